#pragma once

#include "peerquic/core/result.hpp"
#include "peerquic/core/failures.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <span>
#include <type_traits>

namespace peerquic::crypto {

/**
 * @brief Guarded home of the identity secret key
 *
 * The bytes live in a sodium_malloc region that is inaccessible (PROT_NONE)
 * except inside WithReadAccess / WithWriteAccess. Readers on several
 * endpoint threads may overlap; the region drops back to no-access when the
 * last one leaves.
 */
class SecureMemoryHandle {
    struct Region {
        uint8_t* bytes = nullptr;
        size_t size = 0;
        std::mutex mutex;
        size_t readers = 0;
    };

public:
    static Result<SecureMemoryHandle, SodiumFailure> Allocate(size_t size);

    SecureMemoryHandle() = default;

    template<typename F>
    auto WithReadAccess(F&& func) const -> Result<std::invoke_result_t<F, std::span<const uint8_t>>, SodiumFailure> {
        using R = std::invoke_result_t<F, std::span<const uint8_t>>;
        if (auto opened = OpenForRead(); opened.IsErr()) {
            return Result<R, SodiumFailure>::Err(std::move(opened).UnwrapErr());
        }
        const AccessScope scope(*this, false);
        return Result<R, SodiumFailure>::Ok(
            std::forward<F>(func)(std::span<const uint8_t>(region_->bytes, region_->size)));
    }

    /// Exclusive access for filling the key in place
    template<typename F>
    auto WithWriteAccess(F&& func) -> Result<std::invoke_result_t<F, std::span<uint8_t>>, SodiumFailure> {
        using R = std::invoke_result_t<F, std::span<uint8_t>>;
        if (auto opened = OpenForWrite(); opened.IsErr()) {
            return Result<R, SodiumFailure>::Err(std::move(opened).UnwrapErr());
        }
        const AccessScope scope(*this, true);
        return Result<R, SodiumFailure>::Ok(
            std::forward<F>(func)(std::span<uint8_t>(region_->bytes, region_->size)));
    }

    [[nodiscard]] bool IsInvalid() const noexcept {
        return region_ == nullptr;
    }

    [[nodiscard]] size_t Size() const noexcept {
        return region_ ? region_->size : 0;
    }

private:
    struct RegionDeleter {
        void operator()(Region* region) const noexcept;
    };

    /// Restores no-access protection when the callback returns or throws
    class AccessScope {
    public:
        AccessScope(const SecureMemoryHandle& owner, const bool writing) noexcept
            : owner_(owner), writing_(writing) {}
        ~AccessScope() { owner_.Close(writing_); }

        AccessScope(const AccessScope&) = delete;
        AccessScope& operator=(const AccessScope&) = delete;

    private:
        const SecureMemoryHandle& owner_;
        bool writing_;
    };

    explicit SecureMemoryHandle(std::unique_ptr<Region, RegionDeleter> region) noexcept;

    [[nodiscard]] Result<Unit, SodiumFailure> OpenForRead() const;
    [[nodiscard]] Result<Unit, SodiumFailure> OpenForWrite();
    void Close(bool writing) const noexcept;

    std::unique_ptr<Region, RegionDeleter> region_;
};

}
