#pragma once
#include <functional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
namespace peerquic {

/// Value of a Result that carries no payload on success
struct Unit {
    constexpr bool operator==(const Unit&) const noexcept = default;
};
inline constexpr Unit unit{};

/// Thrown when a Result is unwrapped on the wrong side; a programming error
class BadResultAccess final : public std::logic_error {
public:
    explicit BadResultAccess(const std::string& what)
        : std::logic_error(what) {}
};

/**
 * @brief Success value or failure, returned by every fallible operation
 *
 * Failures are plain values (SodiumFailure, CertificateFailure,
 * TransportFailure); nothing in the library throws across its API.
 * Callers check IsErr() and move the failure on:
 * ```cpp
 * auto parsed = IdentityCertificate::Parse(der);
 * if (parsed.IsErr()) {
 *     return Result<PeerId, CertificateFailure>::Err(std::move(parsed).UnwrapErr());
 * }
 * ```
 */
template<typename T, typename E>
class Result {
public:
    using value_type = T;
    using error_type = E;

    static Result Ok(T value) {
        return Result(std::in_place_index<kValue>, std::move(value));
    }
    static Result Err(E error) {
        return Result(std::in_place_index<kError>, std::move(error));
    }

    [[nodiscard]] bool IsOk() const noexcept { return state_.index() == kValue; }
    [[nodiscard]] bool IsErr() const noexcept { return state_.index() == kError; }

    [[nodiscard]] T& Unwrap() & {
        RequireOk();
        return std::get<kValue>(state_);
    }
    [[nodiscard]] const T& Unwrap() const& {
        RequireOk();
        return std::get<kValue>(state_);
    }
    [[nodiscard]] T&& Unwrap() && {
        RequireOk();
        return std::get<kValue>(std::move(state_));
    }

    [[nodiscard]] E& UnwrapErr() & {
        RequireErr();
        return std::get<kError>(state_);
    }
    [[nodiscard]] const E& UnwrapErr() const& {
        RequireErr();
        return std::get<kError>(state_);
    }
    [[nodiscard]] E&& UnwrapErr() && {
        RequireErr();
        return std::get<kError>(std::move(state_));
    }

    /// Convert the failure type, typically at a layer boundary
    template<typename F>
    [[nodiscard]] auto MapErr(F&& convert) && -> Result<T, std::invoke_result_t<F, E>> {
        using Mapped = Result<T, std::invoke_result_t<F, E>>;
        if (IsErr()) {
            return Mapped::Err(std::invoke(std::forward<F>(convert), std::get<kError>(std::move(state_))));
        }
        return Mapped::Ok(std::get<kValue>(std::move(state_)));
    }

private:
    static constexpr std::size_t kValue = 0;
    static constexpr std::size_t kError = 1;

    template<std::size_t I, typename Arg>
    Result(std::in_place_index_t<I> index, Arg&& arg)
        : state_(index, std::forward<Arg>(arg)) {}

    void RequireOk() const {
        if (IsErr()) {
            throw BadResultAccess("Unwrap() called on a failed Result");
        }
    }
    void RequireErr() const {
        if (IsOk()) {
            throw BadResultAccess("UnwrapErr() called on a successful Result");
        }
    }

    std::variant<T, E> state_;
};

}
