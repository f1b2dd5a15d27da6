#include "peerquic/crypto/sodium_secure_memory_handle.hpp"
#include "peerquic/crypto/sodium_interop.hpp"
#include "peerquic/core/constants.hpp"

#include <fmt/format.h>
#include <sodium.h>

#include <string>

namespace peerquic::crypto {

void SecureMemoryHandle::RegionDeleter::operator()(Region* region) const noexcept {
    if (region->bytes != nullptr) {
        // sodium_free wipes the bytes, which needs them writable again.
        sodium_mprotect_readwrite(region->bytes);
        sodium_free(region->bytes);
    }
    delete region;
}

SecureMemoryHandle::SecureMemoryHandle(std::unique_ptr<Region, RegionDeleter> region) noexcept
    : region_(std::move(region)) {}

Result<SecureMemoryHandle, SodiumFailure> SecureMemoryHandle::Allocate(const size_t size) {
    if (!SodiumInterop::IsInitialized()) {
        return Result<SecureMemoryHandle, SodiumFailure>::Err(
            SodiumFailure::InitializationFailed(std::string(ErrorMessages::NOT_INITIALIZED)));
    }
    if (size == 0) {
        return Result<SecureMemoryHandle, SodiumFailure>::Err(
            SodiumFailure::AllocationFailed("Secret key region must not be empty"));
    }

    std::unique_ptr<Region, RegionDeleter> region(new Region);
    region->bytes = static_cast<uint8_t*>(sodium_malloc(size));
    if (region->bytes == nullptr) {
        return Result<SecureMemoryHandle, SodiumFailure>::Err(
            SodiumFailure::AllocationFailed(fmt::format("sodium_malloc of {} bytes failed", size)));
    }
    region->size = size;
    sodium_memzero(region->bytes, size);
    if (sodium_mprotect_noaccess(region->bytes) != SodiumConstants::SUCCESS) {
        return Result<SecureMemoryHandle, SodiumFailure>::Err(
            SodiumFailure::AllocationFailed("sodium_mprotect_noaccess failed"));
    }
    return Result<SecureMemoryHandle, SodiumFailure>::Ok(SecureMemoryHandle(std::move(region)));
}

Result<Unit, SodiumFailure> SecureMemoryHandle::OpenForRead() const {
    if (IsInvalid()) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::InvalidOperation(std::string(ErrorMessages::HANDLE_DISPOSED)));
    }
    std::lock_guard lock(region_->mutex);
    if (region_->readers == 0 && sodium_mprotect_readonly(region_->bytes) != SodiumConstants::SUCCESS) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::InvalidOperation("sodium_mprotect_readonly failed"));
    }
    ++region_->readers;
    return Result<Unit, SodiumFailure>::Ok(unit);
}

Result<Unit, SodiumFailure> SecureMemoryHandle::OpenForWrite() {
    if (IsInvalid()) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::InvalidOperation(std::string(ErrorMessages::HANDLE_DISPOSED)));
    }
    // Held until Close(true).
    region_->mutex.lock();
    if (region_->readers != 0) {
        region_->mutex.unlock();
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::InvalidOperation("Secret key is being read"));
    }
    if (sodium_mprotect_readwrite(region_->bytes) != SodiumConstants::SUCCESS) {
        region_->mutex.unlock();
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::InvalidOperation("sodium_mprotect_readwrite failed"));
    }
    return Result<Unit, SodiumFailure>::Ok(unit);
}

void SecureMemoryHandle::Close(const bool writing) const noexcept {
    if (writing) {
        sodium_mprotect_noaccess(region_->bytes);
        region_->mutex.unlock();
        return;
    }
    std::lock_guard lock(region_->mutex);
    if (--region_->readers == 0) {
        sodium_mprotect_noaccess(region_->bytes);
    }
}

}
