#pragma once

#include "stmap/config.hpp"
#include "stmap/core/type.hpp"
#include "stmap/core/macros.hpp"
#include "stmap/core/error.hpp"
#include <cstring>
#include <new>
#include <utility>
#include <memory>
#include <algorithm>
#include <type_traits>

// =============================================================================
// FILE: stmap/core/memory.hpp
// BRIEF: Aligned allocation and bulk memory primitives
// =============================================================================

namespace stmap::memory {

// =============================================================================
// Aligned Memory Allocation
// =============================================================================

template <typename T>
struct AlignedDeleter {
    std::size_t alignment_;

    explicit AlignedDeleter(std::size_t alignment = DEFAULT_ALIGNMENT) noexcept
        : alignment_(alignment) {}

    void operator()(T* ptr) const noexcept {
        if (STMAP_UNLIKELY(!ptr)) return;
        operator delete[](ptr, std::align_val_t(alignment_));
    }
};

template <typename T>
using AlignedPtr = std::unique_ptr<T[], AlignedDeleter<T>>;  // NOLINT(modernize-avoid-c-arrays)

// Zero-initialized aligned array; throws OutOfMemoryError on failure
template <typename T>
inline auto aligned_alloc(Size count, std::size_t alignment = DEFAULT_ALIGNMENT) -> AlignedPtr<T> {
    static_assert(std::is_arithmetic_v<T>, "aligned_alloc: arithmetic types only");

    if (STMAP_UNLIKELY(count == 0)) {
        return AlignedPtr<T>(nullptr, AlignedDeleter<T>(alignment));
    }

    T* raw_ptr = new (std::align_val_t(alignment), std::nothrow) T[count]();
    if (STMAP_UNLIKELY(raw_ptr == nullptr)) {
        throw OutOfMemoryError("aligned_alloc: failed to allocate " +
                               std::to_string(count * sizeof(T)) + " bytes");
    }
    return AlignedPtr<T>(raw_ptr, AlignedDeleter<T>(alignment));
}

// Owning RAII buffer with an Array<T> view
template <typename T>
struct AlignedBuffer {
    AlignedBuffer() noexcept
        : ptr_(nullptr, AlignedDeleter<T>()), count_(0) {}

    explicit AlignedBuffer(Size count, std::size_t alignment = DEFAULT_ALIGNMENT)
        : ptr_(aligned_alloc<T>(count, alignment)), count_(count) {}

    ~AlignedBuffer() = default;

    AlignedBuffer(const AlignedBuffer&) = delete;
    auto operator=(const AlignedBuffer&) -> AlignedBuffer& = delete;

    AlignedBuffer(AlignedBuffer&&) noexcept = default;
    auto operator=(AlignedBuffer&&) noexcept -> AlignedBuffer& = default;

    [[nodiscard]] auto array() noexcept -> Array<T> {
        return Array<T>(ptr_.get(), count_);
    }

    [[nodiscard]] auto array() const noexcept -> Array<const T> {
        return Array<const T>(ptr_.get(), count_);
    }

    [[nodiscard]] auto get() noexcept -> T* { return ptr_.get(); }
    [[nodiscard]] auto get() const noexcept -> const T* { return ptr_.get(); }
    [[nodiscard]] auto size() const noexcept -> Size { return count_; }
    [[nodiscard]] auto empty() const noexcept -> bool { return count_ == 0; }

    STMAP_FORCE_INLINE auto operator[](Size i) noexcept -> T& { return ptr_[i]; }
    STMAP_FORCE_INLINE auto operator[](Size i) const noexcept -> const T& { return ptr_[i]; }

private:
    AlignedPtr<T> ptr_;
    Size count_;
};

// =============================================================================
// Bulk Operations
// =============================================================================

template <typename T>
STMAP_FORCE_INLINE void zero(Array<T> span) noexcept {
    if (span.len == 0) return;
    std::memset(static_cast<void*>(span.ptr), 0, span.len * sizeof(T));
}

template <typename T>
STMAP_FORCE_INLINE void copy_fast(Array<const T> src, Array<T> dst) {
    STMAP_ASSERT(src.len == dst.len, "copy_fast: size mismatch");
    if (src.len == 0) return;
    std::memcpy(static_cast<void*>(dst.ptr), static_cast<const void*>(src.ptr), src.len * sizeof(T));
}

} // namespace stmap::memory
