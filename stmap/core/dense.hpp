#pragma once

#include "stmap/core/type.hpp"
#include "stmap/core/error.hpp"
#include "stmap/core/memory.hpp"

#include <string>
#include <utility>

// =============================================================================
/// @file dense.hpp
/// @brief Dense row-major matrices
///
/// - DenseArray<T>: non-owning row-major view (ptr, rows, cols)
/// - DenseMatrix: owning, 64-byte aligned Real storage
///
/// Indexing is ptr[r * cols + c] for both.
// =============================================================================

namespace stmap {

// =============================================================================
// DenseArray: Contiguous Row-Major View
// =============================================================================

template <typename T>
struct DenseArray {
    using ValueType = T;

    T* ptr;
    Index rows;
    Index cols;

    constexpr DenseArray() noexcept : ptr(nullptr), rows(0), cols(0) {}

    constexpr DenseArray(T* p, Index r, Index c) noexcept
        : ptr(p), rows(r), cols(c) {}

    template <typename U>
        requires (std::is_const_v<T> && std::is_same_v<std::remove_const_t<T>, U>)
    constexpr DenseArray(const DenseArray<U>& other) noexcept
        : ptr(other.ptr), rows(other.rows), cols(other.cols) {}

    STMAP_NODISCARD STMAP_FORCE_INLINE T& operator()(Index r, Index c) const {
#if !defined(NDEBUG)
        STMAP_ASSERT(r >= 0 && r < rows, "DenseArray: Row out of bounds");
        STMAP_ASSERT(c >= 0 && c < cols, "DenseArray: Col out of bounds");
#endif
        return ptr[r * cols + c];
    }

    STMAP_NODISCARD STMAP_FORCE_INLINE Array<T> row(Index r) const {
        return Array<T>(ptr + (r * cols), static_cast<Size>(cols));
    }

    STMAP_NODISCARD constexpr T* data() const noexcept { return ptr; }

    STMAP_NODISCARD constexpr Size size() const noexcept {
        return static_cast<Size>(rows) * static_cast<Size>(cols);
    }
};

// =============================================================================
// DenseMatrix: Owning Row-Major Storage
// =============================================================================

class DenseMatrix {
public:
    DenseMatrix() noexcept : rows_(0), cols_(0) {}

    DenseMatrix(Index rows, Index cols)
        : buffer_(checked_size(rows, cols)), rows_(rows), cols_(cols) {}

    // Deep copy of a row-major buffer
    static DenseMatrix from(DenseArray<const Real> src) {
        DenseMatrix out(src.rows, src.cols);
        memory::copy_fast(Array<const Real>(src.ptr, src.size()), out.values());
        return out;
    }

    DenseMatrix(DenseMatrix&&) noexcept = default;
    DenseMatrix& operator=(DenseMatrix&&) noexcept = default;
    DenseMatrix(const DenseMatrix&) = delete;
    DenseMatrix& operator=(const DenseMatrix&) = delete;

    STMAP_NODISCARD DenseMatrix clone() const {
        return from(view());
    }

    STMAP_NODISCARD Index rows() const noexcept { return rows_; }
    STMAP_NODISCARD Index cols() const noexcept { return cols_; }
    STMAP_NODISCARD Size size() const noexcept { return buffer_.size(); }
    STMAP_NODISCARD bool empty() const noexcept { return buffer_.empty(); }

    STMAP_NODISCARD Real* data() noexcept { return buffer_.get(); }
    STMAP_NODISCARD const Real* data() const noexcept { return buffer_.get(); }

    STMAP_NODISCARD DenseArray<Real> view() noexcept {
        return DenseArray<Real>(buffer_.get(), rows_, cols_);
    }

    STMAP_NODISCARD DenseArray<const Real> view() const noexcept {
        return DenseArray<const Real>(buffer_.get(), rows_, cols_);
    }

    STMAP_NODISCARD Array<Real> values() noexcept { return buffer_.array(); }
    STMAP_NODISCARD Array<const Real> values() const noexcept { return buffer_.array(); }

    STMAP_NODISCARD Array<Real> row(Index r) noexcept {
        return Array<Real>(buffer_.get() + r * cols_, static_cast<Size>(cols_));
    }

    STMAP_NODISCARD Array<const Real> row(Index r) const noexcept {
        return Array<const Real>(buffer_.get() + r * cols_, static_cast<Size>(cols_));
    }

    STMAP_NODISCARD STMAP_FORCE_INLINE Real& operator()(Index r, Index c) noexcept {
        return buffer_[static_cast<Size>(r * cols_ + c)];
    }

    STMAP_NODISCARD STMAP_FORCE_INLINE Real operator()(Index r, Index c) const noexcept {
        return buffer_[static_cast<Size>(r * cols_ + c)];
    }

private:
    static Size checked_size(Index rows, Index cols) {
        STMAP_CHECK_ARG(rows >= 0 && cols >= 0,
                        "DenseMatrix: negative shape (" + std::to_string(rows) +
                        ", " + std::to_string(cols) + ")");
        return static_cast<Size>(rows) * static_cast<Size>(cols);
    }

    memory::AlignedBuffer<Real> buffer_;
    Index rows_;
    Index cols_;
};

} // namespace stmap
