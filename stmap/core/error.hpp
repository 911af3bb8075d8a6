#pragma once

#include "stmap/core/macros.hpp"
#include <cstdint>
#include <exception>
#include <string>
#include <utility>

// =============================================================================
// FILE: stmap/core/error.hpp
// BRIEF: Exception types thrown by stmap and the argument-check macros
// =============================================================================

namespace stmap {

// Numeric values are the STMAP_ERROR_* codes of the C ABI
enum class ErrorCode : std::int32_t {
    OK = 0,

    UNKNOWN = 1,
    INTERNAL_ERROR = 2,
    OUT_OF_MEMORY = 3,
    NULL_POINTER = 4,

    INVALID_ARGUMENT = 10,
    DIMENSION_MISMATCH = 11,
    INDEX_OUT_OF_BOUNDS = 14,
    SHAPE_MISMATCH = 15,
    GENE_ALIGNMENT = 16,

    TYPE_ERROR = 20,
    UNSUPPORTED_MATRIX_TYPE = 22,

    IO_ERROR = 30,
    FILE_NOT_FOUND = 31,
    READ_ERROR = 33,
    WRITE_ERROR = 34,

    NOT_IMPLEMENTED = 40,
    FEATURE_UNAVAILABLE = 41,
    UNSUPPORTED_MODE = 42,
};

class STMAP_EXPORT Exception : public std::exception {
public:
    Exception(ErrorCode code, std::string msg)
        : code_(code), msg_(std::move(msg)) {}

    [[nodiscard]] const char* what() const noexcept override { return msg_.c_str(); }
    [[nodiscard]] ErrorCode code() const noexcept { return code_; }
    [[nodiscard]] const std::string& message() const noexcept { return msg_; }

private:
    ErrorCode code_;
    std::string msg_;
};

// Declares a leaf type with a fixed code
#define STMAP_DEFINE_ERROR(Name, Base, Code)                          \
    class Name : public Base {                                        \
    public:                                                           \
        explicit Name(const std::string& msg) : Base(Code, msg) {}    \
    }

// Base types keep a protected (code, msg) constructor for their subtypes
class ValueError : public Exception {
public:
    explicit ValueError(const std::string& msg)
        : Exception(ErrorCode::INVALID_ARGUMENT, msg) {}
protected:
    ValueError(ErrorCode code, const std::string& msg) : Exception(code, msg) {}
};

// Two axes that must agree in length do not
class DimensionMismatchError : public ValueError {
public:
    explicit DimensionMismatchError(const std::string& msg)
        : ValueError(ErrorCode::DIMENSION_MISMATCH, msg) {}
protected:
    DimensionMismatchError(ErrorCode code, const std::string& msg) : ValueError(code, msg) {}
};

class TypeError : public Exception {
public:
    explicit TypeError(const std::string& msg) : Exception(ErrorCode::TYPE_ERROR, msg) {}
protected:
    TypeError(ErrorCode code, const std::string& msg) : Exception(code, msg) {}
};

class IOError : public Exception {
public:
    explicit IOError(const std::string& msg) : Exception(ErrorCode::IO_ERROR, msg) {}
protected:
    IOError(ErrorCode code, const std::string& msg) : Exception(code, msg) {}
};

class NotImplementedError : public Exception {
public:
    explicit NotImplementedError(const std::string& msg)
        : Exception(ErrorCode::NOT_IMPLEMENTED, msg) {}
protected:
    NotImplementedError(ErrorCode code, const std::string& msg) : Exception(code, msg) {}
};

STMAP_DEFINE_ERROR(OutOfMemoryError, Exception, ErrorCode::OUT_OF_MEMORY);
STMAP_DEFINE_ERROR(NullPointerError, Exception, ErrorCode::NULL_POINTER);
STMAP_DEFINE_ERROR(InternalError, Exception, ErrorCode::INTERNAL_ERROR);
STMAP_DEFINE_ERROR(FeatureUnavailableError, Exception, ErrorCode::FEATURE_UNAVAILABLE);

// Warm-start mapping is not (n_cells, n_spots)
STMAP_DEFINE_ERROR(ShapeMismatchError, DimensionMismatchError, ErrorCode::SHAPE_MISMATCH);
STMAP_DEFINE_ERROR(GeneAlignmentError, ValueError, ErrorCode::GENE_ALIGNMENT);
STMAP_DEFINE_ERROR(IndexOutOfBoundsError, ValueError, ErrorCode::INDEX_OUT_OF_BOUNDS);

// Expression storage with no dense conversion
STMAP_DEFINE_ERROR(UnsupportedMatrixTypeError, TypeError, ErrorCode::UNSUPPORTED_MATRIX_TYPE);

STMAP_DEFINE_ERROR(ReadError, IOError, ErrorCode::READ_ERROR);
STMAP_DEFINE_ERROR(WriteError, IOError, ErrorCode::WRITE_ERROR);

// Operating mode with no hyperparameter preset
STMAP_DEFINE_ERROR(UnsupportedModeError, NotImplementedError, ErrorCode::UNSUPPORTED_MODE);

#undef STMAP_DEFINE_ERROR

class FileNotFoundError : public IOError {
public:
    explicit FileNotFoundError(const std::string& path)
        : IOError(ErrorCode::FILE_NOT_FOUND, "File not found: " + path) {}
};

// Broken internal invariant; on in every build type
#define STMAP_ASSERT(cond, msg)                                                  \
    do {                                                                         \
        if (STMAP_UNLIKELY(!(cond))) {                                           \
            throw ::stmap::InternalError(std::string(msg) + " (" + __FILE__ +    \
                                         ":" + std::to_string(__LINE__) + ")");  \
        }                                                                        \
    } while (0)

#define STMAP_CHECK_ARG(cond, msg)                                   \
    do {                                                             \
        if (STMAP_UNLIKELY(!(cond))) throw ::stmap::ValueError(msg); \
    } while (0)

#define STMAP_CHECK_DIM(cond, msg)                                               \
    do {                                                                         \
        if (STMAP_UNLIKELY(!(cond))) throw ::stmap::DimensionMismatchError(msg); \
    } while (0)

#define STMAP_CHECK_NULL(ptr, msg)                                                  \
    do {                                                                            \
        if (STMAP_UNLIKELY((ptr) == nullptr)) throw ::stmap::NullPointerError(msg); \
    } while (0)

} // namespace stmap
