// =============================================================================
// FILE: stmap/binding/c_api/core/core.cpp
// BRIEF: Core C API implementation with thread-safe error handling
// =============================================================================

#include "stmap/binding/c_api/core/core.h"
#include "stmap/binding/c_api/core/internal.hpp"
#include "stmap/core/error.hpp"
#include "stmap/core/log.hpp"
#include "stmap/threading/scheduler.hpp"

#include <algorithm>
#include <array>
#include <cstring>
#include <exception>
#include <new>
#include <stdexcept>
#include <string_view>

namespace stmap::binding {

// =============================================================================
// Thread-Local Error State
// =============================================================================

namespace {

constexpr std::size_t ERROR_MESSAGE_BUFFER_SIZE = 512;

// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
thread_local stmap_error_t g_last_error_code = STMAP_OK;
// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
thread_local std::array<char, ERROR_MESSAGE_BUFFER_SIZE> g_last_error_message = {};

stmap_error_t report(stmap_error_t code, const char* message) noexcept {
    set_last_error(code, message);
    return code;
}

} // anonymous namespace

// =============================================================================
// Internal Error Management Functions
// =============================================================================

void set_last_error(stmap_error_t code, const char* message) noexcept {
    g_last_error_code = code;

    if (STMAP_LIKELY(message != nullptr)) [[likely]] {
        std::strncpy(g_last_error_message.data(), message,
                     ERROR_MESSAGE_BUFFER_SIZE - 1);
        g_last_error_message[ERROR_MESSAGE_BUFFER_SIZE - 1] = '\0';
    } else [[unlikely]] {
        g_last_error_message[0] = '\0';
    }
}

void set_last_error(stmap_error_t code, std::string_view message) noexcept {
    g_last_error_code = code;

    const auto copy_len = std::min(message.size(), ERROR_MESSAGE_BUFFER_SIZE - 1);
    std::memcpy(g_last_error_message.data(), message.data(), copy_len);
    g_last_error_message[copy_len] = '\0';
}

void clear_last_error() noexcept {
    g_last_error_code = STMAP_OK;
    g_last_error_message[0] = '\0';
}

auto get_last_error_message() noexcept -> const char* {
    if (STMAP_LIKELY(g_last_error_message[0] != '\0')) [[likely]] {
        return g_last_error_message.data();
    }
    return "No error";
}

auto get_last_error_code() noexcept -> stmap_error_t {
    return g_last_error_code;
}

// =============================================================================
// Exception to Error Code Conversion
// =============================================================================

// stmap exceptions carry their C code; standard ones are classified here
[[nodiscard]] auto handle_exception() noexcept -> stmap_error_t {
    try {
        throw;
    } catch (const Exception& e) {
        return report(static_cast<stmap_error_t>(e.code()), e.what());
    } catch (const std::bad_alloc&) {
        return report(STMAP_ERROR_OUT_OF_MEMORY, "Memory allocation failed (std::bad_alloc)");
    } catch (const std::out_of_range& e) {
        return report(STMAP_ERROR_INDEX_OUT_OF_BOUNDS, e.what());
    } catch (const std::logic_error& e) {
        return report(STMAP_ERROR_INVALID_ARGUMENT, e.what());
    } catch (const std::exception& e) {
        return report(STMAP_ERROR_UNKNOWN, e.what());
    } catch (...) {
        return report(STMAP_ERROR_UNKNOWN, "Unknown exception (not derived from std::exception)");
    }
}

} // namespace stmap::binding

// =============================================================================
// C API Implementation (Stable ABI)
// =============================================================================

extern "C" {

// =============================================================================
// Version Information
// =============================================================================

STMAP_EXPORT const char* stmap_get_version(void) {
    return "1.0.0";
}

STMAP_EXPORT const char* stmap_get_build_config(void) {
    static const char* config_str =
        STMAP_REAL_TYPE_NAME "+" STMAP_INDEX_TYPE_NAME
#if defined(STMAP_ONLY_SCALAR)
        "+scalar"
#elif defined(__AVX512F__)
        "+avx512"
#elif defined(__AVX2__)
        "+avx2"
#elif defined(__AVX__)
        "+avx"
#elif defined(__SSE4_2__)
        "+sse4.2"
#elif defined(__SSE2__)
        "+sse2"
#elif defined(__ARM_NEON)
        "+neon"
#else
        "+scalar"
#endif
#if defined(STMAP_USE_OPENMP)
        "+openmp"
#elif defined(STMAP_USE_TBB)
        "+tbb"
#elif defined(STMAP_USE_BS)
        "+bs"
#else
        "+serial"
#endif
#if defined(STMAP_HAS_HDF5)
        "+hdf5"
#endif
        ;
    return config_str;
}

// =============================================================================
// Error Handling
// =============================================================================

STMAP_EXPORT const char* stmap_get_last_error(void) {
    return stmap::binding::get_last_error_message();
}

STMAP_EXPORT stmap_error_t stmap_get_last_error_code(void) {
    return stmap::binding::get_last_error_code();
}

STMAP_EXPORT void stmap_clear_error(void) {
    stmap::binding::clear_last_error();
}

STMAP_EXPORT stmap_bool_t stmap_is_ok(stmap_error_t code) {
    return (code == STMAP_OK) ? STMAP_TRUE : STMAP_FALSE;
}

STMAP_EXPORT stmap_bool_t stmap_is_error(stmap_error_t code) {
    return (code != STMAP_OK) ? STMAP_TRUE : STMAP_FALSE;
}

// =============================================================================
// Runtime Configuration
// =============================================================================

STMAP_EXPORT stmap_error_t stmap_set_num_threads(stmap_size_t n) {
    STMAP_C_API_CHECK(n > 0, STMAP_ERROR_INVALID_ARGUMENT,
                      "Thread count must be positive");

    STMAP_C_API_TRY
        stmap::threading::Scheduler::set_num_threads(n);
        STMAP_C_API_RETURN_OK;
    STMAP_C_API_CATCH
}

STMAP_EXPORT stmap_size_t stmap_get_num_threads(void) {
    return stmap::threading::Scheduler::get_num_threads();
}

STMAP_EXPORT stmap_error_t stmap_set_log_level(int32_t level) {
    STMAP_C_API_CHECK(level >= STMAP_LOG_LEVEL_DEBUG && level <= STMAP_LOG_LEVEL_OFF,
                      STMAP_ERROR_INVALID_ARGUMENT, "Unknown log level");

    stmap::log::set_level(static_cast<stmap::log::Level>(level));
    STMAP_C_API_RETURN_OK;
}

} // extern "C"
