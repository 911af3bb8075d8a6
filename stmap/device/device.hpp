#pragma once

#include "stmap/core/type.hpp"
#include "stmap/core/error.hpp"
#include "stmap/core/dense.hpp"
#include "stmap/core/memory.hpp"
#include "stmap/core/log.hpp"
#include "stmap/threading/scheduler.hpp"

#include <charconv>
#include <string>
#include <string_view>

// =============================================================================
// FILE: stmap/device/device.hpp
// BRIEF: Compute device selection and scoped acquisition
// =============================================================================
//
// Identifiers: "cpu" | "host" | "cuda" | "cuda:N" | "hip" | "hip:N".
// This build carries host kernels only, so accelerator requests resolve to the
// host with a warning. Buffers handed out by a ComputeDevice live in that
// device's memory space for the handle's lifetime.
// =============================================================================

namespace stmap::device {

enum class DeviceKind : std::int32_t {
    Host = 0,
    Cuda = 1,
    Hip = 2
};

struct DeviceSpec {
    DeviceKind kind = DeviceKind::Host;
    int ordinal = 0;
};

inline const char* kind_name(DeviceKind kind) noexcept {
    switch (kind) {
        case DeviceKind::Cuda: return "cuda";
        case DeviceKind::Hip:  return "hip";
        default:               return "cpu";
    }
}

inline std::string to_string(const DeviceSpec& spec) {
    if (spec.kind == DeviceKind::Host) return "cpu";
    return std::string(kind_name(spec.kind)) + ":" + std::to_string(spec.ordinal);
}

// Throws ValueError for malformed identifiers
inline DeviceSpec parse_device(std::string_view id) {
    if (id == "cpu" || id == "host") {
        return DeviceSpec{DeviceKind::Host, 0};
    }

    DeviceKind kind;
    std::string_view rest;
    if (id.substr(0, 4) == "cuda") {
        kind = DeviceKind::Cuda;
        rest = id.substr(4);
    } else if (id.substr(0, 3) == "hip") {
        kind = DeviceKind::Hip;
        rest = id.substr(3);
    } else {
        throw ValueError("Unrecognized device identifier: '" + std::string(id) + "'");
    }

    if (rest.empty()) {
        return DeviceSpec{kind, 0};
    }

    int ordinal = -1;
    if (rest.size() >= 2 && rest.front() == ':') {
        const char* first = rest.data() + 1;
        const char* last = rest.data() + rest.size();
        auto [ptr, ec] = std::from_chars(first, last, ordinal);
        if (ec != std::errc() || ptr != last) {
            ordinal = -1;
        }
    }
    STMAP_CHECK_ARG(ordinal >= 0,
                    "Unrecognized device identifier: '" + std::string(id) + "'");
    return DeviceSpec{kind, ordinal};
}

// Acquired once per training run; releases its thread override on destruction.
// A non-zero num_threads changes the process-wide Scheduler count, so at most
// one device holding an override may be alive at a time. Overlapping sessions
// with different counts overwrite each other, and each one restores the count
// it saw on construction when destroyed. Devices built with num_threads == 0
// never touch the Scheduler and may coexist freely.
class ComputeDevice {
public:
    explicit ComputeDevice(const DeviceSpec& requested, size_t num_threads = 0)
        : requested_(requested),
          resolved_(DeviceKind::Host),
          previous_threads_(threading::Scheduler::get_num_threads()),
          owns_threads_(num_threads > 0)
    {
        if (requested_.kind != DeviceKind::Host) {
            STMAP_LOG_WARNING("Device '%s' is not available in this build, using host compute",
                              to_string(requested_).c_str());
        }
        if (owns_threads_) {
            threading::Scheduler::set_num_threads(num_threads);
        }
    }

    explicit ComputeDevice(std::string_view id, size_t num_threads = 0)
        : ComputeDevice(parse_device(id), num_threads) {}

    ~ComputeDevice() {
        if (owns_threads_) {
            try {
                threading::Scheduler::set_num_threads(previous_threads_);
            } catch (const std::exception& e) {
                STMAP_LOG_WARNING("Failed to restore worker count: %s", e.what());
            }
        }
    }

    ComputeDevice(const ComputeDevice&) = delete;
    ComputeDevice& operator=(const ComputeDevice&) = delete;
    ComputeDevice(ComputeDevice&&) = delete;
    ComputeDevice& operator=(ComputeDevice&&) = delete;

    STMAP_NODISCARD const DeviceSpec& requested() const noexcept { return requested_; }
    STMAP_NODISCARD DeviceKind kind() const noexcept { return resolved_; }
    STMAP_NODISCARD bool is_fallback() const noexcept { return requested_.kind != resolved_; }

    STMAP_NODISCARD DenseMatrix allocate_matrix(Index rows, Index cols) const {
        return DenseMatrix(rows, cols);
    }

    STMAP_NODISCARD memory::AlignedBuffer<Real> allocate(Size n) const {
        return memory::AlignedBuffer<Real>(n);
    }

    // Copy host data into this device's memory space
    STMAP_NODISCARD DenseMatrix upload(DenseArray<const Real> src) const {
        return DenseMatrix::from(src);
    }

private:
    DeviceSpec requested_;
    DeviceKind resolved_;
    size_t previous_threads_;
    bool owns_threads_;
};

} // namespace stmap::device
