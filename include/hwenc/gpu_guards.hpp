#pragma once

#include "hardware.hpp"

#include <exception>
#include <spdlog/spdlog.h>

namespace HWENC {

/**
 * @brief Makes a compute context current for the lifetime of the guard.
 */
class context_guard {
public:
    explicit context_guard(compute_context& context)
        : context_{context} {
        context_.push();
    }

    context_guard(const context_guard&)            = delete;
    context_guard& operator=(const context_guard&) = delete;

    ~context_guard() {
        try {
            context_.pop();
        } catch (const std::exception& e) {
            if (auto log = spdlog::get("hwenc")) {
                log->warn("[context_guard] failed to pop context of device {}: {}", context_.device_id(), e.what());
            }
        }
    }

private:
    compute_context& context_;
};

/**
 * @brief Maps a registered input resource and unmaps it on scope exit.
 *
 * unmap() releases early and reports errors; the destructor only logs them.
 */
class mapped_resource {
public:
    mapped_resource(encoder_context& encoder, resource_handle registered)
        : encoder_{encoder}
        , mapped_{encoder.map_resource(registered)} { }

    mapped_resource(const mapped_resource&)            = delete;
    mapped_resource& operator=(const mapped_resource&) = delete;

    ~mapped_resource() {
        if (mapped_ == nullptr) {
            return;
        }
        try {
            encoder_.unmap_resource(mapped_);
        } catch (const std::exception& e) {
            if (auto log = spdlog::get("hwenc")) {
                log->warn("[mapped_resource] unmap failed: {}", e.what());
            }
        }
    }

    [[nodiscard]] resource_handle get() const {
        return mapped_;
    }

    void unmap() {
        resource_handle mapped = mapped_;
        mapped_                = nullptr;
        encoder_.unmap_resource(mapped);
    }

private:
    encoder_context& encoder_;
    resource_handle  mapped_;
};

/**
 * @brief Locks an output bitstream and unlocks it on scope exit.
 */
class bitstream_lock {
public:
    bitstream_lock(encoder_context& encoder, resource_handle bitstream)
        : encoder_{encoder}
        , bitstream_{bitstream}
        , locked_{encoder.lock_bitstream(bitstream)} { }

    bitstream_lock(const bitstream_lock&)            = delete;
    bitstream_lock& operator=(const bitstream_lock&) = delete;

    ~bitstream_lock() {
        if (bitstream_ == nullptr) {
            return;
        }
        try {
            encoder_.unlock_bitstream(bitstream_);
        } catch (const std::exception& e) {
            if (auto log = spdlog::get("hwenc")) {
                log->warn("[bitstream_lock] unlock failed: {}", e.what());
            }
        }
    }

    [[nodiscard]] const locked_bitstream& get() const {
        return locked_;
    }

    void unlock() {
        resource_handle bitstream = bitstream_;
        bitstream_                = nullptr;
        encoder_.unlock_bitstream(bitstream);
    }

private:
    encoder_context& encoder_;
    resource_handle  bitstream_;
    locked_bitstream locked_;
};

} // namespace HWENC
