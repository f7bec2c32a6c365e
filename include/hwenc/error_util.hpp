#pragma once

#include "global_module_defs.hpp"
#include "relative_clock.hpp"

#include <cerrno>
#include <cstdlib>
#include <optional>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <string>

/**
 * @brief Parameterless macro for report_and_clear_errno.
 */
#ifndef RAC_ERRNO
    #define RAC_ERRNO() HWENC::report_and_clear_errno(__FILE__, __LINE__, __func__)
#endif /// RAC_ERRNO

/**
 * @brief Parameterized macro for report_and_clear_errno.
 *
 * Prints a message from the calling context for additional info.
 */
#ifndef RAC_ERRNO_MSG
    #define RAC_ERRNO_MSG(msg) HWENC::report_and_clear_errno(__FILE__, __LINE__, __func__, msg)
#endif /// RAC_ERRNO_MSG

namespace HWENC {

static const bool ENABLE_VERBOSE_ERRORS{getenv("HWENC_ENABLE_VERBOSE_ERRORS") != nullptr &&
                                        HWENC::str_to_bool(getenv("HWENC_ENABLE_VERBOSE_ERRORS"))};

/**
 * @brief Support function to report errno values when debugging.
 *
 * If errno is set, this function will report errno's value and the calling context.
 * It will subsequently clear errno (reset value to 0).
 * Otherwise, this function does nothing.
 */
inline void report_and_clear_errno([[maybe_unused]] const std::string& file, [[maybe_unused]] const int& line,
                                   [[maybe_unused]] const std::string& function, [[maybe_unused]] const std::string& msg = "") {
    if (errno > 0) {
        if (HWENC::ENABLE_VERBOSE_ERRORS) {
            if (auto log = spdlog::get("hwenc")) {
                log->error("[error_util] || Errno was set: {} @ {}:{} [{}]", errno, file, line, function);
                if (!msg.empty()) {
                    log->error("[error_util]|> Message: {}", msg);
                }
            }
        }
        errno = 0;
    }
}

/**
 * @brief Root of the encoder error taxonomy.
 *
 * Driver and codec status codes are translated into one of the subclasses below at the call site that
 * produced them. A caller that only needs "encoder unavailable" semantics can catch this type.
 */
class hwenc_error : public std::runtime_error {
public:
    explicit hwenc_error(const std::string& what)
        : std::runtime_error{what} { }
};

/**
 * @brief The device is temporarily overloaded or unavailable; retry elsewhere or after a backoff.
 */
class transient_device_error : public hwenc_error {
public:
    explicit transient_device_error(const std::string& what, int device_id = -1)
        : hwenc_error{what}
        , device_id_{device_id} { }

    [[nodiscard]] int device_id() const {
        return device_id_;
    }

    [[nodiscard]] std::optional<duration> failure_time() const {
        return failure_time_;
    }

    void set_failure_time(duration when) {
        failure_time_ = when;
    }

private:
    int                     device_id_;
    std::optional<duration> failure_time_;
};

/**
 * @brief A parameter or preset was rejected. Fatal for the session.
 *
 * When the rejection can be attributed to a preset, its name is carried so the registry can denylist it
 * for the device.
 */
class invalid_configuration : public hwenc_error {
public:
    explicit invalid_configuration(const std::string& what, std::string preset = "")
        : hwenc_error{what}
        , preset_{std::move(preset)} { }

    [[nodiscard]] const std::string& preset() const {
        return preset_;
    }

private:
    std::string preset_;
};

/**
 * @brief The activation key was rejected by the encoder API.
 */
class authorization_error : public hwenc_error {
public:
    explicit authorization_error(const std::string& what)
        : hwenc_error{what} { }
};

/**
 * @brief Host or device allocation failed, or the driver ran out of encode sessions.
 */
class resource_exhaustion : public hwenc_error {
public:
    explicit resource_exhaustion(const std::string& what)
        : hwenc_error{what} { }
};

/**
 * @brief A call was made out of order (compress before ready, compress on a closed session, ...).
 */
class protocol_violation : public hwenc_error {
public:
    explicit protocol_violation(const std::string& what)
        : hwenc_error{what} { }
};

/**
 * @brief No usable preset exists for the codec on the device (all presets denylisted or unknown).
 */
class no_preset_available : public hwenc_error {
public:
    explicit no_preset_available(const std::string& what)
        : hwenc_error{what} { }
};

} // namespace HWENC
