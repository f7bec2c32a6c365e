#pragma once

#include "global_module_defs.hpp"

#include <string>
#include <vector>

namespace HWENC {

/**
 * @brief Module-wide settings, read once when the device registry is created.
 *
 * Values come from an optional YAML file and are then overridden by HWENC_* environment variables.
 * Nothing here is consulted per frame.
 */
struct module_config {
    int  subsampling_threshold = 80;
    bool native_rgb            = true;
    bool enable_h264           = true;
    bool enable_hevc           = true;
    bool enable_av1            = true;
    bool enable_yuv444         = true;
    bool enable_10bit          = true;
    bool device_memcopy        = true;
    int  context_limit         = device_params::context_limit;
    bool threaded_init         = true;

    /// Forced preset and tuning names; empty means "score it"
    std::string preset;
    std::string tuning;

    bool        debug_dump = false;
    std::string dump_dir   = ".";

    /// Preferred device, -1 for none
    int                      device_id = -1;
    /// Substring of the preferred device name, empty for none
    std::string              device_name;
    /// "memory" ranks devices by suitability and free memory, "round-robin" rotates through them
    std::string              load_balancing = "memory";
    std::vector<std::string> enabled_devices;
    std::vector<std::string> disabled_devices;

    std::vector<std::string> license_keys;
    std::string              license_keys_file;

    /// Minimum compute capability, encoded as (major << 4) + minor
    int min_compute     = 0x30;
    int min_free_memory = 10;
    int worker_threads  = 2;
};

/**
 * @brief Get the value of the environment variable @p var, or @p _default if it is unset or empty.
 */
std::string get_env(const std::string& var, const std::string& _default = "");

/**
 * @brief Get the boolean value of the given environment variable
 *
 * Integers are true when positive; otherwise yes/y/true/on (any case) are true.
 */
bool get_env_bool(const std::string& var, bool _default = false);

long get_env_long(const std::string& var, long _default = 0);

/**
 * @brief Splits a comma separated list, trimming blanks and dropping empty items.
 */
std::vector<std::string> split_list(const std::string& value);

/**
 * @brief Reads activation keys from @p path, one per line; lines starting with '#' or '!' are comments.
 *
 * A missing file yields no keys.
 */
std::vector<std::string> read_key_file(const std::string& path);

/**
 * @brief Loads the module configuration.
 *
 * @param path YAML file to read; when empty HWENC_CONFIG is consulted, and when that is unset too only
 *             defaults and environment overrides apply.
 * @throws invalid_configuration if the file cannot be parsed or a value has the wrong type.
 */
module_config load_config(const std::string& path = "");

/**
 * @brief Applies HWENC_* environment overrides on top of @p config.
 */
void apply_env_overrides(module_config& config);

} // namespace HWENC
