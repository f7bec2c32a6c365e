#include "hwenc/config.hpp"

#include "hwenc/error_util.hpp"
#include "hwenc/logging.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <yaml-cpp/yaml.h>

namespace HWENC {

namespace {

std::string trim(const std::string& value) {
    const auto first = value.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = value.find_last_not_of(" \t\r\n");
    return value.substr(first, last - first + 1);
}

template<typename T>
void read_scalar(const YAML::Node& root, const char* key, T& out) {
    if (const YAML::Node node = root[key]) {
        out = node.as<T>();
    }
}

void read_list(const YAML::Node& root, const char* key, std::vector<std::string>& out) {
    if (const YAML::Node node = root[key]) {
        if (node.IsSequence()) {
            out = node.as<std::vector<std::string>>();
        } else {
            out = split_list(node.as<std::string>());
        }
    }
}

void read_yaml(const YAML::Node& root, module_config& config) {
    read_scalar(root, "subsampling_threshold", config.subsampling_threshold);
    read_scalar(root, "native_rgb", config.native_rgb);
    read_scalar(root, "enable_h264", config.enable_h264);
    read_scalar(root, "enable_hevc", config.enable_hevc);
    read_scalar(root, "enable_av1", config.enable_av1);
    read_scalar(root, "enable_yuv444", config.enable_yuv444);
    read_scalar(root, "enable_10bit", config.enable_10bit);
    read_scalar(root, "device_memcopy", config.device_memcopy);
    read_scalar(root, "context_limit", config.context_limit);
    read_scalar(root, "threaded_init", config.threaded_init);
    read_scalar(root, "preset", config.preset);
    read_scalar(root, "tuning", config.tuning);
    read_scalar(root, "debug_dump", config.debug_dump);
    read_scalar(root, "dump_dir", config.dump_dir);
    read_scalar(root, "device_id", config.device_id);
    read_list(root, "enabled_devices", config.enabled_devices);
    read_list(root, "disabled_devices", config.disabled_devices);
    read_list(root, "license_keys", config.license_keys);
    read_scalar(root, "license_keys_file", config.license_keys_file);
    read_scalar(root, "min_compute", config.min_compute);
    read_scalar(root, "min_free_memory", config.min_free_memory);
    read_scalar(root, "worker_threads", config.worker_threads);
    read_scalar(root, "device_name", config.device_name);
    read_scalar(root, "load_balancing", config.load_balancing);
}

} // namespace

std::string get_env(const std::string& var, const std::string& _default) {
    const char* val = std::getenv(var.c_str());
    if (val == nullptr || *val == '\0') {
        return _default;
    }
    return val;
}

bool get_env_bool(const std::string& var, bool _default) {
    const std::string val = trim(get_env(var));
    if (val.empty()) {
        return _default;
    }
    // see if we are dealing with an int value
    if (std::all_of(val.begin(), val.end(), [](char c) {
            return std::isdigit(static_cast<unsigned char>(c)) || c == '-';
        })) {
        try {
            return std::stol(val) > 0;
        } catch (const std::logic_error&) {
            return false;
        }
    }

    const std::vector<std::string> affirmative{"yes", "y", "true", "on"};
    for (const auto& s : affirmative) {
        if (std::equal(val.begin(), val.end(), s.begin(), s.end(), [](char a, char b) {
                return std::tolower(a) == std::tolower(b);
            }))
            return true;
    }
    return false;
}

long get_env_long(const std::string& var, const long _default) {
    const std::string val = trim(get_env(var));
    if (val.empty()) {
        return _default;
    }
    try {
        // base 0 so 0x30 style compute capabilities work
        return std::stol(val, nullptr, 0);
    } catch (const std::logic_error&) {
        throw invalid_configuration{var + " is not an integer: '" + val + "'"};
    }
}

std::vector<std::string> split_list(const std::string& value) {
    std::vector<std::string> items;
    std::string::size_type   start = 0;
    while (start <= value.size()) {
        auto end = value.find(',', start);
        if (end == std::string::npos) {
            end = value.size();
        }
        std::string item = trim(value.substr(start, end - start));
        if (!item.empty()) {
            items.push_back(std::move(item));
        }
        start = end + 1;
    }
    return items;
}

std::vector<std::string> read_key_file(const std::string& path) {
    std::vector<std::string> keys;
    std::ifstream            file{path};
    if (!file.is_open()) {
        return keys;
    }
    std::string line;
    while (std::getline(file, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#' || line[0] == '!') {
            continue;
        }
        keys.push_back(line);
    }
    return keys;
}

void apply_env_overrides(module_config& config) {
    config.subsampling_threshold = static_cast<int>(get_env_long("HWENC_SUBSAMPLING_THRESHOLD", config.subsampling_threshold));
    config.native_rgb            = get_env_bool("HWENC_NATIVE_RGB", config.native_rgb);
    config.enable_h264           = get_env_bool("HWENC_ENABLE_H264", config.enable_h264);
    config.enable_hevc           = get_env_bool("HWENC_ENABLE_HEVC", config.enable_hevc);
    config.enable_av1            = get_env_bool("HWENC_ENABLE_AV1", config.enable_av1);
    config.enable_yuv444         = get_env_bool("HWENC_ENABLE_YUV444", config.enable_yuv444);
    config.enable_10bit          = get_env_bool("HWENC_ENABLE_10BIT", config.enable_10bit);
    config.device_memcopy        = get_env_bool("HWENC_DEVICE_MEMCOPY", config.device_memcopy);
    config.context_limit         = static_cast<int>(get_env_long("HWENC_CONTEXT_LIMIT", config.context_limit));
    config.threaded_init         = get_env_bool("HWENC_THREADED_INIT", config.threaded_init);
    config.preset                = get_env("HWENC_PRESET", config.preset);
    config.tuning                = get_env("HWENC_TUNING", config.tuning);
    config.debug_dump            = get_env_bool("HWENC_DEBUG_DUMP", config.debug_dump);
    config.dump_dir              = get_env("HWENC_DUMP_DIR", config.dump_dir);
    config.device_id             = static_cast<int>(get_env_long("HWENC_DEVICE_ID", config.device_id));
    config.device_name           = get_env("HWENC_DEVICE_NAME", config.device_name);
    config.load_balancing        = get_env("HWENC_LOAD_BALANCING", config.load_balancing);
    config.min_compute           = static_cast<int>(get_env_long("HWENC_MIN_COMPUTE", config.min_compute));
    config.min_free_memory       = static_cast<int>(get_env_long("HWENC_MIN_FREE_MEMORY", config.min_free_memory));
    config.worker_threads        = static_cast<int>(get_env_long("HWENC_WORKER_THREADS", config.worker_threads));
    config.license_keys_file     = get_env("HWENC_CLIENT_KEY_FILE", config.license_keys_file);

    const std::string enabled = get_env("HWENC_ENABLED_DEVICES");
    if (!enabled.empty()) {
        config.enabled_devices = split_list(enabled);
    }
    const std::string disabled = get_env("HWENC_DISABLED_DEVICES");
    if (!disabled.empty()) {
        config.disabled_devices = split_list(disabled);
    }
    for (auto& key : split_list(get_env("HWENC_CLIENT_KEY"))) {
        if (std::find(config.license_keys.begin(), config.license_keys.end(), key) == config.license_keys.end()) {
            config.license_keys.push_back(std::move(key));
        }
    }

    if (config.context_limit < 1) {
        throw invalid_configuration{"context_limit must be at least 1, got " + std::to_string(config.context_limit)};
    }
    if (config.load_balancing != "memory" && config.load_balancing != "round-robin") {
        throw invalid_configuration{"load_balancing must be 'memory' or 'round-robin', got '" + config.load_balancing + "'"};
    }
    if (config.worker_threads < 1) {
        throw invalid_configuration{"worker_threads must be at least 1, got " + std::to_string(config.worker_threads)};
    }
}

module_config load_config(const std::string& path) {
    auto log = init_logging();

    module_config     config;
    const std::string file = path.empty() ? get_env("HWENC_CONFIG") : path;
    if (!file.empty()) {
        try {
            read_yaml(YAML::LoadFile(file), config);
            log->info("[config] Loaded {}", file);
        } catch (const YAML::BadFile&) {
            log->error("[config] Could not load given config file: {}", file);
            throw invalid_configuration{"Could not load given config file: " + file};
        } catch (const YAML::Exception& e) {
            log->error("[config] Malformed config file {}: {}", file, e.what());
            throw invalid_configuration{"Malformed config file " + file + ": " + e.what()};
        }
    }
    apply_env_overrides(config);

    if (!config.license_keys_file.empty()) {
        for (auto& key : read_key_file(config.license_keys_file)) {
            if (std::find(config.license_keys.begin(), config.license_keys.end(), key) == config.license_keys.end()) {
                config.license_keys.push_back(std::move(key));
            }
        }
    }
    return config;
}

} // namespace HWENC
