#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace HWENC {

using metadata_value = std::variant<bool, int64_t, std::string, std::pair<uint32_t, uint32_t>>;
using metadata_map   = std::map<std::string, metadata_value>;

/**
 * @brief Output of one compress() call; the caller owns it.
 *
 * Metadata keys: "csc" (colorspace alias), "frame" (index), "pts" (ms since the first frame),
 * "full-range", "kernel" (only when the conversion kernel ran), "type" ("IDR", only on IDR frames),
 * "quality" (100 only for true lossless), and "scaled_size" / "scaling-quality" when downscaling.
 */
struct compressed_frame {
    std::vector<uint8_t> data;
    metadata_map         metadata;

    template<typename T>
    const T& get(const std::string& key) const {
        return std::get<T>(metadata.at(key));
    }

    [[nodiscard]] bool has(const std::string& key) const {
        return metadata.find(key) != metadata.end();
    }
};

} // namespace HWENC
