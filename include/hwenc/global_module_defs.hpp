// Encoder-wide constants. Tunables that operators change live in config.hpp instead.
#pragma once

#include <algorithm>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace HWENC {

/// Session quality knobs
struct quality_params {
    // Quality at or above this value requests true lossless encoding
    static constexpr int lossless_threshold = 100;

    // Best quality reachable without lossless support
    static constexpr int best_lossy = lossless_threshold - 1;

    // Largest quality change applied by a single set_quality call (below the lossless threshold)
    static constexpr int edge_resistance = 10;

    // Half-width, in quality units, of the band used to derive the QP window
    static constexpr int qp_band = 10;
};

/// Buffer geometry
struct buffer_params {
    // Width and height are rounded up to this many pixels before buffers are sized
    static constexpr uint32_t alignment = 32;

    // Source and packed output pixels are always 32 bits wide
    static constexpr uint32_t bytes_per_pixel = 4;

    // Thread-block edge used by the conversion kernels
    static constexpr uint32_t block_size = 16;
};

/// Device scheduling
struct device_params {
    // Default soft limit of active encode contexts per device
    static constexpr int context_limit = 32;

    // A device failure discounts that device for this many seconds
    static constexpr double failure_discount_seconds = 60.0;

    // Runtime factors never drop below this floor
    static constexpr double min_runtime_factor = 0.1;
};

/// Rate control
struct bitrate_params {
    static constexpr double min_bitrate = 1e6;
    static constexpr double max_bitrate = 1e8;
    static constexpr double scale       = 1e8;
};

inline constexpr uint32_t round_up(uint32_t value, uint32_t alignment) {
    return (value + alignment - 1) / alignment * alignment;
}

/**
 * @brief Convert a string containing a (python) boolean to the bool type
 */
inline bool str_to_bool(const std::string& var) {
    std::string temp = var;
    std::transform(temp.begin(), temp.end(), temp.begin(), ::toupper);
    if (temp.empty())
        return false;
    return (temp == "TRUE" || temp == "1" || temp == "YES" || temp == "ON") ? true
        : (temp == "FALSE" || temp == "0" || temp == "NO" || temp == "OFF")  ? false
                                                                             : throw std::runtime_error("Invalid conversion from std::string to bool");
}

} // namespace HWENC
