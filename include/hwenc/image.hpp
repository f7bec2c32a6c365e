#pragma once

#include "pixel_format.hpp"

#include <cstdint>
#include <optional>

namespace HWENC {

/**
 * @brief A captured frame as handed over by the capture layer. Not owned: the pixels stay valid for the
 * duration of the compress() call only.
 */
struct image {
    uint32_t       width  = 0;
    uint32_t       height = 0;
    uint32_t       stride = 0; ///< bytes per row of pixels
    source_format  format = source_format::BGRX;
    const uint8_t* pixels = nullptr;

    /// Device address of an already-resident copy of the same pixels, with the same stride
    std::optional<uint64_t> device_ptr;

    /// Capture time in milliseconds
    int64_t timestamp  = 0;
    bool    full_range = false;
};

} // namespace HWENC
