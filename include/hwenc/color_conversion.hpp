#pragma once

#include "config.hpp"
#include "hardware.hpp"
#include "image.hpp"
#include "pixel_format.hpp"

#include <memory>
#include <optional>
#include <string>

namespace HWENC {

/**
 * @brief Picks the encoder input layout for a source format.
 *
 * 30 bit sources are imported packed. Packed RGB is imported as-is when allowed by the configuration and
 * accepted by the hardware, unless the session is lossless or scaled. Otherwise the source is converted to
 * planar 4:4:4 (lossless, or quality at or above the subsampling threshold) or planar 4:2:0.
 *
 * @throws invalid_configuration when the hardware accepts none of the candidate layouts.
 */
buffer_layout choose_layout(source_format source, const codec_capabilities& caps, const module_config& config, bool lossless,
                            int quality, bool scaled);

/// Name of the conversion kernel for a source format and layout, e.g. "BGRX_to_YUV420P"
std::string kernel_name(source_format source, const buffer_layout& layout);

/**
 * @brief Host staging, device input and device output buffers of one session, and the per-frame upload
 * and conversion into the encoder's input layout.
 *
 * Every call requires the session's compute context to be current.
 */
class color_conversion {
public:
    struct geometry {
        uint32_t width         = 0; ///< logical source size
        uint32_t height        = 0;
        uint32_t encode_width  = 0; ///< logical or scaled output size
        uint32_t encode_height = 0;
    };

    /// @param full_range output range of the conversion; every frame must request the same range
    color_conversion(compute_context& context, source_format source, buffer_layout layout, geometry size, bool bilinear,
                     bool device_memcopy, bool full_range = false);

    color_conversion(const color_conversion&)            = delete;
    color_conversion& operator=(const color_conversion&) = delete;

    /**
     * @brief Allocates all buffers.
     *
     * @throws resource_exhaustion when an allocation fails.
     */
    void allocate();

    /**
     * @brief Frees every buffer. Safe to call more than once.
     */
    void release();

    [[nodiscard]] bool allocated() const {
        return output_ != nullptr;
    }

    /// Description of the output buffer, for registration with the encoder
    [[nodiscard]] resource_desc output_desc() const;

    /**
     * @brief Uploads @p frame and converts it if the layout needs it; blocks until the output buffer is complete.
     *
     * @return the kernel name when the conversion kernel ran.
     * @throws invalid_configuration if the frame does not match the session's size, format or range.
     */
    std::optional<std::string> process(const image& frame);

    /// The kernel dispatch for the current buffers
    [[nodiscard]] conversion_launch make_launch(bool full_range) const;

    [[nodiscard]] const buffer_layout& layout() const {
        return layout_;
    }

    [[nodiscard]] const geometry& size() const {
        return size_;
    }

    [[nodiscard]] uint32_t padded_width() const {
        return padded_width_;
    }

    [[nodiscard]] uint32_t padded_height() const {
        return padded_height_;
    }

    [[nodiscard]] bool full_range() const {
        return full_range_;
    }

    [[nodiscard]] bool last_copy_on_device() const {
        return last_copy_on_device_;
    }

    [[nodiscard]] const host_buffer* staging() const {
        return staging_.get();
    }

    [[nodiscard]] const device_buffer* input() const {
        return input_.get();
    }

    [[nodiscard]] const device_buffer* output() const {
        return output_.get();
    }

private:
    compute_context& context_;
    source_format    source_;
    buffer_layout    layout_;
    geometry         size_;
    bool             bilinear_;
    bool             device_memcopy_;
    bool             full_range_;
    uint32_t         padded_width_;
    uint32_t         padded_height_;
    uint32_t         output_width_;
    uint32_t         output_height_;
    bool             last_copy_on_device_ = false;

    std::unique_ptr<host_buffer>   staging_;
    std::unique_ptr<device_buffer> input_;
    std::unique_ptr<device_buffer> output_;
};

} // namespace HWENC
