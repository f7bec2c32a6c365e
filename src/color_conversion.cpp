#include "hwenc/color_conversion.hpp"

#include "hwenc/global_module_defs.hpp"

#include <cstring>
#include <spdlog/spdlog.h>

namespace HWENC {

buffer_layout choose_layout(source_format source, const codec_capabilities& caps, const module_config& config, bool lossless,
                            int quality, bool scaled) {
    if (is_30bit(source)) {
        if (!config.enable_10bit || !caps.supports(buffer_format::argb10)) {
            throw invalid_configuration{to_string(caps.codec_id) + " cannot import " + to_string(source) + " on this device"};
        }
        if (scaled) {
            throw invalid_configuration{"scaling is not available for " + to_string(source)};
        }
        return packed_10bit{};
    }

    const auto native = native_buffer_format(source);
    if (config.native_rgb && native && caps.supports(*native) && !lossless && !scaled) {
        return packed_rgb{source, *native};
    }

    const bool want_444 = lossless || quality >= config.subsampling_threshold;
    if (want_444 && config.enable_yuv444 && caps.yuv444 && caps.supports(buffer_format::yuv444)) {
        return planar_444{};
    }
    if (!caps.supports(buffer_format::iyuv)) {
        throw invalid_configuration{to_string(caps.codec_id) + " has no usable input format for " + to_string(source)};
    }
    return planar_420{};
}

std::string kernel_name(source_format source, const buffer_layout& layout) {
    return to_string(source) + "_to_" + layout_name(layout);
}

color_conversion::color_conversion(compute_context& context, source_format source, buffer_layout layout, geometry size,
                                   bool bilinear, bool device_memcopy, bool full_range)
    : context_{context}
    , source_{source}
    , layout_{layout}
    , size_{size}
    , bilinear_{bilinear}
    , device_memcopy_{device_memcopy}
    , full_range_{full_range}
    , padded_width_{round_up(size.width, buffer_params::alignment)}
    , padded_height_{round_up(size.height, buffer_params::alignment)}
    , output_width_{round_up(size.encode_width, buffer_params::alignment)}
    , output_height_{round_up(size.encode_height, buffer_params::alignment)} {
    if (size.width == 0 || size.height == 0 || size.encode_width == 0 || size.encode_height == 0) {
        throw invalid_configuration{"invalid dimensions " + std::to_string(size.width) + "x" + std::to_string(size.height)};
    }
    if (!needs_conversion(layout_) && (size.encode_width != size.width || size.encode_height != size.height)) {
        throw invalid_configuration{"scaling requires the conversion kernel"};
    }
}

void color_conversion::allocate() {
    const std::size_t bpp = buffer_params::bytes_per_pixel;
    staging_              = context_.alloc_host(static_cast<std::size_t>(padded_width_) * bpp * padded_height_);
    if (needs_conversion(layout_)) {
        input_ = context_.alloc_pitched(static_cast<std::size_t>(padded_width_) * bpp, padded_height_);
    }
    output_ = std::visit(overloaded{[&](const packed_rgb&) {
                                        return context_.alloc_pitched(output_width_ * bpp, output_height_);
                                    },
                                    [&](const packed_10bit&) {
                                        return context_.alloc_pitched(output_width_ * bpp, output_height_);
                                    },
                                    [&](const planar_444&) {
                                        return context_.alloc_pitched(output_width_, 3 * output_height_);
                                    },
                                    [&](const planar_420&) {
                                        return context_.alloc_pitched(output_width_, output_height_ * 3 / 2);
                                    }},
                         layout_);

    if (auto log = spdlog::get("hwenc")) {
        log->debug("[color_conversion] {} -> {}: staging {} bytes, input {}, output pitch {} x {} rows", to_string(source_),
                   layout_name(layout_), staging_->size(), input_ ? std::to_string(input_->pitch()) : std::string{"none"},
                   output_->pitch(), output_->rows());
    }
}

void color_conversion::release() {
    output_.reset();
    input_.reset();
    staging_.reset();
}

resource_desc color_conversion::output_desc() const {
    if (!output_) {
        throw protocol_violation{"color_conversion buffers are not allocated"};
    }
    resource_desc desc;
    desc.device_ptr = output_->ptr();
    desc.width      = output_width_;
    desc.height     = output_height_;
    desc.pitch      = static_cast<uint32_t>(output_->pitch());
    desc.format     = hardware_format(layout_);
    return desc;
}

conversion_launch color_conversion::make_launch(bool full_range) const {
    if (!input_ || !output_) {
        throw protocol_violation{"no conversion buffers for " + layout_name(layout_)};
    }
    conversion_launch launch;
    launch.src        = input_->ptr();
    launch.src_pitch  = input_->pitch();
    launch.src_width  = size_.width;
    launch.src_height = size_.height;
    launch.offsets    = channel_offsets(source_);
    launch.dst        = output_->ptr();
    launch.dst_pitch  = output_->pitch();
    launch.dst_width  = size_.encode_width;
    launch.dst_height = size_.encode_height;
    launch.dst_rows   = output_height_;
    launch.full_range = full_range;
    launch.bilinear   = bilinear_;
    launch.block_x    = buffer_params::block_size;
    launch.block_y    = buffer_params::block_size;

    const uint32_t block = buffer_params::block_size;
    std::visit(overloaded{[&](const planar_420&) {
                              // one thread per 2x2 luma block
                              launch.which            = conversion_launch::kernel::rgb_to_yuv420p;
                              launch.dst_chroma_pitch = output_->pitch() / 2;
                              launch.grid_x           = ((size_.encode_width + 1) / 2 + block - 1) / block;
                              launch.grid_y           = ((size_.encode_height + 1) / 2 + block - 1) / block;
                          },
                          [&](const planar_444&) {
                              launch.which            = conversion_launch::kernel::rgb_to_yuv444p;
                              launch.dst_chroma_pitch = output_->pitch();
                              launch.grid_x           = (size_.encode_width + block - 1) / block;
                              launch.grid_y           = (size_.encode_height + block - 1) / block;
                          },
                          [&](const packed_rgb&) {
                              throw protocol_violation{"packed layouts are not converted"};
                          },
                          [&](const packed_10bit&) {
                              throw protocol_violation{"packed layouts are not converted"};
                          }},
               layout_);
    return launch;
}

std::optional<std::string> color_conversion::process(const image& frame) {
    if (!output_) {
        throw protocol_violation{"color_conversion buffers are not allocated"};
    }
    if (frame.width != size_.width || frame.height != size_.height) {
        throw invalid_configuration{"frame size mismatch: " + std::to_string(frame.width) + "x" + std::to_string(frame.height) +
                                    " should be " + std::to_string(size_.width) + "x" + std::to_string(size_.height)};
    }
    if (frame.format != source_) {
        throw invalid_configuration{"frame format " + to_string(frame.format) + " does not match session format " +
                                    to_string(source_)};
    }
    if (frame.full_range != full_range_) {
        throw invalid_configuration{std::string{"frame requests "} + (frame.full_range ? "full" : "limited") +
                                    " range output, the session encodes " + (full_range_ ? "full" : "limited") + " range"};
    }

    const std::size_t    row_bytes = static_cast<std::size_t>(frame.width) * buffer_params::bytes_per_pixel;
    const device_buffer& target    = input_ ? *input_ : *output_;
    if (frame.stride < row_bytes) {
        throw invalid_configuration{"frame stride " + std::to_string(frame.stride) + " is shorter than a row"};
    }

    if (device_memcopy_ && frame.device_ptr && frame.stride <= target.pitch()) {
        context_.copy_device_to_device(target, *frame.device_ptr, frame.stride, row_bytes, frame.height);
        last_copy_on_device_ = true;
    } else {
        if (frame.pixels == nullptr) {
            throw invalid_configuration{"frame has no host pixels"};
        }
        const std::size_t staging_pitch = static_cast<std::size_t>(padded_width_) * buffer_params::bytes_per_pixel;
        uint8_t*          staging       = staging_->data();
        if (frame.stride == staging_pitch) {
            std::memcpy(staging, frame.pixels, staging_pitch * frame.height);
        } else {
            for (uint32_t y = 0; y < frame.height; ++y) {
                std::memcpy(staging + y * staging_pitch, frame.pixels + static_cast<std::size_t>(y) * frame.stride, row_bytes);
            }
        }
        context_.copy_to_device(target, staging, staging_pitch, row_bytes, frame.height);
        last_copy_on_device_ = false;
    }

    if (!needs_conversion(layout_)) {
        return std::nullopt;
    }
    context_.launch_conversion(make_launch(full_range_));
    return kernel_name(source_, layout_);
}

} // namespace HWENC
