#pragma once

#include "error_util.hpp"
#include "pixel_format.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace HWENC {

enum class codec {
    h264,
    hevc,
    av1,
};

inline std::string to_string(codec c) {
    switch (c) {
    case codec::h264:
        return "h264";
    case codec::hevc:
        return "hevc";
    case codec::av1:
        return "av1";
    }
    return "unknown";
}

/**
 * @throws invalid_configuration for an unknown codec name.
 */
inline codec parse_codec(const std::string& name) {
    if (name == "h264" || name == "H264")
        return codec::h264;
    if (name == "hevc" || name == "h265" || name == "H265")
        return codec::hevc;
    if (name == "av1" || name == "AV1")
        return codec::av1;
    throw invalid_configuration{"unsupported codec '" + name + "'"};
}

enum class tuning {
    high_quality,
    low_latency,
    ultra_low_latency,
    lossless,
};

inline std::string to_string(tuning t) {
    switch (t) {
    case tuning::high_quality:
        return "high-quality";
    case tuning::low_latency:
        return "low-latency";
    case tuning::ultra_low_latency:
        return "ultra-low-latency";
    case tuning::lossless:
        return "lossless";
    }
    return "unknown";
}

inline tuning parse_tuning(const std::string& name) {
    for (auto t : {tuning::high_quality, tuning::low_latency, tuning::ultra_low_latency, tuning::lossless}) {
        if (to_string(t) == name) {
            return t;
        }
    }
    throw invalid_configuration{"unknown tuning '" + name + "'"};
}

enum class rc_mode {
    const_qp,
    vbr,
    cbr,
};

enum class picture_type {
    p,
    b,
    i,
    idr,
    unknown,
};

/// Capability queries answered by an open encoder session
enum class encoder_cap {
    width_max,
    height_max,
    async_encode,
    rc_modes, ///< bitmask of (1 << rc_mode)
    yuv444,
    lossless,
    intra_refresh,
    ten_bit,
};

struct device_info {
    int         id = -1;
    std::string name;
    std::string pci_bus_id;
    int         compute_major = 0;
    int         compute_minor = 0;
    std::size_t total_memory  = 0;
    std::size_t free_memory   = 0;
    bool        can_map_host_memory = false;

    [[nodiscard]] int compute_capability() const {
        return (compute_major << 4) + compute_minor;
    }
};

/// What one device can do for one codec, as learned by a probe
struct codec_capabilities {
    codec                      codec_id = codec::h264;
    std::vector<std::string>   presets; ///< in enumeration order
    std::vector<std::string>   profiles;
    std::vector<buffer_format> input_formats;
    uint32_t                   max_width     = 0;
    uint32_t                   max_height    = 0;
    bool                       async_encode  = false;
    bool                       yuv444        = false;
    bool                       lossless      = false;
    bool                       intra_refresh = false;
    bool                       ten_bit       = false;
    std::vector<rc_mode>       rc_modes;

    [[nodiscard]] bool supports(buffer_format format) const {
        return std::find(input_formats.begin(), input_formats.end(), format) != input_formats.end();
    }

    [[nodiscard]] bool has_preset(const std::string& name) const {
        return std::find(presets.begin(), presets.end(), name) != presets.end();
    }

    [[nodiscard]] bool has_profile(const std::string& name) const {
        return std::find(profiles.begin(), profiles.end(), name) != profiles.end();
    }

    bool operator==(const codec_capabilities& other) const {
        return codec_id == other.codec_id && presets == other.presets && profiles == other.profiles &&
            input_formats == other.input_formats && max_width == other.max_width && max_height == other.max_height &&
            async_encode == other.async_encode && yuv444 == other.yuv444 && lossless == other.lossless &&
            intra_refresh == other.intra_refresh && ten_bit == other.ten_bit && rc_modes == other.rc_modes;
    }

    bool operator!=(const codec_capabilities& other) const {
        return !(*this == other);
    }
};

struct rate_control_params {
    rc_mode  mode            = rc_mode::vbr;
    uint32_t average_bitrate = 0;
    uint32_t max_bitrate     = 0;
    int      min_qp          = 0;
    int      max_qp          = 0;
    int      initial_qp      = 0;
};

struct encoder_init_params {
    codec         codec_id = codec::h264;
    std::string   preset;
    tuning        tune = tuning::low_latency;
    std::string   profile;
    buffer_format format = buffer_format::iyuv;
    /// Encoded picture size: the logical (or scaled) size, never the padded allocation
    uint32_t            width      = 0;
    uint32_t            height     = 0;
    uint32_t            frame_rate = 30;
    bool                lossless   = false;
    bool                full_range = false;
    rate_control_params rc;
};

/// Opaque handle to something the encoder API owns (registered resource, mapped input, bitstream buffer)
using resource_handle = void*;

/// A device allocation being registered with the encoder as an input resource
struct resource_desc {
    uint64_t      device_ptr = 0;
    uint32_t      width      = 0;
    uint32_t      height     = 0;
    uint32_t      pitch      = 0;
    buffer_format format     = buffer_format::iyuv;
};

struct picture_params {
    resource_handle input  = nullptr; ///< mapped input resource
    resource_handle output = nullptr; ///< bitstream buffer
    buffer_format   format = buffer_format::iyuv;
    uint32_t        width  = 0;
    uint32_t        height = 0;
    uint32_t        pitch  = 0;
    uint64_t        frame_index = 0;
    uint64_t        timestamp   = 0; ///< session relative, in ms
    bool            force_idr   = false;
};

struct locked_bitstream {
    const uint8_t* data = nullptr;
    std::size_t    size = 0;
    picture_type   type = picture_type::unknown;
    uint64_t       timestamp = 0;
};

/// One dispatch of the color space conversion kernel
struct conversion_launch {
    enum class kernel {
        rgb_to_yuv420p,
        rgb_to_yuv444p,
    };

    kernel      which   = kernel::rgb_to_yuv420p;
    uint64_t    src     = 0;
    std::size_t src_pitch = 0;
    uint32_t    src_width  = 0;
    uint32_t    src_height = 0;
    rgb_offsets offsets{2, 1, 0};

    /// Y plane starts at dst, chroma planes follow at dst + pitch * dst_rows (each dst_chroma_pitch wide)
    uint64_t    dst       = 0;
    std::size_t dst_pitch = 0;
    std::size_t dst_chroma_pitch = 0;
    uint32_t    dst_width  = 0;
    uint32_t    dst_height = 0;
    uint32_t    dst_rows   = 0; ///< rows in the luma plane of the allocation

    bool full_range = false;
    bool bilinear   = false;

    uint32_t grid_x  = 1;
    uint32_t grid_y  = 1;
    uint32_t block_x = 1;
    uint32_t block_y = 1;
};

/// Page-locked host memory
class host_buffer {
public:
    virtual ~host_buffer() = default;

    virtual uint8_t*            data()       = 0;
    [[nodiscard]] virtual std::size_t size() const = 0;
};

/// A pitched 2D device allocation
class device_buffer {
public:
    virtual ~device_buffer() = default;

    [[nodiscard]] virtual uint64_t    ptr() const       = 0;
    [[nodiscard]] virtual std::size_t pitch() const     = 0;
    [[nodiscard]] virtual std::size_t row_bytes() const = 0;
    [[nodiscard]] virtual std::size_t rows() const      = 0;
};

/**
 * @brief A GPU compute context bound to one device. Destroying it releases the context.
 *
 * Every buffer and copy call requires the context to be current on the calling thread (see push()).
 */
class compute_context {
public:
    virtual ~compute_context() = default;

    [[nodiscard]] virtual int device_id() const = 0;

    virtual void push() = 0;
    virtual void pop()  = 0;

    /// The vendor handle the encoder API is opened against
    virtual void* native_handle() = 0;

    virtual std::unique_ptr<host_buffer>   alloc_host(std::size_t bytes)                         = 0;
    virtual std::unique_ptr<device_buffer> alloc_pitched(std::size_t row_bytes, std::size_t rows) = 0;

    virtual void copy_to_device(const device_buffer& dst, const uint8_t* src, std::size_t src_pitch, std::size_t row_bytes,
                                std::size_t rows) = 0;
    virtual void copy_device_to_device(const device_buffer& dst, uint64_t src, std::size_t src_pitch, std::size_t row_bytes,
                                       std::size_t rows) = 0;

    /// Runs the kernel and blocks until the device reports completion
    virtual void launch_conversion(const conversion_launch& launch) = 0;
};

class compute_api {
public:
    virtual ~compute_api() = default;

    /// Initializes the driver; throws hwenc_error if the runtime is unusable
    virtual void init()         = 0;
    virtual int  device_count() = 0;

    virtual device_info                      query_device(int id)   = 0;
    virtual std::unique_ptr<compute_context> create_context(int id) = 0;
};

/**
 * @brief One hardware encode session. Destroying it destroys the session.
 *
 * Must not outlive the compute_context it was opened against.
 */
class encoder_context {
public:
    virtual ~encoder_context() = default;

    virtual std::vector<codec>         codecs()                   = 0;
    virtual std::vector<std::string>   presets(codec c)           = 0;
    virtual std::vector<std::string>   profiles(codec c)          = 0;
    virtual std::vector<buffer_format> input_formats(codec c)     = 0;
    virtual int                        query_cap(codec c, encoder_cap cap) = 0;

    virtual void initialize(const encoder_init_params& params)                = 0;
    virtual void reconfigure(const rate_control_params& rc, bool force_idr) = 0;

    virtual resource_handle register_resource(const resource_desc& desc) = 0;
    virtual void            unregister_resource(resource_handle registered) = 0;
    virtual resource_handle map_resource(resource_handle registered)      = 0;
    virtual void            unmap_resource(resource_handle mapped)        = 0;

    virtual resource_handle create_bitstream_buffer()                    = 0;
    virtual void            destroy_bitstream_buffer(resource_handle bitstream) = 0;

    virtual void             encode_picture(const picture_params& picture) = 0;
    virtual locked_bitstream lock_bitstream(resource_handle bitstream)     = 0;
    virtual void             unlock_bitstream(resource_handle bitstream)   = 0;

    /// Signals end of stream so buffered pictures are drained
    virtual void flush() = 0;
};

class encoder_api {
public:
    virtual ~encoder_api() = default;

    /**
     * @brief Opens a session on the device of @p context.
     *
     * @param key activation key; empty for none.
     * @throws authorization_error if the key is rejected.
     */
    virtual std::unique_ptr<encoder_context> open_session(compute_context& context, const std::string& key) = 0;
};

} // namespace HWENC
