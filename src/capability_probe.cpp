#include "hwenc/capability_probe.hpp"

#include <algorithm>
#include <spdlog/fmt/ranges.h>
#include <spdlog/spdlog.h>

namespace HWENC {

std::optional<codec_capabilities> capability_probe::query(codec c) {
    auto log = spdlog::get("hwenc");

    const auto available = session_.codecs();
    if (std::find(available.begin(), available.end(), c) == available.end()) {
        if (log) {
            log->debug("[capability_probe] {} not offered by this session", to_string(c));
        }
        return std::nullopt;
    }

    codec_capabilities caps;
    caps.codec_id      = c;
    caps.presets       = session_.presets(c);
    caps.profiles      = session_.profiles(c);
    caps.input_formats = session_.input_formats(c);
    caps.max_width     = static_cast<uint32_t>(std::max(0, session_.query_cap(c, encoder_cap::width_max)));
    caps.max_height    = static_cast<uint32_t>(std::max(0, session_.query_cap(c, encoder_cap::height_max)));
    caps.async_encode  = session_.query_cap(c, encoder_cap::async_encode) != 0;
    caps.yuv444        = session_.query_cap(c, encoder_cap::yuv444) != 0;
    caps.lossless      = session_.query_cap(c, encoder_cap::lossless) != 0;
    caps.intra_refresh = session_.query_cap(c, encoder_cap::intra_refresh) != 0;
    caps.ten_bit       = session_.query_cap(c, encoder_cap::ten_bit) != 0;

    const int rc_mask = session_.query_cap(c, encoder_cap::rc_modes);
    for (auto mode : {rc_mode::const_qp, rc_mode::vbr, rc_mode::cbr}) {
        if (rc_mask & (1 << static_cast<int>(mode))) {
            caps.rc_modes.push_back(mode);
        }
    }

    if (log) {
        log->debug("[capability_probe] {}: presets [{}], profiles [{}], max {}x{}, yuv444={}, lossless={}, "
                   "intra-refresh={}, 10bit={}, async={}",
                   to_string(c), fmt::join(caps.presets, ", "), fmt::join(caps.profiles, ", "), caps.max_width,
                   caps.max_height, caps.yuv444, caps.lossless, caps.intra_refresh, caps.ten_bit, caps.async_encode);
    }
    return caps;
}

} // namespace HWENC
