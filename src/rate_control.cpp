#include "hwenc/rate_control.hpp"

#include "hwenc/global_module_defs.hpp"

#include <algorithm>
#include <cmath>

namespace HWENC {

int max_qp(codec c) {
    return c == codec::av1 ? 255 : 51;
}

int quality_to_qp(int quality, codec c) {
    const int q = std::clamp(quality, 0, 100);
    return (100 - q) * max_qp(c) / 100;
}

uint32_t target_bitrate(int speed, uint32_t width, uint32_t height, bool subsampled) {
    const double s          = std::clamp(speed, 0, 100);
    const double megapixels = static_cast<double>(width) * height / 1e6;
    const double bitrate    = std::pow(0.5 + s / 200.0, 8) * bitrate_params::scale * megapixels * (subsampled ? 0.5 : 1.0);
    return static_cast<uint32_t>(std::clamp(bitrate, bitrate_params::min_bitrate, bitrate_params::max_bitrate));
}

rate_control_params compute_rate_control(codec c, int speed, int quality, bool lossless, uint32_t width, uint32_t height,
                                         bool subsampled) {
    rate_control_params rc;
    rc.average_bitrate = target_bitrate(speed, width, height, subsampled);
    rc.max_bitrate     = 2 * rc.average_bitrate;
    if (lossless) {
        rc.mode       = rc_mode::const_qp;
        rc.min_qp     = 0;
        rc.max_qp     = 0;
        rc.initial_qp = 0;
        return rc;
    }
    rc.mode       = rc_mode::vbr;
    rc.min_qp     = quality_to_qp(std::min(100, quality + quality_params::qp_band), c);
    rc.max_qp     = quality_to_qp(std::max(0, quality - quality_params::qp_band), c);
    rc.initial_qp = (rc.min_qp + rc.max_qp) / 2;
    return rc;
}

int apply_edge_resistance(int current, int requested) {
    const int target = std::clamp(requested, 0, 100);
    if (target >= quality_params::lossless_threshold) {
        return target;
    }
    return std::clamp(target, current - quality_params::edge_resistance, current + quality_params::edge_resistance);
}

} // namespace HWENC
