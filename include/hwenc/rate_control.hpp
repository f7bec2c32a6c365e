#pragma once

#include "hardware.hpp"

#include <cstdint>

namespace HWENC {

/// Largest QP of the codec: 51 for H.264/HEVC, 255 for AV1
int max_qp(codec c);

/**
 * @brief Maps a quality percentage onto the codec's QP range; higher quality gives a lower QP.
 */
int quality_to_qp(int quality, codec c);

/**
 * @brief clamp(1e6, 1e8, (0.5 + speed / 200)^8 * 1e8 * megapixels * (0.5 for 4:2:0, else 1))
 */
uint32_t target_bitrate(int speed, uint32_t width, uint32_t height, bool subsampled);

/**
 * @brief Rate control for a target speed and quality.
 *
 * Lossy: VBR with a QP window derived from quality +/- 10 and the initial QP at its midpoint; the maximum
 * bitrate is twice the target. Lossless: constant QP 0.
 */
rate_control_params compute_rate_control(codec c, int speed, int quality, bool lossless, uint32_t width, uint32_t height,
                                         bool subsampled);

/**
 * @brief Moves @p current towards @p requested by at most the edge resistance step.
 *
 * Requests at or above the lossless threshold are returned unchanged so the caller can switch to lossless.
 */
int apply_edge_resistance(int current, int requested);

} // namespace HWENC
