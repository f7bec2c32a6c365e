#pragma once

#include <cstddef>
#include <cstdint>

// Compiled by nvcc; keep this header free of host library includes.
namespace HWENC {

struct csc_args {
    const uint8_t* src;
    std::size_t    src_pitch;
    uint32_t       src_width;
    uint32_t       src_height;
    int            r_offset;
    int            g_offset;
    int            b_offset;
    /// Y plane; U and V follow after dst_rows rows, each dst_chroma_pitch wide
    uint8_t*    dst;
    std::size_t dst_pitch;
    std::size_t dst_chroma_pitch;
    uint32_t    dst_width;
    uint32_t    dst_height;
    uint32_t    dst_rows;
    bool        full_range;
    bool        bilinear;
};

struct csc_grid {
    uint32_t grid_x;
    uint32_t grid_y;
    uint32_t block_x;
    uint32_t block_y;
};

/**
 * @brief Enqueues a BT.601 RGB to planar YUV conversion on the current context's default stream.
 *
 * @param subsampled 4:2:0 output when true, 4:4:4 otherwise.
 * @return the CUDA runtime error code of the launch, 0 on success.
 */
int launch_rgb_to_yuv(const csc_args& args, const csc_grid& grid, bool subsampled);

} // namespace HWENC
