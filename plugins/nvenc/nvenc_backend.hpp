#pragma once

#include "cuda_compute.hpp"
#include "nvenc_api.hpp"

#include <memory>

namespace HWENC {

/// The CUDA driver backed compute API
inline std::shared_ptr<compute_api> make_cuda_compute() {
    return std::make_shared<cuda_compute>();
}

/**
 * @brief The NVENC backed encoder API.
 *
 * @throws hwenc_error when the driver's encode library is missing.
 */
inline std::shared_ptr<encoder_api> make_nvenc_api() {
    return std::make_shared<nvenc_api>();
}

} // namespace HWENC
