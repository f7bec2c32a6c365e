#pragma once

#include "hwenc/hardware.hpp"

#include <cuda.h>
#include <memory>

namespace HWENC {

/**
 * @brief Translates a CUDA driver status into the encoder error taxonomy, logging it first.
 *
 * Out of memory becomes resource_exhaustion; timeouts and busy or unavailable devices become
 * transient_device_error; everything else is a plain hwenc_error.
 */
void check_cuda(CUresult result, const char* msg, int device_id = -1);

/**
 * @brief A retained primary context of one CUDA device.
 */
class cuda_context : public compute_context {
public:
    explicit cuda_context(int device_id);
    ~cuda_context() override;

    cuda_context(const cuda_context&)            = delete;
    cuda_context& operator=(const cuda_context&) = delete;

    [[nodiscard]] int device_id() const override {
        return device_id_;
    }

    void push() override;
    void pop() override;

    void* native_handle() override {
        return context_;
    }

    std::unique_ptr<host_buffer>   alloc_host(std::size_t bytes) override;
    std::unique_ptr<device_buffer> alloc_pitched(std::size_t row_bytes, std::size_t rows) override;

    void copy_to_device(const device_buffer& dst, const uint8_t* src, std::size_t src_pitch, std::size_t row_bytes,
                        std::size_t rows) override;
    void copy_device_to_device(const device_buffer& dst, uint64_t src, std::size_t src_pitch, std::size_t row_bytes,
                               std::size_t rows) override;

    void launch_conversion(const conversion_launch& launch) override;

private:
    int       device_id_;
    CUdevice  device_  = 0;
    CUcontext context_ = nullptr;
};

class cuda_compute : public compute_api {
public:
    void init() override;
    int  device_count() override;

    device_info                      query_device(int id) override;
    std::unique_ptr<compute_context> create_context(int id) override;
};

} // namespace HWENC
