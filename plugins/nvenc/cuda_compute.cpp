#include "cuda_compute.hpp"

#include "csc_kernels.hpp"

#include <spdlog/spdlog.h>
#include <string>

namespace HWENC {

namespace {

    std::string cuda_error_string(CUresult result) {
        const char* name = nullptr;
        const char* text = nullptr;
        cuGetErrorName(result, &name);
        cuGetErrorString(result, &text);
        return std::string{name == nullptr ? "CUDA_ERROR_UNKNOWN" : name} + " (" + std::to_string(result) + ")" +
            (text == nullptr ? "" : std::string{": "} + text);
    }

    void log_cuda_failure(CUresult result, const char* what) {
        if (result == CUDA_SUCCESS) {
            return;
        }
        if (auto log = spdlog::get("hwenc")) {
            log->error("[cuda] {} failed: {}", what, cuda_error_string(result));
        }
    }

    class cuda_host_buffer : public host_buffer {
    public:
        cuda_host_buffer(void* data, std::size_t size)
            : data_{static_cast<uint8_t*>(data)}
            , size_{size} { }

        ~cuda_host_buffer() override {
            log_cuda_failure(cuMemFreeHost(data_), "cuMemFreeHost");
        }

        uint8_t* data() override {
            return data_;
        }

        [[nodiscard]] std::size_t size() const override {
            return size_;
        }

    private:
        uint8_t*    data_;
        std::size_t size_;
    };

    class cuda_device_buffer : public device_buffer {
    public:
        cuda_device_buffer(CUdeviceptr ptr, std::size_t pitch, std::size_t row_bytes, std::size_t rows)
            : ptr_{ptr}
            , pitch_{pitch}
            , row_bytes_{row_bytes}
            , rows_{rows} { }

        ~cuda_device_buffer() override {
            log_cuda_failure(cuMemFree(ptr_), "cuMemFree");
        }

        [[nodiscard]] uint64_t ptr() const override {
            return static_cast<uint64_t>(ptr_);
        }

        [[nodiscard]] std::size_t pitch() const override {
            return pitch_;
        }

        [[nodiscard]] std::size_t row_bytes() const override {
            return row_bytes_;
        }

        [[nodiscard]] std::size_t rows() const override {
            return rows_;
        }

    private:
        CUdeviceptr ptr_;
        std::size_t pitch_;
        std::size_t row_bytes_;
        std::size_t rows_;
    };

    int device_attribute(CUdevice device, CUdevice_attribute attribute, int device_id) {
        int value = 0;
        check_cuda(cuDeviceGetAttribute(&value, attribute, device), "cuDeviceGetAttribute", device_id);
        return value;
    }

} // namespace

void check_cuda(CUresult result, const char* msg, int device_id) {
    if (result == CUDA_SUCCESS) {
        return;
    }
    const std::string what = std::string{msg} + " failed: " + cuda_error_string(result);
    if (auto log = spdlog::get("hwenc")) {
        log->error("[cuda] {}", what);
    }
    switch (result) {
    case CUDA_ERROR_OUT_OF_MEMORY:
        throw resource_exhaustion{what};
    case CUDA_ERROR_LAUNCH_TIMEOUT:
    case CUDA_ERROR_NOT_READY:
    case CUDA_ERROR_DEVICE_UNAVAILABLE:
    case CUDA_ERROR_CONTEXT_ALREADY_IN_USE:
        throw transient_device_error{what, device_id};
    default:
        throw hwenc_error{what};
    }
}

cuda_context::cuda_context(int device_id)
    : device_id_{device_id} {
    check_cuda(cuDeviceGet(&device_, device_id), "cuDeviceGet", device_id);
    check_cuda(cuDevicePrimaryCtxRetain(&context_, device_), "cuDevicePrimaryCtxRetain", device_id);
    spdlog::get("hwenc")->debug("[cuda] device {} context {}", device_id_, static_cast<void*>(context_));
}

cuda_context::~cuda_context() {
    log_cuda_failure(cuDevicePrimaryCtxRelease(device_), "cuDevicePrimaryCtxRelease");
}

void cuda_context::push() {
    check_cuda(cuCtxPushCurrent(context_), "cuCtxPushCurrent", device_id_);
}

void cuda_context::pop() {
    CUcontext popped = nullptr;
    check_cuda(cuCtxPopCurrent(&popped), "cuCtxPopCurrent", device_id_);
}

std::unique_ptr<host_buffer> cuda_context::alloc_host(std::size_t bytes) {
    void* data = nullptr;
    check_cuda(cuMemHostAlloc(&data, bytes, CU_MEMHOSTALLOC_PORTABLE), "cuMemHostAlloc", device_id_);
    return std::make_unique<cuda_host_buffer>(data, bytes);
}

std::unique_ptr<device_buffer> cuda_context::alloc_pitched(std::size_t row_bytes, std::size_t rows) {
    CUdeviceptr ptr   = 0;
    std::size_t pitch = 0;
    check_cuda(cuMemAllocPitch(&ptr, &pitch, row_bytes, rows, 16), "cuMemAllocPitch", device_id_);
    return std::make_unique<cuda_device_buffer>(ptr, pitch, row_bytes, rows);
}

void cuda_context::copy_to_device(const device_buffer& dst, const uint8_t* src, std::size_t src_pitch, std::size_t row_bytes,
                                  std::size_t rows) {
    CUDA_MEMCPY2D copy{};
    copy.srcMemoryType = CU_MEMORYTYPE_HOST;
    copy.srcHost       = src;
    copy.srcPitch      = src_pitch;
    copy.dstMemoryType = CU_MEMORYTYPE_DEVICE;
    copy.dstDevice     = static_cast<CUdeviceptr>(dst.ptr());
    copy.dstPitch      = dst.pitch();
    copy.WidthInBytes  = row_bytes;
    copy.Height        = rows;
    check_cuda(cuMemcpy2D(&copy), "cuMemcpy2D host to device", device_id_);
}

void cuda_context::copy_device_to_device(const device_buffer& dst, uint64_t src, std::size_t src_pitch, std::size_t row_bytes,
                                         std::size_t rows) {
    CUDA_MEMCPY2D copy{};
    copy.srcMemoryType = CU_MEMORYTYPE_DEVICE;
    copy.srcDevice     = static_cast<CUdeviceptr>(src);
    copy.srcPitch      = src_pitch;
    copy.dstMemoryType = CU_MEMORYTYPE_DEVICE;
    copy.dstDevice     = static_cast<CUdeviceptr>(dst.ptr());
    copy.dstPitch      = dst.pitch();
    copy.WidthInBytes  = row_bytes;
    copy.Height        = rows;
    check_cuda(cuMemcpy2D(&copy), "cuMemcpy2D device to device", device_id_);
}

void cuda_context::launch_conversion(const conversion_launch& launch) {
    const csc_args args{reinterpret_cast<const uint8_t*>(launch.src),
                        launch.src_pitch,
                        launch.src_width,
                        launch.src_height,
                        launch.offsets.r,
                        launch.offsets.g,
                        launch.offsets.b,
                        reinterpret_cast<uint8_t*>(launch.dst),
                        launch.dst_pitch,
                        launch.dst_chroma_pitch,
                        launch.dst_width,
                        launch.dst_height,
                        launch.dst_rows,
                        launch.full_range,
                        launch.bilinear};
    const csc_grid grid{launch.grid_x, launch.grid_y, launch.block_x, launch.block_y};

    const int status = launch_rgb_to_yuv(args, grid, launch.which == conversion_launch::kernel::rgb_to_yuv420p);
    if (status != 0) {
        throw hwenc_error{"conversion kernel launch failed with CUDA runtime error " + std::to_string(status)};
    }
    check_cuda(cuCtxSynchronize(), "cuCtxSynchronize", device_id_);
}

void cuda_compute::init() {
    check_cuda(cuInit(0), "cuInit");
    int version = 0;
    check_cuda(cuDriverGetVersion(&version), "cuDriverGetVersion");
    spdlog::get("hwenc")->info("[cuda] driver version {}.{}", version / 1000, (version % 1000) / 10);
}

int cuda_compute::device_count() {
    int count = 0;
    check_cuda(cuDeviceGetCount(&count), "cuDeviceGetCount");
    return count;
}

device_info cuda_compute::query_device(int id) {
    CUdevice device = 0;
    check_cuda(cuDeviceGet(&device, id), "cuDeviceGet", id);

    device_info info;
    info.id = id;

    char name[256] = {};
    check_cuda(cuDeviceGetName(name, sizeof(name), device), "cuDeviceGetName", id);
    info.name = name;

    char pci_bus_id[32] = {};
    check_cuda(cuDeviceGetPCIBusId(pci_bus_id, sizeof(pci_bus_id), device), "cuDeviceGetPCIBusId", id);
    info.pci_bus_id = pci_bus_id;

    info.compute_major       = device_attribute(device, CU_DEVICE_ATTRIBUTE_COMPUTE_CAPABILITY_MAJOR, id);
    info.compute_minor       = device_attribute(device, CU_DEVICE_ATTRIBUTE_COMPUTE_CAPABILITY_MINOR, id);
    info.can_map_host_memory = device_attribute(device, CU_DEVICE_ATTRIBUTE_CAN_MAP_HOST_MEMORY, id) != 0;

    // free memory is only reported for a current context
    cuda_context context{id};
    context.push();
    std::size_t free_memory  = 0;
    std::size_t total_memory = 0;
    const CUresult result    = cuMemGetInfo(&free_memory, &total_memory);
    context.pop();
    check_cuda(result, "cuMemGetInfo", id);
    info.free_memory  = free_memory;
    info.total_memory = total_memory;
    return info;
}

std::unique_ptr<compute_context> cuda_compute::create_context(int id) {
    return std::make_unique<cuda_context>(id);
}

} // namespace HWENC
