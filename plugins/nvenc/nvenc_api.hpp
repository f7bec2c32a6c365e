#pragma once

#include "hwenc/dynamic_lib.hpp"
#include "hwenc/hardware.hpp"

#include <memory>
#include <nvEncodeAPI.h>
#include <string>
#include <vector>

namespace HWENC {

/**
 * @brief Translates an NVENC status into the encoder error taxonomy, logging it first.
 *
 * @param preset preset in use, carried by invalid_configuration so the caller can denylist it.
 */
void check_nvenc(NVENCSTATUS status, const std::string& msg, const std::string& preset = "", int device_id = -1);

const char* nvenc_status_name(NVENCSTATUS status);

/// Parses "xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx" (dashes optional); throws authorization_error when malformed
GUID parse_client_key(const std::string& key);

/// The loaded driver library and its function table
struct nvenc_library {
    dynamic_lib                 lib;
    NV_ENCODE_API_FUNCTION_LIST functions;
};

class nvenc_session : public encoder_context {
public:
    nvenc_session(std::shared_ptr<const nvenc_library> library, void* encoder, int device_id);
    ~nvenc_session() override;

    nvenc_session(const nvenc_session&)            = delete;
    nvenc_session& operator=(const nvenc_session&) = delete;

    std::vector<codec>         codecs() override;
    std::vector<std::string>   presets(codec c) override;
    std::vector<std::string>   profiles(codec c) override;
    std::vector<buffer_format> input_formats(codec c) override;
    int                        query_cap(codec c, encoder_cap cap) override;

    void initialize(const encoder_init_params& params) override;
    void reconfigure(const rate_control_params& rc, bool force_idr) override;

    resource_handle register_resource(const resource_desc& desc) override;
    void            unregister_resource(resource_handle registered) override;
    resource_handle map_resource(resource_handle registered) override;
    void            unmap_resource(resource_handle mapped) override;

    resource_handle create_bitstream_buffer() override;
    void            destroy_bitstream_buffer(resource_handle bitstream) override;

    void             encode_picture(const picture_params& picture) override;
    locked_bitstream lock_bitstream(resource_handle bitstream) override;
    void             unlock_bitstream(resource_handle bitstream) override;

    void flush() override;

private:
    void apply_rate_control(const rate_control_params& rc);

    [[nodiscard]] const NV_ENCODE_API_FUNCTION_LIST& api() const {
        return library_->functions;
    }

    std::shared_ptr<const nvenc_library> library_;
    void*                                encoder_;
    int                                  device_id_;

    encoder_init_params    params_;
    NV_ENC_INITIALIZE_PARAMS init_params_{};
    NV_ENC_CONFIG          config_{};
    bool                   initialized_ = false;
};

/**
 * @brief Opens NVENC sessions on CUDA contexts. The driver library is loaded on construction.
 *
 * @throws hwenc_error when libnvidia-encode cannot be loaded or is too old for the headers.
 */
class nvenc_api : public encoder_api {
public:
    nvenc_api();

    std::unique_ptr<encoder_context> open_session(compute_context& context, const std::string& key) override;

private:
    std::shared_ptr<nvenc_library> library_;
};

} // namespace HWENC
