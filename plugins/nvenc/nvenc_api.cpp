#include "nvenc_api.hpp"

#include <algorithm>
#include <cctype>
#include <cstring>
#include <optional>
#include <spdlog/spdlog.h>
#include <utility>

namespace HWENC {

namespace {

    typedef NVENCSTATUS(NVENCAPI* PNVENCODEAPICREATEINSTANCE)(NV_ENCODE_API_FUNCTION_LIST*);
    typedef NVENCSTATUS(NVENCAPI* PNVENCODEAPIGETMAXSUPPORTEDVERSION)(uint32_t*);

    bool same_guid(const GUID& a, const GUID& b) {
        return std::memcmp(&a, &b, sizeof(GUID)) == 0;
    }

    template<typename T>
    struct named_guid {
        GUID guid;
        T    value;
    };

    const std::vector<named_guid<codec>>& codec_guids() {
        static const std::vector<named_guid<codec>> guids{
            {NV_ENC_CODEC_H264_GUID, codec::h264},
            {NV_ENC_CODEC_HEVC_GUID, codec::hevc},
            {NV_ENC_CODEC_AV1_GUID, codec::av1},
        };
        return guids;
    }

    const std::vector<named_guid<std::string>>& preset_guids() {
        static const std::vector<named_guid<std::string>> guids{
            {NV_ENC_PRESET_P1_GUID, "P1"}, {NV_ENC_PRESET_P2_GUID, "P2"}, {NV_ENC_PRESET_P3_GUID, "P3"},
            {NV_ENC_PRESET_P4_GUID, "P4"}, {NV_ENC_PRESET_P5_GUID, "P5"}, {NV_ENC_PRESET_P6_GUID, "P6"},
            {NV_ENC_PRESET_P7_GUID, "P7"},
        };
        return guids;
    }

    const std::vector<named_guid<std::string>>& profile_guids(codec c) {
        static const std::vector<named_guid<std::string>> h264{
            {NV_ENC_CODEC_PROFILE_AUTOSELECT_GUID, "auto"}, {NV_ENC_H264_PROFILE_BASELINE_GUID, "baseline"},
            {NV_ENC_H264_PROFILE_MAIN_GUID, "main"},        {NV_ENC_H264_PROFILE_HIGH_GUID, "high"},
            {NV_ENC_H264_PROFILE_HIGH_444_GUID, "high444"},
        };
        static const std::vector<named_guid<std::string>> hevc{
            {NV_ENC_CODEC_PROFILE_AUTOSELECT_GUID, "auto"},
            {NV_ENC_HEVC_PROFILE_MAIN_GUID, "main"},
            {NV_ENC_HEVC_PROFILE_MAIN10_GUID, "main10"},
            {NV_ENC_HEVC_PROFILE_FREXT_GUID, "frext"},
        };
        static const std::vector<named_guid<std::string>> av1{
            {NV_ENC_CODEC_PROFILE_AUTOSELECT_GUID, "auto"},
            {NV_ENC_AV1_PROFILE_MAIN_GUID, "main"},
        };
        switch (c) {
        case codec::h264:
            return h264;
        case codec::hevc:
            return hevc;
        case codec::av1:
            return av1;
        }
        return h264;
    }

    std::optional<buffer_format> from_nvenc(NV_ENC_BUFFER_FORMAT format) {
        switch (format) {
        case NV_ENC_BUFFER_FORMAT_ARGB:
            return buffer_format::argb;
        case NV_ENC_BUFFER_FORMAT_ABGR:
            return buffer_format::abgr;
        case NV_ENC_BUFFER_FORMAT_ARGB10:
            return buffer_format::argb10;
        case NV_ENC_BUFFER_FORMAT_IYUV:
            return buffer_format::iyuv;
        case NV_ENC_BUFFER_FORMAT_YUV444:
            return buffer_format::yuv444;
        default:
            return std::nullopt;
        }
    }

    NV_ENC_BUFFER_FORMAT to_nvenc(buffer_format format) {
        switch (format) {
        case buffer_format::argb:
            return NV_ENC_BUFFER_FORMAT_ARGB;
        case buffer_format::abgr:
            return NV_ENC_BUFFER_FORMAT_ABGR;
        case buffer_format::argb10:
            return NV_ENC_BUFFER_FORMAT_ARGB10;
        case buffer_format::iyuv:
            return NV_ENC_BUFFER_FORMAT_IYUV;
        case buffer_format::yuv444:
            return NV_ENC_BUFFER_FORMAT_YUV444;
        }
        return NV_ENC_BUFFER_FORMAT_UNDEFINED;
    }

    NV_ENC_TUNING_INFO to_nvenc(tuning t) {
        switch (t) {
        case tuning::high_quality:
            return NV_ENC_TUNING_INFO_HIGH_QUALITY;
        case tuning::low_latency:
            return NV_ENC_TUNING_INFO_LOW_LATENCY;
        case tuning::ultra_low_latency:
            return NV_ENC_TUNING_INFO_ULTRA_LOW_LATENCY;
        case tuning::lossless:
            return NV_ENC_TUNING_INFO_LOSSLESS;
        }
        return NV_ENC_TUNING_INFO_LOW_LATENCY;
    }

    picture_type from_nvenc(NV_ENC_PIC_TYPE type) {
        switch (type) {
        case NV_ENC_PIC_TYPE_P:
            return picture_type::p;
        case NV_ENC_PIC_TYPE_B:
            return picture_type::b;
        case NV_ENC_PIC_TYPE_I:
            return picture_type::i;
        case NV_ENC_PIC_TYPE_IDR:
            return picture_type::idr;
        default:
            return picture_type::unknown;
        }
    }

    NV_ENC_CAPS to_nvenc(encoder_cap cap) {
        switch (cap) {
        case encoder_cap::width_max:
            return NV_ENC_CAPS_WIDTH_MAX;
        case encoder_cap::height_max:
            return NV_ENC_CAPS_HEIGHT_MAX;
        case encoder_cap::async_encode:
            return NV_ENC_CAPS_ASYNC_ENCODE_SUPPORT;
        case encoder_cap::rc_modes:
            return NV_ENC_CAPS_SUPPORTED_RATECONTROL_MODES;
        case encoder_cap::yuv444:
            return NV_ENC_CAPS_SUPPORT_YUV444_ENCODE;
        case encoder_cap::lossless:
            return NV_ENC_CAPS_SUPPORT_LOSSLESS_ENCODE;
        case encoder_cap::intra_refresh:
            return NV_ENC_CAPS_SUPPORT_INTRA_REFRESH;
        case encoder_cap::ten_bit:
            return NV_ENC_CAPS_SUPPORT_10BIT_ENCODE;
        }
        return NV_ENC_CAPS_WIDTH_MAX;
    }

    GUID codec_guid(codec c) {
        for (const auto& entry : codec_guids()) {
            if (entry.value == c) {
                return entry.guid;
            }
        }
        throw invalid_configuration{"no encode GUID for " + to_string(c)};
    }

    GUID named(const std::vector<named_guid<std::string>>& table, const std::string& name, const char* kind) {
        for (const auto& entry : table) {
            if (entry.value == name) {
                return entry.guid;
            }
        }
        throw invalid_configuration{std::string{"unknown "} + kind + " '" + name + "'", kind == std::string{"preset"} ? name : ""};
    }

    int hex_digit(char c) {
        if (c >= '0' && c <= '9')
            return c - '0';
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        if (c >= 'a' && c <= 'f')
            return c - 'a' + 10;
        return -1;
    }

} // namespace

const char* nvenc_status_name(NVENCSTATUS status) {
    switch (status) {
    case NV_ENC_SUCCESS:
        return "NV_ENC_SUCCESS";
    case NV_ENC_ERR_NO_ENCODE_DEVICE:
        return "NV_ENC_ERR_NO_ENCODE_DEVICE";
    case NV_ENC_ERR_UNSUPPORTED_DEVICE:
        return "NV_ENC_ERR_UNSUPPORTED_DEVICE";
    case NV_ENC_ERR_INVALID_ENCODERDEVICE:
        return "NV_ENC_ERR_INVALID_ENCODERDEVICE";
    case NV_ENC_ERR_INVALID_DEVICE:
        return "NV_ENC_ERR_INVALID_DEVICE";
    case NV_ENC_ERR_DEVICE_NOT_EXIST:
        return "NV_ENC_ERR_DEVICE_NOT_EXIST";
    case NV_ENC_ERR_INVALID_PTR:
        return "NV_ENC_ERR_INVALID_PTR";
    case NV_ENC_ERR_INVALID_EVENT:
        return "NV_ENC_ERR_INVALID_EVENT";
    case NV_ENC_ERR_INVALID_PARAM:
        return "NV_ENC_ERR_INVALID_PARAM";
    case NV_ENC_ERR_INVALID_CALL:
        return "NV_ENC_ERR_INVALID_CALL";
    case NV_ENC_ERR_OUT_OF_MEMORY:
        return "NV_ENC_ERR_OUT_OF_MEMORY";
    case NV_ENC_ERR_ENCODER_NOT_INITIALIZED:
        return "NV_ENC_ERR_ENCODER_NOT_INITIALIZED";
    case NV_ENC_ERR_UNSUPPORTED_PARAM:
        return "NV_ENC_ERR_UNSUPPORTED_PARAM";
    case NV_ENC_ERR_LOCK_BUSY:
        return "NV_ENC_ERR_LOCK_BUSY";
    case NV_ENC_ERR_NOT_ENOUGH_BUFFER:
        return "NV_ENC_ERR_NOT_ENOUGH_BUFFER";
    case NV_ENC_ERR_INVALID_VERSION:
        return "NV_ENC_ERR_INVALID_VERSION";
    case NV_ENC_ERR_MAP_FAILED:
        return "NV_ENC_ERR_MAP_FAILED";
    case NV_ENC_ERR_NEED_MORE_INPUT:
        return "NV_ENC_ERR_NEED_MORE_INPUT";
    case NV_ENC_ERR_ENCODER_BUSY:
        return "NV_ENC_ERR_ENCODER_BUSY";
    case NV_ENC_ERR_EVENT_NOT_REGISTERD:
        return "NV_ENC_ERR_EVENT_NOT_REGISTERD";
    case NV_ENC_ERR_GENERIC:
        return "NV_ENC_ERR_GENERIC";
    case NV_ENC_ERR_INCOMPATIBLE_CLIENT_KEY:
        return "NV_ENC_ERR_INCOMPATIBLE_CLIENT_KEY";
    case NV_ENC_ERR_UNIMPLEMENTED:
        return "NV_ENC_ERR_UNIMPLEMENTED";
    case NV_ENC_ERR_RESOURCE_REGISTER_FAILED:
        return "NV_ENC_ERR_RESOURCE_REGISTER_FAILED";
    case NV_ENC_ERR_RESOURCE_NOT_REGISTERED:
        return "NV_ENC_ERR_RESOURCE_NOT_REGISTERED";
    case NV_ENC_ERR_RESOURCE_NOT_MAPPED:
        return "NV_ENC_ERR_RESOURCE_NOT_MAPPED";
    default:
        return "NV_ENC_ERR_UNKNOWN";
    }
}

void check_nvenc(NVENCSTATUS status, const std::string& msg, const std::string& preset, int device_id) {
    if (status == NV_ENC_SUCCESS) {
        return;
    }
    const std::string what = msg + " failed: " + nvenc_status_name(status) + " (" + std::to_string(status) + ")";
    if (auto log = spdlog::get("hwenc")) {
        log->error("[nvenc] {}", what);
    }
    switch (status) {
    case NV_ENC_ERR_INCOMPATIBLE_CLIENT_KEY:
        throw authorization_error{what};
    case NV_ENC_ERR_INVALID_PARAM:
    case NV_ENC_ERR_UNSUPPORTED_PARAM:
    case NV_ENC_ERR_INVALID_VERSION:
        throw invalid_configuration{what, preset};
    case NV_ENC_ERR_OUT_OF_MEMORY:
        throw resource_exhaustion{what};
    case NV_ENC_ERR_ENCODER_BUSY:
    case NV_ENC_ERR_LOCK_BUSY:
    case NV_ENC_ERR_MAP_FAILED:
    case NV_ENC_ERR_DEVICE_NOT_EXIST:
        throw transient_device_error{what, device_id};
    case NV_ENC_ERR_INVALID_CALL:
    case NV_ENC_ERR_ENCODER_NOT_INITIALIZED:
        throw protocol_violation{what};
    default:
        throw hwenc_error{what};
    }
}

GUID parse_client_key(const std::string& key) {
    std::string digits;
    for (char c : key) {
        if (c == '-' || c == '{' || c == '}')
            continue;
        if (hex_digit(c) < 0) {
            throw authorization_error{"malformed client key"};
        }
        digits += c;
    }
    if (digits.size() != 32) {
        throw authorization_error{"malformed client key: expected 32 hex digits, got " + std::to_string(digits.size())};
    }

    auto read = [&digits](std::size_t offset, std::size_t count) {
        uint64_t value = 0;
        for (std::size_t i = 0; i < count; ++i) {
            value = (value << 4) | static_cast<uint64_t>(hex_digit(digits[offset + i]));
        }
        return value;
    };

    GUID guid{};
    guid.Data1 = static_cast<uint32_t>(read(0, 8));
    guid.Data2 = static_cast<uint16_t>(read(8, 4));
    guid.Data3 = static_cast<uint16_t>(read(12, 4));
    for (std::size_t i = 0; i < 8; ++i) {
        guid.Data4[i] = static_cast<uint8_t>(read(16 + 2 * i, 2));
    }
    return guid;
}

nvenc_session::nvenc_session(std::shared_ptr<const nvenc_library> library, void* encoder, int device_id)
    : library_{std::move(library)}
    , encoder_{encoder}
    , device_id_{device_id} { }

nvenc_session::~nvenc_session() {
    const NVENCSTATUS status = api().nvEncDestroyEncoder(encoder_);
    if (status != NV_ENC_SUCCESS) {
        if (auto log = spdlog::get("hwenc")) {
            log->error("[nvenc] nvEncDestroyEncoder failed on device {}: {}", device_id_, nvenc_status_name(status));
        }
    }
}

std::vector<codec> nvenc_session::codecs() {
    uint32_t count = 0;
    check_nvenc(api().nvEncGetEncodeGUIDCount(encoder_, &count), "nvEncGetEncodeGUIDCount", "", device_id_);
    std::vector<GUID> guids(count);
    check_nvenc(api().nvEncGetEncodeGUIDs(encoder_, guids.data(), count, &count), "nvEncGetEncodeGUIDs", "", device_id_);
    guids.resize(count);

    std::vector<codec> codecs;
    for (const auto& guid : guids) {
        for (const auto& entry : codec_guids()) {
            if (same_guid(guid, entry.guid)) {
                codecs.push_back(entry.value);
            }
        }
    }
    return codecs;
}

std::vector<std::string> nvenc_session::presets(codec c) {
    const GUID codec_id = codec_guid(c);
    uint32_t   count    = 0;
    check_nvenc(api().nvEncGetEncodePresetCount(encoder_, codec_id, &count), "nvEncGetEncodePresetCount", "", device_id_);
    std::vector<GUID> guids(count);
    check_nvenc(api().nvEncGetEncodePresetGUIDs(encoder_, codec_id, guids.data(), count, &count), "nvEncGetEncodePresetGUIDs",
                "", device_id_);
    guids.resize(count);

    std::vector<std::string> names;
    for (const auto& guid : guids) {
        for (const auto& entry : preset_guids()) {
            if (same_guid(guid, entry.guid)) {
                names.push_back(entry.value);
            }
        }
    }
    return names;
}

std::vector<std::string> nvenc_session::profiles(codec c) {
    const GUID codec_id = codec_guid(c);
    uint32_t   count    = 0;
    check_nvenc(api().nvEncGetEncodeProfileGUIDCount(encoder_, codec_id, &count), "nvEncGetEncodeProfileGUIDCount", "",
                device_id_);
    std::vector<GUID> guids(count);
    check_nvenc(api().nvEncGetEncodeProfileGUIDs(encoder_, codec_id, guids.data(), count, &count),
                "nvEncGetEncodeProfileGUIDs", "", device_id_);
    guids.resize(count);

    std::vector<std::string> names;
    for (const auto& guid : guids) {
        for (const auto& entry : profile_guids(c)) {
            if (same_guid(guid, entry.guid)) {
                names.push_back(entry.value);
            }
        }
    }
    return names;
}

std::vector<buffer_format> nvenc_session::input_formats(codec c) {
    const GUID codec_id = codec_guid(c);
    uint32_t   count    = 0;
    check_nvenc(api().nvEncGetInputFormatCount(encoder_, codec_id, &count), "nvEncGetInputFormatCount", "", device_id_);
    std::vector<NV_ENC_BUFFER_FORMAT> formats(count);
    check_nvenc(api().nvEncGetInputFormats(encoder_, codec_id, formats.data(), count, &count), "nvEncGetInputFormats", "",
                device_id_);
    formats.resize(count);

    std::vector<buffer_format> result;
    for (auto format : formats) {
        if (auto known = from_nvenc(format)) {
            result.push_back(*known);
        }
    }
    return result;
}

int nvenc_session::query_cap(codec c, encoder_cap cap) {
    NV_ENC_CAPS_PARAM param{};
    param.version     = NV_ENC_CAPS_PARAM_VER;
    param.capsToQuery = to_nvenc(cap);
    int value         = 0;
    check_nvenc(api().nvEncGetEncodeCaps(encoder_, codec_guid(c), &param, &value), "nvEncGetEncodeCaps", "", device_id_);

    if (cap != encoder_cap::rc_modes) {
        return value;
    }
    // constant QP has the value 0 and is always available
    int modes = 1 << static_cast<int>(rc_mode::const_qp);
    if (value & NV_ENC_PARAMS_RC_VBR)
        modes |= 1 << static_cast<int>(rc_mode::vbr);
    if (value & NV_ENC_PARAMS_RC_CBR)
        modes |= 1 << static_cast<int>(rc_mode::cbr);
    return modes;
}

void nvenc_session::apply_rate_control(const rate_control_params& rc) {
    auto& params = config_.rcParams;
    switch (rc.mode) {
    case rc_mode::const_qp:
        params.rateControlMode = NV_ENC_PARAMS_RC_CONSTQP;
        params.constQP         = {static_cast<uint32_t>(rc.initial_qp), static_cast<uint32_t>(rc.initial_qp),
                                  static_cast<uint32_t>(rc.initial_qp)};
        params.enableMinQP     = 0;
        params.enableMaxQP     = 0;
        params.enableInitialRCQP = 0;
        return;
    case rc_mode::vbr:
        params.rateControlMode = NV_ENC_PARAMS_RC_VBR;
        break;
    case rc_mode::cbr:
        params.rateControlMode = NV_ENC_PARAMS_RC_CBR;
        break;
    }
    params.averageBitRate    = rc.average_bitrate;
    params.maxBitRate        = rc.max_bitrate;
    params.enableMinQP       = 1;
    params.minQP             = {static_cast<uint32_t>(rc.min_qp), static_cast<uint32_t>(rc.min_qp), static_cast<uint32_t>(rc.min_qp)};
    params.enableMaxQP       = 1;
    params.maxQP             = {static_cast<uint32_t>(rc.max_qp), static_cast<uint32_t>(rc.max_qp), static_cast<uint32_t>(rc.max_qp)};
    params.enableInitialRCQP = 1;
    params.initialRCQP       = {static_cast<uint32_t>(rc.initial_qp), static_cast<uint32_t>(rc.initial_qp),
                                static_cast<uint32_t>(rc.initial_qp)};
}

void nvenc_session::initialize(const encoder_init_params& params) {
    params_                 = params;
    const GUID codec_id     = codec_guid(params.codec_id);
    const GUID preset_id    = named(preset_guids(), params.preset, "preset");
    const auto tuning_info  = to_nvenc(params.tune);
    const bool full_chroma  = params.format == buffer_format::yuv444;

    NV_ENC_PRESET_CONFIG preset_config{};
    preset_config.version           = NV_ENC_PRESET_CONFIG_VER;
    preset_config.presetCfg.version = NV_ENC_CONFIG_VER;
    check_nvenc(api().nvEncGetEncodePresetConfigEx(encoder_, codec_id, preset_id, tuning_info, &preset_config),
                "nvEncGetEncodePresetConfigEx", params.preset, device_id_);

    config_                = preset_config.presetCfg;
    config_.version        = NV_ENC_CONFIG_VER;
    config_.profileGUID    = named(profile_guids(params.codec_id), params.profile, "profile");
    config_.gopLength      = NVENC_INFINITE_GOPLENGTH;
    config_.frameIntervalP = 1;
    apply_rate_control(params.rc);

    switch (params.codec_id) {
    case codec::h264: {
        auto& h264            = config_.encodeCodecConfig.h264Config;
        h264.idrPeriod        = NVENC_INFINITE_GOPLENGTH;
        h264.repeatSPSPPS     = 1;
        h264.chromaFormatIDC  = full_chroma ? 3 : 1;
        if (params.lossless) {
            h264.qpPrimeYZeroTransformBypassFlag = 1;
        }
        h264.h264VUIParameters.videoSignalTypePresentFlag = 1;
        h264.h264VUIParameters.videoFullRangeFlag         = params.full_range ? 1 : 0;
        break;
    }
    case codec::hevc: {
        auto& hevc            = config_.encodeCodecConfig.hevcConfig;
        hevc.idrPeriod        = NVENC_INFINITE_GOPLENGTH;
        hevc.repeatSPSPPS     = 1;
        hevc.chromaFormatIDC  = full_chroma ? 3 : 1;
        hevc.hevcVUIParameters.videoSignalTypePresentFlag = 1;
        hevc.hevcVUIParameters.videoFullRangeFlag         = params.full_range ? 1 : 0;
        break;
    }
    case codec::av1: {
        auto& av1          = config_.encodeCodecConfig.av1Config;
        av1.idrPeriod      = NVENC_INFINITE_GOPLENGTH;
        av1.repeatSeqHdr   = 1;
        av1.chromaFormatIDC = full_chroma ? 3 : 1;
        av1.colorRange     = params.full_range ? 1 : 0;
        break;
    }
    }

    init_params_                   = NV_ENC_INITIALIZE_PARAMS{};
    init_params_.version           = NV_ENC_INITIALIZE_PARAMS_VER;
    init_params_.encodeGUID        = codec_id;
    init_params_.presetGUID        = preset_id;
    init_params_.tuningInfo        = tuning_info;
    init_params_.encodeWidth       = params.width;
    init_params_.encodeHeight      = params.height;
    init_params_.darWidth          = params.width;
    init_params_.darHeight         = params.height;
    init_params_.maxEncodeWidth    = params.width;
    init_params_.maxEncodeHeight   = params.height;
    init_params_.frameRateNum      = params.frame_rate;
    init_params_.frameRateDen      = 1;
    init_params_.enablePTD         = 1;
    init_params_.enableEncodeAsync = 0;
    init_params_.encodeConfig      = &config_;

    check_nvenc(api().nvEncInitializeEncoder(encoder_, &init_params_), "nvEncInitializeEncoder", params.preset, device_id_);
    initialized_ = true;
}

void nvenc_session::reconfigure(const rate_control_params& rc, bool force_idr) {
    if (!initialized_) {
        throw protocol_violation{"nvenc session reconfigured before initialization"};
    }
    params_.rc = rc;
    apply_rate_control(rc);

    NV_ENC_RECONFIGURE_PARAMS reconfigure{};
    reconfigure.version             = NV_ENC_RECONFIGURE_PARAMS_VER;
    reconfigure.reInitEncodeParams  = init_params_;
    reconfigure.reInitEncodeParams.encodeConfig = &config_;
    reconfigure.resetEncoder        = force_idr ? 1 : 0;
    reconfigure.forceIDR            = force_idr ? 1 : 0;
    check_nvenc(api().nvEncReconfigureEncoder(encoder_, &reconfigure), "nvEncReconfigureEncoder", params_.preset, device_id_);
}

resource_handle nvenc_session::register_resource(const resource_desc& desc) {
    NV_ENC_REGISTER_RESOURCE resource{};
    resource.version            = NV_ENC_REGISTER_RESOURCE_VER;
    resource.resourceType       = NV_ENC_INPUT_RESOURCE_TYPE_CUDADEVICEPTR;
    resource.width              = desc.width;
    resource.height             = desc.height;
    resource.pitch              = desc.pitch;
    resource.resourceToRegister = reinterpret_cast<void*>(desc.device_ptr);
    resource.bufferFormat       = to_nvenc(desc.format);
    resource.bufferUsage        = NV_ENC_INPUT_IMAGE;
    check_nvenc(api().nvEncRegisterResource(encoder_, &resource), "nvEncRegisterResource", "", device_id_);
    return resource.registeredResource;
}

void nvenc_session::unregister_resource(resource_handle registered) {
    check_nvenc(api().nvEncUnregisterResource(encoder_, registered), "nvEncUnregisterResource", "", device_id_);
}

resource_handle nvenc_session::map_resource(resource_handle registered) {
    NV_ENC_MAP_INPUT_RESOURCE mapping{};
    mapping.version            = NV_ENC_MAP_INPUT_RESOURCE_VER;
    mapping.registeredResource = registered;
    check_nvenc(api().nvEncMapInputResource(encoder_, &mapping), "nvEncMapInputResource", "", device_id_);
    return mapping.mappedResource;
}

void nvenc_session::unmap_resource(resource_handle mapped) {
    check_nvenc(api().nvEncUnmapInputResource(encoder_, mapped), "nvEncUnmapInputResource", "", device_id_);
}

resource_handle nvenc_session::create_bitstream_buffer() {
    NV_ENC_CREATE_BITSTREAM_BUFFER buffer{};
    buffer.version = NV_ENC_CREATE_BITSTREAM_BUFFER_VER;
    check_nvenc(api().nvEncCreateBitstreamBuffer(encoder_, &buffer), "nvEncCreateBitstreamBuffer", "", device_id_);
    return buffer.bitstreamBuffer;
}

void nvenc_session::destroy_bitstream_buffer(resource_handle bitstream) {
    check_nvenc(api().nvEncDestroyBitstreamBuffer(encoder_, bitstream), "nvEncDestroyBitstreamBuffer", "", device_id_);
}

void nvenc_session::encode_picture(const picture_params& picture) {
    NV_ENC_PIC_PARAMS pic{};
    pic.version         = NV_ENC_PIC_PARAMS_VER;
    pic.inputWidth      = picture.width;
    pic.inputHeight     = picture.height;
    pic.inputPitch      = picture.pitch;
    pic.frameIdx        = static_cast<uint32_t>(picture.frame_index);
    pic.inputTimeStamp  = picture.timestamp;
    pic.pictureStruct   = NV_ENC_PIC_STRUCT_FRAME;
    pic.inputBuffer     = picture.input;
    pic.outputBitstream = picture.output;
    pic.bufferFmt       = to_nvenc(picture.format);
    if (picture.force_idr) {
        pic.encodePicFlags = NV_ENC_PIC_FLAG_FORCEIDR | NV_ENC_PIC_FLAG_OUTPUT_SPSPPS;
    }
    check_nvenc(api().nvEncEncodePicture(encoder_, &pic), "nvEncEncodePicture", "", device_id_);
}

locked_bitstream nvenc_session::lock_bitstream(resource_handle bitstream) {
    NV_ENC_LOCK_BITSTREAM lock{};
    lock.version         = NV_ENC_LOCK_BITSTREAM_VER;
    lock.outputBitstream = bitstream;
    lock.doNotWait       = 0;
    check_nvenc(api().nvEncLockBitstream(encoder_, &lock), "nvEncLockBitstream", "", device_id_);

    locked_bitstream locked;
    locked.data      = static_cast<const uint8_t*>(lock.bitstreamBufferPtr);
    locked.size      = lock.bitstreamSizeInBytes;
    locked.type      = from_nvenc(lock.pictureType);
    locked.timestamp = lock.outputTimeStamp;
    return locked;
}

void nvenc_session::unlock_bitstream(resource_handle bitstream) {
    check_nvenc(api().nvEncUnlockBitstream(encoder_, bitstream), "nvEncUnlockBitstream", "", device_id_);
}

void nvenc_session::flush() {
    if (!initialized_) {
        return;
    }
    NV_ENC_PIC_PARAMS pic{};
    pic.version        = NV_ENC_PIC_PARAMS_VER;
    pic.encodePicFlags = NV_ENC_PIC_FLAG_EOS;
    check_nvenc(api().nvEncEncodePicture(encoder_, &pic), "nvEncEncodePicture(EOS)", "", device_id_);
}

nvenc_api::nvenc_api()
    : library_{std::make_shared<nvenc_library>(nvenc_library{dynamic_lib::create_any({"libnvidia-encode.so.1", "libnvidia-encode.so"}),
                                                             NV_ENCODE_API_FUNCTION_LIST{}})} {
    uint32_t max_version = 0;
    auto     get_max     = library_->lib.get<PNVENCODEAPIGETMAXSUPPORTEDVERSION>("NvEncodeAPIGetMaxSupportedVersion");
    check_nvenc(get_max(&max_version), "NvEncodeAPIGetMaxSupportedVersion");
    const uint32_t wanted = (NVENCAPI_MAJOR_VERSION << 4) | NVENCAPI_MINOR_VERSION;
    if (max_version < wanted) {
        throw hwenc_error{"the driver supports NVENC API " + std::to_string(max_version >> 4) + "." +
                          std::to_string(max_version & 0xf) + ", built against " + std::to_string(NVENCAPI_MAJOR_VERSION) +
                          "." + std::to_string(NVENCAPI_MINOR_VERSION)};
    }

    auto create_instance = library_->lib.get<PNVENCODEAPICREATEINSTANCE>("NvEncodeAPICreateInstance");
    library_->functions.version = NV_ENCODE_API_FUNCTION_LIST_VER;
    check_nvenc(create_instance(&library_->functions), "NvEncodeAPICreateInstance");
    if (library_->functions.nvEncOpenEncodeSessionEx == nullptr) {
        throw hwenc_error{"nvEncOpenEncodeSessionEx not available"};
    }
    spdlog::get("hwenc")->info("[nvenc] loaded {} (API {}.{})", library_->lib.path(), NVENCAPI_MAJOR_VERSION,
                               NVENCAPI_MINOR_VERSION);
}

std::unique_ptr<encoder_context> nvenc_api::open_session(compute_context& context, const std::string& key) {
    GUID client_key{};
    NV_ENC_OPEN_ENCODE_SESSION_EX_PARAMS session_params{};
    session_params.version    = NV_ENC_OPEN_ENCODE_SESSION_EX_PARAMS_VER;
    session_params.device     = context.native_handle();
    session_params.deviceType = NV_ENC_DEVICE_TYPE_CUDA;
    session_params.apiVersion = NVENCAPI_VERSION;
    if (!key.empty()) {
        client_key              = parse_client_key(key);
        session_params.reserved = &client_key;
    }

    void*             encoder = nullptr;
    const NVENCSTATUS status  = library_->functions.nvEncOpenEncodeSessionEx(&session_params, &encoder);
    if (status != NV_ENC_SUCCESS) {
        if (encoder != nullptr) {
            const NVENCSTATUS destroyed = library_->functions.nvEncDestroyEncoder(encoder);
            if (destroyed != NV_ENC_SUCCESS) {
                spdlog::get("hwenc")->warn("[nvenc] nvEncDestroyEncoder after a failed open: {}", nvenc_status_name(destroyed));
            }
        }
        check_nvenc(status, "nvEncOpenEncodeSessionEx on device " + std::to_string(context.device_id()), "", context.device_id());
    }
    return std::make_unique<nvenc_session>(library_, encoder, context.device_id());
}

} // namespace HWENC
