#pragma once

#include "hwenc/config.hpp"
#include "hwenc/global_module_defs.hpp"
#include "hwenc/hardware.hpp"
#include "hwenc/relative_clock.hpp"

#include <cstring>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace HWENC::test {

/// Everything the fakes record, shared by every context and session they hand out
struct fake_state {
    std::mutex mutex;

    // compute side
    int                            contexts_created = 0;
    int                            contexts_live    = 0;
    int                            push_depth       = 0;
    int                            host_uploads     = 0;
    int                            device_copies    = 0;
    int                            live_buffers     = 0;
    bool                           fail_alloc       = false;
    std::vector<conversion_launch> launches;

    // encoder side
    std::vector<std::string>         keys_tried;
    int                              sessions_live = 0;
    int                              registered    = 0;
    int                              mapped        = 0;
    int                              bitstreams    = 0;
    int                              flushes       = 0;
    std::vector<encoder_init_params> initialized;
    std::vector<std::pair<rate_control_params, bool>> reconfigured;
    std::vector<picture_params>      pictures;
    std::vector<resource_desc>       resources;
    bool                             transient_encode_failure = false;
};

class fake_host_buffer : public host_buffer {
public:
    fake_host_buffer(std::shared_ptr<fake_state> state, std::size_t bytes)
        : state_{std::move(state)}
        , data_(bytes) {
        std::lock_guard<std::mutex> lock{state_->mutex};
        ++state_->live_buffers;
    }

    ~fake_host_buffer() override {
        std::lock_guard<std::mutex> lock{state_->mutex};
        --state_->live_buffers;
    }

    uint8_t* data() override {
        return data_.data();
    }

    [[nodiscard]] std::size_t size() const override {
        return data_.size();
    }

private:
    std::shared_ptr<fake_state> state_;
    std::vector<uint8_t>        data_;
};

/// "Device" memory backed by host memory, with the pitch rounded to 64 bytes like a real allocator would
class fake_device_buffer : public device_buffer {
public:
    fake_device_buffer(std::shared_ptr<fake_state> state, std::size_t row_bytes, std::size_t rows)
        : state_{std::move(state)}
        , row_bytes_{row_bytes}
        , rows_{rows}
        , pitch_{(row_bytes + 63) / 64 * 64}
        , data_(pitch_ * rows) {
        std::lock_guard<std::mutex> lock{state_->mutex};
        ++state_->live_buffers;
    }

    ~fake_device_buffer() override {
        std::lock_guard<std::mutex> lock{state_->mutex};
        --state_->live_buffers;
    }

    [[nodiscard]] uint64_t ptr() const override {
        return reinterpret_cast<uint64_t>(data_.data());
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
    std::shared_ptr<fake_state> state_;
    std::size_t                 row_bytes_;
    std::size_t                 rows_;
    std::size_t                 pitch_;
    std::vector<uint8_t>        data_;
};

class fake_compute_context : public compute_context {
public:
    fake_compute_context(std::shared_ptr<fake_state> state, int device_id)
        : state_{std::move(state)}
        , device_id_{device_id} {
        std::lock_guard<std::mutex> lock{state_->mutex};
        ++state_->contexts_created;
        ++state_->contexts_live;
    }

    ~fake_compute_context() override {
        std::lock_guard<std::mutex> lock{state_->mutex};
        --state_->contexts_live;
    }

    [[nodiscard]] int device_id() const override {
        return device_id_;
    }

    void push() override {
        std::lock_guard<std::mutex> lock{state_->mutex};
        ++state_->push_depth;
    }

    void pop() override {
        std::lock_guard<std::mutex> lock{state_->mutex};
        --state_->push_depth;
    }

    void* native_handle() override {
        return this;
    }

    std::unique_ptr<host_buffer> alloc_host(std::size_t bytes) override {
        check_alloc();
        return std::make_unique<fake_host_buffer>(state_, bytes);
    }

    std::unique_ptr<device_buffer> alloc_pitched(std::size_t row_bytes, std::size_t rows) override {
        check_alloc();
        return std::make_unique<fake_device_buffer>(state_, row_bytes, rows);
    }

    void copy_to_device(const device_buffer& dst, const uint8_t* src, std::size_t src_pitch, std::size_t row_bytes,
                        std::size_t rows) override {
        copy_rows(dst, src, src_pitch, row_bytes, rows);
        std::lock_guard<std::mutex> lock{state_->mutex};
        ++state_->host_uploads;
    }

    void copy_device_to_device(const device_buffer& dst, uint64_t src, std::size_t src_pitch, std::size_t row_bytes,
                               std::size_t rows) override {
        copy_rows(dst, reinterpret_cast<const uint8_t*>(src), src_pitch, row_bytes, rows);
        std::lock_guard<std::mutex> lock{state_->mutex};
        ++state_->device_copies;
    }

    void launch_conversion(const conversion_launch& launch) override {
        std::lock_guard<std::mutex> lock{state_->mutex};
        state_->launches.push_back(launch);
    }

private:
    void check_alloc() {
        std::lock_guard<std::mutex> lock{state_->mutex};
        if (state_->fail_alloc) {
            throw resource_exhaustion{"fake allocation failure"};
        }
    }

    static void copy_rows(const device_buffer& dst, const uint8_t* src, std::size_t src_pitch, std::size_t row_bytes,
                          std::size_t rows) {
        auto* out = reinterpret_cast<uint8_t*>(dst.ptr());
        for (std::size_t y = 0; y < rows; ++y) {
            std::memcpy(out + y * dst.pitch(), src + y * src_pitch, row_bytes);
        }
    }

    std::shared_ptr<fake_state> state_;
    int                         device_id_;
};

class fake_compute_api : public compute_api {
public:
    explicit fake_compute_api(std::shared_ptr<fake_state> state)
        : state_{std::move(state)} { }

    void init() override {
        if (init_fails) {
            throw hwenc_error{"fake driver is broken"};
        }
    }

    int device_count() override {
        return static_cast<int>(devices.size());
    }

    device_info query_device(int id) override {
        if (failing_devices.count(id) != 0) {
            throw hwenc_error{"fake device " + std::to_string(id) + " does not answer"};
        }
        return devices.at(static_cast<std::size_t>(id));
    }

    std::unique_ptr<compute_context> create_context(int id) override {
        return std::make_unique<fake_compute_context>(state_, id);
    }

    static device_info make_device(int id, const std::string& name = "Fake GPU") {
        device_info info;
        info.id                  = id;
        info.name                = name;
        info.pci_bus_id          = "0000:0" + std::to_string(id + 1) + ":00.0";
        info.compute_major       = 7;
        info.compute_minor       = 5;
        info.total_memory        = 8ull << 30;
        info.free_memory         = 6ull << 30;
        info.can_map_host_memory = true;
        return info;
    }

    std::vector<device_info> devices;
    std::set<int>            failing_devices;
    bool                     init_fails = false;

private:
    std::shared_ptr<fake_state> state_;
};

/// What a fake device offers for one codec
struct fake_codec {
    std::vector<std::string>   presets{"P1", "P2", "P3", "P4", "P5", "P6", "P7"};
    std::vector<std::string>   profiles{"high", "high444", "main", "main10", "frext"};
    std::vector<buffer_format> formats{buffer_format::argb, buffer_format::abgr, buffer_format::iyuv, buffer_format::yuv444};
    int                        max_width  = 4096;
    int                        max_height = 4096;
    bool                       yuv444     = true;
    bool                       lossless   = true;
    bool                       ten_bit    = false;
};

class fake_encoder_api;

class fake_encoder_context : public encoder_context {
public:
    fake_encoder_context(fake_encoder_api& api, std::shared_ptr<fake_state> state, int device_id);
    ~fake_encoder_context() override;

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
    const fake_codec& get(codec c) const;

    fake_encoder_api&           api_;
    std::shared_ptr<fake_state> state_;
    int                         device_id_;
    bool                        initialized_ = false;
    picture_params              last_picture_;
    std::vector<uint8_t>        output_;
    int                         handles_[3] = {0, 0, 0};
};

class fake_encoder_api : public encoder_api {
public:
    explicit fake_encoder_api(std::shared_ptr<fake_state> state)
        : state_{std::move(state)} {
        codecs[codec::h264] = fake_codec{};
        codecs[codec::hevc] = fake_codec{};
    }

    std::unique_ptr<encoder_context> open_session(compute_context& context, const std::string& key) override {
        {
            std::lock_guard<std::mutex> lock{state_->mutex};
            state_->keys_tried.push_back(key);
        }
        if (!valid_keys.empty() && valid_keys.count(key) == 0) {
            throw authorization_error{"fake key rejected"};
        }
        if (transient_devices.count(context.device_id()) != 0) {
            throw transient_device_error{"fake device busy", context.device_id()};
        }
        if (broken_devices.count(context.device_id()) != 0) {
            throw hwenc_error{"fake device broken"};
        }
        return std::make_unique<fake_encoder_context>(*this, state_, context.device_id());
    }

    /// Empty: no key needed
    std::set<std::string>     valid_keys;
    std::map<codec, fake_codec> codecs;
    /// Presets the fake rejects in initialize(), reported with the preset name
    std::set<std::string> rejected_presets;
    std::set<int>         transient_devices;
    std::set<int>         broken_devices;

private:
    std::shared_ptr<fake_state> state_;
};

inline fake_encoder_context::fake_encoder_context(fake_encoder_api& api, std::shared_ptr<fake_state> state, int device_id)
    : api_{api}
    , state_{std::move(state)}
    , device_id_{device_id} {
    std::lock_guard<std::mutex> lock{state_->mutex};
    ++state_->sessions_live;
}

inline fake_encoder_context::~fake_encoder_context() {
    std::lock_guard<std::mutex> lock{state_->mutex};
    --state_->sessions_live;
}

inline const fake_codec& fake_encoder_context::get(codec c) const {
    auto it = api_.codecs.find(c);
    if (it == api_.codecs.end()) {
        throw invalid_configuration{"codec not offered"};
    }
    return it->second;
}

inline std::vector<codec> fake_encoder_context::codecs() {
    std::vector<codec> result;
    for (const auto& entry : api_.codecs) {
        result.push_back(entry.first);
    }
    return result;
}

inline std::vector<std::string> fake_encoder_context::presets(codec c) {
    return get(c).presets;
}

inline std::vector<std::string> fake_encoder_context::profiles(codec c) {
    return get(c).profiles;
}

inline std::vector<buffer_format> fake_encoder_context::input_formats(codec c) {
    return get(c).formats;
}

inline int fake_encoder_context::query_cap(codec c, encoder_cap cap) {
    const fake_codec& info = get(c);
    switch (cap) {
    case encoder_cap::width_max:
        return info.max_width;
    case encoder_cap::height_max:
        return info.max_height;
    case encoder_cap::async_encode:
        return 0;
    case encoder_cap::rc_modes:
        return (1 << static_cast<int>(rc_mode::const_qp)) | (1 << static_cast<int>(rc_mode::vbr)) |
            (1 << static_cast<int>(rc_mode::cbr));
    case encoder_cap::yuv444:
        return info.yuv444 ? 1 : 0;
    case encoder_cap::lossless:
        return info.lossless ? 1 : 0;
    case encoder_cap::intra_refresh:
        return 1;
    case encoder_cap::ten_bit:
        return info.ten_bit ? 1 : 0;
    }
    return 0;
}

inline void fake_encoder_context::initialize(const encoder_init_params& params) {
    if (api_.rejected_presets.count(params.preset) != 0) {
        throw invalid_configuration{"fake encoder rejects preset " + params.preset, params.preset};
    }
    initialized_ = true;
    std::lock_guard<std::mutex> lock{state_->mutex};
    state_->initialized.push_back(params);
}

inline void fake_encoder_context::reconfigure(const rate_control_params& rc, bool force_idr) {
    if (!initialized_) {
        throw protocol_violation{"reconfigure before initialize"};
    }
    std::lock_guard<std::mutex> lock{state_->mutex};
    state_->reconfigured.emplace_back(rc, force_idr);
}

inline resource_handle fake_encoder_context::register_resource(const resource_desc& desc) {
    std::lock_guard<std::mutex> lock{state_->mutex};
    ++state_->registered;
    state_->resources.push_back(desc);
    return &handles_[0];
}

inline void fake_encoder_context::unregister_resource(resource_handle) {
    std::lock_guard<std::mutex> lock{state_->mutex};
    --state_->registered;
}

inline resource_handle fake_encoder_context::map_resource(resource_handle) {
    std::lock_guard<std::mutex> lock{state_->mutex};
    ++state_->mapped;
    return &handles_[1];
}

inline void fake_encoder_context::unmap_resource(resource_handle) {
    std::lock_guard<std::mutex> lock{state_->mutex};
    --state_->mapped;
}

inline resource_handle fake_encoder_context::create_bitstream_buffer() {
    std::lock_guard<std::mutex> lock{state_->mutex};
    ++state_->bitstreams;
    return &handles_[2];
}

inline void fake_encoder_context::destroy_bitstream_buffer(resource_handle) {
    std::lock_guard<std::mutex> lock{state_->mutex};
    --state_->bitstreams;
}

inline void fake_encoder_context::encode_picture(const picture_params& picture) {
    if (!initialized_) {
        throw protocol_violation{"encode before initialize"};
    }
    std::lock_guard<std::mutex> lock{state_->mutex};
    if (state_->transient_encode_failure) {
        throw transient_device_error{"fake encoder busy", device_id_};
    }
    state_->pictures.push_back(picture);
    last_picture_ = picture;
}

inline locked_bitstream fake_encoder_context::lock_bitstream(resource_handle) {
    // a fake NAL: start code followed by the frame index
    output_ = {0, 0, 0, 1, static_cast<uint8_t>(last_picture_.frame_index & 0xff)};
    locked_bitstream locked;
    locked.data      = output_.data();
    locked.size      = output_.size();
    locked.type      = last_picture_.force_idr ? picture_type::idr : picture_type::p;
    locked.timestamp = last_picture_.timestamp;
    return locked;
}

inline void fake_encoder_context::unlock_bitstream(resource_handle) { }

inline void fake_encoder_context::flush() {
    std::lock_guard<std::mutex> lock{state_->mutex};
    ++state_->flushes;
}

/// A clock the test steps by hand
class fake_clock : public relative_clock {
public:
    [[nodiscard]] duration now() const override {
        std::lock_guard<std::mutex> lock{mutex_};
        return now_;
    }

    void advance(duration step) {
        std::lock_guard<std::mutex> lock{mutex_};
        now_ += step;
    }

private:
    mutable std::mutex mutex_;
    duration           now_{std::chrono::seconds{1000}};
};

/// One fresh set of fakes plus a module_config with synchronous init
struct fake_hardware {
    fake_hardware()
        : state{std::make_shared<fake_state>()}
        , compute{std::make_shared<fake_compute_api>(state)}
        , encoder{std::make_shared<fake_encoder_api>(state)}
        , clock{std::make_shared<fake_clock>()} {
        compute->devices.push_back(fake_compute_api::make_device(0));
        config.threaded_init = false;
        config.enable_av1    = false;
    }

    std::shared_ptr<fake_state>       state;
    std::shared_ptr<fake_compute_api> compute;
    std::shared_ptr<fake_encoder_api> encoder;
    std::shared_ptr<fake_clock>       clock;
    module_config                     config;
};

} // namespace HWENC::test
