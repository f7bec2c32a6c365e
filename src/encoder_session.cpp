#include "hwenc/encoder_session.hpp"

#include "hwenc/global_module_defs.hpp"
#include "hwenc/gpu_guards.hpp"
#include "hwenc/logging.hpp"
#include "hwenc/preset_resolver.hpp"
#include "hwenc/rate_control.hpp"

#include <algorithm>
#include <filesystem>
#include <spdlog/spdlog.h>
#include <system_error>

namespace HWENC {

namespace {

std::string select_profile(codec c, const buffer_layout& layout) {
    const bool full_chroma = std::holds_alternative<planar_444>(layout);
    const bool ten_bit     = std::holds_alternative<packed_10bit>(layout);
    switch (c) {
    case codec::h264:
        if (ten_bit) {
            throw invalid_configuration{"h264 cannot encode 10 bit input"};
        }
        return full_chroma ? "high444" : "high";
    case codec::hevc:
        return full_chroma ? "frext" : ten_bit ? "main10" : "main";
    case codec::av1:
        return "main";
    }
    return "";
}

std::string dump_extension(codec c) {
    switch (c) {
    case codec::h264:
        return "h264";
    case codec::hevc:
        return "h265";
    case codec::av1:
        return "obu";
    }
    return "bin";
}

} // namespace

std::string to_string(session_state state) {
    switch (state) {
    case session_state::created:
        return "created";
    case session_state::initializing:
        return "initializing";
    case session_state::ready:
        return "ready";
    case session_state::encoding:
        return "encoding";
    case session_state::closed:
        return "closed";
    }
    return "unknown";
}

encoder_session::encoder_session(std::shared_ptr<device_registry> registry, std::shared_ptr<worker_pool> pool)
    : registry_{std::move(registry)}
    , pool_{std::move(pool)} {
    init_logging();
    if (!registry_ || !pool_) {
        throw hwenc_error{"encoder_session needs a device registry and a worker pool"};
    }
}

encoder_session::encoder_session(std::shared_ptr<device_registry> registry)
    : encoder_session(registry, registry ? registry->pool() : nullptr) { }

encoder_session::~encoder_session() {
    if (clean_future_.valid()) {
        clean_future_.wait();
    }
    clean();
}

template<typename Fn>
void encoder_session::best_effort(const char* step, Fn&& fn) {
    try {
        fn();
    } catch (const std::exception& e) {
        spdlog::get("hwenc")->warn("[encoder_session] {} failed on device {}: {}", step, device_id_, e.what());
    }
}

void encoder_session::init_context(const std::string& codec_name, uint32_t width, uint32_t height,
                                   const std::string& source_format_name, const session_options& options) {
    auto log = spdlog::get("hwenc");
    if (state_.load() != session_state::created) {
        throw protocol_violation{"init_context called on a session that is " + to_string(state_.load())};
    }

    source_ = parse_source_format(source_format_name);
    codec_  = parse_codec(codec_name);
    if (!registry_->codec_enabled(codec_)) {
        throw invalid_configuration{codec_name + " is disabled"};
    }
    if (width == 0 || height == 0) {
        throw invalid_configuration{"invalid dimensions " + std::to_string(width) + "x" + std::to_string(height)};
    }

    width_         = width;
    height_        = height;
    encode_width_  = width;
    encode_height_ = height;
    if (options.scaled_size && (options.scaled_size->first != width || options.scaled_size->second != height)) {
        const auto [scaled_width, scaled_height] = *options.scaled_size;
        if (scaled_width == 0 || scaled_height == 0 || scaled_width > width || scaled_height > height) {
            throw invalid_configuration{"cannot scale " + std::to_string(width) + "x" + std::to_string(height) + " to " +
                                        std::to_string(scaled_width) + "x" + std::to_string(scaled_height)};
        }
        encode_width_  = scaled_width;
        encode_height_ = scaled_height;
        scaled_        = true;
    }
    filter_     = options.filter;
    full_range_ = options.full_range;
    frame_rate_ = options.frame_rate == 0 ? 30 : options.frame_rate;
    speed_      = std::clamp(options.speed, 0, 100);
    int quality = std::clamp(options.quality, 0, 100);

    device_id_ = registry_->select_device(codec_, options.device_id);
    auto caps  = registry_->probe(device_id_, codec_);
    if (!caps) {
        throw hwenc_error{"device " + std::to_string(device_id_) + " lost " + codec_name + " support"};
    }
    caps_ = *caps;
    if ((caps_.max_width > 0 && encode_width_ > caps_.max_width) || (caps_.max_height > 0 && encode_height_ > caps_.max_height)) {
        throw invalid_configuration{std::to_string(encode_width_) + "x" + std::to_string(encode_height_) + " exceeds the " +
                                    codec_name + " limit of " + std::to_string(caps_.max_width) + "x" +
                                    std::to_string(caps_.max_height)};
    }

    const bool lossless_requested = quality >= quality_params::lossless_threshold;
    layout_ = choose_layout(source_, caps_, registry_->config(), lossless_requested, quality, scaled_);
    lossless_supported_ = caps_.lossless && std::holds_alternative<planar_444>(*layout_);
    lossless_           = lossless_requested && lossless_supported_;
    if (lossless_requested && !lossless_supported_) {
        log->debug("[encoder_session] lossless not available for {} on device {}, using quality {}", layout_name(*layout_),
                   device_id_, quality_params::best_lossy);
        quality = quality_params::best_lossy;
    }
    quality_ = quality;

    profile_ = select_profile(codec_, *layout_);
    if (!caps_.profiles.empty() && !caps_.has_profile(profile_)) {
        throw invalid_configuration{codec_name + " profile " + profile_ + " is not available on device " +
                                    std::to_string(device_id_)};
    }

    generation_ = registry_->acquire_context(device_id_);
    slot_held_  = true;
    state_      = session_state::initializing;

    const bool threaded = options.threaded_init.value_or(registry_->config().threaded_init);
    log->debug("[encoder_session] {} {}x{} {} -> {} on device {} (generation {}, {} init)", codec_name, width, height,
               source_format_name, layout_name(*layout_), device_id_, generation_, threaded ? "threaded" : "synchronous");
    if (threaded) {
        init_future_ = pool_->submit([this] {
                                 device_init();
                             })
                           .share();
    } else {
        device_init();
    }
}

void encoder_session::device_init() {
    auto fail = [this] {
        {
            std::lock_guard<std::mutex> lock{init_mutex_};
            init_error_ = std::current_exception();
        }
        teardown();
        state_ = session_state::closed;
    };

    try {
        device_init_locked();
    } catch (transient_device_error& e) {
        registry_->record_failure(device_id_);
        e.set_failure_time(registry_->clock().now());
        spdlog::get("hwenc")->warn("[encoder_session] device {} temporarily unavailable: {}", device_id_, e.what());
        fail();
        throw;
    } catch (const invalid_configuration& e) {
        if (!e.preset().empty()) {
            registry_->add_bad_preset(device_id_, e.preset());
        }
        spdlog::get("hwenc")->error("[encoder_session] invalid configuration on device {}: {}", device_id_, e.what());
        fail();
        throw;
    } catch (...) {
        fail();
        throw;
    }
}

void encoder_session::device_init_locked() {
    const module_config& config = registry_->config();
    // quality and speed changes wait for the encoder
    std::lock_guard<std::mutex> frame_lock{frame_mutex_};
    auto                        device_lock = registry_->lock_device(device_id_);

    compute_ = registry_->compute().create_context(device_id_);
    context_guard guard{*compute_};

    pipeline_ = std::make_unique<color_conversion>(
        *compute_, source_, *layout_, color_conversion::geometry{width_, height_, encode_width_, encode_height_},
        filter_ == scaling_filter::bilinear, config.device_memcopy, full_range_);
    pipeline_->allocate();
    start_encoder();

    if (config.debug_dump) {
        open_dump();
    }

    session_state expected = session_state::initializing;
    state_.compare_exchange_strong(expected, session_state::ready);
}

void encoder_session::start_encoder() {
    auto                 log    = spdlog::get("hwenc");
    const module_config& config = registry_->config();

    encoder_ = registry_->open_session(*compute_);

    preset_resolver resolver{config.preset, config.tuning};
    try {
        preset_ = resolver.get_preset(caps_, registry_->bad_presets(device_id_), speed_, quality_, lossless_,
                                      hardware_format(*layout_));
    } catch (const no_preset_available& e) {
        registry_->mark_no_preset(codec_);
        log->warn("[encoder_session] {}", e.what());
        throw;
    }
    registry_->clear_no_preset(codec_);
    tuning_ = resolver.get_tuning(speed_, lossless_);

    init_params_.codec_id   = codec_;
    init_params_.preset     = preset_;
    init_params_.tune       = tuning_;
    init_params_.profile    = profile_;
    init_params_.format     = hardware_format(*layout_);
    init_params_.width      = encode_width_;
    init_params_.height     = encode_height_;
    init_params_.frame_rate = frame_rate_;
    init_params_.lossless   = lossless_;
    init_params_.full_range = full_range_;
    init_params_.rc = compute_rate_control(codec_, speed_, quality_, lossless_, encode_width_, encode_height_,
                                           is_subsampled(*layout_));
    encoder_->initialize(init_params_);
    encoder_initialized_ = true;
    {
        std::lock_guard<std::mutex> lock{rc_mutex_};
        rc_ = init_params_.rc;
    }

    registered_ = encoder_->register_resource(pipeline_->output_desc());
    bitstream_  = encoder_->create_bitstream_buffer();
    writer_     = std::make_unique<bitstream_writer>(*encoder_, registered_, bitstream_);

    log->info("[encoder_session] {} {}x{} ready on device {}: preset {}, tuning {}, {}, profile {}{}", to_string(codec_),
              encode_width_, encode_height_, device_id_, preset_, to_string(tuning_), layout_name(*layout_), profile_,
              lossless_ ? ", lossless" : "");
}

void encoder_session::release_encoder() {
    writer_.reset();
    if (encoder_) {
        if (encoder_initialized_) {
            best_effort("flush", [this] {
                encoder_->flush();
            });
        }
        if (bitstream_ != nullptr) {
            best_effort("destroying the bitstream buffer", [this] {
                encoder_->destroy_bitstream_buffer(bitstream_);
            });
        }
        if (registered_ != nullptr) {
            best_effort("unregistering the input resource", [this] {
                encoder_->unregister_resource(registered_);
            });
        }
    }
    bitstream_           = nullptr;
    registered_          = nullptr;
    encoder_initialized_ = false;
    encoder_.reset();
}

void encoder_session::restart_encoder() {
    spdlog::get("hwenc")->info("[encoder_session] {} on device {}, re-creating the encoder",
                               lossless_ ? "switching to lossless" : "leaving lossless", device_id_);
    try {
        auto device_lock = registry_->lock_device(device_id_);
        release_encoder();
        start_encoder();
    } catch (const invalid_configuration& e) {
        if (!e.preset().empty()) {
            registry_->add_bad_preset(device_id_, e.preset());
        }
        state_ = session_state::closed;
        throw;
    } catch (...) {
        state_ = session_state::closed;
        throw;
    }
}

void encoder_session::open_dump() {
    static std::atomic<uint64_t> dump_counter{0};
    auto                         log = spdlog::get("hwenc");
    const std::string&           dir = registry_->config().dump_dir;

    std::error_code error;
    std::filesystem::create_directories(dir, error);
    if (error) {
        log->warn("[encoder_session] cannot create dump directory {}: {}", dir, error.message());
        return;
    }
    dump_path_ = dir + "/hwenc-" + to_string(codec_) + "-" + std::to_string(device_id_) + "-" +
        std::to_string(++dump_counter) + "." + dump_extension(codec_);
    dump_.open(dump_path_, std::ios::binary | std::ios::trunc);
    if (!dump_.is_open()) {
        log->warn("[encoder_session] cannot open dump file {}", dump_path_);
        return;
    }
    log->info("[encoder_session] writing raw stream to {}", dump_path_);
}

bool encoder_session::is_ready() {
    {
        std::lock_guard<std::mutex> lock{init_mutex_};
        if (init_error_) {
            std::rethrow_exception(init_error_);
        }
    }
    const session_state state = state_.load();
    return state == session_state::ready || state == session_state::encoding;
}

bool encoder_session::wait_ready() {
    if (init_future_.valid()) {
        init_future_.wait();
    }
    return is_ready();
}

void encoder_session::update_rate_control(bool force_idr) {
    auto rc = compute_rate_control(codec_, speed_, quality_, lossless_, encode_width_, encode_height_, is_subsampled(*layout_));
    encoder_->reconfigure(rc, force_idr);
    std::lock_guard<std::mutex> lock{rc_mutex_};
    rc_ = rc;
}

encoder_session::quality_change encoder_session::change_quality(int requested) {
    const int current  = quality_.load();
    int       next     = apply_edge_resistance(current, requested);
    bool      lossless = false;
    if (next >= quality_params::lossless_threshold) {
        if (lossless_supported_) {
            lossless = true;
            next     = quality_params::lossless_threshold;
        } else {
            next = quality_params::best_lossy;
        }
    }
    const bool toggled = lossless != lossless_.load();
    if (next == current && !toggled) {
        return quality_change::none;
    }
    quality_  = next;
    lossless_ = lossless;
    if (!toggled) {
        return quality_change::rate_control;
    }
    pending_idr_ = true;
    return quality_change::lossless_toggle;
}

void encoder_session::set_quality(int quality) {
    std::lock_guard<std::mutex> lock{frame_mutex_};
    const quality_change        change = change_quality(quality);
    if (change == quality_change::none || state_.load() != session_state::ready || !encoder_initialized_) {
        return;
    }
    context_guard guard{*compute_};
    if (change == quality_change::lossless_toggle) {
        // the next frame is the new encoder's key frame
        restart_encoder();
        return;
    }
    update_rate_control(false);
}

void encoder_session::set_speed(int speed) {
    const int                   next = std::clamp(speed, 0, 100);
    std::lock_guard<std::mutex> lock{frame_mutex_};
    if (speed_.exchange(next) == next) {
        return;
    }
    if (state_.load() != session_state::ready || !encoder_initialized_) {
        return;
    }
    context_guard guard{*compute_};
    update_rate_control(false);
}

compressed_frame encoder_session::compress(const image& frame, const compress_options& options) {
    session_state expected = session_state::ready;
    if (!state_.compare_exchange_strong(expected, session_state::encoding)) {
        if (expected == session_state::encoding) {
            throw protocol_violation{"compress is not re-entrant"};
        }
        throw protocol_violation{"compress called on a session that is " + to_string(expected)};
    }
    auto restore = [this] {
        session_state busy = session_state::encoding;
        state_.compare_exchange_strong(busy, session_state::ready);
    };

    std::unique_lock<std::mutex> frame_lock{frame_mutex_};
    if (state_.load() != session_state::encoding) {
        throw protocol_violation{"session closed while a frame was submitted"};
    }

    compressed_frame out;
    try {
        context_guard guard{*compute_};

        bool rc_changed = false;
        if (options.speed) {
            const int next = std::clamp(*options.speed, 0, 100);
            rc_changed     = speed_.exchange(next) != next;
        }
        const quality_change change = options.quality ? change_quality(*options.quality) : quality_change::none;
        if (change == quality_change::lossless_toggle) {
            restart_encoder();
        } else if (rc_changed || change == quality_change::rate_control) {
            update_rate_control(false);
        }

        const auto kernel = pipeline_->process(frame);

        const bool first = frames_ == 0;
        if (first) {
            base_timestamp_ = frame.timestamp;
        }
        picture_params picture;
        picture.format      = hardware_format(*layout_);
        picture.width       = encode_width_;
        picture.height      = encode_height_;
        picture.pitch       = static_cast<uint32_t>(pipeline_->output()->pitch());
        picture.frame_index = frames_;
        picture.timestamp   = static_cast<uint64_t>(std::max<int64_t>(0, frame.timestamp - base_timestamp_));
        picture.force_idr   = first || options.force_keyframe || pending_idr_;

        encoded_picture encoded = writer_->submit_and_lock(picture);
        pending_idr_            = false;
        const uint64_t index    = frames_++;

        out.data                   = std::move(encoded.data);
        out.metadata["csc"]        = layout_name(*layout_);
        out.metadata["frame"]      = static_cast<int64_t>(index);
        out.metadata["pts"]        = static_cast<int64_t>(picture.timestamp);
        out.metadata["full-range"] = full_range_;
        out.metadata["quality"]    = static_cast<int64_t>(lossless_ ? quality_params::lossless_threshold
                                                                    : std::min(quality_.load(), quality_params::best_lossy));
        if (kernel) {
            out.metadata["kernel"] = *kernel;
        }
        if (encoded.type == picture_type::idr) {
            out.metadata["type"] = std::string{"IDR"};
        }
        if (scaled_) {
            out.metadata["scaled_size"]     = std::make_pair(encode_width_, encode_height_);
            out.metadata["scaling-quality"] = std::string{filter_ == scaling_filter::bilinear ? "bilinear" : "nearest"};
        }

        if (dump_.is_open()) {
            dump_.write(reinterpret_cast<const char*>(out.data.data()), static_cast<std::streamsize>(out.data.size()));
            if (!dump_) {
                spdlog::get("hwenc")->warn("[encoder_session] write to {} failed, dump disabled", dump_path_);
                dump_.close();
            }
        }
    } catch (transient_device_error& e) {
        registry_->record_failure(device_id_);
        e.set_failure_time(registry_->clock().now());
        restore();
        throw;
    } catch (...) {
        restore();
        throw;
    }
    restore();
    return out;
}

void encoder_session::teardown() {
    auto log = spdlog::get("hwenc");
    if (compute_) {
        auto device_lock = registry_->lock_device(device_id_);
        try {
            context_guard guard{*compute_};
            release_encoder();
            if (pipeline_) {
                pipeline_->release();
            }
            pipeline_.reset();
        } catch (const std::exception& e) {
            log->warn("[encoder_session] could not make the context of device {} current for teardown: {}", device_id_,
                      e.what());
        }
        writer_.reset();
        pipeline_.reset();
        encoder_.reset();
        bitstream_           = nullptr;
        registered_          = nullptr;
        encoder_initialized_ = false;
        compute_.reset();
    }
    if (slot_held_) {
        registry_->release_context(device_id_);
        slot_held_ = false;
    }
    if (dump_.is_open()) {
        dump_.close();
    }
}

void encoder_session::clean() {
    std::lock_guard<std::mutex> lock{clean_mutex_};
    if (cleaned_) {
        return;
    }
    if (init_future_.valid()) {
        init_future_.wait();
    }
    {
        std::lock_guard<std::mutex> frame_lock{frame_mutex_};
        state_   = session_state::closed;
        cleaned_ = true;
        teardown();
    }
    spdlog::get("hwenc")->debug("[encoder_session] closed after {} frame(s)", frames_);
}

std::shared_future<void> encoder_session::clean_async() {
    clean_future_ = pool_->submit([this] {
                              clean();
                          })
                        .share();
    return clean_future_;
}

rate_control_params encoder_session::rate_control() const {
    std::lock_guard<std::mutex> lock{rc_mutex_};
    return rc_;
}

std::map<std::string, std::string> encoder_session::get_info() const {
    std::map<std::string, std::string> info;
    info["state"]      = to_string(state_.load());
    info["codec"]      = to_string(codec_);
    info["device"]     = std::to_string(device_id_);
    info["generation"] = std::to_string(generation_);
    info["width"]      = std::to_string(width_);
    info["height"]     = std::to_string(height_);
    info["quality"]    = std::to_string(quality_.load());
    info["speed"]      = std::to_string(speed_.load());
    info["lossless"]   = lossless_.load() ? "true" : "false";
    info["frames"]     = std::to_string(frames_);
    if (layout_) {
        info["csc"]         = layout_name(*layout_);
        info["buffer-format"] = to_string(hardware_format(*layout_));
    }
    if (scaled_) {
        info["scaled-size"] = std::to_string(encode_width_) + "x" + std::to_string(encode_height_);
    }
    if (!preset_.empty()) {
        info["preset"]  = preset_;
        info["tuning"]  = to_string(tuning_);
        info["profile"] = profile_;
    }
    if (pipeline_) {
        info["padded-size"] = std::to_string(pipeline_->padded_width()) + "x" + std::to_string(pipeline_->padded_height());
    }
    const auto rc = rate_control();
    info["bitrate"]     = std::to_string(rc.average_bitrate);
    info["max-bitrate"] = std::to_string(rc.max_bitrate);
    info["min-qp"]      = std::to_string(rc.min_qp);
    info["max-qp"]      = std::to_string(rc.max_qp);
    if (!dump_path_.empty()) {
        info["dump"] = dump_path_;
    }
    return info;
}

} // namespace HWENC
