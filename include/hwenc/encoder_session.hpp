#pragma once

#include "bitstream_writer.hpp"
#include "color_conversion.hpp"
#include "compressed_frame.hpp"
#include "device_registry.hpp"
#include "hardware.hpp"
#include "image.hpp"
#include "worker_pool.hpp"

#include <atomic>
#include <cstdint>
#include <exception>
#include <fstream>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

namespace HWENC {

enum class session_state {
    created,
    initializing,
    ready,
    encoding,
    closed,
};

std::string to_string(session_state state);

enum class scaling_filter {
    nearest,
    bilinear,
};

struct session_options {
    int      quality    = 50;
    int      speed      = 50;
    uint32_t frame_rate = 30;
    /// Preferred device, -1 to let the registry choose
    int device_id = -1;
    /// Output size when downscaling; must not exceed the source size
    std::optional<std::pair<uint32_t, uint32_t>> scaled_size;
    scaling_filter                               filter = scaling_filter::bilinear;
    /// Background initialization; the configured default when unset
    std::optional<bool> threaded_init;
    /// Full range output, signalled in the bitstream; every frame must request the same range
    bool full_range = false;
};

struct compress_options {
    std::optional<int> quality;
    std::optional<int> speed;
    bool               force_keyframe = false;
};

/**
 * @brief One compressed stream: a hardware encode context, a compute context and their buffers.
 *
 * Driven by a single producer thread; compress() is not re-entrant. Teardown may run on the worker pool
 * (clean_async()) and is serialized per device by the registry's device lock.
 */
class encoder_session {
public:
    encoder_session(std::shared_ptr<device_registry> registry, std::shared_ptr<worker_pool> pool);

    /// Runs background work on the registry's shared worker pool
    explicit encoder_session(std::shared_ptr<device_registry> registry);

    encoder_session(const encoder_session&)            = delete;
    encoder_session& operator=(const encoder_session&) = delete;

    /**
     * @brief Waits for pending initialization or teardown, then cleans up.
     */
    ~encoder_session();

    /**
     * @brief Validates the request, picks a device and starts device initialization.
     *
     * The source format and codec are validated before any device resource is touched. With threaded init the
     * heavy setup runs on the worker pool and the caller polls is_ready().
     *
     * @throws invalid_configuration for unsupported formats, codecs, sizes or scaling requests.
     * @throws protocol_violation if the session was already initialized.
     */
    void init_context(const std::string& codec_name, uint32_t width, uint32_t height, const std::string& source_format_name,
                      const session_options& options = {});

    /**
     * @brief True once the session accepts frames; rethrows the failure of a background initialization.
     */
    bool is_ready();

    /// Blocks until initialization finished, then behaves like is_ready()
    bool wait_ready();

    /**
     * @brief Encodes one frame.
     *
     * The first frame of a session is always a key frame and defines pts 0. Switching between lossy and lossless
     * re-creates the hardware encoder, and the next frame is a key frame.
     *
     * @throws protocol_violation when not ready, closed, or called re-entrantly.
     * @throws invalid_configuration when the frame's size, format or range does not match the session.
     */
    compressed_frame compress(const image& frame, const compress_options& options = {});

    void set_speed(int speed);

    /**
     * @brief Moves quality towards @p quality by at most the edge resistance step.
     *
     * At or above the lossless threshold the session switches to lossless if its layout and device allow it,
     * and to the best lossy quality otherwise.
     */
    void set_quality(int quality);

    /**
     * @brief Flushes the encoder, frees buffers and contexts and releases the device slot. Idempotent.
     */
    void clean();

    /// clean() on the worker pool
    std::shared_future<void> clean_async();

    [[nodiscard]] session_state state() const {
        return state_.load();
    }

    [[nodiscard]] int quality() const {
        return quality_.load();
    }

    [[nodiscard]] int speed() const {
        return speed_.load();
    }

    [[nodiscard]] bool lossless() const {
        return lossless_.load();
    }

    [[nodiscard]] bool full_range() const {
        return full_range_;
    }

    [[nodiscard]] int device_id() const {
        return device_id_;
    }

    [[nodiscard]] uint64_t frames() const {
        return frames_;
    }

    [[nodiscard]] const std::string& preset() const {
        return preset_;
    }

    [[nodiscard]] const encoder_init_params& init_params() const {
        return init_params_;
    }

    [[nodiscard]] rate_control_params rate_control() const;

    [[nodiscard]] std::optional<buffer_layout> layout() const {
        return layout_;
    }

    [[nodiscard]] const color_conversion* pipeline() const {
        return pipeline_.get();
    }

    [[nodiscard]] std::map<std::string, std::string> get_info() const;

private:
    enum class quality_change {
        none,
        rate_control,
        lossless_toggle,
    };

    void device_init();
    void device_init_locked();
    void start_encoder();
    void release_encoder();
    void restart_encoder();
    void teardown();
    void update_rate_control(bool force_idr);
    quality_change change_quality(int requested);
    void open_dump();

    template<typename Fn>
    void best_effort(const char* step, Fn&& fn);

    std::shared_ptr<device_registry> registry_;
    std::shared_ptr<worker_pool>     pool_;

    std::atomic<session_state> state_{session_state::created};
    std::atomic<int>           quality_{50};
    std::atomic<int>           speed_{50};
    std::atomic<bool>          lossless_{false};
    bool                       lossless_supported_ = false;

    codec                        codec_   = codec::h264;
    source_format                source_  = source_format::BGRX;
    uint32_t                     width_   = 0;
    uint32_t                     height_  = 0;
    uint32_t                     encode_width_  = 0;
    uint32_t                     encode_height_ = 0;
    bool                         scaled_   = false;
    scaling_filter               filter_   = scaling_filter::bilinear;
    bool                         full_range_ = false;
    uint32_t                     frame_rate_ = 30;
    int                          device_id_  = -1;
    uint64_t                     generation_ = 0;
    bool                         slot_held_  = false;
    codec_capabilities           caps_;
    std::optional<buffer_layout> layout_;
    std::string                  profile_;
    std::string                  preset_;
    tuning                       tuning_ = tuning::low_latency;
    encoder_init_params          init_params_;

    std::unique_ptr<compute_context>  compute_;
    std::unique_ptr<encoder_context>  encoder_;
    std::unique_ptr<color_conversion> pipeline_;
    std::unique_ptr<bitstream_writer> writer_;
    resource_handle                   registered_ = nullptr;
    resource_handle                   bitstream_  = nullptr;
    bool                              encoder_initialized_ = false;

    uint64_t frames_         = 0;
    int64_t  base_timestamp_ = 0;
    bool     pending_idr_    = false;

    std::ofstream dump_;
    std::string   dump_path_;

    mutable std::mutex       rc_mutex_;
    rate_control_params      rc_;
    std::mutex               frame_mutex_;
    std::mutex               clean_mutex_;
    bool                     cleaned_ = false;
    std::mutex               init_mutex_;
    std::exception_ptr       init_error_;
    std::shared_future<void> init_future_;
    std::shared_future<void> clean_future_;
};

} // namespace HWENC
