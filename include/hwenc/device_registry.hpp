#pragma once

#include "config.hpp"
#include "hardware.hpp"
#include "relative_clock.hpp"
#include "worker_pool.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace HWENC {

/**
 * @brief The hardware registry: usable devices, their probed capabilities, and per-device bookkeeping.
 *
 * One instance is meant to live for the whole process and be shared by every encoder session; tests create
 * a fresh one each. All members are thread safe. Hardware context creation and destruction on a device is
 * serialized through lock_device().
 */
class device_registry {
public:
    device_registry(std::shared_ptr<compute_api> compute, std::shared_ptr<encoder_api> encoder, module_config config,
                    std::shared_ptr<relative_clock> clock = std::make_shared<relative_clock>());

    device_registry(const device_registry&)            = delete;
    device_registry& operator=(const device_registry&) = delete;

    /**
     * @brief Initializes the driver and lists the devices that pass the configured filters.
     *
     * Devices that fail to initialize are logged and left out. Runs once; later calls return the same list
     * minus devices removed by failed probes.
     */
    std::vector<int> enumerate();

    /**
     * @brief Enumerates and probes every enabled codec on every device, selecting the activation key.
     *
     * @throws authorization_error if every candidate key is rejected.
     * @throws transient_device_error if a device is temporarily unavailable.
     * @throws hwenc_error if no usable device remains.
     */
    void init();

    [[nodiscard]] bool initialized() const;

    /**
     * @brief Capabilities of @p c on @p device, probing the device on first use only.
     *
     * @return std::nullopt if the device does not offer the codec or was removed because probing failed.
     */
    std::optional<codec_capabilities> probe(int device, codec c);

    [[nodiscard]] std::vector<int> devices() const;
    [[nodiscard]] device_info      get_device(int device) const;

    /// Codecs enabled in the configuration and offered by at least one probed device
    [[nodiscard]] std::vector<codec> codecs() const;
    [[nodiscard]] bool               codec_enabled(codec c) const;

    /**
     * @brief Picks the device for a new @p c session.
     *
     * The preferred device (argument, then configuration) wins when it offers the codec. With round-robin load
     * balancing the devices offering the codec take turns. Otherwise a device whose name contains the configured
     * device name wins, then the highest device_factor(). Equal factors go to a device above the free memory floor,
     * then the most free memory (sampled now), then fewer active contexts, then the lower id.
     *
     * @throws hwenc_error when no device offers the codec.
     */
    int select_device(codec c, int preferred = -1);

    /// Suitability of one device in [0.1, 1], lowered by context pressure and recent failures
    [[nodiscard]] double device_factor(int device) const;

    /// Suitability of the whole module in [0.1, 1]
    [[nodiscard]] double runtime_factor() const;

    /// The worker pool shared by the sessions of this registry, sized by the configuration
    std::shared_ptr<worker_pool> pool();

    std::unique_lock<std::mutex> lock_device(int device);

    /// Counts a new encode context on @p device and returns the device's generation
    uint64_t acquire_context(int device);
    void     release_context(int device);
    [[nodiscard]] int      active_contexts(int device) const;
    [[nodiscard]] uint64_t generation(int device) const;

    void                                 record_failure(int device);
    [[nodiscard]] std::optional<duration> last_failure(int device) const;

    void                                add_bad_preset(int device, const std::string& preset);
    [[nodiscard]] std::set<std::string> bad_presets(int device) const;

    void               mark_no_preset(codec c);
    void               clear_no_preset(codec c);
    [[nodiscard]] bool no_preset_available(codec c) const;

    /// The first key the encoder API accepted; empty means "no key"
    [[nodiscard]] std::string activation_key() const;

    /**
     * @brief Opens a session on @p context with the selected key, selecting it first if needed.
     */
    std::unique_ptr<encoder_context> open_session(compute_context& context);

    [[nodiscard]] const module_config& config() const {
        return config_;
    }

    compute_api& compute() {
        return *compute_;
    }

    [[nodiscard]] const relative_clock& clock() const {
        return *clock_;
    }

    [[nodiscard]] std::map<std::string, std::string> get_info() const;

private:
    struct device_state {
        device_info                                info;
        int                                        active_contexts = 0;
        uint64_t                                   generation      = 0;
        std::optional<duration>                    last_failure;
        std::set<std::string>                      bad_presets;
        bool                                       probed = false;
        std::map<codec, std::optional<codec_capabilities>> caps;
    };

    bool matches(const std::vector<std::string>& list, const device_info& info) const;
    bool usable(const device_info& info) const;
    void probe_device(int device);
    void remove_device(int device, const std::string& reason);
    void refresh_memory(const std::vector<int>& ids);
    std::vector<std::string> key_candidates() const;
    double device_factor_locked(const device_state& state) const;
    std::mutex& device_mutex(int device);

    std::shared_ptr<compute_api>    compute_;
    std::shared_ptr<encoder_api>    encoder_;
    const module_config             config_;
    std::shared_ptr<relative_clock> clock_;

    mutable std::mutex                            mutex_;
    bool                                          enumerated_  = false;
    bool                                          initialized_ = false;
    std::map<int, device_state>                   devices_;
    std::map<int, std::unique_ptr<std::mutex>>    device_locks_;
    std::set<codec>                               no_preset_;
    std::optional<std::string>                    key_;
    int                                           last_round_robin_ = -1;
    std::shared_ptr<worker_pool>                  pool_;

    mutable std::mutex key_mutex_;
};

} // namespace HWENC
