#include "hwenc/device_registry.hpp"

#include "hwenc/capability_probe.hpp"
#include "hwenc/error_util.hpp"
#include "hwenc/gpu_guards.hpp"
#include "hwenc/logging.hpp"

#include <algorithm>
#include <spdlog/fmt/ranges.h>
#include <spdlog/spdlog.h>

namespace HWENC {

namespace {

// devices that do not report their memory are never considered low on it
int free_percent(const device_info& info) {
    if (info.total_memory == 0) {
        return 100;
    }
    return static_cast<int>(100 * info.free_memory / info.total_memory);
}

} // namespace

device_registry::device_registry(std::shared_ptr<compute_api> compute, std::shared_ptr<encoder_api> encoder,
                                 module_config config, std::shared_ptr<relative_clock> clock)
    : compute_{std::move(compute)}
    , encoder_{std::move(encoder)}
    , config_{std::move(config)}
    , clock_{std::move(clock)} {
    init_logging();
    if (!compute_ || !encoder_ || !clock_) {
        throw hwenc_error{"device_registry needs a compute api, an encoder api and a clock"};
    }
}

bool device_registry::matches(const std::vector<std::string>& list, const device_info& info) const {
    return std::any_of(list.begin(), list.end(), [&info](const std::string& token) {
        return token == std::to_string(info.id) || token == info.name || token == info.pci_bus_id;
    });
}

bool device_registry::usable(const device_info& info) const {
    auto log = spdlog::get("hwenc");
    if (!info.can_map_host_memory) {
        log->warn("[device_registry] skipping device {} '{}' (cannot map host memory)", info.id, info.name);
        return false;
    }
    if (info.compute_capability() < config_.min_compute) {
        log->info("[device_registry] ignoring device {} '{}': compute capability {:#x} (minimum {:#x} required)", info.id,
                  info.name, info.compute_capability(), config_.min_compute);
        return false;
    }
    const auto& enabled = config_.enabled_devices;
    if (!enabled.empty() && std::find(enabled.begin(), enabled.end(), "all") == enabled.end() && !matches(enabled, info)) {
        log->debug("[device_registry] device {} '{}' / '{}' is not in the list of enabled devices, skipped", info.id,
                   info.name, info.pci_bus_id);
        return false;
    }
    if (matches(config_.disabled_devices, info)) {
        log->debug("[device_registry] device {} '{}' / '{}' is in the list of disabled devices, skipped", info.id, info.name,
                   info.pci_bus_id);
        return false;
    }
    if (info.total_memory > 0) {
        const int free_pct = free_percent(info);
        if (free_pct < config_.min_free_memory) {
            log->warn("[device_registry] device {} is low on memory: {}% free", info.id, free_pct);
        }
        log->info("[device_registry]  + device {} '{}' (memory: {}% free, compute: {}.{})", info.id, info.name, free_pct,
                  info.compute_major, info.compute_minor);
    }
    return true;
}

std::vector<int> device_registry::enumerate() {
    auto log = spdlog::get("hwenc");
    {
        std::lock_guard<std::mutex> lock{mutex_};
        if (enumerated_) {
            std::vector<int> ids;
            for (const auto& entry : devices_) {
                ids.push_back(entry.first);
            }
            return ids;
        }
        enumerated_ = true;
    }

    const auto& disabled = config_.disabled_devices;
    const auto& enabled  = config_.enabled_devices;
    if (std::find(disabled.begin(), disabled.end(), "all") != disabled.end() ||
        std::find(enabled.begin(), enabled.end(), "none") != enabled.end()) {
        log->info("[device_registry] all devices are disabled");
        return {};
    }

    std::vector<device_info> found;
    try {
        compute_->init();
        const int count = compute_->device_count();
        log->debug("[device_registry] driver reports {} device(s)", count);
        for (int i = 0; i < count; ++i) {
            try {
                found.push_back(compute_->query_device(i));
            } catch (const hwenc_error& e) {
                log->error("[device_registry] error on device {}: {}", i, e.what());
            }
        }
    } catch (const hwenc_error& e) {
        log->error("[device_registry] driver initialization failed: {}", e.what());
        return {};
    }

    std::vector<int>            ids;
    std::lock_guard<std::mutex> lock{mutex_};
    for (auto& info : found) {
        if (!usable(info)) {
            continue;
        }
        const int id          = info.id;
        devices_[id].info     = std::move(info);
        device_locks_.emplace(id, std::make_unique<std::mutex>());
        ids.push_back(id);
    }
    return ids;
}

std::mutex& device_registry::device_mutex(int device) {
    std::lock_guard<std::mutex> lock{mutex_};
    auto&                       slot = device_locks_[device];
    if (!slot) {
        slot = std::make_unique<std::mutex>();
    }
    return *slot;
}

std::unique_lock<std::mutex> device_registry::lock_device(int device) {
    return std::unique_lock<std::mutex>{device_mutex(device)};
}

std::vector<std::string> device_registry::key_candidates() const {
    // "no key" first
    std::vector<std::string> keys{""};
    for (const auto& key : config_.license_keys) {
        if (!key.empty() && std::find(keys.begin(), keys.end(), key) == keys.end()) {
            keys.push_back(key);
        }
    }
    return keys;
}

std::unique_ptr<encoder_context> device_registry::open_session(compute_context& context) {
    std::unique_lock<std::mutex> lock{key_mutex_};
    if (key_) {
        const std::string key = *key_;
        lock.unlock();
        return encoder_->open_session(context, key);
    }

    auto        log        = spdlog::get("hwenc");
    const auto  candidates = key_candidates();
    std::string last_error;
    for (const auto& key : candidates) {
        try {
            auto session = encoder_->open_session(context, key);
            key_         = key;
            if (key.empty()) {
                log->debug("[device_registry] no activation key required");
            } else {
                log->info("[device_registry] using activation key {} of {}",
                          std::find(candidates.begin(), candidates.end(), key) - candidates.begin(), candidates.size() - 1);
            }
            return session;
        } catch (const authorization_error& e) {
            log->debug("[device_registry] activation key rejected: {}", e.what());
            last_error = e.what();
        }
    }
    log->error("[device_registry] every activation key was rejected ({} tried)", candidates.size());
    throw authorization_error{"the encoder API rejected all " + std::to_string(candidates.size()) +
                              " activation key candidates (configure license_keys or HWENC_CLIENT_KEY): " + last_error};
}

void device_registry::probe_device(int device) {
    auto device_lock = lock_device(device);
    {
        std::lock_guard<std::mutex> lock{mutex_};
        auto                        it = devices_.find(device);
        if (it == devices_.end() || it->second.probed) {
            return;
        }
    }

    auto log = spdlog::get("hwenc");
    log->debug("[device_registry] probing device {}", device);

    std::map<codec, std::optional<codec_capabilities>> caps;
    auto                                               context = compute_->create_context(device);
    {
        context_guard guard{*context};
        auto          session = open_session(*context);
        capability_probe probe{*session};
        for (auto c : {codec::h264, codec::hevc, codec::av1}) {
            if (codec_enabled(c)) {
                caps[c] = probe.query(c);
            }
        }
    }

    std::lock_guard<std::mutex> lock{mutex_};
    auto                        it = devices_.find(device);
    if (it != devices_.end()) {
        it->second.caps   = std::move(caps);
        it->second.probed = true;
    }
}

void device_registry::remove_device(int device, const std::string& reason) {
    spdlog::get("hwenc")->warn("[device_registry] removing device {} from the usable set: {}", device, reason);
    std::lock_guard<std::mutex> lock{mutex_};
    devices_.erase(device);
}

void device_registry::init() {
    auto log = spdlog::get("hwenc");
    for (int id : enumerate()) {
        try {
            probe_device(id);
        } catch (const authorization_error& e) {
            log->error("[device_registry] {}", e.what());
            throw;
        } catch (transient_device_error& e) {
            record_failure(id);
            e.set_failure_time(clock_->now());
            log->warn("[device_registry] device {} temporarily unavailable: {}", id, e.what());
            throw;
        } catch (const hwenc_error& e) {
            remove_device(id, e.what());
        }
    }

    std::lock_guard<std::mutex> lock{mutex_};
    if (devices_.empty()) {
        throw hwenc_error{"no usable hardware encoder device"};
    }
    initialized_ = true;
    log->info("[device_registry] initialized with {} device(s)", devices_.size());
}

bool device_registry::initialized() const {
    std::lock_guard<std::mutex> lock{mutex_};
    return initialized_;
}

std::optional<codec_capabilities> device_registry::probe(int device, codec c) {
    try {
        probe_device(device);
    } catch (const authorization_error&) {
        throw;
    } catch (transient_device_error& e) {
        record_failure(device);
        e.set_failure_time(clock_->now());
        throw;
    } catch (const hwenc_error& e) {
        remove_device(device, e.what());
        return std::nullopt;
    }

    std::lock_guard<std::mutex> lock{mutex_};
    auto                        it = devices_.find(device);
    if (it == devices_.end()) {
        return std::nullopt;
    }
    auto caps = it->second.caps.find(c);
    if (caps == it->second.caps.end()) {
        return std::nullopt;
    }
    return caps->second;
}

std::vector<int> device_registry::devices() const {
    std::lock_guard<std::mutex> lock{mutex_};
    std::vector<int>            ids;
    for (const auto& entry : devices_) {
        ids.push_back(entry.first);
    }
    return ids;
}

device_info device_registry::get_device(int device) const {
    std::lock_guard<std::mutex> lock{mutex_};
    auto                        it = devices_.find(device);
    if (it == devices_.end()) {
        throw hwenc_error{"unknown device " + std::to_string(device)};
    }
    return it->second.info;
}

bool device_registry::codec_enabled(codec c) const {
    switch (c) {
    case codec::h264:
        return config_.enable_h264;
    case codec::hevc:
        return config_.enable_hevc;
    case codec::av1:
        return config_.enable_av1;
    }
    return false;
}

std::vector<codec> device_registry::codecs() const {
    std::lock_guard<std::mutex> lock{mutex_};
    std::vector<codec>          result;
    for (auto c : {codec::h264, codec::hevc, codec::av1}) {
        if (!codec_enabled(c)) {
            continue;
        }
        const bool offered = std::any_of(devices_.begin(), devices_.end(), [c](const auto& entry) {
            auto it = entry.second.caps.find(c);
            return it != entry.second.caps.end() && it->second.has_value();
        });
        if (offered) {
            result.push_back(c);
        }
    }
    return result;
}

int device_registry::select_device(codec c, int preferred) {
    if (!codec_enabled(c)) {
        throw invalid_configuration{to_string(c) + " is disabled"};
    }
    const auto ids = enumerate();
    for (int id : ids) {
        probe(id, c);
    }
    if (config_.load_balancing == "memory") {
        refresh_memory(ids);
    }

    auto                        log = spdlog::get("hwenc");
    std::lock_guard<std::mutex> lock{mutex_};
    auto                        offers = [c](const device_state& state) {
        auto it = state.caps.find(c);
        return it != state.caps.end() && it->second.has_value();
    };

    for (int candidate : {preferred, config_.device_id}) {
        if (candidate < 0) {
            continue;
        }
        auto it = devices_.find(candidate);
        if (it != devices_.end() && offers(it->second)) {
            log->debug("[device_registry] using preferred device {} for {}", candidate, to_string(c));
            return candidate;
        }
        log->warn("[device_registry] preferred device {} cannot encode {}", candidate, to_string(c));
    }

    std::vector<int> candidates;
    for (const auto& [id, state] : devices_) {
        if (offers(state)) {
            candidates.push_back(id);
        }
    }
    if (candidates.empty()) {
        throw hwenc_error{"no usable device can encode " + to_string(c)};
    }

    if (config_.load_balancing == "round-robin") {
        auto next = std::upper_bound(candidates.begin(), candidates.end(), last_round_robin_);
        const int selected = next == candidates.end() ? candidates.front() : *next;
        last_round_robin_  = selected;
        log->debug("[device_registry] round-robin selected device {} for {}", selected, to_string(c));
        return selected;
    }

    if (!config_.device_name.empty()) {
        for (int id : candidates) {
            if (devices_.at(id).info.name.find(config_.device_name) != std::string::npos) {
                log->debug("[device_registry] device {} matches the preferred name '{}'", id, config_.device_name);
                return id;
            }
        }
    }

    int    best        = -1;
    double best_factor = -1.0;
    bool   best_roomy  = false;
    int    best_free   = -1;
    int    best_active = 0;
    for (int id : candidates) {
        const auto&  state  = devices_.at(id);
        const double factor = device_factor_locked(state);
        const int    free   = free_percent(state.info);
        const bool   roomy  = free >= config_.min_free_memory;
        // suitability first, then devices above the free memory floor, then the most free memory
        const bool better = best < 0 || factor > best_factor ||
            (factor == best_factor &&
             (roomy != best_roomy ? roomy
                                  : free != best_free ? free > best_free : state.active_contexts < best_active));
        if (better) {
            best        = id;
            best_factor = factor;
            best_roomy  = roomy;
            best_free   = free;
            best_active = state.active_contexts;
        }
    }
    if (!best_roomy) {
        log->warn("[device_registry] every device is low on memory, using device {} ({}% free)", best, best_free);
    }
    log->debug("[device_registry] selected device {} for {} (factor {:.2f}, {}% free, {} active)", best, to_string(c),
               best_factor, best_free, best_active);
    return best;
}

void device_registry::refresh_memory(const std::vector<int>& ids) {
    for (int id : ids) {
        device_info info;
        try {
            info = compute_->query_device(id);
        } catch (const hwenc_error& e) {
            spdlog::get("hwenc")->warn("[device_registry] cannot refresh the memory usage of device {}: {}", id, e.what());
            continue;
        }
        std::lock_guard<std::mutex> lock{mutex_};
        auto                        it = devices_.find(id);
        if (it != devices_.end()) {
            it->second.info.free_memory  = info.free_memory;
            it->second.info.total_memory = info.total_memory;
        }
    }
}

std::shared_ptr<worker_pool> device_registry::pool() {
    std::lock_guard<std::mutex> lock{mutex_};
    if (!pool_) {
        pool_ = std::make_shared<worker_pool>(static_cast<std::size_t>(config_.worker_threads));
    }
    return pool_;
}

double device_registry::device_factor_locked(const device_state& state) const {
    const int limit = config_.context_limit;
    // start discounting well before the soft limit
    const int low    = std::min(limit, 1 + limit / 2);
    const int excess = std::max(0, state.active_contexts - low);
    double    factor = 1.0 - static_cast<double>(excess) / std::max(1, limit - low);
    if (state.last_failure) {
        const double elapsed = duration_to_double(clock_->now() - *state.last_failure);
        if (elapsed < device_params::failure_discount_seconds) {
            factor *= std::max(0.0, elapsed) / device_params::failure_discount_seconds;
        }
    }
    return std::max(device_params::min_runtime_factor, std::min(1.0, factor));
}

double device_registry::device_factor(int device) const {
    std::lock_guard<std::mutex> lock{mutex_};
    auto                        it = devices_.find(device);
    if (it == devices_.end()) {
        return device_params::min_runtime_factor;
    }
    return device_factor_locked(it->second);
}

double device_registry::runtime_factor() const {
    std::lock_guard<std::mutex> lock{mutex_};
    double                      factor = device_params::min_runtime_factor;
    for (const auto& entry : devices_) {
        factor = std::max(factor, device_factor_locked(entry.second));
    }
    return factor;
}

uint64_t device_registry::acquire_context(int device) {
    std::lock_guard<std::mutex> lock{mutex_};
    auto                        it = devices_.find(device);
    if (it == devices_.end()) {
        throw hwenc_error{"device " + std::to_string(device) + " is not usable"};
    }
    auto& state = it->second;
    ++state.active_contexts;
    if (state.active_contexts > config_.context_limit) {
        spdlog::get("hwenc")->warn("[device_registry] device {} is above its context limit: {} > {}", device,
                                   state.active_contexts, config_.context_limit);
    }
    return ++state.generation;
}

void device_registry::release_context(int device) {
    std::lock_guard<std::mutex> lock{mutex_};
    auto                        it = devices_.find(device);
    if (it != devices_.end() && it->second.active_contexts > 0) {
        --it->second.active_contexts;
    }
}

int device_registry::active_contexts(int device) const {
    std::lock_guard<std::mutex> lock{mutex_};
    auto                        it = devices_.find(device);
    return it == devices_.end() ? 0 : it->second.active_contexts;
}

uint64_t device_registry::generation(int device) const {
    std::lock_guard<std::mutex> lock{mutex_};
    auto                        it = devices_.find(device);
    return it == devices_.end() ? 0 : it->second.generation;
}

void device_registry::record_failure(int device) {
    std::lock_guard<std::mutex> lock{mutex_};
    auto                        it = devices_.find(device);
    if (it != devices_.end()) {
        it->second.last_failure = clock_->now();
        spdlog::get("hwenc")->warn("[device_registry] recorded a failure on device {}", device);
    }
}

std::optional<duration> device_registry::last_failure(int device) const {
    std::lock_guard<std::mutex> lock{mutex_};
    auto                        it = devices_.find(device);
    if (it == devices_.end()) {
        return std::nullopt;
    }
    return it->second.last_failure;
}

void device_registry::add_bad_preset(int device, const std::string& preset) {
    std::lock_guard<std::mutex> lock{mutex_};
    auto                        it = devices_.find(device);
    if (it != devices_.end() && it->second.bad_presets.insert(preset).second) {
        spdlog::get("hwenc")->warn("[device_registry] preset {} denylisted on device {}", preset, device);
    }
}

std::set<std::string> device_registry::bad_presets(int device) const {
    std::lock_guard<std::mutex> lock{mutex_};
    auto                        it = devices_.find(device);
    if (it == devices_.end()) {
        return {};
    }
    return it->second.bad_presets;
}

void device_registry::mark_no_preset(codec c) {
    std::lock_guard<std::mutex> lock{mutex_};
    no_preset_.insert(c);
}

void device_registry::clear_no_preset(codec c) {
    std::lock_guard<std::mutex> lock{mutex_};
    no_preset_.erase(c);
}

bool device_registry::no_preset_available(codec c) const {
    std::lock_guard<std::mutex> lock{mutex_};
    return no_preset_.count(c) != 0;
}

std::string device_registry::activation_key() const {
    std::lock_guard<std::mutex> lock{key_mutex_};
    return key_.value_or("");
}

std::map<std::string, std::string> device_registry::get_info() const {
    std::map<std::string, std::string> info;
    {
        std::lock_guard<std::mutex> lock{key_mutex_};
        info["activation-key"] = !key_ ? "unselected" : key_->empty() ? "none" : "set";
    }

    std::vector<std::string> codec_names;
    for (auto c : codecs()) {
        codec_names.push_back(to_string(c));
    }
    info["codecs"] = fmt::format("{}", fmt::join(codec_names, ","));

    std::lock_guard<std::mutex> lock{mutex_};
    std::vector<std::string>    ids;
    double                      runtime = device_params::min_runtime_factor;
    for (const auto& [id, state] : devices_) {
        const std::string prefix = "device." + std::to_string(id) + ".";
        const double      factor = device_factor_locked(state);
        runtime                  = std::max(runtime, factor);
        ids.push_back(std::to_string(id));
        info[prefix + "name"]        = state.info.name;
        info[prefix + "pci-bus-id"]  = state.info.pci_bus_id;
        info[prefix + "compute"]     = fmt::format("{}.{}", state.info.compute_major, state.info.compute_minor);
        info[prefix + "contexts"]    = std::to_string(state.active_contexts);
        info[prefix + "generation"]  = std::to_string(state.generation);
        info[prefix + "factor"]      = fmt::format("{:.2f}", factor);
        info[prefix + "bad-presets"] = fmt::format("{}", fmt::join(state.bad_presets, ","));
    }
    info["devices"]        = fmt::format("{}", fmt::join(ids, ","));
    info["context-limit"]  = std::to_string(config_.context_limit);
    info["runtime-factor"] = fmt::format("{:.2f}", runtime);
    info["initialized"]    = initialized_ ? "true" : "false";
    return info;
}

} // namespace HWENC
