#include "hwenc/preset_resolver.hpp"

#include <cstdlib>
#include <map>
#include <spdlog/spdlog.h>

namespace HWENC {

namespace {

// (speed, quality) ratings of the presets the encoder API exposes
const std::map<std::string, preset_rating> preset_ratings{
    {"P1", {100, 30}}, {"P2", {90, 40}}, {"P3", {80, 50}}, {"P4", {70, 60}},
    {"P5", {60, 70}},  {"P6", {50, 80}}, {"P7", {40, 90}},
};

} // namespace

std::optional<preset_rating> rate_preset(const std::string& name) {
    auto it = preset_ratings.find(name);
    if (it == preset_ratings.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool is_lossless_preset(const std::string& name) {
    return name.rfind("lossless", 0) == 0;
}

int preset_score(const std::string& name, const preset_rating& rating, int speed, int quality, bool lossless) {
    int score = 2 * std::abs(rating.speed - speed) + 3 * std::abs(rating.quality - quality);
    if (is_lossless_preset(name) == lossless) {
        score -= 100;
    }
    return score;
}

preset_resolver::preset_resolver(std::string override_preset, const std::string& override_tuning)
    : override_preset_{std::move(override_preset)} {
    if (!override_tuning.empty()) {
        override_tuning_ = parse_tuning(override_tuning);
    }
}

std::string preset_resolver::get_preset(const codec_capabilities& caps, const std::set<std::string>& denylist, int speed,
                                        int quality, bool lossless, buffer_format format) const {
    auto log = spdlog::get("hwenc");

    if (!override_preset_.empty()) {
        if (caps.has_preset(override_preset_) && denylist.count(override_preset_) == 0) {
            return override_preset_;
        }
        if (log) {
            log->warn("[preset_resolver] preset override '{}' is not usable for {}, scoring instead", override_preset_,
                      to_string(caps.codec_id));
        }
    }

    const bool  want_lossless = lossless && format != buffer_format::iyuv;
    std::string best;
    int         best_score = 0;
    for (const auto& name : caps.presets) {
        if (denylist.count(name) != 0) {
            continue;
        }
        const auto rating = rate_preset(name);
        if (!rating) {
            if (log) {
                log->debug("[preset_resolver] no rating for preset '{}'", name);
            }
            continue;
        }
        const int score = preset_score(name, *rating, speed, quality, want_lossless);
        if (best.empty() || score < best_score) {
            best       = name;
            best_score = score;
        }
    }

    if (best.empty()) {
        throw no_preset_available{"no usable " + to_string(caps.codec_id) + " preset (" +
                                  std::to_string(caps.presets.size()) + " offered, " + std::to_string(denylist.size()) +
                                  " denylisted)"};
    }
    if (log) {
        log->debug("[preset_resolver] speed={}, quality={}, lossless={}: preset {} (score {})", speed, quality,
                   want_lossless, best, best_score);
    }
    return best;
}

tuning preset_resolver::get_tuning(int speed, bool lossless) const {
    if (override_tuning_) {
        return *override_tuning_;
    }
    if (lossless) {
        return tuning::lossless;
    }
    if (speed > 80) {
        return tuning::ultra_low_latency;
    }
    if (speed >= 50) {
        return tuning::low_latency;
    }
    return tuning::high_quality;
}

} // namespace HWENC
