#pragma once

#include "hardware.hpp"

#include <optional>
#include <set>
#include <string>

namespace HWENC {

/// Approximate speed and quality of a hardware preset, both 0-100
struct preset_rating {
    int speed;
    int quality;
};

/**
 * @brief Looks up the rating of a preset by name.
 *
 * @return std::nullopt for presets the table does not know; those are never selected by scoring.
 */
std::optional<preset_rating> rate_preset(const std::string& name);

bool is_lossless_preset(const std::string& name);

/**
 * @brief Lower is better: 2 * |speed delta| + 3 * |quality delta|, minus 100 when losslessness matches.
 */
int preset_score(const std::string& name, const preset_rating& rating, int speed, int quality, bool lossless);

/**
 * @brief Chooses a preset and a tuning hint for a target speed and quality.
 */
class preset_resolver {
public:
    /**
     * @param override_preset forces this preset whenever the device offers it and it is not denylisted.
     * @param override_tuning forces this tuning; must name a tuning or be empty.
     * @throws invalid_configuration for an unknown @p override_tuning.
     */
    explicit preset_resolver(std::string override_preset = "", const std::string& override_tuning = "");

    /**
     * @brief Scores every preset of @p caps that is not in @p denylist and returns the best one.
     *
     * Ties go to the preset enumerated first. Subsampled formats cannot be lossless, so the request is
     * scored as lossy for them.
     *
     * @throws no_preset_available when nothing can be scored.
     */
    [[nodiscard]] std::string get_preset(const codec_capabilities& caps, const std::set<std::string>& denylist, int speed,
                                         int quality, bool lossless, buffer_format format) const;

    [[nodiscard]] tuning get_tuning(int speed, bool lossless) const;

private:
    std::string           override_preset_;
    std::optional<tuning> override_tuning_;
};

} // namespace HWENC
