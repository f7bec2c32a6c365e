#pragma once

#include "hardware.hpp"

#include <optional>

namespace HWENC {

/**
 * @brief Learns what an open encoder session can do for a codec.
 *
 * Runs against a throwaway session; results are cached by the device registry for the life of the process.
 */
class capability_probe {
public:
    explicit capability_probe(encoder_context& session)
        : session_{session} { }

    /**
     * @brief Queries every capability of @p c.
     *
     * @return std::nullopt when the session does not offer the codec at all.
     */
    std::optional<codec_capabilities> query(codec c);

private:
    encoder_context& session_;
};

} // namespace HWENC
