#pragma once

#include "hardware.hpp"

#include <cstdint>
#include <vector>

namespace HWENC {

/// Bytes of one encoded picture
struct encoded_picture {
    std::vector<uint8_t> data;
    picture_type         type = picture_type::unknown;
};

/**
 * @brief Submits one picture to the encoder and copies the resulting bitstream out.
 */
class bitstream_writer {
public:
    bitstream_writer(encoder_context& encoder, resource_handle registered_input, resource_handle bitstream)
        : encoder_{encoder}
        , registered_input_{registered_input}
        , bitstream_{bitstream} { }

    /**
     * @brief Maps the input, encodes @p picture, then locks, copies and unlocks the bitstream.
     *
     * The input and output handles of @p picture are filled in here. Any failure is fatal for this frame; the
     * input is unmapped and the bitstream unlocked on every path.
     */
    encoded_picture submit_and_lock(picture_params picture);

private:
    encoder_context& encoder_;
    resource_handle  registered_input_;
    resource_handle  bitstream_;
};

} // namespace HWENC
