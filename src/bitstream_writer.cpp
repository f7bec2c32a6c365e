#include "hwenc/bitstream_writer.hpp"

#include "hwenc/gpu_guards.hpp"

#include <spdlog/spdlog.h>

namespace HWENC {

encoded_picture bitstream_writer::submit_and_lock(picture_params picture) {
    mapped_resource input{encoder_, registered_input_};
    picture.input  = input.get();
    picture.output = bitstream_;
    encoder_.encode_picture(picture);

    encoded_picture result;
    {
        bitstream_lock         lock{encoder_, bitstream_};
        const locked_bitstream& locked = lock.get();
        result.type                    = locked.type;
        if (locked.size > 0) {
            if (locked.data == nullptr) {
                throw hwenc_error{"encoder returned a null bitstream of " + std::to_string(locked.size) + " bytes"};
            }
            result.data.assign(locked.data, locked.data + locked.size);
        }
        lock.unlock();
    }
    input.unmap();

    if (auto log = spdlog::get("hwenc")) {
        log->trace("[bitstream_writer] frame {}: {} bytes{}", picture.frame_index, result.data.size(),
                   result.type == picture_type::idr ? " (IDR)" : "");
    }
    return result;
}

} // namespace HWENC
