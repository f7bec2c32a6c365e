#include "fake_hardware.hpp"
#include "gtest/gtest.h"
#include "hwenc/color_conversion.hpp"

#include <cstring>
#include <memory>
#include <vector>

namespace HWENC {

using namespace HWENC::test;

class ColorConversionTest : public ::testing::Test {
protected:
    ColorConversionTest()
        : state_{std::make_shared<fake_state>()}
        , context_{state_, 0} {
        caps_.codec_id      = codec::h264;
        caps_.yuv444        = true;
        caps_.input_formats = {buffer_format::argb, buffer_format::abgr, buffer_format::iyuv, buffer_format::yuv444};
    }

    /// Pixel bytes derived from their offset
    static std::vector<uint8_t> make_pixels(uint32_t height, uint32_t stride) {
        std::vector<uint8_t> pixels(static_cast<std::size_t>(stride) * height);
        for (std::size_t i = 0; i < pixels.size(); ++i) {
            pixels[i] = static_cast<uint8_t>(i * 7);
        }
        return pixels;
    }

    image make_image(const std::vector<uint8_t>& pixels, uint32_t width, uint32_t height, uint32_t stride) {
        image frame;
        frame.width  = width;
        frame.height = height;
        frame.stride = stride;
        frame.format = source_format::BGRX;
        frame.pixels = pixels.data();
        return frame;
    }

    std::shared_ptr<fake_state> state_;
    fake_compute_context        context_;
    codec_capabilities          caps_;
    module_config               config_;
};

TEST_F(ColorConversionTest, NativeRgbWhenAllowed) {
    const auto layout = choose_layout(source_format::BGRX, caps_, config_, false, 50, false);
    ASSERT_TRUE(std::holds_alternative<packed_rgb>(layout));
    EXPECT_EQ(std::get<packed_rgb>(layout).format, buffer_format::argb);

    EXPECT_EQ(hardware_format(choose_layout(source_format::RGBA, caps_, config_, false, 50, false)), buffer_format::abgr);
    // no native import for XRGB
    EXPECT_TRUE(std::holds_alternative<planar_420>(choose_layout(source_format::XRGB, caps_, config_, false, 50, false)));
    // lossless and scaled sessions always convert
    EXPECT_TRUE(std::holds_alternative<planar_444>(choose_layout(source_format::BGRX, caps_, config_, true, 100, false)));
    EXPECT_TRUE(std::holds_alternative<planar_420>(choose_layout(source_format::BGRX, caps_, config_, false, 50, true)));
}

TEST_F(ColorConversionTest, SubsamplingThreshold) {
    config_.native_rgb = false;
    EXPECT_TRUE(std::holds_alternative<planar_420>(choose_layout(source_format::BGRX, caps_, config_, false, 79, false)));
    EXPECT_TRUE(std::holds_alternative<planar_444>(choose_layout(source_format::BGRX, caps_, config_, false, 80, false)));

    config_.enable_yuv444 = false;
    EXPECT_TRUE(std::holds_alternative<planar_420>(choose_layout(source_format::BGRX, caps_, config_, false, 90, false)));

    config_.enable_yuv444 = true;
    caps_.yuv444          = false;
    EXPECT_TRUE(std::holds_alternative<planar_420>(choose_layout(source_format::BGRX, caps_, config_, true, 100, false)));

    caps_.input_formats = {buffer_format::argb};
    EXPECT_THROW(choose_layout(source_format::BGRX, caps_, config_, false, 50, false), invalid_configuration);
}

TEST_F(ColorConversionTest, TenBitSources) {
    EXPECT_THROW(choose_layout(source_format::r210, caps_, config_, false, 50, false), invalid_configuration);

    caps_.input_formats.push_back(buffer_format::argb10);
    EXPECT_TRUE(std::holds_alternative<packed_10bit>(choose_layout(source_format::r210, caps_, config_, false, 50, false)));
    EXPECT_THROW(choose_layout(source_format::r210, caps_, config_, false, 50, true), invalid_configuration);

    config_.enable_10bit = false;
    EXPECT_THROW(choose_layout(source_format::r210, caps_, config_, false, 50, false), invalid_configuration);
}

TEST_F(ColorConversionTest, KernelNames) {
    EXPECT_EQ(kernel_name(source_format::BGRX, planar_420{}), "BGRX_to_YUV420P");
    EXPECT_EQ(kernel_name(source_format::RGBA, planar_444{}), "RGBA_to_YUV444P");
}

TEST_F(ColorConversionTest, BufferSizes) {
    color_conversion planar{context_, source_format::BGRX, planar_420{}, {100, 50, 100, 50}, true, false};
    EXPECT_EQ(planar.padded_width(), 128u);
    EXPECT_EQ(planar.padded_height(), 64u);
    EXPECT_FALSE(planar.allocated());
    planar.allocate();
    ASSERT_TRUE(planar.allocated());
    EXPECT_EQ(planar.staging()->size(), 128u * 4 * 64);
    ASSERT_NE(planar.input(), nullptr);
    EXPECT_EQ(planar.input()->row_bytes(), 128u * 4);
    EXPECT_EQ(planar.input()->rows(), 64u);
    EXPECT_EQ(planar.output()->row_bytes(), 128u);
    EXPECT_EQ(planar.output()->rows(), 96u);

    const resource_desc desc = planar.output_desc();
    EXPECT_EQ(desc.width, 128u);
    EXPECT_EQ(desc.height, 64u);
    EXPECT_EQ(desc.pitch, planar.output()->pitch());
    EXPECT_EQ(desc.format, buffer_format::iyuv);

    color_conversion full{context_, source_format::BGRX, planar_444{}, {100, 50, 100, 50}, true, false};
    full.allocate();
    EXPECT_EQ(full.output()->rows(), 192u);

    color_conversion packed{context_, source_format::BGRX, packed_rgb{source_format::BGRX, buffer_format::argb},
                            {100, 50, 100, 50}, true, false};
    packed.allocate();
    EXPECT_EQ(packed.input(), nullptr);
    EXPECT_EQ(packed.output()->row_bytes(), 128u * 4);
    EXPECT_EQ(packed.output()->rows(), 64u);
    EXPECT_EQ(packed.output_desc().format, buffer_format::argb);

    planar.release();
    full.release();
    packed.release();
    planar.release();
    EXPECT_FALSE(planar.allocated());
    EXPECT_EQ(state_->live_buffers, 0);
}

TEST_F(ColorConversionTest, InvalidGeometry) {
    EXPECT_THROW(color_conversion(context_, source_format::BGRX, planar_420{}, {0, 50, 0, 50}, true, false),
                 invalid_configuration);
    EXPECT_THROW(color_conversion(context_, source_format::BGRX, packed_rgb{source_format::BGRX, buffer_format::argb},
                                  {100, 50, 50, 25}, true, false),
                 invalid_configuration);
}

TEST_F(ColorConversionTest, UploadsThroughStagingAndConverts) {
    color_conversion pipeline{context_, source_format::BGRX, planar_420{}, {100, 50, 100, 50}, false, true, true};
    pipeline.allocate();

    const uint32_t stride = 100 * 4 + 16;
    const auto     pixels = make_pixels(50, stride);
    image          frame  = make_image(pixels, 100, 50, stride);
    frame.full_range      = true;

    const auto kernel = pipeline.process(frame);
    ASSERT_TRUE(kernel.has_value());
    EXPECT_EQ(*kernel, "BGRX_to_YUV420P");
    EXPECT_FALSE(pipeline.last_copy_on_device());
    EXPECT_EQ(state_->host_uploads, 1);

    // row 3 arrived intact in the device input buffer
    const auto* input = reinterpret_cast<const uint8_t*>(pipeline.input()->ptr());
    EXPECT_EQ(std::memcmp(input + 3 * pipeline.input()->pitch(), pixels.data() + 3 * stride, 100 * 4), 0);

    ASSERT_EQ(state_->launches.size(), 1u);
    const conversion_launch& launch = state_->launches.front();
    EXPECT_EQ(launch.which, conversion_launch::kernel::rgb_to_yuv420p);
    EXPECT_EQ(launch.src, pipeline.input()->ptr());
    EXPECT_EQ(launch.dst, pipeline.output()->ptr());
    EXPECT_EQ(launch.dst_chroma_pitch, pipeline.output()->pitch() / 2);
    EXPECT_EQ(launch.dst_rows, 64u);
    EXPECT_EQ(launch.grid_x, 4u);
    EXPECT_EQ(launch.grid_y, 2u);
    EXPECT_EQ(launch.block_x, 16u);
    EXPECT_EQ(launch.offsets.r, 2);
    EXPECT_TRUE(launch.full_range);
    EXPECT_FALSE(launch.bilinear);
}

TEST_F(ColorConversionTest, DeviceResidentFramesSkipTheHost) {
    color_conversion pipeline{context_, source_format::BGRX, planar_444{}, {100, 50, 100, 50}, true, true};
    pipeline.allocate();

    const uint32_t stride = 100 * 4;
    const auto     pixels = make_pixels(50, stride);
    image          frame  = make_image(pixels, 100, 50, stride);
    frame.device_ptr      = reinterpret_cast<uint64_t>(pixels.data());

    pipeline.process(frame);
    EXPECT_TRUE(pipeline.last_copy_on_device());
    EXPECT_EQ(state_->device_copies, 1);
    EXPECT_EQ(state_->host_uploads, 0);
    EXPECT_EQ(state_->launches.back().which, conversion_launch::kernel::rgb_to_yuv444p);
    EXPECT_EQ(state_->launches.back().grid_x, 7u);

    // without a host copy the frame cannot take the fallback path
    color_conversion host_only{context_, source_format::BGRX, planar_444{}, {100, 50, 100, 50}, true, false};
    host_only.allocate();
    frame.pixels = nullptr;
    EXPECT_THROW(host_only.process(frame), invalid_configuration);
}

TEST_F(ColorConversionTest, PackedLayoutsAreNotConverted) {
    color_conversion pipeline{context_, source_format::BGRX, packed_rgb{source_format::BGRX, buffer_format::argb},
                              {64, 32, 64, 32}, true, false};
    pipeline.allocate();
    const auto pixels = make_pixels(32, 256);
    EXPECT_FALSE(pipeline.process(make_image(pixels, 64, 32, 256)).has_value());
    EXPECT_TRUE(state_->launches.empty());
    EXPECT_THROW((void) pipeline.make_launch(false), protocol_violation);
}

TEST_F(ColorConversionTest, Scaling) {
    color_conversion pipeline{context_, source_format::RGBX, planar_420{}, {200, 100, 100, 50}, true, false};
    pipeline.allocate();
    EXPECT_EQ(pipeline.output_desc().width, 128u);
    EXPECT_EQ(pipeline.output_desc().height, 64u);
    EXPECT_EQ(pipeline.input()->rows(), 128u);

    const auto launch = pipeline.make_launch(false);
    EXPECT_EQ(launch.src_width, 200u);
    EXPECT_EQ(launch.src_height, 100u);
    EXPECT_EQ(launch.dst_width, 100u);
    EXPECT_EQ(launch.dst_height, 50u);
    EXPECT_EQ(launch.offsets.r, 0);
    EXPECT_TRUE(launch.bilinear);
}

TEST_F(ColorConversionTest, RejectsMismatchedFrames) {
    color_conversion pipeline{context_, source_format::BGRX, planar_420{}, {100, 50, 100, 50}, true, false};
    const auto       pixels = make_pixels(50, 400);

    EXPECT_THROW(pipeline.process(make_image(pixels, 100, 50, 400)), protocol_violation);
    pipeline.allocate();

    EXPECT_THROW(pipeline.process(make_image(pixels, 100, 40, 400)), invalid_configuration);
    image wrong_format  = make_image(pixels, 100, 50, 400);
    wrong_format.format = source_format::RGBX;
    EXPECT_THROW(pipeline.process(wrong_format), invalid_configuration);
    EXPECT_THROW(pipeline.process(make_image(pixels, 100, 50, 200)), invalid_configuration);
    image full_range      = make_image(pixels, 100, 50, 400);
    full_range.full_range = true;
    EXPECT_THROW(pipeline.process(full_range), invalid_configuration);
    EXPECT_TRUE(state_->launches.empty());

    state_->fail_alloc = true;
    color_conversion starved{context_, source_format::BGRX, planar_420{}, {100, 50, 100, 50}, true, false};
    EXPECT_THROW(starved.allocate(), resource_exhaustion);
}

} // namespace HWENC
