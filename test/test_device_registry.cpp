#include "fake_hardware.hpp"
#include "gtest/gtest.h"
#include "hwenc/device_registry.hpp"

#include <chrono>
#include <memory>
#include <vector>

namespace HWENC {

using namespace HWENC::test;

class DeviceRegistryTest : public ::testing::Test {
protected:
    std::shared_ptr<device_registry> make_registry() {
        return std::make_shared<device_registry>(hw_.compute, hw_.encoder, hw_.config, hw_.clock);
    }

    void add_device(int id, const std::string& name = "Fake GPU") {
        hw_.compute->devices.push_back(fake_compute_api::make_device(id, name));
    }

    fake_hardware hw_;
};

TEST_F(DeviceRegistryTest, InitProbesEnabledCodecs) {
    auto registry = make_registry();
    registry->init();

    EXPECT_TRUE(registry->initialized());
    EXPECT_EQ(registry->devices(), (std::vector<int>{0}));
    EXPECT_EQ(registry->codecs(), (std::vector<codec>{codec::h264, codec::hevc}));
    EXPECT_EQ(registry->activation_key(), "");

    const auto caps = registry->probe(0, codec::h264);
    ASSERT_TRUE(caps.has_value());
    EXPECT_EQ(caps->presets.size(), 7u);
    EXPECT_TRUE(caps->yuv444);
    EXPECT_EQ(caps->max_width, 4096u);
    EXPECT_EQ(caps->rc_modes.size(), 3u);
    // av1 is disabled in the configuration
    EXPECT_FALSE(registry->probe(0, codec::av1).has_value());

    // the probe context and session are gone
    EXPECT_EQ(hw_.state->contexts_live, 0);
    EXPECT_EQ(hw_.state->sessions_live, 0);
    EXPECT_EQ(hw_.state->push_depth, 0);

    const auto info = registry->get_info();
    EXPECT_EQ(info.at("initialized"), "true");
    EXPECT_EQ(info.at("codecs"), "h264,hevc");
    EXPECT_EQ(info.at("device.0.name"), "Fake GPU");
    EXPECT_EQ(info.at("activation-key"), "none");
}

TEST_F(DeviceRegistryTest, ProbeRunsOncePerDevice) {
    auto registry = make_registry();
    registry->probe(0, codec::h264);
    registry->probe(0, codec::hevc);
    registry->init();
    EXPECT_EQ(hw_.state->contexts_created, 1);
}

TEST_F(DeviceRegistryTest, FirstAcceptedKeyIsKept) {
    hw_.encoder->valid_keys  = {"good"};
    hw_.config.license_keys = {"bad", "good", "also-good"};
    auto registry           = make_registry();
    registry->init();

    EXPECT_EQ(registry->activation_key(), "good");
    EXPECT_EQ(hw_.state->keys_tried, (std::vector<std::string>{"", "bad", "good"}));

    auto context = hw_.compute->create_context(0);
    auto session = registry->open_session(*context);
    EXPECT_NE(session, nullptr);
    EXPECT_EQ(hw_.state->keys_tried.back(), "good");
    EXPECT_EQ(hw_.state->keys_tried.size(), 4u);
}

TEST_F(DeviceRegistryTest, EveryKeyRejected) {
    hw_.encoder->valid_keys  = {"good"};
    hw_.config.license_keys = {"bad"};
    auto registry           = make_registry();
    EXPECT_THROW(registry->init(), authorization_error);
    EXPECT_FALSE(registry->initialized());
}

TEST_F(DeviceRegistryTest, DeviceFilters) {
    add_device(1, "Quadro K600");
    add_device(2);

    hw_.config.disabled_devices = {"1"};
    EXPECT_EQ(make_registry()->enumerate(), (std::vector<int>{0, 2}));

    hw_.config.disabled_devices = {"Quadro K600"};
    EXPECT_EQ(make_registry()->enumerate(), (std::vector<int>{0, 2}));

    hw_.config.disabled_devices.clear();
    hw_.config.enabled_devices = {"0000:02:00.0"};
    EXPECT_EQ(make_registry()->enumerate(), (std::vector<int>{1}));

    hw_.config.enabled_devices = {"all"};
    EXPECT_EQ(make_registry()->enumerate().size(), 3u);

    hw_.config.enabled_devices = {"none"};
    EXPECT_TRUE(make_registry()->enumerate().empty());

    hw_.config.enabled_devices.clear();
    hw_.config.disabled_devices = {"all"};
    EXPECT_TRUE(make_registry()->enumerate().empty());
}

TEST_F(DeviceRegistryTest, UnsuitableDevicesAreSkipped) {
    add_device(1);
    add_device(2);
    hw_.compute->devices[1].can_map_host_memory = false;
    hw_.compute->devices[2].compute_major       = 2;
    hw_.compute->devices[2].compute_minor       = 1;
    EXPECT_EQ(make_registry()->enumerate(), (std::vector<int>{0}));

    hw_.compute->failing_devices = {0};
    EXPECT_TRUE(make_registry()->enumerate().empty());
}

TEST_F(DeviceRegistryTest, NoDevices) {
    hw_.compute->init_fails = true;
    EXPECT_TRUE(make_registry()->enumerate().empty());
    EXPECT_THROW(make_registry()->init(), hwenc_error);

    hw_.compute->init_fails    = false;
    hw_.config.enabled_devices = {"none"};
    EXPECT_THROW(make_registry()->init(), hwenc_error);
}

TEST_F(DeviceRegistryTest, BrokenDeviceIsRemoved) {
    add_device(1);
    hw_.encoder->broken_devices = {1};
    auto registry               = make_registry();
    registry->init();
    EXPECT_EQ(registry->devices(), (std::vector<int>{0}));
    EXPECT_FALSE(registry->probe(1, codec::h264).has_value());
}

TEST_F(DeviceRegistryTest, TransientFailureIsRecorded) {
    hw_.encoder->transient_devices = {0};
    auto registry                  = make_registry();
    try {
        registry->init();
        FAIL() << "expected a transient_device_error";
    } catch (const transient_device_error& e) {
        EXPECT_EQ(e.device_id(), 0);
        ASSERT_TRUE(e.failure_time().has_value());
        EXPECT_EQ(*e.failure_time(), hw_.clock->now());
    }
    EXPECT_TRUE(registry->last_failure(0) == hw_.clock->now());
    EXPECT_EQ(registry->devices(), (std::vector<int>{0}));

    // the device recovers
    hw_.encoder->transient_devices.clear();
    registry->init();
    EXPECT_TRUE(registry->initialized());
}

TEST_F(DeviceRegistryTest, FailuresDiscountTheDevice) {
    auto registry = make_registry();
    registry->init();
    EXPECT_DOUBLE_EQ(registry->device_factor(0), 1.0);

    registry->record_failure(0);
    EXPECT_DOUBLE_EQ(registry->device_factor(0), 0.1);

    hw_.clock->advance(std::chrono::seconds{30});
    EXPECT_DOUBLE_EQ(registry->device_factor(0), 0.5);
    EXPECT_DOUBLE_EQ(registry->runtime_factor(), 0.5);

    hw_.clock->advance(std::chrono::seconds{30});
    EXPECT_DOUBLE_EQ(registry->device_factor(0), 1.0);
}

TEST_F(DeviceRegistryTest, ContextPressure) {
    hw_.config.context_limit = 4;
    add_device(1);
    auto registry = make_registry();
    registry->init();

    // ties go to the lower id
    EXPECT_EQ(registry->select_device(codec::h264), 0);

    // discounting starts above 1 + limit / 2 = 3 contexts
    for (int i = 0; i < 3; ++i) {
        registry->acquire_context(0);
    }
    EXPECT_DOUBLE_EQ(registry->device_factor(0), 1.0);
    // equal factors: fewer active contexts wins
    EXPECT_EQ(registry->select_device(codec::h264), 1);

    registry->acquire_context(0);
    EXPECT_DOUBLE_EQ(registry->device_factor(0), 0.1);
    EXPECT_EQ(registry->active_contexts(0), 4);
    EXPECT_EQ(registry->generation(0), 4u);
    EXPECT_EQ(registry->select_device(codec::h264), 1);

    // an explicit preference still wins
    EXPECT_EQ(registry->select_device(codec::h264, 0), 0);

    for (int i = 0; i < 4; ++i) {
        registry->release_context(0);
    }
    registry->release_context(0);
    EXPECT_EQ(registry->active_contexts(0), 0);
    EXPECT_EQ(registry->generation(0), 4u);
}

TEST_F(DeviceRegistryTest, MostFreeMemoryWins) {
    add_device(1);
    auto registry = make_registry();
    registry->init();
    EXPECT_EQ(registry->select_device(codec::h264), 0);

    // memory is queried again at selection time
    hw_.compute->devices[0].free_memory = 2ull << 30;
    EXPECT_EQ(registry->select_device(codec::h264), 1);

    // below the floor on both devices: still the one with the most free memory
    hw_.compute->devices[0].free_memory = 400ull << 20;
    hw_.compute->devices[1].free_memory = 200ull << 20;
    EXPECT_EQ(registry->select_device(codec::h264), 0);

    // above the floor beats more active contexts
    hw_.compute->devices[1].free_memory = 4ull << 30;
    registry->acquire_context(1);
    EXPECT_EQ(registry->select_device(codec::h264), 1);
}

TEST_F(DeviceRegistryTest, DeviceNamePreference) {
    add_device(1, "Fake RTX 4000");
    hw_.config.device_name = "RTX";
    auto registry          = make_registry();
    registry->init();
    EXPECT_EQ(registry->select_device(codec::h264), 1);

    hw_.config.device_name = "Tesla";
    EXPECT_EQ(make_registry()->select_device(codec::h264), 0);
}

TEST_F(DeviceRegistryTest, RoundRobin) {
    add_device(1);
    add_device(2);
    hw_.config.load_balancing = "round-robin";
    auto registry             = make_registry();
    registry->init();

    std::vector<int> selected;
    for (int i = 0; i < 4; ++i) {
        selected.push_back(registry->select_device(codec::h264));
    }
    EXPECT_EQ(selected, (std::vector<int>{0, 1, 2, 0}));

    EXPECT_EQ(registry->select_device(codec::h264, 2), 2);
    // an explicit preference does not advance the rotation
    EXPECT_EQ(registry->select_device(codec::h264), 1);
}

TEST_F(DeviceRegistryTest, SharedWorkerPool) {
    hw_.config.worker_threads = 3;
    auto registry             = make_registry();

    auto pool = registry->pool();
    ASSERT_NE(pool, nullptr);
    EXPECT_EQ(pool->size(), 3u);
    EXPECT_EQ(registry->pool(), pool);
}

TEST_F(DeviceRegistryTest, CodecAvailability) {
    hw_.config.enable_hevc = false;
    hw_.config.enable_av1  = true;
    auto registry          = make_registry();
    registry->init();

    EXPECT_EQ(registry->codecs(), (std::vector<codec>{codec::h264}));
    EXPECT_THROW(registry->select_device(codec::hevc), invalid_configuration);
    // enabled, but the device does not offer it
    EXPECT_THROW(registry->select_device(codec::av1), hwenc_error);
}

TEST_F(DeviceRegistryTest, PresetBookkeeping) {
    auto registry = make_registry();
    registry->init();

    registry->add_bad_preset(0, "P4");
    registry->add_bad_preset(0, "P4");
    EXPECT_EQ(registry->bad_presets(0), (std::set<std::string>{"P4"}));
    EXPECT_EQ(registry->get_info().at("device.0.bad-presets"), "P4");

    EXPECT_FALSE(registry->no_preset_available(codec::h264));
    registry->mark_no_preset(codec::h264);
    EXPECT_TRUE(registry->no_preset_available(codec::h264));
    registry->clear_no_preset(codec::h264);
    EXPECT_FALSE(registry->no_preset_available(codec::h264));
}

TEST_F(DeviceRegistryTest, RegistriesAreIndependent) {
    auto first = make_registry();
    first->init();
    first->add_bad_preset(0, "P1");

    auto second = make_registry();
    second->init();
    EXPECT_TRUE(second->bad_presets(0).empty());
}

} // namespace HWENC
