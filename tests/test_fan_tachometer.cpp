#include <gtest/gtest.h>

#include <memory>

#include "fakes.hpp"
#include "libcore/errors.hpp"
#include "libcore/fan.hpp"
#include "libcore/fan_tachometer.hpp"

namespace fanctl::core {
namespace {

using test::FakeMachine;
using test::FakePwm;
using test::make_fan_config;

class FanTachometerTest : public ::testing::Test {
protected:
    std::unique_ptr<Fan> make_fan(const FanConfig &cfg) {
        return std::make_unique<Fan>(cfg, pwm, nullptr, lookahead);
    }

    TachometerConfig tach_config(TachLossAction action) {
        TachometerConfig cfg;
        cfg.pin = "/sys/bus/counter/devices/counter0/count0/count";
        cfg.ppr = 2;
        cfg.loss_interval = 3.0;
        cfg.loss_action = action;
        cfg.warning_repeat_interval = 3.0;
        return cfg;
    }

    LookaheadQueue lookahead{0.0};
    FakePwm pwm;
    FakeMachine machine;
};

TEST_F(FanTachometerTest, ConvertsFrequencyToRpm) {
    auto fan = make_fan(make_fan_config("fan"));
    FanTachometer tach(tach_config(TachLossAction::Shutdown), *fan, machine);

    EXPECT_DOUBLE_EQ(tach.sample(10.0, 1.0), 150.0);
    ASSERT_TRUE(tach.rpm().has_value());
    EXPECT_DOUBLE_EQ(*tach.rpm(), 150.0);
}

TEST_F(FanTachometerTest, SingleShutdownAfterLossInterval) {
    auto fan = make_fan(make_fan_config("fan"));
    FanTachometer tach(tach_config(TachLossAction::Shutdown), *fan, machine);
    fan->set_speed(0.0, 0.5);

    tach.sample(0.0, 10.0);
    ASSERT_TRUE(tach.loss_since().has_value());
    EXPECT_DOUBLE_EQ(*tach.loss_since(), 10.0);

    tach.sample(0.0, 13.0);
    EXPECT_TRUE(machine.shutdown_reasons.empty());

    tach.sample(0.0, 13.5);
    ASSERT_EQ(machine.shutdown_reasons.size(), 1u);
    EXPECT_EQ(machine.shutdown_reasons[0], "Tach signal lost on fan for longer than 3 seconds.");
}

TEST_F(FanTachometerTest, PulsesClearLossTimer) {
    auto fan = make_fan(make_fan_config("fan"));
    FanTachometer tach(tach_config(TachLossAction::Shutdown), *fan, machine);
    fan->set_speed(0.0, 0.5);

    tach.sample(0.0, 10.0);
    tach.sample(20.0, 12.0);
    EXPECT_FALSE(tach.loss_since().has_value());
    tach.sample(0.0, 14.0);
    tach.sample(0.0, 16.0);
    EXPECT_TRUE(machine.shutdown_reasons.empty());
}

TEST_F(FanTachometerTest, StoppedFanIsNotAFault) {
    auto fan = make_fan(make_fan_config("fan"));
    FanTachometer tach(tach_config(TachLossAction::Shutdown), *fan, machine);

    tach.sample(0.0, 10.0);
    tach.sample(0.0, 20.0);
    EXPECT_FALSE(tach.loss_since().has_value());
    EXPECT_TRUE(machine.shutdown_reasons.empty());
}

TEST_F(FanTachometerTest, LossTimerWaitsForScheduledDuty) {
    auto fan = make_fan(make_fan_config("fan"));
    FanTachometer tach(tach_config(TachLossAction::Shutdown), *fan, machine);
    fan->set_speed(5.0, 0.5);

    tach.sample(0.0, 4.0);
    EXPECT_FALSE(tach.loss_since().has_value());
    tach.sample(0.0, 5.0);
    ASSERT_TRUE(tach.loss_since().has_value());
    EXPECT_DOUBLE_EQ(*tach.loss_since(), 5.0);
}

TEST_F(FanTachometerTest, WarningRepeatsAtInterval) {
    auto fan = make_fan(make_fan_config("fan"));
    FanTachometer tach(tach_config(TachLossAction::Warning), *fan, machine);
    fan->set_speed(0.0, 0.5);

    tach.sample(0.0, 1.0);
    tach.sample(0.0, 5.0);
    tach.sample(0.0, 6.0);
    tach.sample(0.0, 8.0);
    EXPECT_EQ(machine.responses.size(), 2u);
    EXPECT_TRUE(machine.shutdown_reasons.empty());
}

TEST_F(FanTachometerTest, ZeroRepeatIntervalWarnsOnce) {
    auto fan = make_fan(make_fan_config("fan"));
    TachometerConfig cfg = tach_config(TachLossAction::Warning);
    cfg.warning_repeat_interval = 0.0;
    FanTachometer tach(cfg, *fan, machine);
    fan->set_speed(0.0, 0.5);

    tach.sample(0.0, 0.0);
    for (double t = 4.0; t < 30.0; t += 1.0) {
        tach.sample(0.0, t);
    }
    EXPECT_EQ(machine.responses.size(), 1u);
}

TEST_F(FanTachometerTest, NoneActionStaysSilent) {
    auto fan = make_fan(make_fan_config("fan"));
    FanTachometer tach(tach_config(TachLossAction::None), *fan, machine);
    fan->set_speed(0.0, 0.5);

    tach.sample(0.0, 0.0);
    tach.sample(0.0, 10.0);
    EXPECT_TRUE(machine.responses.empty());
    EXPECT_TRUE(machine.shutdown_reasons.empty());
}

TEST_F(FanTachometerTest, HeaterFanRequiresShutdownAction) {
    FanConfig cfg = make_fan_config("hotend_fan");
    cfg.heaters = {"extruder"};
    auto fan = make_fan(cfg);

    FanTachometer warn(tach_config(TachLossAction::Warning), *fan, machine);
    EXPECT_THROW(warn.handle_connect(), ConfigError);

    FanTachometer shut(tach_config(TachLossAction::Shutdown), *fan, machine);
    EXPECT_NO_THROW(shut.handle_connect());
}

} // namespace
} // namespace fanctl::core
