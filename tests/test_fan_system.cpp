#include <gtest/gtest.h>

#include <sstream>

#include "fakes.hpp"
#include "libcore/errors.hpp"
#include "libcore/fan_system.hpp"
#include "libcore/fan_tachometer.hpp"

namespace fanctl::core {
namespace {

using test::FakeFrequency;
using test::FakeHardware;
using test::FakeMachine;

FanctlConfig parse(const std::string &text) {
    std::istringstream in(text);
    return parse_fanctl_config(in);
}

class FanSystemTest : public ::testing::Test {
protected:
    FakeMachine machine;
    LookaheadQueue lookahead{0.1};
    FakeHardware hardware;
    FanSystem system{machine, lookahead, hardware};
};

TEST_F(FanSystemTest, BuildsEveryFanAndRoutesSlicerNumbers) {
    system.build(parse("SOURCE_cpu=type=sysfs,path=/t,poll=2\n"
                       "FAN=pin=/p0,kick_start_time=0\n"
                       "FAN_GENERIC_aux=pin=/p1,slicer_fan_number=1,enable_pin=/g1\n"
                       "TEMPERATURE_FAN_case=pin=/p2,sensor=cpu,min_temp=0,max_temp=90,control=watermark\n"));
    system.connect();

    ASSERT_NE(system.primary_fan(), nullptr);
    EXPECT_EQ(system.generic_fans().size(), 1u);
    ASSERT_EQ(system.temperature_fans().size(), 1u);
    EXPECT_DOUBLE_EQ(system.temperature_fans()[0]->speed_delay(), 0.1);
    EXPECT_EQ(hardware.pwms.size(), 3u);
    EXPECT_EQ(hardware.digitals.size(), 1u);

    EXPECT_EQ(&system.registry().lookup(1), system.generic_fans()[0].get());
    EXPECT_EQ(&system.registry().lookup(0), system.primary_fan());

    system.commands().execute("M106 S255 T1");
    lookahead.flush(1.0);
    ASSERT_EQ(hardware.pwm("aux").writes.size(), 1u);
    EXPECT_NEAR(hardware.pwm("aux").writes[0].time, 1.1, 1e-9);
}

TEST_F(FanSystemTest, TemperatureFanIsNotCommandableAsGenericFan) {
    system.build(parse("SOURCE_cpu=type=sysfs,path=/t\n"
                       "TEMPERATURE_FAN_case=pin=/p2,sensor=cpu,min_temp=0,max_temp=90,control=watermark\n"));
    system.connect();

    EXPECT_THROW(system.commands().execute("SET_FAN_SPEED FAN=case SPEED=1"), CommandError);
    EXPECT_THROW(system.commands().execute("M106"), CommandError);
}

TEST_F(FanSystemTest, SamplesReachBoundTemperatureFans) {
    system.build(parse("SOURCE_cpu=type=sysfs,path=/t\n"
                       "SOURCE_gpu=type=sysfs,path=/u\n"
                       "TEMPERATURE_FAN_case=pin=/p2,sensor=cpu,min_temp=0,max_temp=90,target_temp=40,"
                       "control=watermark\n"));
    system.connect();

    system.on_temperature_sample("gpu", 1.0, 80.0, 1.0);
    EXPECT_TRUE(hardware.pwm("case").writes.empty());

    system.on_temperature_sample("cpu", 1.0, 80.0, 1.0);
    ASSERT_EQ(hardware.pwm("case").writes.size(), 1u);
    EXPECT_DOUBLE_EQ(system.temperature_fans()[0]->last_temp(), 80.0);

    const auto status = system.collect_status();
    ASSERT_EQ(status.size(), 1u);
    EXPECT_EQ(status[0].first, "case");
    EXPECT_DOUBLE_EQ(status[0].second.speed, 1.0);
}

TEST_F(FanSystemTest, ConnectRejectsHeaterFanWithoutShutdownAction) {
    system.build(parse("FAN=pin=/p0,heaters=extruder,tachometer_pin=/c,tach_loss_action=warning\n"));
    EXPECT_THROW(system.connect(), ConfigError);
}

TEST_F(FanSystemTest, DuplicateSlicerNumberFailsAtConnect) {
    system.build(parse("FAN_GENERIC_a=pin=/p1,slicer_fan_number=3\n"
                       "FAN_GENERIC_b=pin=/p2,slicer_fan_number=3\n"));
    EXPECT_THROW(system.connect(), ConfigError);
}

TEST_F(FanSystemTest, TachometersSampledOncePerWindow) {
    system.build(parse("FAN=pin=/p0,kick_start_time=0,tachometer_pin=/c,tachometer_ppr=2\n"));
    system.connect();
    hardware.inputs[0].second->frequency = 20.0;

    system.poll_tachometers(0.0);
    FanTachometer *tach = system.primary_fan()->tachometer();
    ASSERT_NE(tach, nullptr);
    ASSERT_TRUE(tach->rpm().has_value());
    EXPECT_DOUBLE_EQ(*tach->rpm(), 300.0);

    hardware.inputs[0].second->frequency = 10.0;
    system.poll_tachometers(0.5);
    EXPECT_DOUBLE_EQ(*tach->rpm(), 300.0);
    system.poll_tachometers(1.0);
    EXPECT_DOUBLE_EQ(*tach->rpm(), 150.0);
}

TEST_F(FanSystemTest, TachLossShutsDownMachine) {
    system.build(parse("FAN=pin=/p0,kick_start_time=0,tachometer_pin=/c,tach_loss_interval=2\n"));
    system.connect();
    system.primary_fan()->set_speed(0.0, 1.0);

    for (double t = 0.0; t <= 4.0; t += 1.0) {
        system.poll_tachometers(t);
    }
    ASSERT_EQ(machine.shutdown_reasons.size(), 1u);
}

TEST_F(FanSystemTest, SlowSourceDoesNotTripTachLossBeforeFanIsDriven) {
    system.build(parse("SOURCE_cpu=type=sysfs,path=/t,poll=5\n"
                       "TEMPERATURE_FAN_chamber=pin=/p2,sensor=cpu,min_temp=0,max_temp=90,target_temp=40,"
                       "control=watermark,kick_start_time=0,tachometer_pin=/c\n"));
    system.connect();
    FakeFrequency &input = *hardware.inputs[0].second;

    system.on_temperature_sample("cpu", 0.0, 70.0, 0.0);
    const auto &writes = hardware.pwm("chamber").writes;
    ASSERT_EQ(writes.size(), 1u);
    EXPECT_LE(writes[0].time, 0.1 + 1e-9);

    // The fan stays still for a while after power-up, then spins.
    for (double t = 0.0; t <= 3.0; t += 1.0) {
        system.poll_tachometers(t);
    }
    input.frequency = 40.0;
    for (double t = 4.0; t <= 8.0; t += 1.0) {
        system.poll_tachometers(t);
    }
    EXPECT_TRUE(machine.shutdown_reasons.empty());
}

TEST_F(FanSystemTest, TachLossWaitsForCommandedDuty) {
    system.build(parse("FAN=pin=/p0,kick_start_time=0,tachometer_pin=/c,tach_loss_interval=2\n"));
    system.connect();
    system.primary_fan()->set_speed(5.0, 1.0);

    for (double t = 0.0; t <= 7.0; t += 1.0) {
        system.poll_tachometers(t);
    }
    EXPECT_TRUE(machine.shutdown_reasons.empty());
    ASSERT_TRUE(system.primary_fan()->tachometer()->loss_since().has_value());
    EXPECT_DOUBLE_EQ(*system.primary_fan()->tachometer()->loss_since(), 5.0);

    system.poll_tachometers(8.0);
    ASSERT_EQ(machine.shutdown_reasons.size(), 1u);
}

TEST_F(FanSystemTest, RestartTurnsEveryFanOff) {
    system.build(parse("FAN=pin=/p0,kick_start_time=0\n"
                       "FAN_GENERIC_aux=pin=/p1,kick_start_time=0\n"));
    system.connect();
    system.primary_fan()->set_speed(1.0, 0.5);
    system.generic_fans()[0]->set_speed(1.0, 0.5);

    system.on_restart(2.0);
    EXPECT_DOUBLE_EQ(hardware.pwm("fan").writes.back().duty, 0.0);
    EXPECT_DOUBLE_EQ(hardware.pwm("aux").writes.back().duty, 0.0);
}

TEST_F(FanSystemTest, BuildTwiceIsRejected) {
    const FanctlConfig cfg = parse("FAN=pin=/p0\n");
    system.build(cfg);
    EXPECT_THROW(system.build(cfg), ConfigError);
}

} // namespace
} // namespace fanctl::core
