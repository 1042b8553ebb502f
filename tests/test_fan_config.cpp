#include <gtest/gtest.h>

#include <sstream>
#include <string>

#include "libcore/errors.hpp"
#include "libcore/fan_config.hpp"

namespace fanctl::core {
namespace {

FanctlConfig parse(const std::string &text) {
    std::istringstream in(text);
    return parse_fanctl_config(in);
}

const char *kFullConfig = R"(
# fanctl test configuration
INTERVAL_MS=20
LOOKAHEAD_MS=150
STATUS_PATH=/tmp/fanctl.status.json
SOURCE_cpu=type=sysfs,path=/sys/class/thermal/thermal_zone0/temp,poll=2
SOURCE_wifi=type=ubus,object=network.wireless,method=status,key=temp_mC,args={"radio":"radio0","x":[1,2]}
FAN=pin=/sys/class/hwmon/hwmon2/pwm1,kick_start_time=0.2,tachometer_pin=/sys/bus/counter/devices/counter0/count0/count
FAN_GENERIC_aux=pin=/sys/class/pwm/pwmchip0/pwm1,pin_type=pwmchip,slicer_fan_number=2,max_power=0.8
TEMPERATURE_FAN_case=pin=/sys/class/hwmon/hwmon2/pwm2,sensor=cpu,min_temp=0,max_temp=90,target_temp=55,control=pid,pid_Kp=40,pid_Ki=0.2,pid_Kd=0
)";

TEST(FanConfigTest, ParsesCompleteConfiguration) {
    const FanctlConfig cfg = parse(kFullConfig);

    EXPECT_EQ(cfg.interval_ms, 20);
    EXPECT_EQ(cfg.lookahead_ms, 150);
    EXPECT_EQ(cfg.status_interval_ms, 1000);
    EXPECT_EQ(cfg.status_path, "/tmp/fanctl.status.json");
    EXPECT_EQ(cfg.command_path, kDefaultCommandPath);

    ASSERT_EQ(cfg.sources.size(), 2u);
    EXPECT_EQ(cfg.sources[0].id, "cpu");
    EXPECT_EQ(cfg.sources[0].poll_sec, 2);
    EXPECT_EQ(cfg.sources[1].type, "ubus");
    EXPECT_EQ(cfg.sources[1].args_json, R"({"radio":"radio0","x":[1,2]})");

    ASSERT_TRUE(cfg.fan.has_value());
    EXPECT_DOUBLE_EQ(cfg.fan->kick_start_time, 0.2);
    EXPECT_DOUBLE_EQ(cfg.fan->shutdown_speed, 0.0);
    ASSERT_TRUE(cfg.fan->tachometer.has_value());
    EXPECT_EQ(cfg.fan->tachometer->ppr, 2);
    EXPECT_EQ(cfg.fan->tachometer->loss_action, TachLossAction::Shutdown);
    EXPECT_DOUBLE_EQ(cfg.fan->tachometer->warning_repeat_interval, 3.0);

    ASSERT_EQ(cfg.generic_fans.size(), 1u);
    EXPECT_EQ(cfg.generic_fans[0].pin_type, PwmPinType::PwmChip);
    EXPECT_EQ(cfg.generic_fans[0].slicer_fan_number, std::optional<int>(2));
    EXPECT_DOUBLE_EQ(cfg.generic_fans[0].max_power, 0.8);

    ASSERT_EQ(cfg.temperature_fans.size(), 1u);
    const TemperatureFanConfig &tf = cfg.temperature_fans[0];
    EXPECT_EQ(tf.fan.name, "case");
    EXPECT_EQ(tf.control, ControlKind::Pid);
    EXPECT_DOUBLE_EQ(tf.pid_kp, 40.0);
    EXPECT_DOUBLE_EQ(tf.target_temp, 55.0);
    EXPECT_DOUBLE_EQ(tf.fan.shutdown_speed, 1.0);
}

TEST(FanConfigTest, EnablePinImpliesFourWire) {
    const FanctlConfig cfg = parse("FAN=pin=/p,enable_pin=/sys/class/gpio/gpio4/value\n");
    EXPECT_TRUE(cfg.fan->four_wire);

    const FanctlConfig plain = parse("FAN=pin=/p\n");
    EXPECT_FALSE(plain.fan->four_wire);
}

TEST(FanConfigTest, TargetDefaultsToFortyOrMaxTemp) {
    const FanctlConfig cfg = parse("SOURCE_cpu=type=sysfs,path=/t\n"
                                   "TEMPERATURE_FAN_a=pin=/p1,sensor=cpu,min_temp=0,max_temp=35,control=watermark\n"
                                   "TEMPERATURE_FAN_b=pin=/p2,sensor=cpu,min_temp=0,max_temp=80,control=watermark\n");
    EXPECT_DOUBLE_EQ(cfg.temperature_fans[0].target_temp, 35.0);
    EXPECT_DOUBLE_EQ(cfg.temperature_fans[1].target_temp, 40.0);
}

TEST(FanConfigTest, RejectsBadValues) {
    EXPECT_THROW(parse("FAN=pin=/p,max_power=0\n"), ConfigError);
    EXPECT_THROW(parse("FAN=pin=/p,max_power=1.5\n"), ConfigError);
    EXPECT_THROW(parse("FAN=pin=/p,kick_start_time=-1\n"), ConfigError);
    EXPECT_THROW(parse("FAN=pin=/p,pin_type=gpio\n"), ConfigError);
    EXPECT_THROW(parse("FAN=pin=/p,bogus=1\n"), ConfigError);
    EXPECT_THROW(parse("FAN=kick_start_time=0.1\n"), ConfigError);
    EXPECT_THROW(parse("FAN=pin=/p,tachometer_pin=/c,tach_loss_interval=10\n"), ConfigError);
    EXPECT_THROW(parse("FAN=pin=/p\nFAN=pin=/q\n"), ConfigError);
    EXPECT_THROW(parse("UNKNOWN_KEY=1\nFAN=pin=/p\n"), ConfigError);
    EXPECT_THROW(parse("INTERVAL_MS=50\n"), ConfigError);
}

TEST(FanConfigTest, SlicerNumberOnlyOnGenericFans) {
    EXPECT_THROW(parse("FAN=pin=/p,slicer_fan_number=1\n"), ConfigError);
    EXPECT_THROW(parse("FAN_GENERIC_x=pin=/p,slicer_fan_number=0\n"), ConfigError);
    EXPECT_NO_THROW(parse("FAN_GENERIC_x=pin=/p,slicer_fan_number=1\n"));
}

TEST(FanConfigTest, TemperatureFanChecks) {
    EXPECT_THROW(parse("TEMPERATURE_FAN_a=pin=/p,sensor=cpu,min_temp=0,max_temp=80,control=watermark\n"),
                 ConfigError);
    EXPECT_THROW(parse("SOURCE_cpu=type=sysfs,path=/t\n"
                       "TEMPERATURE_FAN_a=pin=/p,sensor=cpu,min_temp=50,max_temp=40,control=watermark\n"),
                 ConfigError);
    EXPECT_THROW(parse("SOURCE_cpu=type=sysfs,path=/t\n"
                       "TEMPERATURE_FAN_a=pin=/p,sensor=cpu,min_temp=0,max_temp=80,control=pid,pid_Kp=1\n"),
                 ConfigError);
    EXPECT_THROW(parse("SOURCE_cpu=type=sysfs,path=/t\n"
                       "TEMPERATURE_FAN_a=pin=/p,sensor=cpu,min_temp=0,max_temp=80,target_temp=90,"
                       "control=watermark\n"),
                 ConfigError);
    EXPECT_THROW(parse("SOURCE_cpu=type=sysfs,path=/t\n"
                       "TEMPERATURE_FAN_a=pin=/p,sensor=cpu,min_temp=0,max_temp=80,control=slope\n"),
                 ConfigError);
}

TEST(FanConfigTest, RejectsDuplicateAndInvalidNames) {
    EXPECT_THROW(parse("FAN_GENERIC_bad.name=pin=/p\n"), ConfigError);
    EXPECT_THROW(parse("FAN=pin=/p\nFAN_GENERIC_fan=pin=/q\n"), ConfigError);
    EXPECT_THROW(parse("SOURCE_cpu=type=sysfs,path=/t\n"
                       "FAN_GENERIC_a=pin=/q\n"
                       "TEMPERATURE_FAN_a=pin=/p,sensor=cpu,min_temp=0,max_temp=80,control=watermark\n"),
                 ConfigError);
    EXPECT_THROW(parse("SOURCE_cpu=type=sysfs,path=/a\nSOURCE_cpu=type=sysfs,path=/b\nFAN=pin=/p\n"), ConfigError);
    EXPECT_THROW(parse("SOURCE_x=type=ubus,object=o\nFAN=pin=/p\n"), ConfigError);
    EXPECT_THROW(parse("SOURCE_x=type=file,path=/t\nFAN=pin=/p\n"), ConfigError);
}

TEST(FanConfigTest, SchemaListsFanFields) {
    const std::string schema = dump_config_schema_json();
    EXPECT_NE(schema.find("kick_start_time"), std::string::npos);
    EXPECT_NE(schema.find("tach_loss_action"), std::string::npos);
}

} // namespace
} // namespace fanctl::core
