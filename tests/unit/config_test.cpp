#include "runtime/config.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>

namespace fs = std::filesystem;
using namespace warden::runtime;

class ConfigTest : public ::testing::Test {
protected:
    fs::path temp_dir;

    void SetUp() override {
        // Create temporary test directory
        temp_dir = fs::temp_directory_path() / "warden_config_test";
        fs::create_directories(temp_dir);
    }

    void TearDown() override {
        // Clean up temporary files
        if (fs::exists(temp_dir)) {
            fs::remove_all(temp_dir);
        }
    }

    std::string create_config_file(const std::string& name, const std::string& content) {
        fs::path config_path = temp_dir / name;
        std::ofstream file(config_path);
        file << content;
        file.close();
        return config_path.string();
    }
};

TEST_F(ConfigTest, DefaultsDescribeMoongateDeployment) {
    WatchdogConfig config;
    std::string error;

    ASSERT_TRUE(validate_config(config, error)) << error;
    EXPECT_EQ(config.service.container_name, "sp1-gpu");
    EXPECT_EQ(config.service.port, 3000);
    EXPECT_EQ(config.service.flags.gpus, "all");
    EXPECT_EQ(config.service.max_attempts, 30);
    EXPECT_EQ(config.service.poll_interval_ms, 2000);
    EXPECT_EQ(config.service.readiness_timeout_ms(), 60000);
    EXPECT_EQ(config.service.check_interval_ms, 30000);
    EXPECT_EQ(config.service.probe_timeout_ms, 5000);
    EXPECT_EQ(config.install.unit_name, "moongate-monitor");
    EXPECT_TRUE(config.supervision.backoff_ms.empty());
    EXPECT_EQ(config.supervision.alarm_after_failures, 0);
    ASSERT_EQ(config.supervision.alert_command.size(), 1u);
    EXPECT_EQ(config.supervision.alert_command[0], "wall");
}

TEST_F(ConfigTest, EmptyAlertCommandDisablesAlerts) {
    std::string config_path = create_config_file("no_alerts.yaml", R"(
supervision:
  alert_command: []
)");
    WatchdogConfig config;
    std::string error;

    ASSERT_TRUE(load_config(config_path, config, error)) << error;
    EXPECT_TRUE(config.supervision.alert_command.empty());
}

TEST_F(ConfigTest, ValidFullConfig) {
    std::string config_content = R"(
service:
  container_name: prover-gpu
  image: example/prover:1.2
  host: 127.0.0.1
  port: 3100
  container_port: 3000
  gpus: device=0
  restart_policy: ""
  extra_args: [--shm-size, 2g]
  probe_timeout_ms: 2000
  max_attempts: 10
  poll_interval_ms: 500
  check_interval_ms: 15000

runtime:
  docker_binary: /usr/bin/docker
  command_timeout_ms: 60000
  log_tail_lines: 20

supervision:
  tick_ms: 100
  backoff_ms: [1000, 5000]
  alarm_after_failures: 3
  alert_command: [wall]

logging:
  level: warn
  file: /tmp/warden.log

install:
  unit_name: prover-watchdog
  unit_dir: /tmp/units
  restart_sec: 5
)";

    std::string config_path = create_config_file("full.yaml", config_content);
    WatchdogConfig config;
    std::string error;

    ASSERT_TRUE(load_config(config_path, config, error)) << "Error: " << error;
    EXPECT_EQ(config.service.container_name, "prover-gpu");
    EXPECT_EQ(config.service.image, "example/prover:1.2");
    EXPECT_EQ(config.service.port, 3100);
    EXPECT_EQ(config.service.container_port, 3000);
    EXPECT_EQ(config.service.flags.gpus, "device=0");
    EXPECT_TRUE(config.service.flags.restart_policy.empty());
    ASSERT_EQ(config.service.flags.extra_args.size(), 2u);
    EXPECT_EQ(config.service.flags.extra_args[0], "--shm-size");
    EXPECT_EQ(config.service.probe_timeout_ms, 2000);
    EXPECT_EQ(config.service.max_attempts, 10);
    EXPECT_EQ(config.service.poll_interval_ms, 500);
    EXPECT_EQ(config.service.check_interval_ms, 15000);
    EXPECT_EQ(config.runtime.docker_binary, "/usr/bin/docker");
    EXPECT_EQ(config.runtime.log_tail_lines, 20);
    EXPECT_EQ(config.supervision.tick_ms, 100);
    ASSERT_EQ(config.supervision.backoff_ms.size(), 2u);
    EXPECT_EQ(config.supervision.backoff_ms[1], 5000);
    EXPECT_EQ(config.supervision.alarm_after_failures, 3);
    ASSERT_EQ(config.supervision.alert_command.size(), 1u);
    EXPECT_EQ(config.supervision.alert_command[0], "wall");
    EXPECT_EQ(config.logging.level, "warn");
    EXPECT_EQ(config.logging.file, "/tmp/warden.log");
    EXPECT_EQ(config.install.unit_name, "prover-watchdog");
    EXPECT_EQ(config.install.restart_sec, 5);
}

TEST_F(ConfigTest, PortAlsoSetsContainerPortUnlessGiven) {
    std::string config_path = create_config_file("port.yaml", R"(
service:
  port: 8545
)");
    WatchdogConfig config;
    std::string error;

    ASSERT_TRUE(load_config(config_path, config, error)) << error;
    EXPECT_EQ(config.service.port, 8545);
    EXPECT_EQ(config.service.container_port, 8545);
}

TEST_F(ConfigTest, UnknownTopLevelKeyIsIgnored) {
    std::string config_path = create_config_file("unknown.yaml", R"(
service:
  container_name: svc
telemetry:
  enabled: true
)");
    WatchdogConfig config;
    std::string error;

    EXPECT_TRUE(load_config(config_path, config, error)) << error;
    EXPECT_EQ(config.service.container_name, "svc");
}

TEST_F(ConfigTest, InvalidPortRejected) {
    std::string config_path = create_config_file("bad_port.yaml", R"(
service:
  port: 70000
)");
    WatchdogConfig config;
    std::string error;

    EXPECT_FALSE(load_config(config_path, config, error));
    EXPECT_NE(error.find("port"), std::string::npos);
}

TEST_F(ConfigTest, ProbeTimeoutAboveFiveSecondsRejected) {
    std::string config_path = create_config_file("slow_probe.yaml", R"(
service:
  probe_timeout_ms: 10000
)");
    WatchdogConfig config;
    std::string error;

    EXPECT_FALSE(load_config(config_path, config, error));
    EXPECT_NE(error.find("probe_timeout_ms"), std::string::npos);
}

TEST_F(ConfigTest, ZeroMaxAttemptsRejected) {
    WatchdogConfig config;
    config.service.max_attempts = 0;
    std::string error;

    EXPECT_FALSE(validate_config(config, error));
    EXPECT_NE(error.find("max_attempts"), std::string::npos);
}

TEST_F(ConfigTest, EmptyContainerNameRejected) {
    WatchdogConfig config;
    config.service.container_name = "";
    std::string error;

    EXPECT_FALSE(validate_config(config, error));
}

TEST_F(ConfigTest, NegativeBackoffRejected) {
    WatchdogConfig config;
    config.supervision.backoff_ms = {1000, -1};
    std::string error;

    EXPECT_FALSE(validate_config(config, error));
    EXPECT_NE(error.find("backoff_ms[1]"), std::string::npos);
}

TEST_F(ConfigTest, InvalidLogLevelRejected) {
    std::string config_path = create_config_file("bad_level.yaml", R"(
logging:
  level: verbose
)");
    WatchdogConfig config;
    std::string error;

    EXPECT_FALSE(load_config(config_path, config, error));
    EXPECT_NE(error.find("log level"), std::string::npos);
}

TEST_F(ConfigTest, NegativeActivationIntervalRejected) {
    WatchdogConfig config;
    config.install.activation_interval_ms = -1;
    std::string error;

    EXPECT_FALSE(validate_config(config, error));
    EXPECT_NE(error.find("activation_interval_ms"), std::string::npos);
}

TEST_F(ConfigTest, LogTailLinesOutOfRangeRejected) {
    WatchdogConfig config;
    std::string error;

    config.runtime.log_tail_lines = 10001;
    EXPECT_FALSE(validate_config(config, error));
    EXPECT_NE(error.find("log_tail_lines"), std::string::npos);

    config.runtime.log_tail_lines = -1;
    EXPECT_FALSE(validate_config(config, error));
}

TEST_F(ConfigTest, UnitNameWithSlashRejected) {
    WatchdogConfig config;
    config.install.unit_name = "../evil";
    std::string error;

    EXPECT_FALSE(validate_config(config, error));
}

TEST_F(ConfigTest, MissingFileReportsError) {
    WatchdogConfig config;
    std::string error;

    EXPECT_FALSE(load_config((temp_dir / "nope.yaml").string(), config, error));
    EXPECT_NE(error.find("Cannot open config file"), std::string::npos);
}

TEST_F(ConfigTest, MalformedYamlReportsParseError) {
    std::string config_path = create_config_file("broken.yaml", "service: [unterminated\n");
    WatchdogConfig config;
    std::string error;

    EXPECT_FALSE(load_config(config_path, config, error));
    EXPECT_FALSE(error.empty());
}

TEST_F(ConfigTest, WrongTypeReportsError) {
    std::string config_path = create_config_file("wrong_type.yaml", R"(
service:
  port: not-a-number
)");
    WatchdogConfig config;
    std::string error;

    EXPECT_FALSE(load_config(config_path, config, error));
    EXPECT_NE(error.find("Config load error"), std::string::npos);
}
