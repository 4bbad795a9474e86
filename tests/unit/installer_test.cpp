#include "install/installer.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>

#include "mocks/mock_command_runner.hpp"

namespace fs = std::filesystem;
using namespace warden;
using namespace warden::tests;
using install::InstallStatus;
using ::testing::_;
using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::InSequence;
using ::testing::Return;

class InstallerTest : public ::testing::Test {
protected:
    fs::path temp_dir;
    runtime::InstallConfig config;
    MockCommandRunner runner;
    service::ServiceDescriptor descriptor;
    install::UnitInvocation invocation;

    void SetUp() override {
        temp_dir = fs::temp_directory_path() / "warden_installer_test";
        fs::remove_all(temp_dir);
        config.unit_dir = (temp_dir / "units").string();
        config.activation_checks = 3;
        config.activation_interval_ms = 1;
        invocation.executable = "/usr/local/bin/warden";
        invocation.config_path = "/etc/warden/warden.yaml";
        invocation.working_directory = "/opt/warden";
    }

    void TearDown() override { fs::remove_all(temp_dir); }

    void expect_systemctl_success(int times = 1) {
        EXPECT_CALL(runner, run(ElementsAre("systemctl", "daemon-reload"), _))
            .Times(times)
            .WillRepeatedly(Return(exited(0)));
        EXPECT_CALL(runner, run(ElementsAre("systemctl", "enable", "moongate-monitor.service"), _))
            .Times(times)
            .WillRepeatedly(Return(exited(0)));
        EXPECT_CALL(runner, run(ElementsAre("systemctl", "restart", "moongate-monitor.service"), _))
            .Times(times)
            .WillRepeatedly(Return(exited(0)));
        EXPECT_CALL(runner, run(ElementsAre("systemctl", "is-active", "moongate-monitor.service"), _))
            .Times(times)
            .WillRepeatedly(Return(exited(0, "active\n")));
    }

    static std::string read_file(const fs::path &path) {
        std::ifstream in(path);
        std::stringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }
};

TEST_F(InstallerTest, RenderedUnitRunsMonitorAndRestartsAlways) {
    install::Installer installer(config, runner);
    auto unit = installer.render_unit(descriptor, invocation);

    EXPECT_THAT(unit, HasSubstr("Description=Moongate Health Monitor for SP1 CUDA (sp1-gpu)\n"));
    EXPECT_THAT(unit, HasSubstr("After=docker.service\n"));
    EXPECT_THAT(unit, HasSubstr("Requires=docker.service\n"));
    EXPECT_THAT(unit, HasSubstr("User=root\n"));
    EXPECT_THAT(unit, HasSubstr("WorkingDirectory=/opt/warden\n"));
    EXPECT_THAT(unit, HasSubstr("ExecStart=/usr/local/bin/warden --config /etc/warden/warden.yaml monitor\n"));
    EXPECT_THAT(unit, HasSubstr("Restart=always\n"));
    EXPECT_THAT(unit, HasSubstr("RestartSec=10\n"));
    EXPECT_THAT(unit, HasSubstr("StandardOutput=journal\n"));
    EXPECT_THAT(unit, HasSubstr("WantedBy=multi-user.target\n"));
}

TEST_F(InstallerTest, ExecStartQuotesPathsWithSpaces) {
    invocation.executable = "/opt/my tools/warden";
    invocation.config_path = "";
    install::Installer installer(config, runner);

    auto unit = installer.render_unit(descriptor, invocation);

    EXPECT_THAT(unit, HasSubstr("ExecStart=\"/opt/my tools/warden\" monitor\n"));
}

TEST_F(InstallerTest, InstallWritesUnitAndActivates) {
    {
        InSequence seq;
        EXPECT_CALL(runner, run(ElementsAre("systemctl", "daemon-reload"), _)).WillOnce(Return(exited(0)));
        EXPECT_CALL(runner, run(ElementsAre("systemctl", "enable", "moongate-monitor.service"), _))
            .WillOnce(Return(exited(0)));
        EXPECT_CALL(runner, run(ElementsAre("systemctl", "restart", "moongate-monitor.service"), _))
            .WillOnce(Return(exited(0)));
        EXPECT_CALL(runner, run(ElementsAre("systemctl", "is-active", "moongate-monitor.service"), _))
            .WillOnce(Return(exited(3, "activating\n")))
            .WillOnce(Return(exited(0, "active\n")));
    }

    install::Installer installer(config, runner);
    auto result = installer.install(descriptor, invocation);

    EXPECT_EQ(result.status, InstallStatus::INSTALLED) << result.error;
    EXPECT_EQ(result.unit_path, (temp_dir / "units" / "moongate-monitor.service").string());
    EXPECT_EQ(read_file(result.unit_path), installer.render_unit(descriptor, invocation));
}

TEST_F(InstallerTest, ReinstallLeavesExactlyOneUnit) {
    expect_systemctl_success(2);
    install::Installer installer(config, runner);

    ASSERT_EQ(installer.install(descriptor, invocation).status, InstallStatus::INSTALLED);
    invocation.working_directory = "/srv/warden";
    ASSERT_EQ(installer.install(descriptor, invocation).status, InstallStatus::INSTALLED);

    int files = 0;
    for (const auto &entry : fs::directory_iterator(config.unit_dir)) {
        (void)entry;
        files++;
    }
    EXPECT_EQ(files, 1);
    EXPECT_THAT(read_file(installer.unit_path()), HasSubstr("WorkingDirectory=/srv/warden\n"));
}

TEST_F(InstallerTest, AccessDeniedIsPermissionError) {
    EXPECT_CALL(runner, run(ElementsAre("systemctl", "daemon-reload"), _))
        .WillOnce(Return(exited(1, "", "Failed to reload daemon: Access denied\n")));

    install::Installer installer(config, runner);
    auto result = installer.install(descriptor, invocation);

    EXPECT_EQ(result.status, InstallStatus::PERMISSION_ERROR);
    EXPECT_THAT(result.error, HasSubstr("Access denied"));
}

TEST_F(InstallerTest, EnableFailureIsFailed) {
    EXPECT_CALL(runner, run(ElementsAre("systemctl", "daemon-reload"), _)).WillOnce(Return(exited(0)));
    EXPECT_CALL(runner, run(ElementsAre("systemctl", "enable", _), _))
        .WillOnce(Return(exited(1, "", "Failed to enable unit: Unit file is masked.\n")));

    install::Installer installer(config, runner);
    auto result = installer.install(descriptor, invocation);

    EXPECT_EQ(result.status, InstallStatus::FAILED);
    EXPECT_EQ(result.error, "systemctl enable moongate-monitor.service failed: Failed to enable unit: Unit file is masked.");
}

TEST_F(InstallerTest, MissingSystemctlIsFailed) {
    EXPECT_CALL(runner, run(_, _)).WillOnce(Return(not_started("exec failed for systemctl: No such file or directory")));

    install::Installer installer(config, runner);
    auto result = installer.install(descriptor, invocation);

    EXPECT_EQ(result.status, InstallStatus::FAILED);
    EXPECT_THAT(result.error, HasSubstr("No such file or directory"));
}

TEST_F(InstallerTest, NeverActiveIsFailed) {
    EXPECT_CALL(runner, run(ElementsAre("systemctl", "daemon-reload"), _)).WillOnce(Return(exited(0)));
    EXPECT_CALL(runner, run(ElementsAre("systemctl", "enable", _), _)).WillOnce(Return(exited(0)));
    EXPECT_CALL(runner, run(ElementsAre("systemctl", "restart", _), _)).WillOnce(Return(exited(0)));
    EXPECT_CALL(runner, run(ElementsAre("systemctl", "is-active", _), _))
        .Times(3)
        .WillRepeatedly(Return(exited(3, "failed\n")));

    install::Installer installer(config, runner);
    auto result = installer.install(descriptor, invocation);

    EXPECT_EQ(result.status, InstallStatus::FAILED);
    EXPECT_THAT(result.error, HasSubstr("last state: failed"));
}

TEST_F(InstallerTest, UnwritableUnitDirIsNotInstalled) {
    // A regular file where the unit directory should be
    fs::create_directories(temp_dir);
    std::ofstream(temp_dir / "blocker") << "x";
    config.unit_dir = (temp_dir / "blocker" / "units").string();
    EXPECT_CALL(runner, run(_, _)).Times(0);

    install::Installer installer(config, runner);
    auto result = installer.install(descriptor, invocation);

    EXPECT_NE(result.status, InstallStatus::INSTALLED);
    EXPECT_FALSE(result.error.empty());
}

TEST(InstallStatusTest, Names) {
    EXPECT_STREQ(install::to_string(InstallStatus::INSTALLED), "Installed");
    EXPECT_STREQ(install::to_string(InstallStatus::PERMISSION_ERROR), "PermissionError");
    EXPECT_STREQ(install::to_string(InstallStatus::FAILED), "Failed");
}
