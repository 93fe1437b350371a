#include <gtest/gtest.h>
#include "test_fakes.hpp"
#include "upload/preflight.hpp"
#include "common/errors.hpp"

class PreflightTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = makeTempDir();
        writeExecutable(dir_ + "/python3", "#!/bin/sh\nexit 0\n");
        tools_.interpreter = dir_ + "/python3";
        tools_.helperDir = dir_;
        installExportHelper("1.30.0", "yes", 0);
    }

    void TearDown() override { removeTree(dir_); }

    void installExportHelper(const std::string& version, const std::string& selinux, int pluginStatus) {
        writeExecutable(dir_ + "/nbdkit",
                        "#!/bin/sh\n"
                        "case \"$1\" in\n"
                        "  --version) echo 'nbdkit " + version + "'; exit 0 ;;\n"
                        "  --dump-config) printf 'bindir=/usr/bin\\nversion=" + version +
                        "\\nselinux=" + selinux + "\\n'; exit 0 ;;\n"
                        "  python) exit " + std::to_string(pluginStatus) + " ;;\n"
                        "esac\n"
                        "exit 1\n");
        tools_.exportHelper = dir_ + "/nbdkit";
    }

    static bool noSelinux() { return false; }
    static bool withSelinux() { return true; }

    std::string dir_;
    ToolConfig tools_;
};

TEST_F(PreflightTest, HealthyEnvironmentPasses) {
    EnvironmentPreflight preflight(tools_, noSelinux);
    EXPECT_NO_THROW(preflight.verify());
    EXPECT_FALSE(preflight.selinuxEnabled());
}

TEST_F(PreflightTest, MissingInterpreterFails) {
    tools_.interpreter = dir_ + "/no-python";
    EnvironmentPreflight preflight(tools_, noSelinux);
    EXPECT_THROW(preflight.verify(), EnvironmentError);
}

TEST_F(PreflightTest, MissingSdkModuleFails) {
    writeExecutable(dir_ + "/python3", "#!/bin/sh\nexit 1\n");
    EnvironmentPreflight preflight(tools_, noSelinux);
    try {
        preflight.verify();
        FAIL() << "expected EnvironmentError";
    } catch (const EnvironmentError& e) {
        EXPECT_NE(std::string(e.what()).find("ovirtsdk4"), std::string::npos);
    }
}

TEST_F(PreflightTest, MissingExportHelperFails) {
    tools_.exportHelper = dir_ + "/no-nbdkit";
    EnvironmentPreflight preflight(tools_, noSelinux);
    EXPECT_THROW(preflight.verify(), EnvironmentError);
}

TEST_F(PreflightTest, OldExportHelperFails) {
    installExportHelper("1.20.4", "yes", 0);
    EnvironmentPreflight preflight(tools_, noSelinux);
    try {
        preflight.verify();
        FAIL() << "expected EnvironmentError";
    } catch (const EnvironmentError& e) {
        EXPECT_NE(std::string(e.what()).find("1.22.0"), std::string::npos);
    }
}

TEST_F(PreflightTest, SelinuxHostNeedsSelinuxBuild) {
    installExportHelper("1.30.0", "no", 0);
    EnvironmentPreflight without(tools_, noSelinux);
    EXPECT_NO_THROW(without.verify());

    EnvironmentPreflight with(tools_, withSelinux);
    EXPECT_THROW(with.verify(), EnvironmentError);
}

TEST_F(PreflightTest, SelinuxHostWithSelinuxBuildLabelsSockets) {
    EnvironmentPreflight preflight(tools_, withSelinux);
    EXPECT_NO_THROW(preflight.verify());
    EXPECT_TRUE(preflight.selinuxEnabled());
}

TEST_F(PreflightTest, BrokenPluginFails) {
    installExportHelper("1.30.0", "yes", 1);
    EnvironmentPreflight preflight(tools_, noSelinux);
    EXPECT_THROW(preflight.verify(), EnvironmentError);
}

TEST(PreflightParsingTest, ParsesDumpConfig) {
    auto config = EnvironmentPreflight::parseConfig("bindir=/usr/bin\nversion=1.30.3\nselinux=yes\ngarbage\n");
    EXPECT_EQ(config["version"], "1.30.3");
    EXPECT_EQ(config["selinux"], "yes");
    EXPECT_EQ(config.count("garbage"), 0u);
}

TEST(PreflightParsingTest, ComparesVersions) {
    EXPECT_EQ(EnvironmentPreflight::parseVersion("1.22.0"), (std::vector<int>{1, 22, 0}));
    EXPECT_EQ(EnvironmentPreflight::parseVersion("1.33.2-rc1"), (std::vector<int>{1, 33, 2}));
    EXPECT_TRUE(EnvironmentPreflight::versionAtLeast("1.22.0", "1.22.0"));
    EXPECT_TRUE(EnvironmentPreflight::versionAtLeast("1.100.1", "1.22.0"));
    EXPECT_TRUE(EnvironmentPreflight::versionAtLeast("2.0", "1.22.0"));
    EXPECT_FALSE(EnvironmentPreflight::versionAtLeast("1.21.99", "1.22.0"));
    EXPECT_FALSE(EnvironmentPreflight::versionAtLeast("1.3.0", "1.22.0"));
    EXPECT_FALSE(EnvironmentPreflight::versionAtLeast("unknown", "1.22.0"));
}
