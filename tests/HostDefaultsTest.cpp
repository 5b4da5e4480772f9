#include "fakes/TempDir.hpp"
#include "Core/config/HostDefaults.hpp"
#include "Virtualization/Utils/VmException.hpp"
#include <fstream>
#include <gtest/gtest.h>

using namespace std::chrono_literals;

namespace {

class HostDefaultsTest : public ::testing::Test {
protected:
    TempDir scratch;

    std::string writeConfig(const std::string& text) const {
        const auto path = scratch / "virtrecon.ini";
        std::ofstream(path) << text;
        return path;
    }

    std::string loadError(const std::string& text) const {
        try {
            static_cast<void>(HostDefaults::loadFromFile(writeConfig(text)));
        } catch (const InvalidInputException& e) {
            return e.what();
        }
        return "";
    }
};

} // namespace

TEST_F(HostDefaultsTest, BuiltInValues) {
    const HostDefaults defaults;
    EXPECT_EQ(defaults.defaultUri, "qemu:///system");
    EXPECT_EQ(defaults.powerShutdownTimeout, 60s);
    EXPECT_EQ(defaults.removeShutdownTimeout, 30s);
    EXPECT_EQ(defaults.pollInterval, 1000ms);
    EXPECT_EQ(defaults.poolActivationAttempts, 3u);
    EXPECT_EQ(defaults.importChunkSize, 1024u * 1024);
    EXPECT_EQ(defaults.logLevel, "warn");
}

TEST_F(HostDefaultsTest, IniOverridesOnlyNamedKeys) {
    const auto defaults = HostDefaults::loadFromFile(writeConfig(
        "[connection]\n"
        "default_uri = qemu:///session\n"
        "[domain]\n"
        "nvram_dir = /srv/nvram\n"
        "mac_prefix = 52:54:01\n"
        "[timeouts]\n"
        "power_shutdown = 5\n"
        "poll_interval_ms = 250\n"
        "[pool]\n"
        "activation_attempts = 5\n"
        "activation_backoff_ms = 50\n"
        "[volume]\n"
        "import_chunk_size = 65536\n"
        "[log]\n"
        "level = debug\n"));

    EXPECT_EQ(defaults.defaultUri, "qemu:///session");
    EXPECT_EQ(defaults.nvramDir, "/srv/nvram");
    EXPECT_EQ(defaults.macPrefix, "52:54:01");
    EXPECT_EQ(defaults.powerShutdownTimeout, 5s);
    EXPECT_EQ(defaults.removeShutdownTimeout, 30s);
    EXPECT_EQ(defaults.pollInterval, 250ms);
    EXPECT_EQ(defaults.poolActivationAttempts, 5u);
    EXPECT_EQ(defaults.poolActivationBackoff, 50ms);
    EXPECT_EQ(defaults.importChunkSize, 65536u);
    EXPECT_EQ(defaults.logLevel, "debug");
    EXPECT_EQ(defaults.machineType, HostDefaults().machineType);
}

TEST_F(HostDefaultsTest, RejectsBadFiles) {
    const auto missing = scratch / "missing.ini";
    EXPECT_THROW(static_cast<void>(HostDefaults::loadFromFile(missing)), InvalidInputException);

    EXPECT_EQ(loadError("[domain]\ncolour = blue\n").rfind("Invalid configuration file ", 0), 0u);
    EXPECT_NE(loadError("[timeouts]\npoll_interval_ms = 0\n").find("negative or zero interval"), std::string::npos);
    EXPECT_NE(loadError("[timeouts]\nremove_shutdown = -1\n").find("negative or zero interval"), std::string::npos);
    EXPECT_NE(loadError("[pool]\nactivation_attempts = 0\n").find("pool.activation_attempts must be >= 1"),
              std::string::npos);
    EXPECT_NE(loadError("[volume]\nimport_chunk_size = 0\n").find("volume.import_chunk_size must be > 0"),
              std::string::npos);
    EXPECT_FALSE(loadError("[timeouts]\npoll_interval_ms = soon\n").empty());
}

TEST_F(HostDefaultsTest, DerivedPathsAndUris) {
    HostDefaults defaults;
    defaults.nvramDir = "/var/lib/libvirt/qemu/nvram/";
    EXPECT_EQ(defaults.nvramPathFor("web01"), "/var/lib/libvirt/qemu/nvram/web01_VARS.fd");
    EXPECT_EQ(defaults.remoteUriFor("kvm1.example.net"), "qemu+ssh://kvm1.example.net/system");

    defaults.remoteUriTemplate = "qemu+tls://host/system";
    EXPECT_EQ(defaults.remoteUriFor("ignored"), "qemu+tls://host/system");
}

TEST(WaitPolicyTest, TicksAreWholeIntervals) {
    EXPECT_EQ((WaitPolicy{5000ms, 1000ms}.ticks()), 5u);
    EXPECT_EQ((WaitPolicy{2500ms, 1000ms}.ticks()), 2u);
    EXPECT_EQ((WaitPolicy{5000ms, 0ms}.ticks()), 0u);
}
