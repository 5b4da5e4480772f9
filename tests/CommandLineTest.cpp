#include "fakes/FakeHypervisor.hpp"
#include "fakes/TempDir.hpp"
#include "API/cli/CommandLine.hpp"
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <sstream>

using nlohmann::json;

namespace {

class CommandLineTest : public ::testing::Test {
protected:
    std::shared_ptr<FakeState> shared = std::make_shared<FakeState>();
    FakeState& state = *shared;
    std::optional<ConnectionParams> lastConnection;
    std::string lastNvramDir;
    bool failConnect{false};
    unsigned sleeps{0};

    CommandLine cli() {
        HypervisorFactory factory = [this](const ConnectionParams& params,
                                           const HostDefaults& defaults) -> Result<std::unique_ptr<IHypervisor>> {
            lastConnection = params;
            lastNvramDir = defaults.nvramDir;
            if (failConnect) return std::string("failed to connect to the hypervisor");
            return std::unique_ptr<IHypervisor>(std::make_unique<FakeHypervisor>(shared));
        };
        return CommandLine(factory, [this](std::chrono::milliseconds) { ++sleeps; });
    }

    int run(const std::vector<std::string>& args) {
        output.str("");
        return cli().run(args, output);
    }

    json body() const { return json::parse(output.str()); }

    std::ostringstream output;
};

} // namespace

TEST_F(CommandLineTest, DomainPresentPrintsDomainInfo) {
    EXPECT_EQ(run({"domain", "--name", "web01", "--vcpu", "2", "--memory", "1024"}), 0);
    const auto result = body();
    EXPECT_TRUE(result["changed"].get<bool>());
    EXPECT_EQ(result["msg"], "Domain created successfully");
    EXPECT_EQ(result["domain_info"]["name"], "web01");
    EXPECT_EQ(result["domain_info"]["state"], "shutoff");
    EXPECT_TRUE(state.domains.contains("web01"));
    ASSERT_TRUE(lastConnection.has_value());
    EXPECT_FALSE(lastConnection->uri.has_value());
}

TEST_F(CommandLineTest, GlobalOptionsReachConnectionAndOptions) {
    addFakeDomain(state, "web01", DomainState::Shutoff);

    EXPECT_EQ(run({"--uri", "qemu+ssh://kvm1/system", "--auth-user", "ops", "--dry-run", "power", "--name", "web01",
                   "--state", "running"}),
              0);
    ASSERT_TRUE(lastConnection.has_value());
    EXPECT_EQ(lastConnection->uri, std::optional<std::string>("qemu+ssh://kvm1/system"));
    EXPECT_EQ(lastConnection->authUser, std::optional<std::string>("ops"));

    const auto result = body();
    EXPECT_EQ(result["msg"], "Would start domain web01");
    EXPECT_EQ(state.domains["web01"].state, DomainState::Shutoff);
}

TEST_F(CommandLineTest, PowerStartReportsStatus) {
    addFakeDomain(state, "web01", DomainState::Shutoff);

    EXPECT_EQ(run({"power", "--name", "web01", "--state", "running"}), 0);
    const auto result = body();
    EXPECT_EQ(result["status"], "applied");
    EXPECT_EQ(result["msg"], "Domain web01 started");
    EXPECT_EQ(state.domains["web01"].state, DomainState::Running);
}

TEST_F(CommandLineTest, FailedOperationExitsWithOne) {
    EXPECT_EQ(run({"power", "--name", "ghost", "--state", "running"}), 1);
    const auto result = body();
    EXPECT_TRUE(result["failed"].get<bool>());
    EXPECT_FALSE(result["changed"].get<bool>());
    EXPECT_EQ(result["msg"], "Domain ghost does not exist");
    EXPECT_EQ(result["error"], result["msg"]);
}

TEST_F(CommandLineTest, BadArgumentsNeverConnect) {
    EXPECT_EQ(run({"power", "--name", "web01", "--state", "sideways"}), 2);
    EXPECT_EQ(body()["msg"], "Invalid power state: sideways");

    EXPECT_EQ(run({"domain", "--vcpu", "2"}), 2);
    EXPECT_TRUE(body()["failed"].get<bool>());

    EXPECT_EQ(run({"frobnicate"}), 2);
    EXPECT_EQ(body()["msg"], "Unknown command: frobnicate");

    EXPECT_EQ(run({}), 2);
    EXPECT_EQ(run({"--log-level", "chatty", "refresh"}), 2);
    EXPECT_EQ(body()["msg"], "Invalid log level: chatty");

    EXPECT_EQ(run({"network", "--name", "lab", "--state", "running"}), 2);
    EXPECT_EQ(run({"volume", "--pool", "p", "--name", "v", "--capacity", "ten"}), 2);
    EXPECT_EQ(run({"info", "--kind", "pool", "--cidr", "10.0.0.0/24"}), 2);

    EXPECT_FALSE(lastConnection.has_value());
}

TEST_F(CommandLineTest, ConnectionFailureExitsWithThree) {
    failConnect = true;
    EXPECT_EQ(run({"refresh"}), 3);
    EXPECT_EQ(body()["msg"], "failed to connect to the hypervisor");
}

TEST_F(CommandLineTest, ConfigFileOverridesDefaults) {
    TempDir scratch;
    const auto config = scratch / "virtrecon.ini";
    std::ofstream(config) << "[domain]\nnvram_dir = /srv/nvram\n";

    EXPECT_EQ(run({"--config", config, "domain", "--name", "web01"}), 0);
    EXPECT_EQ(lastNvramDir, "/srv/nvram");
    EXPECT_NE(state.domains["web01"].xml.find("/srv/nvram/web01_VARS.fd"), std::string::npos);

    EXPECT_EQ(run({"--config", scratch / "missing.ini", "domain", "--name", "web01"}), 2);
}

TEST_F(CommandLineTest, NetworkCommandBuildsSpec) {
    EXPECT_EQ(run({"network", "--name", "lab", "--cidr", "10.9.0.0/24", "--dns-host", "10.9.0.5=db,db.lab",
                   "--dns-forwarder", "1.1.1.1"}),
              0);
    const auto result = body();
    EXPECT_EQ(result["msg"], "Network lab is active");
    EXPECT_EQ(result["network_info"]["name"], "lab");
    EXPECT_TRUE(state.networks["lab"].active);
    EXPECT_NE(state.networks["lab"].xml.find("db.lab"), std::string::npos);
}

TEST_F(CommandLineTest, PoolRecursivePermissionsAndDryRunRefresh) {
    TempDir scratch;
    const auto target = scratch / "images";
    std::filesystem::create_directory(target);
    std::ofstream(target + "/base.qcow2") << "qcow";
    std::filesystem::permissions(target + "/base.qcow2", std::filesystem::perms::owner_read,
                                 std::filesystem::perm_options::replace);

    EXPECT_EQ(run({"pool", "--name", "images", "--type", "dir", "--target-path", target, "--mode", "0750",
                   "--recursive-permissions"}),
              0);
    const auto mode = std::filesystem::status(target + "/base.qcow2").permissions();
    EXPECT_EQ(mode, static_cast<std::filesystem::perms>(0750));

    state.journal.clear();
    EXPECT_EQ(run({"--dry-run", "refresh"}), 0);
    EXPECT_EQ(body()["msg"], "Would refresh pools: images");
    EXPECT_EQ(state.pools["images"].refreshCount, 0u);
    EXPECT_TRUE(state.journal.empty());
}

TEST_F(CommandLineTest, VolumeAndAttachCommands) {
    addFakePool(state, "images", "/srv/images");
    addFakeDomain(state, "web01", DomainState::Running);

    EXPECT_EQ(run({"volume", "--pool", "images", "--name", "data.raw", "--capacity", "1G"}), 0);
    EXPECT_EQ(body()["volume_info"]["capacity"], 1073741824u);

    EXPECT_EQ(run({"attach-volume", "--domain", "web01", "--pool", "images", "--volume", "data.raw"}), 0);
    const auto attached = body();
    ASSERT_EQ(attached["attached_volumes"].size(), 1u);
    EXPECT_EQ(attached["attached_volumes"][0]["target"], "vda");
    EXPECT_EQ(attached["domain_state"], "running");
}

TEST_F(CommandLineTest, InfoAndReservedIp) {
    addFakeNetwork(state, "lab",
                   "<network><name>lab</name><ip address='10.9.0.1' netmask='255.255.255.0'><dhcp>"
                   "<host mac='52:54:00:00:00:01' name='web01' ip='10.9.0.20'/></dhcp></ip></network>");
    addFakeDomain(state, "web01", DomainState::Running, fakeNetworkInterface("lab", "52:54:00:00:00:01"));

    EXPECT_EQ(run({"info", "--kind", "domain", "--pattern", "web*"}), 0);
    const auto info = body();
    EXPECT_FALSE(info["changed"].get<bool>());
    ASSERT_EQ(info["domains"].size(), 1u);

    EXPECT_EQ(run({"reserved-ip", "--pair", "web01/lab", "--pair", "ghost/lab"}), 0);
    const auto reserved = body();
    ASSERT_EQ(reserved["reserved_ips"].size(), 2u);
    EXPECT_EQ(reserved["reserved_ips"][0]["ip"], "10.9.0.20");
    EXPECT_TRUE(reserved["reserved_ips"][1]["ip"].is_null());

    EXPECT_EQ(run({"reserved-ip", "--pair", "web01"}), 2);
}

TEST_F(CommandLineTest, HelpListsCommands) {
    EXPECT_EQ(run({"--help"}), 0);
    for (const auto& name : CommandLine::commands()) {
        EXPECT_NE(output.str().find("  " + name), std::string::npos) << name;
    }

    EXPECT_EQ(run({"clone", "--help"}), 0);
    EXPECT_NE(output.str().find("--target-pool"), std::string::npos);
    EXPECT_FALSE(lastConnection.has_value());
}
