#include "fakes/FakeHypervisor.hpp"
#include "Virtualization/descriptor/NetworkDescriptor.hpp"
#include "Virtualization/operations/DhcpReservationReconciler.hpp"
#include <gtest/gtest.h>

namespace {

const char* kDhcpNetwork = "<network><name>lab</name><forward mode='nat'/>"
                           "<ip address='10.9.0.1' netmask='255.255.255.0'><dhcp>"
                           "<range start='10.9.0.10' end='10.9.0.254'/>"
                           "<host mac='52:54:00:00:00:01' name='db01' ip='10.9.0.20'/>"
                           "</dhcp></ip></network>";

class DhcpReservationTest : public ::testing::Test {
protected:
    FakeHypervisor hypervisor;
    FakeState& state = hypervisor.fake();
    DhcpReservationReconciler reconciler{hypervisor};

    void SetUp() override { addFakeNetwork(state, "lab", kDhcpNetwork); }

    static DhcpReservationRequest request(const std::string& domain, const std::string& ip, const std::string& mac) {
        return {"lab", domain, ip, mac};
    }

    std::vector<DhcpHost> hosts() { return NetworkDescriptor::fromXML(state.networks["lab"].xml).ip->hosts; }
};

} // namespace

TEST_F(DhcpReservationTest, AddsNewHostEntry) {
    const auto outcome = reconciler.reconcile(request("web01", "10.9.0.30/24", "52:54:00:00:00:02")).unwrap();
    EXPECT_TRUE(outcome.changed);
    EXPECT_EQ(outcome.msg, "DHCP reservation updated");
    EXPECT_EQ(outcome.ipAddress, "10.9.0.30");
    EXPECT_TRUE(state.journaled("network.update lab add-last live"));

    const auto entries = hosts();
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[1].name, "web01");
    EXPECT_EQ(entries[1].ip, "10.9.0.30");
    EXPECT_EQ(entries[0].name, "db01");
}

TEST_F(DhcpReservationTest, ModifiesEntryMatchingMac) {
    const auto outcome = reconciler.reconcile(request("db01", "10.9.0.21", "52:54:00:00:00:01")).unwrap();
    EXPECT_TRUE(outcome.changed);
    EXPECT_TRUE(state.journaled("network.update lab modify live"));

    const auto entries = hosts();
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].ip, "10.9.0.21");
}

TEST_F(DhcpReservationTest, ModifiesEntryMatchingIpOnInactiveNetwork) {
    state.networks["lab"].active = false;

    ASSERT_TRUE(reconciler.reconcile(request("db02", "10.9.0.20", "52:54:00:00:00:09")).isOk());
    EXPECT_TRUE(state.journaled("network.update lab modify config"));
    const auto entries = hosts();
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].name, "db02");
}

TEST_F(DhcpReservationTest, MatchingEntryIsUpToDate) {
    const auto outcome = reconciler.reconcile(request("db01", "10.9.0.20", "52:54:00:00:00:01")).unwrap();
    EXPECT_FALSE(outcome.changed);
    EXPECT_EQ(outcome.msg, "DHCP reservation already up to date");
    EXPECT_TRUE(state.journal.empty());
}

TEST_F(DhcpReservationTest, ConflictingKeysWarnAndUpdateFirstEntry) {
    addFakeNetwork(state, "lab",
                   "<network><name>lab</name><ip address='10.9.0.1' netmask='255.255.255.0'><dhcp>"
                   "<host mac='52:54:00:00:00:01' name='a' ip='10.9.0.20'/>"
                   "<host mac='52:54:00:00:00:02' name='b' ip='10.9.0.21'/>"
                   "</dhcp></ip></network>");

    const auto outcome = reconciler.reconcile(request("b", "10.9.0.20", "52:54:00:00:00:02")).unwrap();
    EXPECT_TRUE(outcome.changed);
    ASSERT_EQ(outcome.warnings.size(), 1u);
    EXPECT_EQ(outcome.warnings[0],
              "MAC 52:54:00:00:00:02 and IP 10.9.0.20 match different reservations; updating the first one");
}

TEST_F(DhcpReservationTest, NetworkWithoutDhcpIsSkipped) {
    addFakeNetwork(state, "plain", "<network><name>plain</name><ip address='10.8.0.1' netmask='255.255.255.0'/></network>");

    auto r = request("web01", "10.8.0.5", "52:54:00:00:00:02");
    r.networkName = "plain";
    const auto outcome = reconciler.reconcile(r).unwrap();
    EXPECT_FALSE(outcome.changed);
    EXPECT_TRUE(outcome.skipped);
    EXPECT_EQ(outcome.msg, "Operation skipped - DHCP not enabled");
    ASSERT_EQ(outcome.warnings.size(), 1u);
    EXPECT_EQ(outcome.warnings[0], "Network plain does not have DHCP enabled - skipping DHCP reservation");
}

TEST_F(DhcpReservationTest, RejectsInvalidInput) {
    EXPECT_EQ(reconciler.reconcile(request("web01", "10.10.0.5", "52:54:00:00:00:02")).error(),
              "IP address 10.10.0.5 is not within network range");
    EXPECT_EQ(reconciler.reconcile(request("web01", "10.9.0.300", "52:54:00:00:00:02")).error(),
              "Invalid IP address: 10.9.0.300");
    EXPECT_EQ(reconciler.reconcile(request("web01", "10.9.0.5", "not-a-mac")).error(),
              "Invalid MAC address format: not-a-mac");

    auto missing = request("web01", "10.9.0.5", "52:54:00:00:00:02");
    missing.networkName = "wan";
    EXPECT_EQ(reconciler.reconcile(missing).error(), "Network wan does not exist");
    EXPECT_TRUE(state.journal.empty());
}

TEST_F(DhcpReservationTest, DryRunUpdatesNothing) {
    const auto outcome = reconciler.reconcile(request("web01", "10.9.0.30", "52:54:00:00:00:02"), {true}).unwrap();
    EXPECT_TRUE(outcome.changed);
    EXPECT_EQ(outcome.msg, "Would update DHCP reservation");
    EXPECT_TRUE(state.journal.empty());
    EXPECT_EQ(hosts().size(), 1u);
}

TEST(DhcpStripPrefixTest, DropsCidrSuffix) {
    EXPECT_EQ(DhcpReservationReconciler::stripPrefix("10.0.0.5/24"), "10.0.0.5");
    EXPECT_EQ(DhcpReservationReconciler::stripPrefix("10.0.0.5"), "10.0.0.5");
}
