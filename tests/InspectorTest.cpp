#include "fakes/FakeHypervisor.hpp"
#include "Virtualization/Utils/VmException.hpp"
#include "Virtualization/inspect/DomainInspector.hpp"
#include "Virtualization/inspect/NetworkInspector.hpp"
#include "Virtualization/inspect/PoolInspector.hpp"
#include "Virtualization/inspect/VolumeInspector.hpp"
#include <gtest/gtest.h>

namespace {

const char* kLabNetwork = R"(
<network>
  <name>lab</name>
  <forward mode='nat'/>
  <ip address='10.9.0.1' netmask='255.255.255.0'>
    <dhcp>
      <range start='10.9.0.10' end='10.9.0.254'/>
      <host mac='52:54:00:AA:BB:CC' name='web01' ip='10.9.0.20'/>
    </dhcp>
  </ip>
</network>)";

class InspectorTest : public ::testing::Test {
protected:
    FakeHypervisor hypervisor;
    FakeState& state = hypervisor.fake();
};

} // namespace

TEST_F(InspectorTest, DomainInfoFiltersNonDiskDevices) {
    addFakeDomain(state, "web01", DomainState::Running,
                  fakeFileDisk("/images/web01.qcow2", "vda") + fakeFileDisk("/isos/boot.iso", "sda", "cdrom") +
                      fakeNetworkInterface("lab", "52:54:00:aa:bb:cc"));

    const auto info = DomainInspector(hypervisor).getInfo("web01");
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->state, DomainState::Running);
    EXPECT_TRUE(info->active);
    EXPECT_EQ(info->vcpus, 2u);
    EXPECT_EQ(info->memoryKiB, 1048576u);
    ASSERT_EQ(info->disks.size(), 1u);
    EXPECT_EQ(info->disks[0].sourceFile, "/images/web01.qcow2");
    ASSERT_EQ(info->interfaces.size(), 1u);
    EXPECT_EQ(info->interfaces[0].sourceNetwork, "lab");
}

TEST_F(InspectorTest, MissingAndUnreadableDomainsAreAbsent) {
    addFakeDomain(state, "broken", DomainState::Running).unreadable = true;
    DomainInspector inspector(hypervisor);

    const auto missing = inspector.lookup("nope");
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().kind, LookupFailure::Kind::NotFound);

    const auto broken = inspector.lookup("broken");
    ASSERT_FALSE(broken.has_value());
    EXPECT_EQ(broken.error().kind, LookupFailure::Kind::Malformed);

    EXPECT_FALSE(inspector.exists("nope"));
    EXPECT_FALSE(inspector.exists("broken"));
}

TEST_F(InspectorTest, DomainPatternSkipsUnreadableEntries) {
    addFakeDomain(state, "web01", DomainState::Shutoff);
    addFakeDomain(state, "web02", DomainState::Running);
    addFakeDomain(state, "db01", DomainState::Running);
    addFakeDomain(state, "web03", DomainState::Running).unreadable = true;

    const auto found = DomainInspector(hypervisor).getByPattern("web*");
    ASSERT_EQ(found.size(), 2u);
    EXPECT_EQ(found[0].name, "web01");
    EXPECT_EQ(found[1].name, "web02");
    EXPECT_TRUE(DomainInspector(hypervisor).getByPattern("cache*").empty());
}

TEST_F(InspectorTest, NetworkInfoAndCidrLookup) {
    addFakeNetwork(state, "lab", kLabNetwork);
    addFakeNetwork(state, "other", "<network><name>other</name><ip address='10.10.0.1' prefix='16'/></network>", false);
    NetworkInspector inspector(hypervisor);

    const auto lab = inspector.getInfo("lab");
    ASSERT_TRUE(lab.has_value());
    EXPECT_TRUE(lab->active);
    EXPECT_EQ(lab->forwardMode, "nat");
    ASSERT_TRUE(lab->ip.has_value());
    EXPECT_EQ(lab->ip->cidr, "10.9.0.0/24");

    // host bits in the query are ignored, containment is not enough
    ASSERT_TRUE(inspector.getByCidr("10.9.0.77/24").has_value());
    EXPECT_EQ(inspector.getByCidr("10.9.0.0/24")->name, "lab");
    EXPECT_EQ(inspector.getByCidr("10.10.0.0/16")->name, "other");
    EXPECT_FALSE(inspector.getByCidr("10.9.0.0/25").has_value());
    EXPECT_FALSE(inspector.getByCidr("10.0.0.0/8").has_value());
    EXPECT_THROW((void)inspector.getByCidr("10.9.0.0"), InvalidInputException);
}

TEST_F(InspectorTest, ReservedIpMatchesMacCaseInsensitively) {
    addFakeNetwork(state, "lab", kLabNetwork);
    addFakeDomain(state, "web01", DomainState::Running, fakeNetworkInterface("lab", "52:54:00:aa:bb:cc"));
    addFakeDomain(state, "web02", DomainState::Running, fakeNetworkInterface("lab", "52:54:00:00:00:01"));
    addFakeDomain(state, "web03", DomainState::Running, fakeNetworkInterface("default", "52:54:00:aa:bb:cc"));
    NetworkInspector inspector(hypervisor);

    EXPECT_EQ(inspector.reservedIpFor("web01", "lab"), std::optional<std::string>("10.9.0.20"));
    EXPECT_FALSE(inspector.reservedIpFor("web02", "lab").has_value());
    EXPECT_FALSE(inspector.reservedIpFor("web03", "lab").has_value());
    EXPECT_FALSE(inspector.reservedIpFor("ghost", "lab").has_value());
    EXPECT_FALSE(inspector.reservedIpFor("web01", "missing").has_value());
}

TEST_F(InspectorTest, PoolInfoAndPattern) {
    addFakePool(state, "images", "/srv/images");
    addFakePool(state, "backup", "/srv/backup", false);
    addFakeVolume(state, "images", "a.raw", 4096);
    PoolInspector inspector(hypervisor);

    const auto images = inspector.getInfo("images");
    ASSERT_TRUE(images.has_value());
    EXPECT_EQ(images->state, PoolState::Running);
    EXPECT_EQ(images->type, "dir");
    EXPECT_EQ(images->targetPath, "/srv/images");
    EXPECT_EQ(images->allocation, 1024u);

    const auto backup = inspector.getInfo("backup");
    ASSERT_TRUE(backup.has_value());
    EXPECT_FALSE(backup->active);

    EXPECT_EQ(inspector.getByPattern("*").size(), 2u);
    EXPECT_FALSE(inspector.exists("nope"));
}

TEST_F(InspectorTest, VolumeLookupRefreshesThePool) {
    addFakePool(state, "images", "/srv/images");
    addFakeVolume(state, "images", "web01.qcow2", 10ULL << 30, "qcow2");
    addFakeVolume(state, "images", "web02.qcow2", 10ULL << 30, "qcow2");
    addFakeVolume(state, "images", "db.raw", 1ULL << 30);
    VolumeInspector inspector(hypervisor);

    const auto info = inspector.getInfo("images/web01.qcow2");
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->pool, "images");
    EXPECT_EQ(info->path, "/srv/images/web01.qcow2");
    EXPECT_EQ(info->format, "qcow2");
    EXPECT_EQ(info->capacity, 10ULL << 30);
    EXPECT_GE(state.pools["images"].refreshCount, 1u);

    EXPECT_EQ(inspector.getByPattern("images/web*").size(), 2u);
    EXPECT_TRUE(inspector.getByPattern("missing/*").empty());
    EXPECT_FALSE(inspector.exists("images", "nope.raw"));
}

TEST_F(InspectorTest, VolumeLookupSurvivesFailingRefreshAndInactivePools) {
    addFakePool(state, "images", "/srv/images").failRefresh = true;
    addFakeVolume(state, "images", "a.raw", 4096);
    addFakePool(state, "cold", "/srv/cold", false);
    addFakeVolume(state, "cold", "b.raw", 4096);
    VolumeInspector inspector(hypervisor);

    EXPECT_TRUE(inspector.exists("images", "a.raw"));
    EXPECT_FALSE(inspector.exists("cold", "b.raw"));
    EXPECT_TRUE(inspector.getByPattern("cold", "*").empty());
}

TEST(VolumeKeyTest, SplitsAtFirstSlash) {
    EXPECT_EQ(VolumeInspector::parseVolumeKey("images/a/b.raw"), (std::pair<std::string, std::string>{"images", "a/b.raw"}));
    EXPECT_THROW((void)VolumeInspector::parseVolumeKey("images"), InvalidInputException);
    EXPECT_THROW((void)VolumeInspector::parseVolumeKey("/a.raw"), InvalidInputException);
    EXPECT_THROW((void)VolumeInspector::parseVolumeKey("images/"), InvalidInputException);
}
