#include "fakes/FakeHypervisor.hpp"
#include "Virtualization/descriptor/DomainDescriptor.hpp"
#include "Virtualization/operations/DomainCloner.hpp"
#include <gtest/gtest.h>

namespace {

constexpr std::uint64_t GiB = 1024ULL * 1024 * 1024;

class DomainClonerTest : public ::testing::Test {
protected:
    FakeHypervisor hypervisor;
    FakeState& state = hypervisor.fake();
    DomainCloner cloner{hypervisor};

    void SetUp() override {
        addFakePool(state, "images", "/srv/images");
        addFakePool(state, "fast", "/srv/fast");
    }

    void seedSource(const std::string& format = "raw") {
        addFakeVolume(state, "images", "web01.qcow2", 10 * GiB, format).content = "root-disk";
        addFakeDomain(state, "web01", DomainState::Shutoff,
                      fakeFileDisk("/srv/images/web01.qcow2", "vda") +
                          fakeFileDisk("/srv/iso/install.iso", "sda", "cdrom") +
                          fakeNetworkInterface("default", "52:54:00:aa:bb:cc"));
    }

    static CloneRequest request(bool linked = false) {
        CloneRequest r;
        r.sourceName = "web01";
        r.cloneName = "web02";
        r.linked = linked;
        return r;
    }
};

} // namespace

TEST_F(DomainClonerTest, FullCloneCopiesDisksAndStartsClone) {
    seedSource();

    auto result = cloner.clone(request());
    ASSERT_TRUE(result.isOk()) << result.error();
    const auto outcome = result.unwrap();
    EXPECT_TRUE(outcome.changed);
    EXPECT_EQ(outcome.msg, "Successfully created full clone web02");
    EXPECT_FALSE(outcome.uuid.empty());

    ASSERT_EQ(outcome.storage.size(), 1u);
    EXPECT_EQ(outcome.storage[0].name, "web02.qcow2");
    EXPECT_EQ(outcome.storage[0].path, "/srv/images/web02.qcow2");
    EXPECT_EQ(outcome.storage[0].type, "full");
    EXPECT_EQ(outcome.storage[0].pool, "images");
    EXPECT_TRUE(state.journaled("volume.clone images/web02.qcow2 prealloc"));
    EXPECT_EQ(state.pools["images"].volumes["web02.qcow2"].content, "root-disk");

    ASSERT_TRUE(state.domains.contains("web02"));
    EXPECT_EQ(state.domains["web02"].state, DomainState::Running);
    const auto clone = DomainDescriptor::fromXML(state.domains["web02"].xml);
    ASSERT_EQ(clone.disks.size(), 2u);
    EXPECT_EQ(clone.disks[0].sourcePath(), "/srv/images/web02.qcow2");
    EXPECT_EQ(clone.disks[1].sourcePath(), "/srv/iso/install.iso");
    ASSERT_EQ(clone.interfaces.size(), 1u);
    EXPECT_NE(clone.interfaces[0].mac, "52:54:00:aa:bb:cc");
    EXPECT_NE(clone.uuid, DomainDescriptor::fromXML(state.domains["web01"].xml).uuid);
}

TEST_F(DomainClonerTest, FullCloneIntoTargetPool) {
    seedSource();
    auto r = request();
    r.targetPool = "fast";
    r.start = false;

    const auto outcome = cloner.clone(r).unwrap();
    EXPECT_EQ(outcome.msg, "Successfully created full clone web02 in pool fast");
    ASSERT_EQ(outcome.storage.size(), 1u);
    EXPECT_EQ(outcome.storage[0].path, "/srv/fast/web02.qcow2");
    EXPECT_EQ(state.domains["web02"].state, DomainState::Shutoff);
    EXPECT_EQ(state.countJournal("domain.create"), 0u);
}

TEST_F(DomainClonerTest, PoolVolumeDisksAreClonedNotShared) {
    addFakeVolume(state, "images", "web01.qcow2", 10 * GiB);
    addFakeVolume(state, "images", "web01-data.raw", 20 * GiB).content = "data-disk";
    addFakeDomain(state, "web01", DomainState::Shutoff,
                  fakeFileDisk("/srv/images/web01.qcow2", "vda") +
                      "<disk type='volume' device='disk'><driver name='qemu' type='raw'/>"
                      "<source pool='images' volume='web01-data.raw'/><target dev='vdb' bus='virtio'/></disk>");
    auto r = request();
    r.start = false;

    auto result = cloner.clone(r);
    ASSERT_TRUE(result.isOk()) << result.error();
    const auto outcome = result.unwrap();
    EXPECT_TRUE(outcome.warnings.empty());
    ASSERT_EQ(outcome.storage.size(), 2u);
    EXPECT_EQ(outcome.storage[1].name, "web02-data.raw");
    EXPECT_EQ(outcome.storage[1].path, "/srv/images/web02-data.raw");
    EXPECT_TRUE(state.journaled("volume.clone images/web02-data.raw prealloc"));
    EXPECT_EQ(state.pools["images"].volumes["web02-data.raw"].content, "data-disk");

    const auto clone = DomainDescriptor::fromXML(state.domains["web02"].xml);
    ASSERT_EQ(clone.disks.size(), 2u);
    EXPECT_EQ(clone.disks[1].sourcePool, "images");
    EXPECT_EQ(clone.disks[1].sourceVolume, "web02-data.raw");
    const auto original = DomainDescriptor::fromXML(state.domains["web01"].xml);
    EXPECT_EQ(original.disks[1].sourceVolume, "web01-data.raw");
}

TEST_F(DomainClonerTest, PoolVolumeDiskFollowsTargetPool) {
    addFakeVolume(state, "images", "web01-data.raw", 20 * GiB);
    addFakeDomain(state, "web01", DomainState::Shutoff,
                  "<disk type='volume' device='disk'><driver name='qemu' type='raw'/>"
                  "<source pool='images' volume='web01-data.raw'/><target dev='vda' bus='virtio'/></disk>");
    auto r = request();
    r.targetPool = "fast";
    r.start = false;

    const auto outcome = cloner.clone(r).unwrap();
    ASSERT_EQ(outcome.storage.size(), 1u);
    EXPECT_EQ(outcome.storage[0].pool, "fast");
    const auto clone = DomainDescriptor::fromXML(state.domains["web02"].xml);
    ASSERT_EQ(clone.disks.size(), 1u);
    EXPECT_EQ(clone.disks[0].sourcePool, "fast");
    EXPECT_EQ(clone.disks[0].sourceVolume, "web02-data.raw");
}

TEST_F(DomainClonerTest, LinkedCloneOfQcow2UsesBackingStore) {
    seedSource("qcow2");

    const auto outcome = cloner.clone(request(true)).unwrap();
    EXPECT_EQ(outcome.msg, "Successfully created linked clone web02");
    ASSERT_EQ(outcome.storage.size(), 1u);
    EXPECT_EQ(outcome.storage[0].type, "cow");
    EXPECT_TRUE(outcome.warnings.empty());
    EXPECT_TRUE(state.journaled("volume.create images/web02.qcow2 prealloc"));
    EXPECT_EQ(state.pools["images"].volumes["web02.qcow2"].backingPath, "/srv/images/web01.qcow2");
}

TEST_F(DomainClonerTest, LinkedCloneOfRawFallsBackToFullCopy) {
    seedSource("raw");

    const auto outcome = cloner.clone(request(true)).unwrap();
    ASSERT_EQ(outcome.storage.size(), 1u);
    EXPECT_EQ(outcome.storage[0].type, "full");
    ASSERT_EQ(outcome.warnings.size(), 1u);
    EXPECT_EQ(outcome.warnings[0], "Volume web01.qcow2 is raw, making a full copy instead of a linked clone");
}

TEST_F(DomainClonerTest, ExistingCloneIsNoChange) {
    seedSource();
    addFakeDomain(state, "web02", DomainState::Shutoff);

    const auto outcome = cloner.clone(request()).unwrap();
    EXPECT_FALSE(outcome.changed);
    EXPECT_EQ(outcome.msg, "Domain clone 'web02' already exists");
    EXPECT_FALSE(outcome.uuid.empty());
    EXPECT_EQ(state.volumeCreates, 0);
}

TEST_F(DomainClonerTest, RejectsBadRequests) {
    seedSource();

    auto noName = request();
    noName.cloneName.clear();
    EXPECT_EQ(cloner.clone(noName).error(), "Source and clone names are required");

    auto ghost = request();
    ghost.sourceName = "ghost";
    EXPECT_EQ(cloner.clone(ghost).error(), "Source domain ghost not found");

    auto missingPool = request();
    missingPool.targetPool = "nope";
    EXPECT_EQ(cloner.clone(missingPool).error(), "Target storage pool nope not found");

    state.pools["fast"].active = false;
    auto inactivePool = request();
    inactivePool.targetPool = "fast";
    EXPECT_EQ(cloner.clone(inactivePool).error(), "Target storage pool fast is not active");

    state.pools["fast"].active = true;
    auto linkedElsewhere = request(true);
    linkedElsewhere.targetPool = "fast";
    EXPECT_EQ(cloner.clone(linkedElsewhere).error(),
              "Linked clones must be in the same storage pool as the source volume");

    EXPECT_FALSE(state.domains.contains("web02"));
}

TEST_F(DomainClonerTest, DryRunCopiesNothing) {
    seedSource();
    auto r = request(true);

    const auto outcome = cloner.clone(r, {true}).unwrap();
    EXPECT_TRUE(outcome.changed);
    EXPECT_EQ(outcome.msg, "Would create linked clone web02");
    EXPECT_TRUE(state.journal.empty());
    EXPECT_FALSE(state.domains.contains("web02"));
}

TEST_F(DomainClonerTest, FailedVolumeCopyRollsBackEarlierCopies) {
    addFakeVolume(state, "images", "web01.qcow2", GiB);
    addFakeVolume(state, "images", "web01-data.qcow2", GiB);
    addFakeDomain(state, "web01", DomainState::Shutoff,
                  fakeFileDisk("/srv/images/web01.qcow2", "vda") +
                      fakeFileDisk("/srv/images/web01-data.qcow2", "vdb"));
    state.failVolumeCreateAt = 1;

    const auto result = cloner.clone(request());
    ASSERT_TRUE(result.isErr());
    EXPECT_EQ(result.error(), "Failed to clone volume: internal error: storage volume creation failed");
    EXPECT_FALSE(state.pools["images"].volumes.contains("web02.qcow2"));
    EXPECT_FALSE(state.domains.contains("web02"));
    EXPECT_EQ(state.countJournal("domain.define"), 0u);
}

TEST_F(DomainClonerTest, FailedRollbackIsPartialFailure) {
    addFakeVolume(state, "images", "web01.qcow2", GiB);
    addFakeVolume(state, "images", "web01-data.qcow2", GiB);
    addFakeDomain(state, "web01", DomainState::Shutoff,
                  fakeFileDisk("/srv/images/web01.qcow2", "vda") +
                      fakeFileDisk("/srv/images/web01-data.qcow2", "vdb"));
    state.failVolumeCreateAt = 1;
    state.failVolumeRemove = true;

    const auto result = cloner.clone(request());
    ASSERT_TRUE(result.isErr());
    EXPECT_NE(result.error().find("rollback incomplete: /srv/images/web02.qcow2"), std::string::npos);
    EXPECT_TRUE(state.pools["images"].volumes.contains("web02.qcow2"));
}

TEST_F(DomainClonerTest, FailedStartKeepsTheClone) {
    seedSource();
    state.failDomainStart = true;

    const auto outcome = cloner.clone(request()).unwrap();
    EXPECT_TRUE(outcome.changed);
    EXPECT_EQ(outcome.msg,
              "Domain cloned but failed to set power state: internal error: process exited while connecting to monitor");
    ASSERT_EQ(outcome.warnings.size(), 1u);
    EXPECT_TRUE(state.domains.contains("web02"));
    EXPECT_TRUE(state.pools["images"].volumes.contains("web02.qcow2"));
}

TEST(CloneVolumeNameTest, ReplacesSourceNameInBasename) {
    EXPECT_EQ(DomainCloner::cloneVolumeName("/srv/images/web01.qcow2", "web01", "web02"), "web02.qcow2");
    EXPECT_EQ(DomainCloner::cloneVolumeName("/srv/images/web01-web01-data.img", "web01", "db"), "db-db-data.img");
    EXPECT_EQ(DomainCloner::cloneVolumeName("/srv/images/disk0.img", "web01", "web02"), "disk0.img");
    EXPECT_EQ(DomainCloner::cloneVolumeName("plain.raw", "", "x"), "plain.raw");
}
