#include "Virtualization/Utils/VmException.hpp"
#include "Virtualization/descriptor/DomainDescriptor.hpp"
#include "Virtualization/descriptor/NetworkDescriptor.hpp"
#include "Virtualization/descriptor/PoolDescriptor.hpp"
#include "Virtualization/descriptor/VolumeDescriptor.hpp"
#include "Utils/MacAddress.hpp"
#include <gtest/gtest.h>

namespace {

const char* kDomainXml = R"(
<domain type='kvm'>
  <name>web01</name>
  <uuid>6f1c1c36-6d84-4bb5-9d5c-62e7f5a1d001</uuid>
  <memory unit='MiB'>2048</memory>
  <vcpu>4</vcpu>
  <os>
    <type arch='x86_64' machine='pc-q35-7.2'>hvm</type>
    <nvram>/var/lib/libvirt/qemu/nvram/web01_VARS.fd</nvram>
  </os>
  <devices>
    <disk type='file' device='disk'>
      <driver name='qemu' type='qcow2'/>
      <source file='/var/lib/libvirt/images/web01.qcow2'/>
      <target dev='vda' bus='virtio'/>
    </disk>
    <disk type='file' device='cdrom'>
      <source file='/isos/install.iso'/>
      <target dev='sda' bus='sata'/>
      <readonly/>
    </disk>
    <disk type='volume' device='disk'>
      <source pool='data' volume='web01-data.raw'/>
      <target dev='vdb' bus='virtio'/>
    </disk>
    <controller type='sata' index='0'/>
    <controller type='usb' index='0'/>
    <interface type='network'>
      <mac address='52:54:00:11:22:33'/>
      <source network='default'/>
      <model type='virtio'/>
    </interface>
  </devices>
</domain>)";

const char* kNetworkXml = R"(
<network>
  <name>lab</name>
  <uuid>a9d4b2a0-2b8e-4d0b-9a55-3f0c3ad1e002</uuid>
  <forward mode='route'/>
  <bridge name='virbr9' stp='off' delay='2'/>
  <mtu size='9000'/>
  <domain name='lab.local'/>
  <dns>
    <forwarder addr='1.1.1.1'/>
    <host ip='10.9.0.5'>
      <hostname>db</hostname>
      <hostname>db.lab.local</hostname>
    </host>
  </dns>
  <ip address='10.9.0.1' netmask='255.255.255.0'>
    <dhcp>
      <range start='10.9.0.10' end='10.9.0.254'/>
      <host mac='52:54:00:aa:bb:cc' name='db' ip='10.9.0.5'/>
    </dhcp>
  </ip>
</network>)";

} // namespace

TEST(DomainDescriptorTest, ParsesDevicesAndMemory) {
    const auto parsed = DomainDescriptor::tryParse(kDomainXml);
    ASSERT_TRUE(parsed.has_value()) << parsed.error();

    const auto& domain = *parsed;
    EXPECT_EQ(domain.name, "web01");
    EXPECT_EQ(domain.uuid, "6f1c1c36-6d84-4bb5-9d5c-62e7f5a1d001");
    EXPECT_EQ(domain.vcpus, 4u);
    EXPECT_EQ(domain.memory.maximumKiB, 2048ULL * 1024);
    EXPECT_EQ(domain.memory.currentKiB, 2048ULL * 1024);

    ASSERT_EQ(domain.disks.size(), 3u);
    EXPECT_EQ(domain.disks[0].sourcePath(), "/var/lib/libvirt/images/web01.qcow2");
    EXPECT_EQ(domain.disks[0].driver.type, "qcow2");
    EXPECT_EQ(domain.disks[1].device, "cdrom");
    EXPECT_TRUE(domain.disks[1].readOnly);
    EXPECT_EQ(domain.disks[2].sourcePool, "data");
    EXPECT_EQ(domain.disks[2].sourceVolume, "web01-data.raw");
    EXPECT_EQ(domain.disks[2].targetDev, "vdb");

    ASSERT_EQ(domain.interfaces.size(), 1u);
    EXPECT_EQ(domain.interfaces[0].sourceNetwork, "default");
    EXPECT_EQ(domain.interfaces[0].mac, "52:54:00:11:22:33");
    EXPECT_TRUE(domain.hasController("sata"));
    EXPECT_FALSE(domain.hasController("scsi"));
}

TEST(DomainDescriptorTest, MalformedInputYieldsReason) {
    EXPECT_FALSE(DomainDescriptor::tryParse("<domain><name>x</domain>").has_value());
    EXPECT_FALSE(DomainDescriptor::tryParse("<network/>").has_value());
    EXPECT_TRUE(DomainDescriptor::fromXML("garbage").name.empty());
}

TEST(DomainDescriptorTest, CloneRewritesIdentityDisksAndMacs) {
    const std::map<std::string, std::string> paths{
        {"/var/lib/libvirt/images/web01.qcow2", "/var/lib/libvirt/images/web02.qcow2"}};
    const auto cloned = DomainDescriptor::fromXML(cloneDomainDescriptor(kDomainXml, "web02", paths));

    EXPECT_EQ(cloned.name, "web02");
    EXPECT_FALSE(cloned.uuid.empty());
    EXPECT_NE(cloned.uuid, "6f1c1c36-6d84-4bb5-9d5c-62e7f5a1d001");

    ASSERT_EQ(cloned.disks.size(), 3u);
    EXPECT_EQ(cloned.disks[0].sourceFile, "/var/lib/libvirt/images/web02.qcow2");
    // cdroms keep pointing at the original
    EXPECT_EQ(cloned.disks[1].sourceFile, "/isos/install.iso");

    ASSERT_EQ(cloned.interfaces.size(), 1u);
    EXPECT_NE(cloned.interfaces[0].mac, "52:54:00:11:22:33");
    EXPECT_TRUE(MacAddress::isValid(cloned.interfaces[0].mac));
    EXPECT_EQ(cloned.interfaces[0].mac.rfind("52:54:00:", 0), 0u);
}

TEST(DomainDescriptorTest, CloneRenamesNvramFile) {
    const auto xml = cloneDomainDescriptor(kDomainXml, "web02", {});
    EXPECT_NE(xml.find("/var/lib/libvirt/qemu/nvram/web02_VARS.fd"), std::string::npos);
    EXPECT_EQ(xml.find("web01_VARS.fd"), std::string::npos);
}

TEST(DomainDescriptorTest, CloneRejectsUnusableSource) {
    EXPECT_THROW((void)cloneDomainDescriptor("<domain>", "x", {}), InvalidInputException);
    EXPECT_THROW((void)cloneDomainDescriptor("<domain/>", "x", {}), InvalidInputException);
}

TEST(NetworkDescriptorTest, ParsesEverySection) {
    const auto parsed = NetworkDescriptor::tryParse(kNetworkXml);
    ASSERT_TRUE(parsed.has_value()) << parsed.error();

    const auto& net = *parsed;
    EXPECT_EQ(net.name, "lab");
    EXPECT_EQ(net.forwardMode, "route");
    ASSERT_TRUE(net.bridge.has_value());
    EXPECT_EQ(net.bridge->name, "virbr9");
    EXPECT_FALSE(net.bridge->stp);
    EXPECT_EQ(net.bridge->delay, 2u);
    EXPECT_EQ(net.mtu, 9000u);
    EXPECT_EQ(net.domainName, "lab.local");

    ASSERT_TRUE(net.ip.has_value());
    EXPECT_EQ(net.ip->cidr, "10.9.0.0/24");
    EXPECT_TRUE(net.ip->hasDhcp);
    EXPECT_EQ(net.ip->dhcpStart, "10.9.0.10");
    EXPECT_EQ(net.ip->dhcpEnd, "10.9.0.254");
    ASSERT_EQ(net.ip->hosts.size(), 1u);
    EXPECT_EQ(net.ip->hosts[0], (DhcpHost{"52:54:00:aa:bb:cc", "10.9.0.5", "db"}));

    EXPECT_TRUE(net.dns.enabled);
    EXPECT_EQ(net.dns.forwarders, std::vector<std::string>{"1.1.1.1"});
    ASSERT_EQ(net.dns.hosts.size(), 1u);
    EXPECT_EQ(net.dns.hosts[0].hostnames, (std::vector<std::string>{"db", "db.lab.local"}));
}

TEST(NetworkDescriptorTest, PrefixFormAndBareForward) {
    const auto net = NetworkDescriptor::fromXML(
        "<network><name>n</name><forward/><ip address='192.168.50.1' prefix='24'/></network>");
    EXPECT_EQ(net.forwardMode, "nat");
    ASSERT_TRUE(net.ip.has_value());
    EXPECT_EQ(net.ip->cidr, "192.168.50.0/24");
    EXPECT_EQ(net.ip->netmask, "255.255.255.0");
    EXPECT_FALSE(net.ip->hasDhcp);
}

TEST(NetworkDescriptorTest, IsolatedNetworkHasNoForwardMode) {
    const auto net = NetworkDescriptor::fromXML("<network><name>iso</name><dns enable='no'/></network>");
    EXPECT_TRUE(net.forwardMode.empty());
    EXPECT_FALSE(net.ip.has_value());
    EXPECT_FALSE(net.dns.enabled);
}

TEST(PoolDescriptorTest, ParsesTargetAndSource) {
    const auto pool = PoolDescriptor::fromXML(R"(
<pool type='netfs'>
  <name>shared</name>
  <uuid>0f0e0d0c-0b0a-0908-0706-050403020100</uuid>
  <source>
    <host name='nas.local'/>
    <dir path='/export/vms'/>
    <format type='nfs'/>
  </source>
  <target>
    <path>/mnt/shared</path>
    <permissions><mode>0775</mode><owner>107</owner><group>107</group></permissions>
  </target>
</pool>)");
    EXPECT_EQ(pool.name, "shared");
    EXPECT_EQ(pool.type, "netfs");
    EXPECT_EQ(pool.targetPath, "/mnt/shared");
    EXPECT_EQ(pool.permissions.mode, "0775");
    EXPECT_EQ(pool.permissions.owner, "107");
    EXPECT_EQ(pool.source.host, "nas.local");
    EXPECT_EQ(pool.source.dir, "/export/vms");
    EXPECT_EQ(pool.source.format, "nfs");
    EXPECT_TRUE(pool.source.device.empty());
}

TEST(VolumeDescriptorTest, ConvertsUnitsToBytes) {
    const auto volume = VolumeDescriptor::fromXML(R"(
<volume>
  <name>disk.qcow2</name>
  <key>/pool/disk.qcow2</key>
  <capacity unit='G'>10</capacity>
  <allocation unit='KiB'>4</allocation>
  <target><path>/pool/disk.qcow2</path><format type='qcow2'/></target>
  <backingStore><path>/pool/base.qcow2</path></backingStore>
</volume>)");
    EXPECT_EQ(volume.capacity, 10ULL * 1024 * 1024 * 1024);
    EXPECT_EQ(volume.allocation, 4096u);
    EXPECT_EQ(volume.format, "qcow2");
    EXPECT_EQ(volume.backingPath, "/pool/base.qcow2");
}

TEST(VolumeDescriptorTest, CloneMovesPathAndAddsBackingStore) {
    const std::string source = "<volume><name>base.qcow2</name><key>k</key><capacity>100</capacity>"
                               "<target><path>/a/base.qcow2</path><format type='qcow2'/></target></volume>";

    const auto full = VolumeDescriptor::fromXML(cloneVolumeDescriptor(source, "copy.qcow2", "/b/"));
    EXPECT_EQ(full.name, "copy.qcow2");
    EXPECT_EQ(full.path, "/b/copy.qcow2");
    EXPECT_NE(full.key, "k");
    EXPECT_EQ(full.capacity, 100u);
    EXPECT_TRUE(full.backingPath.empty());

    const auto linked =
        VolumeDescriptor::fromXML(cloneVolumeDescriptor(source, "cow.qcow2", "/a", std::string("/a/base.qcow2")));
    EXPECT_EQ(linked.path, "/a/cow.qcow2");
    EXPECT_EQ(linked.backingPath, "/a/base.qcow2");
}
