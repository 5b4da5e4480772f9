#include "Virtualization/vm/VirtualMachine.hpp"
#include "Virtualization/Utils/LibvirtError.hpp"
#include "Virtualization/Utils/VmException.hpp"
#include <cstdlib>
#include <libvirt/virterror.h>

VirtualMachine::VirtualMachine(std::shared_ptr<HypervisorConnector> conn, virDomainPtr dom)
    : connector(std::move(conn)), domain(dom) {
    if (!domain) throw VmException("VirtualMachine: null domain handle");
    const char* n = virDomainGetName(domain);
    domainName = n ? n : "";
}

VirtualMachine::~VirtualMachine() {
    if (domain) virDomainFree(domain);
}

std::string VirtualMachine::name() const { return domainName; }

std::string VirtualMachine::uuid() const {
    char buf[VIR_UUID_STRING_BUFLEN];
    checkLibvirtError(virDomainGetUUIDString(domain, buf), "uuid " + domainName);
    return buf;
}

int VirtualMachine::id() const {
    const unsigned int value = virDomainGetID(domain);
    return value == static_cast<unsigned int>(-1) ? -1 : static_cast<int>(value);
}

DomainRuntimeInfo VirtualMachine::info() const {
    virDomainInfo raw;
    checkLibvirtError(virDomainGetInfo(domain, &raw), "info " + domainName);
    DomainRuntimeInfo out;
    out.state = mapLibvirtState(raw.state);
    out.maxMemoryKiB = raw.maxMem;
    out.memoryKiB = raw.memory;
    out.vcpus = raw.nrVirtCpu;
    out.cpuTime = raw.cpuTime;
    return out;
}

DomainState VirtualMachine::state() const {
    int s = 0;
    checkLibvirtError(virDomainGetState(domain, &s, nullptr, 0), "state " + domainName);
    return mapLibvirtState(s);
}

bool VirtualMachine::isActive() const {
    const int rc = virDomainIsActive(domain);
    checkLibvirtError(rc, "isActive " + domainName);
    return rc == 1;
}

bool VirtualMachine::isPersistent() const {
    const int rc = virDomainIsPersistent(domain);
    checkLibvirtError(rc, "isPersistent " + domainName);
    return rc == 1;
}

bool VirtualMachine::autostart() const {
    int value = 0;
    checkLibvirtError(virDomainGetAutostart(domain, &value), "autostart " + domainName);
    return value != 0;
}

std::string VirtualMachine::xmlDesc() const {
    char* xml = virDomainGetXMLDesc(domain, 0);
    if (!xml) throwLastLibvirtError("xmlDesc " + domainName);
    std::string out(xml);
    std::free(xml);
    return out;
}

void VirtualMachine::create() { checkLibvirtError(virDomainCreate(domain), "start " + domainName); }
void VirtualMachine::shutdown() { checkLibvirtError(virDomainShutdown(domain), "shutdown " + domainName); }
void VirtualMachine::destroy() { checkLibvirtError(virDomainDestroy(domain), "destroy " + domainName); }
void VirtualMachine::reboot() { checkLibvirtError(virDomainReboot(domain, 0), "reboot " + domainName); }
void VirtualMachine::reset() { checkLibvirtError(virDomainReset(domain, 0), "reset " + domainName); }

bool VirtualMachine::hasManagedSaveImage() const {
    const int rc = virDomainHasManagedSaveImage(domain, 0);
    checkLibvirtError(rc, "managed save check " + domainName);
    return rc == 1;
}

void VirtualMachine::managedSaveRemove() {
    checkLibvirtError(virDomainManagedSaveRemove(domain, 0), "managed save remove " + domainName);
}

void VirtualMachine::undefine(UndefineMode mode) {
    if (mode == UndefineMode::Basic) {
        checkLibvirtError(virDomainUndefine(domain), "undefine " + domainName);
        return;
    }
    const unsigned int flags = VIR_DOMAIN_UNDEFINE_MANAGED_SAVE
                             | VIR_DOMAIN_UNDEFINE_SNAPSHOTS_METADATA
                             | VIR_DOMAIN_UNDEFINE_NVRAM
                             | VIR_DOMAIN_UNDEFINE_CHECKPOINTS_METADATA;
    if (virDomainUndefineFlags(domain, flags) < 0) {
        if (lastLibvirtErrorIs(VIR_ERR_NO_SUPPORT) || lastLibvirtErrorIs(VIR_ERR_INVALID_ARG)) {
            virErrorPtr err = virGetLastError();
            throw UnsupportedOperationException("undefine " + domainName + ": "
                                                + (err && err->message ? err->message : "unsupported flags"));
        }
        throwLastLibvirtError("undefine " + domainName);
    }
}

void VirtualMachine::attachDevice(const std::string& deviceXml, bool live) {
    unsigned int flags = VIR_DOMAIN_AFFECT_CONFIG;
    if (live) flags |= VIR_DOMAIN_AFFECT_LIVE;
    checkLibvirtError(virDomainAttachDeviceFlags(domain, deviceXml.c_str(), flags), "attach device to " + domainName);
}

virDomainPtr VirtualMachine::getRawHandle() const noexcept { return domain; }

DomainState VirtualMachine::mapLibvirtState(int state) {
    switch (state) {
        case VIR_DOMAIN_RUNNING: return DomainState::Running;
        case VIR_DOMAIN_BLOCKED: return DomainState::Blocked;
        case VIR_DOMAIN_PAUSED: return DomainState::Paused;
        case VIR_DOMAIN_SHUTDOWN: return DomainState::Shutdown;
        case VIR_DOMAIN_SHUTOFF: return DomainState::Shutoff;
        case VIR_DOMAIN_CRASHED: return DomainState::Crashed;
        case VIR_DOMAIN_PMSUSPENDED: return DomainState::PmSuspended;
        default: return DomainState::NoState;
    }
}
