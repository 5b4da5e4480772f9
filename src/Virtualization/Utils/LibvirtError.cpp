#include "Virtualization/Utils/LibvirtError.hpp"
#include "Virtualization/Utils/VmException.hpp"
#include <libvirt/libvirt.h>
#include <libvirt/virterror.h>

void throwLastLibvirtError(const std::string& action) {
    virErrorPtr err = virGetLastError();
    throw LibvirtException(action + ": " + (err && err->message ? err->message : "unknown"));
}

void checkLibvirtError(int result, const std::string& action) {
    if (result < 0) throwLastLibvirtError(action);
}

bool lastLibvirtErrorIs(int code) noexcept {
    virErrorPtr err = virGetLastError();
    return err != nullptr && err->code == code;
}
