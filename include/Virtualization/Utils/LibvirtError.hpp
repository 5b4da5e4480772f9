#pragma once
#include <string>

// Throws LibvirtException("<action>: <libvirt message>") when result < 0.
void checkLibvirtError(int result, const std::string& action);

[[noreturn]] void throwLastLibvirtError(const std::string& action);

// True when the last libvirt error on this thread carries @p code.
[[nodiscard]] bool lastLibvirtErrorIs(int code) noexcept;
