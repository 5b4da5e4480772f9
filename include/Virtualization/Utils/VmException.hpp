#pragma once
#include <stdexcept>
#include <string>

class VmException : public std::runtime_error {
public:
    explicit VmException(const std::string& msg) : std::runtime_error(msg) {}
};

// Hypervisor call failed; the message is the hypervisor's own error text.
class LibvirtException : public VmException {
public:
    explicit LibvirtException(const std::string& msg) : VmException(msg) {}
};

class StorageException : public VmException {
public:
    explicit StorageException(const std::string& msg) : VmException(msg) {}
};

class InvalidInputException : public VmException {
public:
    explicit InvalidInputException(const std::string& msg) : VmException(msg) {}
};

class NotFoundException : public VmException {
public:
    explicit NotFoundException(const std::string& msg) : VmException(msg) {}
};

class UnsupportedOperationException : public VmException {
public:
    explicit UnsupportedOperationException(const std::string& msg) : VmException(msg) {}
};

// A multi-step workflow failed after some of its steps were applied.
class PartialFailureException : public VmException {
public:
    explicit PartialFailureException(const std::string& msg) : VmException(msg) {}
};
