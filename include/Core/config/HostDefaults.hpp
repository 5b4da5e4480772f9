#pragma once
#include <chrono>
#include <cstddef>
#include <functional>
#include <string>

/**
 * @brief Host-level constants used when synthesizing descriptors and
 * driving state transitions.
 *
 * Every field has a built-in default; an INI file passed with --config
 * may override any of them.
 */
struct HostDefaults {
    std::string defaultUri{"qemu:///system"};
    std::string remoteUriTemplate{"qemu+ssh://{host}/system"};

    std::string machineType{"pc-q35-7.2"};
    std::string arch{"x86_64"};
    std::string emulator{"/usr/bin/qemu-system-x86_64"};
    std::string loaderPath{"/usr/share/edk2/x64/OVMF_CODE.secboot.4m.fd"};
    std::string nvramDir{"/var/lib/libvirt/qemu/nvram"};
    std::string macPrefix{"52:54:00"};

    std::chrono::seconds powerShutdownTimeout{60};
    std::chrono::seconds removeShutdownTimeout{30};
    std::chrono::milliseconds pollInterval{1000};

    unsigned poolActivationAttempts{3};
    std::chrono::milliseconds poolActivationBackoff{1000};

    std::size_t importChunkSize{1024 * 1024};

    std::string logLevel{"warn"};
    std::string logFile;

    // <nvramDir>/<domain>_VARS.fd
    [[nodiscard]] std::string nvramPathFor(const std::string& domainName) const;

    // remoteUriTemplate with {host} substituted
    [[nodiscard]] std::string remoteUriFor(const std::string& host) const;

    /**
     * @brief Loads overrides from an INI file.
     * @throws InvalidInputException on unreadable files, unknown keys or bad values
     */
    static HostDefaults loadFromFile(const std::string& path, HostDefaults base);
    static HostDefaults loadFromFile(const std::string& path);
};

inline HostDefaults HostDefaults::loadFromFile(const std::string& path) {
    return loadFromFile(path, HostDefaults());
}

using Sleeper = std::function<void(std::chrono::milliseconds)>;

[[nodiscard]] Sleeper realSleeper();

// Bounded poll used for shutdown confirmation.
struct WaitPolicy {
    std::chrono::milliseconds timeout{60000};
    std::chrono::milliseconds interval{1000};

    [[nodiscard]] unsigned ticks() const noexcept {
        if (interval.count() <= 0) return 0;
        return static_cast<unsigned>(timeout.count() / interval.count());
    }
};

// Bounded retry used for pool activation.
struct RetryPolicy {
    unsigned attempts{3};
    std::chrono::milliseconds backoff{1000};
};
