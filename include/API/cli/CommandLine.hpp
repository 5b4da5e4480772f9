#pragma once
#include "Core/config/HostDefaults.hpp"
#include "Core/interfaces/IHypervisor.hpp"
#include "Utils/Result.hpp"
#include "Virtualization/vmm/HypervisorConnector.hpp"
#include <nlohmann/json.hpp>
#include <functional>
#include <iosfwd>
#include <memory>
#include <string>
#include <vector>

enum class ExitCode : int {
    Success = 0,
    OperationFailed = 1,
    InvalidArguments = 2,
    ConnectionFailed = 3,
};

using HypervisorFactory =
    std::function<Result<std::unique_ptr<IHypervisor>>(const ConnectionParams&, const HostDefaults&)>;

// Opens a libvirt connection through HypervisorConnector.
[[nodiscard]] HypervisorFactory libvirtFactory();

// Flags shared by every command.
struct GlobalOptions {
    ConnectionParams connection;
    std::string configFile;
    std::string logLevel;
    std::string logFile;
    bool dryRun{false};
};

// What a command produced: the JSON document and whether it describes a failure.
struct CommandResult {
    nlohmann::json body;
    bool failed{false};
};

/**
 * @brief The virtrecon command line.
 *
 *   virtrecon [global options] <command> [command options]
 *
 * Each command is parsed completely before a connection is opened, so bad
 * arguments never touch the hypervisor. The result is printed to @p out as
 * one JSON document; logging goes to stderr and the optional log file.
 */
class CommandLine {
    HypervisorFactory factory;
    Sleeper sleeper;

public:
    explicit CommandLine(HypervisorFactory factory = libvirtFactory(), Sleeper sleeper = realSleeper());

    int run(const std::vector<std::string>& args, std::ostream& out) const;

    [[nodiscard]] static const std::vector<std::string>& commands();
};
