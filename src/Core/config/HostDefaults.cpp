#include "Core/config/HostDefaults.hpp"
#include "Virtualization/Utils/VmException.hpp"
#include <boost/program_options.hpp>
#include <fstream>
#include <thread>

namespace po = boost::program_options;

std::string HostDefaults::nvramPathFor(const std::string& domainName) const {
    std::string dir = nvramDir;
    if (!dir.empty() && dir.back() == '/') dir.pop_back();
    return dir + "/" + domainName + "_VARS.fd";
}

std::string HostDefaults::remoteUriFor(const std::string& host) const {
    std::string uri = remoteUriTemplate;
    const std::string token = "{host}";
    const auto pos = uri.find(token);
    if (pos == std::string::npos) return uri;
    return uri.replace(pos, token.size(), host);
}

HostDefaults HostDefaults::loadFromFile(const std::string& path, HostDefaults base) {
    std::ifstream in(path);
    if (!in) throw InvalidInputException("Cannot read configuration file: " + path);

    long powerTimeout = base.powerShutdownTimeout.count();
    long removeTimeout = base.removeShutdownTimeout.count();
    long pollMs = base.pollInterval.count();
    long backoffMs = base.poolActivationBackoff.count();

    po::options_description desc("Host defaults");
    desc.add_options()
        ("connection.default_uri", po::value<std::string>(&base.defaultUri))
        ("connection.remote_uri_template", po::value<std::string>(&base.remoteUriTemplate))
        ("domain.machine_type", po::value<std::string>(&base.machineType))
        ("domain.arch", po::value<std::string>(&base.arch))
        ("domain.emulator", po::value<std::string>(&base.emulator))
        ("domain.loader_path", po::value<std::string>(&base.loaderPath))
        ("domain.nvram_dir", po::value<std::string>(&base.nvramDir))
        ("domain.mac_prefix", po::value<std::string>(&base.macPrefix))
        ("timeouts.power_shutdown", po::value<long>(&powerTimeout))
        ("timeouts.remove_shutdown", po::value<long>(&removeTimeout))
        ("timeouts.poll_interval_ms", po::value<long>(&pollMs))
        ("pool.activation_attempts", po::value<unsigned>(&base.poolActivationAttempts))
        ("pool.activation_backoff_ms", po::value<long>(&backoffMs))
        ("volume.import_chunk_size", po::value<std::size_t>(&base.importChunkSize))
        ("log.level", po::value<std::string>(&base.logLevel))
        ("log.file", po::value<std::string>(&base.logFile));

    try {
        po::variables_map vm;
        po::store(po::parse_config_file(in, desc, false), vm);
        po::notify(vm);
    } catch (const po::error& e) {
        throw InvalidInputException("Invalid configuration file " + path + ": " + e.what());
    }

    if (powerTimeout < 0 || removeTimeout < 0 || pollMs <= 0 || backoffMs < 0) {
        throw InvalidInputException("Invalid configuration file " + path + ": negative or zero interval");
    }
    if (base.poolActivationAttempts == 0) {
        throw InvalidInputException("Invalid configuration file " + path + ": pool.activation_attempts must be >= 1");
    }
    if (base.importChunkSize == 0) {
        throw InvalidInputException("Invalid configuration file " + path + ": volume.import_chunk_size must be > 0");
    }

    base.powerShutdownTimeout = std::chrono::seconds(powerTimeout);
    base.removeShutdownTimeout = std::chrono::seconds(removeTimeout);
    base.pollInterval = std::chrono::milliseconds(pollMs);
    base.poolActivationBackoff = std::chrono::milliseconds(backoffMs);
    return base;
}

Sleeper realSleeper() {
    return [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
}
