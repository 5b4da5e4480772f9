#include "API/cli/CommandLine.hpp"
#include "API/cli/ResultJson.hpp"
#include "System/Logger.hpp"
#include "Utils/Ipv4Network.hpp"
#include "Utils/SizeParser.hpp"
#include "Virtualization/Utils/VmException.hpp"
#include "Virtualization/inspect/DomainInspector.hpp"
#include "Virtualization/inspect/NetworkInspector.hpp"
#include "Virtualization/inspect/PoolInspector.hpp"
#include "Virtualization/inspect/VolumeInspector.hpp"
#include "Virtualization/operations/DhcpReservationReconciler.hpp"
#include "Virtualization/operations/DomainCloner.hpp"
#include "Virtualization/operations/NetworkAttacher.hpp"
#include "Virtualization/operations/VolumeAttacher.hpp"
#include "Virtualization/reconcile/DomainPowerReconciler.hpp"
#include "Virtualization/reconcile/DomainReconciler.hpp"
#include "Virtualization/reconcile/NetworkReconciler.hpp"
#include "Virtualization/reconcile/PoolReconciler.hpp"
#include "Virtualization/reconcile/VolumeReconciler.hpp"
#include "Virtualization/vmm/LibvirtHypervisor.hpp"
#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/classification.hpp>
#include <boost/program_options.hpp>
#include <algorithm>
#include <array>
#include <ostream>
#include <sstream>

namespace po = boost::program_options;
using nlohmann::json;

HypervisorFactory libvirtFactory() {
    return [](const ConnectionParams& params, const HostDefaults& defaults) -> Result<std::unique_ptr<IHypervisor>> {
        auto connector = HypervisorConnector::open(params, defaults);
        if (connector.isErr()) return connector.unwrapErr();
        return std::unique_ptr<IHypervisor>(std::make_unique<LibvirtHypervisor>(connector.unwrap()));
    };
}

namespace {

// Everything a bound command needs besides the hypervisor.
struct Context {
    HostDefaults defaults;
    ReconcileOptions options;
    Sleeper sleeper;
};

using Invocation = std::function<CommandResult(IHypervisor&, const Context&)>;

struct CommandSpec {
    std::string name;
    std::string summary;
    std::function<po::options_description()> options;
    std::function<Invocation(const po::variables_map&)> bind;
};

constexpr int parserStyle = po::command_line_style::default_style & ~po::command_line_style::allow_guessing;

template <typename T, typename Fill>
CommandResult respond(Result<T> result, Fill&& fill) {
    if (result.isErr()) return {failureJson(result.error()), true};
    const T& outcome = result.value();
    json body = outcomeJson(outcome);
    fill(body, outcome);
    return {std::move(body), false};
}

std::optional<std::string> optionalArgument(const po::variables_map& vm, const char* key) {
    if (!vm.count(key)) return std::nullopt;
    return vm[key].as<std::string>();
}

std::string stringArgument(const po::variables_map& vm, const char* key) {
    return optionalArgument(vm, key).value_or(std::string());
}

ResourceState stateArgument(const po::variables_map& vm, std::initializer_list<ResourceState> allowed) {
    const std::string text = vm["state"].as<std::string>();
    const auto state = parseResourceState(text);
    if (!state || std::find(allowed.begin(), allowed.end(), *state) == allowed.end()) {
        throw InvalidInputException("Invalid state: " + text);
    }
    return *state;
}

PermissionSpec permissionArguments(const po::variables_map& vm) {
    return {vm["mode"].as<std::string>(), stringArgument(vm, "owner"), stringArgument(vm, "group")};
}

// "pool/volume" or "domain/network"
std::pair<std::string, std::string> splitPair(const std::string& text, const char* what) {
    const auto slash = text.find('/');
    if (slash == std::string::npos || slash == 0 || slash + 1 == text.size()) {
        throw InvalidInputException(std::string("Expected ") + what + ", got '" + text + "'");
    }
    return {text.substr(0, slash), text.substr(slash + 1)};
}

// "ip=host1,host2"
DnsHost dnsHostArgument(const std::string& text) {
    const auto eq = text.find('=');
    if (eq == std::string::npos || eq == 0 || eq + 1 == text.size()) {
        throw InvalidInputException("Expected ip=hostname[,hostname...], got '" + text + "'");
    }
    DnsHost host;
    host.ip = text.substr(0, eq);
    boost::split(host.hostnames, text.substr(eq + 1), boost::is_any_of(","));
    std::erase(host.hostnames, std::string());
    return host;
}

CommandSpec domainCommand() {
    return {"domain", "define or remove a domain",
            [] {
                po::options_description desc("domain options");
                desc.add_options()
                    ("name", po::value<std::string>()->required(), "domain name")
                    ("state", po::value<std::string>()->default_value("present"), "present or absent")
                    ("vcpu", po::value<unsigned int>()->default_value(1), "virtual CPUs")
                    ("memory", po::value<unsigned long>()->default_value(512), "memory in MiB");
                return desc;
            },
            [](const po::variables_map& vm) -> Invocation {
                DomainSpec spec{vm["name"].as<std::string>(), vm["vcpu"].as<unsigned int>(),
                                vm["memory"].as<unsigned long>()};
                const bool absent = stateArgument(vm, {ResourceState::Present, ResourceState::Absent}) ==
                                    ResourceState::Absent;
                return [spec, absent](IHypervisor& hv, const Context& ctx) {
                    DomainReconciler reconciler(hv, ctx.defaults, ctx.sleeper);
                    auto result = absent ? reconciler.ensureAbsent(spec.name, ctx.options)
                                         : reconciler.ensurePresent(spec, ctx.options);
                    return respond(std::move(result), [](json& body, const DomainOutcome& outcome) {
                        body["domain_info"] = optionalJson(outcome.domainInfo);
                    });
                };
            }};
}

CommandSpec powerCommand() {
    return {"power", "start, stop or reboot a domain",
            [] {
                po::options_description desc("power options");
                desc.add_options()
                    ("name", po::value<std::string>()->required(), "domain name")
                    ("state", po::value<std::string>()->required(), "running, poweroff or reboot")
                    ("force", po::bool_switch(), "destroy instead of shutdown, reset instead of reboot")
                    ("force-on-timeout", po::bool_switch(), "destroy when a graceful shutdown times out");
                return desc;
            },
            [](const po::variables_map& vm) -> Invocation {
                const std::string target = vm["state"].as<std::string>();
                const auto parsed = parsePowerTarget(target);
                if (!parsed) throw InvalidInputException("Invalid power state: " + target);

                PowerRequest request{vm["name"].as<std::string>(), *parsed, vm["force"].as<bool>(),
                                     vm["force-on-timeout"].as<bool>()};
                return [request](IHypervisor& hv, const Context& ctx) {
                    DomainPowerReconciler reconciler(
                        hv, WaitPolicy{ctx.defaults.powerShutdownTimeout, ctx.defaults.pollInterval}, ctx.sleeper);
                    return respond(reconciler.apply(request, ctx.options), [](json& body, const PowerOutcome& outcome) {
                        body["status"] = std::string(toString(outcome.status));
                        body["state"] = std::string(toString(outcome.state));
                    });
                };
            }};
}

CommandSpec cloneCommand() {
    return {"clone", "clone a domain and its disks",
            [] {
                po::options_description desc("clone options");
                desc.add_options()
                    ("source", po::value<std::string>()->required(), "domain to clone")
                    ("name", po::value<std::string>()->required(), "name of the clone")
                    ("linked", po::bool_switch(), "qcow2 copy-on-write disks backed by the source")
                    ("target-pool", po::value<std::string>(), "pool receiving every cloned volume")
                    ("no-start", po::bool_switch(), "leave the clone shut off");
                return desc;
            },
            [](const po::variables_map& vm) -> Invocation {
                CloneRequest request{vm["source"].as<std::string>(), vm["name"].as<std::string>(),
                                     vm["linked"].as<bool>(), stringArgument(vm, "target-pool"),
                                     !vm["no-start"].as<bool>()};
                return [request](IHypervisor& hv, const Context& ctx) {
                    DomainCloner cloner(hv, ctx.defaults);
                    return respond(cloner.clone(request, ctx.options), [](json& body, const CloneOutcome& outcome) {
                        body["clone_info"] = {
                            {"name", outcome.cloneName}, {"uuid", outcome.uuid}, {"storage", outcome.storage}};
                    });
                };
            }};
}

CommandSpec networkCommand() {
    return {"network", "define, activate or remove a virtual network",
            [] {
                po::options_description desc("network options");
                desc.add_options()
                    ("name", po::value<std::string>()->required(), "network name")
                    ("state", po::value<std::string>()->default_value("present"), "present, absent, active or inactive")
                    ("type", po::value<std::string>()->default_value("nat"), "nat, route or isolated")
                    ("bridge", po::value<std::string>(), "bridge device name")
                    ("stp", po::value<bool>()->default_value(true), "spanning tree on the bridge")
                    ("delay", po::value<unsigned int>()->default_value(0), "bridge forward delay")
                    ("mtu", po::value<unsigned int>(), "bridge MTU")
                    ("domain", po::value<std::string>(), "DNS domain")
                    ("cidr", po::value<std::string>(), "IPv4 network, a.b.c.d/len")
                    ("dhcp", po::value<bool>()->default_value(true), "serve DHCP on the network")
                    ("dhcp-start", po::value<std::string>(), "first DHCP address")
                    ("dhcp-end", po::value<std::string>(), "last DHCP address")
                    ("dns", po::value<bool>()->default_value(true), "serve DNS on the network")
                    ("dns-forwarder", po::value<std::vector<std::string>>()->composing(), "upstream DNS server")
                    ("dns-host", po::value<std::vector<std::string>>()->composing(), "static entry, ip=host[,host]")
                    ("autostart", po::value<bool>()->default_value(true), "start with the host");
                return desc;
            },
            [](const po::variables_map& vm) -> Invocation {
                NetworkSpec spec;
                spec.name = vm["name"].as<std::string>();
                spec.state = stateArgument(vm, {ResourceState::Present, ResourceState::Absent, ResourceState::Active,
                                                ResourceState::Inactive});
                spec.type = vm["type"].as<std::string>();
                spec.bridge = stringArgument(vm, "bridge");
                spec.stp = vm["stp"].as<bool>();
                spec.delay = vm["delay"].as<unsigned int>();
                if (vm.count("mtu")) spec.mtu = vm["mtu"].as<unsigned int>();
                spec.domainName = stringArgument(vm, "domain");
                spec.cidr = stringArgument(vm, "cidr");
                spec.dhcpEnabled = vm["dhcp"].as<bool>();
                spec.dhcpStart = stringArgument(vm, "dhcp-start");
                spec.dhcpEnd = stringArgument(vm, "dhcp-end");
                spec.dnsEnabled = vm["dns"].as<bool>();
                if (vm.count("dns-forwarder")) spec.dnsForwarders = vm["dns-forwarder"].as<std::vector<std::string>>();
                if (vm.count("dns-host")) {
                    for (const auto& entry : vm["dns-host"].as<std::vector<std::string>>()) {
                        spec.dnsHosts.push_back(dnsHostArgument(entry));
                    }
                }
                spec.autostart = vm["autostart"].as<bool>();

                return [spec](IHypervisor& hv, const Context& ctx) {
                    NetworkReconciler reconciler(hv);
                    return respond(reconciler.reconcile(spec, ctx.options),
                                   [](json& body, const NetworkOutcome& outcome) {
                                       body["network_info"] = optionalJson(outcome.networkInfo);
                                   });
                };
            }};
}

CommandSpec poolCommand() {
    return {"pool", "define, activate or remove a storage pool",
            [] {
                po::options_description desc("pool options");
                desc.add_options()
                    ("name", po::value<std::string>()->required(), "pool name")
                    ("state", po::value<std::string>()->default_value("present"), "present, absent, active or inactive")
                    ("type", po::value<std::string>(), "dir, fs, netfs, logical, disk, iscsi, ...")
                    ("target-path", po::value<std::string>(), "target directory or device path")
                    ("source-device", po::value<std::string>(), "source device path")
                    ("source-host", po::value<std::string>(), "source host")
                    ("source-dir", po::value<std::string>(), "source directory on the host")
                    ("source-name", po::value<std::string>(), "source name")
                    ("source-format", po::value<std::string>(), "source format")
                    ("mode", po::value<std::string>()->default_value("0755"), "octal target mode")
                    ("owner", po::value<std::string>(), "target owner, name or uid")
                    ("group", po::value<std::string>(), "target group, name or gid")
                    ("recursive-permissions", po::bool_switch(), "apply mode and ownership below the target too")
                    ("autostart", po::value<bool>()->default_value(true), "start with the host");
                return desc;
            },
            [](const po::variables_map& vm) -> Invocation {
                PoolSpec spec;
                spec.name = vm["name"].as<std::string>();
                spec.state = stateArgument(vm, {ResourceState::Present, ResourceState::Absent, ResourceState::Active,
                                                ResourceState::Inactive});
                spec.type = stringArgument(vm, "type");
                spec.targetPath = stringArgument(vm, "target-path");
                spec.source = {stringArgument(vm, "source-device"), stringArgument(vm, "source-host"),
                               stringArgument(vm, "source-dir"), stringArgument(vm, "source-name"),
                               stringArgument(vm, "source-format")};
                spec.permissions = permissionArguments(vm);
                spec.recursivePermissions = vm["recursive-permissions"].as<bool>();
                spec.autostart = vm["autostart"].as<bool>();

                return [spec](IHypervisor& hv, const Context& ctx) {
                    PoolReconciler reconciler(
                        hv, RetryPolicy{ctx.defaults.poolActivationAttempts, ctx.defaults.poolActivationBackoff},
                        ctx.sleeper);
                    return respond(reconciler.reconcile(spec, ctx.options), [](json& body, const PoolOutcome& outcome) {
                        body["pool_info"] = optionalJson(outcome.poolInfo);
                    });
                };
            }};
}

CommandSpec volumeCommand() {
    return {"volume", "create, remove, grow or import a volume",
            [] {
                po::options_description desc("volume options");
                desc.add_options()
                    ("pool", po::value<std::string>()->required(), "pool holding the volume")
                    ("name", po::value<std::string>()->required(), "volume name")
                    ("state", po::value<std::string>()->default_value("present"), "present, absent, resize or import")
                    ("capacity", po::value<std::string>(), "size such as 10G, 512M or 4096")
                    ("allocation", po::value<std::string>(), "preallocated size, thin when omitted")
                    ("format", po::value<std::string>()->default_value("raw"), "raw, qcow2, vmdk or iso")
                    ("import-path", po::value<std::string>(), "local image to upload")
                    ("import-format", po::value<std::string>()->default_value("qcow2"), "format of the imported image")
                    ("mode", po::value<std::string>()->default_value("0644"), "octal file mode")
                    ("owner", po::value<std::string>(), "file owner, name or uid")
                    ("group", po::value<std::string>(), "file group, name or gid");
                return desc;
            },
            [](const po::variables_map& vm) -> Invocation {
                VolumeSpec spec;
                spec.pool = vm["pool"].as<std::string>();
                spec.name = vm["name"].as<std::string>();
                const std::string action = vm["state"].as<std::string>();
                const auto parsed = parseVolumeAction(action);
                if (!parsed) throw InvalidInputException("Invalid state: " + action);
                spec.action = *parsed;
                if (vm.count("capacity")) spec.capacity = parseSize(vm["capacity"].as<std::string>());
                if (vm.count("allocation")) spec.allocation = parseSize(vm["allocation"].as<std::string>());
                spec.format = vm["format"].as<std::string>();
                spec.importPath = stringArgument(vm, "import-path");
                spec.importFormat = vm["import-format"].as<std::string>();
                spec.permissions = permissionArguments(vm);

                return [spec](IHypervisor& hv, const Context& ctx) {
                    VolumeReconciler reconciler(hv, ctx.defaults, ctx.sleeper);
                    return respond(reconciler.reconcile(spec, ctx.options),
                                   [](json& body, const VolumeOutcome& outcome) {
                                       body["volume_info"] = optionalJson(outcome.volumeInfo);
                                   });
                };
            }};
}

CommandSpec attachNetworkCommand() {
    return {"attach-network", "add an interface on a virtual network to a domain",
            [] {
                po::options_description desc("attach-network options");
                desc.add_options()
                    ("domain", po::value<std::string>()->required(), "domain name")
                    ("network", po::value<std::string>()->required(), "network name")
                    ("mac", po::value<std::string>(), "MAC address of the new interface")
                    ("link-down", po::bool_switch(), "attach with the link state down");
                return desc;
            },
            [](const po::variables_map& vm) -> Invocation {
                NetworkAttachRequest request{vm["domain"].as<std::string>(), vm["network"].as<std::string>(),
                                             stringArgument(vm, "mac"), !vm["link-down"].as<bool>()};
                return [request](IHypervisor& hv, const Context& ctx) {
                    NetworkAttacher attacher(hv);
                    return respond(attacher.attach(request, ctx.options),
                                   [](json& body, const NetworkAttachOutcome& outcome) {
                                       body["domain"] = outcome.domainName;
                                       body["network"] = outcome.networkName;
                                       body["mac_address"] = outcome.macAddress;
                                       body["already_attached"] = outcome.alreadyAttached;
                                       body["domain_running"] = outcome.domainRunning;
                                   });
                };
            }};
}

CommandSpec attachVolumeCommand() {
    return {"attach-volume", "attach pool volumes to a domain",
            [] {
                po::options_description desc("attach-volume options");
                desc.add_options()
                    ("domain", po::value<std::string>()->required(), "domain name")
                    ("pool", po::value<std::string>()->required(), "pool holding the volumes")
                    ("volume", po::value<std::vector<std::string>>()->composing()->required(), "volume name, repeatable");
                return desc;
            },
            [](const po::variables_map& vm) -> Invocation {
                VolumeAttachRequest request{vm["domain"].as<std::string>(), vm["pool"].as<std::string>(),
                                            vm["volume"].as<std::vector<std::string>>()};
                return [request](IHypervisor& hv, const Context& ctx) {
                    VolumeAttacher attacher(hv);
                    return respond(attacher.attach(request, ctx.options),
                                   [](json& body, const VolumeAttachOutcome& outcome) {
                                       body["attached_volumes"] = outcome.attachedVolumes;
                                       body["already_attached"] = outcome.alreadyAttached;
                                       body["domain_state"] = outcome.domainState;
                                   });
                };
            }};
}

CommandSpec dhcpReservationCommand() {
    return {"dhcp-reservation", "pin a domain's MAC to an IP in a network's DHCP hosts",
            [] {
                po::options_description desc("dhcp-reservation options");
                desc.add_options()
                    ("network", po::value<std::string>()->required(), "network name")
                    ("domain", po::value<std::string>()->required(), "domain name, used as host name")
                    ("ip", po::value<std::string>()->required(), "reserved address, a /prefix is ignored")
                    ("mac", po::value<std::string>()->required(), "domain interface MAC");
                return desc;
            },
            [](const po::variables_map& vm) -> Invocation {
                DhcpReservationRequest request{vm["network"].as<std::string>(), vm["domain"].as<std::string>(),
                                               vm["ip"].as<std::string>(), vm["mac"].as<std::string>()};
                return [request](IHypervisor& hv, const Context& ctx) {
                    DhcpReservationReconciler reconciler(hv);
                    return respond(reconciler.reconcile(request, ctx.options),
                                   [](json& body, const DhcpReservationOutcome& outcome) {
                                       body["skipped"] = outcome.skipped;
                                       body["network_name"] = outcome.networkName;
                                       body["domain_name"] = outcome.domainName;
                                       body["ip_address"] = outcome.ipAddress;
                                       body["mac_address"] = outcome.macAddress;
                                   });
                };
            }};
}

CommandSpec refreshCommand() {
    return {"refresh", "re-read the volume list of one or every active pool",
            [] {
                po::options_description desc("refresh options");
                desc.add_options()("pool", po::value<std::string>(), "pool name, every active pool when omitted");
                return desc;
            },
            [](const po::variables_map& vm) -> Invocation {
                auto pool = optionalArgument(vm, "pool");
                return [pool](IHypervisor& hv, const Context& ctx) {
                    PoolReconciler reconciler(
                        hv, RetryPolicy{ctx.defaults.poolActivationAttempts, ctx.defaults.poolActivationBackoff},
                        ctx.sleeper);
                    return respond(reconciler.refresh(pool, ctx.options), [](json& body, const RefreshOutcome& outcome) {
                        body["refreshed"] = outcome.refreshed;
                    });
                };
            }};
}

CommandSpec restartNetworksCommand() {
    return {"restart-networks", "destroy and start one or every active network",
            [] {
                po::options_description desc("restart-networks options");
                desc.add_options()("network", po::value<std::string>(), "network name, every active one when omitted");
                return desc;
            },
            [](const po::variables_map& vm) -> Invocation {
                auto network = optionalArgument(vm, "network");
                return [network](IHypervisor& hv, const Context& ctx) {
                    NetworkReconciler reconciler(hv);
                    return respond(reconciler.restartActiveNetworks(network, ctx.options),
                                   [](json& body, const RefreshOutcome& outcome) {
                                       body["restarted"] = outcome.refreshed;
                                   });
                };
            }};
}

CommandSpec infoCommand() {
    return {"info", "describe domains, networks, pools or volumes",
            [] {
                po::options_description desc("info options");
                desc.add_options()
                    ("kind", po::value<std::string>()->required(), "domain, network, pool or volume")
                    ("pattern", po::value<std::string>()->default_value("*"), "name or glob; pool/glob for volumes")
                    ("cidr", po::value<std::string>(), "network whose address range equals this CIDR");
                return desc;
            },
            [](const po::variables_map& vm) -> Invocation {
                const std::string kind = vm["kind"].as<std::string>();
                static const std::array<std::string, 4> kinds{"domain", "network", "pool", "volume"};
                if (std::find(kinds.begin(), kinds.end(), kind) == kinds.end()) {
                    throw InvalidInputException("Invalid kind: " + kind);
                }
                const std::string pattern = vm["pattern"].as<std::string>();
                const auto cidr = optionalArgument(vm, "cidr");
                if (cidr) {
                    if (kind != "network") throw InvalidInputException("--cidr only applies to networks");
                    (void)Ipv4Network::fromCidr(*cidr, false);
                }
                if (kind == "volume") (void)VolumeInspector::parseVolumeKey(pattern);

                return [kind, pattern, cidr](IHypervisor& hv, const Context&) {
                    json body{{"changed", false}};
                    if (kind == "domain") {
                        body["domains"] = DomainInspector(hv).getByPattern(pattern);
                    } else if (kind == "network" && cidr) {
                        body["network_info"] = optionalJson(NetworkInspector(hv).getByCidr(*cidr));
                    } else if (kind == "network") {
                        body["networks"] = NetworkInspector(hv).getByPattern(pattern);
                    } else if (kind == "pool") {
                        body["pools"] = PoolInspector(hv).getByPattern(pattern);
                    } else {
                        body["volumes"] = VolumeInspector(hv).getByPattern(pattern);
                    }
                    return CommandResult{std::move(body), false};
                };
            }};
}

CommandSpec reservedIpCommand() {
    return {"reserved-ip", "look up the DHCP reservation of domains on networks",
            [] {
                po::options_description desc("reserved-ip options");
                desc.add_options()("pair", po::value<std::vector<std::string>>()->composing()->required(),
                                   "domain/network, repeatable");
                return desc;
            },
            [](const po::variables_map& vm) -> Invocation {
                std::vector<std::pair<std::string, std::string>> pairs;
                for (const auto& entry : vm["pair"].as<std::vector<std::string>>()) {
                    pairs.push_back(splitPair(entry, "domain/network"));
                }
                return [pairs](IHypervisor& hv, const Context&) {
                    NetworkInspector inspector(hv);
                    json reserved = json::array();
                    for (const auto& [domain, network] : pairs) {
                        reserved.push_back({{"domain", domain},
                                            {"network", network},
                                            {"ip", optionalJson(inspector.reservedIpFor(domain, network))}});
                    }
                    return CommandResult{json{{"changed", false}, {"reserved_ips", std::move(reserved)}}, false};
                };
            }};
}

const std::vector<CommandSpec>& commandTable() {
    static const std::vector<CommandSpec> table{
        domainCommand(),       powerCommand(),          cloneCommand(),
        networkCommand(),      poolCommand(),           volumeCommand(),
        attachNetworkCommand(), attachVolumeCommand(),  dhcpReservationCommand(),
        refreshCommand(),      restartNetworksCommand(), infoCommand(),
        reservedIpCommand(),
    };
    return table;
}

const CommandSpec* findCommand(const std::string& name) {
    const auto& table = commandTable();
    const auto it = std::find_if(table.begin(), table.end(), [&](const CommandSpec& c) { return c.name == name; });
    return it == table.end() ? nullptr : &*it;
}

po::options_description globalDescription() {
    po::options_description desc("Global options");
    desc.add_options()
        ("help,h", "print usage, or the options of a command")
        ("uri", po::value<std::string>(), "libvirt connection URI")
        ("remote-host", po::value<std::string>(), "connect to this host over the remote transport")
        ("auth-user", po::value<std::string>(), "user name for authenticated connections")
        ("auth-password", po::value<std::string>(), "password for authenticated connections")
        ("config", po::value<std::string>(), "INI file overriding host defaults")
        ("log-level", po::value<std::string>(), "trace, debug, info, warn, error, critical or off")
        ("log-file", po::value<std::string>(), "also log to this rotating file")
        ("dry-run", po::bool_switch(), "report what would change without changing anything");
    return desc;
}

std::string usage() {
    std::ostringstream text;
    text << "Usage: virtrecon [global options] <command> [command options]\n\n" << globalDescription() << "\nCommands:\n";
    for (const auto& command : commandTable()) {
        text << "  " << command.name << std::string(command.name.size() < 18 ? 18 - command.name.size() : 1, ' ')
             << command.summary << '\n';
    }
    return text.str();
}

bool isLogLevel(const std::string& level) {
    static const std::array<std::string, 7> levels{"trace", "debug", "info", "warn", "error", "critical", "off"};
    return std::find(levels.begin(), levels.end(), level) != levels.end();
}

int emit(std::ostream& out, const json& body, ExitCode code) {
    out << body.dump(2) << '\n';
    return static_cast<int>(code);
}

} // namespace

CommandLine::CommandLine(HypervisorFactory factory, Sleeper sleeper)
    : factory(std::move(factory)), sleeper(std::move(sleeper)) {}

const std::vector<std::string>& CommandLine::commands() {
    static const std::vector<std::string> names = [] {
        std::vector<std::string> result;
        for (const auto& command : commandTable()) result.push_back(command.name);
        return result;
    }();
    return names;
}

int CommandLine::run(const std::vector<std::string>& args, std::ostream& out) const {
    GlobalOptions global;
    Context context;
    Invocation invocation;

    try {
        po::options_description hidden;
        hidden.add_options()
            ("command", po::value<std::string>())
            ("arguments", po::value<std::vector<std::string>>());
        po::options_description all;
        all.add(globalDescription()).add(hidden);

        po::positional_options_description positional;
        positional.add("command", 1).add("arguments", -1);

        const po::parsed_options parsed = po::command_line_parser(args)
                                              .options(all)
                                              .positional(positional)
                                              .style(parserStyle)
                                              .allow_unregistered()
                                              .run();
        po::variables_map vm;
        po::store(parsed, vm);
        po::notify(vm);

        if (!vm.count("command")) {
            if (vm.count("help")) {
                out << usage();
                return static_cast<int>(ExitCode::Success);
            }
            throw InvalidInputException("No command given, see --help");
        }

        const std::string name = vm["command"].as<std::string>();
        const CommandSpec* command = findCommand(name);
        if (command == nullptr) throw InvalidInputException("Unknown command: " + name);

        if (vm.count("help")) {
            out << "Usage: virtrecon [global options] " << name << " [options]\n\n" << command->options();
            return static_cast<int>(ExitCode::Success);
        }

        global.connection = {optionalArgument(vm, "uri"), optionalArgument(vm, "remote-host"),
                             optionalArgument(vm, "auth-user"), optionalArgument(vm, "auth-password")};
        global.configFile = stringArgument(vm, "config");
        global.logLevel = stringArgument(vm, "log-level");
        global.logFile = stringArgument(vm, "log-file");
        global.dryRun = vm["dry-run"].as<bool>();

        std::vector<std::string> rest = po::collect_unrecognized(parsed.options, po::include_positional);
        rest.erase(rest.begin());

        po::variables_map commandArgs;
        po::store(po::command_line_parser(rest).options(command->options()).style(parserStyle).run(), commandArgs);
        po::notify(commandArgs);
        invocation = command->bind(commandArgs);

        context.defaults = global.configFile.empty() ? HostDefaults() : HostDefaults::loadFromFile(global.configFile);
        if (!global.logLevel.empty()) context.defaults.logLevel = global.logLevel;
        if (!global.logFile.empty()) context.defaults.logFile = global.logFile;
        if (!isLogLevel(context.defaults.logLevel)) {
            throw InvalidInputException("Invalid log level: " + context.defaults.logLevel);
        }
        context.options.dryRun = global.dryRun;
        context.sleeper = sleeper;

        SafeLogger::initialize(LogSettings{context.defaults.logLevel, context.defaults.logFile});
    } catch (const po::error& e) {
        return emit(out, failureJson(e.what()), ExitCode::InvalidArguments);
    } catch (const InvalidInputException& e) {
        return emit(out, failureJson(e.what()), ExitCode::InvalidArguments);
    } catch (const spdlog::spdlog_ex& e) {
        return emit(out, failureJson(std::string("Cannot open log file: ") + e.what()), ExitCode::InvalidArguments);
    }

    auto connection = factory(global.connection, context.defaults);
    if (connection.isErr()) {
        VRLOG_ERROR("Connection failed: {}", connection.error());
        return emit(out, failureJson(connection.error()), ExitCode::ConnectionFailed);
    }
    std::unique_ptr<IHypervisor> hypervisor = connection.unwrap();
    VRLOG_DEBUG("Using {}{}", hypervisor->uri(), context.options.dryRun ? " (dry run)" : "");

    CommandResult result;
    try {
        result = invocation(*hypervisor, context);
    } catch (const VmException& e) {
        VRLOG_ERROR("{}", e.what());
        result = {failureJson(e.what()), true};
    }
    return emit(out, result.body, result.failed ? ExitCode::OperationFailed : ExitCode::Success);
}
