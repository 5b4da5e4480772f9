#pragma once
#include "Core/interfaces/IHypervisor.hpp"
#include <algorithm>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

/**
 * @brief In-memory hypervisor shared by every handle a FakeHypervisor hands out.
 *
 * Records are keyed by name. Every mutating call is appended to journal as
 * "<object>.<call> <name> [detail]" so tests can assert on what happened
 * and in which order.
 */
struct FakeState {
    struct Domain {
        std::string xml;
        DomainState state{DomainState::Shutoff};
        bool persistent{true};
        bool autostart{false};
        bool managedSave{false};
        bool ignoreShutdown{false};  // guest ignores ACPI shutdown requests
        bool unreadable{false};      // info() fails as if the daemon lost the domain
    };

    struct Network {
        std::string xml;
        bool active{false};
        bool persistent{true};
        bool autostart{false};
    };

    struct Volume {
        std::string name;
        std::string path;
        std::string format{"raw"};
        std::uint64_t capacity{0};
        std::uint64_t allocation{0};
        std::string backingPath;
        std::string content;
        bool uploadAborted{false};
    };

    struct Pool {
        std::string xml;
        bool active{false};
        bool persistent{true};
        bool autostart{false};
        std::map<std::string, Volume> volumes;
        unsigned failActivations{0};  // the next N create() calls fail
        unsigned activationAttempts{0};
        unsigned refreshCount{0};
        bool failRefresh{false};
    };

    std::map<std::string, Domain> domains;
    std::map<std::string, Network> networks;
    std::map<std::string, Pool> pools;

    int failVolumeCreateAt{-1};  // zero-based index of the createVolume/createVolumeFrom call that fails
    int volumeCreates{0};
    bool extendedUndefineUnsupported{false};
    bool failDomainStart{false};
    bool failUpload{false};
    bool failVolumeRemove{false};
    unsigned uploadChunks{0};

    std::vector<std::string> journal;

    [[nodiscard]] bool journaled(const std::string& entry) const {
        return std::find(journal.begin(), journal.end(), entry) != journal.end();
    }

    [[nodiscard]] std::size_t countJournal(const std::string& prefix) const {
        return static_cast<std::size_t>(std::count_if(journal.begin(), journal.end(), [&](const std::string& e) {
            return e.rfind(prefix, 0) == 0;
        }));
    }
};

class FakeHypervisor : public IHypervisor {
    std::shared_ptr<FakeState> state;

public:
    explicit FakeHypervisor(std::shared_ptr<FakeState> state = std::make_shared<FakeState>())
        : state(std::move(state)) {}

    [[nodiscard]] FakeState& fake() const noexcept { return *state; }
    [[nodiscard]] std::shared_ptr<FakeState> shared() const noexcept { return state; }

    [[nodiscard]] std::string uri() const override { return "test:///fake"; }

    [[nodiscard]] std::vector<std::string> listDomainNames() const override;
    [[nodiscard]] std::unique_ptr<IDomainHandle> lookupDomain(const std::string& name) const override;
    [[nodiscard]] std::unique_ptr<IDomainHandle> defineDomain(const std::string& xml) override;

    [[nodiscard]] std::vector<std::string> listNetworkNames() const override;
    [[nodiscard]] std::unique_ptr<INetworkHandle> lookupNetwork(const std::string& name) const override;
    [[nodiscard]] std::unique_ptr<INetworkHandle> defineNetwork(const std::string& xml) override;

    [[nodiscard]] std::vector<std::string> listPoolNames(bool activeOnly) const override;
    [[nodiscard]] std::unique_ptr<IStoragePoolHandle> lookupPool(const std::string& name) const override;
    [[nodiscard]] std::unique_ptr<IStoragePoolHandle> definePool(const std::string& xml) override;

    [[nodiscard]] std::unique_ptr<IStorageVolumeHandle> lookupVolumeByPath(const std::string& path) const override;
};

// Seeding helpers. Descriptors are minimal but parse like real ones.

[[nodiscard]] std::string fakeDomainXml(const std::string& name, const std::string& devices = "",
                                        unsigned long memoryKiB = 1048576, unsigned vcpus = 2);

FakeState::Domain& addFakeDomain(FakeState& state, const std::string& name, DomainState power,
                                 const std::string& devices = "");

FakeState::Network& addFakeNetwork(FakeState& state, const std::string& name, const std::string& xml,
                                   bool active = true);

FakeState::Pool& addFakePool(FakeState& state, const std::string& name, const std::string& targetPath,
                             bool active = true, const std::string& type = "dir");

FakeState::Volume& addFakeVolume(FakeState& state, const std::string& pool, const std::string& name,
                                 std::uint64_t capacity, const std::string& format = "raw");

// <disk type='file' device='disk'> on @p path with target @p dev
[[nodiscard]] std::string fakeFileDisk(const std::string& path, const std::string& dev,
                                       const std::string& device = "disk");

// <interface type='network'> on @p network with @p mac
[[nodiscard]] std::string fakeNetworkInterface(const std::string& network, const std::string& mac);
