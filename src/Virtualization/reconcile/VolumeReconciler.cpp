#include "Virtualization/reconcile/VolumeReconciler.hpp"
#include "System/PermissionReconciler.hpp"
#include "Virtualization/builder/VolumeDefinitionBuilder.hpp"
#include "Virtualization/inspect/VolumeInspector.hpp"
#include <filesystem>
#include <fstream>
#include <vector>

std::optional<VolumeAction> parseVolumeAction(std::string_view text) noexcept {
    if (text == "present") return VolumeAction::Present;
    if (text == "absent") return VolumeAction::Absent;
    if (text == "resize") return VolumeAction::Resize;
    if (text == "import") return VolumeAction::Import;
    return std::nullopt;
}

VolumeReconciler::VolumeReconciler(IHypervisor& hypervisor, HostDefaults defaults, Sleeper sleeper)
    : hypervisor(hypervisor),
      defaults(std::move(defaults)),
      pools(hypervisor, RetryPolicy{this->defaults.poolActivationAttempts, this->defaults.poolActivationBackoff},
            std::move(sleeper)) {}

Result<VolumeOutcome> VolumeReconciler::reconcile(const VolumeSpec& spec, const ReconcileOptions& options) {
    return guardReconcile<VolumeOutcome>("Managing volume " + spec.pool + "/" + spec.name,
                                         [&] { return run(spec, options); });
}

VolumeOutcome VolumeReconciler::run(const VolumeSpec& spec, const ReconcileOptions& options) {
    if (spec.pool.empty() || spec.name.empty()) throw InvalidInputException("Volume pool and name are required");

    auto pool = hypervisor.lookupPool(spec.pool);
    if (!pool) throw NotFoundException("Storage pool '" + spec.pool + "' does not exist");
    if (pool->isActive()) pool->refresh();

    switch (spec.action) {
        case VolumeAction::Present: return create(*pool, spec, options);
        case VolumeAction::Resize: return resize(*pool, spec, options);
        case VolumeAction::Import: return import(*pool, spec, options);
        case VolumeAction::Absent: break;
    }

    VolumeOutcome outcome;
    auto volume = pool->isActive() ? pool->lookupVolume(spec.name) : nullptr;
    if (!volume) {
        outcome.msg = "Volume does not exist";
        return outcome;
    }
    outcome.changed = true;
    if (options.dryRun) {
        outcome.msg = "Would delete volume " + spec.name;
        return outcome;
    }
    VRLOG_INFO("Deleting volume {}/{}", spec.pool, spec.name);
    volume->remove();
    outcome.msg = "Volume deleted successfully";
    return outcome;
}

bool VolumeReconciler::applyPermissions(const IStorageVolumeHandle& volume, const VolumeSpec& spec,
                                        const ReconcileOptions& options, VolumeOutcome& outcome) const {
    const std::string path = volume.path();
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        outcome.warn("Volume file " + path + " is not visible on this host, permissions not applied");
        return false;
    }
    return PermissionReconciler(options.dryRun).manage(path, spec.permissions);
}

VolumeOutcome VolumeReconciler::create(IStoragePoolHandle& pool, const VolumeSpec& spec, const ReconcileOptions& options) {
    VolumeOutcome outcome;
    if (!options.dryRun && pools.ensureActive(pool)) pool.refresh();
    if (auto existing = pool.isActive() ? pool.lookupVolume(spec.name) : nullptr) {
        outcome.changed = applyPermissions(*existing, spec, options, outcome);
        outcome.msg = outcome.changed ? "Volume already exists, permissions updated" : "Volume already exists";
        outcome.volumeInfo = VolumeInspector::describe(*existing, spec.pool);
        return outcome;
    }

    if (spec.capacity == 0) throw InvalidInputException("capacity is required when creating a volume");
    VolumeDefinitionBuilder builder;
    builder.setName(spec.name).setFormat(spec.format).setCapacity(spec.capacity).setAllocation(spec.allocation);
    const std::string xml = builder.build();

    outcome.changed = true;
    if (options.dryRun) {
        outcome.msg = "Would create volume " + spec.name;
        return outcome;
    }

    VRLOG_INFO("Creating volume {}/{} ({} bytes, {})", spec.pool, spec.name, spec.capacity, spec.format);
    auto volume = pool.createVolume(xml, false);
    applyPermissions(*volume, spec, options, outcome);
    outcome.msg = "Volume created successfully";
    outcome.volumeInfo = VolumeInspector::describe(*volume, spec.pool);
    return outcome;
}

VolumeOutcome VolumeReconciler::resize(IStoragePoolHandle& pool, const VolumeSpec& spec, const ReconcileOptions& options) {
    auto volume = pool.isActive() ? pool.lookupVolume(spec.name) : nullptr;
    if (!volume) throw NotFoundException("Volume " + spec.name + " does not exist");

    VolumeOutcome outcome;
    const std::uint64_t current = volume->info().capacity;
    if (spec.capacity == current) {
        outcome.changed = applyPermissions(*volume, spec, options, outcome);
        outcome.msg = outcome.changed ? "Volume is already at the specified size, permissions updated"
                                      : "Volume is already at the specified size";
        outcome.volumeInfo = VolumeInspector::describe(*volume, spec.pool);
        return outcome;
    }
    if (spec.capacity < current) {
        throw InvalidInputException("New capacity must be larger than current capacity (" + std::to_string(spec.capacity) +
                                    " < " + std::to_string(current) + ")");
    }

    outcome.changed = true;
    if (options.dryRun) {
        outcome.msg = "Would resize volume from " + std::to_string(current) + " to " + std::to_string(spec.capacity) + " bytes";
        return outcome;
    }
    VRLOG_INFO("Resizing volume {}/{} to {} bytes", spec.pool, spec.name, spec.capacity);
    volume->resize(spec.capacity);
    applyPermissions(*volume, spec, options, outcome);
    outcome.msg = "Volume resized from " + std::to_string(current) + " to " + std::to_string(spec.capacity) + " bytes";
    outcome.volumeInfo = VolumeInspector::describe(*volume, spec.pool);
    return outcome;
}

void VolumeReconciler::upload(IStorageVolumeHandle& volume, const std::string& sourcePath, std::uint64_t length) {
    std::ifstream in(sourcePath, std::ios::binary);
    if (!in) throw StorageException("Cannot open import file " + sourcePath);

    auto stream = volume.upload(length);
    std::vector<char> chunk(defaults.importChunkSize == 0 ? 1024 * 1024 : defaults.importChunkSize);
    while (in) {
        in.read(chunk.data(), static_cast<std::streamsize>(chunk.size()));
        const auto got = in.gcount();
        if (got <= 0) break;
        stream->send(chunk.data(), static_cast<std::size_t>(got));
    }
    if (in.bad()) throw StorageException("Read error on import file " + sourcePath);
    stream->finish();
}

VolumeOutcome VolumeReconciler::import(IStoragePoolHandle& pool, const VolumeSpec& spec, const ReconcileOptions& options) {
    VolumeOutcome outcome;
    if (!options.dryRun && pools.ensureActive(pool)) pool.refresh();
    if (auto existing = pool.isActive() ? pool.lookupVolume(spec.name) : nullptr) {
        outcome.msg = "Volume already exists";
        outcome.volumeInfo = VolumeInspector::describe(*existing, spec.pool);
        return outcome;
    }

    std::error_code ec;
    if (spec.importPath.empty() || !std::filesystem::is_regular_file(spec.importPath, ec)) {
        throw NotFoundException("Import file " + spec.importPath + " does not exist");
    }
    const auto size = static_cast<std::uint64_t>(std::filesystem::file_size(spec.importPath, ec));
    if (ec) throw StorageException("Cannot stat import file " + spec.importPath + ": " + ec.message());

    VolumeDefinitionBuilder builder;
    builder.setName(spec.name).setFormat(spec.importFormat).setCapacity(size).setAllocation(size);
    const std::string xml = builder.build();

    outcome.changed = true;
    if (options.dryRun) {
        outcome.msg = "Would import " + spec.importPath + " as volume " + spec.name;
        return outcome;
    }

    VRLOG_INFO("Importing {} ({} bytes) into {}/{}", spec.importPath, size, spec.pool, spec.name);
    auto volume = pool.createVolume(xml, false);
    try {
        upload(*volume, spec.importPath, size);
    } catch (const VmException& e) {
        std::string message = std::string("Error importing volume: ") + e.what();
        try {
            volume->remove();
        } catch (const LibvirtException& cleanup) {
            message += "; the partially imported volume could not be deleted: " + std::string(cleanup.what());
            throw PartialFailureException(message);
        }
        throw StorageException(message);
    }

    applyPermissions(*volume, spec, options, outcome);
    outcome.msg = "Volume imported successfully (format: " + spec.importFormat + ")";
    outcome.volumeInfo = VolumeInspector::describe(*volume, spec.pool);
    return outcome;
}
