#include "upload/upload_orchestrator.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "common/uuid.hpp"
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>

UploadOrchestrator::UploadOrchestrator(UploadOptions options,
                                       std::string workDir,
                                       std::shared_ptr<HelperInvoker> helpers,
                                       std::shared_ptr<ExportDaemonLauncher> launcher,
                                       std::shared_ptr<DescriptorBuilder> descriptors,
                                       ExitGuard& guard)
    : options_(std::move(options))
    , workDir_(std::move(workDir))
    , helpers_(std::move(helpers))
    , launcher_(std::move(launcher))
    , descriptors_(std::move(descriptors))
    , guard_(guard) {
}

HelperParams UploadOrchestrator::invariantParams() const {
    HelperParams params;
    params.set("verbose", Logger::isEnabled(LogLevel::DEBUG));
    params.set("output_conn", options_.outputConn);
    params.set("output_password", options_.outputPasswordFile);
    params.set("output_storage", options_.outputStorage);
    params.set("rhv_cafile", options_.caFile ? HelperDocument(*options_.caFile) : HelperDocument(nullptr));
    params.set("rhv_cluster", options_.clusterName());
    params.set("rhv_direct", options_.direct);
    // The engine SDK's "insecure" flag: skip peer verification.
    params.set("insecure", !options_.verifyPeer);
    if (options_.diskUUIDs) {
        params.setStringList("rhv_disk_uuids", *options_.diskUUIDs);
    }
    return params;
}

std::string UploadOrchestrator::socketPath(int index) const {
    return workDir_ + "/out" + std::to_string(index);
}

std::string UploadOrchestrator::diskName(const std::string& outputName, int index) {
    char suffix[16];
    std::snprintf(suffix, sizeof(suffix), "-%03d", index);
    return outputName + suffix;
}

ConversionState UploadOrchestrator::setup(const std::vector<DiskDescriptor>& disks,
                                          const std::string& sourceName) {
    if (disks.empty()) {
        throw ConfigurationError("the guest has no disks to upload");
    }

    // Checked before anything is sent to the engine.
    std::vector<std::string> diskUuids = uuid::resolveDiskUUIDs(disks.size(), options_.diskUUIDs);

    ConversionState state;
    state.params = invariantParams();
    state.clusterName = options_.clusterName();
    for (const auto& disk : disks) {
        state.diskSizes.push_back(disk.size);
    }

    runPrechecks(state);

    state.outputName = options_.outputName.value_or(sourceName);
    state.params.set("output_name", state.outputName);

    // Needs the output name, so it cannot be part of the precheck. Must run
    // before the first transfer is opened.
    if (!helpers_->invoke(Helper::VmCheck, state.params).succeeded()) {
        throw RemoteRejection("failed vmchecks, see earlier errors");
    }

    cancelParams_ = state.params;
    guard_.arm(diskUuids, [this](const std::vector<std::string>& transferIds,
                                 const std::vector<std::string>& uuids) {
        return cancel(transferIds, uuids);
    });

    for (size_t i = 0; i < disks.size(); ++i) {
        TransferSession session = openTransfer(state, disks[i], diskUuids[i]);
        startExportDaemon(session, disks[i].size);
        state.sessions.push_back(session);
    }

    Logger::info("Opened " + std::to_string(state.sessions.size()) + " transfer(s) for " + state.outputName);
    return state;
}

void UploadOrchestrator::runPrechecks(ConversionState& state) {
    HelperResult result = helpers_->invoke(Helper::Precheck, state.params, {}, true);
    if (!result.succeeded()) {
        throw RemoteRejection("failed server prechecks, see earlier errors");
    }

    const std::string source = helperName(Helper::Precheck);
    state.storageDomainUuid = requireString(*result.output, "rhv_storagedomain_uuid", source);
    state.clusterUuid = requireString(*result.output, "rhv_cluster_uuid", source);
    state.clusterCpuArchitecture = requireString(*result.output, "rhv_cluster_cpu_architecture", source);
}

TransferSession UploadOrchestrator::openTransfer(const ConversionState& state,
                                                 const DiskDescriptor& disk,
                                                 const std::string& diskUuid) {
    TransferSession session;
    session.index = disk.index;
    session.diskUuid = diskUuid;
    session.socketPath = socketPath(disk.index);
    guard_.registerSocket(session.socketPath);

    HelperParams params = state.params;
    params.set("disk_name", diskName(state.outputName, disk.index));
    params.set("disk_format", options_.outputFormat);
    params.set("disk_size", disk.size);
    params.set("disk_uuid", diskUuid);

    HelperResult result = helpers_->invoke(Helper::Transfer, params, {}, true);
    if (!result.succeeded()) {
        throw RemoteRejection("failed to start transfer, see earlier errors");
    }

    const std::string source = helperName(Helper::Transfer);
    // Registered first: the engine holds the transfer even if the rest of
    // the result is malformed.
    session.transferId = requireString(*result.output, "transfer_id", source);
    guard_.registerTransfer(session.transferId);
    session.destinationUrl = requireString(*result.output, "destination_url", source);
    session.isEngineHost = requireBool(*result.output, "is_ovirt_host", source);

    Logger::debug("disk " + std::to_string(disk.index) + ": transfer " + session.transferId +
                  " -> " + session.destinationUrl);
    return session;
}

void UploadOrchestrator::startExportDaemon(TransferSession& session, uint64_t diskSize) {
    ExportDaemonConfig config;
    config.socketPath = session.socketPath;
    config.diskSize = diskSize;
    config.destinationUrl = session.destinationUrl;
    config.caFile = options_.caFile;
    config.insecure = !options_.verifyPeer;
    config.isEngineHost = session.isEngineHost;

    pid_t pid = guard_.adoptDaemon([this, &config]() { return launcher_->spawn(config); });
    session.daemonPid = pid;
    try {
        launcher_->waitUntilReady(pid, config);
    } catch (const ProcessError&) {
        session.daemonPid.reset();
        guard_.forgetDaemons({pid});
        throw;
    }
}

void UploadOrchestrator::stopExportDaemons(ConversionState& state) {
    for (const auto& session : state.sessions) {
        if (session.isActive() && !launcher_->terminate(*session.daemonPid)) {
            throw ProcessError("could not stop export daemon " + std::to_string(*session.daemonPid) +
                               ": " + strerror(errno));
        }
    }

    for (auto& session : state.sessions) {
        if (!session.isActive()) {
            continue;
        }
        pid_t pid = *session.daemonPid;
        if (!launcher_->waitForExit(pid)) {
            throw ProcessError("export daemon " + std::to_string(pid) + " for disk " +
                               std::to_string(session.index) + " did not exit");
        }
        session.daemonPid.reset();
        guard_.forgetDaemons({pid});
    }
}

FinalizeResult UploadOrchestrator::finalize(ConversionState& state, const FinalizeRequest& request) {
    if (state.clusterCpuArchitecture != request.guestArchitecture) {
        throw ConfigurationError("the cluster '" + state.clusterName + "' does not support the architecture " +
                                 request.guestArchitecture + " but " + state.clusterCpuArchitecture);
    }

    // Data-plane traffic during the finalize call corrupts the remote
    // transfer state, so every daemon must be gone first.
    stopExportDaemons(state);
    if (state.anyActive()) {
        throw ProcessError("export daemons still running, refusing to finalize");
    }

    HelperParams params = state.params;
    params.setStringList("transfer_ids", state.transferIds());
    params.setStringList("disk_uuids", state.diskUuids());
    if (!helpers_->invoke(Helper::Finalize, params).succeeded()) {
        throw RemoteRejection("failed to finalize the transfers, see earlier errors");
    }

    FinalizeResult result;
    for (size_t i = 0; i < state.diskSizes.size(); ++i) {
        result.volumeUuids.push_back(uuid::generate());
    }
    result.vmUuid = uuid::generate();

    DescriptorRequest descriptor;
    descriptor.source = request.source;
    descriptor.inspection = request.inspection;
    descriptor.target = request.target;
    descriptor.diskSizes = state.diskSizes;
    descriptor.sparse = true;
    descriptor.outputFormat = options_.outputFormat;
    descriptor.outputName = state.outputName;
    descriptor.storageDomainUuid = state.storageDomainUuid;
    descriptor.diskUuids = state.diskUuids();
    descriptor.volumeUuids = result.volumeUuids;
    descriptor.vmUuid = result.vmUuid;
    std::string document = descriptors_->build(descriptor);

    result.descriptorPath = workDir_ + "/vm.ovf";
    std::ofstream out(result.descriptorPath, std::ios::trunc);
    out << document;
    out.close();
    if (!out) {
        throw ProcessError("Failed to write " + result.descriptorPath);
    }

    HelperParams createParams = params.with("rhv_cluster_uuid", state.clusterUuid);
    if (!helpers_->invoke(Helper::CreateVm, createParams, {result.descriptorPath}).succeeded()) {
        throw RemoteRejection("failed to create virtual machine, see earlier errors");
    }

    Logger::info("Created virtual machine " + state.outputName + " (" + result.vmUuid + ")");
    return result;
}

std::string UploadOrchestrator::cancel(const std::vector<std::string>& transferIds,
                                       const std::vector<std::string>& diskUuids) {
    HelperParams params = cancelParams_;
    params.setStringList("transfer_ids", transferIds);
    params.setStringList("disk_uuids", diskUuids);

    try {
        HelperResult result = helpers_->invoke(Helper::Cancel, params);
        if (!result.succeeded()) {
            return "cancel helper exited with status " + std::to_string(result.exitStatus) +
                   ", disks may have to be removed from the engine manually";
        }
    } catch (const std::exception& e) {
        return "failed to cancel transfers: " + std::string(e.what());
    }
    return "";
}
