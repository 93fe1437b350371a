#pragma once

#include "upload/conversion_state.hpp"
#include "upload/descriptor_builder.hpp"
#include "upload/exit_guard.hpp"
#include "upload/export_daemon.hpp"
#include "upload/helper_invoker.hpp"
#include "upload/upload_options.hpp"
#include <memory>
#include <string>
#include <vector>

// What the conversion learned about the guest, needed at finalize time.
struct FinalizeRequest {
    std::string guestArchitecture;
    HelperDocument source;
    HelperDocument inspection;
    HelperDocument target;
};

struct FinalizeResult {
    std::vector<std::string> volumeUuids;
    std::string vmUuid;
    std::string descriptorPath;
};

// Drives the upload of one guest: setup opens one transfer and one export
// daemon per disk, finalize commits the transfers and creates the VM, and
// cancel (reached only through the exit guard) rolls the transfers back.
class UploadOrchestrator {
public:
    UploadOrchestrator(UploadOptions options,
                       std::string workDir,
                       std::shared_ptr<HelperInvoker> helpers,
                       std::shared_ptr<ExportDaemonLauncher> launcher,
                       std::shared_ptr<DescriptorBuilder> descriptors,
                       ExitGuard& guard);

    ConversionState setup(const std::vector<DiskDescriptor>& disks, const std::string& sourceName);
    FinalizeResult finalize(ConversionState& state, const FinalizeRequest& request);

    // Best effort: never throws, returns a diagnostic (empty on success).
    std::string cancel(const std::vector<std::string>& transferIds,
                       const std::vector<std::string>& diskUuids);

    // Parameters shared by every helper call, before any phase adds to them.
    HelperParams invariantParams() const;

    std::string socketPath(int index) const;
    static std::string diskName(const std::string& outputName, int index);

private:
    void runPrechecks(ConversionState& state);
    TransferSession openTransfer(const ConversionState& state, const DiskDescriptor& disk,
                                 const std::string& diskUuid);
    void startExportDaemon(TransferSession& session, uint64_t diskSize);
    void stopExportDaemons(ConversionState& state);

    UploadOptions options_;
    std::string workDir_;
    std::shared_ptr<HelperInvoker> helpers_;
    std::shared_ptr<ExportDaemonLauncher> launcher_;
    std::shared_ptr<DescriptorBuilder> descriptors_;
    ExitGuard& guard_;
    HelperParams cancelParams_;
};
