#pragma once

#include "upload/helper_params.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <sys/types.h>

// One source disk as handed over by the disk-source collaborator.
struct DiskDescriptor {
    int index{0};
    uint64_t size{0};
};

// Upload context for one disk.
struct TransferSession {
    int index{0};
    std::string diskUuid;
    std::string transferId;
    std::string destinationUrl;
    std::string socketPath;
    bool isEngineHost{false};
    std::optional<pid_t> daemonPid;  // set while the export daemon runs

    bool isActive() const { return daemonPid.has_value(); }
};

// Everything Setup hands to Finalize.
struct ConversionState {
    std::vector<TransferSession> sessions;
    std::vector<uint64_t> diskSizes;

    // Resolved by the remote precheck; never modified afterwards.
    std::string storageDomainUuid;
    std::string clusterUuid;
    std::string clusterCpuArchitecture;

    std::string clusterName;
    std::string outputName;

    // Shared parameter set, including output_name.
    HelperParams params;

    std::vector<std::string> transferIds() const;
    std::vector<std::string> diskUuids() const;
    bool anyActive() const;
};
