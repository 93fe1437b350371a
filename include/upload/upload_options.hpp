#pragma once

#include <optional>
#include <string>
#include <vector>

// Output options for publishing to the remote engine. Parsed once from the
// command line and not modified afterwards.
struct UploadOptions {
    std::string outputConn;          // engine REST API URL
    std::string outputPasswordFile;  // file holding the engine password
    std::string outputStorage;       // target storage domain name
    std::string outputFormat{"raw"}; // "raw" or "qcow2"
    std::optional<std::string> outputName;
    std::optional<std::string> caFile;
    std::optional<std::string> cluster;
    bool direct{false};
    bool verifyPeer{false};
    std::optional<std::vector<std::string>> diskUUIDs;

    std::string clusterName() const { return cluster.value_or("Default"); }

    // Short form for log messages, e.g. "-o rhv-upload -oc URL -os STORAGE".
    std::string describe() const;
};

// Applies one "-oo key[=value]" output option. Throws ConfigurationError.
void applyOutputOption(UploadOptions& options, const std::string& option);

// Checks required options and the output format. Throws ConfigurationError.
void validateUploadOptions(const UploadOptions& options);

std::string outputOptionsHelp();
