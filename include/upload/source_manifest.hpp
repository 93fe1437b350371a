#pragma once

#include "upload/conversion_state.hpp"
#include "upload/helper_params.hpp"
#include <cstdint>
#include <string>
#include <vector>

struct SourceDisk {
    int index{0};
    std::string path;
    std::string format;
    uint64_t size{0};
};

// The guest as described by the disk-source collaborator.
struct SourceManifest {
    std::string name;
    std::string architecture;
    HelperDocument source;
    HelperDocument inspection;
    HelperDocument target;
    std::vector<SourceDisk> disks;

    std::vector<DiskDescriptor> diskDescriptors() const;

    // Throws ConfigurationError on unreadable or incomplete manifests.
    static SourceManifest load(const std::string& path);
    static SourceManifest parse(const HelperDocument& doc);
};
