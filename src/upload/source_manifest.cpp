#include "upload/source_manifest.hpp"
#include "upload/disk_probe.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include <fstream>

namespace {

std::string requiredString(const HelperDocument& doc, const std::string& key) {
    auto it = doc.find(key);
    if (it == doc.end() || !it->is_string() || it->get<std::string>().empty()) {
        throw ConfigurationError("disk manifest: missing '" + key + "'");
    }
    return it->get<std::string>();
}

HelperDocument optionalObject(const HelperDocument& doc, const std::string& key) {
    auto it = doc.find(key);
    if (it == doc.end() || it->is_null()) {
        return HelperDocument::object();
    }
    return *it;
}

}

std::vector<DiskDescriptor> SourceManifest::diskDescriptors() const {
    std::vector<DiskDescriptor> descriptors;
    for (const auto& disk : disks) {
        descriptors.push_back({disk.index, disk.size});
    }
    return descriptors;
}

SourceManifest SourceManifest::load(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw ConfigurationError("cannot open disk manifest " + path);
    }
    try {
        return parse(HelperDocument::parse(in));
    } catch (const nlohmann::json::exception& e) {
        throw ConfigurationError("disk manifest " + path + ": " + std::string(e.what()));
    }
}

SourceManifest SourceManifest::parse(const HelperDocument& doc) {
    if (!doc.is_object()) {
        throw ConfigurationError("disk manifest: expected a JSON object");
    }

    SourceManifest manifest;
    manifest.name = requiredString(doc, "name");
    manifest.architecture = requiredString(doc, "arch");
    manifest.source = optionalObject(doc, "source");
    manifest.inspection = optionalObject(doc, "inspection");
    manifest.target = optionalObject(doc, "target");

    auto disks = doc.find("disks");
    if (disks == doc.end() || !disks->is_array() || disks->empty()) {
        throw ConfigurationError("disk manifest: the guest has no disks");
    }

    int index = 0;
    for (const auto& entry : *disks) {
        SourceDisk disk;
        disk.index = index++;
        disk.path = requiredString(entry, "path");

        if (entry.contains("format")) {
            disk.format = entry.at("format").get<std::string>();
        } else {
            disk.format = DiskProbe::formatName(DiskProbe::detectFormat(disk.path));
            if (disk.format == "unknown") {
                throw ConfigurationError("disk manifest: cannot read " + disk.path);
            }
        }

        if (entry.contains("size")) {
            const auto& size = entry.at("size");
            bool nonNegative = size.is_number_unsigned() ||
                               (size.is_number_integer() && size.get<int64_t>() >= 0);
            if (!nonNegative) {
                throw ConfigurationError("disk manifest: invalid size " + size.dump() + " for " + disk.path);
            }
            disk.size = size.get<uint64_t>();
        } else {
            disk.size = DiskProbe::getSize(disk.path);
        }
        if (disk.size == 0) {
            throw ConfigurationError("disk manifest: cannot determine the size of " + disk.path);
        }

        Logger::debug("disk " + std::to_string(disk.index) + ": " + disk.path + " (" + disk.format +
                      ", " + std::to_string(disk.size) + " bytes)");
        manifest.disks.push_back(disk);
    }
    return manifest;
}
