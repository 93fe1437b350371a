#include "upload/upload_options.hpp"
#include "common/errors.hpp"
#include "common/utils.hpp"
#include "common/uuid.hpp"
#include <filesystem>
#include <fstream>

namespace {

bool parseBool(const std::string& key, const std::string& value) {
    if (value.empty() || value == "true" || value == "yes" || value == "1" || value == "on") {
        return true;
    }
    if (value == "false" || value == "no" || value == "0" || value == "off") {
        return false;
    }
    throw ConfigurationError("-o rhv-upload: -oo " + key + ": invalid boolean '" + value + "'");
}

}

std::string UploadOptions::describe() const {
    std::string s = "-o rhv-upload";
    if (!outputConn.empty()) {
        s += " -oc " + outputConn;
    }
    if (!outputStorage.empty()) {
        s += " -os " + outputStorage;
    }
    return s;
}

void applyOutputOption(UploadOptions& options, const std::string& option) {
    std::string key = option;
    std::string value;
    size_t eq = option.find('=');
    if (eq != std::string::npos) {
        key = option.substr(0, eq);
        value = option.substr(eq + 1);
    }

    if (key == "rhv-cafile") {
        if (options.caFile) {
            throw ConfigurationError("-o rhv-upload: -oo rhv-cafile set more than once");
        }
        options.caFile = value;
    } else if (key == "rhv-cluster") {
        if (options.cluster) {
            throw ConfigurationError("-o rhv-upload: -oo rhv-cluster set more than once");
        }
        options.cluster = value;
    } else if (key == "rhv-direct") {
        options.direct = parseBool(key, value);
    } else if (key == "rhv-verifypeer") {
        options.verifyPeer = parseBool(key, value);
    } else if (key == "rhv-disk-uuid") {
        if (!uuid::isValid(value)) {
            throw ConfigurationError("-o rhv-upload: invalid UUID for -oo rhv-disk-uuid: " + value);
        }
        if (!options.diskUUIDs) {
            options.diskUUIDs.emplace();
        }
        options.diskUUIDs->push_back(value);
    } else {
        throw ConfigurationError("-o rhv-upload: unknown output option '-oo " + key + "'");
    }
}

void validateUploadOptions(const UploadOptions& options) {
    if (options.outputConn.empty()) {
        throw ConfigurationError(
            "-o rhv-upload: use '-oc' to point to the engine REST API URL, which is usually "
            "https://servername/ovirt-engine/api");
    }
    if (!utils::isHttpUrl(options.outputConn)) {
        throw ConfigurationError("-o rhv-upload: -oc " + options.outputConn +
                                 ": not an http or https URL");
    }
    if (options.outputPasswordFile.empty()) {
        throw ConfigurationError(
            "-o rhv-upload: output password file was not specified, use '-op' to point to a "
            "file which contains the password used to connect to the engine");
    }
    std::ifstream password(options.outputPasswordFile);
    if (!password) {
        throw ConfigurationError("-o rhv-upload: cannot read password file " +
                                 options.outputPasswordFile);
    }
    if (options.outputStorage.empty()) {
        throw ConfigurationError("-o rhv-upload: output storage was not specified, use '-os'");
    }
    if (options.outputFormat != "raw" && options.outputFormat != "qcow2") {
        throw ConfigurationError(
            "rhv-upload: -of " + options.outputFormat +
            ": Only output format 'raw' or 'qcow2' is supported.  If the input is in a different "
            "format then force one of these output formats by adding either '-of raw' or "
            "'-of qcow2' on the command line.");
    }
    if (options.caFile && !std::filesystem::exists(*options.caFile)) {
        throw ConfigurationError("-o rhv-upload: -oo rhv-cafile: " + *options.caFile +
                                 ": file not found");
    }
}

std::string outputOptionsHelp() {
    return "Output options (-oo) which can be used with -o rhv-upload:\n"
           "\n"
           "  -oo rhv-cafile=CA.PEM           Set 'ca.pem' certificate bundle filename.\n"
           "  -oo rhv-cluster=CLUSTERNAME     Set the engine cluster name.\n"
           "  -oo rhv-direct[=true|false]     Use direct transfer mode (default: false).\n"
           "  -oo rhv-verifypeer[=true|false] Verify server identity (default: false).\n"
           "\n"
           "You can override the UUIDs of the disks, instead of using autogenerated UUIDs\n"
           "after their uploads (if you do, you must supply one for each disk):\n"
           "\n"
           "  -oo rhv-disk-uuid=UUID          Disk UUID\n";
}
