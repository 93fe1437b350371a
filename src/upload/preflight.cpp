#include "upload/preflight.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "common/subprocess.hpp"
#include <libvirt/libvirt.h>
#include <libvirt/virterror.h>
#include <algorithm>
#include <cctype>
#include <cstring>
#include <filesystem>
#include <sstream>

namespace {

void ignoreLibvirtError(void*, virErrorPtr) {
}

}

EnvironmentPreflight::EnvironmentPreflight(ToolConfig tools, SecurityProbe probe)
    : tools_(std::move(tools))
    , probe_(std::move(probe)) {
}

void EnvironmentPreflight::verify() {
    checkInterpreter();
    checkSdkModule();
    checkExportHelperInstalled();
    auto config = readExportHelperConfig();
    checkExportHelperVersion(config);
    checkExportHelperSelinux(config);
    checkPluginLoads();
    Logger::info("Environment checks passed");
}

void EnvironmentPreflight::checkInterpreter() {
    interpreterPath_ = Subprocess::findProgram(tools_.interpreter);
    if (interpreterPath_.empty()) {
        throw EnvironmentError("could not find the interpreter '" + tools_.interpreter +
                               "'; install it or set VMPUBLISH_PYTHON");
    }
    Logger::debug("using interpreter " + interpreterPath_);
}

void EnvironmentPreflight::checkSdkModule() {
    int status = Subprocess::run({interpreterPath_, "-c", std::string("import ") + kSdkModule});
    if (status != 0) {
        throw EnvironmentError(std::string("the Python module '") + kSdkModule +
                               "' could not be loaded, is it installed?  See previous messages for problems.");
    }
}

void EnvironmentPreflight::checkExportHelperInstalled() {
    int status = 127;
    if (!Subprocess::findProgram(tools_.exportHelper).empty()) {
        status = Subprocess::runQuiet({tools_.exportHelper, "--version"});
    }
    if (status != 0) {
        throw EnvironmentError(tools_.exportHelper +
                               " is not installed or not working.  It is required to upload "
                               "disks to the engine.");
    }
}

std::map<std::string, std::string> EnvironmentPreflight::readExportHelperConfig() {
    int status = 0;
    std::string text = Subprocess::capture({tools_.exportHelper, "--dump-config"}, status);
    if (status != 0) {
        throw EnvironmentError(tools_.exportHelper + " --dump-config failed, see earlier errors");
    }
    return parseConfig(text);
}

void EnvironmentPreflight::checkExportHelperVersion(const std::map<std::string, std::string>& config) {
    auto it = config.find("version");
    if (it == config.end()) {
        throw EnvironmentError(tools_.exportHelper + " --dump-config did not report a version");
    }
    Logger::debug(tools_.exportHelper + " version " + it->second);
    if (!versionAtLeast(it->second, kExportHelperMinVersion)) {
        throw EnvironmentError(tools_.exportHelper + " is not new enough, you need to upgrade to " +
                               tools_.exportHelper + " >= " + kExportHelperMinVersion);
    }
}

void EnvironmentPreflight::checkExportHelperSelinux(const std::map<std::string, std::string>& config) {
    selinuxEnabled_ = probe_ && probe_();
    if (!selinuxEnabled_) {
        return;
    }

    auto it = config.find("selinux");
    std::string selinux = it == config.end() ? "no" : it->second;
    if (selinux == "no") {
        throw EnvironmentError(tools_.exportHelper +
                               " was compiled without SELinux support.  You will have to recompile " +
                               tools_.exportHelper +
                               " with libselinux-devel installed, or else set SELinux to Permissive "
                               "mode while doing the conversion.");
    }
}

void EnvironmentPreflight::checkPluginLoads() {
    std::vector<std::string> argv = {
        tools_.exportHelper, "python", tools_.helperPath("plugin.py"), "--dump-plugin"
    };
    Logger::debug(Subprocess::commandLine(argv));
    if (Subprocess::runQuiet(argv) != 0) {
        throw EnvironmentError(tools_.exportHelper +
                               " python plugin is not installed or not working.  It is required "
                               "to upload disks to the engine.");
    }
}

std::map<std::string, std::string> EnvironmentPreflight::parseConfig(const std::string& text) {
    std::map<std::string, std::string> config;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        size_t eq = line.find('=');
        if (eq == std::string::npos || eq == 0) {
            continue;
        }
        config[line.substr(0, eq)] = line.substr(eq + 1);
    }
    return config;
}

std::vector<int> EnvironmentPreflight::parseVersion(const std::string& version) {
    std::vector<int> parts;
    size_t pos = 0;
    while (pos < version.size() && std::isdigit(static_cast<unsigned char>(version[pos]))) {
        int value = 0;
        while (pos < version.size() && std::isdigit(static_cast<unsigned char>(version[pos]))) {
            value = value * 10 + (version[pos] - '0');
            ++pos;
        }
        parts.push_back(value);
        if (pos < version.size() && version[pos] == '.') {
            ++pos;
        } else {
            break;
        }
    }
    return parts;
}

bool EnvironmentPreflight::versionAtLeast(const std::string& version, const std::string& minimum) {
    auto have = parseVersion(version);
    auto need = parseVersion(minimum);
    if (have.empty()) {
        return false;
    }
    have.resize(std::max(have.size(), need.size()), 0);
    need.resize(have.size(), 0);
    return have >= need;
}

bool EnvironmentPreflight::hostHasSelinux() {
    virSetErrorFunc(nullptr, ignoreLibvirtError);
    virConnectPtr conn = virConnectOpenReadOnly("qemu:///system");
    if (conn) {
        virSecurityModel model;
        std::memset(&model, 0, sizeof(model));
        int rc = virNodeGetSecurityModel(conn, &model);
        virConnectClose(conn);
        if (rc == 0) {
            return std::strcmp(model.model, "selinux") == 0;
        }
    }

    std::error_code ec;
    return std::filesystem::exists("/sys/fs/selinux/enforce", ec);
}
