#pragma once

#include "upload/tool_config.hpp"
#include <functional>
#include <map>
#include <string>
#include <vector>

// Checks the local tool chain before any remote state is touched.
// Each failed check throws EnvironmentError with the remedy in the message.
class EnvironmentPreflight {
public:
    // Parallel threading model in the python plugin and API version 2.
    static constexpr const char* kExportHelperMinVersion = "1.22.0";
    static constexpr const char* kSdkModule = "ovirtsdk4";

    // Returns true when the host runs a mandatory access control subsystem.
    using SecurityProbe = std::function<bool()>;

    explicit EnvironmentPreflight(ToolConfig tools, SecurityProbe probe = hostHasSelinux);

    void verify();

    // Valid after verify(): export daemons must label their sockets.
    bool selinuxEnabled() const { return selinuxEnabled_; }

    static std::map<std::string, std::string> parseConfig(const std::string& text);
    static std::vector<int> parseVersion(const std::string& version);
    static bool versionAtLeast(const std::string& version, const std::string& minimum);

    // Asks libvirt for the node security model, falling back to selinuxfs.
    static bool hostHasSelinux();

private:
    void checkInterpreter();
    void checkSdkModule();
    void checkExportHelperInstalled();
    std::map<std::string, std::string> readExportHelperConfig();
    void checkExportHelperVersion(const std::map<std::string, std::string>& config);
    void checkExportHelperSelinux(const std::map<std::string, std::string>& config);
    void checkPluginLoads();

    ToolConfig tools_;
    SecurityProbe probe_;
    std::string interpreterPath_;
    bool selinuxEnabled_{false};
};
