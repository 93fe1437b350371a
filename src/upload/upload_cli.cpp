#include "upload/upload_cli.hpp"
#include "upload/descriptor_builder.hpp"
#include "upload/disk_copier.hpp"
#include "upload/exit_guard.hpp"
#include "upload/export_daemon.hpp"
#include "upload/helper_invoker.hpp"
#include "upload/preflight.hpp"
#include "upload/source_manifest.hpp"
#include "upload/upload_orchestrator.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "common/signal_watcher.hpp"
#include "main/upload_main.hpp"
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <vector>

namespace {

std::string nextValue(int argc, char* argv[], int& i, const std::string& flag) {
    if (i + 1 >= argc) {
        throw ConfigurationError("option " + flag + " requires an argument");
    }
    return argv[++i];
}

}

UploadArguments UploadCLI::parseArguments(int argc, char* argv[]) {
    UploadArguments args;
    args.tools.loadFromEnvironment();

    // argv[0] is the subcommand name.
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            args.help = true;
        } else if (arg == "--query-options") {
            args.queryOptions = true;
        } else if (arg == "-oc") {
            args.options.outputConn = nextValue(argc, argv, i, arg);
        } else if (arg == "-op") {
            args.options.outputPasswordFile = nextValue(argc, argv, i, arg);
        } else if (arg == "-os") {
            args.options.outputStorage = nextValue(argc, argv, i, arg);
        } else if (arg == "-of") {
            args.options.outputFormat = nextValue(argc, argv, i, arg);
        } else if (arg == "-on") {
            args.options.outputName = nextValue(argc, argv, i, arg);
        } else if (arg == "-oo") {
            applyOutputOption(args.options, nextValue(argc, argv, i, arg));
        } else if (arg == "--disks") {
            args.manifestPath = nextValue(argc, argv, i, arg);
        } else if (arg == "--work-dir") {
            args.workDir = nextValue(argc, argv, i, arg);
        } else if (arg == "--keep-work-dir") {
            args.keepWorkDir = true;
        } else if (arg == "--helper-dir") {
            args.tools.helperDir = nextValue(argc, argv, i, arg);
        } else if (arg == "--python") {
            args.tools.interpreter = nextValue(argc, argv, i, arg);
        } else if (arg == "--nbdkit") {
            args.tools.exportHelper = nextValue(argc, argv, i, arg);
        } else if (arg == "--verbose") {
            args.verbose = true;
        } else {
            throw ConfigurationError("unknown option: " + arg);
        }
    }

    if (!args.help && !args.queryOptions && args.manifestPath.empty()) {
        throw ConfigurationError("no disk manifest given, use '--disks'");
    }
    return args;
}

int UploadCLI::run(int argc, char* argv[]) {
    UploadArguments args;
    try {
        args = parseArguments(argc, argv);
    } catch (const ConfigurationError& e) {
        std::cerr << "vmpublish: " << e.what() << std::endl;
        printUploadUsage();
        return 1;
    }

    if (args.help) {
        printUploadUsage();
        return 0;
    }
    if (args.queryOptions) {
        std::cout << outputOptionsHelp();
        return 0;
    }

    Logger::setLogLevel(args.verbose ? LogLevel::DEBUG : LogLevel::INFO);

    try {
        return execute(args);
    } catch (const UploadError& e) {
        Logger::error(e.what());
        return 1;
    }
}

int UploadCLI::execute(const UploadArguments& args) {
    validateUploadOptions(args.options);
    Logger::info("Uploading to " + args.options.describe());

    SourceManifest manifest = SourceManifest::load(args.manifestPath);

    EnvironmentPreflight preflight(args.tools);
    preflight.verify();

    std::string workDir = prepareWorkDir(args);
    auto helpers = std::make_shared<ScriptHelperInvoker>(args.tools, workDir);
    auto launcher = std::make_shared<NbdkitLauncher>(args.tools, preflight.selinuxEnabled());
    auto descriptors = std::make_shared<HelperDescriptorBuilder>(helpers);

    int status = 1;
    {
        ExitGuard guard(workDir, launcher);
        SignalWatcher watcher([&guard](int) { guard.run(); });
        UploadOrchestrator orchestrator(args.options, workDir, helpers, launcher, descriptors, guard);

        try {
            ConversionState state = orchestrator.setup(manifest.diskDescriptors(), manifest.name);

            QemuImgCopier copier(args.tools);
            for (size_t i = 0; i < manifest.disks.size(); ++i) {
                const auto& disk = manifest.disks[i];
                copier.copy(disk.path, disk.format, args.options.outputFormat, state.sessions[i].socketPath);
            }

            FinalizeRequest request;
            request.guestArchitecture = manifest.architecture;
            request.source = manifest.source;
            request.inspection = manifest.inspection;
            request.target = manifest.target;
            orchestrator.finalize(state, request);

            std::ofstream marker(guard.successMarkerPath());
            if (!marker) {
                throw ProcessError("cannot create " + guard.successMarkerPath());
            }
            marker.close();
            status = 0;
        } catch (const UploadError& e) {
            Logger::error(e.what());
        } catch (const std::exception& e) {
            Logger::error("Unexpected error: " + std::string(e.what()));
        }

        guard.run();
    }

    if (!args.keepWorkDir && args.workDir.empty()) {
        removeWorkDir(workDir);
    }
    return status;
}

std::string UploadCLI::prepareWorkDir(const UploadArguments& args) const {
    if (!args.workDir.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(args.workDir, ec);
        if (ec) {
            throw ConfigurationError("cannot create work directory " + args.workDir + ": " + ec.message());
        }
        // A marker left by an earlier run would suppress rollback.
        std::filesystem::remove(args.workDir + "/" + ExitGuard::kSuccessMarker, ec);
        if (ec) {
            throw ConfigurationError("cannot remove stale marker in " + args.workDir + ": " + ec.message());
        }
        return args.workDir;
    }

    const char* tmp = std::getenv("TMPDIR");
    std::string pattern = std::string(tmp && *tmp ? tmp : "/var/tmp") + "/vmpublish.XXXXXX";
    std::vector<char> buffer(pattern.begin(), pattern.end());
    buffer.push_back('\0');
    if (!mkdtemp(buffer.data())) {
        throw ConfigurationError("mkdtemp: " + pattern + ": " + strerror(errno));
    }
    return buffer.data();
}

void UploadCLI::removeWorkDir(const std::string& dir) const {
    std::error_code ec;
    std::filesystem::remove_all(dir, ec);
    if (ec) {
        Logger::warning("could not remove " + dir + ": " + ec.message());
    }
}
