/**
 * @file qrshare.cpp
 * @brief qrshare command-line tool
 *
 * Shares files or directories over HTTP on the local network and shows the
 * download link as a QR code.
 *
 * Usage:
 *   qrshare [--zip] [-i IFACE] [--expire SECONDS] [--password SECRET]
 *           [--log-file PATH] <path>...
 */

#include "qrshare/AppPaths.h"
#include "qrshare/ErrorCodes.h"
#include "qrshare/QrTerminal.h"
#include "qrshare/ShareArgs.h"
#include "qrshare/ShareController.h"
#include "qrshare/StopSignal.h"
#include "qrshare/ThreadSafeLog.h"
#include "qrshare/UserConfig.h"
#include "qrshare/Debug.h"
#include <iostream>
#include <string>
#include <vector>

using namespace QrShare;

//=============================================================================
// Helper Functions
//=============================================================================

/**
 * @brief Resolve the interface: flag, then saved config, then automatic
 *
 * A flag value is remembered for the next run.
 */
static std::string resolveInterface(const ShareArgs& args) {
    const std::filesystem::path configPath = AppPaths::configJsonPath();
    if (configPath.empty()) {
        LOG_WARNING("[qrshare] No home directory; interface choice is not remembered");
        return args.interfaceName;
    }

    if (!args.interfaceName.empty()) {
        UserConfig config = UserConfig::load(configPath);
        config.setInterfaceName(args.interfaceName);
        std::string error;
        if (!config.save(configPath, error)) {
            std::cerr << "Warning [" << ErrorCodes::CONFIG_WRITE_FAILED << "]: " << error << "\n";
        }
        return args.interfaceName;
    }

    return UserConfig::load(configPath).interfaceName();
}

static void printQrCode(const std::string& url) {
    std::string qr;
    std::string error;
    std::cout << "Scan this QR code to download:\n";
    if (QrTerminal::render(url, qr, error)) {
        std::cout << qr;
    } else {
        LOG_WARNING("[qrshare] Cannot render QR code: " << error);
    }
}

//=============================================================================
// Main Function
//=============================================================================

int main(int argc, char* argv[]) {
    const std::string program = argc > 0 ? argv[0] : "qrshare";
    const std::vector<std::string> rawArgs(argv + (argc > 0 ? 1 : 0), argv + argc);

    ShareArgs args;
    std::string argError;
    if (!ShareArgs::parse(rawArgs, args, &argError)) {
        std::cerr << "Error [" << ErrorCodes::ARGS_INVALID << "]: " << argError << "\n\n"
                  << ShareArgs::usage(program);
        return 2;
    }
    if (args.showHelp) {
        std::cout << ShareArgs::usage(program);
        return 0;
    }

    if (!args.logFile.empty()) {
        ThreadSafeLog::initialize(args.logFile);
    }

    std::string signalError;
    if (!StopSignal::install(signalError)) {
        LOG_WARNING("[qrshare] Ctrl+C handling unavailable: " << signalError);
    }

    ShareOptions options;
    options.paths.assign(args.paths.begin(), args.paths.end());
    options.forceZip = args.forceZip;
    options.interfaceName = resolveInterface(args);
    options.expireSeconds = args.expireSeconds;
    options.password = args.password;

    ShareCollaborators collaborators = ShareCollaborators::defaults();
    collaborators.presentUrl = &printQrCode;

    ShareController controller(std::move(options), std::move(collaborators));
    const int exitCode = controller.run();

    StopSignal::uninstall();
    ThreadSafeLog::shutdown();
    return exitCode;
}
