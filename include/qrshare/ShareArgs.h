/**
 * @file ShareArgs.h
 * @brief Command-line parsing for the qrshare tool.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace QrShare {

struct ShareArgs {
    std::vector<std::string> paths;
    bool forceZip = false;
    std::string interfaceName;            ///< Empty: saved or automatic
    uint64_t expireSeconds = 0;           ///< 0: never expires
    std::optional<std::string> password;  ///< Unset when empty
    std::string logFile;
    bool showHelp = false;

    /**
     * @brief Parse arguments (excluding argv[0]) in a strict, fail-closed manner.
     *
     * Supported flags:
     * - --zip
     * - -i, --interface <name>
     * - --expire <seconds>
     * - --password <secret>
     * - --log-file <path>
     * - -h, --help
     *
     * Long flags also accept "--flag=value". "--" ends flag parsing.
     * At least one path is required unless --help is given.
     */
    static bool parse(const std::vector<std::string>& args, ShareArgs& out, std::string* outErr);

    /**
     * @brief Usage text for --help and argument errors
     */
    static std::string usage(const std::string& program);
};

}  // namespace QrShare
