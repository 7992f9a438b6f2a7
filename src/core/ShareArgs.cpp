/**
 * @file ShareArgs.cpp
 * @brief Implementation of strict parsing for the qrshare tool.
 */

#include "qrshare/ShareArgs.h"

#include <cctype>

namespace QrShare {
namespace {

// Ten years; keeps deadline arithmetic far from overflow
constexpr uint64_t kMaxExpireSeconds = 10ull * 365 * 24 * 60 * 60;

static bool isAllDigits(const std::string& s)
{
    if (s.empty()) return false;
    for (char ch : s) {
        if (!std::isdigit(static_cast<unsigned char>(ch))) return false;
    }
    return true;
}

static void setErr(std::string* outErr, const std::string& msg)
{
    if (outErr) *outErr = msg;
}

}  // namespace

bool ShareArgs::parse(const std::vector<std::string>& args, ShareArgs& out, std::string* outErr)
{
    out = ShareArgs{};

    bool flagsDone = false;
    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& raw = args[i];

        if (flagsDone || raw.empty() || raw[0] != '-' || raw == "-") {
            out.paths.push_back(raw);
            continue;
        }

        if (raw == "--") {
            flagsDone = true;
            continue;
        }

        // Split "--flag=value"
        std::string a = raw;
        std::string inlineValue;
        bool hasInlineValue = false;
        if (a.rfind("--", 0) == 0) {
            const size_t eq = a.find('=');
            if (eq != std::string::npos) {
                inlineValue = a.substr(eq + 1);
                a = a.substr(0, eq);
                hasInlineValue = true;
            }
        }

        auto takeValue = [&](std::string& value) -> bool {
            if (hasInlineValue) {
                value = inlineValue;
                return true;
            }
            if (i + 1 >= args.size()) {
                setErr(outErr, "Missing value for " + a);
                return false;
            }
            value = args[++i];
            return true;
        };

        if (a == "-h" || a == "--help") {
            out.showHelp = true;
            continue;
        }

        if (a == "--zip") {
            if (hasInlineValue) {
                setErr(outErr, "--zip does not take a value");
                return false;
            }
            out.forceZip = true;
            continue;
        }

        if (a == "-i" || a == "--interface") {
            if (!takeValue(out.interfaceName)) return false;
            if (out.interfaceName.empty()) {
                setErr(outErr, "Invalid " + a + " (must not be empty)");
                return false;
            }
            continue;
        }

        if (a == "--expire") {
            std::string value;
            if (!takeValue(value)) return false;
            if (!isAllDigits(value)) {
                setErr(outErr, "Invalid --expire (must be a non-negative integer)");
                return false;
            }
            if (value.size() > 12 || std::stoull(value) > kMaxExpireSeconds) {
                setErr(outErr, "Invalid --expire (out of range)");
                return false;
            }
            out.expireSeconds = std::stoull(value);
            continue;
        }

        if (a == "--password") {
            std::string value;
            if (!takeValue(value)) return false;
            if (value.empty()) {
                out.password.reset();
            } else {
                out.password = value;
            }
            continue;
        }

        if (a == "--log-file") {
            if (!takeValue(out.logFile)) return false;
            if (out.logFile.empty()) {
                setErr(outErr, "Invalid --log-file (must not be empty)");
                return false;
            }
            continue;
        }

        setErr(outErr, "Unknown argument: " + raw);
        return false;
    }

    if (out.showHelp) {
        return true;
    }

    if (out.paths.empty()) {
        setErr(outErr, "Missing required argument: at least one file or directory");
        return false;
    }

    return true;
}

std::string ShareArgs::usage(const std::string& program)
{
    return "Usage: " + program + " [options] <path>...\n"
           "\n"
           "Share files or directories over HTTP on the local network.\n"
           "\n"
           "Options:\n"
           "  --zip                  Pack a single file into a zip archive\n"
           "  -i, --interface NAME   Network interface to advertise (remembered)\n"
           "  --expire SECONDS       Link lifetime in seconds (0 = never, default)\n"
           "  --password SECRET      Require a password (URL param 'passed' or\n"
           "                         HTTP header X-Password)\n"
           "  --log-file PATH        Append trace log lines to PATH\n"
           "  -h, --help             Show this help\n";
}

}  // namespace QrShare
