/**
 * @file ShareController.h
 * @brief Lifecycle of one sharing run: package, advertise, serve, clean up
 */

#pragma once

#include "config.h"
#include <cstdint>
#include <filesystem>
#include <functional>
#include <iostream>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace QrShare {

/**
 * @brief What the operator asked to share and how
 */
struct ShareOptions {
    std::vector<std::filesystem::path> paths;
    bool forceZip = false;
    std::string interfaceName;            ///< Hint for IP discovery; empty = automatic
    uint64_t expireSeconds = 0;           ///< 0 = never
    std::optional<std::string> password;  ///< Unset or empty = no password
};

/**
 * @brief Replaceable collaborators of the controller
 *
 * Defaults talk to the real system (interfaces, ports, CSPRNG, stdin and
 * signals). Tests swap in deterministic versions.
 */
struct ShareCollaborators {
    using IpResolver = std::function<bool(const std::string& interfaceHint,
                                          std::string& ip, std::string& errorMsg)>;
    using PortAllocator = std::function<bool(uint16_t& port, std::string& errorMsg)>;
    using TokenGenerator = std::function<bool(std::string& token, std::string& errorMsg)>;
    using UrlPresenter = std::function<void(const std::string& url)>;
    using StopWaiter = std::function<void()>;

    IpResolver resolveIp;
    PortAllocator allocatePort;
    TokenGenerator generateToken;
    UrlPresenter presentUrl;   ///< Optional extra presentation (QR code)
    StopWaiter waitForStop;
    std::string bindAddress = BIND_ADDRESS_ANY;

    /**
     * @brief Collaborators backed by the real system
     */
    static ShareCollaborators defaults();
};

/**
 * @brief Outcome of run()
 */
struct ShareReport {
    int exitCode = 0;
    std::string errorCode;        ///< ErrorCodes value when exitCode != 0
    std::string errorMsg;
    std::string url;              ///< Advertised URL (empty if setup failed)
    uint16_t port = 0;
    uint64_t downloadCount = 0;
    std::filesystem::path artifactPath;
    bool artifactWasTemporary = false;
};

/**
 * @class ShareController
 * @brief Owns the session and drives the server from setup to cleanup
 *
 * Steps of run():
 * 1. Validate inputs and build the artifact (ArchiveBuilder)
 * 2. Resolve the advertised IP and a free port
 * 3. Generate the token and start the DownloadServer
 * 4. Print the URL and notices, then block in waitForStop
 * 5. Stop the server, delete a temporary artifact, print the download count
 *
 * A failure in steps 1-3 prints "Error [CODE]: message" to the error stream,
 * deletes a temporary artifact already built and returns exit code 1.
 */
class ShareController {
public:
    ShareController(ShareOptions options,
                    ShareCollaborators collaborators,
                    std::ostream& out = std::cout,
                    std::ostream& err = std::cerr);

    ShareController(const ShareController&) = delete;
    ShareController& operator=(const ShareController&) = delete;

    /**
     * @brief Run one sharing session to completion
     * @return Process exit code (0 on success)
     */
    int run();

    const ShareReport& getReport() const { return m_report; }

    /**
     * @brief Build http://{ip}:{port}/{token}[?passed={password}]
     *
     * The password is percent-encoded; an empty password is omitted.
     */
    static std::string buildShareUrl(const std::string& ip,
                                     uint16_t port,
                                     const std::string& token,
                                     const std::optional<std::string>& password);

private:
    int fail(const char* code, const std::string& message);
    void removeTemporaryArtifact();

    ShareOptions m_options;
    ShareCollaborators m_collaborators;
    std::ostream& m_out;
    std::ostream& m_err;
    std::mutex m_outMutex;  ///< Download notices arrive from handler threads
    ShareReport m_report;
};

}  // namespace QrShare
