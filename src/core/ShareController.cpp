/**
 * @file ShareController.cpp
 * @brief Lifecycle of one sharing run: package, advertise, serve, clean up
 */

#include "qrshare/ShareController.h"
#include "qrshare/ArchiveBuilder.h"
#include "qrshare/DownloadServer.h"
#include "qrshare/ErrorCodes.h"
#include "qrshare/HttpContent.h"
#include "qrshare/NetworkInterfaces.h"
#include "qrshare/ShareSession.h"
#include "qrshare/ShareToken.h"
#include "qrshare/StopSignal.h"
#include "qrshare/Debug.h"
#include "qrshare/ThreadSafeLog.h"

namespace fs = std::filesystem;

namespace QrShare {

//=============================================================================
// ShareCollaborators
//=============================================================================

ShareCollaborators ShareCollaborators::defaults() {
    ShareCollaborators c;
    c.resolveIp = &resolveLocalIp;
    c.allocatePort = &findFreePort;
    c.generateToken = &ShareToken::generate;
    c.presentUrl = nullptr;
    c.waitForStop = []() { (void)StopSignal::waitForStop(); };
    return c;
}

//=============================================================================
// Constructor
//=============================================================================

ShareController::ShareController(ShareOptions options,
                                 ShareCollaborators collaborators,
                                 std::ostream& out,
                                 std::ostream& err)
    : m_options(std::move(options))
    , m_collaborators(std::move(collaborators))
    , m_out(out)
    , m_err(err)
{
}

//=============================================================================
// ShareController: buildShareUrl()
//=============================================================================

std::string ShareController::buildShareUrl(const std::string& ip,
                                           uint16_t port,
                                           const std::string& token,
                                           const std::optional<std::string>& password) {
    std::string url = "http://" + ip + ":" + std::to_string(port) + "/" + token;
    if (password && !password->empty()) {
        url += std::string("?") + PASSWORD_QUERY_PARAM + "=" + percentEncode(*password);
    }
    return url;
}

//=============================================================================
// ShareController: run()
//=============================================================================

int ShareController::run() {
    m_report = ShareReport{};

    // Step 1: artifact
    std::string error;
    if (!ArchiveBuilder::validateInputs(m_options.paths, error)) {
        return fail(ErrorCodes::SETUP_INVALID_PATH, error);
    }

    ArchiveResult artifact;
    if (!ArchiveBuilder::build(m_options.paths, m_options.forceZip, artifact, error)) {
        return fail(ErrorCodes::SETUP_ARCHIVE_FAILED, error);
    }
    m_report.artifactPath = artifact.path;
    m_report.artifactWasTemporary = artifact.isTemporary;

    // Step 2: where clients reach us
    std::string ip;
    if (!m_collaborators.resolveIp ||
        !m_collaborators.resolveIp(m_options.interfaceName, ip, error)) {
        return fail(ErrorCodes::SETUP_NO_ADDRESS, "Error determining IP: " + error);
    }

    uint16_t port = 0;
    if (!m_collaborators.allocatePort || !m_collaborators.allocatePort(port, error)) {
        return fail(ErrorCodes::SETUP_NO_FREE_PORT, error);
    }

    // Step 3: session and server
    std::string token;
    if (!m_collaborators.generateToken || !m_collaborators.generateToken(token, error)) {
        return fail(ErrorCodes::SETUP_TOKEN_FAILED, error);
    }

    std::error_code ec;
    const fs::path absoluteArtifact = fs::absolute(artifact.path, ec);
    if (ec) {
        return fail(ErrorCodes::SETUP_INVALID_PATH, "Cannot resolve " + artifact.path.string());
    }

    ShareSession session(token, absoluteArtifact, artifact.isTemporary);
    session.setPassword(m_options.password);
    if (m_options.expireSeconds > 0) {
        session.setExpiryDeadline(Clock::now() + std::chrono::seconds(m_options.expireSeconds));
    }

    DownloadServer server(session, m_collaborators.bindAddress, port);
    server.setDownloadCallback([this](const std::string& clientIp, uint64_t number) {
        std::lock_guard<std::mutex> lock(m_outMutex);
        m_out << "[Download #" << number << "] " << clientIp << std::endl;
    });

    if (!server.start(error)) {
        return fail(ErrorCodes::SETUP_SERVER_START_FAILED, error);
    }

    m_report.port = server.getPort();
    m_report.url = buildShareUrl(ip, server.getPort(), token, session.getPassword());

    // Step 4: advertise and wait
    {
        std::lock_guard<std::mutex> lock(m_outMutex);
        if (m_collaborators.presentUrl) {
            m_collaborators.presentUrl(m_report.url);
        }
        m_out << "URL: " << m_report.url << "\n";
        if (session.hasPassword()) {
            m_out << "[Protected] Password is in URL param '" << PASSWORD_QUERY_PARAM
                  << "' or HTTP header " << PASSWORD_HEADER << ".\n";
        }
        if (m_options.expireSeconds > 0) {
            m_out << "[Notice] Link will expire in " << m_options.expireSeconds << " seconds\n";
        }
        m_out << "Press Enter or Ctrl+C to stop transfer..." << std::endl;
    }

    ThreadSafeLog::log("[ShareController] serving " + absoluteArtifact.string() +
                       " on port " + std::to_string(server.getPort()));

    if (m_collaborators.waitForStop) {
        m_collaborators.waitForStop();
    }

    // Step 5: teardown. stop() returns only after every handler has exited.
    server.stop();
    removeTemporaryArtifact();

    m_report.downloadCount = session.getDownloadCount();
    {
        std::lock_guard<std::mutex> lock(m_outMutex);
        m_out << "Transfer session ended.\n";
        m_out << "Total downloads: " << m_report.downloadCount << std::endl;
    }

    ThreadSafeLog::log("[ShareController] session ended, downloads=" +
                       std::to_string(m_report.downloadCount));
    return 0;
}

//=============================================================================
// Private helpers
//=============================================================================

int ShareController::fail(const char* code, const std::string& message) {
    removeTemporaryArtifact();

    m_report.exitCode = 1;
    m_report.errorCode = code;
    m_report.errorMsg = message;

    m_err << "Error [" << code << "]: " << message << std::endl;
    ThreadSafeLog::log(std::string("[ShareController] setup failed ") + code + ": " + message);
    return m_report.exitCode;
}

void ShareController::removeTemporaryArtifact() {
    if (!m_report.artifactWasTemporary || m_report.artifactPath.empty()) {
        return;
    }

    std::error_code ec;
    fs::remove(m_report.artifactPath, ec);
    if (ec) {
        LOG_WARNING("[ShareController] Could not delete " << m_report.artifactPath.string()
                    << ": " << ec.message());
    } else {
        LOG_DEBUG("[ShareController] Deleted temporary archive " << m_report.artifactPath.string());
    }
}

}  // namespace QrShare
