/**
 * @file DownloadServer.cpp
 * @brief HTTP server releasing one artifact behind the access policy
 */

#include "qrshare/DownloadServer.h"
#include "qrshare/HttpContent.h"
#include "qrshare/Debug.h"
#include "qrshare/ThreadSafeLog.h"
#include <httplib.h>
#include <arpa/inet.h>
#include <sys/stat.h>
#include <algorithm>
#include <fstream>
#include <memory>
#include <vector>

namespace QrShare {

//=============================================================================
// Trace logging
//=============================================================================

namespace {
    #define LogServerTrace(msg) QrShare::ThreadSafeLog::log(msg)

    constexpr const char* kUnauthorizedMessage =
        "Unauthorized. Provide password via '?passed=SECRET' or header X-Password.";

    const char* reasonPhrase(int status) {
        switch (status) {
            case 401: return "Unauthorized";
            case 404: return "Not Found";
            case 405: return "Method Not Allowed";
            case 410: return "Gone";
            case 500: return "Internal Server Error";
            default:  return "Error";
        }
    }

    std::string lastModified(const std::filesystem::path& artifact) {
        struct stat st{};
        if (::stat(artifact.c_str(), &st) != 0) {
            return "";
        }
        return formatHttpDate(st.st_mtime);
    }
} // anonymous namespace

//=============================================================================
// Constructor / Destructor
//=============================================================================

DownloadServer::DownloadServer(ShareSession& session,
                               std::string bindAddress,
                               uint16_t port)
    : m_session(session)
    , m_bindAddress(std::move(bindAddress))
    , m_requestedPort(port)
    , m_boundPort(0)
    , m_activeTransfers(0)
    , m_running(false)
    , m_stopRequested(false)
    , m_downloadCallback(nullptr)
{
}

DownloadServer::~DownloadServer() {
    stop();
}

//=============================================================================
// DownloadServer: start()
//=============================================================================

bool DownloadServer::start(std::string& errorMsg) {
    if (m_running.load()) {
        errorMsg = "Server already running";
        return false;
    }

    // httplib would resolve a host name; only literal IPv4 addresses are accepted
    in_addr parsed{};
    if (::inet_pton(AF_INET, m_bindAddress.c_str(), &parsed) != 1) {
        errorMsg = "Invalid bind address: " + m_bindAddress;
        return false;
    }

    m_server = std::make_unique<httplib::Server>();
    registerHandlers();

    int port = -1;
    if (m_requestedPort == PORT_ANY) {
        port = m_server->bind_to_any_port(m_bindAddress);
    } else if (m_server->bind_to_port(m_bindAddress, m_requestedPort)) {
        port = m_requestedPort;
    }
    if (port <= 0) {
        errorMsg = "Cannot bind " + m_bindAddress + ":" + std::to_string(m_requestedPort);
        m_server.reset();
        return false;
    }

    m_stopRequested.store(false);
    m_boundPort.store(static_cast<uint16_t>(port));

    m_listenerThread = std::thread([this]() {
        if (!m_server->listen_after_bind()) {
            LOG_ERROR("[DownloadServer] Accept loop failed");
        }
    });
    m_server->wait_until_ready();
    m_running.store(true);

    LOG_INFO("[DownloadServer] Listening on " << m_bindAddress << ":" << port);
    LogServerTrace("=== DownloadServer::start port=" + std::to_string(port) + " ===");
    return true;
}

//=============================================================================
// DownloadServer: stop()
//=============================================================================

void DownloadServer::stop() {
    if (!m_running.load()) {
        return;
    }

    LogServerTrace("=== DownloadServer::stop START ===");

    // Content providers see the flag at their next chunk and abort
    m_stopRequested.store(true);
    m_server->stop();

    // listen_after_bind() returns only after the worker pool has drained
    if (m_listenerThread.joinable()) {
        m_listenerThread.join();
    }
    m_server.reset();

    m_boundPort.store(0);
    m_running.store(false);
    LOG_INFO("[DownloadServer] Stopped");
    LogServerTrace("=== DownloadServer::stop END ===");
}

//=============================================================================
// Request Evaluation
//=============================================================================

std::string DownloadServer::tokenFromTarget(const std::string& target) {
    const std::string path = target.substr(0, target.find_first_of("?#"));
    const size_t first = path.find_first_not_of('/');
    return first == std::string::npos ? std::string() : path.substr(first);
}

AccessCredentials DownloadServer::extractCredentials(const httplib::Request& request) {
    AccessCredentials credentials;
    credentials.token = tokenFromTarget(request.target);

    const auto range = request.params.equal_range(PASSWORD_QUERY_PARAM);
    for (auto it = range.first; it != range.second; ++it) {
        if (!it->second.empty()) {
            credentials.queryPassword = it->second;
            break;
        }
    }

    credentials.headerPassword = request.get_header_value(PASSWORD_HEADER);
    return credentials;
}

AccessDecision DownloadServer::evaluate(const httplib::Request& request, TimePoint now) const {
    return decideAccess(now, m_session.getRules(), extractCredentials(request));
}

//=============================================================================
// Handlers
//=============================================================================

void DownloadServer::registerHandlers() {
    // One request per connection; queued connections wait for a free worker
    m_server->new_task_queue = [] { return new httplib::ThreadPool(SERVER_THREAD_COUNT); };
    m_server->set_keep_alive_max_count(1);
    m_server->set_keep_alive_timeout(IDLE_CONNECTION_TIMEOUT_SEC);
    m_server->set_read_timeout(REQUEST_READ_TIMEOUT_SEC, 0);
    m_server->set_write_timeout(RESPONSE_WRITE_TIMEOUT_SEC, 0);
    m_server->set_default_headers({{"Server", SERVER_NAME}});

    m_server->set_pre_routing_handler(
        [](const httplib::Request& request, httplib::Response& response) {
            if (request.method == "GET") {
                return httplib::Server::HandlerResponse::Unhandled;
            }
            setError(response, 405, "Only GET is supported");
            response.set_header("Allow", "GET");
            return httplib::Server::HandlerResponse::Handled;
        });

    m_server->Get(R"(/(.*))", [this](const httplib::Request& request, httplib::Response& response) {
        handleDownload(request, response);
    });

    // Secrets travel in the target; only the client, method and status are logged
    m_server->set_logger([](const httplib::Request& request, const httplib::Response& response) {
        LOG_INFO("[DownloadServer] " << request.remote_addr << " " << request.method
                 << " -> " << response.status);
    });
}

void DownloadServer::handleDownload(const httplib::Request& request, httplib::Response& response) {
    const AccessDecision decision = evaluate(request, Clock::now());
    if (decision != AccessDecision::ALLOWED) {
        setDenial(response, decision);
        LogServerTrace("[DownloadServer] " + request.remote_addr + " denied (" +
                       accessDecisionToString(decision) + ")");
        return;
    }

    serveArtifact(request, response);
}

//=============================================================================
// DownloadServer: serveArtifact()
//=============================================================================

void DownloadServer::serveArtifact(const httplib::Request& request, httplib::Response& response) {
    const std::filesystem::path& artifact = m_session.getArtifactPath();

    std::error_code ec;
    const uintmax_t size = std::filesystem::file_size(artifact, ec);
    auto file = std::make_shared<std::ifstream>(artifact, std::ios::binary);
    if (ec || !*file) {
        setError(response, 500, "Shared file is not available");
        LOG_ERROR("[DownloadServer] " << request.remote_addr << " artifact unreadable");
        return;
    }

    const uint64_t downloadNumber = m_session.recordDownload();
    const std::string clientIp = request.remote_addr;
    const std::string contentType = guessContentType(artifact);

    response.set_header("Content-Disposition", contentDisposition(artifact));
    const std::string modified = lastModified(artifact);
    if (!modified.empty()) {
        response.set_header("Last-Modified", modified);
    }

    auto finished = [this, clientIp, downloadNumber, size](bool success) {
        if (!success) {
            LOG_WARNING("[DownloadServer] " << clientIp << " transfer #" << downloadNumber
                        << " aborted");
            return;
        }
        LogServerTrace("[DownloadServer] download #" + std::to_string(downloadNumber) +
                       " by " + clientIp + " (" + std::to_string(size) + " bytes)");
        if (m_downloadCallback) {
            m_downloadCallback(clientIp, downloadNumber);
        }
    };

    if (size == 0) {
        response.set_content(std::string(), contentType);
        finished(true);
        return;
    }

    m_activeTransfers.fetch_add(1);
    response.set_content_provider(
        static_cast<size_t>(size), contentType,
        [this, file, clientIp](size_t offset, size_t length, httplib::DataSink& sink) {
            if (m_stopRequested.load()) {
                return false;
            }
            std::vector<char> buffer(std::min(length, BUFFER_SIZE));
            file->clear();
            file->seekg(static_cast<std::streamoff>(offset));
            file->read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
            const std::streamsize got = file->gcount();
            if (got <= 0) {
                // Headers are out; the short body tells the client the transfer failed
                LOG_ERROR("[DownloadServer] " << clientIp << " artifact read failed at offset "
                          << offset);
                return false;
            }
            return sink.write(buffer.data(), static_cast<size_t>(got));
        },
        [this, finished](bool success) {
            m_activeTransfers.fetch_sub(1);
            finished(success);
        });
}

//=============================================================================
// Responses
//=============================================================================

void DownloadServer::setDenial(httplib::Response& response, AccessDecision decision) {
    switch (decision) {
        case AccessDecision::DENIED_EXPIRED:
            setError(response, 410, "Link expired");
            break;
        case AccessDecision::DENIED_UNAUTHORIZED:
            setError(response, 401, kUnauthorizedMessage);
            break;
        case AccessDecision::DENIED_NOT_FOUND:
        case AccessDecision::ALLOWED:
        default:
            setError(response, 404, "");
            break;
    }
}

void DownloadServer::setError(httplib::Response& response, int status,
                              const std::string& explanation) {
    std::string body = std::to_string(status) + " " + reasonPhrase(status);
    if (!explanation.empty()) {
        body += ": " + explanation;
    }
    body += "\n";

    response.status = status;
    response.set_content(body, "text/plain; charset=utf-8");
}

}  // namespace QrShare
