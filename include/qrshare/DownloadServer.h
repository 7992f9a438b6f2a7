/**
 * @file DownloadServer.h
 * @brief HTTP server releasing one artifact behind the access policy
 */

#pragma once

#include "config.h"
#include "AccessPolicy.h"
#include "ShareSession.h"
#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <thread>

namespace httplib {
class Server;
struct Request;
struct Response;
}  // namespace httplib

namespace QrShare {

//=============================================================================
// Callback Types
//=============================================================================

/**
 * @brief Download event callback function type
 *
 * Called from a worker thread after the artifact was streamed completely.
 *
 * @param clientIp IP address of the downloading client
 * @param downloadNumber Counter value recorded for this download
 */
using DownloadCallback = std::function<void(const std::string& clientIp,
                                            uint64_t downloadNumber)>;

//=============================================================================
// DownloadServer Class
//=============================================================================

/**
 * @class DownloadServer
 * @brief cpp-httplib server that serves the session artifact to authorized requests
 *
 * Architecture:
 * - httplib::Server bound by start(), accepting on a listener thread
 * - SERVER_THREAD_COUNT workers, one request per connection
 * - A pre-routing handler answers every method but GET with 405
 * - The catch-all GET route evaluates decideAccess() against the session rules
 *   and streams the artifact through a content provider
 *
 * Thread Safety:
 * - isRunning() and getPort() are thread-safe (atomic)
 * - The download counter lives in the ShareSession and is atomic
 * - start() and stop() are NOT thread-safe (call from same thread)
 *
 * Usage:
 * @code
 * ShareSession session(token, "/abs/path/file.zip");
 * DownloadServer server(session);
 * std::string error;
 * if (server.start(error)) {
 *     // ... wait for the operator ...
 *     server.stop();
 * }
 * @endcode
 */
class DownloadServer {
public:
    /**
     * @brief Constructor
     * @param session Session to serve; must outlive the server
     * @param bindAddress IPv4 address to bind (default: all interfaces)
     * @param port TCP port (default: 0, any free port)
     *
     * The server is not started until start() is called.
     */
    explicit DownloadServer(ShareSession& session,
                            std::string bindAddress = BIND_ADDRESS_ANY,
                            uint16_t port = PORT_ANY);

    /**
     * @brief Destructor
     *
     * Stops the server if running.
     */
    ~DownloadServer();

    // Prevent copying
    DownloadServer(const DownloadServer&) = delete;
    DownloadServer& operator=(const DownloadServer&) = delete;

    // Prevent moving (server has unique resources)
    DownloadServer(DownloadServer&&) = delete;
    DownloadServer& operator=(DownloadServer&&) = delete;

    //=========================================================================
    // Server Control Methods
    //=========================================================================

    /**
     * @brief Bind, listen and launch the listener thread
     * @param errorMsg Output error message if the socket cannot be set up
     * @return true if the server is accepting connections
     */
    bool start(std::string& errorMsg);

    /**
     * @brief Stop the server
     *
     * Stops accepting connections, aborts in-flight transfers at the next
     * chunk and waits for all workers to exit. When this returns no worker
     * touches the artifact any more.
     */
    void stop();

    /**
     * @brief Check if the server is currently running
     */
    bool isRunning() const { return m_running.load(); }

    /**
     * @brief Bound TCP port (0 when not running)
     */
    uint16_t getPort() const { return m_boundPort.load(); }

    /**
     * @brief Number of artifact transfers currently streaming
     */
    size_t getActiveTransferCount() const { return m_activeTransfers.load(); }

    void setDownloadCallback(DownloadCallback callback) {
        m_downloadCallback = std::move(callback);
    }

    //=========================================================================
    // Request Evaluation
    //=========================================================================

    /**
     * @brief Token embedded in a raw request target
     *
     * Everything before '?' with all leading '/' removed. No percent-decoding:
     * the token is compared byte for byte as sent.
     */
    static std::string tokenFromTarget(const std::string& target);

    /**
     * @brief Extract token and password channels from a request
     *
     * The query channel is the first non-empty 'passed' value; empty values
     * count as absent.
     */
    static AccessCredentials extractCredentials(const httplib::Request& request);

    /**
     * @brief Evaluate a request against the session rules at time now
     */
    AccessDecision evaluate(const httplib::Request& request, TimePoint now) const;

private:
    //=========================================================================
    // Private Methods
    //=========================================================================

    void registerHandlers();

    /**
     * @brief GET route: decide access, then deny or stream the artifact
     */
    void handleDownload(const httplib::Request& request, httplib::Response& response);

    /**
     * @brief Attach the artifact to an allowed response
     */
    void serveArtifact(const httplib::Request& request, httplib::Response& response);

    static void setDenial(httplib::Response& response, AccessDecision decision);
    static void setError(httplib::Response& response, int status,
                         const std::string& explanation);

    //=========================================================================
    // Member Variables
    //=========================================================================

    // Configuration
    ShareSession& m_session;           ///< Rules, artifact and counter
    std::string m_bindAddress;         ///< IPv4 bind address
    uint16_t m_requestedPort;          ///< Port to bind (0 = any)
    std::atomic<uint16_t> m_boundPort; ///< Port actually bound

    // HTTP server and the thread running its accept loop
    std::unique_ptr<httplib::Server> m_server;
    std::thread m_listenerThread;

    std::atomic<size_t> m_activeTransfers;

    // Control flags
    std::atomic<bool> m_running;       ///< Server is running
    std::atomic<bool> m_stopRequested; ///< Abort transfers in progress

    // Callbacks
    DownloadCallback m_downloadCallback;
};

}  // namespace QrShare
