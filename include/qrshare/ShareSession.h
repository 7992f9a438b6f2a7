/**
 * @file ShareSession.h
 * @brief State of one sharing run: access rules, artifact and download count
 */

#pragma once

#include "AccessPolicy.h"
#include <atomic>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <utility>

namespace QrShare {

/**
 * @class ShareSession
 * @brief One run's serving context
 *
 * Owned by the ShareController; the DownloadServer keeps a reference for the
 * duration of its run.
 *
 * Thread Safety:
 * - The access rules and artifact path are set before the server starts and
 *   are read-only while it runs.
 * - recordDownload() and getDownloadCount() are thread-safe (atomic).
 */
class ShareSession {
public:
    ShareSession(std::string token,
                 std::filesystem::path artifactPath,
                 bool artifactIsTemporary = false)
        : m_artifactPath(std::move(artifactPath))
        , m_artifactIsTemporary(artifactIsTemporary)
        , m_downloadCount(0)
    {
        m_rules.expectedToken = std::move(token);
    }

    // Handlers hold references; the session must not move
    ShareSession(const ShareSession&) = delete;
    ShareSession& operator=(const ShareSession&) = delete;
    ShareSession(ShareSession&&) = delete;
    ShareSession& operator=(ShareSession&&) = delete;

    //=========================================================================
    // Configuration (before the server starts)
    //=========================================================================

    /**
     * @brief Require a password. An empty or unset value disables the check.
     */
    void setPassword(std::optional<std::string> password) {
        if (password && password->empty()) {
            password.reset();
        }
        m_rules.expectedPassword = std::move(password);
    }

    void setExpiryDeadline(std::optional<TimePoint> deadline) {
        m_rules.expiryDeadline = deadline;
    }

    //=========================================================================
    // Accessors
    //=========================================================================

    const AccessRules& getRules() const { return m_rules; }
    const std::string& getToken() const { return m_rules.expectedToken; }
    const std::optional<std::string>& getPassword() const { return m_rules.expectedPassword; }
    const std::optional<TimePoint>& getExpiryDeadline() const { return m_rules.expiryDeadline; }
    bool hasPassword() const { return m_rules.expectedPassword.has_value(); }

    const std::filesystem::path& getArtifactPath() const { return m_artifactPath; }
    bool isArtifactTemporary() const { return m_artifactIsTemporary; }

    //=========================================================================
    // Download Counter
    //=========================================================================

    /**
     * @brief Count one authorized download
     * @return Counter value after this download
     */
    uint64_t recordDownload() { return m_downloadCount.fetch_add(1) + 1; }

    uint64_t getDownloadCount() const { return m_downloadCount.load(); }

private:
    AccessRules m_rules;
    std::filesystem::path m_artifactPath;
    bool m_artifactIsTemporary;
    std::atomic<uint64_t> m_downloadCount;
};

}  // namespace QrShare
