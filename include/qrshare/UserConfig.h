/**
 * @file UserConfig.h
 * @brief Persisted user preferences (last-used network interface)
 */

#pragma once

#include <filesystem>
#include <string>
#include <nlohmann/json.hpp>

namespace QrShare {

/**
 * @brief User configuration stored as JSON.
 *
 * Format:
 * @code
 * { "interface": "wlan0" }
 * @endcode
 *
 * Unknown keys are ignored on load. Wrongly-typed values are treated as
 * absent. A missing or corrupt file loads as an empty configuration.
 */
class UserConfig {
public:
    const std::string& interfaceName() const { return m_interfaceName; }
    void setInterfaceName(const std::string& name) { m_interfaceName = name; }

    nlohmann::json toJson() const;
    static UserConfig fromJson(const nlohmann::json& j);

    /**
     * @brief Load from path. Never fails: unreadable or invalid files give
     *        an empty configuration.
     */
    static UserConfig load(const std::filesystem::path& path);

    /**
     * @brief Save to path atomically.
     * @return true on success; errorMsg describes the failure otherwise
     */
    bool save(const std::filesystem::path& path, std::string& errorMsg) const;

private:
    std::string m_interfaceName;
};

}  // namespace QrShare
