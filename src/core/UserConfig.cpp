/**
 * @file UserConfig.cpp
 * @brief Persisted user preferences implementation
 */

#include "qrshare/UserConfig.h"
#include "qrshare/AtomicFile.h"
#include "qrshare/config.h"

#include <fstream>
#include <iterator>

namespace QrShare {

nlohmann::json UserConfig::toJson() const {
    nlohmann::json out = nlohmann::json::object();
    if (!m_interfaceName.empty()) {
        out[CONFIG_KEY_INTERFACE] = m_interfaceName;
    }
    return out;
}

UserConfig UserConfig::fromJson(const nlohmann::json& j) {
    UserConfig config;
    if (!j.is_object()) {
        return config;
    }

    if (j.contains(CONFIG_KEY_INTERFACE) && j[CONFIG_KEY_INTERFACE].is_string()) {
        config.m_interfaceName = j[CONFIG_KEY_INTERFACE].get<std::string>();
    }
    return config;
}

UserConfig UserConfig::load(const std::filesystem::path& path) {
    if (path.empty()) {
        return {};
    }

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return {};
    }

    const std::string data((std::istreambuf_iterator<char>(in)),
                           std::istreambuf_iterator<char>());

    // allow_exceptions=false: a corrupt file yields a discarded value
    const nlohmann::json j = nlohmann::json::parse(data, nullptr, false);
    if (j.is_discarded()) {
        return {};
    }
    return fromJson(j);
}

bool UserConfig::save(const std::filesystem::path& path, std::string& errorMsg) const {
    if (path.empty()) {
        errorMsg = "No configuration path available";
        return false;
    }

    const std::string jsonString = toJson().dump(4);
    return atomicWriteFile(path, jsonString, errorMsg);
}

}  // namespace QrShare
