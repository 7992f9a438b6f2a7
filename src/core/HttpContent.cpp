/**
 * @file HttpContent.cpp
 * @brief URL encoding and content headers for the served artifact
 */

#include "qrshare/HttpContent.h"

#include <algorithm>
#include <cctype>
#include <utility>

namespace QrShare {

namespace {

std::string quoteFilename(const std::string& name) {
    std::string out;
    out.reserve(name.size() + 2);
    out.push_back('"');
    for (char c : name) {
        if (c == '"' || c == '\\') {
            out.push_back('\\');
        }
        out.push_back(c);
    }
    out.push_back('"');
    return out;
}

bool isPrintableAscii(const std::string& s) {
    return std::all_of(s.begin(), s.end(), [](unsigned char c) {
        return c >= 0x20 && c <= 0x7E;
    });
}

}  // namespace

std::string percentEncode(const std::string& in) {
    static const char kHex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(in.size() * 3);

    for (unsigned char c : in) {
        if (std::isalnum(c) || c == '-' || c == '.' || c == '_' || c == '~') {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('%');
            out.push_back(kHex[c >> 4]);
            out.push_back(kHex[c & 0x0F]);
        }
    }
    return out;
}

std::string guessContentType(const std::filesystem::path& path) {
    std::string ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    static const std::pair<const char*, const char*> kTypes[] = {
        {".zip",  "application/zip"},
        {".txt",  "text/plain; charset=utf-8"},
        {".html", "text/html; charset=utf-8"},
        {".htm",  "text/html; charset=utf-8"},
        {".json", "application/json"},
        {".pdf",  "application/pdf"},
        {".png",  "image/png"},
        {".jpg",  "image/jpeg"},
        {".jpeg", "image/jpeg"},
        {".gif",  "image/gif"},
        {".mp4",  "video/mp4"},
        {".mp3",  "audio/mpeg"},
    };

    for (const auto& entry : kTypes) {
        if (ext == entry.first) {
            return entry.second;
        }
    }
    return "application/octet-stream";
}

std::string contentDisposition(const std::filesystem::path& artifact) {
    const std::string name = artifact.filename().string();
    if (isPrintableAscii(name)) {
        return "attachment; filename=" + quoteFilename(name);
    }
    return "attachment; filename=\"download\"; filename*=UTF-8''" + percentEncode(name);
}

std::string formatHttpDate(std::time_t t) {
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[64];
    const size_t n = std::strftime(buf, sizeof(buf), "%a, %d %b %Y %H:%M:%S GMT", &tm);
    return std::string(buf, n);
}

}  // namespace QrShare
