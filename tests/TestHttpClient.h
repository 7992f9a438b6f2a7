/**
 * @file TestHttpClient.h
 * @brief Blocking loopback HTTP clients used by the server tests
 *
 * get() goes through httplib::Client; sendRaw() writes bytes as given, for
 * requests a conforming client would never send.
 */

#pragma once

#include <httplib.h>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>
#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <string>
#include <utility>
#include <vector>

namespace QrShareTest {

struct HttpResponse {
    int status = 0;
    std::vector<std::pair<std::string, std::string>> headers;
    std::string body;
    bool ok = false;  ///< Connected and received a status line

    std::string header(const std::string& name) const {
        for (const auto& h : headers) {
            if (h.first.size() != name.size()) continue;
            bool same = true;
            for (size_t i = 0; i < name.size(); ++i) {
                if (std::tolower(static_cast<unsigned char>(h.first[i])) !=
                    std::tolower(static_cast<unsigned char>(name[i]))) {
                    same = false;
                    break;
                }
            }
            if (same) return h.second;
        }
        return "";
    }
};

/**
 * @brief Send raw bytes to 127.0.0.1:port and read until the server closes
 */
inline HttpResponse sendRaw(uint16_t port, const std::string& request) {
    HttpResponse response;

    const int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) {
        return response;
    }

    timeval tv{};
    tv.tv_sec = 10;
    (void)::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    ::inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);

    if (::connect(fd, reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) != 0) {
        ::close(fd);
        return response;
    }

    size_t sent = 0;
    while (sent < request.size()) {
        const ssize_t n = ::send(fd, request.data() + sent, request.size() - sent, MSG_NOSIGNAL);
        if (n <= 0) break;
        sent += static_cast<size_t>(n);
    }

    std::string raw;
    char buf[8192];
    while (true) {
        const ssize_t n = ::recv(fd, buf, sizeof(buf), 0);
        if (n <= 0) break;
        raw.append(buf, static_cast<size_t>(n));
    }
    ::close(fd);

    const size_t headEnd = raw.find("\r\n\r\n");
    if (headEnd == std::string::npos) {
        return response;
    }

    const std::string head = raw.substr(0, headEnd);
    response.body = raw.substr(headEnd + 4);

    size_t lineStart = 0;
    bool first = true;
    while (lineStart <= head.size()) {
        size_t lineEnd = head.find("\r\n", lineStart);
        if (lineEnd == std::string::npos) lineEnd = head.size();
        const std::string line = head.substr(lineStart, lineEnd - lineStart);
        lineStart = lineEnd + 2;

        if (first) {
            first = false;
            // "HTTP/1.1 200 OK"
            const size_t sp = line.find(' ');
            if (sp == std::string::npos) return response;
            response.status = std::atoi(line.c_str() + sp + 1);
            continue;
        }
        const size_t colon = line.find(':');
        if (colon == std::string::npos) continue;
        std::string value = line.substr(colon + 1);
        while (!value.empty() && value.front() == ' ') value.erase(0, 1);
        response.headers.emplace_back(line.substr(0, colon), value);
    }

    response.ok = response.status != 0;
    return response;
}

/**
 * @brief GET target from 127.0.0.1:port with optional extra headers
 */
inline HttpResponse get(uint16_t port, const std::string& target,
                        const httplib::Headers& extraHeaders = {}) {
    HttpResponse response;

    httplib::Client client("127.0.0.1", port);
    client.set_connection_timeout(5, 0);
    client.set_read_timeout(10, 0);

    const httplib::Result result = client.Get(target, extraHeaders);
    if (!result) {
        return response;
    }

    response.status = result->status;
    response.body = result->body;
    for (const auto& h : result->headers) {
        response.headers.emplace_back(h.first, h.second);
    }
    response.ok = true;
    return response;
}

}  // namespace QrShareTest
