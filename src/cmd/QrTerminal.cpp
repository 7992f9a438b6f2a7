/**
 * @file QrTerminal.cpp
 * @brief Render a QR code as Unicode half blocks for the terminal
 */

#include "qrshare/QrTerminal.h"
#include <qrencode.h>
#include <cerrno>
#include <cstring>

namespace QrShare {

namespace {
    constexpr const char* kFull = "\xE2\x96\x88";    // U+2588 FULL BLOCK
    constexpr const char* kUpper = "\xE2\x96\x80";   // U+2580 UPPER HALF BLOCK
    constexpr const char* kLower = "\xE2\x96\x84";   // U+2584 LOWER HALF BLOCK
} // anonymous namespace

bool QrTerminal::render(const std::string& text, std::string& out, std::string& errorMsg) {
    out.clear();

    QRcode* qr = QRcode_encodeString8bit(text.c_str(), 0, QR_ECLEVEL_M);
    if (!qr) {
        errorMsg = std::string("QRcode_encodeString8bit failed: ") + std::strerror(errno);
        return false;
    }

    const int width = qr->width;
    const int size = width + 2 * QUIET_ZONE_MODULES;

    // Quiet zone counts as light
    auto isLight = [qr, width](int x, int y) {
        x -= QUIET_ZONE_MODULES;
        y -= QUIET_ZONE_MODULES;
        if (x < 0 || y < 0 || x >= width || y >= width) {
            return true;
        }
        return (qr->data[y * width + x] & 0x01) == 0;
    };

    for (int y = 0; y < size; y += 2) {
        for (int x = 0; x < size; ++x) {
            const bool top = isLight(x, y);
            const bool bottom = (y + 1 < size) ? isLight(x, y + 1) : false;
            if (top && bottom) {
                out += kFull;
            } else if (top) {
                out += kUpper;
            } else if (bottom) {
                out += kLower;
            } else {
                out += ' ';
            }
        }
        out += '\n';
    }

    QRcode_free(qr);
    return true;
}

}  // namespace QrShare
