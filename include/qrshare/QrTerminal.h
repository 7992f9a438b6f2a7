/**
 * @file QrTerminal.h
 * @brief Render a QR code as Unicode half blocks for the terminal
 */

#pragma once

#include <string>

namespace QrShare {

class QrTerminal {
public:
    /**
     * @brief Encode text (error-correction level M) and draw it
     * @param text Payload, typically the share URL
     * @param out Output: lines of half-block characters, '\n' terminated
     * @param errorMsg Output error message
     * @return true on success
     *
     * Two QR rows map to one text line. Light modules are drawn as block
     * characters, so the code reads correctly on a dark terminal background.
     * A quiet zone of QUIET_ZONE_MODULES surrounds the symbol.
     */
    static bool render(const std::string& text, std::string& out, std::string& errorMsg);

    static constexpr int QUIET_ZONE_MODULES = 2;
};

}  // namespace QrShare
