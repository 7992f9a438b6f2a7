#include <gtest/gtest.h>
#include "qrshare/QrTerminal.h"

#include <vector>

using namespace QrShare;

namespace {

// Number of display columns: every glyph is one column
size_t displayWidth(const std::string& line) {
    size_t cols = 0;
    for (unsigned char c : line) {
        if ((c & 0xC0) != 0x80) {
            ++cols;
        }
    }
    return cols;
}

}  // namespace

TEST(QrTerminalTest, RendersSquareSymbolWithQuietZone) {
    std::string out;
    std::string err;
    ASSERT_TRUE(QrTerminal::render("http://192.168.1.20:40000/abcdefghijk", out, err)) << err;

    std::vector<std::string> lines;
    size_t start = 0;
    while (start < out.size()) {
        const size_t nl = out.find('\n', start);
        ASSERT_NE(nl, std::string::npos);
        lines.push_back(out.substr(start, nl - start));
        start = nl + 1;
    }
    ASSERT_FALSE(lines.empty());

    const size_t width = displayWidth(lines.front());
    // Version 1 is 21 modules; the quiet zone adds two on each side
    EXPECT_GE(width, 21u + 2 * QrTerminal::QUIET_ZONE_MODULES);
    EXPECT_EQ(lines.size(), (width + 1) / 2);
    for (const auto& line : lines) {
        EXPECT_EQ(displayWidth(line), width);
    }

    // First line is pure quiet zone on top of the finder pattern row
    EXPECT_EQ(lines.front().substr(0, 3), "\xE2\x96\x88");
}

TEST(QrTerminalTest, LongerPayloadNeedsLargerSymbol) {
    std::string small;
    std::string large;
    std::string err;
    ASSERT_TRUE(QrTerminal::render("x", small, err)) << err;
    ASSERT_TRUE(QrTerminal::render(std::string(300, 'x'), large, err)) << err;
    EXPECT_GT(large.size(), small.size());
}
