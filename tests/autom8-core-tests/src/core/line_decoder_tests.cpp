#include <catch2/catch.hpp>

#include <core/line_decoder.hpp>

#include <string>

namespace line_decoder_tests {

using namespace autom8_tui;

std::vector<std::string> feed(LineDecoder& decoder, const std::string& data) {
    return decoder.feed(data.data(), data.size());
}

TEST_CASE("LineDecoder splits chunks on newlines and keeps partial lines", "[decoder]") {
    LineDecoder decoder;
    auto first = feed(decoder, "TASK [ping]\nok: [sw");
    REQUIRE(first.size() == 1);
    CHECK(first[0] == "TASK [ping]");

    auto second = feed(decoder, "1]\r\nPLAY RECAP");
    REQUIRE(second.size() == 1);
    CHECK(second[0] == "ok: [sw1]");

    auto tail = decoder.finish();
    REQUIRE(tail);
    CHECK(*tail == "PLAY RECAP");
    CHECK_FALSE(decoder.finish());
}

TEST_CASE("LineDecoder sanitizes terminal control sequences", "[decoder]") {
    CHECK(LineDecoder::sanitize("\x1b[0;32mok: [sw1]\x1b[0m") == "ok: [sw1]");
    CHECK(LineDecoder::sanitize("\x1b]0;title\aafter") == "after");
    CHECK(LineDecoder::sanitize("10%\r50%\r100%") == "100%");
    CHECK(LineDecoder::sanitize("a\tb") == "a   b");
    CHECK(LineDecoder::sanitize("bell\a here") == "bell here");
}

TEST_CASE("LineDecoder replaces invalid UTF-8 and counts replacements", "[decoder]") {
    LineDecoder decoder;
    auto lines = feed(decoder, std::string("caf\xC3\xA9 \xFF\xFE end\n"));
    REQUIRE(lines.size() == 1);
    CHECK(lines[0] == "caf\xC3\xA9 \xEF\xBF\xBD\xEF\xBF\xBD end");
    CHECK(decoder.replacement_count() == 2);
}

TEST_CASE("LineDecoder bounds a line without newline", "[decoder]") {
    LineDecoder decoder;
    std::string huge(LineDecoder::MAX_LINE_BYTES + 10, 'x');
    auto lines = feed(decoder, huge);
    REQUIRE(lines.size() == 1);
    CHECK(lines[0].size() == LineDecoder::MAX_LINE_BYTES);
    auto tail = decoder.finish();
    REQUIRE(tail);
    CHECK(tail->size() == 10);
}

} // namespace line_decoder_tests
