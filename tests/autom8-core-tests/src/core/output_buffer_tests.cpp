#include <catch2/catch.hpp>

#include <core/output_buffer.hpp>

#include <thread>
#include <vector>

namespace output_buffer_tests {

using namespace autom8_tui;

TEST_CASE("OutputBuffer evicts the oldest line when full", "[buffer]") {
    OutputBuffer buffer(3);
    for (int i = 0; i < 5; ++i) {
        buffer.append(StreamSource::STDOUT, "line " + std::to_string(i));
    }

    CHECK(buffer.size() == 3);
    CHECK(buffer.evicted_count() == 2);
    auto lines = buffer.snapshot();
    REQUIRE(lines.size() == 3);
    CHECK(lines.front().text == "line 2");
    CHECK(lines.front().sequence == 2);
    CHECK(lines.back().text == "line 4");
    CHECK(lines.back().sequence == 4);
}

TEST_CASE("OutputBuffer windows and latest lines", "[buffer]") {
    OutputBuffer buffer(10);
    for (int i = 0; i < 6; ++i) {
        buffer.append(i % 2 == 0 ? StreamSource::STDOUT : StreamSource::STDERR, std::to_string(i));
    }

    auto window = buffer.window(2, 3);
    REQUIRE(window.size() == 3);
    CHECK(window[0].text == "2");
    CHECK(window[2].text == "4");
    CHECK(window[1].source == StreamSource::STDERR);

    CHECK(buffer.window(5, 10).size() == 1);
    CHECK(buffer.window(6, 10).empty());

    auto latest = buffer.latest(2);
    REQUIRE(latest.size() == 2);
    CHECK(latest[0].text == "4");
    CHECK(latest[1].text == "5");
}

TEST_CASE("OutputBuffer clear keeps the sequence counter", "[buffer]") {
    OutputBuffer buffer(10);
    buffer.append(StreamSource::SYSTEM, "a");
    buffer.append(StreamSource::SYSTEM, "b");
    auto version = buffer.version();

    buffer.clear();
    CHECK(buffer.size() == 0);
    CHECK(buffer.version() > version);
    CHECK(buffer.append(StreamSource::STDOUT, "c") == 2);
}

TEST_CASE("OutputBuffer reports the sequence of its oldest line", "[buffer]") {
    OutputBuffer buffer(3);
    CHECK(buffer.first_sequence() == 0);

    for (int i = 0; i < 5; ++i) {
        buffer.append(StreamSource::STDOUT, std::to_string(i));
    }
    CHECK(buffer.first_sequence() == 2);
    CHECK(buffer.window(0, 1).front().sequence == buffer.first_sequence());

    buffer.clear();
    CHECK(buffer.first_sequence() == 5);
    CHECK(buffer.first_sequence() == buffer.next_sequence());
    buffer.append(StreamSource::STDOUT, "after");
    CHECK(buffer.first_sequence() == 5);
}

TEST_CASE("OutputBuffer capacity is at least one", "[buffer]") {
    OutputBuffer buffer(0);
    CHECK(buffer.capacity() == 1);
    buffer.append(StreamSource::STDOUT, "x");
    buffer.append(StreamSource::STDOUT, "y");
    REQUIRE(buffer.size() == 1);
    CHECK(buffer.snapshot()[0].text == "y");
}

TEST_CASE("OutputBuffer sequences stay ordered under concurrent writers", "[buffer][concurrency]") {
    OutputBuffer buffer(100000);
    constexpr int LINES_PER_WRITER = 2000;

    auto writer = [&](StreamSource source) {
        for (int i = 0; i < LINES_PER_WRITER; ++i) {
            buffer.append(source, std::to_string(i));
        }
    };
    std::thread out(writer, StreamSource::STDOUT);
    std::thread err(writer, StreamSource::STDERR);
    out.join();
    err.join();

    auto lines = buffer.snapshot();
    REQUIRE(lines.size() == 2 * LINES_PER_WRITER);
    int last_stdout = -1;
    int last_stderr = -1;
    for (std::size_t i = 0; i < lines.size(); ++i) {
        CHECK(lines[i].sequence == i);
        // 每个流内部保持自身顺序
        int value = std::stoi(lines[i].text);
        int& last = lines[i].source == StreamSource::STDOUT ? last_stdout : last_stderr;
        CHECK(value == last + 1);
        last = value;
    }
}

} // namespace output_buffer_tests
