#include <catch2/catch.hpp>

#include <core/secret_buffer.hpp>

#include <string>
#include <utility>

namespace secret_buffer_tests {

using namespace autom8_tui;

TEST_CASE("SecretBuffer appends and removes characters", "[secret]") {
    SecretBuffer secret;
    CHECK(secret.empty());
    for (char c : std::string("hunter2")) {
        REQUIRE(secret.push_back(c));
    }
    CHECK(secret.size() == 7);
    CHECK(std::string(secret.data(), secret.size()) == "hunter2");

    secret.pop_back();
    CHECK(std::string(secret.data(), secret.size()) == "hunter");
    // 弹出的字节同样被清零
    CHECK(secret.data()[6] == '\0');
}

TEST_CASE("SecretBuffer works in whole UTF-8 characters", "[secret]") {
    SecretBuffer secret;
    const std::string snowman = "\xE2\x98\x83";
    REQUIRE(secret.append("k", 1));
    REQUIRE(secret.append(snowman.data(), snowman.size()));
    CHECK(secret.size() == 4);
    CHECK(secret.code_points() == 2);

    secret.pop_code_point();
    CHECK(secret.size() == 1);
    CHECK(secret.code_points() == 1);
    CHECK(secret.data()[1] == '\0');
    CHECK(secret.data()[3] == '\0');

    secret.pop_code_point();
    secret.pop_code_point();
    CHECK(secret.is_zeroed());

    // 放不下整个字符时一个字节也不写
    for (std::size_t i = 0; i + 2 < SecretBuffer::MAX_SECRET_LENGTH; ++i) {
        REQUIRE(secret.push_back('x'));
    }
    CHECK_FALSE(secret.append(snowman.data(), snowman.size()));
    CHECK(secret.size() == SecretBuffer::MAX_SECRET_LENGTH - 2);
}

TEST_CASE("SecretBuffer rejects input beyond its fixed capacity", "[secret]") {
    SecretBuffer secret;
    for (std::size_t i = 0; i < SecretBuffer::MAX_SECRET_LENGTH; ++i) {
        REQUIRE(secret.push_back('x'));
    }
    CHECK_FALSE(secret.push_back('y'));
    CHECK(secret.size() == SecretBuffer::MAX_SECRET_LENGTH);
}

TEST_CASE("SecretBuffer wipe zeroes all storage", "[secret]") {
    SecretBuffer secret;
    secret.push_back('a');
    secret.push_back('b');
    CHECK_FALSE(secret.is_zeroed());

    secret.wipe();
    CHECK(secret.empty());
    CHECK(secret.is_zeroed());
}

TEST_CASE("SecretBuffer move leaves the source zeroed", "[secret]") {
    SecretBuffer source;
    source.push_back('p');
    source.push_back('w');

    SECTION("move construction") {
        SecretBuffer target(std::move(source));
        CHECK(std::string(target.data(), target.size()) == "pw");
        CHECK(source.is_zeroed());
        CHECK(source.empty());
    }

    SECTION("move assignment") {
        SecretBuffer target;
        target.push_back('z');
        target = std::move(source);
        CHECK(std::string(target.data(), target.size()) == "pw");
        CHECK(source.is_zeroed());
    }
}

} // namespace secret_buffer_tests
