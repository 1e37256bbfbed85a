#include <catch2/catch_test_macros.hpp>
#include "core/result.hpp"

#include <string>

using namespace ladle;

namespace {

Res<int> parse_minutes(const std::string& text) {
    if (text.empty()) return Res<int>::err(Error{ErrorKind::InvalidData, "empty"});
    int total = 0;
    for (char c : text) {
        if (c < '0' || c > '9') return Res<int>::err(Error{ErrorKind::InvalidData, "not a number: " + text});
        total = total * 10 + (c - '0');
    }
    return Res<int>::ok(total);
}

} // namespace

TEST_CASE("Result carries a value or an error", "[result]") {
    SECTION("ok") {
        auto result = parse_minutes("45");
        REQUIRE(result.is_ok());
        REQUIRE_FALSE(result.is_err());
        REQUIRE(result.unwrap() == 45);
    }

    SECTION("err keeps kind and message") {
        auto result = parse_minutes("soon");
        REQUIRE(result.is_err());
        REQUIRE(result.unwrap_err().kind == ErrorKind::InvalidData);
        REQUIRE(result.unwrap_err().message == "not a number: soon");
    }

    SECTION("unwrap on an error throws") {
        auto result = parse_minutes("");
        REQUIRE_THROWS_AS(result.unwrap(), std::runtime_error);
    }
}

TEST_CASE("Error constructors", "[result]") {
    Error storage{"disk I/O error", 10, ErrorKind::Storage};
    REQUIRE(storage.code == 10);
    REQUIRE(storage.kind == ErrorKind::Storage);

    Error plain{"boom"};
    REQUIRE(plain.kind == ErrorKind::Internal);
    REQUIRE(plain.code == 0);

    Error quota{ErrorKind::QuotaExceeded, "quota"};
    REQUIRE(quota.code == 0);
    REQUIRE(std::string(to_string(quota.kind)) == "quota_exceeded");
}

TEST_CASE("Only transient error kinds are retryable", "[result][retry]") {
    REQUIRE(is_retryable(Error{ErrorKind::NetworkUnavailable, "offline"}));
    REQUIRE(is_retryable(Error{ErrorKind::Conflict, "changed on server"}));
    REQUIRE(is_retryable(Error{ErrorKind::Internal, "unexpected"}));
    REQUIRE(is_retryable(Error{ErrorKind::Storage, "locked"}));

    REQUIRE_FALSE(is_retryable(Error{ErrorKind::QuotaExceeded, "full"}));
    REQUIRE_FALSE(is_retryable(Error{ErrorKind::InvalidData, "bad record"}));
    REQUIRE_FALSE(is_retryable(Error{ErrorKind::NotFound, "gone"}));
    REQUIRE_FALSE(is_retryable(Error{ErrorKind::AssetTooLarge, "12MB"}));
}

TEST_CASE("Result combinators", "[result]") {
    SECTION("map and value_or") {
        REQUIRE(parse_minutes("30").map([](int m) { return m * 60; }).unwrap() == 1800);
        REQUIRE(parse_minutes("x").map([](int m) { return m * 60; }).value_or(-1) == -1);
    }

    SECTION("and_then short-circuits") {
        auto at_most_a_day = [](int m) -> Res<int> {
            if (m > 1440) return Res<int>::err(Error{ErrorKind::InvalidData, "too long"});
            return Res<int>::ok(m);
        };
        REQUIRE(parse_minutes("90").and_then(at_most_a_day).unwrap() == 90);
        REQUIRE(parse_minutes("2000").and_then(at_most_a_day).unwrap_err().message == "too long");
        REQUIRE(parse_minutes("?").and_then(at_most_a_day).unwrap_err().message == "not a number: ?");
    }

    SECTION("or_else recovers") {
        auto fallback = [](const Error&) { return Res<int>::ok(0); };
        REQUIRE(parse_minutes("12").or_else(fallback).unwrap() == 12);
        REQUIRE(parse_minutes("").or_else(fallback).unwrap() == 0);
    }

    SECTION("map_err rewrites the error") {
        auto mapped = parse_minutes("").map_err([](Error e) {
            return Error{ErrorKind::Storage, e.message + " (column total_minutes)"};
        });
        REQUIRE(mapped.unwrap_err().kind == ErrorKind::Storage);
        REQUIRE(mapped.unwrap_err().message == "empty (column total_minutes)");
    }
}

TEST_CASE("Result<void>", "[result]") {
    auto ok_result = Res<void>::ok();
    auto err_result = Res<void>::err(Error{ErrorKind::NotFound, "missing"});

    REQUIRE(ok_result.is_ok());
    REQUIRE(err_result.is_err());
    REQUIRE_NOTHROW(ok_result.unwrap());
    REQUIRE_THROWS(err_result.unwrap());
    REQUIRE(err_result.unwrap_err().kind == ErrorKind::NotFound);
}
