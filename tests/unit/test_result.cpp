#include <catch2/catch_test_macros.hpp>
#include "core/result.hpp"

using namespace lanlink;

TEST_CASE("Result::ok creates a success result", "[result]") {
    auto result = Result<int>::ok(42);

    REQUIRE(result.is_ok());
    REQUIRE_FALSE(result.is_err());
    REQUIRE(result.unwrap() == 42);
}

TEST_CASE("Result::err carries kind, message and code", "[result]") {
    auto result = Result<int>::err(Error{ErrorKind::CancelledByRemote, "Cancelled by receiver", 4001});

    REQUIRE(result.is_err());
    REQUIRE(result.unwrap_err().kind == ErrorKind::CancelledByRemote);
    REQUIRE(result.unwrap_err().message == "Cancelled by receiver");
    REQUIRE(result.unwrap_err().code == 4001);
    REQUIRE(result.unwrap_err().qmessage() == QStringLiteral("Cancelled by receiver"));
}

TEST_CASE("Result::unwrap throws on error", "[result]") {
    auto result = Result<int>::err(Error{"error"});

    REQUIRE_THROWS_AS(result.unwrap(), std::runtime_error);
}

TEST_CASE("Result::unwrap_err throws on success", "[result]") {
    auto result = Result<int>::ok(1);

    REQUIRE_THROWS_AS(result.unwrap_err(), std::runtime_error);
}

TEST_CASE("Result::value_or returns default on error", "[result]") {
    auto ok_result = Result<int>::ok(42);
    auto err_result = Result<int>::err(Error{"error"});

    REQUIRE(ok_result.value_or(0) == 42);
    REQUIRE(err_result.value_or(0) == 0);
}

TEST_CASE("Result::map transforms success value and keeps errors", "[result]") {
    auto mapped = Result<int>::ok(21).map([](int x) { return x * 2; });
    REQUIRE(mapped.unwrap() == 42);

    auto failed = Result<int>::err(Error{ErrorKind::Timeout, "slow"}).map([](int x) { return x * 2; });
    REQUIRE(failed.is_err());
    REQUIRE(failed.unwrap_err().kind == ErrorKind::Timeout);
}

TEST_CASE("Result::and_then chains operations", "[result]") {
    auto divide = [](int x) -> Result<int> {
        if (x == 0) return Result<int>::err(Error{ErrorKind::InvalidArgument, "division by zero"});
        return Result<int>::ok(100 / x);
    };

    REQUIRE(Result<int>::ok(5).and_then(divide).unwrap() == 20);
    REQUIRE(Result<int>::ok(0).and_then(divide).unwrap_err().kind == ErrorKind::InvalidArgument);
    REQUIRE(Result<int>::err(Error{"initial error"}).and_then(divide).unwrap_err().message == "initial error");
}

TEST_CASE("Result::inspect_err only runs on error", "[result]") {
    int calls = 0;
    Result<int>::ok(1).inspect_err([&](const Error&) { ++calls; });
    REQUIRE(calls == 0);

    Result<int>::err(Error{"boom"}).inspect_err([&](const Error& e) {
        ++calls;
        REQUIRE(e.message == "boom");
    });
    REQUIRE(calls == 1);
}

TEST_CASE("Result<void> works correctly", "[result]") {
    auto ok_result = Result<void>::ok();
    auto err_result = Result<void>::err(Error{ErrorKind::NotConnected, "gone"});

    REQUIRE(ok_result.is_ok());
    REQUIRE(err_result.is_err());

    REQUIRE_NOTHROW(ok_result.unwrap());
    REQUIRE_THROWS(err_result.unwrap());
    REQUIRE(err_result.unwrap_err().kind == ErrorKind::NotConnected);

    auto chained = ok_result.and_then([] { return Result<int>::ok(7); });
    REQUIRE(chained.unwrap() == 7);
}

TEST_CASE("ErrorKind names are stable", "[result]") {
    REQUIRE(std::string(to_string(ErrorKind::CancelledByRemote)) == "cancelled_by_remote");
    REQUIRE(std::string(to_string(ErrorKind::NetworkBindFailure)) == "network_bind_failure");
    REQUIRE(std::string(to_string(ErrorKind::ProtocolParseError)) == "protocol_parse_error");
}
