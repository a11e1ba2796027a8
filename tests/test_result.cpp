#include <catch2/catch.hpp>
#include <gapline/result.hpp>
#include <memory>
#include <string>

using namespace gapline;

static Result<int> try_double(Result<int> input) {
    GAPLINE_TRY(input);
    return Result<int>::ok(input.value() * 2);
}

TEST_CASE("Create Ok result and access value", "[result]") {
    auto r = Result<int>::ok(42);
    REQUIRE(r.is_ok());
    REQUIRE_FALSE(r.is_err());
    REQUIRE(r.value() == 42);
    REQUIRE(static_cast<bool>(r));
}

TEST_CASE("Create Err result and access error", "[result]") {
    auto r = Result<int>::err(GapError{GapError::NotFound, "missing trivium"});
    REQUIRE(r.is_err());
    REQUIRE_FALSE(static_cast<bool>(r));
    REQUIRE(r.error().code == GapError::NotFound);
    REQUIRE(r.error().message == "missing trivium");
}

TEST_CASE("Value access on Err throws bad_variant_access", "[result]") {
    auto r = Result<int>::err(GapError{GapError::OutOfRange, "fail"});
    REQUIRE_THROWS_AS(r.value(), std::bad_variant_access);
}

TEST_CASE("GAPLINE_TRY propagates errors and passes through Ok", "[result]") {
    auto failed = try_double(Result<int>::err(GapError{GapError::Config, "bad level"}));
    REQUIRE(failed.is_err());
    REQUIRE(failed.error().code == GapError::Config);

    auto passed = try_double(Result<int>::ok(7));
    REQUIRE(passed.is_ok());
    REQUIRE(passed.value() == 14);
}

TEST_CASE("Status (void result)", "[result]") {
    REQUIRE(ok_status().is_ok());
    auto s = Status::err(GapError{GapError::Config, "bad spelling"});
    REQUIRE(s.is_err());
    REQUIRE(s.error().code == GapError::Config);
}

TEST_CASE("Result with move-only type", "[result]") {
    auto r = Result<std::unique_ptr<int>>::ok(std::make_unique<int>(99));
    REQUIRE(r.is_ok());
    REQUIRE(*r.value() == 99);
}

TEST_CASE("GapError format() with hint", "[error]") {
    GapError e{GapError::NotFound, "trivium not owned", "pass the owning token"};
    auto formatted = e.format();
    REQUIRE(formatted.find("error[NotFound]: trivium not owned") != std::string::npos);
    REQUIRE(formatted.find("\n  hint: pass the owning token") != std::string::npos);
}

TEST_CASE("GapError format() without hint", "[error]") {
    GapError e{GapError::Parse, "unexpected character"};
    auto formatted = e.format();
    REQUIRE(formatted == "error[Parse]: unexpected character");
    REQUIRE_FALSE(e.token_index.has_value());
}

TEST_CASE("GapError format() with token index", "[error]") {
    GapError e = GapError{GapError::OutOfRange, "token index out of range"}.at_token(12);
    REQUIRE(e.token_index == std::optional<size_t>(12));
    REQUIRE(e.format() == "error[OutOfRange]: token index out of range\n  --> token 12");
}

TEST_CASE("GapError code_name() for all codes", "[error]") {
    REQUIRE(std::string(GapError::code_name(GapError::Config)) == "Config");
    REQUIRE(std::string(GapError::code_name(GapError::Parse)) == "Parse");
    REQUIRE(std::string(GapError::code_name(GapError::NotFound)) == "NotFound");
    REQUIRE(std::string(GapError::code_name(GapError::OutOfRange)) == "OutOfRange");
}
