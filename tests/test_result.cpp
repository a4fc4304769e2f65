#include <catch2/catch.hpp>
#include <tyck/result.hpp>
#include <string>

using namespace tyck;

static Result<int> try_double(Result<int> input) {
    TYCK_TRY(input);
    return Result<int>::ok(input.value() * 2);
}

static Status check_positive(int n) {
    if (n <= 0) return TyckError{TyckError::InvalidArg, "not positive"};
    return ok_status();
}

static Result<int> checked_square(int n) {
    TYCK_TRY(check_positive(n));
    return Result<int>::ok(n * n);
}

TEST_CASE("Create Ok result and access value", "[result]") {
    auto r = Result<int>::ok(42);
    REQUIRE(r.is_ok());
    REQUIRE_FALSE(r.is_err());
    REQUIRE(r.value() == 42);
    REQUIRE(static_cast<bool>(r));
}

TEST_CASE("Create Err result and access error", "[result]") {
    auto r = Result<int>::err(TyckError{TyckError::Config, "bad option"});
    REQUIRE(r.is_err());
    REQUIRE_FALSE(static_cast<bool>(r));
    REQUIRE(r.error().code == TyckError::Config);
    REQUIRE(r.error().message == "bad option");
}

TEST_CASE("TYCK_TRY propagates errors", "[result]") {
    auto output = try_double(Result<int>::err(TyckError{TyckError::Parse, "syntax error"}));
    REQUIRE(output.is_err());
    REQUIRE(output.error().code == TyckError::Parse);
    REQUIRE(output.error().message == "syntax error");
}

TEST_CASE("TYCK_TRY passes through Ok", "[result]") {
    REQUIRE(try_double(Result<int>::ok(7)).value() == 14);
}

TEST_CASE("TYCK_TRY converts Status errors across Result types", "[result]") {
    REQUIRE(checked_square(3).value() == 9);
    auto r = checked_square(-1);
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == TyckError::InvalidArg);
}

TEST_CASE("TyckError::format includes hint and location", "[result]") {
    TyckError e{TyckError::Config, "max_workers must be at least 1",
                "set max_workers to a positive value", ".tyckconfig.toml", 4};
    std::string s = e.format();
    REQUIRE(s == "error[Config]: max_workers must be at least 1\n"
                 "  hint: set max_workers to a positive value\n"
                 "  --> .tyckconfig.toml:4");
}

TEST_CASE("TyckError::format without extras", "[result]") {
    TyckError e{TyckError::IO, "cannot open config file: x"};
    REQUIRE(e.format() == "error[IO]: cannot open config file: x");
}

TEST_CASE("code names", "[result]") {
    REQUIRE(std::string(TyckError::code_name(TyckError::Regex)) == "Regex");
    REQUIRE(std::string(TyckError::code_name(TyckError::InvalidArg)) == "InvalidArg");
}
