#include <catch2/catch_test_macros.hpp>
#include "Packwright/core/result.hpp"
#include "Packwright/core/string_utils.hpp"
#include "Packwright/core/types.hpp"

#include <memory>
#include <stdexcept>

using namespace Packwright;
using namespace Packwright::core;

// =============================================================================
// Result<T>
// =============================================================================

TEST_CASE("Result holds a value or an error", "[result]") {
  SECTION("ok carries the value") {
    auto result = Result<i32>::ok(42);
    REQUIRE(result.isOk());
    REQUIRE_FALSE(result.isError());
    CHECK(result.value() == 42);
    CHECK(result.error().empty());
  }

  SECTION("error carries the message") {
    auto result = Result<i32>::error("boom");
    REQUIRE(result.isError());
    CHECK(result.error() == "boom");
    CHECK(result.valueOr(7) == 7);
  }

  SECTION("value() on an error throws") {
    auto result = Result<std::string>::error("missing");
    CHECK_THROWS_AS(result.value(), std::logic_error);
  }

  SECTION("move-only values") {
    auto result = Result<std::unique_ptr<i32>>::ok(std::make_unique<i32>(5));
    REQUIRE(result.isOk());
    CHECK(*result.value() == 5);
  }
}

TEST_CASE("Result<void> reports success or failure", "[result]") {
  auto ok = Result<void>::ok();
  CHECK(ok.isOk());
  CHECK(ok.error().empty());

  auto failed = Result<void>::error("nope");
  CHECK(failed.isError());
  CHECK(failed.error() == "nope");
}

// =============================================================================
// String helpers
// =============================================================================

TEST_CASE("isTruthy accepts the usual switch values", "[string_utils]") {
  CHECK(isTruthy("1"));
  CHECK(isTruthy("true"));
  CHECK(isTruthy("TRUE"));
  CHECK(isTruthy(" yes "));
  CHECK(isTruthy("On"));

  CHECK_FALSE(isTruthy(""));
  CHECK_FALSE(isTruthy("0"));
  CHECK_FALSE(isTruthy("false"));
  CHECK_FALSE(isTruthy("enabled"));
}

TEST_CASE("trim and startsWith", "[string_utils]") {
  CHECK(trim("  abc \n") == "abc");
  CHECK(trim("   ").empty());
  CHECK(startsWith("tkinter/__init__.py", "tkinter"));
  CHECK_FALSE(startsWith("tk", "tkinter"));
  CHECK(toLower("UDZO") == "udzo");
}
