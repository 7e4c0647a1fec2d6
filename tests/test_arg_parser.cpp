#include <catch2/catch.hpp>

#include "shared/arg_parser.h"

#include <cstdint>
#include <limits>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

using idforge::apps::Option;
using idforge::apps::parse_int64;
using idforge::apps::parse_options;

namespace {

struct TestConfig {
  std::optional<std::int64_t> count;
  bool verbose{false};
};

std::vector<Option<TestConfig>> test_options() {
  return {
      {"--count", true, "how many",
       [](TestConfig& c, const std::string& v) {
         c.count = parse_int64(v);
         return c.count.has_value();
       }},
      {"--verbose", false, "chatty",
       [](TestConfig& c, const std::string& /*v*/) {
         c.verbose = true;
         return true;
       }},
  };
}

// Holds argv storage for the duration of a test.
struct Argv {
  explicit Argv(std::vector<std::string> args) : storage(std::move(args)) {
    for (auto& arg : storage) {
      pointers.push_back(arg.data());
    }
  }
  int argc() const { return static_cast<int>(pointers.size()); }
  char** argv() { return pointers.data(); }

  std::vector<std::string> storage;
  std::vector<char*> pointers;
};

}  // namespace

TEST_CASE("parse_int64 accepts whole decimal integers only", "[cli][args]") {
  CHECK(parse_int64("42").value() == 42);
  CHECK(parse_int64("-9223372036854775808").value() == std::numeric_limits<std::int64_t>::min());
  CHECK_FALSE(parse_int64("").has_value());
  CHECK_FALSE(parse_int64("4x").has_value());
  CHECK_FALSE(parse_int64("9223372036854775808").has_value());
}

TEST_CASE("parse_options dispatches flags and collects positionals", "[cli][args]") {
  const auto options = test_options();

  SECTION("flags with and without values") {
    Argv args({"idforge_cli", "cmd", "--count", "5", "--verbose", "extra"});
    const auto parsed = parse_options(args.argc(), args.argv(), options);
    CHECK(parsed.ok);
    CHECK(parsed.config.count.value() == 5);
    CHECK(parsed.config.verbose);
    CHECK(parsed.positional == std::vector<std::string>{"extra"});
  }

  SECTION("negative integers are positional") {
    Argv args({"idforge_cli", "cmd", "-7", "3"});
    const auto parsed = parse_options(args.argc(), args.argv(), options);
    CHECK(parsed.ok);
    CHECK(parsed.positional == std::vector<std::string>{"-7", "3"});
  }

  SECTION("unknown flags fail the parse") {
    Argv args({"idforge_cli", "cmd", "--bogus"});
    CHECK_FALSE(parse_options(args.argc(), args.argv(), options).ok);
  }

  SECTION("a missing value fails the parse") {
    Argv args({"idforge_cli", "cmd", "--count"});
    CHECK_FALSE(parse_options(args.argc(), args.argv(), options).ok);
  }

  SECTION("a rejected value fails the parse") {
    Argv args({"idforge_cli", "cmd", "--count", "many"});
    CHECK_FALSE(parse_options(args.argc(), args.argv(), options).ok);
  }

  SECTION("a double dash ends flag parsing") {
    Argv args({"idforge_cli", "cmd", "--", "--verbose"});
    const auto parsed = parse_options(args.argc(), args.argv(), options);
    CHECK(parsed.ok);
    CHECK_FALSE(parsed.config.verbose);
    CHECK(parsed.positional == std::vector<std::string>{"--verbose"});
  }
}

TEST_CASE("print_usage lists every option", "[cli][args]") {
  std::ostringstream os;
  idforge::apps::print_usage(os, "idforge_cli cmd [options]", test_options());
  const std::string text = os.str();
  CHECK(text.find("Usage: idforge_cli cmd [options]") != std::string::npos);
  CHECK(text.find("--count <value>") != std::string::npos);
  CHECK(text.find("--verbose\n") != std::string::npos);
}
