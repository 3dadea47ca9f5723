#include <yeb/config.hpp>
#include <yeb/error.hpp>

#include <catch2/catch_test_macros.hpp>

#include <optional>
#include <string>

using namespace yeb;

namespace {

  std::optional<error>
  failure_of(const std::string& text) {
    try {
      parse_options(text);
    } catch (const error& ex) {
      return ex;
    }
    return std::nullopt;
  }

} // namespace

TEST_CASE("config: empty object keeps defaults", "[config]") {
  auto opts = load_options(nlohmann::json::object());
  CHECK(opts.max_alternatives == converter_options::default_max_alternatives);
  CHECK(opts.max_sequence == converter_options::default_max_sequence);
  CHECK(opts.inline_trivial);
  CHECK_FALSE(opts.drop_inlined);
}

TEST_CASE("config: all keys", "[config]") {
  nlohmann::json config = {{"max-alternatives", 2},
                           {"max-sequence", 6},
                           {"inline", false},
                           {"drop-inlined", true}};
  auto opts = load_options(config);
  CHECK(opts.max_alternatives == 2);
  CHECK(opts.max_sequence == 6);
  CHECK_FALSE(opts.inline_trivial);
  CHECK(opts.drop_inlined);
}

TEST_CASE("config: parsed from text", "[config]") {
  auto opts = parse_options(R"({ "max-sequence": 1 })");
  CHECK(opts.max_sequence == 1);
  CHECK(opts.max_alternatives == 4);
}

TEST_CASE("config: unknown key", "[config]") {
  auto err = failure_of(R"({ "max-sequences": 1 })");
  REQUIRE(err.has_value());
  CHECK(err->kind() == error_kind::config);
  CHECK(err->detail() == "unknown option 'max-sequences'");
}

TEST_CASE("config: wrong types", "[config]") {
  auto negative = failure_of(R"({ "max-alternatives": -1 })");
  REQUIRE(negative.has_value());
  CHECK(negative->kind() == error_kind::config);

  auto text = failure_of(R"({ "max-sequence": "3" })");
  REQUIRE(text.has_value());
  CHECK(text->kind() == error_kind::config);

  auto flag = failure_of(R"({ "inline": 1 })");
  REQUIRE(flag.has_value());
  CHECK(flag->detail() == "'inline' must be true or false");
}

TEST_CASE("config: not an object", "[config]") {
  auto err = failure_of("[1, 2]");
  REQUIRE(err.has_value());
  CHECK(err->kind() == error_kind::config);
}

TEST_CASE("config: malformed JSON", "[config]") {
  auto err = failure_of("{ \"inline\": ");
  REQUIRE(err.has_value());
  CHECK(err->kind() == error_kind::config);
}
