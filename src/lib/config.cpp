#include <yeb/config.hpp>

#include <yeb/error.hpp>

#include <array>
#include <cstdint>
#include <string>

namespace yeb {

  namespace {

    constexpr std::array<std::string_view, 4> known_keys = {
        "max-alternatives", "max-sequence", "inline", "drop-inlined"};

    std::size_t
    read_count(const nlohmann::json& config, const std::string& key,
               std::size_t fallback) {
      if (!config.contains(key)) return fallback;
      const auto& v = config[key];
      if (!v.is_number_integer() || v.get<std::int64_t>() < 0)
        throw error(error_kind::config,
                    "'" + key + "' must be a non-negative integer");
      return v.get<std::size_t>();
    }

    bool
    read_flag(const nlohmann::json& config, const std::string& key,
              bool fallback) {
      if (!config.contains(key)) return fallback;
      const auto& v = config[key];
      if (!v.is_boolean())
        throw error(error_kind::config, "'" + key + "' must be true or false");
      return v.get<bool>();
    }

  } // namespace

  converter_options
  load_options(const nlohmann::json& config) {
    if (!config.is_object())
      throw error(error_kind::config, "configuration must be a JSON object");

    for (const auto& item : config.items()) {
      const auto& key = item.key();
      bool known = false;
      for (auto k : known_keys)
        if (key == k) known = true;
      if (!known)
        throw error(error_kind::config, "unknown option '" + key + "'");
    }

    converter_options opts;
    opts.max_alternatives =
        read_count(config, "max-alternatives", opts.max_alternatives);
    opts.max_sequence = read_count(config, "max-sequence", opts.max_sequence);
    opts.inline_trivial = read_flag(config, "inline", opts.inline_trivial);
    opts.drop_inlined = read_flag(config, "drop-inlined", opts.drop_inlined);
    return opts;
  }

  converter_options
  parse_options(std::string_view text) {
    nlohmann::json config;
    try {
      config = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& ex) {
      throw error(error_kind::config, ex.what());
    }
    return load_options(config);
  }

} // namespace yeb
