#include "Argon++/Core/Config.hpp"

#if ARGON_TOML_CONFIG
  #include <system_error>               // std::error_code
  #include <toml++/impl/node.hpp>        // toml::node
  #include <toml++/impl/node_view.hpp>   // toml::node_view
  #include <toml++/impl/parse_error.hpp> // toml::parse_error
  #include <toml++/impl/parser.hpp>      // toml::parse_file

  #include "Argon++/Utils/Logging.hpp"
#endif

#include "Argon++/Utils/Error.hpp"
#include "Argon++/Utils/Types.hpp"

using namespace argon::utils::types;

namespace argon::core {
  fn NoPrefixInverseGenerator() -> InverseGenerator {
    return [](const StringView name) -> Option<String> { return std::format("no-{}", name); };
  }

  fn DefaultInversePrefixPairs() -> Vec<Pair<String, String>> {
    return {
      { "with-", "without-" },
      { "enable-", "disable-" },
    };
  }

  fn PrefixInverseGenerator(Vec<Pair<String, String>> pairs, String fallback) -> InverseGenerator {
    return [pairs = std::move(pairs), fallback = std::move(fallback)](const StringView name) -> Option<String> {
      for (const auto& [first, second] : pairs) {
        if (name.starts_with(first))
          return second + String(name.substr(first.size()));

        if (name.starts_with(second))
          return first + String(name.substr(second.size()));
      }

      return fallback + String(name);
    };
  }

  fn ArgConfig::Default() -> ArgConfig {
    ArgConfig config;
    config.inverseGenerator = NoPrefixInverseGenerator();
    return config;
  }

  fn ArgConfig::Go() -> ArgConfig {
    ArgConfig config;
    config.longPrefix  = "-";
    config.shortPrefix = None;
    return config;
  }

#if ARGON_TOML_CONFIG
  namespace {
    using enum argon::utils::error::ArgonErrorCode;

    // An empty string in the file means "disabled".
    fn ReadOptionalPrefix(const toml::node_view<const toml::node>& node, const StringView key, Option<String>& out) -> Result<> {
      if (!node.is_string())
        ERR_FMT(ConfigurationError, "'{}' must be a string", key);

      const String value = *node.value<String>();
      out                = value.empty() ? Option<String>() : Option<String>(value);
      return {};
    }

    fn ReadBool(const toml::node_view<const toml::node>& node, const StringView key, bool& out) -> Result<> {
      if (!node.is_boolean())
        ERR_FMT(ConfigurationError, "'{}' must be a boolean", key);

      out = *node.value<bool>();
      return {};
    }
  } // namespace

  fn ArgConfig::fromToml(const toml::table& tbl) -> Result<ArgConfig> {
    ArgConfig config = Default();

    if (const toml::node_view<const toml::node> presetNode = tbl["preset"]) {
      const Option<String> preset = presetNode.value<String>();

      if (!preset)
        ERR(ConfigurationError, "'preset' must be a string");

      if (*preset == "go")
        config = Go();
      else if (*preset != "default")
        ERR_FMT(ConfigurationError, "Unknown preset '{}' (expected 'default' or 'go')", *preset);
    }

    for (const auto& [key, node] : tbl) {
      const StringView name  = key.str();
      const auto       value = toml::node_view<const toml::node>(node);

      Result<> applied;

      if (name == "preset")
        continue;

      if (name == "long_prefix") {
        const Option<String> prefix = value.value<String>();

        if (!prefix || prefix->empty())
          ERR(ConfigurationError, "'long_prefix' must be a non-empty string");

        config.longPrefix = *prefix;
      } else if (name == "short_prefix")
        applied = ReadOptionalPrefix(value, name, config.shortPrefix);
      else if (name == "options_terminator")
        applied = ReadOptionalPrefix(value, name, config.disableOptionsAfter);
      else if (name == "no_options_after_positional")
        applied = ReadBool(value, name, config.noOptionsAfterPositional);
      else if (name == "cluster_short_options")
        applied = ReadBool(value, name, config.clusterShortOptions);
      else if (name == "inverse") {
        const Option<String> inverse = value.value<String>();

        if (!inverse)
          ERR(ConfigurationError, "'inverse' must be a string");

        if (*inverse == "none")
          config.inverseGenerator = nullptr;
        else if (*inverse == "no")
          config.inverseGenerator = NoPrefixInverseGenerator();
        else if (*inverse == "prefix")
          config.inverseGenerator = PrefixInverseGenerator();
        else
          ERR_FMT(ConfigurationError, "Unknown inverse generator '{}' (expected 'none', 'no' or 'prefix')", *inverse);
      } else
        warn_log("Ignoring unknown config key '{}'", name);

      if (!applied)
        return Err(applied.error());
    }

    return config;
  }

  fn ArgConfig::FromFile(const std::filesystem::path& path) -> Result<ArgConfig> {
    namespace fs = std::filesystem;

    if (std::error_code errc; !fs::exists(path, errc)) {
      if (errc)
        ERR_FROM(errc);

      ERR_FMT(NotFound, "Config file not found: {}", path.string());
    }

    try {
      const toml::table parsed = toml::parse_file(path.string());

      debug_log("Parsing config loaded from {}", path.string());

      return fromToml(parsed);
    } catch (const toml::parse_error& err) {
      ERR_FMT(ParseError, "Failed to parse {}: {}", path.string(), err.description());
    } catch (const Exception& exc) {
      ERR_FMT(IoError, "Failed to read {}: {}", path.string(), exc.what());
    }
  }
#endif
} // namespace argon::core
