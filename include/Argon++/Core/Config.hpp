/**
 * @file Config.hpp
 * @brief Parsing policy: token prefixes, clustering and flag inverse generation.
 */

#pragma once

#if ARGON_TOML_CONFIG
  #include <filesystem>            // std::filesystem::path
  #include <toml++/impl/table.hpp> // toml::table
#endif

#include "Argon++/Utils/Definitions.hpp"
#include "Argon++/Utils/Error.hpp"
#include "Argon++/Utils/Types.hpp"

namespace argon::core {
  namespace {
    using utils::types::Fn;
    using utils::types::Option;
    using utils::types::Pair;
    using utils::types::Result;
    using utils::types::String;
    using utils::types::StringView;
    using utils::types::Vec;
  } // namespace

  /**
   * @brief Produces the inverse name of a flag, or None for no inverse.
   */
  using InverseGenerator = Fn<Option<String>(StringView name)>;

  /**
   * @brief Generates `no-<name>` for every flag.
   */
  fn NoPrefixInverseGenerator() -> InverseGenerator;

  /**
   * @brief The prefix pairs used by PrefixInverseGenerator by default.
   *
   * `with-`/`without-` and `enable-`/`disable-`.
   */
  fn DefaultInversePrefixPairs() -> Vec<Pair<String, String>>;

  /**
   * @brief Swaps a known prefix for its counterpart, otherwise prepends @p fallback.
   *
   * Each pair is tried in both directions, so with the default pairs
   * `with-a` becomes `without-a` and `disable-b` becomes `enable-b`.
   */
  fn PrefixInverseGenerator(Vec<Pair<String, String>> pairs = DefaultInversePrefixPairs(), String fallback = "no-") -> InverseGenerator;

  /**
   * @struct ArgConfig
   * @brief An immutable policy object consumed by registration and parsing.
   */
  struct ArgConfig {
    String           longPrefix               = "--";  ///< Prefix of long options.
    Option<String>   shortPrefix              = "-";   ///< Prefix of short option clusters; None disables short options.
    Option<String>   disableOptionsAfter      = "--";  ///< Token after which only positionals are recognized.
    bool             noOptionsAfterPositional = false; ///< Stop recognizing options after the first positional.
    bool             clusterShortOptions      = true;  ///< Allow `-abc` to mean `-a -b -c` for flags.
    InverseGenerator inverseGenerator;                 ///< Empty means flags get no generated inverse.

    /**
     * @brief The default policy, generating `no-` inverses.
     */
    static fn Default() -> ArgConfig;

    /**
     * @brief Go-style parsing: single-dash long options, no short options,
     * no inverses.
     */
    static fn Go() -> ArgConfig;

#if ARGON_TOML_CONFIG
    /**
     * @brief Builds a config from a TOML table.
     *
     * Recognized keys: preset, long_prefix, short_prefix,
     * options_terminator, no_options_after_positional,
     * cluster_short_options, inverse. Unknown keys are logged and ignored.
     */
    static fn fromToml(const toml::table& tbl) -> Result<ArgConfig>;

    /**
     * @brief Loads a config from a TOML file.
     */
    static fn FromFile(const std::filesystem::path& path) -> Result<ArgConfig>;
#endif
  };
} // namespace argon::core
