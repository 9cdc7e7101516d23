/**
 * @file Substring.hpp
 * @brief Longest common substring of two names, used to print a flag and its
 * inverse as a single usage entry.
 */

#pragma once

#include "Argon++/Utils/Definitions.hpp"
#include "Argon++/Utils/Types.hpp"

namespace argon::usage {
  namespace {
    using utils::types::String;
    using utils::types::StringView;
  } // namespace

  /**
   * @struct CommonSubstring
   * @brief Two strings split around their longest common substring.
   */
  struct CommonSubstring {
    String firstPrefix;  ///< Text before the substring in the first string.
    String secondPrefix; ///< Text before the substring in the second string.
    String firstSuffix;  ///< Text after the substring in the first string.
    String secondSuffix; ///< Text after the substring in the second string.
    String substring;    ///< The shared part.

    /**
     * @brief Renders both strings at once, e.g. `{no-}color` or `with{-a,out-a}`.
     *
     * A side where both strings agree is left out; a side where only one string
     * has text shows just that text in braces.
     */
    [[nodiscard]] fn toString() const -> String;
  };

  /**
   * @brief Finds the longest common substring of @p first and @p second.
   *
   * Ties resolve to the earliest match in @p first. If the strings share
   * nothing, the substring is empty and each string is its own prefix.
   */
  fn LongestCommonSubstring(StringView first, StringView second) -> CommonSubstring;
} // namespace argon::usage
