#include "Argon++/Usage/Substring.hpp"

#include <format>  // std::format
#include <utility> // std::swap

#include "Argon++/Utils/Types.hpp"

using namespace argon::utils::types;

namespace argon::usage {
  namespace {
    fn ShowChoice(const StringView first, const StringView second) -> String {
      if (first.empty() && second.empty())
        return {};

      if (first.empty() || second.empty())
        return std::format("{{{}}}", first.empty() ? second : first);

      return std::format("{{{},{}}}", first, second);
    }
  } // namespace

  fn CommonSubstring::toString() const -> String {
    return ShowChoice(firstPrefix, secondPrefix) + substring + ShowChoice(firstSuffix, secondSuffix);
  }

  fn LongestCommonSubstring(const StringView first, const StringView second) -> CommonSubstring {
    // current[j + 1] is the length of the common suffix of first[..i] and second[..j].
    Vec<usize> previous(second.size() + 1, 0);
    Vec<usize> current(second.size() + 1, 0);

    usize longest   = 0;
    usize firstEnd  = 0;
    usize secondEnd = 0;

    for (usize i = 0; i < first.size(); i++) {
      for (usize j = 0; j < second.size(); j++) {
        current[j + 1] = first[i] == second[j] ? previous[j] + 1 : 0;

        if (current[j + 1] > longest) {
          longest   = current[j + 1];
          firstEnd  = i + 1;
          secondEnd = j + 1;
        }
      }

      std::swap(previous, current);
    }

    if (longest == 0)
      return {
        .firstPrefix  = String(first),
        .secondPrefix = String(second),
        .firstSuffix  = {},
        .secondSuffix = {},
        .substring    = {},
      };

    const usize firstBegin  = firstEnd - longest;
    const usize secondBegin = secondEnd - longest;

    return {
      .firstPrefix  = String(first.substr(0, firstBegin)),
      .secondPrefix = String(second.substr(0, secondBegin)),
      .firstSuffix  = String(first.substr(firstEnd)),
      .secondSuffix = String(second.substr(secondEnd)),
      .substring    = String(first.substr(firstBegin, longest)),
    };
  }
} // namespace argon::usage
