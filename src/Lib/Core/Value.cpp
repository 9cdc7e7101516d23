#include "Argon++/Core/Value.hpp"

#include "Argon++/Utils/Error.hpp"
#include "Argon++/Utils/Types.hpp"

using namespace argon::utils::types;
using argon::utils::error::ValueParserError;

namespace argon::core {
  fn IdValueParser() -> ValueParser<String> {
    return [](const StringView text) -> Result<String, ValueParserError> { return String(text); };
  }

  fn BoolValueParser() -> ValueParser<bool> {
    return StringChoiceValueParser<bool>({ true, false });
  }

  fn NegateFlag(ValueParser<bool> parser) -> ValueParser<bool> {
    return Then(std::move(parser), [](const bool value) -> Result<bool, ValueParserError> { return !value; });
  }

  fn FlagCountAccumulator() -> Accumulator<bool, i32> {
    return [](const bool value, const Option<i32> previous) -> i32 { return previous.value_or(0) + (value ? 1 : -1); };
  }
} // namespace argon::core
