/**
 * @file Value.hpp
 * @brief Value parsers, value printers and accumulators.
 *
 * A value parser turns the raw text of one occurrence of an argument into a
 * typed value. An accumulator folds every parsed occurrence into the value
 * that is finally stored for the argument. Parsers are composed with
 * ordinary function composition (see Then and Also).
 */

#pragma once

#include <algorithm>                 // std::ranges::find
#include <charconv>                  // std::from_chars
#include <concepts>                  // std::{integral, floating_point}
#include <format>                    // std::format, std::formattable
#include <magic_enum/magic_enum.hpp> // magic_enum::{enum_name, enum_values}
#include <type_traits>               // std::{invoke_result_t, is_enum_v}

#include "Argon++/Utils/Definitions.hpp"
#include "Argon++/Utils/Error.hpp"
#include "Argon++/Utils/Types.hpp"

namespace argon::core {
  namespace {
    using utils::error::ValueParserError;

    using utils::types::Err;
    using utils::types::f64;
    using utils::types::Fn;
    using utils::types::i32;
    using utils::types::i64;
    using utils::types::Option;
    using utils::types::Pair;
    using utils::types::Result;
    using utils::types::Set;
    using utils::types::String;
    using utils::types::StringView;
    using utils::types::Unit;
    using utils::types::Vec;
  } // namespace

  /**
   * @brief Converts the raw text of an argument into a value of type T.
   */
  template <typename T>
  using ValueParser = Fn<Result<T, ValueParserError>(StringView text)>;

  /**
   * @brief Converts a value back into the text a user would type for it.
   */
  template <typename T>
  using ValuePrinter = Fn<String(const T& value)>;

  /**
   * @brief Folds a newly parsed value into the previously stored one.
   *
   * @p previous holds the current content of the argument's slot: the default
   * for optional arguments, or nothing when a mandatory argument is seen for
   * the first time.
   */
  template <typename T, typename U>
  using Accumulator = Fn<U(T value, Option<U> previous)>;

  /**
   * @brief A printer that formats values through std::format.
   */
  template <typename T>
    requires std::formattable<T, char>
  fn ToStringValuePrinter() -> ValuePrinter<T> {
    return [](const T& value) -> String { return std::format("{}", value); };
  }

  /**
   * @brief A printer for enums, producing the enumerator's name.
   * @param intercept Optional hook that rewrites the name (e.g. to lowercase it).
   */
  template <typename E>
    requires std::is_enum_v<E>
  fn EnumValuePrinter(Fn<String(StringView)> intercept = {}) -> ValuePrinter<E> {
    return [intercept = std::move(intercept)](const E& value) -> String {
      String name(magic_enum::enum_name(value));
      return intercept ? intercept(name) : name;
    };
  }

  /**
   * @brief A parser that returns its input unchanged.
   */
  fn IdValueParser() -> ValueParser<String>;

  /**
   * @brief A parser for integers in the given radix.
   *
   * Accepts an optional leading sign; the whole token must be consumed.
   */
  template <std::integral I = i64>
  fn IntValueParser(const i32 radix = 10) -> ValueParser<I> {
    return [radix](const StringView text) -> Result<I, ValueParserError> {
      StringView digits  = text;
      const bool hadPlus = digits.starts_with('+');

      if (hadPlus)
        digits.remove_prefix(1);

      I value {};

      if (digits.empty() || (hadPlus && (digits.front() == '+' || digits.front() == '-')))
        return Err(ValueParserError { "Invalid int" });

      const char* end = digits.data() + digits.size();

      if (const auto [ptr, errc] = std::from_chars(digits.data(), end, value, radix); errc != std::errc() || ptr != end)
        return Err(ValueParserError { "Invalid int" });

      return value;
    };
  }

  /**
   * @brief A parser for floating point numbers.
   */
  template <std::floating_point F = f64>
  fn FloatValueParser() -> ValueParser<F> {
    return [](const StringView text) -> Result<F, ValueParserError> {
      StringView digits  = text;
      const bool hadPlus = digits.starts_with('+');

      if (hadPlus)
        digits.remove_prefix(1);

      F value {};

      if (digits.empty() || (hadPlus && (digits.front() == '+' || digits.front() == '-')))
        return Err(ValueParserError { "Invalid number" });

      const char* end = digits.data() + digits.size();

      if (const auto [ptr, errc] = std::from_chars(digits.data(), end, value); errc != std::errc() || ptr != end)
        return Err(ValueParserError { "Invalid number" });

      return value;
    };
  }

  /**
   * @brief A parser that maps the printed form of each choice back to the choice.
   * @param choices The accepted values.
   * @param printer Produces the text accepted for each choice.
   */
  template <typename T>
  fn StringChoiceValueParser(const Vec<T>& choices, const ValuePrinter<T>& printer) -> ValueParser<T> {
    Vec<Pair<String, T>> table;
    table.reserve(choices.size());

    for (const T& choice : choices)
      table.emplace_back(printer(choice), choice);

    return [table = std::move(table)](const StringView text) -> Result<T, ValueParserError> {
      for (const auto& [printed, choice] : table)
        if (printed == text)
          return choice;

      String formatted;

      for (const auto& [printed, choice] : table) {
        if (!formatted.empty())
          formatted += ", ";

        formatted += printed;
      }

      return Err(ValueParserError { std::format("Value not in available choices: {}", formatted) });
    };
  }

  template <typename T>
    requires std::formattable<T, char>
  fn StringChoiceValueParser(const Vec<T>& choices) -> ValueParser<T> {
    return StringChoiceValueParser<T>(choices, ToStringValuePrinter<T>());
  }

  /**
   * @brief A parser accepting the enumerator names of E.
   * @param intercept Optional hook that rewrites each name before matching.
   */
  template <typename E>
    requires std::is_enum_v<E>
  fn EnumValueParser(Fn<String(StringView)> intercept = {}) -> ValueParser<E> {
    constexpr auto values = magic_enum::enum_values<E>();
    return StringChoiceValueParser<E>(Vec<E>(values.begin(), values.end()), EnumValuePrinter<E>(std::move(intercept)));
  }

  /**
   * @brief A parser accepting the strings "true" and "false".
   */
  fn BoolValueParser() -> ValueParser<bool>;

  /**
   * @brief Runs @p parser, then feeds its value to @p next.
   *
   * @p next returns a Result, so it can both convert and validate.
   */
  template <typename T, typename Func>
  fn Then(ValueParser<T> parser, Func next) -> ValueParser<typename std::invoke_result_t<Func, T>::value_type> {
    using S = typename std::invoke_result_t<Func, T>::value_type;

    return [parser = std::move(parser), next = std::move(next)](const StringView text) -> Result<S, ValueParserError> {
      Result<T, ValueParserError> parsed = parser(text);

      if (!parsed)
        return Err(std::move(parsed).error());

      return next(std::move(*parsed));
    };
  }

  /**
   * @brief Runs @p parser, then passes its value to @p check, keeping the value.
   *
   * @p check returns Result<Unit, ValueParserError>; an error rejects the value.
   */
  template <typename T, typename Func>
  fn Also(ValueParser<T> parser, Func check) -> ValueParser<T> {
    return [parser = std::move(parser), check = std::move(check)](const StringView text) -> Result<T, ValueParserError> {
      Result<T, ValueParserError> parsed = parser(text);

      if (!parsed)
        return parsed;

      if (Result<Unit, ValueParserError> checked = check(*parsed); !checked)
        return Err(std::move(checked).error());

      return parsed;
    };
  }

  /**
   * @brief Restricts an already-parsed value to a set of choices.
   */
  template <typename T>
  fn ChoiceValueParser(Vec<T> choices, ValueParser<T> parser, ValuePrinter<T> printer) -> ValueParser<T> {
    return Also(
      std::move(parser),
      [choices = std::move(choices), printer = std::move(printer)](const T& value) -> Result<Unit, ValueParserError> {
        if (std::ranges::find(choices, value) != choices.end())
          return {};

        String formatted;

        for (const T& choice : choices) {
          if (!formatted.empty())
            formatted += ", ";

          formatted += printer(choice);
        }

        return Err(ValueParserError { std::format("Value not in available choices: {}", formatted) });
      }
    );
  }

  template <typename T>
    requires std::formattable<T, char>
  fn ChoiceValueParser(Vec<T> choices, ValueParser<T> parser) -> ValueParser<T> {
    return ChoiceValueParser<T>(std::move(choices), std::move(parser), ToStringValuePrinter<T>());
  }

  /**
   * @brief Wraps a boolean parser and flips its result.
   */
  fn NegateFlag(ValueParser<bool> parser) -> ValueParser<bool>;

  /**
   * @brief Keeps only the most recent value.
   */
  template <typename T>
  fn DiscardAccumulator() -> Accumulator<T, T> {
    return [](T value, Option<T> /*previous*/) -> T { return value; };
  }

  /**
   * @brief Appends every value to a list.
   */
  template <typename T>
  fn ListAccumulator() -> Accumulator<T, Vec<T>> {
    return [](T value, Option<Vec<T>> previous) -> Vec<T> {
      Vec<T> list = previous ? std::move(*previous) : Vec<T> {};
      list.push_back(std::move(value));
      return list;
    };
  }

  /**
   * @brief Inserts every value into a set.
   */
  template <typename T>
  fn SetAccumulator() -> Accumulator<T, Set<T>> {
    return [](T value, Option<Set<T>> previous) -> Set<T> {
      Set<T> set = previous ? std::move(*previous) : Set<T> {};
      set.insert(std::move(value));
      return set;
    };
  }

  /**
   * @brief Counts flag occurrences: +1 for every true, -1 for every false.
   */
  fn FlagCountAccumulator() -> Accumulator<bool, i32>;

  /**
   * @brief Adapts an accumulator to a slot that stores Option<U>.
   *
   * Used for arguments whose default is "no value at all".
   */
  template <typename T, typename U>
  fn LiftOptional(Accumulator<T, U> accumulator) -> Accumulator<T, Option<U>> {
    return [accumulator = std::move(accumulator)](T value, Option<Option<U>> previous) -> Option<U> {
      Option<U> flattened;

      if (previous)
        flattened = std::move(*previous);

      return accumulator(std::move(value), std::move(flattened));
    };
  }
} // namespace argon::core
