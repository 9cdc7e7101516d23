/**
 * @file Holder.hpp
 * @brief Value holders: the slots parsing writes into and callers read from.
 */

#pragma once

#include <optional> // std::bad_optional_access

#include "Argon++/Core/Value.hpp"
#include "Argon++/Utils/Definitions.hpp"
#include "Argon++/Utils/Error.hpp"
#include "Argon++/Utils/Types.hpp"

namespace argon::core {
  namespace {
    using utils::error::ValueParserError;

    using utils::types::Err;
    using utils::types::Option;
    using utils::types::Result;
    using utils::types::SharedPointer;
    using utils::types::String;
    using utils::types::StringView;
    using utils::types::Unit;
  } // namespace

  /**
   * @struct ValueCell
   * @brief Shared storage behind a value holder.
   */
  template <typename U>
  struct ValueCell {
    String    name;             ///< The argument name, for error messages.
    Option<U> value;            ///< Empty until a default is set or a value is parsed.
    bool      wasGiven = false; ///< Whether the argument appeared on the command line.
  };

  /**
   * @brief A handle to the eventual value of an argument.
   *
   * Copies refer to the same slot. Reading the value of a slot that was never
   * filled (a mandatory argument before parsing, or a default-constructed
   * handle) throws std::bad_optional_access.
   */
  template <typename U>
  class Arg {
   public:
    Arg() = default;

    explicit Arg(SharedPointer<ValueCell<U>> cell)
      : m_cell(std::move(cell)) {}

    [[nodiscard]] fn name() const -> const String& {
      static const String Unnamed;
      return m_cell ? m_cell->name : Unnamed;
    }

    /**
     * @brief The parsed (or default) value.
     * @throws std::bad_optional_access if the slot is empty.
     */
    [[nodiscard]] fn value() const -> const U& {
      if (!m_cell)
        throw std::bad_optional_access();

      return m_cell->value.value();
    }

    /**
     * @brief Whether the argument was given; if false, value() is the default.
     */
    [[nodiscard]] fn wasGiven() const -> bool {
      return m_cell && m_cell->wasGiven;
    }

    [[nodiscard]] fn hasValue() const -> bool {
      return m_cell && m_cell->value.has_value();
    }

   private:
    SharedPointer<ValueCell<U>> m_cell;
  };

  /**
   * @brief The type-erased face of a holder, as seen by the parse state machine.
   */
  class ValueTarget {
   public:
    ValueTarget()                              = default;
    ValueTarget(const ValueTarget&)            = delete;
    ValueTarget(ValueTarget&&)                 = delete;
    fn operator=(const ValueTarget&)->ValueTarget& = delete;
    fn operator=(ValueTarget&&)->ValueTarget&      = delete;
    virtual ~ValueTarget()                     = default;

    [[nodiscard]] virtual fn name() const -> const String& = 0;

    /**
     * @brief Parses @p text and folds the result into the slot.
     * @return The parser's error if the text was rejected; the slot is then untouched.
     */
    virtual fn parseAndFill(StringView text) -> Result<Unit, ValueParserError> = 0;

    [[nodiscard]] virtual fn wasGiven() const -> bool = 0;
    [[nodiscard]] virtual fn isEmpty() const -> bool  = 0;
  };

  /**
   * @brief A ValueTarget parsing values of type T into a slot of type U.
   */
  template <typename T, typename U>
  class AccumulatingTarget final : public ValueTarget {
   public:
    AccumulatingTarget(SharedPointer<ValueCell<U>> cell, ValueParser<T> parser, Accumulator<T, U> accumulator)
      : m_cell(std::move(cell)), m_parser(std::move(parser)), m_accumulator(std::move(accumulator)) {}

    [[nodiscard]] fn name() const -> const String& override {
      return m_cell->name;
    }

    fn parseAndFill(const StringView text) -> Result<Unit, ValueParserError> override {
      Result<T, ValueParserError> parsed = m_parser(text);

      if (!parsed)
        return Err(std::move(parsed).error());

      m_cell->value    = m_accumulator(std::move(*parsed), std::move(m_cell->value));
      m_cell->wasGiven = true;

      return {};
    }

    [[nodiscard]] fn wasGiven() const -> bool override {
      return m_cell->wasGiven;
    }

    [[nodiscard]] fn isEmpty() const -> bool override {
      return !m_cell->value.has_value();
    }

    [[nodiscard]] fn holder() const -> Arg<U> {
      return Arg<U>(m_cell);
    }

   private:
    SharedPointer<ValueCell<U>> m_cell;
    ValueParser<T>              m_parser;
    Accumulator<T, U>           m_accumulator;
  };
} // namespace argon::core
