/**
 * @file Usage.hpp
 * @brief Rendering of usage and help text.
 *
 * The printer only reads a frozen ArgumentSet; it is independent of parsing
 * and can be replaced wholesale through the UsagePrinter function type.
 */

#pragma once

#include <ostream> // std::ostream

#include "Argon++/Core/Config.hpp"
#include "Argon++/Core/Definition.hpp"
#include "Argon++/Utils/Definitions.hpp"
#include "Argon++/Utils/Types.hpp"

namespace argon::usage {
  namespace {
    using core::ArgConfig;
    using core::CommandDefinition;
    using core::Definition;
    using core::FrozenArgumentSet;

    using utils::types::Fn;
    using utils::types::Option;
    using utils::types::SharedPointer;
    using utils::types::String;
    using utils::types::StringView;
    using utils::types::usize;
    using utils::types::Vec;
  } // namespace

  /**
   * @struct UsageInfo
   * @brief Application-level text printed around the generated usage.
   */
  struct UsageInfo {
    Option<String> application; ///< Program name shown after `Usage:`.
    Option<String> prologue;    ///< Printed after the usage line in full help.
    Option<String> epilogue;    ///< Printed at the very end of full help.
  };

  /**
   * @brief The chain of commands selected so far, outermost first.
   */
  class UsageContext {
   public:
    UsageContext() = default;

    [[nodiscard]] fn subCommand(SharedPointer<const CommandDefinition> command) const -> UsageContext;

    [[nodiscard]] fn path() const -> const Vec<SharedPointer<const CommandDefinition>>& {
      return m_path;
    }

   private:
    Vec<SharedPointer<const CommandDefinition>> m_path;
  };

  /**
   * @struct TerminalAttributes
   * @brief What the sink usage is printed to can do.
   */
  struct TerminalAttributes {
    bool          supportsColors = false;
    Option<usize> width;          ///< None disables wrapping.

    static fn Defaults() -> TerminalAttributes {
      return { .supportsColors = false, .width = 80 };
    }
  };

  /**
   * @brief Decides the attributes of a given sink.
   */
  using TerminalAttributesFactory = Fn<TerminalAttributes(std::ostream& sink)>;

  /**
   * @brief Queries the terminal behind std::cout or std::cerr.
   *
   * Other sinks get TerminalAttributes::Defaults(). `NO_COLOR` disables
   * colours; `COLUMNS` is used when the terminal width cannot be queried.
   */
  fn DefaultTerminalAttributesFactory(std::ostream& sink) -> TerminalAttributes;

  /**
   * @brief A factory returning @p attributes for every sink.
   */
  fn FixedTerminalAttributes(TerminalAttributes attributes) -> TerminalAttributesFactory;

  /**
   * @brief Splits @p text into lines of at most @p width characters.
   */
  using TextWrapper = Fn<Vec<String>(StringView text, usize width)>;

  /**
   * @brief Wraps on whitespace, hard-splitting words longer than @p width.
   *
   * Lines already shorter than @p width and explicit newlines are kept.
   */
  fn DefaultTextWrapper(StringView text, usize width) -> Vec<String>;

  /**
   * @brief Prints the usage of @p args to @p sink.
   *
   * With @p showShortUsage only the `Usage:` line is printed, otherwise the
   * full help.
   */
  using UsagePrinter = Fn<void(
    const FrozenArgumentSet& args,
    const ArgConfig&         config,
    const UsageInfo&         info,
    const UsageContext&      context,
    std::ostream&            sink,
    bool                     showShortUsage
  )>;

  /**
   * @brief The default UsagePrinter.
   *
   * Full help lists the `Commands`, `Positional arguments` and `Options`
   * groups, then every custom usage group in order of first use. Descriptions
   * are aligned in a column and wrapped to the terminal width.
   */
  class DefaultUsagePrinter {
   public:
    DefaultUsagePrinter(TerminalAttributesFactory attributesFactory, TextWrapper wrapper);

    fn operator()(
      const FrozenArgumentSet& args,
      const ArgConfig&         config,
      const UsageInfo&         info,
      const UsageContext&      context,
      std::ostream&            sink,
      bool                     showShortUsage
    ) const -> void;

    static fn Create(
      TerminalAttributesFactory attributesFactory = DefaultTerminalAttributesFactory,
      TextWrapper               wrapper           = DefaultTextWrapper
    ) -> UsagePrinter;

   private:
    [[nodiscard]] static fn FormatDefinition(const Definition& definition, const ArgConfig& config, bool inShortUsage) -> String;
    [[nodiscard]] static fn BuildUsageLine(const FrozenArgumentSet& args, const ArgConfig& config) -> String;

    [[nodiscard]] fn wrap(StringView text, const TerminalAttributes& attributes) const -> Vec<String>;

    fn printGroup(
      std::ostream&             sink,
      const TerminalAttributes& attributes,
      StringView                groupName,
      const Vec<Definition>&    contents,
      const ArgConfig&          config
    ) const -> void;

    TerminalAttributesFactory m_attributesFactory;
    TextWrapper               m_wrapper;
  };
} // namespace argon::usage
