#include "Argon++/Core/ParserContext.hpp"

#include "Argon++/Utils/Error.hpp"
#include "Argon++/Utils/Types.hpp"

using namespace argon::utils::types;
using argon::utils::error::ParseError;
using argon::utils::error::ValueParserError;

namespace argon::core {
  namespace {
    struct OptionSplit {
      StringView         name;
      Option<StringView> value;
    };

    // `name=value` splits on the first '='; everything after it is the value.
    fn SplitLongOption(const StringView text) -> OptionSplit {
      if (const usize equals = text.find('='); equals != StringView::npos)
        return { .name = text.substr(0, equals), .value = text.substr(equals + 1) };

      return { .name = text, .value = None };
    }
  } // namespace

  ParserContext::ParserContext(const ArgConfig& config, FrozenArgumentSet args)
    : m_config(config), m_args(std::move(args)) {}

  fn ParserContext::Parse(const ArgConfig& config, const FrozenArgumentSet& args, const Span<const String> tokens) -> Result<Unit, ParseError> {
    ParserContext context(config, args);
    return context.run(tokens);
  }

  fn ParserContext::run(const Span<const String> tokens) -> Result<Unit, ParseError> {
    for (usize i = 0; i < tokens.size(); i++) {
      const String& token = tokens[i];

      if (m_waitingForValue) {
        const SharedPointer<const OptionDefinition> option = std::exchange(m_waitingForValue, nullptr);

        if (Result<Unit, ParseError> filled = Fill(*option->target, token); !filled)
          return filled;

        continue;
      }

      if (m_config.disableOptionsAfter && token == *m_config.disableOptionsAfter) {
        m_optionsAvailable = false;
        continue;
      }

      const ClassifiedToken classified = classify(token);

      Result<Unit, ParseError> handled;

      switch (classified.kind) {
        case TokenKind::Positional:
          if (m_args->commandSet())
            return parseCommand(classified.text, tokens.subspan(i + 1));

          handled = parsePositional(classified.text);
          break;
        case TokenKind::LongOption:
          handled = parseLongOption(token, classified.text);
          break;
        case TokenKind::ShortOption:
          handled = m_config.clusterShortOptions ? parseShortOption(classified.text)
                                                 : parseShortOptionUnclustered(token, classified.text);
          break;
      }

      if (!handled)
        return handled;
    }

    return finish();
  }

  fn ParserContext::classify(const StringView token) const -> ClassifiedToken {
    if (m_optionsAvailable) {
      // A bare prefix names no option, so it is treated as positional text.
      if (token.starts_with(m_config.longPrefix) && token.size() > m_config.longPrefix.size())
        return { .kind = TokenKind::LongOption, .text = token.substr(m_config.longPrefix.size()) };

      if (const Option<String>& shortPrefix = m_config.shortPrefix; shortPrefix && token.starts_with(*shortPrefix) && token.size() > shortPrefix->size())
        return { .kind = TokenKind::ShortOption, .text = token.substr(shortPrefix->size()) };
    }

    return { .kind = TokenKind::Positional, .text = token };
  }

  fn ParserContext::parsePositional(const StringView text) -> Result<Unit, ParseError> {
    const Vec<SharedPointer<const PositionalDefinition>>& positionals = m_args->positionals();

    if (m_nextPositional >= positionals.size())
      return Err(ParseError::TooManyPositionals(text));

    const PositionalDefinition& positional = *positionals[m_nextPositional];

    if (Result<Unit, ParseError> filled = Fill(*positional.target, text); !filled)
      return filled;

    if (!positional.isMulti)
      m_nextPositional++;

    if (positional.noOptionsFollowing.value_or(m_config.noOptionsAfterPositional))
      m_optionsAvailable = false;

    return {};
  }

  fn ParserContext::parseCommand(const StringView text, const Span<const String> remaining) -> Result<Unit, ParseError> {
    const SharedPointer<const CommandDefinition> command = m_args->findCommand(text);

    if (!command)
      return Err(ParseError::UnknownCommand(text));

    if (Result<Unit, ParseError> filled = Fill(*m_args->commandSet()->target, text); !filled)
      return filled;

    return Parse(m_config, command->args(), remaining);
  }

  fn ParserContext::parseLongOption(const StringView token, const StringView text) -> Result<Unit, ParseError> {
    const auto [name, value] = SplitLongOption(text);

    const SharedPointer<const OptionDefinition> option = m_args->findOption(name);

    if (!option)
      return Err(ParseError::UnknownOption(token));

    if (value)
      return Fill(*option->target, *value);

    if (option->isFlag())
      return FillFlag(*option, name == option->inverseName());

    m_waitingForValue = option;
    return {};
  }

  fn ParserContext::parseShortOption(const StringView text) -> Result<Unit, ParseError> {
    for (usize i = 0; i < text.size(); i++) {
      const char         shortName = text[i];
      const bool         isLast    = i + 1 == text.size();
      const Option<char> nextChar  = isLast ? None : Option<char>(text[i + 1]);

      const SharedPointer<const OptionDefinition> option = m_args->findShort(shortName);

      if (!option)
        return Err(ParseError::UnknownOption(shortDisplay(shortName)));

      // A flag followed by '=' takes the text after it as its value instead of clustering.
      if (option->isFlag() && nextChar != '=') {
        if (Result<Unit, ParseError> filled = FillFlag(*option, false); !filled)
          return filled;

        continue;
      }

      if (isLast) {
        m_waitingForValue = option;
        return {};
      }

      StringView rest = text.substr(i + 1);

      if (rest.starts_with('='))
        rest.remove_prefix(1);

      return Fill(*option->target, rest);
    }

    return {};
  }

  fn ParserContext::parseShortOptionUnclustered(const StringView token, const StringView text) -> Result<Unit, ParseError> {
    const SharedPointer<const OptionDefinition> option = m_args->findShort(text.front());

    if (!option)
      return Err(ParseError::UnknownOption(text.size() == 1 ? shortDisplay(text.front()) : String(token)));

    StringView rest = text.substr(1);

    if (rest.empty()) {
      if (option->isFlag())
        return FillFlag(*option, false);

      m_waitingForValue = option;
      return {};
    }

    if (rest.starts_with('='))
      rest.remove_prefix(1);
    else if (option->isFlag())
      return Err(ParseError::UnknownOption(token));

    return Fill(*option->target, rest);
  }

  fn ParserContext::finish() const -> Result<Unit, ParseError> {
    if (const Option<CommandSetDefinition>& commandSet = m_args->commandSet(); commandSet && commandSet->target->isEmpty())
      return Err(ParseError::MissingCommand());

    const Vec<SharedPointer<const PositionalDefinition>>& positionals = m_args->positionals();

    Vec<String> missing;

    // The positional at m_nextPositional may be a multi-valued one that already received values.
    for (usize i = m_nextPositional; i < positionals.size(); i++)
      if (positionals[i]->isMandatory && !positionals[i]->target->wasGiven())
        missing.push_back(positionals[i]->name);

    if (!missing.empty())
      return Err(ParseError::MissingPositionals(std::move(missing)));

    if (m_waitingForValue)
      return Err(ParseError::MissingOptionValue(m_waitingForValue->name));

    return {};
  }

  fn ParserContext::shortDisplay(const char shortName) const -> String {
    return m_config.shortPrefix.value_or("-") + shortName;
  }

  fn ParserContext::Fill(ValueTarget& target, const StringView raw) -> Result<Unit, ParseError> {
    if (Result<Unit, ValueParserError> filled = target.parseAndFill(raw); !filled)
      return Err(ParseError::ValueParsingFailed(target.name(), raw, filled.error().reason));

    return {};
  }

  fn ParserContext::FillFlag(const OptionDefinition& option, const bool inverse) -> Result<Unit, ParseError> {
    return Fill(*option.target, inverse ? "false" : "true");
  }
} // namespace argon::core
