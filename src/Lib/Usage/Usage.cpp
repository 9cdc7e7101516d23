#include "Argon++/Usage/Usage.hpp"

#include <algorithm> // std::ranges::{find_if, max}
#include <cctype>    // std::isspace
#include <charconv>  // std::from_chars
#include <format>    // std::format
#include <iostream>  // std::{cout, cerr, clog}
#include <variant>   // std::{visit, holds_alternative}

#if ARGON_POSIX
  #include <sys/ioctl.h> // ioctl, TIOCGWINSZ, winsize
  #include <unistd.h>    // isatty, STDOUT_FILENO, STDERR_FILENO
#endif

#include "Argon++/Usage/Substring.hpp"
#include "Argon++/Utils/Env.hpp"
#include "Argon++/Utils/Logging.hpp"
#include "Argon++/Utils/Types.hpp"

using namespace argon::utils::types;
using argon::core::CommandDefinition;
using argon::core::OptionDefinition;
using argon::core::PositionalDefinition;
using argon::core::UsageGroup;
using argon::utils::env::GetEnv;
using argon::utils::logging::Bold;

namespace argon::usage {
  namespace {
    constexpr StringView PADDING = "  ";

    fn DescriptionOf(const Definition& definition) -> const String& {
      return std::visit([](const auto& def) -> const String& { return def->description; }, definition);
    }

    fn UsageGroupOf(const Definition& definition) -> const Option<UsageGroup>& {
      return std::visit([](const auto& def) -> const Option<UsageGroup>& { return def->usageGroup; }, definition);
    }

    fn WriteLines(std::ostream& sink, const Vec<String>& lines) -> void {
      for (usize i = 0; i < lines.size(); i++) {
        if (i > 0)
          sink << '\n';

        sink << lines[i];
      }

      sink << '\n';
    }

    fn ColumnsFromEnv() -> Option<usize> {
      const Result<String> columns = GetEnv("COLUMNS");

      if (!columns)
        return None;

      usize width = 0;

      const char* end = columns->data() + columns->size();

      if (const auto [ptr, errc] = std::from_chars(columns->data(), end, width); errc != std::errc() || ptr != end || width == 0)
        return None;

      return width;
    }
  } // namespace

  fn UsageContext::subCommand(SharedPointer<const CommandDefinition> command) const -> UsageContext {
    UsageContext context = *this;
    context.m_path.push_back(std::move(command));
    return context;
  }

  fn DefaultTerminalAttributesFactory([[maybe_unused]] std::ostream& sink) -> TerminalAttributes {
#if ARGON_POSIX
    Option<i32> descriptor;

    if (&sink == &std::cout)
      descriptor = STDOUT_FILENO;
    else if (&sink == &std::cerr || &sink == &std::clog)
      descriptor = STDERR_FILENO;

    if (!descriptor)
      return TerminalAttributes::Defaults();

    if (isatty(*descriptor) == 0)
      return { .supportsColors = false, .width = None };

    const bool noColor = GetEnv("NO_COLOR").has_value();

    winsize size {};

    if (ioctl(*descriptor, TIOCGWINSZ, &size) != -1 && size.ws_col > 0)
      return { .supportsColors = !noColor, .width = static_cast<usize>(size.ws_col) };

    return { .supportsColors = !noColor, .width = ColumnsFromEnv().value_or(80) };
#else
    return { .supportsColors = false, .width = ColumnsFromEnv().value_or(80) };
#endif
  }

  fn FixedTerminalAttributes(TerminalAttributes attributes) -> TerminalAttributesFactory {
    return [attributes](std::ostream& /*sink*/) -> TerminalAttributes { return attributes; };
  }

  fn DefaultTextWrapper(const StringView text, const usize width) -> Vec<String> {
    Vec<String> lines;

    usize lineStart = 0;

    while (lineStart <= text.size()) {
      const usize      lineEnd = std::min(text.find('\n', lineStart), text.size());
      const StringView line    = text.substr(lineStart, lineEnd - lineStart);

      lineStart = lineEnd + 1;

      if (width == 0 || line.size() < width) {
        lines.emplace_back(line);
        continue;
      }

      String buffer;
      usize  wordStart = 0;

      while (wordStart < line.size()) {
        while (wordStart < line.size() && std::isspace(static_cast<unsigned char>(line[wordStart])))
          wordStart++;

        usize wordEnd = wordStart;

        while (wordEnd < line.size() && !std::isspace(static_cast<unsigned char>(line[wordEnd])))
          wordEnd++;

        if (wordEnd == wordStart)
          break;

        StringView word = line.substr(wordStart, wordEnd - wordStart);
        wordStart       = wordEnd;

        bool        needsSpace = !buffer.empty();
        const usize needed     = word.size() + (needsSpace ? 1 : 0);

        if (width - buffer.size() < needed) {
          if (!buffer.empty())
            lines.push_back(buffer);

          buffer.clear();
          needsSpace = false;

          if (word.size() > width) {
            usize chunk = 0;

            for (; chunk + width <= word.size(); chunk += width)
              lines.emplace_back(word.substr(chunk, width));

            word = word.substr(chunk);
          }
        }

        if (needsSpace)
          buffer += ' ';

        buffer += word;
      }

      if (!buffer.empty())
        lines.push_back(buffer);
    }

    return lines;
  }

  DefaultUsagePrinter::DefaultUsagePrinter(TerminalAttributesFactory attributesFactory, TextWrapper wrapper)
    : m_attributesFactory(std::move(attributesFactory)), m_wrapper(std::move(wrapper)) {}

  fn DefaultUsagePrinter::Create(TerminalAttributesFactory attributesFactory, TextWrapper wrapper) -> UsagePrinter {
    return DefaultUsagePrinter(std::move(attributesFactory), std::move(wrapper));
  }

  fn DefaultUsagePrinter::FormatDefinition(const Definition& definition, const ArgConfig& config, const bool inShortUsage) -> String {
    if (const auto* command = std::get_if<SharedPointer<const CommandDefinition>>(&definition))
      return (*command)->name;

    if (const auto* positional = std::get_if<SharedPointer<const PositionalDefinition>>(&definition))
      return inShortUsage ? std::format("<{}>", (*positional)->name) : (*positional)->name;

    const OptionDefinition& option = *std::get<SharedPointer<const OptionDefinition>>(definition);

    String text;

    if (option.shortName && config.shortPrefix)
      text += std::format("{}{}{}", *config.shortPrefix, *option.shortName, inShortUsage ? "|" : ", ");

    text += config.longPrefix;

    if (option.isFlag()) {
      if (const Option<String> inverse = option.inverseName())
        text += LongestCommonSubstring(option.name, *inverse).toString();
      else
        text += option.name;

      text += "[=true|false]";
    } else
      text += std::format("{}={}", option.name, option.valueDescription.value_or("VALUE"));

    return inShortUsage ? std::format("[{}]", text) : text;
  }

  fn DefaultUsagePrinter::BuildUsageLine(const FrozenArgumentSet& args, const ArgConfig& config) -> String {
    String line;

    const auto append = [&line](const StringView part) {
      if (!line.empty())
        line += ' ';

      line += part;
    };

    if (!args->commands().empty())
      append("<command>");

    for (const core::NamedDefinition& entry : args->allDefinitions(false))
      if (!std::holds_alternative<SharedPointer<const CommandDefinition>>(entry.definition))
        append(FormatDefinition(entry.definition, config, true));

    return line;
  }

  fn DefaultUsagePrinter::wrap(const StringView text, const TerminalAttributes& attributes) const -> Vec<String> {
    if (attributes.width)
      return m_wrapper(text, *attributes.width);

    return { String(text) };
  }

  fn DefaultUsagePrinter::printGroup(
    std::ostream&             sink,
    const TerminalAttributes& attributes,
    const StringView          groupName,
    const Vec<Definition>&    contents,
    const ArgConfig&          config
  ) const -> void {
    if (contents.empty())
      return;

    const String heading = std::format("{}:", groupName);

    sink << '\n'
         << (attributes.supportsColors ? Bold(heading) : heading) << '\n'
         << '\n';

    Vec<String> argumentStrings;
    argumentStrings.reserve(contents.size());

    for (const Definition& definition : contents)
      argumentStrings.push_back(FormatDefinition(definition, config, false));

    const usize longest = std::ranges::max(argumentStrings, {}, [](const String& argument) { return argument.size(); }).size();

    const usize argStringLength = longest + (PADDING.size() * 2);

    Option<usize> maxDescriptionWidth;

    if (attributes.width && *attributes.width > PADDING.size() + argStringLength + 1)
      maxDescriptionWidth = *attributes.width - PADDING.size() - argStringLength;

    for (usize i = 0; i < contents.size(); i++) {
      const String& argument    = argumentStrings[i];
      const String& description = DescriptionOf(contents[i]);

      sink << PADDING << argument;

      if (description.empty()) {
        sink << '\n';
        continue;
      }

      sink << String(longest - argument.size(), ' ') << PADDING;

      if (!maxDescriptionWidth) {
        sink << description << '\n';
        continue;
      }

      const Vec<String> lines = m_wrapper(description, *maxDescriptionWidth);

      if (lines.empty()) {
        sink << '\n';
        continue;
      }

      sink << lines.front() << '\n';

      for (usize line = 1; line < lines.size(); line++)
        sink << String(argStringLength, ' ') << lines[line] << '\n';
    }
  }

  fn DefaultUsagePrinter::operator()(
    const FrozenArgumentSet& args,
    const ArgConfig&         config,
    const UsageInfo&         info,
    const UsageContext&      context,
    std::ostream&            sink,
    const bool               showShortUsage
  ) const -> void {
    const TerminalAttributes attributes = m_attributesFactory(sink);

    Vec<Definition> commandsGroup;
    Vec<Definition> positionalGroup;
    Vec<Definition> optionsGroup;

    Vec<Pair<UsageGroup, Vec<Definition>>> usageGroups;

    for (const core::NamedDefinition& entry : args->allDefinitions(false)) {
      const Definition& definition = entry.definition;

      if (const Option<UsageGroup>& group = UsageGroupOf(definition)) {
        auto iter = std::ranges::find_if(usageGroups, [&group](const Pair<UsageGroup, Vec<Definition>>& existing) {
          return existing.first == *group;
        });

        if (iter == usageGroups.end())
          usageGroups.emplace_back(*group, Vec<Definition> { definition });
        else
          iter->second.push_back(definition);
      } else if (std::holds_alternative<SharedPointer<const CommandDefinition>>(definition))
        commandsGroup.push_back(definition);
      else if (std::holds_alternative<SharedPointer<const PositionalDefinition>>(definition))
        positionalGroup.push_back(definition);
      else
        optionsGroup.push_back(definition);
    }

    String usagePrefix = std::format("{} {}", attributes.supportsColors ? Bold("Usage:") : String("Usage:"), info.application.value_or("<this application>"));

    for (const SharedPointer<const CommandDefinition>& command : context.path())
      usagePrefix += ' ' + command->name;

    sink << usagePrefix;

    if (const String usageLine = BuildUsageLine(args, config); usageLine.empty())
      sink << '\n';
    else {
      sink << ' ';
      WriteLines(sink, wrap(usageLine, attributes));
    }

    if (showShortUsage)
      return;

    if (info.prologue) {
      sink << '\n';
      WriteLines(sink, wrap(*info.prologue, attributes));
    }

    printGroup(sink, attributes, "Commands", commandsGroup, config);
    printGroup(sink, attributes, "Positional arguments", positionalGroup, config);
    printGroup(sink, attributes, "Options", optionsGroup, config);

    for (const auto& [group, contents] : usageGroups)
      printGroup(sink, attributes, group.name, contents, config);

    sink << '\n';

    if (info.epilogue) {
      WriteLines(sink, wrap(*info.epilogue, attributes));
      sink << '\n';
    }
  }
} // namespace argon::usage
