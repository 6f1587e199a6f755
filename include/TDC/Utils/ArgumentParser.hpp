/**
 * @file ArgumentParser.hpp
 * @brief Small command-line argument parser for TabletDriverCleanup.
 *
 * Supports boolean flags with any number of aliases, value options given as
 * either `--name value` or `--name=value`, enum-valued options backed by
 * magic_enum, and generated help text. Help and version requests are reported
 * back to the caller instead of terminating the process.
 */

#pragma once

#include <algorithm>                 // std::ranges::{equal, transform}
#include <concepts>                  // std::convertible_to
#include <format>                    // std::format
#include <magic_enum/magic_enum.hpp> // magic_enum::{enum_name, enum_cast, enum_values}
#include <sstream>                   // std::ostringstream
#include <utility>                   // std::forward
#include <variant>                   // std::{variant, get, holds_alternative}

#include "Error.hpp"
#include "Logging.hpp"
#include "Types.hpp"

namespace tdc::utils::argparse {
  namespace {
    using error::TdcError;
    using error::TdcErrorCode;
    using logging::Println;

    using types::Err;
    using types::i32;
    using types::Map;
    using types::None;
    using types::Option;
    using types::Result;
    using types::Span;
    using types::String;
    using types::StringView;
    using types::UniquePointer;
    using types::Unit;
    using types::usize;
    using types::Vec;

    inline fn EqualsIgnoreCase(const StringView lhs, const StringView rhs) -> bool {
      return std::ranges::equal(lhs, rhs, [](const char charA, const char charB) {
        return std::tolower(static_cast<unsigned char>(charA)) == std::tolower(static_cast<unsigned char>(charB));
      });
    }

    inline fn ToLower(String str) -> String {
      std::ranges::transform(str, str.begin(), [](const char character) { return static_cast<char>(std::tolower(static_cast<unsigned char>(character))); });
      return str;
    }
  } // namespace

  /**
   * @brief Type alias for argument values.
   */
  using ArgValue = std::variant<bool, i32, String>;

  /**
   * @brief Type alias for allowed choices for enum-style arguments.
   */
  using ArgChoices = Vec<String>;

  /**
   * @brief What the caller should do after a successful parse.
   */
  enum class ParseAction : types::u8 {
    Continue,    ///< Normal run.
    ShowHelp,    ///< -h/--help was given; help has been printed.
    ShowVersion, ///< -v/--version was given; the version has been printed.
  };

  /**
   * @brief Generic traits class for enum string conversion using magic_enum.
   * @tparam EnumType The enum type
   */
  template <typename EnumType>
  struct EnumTraits {
    static constexpr bool has_string_conversion = magic_enum::is_scoped_enum_v<EnumType>;

    static fn getChoices() -> ArgChoices {
      ArgChoices choices;

      for (const EnumType value : magic_enum::enum_values<EnumType>())
        choices.emplace_back(ToLower(String(magic_enum::enum_name(value))));

      return choices;
    }

    static fn stringToEnum(const StringView str) -> Option<EnumType> {
      for (const EnumType value : magic_enum::enum_values<EnumType>())
        if (EqualsIgnoreCase(str, magic_enum::enum_name(value)))
          return value;

      return None;
    }
  };

  /**
   * @brief Represents a command-line argument with its metadata and value.
   */
  class Argument {
   public:
    template <typename... NameTs>
      requires(sizeof...(NameTs) >= 1 && (std::convertible_to<NameTs, String> && ...))
    explicit Argument(NameTs&&... names)
      : m_names { String(std::forward<NameTs>(names))... } {}

    fn help(String helpText) -> Argument& {
      m_helpText = std::move(helpText);
      return *this;
    }

    /**
     * @brief Configure this argument as a boolean flag that takes no value.
     */
    fn flag() -> Argument& {
      m_isFlag       = true;
      m_defaultValue = false;
      return *this;
    }

    template <typename T>
    fn defaultValue(T value) -> Argument& {
      m_defaultValue = ArgValue(std::move(value));
      return *this;
    }

    /**
     * @brief Restrict the argument to the names of a scoped enum and use one of them as the default.
     * @tparam EnumType The enum type
     * @param value The default enum value
     */
    template <typename EnumType>
      requires std::is_enum_v<EnumType> && EnumTraits<EnumType>::has_string_conversion
    fn defaultEnum(const EnumType value) -> Argument& {
      m_defaultValue = ToLower(String(magic_enum::enum_name(value)));
      m_choices      = EnumTraits<EnumType>::getChoices();
      return *this;
    }

    template <typename T>
    [[nodiscard]] fn get() const -> T {
      if (m_value && std::holds_alternative<T>(*m_value))
        return std::get<T>(*m_value);

      if (m_defaultValue && std::holds_alternative<T>(*m_defaultValue))
        return std::get<T>(*m_defaultValue);

      return T {};
    }

    [[nodiscard]] fn isUsed() const -> bool {
      return m_isUsed;
    }

    [[nodiscard]] fn getPrimaryName() const -> const String& {
      return m_names.front();
    }

    [[nodiscard]] fn getNames() const -> const Vec<String>& {
      return m_names;
    }

    [[nodiscard]] fn getHelpText() const -> const String& {
      return m_helpText;
    }

    [[nodiscard]] fn isFlag() const -> bool {
      return m_isFlag;
    }

    [[nodiscard]] fn getChoices() const -> const Option<ArgChoices>& {
      return m_choices;
    }

    /**
     * @brief Store a value given on the command line, validating it against the allowed choices.
     * @param value The raw value
     * @return An InvalidArgument error if the value is not one of the choices
     */
    fn setValue(const String& value) -> Result<> {
      if (m_choices) {
        const bool isValid = std::ranges::any_of(*m_choices, [&](const String& choice) { return EqualsIgnoreCase(value, choice); });

        if (!isValid) {
          std::ostringstream choicesStream;

          for (usize i = 0; i < m_choices->size(); ++i)
            choicesStream << (i > 0 ? ", " : "") << (*m_choices)[i];

          return Err(TdcError(
            TdcErrorCode::InvalidArgument,
            std::format("Invalid value '{}' for argument '{}'. Allowed values: {}", value, getPrimaryName(), choicesStream.str())
          ));
        }
      }

      m_value  = value;
      m_isUsed = true;
      return {};
    }

    fn markUsed() -> Unit {
      m_isUsed = true;

      if (m_isFlag)
        m_value = true;
    }

   private:
    Vec<String>        m_names;        ///< Argument names (e.g., {"-d", "--dry-run"})
    String             m_helpText;     ///< Help text for this argument
    Option<ArgValue>   m_value;        ///< The value given on the command line
    Option<ArgValue>   m_defaultValue; ///< Default value if none was given
    Option<ArgChoices> m_choices;      ///< Allowed values for enum-style arguments
    bool               m_isFlag {};    ///< Whether this is a flag argument
    bool               m_isUsed {};    ///< Whether this argument was given
  };

  /**
   * @brief Main argument parser class.
   */
  class ArgumentParser {
   public:
    /**
     * @brief Construct a new ArgumentParser.
     * @param programName Name of the program (for help messages)
     * @param version Version string of the program
     */
    explicit ArgumentParser(String programName, String version)
      : m_programName(std::move(programName)), m_version(std::move(version)) {
      addArguments("-h", "--help").help("Show this help message and exit").flag();
      addArguments("-v", "--version").help("Show version information and exit").flag();
    }

    /**
     * @brief Add a new argument (or multiple aliases) to the parser.
     * @tparam NameTs Variadic list of types convertible to `String`
     * @param names   One or more argument names / aliases
     * @return Reference to the newly created argument
     */
    template <typename... NameTs>
      requires(sizeof...(NameTs) >= 1 && (std::convertible_to<NameTs, String> && ...))
    fn addArguments(NameTs&&... names) -> Argument& {
      m_arguments.emplace_back(std::make_unique<Argument>(std::forward<NameTs>(names)...));
      Argument& arg = *m_arguments.back();

      for (const String& name : arg.getNames())
        m_argumentMap[name] = &arg;

      return arg;
    }

    /**
     * @brief Parse command-line arguments as received by main().
     * @param args Span of argument strings, including the program path
     * @return What the caller should do next, or an InvalidArgument error
     */
    fn parseArgs(const Span<const char* const> args) -> Result<ParseAction> {
      Vec<String> stringArgs;
      stringArgs.reserve(args.size());

      for (const char* arg : args)
        stringArgs.emplace_back(arg);

      return parseArgs(stringArgs);
    }

    fn parseArgs(const Vec<String>& args) -> Result<ParseAction> {
      for (usize i = 1; i < args.size(); ++i) {
        String         name = args[i];
        Option<String> inlineValue;

        if (const usize eqPos = name.find('='); name.starts_with("--") && eqPos != String::npos) {
          inlineValue = name.substr(eqPos + 1);
          name.resize(eqPos);
        }

        if (name == "-h" || name == "--help") {
          printHelp();
          return ParseAction::ShowHelp;
        }

        if (name == "-v" || name == "--version") {
          Println("{} v{}", m_programName, m_version);
          return ParseAction::ShowVersion;
        }

        const auto iter = m_argumentMap.find(name);

        if (iter == m_argumentMap.end())
          return Err(TdcError(TdcErrorCode::InvalidArgument, std::format("Unknown argument: {}", name)));

        Argument* argument = iter->second;

        if (argument->isFlag()) {
          if (inlineValue)
            return Err(TdcError(TdcErrorCode::InvalidArgument, std::format("Argument {} does not take a value", name)));

          argument->markUsed();
          continue;
        }

        if (!inlineValue) {
          if (i + 1 >= args.size())
            return Err(TdcError(TdcErrorCode::InvalidArgument, std::format("Argument {} requires a value", name)));

          inlineValue = args[++i];
        }

        if (Result<> result = argument->setValue(*inlineValue); !result)
          return Err(result.error());
      }

      return ParseAction::Continue;
    }

    template <typename T = String>
    [[nodiscard]] fn get(const StringView name) const -> T {
      if (const auto iter = m_argumentMap.find(name); iter != m_argumentMap.end())
        return iter->second->get<T>();

      return T {};
    }

    template <typename EnumType>
      requires std::is_enum_v<EnumType> && EnumTraits<EnumType>::has_string_conversion
    [[nodiscard]] fn getEnum(const StringView name) const -> Option<EnumType> {
      return EnumTraits<EnumType>::stringToEnum(get<String>(name));
    }

    [[nodiscard]] fn isUsed(const StringView name) const -> bool {
      if (const auto iter = m_argumentMap.find(name); iter != m_argumentMap.end())
        return iter->second->isUsed();

      return false;
    }

    fn printHelp() const -> Unit {
      std::ostringstream usageStream;
      usageStream << "Usage: " << m_programName << " [OPTIONS]";

      Println(usageStream.str());
      Println();
      Println("Options:");

      for (const UniquePointer<Argument>& arg : m_arguments) {
        std::ostringstream lineStream;
        lineStream << "  ";

        for (usize i = 0; i < arg->getNames().size(); ++i)
          lineStream << (i > 0 ? ", " : "") << arg->getNames()[i];

        if (!arg->isFlag())
          lineStream << " <VALUE>";

        Println(lineStream.str());

        if (!arg->getHelpText().empty())
          Println("      {}", arg->getHelpText());

        if (const Option<ArgChoices>& choices = arg->getChoices()) {
          std::ostringstream choicesStream;

          for (usize i = 0; i < choices->size(); ++i)
            choicesStream << (i > 0 ? ", " : "") << (*choices)[i];

          Println("      Possible values: {}", choicesStream.str());
        }
      }
    }

   private:
    String                       m_programName; ///< Program name
    String                       m_version;     ///< Program version
    Vec<UniquePointer<Argument>> m_arguments;   ///< List of all arguments, in registration order
    Map<String, Argument*>       m_argumentMap; ///< Map of argument names to arguments
  };
} // namespace tdc::utils::argparse
