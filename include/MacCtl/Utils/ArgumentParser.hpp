/**
 * @file ArgumentParser.hpp
 * @brief Simple command-line argument parser for macctl.
 *
 * This header provides a lightweight argument parser that follows the macctl
 * coding conventions and type system. It supports flags, valued options,
 * ordered positional arguments (used for subcommands and their operands),
 * enum-backed choices, and help text generation.
 */

#pragma once

#include <algorithm>                 // std::ranges::{equal, transform, find_if}
#include <cctype>                    // std::tolower
#include <charconv>                  // std::from_chars
#include <concepts>                  // std::convertible_to
#include <cstdlib>                   // std::exit
#include <format>                    // std::format
#include <magic_enum/magic_enum.hpp> // magic_enum::enum_name, magic_enum::enum_cast
#include <sstream>                   // std::ostringstream
#include <utility>                   // std::forward
#include <variant>                   // std::{variant, get, holds_alternative}

#include "Error.hpp"
#include "Logging.hpp"
#include "Types.hpp"

namespace macctl::utils::argparse {
  namespace {
    using error::MacCtlError;
    using error::MacCtlErrorCode;
    using logging::Println;

    using types::Err;
    using types::f64;
    using types::Map;
    using types::Option;
    using types::Result;
    using types::Span;
    using types::String;
    using types::StringView;
    using types::UniquePointer;
    using types::Unit;
    using types::usize;
    using types::Vec;
  } // namespace

  /**
   * @brief Type alias for argument values.
   */
  using ArgValue = std::variant<bool, String>;

  /**
   * @brief Type alias for allowed choices for enum-style arguments.
   */
  using ArgChoices = Vec<String>;

  namespace detail {
    inline fn EqualsIgnoreCase(const StringView lhs, const StringView rhs) -> bool {
      return std::ranges::equal(lhs, rhs, [](const char charA, const char charB) {
        return std::tolower(static_cast<unsigned char>(charA)) == std::tolower(static_cast<unsigned char>(charB));
      });
    }

    inline fn ToLower(String text) -> String {
      std::ranges::transform(text, text.begin(), [](const char character) {
        return static_cast<char>(std::tolower(static_cast<unsigned char>(character)));
      });
      return text;
    }

    /**
     * @brief Checks whether a token such as "-5" is a number rather than an option name.
     */
    inline fn LooksNumeric(const StringView token) -> bool {
      f64        value = 0.0;
      const auto end   = token.data() + token.size();
      const auto [ptr, errc] = std::from_chars(token.data(), end, value);

      return errc == std::errc() && ptr == end;
    }

    inline fn JoinChoices(const ArgChoices& choices) -> String {
      std::ostringstream choicesStream;

      for (usize i = 0; i < choices.size(); ++i) {
        if (i > 0)
          choicesStream << ", ";

        choicesStream << ToLower(choices[i]);
      }

      return choicesStream.str();
    }
  } // namespace detail

  /**
   * @brief Generic traits class for enum string conversion using magic_enum.
   * @tparam EnumType The enum type
   */
  template <typename EnumType>
  struct EnumTraits {
    static constexpr bool has_string_conversion = magic_enum::is_scoped_enum_v<EnumType>;

    static fn getChoices() -> ArgChoices {
      static_assert(has_string_conversion, "Enum type must be a scoped enum");

      ArgChoices choices;
      const auto enumValues = magic_enum::enum_values<EnumType>();
      choices.reserve(enumValues.size());

      for (const auto value : enumValues)
        choices.emplace_back(magic_enum::enum_name(value));

      return choices;
    }

    static fn stringToEnum(const String& str) -> EnumType {
      static_assert(has_string_conversion, "Enum type must be a scoped enum");

      if (auto result = magic_enum::enum_cast<EnumType>(str); result.has_value())
        return result.value();

      const auto enumValues = magic_enum::enum_values<EnumType>();
      for (const auto value : enumValues)
        if (detail::EqualsIgnoreCase(str, magic_enum::enum_name(value)))
          return value;

      return enumValues[0];
    }

    static fn enumToString(EnumType value) -> String {
      return String(magic_enum::enum_name(value));
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

    /**
     * @brief Set the help text for this argument.
     * @param help_text The help text
     * @return Reference to this argument for method chaining
     */
    fn help(String help_text) -> Argument& {
      m_helpText = std::move(help_text);
      return *this;
    }

    /**
     * @brief Set the default value for this argument.
     * @tparam T Type of the default value
     * @param value The default value
     * @return Reference to this argument for method chaining
     */
    template <typename T>
    fn defaultValue(T value) -> Argument& {
      m_defaultValue = std::move(value);
      return *this;
    }

    /**
     * @brief Set the default value for this argument as an enum.
     *
     * Also restricts the accepted values to the enum's names.
     * @tparam EnumType The enum type
     * @param value The default enum value
     * @return Reference to this argument for method chaining
     */
    template <typename EnumType>
      requires std::is_enum_v<EnumType> && EnumTraits<EnumType>::has_string_conversion
    fn defaultValue(EnumType value) -> Argument& {
      m_defaultValue = EnumTraits<EnumType>::enumToString(value);
      m_choices      = EnumTraits<EnumType>::getChoices();

      return *this;
    }

    /**
     * @brief Configure this argument as a flag.
     * @return Reference to this argument for method chaining
     */
    fn flag() -> Argument& {
      m_isFlag       = true;
      m_defaultValue = false;
      return *this;
    }

    /**
     * @brief Configure this argument as positional.
     *
     * Positional arguments are filled in declaration order by tokens that are
     * not option names.
     * @return Reference to this argument for method chaining
     */
    fn positional() -> Argument& {
      m_isPositional = true;
      return *this;
    }

    /**
     * @brief Set allowed choices for enum-style arguments.
     * @param choices Vector of allowed string values
     * @return Reference to this argument for method chaining
     */
    fn choices(ArgChoices choices) -> Argument& {
      m_choices = std::move(choices);
      return *this;
    }

    /**
     * @brief Get the value of this argument.
     * @tparam T Type to get the value as
     * @return The argument value, or default value if not provided
     */
    template <typename T>
    fn get() const -> T {
      if (m_isUsed && m_value.has_value())
        return std::get<T>(m_value.value());

      if (m_defaultValue.has_value())
        return std::get<T>(m_defaultValue.value());

      return T {};
    }

    /**
     * @brief Get the value of this argument as an enum type.
     * @tparam EnumType The enum type to convert to
     * @return The argument value converted to the enum type
     */
    template <typename EnumType>
      requires std::is_enum_v<EnumType> && EnumTraits<EnumType>::has_string_conversion
    fn getEnum() const -> EnumType {
      return EnumTraits<EnumType>::stringToEnum(get<String>());
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

    [[nodiscard]] fn isPositional() const -> bool {
      return m_isPositional;
    }

    [[nodiscard]] fn hasChoices() const -> bool {
      return m_choices.has_value();
    }

    [[nodiscard]] fn getChoices() const -> ArgChoices {
      return m_choices.value_or(ArgChoices {});
    }

    /**
     * @brief Set the value for this argument.
     * @param value The value to set
     * @return Result indicating success or failure
     */
    fn setValue(ArgValue value) -> Result<> {
      if (hasChoices() && std::holds_alternative<String>(value)) {
        const String&     strValue = std::get<String>(value);
        const ArgChoices& choices  = m_choices.value();

        const bool isValid = std::ranges::any_of(choices, [&](const String& choice) {
          return detail::EqualsIgnoreCase(strValue, choice);
        });

        if (!isValid)
          return Err(MacCtlError(
            MacCtlErrorCode::InvalidArgument,
            std::format("Invalid value '{}' for argument '{}'. Allowed values: {}", strValue, getPrimaryName(), detail::JoinChoices(choices))
          ));
      }

      m_value  = std::move(value);
      m_isUsed = true;
      return {};
    }

    /**
     * @brief Mark this argument as used.
     */
    fn markUsed() -> Unit {
      m_isUsed = true;

      if (m_isFlag)
        m_value = true;
    }

   private:
    Vec<String>        m_names;          ///< Argument names (e.g., {"-v", "--verbose"})
    String             m_helpText;       ///< Help text for this argument
    Option<ArgValue>   m_value;          ///< The actual value provided
    Option<ArgValue>   m_defaultValue;   ///< Default value if none provided
    Option<ArgChoices> m_choices;        ///< Allowed choices for enum-style arguments
    bool               m_isFlag {};      ///< Whether this is a flag argument
    bool               m_isPositional {}; ///< Whether this argument is filled by position
    bool               m_isUsed {};      ///< Whether this argument was used
  };

  /**
   * @brief Main argument parser class.
   */
  class ArgumentParser {
   public:
    ArgumentParser(String programName, String version)
      : m_programName(std::move(programName)), m_version(std::move(version)) {
      addArguments("-h", "--help")
        .help("Show this help message and exit")
        .flag();

      addArguments("-v", "--version")
        .help("Show version information and exit")
        .flag();
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
     * @brief Parse command-line arguments.
     * @param args Span of argument strings
     * @return Result indicating success or failure
     */
    fn parseArgs(Span<const char* const> args) -> Result<> {
      Vec<String> stringArgs;
      stringArgs.reserve(args.size());

      for (const char* arg : args)
        stringArgs.emplace_back(arg);

      return parseArgs(stringArgs);
    }

    /**
     * @brief Parse command-line arguments from a vector.
     * @param args Vector of argument strings, starting with the program name
     * @return Result indicating success or failure
     */
    fn parseArgs(const Vec<String>& args) -> Result<> {
      usize nextPositional = 0;

      for (usize i = 1; i < args.size(); ++i) {
        const String& arg = args[i];

        if (arg == "-h" || arg == "--help") {
          printHelp();
          std::exit(0);
        }

        if (arg == "-v" || arg == "--version") {
          Println(m_version);
          std::exit(0);
        }

        if (auto iter = m_argumentMap.find(arg); iter != m_argumentMap.end() && !iter->second->isPositional()) {
          Argument* argument = iter->second;

          if (argument->isFlag()) {
            argument->markUsed();
            continue;
          }

          if (i + 1 >= args.size())
            return Err(MacCtlError(MacCtlErrorCode::InvalidArgument, std::format("Argument {} requires a value", arg)));

          if (Result result = argument->setValue(args[++i]); !result)
            return result;

          continue;
        }

        if (arg.starts_with('-') && !detail::LooksNumeric(arg))
          return Err(MacCtlError(MacCtlErrorCode::InvalidArgument, std::format("Unknown argument: {}", arg)));

        Argument* positional = nthPositional(nextPositional++);

        if (positional == nullptr)
          return Err(MacCtlError(MacCtlErrorCode::InvalidArgument, std::format("Unexpected argument: {}", arg)));

        if (Result result = positional->setValue(arg); !result)
          return result;
      }

      return {};
    }

    /**
     * @brief Get the value of an argument.
     * @tparam T Type to get the value as
     * @param name Argument name
     * @return The argument value, or default value if not provided
     */
    template <typename T = String>
    fn get(StringView name) const -> T {
      if (auto iter = m_argumentMap.find(String(name)); iter != m_argumentMap.end())
        return iter->second->get<T>();

      return T {};
    }

    /**
     * @brief Get the value of an argument as an enum type.
     * @tparam EnumType The enum type to convert to
     * @param name Argument name
     * @return The argument value converted to the enum type
     */
    template <typename EnumType>
    fn getEnum(StringView name) const -> EnumType {
      if (auto iter = m_argumentMap.find(String(name)); iter != m_argumentMap.end())
        return iter->second->getEnum<EnumType>();

      return EnumTraits<EnumType>::stringToEnum("");
    }

    /**
     * @brief Check if an argument was used.
     * @param name Argument name
     * @return true if the argument was used, false otherwise
     */
    [[nodiscard]] fn isUsed(StringView name) const -> bool {
      if (auto iter = m_argumentMap.find(String(name)); iter != m_argumentMap.end())
        return iter->second->isUsed();

      return false;
    }

    /**
     * @brief Print help message.
     */
    fn printHelp() const -> Unit {
      std::ostringstream usageStream;
      usageStream << "Usage: " << m_programName;

      for (const auto& arg : m_arguments)
        if (!arg->isPositional()) {
          usageStream << " [" << arg->getPrimaryName();

          if (!arg->isFlag())
            usageStream << " VALUE";

          usageStream << "]";
        }

      for (const auto& arg : m_arguments)
        if (arg->isPositional())
          usageStream << " [" << arg->getPrimaryName() << "]";

      Println(usageStream.str());
      Println();

      if (m_arguments.empty())
        return;

      Println("Arguments:");
      for (const auto& arg : m_arguments) {
        std::ostringstream namesStream;
        for (usize i = 0; i < arg->getNames().size(); ++i) {
          if (i > 0)
            namesStream << ", ";

          namesStream << arg->getNames()[i];
        }

        if (!arg->isFlag() && !arg->isPositional())
          namesStream << " VALUE";

        Println("  " + namesStream.str());

        if (!arg->getHelpText().empty())
          Println("    " + arg->getHelpText());

        if (arg->hasChoices())
          Println("    Available values: " + detail::JoinChoices(arg->getChoices()));

        Println();
      }
    }

   private:
    String                       m_programName; ///< Program name
    String                       m_version;     ///< Program version
    Vec<UniquePointer<Argument>> m_arguments;   ///< List of all arguments
    Map<String, Argument*>       m_argumentMap; ///< Map of argument names to arguments

    fn nthPositional(usize index) const -> Argument* {
      for (const auto& arg : m_arguments)
        if (arg->isPositional() && index-- == 0)
          return arg.get();

      return nullptr;
    }
  };
} // namespace macctl::utils::argparse
