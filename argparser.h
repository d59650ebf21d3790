// reflect-based argument parser
//
// Options are the members of an aggregate. Members flagged with
// Opts::fromEnv can also be set from the environment variable named like
// the member in upper case (uid -> UID).

#ifndef ARGPARSER_H
#define ARGPARSER_H

#include <algorithm>
#include <cctype>
#include <charconv>
#include <optional>
#include <reflect>
#include <spanstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/format.h>

#include "environment.h"

namespace argparser {

struct Opts {
  char shortName = 0;
  bool fromEnv = false;
};

template <class T, Opts opts = {}> struct Option : public T {
  using T::T;
  static constexpr Opts argparser_options = opts;

  operator T() noexcept { return *this; }

  operator const T() const noexcept { return *this; }

  T &value() noexcept { return *this; }
  const T &value() const noexcept { return *this; }
};

template <std::integral T, Opts opts> struct Option<T, opts> {
  static constexpr Opts argparser_options = opts;

  constexpr Option() = default;
  constexpr Option(T data) : m_data{data} {}

  operator T() const noexcept { return m_data; }

  T &value() noexcept { return m_data; }
  const T &value() const noexcept { return m_data; }

private:
  T m_data{};
};

class PositionalArguments : public std::vector<std::string> {
public:
  using vector::vector;

  void setCatchAll(bool on) { m_catchAll = on; }

  bool isCatchAll() const { return m_catchAll; }

private:
  bool m_catchAll = false;
};

class ArgumentException : public std::runtime_error {
public:
  ArgumentException(const std::string &msg) : std::runtime_error{msg} {}
};

namespace detail {
template <typename T> struct Unwrapper {
  using type = T;
  static constexpr Opts opts = {};

  static T &ref(T &x) { return x; }
};
template <typename T, Opts o> struct Unwrapper<Option<T, o>> {
  using type = T;
  static constexpr Opts opts = o;

  static T &ref(Option<T, o> &x) { return x.value(); }
};

template <typename T> constexpr Opts GetOpts = Unwrapper<T>::opts;

template <typename T> using UnwrapOption = Unwrapper<T>::type;

template <typename ArgClass, typename T> struct ArgInfo {
  using value_type = T;

  std::string name;
  T *ptr{};
};

template <typename T>
constexpr bool isPositionalArguments =
    std::is_same_v<std::remove_cvref_t<T>, PositionalArguments>;

template <typename ArgClass> constexpr bool hasPositionalArguments() {
  return [&]<auto... Ns>(std::index_sequence<Ns...>) {
    return (... || isPositionalArguments<decltype(reflect::get<Ns>(
                       std::declval<ArgClass>()))>);
  }(std::make_index_sequence<reflect::size<ArgClass>()>());
}

template <typename ArgClass>
PositionalArguments *getPositionalArguments(ArgClass &args) {
  PositionalArguments *ret{};

  auto check = [&]<typename T>(T &member) {
    if constexpr (std::is_same_v<T, PositionalArguments>) {
      ret = &member;
      return true;
    } else
      return false;
  };

  [&]<auto... Ns>(std::index_sequence<Ns...>) {
    (... || check(reflect::get<Ns>(args)));
  }(std::make_index_sequence<reflect::size<ArgClass>()>());

  return ret;
}

template <int N, typename T, typename ArgClass> auto argInfo(ArgClass &args) {
  if (std::is_same_v<std::remove_cvref_t<decltype(reflect::get<N>(args))>,
                     PositionalArguments>)
    return ArgInfo<ArgClass, T>{};

  return ArgInfo<ArgClass, T>{std::string{reflect::member_name<N, ArgClass>()},
                              &reflect::get<N>(args)};
}

template <typename ArgClass> auto argInfos(ArgClass &args) {
  return [&]<auto... Ns>(std::index_sequence<Ns...>) {
    return std::make_tuple(
        argInfo<Ns, std::remove_cvref_t<decltype(reflect::get<Ns>(args))>>(
            args)...);
  }(std::make_index_sequence<reflect::size<ArgClass>()>());
}

// Parse a single option value into its target
template <typename T>
void parseValue(T &target, std::string_view value, std::string_view name) {
  if constexpr (std::is_same_v<T, std::string>)
    target = std::string{value};
  else if constexpr (std::is_same_v<T, std::optional<std::string>>)
    target = std::string{value};
  else if constexpr (std::is_integral_v<T> && !std::is_same_v<T, bool>) {
    T result{};
    auto [ptr, ec] =
        std::from_chars(value.data(), value.data() + value.size(), result);
    if (ec != std::errc{} || ptr != value.data() + value.size())
      throw ArgumentException{
          fmt::format("Could not parse argument '{}' to --{}", value, name)};
    target = result;
  } else {
    std::ispanstream is{value};
    is >> target;

    if (!is)
      throw ArgumentException{
          fmt::format("Could not parse argument '{}' to --{}", value, name)};
  }
}

inline std::string envName(std::string_view memberName) {
  std::string ret{memberName};
  std::ranges::transform(ret, ret.begin(), [](unsigned char c) {
    return static_cast<char>(std::toupper(c));
  });
  return ret;
}
} // namespace detail

template <typename T>
concept argument_list =
    std::ranges::random_access_range<T> &&
    std::is_convertible_v<std::ranges::range_value_t<T>, std::string_view>;

template <typename ArgClass> class Parser {
public:
  explicit Parser(ArgClass &args) : m_args{args} {}

  //! Apply environment-backed options. Call this before parse().
  void parseEnvironment(const Environment &env) {
    auto tryEnv = [&]<typename T>(T &argInfo) {
      using ValueType = detail::UnwrapOption<typename T::value_type>;
      constexpr Opts opts = detail::GetOpts<typename T::value_type>;

      if constexpr (opts.fromEnv) {
        if (!argInfo.ptr)
          return;

        auto name = detail::envName(argInfo.name);
        if (auto value = env.value(name)) {
          ValueType &target =
              detail::Unwrapper<typename T::value_type>::ref(*argInfo.ptr);
          try {
            detail::parseValue(target, *value, argInfo.name);
          } catch (ArgumentException &) {
            throw ArgumentException{fmt::format(
                "Could not parse environment variable {}='{}'", name, *value)};
          }
        }
      }
    };

    auto infos = detail::argInfos(m_args);
    std::apply([&](auto &...info) { (..., tryEnv(info)); }, infos);
  }

  template <argument_list ArgumentList>
  void parse(const ArgumentList &arguments) {
    using namespace std::literals;

    auto ARG_INFOS = detail::argInfos(m_args);

    constexpr bool ACCEPTS_POSITIONAL =
        detail::hasPositionalArguments<ArgClass>();
    PositionalArguments *positional = detail::getPositionalArguments(m_args);

    for (std::size_t i = 0; i < std::size(arguments); ++i) {
      auto arg = std::string_view{arguments[i]};

      if constexpr (ACCEPTS_POSITIONAL) {
        if (positional->isCatchAll()) {
          positional->push_back(std::string{arg});
          continue;
        }
      }

      if (!arg.starts_with("-"sv) || arg == "-"sv) {
        if constexpr (ACCEPTS_POSITIONAL) {
          positional->setCatchAll(true);
          for (std::size_t j = i; j < std::size(arguments); ++j)
            positional->push_back(std::string{arguments[j]});

          return;
        } else
          throw ArgumentException{fmt::format("Invalid argument '{}'", arg)};
      }

      if constexpr (ACCEPTS_POSITIONAL) {
        if (arg == "--"sv) {
          // "--" switches to positional arguments
          positional->setCatchAll(true);
          for (std::size_t j = i + 1; j < std::size(arguments); ++j)
            positional->push_back(std::string{arguments[j]});
          return;
        }
      }

      std::string_view argName =
          arg.starts_with("--"sv) ? arg.substr(2) : arg.substr(1);

      // Decompose argName into key and value (for --X=Y options)
      std::string key;
      std::optional<std::string_view> value;

      auto equalsSign = argName.find('=');
      if (equalsSign != std::string_view::npos) {
        key = argName.substr(0, equalsSign);
        value = argName.substr(equalsSign + 1);
      } else
        key = argName;

      if (!arg.starts_with("--"sv) && key.length() != 1)
        throw ArgumentException{fmt::format("Invalid short option '-{}'", key)};

      std::ranges::replace(key, '-', '_');

      auto takeValue = [&]() -> std::string_view {
        // If we don't have a value already (from --X=Y), grab the next
        // argument.
        if (!value) {
          if (i + 1 == std::size(arguments))
            throw ArgumentException{
                fmt::format("'{}' requires an argument", arg)};

          value = arguments[i + 1];
          ++i;
        }
        return *value;
      };

      auto tryParam = [&]<typename T>(T &argInfo) -> bool {
        using ValueType = detail::UnwrapOption<typename T::value_type>;
        constexpr Opts opts = detail::GetOpts<typename T::value_type>;

        if (!argInfo.ptr)
          return false;

        if (key != argInfo.name &&
            !(key.size() == 1 && opts.shortName != 0 &&
              key[0] == opts.shortName))
          return false;

        ValueType &target =
            detail::Unwrapper<typename T::value_type>::ref(*argInfo.ptr);

        // Is this an std::vector?
        if constexpr (requires {
                        []<typename U>(const std::vector<U> &) {}(ValueType{});
                      }) {
          detail::parseValue(target.emplace_back(), takeValue(), key);
        }
        // or a bool?
        else if constexpr (std::is_same_v<ValueType, bool>) {
          if (value)
            throw ArgumentException{
                fmt::format("--{} does not take an argument", key)};
          target = true;
        }
        // or a straight value / std::optional<std::string>?
        else {
          detail::parseValue(target, takeValue(), key);
        }

        return true;
      };

      bool found = std::apply(
          [&](auto &...infos) { return (... || tryParam(infos)); }, ARG_INFOS);
      if (!found)
        throw ArgumentException{fmt::format("Unknown argument --{}", key)};
    }
  }

private:
  ArgClass &m_args;
};

} // namespace argparser

#endif
