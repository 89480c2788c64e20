#pragma once

#include <cstddef>
#include <format>
#include <limits>
#include <stdexcept>
#include <string_view>
#include <type_traits>

namespace seqregex {

template <typename... Ts> struct Overload : Ts... {
  using Ts::operator()...;
};
template <typename... Ts> Overload(Ts...) -> Overload<Ts...>;

// Upper bound for repeat() meaning "as many times as it matches"
inline constexpr size_t unbounded = std::numeric_limits<size_t>::max();

class SeqRegexError : public std::runtime_error {
public:
  template <typename... T>
  explicit SeqRegexError(std::string_view fmt_string, T const &...args)
      : std::runtime_error(
            std::vformat(fmt_string, std::make_format_args(args...))) {}
};

class CompileError : public SeqRegexError {
public:
  using SeqRegexError::SeqRegexError;
};

// Raised by Match accessors when reading outside the subject. Inside a
// predicate this just means the predicate did not match.
class NoMoreItems : public SeqRegexError {
public:
  using SeqRegexError::SeqRegexError;
};

namespace meta {
template <typename T, template <typename...> typename Template>
struct IsInstance : std::false_type {};
template <template <typename...> typename Template, typename... Args>
struct IsInstance<Template<Args...>, Template> : std::true_type {};

template <typename T, template <typename...> typename Template>
inline constexpr bool is_instance = IsInstance<T, Template>::value;
} // namespace meta
} // namespace seqregex
