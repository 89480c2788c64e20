#pragma once

#include "common.hpp"

#include <cstddef>
#include <tuple>
#include <type_traits>
#include <utility>

namespace seqregex {
// Pattern construction surface. These only record their arguments, the
// element type is unknown until the pattern is compiled against a subject.
struct AnyPattern {};
struct StartPattern {};
struct EndPattern {};

struct BackreferencePattern {
  std::ptrdiff_t index;
};

template <typename P> struct RepeatPattern {
  P pattern;
  size_t min;
  size_t max;
  bool greedy;
};

template <typename... Ps> struct SequencePattern {
  std::tuple<Ps...> patterns;
};

template <typename... Ps> struct EitherPattern {
  std::tuple<Ps...> alternatives;
};

template <typename... Ps> struct BothPattern {
  std::tuple<Ps...> patterns;
};

template <typename P> struct NegatePattern {
  P pattern;
};

template <typename P> struct LookaheadPattern {
  P pattern;
};

template <typename Open, typename Close> struct MatchingPairPattern {
  Open open;
  Close close;
};

// Matches any single item
constexpr auto any() -> AnyPattern { return {}; }

// Zero-width, matches at offset 0 only
constexpr auto start() -> StartPattern { return {}; }

// Zero-width, matches after the last item only
constexpr auto end() -> EndPattern { return {}; }

template <typename P>
constexpr auto repeat(P &&pattern, size_t min = 1, size_t max = unbounded)
    -> RepeatPattern<std::decay_t<P>> {
  return {std::forward<P>(pattern), min, max, true};
}

// Like repeat(), but tries the fewest repetitions first
template <typename P>
constexpr auto lazy_repeat(P &&pattern, size_t min = 1, size_t max = unbounded)
    -> RepeatPattern<std::decay_t<P>> {
  return {std::forward<P>(pattern), min, max, false};
}

template <typename P>
constexpr auto optional(P &&pattern) -> RepeatPattern<std::decay_t<P>> {
  return repeat(std::forward<P>(pattern), 0, 1);
}

template <typename P>
constexpr auto zero_or_more(P &&pattern) -> RepeatPattern<std::decay_t<P>> {
  return repeat(std::forward<P>(pattern), 0, unbounded);
}

template <typename P>
constexpr auto one_or_more(P &&pattern) -> RepeatPattern<std::decay_t<P>> {
  return repeat(std::forward<P>(pattern), 1, unbounded);
}

template <typename... Ps>
constexpr auto seq(Ps &&...patterns) -> SequencePattern<std::decay_t<Ps>...> {
  return {{std::forward<Ps>(patterns)...}};
}

template <typename... Ps>
constexpr auto either(Ps &&...patterns) -> EitherPattern<std::decay_t<Ps>...> {
  return {{std::forward<Ps>(patterns)...}};
}

// Matches where every pattern matches with the same length
template <typename... Ps>
constexpr auto both(Ps &&...patterns) -> BothPattern<std::decay_t<Ps>...> {
  static_assert(sizeof...(Ps) > 0, "both() needs at least one pattern");
  return {{std::forward<Ps>(patterns)...}};
}

// Consumes the width of `pattern` if `pattern` does not match here
template <typename P>
constexpr auto negate(P &&pattern) -> NegatePattern<std::decay_t<P>> {
  return {std::forward<P>(pattern)};
}

// Zero-width, matches if `pattern` would match here
template <typename P>
constexpr auto lookahead(P &&pattern) -> LookaheadPattern<std::decay_t<P>> {
  return {std::forward<P>(pattern)};
}

// Matches `open` up to and including its balancing `close`
template <typename Open, typename Close>
constexpr auto matching_pair(Open &&open, Close &&close)
    -> MatchingPairPattern<std::decay_t<Open>, std::decay_t<Close>> {
  return {std::forward<Open>(open), std::forward<Close>(close)};
}

// Matches an item equal to the `index`-th item matched so far
constexpr auto backreference(std::ptrdiff_t index = 0)
    -> BackreferencePattern {
  return {index};
}
} // namespace seqregex
