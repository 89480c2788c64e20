#pragma once

#include "common.hpp"
#include "match.hpp"
#include "nodes.hpp"
#include "patterns.hpp"
#include "width.hpp"

#include <algorithm>
#include <concepts>
#include <cstddef>
#include <functional>
#include <initializer_list>
#include <limits>
#include <memory>
#include <optional>
#include <ranges>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace seqregex {
template <typename Item> class Pattern;

namespace compiler {
template <typename Item, typename P> consteval auto is_pattern_for() -> bool;

template <typename Item, typename Tuple> struct AllPatterns;
template <typename Item, template <typename...> typename Template,
          typename... Ps>
struct AllPatterns<Item, Template<Ps...>> {
  static constexpr bool value = (is_pattern_for<Item, Ps>() && ...);
};

template <typename T>
inline constexpr bool is_pattern_list =
    meta::is_instance<T, SequencePattern> ||
    meta::is_instance<T, EitherPattern> || meta::is_instance<T, BothPattern> ||
    meta::is_instance<T, std::tuple>;

template <typename Item, typename P>
inline constexpr bool is_predicate =
    std::is_invocable_v<P const &, Match<Item> const &>;

// A list or tuple of patterns, rather than a value compared as a whole
template <typename Item, typename P> consteval auto is_sequence_range() -> bool {
  if constexpr (std::ranges::range<P const>) {
    return is_pattern_for<Item, std::ranges::range_value_t<P const>>();
  } else {
    return false;
  }
}

template <typename P>
inline constexpr bool is_character_array =
    std::is_bounded_array_v<P> &&
    (std::is_same_v<std::remove_cv_t<std::remove_extent_t<P>>, char> ||
     std::is_same_v<std::remove_cv_t<std::remove_extent_t<P>>, wchar_t> ||
     std::is_same_v<std::remove_cv_t<std::remove_extent_t<P>>, char8_t> ||
     std::is_same_v<std::remove_cv_t<std::remove_extent_t<P>>, char16_t> ||
     std::is_same_v<std::remove_cv_t<std::remove_extent_t<P>>, char32_t>);

// Which pattern form `P` is when matching items of type `Item`. The checks
// run in the same order compile() tries them.
template <typename Item, typename P> consteval auto is_pattern_for() -> bool {
  if constexpr (std::is_same_v<P, Pattern<Item>>) {
    return true;
  } else if constexpr (std::is_same_v<P, AnyPattern> ||
                       std::is_same_v<P, StartPattern> ||
                       std::is_same_v<P, EndPattern>) {
    return true;
  } else if constexpr (std::is_same_v<P, BackreferencePattern>) {
    return std::equality_comparable<Item>;
  } else if constexpr (meta::is_instance<P, RepeatPattern> ||
                       meta::is_instance<P, NegatePattern> ||
                       meta::is_instance<P, LookaheadPattern>) {
    return is_pattern_for<Item, decltype(P::pattern)>();
  } else if constexpr (meta::is_instance<P, MatchingPairPattern>) {
    return is_pattern_for<Item, decltype(P::open)>() &&
           is_pattern_for<Item, decltype(P::close)>();
  } else if constexpr (is_pattern_list<P>) {
    return AllPatterns<Item, P>::value;
  } else if constexpr (is_predicate<Item, P>) {
    using Result = std::invoke_result_t<P const &, Match<Item> const &>;
    return std::is_same_v<Result, bool> || std::is_integral_v<Result>;
  } else if constexpr (is_sequence_range<Item, P>()) {
    return true;
  } else {
    return std::convertible_to<P const &, Item> &&
           std::equality_comparable<Item>;
  }
}

template <typename Item>
auto make_node(typename Node<Item>::NodeVariant type, Width width)
    -> NodePtr<Item> {
  return std::make_shared<Node<Item> const>(
      Node<Item>{.type = std::move(type), .width = width});
}

template <typename Item>
auto make_sequence(std::vector<NodePtr<Item>> children) -> NodePtr<Item> {
  Width width = Width::exactly(0);
  for (auto const &child : children) {
    width = width + child->width;
  }
  return make_node<Item>(node::Sequence<Item>{std::move(children)}, width);
}

template <typename Item>
auto make_either(std::vector<NodePtr<Item>> alternatives) -> NodePtr<Item> {
  // An empty choice never matches, its width is irrelevant
  Width width = Width::exactly(0);
  for (size_t i = 0; i < alternatives.size(); i += 1) {
    width = i == 0 ? alternatives[i]->width
                   : width.either(alternatives[i]->width);
  }
  return make_node<Item>(node::Either<Item>{std::move(alternatives)}, width);
}

template <typename Item>
auto make_both(std::vector<NodePtr<Item>> patterns) -> NodePtr<Item> {
  Width width = Width::at_least(0);
  for (auto const &pattern : patterns) {
    width = width.both(pattern->width);
  }
  return make_node<Item>(node::Both<Item>{std::move(patterns)}, width);
}

// The width negate() consumes for `child`. Predicates count as testing a
// single item, anything else has to have a fixed width.
template <typename Item>
auto declared_width(Node<Item> const &child) -> std::optional<size_t> {
  auto same_for_all = [](std::vector<NodePtr<Item>> const &nodes)
      -> std::optional<size_t> {
    std::optional<size_t> result;
    for (auto const &node : nodes) {
      auto width = declared_width(*node);
      if (not width.has_value() ||
          (result.has_value() && *result != *width)) {
        return std::nullopt;
      }
      result = width;
    }
    return result;
  };

  return std::visit(
      Overload{
          [](node::Predicate<Item> const &) -> std::optional<size_t> {
            return 1;
          },
          [](node::Sequence<Item> const &sequence) -> std::optional<size_t> {
            size_t total = 0;
            for (auto const &element : sequence.children) {
              auto width = declared_width(*element);
              if (not width.has_value()) {
                return std::nullopt;
              }
              total += *width;
            }
            return total;
          },
          [](node::Repeat<Item> const &repeat) -> std::optional<size_t> {
            auto width = declared_width(*repeat.child);
            if (not width.has_value()) {
              return std::nullopt;
            }
            if (*width == 0) {
              return 0;
            }
            if (repeat.min != repeat.max) {
              return std::nullopt;
            }
            return *width * repeat.min;
          },
          [&](node::Either<Item> const &either) -> std::optional<size_t> {
            return same_for_all(either.alternatives);
          },
          [&](node::Both<Item> const &both) -> std::optional<size_t> {
            return same_for_all(both.patterns);
          },
          [&](auto const &) { return child.width.fixed(); },
      },
      child.type);
}

template <typename Item, typename P>
auto compile_node(P const &pattern) -> NodePtr<Item>;

// `value` converted to Item. Empty when the conversion loses information,
// no item can equal such a value.
template <typename Item, typename P>
auto literal_value(P const &value) -> std::optional<Item> {
  if constexpr (std::is_arithmetic_v<P> && std::is_arithmetic_v<Item>) {
    if constexpr (std::is_floating_point_v<P>) {
      // Out of range floating conversions are undefined, NaN fails here too
      auto const lowest = static_cast<P>(std::numeric_limits<Item>::lowest());
      auto const highest = static_cast<P>(std::numeric_limits<Item>::max());
      bool in_range = value >= lowest && value <= highest;
      if constexpr (std::is_integral_v<Item>) {
        // `highest` may have rounded up past the largest Item
        in_range = value >= lowest && value < highest + 1;
      }
      if (not in_range) {
        return std::nullopt;
      }
    }
    auto const converted = static_cast<Item>(value);
    if (static_cast<P>(converted) != value) {
      return std::nullopt;
    }
    return converted;
  } else {
    return static_cast<Item>(value);
  }
}

template <typename Item, typename Tuple>
auto compile_all(Tuple const &patterns) -> std::vector<NodePtr<Item>> {
  return std::apply(
      [](auto const &...elements) {
        return std::vector<NodePtr<Item>>{compile_node<Item>(elements)...};
      },
      patterns);
}

template <typename Item, typename P>
auto compile_predicate(P const &predicate) -> NodePtr<Item> {
  auto fn = [predicate](Match<Item> const &match) -> size_t {
    auto const result = std::invoke(predicate, match);
    if constexpr (std::is_same_v<std::remove_cvref_t<decltype(result)>,
                                 bool>) {
      return result ? 1 : 0;
    } else if constexpr (std::is_signed_v<
                             std::remove_cvref_t<decltype(result)>>) {
      // A negative width cannot be consumed, treat it as no match
      return result > 0 ? static_cast<size_t>(result) : 0;
    } else {
      return static_cast<size_t>(result);
    }
  };
  return make_node<Item>(node::Predicate<Item>{std::move(fn)},
                         Width::at_least(1));
}

template <typename Item, typename P>
auto compile_node(P const &pattern) -> NodePtr<Item> {
  static_assert(is_pattern_for<Item, P>(),
                "Unrecognized pattern form for this item type");

  if constexpr (std::is_same_v<P, Pattern<Item>>) {
    return pattern.node_ptr();
  } else if constexpr (std::is_same_v<P, AnyPattern>) {
    return make_node<Item>(node::Any{}, Width::exactly(1));
  } else if constexpr (std::is_same_v<P, StartPattern>) {
    return make_node<Item>(node::Start{}, Width::exactly(0));
  } else if constexpr (std::is_same_v<P, EndPattern>) {
    return make_node<Item>(node::End{}, Width::exactly(0));
  } else if constexpr (std::is_same_v<P, BackreferencePattern>) {
    return make_node<Item>(node::Backreference{pattern.index},
                           Width::exactly(1));
  } else if constexpr (meta::is_instance<P, RepeatPattern>) {
    if (pattern.min == unbounded) {
      throw CompileError("repeat: min must be a finite count");
    }
    if (pattern.min > pattern.max) {
      throw CompileError("repeat: min {} is larger than max {}", pattern.min,
                         pattern.max);
    }
    auto child = compile_node<Item>(pattern.pattern);
    Width const width = child->width.repeated(pattern.min, pattern.max);
    return make_node<Item>(node::Repeat<Item>{.child = std::move(child),
                                              .min = pattern.min,
                                              .max = pattern.max,
                                              .greedy = pattern.greedy},
                           width);
  } else if constexpr (meta::is_instance<P, NegatePattern>) {
    auto child = compile_node<Item>(pattern.pattern);
    auto width = declared_width(*child);
    if (not width.has_value()) {
      throw CompileError(
          "negate: pattern must have a fixed width, got a width of {}",
          child->width.to_string());
    }
    return make_node<Item>(
        node::Negate<Item>{.child = std::move(child), .width = *width},
        Width::exactly(*width));
  } else if constexpr (meta::is_instance<P, LookaheadPattern>) {
    return make_node<Item>(
        node::Lookahead<Item>{compile_node<Item>(pattern.pattern)},
        Width::exactly(0));
  } else if constexpr (meta::is_instance<P, MatchingPairPattern>) {
    auto open = compile_node<Item>(pattern.open);
    auto close = compile_node<Item>(pattern.close);
    if (open->width.min == 0 || close->width.min == 0) {
      throw CompileError("matching_pair: open ({}) and close ({}) must "
                         "consume at least one item",
                         open->width.to_string(), close->width.to_string());
    }
    Width const width = Width::at_least(open->width.min) +
                        Width::exactly(close->width.min);
    return make_node<Item>(node::MatchingPair<Item>{.open = std::move(open),
                                                    .close = std::move(close)},
                           width);
  } else if constexpr (meta::is_instance<P, EitherPattern>) {
    return make_either<Item>(compile_all<Item>(pattern.alternatives));
  } else if constexpr (meta::is_instance<P, BothPattern>) {
    return make_both<Item>(compile_all<Item>(pattern.patterns));
  } else if constexpr (meta::is_instance<P, SequencePattern>) {
    return make_sequence<Item>(compile_all<Item>(pattern.patterns));
  } else if constexpr (meta::is_instance<P, std::tuple>) {
    return make_sequence<Item>(compile_all<Item>(pattern));
  } else if constexpr (is_predicate<Item, P>) {
    return compile_predicate<Item>(pattern);
  } else if constexpr (is_character_array<P>) {
    // A string literal is its characters, without the terminator
    using Char = std::remove_cv_t<std::remove_extent_t<P>>;
    return compile_node<Item>(
        std::basic_string_view<Char>{pattern, std::extent_v<P> - 1});
  } else if constexpr (is_sequence_range<Item, P>()) {
    std::vector<NodePtr<Item>> children;
    for (auto const &element : pattern) {
      children.push_back(compile_node<Item>(element));
    }
    return make_sequence<Item>(std::move(children));
  } else {
    return make_node<Item>(node::Literal<Item>{literal_value<Item>(pattern)},
                           Width::exactly(1));
  }
}
} // namespace compiler

// A pattern compiled for one item type. Implicitly constructible from any
// pattern form, so brace-enclosed lists like {1, optional(2), 3} work
// wherever a Pattern is expected.
template <typename Item> class Pattern {
  NodePtr<Item> m_node;

public:
  explicit Pattern(NodePtr<Item> node) : m_node{std::move(node)} {}

  template <typename P>
    requires(not std::is_same_v<P, Pattern> &&
             compiler::is_pattern_for<Item, P>())
  Pattern(P const &pattern) : m_node{compiler::compile_node<Item>(pattern)} {}

  Pattern(std::initializer_list<Pattern> patterns) {
    std::vector<NodePtr<Item>> children;
    for (auto const &pattern : patterns) {
      children.push_back(pattern.m_node);
    }
    m_node = compiler::make_sequence<Item>(std::move(children));
  }

  auto node() const -> Node<Item> const & { return *m_node; }
  auto node_ptr() const -> NodePtr<Item> const & { return m_node; }
  auto width() const -> Width { return m_node->width; }
};

// Compiles once, for reuse across many driver calls
template <typename Item, typename P>
auto compile(P const &pattern) -> Pattern<Item> {
  return Pattern<Item>(compiler::compile_node<Item>(pattern));
}
} // namespace seqregex
