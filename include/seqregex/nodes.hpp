#pragma once

#include "match.hpp"
#include "width.hpp"

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <variant>
#include <vector>

namespace seqregex {
// A compiled pattern is a tree of nodes. Each node either consumes items
// from the current offset or asserts something about it; the engine
// switches on the node type and never looks at the user's pattern again.
template <typename Item> struct Node;
template <typename Item> using NodePtr = std::shared_ptr<Node<Item> const>;

namespace node {
// Empty when the pattern value has no equal among the values of Item
template <typename Item> struct Literal {
  std::optional<Item> value;
};

struct Any {};

template <typename Item> struct Sequence {
  std::vector<NodePtr<Item>> children;
};

template <typename Item> struct Repeat {
  NodePtr<Item> child;
  size_t min;
  size_t max;
  bool greedy;
};

// Ordered choice, the first alternative leading to overall success wins
template <typename Item> struct Either {
  std::vector<NodePtr<Item>> alternatives;
};

// Every pattern has to reach the same end offset
template <typename Item> struct Both {
  std::vector<NodePtr<Item>> patterns;
};

template <typename Item> struct Negate {
  NodePtr<Item> child;
  size_t width;
};

template <typename Item> struct Lookahead {
  NodePtr<Item> child;
};

struct Start {};
struct End {};

// Returns the number of items to consume, zero meaning no match
template <typename Item> struct Predicate {
  std::function<size_t(Match<Item> const &)> fn;
};

template <typename Item> struct MatchingPair {
  NodePtr<Item> open;
  NodePtr<Item> close;
};

struct Backreference {
  std::ptrdiff_t index;
};
} // namespace node

template <typename Item> struct Node {
  using NodeVariant =
      std::variant<node::Literal<Item>, node::Any, node::Sequence<Item>,
                   node::Repeat<Item>, node::Either<Item>, node::Both<Item>,
                   node::Negate<Item>, node::Lookahead<Item>, node::Start,
                   node::End, node::Predicate<Item>, node::MatchingPair<Item>,
                   node::Backreference>;

  NodeVariant type;
  Width width;
};
} // namespace seqregex
