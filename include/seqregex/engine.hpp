#pragma once

#include "common.hpp"
#include "function_ref.hpp"
#include "match.hpp"
#include "nodes.hpp"
#include "width.hpp"

#include <algorithm>
#include <concepts>
#include <cstddef>
#include <functional>
#include <iterator>
#include <optional>
#include <ranges>
#include <span>
#include <variant>
#include <vector>

namespace seqregex::engine {
// Receives each candidate in priority order. Returning true accepts the
// candidate and stops the search, returning false asks for the next one.
template <typename Item> using Accept = FunctionRef<bool(Match<Item> const &)>;

template <typename Item>
auto attempt(Node<Item> const &node, Match<Item> const &state,
             Accept<Item> accept) -> bool;

template <typename Item>
constexpr auto items_equal(Item const &lhs, Item const &rhs) -> bool {
  if constexpr (std::equality_comparable<Item>) {
    return lhs == rhs;
  } else {
    // compile() only builds comparing nodes for comparable items
    return false;
  }
}

template <typename Item>
auto attempt_sequence(std::span<NodePtr<Item> const> children,
                      Match<Item> const &state, Accept<Item> accept) -> bool {
  if (children.empty()) {
    return accept(state);
  }
  return attempt<Item>(*children.front(), state,
                       [&](Match<Item> const &after_child) {
                         return attempt_sequence(children.subspan(1),
                                                 after_child, accept);
                       });
}

template <typename Item>
auto attempt_exactly(Node<Item> const &child, size_t count,
                     Match<Item> const &state, Accept<Item> accept) -> bool {
  if (count == 0) {
    return accept(state);
  }
  if (child.width.min != 0 && count > state.remaining() / child.width.min) {
    return false;
  }
  return attempt<Item>(child, state, [&](Match<Item> const &after_child) {
    return attempt_exactly(child, count - 1, after_child, accept);
  });
}

// Each repetition count is a separate group of candidates: greedy repeats
// offer every way of matching the highest count before trying one fewer.
template <typename Item>
auto attempt_repeat(node::Repeat<Item> const &repeat, Match<Item> const &state,
                    Accept<Item> accept) -> bool {
  auto const bounds = repetition_bounds(repeat.child->width, repeat.min,
                                        repeat.max, state.remaining());
  if (not bounds.has_value()) {
    return false;
  }

  if (repeat.greedy) {
    for (size_t count = bounds->highest;; count -= 1) {
      if (attempt_exactly(*repeat.child, count, state, accept)) {
        return true;
      }
      if (count == bounds->lowest) {
        return false;
      }
    }
  }

  for (size_t count = bounds->lowest; count <= bounds->highest; count += 1) {
    if (attempt_exactly(*repeat.child, count, state, accept)) {
      return true;
    }
  }
  return false;
}

template <typename Item>
auto attempt_both(node::Both<Item> const &both, Match<Item> const &state,
                  Accept<Item> accept) -> bool {
  std::vector<size_t> common_ends;
  for (size_t i = 0; i < both.patterns.size(); i += 1) {
    std::vector<size_t> ends;
    attempt<Item>(*both.patterns[i], state, [&](Match<Item> const &candidate) {
      ends.push_back(candidate.end_index());
      return false;
    });
    std::ranges::sort(ends);
    auto const duplicates = std::ranges::unique(ends);
    ends.erase(duplicates.begin(), duplicates.end());

    if (i == 0) {
      common_ends = std::move(ends);
    } else {
      std::vector<size_t> intersection;
      std::ranges::set_intersection(common_ends, ends,
                                    std::back_inserter(intersection));
      common_ends = std::move(intersection);
    }
    if (common_ends.empty()) {
      return false;
    }
  }

  // Longest first
  for (auto end : common_ends | std::views::reverse) {
    if (accept(state.advance(end - state.end_index()))) {
      return true;
    }
  }
  return false;
}

template <typename Item>
auto attempt_pair_close(node::MatchingPair<Item> const &pair,
                        Match<Item> const &state, size_t depth,
                        Accept<Item> accept) -> bool {
  Match<Item> position = state;
  while (true) {
    bool opened = false;
    bool const accepted_open = attempt<Item>(
        *pair.open, position, [&](Match<Item> const &after_open) {
          opened = true;
          return attempt_pair_close(pair, after_open, depth + 1, accept);
        });
    if (accepted_open || opened) {
      return accepted_open;
    }

    bool closed = false;
    bool const accepted_close = attempt<Item>(
        *pair.close, position, [&](Match<Item> const &after_close) {
          closed = true;
          if (depth == 1) {
            return accept(after_close);
          }
          return attempt_pair_close(pair, after_close, depth - 1, accept);
        });
    if (accepted_close || closed) {
      return accepted_close;
    }

    if (not position.has_next()) {
      return false;
    }
    position = position.advance(1);
  }
}

template <typename Item>
auto attempt_predicate(node::Predicate<Item> const &predicate,
                       Match<Item> const &state, Accept<Item> accept) -> bool {
  size_t width = 0;
  try {
    width = predicate.fn(state);
  } catch (NoMoreItems const &) {
    // Reading past the subject inside a predicate is a plain mismatch
    width = 0;
  }

  if (width == 0 || width > state.remaining()) {
    return false;
  }
  return accept(state.advance(width));
}

template <typename Item>
auto attempt(Node<Item> const &node, Match<Item> const &state,
             Accept<Item> accept) -> bool {
  if (node.width.min > state.remaining()) {
    return false;
  }

  auto const accept_any = [](Match<Item> const &) { return true; };

  return std::visit(
      Overload{
          [&](node::Literal<Item> const &literal) {
            return literal.value.has_value() &&
                   items_equal(state.next(), *literal.value) &&
                   accept(state.advance(1));
          },
          [&](node::Any const &) { return accept(state.advance(1)); },
          [&](node::Sequence<Item> const &sequence) {
            return attempt_sequence<Item>(sequence.children, state, accept);
          },
          [&](node::Repeat<Item> const &repeat) {
            return attempt_repeat(repeat, state, accept);
          },
          [&](node::Either<Item> const &either) {
            for (auto const &alternative : either.alternatives) {
              if (attempt<Item>(*alternative, state, accept)) {
                return true;
              }
            }
            return false;
          },
          [&](node::Both<Item> const &both) {
            return attempt_both(both, state, accept);
          },
          [&](node::Negate<Item> const &negate) {
            if (attempt<Item>(*negate.child, state, accept_any)) {
              return false;
            }
            return accept(state.advance(negate.width));
          },
          [&](node::Lookahead<Item> const &lookahead) {
            return attempt<Item>(*lookahead.child, state, accept_any) &&
                   accept(state);
          },
          [&](node::Start const &) {
            return state.end_index() == 0 && accept(state);
          },
          [&](node::End const &) {
            return not state.has_next() && accept(state);
          },
          [&](node::Predicate<Item> const &predicate) {
            return attempt_predicate(predicate, state, accept);
          },
          [&](node::MatchingPair<Item> const &pair) {
            return attempt<Item>(*pair.open, state,
                                 [&](Match<Item> const &after_open) {
                                   return attempt_pair_close(pair, after_open,
                                                             1, accept);
                                 });
          },
          [&](node::Backreference const &backreference) {
            Item const *reference = state.get(backreference.index);
            return reference != nullptr &&
                   items_equal(state.next(), *reference) &&
                   accept(state.advance(1));
          },
      },
      node.type);
}

// Offers every completion of `node` starting at `offset` to `accept`, in
// priority order, until one is accepted.
template <typename Item>
auto run(Node<Item> const &node, std::span<Item const> items, size_t offset,
         Accept<Item> accept) -> bool {
  Match<Item> const state{items, offset, offset, true};
  return attempt(node, state, accept);
}

// The first completion from `offset` that `filter` accepts
template <typename Item, typename Filter>
auto first_match(Node<Item> const &node, std::span<Item const> items,
                 size_t offset, Filter const &filter)
    -> std::optional<Match<Item>> {
  std::optional<Match<Item>> result;
  run<Item>(node, items, offset, [&](Match<Item> const &candidate) {
    if (not filter(candidate)) {
      return false;
    }
    result.emplace(items, candidate.start_index(), candidate.end_index());
    return true;
  });
  return result;
}

// The first match starting at `offset` or later
template <typename Item>
auto search_from(Node<Item> const &node, std::span<Item const> items,
                 size_t offset) -> std::optional<Match<Item>> {
  for (; offset <= items.size(); offset += 1) {
    auto result = first_match(node, items, offset,
                              [](Match<Item> const &) { return true; });
    if (result.has_value()) {
      return result;
    }
  }
  return std::nullopt;
}
} // namespace seqregex::engine
