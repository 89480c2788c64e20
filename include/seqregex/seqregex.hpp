#pragma once

#include "common.hpp"
#include "compiler.hpp"
#include "engine.hpp"
#include "match.hpp"
#include "patterns.hpp"

#include <algorithm>
#include <concepts>
#include <cstddef>
#include <functional>
#include <iterator>
#include <optional>
#include <ranges>
#include <span>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace seqregex {
// Anything indexable with a known length, viewed without copying
template <typename Subject>
concept SubjectRange = std::ranges::contiguous_range<Subject const> &&
                       std::ranges::sized_range<Subject const>;

template <SubjectRange Subject>
using item_t = std::ranges::range_value_t<Subject const>;

// Deduce the item type from the subject only, so that patterns can be
// written as brace-enclosed lists.
template <SubjectRange Subject>
using PatternFor = std::type_identity_t<Pattern<item_t<Subject>>>;

template <SubjectRange Subject>
auto as_items(Subject const &subject) -> std::span<item_t<Subject> const> {
  return {std::ranges::data(subject), std::ranges::size(subject)};
}

// Successive non-overlapping matches, computed as the iterator advances.
// After a match [s, e) scanning resumes at max(e, s + 1).
template <typename Item> class MatchIterator {
  Pattern<Item> m_pattern;
  std::span<Item const> m_items;
  size_t m_next_offset;
  std::optional<Match<Item>> m_current;

  auto find_next() -> void {
    if (m_next_offset > m_items.size()) {
      m_current.reset();
      return;
    }
    m_current = engine::search_from(m_pattern.node(), m_items, m_next_offset);
    if (m_current.has_value()) {
      m_next_offset =
          std::max(m_current->end_index(), m_current->start_index() + 1);
    }
  }

public:
  using value_type = Match<Item>;
  using difference_type = std::ptrdiff_t;

  MatchIterator(Pattern<Item> pattern, std::span<Item const> items)
      : m_pattern(std::move(pattern)), m_items{items}, m_next_offset{0} {
    find_next();
  }

  auto operator*() const -> Match<Item> const & { return *m_current; }
  auto operator->() const -> Match<Item> const * { return &*m_current; }

  auto operator++() -> MatchIterator & {
    find_next();
    return *this;
  }
  auto operator++(int) -> void { find_next(); }

  friend auto operator==(MatchIterator const &iterator, std::default_sentinel_t)
      -> bool {
    return not iterator.m_current.has_value();
  }
};

template <typename Item> class MatchRange {
  Pattern<Item> m_pattern;
  std::span<Item const> m_items;

public:
  MatchRange(Pattern<Item> pattern, std::span<Item const> items)
      : m_pattern(std::move(pattern)), m_items{items} {}

  // Every call starts a fresh scan from the beginning of the subject
  auto begin() const -> MatchIterator<Item> { return {m_pattern, m_items}; }
  auto end() const -> std::default_sentinel_t { return {}; }
};

template <typename Item> struct Substitution {
  std::vector<Item> items;
  size_t count;
};

template <typename Item> struct Rule {
  std::string name;
  Pattern<Item> pattern;
};

template <typename Item> struct Token {
  std::string name;
  Match<Item> match;
};

// Matches at offset 0, taking the first candidate
template <SubjectRange Subject>
auto match(PatternFor<Subject> const &pattern, Subject const &subject)
    -> std::optional<Match<item_t<Subject>>> {
  using Item = item_t<Subject>;
  return engine::first_match(pattern.node(), as_items(subject), 0,
                             [](Match<Item> const &) { return true; });
}

// Matches at offset 0, taking the first candidate covering the whole subject
template <SubjectRange Subject>
auto fullmatch(PatternFor<Subject> const &pattern, Subject const &subject)
    -> std::optional<Match<item_t<Subject>>> {
  using Item = item_t<Subject>;
  return engine::first_match(
      pattern.node(), as_items(subject), 0,
      [](Match<Item> const &candidate) { return not candidate.has_next(); });
}

// The first match at the lowest offset, the end of the subject included
template <SubjectRange Subject>
auto search(PatternFor<Subject> const &pattern, Subject const &subject)
    -> std::optional<Match<item_t<Subject>>> {
  return engine::search_from(pattern.node(), as_items(subject), 0);
}

template <SubjectRange Subject>
auto finditer(PatternFor<Subject> const &pattern, Subject const &subject)
    -> MatchRange<item_t<Subject>> {
  return {pattern, as_items(subject)};
}

template <SubjectRange Subject>
auto findall(PatternFor<Subject> const &pattern, Subject const &subject)
    -> std::vector<std::vector<item_t<Subject>>> {
  std::vector<std::vector<item_t<Subject>>> result;
  for (auto const &match : finditer(pattern, subject)) {
    result.emplace_back(match.begin(), match.end());
  }
  return result;
}

// `replacement` is either a sequence of items or a callable mapping the
// match to one. Replaces at most `count` matches when `count` is non-zero.
template <SubjectRange Subject, typename Replacement>
auto subn(PatternFor<Subject> const &pattern, Replacement const &replacement,
          Subject const &subject, size_t count = 0)
    -> Substitution<item_t<Subject>> {
  using Item = item_t<Subject>;
  auto const items = as_items(subject);

  Substitution<Item> result{.items = {}, .count = 0};
  size_t copied_up_to = 0;
  for (auto const &match : finditer(pattern, subject)) {
    if (count != 0 && result.count == count) {
      break;
    }
    result.items.insert(result.items.end(), items.begin() + copied_up_to,
                        items.begin() + match.start_index());

    if constexpr (std::is_invocable_v<Replacement const &,
                                      Match<Item> const &>) {
      std::ranges::copy(std::invoke(replacement, match),
                        std::back_inserter(result.items));
    } else {
      std::ranges::copy(replacement, std::back_inserter(result.items));
    }
    copied_up_to = match.end_index();
    result.count += 1;
  }
  result.items.insert(result.items.end(), items.begin() + copied_up_to,
                      items.end());
  return result;
}

template <SubjectRange Subject, typename Replacement>
auto sub(PatternFor<Subject> const &pattern, Replacement const &replacement,
         Subject const &subject, size_t count = 0)
    -> std::vector<item_t<Subject>> {
  return subn(pattern, replacement, subject, count).items;
}

// The items between matches, at most `maxsplit` splits when non-zero
template <SubjectRange Subject>
auto split(PatternFor<Subject> const &pattern, Subject const &subject,
           size_t maxsplit = 0) -> std::vector<std::vector<item_t<Subject>>> {
  auto const items = as_items(subject);

  std::vector<std::vector<item_t<Subject>>> result;
  size_t last_end = 0;
  for (auto const &match : finditer(pattern, subject)) {
    if (maxsplit != 0 && result.size() == maxsplit) {
      break;
    }
    result.emplace_back(items.begin() + last_end,
                        items.begin() + match.start_index());
    last_end = match.end_index();
  }
  result.emplace_back(items.begin() + last_end, items.end());
  return result;
}

// Splits the subject into named tokens. At each offset the rules are tried
// in order and the first non-empty match wins. Stops at the first offset
// where nothing matches.
template <SubjectRange Subject>
auto scan(std::type_identity_t<std::vector<Rule<item_t<Subject>>>> const &rules,
          Subject const &subject) -> std::vector<Token<item_t<Subject>>> {
  using Item = item_t<Subject>;
  auto const items = as_items(subject);

  std::vector<Token<Item>> tokens;
  size_t offset = 0;
  while (offset < items.size()) {
    bool found = false;
    for (auto const &rule : rules) {
      auto token = engine::first_match(
          rule.pattern.node(), items, offset,
          [](Match<Item> const &candidate) { return not candidate.empty(); });
      if (token.has_value()) {
        offset = token->end_index();
        tokens.push_back(Token<Item>{.name = rule.name, .match = *token});
        found = true;
        break;
      }
    }
    if (not found) {
      break;
    }
  }
  return tokens;
}
} // namespace seqregex
