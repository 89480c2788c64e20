#pragma once

#include "common.hpp"

#include <cstddef>
#include <span>

namespace seqregex {
// A contiguous span [start, end) of a caller-owned subject. The subject is
// never copied; it must outlive the match and must not change while
// matching.
template <typename Item> class Match {
  std::span<Item const> m_items;
  size_t m_start;
  size_t m_end;
  // While matching, a predicate looking at an empty match-so-far reads
  // index 0 as the item it is about to consume.
  bool m_head_aliases_next;

public:
  using value_type = Item;
  using iterator = typename std::span<Item const>::iterator;

  constexpr explicit Match(std::span<Item const> items, size_t start = 0,
                           size_t end = 0, bool head_aliases_next = false)
      : m_items{items}, m_start{start}, m_end{end},
        m_head_aliases_next{head_aliases_next} {}

  constexpr auto start_index() const -> size_t { return m_start; }
  constexpr auto end_index() const -> size_t { return m_end; }

  constexpr auto size() const -> size_t { return m_end - m_start; }
  constexpr auto empty() const -> bool { return m_start == m_end; }

  // The whole subject, regardless of the matched span
  constexpr auto items() const -> std::span<Item const> { return m_items; }

  constexpr auto matched() const -> std::span<Item const> {
    return m_items.subspan(m_start, size());
  }

  constexpr auto rest() const -> std::span<Item const> {
    return m_items.subspan(m_end);
  }

  constexpr auto remaining() const -> size_t { return m_items.size() - m_end; }

  constexpr auto has_next() const -> bool { return m_end < m_items.size(); }

  constexpr auto next() const -> Item const & {
    if (not has_next()) {
      throw NoMoreItems("No item after offset {} (subject has {} items)",
                        m_end, m_items.size());
    }
    return m_items[m_end];
  }

  // Negative indices count back from the end of the matched span. Null when
  // out of range.
  constexpr auto get(std::ptrdiff_t index) const -> Item const * {
    auto const length = static_cast<std::ptrdiff_t>(size());
    if (m_head_aliases_next && length == 0 && index == 0) {
      return has_next() ? &m_items[m_end] : nullptr;
    }

    std::ptrdiff_t const relative = index < 0 ? length + index : index;
    if (relative < 0 || relative >= length) {
      return nullptr;
    }
    return &m_items[m_start + static_cast<size_t>(relative)];
  }

  constexpr auto operator[](std::ptrdiff_t index) const -> Item const & {
    Item const *item = get(index);
    if (item == nullptr) {
      throw NoMoreItems("Index {} is outside a match of {} items", index,
                        size());
    }
    return *item;
  }

  constexpr auto begin() const -> iterator { return matched().begin(); }
  constexpr auto end() const -> iterator { return matched().end(); }

  constexpr auto advance(size_t n) const -> Match {
    return Match{m_items, m_start, m_end + n, m_head_aliases_next};
  }

  constexpr auto operator==(Match const &other) const -> bool {
    return m_items.data() == other.m_items.data() &&
           m_items.size() == other.m_items.size() &&
           m_start == other.m_start && m_end == other.m_end;
  }
};
} // namespace seqregex
