#pragma once

#include "common.hpp"

#include <cstddef>
#include <optional>
#include <string>

namespace seqregex {
// Number of items a pattern can consume, as an inclusive range. `max` is
// `unbounded` when the pattern can keep consuming.
struct Width {
  size_t min;
  size_t max;

  static constexpr auto exactly(size_t n) -> Width { return {n, n}; }
  static constexpr auto at_least(size_t n) -> Width { return {n, unbounded}; }
  static constexpr auto between(size_t min, size_t max) -> Width {
    return {min, max};
  }

  constexpr auto contains(size_t n) const -> bool {
    return n >= min && n <= max;
  }

  constexpr auto fixed() const -> std::optional<size_t> {
    if (min == max && max != unbounded) {
      return min;
    }
    return std::nullopt;
  }

  constexpr auto operator==(Width const &) const -> bool = default;

  // Concatenation
  auto operator+(Width const &other) const -> Width;
  // Between `min_count` and `max_count` consecutive copies
  auto repeated(size_t min_count, size_t max_count) const -> Width;
  // Either this or the other
  auto either(Width const &other) const -> Width;
  // Both this and the other
  auto both(Width const &other) const -> Width;

  auto to_string() const -> std::string;
};

struct RepetitionBounds {
  size_t lowest;
  size_t highest;
};

// Repetition counts of a child with width `child` worth attempting when
// `remaining` items are left. Counts beyond `remaining` can only add
// zero-width repetitions, which reach no new end offset. Empty when even
// `min` repetitions cannot fit.
auto repetition_bounds(Width child, size_t min, size_t max, size_t remaining)
    -> std::optional<RepetitionBounds>;
} // namespace seqregex
