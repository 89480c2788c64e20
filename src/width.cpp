#include "seqregex/width.hpp"

#include <algorithm>
#include <cstddef>
#include <format>
#include <optional>
#include <string>

using namespace seqregex;

namespace {
constexpr auto saturating_add(size_t lhs, size_t rhs) -> size_t {
  if (lhs == unbounded || rhs == unbounded) {
    return unbounded;
  }
  if (lhs > unbounded - rhs) {
    return unbounded;
  }
  return lhs + rhs;
}

constexpr auto saturating_multiply(size_t lhs, size_t rhs) -> size_t {
  if (lhs == 0 || rhs == 0) {
    return 0;
  }
  if (lhs == unbounded || rhs == unbounded) {
    return unbounded;
  }
  if (lhs > unbounded / rhs) {
    return unbounded;
  }
  return lhs * rhs;
}
} // namespace

auto Width::operator+(Width const &other) const -> Width {
  return {saturating_add(min, other.min), saturating_add(max, other.max)};
}

auto Width::repeated(size_t min_count, size_t max_count) const -> Width {
  return {saturating_multiply(min, min_count),
          saturating_multiply(max, max_count)};
}

auto Width::either(Width const &other) const -> Width {
  return {std::min(min, other.min), std::max(max, other.max)};
}

auto Width::both(Width const &other) const -> Width {
  // May end up empty (min > max), such a pattern never matches
  return {std::max(min, other.min), std::min(max, other.max)};
}

auto Width::to_string() const -> std::string {
  if (auto size = fixed()) {
    return std::format("{}", *size);
  }
  if (max == unbounded) {
    return std::format("{}..", min);
  }
  return std::format("{}..{}", min, max);
}

auto seqregex::repetition_bounds(Width child, size_t min, size_t max,
                                 size_t remaining)
    -> std::optional<RepetitionBounds> {
  size_t highest = std::min(max, std::max(min, remaining));
  if (child.min > 0) {
    size_t const fits = remaining / child.min;
    if (min > fits) {
      return std::nullopt;
    }
    highest = std::min(highest, fits);
  }
  if (min > highest) {
    return std::nullopt;
  }
  return RepetitionBounds{.lowest = min, .highest = highest};
}
