#pragma once

#include "seqregex/seqregex.hpp"
#include "testing.hpp"

#include <cstddef>
#include <optional>
#include <utility>
#include <vector>

template <typename Item>
auto matched_items(std::optional<seqregex::Match<Item>> const &result)
    -> std::vector<Item> {
  REQUIRE(result.has_value());
  return {result->begin(), result->end()};
}

template <typename Item>
auto span_of(std::optional<seqregex::Match<Item>> const &result)
    -> std::pair<size_t, size_t> {
  REQUIRE(result.has_value());
  return {result->start_index(), result->end_index()};
}

template <typename Subject>
auto does_fullmatch(seqregex::PatternFor<Subject> const &pattern,
                    Subject const &subject) -> bool {
  return seqregex::fullmatch(pattern, subject).has_value();
}
