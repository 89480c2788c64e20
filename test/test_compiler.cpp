#include "seqregex/seqregex.hpp"

#include "seqregex_test_common.hpp"
#include "testing.hpp"

#include <cstdint>
#include <string>
#include <tuple>
#include <variant>
#include <vector>

using namespace seqregex;

namespace {
struct Unrelated {};

struct Reading {
  int sensor;
  double value;
};
} // namespace

TEST_CASE(recognized_pattern_forms, "[seqregex][compiler]") {
  CHECK((compiler::is_pattern_for<int, int>()));
  CHECK((compiler::is_pattern_for<int, AnyPattern>()));
  CHECK((compiler::is_pattern_for<int, std::vector<int>>()));
  CHECK((compiler::is_pattern_for<int, decltype(optional(2))>()));
  CHECK((compiler::is_pattern_for<int, decltype(seq(1, any(), end()))>()));
  CHECK((compiler::is_pattern_for<int, std::tuple<int, AnyPattern>>()));

  CHECK((not compiler::is_pattern_for<int, Unrelated>()));
  CHECK((not compiler::is_pattern_for<int, decltype(optional(Unrelated{}))>()));
  // Items without equality only support structural patterns and predicates
  CHECK((not compiler::is_pattern_for<Reading, Reading>()));
  CHECK((not compiler::is_pattern_for<Reading, BackreferencePattern>()));
  CHECK((compiler::is_pattern_for<Reading, AnyPattern>()));
}

TEST_CASE(compiled_node_kinds, "[seqregex][compiler]") {
  CHECK(std::holds_alternative<node::Literal<int>>(compile<int>(5).node().type));
  CHECK(std::holds_alternative<node::Any>(compile<int>(any()).node().type));

  std::vector<int> const list{1, 2, 3};
  auto const from_list = compile<int>(list);
  REQUIRE(std::holds_alternative<node::Sequence<int>>(from_list.node().type));
  CHECK(std::get<node::Sequence<int>>(from_list.node().type).children.size() ==
        3);

  auto const from_tuple = compile<int>(std::tuple{1, optional(2), 3});
  CHECK(std::holds_alternative<node::Sequence<int>>(from_tuple.node().type));

  auto const predicate =
      compile<int>([](Match<int> const &m) { return m.next() > 2; });
  CHECK(std::holds_alternative<node::Predicate<int>>(predicate.node().type));

  // Wrapping an already compiled pattern reuses its node
  Pattern<int> const wrapped = from_list;
  CHECK(wrapped.node_ptr() == from_list.node_ptr());
}

TEST_CASE(pattern_widths, "[seqregex][compiler]") {
  CHECK(compile<int>(5).width() == Width::exactly(1));
  CHECK(compile<int>(seq(1, optional(2), 3)).width() == Width::between(2, 3));
  CHECK(compile<int>(zero_or_more(1)).width() == Width::at_least(0));
  CHECK(compile<int>(repeat(seq(1, 2), 2, 3)).width() == Width::between(4, 6));
  CHECK(compile<int>(either(1, seq(1, 2))).width() == Width::between(1, 2));
  CHECK(compile<int>(lookahead(seq(1, 2))).width() == Width::exactly(0));
  CHECK(compile<int>(start()).width() == Width::exactly(0));
  CHECK(compile<int>(end()).width() == Width::exactly(0));
  CHECK(compile<int>(backreference()).width() == Width::exactly(1));
  CHECK(compile<int>([](Match<int> const &) { return 1; }).width() ==
        Width::at_least(1));
  CHECK(compile<int>(both(repeat(1), seq(1, 1))).width() == Width::exactly(2));
  CHECK(compile<int>(matching_pair(1, 2)).width() == Width::at_least(2));
}

TEST_CASE(negate_widths, "[seqregex][compiler]") {
  CHECK(compile<int>(negate(1)).width() == Width::exactly(1));
  CHECK(compile<int>(negate(seq(1, any()))).width() == Width::exactly(2));
  CHECK(compile<int>(negate(either(seq(1, 2), seq(3, 4)))).width() ==
        Width::exactly(2));
  CHECK(compile<int>(negate(repeat(1, 3, 3))).width() == Width::exactly(3));
  // Predicates count as testing one item
  CHECK(compile<int>(negate([](Match<int> const &m) {
          return m.next() > 2;
        })).width() == Width::exactly(1));
}

TEST_CASE(invalid_patterns, "[seqregex][compiler]") {
  CHECK_THROWS(compile<int>(repeat(1, 3, 2)), CompileError);
  CHECK_THROWS(compile<int>(lazy_repeat(1, 5, 4)), CompileError);
  CHECK_THROWS(compile<int>(negate(zero_or_more(1))), CompileError);
  CHECK_THROWS(compile<int>(negate(either(1, seq(1, 2)))), CompileError);
  CHECK_THROWS(compile<int>(matching_pair(optional(1), 2)), CompileError);
  CHECK_THROWS(compile<int>(matching_pair(1, lookahead(2))), CompileError);
  CHECK_THROWS(compile<int>(repeat(lookahead(1), unbounded, unbounded)),
               CompileError);

  // Every library error derives from the same base
  CHECK_THROWS(compile<int>(repeat(1, 3, 2)), SeqRegexError);
}

TEST_CASE(literal_conversions, "[seqregex][compiler]") {
  std::vector<int> const one{1};
  CHECK(not does_fullmatch(1.5, one));
  CHECK(does_fullmatch(1.0, one));
  CHECK(does_fullmatch(negate(1.5), one));

  std::vector<std::uint8_t> const byte{44};
  CHECK(not does_fullmatch(300, byte));
  CHECK(not does_fullmatch(-212, byte));
  CHECK(does_fullmatch(44, byte));

  std::vector<double> const half{0.5};
  CHECK(does_fullmatch(0.5f, half));
  std::vector<float> const zero{0.0f};
  CHECK(not does_fullmatch(1e300, zero));
}

TEST_CASE(compile_error_message, "[seqregex][compiler]") {
  std::string message;
  try {
    compile<int>(repeat(1, 3, 2));
  } catch (CompileError const &error) {
    message = error.what();
  }
  CHECK(message == "repeat: min 3 is larger than max 2");
}

TEST_CASE(width_arithmetic, "[seqregex][compiler]") {
  CHECK(Width::at_least(1) + Width::exactly(2) == Width::at_least(3));
  CHECK(Width::exactly(1) + Width::between(0, 4) == Width::between(1, 5));
  CHECK(Width::exactly(2).repeated(0, unbounded) == Width::at_least(0));
  CHECK(Width::exactly(0).repeated(1, unbounded) == Width::exactly(0));
  CHECK(Width::exactly(1).either(Width::exactly(3)) == Width::between(1, 3));
  CHECK(Width::at_least(1).both(Width::between(0, 2)) == Width::between(1, 2));

  // Saturates instead of wrapping
  CHECK((Width::exactly(unbounded - 1) + Width::exactly(5)).max == unbounded);

  CHECK(Width::exactly(3).fixed() == 3);
  CHECK(not Width::at_least(3).fixed().has_value());
  CHECK(Width::between(1, 2).contains(2));
  CHECK(not Width::between(1, 2).contains(3));
}

TEST_CASE(width_to_string, "[seqregex][compiler]") {
  CHECK(Width::exactly(3).to_string() == "3");
  CHECK(Width::at_least(1).to_string() == "1..");
  CHECK(Width::between(1, 2).to_string() == "1..2");
}

TEST_CASE(repetition_bounds_limits, "[seqregex][compiler]") {
  auto bounds = repetition_bounds(Width::exactly(1), 1, unbounded, 5);
  REQUIRE(bounds.has_value());
  CHECK(bounds->lowest == 1);
  CHECK(bounds->highest == 5);

  bounds = repetition_bounds(Width::exactly(2), 0, unbounded, 5);
  REQUIRE(bounds.has_value());
  CHECK(bounds->highest == 2);

  bounds = repetition_bounds(Width::between(1, 3), 0, 2, 10);
  REQUIRE(bounds.has_value());
  CHECK(bounds->highest == 2);

  // Zero-width children are tried up to the items left, never forever
  bounds = repetition_bounds(Width::exactly(0), 0, unbounded, 3);
  REQUIRE(bounds.has_value());
  CHECK(bounds->highest == 3);

  CHECK(not repetition_bounds(Width::exactly(2), 3, unbounded, 5).has_value());
  CHECK(not repetition_bounds(Width::exactly(1), 1, unbounded, 0).has_value());
}
