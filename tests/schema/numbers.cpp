#include <cassert>
#include <iostream>
#include "schemapp/schema.hpp"
#include "test_helpers.hpp"

using namespace schemapp;
using schemapp::test::first_error;
using schemapp::test::has_error;

// ============================================================================
// multipleOf / minimum / maximum / exclusive bounds
// ============================================================================

void test_multiple_of() {
  std::cout << "test_multiple_of...\n";
  Json doc = Json{{"multipleOf", 2}};
  assert(validate(Json(4), doc).is_valid());
  assert(validate(Json(0), doc).is_valid());
  assert(validate(Json(-6), doc).is_valid());
  auto result = validate(Json(7), doc);
  const auto& e = first_error<MultipleOfError>(result);
  assert(e.value == 7.0);
  assert(e.divisor == 2.0);
  assert(to_string(result.errors()[0]) == "7 is not a multiple of 2.");
  std::cout << "  [PASS]\n";
}

void test_multiple_of_fractional_divisor() {
  std::cout << "test_multiple_of_fractional_divisor...\n";
  Json doc = Json{{"multipleOf", 2.5}};
  assert(validate(Json(10), doc).is_valid());
  assert(validate(Json(7.5), doc).is_valid());
  assert(!validate(Json(8), doc).is_valid());
  std::cout << "  [PASS]\n";
}

void test_multiple_of_non_positive_divisor_is_skipped() {
  std::cout << "test_multiple_of_non_positive_divisor_is_skipped...\n";
  assert(validate(Json(7), Json{{"multipleOf", 0}}).is_valid());
  assert(validate(Json(7), Json{{"multipleOf", -3}}).is_valid());
  std::cout << "  [PASS]\n";
}

void test_minimum() {
  std::cout << "test_minimum...\n";
  Json doc = Json{{"minimum", 0}};
  assert(validate(Json(0), doc).is_valid());
  assert(validate(Json(0.5), doc).is_valid());
  auto result = validate(Json(-1), doc);
  const auto& e = first_error<ValueBoundsError>(result);
  assert(e.bound == 0.0);
  assert(e.comparison == Comparison::TooSmall);
  assert(!e.exclusive);
  assert(to_string(result.errors()[0]) == "Value is lower than the minimum value of 0.");
  std::cout << "  [PASS]\n";
}

void test_maximum() {
  std::cout << "test_maximum...\n";
  Json doc = Json{{"maximum", 10}};
  assert(validate(Json(10), doc).is_valid());
  auto result = validate(Json(10.5), doc);
  assert(first_error<ValueBoundsError>(result).comparison == Comparison::TooLarge);
  std::cout << "  [PASS]\n";
}

void test_exclusive_bounds() {
  std::cout << "test_exclusive_bounds...\n";
  Json doc = Json{{"minimum", 0},
                  {"exclusiveMinimum", true},
                  {"maximum", 10},
                  {"exclusiveMaximum", true}};
  assert(validate(Json(5), doc).is_valid());

  auto low = validate(Json(0), doc);
  assert(low.errors().size() == 1);
  assert(first_error<ValueBoundsError>(low).exclusive);
  assert(to_string(low.errors()[0]) == "Value is lower than the exclusive minimum value of 0.");

  auto high = validate(Json(10), doc);
  assert(first_error<ValueBoundsError>(high).comparison == Comparison::TooLarge);

  // exclusiveMinimum false behaves like plain minimum
  assert(validate(Json(0), Json{{"minimum", 0}, {"exclusiveMinimum", false}}).is_valid());
  std::cout << "  [PASS]\n";
}

void test_exclusive_flag_without_bound_is_ignored() {
  std::cout << "test_exclusive_flag_without_bound_is_ignored...\n";
  assert(validate(Json(-100), Json{{"exclusiveMinimum", true}}).is_valid());
  std::cout << "  [PASS]\n";
}

void test_numeric_keywords_ignore_non_numbers() {
  std::cout << "test_numeric_keywords_ignore_non_numbers...\n";
  Json doc = Json{{"minimum", 5}, {"maximum", 1}, {"multipleOf", 3}};
  assert(validate(Json(true), doc).is_valid());
  assert(validate(Json(false), doc).is_valid());
  assert(validate(Json("7"), doc).is_valid());
  assert(validate(Json(nullptr), doc).is_valid());
  std::cout << "  [PASS]\n";
}

void test_range_reports_each_failure() {
  std::cout << "test_range_reports_each_failure...\n";
  // an impossible range fails both bounds and the divisor
  Json doc = Json{{"multipleOf", 3}, {"minimum", 5}, {"maximum", 1}};
  auto result = validate(Json(2), doc);
  assert(result.errors().size() == 3);
  assert(std::holds_alternative<MultipleOfError>(result.errors()[0]));
  assert(std::get<ValueBoundsError>(result.errors()[1]).comparison == Comparison::TooSmall);
  assert(std::get<ValueBoundsError>(result.errors()[2]).comparison == Comparison::TooLarge);
  std::cout << "  [PASS]\n";
}

int main() {
  test_multiple_of();
  test_multiple_of_fractional_divisor();
  test_multiple_of_non_positive_divisor_is_skipped();
  test_minimum();
  test_maximum();
  test_exclusive_bounds();
  test_exclusive_flag_without_bound_is_ignored();
  test_numeric_keywords_ignore_non_numbers();
  test_range_reports_each_failure();
  std::cout << "All numeric keyword tests passed\n";
  return 0;
}
