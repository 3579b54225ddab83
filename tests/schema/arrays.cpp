#include <cassert>
#include <iostream>
#include "schemapp/schema.hpp"
#include "test_helpers.hpp"

using namespace schemapp;
using schemapp::test::count_errors;
using schemapp::test::first_error;
using schemapp::test::has_error;

// ============================================================================
// minItems / maxItems / uniqueItems / items / additionalItems
// ============================================================================

void test_item_count() {
  std::cout << "test_item_count...\n";
  Json doc = Json{{"minItems", 1}, {"maxItems", 2}};
  assert(validate(Json::array({1}), doc).is_valid());
  assert(validate(Json::array({1, 2}), doc).is_valid());

  auto empty = validate(Json::array(), doc);
  const auto& small = first_error<LengthError>(empty);
  assert(small.item == LengthKind::Array);
  assert(small.comparison == Comparison::TooSmall);
  assert(small.length == 1);

  auto full = validate(Json::array({1, 2, 3}), doc);
  assert(first_error<LengthError>(full).comparison == Comparison::TooLarge);
  assert(to_string(full.errors()[0]) == "Length of array is larger than maximum length of 2.");

  // objects and strings are not counted
  assert(validate(Json("abc"), doc).is_valid());
  assert(validate(Json{{"a", 1}, {"b", 2}, {"c", 3}}, doc).is_valid());
  std::cout << "  [PASS]\n";
}

void test_unique_items() {
  std::cout << "test_unique_items...\n";
  Json doc = Json{{"uniqueItems", true}};
  assert(validate(Json::array({1, 2}), doc).is_valid());
  assert(validate(Json::array({true, false}), doc).is_valid());
  assert(validate(Json::array({"a", "b", Json::object()}), doc).is_valid());

  auto dup = validate(Json::array({1, 2, 1}), doc);
  assert(first_error<UniqueItemsError>(dup).value == Json::array({1, 2, 1}));

  assert(!validate(Json::array({Json{{"a", 1}}, Json{{"a", 1}}}), doc).is_valid());
  assert(!validate(Json::array({"x", "x"}), doc).is_valid());
  std::cout << "  [PASS]\n";
}

void test_unique_items_equates_booleans_with_numbers() {
  std::cout << "test_unique_items_equates_booleans_with_numbers...\n";
  Json doc = Json{{"uniqueItems", true}};
  assert(!validate(Json::array({1, true}), doc).is_valid());
  assert(!validate(Json::array({0, false}), doc).is_valid());
  assert(validate(Json::array({1, false}), doc).is_valid());
  // integer and float spellings of the same number
  assert(!validate(Json::array({1, 1.0}), doc).is_valid());
  std::cout << "  [PASS]\n";
}

void test_unique_items_false_is_noop() {
  std::cout << "test_unique_items_false_is_noop...\n";
  assert(validate(Json::array({1, 1}), Json{{"uniqueItems", false}}).is_valid());
  std::cout << "  [PASS]\n";
}

void test_items_schema_applies_to_every_element() {
  std::cout << "test_items_schema_applies_to_every_element...\n";
  Json doc = Json{{"items", {{"type", "integer"}}}};
  assert(validate(Json::array({1, 2, 3}), doc).is_valid());
  assert(validate(Json::array(), doc).is_valid());

  auto result = validate(Json::array({1, "two", 3, "four"}), doc);
  assert(count_errors<UnmatchingTypeError>(result) == 2);
  assert(std::get<UnmatchingTypeError>(result.errors()[0]).value == Json("two"));
  assert(std::get<UnmatchingTypeError>(result.errors()[1]).value == Json("four"));

  assert(validate(Json("not an array"), doc).is_valid());
  std::cout << "  [PASS]\n";
}

void test_tuple_items_with_additional_false() {
  std::cout << "test_tuple_items_with_additional_false...\n";
  Json doc = Json::parse(R"({
    "items": [{"type": "string"}, {"type": "integer"}],
    "additionalItems": false
  })");
  assert(validate(Json::array({"a", 1}), doc).is_valid());
  // shorter arrays only check the positions present
  assert(validate(Json::array({"a"}), doc).is_valid());

  auto wrong = validate(Json::array({1, "a"}), doc);
  assert(count_errors<UnmatchingTypeError>(wrong) == 2);

  auto extra = validate(Json::array({"a", 1, true, false}), doc);
  assert(count_errors<AdditionalPropertiesError>(extra) == 2);
  assert(first_error<AdditionalPropertiesError>(extra).item == ContainerKind::Array);
  assert(to_string(extra.errors()[0]) == "Additional results are not permitted in this array.");
  std::cout << "  [PASS]\n";
}

void test_tuple_items_with_additional_schema() {
  std::cout << "test_tuple_items_with_additional_schema...\n";
  Json doc = Json::parse(R"({
    "items": [{"type": "string"}],
    "additionalItems": {"type": "boolean"}
  })");
  assert(validate(Json::array({"a", true, false}), doc).is_valid());
  auto result = validate(Json::array({"a", true, 3}), doc);
  assert(result.errors().size() == 1);
  assert(first_error<UnmatchingTypeError>(result).expected_type == "boolean");
  std::cout << "  [PASS]\n";
}

void test_tuple_items_allow_extras_by_default() {
  std::cout << "test_tuple_items_allow_extras_by_default...\n";
  Json doc = Json::parse(R"({"items": [{"type": "string"}]})");
  assert(validate(Json::array({"a", 1, nullptr}), doc).is_valid());
  assert(validate(Json::array({"a", 1}),
                  Json::parse(R"({"items": [{}], "additionalItems": true})"))
             .is_valid());
  std::cout << "  [PASS]\n";
}

void test_additional_items_without_tuple_is_ignored() {
  std::cout << "test_additional_items_without_tuple_is_ignored...\n";
  Json doc = Json::parse(R"({"items": {"type": "integer"}, "additionalItems": false})");
  assert(validate(Json::array({1, 2, 3}), doc).is_valid());
  assert(validate(Json::array({1, 2}), Json{{"additionalItems", false}}).is_valid());
  std::cout << "  [PASS]\n";
}

int main() {
  test_item_count();
  test_unique_items();
  test_unique_items_equates_booleans_with_numbers();
  test_unique_items_false_is_noop();
  test_items_schema_applies_to_every_element();
  test_tuple_items_with_additional_false();
  test_tuple_items_with_additional_schema();
  test_tuple_items_allow_extras_by_default();
  test_additional_items_without_tuple_is_ignored();
  std::cout << "All array keyword tests passed\n";
  return 0;
}
