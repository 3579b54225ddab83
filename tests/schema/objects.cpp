#include <cassert>
#include <iostream>
#include "schemapp/schema.hpp"
#include "test_helpers.hpp"

using namespace schemapp;
using schemapp::test::count_errors;
using schemapp::test::first_error;
using schemapp::test::has_error;

// ============================================================================
// Property counts and required
// ============================================================================

void test_property_count() {
  std::cout << "test_property_count...\n";
  Json doc = Json{{"minProperties", 1}, {"maxProperties", 2}};
  assert(validate(Json{{"a", 1}}, doc).is_valid());

  auto empty = validate(Json::object(), doc);
  const auto& e = first_error<LengthError>(empty);
  assert(e.item == LengthKind::Properties);
  assert(e.comparison == Comparison::TooSmall);

  auto crowded = validate(Json{{"a", 1}, {"b", 2}, {"c", 3}}, doc);
  assert(to_string(crowded.errors()[0]) ==
         "The number of properties is larger than maximum number of 2.");

  assert(validate(Json::array(), doc).is_valid());
  std::cout << "  [PASS]\n";
}

void test_required_reports_whole_list_once() {
  std::cout << "test_required_reports_whole_list_once...\n";
  Json doc = Json{{"required", Json::array({"name", "price"})}};
  assert(validate(Json{{"name", "Eggs"}, {"price", 2}}, doc).is_valid());

  auto result = validate(Json{{"name", "Eggs"}}, doc);
  assert(result.errors().size() == 1);
  assert((first_error<RequiredError>(result).required ==
          std::vector<std::string>{"name", "price"}));
  assert(to_string(result.errors()[0]) == "Required properties are missing 'name, price'.");

  assert(count_errors<RequiredError>(validate(Json::object(), doc)) == 1);
  std::cout << "  [PASS]\n";
}

void test_required_rejects_non_objects() {
  std::cout << "test_required_rejects_non_objects...\n";
  Json doc = Json{{"required", Json::array({"name"})}};
  for (const auto& value : {Json("name"), Json::array({"name"}), Json(5), Json(nullptr)}) {
    auto result = validate(value, doc);
    assert(result.errors().size() == 1);
    assert((first_error<RequiredError>(result).required == std::vector<std::string>{"name"}));
  }
  // an empty list still rejects non-objects
  assert(has_error<RequiredError>(validate(Json(5), Json{{"required", Json::array()}})));
  std::cout << "  [PASS]\n";
}

// ============================================================================
// properties / patternProperties / additionalProperties
// ============================================================================

void test_properties_apply_to_present_keys() {
  std::cout << "test_properties_apply_to_present_keys...\n";
  Json doc = Json::parse(R"({
    "properties": {
      "name": {"type": "string"},
      "price": {"type": "number", "minimum": 0}
    }
  })");
  assert(validate(Json::object(), doc).is_valid());
  assert(validate(Json{{"name", "Eggs"}, {"extra", true}}, doc).is_valid());

  auto result = validate(Json{{"name", 1}, {"price", -1}}, doc);
  assert(count_errors<UnmatchingTypeError>(result) == 1);
  assert(count_errors<ValueBoundsError>(result) == 1);
  std::cout << "  [PASS]\n";
}

void test_additional_properties_false() {
  std::cout << "test_additional_properties_false...\n";
  Json doc = Json::parse(R"({
    "properties": {"a": {"type": "string"}},
    "additionalProperties": false
  })");
  assert(validate(Json{{"a", "x"}}, doc).is_valid());

  auto result = validate(Json{{"a", "x"}, {"b", 1}}, doc);
  assert(result.errors().size() == 1);
  assert(first_error<AdditionalPropertiesError>(result).item == ContainerKind::Object);
  assert(to_string(result.errors()[0]) == "Additional results are not permitted in this object.");
  std::cout << "  [PASS]\n";
}

void test_additional_properties_schema() {
  std::cout << "test_additional_properties_schema...\n";
  Json doc = Json::parse(R"({
    "properties": {"id": {}},
    "additionalProperties": {"type": "integer"}
  })");
  assert(validate(Json{{"id", "anything"}, {"n", 3}}, doc).is_valid());
  auto result = validate(Json{{"id", 1}, {"n", "three"}, {"m", "four"}}, doc);
  assert(count_errors<UnmatchingTypeError>(result) == 2);
  std::cout << "  [PASS]\n";
}

void test_additional_properties_alone() {
  std::cout << "test_additional_properties_alone...\n";
  Json doc = Json{{"additionalProperties", false}};
  assert(validate(Json::object(), doc).is_valid());
  assert(!validate(Json{{"k", 1}}, doc).is_valid());
  assert(validate(Json::array({1}), doc).is_valid());
  std::cout << "  [PASS]\n";
}

void test_pattern_properties() {
  std::cout << "test_pattern_properties...\n";
  Json doc = Json::parse(R"({
    "patternProperties": {
      "^s_": {"type": "string"},
      "^n_": {"type": "number"}
    },
    "additionalProperties": false
  })");
  assert(validate(Json{{"s_name", "x"}, {"n_count", 2}}, doc).is_valid());

  auto wrong = validate(Json{{"s_name", 1}}, doc);
  assert(first_error<UnmatchingTypeError>(wrong).expected_type == "string");

  auto unmatched = validate(Json{{"other", 1}}, doc);
  assert(has_error<AdditionalPropertiesError>(unmatched));
  std::cout << "  [PASS]\n";
}

void test_key_matching_property_and_pattern_gets_both() {
  std::cout << "test_key_matching_property_and_pattern_gets_both...\n";
  Json doc = Json::parse(R"({
    "properties": {"s_id": {"maxLength": 2}},
    "patternProperties": {"^s_": {"type": "string"}}
  })");
  auto result = validate(Json{{"s_id", 12345}}, doc);
  // maxLength ignores numbers, the pattern schema still applies
  assert(result.errors().size() == 1);
  assert(has_error<UnmatchingTypeError>(result));

  result = validate(Json{{"s_id", "long"}}, doc);
  assert(result.errors().size() == 1);
  assert(has_error<LengthError>(result));
  std::cout << "  [PASS]\n";
}

void test_invalid_pattern_property_regex() {
  std::cout << "test_invalid_pattern_property_regex...\n";
  Json doc = Json::parse(R"({"patternProperties": {"([": {"type": "string"}}})");
  auto result = validate(Json{{"a", 1}}, doc);
  assert(result.errors().size() == 1);
  assert(first_error<InvalidRegexError>(result).pattern == "([");

  assert(validate(Json::array(), doc).is_valid());
  std::cout << "  [PASS]\n";
}

// ============================================================================
// dependencies
// ============================================================================

void test_property_dependencies() {
  std::cout << "test_property_dependencies...\n";
  Json doc = Json::parse(R"({"dependencies": {"card": ["billing", "zip"]}})");
  assert(validate(Json{{"name", "x"}}, doc).is_valid());
  assert(validate(Json{{"card", 1}, {"billing", 2}, {"zip", 3}}, doc).is_valid());

  auto result = validate(Json{{"card", 1}}, doc);
  assert(count_errors<DependencyMissingError>(result) == 2);
  const auto& first = std::get<DependencyMissingError>(result.errors()[0]);
  assert(first.key == "card");
  assert(first.dependency == "billing");
  assert(to_string(result.errors()[0]) == "'card' is missing its dependency of 'billing'.");

  auto partial = validate(Json{{"card", 1}, {"zip", 3}}, doc);
  assert(partial.errors().size() == 1);
  assert(first_error<DependencyMissingError>(partial).dependency == "billing");
  std::cout << "  [PASS]\n";
}

void test_schema_dependencies() {
  std::cout << "test_schema_dependencies...\n";
  Json doc = Json::parse(R"({
    "dependencies": {"card": {"required": ["billing"]}}
  })");
  assert(validate(Json{{"name", "x"}}, doc).is_valid());
  assert(validate(Json{{"card", 1}, {"billing", 2}}, doc).is_valid());
  assert(has_error<RequiredError>(validate(Json{{"card", 1}}, doc)));
  assert(validate(Json::array({"card"}), doc).is_valid());
  std::cout << "  [PASS]\n";
}

void test_product_schema() {
  std::cout << "test_product_schema...\n";
  Json doc = Json::parse(R"({
    "type": "object",
    "properties": {
      "name": {"type": "string"},
      "price": {"type": "number", "exclusiveMinimum": true, "minimum": 0},
      "tags": {"type": "array", "items": {"type": "string"}, "uniqueItems": true}
    },
    "required": ["name", "price"]
  })");
  Schema schema(doc);
  assert(schema.validate(Json::parse(R"({"name": "Eggs", "price": 34.99, "tags": ["food"]})"))
             .is_valid());
  auto result = schema.validate(Json::parse(R"({"name": "Eggs", "price": 0, "tags": ["a", "a"]})"));
  assert(result.errors().size() == 2);
  assert(has_error<ValueBoundsError>(result));
  assert(has_error<UniqueItemsError>(result));
  std::cout << "  [PASS]\n";
}

int main() {
  test_property_count();
  test_required_reports_whole_list_once();
  test_required_rejects_non_objects();
  test_properties_apply_to_present_keys();
  test_additional_properties_false();
  test_additional_properties_schema();
  test_additional_properties_alone();
  test_pattern_properties();
  test_key_matching_property_and_pattern_gets_both();
  test_invalid_pattern_property_regex();
  test_property_dependencies();
  test_schema_dependencies();
  test_product_schema();
  std::cout << "All object keyword tests passed\n";
  return 0;
}
