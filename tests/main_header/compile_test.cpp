/// @file tests/main_header/compile_test.cpp
/// @brief Compile test for the main schemapp.hpp header
///
/// Including just <schemapp.hpp> must give access to the schema context,
/// the compiler, the format registry and the settings.

#include "schemapp.hpp"

#include <cassert>
#include <iostream>

using namespace schemapp;

int main()
{
    std::cout << "=== Main Header Compile Test ===" << std::endl;

    std::cout << "test_validate_accessible..." << std::endl;
    {
        Json schema = {{"type", "object"},
                       {"properties", {{"price", {{"type", "number"}, {"minimum", 0}}}}}};
        auto result = validate(Json{{"price", -1}}, schema);
        assert(!result.is_valid());
        assert(kind_name(result.errors().front()) == "bounds");
    }
    std::cout << "  PASSED" << std::endl;

    std::cout << "test_compiler_accessible..." << std::endl;
    {
        Json root = {{"type", "string"}};
        auto formats = FormatRegistry::defaults();
        validator::SchemaCompiler compiler(root, formats);
        auto compiled = compiler.compile_document();
        assert(compiled->root()->kind() == validator::RuleKind::AllOf);
        assert(compiled->evaluate(Json("x"), 8).is_valid());
    }
    std::cout << "  PASSED" << std::endl;

    std::cout << "test_settings_and_version_accessible..." << std::endl;
    {
        Settings settings;
        assert(settings.max_reference_depth == 256);
        assert(VERSION_MAJOR == 1);
    }
    std::cout << "  PASSED" << std::endl;

    std::cout << "\n=== All main header tests passed ===" << std::endl;
    return 0;
}
