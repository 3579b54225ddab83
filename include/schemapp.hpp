#pragma once

/// @file schemapp.hpp
/// @brief Main header for schemapp - includes the public validation API
///
/// Usage:
/// @code
/// #include <schemapp.hpp>
///
/// int main() {
///     schemapp::Json schema = {
///         {"type", "object"},
///         {"properties", {{"price", {{"type", "number"}, {"minimum", 0}}}}},
///     };
///     auto result = schemapp::validate(schemapp::Json{{"price", -1}}, schema);
///     for (const auto& e : result.errors())
///         std::cout << schemapp::to_string(e) << "\n";
/// }
/// @endcode

// Core types and exceptions
#include "schemapp/types.hpp"
#include "schemapp/errors.hpp"
#include "schemapp/result.hpp"
#include "schemapp/exceptions.hpp"
#include "schemapp/settings.hpp"
#include "schemapp/version.hpp"

// Formats
#include "schemapp/formats.hpp"

// Compiler and rule tree
#include "schemapp/validator/rule.hpp"
#include "schemapp/validator/combinators.hpp"
#include "schemapp/validator/keywords.hpp"
#include "schemapp/validator/reference.hpp"
#include "schemapp/validator/compiler.hpp"

// Root context
#include "schemapp/schema.hpp"
