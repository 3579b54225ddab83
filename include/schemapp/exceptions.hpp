#pragma once
#include "schemapp/result.hpp"

#include <stdexcept>
#include <string>
#include <utility>

namespace schemapp
{

struct Error : public std::runtime_error
{
    using std::runtime_error::runtime_error;
};

/// Thrown by require_valid(); carries the full result.
struct ValidationError : public Error
{
    ValidationError(const std::string& what, Result result)
        : Error(what), result(std::move(result))
    {
    }

    Result result;
};

/// A schema or instance document could not be read or parsed.
struct SchemaLoadError : public Error
{
    using Error::Error;
};

/// A setting has a value of the wrong shape.
struct ConfigError : public Error
{
    using Error::Error;
};

} // namespace schemapp
