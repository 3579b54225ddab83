#include "schemapp/formats.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <regex>

namespace schemapp
{

Result validate_ipv4(const Json& value)
{
    if (!value.is_string())
        return Result::valid();
    static const std::regex dotted_quad(
        R"(^(25[0-5]|2[0-4][0-9]|[01]?[0-9][0-9]?)\.(25[0-5]|2[0-4][0-9]|[01]?[0-9][0-9]?)\.)"
        R"((25[0-5]|2[0-4][0-9]|[01]?[0-9][0-9]?)\.(25[0-5]|2[0-4][0-9]|[01]?[0-9][0-9]?)$)");
    const auto& s = value.get_ref<const std::string&>();
    if (std::regex_match(s, dotted_quad))
        return Result::valid();
    return Result::invalid(InvalidIPError{s, IPVersion::V4});
}

Result validate_ipv6(const Json& value)
{
    if (!value.is_string())
        return Result::valid();
    const auto& s = value.get_ref<const std::string&>();
    // inet_pton stops at the first NUL and would judge only the prefix.
    if (s.find('\0') != std::string::npos)
        return Result::invalid(InvalidIPError{s, IPVersion::V6});
    in6_addr addr{};
    if (inet_pton(AF_INET6, s.c_str(), &addr) == 1)
        return Result::valid();
    return Result::invalid(InvalidIPError{s, IPVersion::V6});
}

FormatRegistry FormatRegistry::defaults()
{
    return Builder().build();
}

FormatRegistry::Builder::Builder()
{
    formats_["ipv4"] = validate_ipv4;
    formats_["ipv6"] = validate_ipv6;
}

} // namespace schemapp
