#include "schemapp/util/pointer.hpp"

#include <cctype>
#include <limits>

namespace schemapp::util::pointer
{

static int hex_value(char c)
{
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    return -1;
}

std::optional<std::string> percent_decode(const std::string& s)
{
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i)
    {
        if (s[i] != '%')
        {
            out.push_back(s[i]);
            continue;
        }
        if (i + 2 >= s.size())
            return std::nullopt;
        int hi = hex_value(s[i + 1]);
        int lo = hex_value(s[i + 2]);
        if (hi < 0 || lo < 0)
            return std::nullopt;
        out.push_back(static_cast<char>(hi * 16 + lo));
        i += 2;
    }
    return out;
}

std::string unescape_token(const std::string& token)
{
    std::string out;
    out.reserve(token.size());
    for (size_t i = 0; i < token.size(); ++i)
    {
        if (token[i] == '~' && i + 1 < token.size() && (token[i + 1] == '0' || token[i + 1] == '1'))
        {
            out.push_back(token[i + 1] == '1' ? '/' : '~');
            ++i;
            continue;
        }
        out.push_back(token[i]);
    }
    return out;
}

std::vector<std::string> split(const std::string& path)
{
    std::vector<std::string> tokens;
    size_t start = 0;
    while (true)
    {
        size_t slash = path.find('/', start);
        if (slash == std::string::npos)
        {
            tokens.push_back(path.substr(start));
            break;
        }
        tokens.push_back(path.substr(start, slash - start));
        start = slash + 1;
    }
    return tokens;
}

std::optional<std::size_t> parse_index(const std::string& token)
{
    if (token.empty())
        return std::nullopt;
    std::size_t value = 0;
    for (char c : token)
    {
        if (!std::isdigit(static_cast<unsigned char>(c)))
            return std::nullopt;
        std::size_t digit = static_cast<std::size_t>(c - '0');
        if (value > (std::numeric_limits<std::size_t>::max() - digit) / 10)
            return std::nullopt;
        value = value * 10 + digit;
    }
    return value;
}

} // namespace schemapp::util::pointer
