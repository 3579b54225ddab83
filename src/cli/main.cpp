#include "schemapp/exceptions.hpp"
#include "schemapp/schema.hpp"
#include "schemapp/settings.hpp"
#include "schemapp/util/log.hpp"
#include "schemapp/version.hpp"

#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace
{

static int usage(int exit_code)
{
    std::cout << "schemapp " << schemapp::VERSION_MAJOR << "." << schemapp::VERSION_MINOR << "."
              << schemapp::VERSION_PATCH << "\n";
    std::cout << "Usage:\n";
    std::cout << "  schemapp --help\n";
    std::cout << "  schemapp --version\n";
    std::cout << "  schemapp validate --schema <file> --instance <file> [--json]\n";
    std::cout << "\n";
    std::cout << "Exit codes:\n";
    std::cout << "  0  instance is valid\n";
    std::cout << "  1  instance is invalid\n";
    std::cout << "  2  usage or load error\n";
    std::cout << "\n";
    std::cout << "Environment:\n";
    std::cout << "  SCHEMAPP_LOG_LEVEL        DEBUG, INFO, WARN, ERROR or OFF\n";
    std::cout << "  SCHEMAPP_MAX_REF_DEPTH    ceiling on nested $ref expansions (default 256)\n";
    std::cout << "  SCHEMAPP_CACHE_COMPILED   reuse the compiled schema (default true)\n";
    return exit_code;
}

static bool is_flag(const std::string& s)
{
    return !s.empty() && s[0] == '-';
}

static std::optional<std::string> consume_flag_value(std::vector<std::string>& args,
                                                     const std::string& flag)
{
    for (size_t i = 0; i + 1 < args.size(); ++i)
    {
        if (args[i] == flag)
        {
            std::string value = args[i + 1];
            args.erase(args.begin() + static_cast<long long>(i),
                       args.begin() + static_cast<long long>(i) + 2);
            return value;
        }
    }
    return std::nullopt;
}

static bool consume_flag(std::vector<std::string>& args, const std::string& flag)
{
    for (size_t i = 0; i < args.size(); ++i)
    {
        if (args[i] == flag)
        {
            args.erase(args.begin() + static_cast<long long>(i));
            return true;
        }
    }
    return false;
}

static int run_validate_command(int argc, char** argv, const schemapp::Settings& settings)
{
    std::vector<std::string> args;
    args.reserve(static_cast<size_t>(argc));
    for (int i = 2; i < argc; ++i)
        args.emplace_back(argv[i]);

    if (consume_flag(args, "--help") || consume_flag(args, "-h"))
        return usage(0);

    bool as_json = consume_flag(args, "--json");
    auto schema_path = consume_flag_value(args, "--schema");
    auto instance_path = consume_flag_value(args, "--instance");

    for (const auto& a : args)
    {
        if (is_flag(a))
        {
            std::cerr << "Unknown option: " << a << "\n";
            return 2;
        }
    }
    if (!schema_path || !instance_path)
    {
        std::cerr << "Missing --schema or --instance. See: schemapp --help\n";
        return 2;
    }

    try
    {
        auto schema = schemapp::Schema::from_file(*schema_path, schemapp::FormatRegistry::defaults(),
                                                  settings);
        auto instance = schemapp::load_document(*instance_path);
        auto result = schema.validate(instance);

        if (as_json)
        {
            schemapp::Json report = {{"valid", result.is_valid()},
                                     {"errors", schemapp::Json::array()}};
            for (const auto& e : result.errors())
                report["errors"].push_back(schemapp::violation_to_json(e));
            std::cout << report.dump(2) << "\n";
        }
        else if (result)
        {
            std::cout << "valid\n";
        }
        else
        {
            for (const auto& e : result.errors())
                std::cout << schemapp::to_string(e) << "\n";
        }
        return result ? 0 : 1;
    }
    catch (const schemapp::SchemaLoadError& e)
    {
        schemapp::log::error(e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 2;
    }
}

} // namespace

int main(int argc, char** argv)
{
    if (argc < 2)
        return usage(2);

    std::string cmd = argv[1];
    if (cmd == "--help" || cmd == "-h")
        return usage(0);
    if (cmd == "--version")
    {
        std::cout << schemapp::VERSION_MAJOR << "." << schemapp::VERSION_MINOR << "."
                  << schemapp::VERSION_PATCH << "\n";
        return 0;
    }

    schemapp::Settings settings;
    try
    {
        settings = schemapp::Settings::from_env();
    }
    catch (const schemapp::ConfigError& e)
    {
        std::cerr << "Error: " << e.what() << "\n";
        return 2;
    }
    schemapp::log::set_level(schemapp::log::level_from_string(settings.log_level));

    if (cmd == "validate")
        return run_validate_command(argc, argv, settings);

    std::cerr << "Unknown command: " << cmd << "\n";
    return usage(2);
}
