#include <roomassign/errors.hpp>
#include <roomassign/format.hpp>
#include <roomassign/grid.hpp>
#include <roomassign/logger.hpp>
#include <roomassign/pipeline.hpp>
#include <roomassign/result_export.hpp>
#include <roomassign/scheduler.hpp>
#include <roomassign/session.hpp>
#include <roomassign/settings.hpp>

#include "net/json_codec.hpp"

#include <chrono>
#include <cstdint>
#include <iostream>
#include <memory>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

namespace
{

using namespace roomassign;

constexpr int EXIT_DATA_ERROR  = 1;
constexpr int EXIT_USAGE_ERROR = 2;

const char* USAGE =
    "Usage: roomassign [--config path] [--log-level level] [--log-file path] <command> ...\n"
    "\n"
    "Commands:\n"
    "  check <file> [--format bp|traditional] [--json]\n"
    "  submit <file> [--format bp|traditional] [--backend url] [--csv] [--xlsx]\n"
    "         [--out-dir dir] [--with-stats] [--save-response path]\n"
    "  export <response.json> --format bp|traditional [--csv] [--xlsx] [--out-dir dir]\n"
    "         [--with-stats]\n"
    "  example <bp|traditional> [--out path]\n"
    "  theme [light|dark|toggle]\n"
    "  config [key [value]]      keys: backend_url display_mode log_level\n"
    "                                  timeout_seconds export_dir\n";

class UsageError : public std::runtime_error
{
   public:
    using std::runtime_error::runtime_error;
};

// Command arguments after the command word: positionals plus --flags.
// Flags listed in `valued` consume the next argument.
struct CommandArgs
{
    std::vector<std::string> positional;
    std::vector<std::string> flags;
    std::vector<std::pair<std::string, std::string>> values;

    bool has(const std::string& flag) const
    {
        for (const auto& f : flags)
            if (f == flag)
                return true;
        return false;
    }

    std::optional<std::string> value(const std::string& flag) const
    {
        for (const auto& [k, v] : values)
            if (k == flag)
                return v;
        return std::nullopt;
    }
};

CommandArgs parse_command_args(const std::vector<std::string>& args,
                               const std::vector<std::string>& switches,
                               const std::vector<std::string>& valued)
{
    auto contains = [](const std::vector<std::string>& list, const std::string& s)
    {
        for (const auto& x : list)
            if (x == s)
                return true;
        return false;
    };

    CommandArgs out;
    for (size_t i = 0; i < args.size(); ++i)
    {
        const std::string& a = args[i];
        if (a.rfind("--", 0) != 0)
        {
            out.positional.push_back(a);
            continue;
        }
        if (contains(switches, a))
        {
            out.flags.push_back(a);
        }
        else if (contains(valued, a))
        {
            if (i + 1 >= args.size())
                throw UsageError("Missing value for " + a);
            out.values.emplace_back(a, args[++i]);
        }
        else
        {
            throw UsageError("Unknown option " + a);
        }
    }
    return out;
}

std::optional<Format> format_option(const CommandArgs& args)
{
    auto tag = args.value("--format");
    if (!tag)
        return std::nullopt;
    auto format = parse_format_tag(*tag);
    if (!format)
        throw UsageError("Unknown format '" + *tag + "' (expected bp or traditional)");
    return format;
}

const std::string& single_positional(const CommandArgs& args, const char* what)
{
    if (args.positional.size() != 1)
        throw UsageError(std::string("Expected exactly one ") + what);
    return args.positional.front();
}

ExportTargets export_targets(const CommandArgs& args, const Settings& settings)
{
    ExportTargets targets;
    targets.csv                        = args.has("--csv");
    targets.xlsx                       = args.has("--xlsx");
    targets.directory                  = args.value("--out-dir").value_or(settings.export_dir());
    targets.options.include_statistics = args.has("--with-stats");
    return targets;
}

void print_written(const std::vector<std::string>& paths)
{
    for (const auto& p : paths)
        std::cout << "Wrote " << p << "\n";
}

// ─── Commands ────────────────────────────────────────────────────────────────

int cmd_check(const std::vector<std::string>& argv)
{
    auto args     = parse_command_args(argv, {"--json"}, {"--format"});
    auto prepared = load_request(single_positional(args, "input file"), format_option(args));

    if (args.has("--json"))
    {
        std::cout << net::encode_request(prepared.request) << "\n";
        return 0;
    }

    std::cout << prepared.request.participants.size() << " participants, "
              << format_display_name(prepared.format) << " ("
              << role_count(prepared.format) << " roles)\n";
    return 0;
}

int cmd_submit(const std::vector<std::string>& argv, const Settings& settings)
{
    auto args = parse_command_args(argv,
                                   {"--csv", "--xlsx", "--with-stats"},
                                   {"--format", "--backend", "--out-dir", "--save-response"});
    auto prepared = load_request(single_positional(args, "input file"), format_option(args));

    const std::string backend = args.value("--backend").value_or(settings.backend_url());
    auto transport            = std::make_shared<HttplibTransport>(
        backend, std::chrono::seconds(settings.timeout_seconds()));
    auto client = std::make_shared<SchedulerClient>(transport);

    SubmissionSession session(client);
    const Format      format = prepared.format;
    auto              ticket = session.submit(format, std::move(prepared.request));
    auto              result = session.wait(ticket);
    if (!result)
        throw TransportError(0, "Submission was superseded");

    std::cout << describe_summary(summarize(*result, format), format);

    if (auto path = args.value("--save-response"))
    {
        const std::string body = net::encode_response(*result);
        write_file_bytes(*path,
                         std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(body.data()),
                                                  body.size()));
        std::cout << "Wrote " << *path << "\n";
    }

    print_written(
        write_exports(*result, format, export_targets(args, settings), std::chrono::system_clock::now()));
    return 0;
}

int cmd_export(const std::vector<std::string>& argv, const Settings& settings)
{
    auto args   = parse_command_args(argv, {"--csv", "--xlsx", "--with-stats"}, {"--format", "--out-dir"});
    auto format = format_option(args);
    if (!format)
        throw UsageError("export requires --format bp|traditional");

    const std::string& path  = single_positional(args, "response file");
    auto               bytes = read_file_bytes(path);
    auto result = net::decode_response(std::string_view(reinterpret_cast<const char*>(bytes.data()), bytes.size()));

    auto targets = export_targets(args, settings);
    if (!targets.csv && !targets.xlsx)
        targets.csv = true;

    std::cout << describe_summary(summarize(result, *format), *format);
    print_written(write_exports(result, *format, targets, std::chrono::system_clock::now()));
    return 0;
}

int cmd_example(const std::vector<std::string>& argv)
{
    auto args   = parse_command_args(argv, {}, {"--out"});
    auto format = parse_format_tag(single_positional(args, "format (bp or traditional)"));
    if (!format)
        throw UsageError("Unknown format (expected bp or traditional)");

    const std::string text = CsvEncoder{}.encode_text(example_rows(*format));
    if (auto out = args.value("--out"))
    {
        write_file_bytes(*out,
                         std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(text.data()),
                                                  text.size()));
        std::cout << "Wrote " << *out << "\n";
    }
    else
    {
        std::cout << text << "\n";
    }
    return 0;
}

int cmd_theme(const std::vector<std::string>& argv, Settings& settings)
{
    auto args = parse_command_args(argv, {}, {});
    if (args.positional.size() > 1)
        throw UsageError("theme takes at most one argument");

    if (!args.positional.empty())
    {
        const std::string& choice = args.positional.front();
        if (choice == "toggle")
            settings.toggle_display_mode();
        else if (auto mode = parse_display_mode(choice))
            settings.set_display_mode(*mode);
        else
            throw UsageError("Unknown display mode '" + choice + "'");
    }

    std::cout << display_mode_name(settings.display_mode()) << "\n";
    return 0;
}

// No arguments lists every persisted setting; one prints it; two assign it.
int cmd_config(const std::vector<std::string>& argv, Settings& settings)
{
    auto args = parse_command_args(argv, {}, {});
    if (args.positional.size() > 2)
        throw UsageError("config takes at most a key and a value");

    if (args.positional.empty())
    {
        for (auto key : Settings::KEYS)
            std::cout << key << " = " << settings.value(key).value_or("") << "\n";
        return 0;
    }

    const std::string& key     = args.positional[0];
    auto               current = settings.value(key);
    if (!current)
        throw UsageError("Unknown setting '" + key + "'");

    if (args.positional.size() == 2)
    {
        const std::string& text = args.positional[1];
        if (!settings.set_value(key, text))
            throw UsageError("Invalid value '" + text + "' for " + key);
        current = settings.value(key);
    }

    std::cout << *current << "\n";
    return 0;
}

}   // namespace

int main(int argc, char* argv[])
{
    std::string                         config_path;
    std::optional<roomassign::LogLevel> cli_level;
    std::string                         log_file;

    // Global options precede the command word.
    int i = 1;
    for (; i < argc; ++i)
    {
        std::string a(argv[i]);
        if (a.rfind("--", 0) != 0)
            break;
        if (a == "--help")
        {
            std::cout << USAGE;
            return 0;
        }
        if (i + 1 >= argc)
        {
            std::cerr << "Missing value for " << a << "\n" << USAGE;
            return EXIT_USAGE_ERROR;
        }
        std::string v(argv[++i]);
        if (a == "--config")
            config_path = v;
        else if (a == "--log-file")
            log_file = v;
        else if (a == "--log-level")
        {
            cli_level = roomassign::Logger::level_from_string(v);
            if (!cli_level)
            {
                std::cerr << "Unknown log level '" << v << "'\n";
                return EXIT_USAGE_ERROR;
            }
        }
        else
        {
            std::cerr << "Unknown option " << a << "\n" << USAGE;
            return EXIT_USAGE_ERROR;
        }
    }

    if (i >= argc)
    {
        std::cerr << USAGE;
        return EXIT_USAGE_ERROR;
    }
    const std::string        command(argv[i]);
    std::vector<std::string> rest(argv + i + 1, argv + argc);

    roomassign::Settings settings;
    if (config_path.empty())
        config_path = roomassign::Settings::default_path();
    settings.load(config_path);
    settings.apply_environment();
    settings.set_on_change(
        [&settings, &config_path]()
        {
            if (!settings.save(config_path))
                ROOMASSIGN_LOG_WARN("settings", "Could not save settings to {}", config_path);
        });

    auto& logger = roomassign::Logger::instance();
    logger.set_level(cli_level.value_or(settings.log_level()));
    logger.add_sink(roomassign::sinks::console_sink(
        true, settings.display_mode() == roomassign::DisplayMode::Dark));
    if (!log_file.empty())
        logger.add_sink(roomassign::sinks::file_sink(log_file));

    try
    {
        if (command == "check")
            return cmd_check(rest);
        if (command == "submit")
            return cmd_submit(rest, settings);
        if (command == "export")
            return cmd_export(rest, settings);
        if (command == "example")
            return cmd_example(rest);
        if (command == "theme")
            return cmd_theme(rest, settings);
        if (command == "config")
            return cmd_config(rest, settings);

        std::cerr << "Unknown command '" << command << "'\n" << USAGE;
        return EXIT_USAGE_ERROR;
    }
    catch (const UsageError& e)
    {
        std::cerr << e.what() << "\n" << USAGE;
        return EXIT_USAGE_ERROR;
    }
    catch (const roomassign::Error& e)
    {
        ROOMASSIGN_LOG_ERROR("cli", "{} error", roomassign::error_kind_name(e.kind()));
        std::cerr << e.what() << "\n";
        return EXIT_DATA_ERROR;
    }
    catch (const std::exception& e)
    {
        ROOMASSIGN_LOG_CRITICAL("cli", "Unexpected failure: {}", e.what());
        std::cerr << e.what() << "\n";
        return EXIT_DATA_ERROR;
    }
}
