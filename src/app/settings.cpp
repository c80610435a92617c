#include <roomassign/settings.hpp>

#include <charconv>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>

#include "net/json_codec.hpp"

namespace roomassign
{

const char* display_mode_name(DisplayMode mode)
{
    return mode == DisplayMode::Dark ? "dark" : "light";
}

std::optional<DisplayMode> parse_display_mode(std::string_view name)
{
    if (name == "dark")
        return DisplayMode::Dark;
    if (name == "light")
        return DisplayMode::Light;
    return std::nullopt;
}

// ─── Setters ─────────────────────────────────────────────────────────────────

void Settings::set_backend_url(const std::string& url)
{
    backend_url_       = url;
    saved_backend_url_ = url;
    notify_change();
}

void Settings::set_display_mode(DisplayMode mode)
{
    display_mode_ = mode;
    notify_change();
}

void Settings::toggle_display_mode()
{
    set_display_mode(display_mode_ == DisplayMode::Dark ? DisplayMode::Light : DisplayMode::Dark);
}

void Settings::set_log_level(LogLevel level)
{
    log_level_ = level;
    notify_change();
}

void Settings::set_timeout_seconds(int seconds)
{
    timeout_seconds_ = seconds > 0 ? seconds : 1;
    notify_change();
}

void Settings::set_export_dir(const std::string& dir)
{
    export_dir_ = dir.empty() ? "." : dir;
    notify_change();
}

// ─── Keyed access ────────────────────────────────────────────────────────────

std::optional<std::string> Settings::value(std::string_view key) const
{
    if (key == "backend_url")
        return saved_backend_url_;
    if (key == "display_mode")
        return std::string(display_mode_name(display_mode_));
    if (key == "log_level")
        return Logger::level_to_string(log_level_);
    if (key == "timeout_seconds")
        return std::to_string(timeout_seconds_);
    if (key == "export_dir")
        return export_dir_;
    return std::nullopt;
}

bool Settings::set_value(std::string_view key, std::string_view text)
{
    if (key == "backend_url")
    {
        if (text.empty())
            return false;
        set_backend_url(std::string(text));
        return true;
    }
    if (key == "display_mode")
    {
        auto mode = parse_display_mode(text);
        if (!mode)
            return false;
        set_display_mode(*mode);
        return true;
    }
    if (key == "log_level")
    {
        auto level = Logger::level_from_string(text);
        if (!level)
            return false;
        set_log_level(*level);
        return true;
    }
    if (key == "timeout_seconds")
    {
        int seconds = 0;
        auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), seconds);
        if (ec != std::errc() || ptr != text.data() + text.size() || seconds < 1)
            return false;
        set_timeout_seconds(seconds);
        return true;
    }
    if (key == "export_dir")
    {
        set_export_dir(std::string(text));
        return true;
    }
    return false;
}

bool Settings::apply_environment()
{
    const char* url = std::getenv("ROOMASSIGN_BACKEND_URL");
    if (!url || !*url)
        return false;
    backend_url_ = url;
    return true;
}

// ─── JSON serialization ──────────────────────────────────────────────────────

std::string Settings::serialize() const
{
    std::ostringstream os;
    os << "{\n";
    os << "  \"version\": " << FORMAT_VERSION << ",\n";
    os << "  \"backend_url\": \"" << net::escape_json(saved_backend_url_) << "\",\n";
    os << "  \"display_mode\": \"" << display_mode_name(display_mode_) << "\",\n";
    os << "  \"log_level\": \"" << Logger::level_to_string(log_level_) << "\",\n";
    os << "  \"timeout_seconds\": " << timeout_seconds_ << ",\n";
    os << "  \"export_dir\": \"" << net::escape_json(export_dir_) << "\"\n";
    os << "}\n";
    return os.str();
}

bool Settings::deserialize(const std::string& json)
{
    auto doc = net::parse_json(json);
    if (!doc || !doc->is_object())
        return false;

    if (const auto* v = doc->find("version"); v && v->is_number() && v->number > FORMAT_VERSION)
        return false;   // Future version

    if (const auto* v = doc->find("backend_url"); v && v->is_string() && !v->string.empty())
    {
        backend_url_       = v->string;
        saved_backend_url_ = v->string;
    }
    if (const auto* v = doc->find("display_mode"); v && v->is_string())
    {
        if (auto mode = parse_display_mode(v->string))
            display_mode_ = *mode;
    }
    if (const auto* v = doc->find("log_level"); v && v->is_string())
    {
        if (auto level = Logger::level_from_string(v->string))
            log_level_ = *level;
    }
    if (const auto* v = doc->find("timeout_seconds"); v && v->is_number() && v->number >= 1)
        timeout_seconds_ = static_cast<int>(std::lround(v->number));
    if (const auto* v = doc->find("export_dir"); v && v->is_string() && !v->string.empty())
        export_dir_ = v->string;

    return true;
}

// ─── File I/O ────────────────────────────────────────────────────────────────

bool Settings::save(const std::string& path) const
{
    std::error_code ec;
    auto dir = std::filesystem::path(path).parent_path();
    if (!dir.empty())
        std::filesystem::create_directories(dir, ec);
    if (ec)
        return false;

    std::ofstream f(path);
    if (!f.is_open())
        return false;
    f << serialize();
    return f.good();
}

bool Settings::load(const std::string& path)
{
    std::ifstream f(path);
    if (!f.is_open())
        return false;
    std::string json((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    return deserialize(json);
}

std::string Settings::default_path()
{
    const char* home = std::getenv("HOME");
    if (!home)
        home = std::getenv("USERPROFILE");
    if (!home)
        return "roomassign-settings.json";

    std::filesystem::path dir = std::filesystem::path(home) / ".config" / "roomassign";
    return (dir / "settings.json").string();
}

void Settings::notify_change()
{
    if (on_change_)
        on_change_();
}

}   // namespace roomassign
