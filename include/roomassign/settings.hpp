#pragma once

#include <array>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

#include <roomassign/logger.hpp>

namespace roomassign
{

enum class DisplayMode
{
    Light,
    Dark
};

// Persistent user settings: scheduler location, display mode and defaults.
// Loaded once at start-up; setters fire the change callback so the owner can
// save immediately.
class Settings
{
   public:
    static constexpr int FORMAT_VERSION = 1;

    Settings() = default;

    Settings(const Settings&)            = delete;
    Settings& operator=(const Settings&) = delete;

    const std::string& backend_url() const { return backend_url_; }
    DisplayMode        display_mode() const { return display_mode_; }
    LogLevel           log_level() const { return log_level_; }
    int                timeout_seconds() const { return timeout_seconds_; }
    const std::string& export_dir() const { return export_dir_; }

    void set_backend_url(const std::string& url);
    void set_display_mode(DisplayMode mode);
    void toggle_display_mode();
    void set_log_level(LogLevel level);
    void set_timeout_seconds(int seconds);
    void set_export_dir(const std::string& dir);

    // Persisted fields by their JSON key, in file order.
    static constexpr std::array<std::string_view, 5> KEYS = {
        "backend_url", "display_mode", "log_level", "timeout_seconds", "export_dir"};

    // Persisted text form of `key`; nullopt for an unknown key.
    std::optional<std::string> value(std::string_view key) const;

    // Parses `text` and assigns it through the matching setter. Returns false
    // for an unknown key or a value that does not parse.
    bool set_value(std::string_view key, std::string_view text);

    // Process-only override from ROOMASSIGN_BACKEND_URL; not persisted and
    // does not fire the change callback. Returns true if the variable was set.
    bool apply_environment();

    // Value to persist for backend_url (ignores the environment override).
    const std::string& saved_backend_url() const { return saved_backend_url_; }

    // Save settings to a JSON file. Returns true on success.
    bool save(const std::string& path) const;

    // Load settings from a JSON file. Returns false (keeping defaults) if the
    // file is missing, unreadable or written by a newer version.
    bool load(const std::string& path);

    std::string serialize() const;
    bool        deserialize(const std::string& json);

    // ~/.config/roomassign/settings.json
    static std::string default_path();

    using ChangeCallback = std::function<void()>;
    void set_on_change(ChangeCallback cb) { on_change_ = std::move(cb); }

   private:
    std::string saved_backend_url_ = "http://localhost:8000";
    std::string backend_url_       = "http://localhost:8000";
    DisplayMode display_mode_      = DisplayMode::Light;
    LogLevel    log_level_         = LogLevel::Info;
    int         timeout_seconds_   = 60;
    std::string export_dir_        = ".";

    ChangeCallback on_change_;

    void notify_change();
};

const char*                display_mode_name(DisplayMode mode);
std::optional<DisplayMode> parse_display_mode(std::string_view name);

}   // namespace roomassign
