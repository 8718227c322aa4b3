#pragma once

#include <optional>
#include <string>
#include <termpane/logger.hpp>
#include <termpane/session.hpp>

namespace termpane
{

// Engine settings for one terminal panel, persisted as a small JSON file.
struct PanelConfig
{
    std::optional<std::string> working_directory;
    ShellConfig                shell;

    int      initial_directory_delay_ms = 100;
    float    divider_thickness          = 1.0f;
    float    min_pane_size              = 40.0f;
    LogLevel log_level                  = LogLevel::Info;

    // Defaults with shell.path taken from $SHELL when set.
    static PanelConfig from_environment();

    SessionOptions session_options() const;

    std::string serialize() const;

    // Returns false and leaves *this untouched on malformed input. Unknown
    // keys are ignored; values of the wrong type keep their current value.
    bool deserialize(const std::string& json);

    // Save to a JSON file, creating parent directories. Returns true on success.
    bool save(const std::string& path) const;

    // Load from a JSON file. Returns true on success.
    bool load(const std::string& path);

    // $XDG_CONFIG_HOME/termpane/panel.json, else ~/.config/termpane/panel.json.
    static std::string default_path();
};

}   // namespace termpane
