#pragma once

#include <vista/log.hpp>
#include <vista/result.hpp>
#include <optional>
#include <string>

namespace vista {

// Layered settings: global > working directory.
// Later layers override only the keys they set.
struct Settings {
    std::string git_binary = "git";
    int command_timeout = 60;            // seconds per git invocation
    int commit_wrap_column = 72;
    std::string history_config_key = "vista.historySha";
    int max_history_length = 60;
    int read_workers = 4;
    log::Level log_level = log::Info;
    bool log_color = true;

    // Track which fields were explicitly set (for merge)
    bool git_binary_set = false;
    bool command_timeout_set = false;
    bool commit_wrap_column_set = false;
    bool history_config_key_set = false;
    bool max_history_length_set = false;
    bool read_workers_set = false;
    bool log_level_set = false;
    bool log_color_set = false;

    // Load from a TOML settings file
    static Result<Settings> load(const std::string& path);

    // Parse from TOML string
    static Result<Settings> parse(const std::string& toml_str);

    // Merge another layer on top (other's explicitly-set values win)
    void merge(const Settings& other);

    // Build effective settings from layers: global -> working directory
    static Settings effective(const std::optional<Settings>& global,
                              const std::optional<Settings>& workdir);

    // Apply log_level / log_color to the process-wide logger
    void apply_logging() const;
};

// ~/.vista/config.toml, or empty when HOME is unset
std::string global_settings_path();

// <workdir>/.vista.toml
std::string workdir_settings_path(const std::string& working_dir);

// Effective settings for a working directory. Missing files are skipped;
// unreadable or invalid ones are an error.
Result<Settings> load_settings_for(const std::string& working_dir);

} // namespace vista
