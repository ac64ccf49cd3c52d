#include <vista/config.hpp>
#include <toml++/toml.hpp>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace vista {

static Result<int> positive_int(const toml::node_view<toml::node>& node,
                                const char* name) {
    auto v = node.value<int64_t>();
    if (!v) {
        return VistaError{VistaError::Config,
            std::string("'") + name + "' must be an integer"};
    }
    if (*v <= 0 || *v > 100000) {
        return VistaError{VistaError::Config,
            std::string("'") + name + "' out of range: " + std::to_string(*v)};
    }
    return Result<int>::ok(static_cast<int>(*v));
}

static Result<std::string> non_empty_string(const toml::node_view<toml::node>& node,
                                            const char* name) {
    auto v = node.value<std::string>();
    if (!v || v->empty()) {
        return VistaError{VistaError::Config,
            std::string("'") + name + "' must be a non-empty string"};
    }
    return Result<std::string>::ok(std::string(*v));
}

Result<Settings> Settings::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return VistaError{VistaError::Parse,
            std::string("settings TOML parse error: ") + e.what()};
    }

    Settings s;

    // [git] section
    if (auto git = doc["git"].as_table()) {
        if (git->contains("binary")) {
            auto r = non_empty_string((*git)["binary"], "git.binary");
            if (r.is_err()) return std::move(r).error();
            s.git_binary = r.value();
            s.git_binary_set = true;
        }
        if (git->contains("timeout")) {
            auto r = positive_int((*git)["timeout"], "git.timeout");
            if (r.is_err()) return std::move(r).error();
            s.command_timeout = r.value();
            s.command_timeout_set = true;
        }
    }

    // [commit] section
    if (auto commit = doc["commit"].as_table()) {
        if (commit->contains("wrap-column")) {
            auto r = positive_int((*commit)["wrap-column"], "commit.wrap-column");
            if (r.is_err()) return std::move(r).error();
            s.commit_wrap_column = r.value();
            s.commit_wrap_column_set = true;
        }
    }

    // [discard-history] section
    if (auto history = doc["discard-history"].as_table()) {
        if (history->contains("config-key")) {
            auto r = non_empty_string((*history)["config-key"],
                                      "discard-history.config-key");
            if (r.is_err()) return std::move(r).error();
            if (r.value().find('.') == std::string::npos) {
                return VistaError{VistaError::Config,
                    "'discard-history.config-key' must be a git config key "
                    "of the form section.name",
                    "for example \"vista.historySha\""};
            }
            s.history_config_key = r.value();
            s.history_config_key_set = true;
        }
        if (history->contains("max-length")) {
            auto r = positive_int((*history)["max-length"],
                                  "discard-history.max-length");
            if (r.is_err()) return std::move(r).error();
            s.max_history_length = r.value();
            s.max_history_length_set = true;
        }
    }

    // [queue] section
    if (auto queue = doc["queue"].as_table()) {
        if (queue->contains("read-workers")) {
            auto r = positive_int((*queue)["read-workers"], "queue.read-workers");
            if (r.is_err()) return std::move(r).error();
            s.read_workers = r.value();
            s.read_workers_set = true;
        }
    }

    // [log] section
    if (auto lg = doc["log"].as_table()) {
        if (lg->contains("level")) {
            auto name = (*lg)["level"].value<std::string>();
            auto lvl = name ? log::parse_level(*name) : std::nullopt;
            if (!lvl) {
                return VistaError{VistaError::Config,
                    "'log.level' must be one of trace, debug, info, warn, error"};
            }
            s.log_level = *lvl;
            s.log_level_set = true;
        }
        if (lg->contains("color")) {
            auto v = (*lg)["color"].value<bool>();
            if (!v) {
                return VistaError{VistaError::Config, "'log.color' must be a boolean"};
            }
            s.log_color = *v;
            s.log_color_set = true;
        }
    }

    return Result<Settings>::ok(std::move(s));
}

Result<Settings> Settings::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return VistaError{VistaError::IO,
            "cannot open settings file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    return Settings::parse(ss.str());
}

void Settings::merge(const Settings& other) {
    if (other.git_binary_set) {
        git_binary = other.git_binary;
        git_binary_set = true;
    }
    if (other.command_timeout_set) {
        command_timeout = other.command_timeout;
        command_timeout_set = true;
    }
    if (other.commit_wrap_column_set) {
        commit_wrap_column = other.commit_wrap_column;
        commit_wrap_column_set = true;
    }
    if (other.history_config_key_set) {
        history_config_key = other.history_config_key;
        history_config_key_set = true;
    }
    if (other.max_history_length_set) {
        max_history_length = other.max_history_length;
        max_history_length_set = true;
    }
    if (other.read_workers_set) {
        read_workers = other.read_workers;
        read_workers_set = true;
    }
    if (other.log_level_set) {
        log_level = other.log_level;
        log_level_set = true;
    }
    if (other.log_color_set) {
        log_color = other.log_color;
        log_color_set = true;
    }
}

Settings Settings::effective(const std::optional<Settings>& global,
                             const std::optional<Settings>& workdir) {
    Settings result;
    if (global.has_value()) result.merge(global.value());
    if (workdir.has_value()) result.merge(workdir.value());
    return result;
}

void Settings::apply_logging() const {
    log::set_level(log_level);
    if (!log_color) log::set_color_enabled(false);
}

std::string global_settings_path() {
    const char* home = std::getenv("HOME");
    if (!home) home = std::getenv("USERPROFILE");
    if (!home) return "";
    return std::string(home) + "/.vista/config.toml";
}

std::string workdir_settings_path(const std::string& working_dir) {
    return (fs::path(working_dir) / ".vista.toml").string();
}

Result<Settings> load_settings_for(const std::string& working_dir) {
    std::optional<Settings> global;
    std::optional<Settings> local;

    std::string gpath = global_settings_path();
    if (!gpath.empty() && fs::exists(gpath)) {
        auto r = Settings::load(gpath);
        if (r.is_err()) return std::move(r).error();
        global = std::move(r).value();
    }

    std::string lpath = workdir_settings_path(working_dir);
    if (!working_dir.empty() && fs::exists(lpath)) {
        auto r = Settings::load(lpath);
        if (r.is_err()) return std::move(r).error();
        local = std::move(r).value();
    }

    return Result<Settings>::ok(Settings::effective(global, local));
}

} // namespace vista
