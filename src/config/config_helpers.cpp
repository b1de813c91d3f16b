#include <fstream>
#include <fetchkit/config/config_helpers.h>

namespace fetchkit::config {

std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key) {
    std::ifstream file(config_path);
    if (!file) {
        return "";
    }

    std::string line;
    std::string currentSection;
    bool in_target_section = section.empty();

    while (std::getline(file, line)) {
        trim(line);

        // Skip comments and empty lines
        if (line.empty() || line[0] == '#') {
            continue;
        }

        // Check for section headers [section]
        if (line[0] == '[') {
            size_t end = line.find(']');
            if (end != std::string::npos) {
                currentSection = line.substr(1, end - 1);
                trim(currentSection);
                in_target_section = (section.empty() || currentSection == section);
            }
            continue;
        }

        // Both "[fetch] key" and a dotted "fetch.key" at the top level are accepted
        const bool top_level_dotted = !section.empty() && currentSection.empty();
        if (!in_target_section && !top_level_dotted)
            continue;

        size_t eq = line.find('=');
        if (eq == std::string::npos)
            continue;

        std::string k = line.substr(0, eq);
        std::string v = line.substr(eq + 1);
        trim(k);
        trim(v);

        // Inline comments; a '#' inside a quoted value is kept
        if (!v.empty() && (v.front() == '"' || v.front() == '\'')) {
            size_t close = v.find(v.front(), 1);
            if (close != std::string::npos)
                v = v.substr(0, close + 1);
        } else if (size_t comment = v.find('#'); comment != std::string::npos) {
            v = v.substr(0, comment);
            trim(v);
        }

        if ((in_target_section && k == key) ||
            (top_level_dotted && k == section + "." + key)) {
            return unquote(v);
        }
    }

    return "";
}

std::filesystem::path get_config_dir() {
    if (const char* xdgConfigHome = std::getenv("XDG_CONFIG_HOME"); xdgConfigHome && *xdgConfigHome) {
        return std::filesystem::path(xdgConfigHome) / "fetchkit";
    }
    if (const char* homeEnv = std::getenv("HOME"); homeEnv && *homeEnv) {
        return std::filesystem::path(homeEnv) / ".config" / "fetchkit";
    }
    return std::filesystem::path("~/.config") / "fetchkit";
}

std::filesystem::path get_config_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return expand_tilde(override_path);
    }
    return get_config_dir() / "config.toml";
}

std::filesystem::path resolve_config_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return expand_tilde(override_path);
    }
    if (const char* cfg_env = std::getenv("FETCHKIT_CONFIG"); cfg_env && *cfg_env) {
        return expand_tilde(cfg_env);
    }
    return get_config_path();
}

} // namespace fetchkit::config
