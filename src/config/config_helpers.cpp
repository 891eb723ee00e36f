#include <fstream>
#include <payplan/config/config_helpers.h>

namespace payplan::config {

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

        if (line[0] == '[') {
            size_t end = line.find(']');
            if (end != std::string::npos) {
                currentSection = line.substr(1, end - 1);
                trim(currentSection);
                in_target_section = (section.empty() || currentSection == section);
            }
            continue;
        }

        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            continue;
        }
        std::string k = line.substr(0, eq);
        std::string v = line.substr(eq + 1);
        trim(k);
        trim(v);

        // Dotted keys ("extraction.default_locale") work outside a section header
        const bool dotted = !section.empty() && k == section + "." + key;
        if (!(in_target_section && k == key) && !dotted) {
            continue;
        }

        // Inline comments only outside quotes
        if (!v.empty() && (v.front() == '"' || v.front() == '\'')) {
            size_t close = v.find(v.front(), 1);
            if (close != std::string::npos) {
                v = v.substr(0, close + 1);
            }
        } else if (size_t comment = v.find('#'); comment != std::string::npos) {
            v = v.substr(0, comment);
            trim(v);
        }
        return unquote(v);
    }

    return "";
}

std::filesystem::path get_config_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return expand_tilde(override_path);
    }

    const char* xdgConfigHome = std::getenv("XDG_CONFIG_HOME");
    const char* homeEnv = std::getenv("HOME");

    std::filesystem::path configHome;
    if (xdgConfigHome) {
        configHome = std::filesystem::path(xdgConfigHome);
    } else if (homeEnv) {
        configHome = std::filesystem::path(homeEnv) / ".config";
    } else {
        return std::filesystem::path(".config") / "payplan" / "config.toml";
    }

    return configHome / "payplan" / "config.toml";
}

} // namespace payplan::config
