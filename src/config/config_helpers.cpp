#include <clawdesk/config/config_helpers.h>

#include <fstream>

namespace clawdesk::config {

namespace {

std::filesystem::path env_path(const char* name) {
    if (const char* v = std::getenv(name); v && *v) {
        return std::filesystem::path(v);
    }
    return {};
}

} // namespace

std::filesystem::path get_home_dir() {
#ifdef _WIN32
    if (auto p = env_path("USERPROFILE"); !p.empty()) {
        return p;
    }
#endif
    return env_path("HOME");
}

std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key) {
    std::ifstream file(config_path);
    if (!file) {
        return "";
    }

    std::string line;
    std::string currentSection;

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

        // Remove inline comments outside of quotes
        bool inQuote = false;
        char quoteChar = '\0';
        for (size_t i = 0; i < v.size(); ++i) {
            char c = v[i];
            if (inQuote) {
                if (c == quoteChar)
                    inQuote = false;
            } else if (c == '"' || c == '\'') {
                inQuote = true;
                quoteChar = c;
            } else if (c == '#') {
                v = v.substr(0, i);
                trim(v);
                break;
            }
        }

        const bool sectionMatch = section.empty() || currentSection == section;
        if ((sectionMatch && k == key) || (!section.empty() && k == section + "." + key)) {
            return unquote(v);
        }
    }

    return "";
}

std::vector<std::string> parse_string_list(const std::string& raw) {
    std::vector<std::string> out;
    std::string s = raw;
    trim(s);
    if (s.size() >= 2 && s.front() == '[' && s.back() == ']') {
        s = s.substr(1, s.size() - 2);
    }

    std::string current;
    bool inQuote = false;
    char quoteChar = '\0';
    auto flush = [&]() {
        auto item = unquote(current);
        if (!item.empty()) {
            out.push_back(std::move(item));
        }
        current.clear();
    };
    for (char c : s) {
        if (inQuote) {
            if (c == quoteChar)
                inQuote = false;
            current.push_back(c);
        } else if (c == '"' || c == '\'') {
            inQuote = true;
            quoteChar = c;
            current.push_back(c);
        } else if (c == ',') {
            flush();
        } else {
            current.push_back(c);
        }
    }
    flush();
    return out;
}

std::filesystem::path get_config_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return std::filesystem::path(override_path);
    }
    if (auto p = env_path("CLAWDESK_CONFIG"); !p.empty()) {
        return p;
    }
    return get_config_dir() / "config.toml";
}

std::filesystem::path get_config_dir() {
#ifdef _WIN32
    if (auto appData = env_path("APPDATA"); !appData.empty()) {
        return appData / "clawdesk";
    }
#endif
    if (auto xdg = env_path("XDG_CONFIG_HOME"); !xdg.empty()) {
        return xdg / "clawdesk";
    }
    if (auto home = get_home_dir(); !home.empty()) {
        return home / ".config" / "clawdesk";
    }
    return std::filesystem::path("~/.config") / "clawdesk";
}

std::filesystem::path get_data_dir() {
#ifdef _WIN32
    if (auto local = env_path("LOCALAPPDATA"); !local.empty()) {
        return local / "clawdesk";
    }
#endif
    if (auto xdg = env_path("XDG_DATA_HOME"); !xdg.empty()) {
        return xdg / "clawdesk";
    }
    if (auto home = get_home_dir(); !home.empty()) {
        return home / ".local" / "share" / "clawdesk";
    }
    return std::filesystem::current_path() / "clawdesk_data";
}

} // namespace clawdesk::config
