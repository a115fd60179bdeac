#include <fstream>
#include <orderpix/config/config_helpers.h>

namespace orderpix::config {

namespace {

// Drop an inline comment while leaving '#' inside a quoted value alone.
std::string strip_inline_comment(std::string v) {
    if (!v.empty() && (v.front() == '"' || v.front() == '\'')) {
        const char quote = v.front();
        size_t close = v.find(quote, 1);
        if (close != std::string::npos) {
            size_t comment = v.find('#', close + 1);
            if (comment != std::string::npos)
                v.erase(comment);
        }
    } else if (!v.empty() && v.front() == '[') {
        size_t close = v.rfind(']');
        size_t comment = v.find('#', close == std::string::npos ? 0 : close + 1);
        if (comment != std::string::npos)
            v.erase(comment);
    } else {
        size_t comment = v.find('#');
        if (comment != std::string::npos)
            v.erase(comment);
    }
    trim(v);
    return v;
}

} // namespace

std::map<std::string, std::string> parse_config_file(const std::filesystem::path& config_path) {
    std::map<std::string, std::string> values;
    std::ifstream file(config_path);
    if (!file) {
        return values;
    }

    std::string line;
    std::string currentSection;

    while (std::getline(file, line)) {
        trim(line);

        // Skip comments and empty lines
        if (line.empty() || line[0] == '#' || line[0] == ';') {
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
        if (k.empty()) {
            continue;
        }

        v = strip_inline_comment(std::move(v));
        std::string fullKey = currentSection.empty() ? k : currentSection + "." + k;
        // First definition wins, as with a sequential lookup.
        values.emplace(std::move(fullKey), unquote(v));
    }

    return values;
}

std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key) {
    auto values = parse_config_file(config_path);
    auto it = values.find(section.empty() ? key : section + "." + key);
    return it == values.end() ? std::string{} : it->second;
}

std::vector<std::string> parse_list(const std::string& raw) {
    std::vector<std::string> out;
    std::string s = raw;
    trim(s);
    if (s.empty())
        return out;

    if (s.front() == '[' && s.back() == ']') {
        s = s.substr(1, s.size() - 2);
    }

    size_t start = 0;
    while (start <= s.size()) {
        size_t comma = s.find(',', start);
        std::string item =
            unquote(s.substr(start, comma == std::string::npos ? std::string::npos : comma - start));
        if (!item.empty()) {
            out.push_back(std::move(item));
        }
        if (comma == std::string::npos)
            break;
        start = comma + 1;
    }
    return out;
}

std::filesystem::path get_config_dir() {
#if defined(_WIN32)
    if (const char* appData = std::getenv("APPDATA"); appData && *appData) {
        return std::filesystem::path(appData) / "orderpix";
    }
#endif
    if (const char* xdgConfigHome = std::getenv("XDG_CONFIG_HOME");
        xdgConfigHome && *xdgConfigHome) {
        return std::filesystem::path(xdgConfigHome) / "orderpix";
    }
    if (const char* homeEnv = std::getenv("HOME"); homeEnv && *homeEnv) {
        return std::filesystem::path(homeEnv) / ".config" / "orderpix";
    }
    return std::filesystem::path(".orderpix");
}

std::filesystem::path get_config_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return expand_tilde(override_path);
    }
    return get_config_dir() / "config.toml";
}

} // namespace orderpix::config
