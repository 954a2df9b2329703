#include "circuitguard/environment.h"
#include <fstream>
#include <utility>

namespace circuitguard {

    namespace {

    std::string trim(const std::string& str) {
        size_t first = str.find_first_not_of(" \t\r");
        if (first == std::string::npos) return "";
        size_t last = str.find_last_not_of(" \t\r");
        return str.substr(first, last - first + 1);
    }

    bool is_quoted(const std::string& value) {
        return value.size() >= 2 &&
               ((value.front() == '"' && value.back() == '"') ||
                (value.front() == '\'' && value.back() == '\''));
    }

    std::optional<std::pair<std::string, std::string>> parse_line(const std::string& raw) {
        std::string line = trim(raw);
        if (line.empty() || line[0] == '#') return std::nullopt;

        if (line.rfind("export ", 0) == 0) {
            line = trim(line.substr(7));
        }

        size_t eq = line.find('=');
        if (eq == std::string::npos) return std::nullopt;

        std::string key = trim(line.substr(0, eq));
        std::string value = trim(line.substr(eq + 1));
        if (key.empty()) return std::nullopt;

        if (is_quoted(value)) {
            value = value.substr(1, value.size() - 2);
        } else if (size_t hash = value.find(" #"); hash != std::string::npos) {
            value = trim(value.substr(0, hash));
        }

        return std::make_pair(std::move(key), std::move(value));
    }

    } // namespace

    bool load_env(const std::string& path, bool overwrite) {
        std::ifstream file(path);
        if (!file.is_open()) {
            return false;
        }

        std::string line;
        while (std::getline(file, line)) {
            auto entry = parse_line(line);
            if (!entry) continue;
            setenv(entry->first.c_str(), entry->second.c_str(), overwrite ? 1 : 0);
        }

        return true;
    }
}
