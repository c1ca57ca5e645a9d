#include <scriptor/environment.h>
#include <fstream>
#include <string_view>

namespace scriptor {

    namespace {

        std::string trim(std::string_view str) {
            size_t first = str.find_first_not_of(" \t\r");
            if (first == std::string_view::npos) {
                return {};
            }
            size_t last = str.find_last_not_of(" \t\r");
            return std::string(str.substr(first, last - first + 1));
        }

        std::string unquote(std::string value) {
            if (value.size() >= 2 &&
               ((value.front() == '"' && value.back() == '"') ||
                (value.front() == '\'' && value.back() == '\''))) {
                return value.substr(1, value.size() - 2);
            }
            // Unquoted values may carry a trailing " # comment"
            size_t hash = value.find(" #");
            if (hash != std::string::npos) {
                return trim(std::string_view(value).substr(0, hash));
            }
            return value;
        }

    }

    // Values from the file win over the inherited environment, so a rotated
    // key in .env takes effect on the next pool initialization.
    bool load_env(const std::string& path) {
        std::ifstream file(path);
        if (!file.is_open()) {
            return false;
        }

        std::string line;
        while (std::getline(file, line)) {
            std::string clean_line = trim(line);

            if (clean_line.empty() || clean_line[0] == '#') {
                continue;
            }

            if (clean_line.rfind("export ", 0) == 0) {
                clean_line = trim(std::string_view(clean_line).substr(7));
            }

            size_t delimiter_pos = clean_line.find('=');
            if (delimiter_pos == std::string::npos || delimiter_pos == 0) {
                continue;
            }

            std::string key = trim(std::string_view(clean_line).substr(0, delimiter_pos));
            std::string value = unquote(trim(std::string_view(clean_line).substr(delimiter_pos + 1)));

            setenv(key.c_str(), value.c_str(), 1);
        }

        return true;
    }
}
