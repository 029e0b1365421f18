// src/augur/utils/config.cpp
#include "augur/utils/config.hpp"
#include <algorithm>
#include <cctype>

namespace augur {
namespace utils {

std::string Config::trim(const std::string& text) {
    auto begin = text.find_first_not_of(" \t\r");
    if (begin == std::string::npos) {
        return "";
    }
    auto end = text.find_last_not_of(" \t\r");
    return text.substr(begin, end - begin + 1);
}

bool Config::load_from_file(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        return false;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    load_from_string(buffer.str());
    return true;
}

void Config::load_from_string(const std::string& text) {
    std::lock_guard<std::mutex> lock(mutex_);
    values_.clear();

    std::istringstream input(text);
    std::string line;
    while (std::getline(input, line)) {
        // Skip comments and empty lines
        std::string stripped = trim(line);
        if (stripped.empty() || stripped[0] == '#') {
            continue;
        }

        // Parse key=value
        size_t pos = stripped.find('=');
        if (pos != std::string::npos) {
            std::string key = trim(stripped.substr(0, pos));
            std::string value = trim(stripped.substr(pos + 1));
            if (!key.empty()) {
                values_[key] = value;
            }
        }
    }
}

bool Config::has(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return values_.count(key) > 0;
}

bool Config::get_bool(const std::string& key, bool default_value) const {
    std::string raw = get(key, std::string());
    std::transform(raw.begin(), raw.end(), raw.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (raw == "true" || raw == "yes" || raw == "on" || raw == "1") {
        return true;
    }
    if (raw == "false" || raw == "no" || raw == "off" || raw == "0") {
        return false;
    }
    return default_value;
}

std::vector<std::string> Config::get_list(const std::string& key) const {
    std::vector<std::string> items;
    std::stringstream ss(get(key, std::string()));
    std::string item;
    while (std::getline(ss, item, ',')) {
        item = trim(item);
        if (!item.empty()) {
            items.push_back(item);
        }
    }
    return items;
}

} // namespace utils
} // namespace augur
