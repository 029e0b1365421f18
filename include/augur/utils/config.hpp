// include/augur/utils/config.hpp
#pragma once
#include <string>
#include <unordered_map>
#include <vector>
#include <mutex>
#include <fstream>
#include <sstream>

namespace augur {
namespace utils {

// key = value settings file. Lines starting with '#' are comments.
class Config {
private:
    std::unordered_map<std::string, std::string> values_;
    mutable std::mutex mutex_;

    static std::string trim(const std::string& text);

public:
    Config() = default;

    // Load configuration from file
    bool load_from_file(const std::string& filename);

    // Parse configuration from an in-memory string (same syntax as the file)
    void load_from_string(const std::string& text);

    bool has(const std::string& key) const;

    // Get a value with default
    template<typename T>
    T get(const std::string& key, const T& default_value) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = values_.find(key);
        if (it == values_.end()) {
            return default_value;
        }

        std::istringstream iss(it->second);
        T value;
        if (!(iss >> value)) {
            return default_value;
        }

        return value;
    }

    // Specialized for string to avoid stringstream
    std::string get(const std::string& key, const std::string& default_value) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = values_.find(key);
        return (it != values_.end()) ? it->second : default_value;
    }

    std::string get(const std::string& key, const char* default_value) const {
        return get(key, std::string(default_value));
    }

    // true/false, yes/no, on/off or 1/0
    bool get_bool(const std::string& key, bool default_value) const;

    // Comma separated list, entries trimmed, empty entries dropped
    std::vector<std::string> get_list(const std::string& key) const;

    // Set a value
    template<typename T>
    void set(const std::string& key, const T& value) {
        std::lock_guard<std::mutex> lock(mutex_);
        std::ostringstream oss;
        oss << value;
        values_[key] = oss.str();
    }
};

} // namespace utils
} // namespace augur
