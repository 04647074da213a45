#pragma once
#include <string>
#include <unordered_map>
#include <mutex>
#include <memory>
#include <sstream>
#include <fundunit/core/errors.hpp>

namespace fundunit::utils {

// key=value settings for the fund administration tools.
// Lines starting with '#' and blank lines are ignored; keys and values are trimmed.
class Config {
private:
    std::unordered_map<std::string, std::string> values_;
    mutable std::mutex mutex_;
    static std::shared_ptr<Config> instance_;
    static std::mutex instance_mutex_;

    void parse(std::istream& input);

public:
    Config() = default;

    static std::shared_ptr<Config> instance() {
        std::lock_guard<std::mutex> lock(instance_mutex_);
        if (!instance_) {
            instance_ = std::make_shared<Config>();
        }
        return instance_;
    }

    // Returns false when the file cannot be opened; existing values are kept in that case.
    bool load_from_file(const std::string& filename);
    void load_from_string(const std::string& text);

    bool has(const std::string& key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return values_.count(key) > 0;
    }

    // Typed lookup; a value that does not parse as T yields the default.
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

    // Like get<T>, but the whole value must parse as T; anything else is a
    // core::ArgumentError naming the key. Missing keys still yield the default.
    template<typename T>
    T get_checked(const std::string& key, const T& default_value) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = values_.find(key);
        if (it == values_.end()) {
            return default_value;
        }

        std::istringstream iss(it->second);
        T value;
        if (!(iss >> value) || !(iss >> std::ws).eof()) {
            throw core::ArgumentError("Invalid value for " + key + ": '" + it->second + "'");
        }

        return value;
    }

    std::string get(const std::string& key, const std::string& default_value) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = values_.find(key);
        return (it != values_.end()) ? it->second : default_value;
    }

    std::string get(const std::string& key, const char* default_value) const {
        return get(key, std::string(default_value));
    }

    template<typename T>
    void set(const std::string& key, const T& value) {
        std::lock_guard<std::mutex> lock(mutex_);
        std::ostringstream oss;
        oss << value;
        values_[key] = oss.str();
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        values_.clear();
    }
};

} // namespace fundunit::utils
