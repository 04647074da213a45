#include <fundunit/utils/config.hpp>
#include <fstream>

namespace fundunit::utils {

std::shared_ptr<Config> Config::instance_ = nullptr;
std::mutex Config::instance_mutex_;

namespace {

void trim(std::string& text) {
    text.erase(0, text.find_first_not_of(" \t\r"));
    text.erase(text.find_last_not_of(" \t\r") + 1);
}

} // namespace

bool Config::load_from_file(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    values_.clear();
    parse(file);
    return true;
}

void Config::load_from_string(const std::string& text) {
    std::istringstream input(text);
    std::lock_guard<std::mutex> lock(mutex_);
    values_.clear();
    parse(input);
}

void Config::parse(std::istream& input) {
    std::string line;
    while (std::getline(input, line)) {
        trim(line);
        if (line.empty() || line[0] == '#') {
            continue;
        }

        size_t pos = line.find('=');
        if (pos == std::string::npos) {
            continue;
        }

        std::string key = line.substr(0, pos);
        std::string value = line.substr(pos + 1);
        trim(key);
        trim(value);

        if (!key.empty()) {
            values_[key] = value;
        }
    }
}

} // namespace fundunit::utils
