#include "aegis/config/ConfigLoader.hpp"

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>

namespace aegis {

static std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

bool ConfigLoader::load(const std::string& path) {
    std::string primary = path;
    if (const char* env = std::getenv("AEGIS_CONFIG")) {
        primary = env;
    }

    std::vector<std::string> paths = { primary, "../" + primary };

    for (const auto& p : paths) {
        std::ifstream file(p);
        if (file.is_open()) {
            config_path_ = p;
            return parse(file);
        }
    }

    std::cerr << "[CONFIG] " << primary << " not found. Searched:\n";
    for (const auto& p : paths) {
        std::cerr << "  - " << p << "\n";
    }
    return false;
}

bool ConfigLoader::load_string(const std::string& text) {
    std::istringstream in(text);
    config_path_ = "<string>";
    return parse(in);
}

bool ConfigLoader::has(const std::string& section, const std::string& key) const {
    return values_.count(section + "." + key) > 0;
}

std::string ConfigLoader::get(const std::string& section, const std::string& key,
                              const std::string& default_val) const {
    auto it = values_.find(section + "." + key);
    if (it != values_.end()) {
        return it->second;
    }
    return default_val;
}

int ConfigLoader::getInt(const std::string& section, const std::string& key, int default_val) const {
    std::string val = get(section, key);
    if (val.empty()) return default_val;
    try {
        return std::stoi(val);
    } catch (const std::exception&) {
        std::cerr << "[CONFIG] " << section << "." << key << "='" << val
                  << "' is not an integer, using " << default_val << "\n";
        return default_val;
    }
}

double ConfigLoader::getDouble(const std::string& section, const std::string& key, double default_val) const {
    std::string val = get(section, key);
    if (val.empty()) return default_val;
    try {
        return std::stod(val);
    } catch (const std::exception&) {
        std::cerr << "[CONFIG] " << section << "." << key << "='" << val
                  << "' is not a number, using " << default_val << "\n";
        return default_val;
    }
}

bool ConfigLoader::getBool(const std::string& section, const std::string& key, bool default_val) const {
    std::string val = get(section, key);
    if (val.empty()) return default_val;
    return (val == "true" || val == "1" || val == "yes" || val == "on");
}

std::vector<std::string> ConfigLoader::sections_with_prefix(const std::string& prefix) const {
    std::vector<std::string> out;
    const std::string head = prefix + ".";
    for (const auto& s : sections_) {
        if (s.size() > head.size() && s.compare(0, head.size(), head) == 0) {
            out.push_back(s.substr(head.size()));
        }
    }
    return out;
}

void ConfigLoader::dump() const {
    std::cout << "[CONFIG] Loaded from: " << config_path_ << "\n";

    std::vector<std::string> keys;
    keys.reserve(values_.size());
    for (const auto& kv : values_) keys.push_back(kv.first);
    std::sort(keys.begin(), keys.end());

    for (const auto& k : keys) {
        if (k.find("password") != std::string::npos ||
            k.find("secret") != std::string::npos ||
            k.find("token") != std::string::npos) {
            std::cout << "  " << k << " = ********\n";
        } else {
            std::cout << "  " << k << " = " << values_.at(k) << "\n";
        }
    }
}

bool ConfigLoader::parse(std::istream& in) {
    std::string line;
    std::string current_section;

    while (std::getline(in, line)) {
        line = trim(line);

        // Skip empty lines and comments
        if (line.empty() || line[0] == '#' || line[0] == ';') continue;

        if (line[0] == '[') {
            size_t close = line.find(']');
            if (close != std::string::npos) {
                current_section = trim(line.substr(1, close - 1));
                if (std::find(sections_.begin(), sections_.end(), current_section) == sections_.end()) {
                    sections_.push_back(current_section);
                }
            }
            continue;
        }

        size_t eq = line.find('=');
        if (eq == std::string::npos) continue;

        std::string key   = trim(line.substr(0, eq));
        std::string value = trim(line.substr(eq + 1));

        values_[current_section + "." + key] = value;
    }

    return !values_.empty();
}

} // namespace aegis
