#pragma once
// =============================================================================
// ConfigLoader.hpp - INI File Parser for ScalpEngine Configuration
// =============================================================================
// [section]
// key = value      # or ; comments
// Values are stored as "section.key". Missing keys fall back to the caller's
// default, so an empty loader yields the built-in thresholds.
// =============================================================================

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace Scalp {

class ConfigLoader {
public:
    ConfigLoader() = default;

    bool load(const std::string& path = "scalp.ini") {
        // Try multiple paths
        std::vector<std::string> paths = {
            path,
            "config/" + path,
            "../config/" + path,
            std::string(getenv("HOME") ? getenv("HOME") : ".") + "/.scalp/" + path
        };

        for (const auto& p : paths) {
            std::ifstream file(p);
            if (file.is_open()) {
                configPath_ = p;
                return parse(file);
            }
        }

        std::cerr << "[ConfigLoader] ERROR: " << path << " not found!\n";
        std::cerr << "[ConfigLoader] Searched paths:\n";
        for (const auto& p : paths) {
            std::cerr << "  - " << p << "\n";
        }
        return false;
    }

    // In-memory INI text (tests, embedded defaults)
    bool loadString(const std::string& text) {
        std::istringstream in(text);
        configPath_ = "<string>";
        return parse(in);
    }

    bool has(const std::string& section, const std::string& key) const {
        return values_.count(section + "." + key) != 0;
    }

    std::string get(const std::string& section, const std::string& key, const std::string& defaultVal = "") const {
        auto it = values_.find(section + "." + key);
        if (it != values_.end()) {
            return it->second;
        }
        return defaultVal;
    }

    int getInt(const std::string& section, const std::string& key, int defaultVal = 0) const {
        std::string val = get(section, key);
        if (val.empty()) return defaultVal;
        try {
            return std::stoi(val);
        } catch (const std::exception&) {
            std::cerr << "[ConfigLoader] WARN: " << section << "." << key
                      << " = '" << val << "' is not an integer, using " << defaultVal << "\n";
            return defaultVal;
        }
    }

    long long getInt64(const std::string& section, const std::string& key, long long defaultVal = 0) const {
        std::string val = get(section, key);
        if (val.empty()) return defaultVal;
        try {
            return std::stoll(val);
        } catch (const std::exception&) {
            std::cerr << "[ConfigLoader] WARN: " << section << "." << key
                      << " = '" << val << "' is not an integer, using " << defaultVal << "\n";
            return defaultVal;
        }
    }

    double getDouble(const std::string& section, const std::string& key, double defaultVal = 0.0) const {
        std::string val = get(section, key);
        if (val.empty()) return defaultVal;
        try {
            return std::stod(val);
        } catch (const std::exception&) {
            std::cerr << "[ConfigLoader] WARN: " << section << "." << key
                      << " = '" << val << "' is not a number, using " << defaultVal << "\n";
            return defaultVal;
        }
    }

    bool getBool(const std::string& section, const std::string& key, bool defaultVal = false) const {
        std::string val = get(section, key);
        if (val.empty()) return defaultVal;
        return (val == "true" || val == "1" || val == "yes" || val == "on");
    }

    const std::string& getConfigPath() const { return configPath_; }
    size_t size() const { return values_.size(); }

private:
    static std::string trim(const std::string& s) {
        size_t start = s.find_first_not_of(" \t\r\n");
        if (start == std::string::npos) return "";
        size_t end = s.find_last_not_of(" \t\r\n");
        return s.substr(start, end - start + 1);
    }

    bool parse(std::istream& in) {
        std::string line;
        std::string currentSection;

        while (std::getline(in, line)) {
            line = trim(line);

            // Skip empty lines and comments
            if (line.empty() || line[0] == '#' || line[0] == ';') continue;

            // Section header
            if (line[0] == '[') {
                size_t closePos = line.find(']');
                if (closePos != std::string::npos) {
                    currentSection = trim(line.substr(1, closePos - 1));
                }
                continue;
            }

            // Key = Value, trailing comment stripped
            size_t eqPos = line.find('=');
            if (eqPos == std::string::npos) continue;

            std::string key = trim(line.substr(0, eqPos));
            std::string value = line.substr(eqPos + 1);
            size_t hashPos = value.find_first_of("#;");
            if (hashPos != std::string::npos) value = value.substr(0, hashPos);
            value = trim(value);

            if (!key.empty()) {
                values_[currentSection + "." + key] = value;
            }
        }

        return !values_.empty();
    }

    std::unordered_map<std::string, std::string> values_;
    std::string configPath_;
};

} // namespace Scalp
