#pragma once

#include <string>
#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <unordered_map>

namespace OnsetAnalyzer {

/**
 * Einfacher .env Parser
 */
class EnvConfig {
public:
    static EnvConfig& instance() {
        static EnvConfig instance;
        return instance;
    }

    // Lade .env Datei (falls vorhanden). Spätere Dateien überschreiben Keys.
    bool load(const std::string& path = ".env") {
        std::ifstream file(path);
        if (!file.is_open()) {
            return false;
        }

        std::string line;
        while (std::getline(file, line)) {
            line = trim(line);
            // Kommentare und leere Zeilen überspringen
            if (line.empty() || line[0] == '#') continue;

            auto pos = line.find('=');
            if (pos != std::string::npos) {
                std::string key = trim(line.substr(0, pos));
                std::string value = unquote(trim(line.substr(pos + 1)));
                m_values[key] = value;
            }
        }
        return true;
    }

    // Alle geladenen Werte verwerfen
    void clear() { m_values.clear(); }

    bool hasKey(const std::string& key) const {
        return m_values.find(key) != m_values.end() || std::getenv(key.c_str()) != nullptr;
    }

    // Getter mit Fallback auf Environment-Variable
    std::string getString(const std::string& key, const std::string& defaultValue = "") const {
        // Erst in geladenen Werten suchen
        auto it = m_values.find(key);
        if (it != m_values.end()) {
            return it->second;
        }

        // Dann Environment-Variable prüfen
        const char* env = std::getenv(key.c_str());
        return env ? env : defaultValue;
    }

    int getInt(const std::string& key, int defaultValue = 0) const {
        std::string val = getString(key, "");
        if (val.empty()) return defaultValue;
        try {
            return std::stoi(val);
        } catch (const std::logic_error&) {
            return defaultValue;
        }
    }

    float getFloat(const std::string& key, float defaultValue = 0.0f) const {
        std::string val = getString(key, "");
        if (val.empty()) return defaultValue;
        try {
            return std::stof(val);
        } catch (const std::logic_error&) {
            return defaultValue;
        }
    }

    bool getBool(const std::string& key, bool defaultValue = false) const {
        std::string val = getString(key, "");
        if (val.empty()) return defaultValue;
        return val == "1" || val == "true" || val == "yes" || val == "on";
    }

private:
    EnvConfig() = default;

    static std::string trim(const std::string& s) {
        size_t start = s.find_first_not_of(" \t\r\n");
        size_t end = s.find_last_not_of(" \t\r\n");
        return (start == std::string::npos) ? "" : s.substr(start, end - start + 1);
    }

    static std::string unquote(const std::string& s) {
        if (s.size() >= 2 && (s.front() == '"' || s.front() == '\'') && s.back() == s.front()) {
            return s.substr(1, s.size() - 2);
        }
        return s;
    }

    std::unordered_map<std::string, std::string> m_values;
};

} // namespace OnsetAnalyzer
