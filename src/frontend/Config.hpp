#pragma once

#include <cstdint>
#include <string>
#include <map>
#include <fstream>
#include <sstream>
#include <stdexcept>

/**
 * Config - Simple INI-style configuration manager
 *
 * Singleton pattern for easy access from anywhere.
 * Stores key-value pairs, persists to/from file.
 *
 * Known keys:
 *   Scale, InstructionsPerSecond, ForegroundColor, BackgroundColor,
 *   ToneColor, WindowX, WindowY, WindowWidth, WindowHeight, Maximized
 */
class Config {
public:
    static constexpr const char* DEFAULT_FILE = "vip8.ini";

    static Config& Instance() {
        static Config instance;
        return instance;
    }

    // Returns false if the file could not be opened (defaults still apply)
    bool Load(const std::string& filename = DEFAULT_FILE) {
        m_filename = filename;
        std::ifstream file(filename);
        if (!file.is_open()) return false;

        std::string line;
        while (std::getline(file, line)) {
            if (!line.empty() && line.back() == '\r') line.pop_back();
            if (line.empty() || line[0] == ';' || line[0] == '#' || line[0] == '[') continue;

            size_t delimiterPos = line.find('=');
            if (delimiterPos != std::string::npos) {
                std::string key = Trim(line.substr(0, delimiterPos));
                std::string value = Trim(line.substr(delimiterPos + 1));
                m_data[key] = value;
            }
        }
        return true;
    }

    bool Save() const {
        if (m_filename.empty()) return false;
        std::ofstream file(m_filename);
        if (!file.is_open()) return false;

        for (const auto& [key, value] : m_data) {
            file << key << "=" << value << "\n";
        }
        return true;
    }

    void Clear() {
        m_data.clear();
        m_filename.clear();
    }

    std::string Get(const std::string& key, const std::string& defaultValue = "") const {
        auto it = m_data.find(key);
        if (it != m_data.end()) {
            return it->second;
        }
        return defaultValue;
    }

    void Set(const std::string& key, const std::string& value) {
        m_data[key] = value;
    }

    int GetInt(const std::string& key, int defaultValue = 0) const {
        std::string val = Get(key);
        if (val.empty()) return defaultValue;
        try {
            return std::stoi(val);
        } catch (const std::exception&) {
            return defaultValue;
        }
    }

    void SetInt(const std::string& key, int value) {
        Set(key, std::to_string(value));
    }

    // Colors are stored as hex ARGB, with or without a 0x prefix
    uint32_t GetColor(const std::string& key, uint32_t defaultValue) const {
        std::string val = Get(key);
        if (val.empty()) return defaultValue;
        try {
            return static_cast<uint32_t>(std::stoul(val, nullptr, 16));
        } catch (const std::exception&) {
            return defaultValue;
        }
    }

    void SetColor(const std::string& key, uint32_t value) {
        std::ostringstream out;
        out << "0x" << std::hex << std::uppercase << value;
        Set(key, out.str());
    }

private:
    std::map<std::string, std::string> m_data;
    std::string m_filename;

    static std::string Trim(const std::string& text) {
        size_t first = text.find_first_not_of(" \t");
        if (first == std::string::npos) return "";
        size_t last = text.find_last_not_of(" \t");
        return text.substr(first, last - first + 1);
    }

    Config() = default;
    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;
};
