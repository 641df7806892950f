#ifndef UTILS_HPP
#define UTILS_HPP

#include <fstream>
#include <iostream>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "../config/CacheConfig.hpp"

class Utils {
public:
    // Converts a string to a LogLevel enum
    static LogUtils::LogLevel stringToLogLevel(const std::string& level) {
        if (level == "DEBUG") return LogUtils::LogLevel::DEBUG;
        if (level == "INFO") return LogUtils::LogLevel::INFO;
        if (level == "WARNING") return LogUtils::LogLevel::WARN;
        if (level == "CERROR") return LogUtils::LogLevel::CERROR;
        throw std::invalid_argument("Invalid log level: " + level);
    }

    // Helper to parse integer safely
    static std::optional<int> stringToInt(const std::string& str) {
        try {
            size_t pos;
            int val = std::stoi(str, &pos);
            // Check if the entire string was consumed
            if (pos == str.length()) {
                return val;
            }
        } catch (const std::invalid_argument&) {
            // Not an integer
        } catch (const std::out_of_range&) {
            // Integer out of range
        }
        return std::nullopt;
    }

    // Helper to trim whitespace from start and end of string
    static std::string trim(const std::string& str) {
        size_t first = str.find_first_not_of(" \t\n\r");
        if (std::string::npos == first) return "";
        size_t last = str.find_last_not_of(" \t\n\r");
        return str.substr(first, (last - first + 1));
    }

    // Parses key=value command-line arguments; nullopt if any is malformed.
    static std::optional<std::map<std::string, std::string>> parseArguments(const std::vector<std::string>& args) {
        std::map<std::string, std::string> argMap;
        for (const std::string& arg : args) {
            size_t delimiterPos = arg.find('=');
            if (delimiterPos != std::string::npos && delimiterPos > 0) { // Ensure key is not empty
                argMap[arg.substr(0, delimiterPos)] = arg.substr(delimiterPos + 1);
            } else {
                std::cerr << "Error: Invalid argument format: '" << arg << "'. Expected non-empty key=value format." << std::endl;
                return std::nullopt;
            }
        }
        return argMap;
    }

    static std::vector<std::string> defaultConfigPaths() {
        return {
            Constants::CONFIG_FILE_NAME,                      // Current directory
            std::string("../") + Constants::CONFIG_FILE_NAME, // Parent directory
            std::string("/etc/ttlcache/") + Constants::CONFIG_FILE_NAME
        };
    }

    // Defaults, then the first config file found, then command-line overrides.
    static CacheConfig loadConfiguration(const std::map<std::string, std::string>& startupArguments) {
        return loadConfiguration(startupArguments, defaultConfigPaths());
    }

    static CacheConfig loadConfiguration(
        const std::map<std::string, std::string>& startupArguments,
        const std::vector<std::string>& config_paths) {
        CacheConfig config;

        bool config_found = false;
        for (const auto& config_path : config_paths) {
            std::ifstream configFile(config_path);
            if (!configFile.is_open()) {
                continue;
            }
            std::cout << "Reading configuration from " << config_path << "..." << std::endl;
            config_found = true;
            std::string line;
            while (std::getline(configFile, line)) {
                line = trim(line);
                if (line.empty() || line[0] == '#') { // Skip empty lines and comments
                    continue;
                }
                size_t delimiterPos = line.find('=');
                if (delimiterPos != std::string::npos && delimiterPos > 0) {
                    applySetting(config, trim(line.substr(0, delimiterPos)), trim(line.substr(delimiterPos + 1)), "config file");
                } else {
                    std::cerr << "Warning: Ignoring malformed config line: '" << line << "'" << std::endl;
                }
            }
            break;
        }

        if (!config_found) {
            std::cerr << "Warning: Configuration file not found in any standard location. Using defaults and command-line arguments." << std::endl;
        }

        // Command-line arguments win over the config file
        for (const auto& pair : startupArguments) {
            applySetting(config, pair.first, pair.second, "arguments");
        }
        return config;
    }

private:
    static void applyInt(int& target, const std::string& key, const std::string& value,
                         const std::string& source, int minimum) {
        auto val = stringToInt(value);
        if (!val) {
            std::cerr << "Warning: Invalid integer for " << key << " in " << source << ": " << value << std::endl;
        } else if (*val < minimum) {
            std::cerr << "Warning: " << key << " in " << source << " must be >= " << minimum << ", got " << *val << std::endl;
        } else {
            target = *val;
        }
    }

    static void applySetting(CacheConfig& config, const std::string& key, const std::string& value, const std::string& source) {
        if (key == "capacity") {
            applyInt(config.capacity, key, value, source, 1);
        } else if (key == "shard_count") {
            applyInt(config.shard_count, key, value, source, 1);
        } else if (key == "sweep_interval") {
            // value provided in millis; 0 disables the background sweeper
            applyInt(config.sweep_interval_in_millis, key, value, source, 0);
        } else if (key == "shutdown_timeout") {
            applyInt(config.shutdown_timeout_in_millis, key, value, source, 0);
        } else if (key == "demo_ttl") {
            applyInt(config.default_demo_ttl_in_millis, key, value, source, 1);
        } else if (key == "log_level") {
            config.log_level = stringToLogLevel(value);
        } else {
            std::cerr << "Warning: Unknown setting '" << key << "' in " << source << std::endl;
        }
    }
};

#endif // UTILS_HPP
