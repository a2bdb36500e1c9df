#pragma once
#include <iosfwd>
#include <string>
#include <unordered_map>
#include <optional>

// Process-wide KEY=VALUE configuration. Values come from a .env file; a
// process environment variable with the same name takes precedence.
class ConfigManager {
public:
  static void Initialize(const std::string& env_path = ".env");
  // Replaces the loaded values; environment variables still take precedence.
  static void LoadFromString(const std::string& contents);
  static std::optional<std::string> Get(const std::string& key);
  static std::string GetOr(const std::string& key, const std::string& default_value);
  static std::string GetOrThrow(const std::string& key);
  static int GetIntOr(const std::string& key, int default_value);
  static bool GetBoolOr(const std::string& key, bool default_value);
private:
  static std::unordered_map<std::string, std::string> cache_;
  static void ParseLines(std::istream& in);
};
