#pragma once
#include <string>
#include <unordered_map>
#include <optional>

// Key/value settings from a .env file. Keys missing from the file are looked
// up in the process environment.
class ConfigManager {
public:
  static void Initialize(const std::string& env_path = ".env");
  static std::optional<std::string> Get(const std::string& key);
  static std::string GetOrThrow(const std::string& key);
  static int GetIntOr(const std::string& key, int default_value);
  static unsigned long long GetUint64Or(const std::string& key, unsigned long long default_value);
  static double GetDoubleOr(const std::string& key, double default_value);
  static bool GetBoolOr(const std::string& key, bool default_value);
  // Overrides a key in-process (used by tests and CLI arguments).
  static void Set(const std::string& key, const std::string& value);
  static void Clear();
private:
  static std::unordered_map<std::string, std::string> cache_;
  static void LoadEnvFile(const std::string& env_path);
};
