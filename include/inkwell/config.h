#pragma once

#include <inkwell/base/factory.h>
#include <inkwell/result.hpp>
#include <yaml-cpp/yaml.h>

#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace inkwell {

class Config : public base::ObjectFactory<Config> {
public:
    using Ptr = std::shared_ptr<Config>;

    // Defaults, then the config file (configPath, else the XDG path when it
    // exists), then INKWELL_* environment variables, then cmdOverrides.
    static Result<Ptr> createImpl(const std::string& configPath,
                                  const YAML::Node& cmdOverrides) noexcept;
    static Result<Ptr> createImpl(const std::string& configPath) noexcept;
    static Result<Ptr> createImpl() noexcept;

    ~Config() = default;

    // Non-copyable
    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    // Get a value by dotted path (e.g. "overlay.text.max-font-size").
    // Returns nullopt if the key doesn't exist or has the wrong type.
    template<typename T>
    std::optional<T> get(const std::string& path) const;

    // Get a value with default fallback
    template<typename T>
    T get(const std::string& path, const T& defaultValue) const;

    // Check if a key exists
    bool has(const std::string& path) const;

    // Get the raw YAML node for advanced queries
    const YAML::Node& root() const { return _config; }

    // Path of the file that was loaded, empty if none
    const std::string& loadedPath() const { return _loadedPath; }

    // Helper to get XDG config path
    static std::filesystem::path getXDGConfigPath();

    // Environment variable prefix
    static constexpr const char* ENV_PREFIX = "INKWELL_";

    // Config keys
    static constexpr const char* KEY_RPC_SOCKET = "rpc.socket";
    static constexpr const char* KEY_ATTACH_ON_START = "overlay.attach-on-start";
    static constexpr const char* KEY_MAX_FONT_SIZE = "overlay.text.max-font-size";
    static constexpr const char* KEY_FALLBACK_FONT = "overlay.text.fallback-font";
    static constexpr const char* KEY_ANIMATION_MS = "overlay.text.animation-ms";
    static constexpr const char* KEY_IMAGE_CACHE_SIZE = "overlay.image-cache-size";
    static constexpr const char* KEY_LOG_LEVEL = "log.level";

    // Typed accessors
    std::string socketPath() const;
    bool attachOnStart() const;
    int maxFontSize() const;
    std::string fallbackFont() const;
    int animationMs() const;
    int imageCacheSize() const;
    std::string logLevel() const;

    // Convert dotted path to env var name (e.g. "log.level" -> "INKWELL_LOG_LEVEL")
    static std::string pathToEnvVar(const std::string& path);

private:
    Config(const std::string& configPath, const YAML::Node& cmdOverrides) noexcept;
    Result<void> init() noexcept;

    void loadDefaults();

    // Load config from file
    Result<void> loadFile(const std::string& path);

    // Apply INKWELL_* environment overrides to every leaf already present
    void applyEnvOverrides();

    // Get YAML node by dotted path
    YAML::Node getNode(const std::string& path) const;

    // Set a leaf by dotted path, creating intermediate maps
    void setNode(const std::string& path, const YAML::Node& value);

    // Merge YAML nodes (source into target)
    static void mergeNodes(YAML::Node& target, const YAML::Node& source);

    YAML::Node _config;
    std::string _configPath;
    std::string _loadedPath;
    YAML::Node _cmdOverrides;
};

// Template implementations
template<typename T>
std::optional<T> Config::get(const std::string& path) const {
    YAML::Node node = getNode(path);
    if (!node || node.IsNull()) {
        return std::nullopt;
    }
    try {
        return node.as<T>();
    } catch (const YAML::Exception&) {
        return std::nullopt;
    }
}

template<typename T>
T Config::get(const std::string& path, const T& defaultValue) const {
    auto value = get<T>(path);
    return value.value_or(defaultValue);
}

} // namespace inkwell
