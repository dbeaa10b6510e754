#include <inkwell/config.h>
#include <ytrace/ytrace.hpp>

#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <vector>

namespace inkwell {

// Split a dotted path into components
static std::vector<std::string> splitPath(const std::string& path) {
    std::vector<std::string> parts;
    std::istringstream ss(path);
    std::string part;
    while (std::getline(ss, part, '.')) {
        if (!part.empty()) {
            parts.push_back(part);
        }
    }
    return parts;
}

// Dotted paths of every scalar leaf below node
static void collectLeaves(const YAML::Node& node, const std::string& prefix,
                          std::vector<std::pair<std::string, YAML::Node>>& out) {
    if (!node.IsMap()) {
        return;
    }
    for (auto it = node.begin(); it != node.end(); ++it) {
        std::string key = it->first.as<std::string>();
        std::string fullPath = prefix.empty() ? key : prefix + "." + key;
        if (it->second.IsMap()) {
            collectLeaves(it->second, fullPath, out);
        } else if (it->second.IsScalar()) {
            out.emplace_back(fullPath, it->second);
        }
    }
}

Config::Config(const std::string& configPath, const YAML::Node& cmdOverrides) noexcept
    : _config(YAML::NodeType::Map), _configPath(configPath), _cmdOverrides(cmdOverrides) {}

Result<void> Config::init() noexcept {
    try {
        loadDefaults();

        std::string effectivePath = _configPath;
        if (effectivePath.empty()) {
            auto xdgPath = getXDGConfigPath();
            std::error_code ec;
            if (std::filesystem::exists(xdgPath, ec)) {
                effectivePath = xdgPath.string();
            }
        }

        if (!effectivePath.empty()) {
            if (auto res = loadFile(effectivePath); !res) {
                // An explicit --config that fails to load is fatal, a broken XDG file is not
                if (!_configPath.empty()) {
                    return Err<void>("Config::init: cannot load " + effectivePath, res);
                }
                ywarn("Config::init: failed to load {}: {}", effectivePath, error_msg(res));
            } else {
                _loadedPath = effectivePath;
                yinfo("Config::init: loaded {}", effectivePath);
            }
        }

        applyEnvOverrides();

        if (_cmdOverrides && _cmdOverrides.IsMap()) {
            mergeNodes(_config, _cmdOverrides);
        }
    } catch (const YAML::Exception& e) {
        return Err<void>(std::string("Config::init: ") + e.what());
    }
    return Ok();
}

void Config::loadDefaults() {
    setNode(KEY_RPC_SOCKET, YAML::Node(std::string("")));
    setNode(KEY_ATTACH_ON_START, YAML::Node(true));
    setNode(KEY_MAX_FONT_SIZE, YAML::Node(50));
    setNode(KEY_FALLBACK_FONT, YAML::Node(std::string("Menlo")));
    setNode(KEY_ANIMATION_MS, YAML::Node(500));
    setNode(KEY_IMAGE_CACHE_SIZE, YAML::Node(100));
    setNode(KEY_LOG_LEVEL, YAML::Node(std::string("info")));
}

Result<void> Config::loadFile(const std::string& path) {
    try {
        std::ifstream file(path);
        if (!file.is_open()) {
            return Err<void>("Cannot open config file: " + path);
        }
        YAML::Node fileConfig = YAML::Load(file);
        if (!fileConfig || fileConfig.IsNull()) {
            return Ok();
        }
        if (!fileConfig.IsMap()) {
            return Err<void>("Config file must contain a mapping: " + path);
        }
        mergeNodes(_config, fileConfig);
        return Ok();
    } catch (const YAML::Exception& e) {
        return Err<void>("YAML parse error: " + std::string(e.what()));
    }
}

void Config::applyEnvOverrides() {
    std::vector<std::pair<std::string, YAML::Node>> leaves;
    collectLeaves(_config, "", leaves);

    for (const auto& [path, current] : leaves) {
        std::string envVar = pathToEnvVar(path);
        const char* val = std::getenv(envVar.c_str());
        if (!val) {
            continue;
        }
        std::string s(val);
        bool asBool = false;
        if (YAML::convert<bool>::decode(current, asBool)) {
            if (s == "1") s = "true";
            else if (s == "0") s = "false";
        }
        setNode(path, YAML::Node(s));
        ydebug("Config::applyEnvOverrides: {}={}", envVar, s);
    }
}

YAML::Node Config::getNode(const std::string& path) const {
    auto parts = splitPath(path);
    if (parts.empty()) {
        return YAML::Clone(_config);
    }

    // reset() rebinds without writing through to the tree
    YAML::Node current;
    current.reset(_config);
    for (const auto& part : parts) {
        if (!current.IsMap()) {
            return YAML::Node();
        }
        const YAML::Node& view = current;
        YAML::Node child = view[part];
        if (!child) {
            return YAML::Node();
        }
        current.reset(child);
    }
    return current;
}

void Config::setNode(const std::string& path, const YAML::Node& value) {
    auto parts = splitPath(path);
    if (parts.empty()) {
        return;
    }

    YAML::Node current;
    current.reset(_config);
    for (size_t i = 0; i + 1 < parts.size(); ++i) {
        YAML::Node next = current[parts[i]];
        if (!next.IsMap()) {
            next = YAML::Node(YAML::NodeType::Map);
        }
        current.reset(next);
    }
    current[parts.back()] = value;
}

void Config::mergeNodes(YAML::Node& target, const YAML::Node& source) {
    if (!source.IsMap()) {
        return;
    }
    for (auto it = source.begin(); it != source.end(); ++it) {
        std::string key = it->first.as<std::string>();
        YAML::Node child = target[key];
        if (it->second.IsMap() && child.IsMap()) {
            mergeNodes(child, it->second);
        } else {
            target[key] = YAML::Clone(it->second);
        }
    }
}

bool Config::has(const std::string& path) const {
    YAML::Node node = getNode(path);
    return node && !node.IsNull();
}

std::string Config::socketPath() const {
    return get<std::string>(KEY_RPC_SOCKET, "");
}

bool Config::attachOnStart() const {
    return get<bool>(KEY_ATTACH_ON_START, true);
}

int Config::maxFontSize() const {
    return get<int>(KEY_MAX_FONT_SIZE, 50);
}

std::string Config::fallbackFont() const {
    return get<std::string>(KEY_FALLBACK_FONT, "Menlo");
}

int Config::animationMs() const {
    return get<int>(KEY_ANIMATION_MS, 500);
}

int Config::imageCacheSize() const {
    return get<int>(KEY_IMAGE_CACHE_SIZE, 100);
}

std::string Config::logLevel() const {
    return get<std::string>(KEY_LOG_LEVEL, "info");
}

std::string Config::pathToEnvVar(const std::string& path) {
    std::string envVar = ENV_PREFIX;
    for (char c : path) {
        if (c == '.' || c == '-') envVar += '_';
        else envVar += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return envVar;
}

std::filesystem::path Config::getXDGConfigPath() {
    std::filesystem::path configDir;
    const char* xdgConfig = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfig && xdgConfig[0] != '\0') {
        configDir = xdgConfig;
    } else {
        const char* home = std::getenv("HOME");
        if (home) {
            configDir = std::filesystem::path(home) / ".config";
        } else {
            configDir = "/tmp";
        }
    }
    return configDir / "inkwell" / "config.yaml";
}

// Factory
Result<Config::Ptr> Config::createImpl(const std::string& configPath,
                                       const YAML::Node& cmdOverrides) noexcept {
    auto config = Ptr(new Config(configPath, cmdOverrides));
    if (auto res = config->init(); !res) {
        return Err<Ptr>("Failed to initialize Config", res);
    }
    return Ok(std::move(config));
}

Result<Config::Ptr> Config::createImpl(const std::string& configPath) noexcept {
    return createImpl(configPath, YAML::Node());
}

Result<Config::Ptr> Config::createImpl() noexcept {
    return createImpl(std::string(), YAML::Node());
}

} // namespace inkwell
