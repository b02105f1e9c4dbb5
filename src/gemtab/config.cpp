#include <gemtab/config.h>

#include <ytrace/ytrace.hpp>

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <vector>

namespace gemtab {

// ─── Helpers ─────────────────────────────────────────────────────────────────

// Split a slash-separated path into components
static std::vector<std::string> splitPath(const std::string& path) {
    std::vector<std::string> parts;
    std::istringstream ss(path);
    std::string part;
    while (std::getline(ss, part, '/')) {
        if (!part.empty()) {
            parts.push_back(part);
        }
    }
    return parts;
}

static YAML::Node findNode(const YAML::Node& node, const std::vector<std::string>& parts, size_t i) {
    if (i == parts.size()) return node;
    if (!node.IsMap()) return YAML::Node(YAML::NodeType::Undefined);
    const YAML::Node child = node[parts[i]];
    if (!child) return YAML::Node(YAML::NodeType::Undefined);
    return findNode(child, parts, i + 1);
}

static void setScalar(YAML::Node node, const std::vector<std::string>& parts, size_t i,
                      const std::string& value) {
    if (i + 1 == parts.size()) {
        node[parts[i]] = value;
        return;
    }
    setScalar(node[parts[i]], parts, i + 1, value);
}

// Merge source into target, maps recursively, everything else replaced
static void mergeNodes(YAML::Node target, const YAML::Node& source) {
    if (!source.IsMap()) return;
    for (auto it = source.begin(); it != source.end(); ++it) {
        const std::string key = it->first.as<std::string>();
        const YAML::Node& value = it->second;
        YAML::Node existing = target[key];
        if (value.IsMap() && existing.IsMap()) {
            mergeNodes(existing, value);
        } else {
            target[key] = YAML::Clone(value);
        }
    }
}

// Collect slash paths of all scalar leaves
static void collectLeaves(const YAML::Node& node, const std::string& prefix,
                          std::vector<std::string>& out) {
    for (auto it = node.begin(); it != node.end(); ++it) {
        const std::string key = it->first.as<std::string>();
        const std::string path = prefix.empty() ? key : prefix + "/" + key;
        if (it->second.IsMap()) {
            collectLeaves(it->second, path, out);
        } else {
            out.push_back(path);
        }
    }
}

static std::string pathToEnvVar(const std::string& path) {
    std::string envVar = Config::ENV_PREFIX;
    for (char c : path) {
        if (c == '/' || c == '-') envVar += '_';
        else envVar += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return envVar;
}

// ─── ConfigImpl ──────────────────────────────────────────────────────────────

class ConfigImpl : public Config {
public:
    ConfigImpl(const std::string& configPath, const YAML::Node& cmdOverrides) noexcept
        : _configPath(configPath), _cmdOverrides(cmdOverrides) {}

    ~ConfigImpl() override = default;

    Result<void> init() noexcept {
        loadDefaults();

        if (!_configPath.empty()) {
            if (auto res = loadFile(_configPath); !res) {
                return Err("Failed to load config file " + _configPath, res);
            }
            _loadedPath = _configPath;
        } else {
            auto xdgPath = getXDGConfigPath();
            std::error_code ec;
            if (std::filesystem::exists(xdgPath, ec)) {
                if (auto res = loadFile(xdgPath.string()); !res) {
                    ywarn("Failed to load config file {}: {}", xdgPath.string(), error_msg(res));
                } else {
                    _loadedPath = xdgPath.string();
                }
            }
        }
        if (!_loadedPath.empty()) {
            yinfo("Loaded config from: {}", _loadedPath);
        }

        applyEnvOverrides();

        if (_cmdOverrides && _cmdOverrides.IsMap()) {
            mergeNodes(_root, _cmdOverrides);
        }
        return Ok();
    }

    bool has(const std::string& path) const override {
        auto parts = splitPath(path);
        if (parts.empty()) return false;
        return findNode(_root, parts, 0).IsDefined();
    }

    const YAML::Node& root() const override { return _root; }

    const std::string& loadedPath() const override { return _loadedPath; }

protected:
    YAML::Node getNode(const std::string& path) const override {
        auto parts = splitPath(path);
        if (parts.empty()) return _root;
        return findNode(_root, parts, 0);
    }

private:
    void loadDefaults() {
        _root = YAML::Node(YAML::NodeType::Map);
        _root["scroll"]["page-percent"] = 75;
        _root["statusbar"]["link-label"] = "Link: ";
        _root["session"]["placeholder-url"] = "about:newtab";
        _root["cache"]["max-age-seconds"] = 1800;
        _root["log"]["level"] = "info";
        _root["log"]["file"] = "";
    }

    Result<void> loadFile(const std::string& path) {
        try {
            std::ifstream file(path);
            if (!file.is_open()) {
                return Err<void>("Cannot open config file: " + path);
            }
            YAML::Node fileConfig = YAML::Load(file);
            if (fileConfig && !fileConfig.IsNull()) {
                if (!fileConfig.IsMap()) {
                    return Err<void>("Config file is not a mapping: " + path);
                }
                mergeNodes(_root, fileConfig);
            }
            return Ok();
        } catch (const YAML::Exception& e) {
            return Err<void>("YAML parse error: " + std::string(e.what()));
        }
    }

    // Only keys that exist (defaults or file) can be overridden
    void applyEnvOverrides() {
        std::vector<std::string> leaves;
        collectLeaves(_root, "", leaves);
        for (const auto& path : leaves) {
            const std::string envVar = pathToEnvVar(path);
            const char* val = std::getenv(envVar.c_str());
            if (!val) continue;
            ydebug("Config: {} overridden by {}", path, envVar);
            setScalar(_root, splitPath(path), 0, val);
        }
    }

    YAML::Node _root;
    std::string _configPath;
    std::string _loadedPath;
    YAML::Node _cmdOverrides;
};

// ─── Config ──────────────────────────────────────────────────────────────────

Result<Config::Ptr> Config::create(const std::string& configPath,
                                   const YAML::Node& cmdOverrides) noexcept {
    auto impl = std::make_shared<ConfigImpl>(configPath, cmdOverrides);
    if (auto res = impl->init(); !res) {
        return Err<Ptr>("Failed to initialize config", res);
    }
    return Ok(Ptr(impl));
}

int Config::pagePercent() const {
    return std::clamp(get<int>(KEY_SCROLL_PAGE_PERCENT, 75), 1, 100);
}

std::string Config::linkLabel() const {
    return get<std::string>(KEY_STATUSBAR_LINK_LABEL, "Link: ");
}

std::string Config::placeholderUrl() const {
    return get<std::string>(KEY_SESSION_PLACEHOLDER_URL, "about:newtab");
}

std::chrono::seconds Config::cacheMaxAge() const {
    return std::chrono::seconds(get<int64_t>(KEY_CACHE_MAX_AGE, 1800));
}

std::string Config::logLevel() const {
    return get<std::string>(KEY_LOG_LEVEL, "info");
}

std::string Config::logFile() const {
    return get<std::string>(KEY_LOG_FILE, "");
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

    return configDir / "gemtab" / "config.yaml";
}

} // namespace gemtab
