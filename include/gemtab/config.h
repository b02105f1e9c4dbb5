#pragma once

#include <gemtab/result.hpp>
#include <yaml-cpp/yaml.h>

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace gemtab {

/**
 * Config - layered YAML configuration.
 *
 * Later layers win: built-in defaults, the config file, GEMTAB_* environment
 * variables, command line overrides. Keys are slash-separated paths
 * ("scroll/page-percent"); the matching environment variable upper-cases the
 * path and turns '/' and '-' into '_' (GEMTAB_SCROLL_PAGE_PERCENT).
 */
class Config {
public:
    using Ptr = std::shared_ptr<Config>;

    static Result<Ptr> create(const std::string& configPath = "",
                              const YAML::Node& cmdOverrides = YAML::Node()) noexcept;

    virtual ~Config() = default;

    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    // Returns nullopt if the key doesn't exist or doesn't convert to T
    template<typename T>
    std::optional<T> get(const std::string& path) const;

    template<typename T>
    T get(const std::string& path, const T& defaultValue) const;

    virtual bool has(const std::string& path) const = 0;

    // Effective configuration after all layers
    virtual const YAML::Node& root() const = 0;

    // Path of the file that was loaded, empty when running on defaults
    virtual const std::string& loadedPath() const = 0;

    // $XDG_CONFIG_HOME/gemtab/config.yaml, or ~/.config/gemtab/config.yaml
    static std::filesystem::path getXDGConfigPath();

    static constexpr const char* ENV_PREFIX = "GEMTAB_";

    static constexpr const char* KEY_SCROLL_PAGE_PERCENT = "scroll/page-percent";
    static constexpr const char* KEY_STATUSBAR_LINK_LABEL = "statusbar/link-label";
    static constexpr const char* KEY_SESSION_PLACEHOLDER_URL = "session/placeholder-url";
    static constexpr const char* KEY_CACHE_MAX_AGE = "cache/max-age-seconds";
    static constexpr const char* KEY_LOG_LEVEL = "log/level";
    static constexpr const char* KEY_LOG_FILE = "log/file";

    int pagePercent() const;
    std::string linkLabel() const;
    std::string placeholderUrl() const;
    std::chrono::seconds cacheMaxAge() const;
    std::string logLevel() const;
    std::string logFile() const;

protected:
    Config() = default;

    // Invalid node when the path doesn't exist
    virtual YAML::Node getNode(const std::string& path) const = 0;
};

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

} // namespace gemtab
