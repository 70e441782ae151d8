#pragma once

#include <fontdiff/result.hpp>
#include <yaml-cpp/yaml.h>

#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace fontdiff {

/**
 * Config - layered run configuration.
 *
 * Layers, later ones winning: built-in defaults, the YAML file (explicit
 * path, else $XDG_CONFIG_HOME/fontdiff/config.yaml), FONTDIFF_* environment
 * variables, command-line overrides. Keys are slash paths such as
 * "render/font-size"; the matching environment variable upper-cases the
 * path and turns '/' and '-' into '_' (FONTDIFF_RENDER_FONT_SIZE).
 */
class Config {
public:
    using Ptr = std::shared_ptr<Config>;

    // An explicit configPath must load; the XDG file is optional
    static Result<Ptr> create(const std::string& configPath = "",
                              const YAML::Node& cmdOverrides = YAML::Node()) noexcept;

    virtual ~Config() = default;

    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    // nullopt if the key is missing or does not convert to T
    template<typename T>
    std::optional<T> get(const std::string& path) const;

    template<typename T>
    T get(const std::string& path, const T& defaultValue) const;

    bool has(const std::string& path) const;

    // Whole merged tree
    virtual const YAML::Node& root() const = 0;

    // Path of the file that was loaded, empty if none
    virtual const std::string& loadedFrom() const = 0;

    static std::filesystem::path getExecutableDir();
    static std::filesystem::path getXDGConfigPath();
    static std::filesystem::path getDefaultWordListPath();

    // FONTDIFF_RENDER_FONT_SIZE for "render/font-size"
    static std::string pathToEnvVar(const std::string& path);

    static constexpr const char* ENV_PREFIX = "FONTDIFF_";

    static constexpr const char* KEY_FONT_SIZE = "render/font-size";
    static constexpr const char* KEY_DIFF_TABLES = "diff/tables";
    static constexpr const char* KEY_DIFF_GLYPHS = "diff/glyphs";
    static constexpr const char* KEY_DIFF_WORDS = "diff/words";
    static constexpr const char* KEY_SUCCINCT = "diff/succinct";
    static constexpr const char* KEY_GLYPH_THRESHOLD = "glyphs/threshold";
    static constexpr const char* KEY_WORD_THRESHOLD = "words/threshold";
    static constexpr const char* KEY_WORDLISTS_PATH = "wordlists/path";

protected:
    Config() = default;

    // Node at a slash path, undefined node when absent
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

} // namespace fontdiff
