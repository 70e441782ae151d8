#include <fontdiff/config.h>
#include <ytrace/ytrace.hpp>

#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <vector>

#if defined(__APPLE__)
#include <mach-o/dyld.h>
#include <limits.h>
#endif

namespace fontdiff {

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

static YAML::Node findNode(const YAML::Node& node, const std::vector<std::string>& parts,
                           size_t i) {
    if (i == parts.size()) return node;
    if (!node.IsMap()) return YAML::Node(YAML::NodeType::Undefined);
    const YAML::Node child = node[parts[i]];
    if (!child) return YAML::Node(YAML::NodeType::Undefined);
    return findNode(child, parts, i + 1);
}

static void setPath(YAML::Node node, const std::vector<std::string>& parts, size_t i,
                    const std::string& value) {
    if (i + 1 == parts.size()) {
        node[parts[i]] = value;
        return;
    }
    if (!node[parts[i]].IsMap()) {
        node[parts[i]] = YAML::Node(YAML::NodeType::Map);
    }
    setPath(node[parts[i]], parts, i + 1, value);
}

// Merge source into target; maps merge key by key, anything else replaces
static void mergeNodes(YAML::Node target, const YAML::Node& source) {
    if (!source.IsMap()) return;
    for (auto it = source.begin(); it != source.end(); ++it) {
        std::string key = it->first.as<std::string>();
        const YAML::Node& value = it->second;
        if (value.IsMap() && target[key].IsMap()) {
            mergeNodes(target[key], value);
        } else {
            target[key] = YAML::Clone(value);
        }
    }
}

// Slash paths of every scalar below node
static void collectLeaves(const YAML::Node& node, const std::string& prefix,
                          std::vector<std::string>& out) {
    for (auto it = node.begin(); it != node.end(); ++it) {
        std::string key = it->first.as<std::string>();
        std::string path = prefix.empty() ? key : prefix + "/" + key;
        if (it->second.IsMap()) {
            collectLeaves(it->second, path, out);
        } else {
            out.push_back(path);
        }
    }
}

// ─── ConfigImpl ──────────────────────────────────────────────────────────────

class ConfigImpl : public Config {
public:
    ConfigImpl(const std::string& configPath, const YAML::Node& cmdOverrides) noexcept
        : _configPath(configPath), _cmdOverrides(cmdOverrides) {
        loadDefaults();
    }

    ~ConfigImpl() override = default;

    Result<void> init() noexcept {
        if (!_configPath.empty()) {
            if (auto res = loadFile(_configPath); !res) {
                return res;
            }
            _loadedFrom = _configPath;
        } else {
            auto xdgPath = getXDGConfigPath();
            std::error_code ec;
            if (std::filesystem::exists(xdgPath, ec)) {
                if (auto res = loadFile(xdgPath.string()); !res) {
                    ywarn("Failed to load config file {}: {}", xdgPath.string(), error_msg(res));
                } else {
                    _loadedFrom = xdgPath.string();
                }
            }
        }
        if (!_loadedFrom.empty()) {
            yinfo("Loaded config from: {}", _loadedFrom);
        }

        if (auto res = applyEnvOverrides(); !res) {
            return res;
        }

        if (_cmdOverrides && _cmdOverrides.IsMap()) {
            mergeNodes(_root, _cmdOverrides);
        }
        return Ok();
    }

    const YAML::Node& root() const override { return _root; }
    const std::string& loadedFrom() const override { return _loadedFrom; }

protected:
    YAML::Node getNode(const std::string& path) const override {
        auto parts = splitPath(path);
        if (parts.empty()) return _root;
        return findNode(_root, parts, 0);
    }

private:
    void loadDefaults() {
        _root = YAML::Node(YAML::NodeType::Map);
        _root["render"]["font-size"] = 40.0;
        _root["diff"]["tables"] = true;
        _root["diff"]["glyphs"] = true;
        _root["diff"]["words"] = true;
        _root["diff"]["succinct"] = true;
        _root["glyphs"]["threshold"] = 0.0;
        _root["words"]["threshold"] = 0.0;
        _root["wordlists"]["path"] = getDefaultWordListPath().string();
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
                    return Err<void>("Config file " + path + " is not a mapping");
                }
                mergeNodes(_root, fileConfig);
            }
            return Ok();
        } catch (const YAML::Exception& e) {
            return Err<void>("YAML parse error: " + std::string(e.what()));
        }
    }

    // Every leaf present after the file merge can be overridden from the
    // environment, whether it came from a default or from the file
    Result<void> applyEnvOverrides() {
        try {
            std::vector<std::string> paths;
            collectLeaves(_root, "", paths);

            for (const auto& path : paths) {
                std::string envVar = pathToEnvVar(path);
                const char* val = std::getenv(envVar.c_str());
                if (!val) continue;

                std::string s(val);
                if (isBoolean(path)) {
                    if (s == "1") s = "true";
                    else if (s == "0") s = "false";
                }

                setPath(_root, splitPath(path), 0, s);
                ydebug("Config override from env: {}={}", envVar, val);
            }
            return Ok();
        } catch (const YAML::Exception& e) {
            return Err<void>("Config environment override failed: " + std::string(e.what()));
        }
    }

    bool isBoolean(const std::string& path) const {
        YAML::Node node = getNode(path);
        if (!node.IsScalar()) return false;
        const std::string& current = node.Scalar();
        return current == "true" || current == "false";
    }

    YAML::Node _root;
    std::string _configPath;
    YAML::Node _cmdOverrides;
    std::string _loadedFrom;
};

// Factory
Result<Config::Ptr> Config::create(const std::string& configPath,
                                   const YAML::Node& cmdOverrides) noexcept {
    auto impl = std::make_shared<ConfigImpl>(configPath, cmdOverrides);
    if (auto res = impl->init(); !res) {
        return Err<Ptr>("Failed to initialize Config", res);
    }
    return Ok(Ptr(std::move(impl)));
}

bool Config::has(const std::string& path) const {
    YAML::Node node = getNode(path);
    return node && !node.IsNull();
}

std::string Config::pathToEnvVar(const std::string& path) {
    std::string envVar = ENV_PREFIX;
    for (char c : path) {
        if (c == '/' || c == '-') envVar += '_';
        else envVar += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return envVar;
}

// Static helpers
std::filesystem::path Config::getExecutableDir() {
#ifdef __linux__
    std::error_code ec;
    auto exe = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (!ec) {
        return exe.parent_path();
    }
#elif defined(__APPLE__)
    char path[PATH_MAX];
    uint32_t size = sizeof(path);
    if (_NSGetExecutablePath(path, &size) == 0) {
        char realPath[PATH_MAX];
        if (realpath(path, realPath)) {
            return std::filesystem::path(realPath).parent_path();
        }
    }
#endif
    return std::filesystem::current_path();
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

    return configDir / "fontdiff" / "config.yaml";
}

std::filesystem::path Config::getDefaultWordListPath() {
    return getExecutableDir().parent_path() / "share" / "fontdiff" / "wordlists";
}

} // namespace fontdiff
