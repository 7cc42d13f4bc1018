#include <sdfvm/config.h>
#include <ytrace/ytrace.hpp>
#include <cctype>
#include <cstdlib>
#include <sstream>

namespace sdfvm {

// ─── Helpers ─────────────────────────────────────────────────────────────────

namespace {

std::vector<std::string> splitPath(const std::string& path) {
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

YAML::Node findNode(const YAML::Node& node, const std::vector<std::string>& parts, size_t index) {
    if (index == parts.size()) return node;
    if (!node.IsMap()) return YAML::Node(YAML::NodeType::Undefined);
    const YAML::Node child = node[parts[index]];
    if (!child) return YAML::Node(YAML::NodeType::Undefined);
    return findNode(child, parts, index + 1);
}

// Deep merge: maps merge key by key, anything else replaces.
void mergeNodes(YAML::Node target, const YAML::Node& source) {
    if (!source.IsMap()) return;
    for (auto it = source.begin(); it != source.end(); ++it) {
        std::string key = it->first.as<std::string>();
        const YAML::Node& value = it->second;
        YAML::Node existing = target[key];
        if (value.IsMap() && existing.IsMap()) {
            mergeNodes(existing, value);
        } else {
            target[key] = YAML::Clone(value);
        }
    }
}

std::string envVarName(const std::string& path) {
    std::string name = Config::ENV_PREFIX;
    for (char c : path) {
        if (c == '/' || c == '-') name += '_';
        else name += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return name;
}

// Colon separated, for list-valued keys set from the environment.
YAML::Node parseList(const std::string& value) {
    YAML::Node list(YAML::NodeType::Sequence);
    std::istringstream ss(value);
    std::string item;
    while (std::getline(ss, item, ':')) {
        if (!item.empty()) list.push_back(item);
    }
    return list;
}

} // namespace

// ─── ConfigImpl ──────────────────────────────────────────────────────────────

class ConfigImpl : public Config {
public:
    ConfigImpl(const std::string& configPath, const YAML::Node& cmdOverrides)
        : _configPath(configPath), _cmdOverrides(cmdOverrides) {
        loadDefaults();
    }

    Result<void> init() {
        yfunc();
        if (!_configPath.empty()) {
            if (auto res = loadFile(_configPath); !res) {
                return Err("Config::init: cannot load " + _configPath, res);
            }
        } else {
            auto xdgPath = getXDGConfigPath();
            if (std::filesystem::exists(xdgPath)) {
                if (auto res = loadFile(xdgPath.string()); !res) {
                    ywarn("Failed to load config file {}: {}", xdgPath.string(), error_msg(res));
                }
            }
        }
        if (!_loadedPath.empty()) {
            yinfo("Loaded config from: {}", _loadedPath);
        }

        applyEnvOverrides(_root, "");

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

    YAML::Node root() const override { return YAML::Clone(_root); }

    const std::string& loadedPath() const override { return _loadedPath; }

protected:
    YAML::Node getNode(const std::string& path) const override {
        return findNode(_root, splitPath(path), 0);
    }

private:
    void loadDefaults() {
        _root = YAML::Node(YAML::NodeType::Map);

        YAML::Node render;
        render["width"] = 512;
        render["height"] = 512;
        render["scale-factor"] = 1.0;
        render["threads"] = 0;
        render["time"] = 0.0;
        render["gamma"] = true;
        _root["render"] = render;

        YAML::Node atlas;
        atlas["texture-size"] = 2560;
        atlas["textures"] = YAML::Node(YAML::NodeType::Sequence);
        atlas["glyph-size"] = 2048;
        atlas["glyph-cell-size"] = 64;
        atlas["glyph-pages"] = YAML::Node(YAML::NodeType::Sequence);
        _root["atlas"] = atlas;

        YAML::Node log;
        log["level"] = "info";
        _root["log"] = log;
    }

    Result<void> loadFile(const std::string& path) {
        try {
            YAML::Node fileConfig = YAML::LoadFile(path);
            if (fileConfig && !fileConfig.IsNull()) {
                if (!fileConfig.IsMap()) {
                    return Err("Config::loadFile: top level of " + path + " must be a map");
                }
                mergeNodes(_root, fileConfig);
            }
            _loadedPath = path;
            return Ok();
        } catch (const YAML::Exception& e) {
            return Err("YAML parse error: " + std::string(e.what()));
        }
    }

    // Every known key can be overridden; unknown keys cannot be introduced.
    void applyEnvOverrides(YAML::Node node, const std::string& prefix) {
        std::vector<std::string> keys;
        for (auto it = node.begin(); it != node.end(); ++it) {
            keys.push_back(it->first.as<std::string>());
        }

        for (const auto& key : keys) {
            std::string fullPath = prefix.empty() ? key : prefix + "/" + key;
            YAML::Node child = node[key];

            if (child.IsMap()) {
                applyEnvOverrides(child, fullPath);
                continue;
            }

            std::string envVar = envVarName(fullPath);
            const char* val = std::getenv(envVar.c_str());
            if (!val) continue;

            if (child.IsSequence()) {
                node[key] = parseList(val);
            } else {
                node[key] = std::string(val);
            }
            ydebug("Config override from env: {}={}", envVar, val);
        }
    }

    YAML::Node _root;
    std::string _configPath;
    std::string _loadedPath;
    YAML::Node _cmdOverrides;
};

// ─── Config ──────────────────────────────────────────────────────────────────

Result<Config::Ptr> Config::createImpl(ContextType&, const std::string& configPath,
                                       const YAML::Node& cmdOverrides) {
    auto impl = std::make_shared<ConfigImpl>(configPath, cmdOverrides);
    if (auto res = impl->init(); !res) {
        return Err<Ptr>("Failed to initialize Config", res);
    }
    return Ok<Ptr>(impl);
}

std::vector<std::string> Config::getList(const std::string& path) const {
    YAML::Node node = getNode(path);
    std::vector<std::string> result;
    if (!node || node.IsNull()) return result;
    if (node.IsScalar()) {
        result.push_back(node.as<std::string>());
        return result;
    }
    if (node.IsSequence()) {
        for (const auto& item : node) {
            if (item.IsScalar()) result.push_back(item.as<std::string>());
        }
    }
    return result;
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
    return configDir / "sdfvm" / "config.yaml";
}

} // namespace sdfvm
