#pragma once

#include <sdfvm/base/object.h>
#include <sdfvm/base/factory.h>
#include <sdfvm/result.hpp>
#include <yaml-cpp/yaml.h>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace sdfvm {

//=============================================================================
// Config - layered YAML configuration
//
// Layers, later wins:
//   1. built-in defaults
//   2. config file (explicit path, else $XDG_CONFIG_HOME/sdfvm/config.yaml)
//   3. environment: SDFVM_<PATH>, '/' and '-' become '_', upper-cased
//      (render/scale-factor -> SDFVM_RENDER_SCALE_FACTOR)
//   4. command line overrides, given as a YAML map
//
// Paths are slash separated: "render/width".
//=============================================================================
class Config : public base::Object,
               public base::ObjectFactory<Config> {
public:
    using Ptr = std::shared_ptr<Config>;

    static Result<Ptr> createImpl(ContextType& ctx, const std::string& configPath = "",
                                  const YAML::Node& cmdOverrides = YAML::Node());

    ~Config() override = default;
    const char* typeName() const override { return "Config"; }

    template<typename T>
    std::optional<T> get(const std::string& path) const;

    template<typename T>
    T get(const std::string& path, const T& defaultValue) const;

    // Sequence of strings; a scalar yields a one-element list.
    std::vector<std::string> getList(const std::string& path) const;

    virtual bool has(const std::string& path) const = 0;

    // Whole merged tree.
    virtual YAML::Node root() const = 0;

    // Path of the file that was loaded, empty when none.
    virtual const std::string& loadedPath() const = 0;

    static std::filesystem::path getXDGConfigPath();

    static constexpr const char* ENV_PREFIX = "SDFVM_";

    static constexpr const char* KEY_RENDER_WIDTH = "render/width";
    static constexpr const char* KEY_RENDER_HEIGHT = "render/height";
    static constexpr const char* KEY_RENDER_SCALE_FACTOR = "render/scale-factor";
    static constexpr const char* KEY_RENDER_THREADS = "render/threads";
    static constexpr const char* KEY_RENDER_TIME = "render/time";
    static constexpr const char* KEY_RENDER_GAMMA = "render/gamma";
    static constexpr const char* KEY_ATLAS_TEXTURE_SIZE = "atlas/texture-size";
    static constexpr const char* KEY_ATLAS_TEXTURES = "atlas/textures";
    static constexpr const char* KEY_ATLAS_GLYPH_SIZE = "atlas/glyph-size";
    static constexpr const char* KEY_ATLAS_GLYPH_CELL_SIZE = "atlas/glyph-cell-size";
    static constexpr const char* KEY_ATLAS_GLYPH_PAGES = "atlas/glyph-pages";
    static constexpr const char* KEY_LOG_LEVEL = "log/level";

protected:
    Config() = default;

    // Node at a slash path; undefined/null node when absent.
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
    return get<T>(path).value_or(defaultValue);
}

} // namespace sdfvm
