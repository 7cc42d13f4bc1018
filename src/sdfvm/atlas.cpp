#include <sdfvm/atlas.h>
#include <ytrace/ytrace.hpp>

#define STB_IMAGE_IMPLEMENTATION
#include <stb_image.h>

#include <algorithm>
#include <cmath>
#include <cstring>
#include <vector>

namespace sdfvm {

namespace {

//=============================================================================
// Region of an RGBA8 image, sampled bilinearly with clamp-to-edge
//=============================================================================
struct Region {
    const uint8_t* pixels;
    uint32_t stride;  // row length of the whole image, in pixels
    uint32_t x0, y0;
    uint32_t width, height;

    glm::vec4 texel(int x, int y) const {
        x = std::clamp(x, 0, static_cast<int>(width) - 1);
        y = std::clamp(y, 0, static_cast<int>(height) - 1);
        size_t idx = (static_cast<size_t>(y0 + y) * stride + (x0 + x)) * 4;
        return glm::vec4(pixels[idx], pixels[idx + 1], pixels[idx + 2], pixels[idx + 3]) / 255.0f;
    }

    glm::vec4 sample(glm::vec2 uv) const {
        if (!std::isfinite(uv.x) || !std::isfinite(uv.y)) return glm::vec4(0.0f);

        // keep the integer conversion in range; clamp-to-edge makes this lossless
        float fx = std::clamp(uv.x * width - 0.5f, -1.0f, static_cast<float>(width));
        float fy = std::clamp(uv.y * height - 0.5f, -1.0f, static_cast<float>(height));
        float ix = std::floor(fx);
        float iy = std::floor(fy);
        float tx = fx - ix;
        float ty = fy - iy;
        int x = static_cast<int>(ix);
        int y = static_cast<int>(iy);

        glm::vec4 top = glm::mix(texel(x, y), texel(x + 1, y), tx);
        glm::vec4 bottom = glm::mix(texel(x, y + 1), texel(x + 1, y + 1), tx);
        return glm::mix(top, bottom, ty);
    }
};

struct LoadedImage {
    std::vector<uint8_t> pixels;
    uint32_t width = 0;
    uint32_t height = 0;
};

Result<LoadedImage> loadImageRgba(const std::string& path) {
    int width = 0, height = 0, channels = 0;
    uint8_t* data = stbi_load(path.c_str(), &width, &height, &channels, 4);
    if (!data) {
        const char* reason = stbi_failure_reason();
        return Err<LoadedImage>("stbi_load failed for " + path + ": " +
                                (reason ? reason : "unknown error"));
    }
    LoadedImage image;
    image.width = static_cast<uint32_t>(width);
    image.height = static_cast<uint32_t>(height);
    image.pixels.assign(data, data + static_cast<size_t>(width) * height * 4);
    stbi_image_free(data);
    return Ok(std::move(image));
}

} // namespace

//=============================================================================
// TextureAtlasImpl
//=============================================================================
class TextureAtlasImpl : public TextureAtlas {
public:
    TextureAtlasImpl(uint32_t width, uint32_t height) : _width(width), _height(height) {}

    Result<void> init() {
        if (_width == 0 || _height == 0) {
            return Err("TextureAtlas::init: atlas size must be non-zero");
        }
        ydebug("TextureAtlas::init: {}x{}", _width, _height);
        return Ok();
    }

    uint32_t width() const override { return _width; }
    uint32_t height() const override { return _height; }
    uint32_t layerCount() const override { return static_cast<uint32_t>(_layers.size()); }

    Result<uint32_t> addLayer(const uint8_t* rgba, uint32_t width, uint32_t height) override {
        if (!rgba) return Err<uint32_t>("TextureAtlas::addLayer: null pixel data");
        if (width > _width || height > _height) {
            return Err<uint32_t>("TextureAtlas::addLayer: image " + std::to_string(width) + "x" +
                                 std::to_string(height) + " exceeds atlas " +
                                 std::to_string(_width) + "x" + std::to_string(_height));
        }

        std::vector<uint8_t> layer(static_cast<size_t>(_width) * _height * 4, 0);
        for (uint32_t row = 0; row < height; ++row) {
            std::memcpy(layer.data() + static_cast<size_t>(row) * _width * 4,
                        rgba + static_cast<size_t>(row) * width * 4,
                        static_cast<size_t>(width) * 4);
        }
        _layers.push_back(std::move(layer));

        auto index = static_cast<uint32_t>(_layers.size() - 1);
        ydebug("TextureAtlas::addLayer: layer {} from {}x{} image", index, width, height);
        return Ok(index);
    }

    Result<uint32_t> addLayerFromFile(const std::string& path) override {
        auto image = loadImageRgba(path);
        if (!image) return Err<uint32_t>("TextureAtlas::addLayerFromFile", image);
        auto res = addLayer(image->pixels.data(), image->width, image->height);
        if (res) yinfo("TextureAtlas: loaded layer {} from {}", *res, path);
        return res;
    }

    glm::vec4 sample(uint32_t layer, glm::vec2 uv) const override {
        if (layer >= _layers.size()) return glm::vec4(0.0f);
        Region region{_layers[layer].data(), _width, 0, 0, _width, _height};
        return region.sample(uv);
    }

private:
    uint32_t _width;
    uint32_t _height;
    std::vector<std::vector<uint8_t>> _layers;
};

Result<TextureAtlas::Ptr> TextureAtlas::createImpl(ContextType&, uint32_t width, uint32_t height) {
    auto impl = std::make_shared<TextureAtlasImpl>(width, height);
    if (auto res = impl->init(); !res) {
        return Err<Ptr>("Failed to initialize TextureAtlas", res);
    }
    return Ok<Ptr>(impl);
}

//=============================================================================
// GlyphAtlasImpl
//=============================================================================
class GlyphAtlasImpl : public GlyphAtlas {
public:
    GlyphAtlasImpl(uint32_t pageSize, uint32_t cellSize)
        : _pageSize(pageSize), _cellSize(cellSize) {}

    Result<void> init() {
        if (_pageSize == 0 || _cellSize == 0) {
            return Err("GlyphAtlas::init: page and cell size must be non-zero");
        }
        if (_cellSize > _pageSize || _pageSize % _cellSize != 0) {
            return Err("GlyphAtlas::init: page size " + std::to_string(_pageSize) +
                       " is not a multiple of cell size " + std::to_string(_cellSize));
        }
        _cellsPerRow = _pageSize / _cellSize;
        ydebug("GlyphAtlas::init: page {} cell {} -> {} cells/page",
               _pageSize, _cellSize, cellsPerPage());
        return Ok();
    }

    uint32_t pageSize() const override { return _pageSize; }
    uint32_t cellSize() const override { return _cellSize; }
    uint32_t cellsPerRow() const override { return _cellsPerRow; }
    uint32_t cellsPerPage() const override { return _cellsPerRow * _cellsPerRow; }
    uint32_t pageCount() const override { return static_cast<uint32_t>(_pages.size()); }

    CellLocation locate(uint32_t glyphId) const override {
        uint32_t perPage = cellsPerPage();
        uint32_t cell = glyphId % perPage;
        return {glyphId / perPage,
                (cell % _cellsPerRow) * _cellSize,
                (cell / _cellsPerRow) * _cellSize};
    }

    Result<uint32_t> addPage(const uint8_t* rgba, uint32_t width, uint32_t height) override {
        if (!rgba) return Err<uint32_t>("GlyphAtlas::addPage: null pixel data");
        if (width != _pageSize || height != _pageSize) {
            return Err<uint32_t>("GlyphAtlas::addPage: page must be " + std::to_string(_pageSize) +
                                 "x" + std::to_string(_pageSize) + ", got " +
                                 std::to_string(width) + "x" + std::to_string(height));
        }
        _pages.emplace_back(rgba, rgba + static_cast<size_t>(width) * height * 4);
        return Ok(static_cast<uint32_t>(_pages.size() - 1));
    }

    Result<uint32_t> addPageFromFile(const std::string& path) override {
        auto image = loadImageRgba(path);
        if (!image) return Err<uint32_t>("GlyphAtlas::addPageFromFile", image);
        auto res = addPage(image->pixels.data(), image->width, image->height);
        if (res) yinfo("GlyphAtlas: loaded page {} from {}", *res, path);
        return res;
    }

    glm::vec3 sampleGlyph(uint32_t glyphId, glm::vec2 uv) const override {
        CellLocation loc = locate(glyphId);
        if (loc.page >= _pages.size()) return glm::vec3(0.0f);
        Region cell{_pages[loc.page].data(), _pageSize, loc.x, loc.y, _cellSize, _cellSize};
        return glm::vec3(cell.sample(uv));
    }

private:
    uint32_t _pageSize;
    uint32_t _cellSize;
    uint32_t _cellsPerRow = 0;
    std::vector<std::vector<uint8_t>> _pages;
};

Result<GlyphAtlas::Ptr> GlyphAtlas::createImpl(ContextType&, uint32_t pageSize, uint32_t cellSize) {
    auto impl = std::make_shared<GlyphAtlasImpl>(pageSize, cellSize);
    if (auto res = impl->init(); !res) {
        return Err<Ptr>("Failed to initialize GlyphAtlas", res);
    }
    return Ok<Ptr>(impl);
}

} // namespace sdfvm
