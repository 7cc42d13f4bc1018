#pragma once

#include <sdfvm/base/object.h>
#include <sdfvm/base/factory.h>
#include <sdfvm/result.hpp>
#include <glm/glm.hpp>
#include <cstdint>
#include <memory>
#include <string>

namespace sdfvm {

//=============================================================================
// TextureAtlas - generic RGBA8 atlas, fixed size, one image per layer
//
// Images smaller than the atlas land at the top-left corner, the remainder
// stays transparent. uv (0,0)-(1,1) spans the whole layer. Sampling is
// bilinear with clamp-to-edge; a missing layer reads transparent black.
//=============================================================================
class TextureAtlas : public base::Object,
                     public base::ObjectFactory<TextureAtlas> {
public:
    using Ptr = std::shared_ptr<TextureAtlas>;

    static constexpr uint32_t DEFAULT_SIZE = 2560;

    static Result<Ptr> createImpl(ContextType& ctx, uint32_t width = DEFAULT_SIZE,
                                  uint32_t height = DEFAULT_SIZE);

    ~TextureAtlas() override = default;
    const char* typeName() const override { return "TextureAtlas"; }

    virtual uint32_t width() const = 0;
    virtual uint32_t height() const = 0;
    virtual uint32_t layerCount() const = 0;

    // Returns the new layer index.
    virtual Result<uint32_t> addLayer(const uint8_t* rgba, uint32_t width, uint32_t height) = 0;
    virtual Result<uint32_t> addLayerFromFile(const std::string& path) = 0;

    virtual glm::vec4 sample(uint32_t layer, glm::vec2 uv) const = 0;
};

//=============================================================================
// GlyphAtlas - MSDF glyph pages laid out as a grid of equal cells
//
//   cellsPerRow  = pageSize / cellSize
//   cellsPerPage = cellsPerRow^2
//   glyphId      = page * cellsPerPage + cell
//   cell origin  = ((cell % cellsPerRow) * cellSize, (cell / cellsPerRow) * cellSize)
//=============================================================================
class GlyphAtlas : public base::Object,
                   public base::ObjectFactory<GlyphAtlas> {
public:
    using Ptr = std::shared_ptr<GlyphAtlas>;

    static constexpr uint32_t DEFAULT_PAGE_SIZE = 2048;
    static constexpr uint32_t DEFAULT_CELL_SIZE = 64;

    struct CellLocation {
        uint32_t page;
        uint32_t x;
        uint32_t y;
    };

    static Result<Ptr> createImpl(ContextType& ctx, uint32_t pageSize = DEFAULT_PAGE_SIZE,
                                  uint32_t cellSize = DEFAULT_CELL_SIZE);

    ~GlyphAtlas() override = default;
    const char* typeName() const override { return "GlyphAtlas"; }

    virtual uint32_t pageSize() const = 0;
    virtual uint32_t cellSize() const = 0;
    virtual uint32_t cellsPerRow() const = 0;
    virtual uint32_t cellsPerPage() const = 0;
    virtual uint32_t pageCount() const = 0;

    virtual CellLocation locate(uint32_t glyphId) const = 0;

    // Page images must be exactly pageSize x pageSize, RGBA8 (alpha unused).
    virtual Result<uint32_t> addPage(const uint8_t* rgba, uint32_t width, uint32_t height) = 0;
    virtual Result<uint32_t> addPageFromFile(const std::string& path) = 0;

    // Three distance channels at uv inside the glyph's cell; zero when the
    // page does not exist.
    virtual glm::vec3 sampleGlyph(uint32_t glyphId, glm::vec2 uv) const = 0;
};

} // namespace sdfvm
