#pragma once

#include <glm/glm.hpp>
#include <cstdint>

namespace sdfvm {

class TextureAtlas;
class GlyphAtlas;

namespace sdf {

//=============================================================================
// Primitive distance library
//
// Positive outside, negative inside, zero on the boundary. All functions are
// pure; the atlas-backed ones only read the atlas.
//=============================================================================

float circle(glm::vec2 p, glm::vec2 center, float radius);

// Unsigned, >= 0.
float segment(glm::vec2 p, glm::vec2 a, glm::vec2 b);

float triangle(glm::vec2 p, glm::vec2 a, glm::vec2 b, glm::vec2 c);

// Axis-aligned box around center with half extents.
float box(glm::vec2 p, glm::vec2 center, glm::vec2 halfSize);

// radii: left-top, right-top, right-bottom, left-bottom (y grows downwards).
// Each radius is clamped to [0, min(halfSize)].
float roundedRectangle(glm::vec2 p, glm::vec2 leftTop, glm::vec2 rightBottom,
                       glm::vec4 radii);

// Infinite line through p0 -> p1; the left side of the direction is negative.
float halfPlane(glm::vec2 p, glm::vec2 p0, glm::vec2 p1);

// Closed-form distance to the quadratic Bezier (a, b, c), signed like halfPlane
// against the tangent at the nearest point.
float quadBezier(glm::vec2 p, glm::vec2 a, glm::vec2 b, glm::vec2 c);

float luminance(glm::vec3 rgb);
float median(float r, float g, float b);

// Grayscale texture as distance: luminance above 0.5 is inside. Samples
// outside the mapped rectangle are outside.
float sdfTexture(glm::vec2 p, glm::vec2 leftTop, glm::vec2 rightBottom,
                 uint32_t layer, const TextureAtlas* atlas, float scaleFactor);

// MSDF glyph coverage mapped to [-1, 1]; 1 outside the glyph quad.
float glyph(glm::vec2 p, glm::vec2 position, float size, uint32_t glyphId,
            const GlyphAtlas* atlas);

// Scale of the texture luminance-to-distance mapping, in pixels at scale 1.
static constexpr float TEXTURE_DISTANCE_RANGE = 16.0f;

// Half width of the median threshold band around 0.5.
static constexpr float GLYPH_SMOOTHING = 0.1f;

} // namespace sdf
} // namespace sdfvm
