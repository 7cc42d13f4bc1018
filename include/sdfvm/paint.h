#pragma once

#include <sdfvm/instruction.h>
#include <glm/glm.hpp>

namespace sdfvm {

class TextureAtlas;

// Width of the analytic antialiasing ramp, in logical pixels: one pixel at
// scale factor 1, scaleFactor device pixels otherwise.
static constexpr float EDGE_WIDTH = 1.0f;

// clamp(-d / EDGE_WIDTH, 0, 1): 0 at or outside the edge, 1 one edge width in.
float antialias(float distance);

// Paint opcodes only produce a colour while the combined shape is inside.
inline bool paintsAt(float shapeDistance) { return shapeDistance < 0.0f; }

glm::vec4 linearGradient(glm::vec2 p, const op::LinearGradient& gradient);
glm::vec4 radialGradient(glm::vec2 p, const op::RadialGradient& gradient);
glm::vec4 textureFill(glm::vec2 p, const op::FillTexture& fill, const TextureAtlas* atlas);

} // namespace sdfvm
