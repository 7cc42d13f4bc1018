#pragma once

#include <sdfvm/instruction.h>
#include <glm/glm.hpp>

namespace sdfvm {

static constexpr float GAMMA = 2.2f;

// Blend straight-alpha src into dst. Values outside the enum behave as Replace.
glm::vec4 blend(BlendMode mode, glm::vec4 src, glm::vec4 dst);

// rgb^2.2, alpha passes through. Negative channels come out NaN and are
// written as 0 by Image::toRgba8.
glm::vec4 gammaEncode(glm::vec4 color);

} // namespace sdfvm
