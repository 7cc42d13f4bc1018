#include <sdfvm/paint.h>
#include <sdfvm/atlas.h>
#include <cmath>

namespace sdfvm {

float antialias(float distance) {
    return glm::clamp(-distance / EDGE_WIDTH, 0.0f, 1.0f);
}

glm::vec4 linearGradient(glm::vec2 p, const op::LinearGradient& gradient) {
    glm::vec2 axis = gradient.to - gradient.from;
    float t = glm::dot(p - gradient.from, axis) / glm::dot(axis, axis);
    // two-sided ramp: samples behind `from` mirror the ones in front
    t = glm::clamp(std::abs(t), 0.0f, 1.0f);
    return glm::mix(gradient.start, gradient.end, t);
}

glm::vec4 radialGradient(glm::vec2 p, const op::RadialGradient& gradient) {
    float t = glm::clamp(glm::length(p - gradient.center) / gradient.radius, 0.0f, 1.0f);
    return glm::mix(gradient.inner, gradient.outer, t);
}

glm::vec4 textureFill(glm::vec2 p, const op::FillTexture& fill, const TextureAtlas* atlas) {
    if (!atlas) return glm::vec4(0.0f);
    glm::vec2 local = (p - fill.leftTop) / (fill.rightBottom - fill.leftTop);
    glm::vec2 uv = glm::mix(fill.uvLeftTop, fill.uvRightBottom, local);
    return atlas->sample(fill.layer, uv);
}

} // namespace sdfvm
