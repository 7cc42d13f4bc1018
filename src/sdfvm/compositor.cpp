#include <sdfvm/compositor.h>

namespace sdfvm {

namespace {

glm::vec4 alphaComposite(glm::vec4 src, glm::vec4 dst) {
    float dstWeight = dst.a * (1.0f - src.a);
    float alpha = src.a + dstWeight;
    if (alpha == 0.0f) return glm::vec4(0.0f);
    glm::vec3 rgb = (glm::vec3(src) * src.a + glm::vec3(dst) * dstWeight) / alpha;
    return glm::vec4(rgb, alpha);
}

} // namespace

glm::vec4 blend(BlendMode mode, glm::vec4 src, glm::vec4 dst) {
    switch (mode) {
        case BlendMode::Replace:
            return src;
        case BlendMode::Add:
            return src + dst;
        case BlendMode::Multiply:
            return src * dst;
        case BlendMode::Subtract:
            return dst - src;
        case BlendMode::Divide:
            return src / dst;
        case BlendMode::Min:
            return glm::min(src, dst);
        case BlendMode::Max:
            return glm::max(src, dst);
        case BlendMode::AlphaComposite:
            return alphaComposite(src, dst);
    }
    return src;
}

glm::vec4 gammaEncode(glm::vec4 color) {
    glm::vec3 rgb = glm::pow(glm::vec3(color), glm::vec3(GAMMA));
    return glm::vec4(rgb, color.a);
}

} // namespace sdfvm
