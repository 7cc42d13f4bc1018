#include <sdfvm/sdf-primitives.h>
#include <sdfvm/atlas.h>
#include <algorithm>
#include <cmath>

namespace sdfvm {
namespace sdf {

namespace {

float dot2(glm::vec2 v) { return glm::dot(v, v); }

float cross2(glm::vec2 a, glm::vec2 b) { return a.x * b.y - a.y * b.x; }

// Left of the direction is inside.
float orient(float distance, glm::vec2 direction, glm::vec2 toSample) {
    return cross2(direction, toSample) > 0.0f ? -distance : distance;
}

} // namespace

float circle(glm::vec2 p, glm::vec2 center, float radius) {
    return glm::length(p - center) - radius;
}

float segment(glm::vec2 p, glm::vec2 a, glm::vec2 b) {
    glm::vec2 pa = p - a;
    glm::vec2 ba = b - a;
    float len2 = glm::dot(ba, ba);
    float h = len2 > 0.0f ? glm::clamp(glm::dot(pa, ba) / len2, 0.0f, 1.0f) : 0.0f;
    return glm::length(pa - ba * h);
}

float triangle(glm::vec2 p, glm::vec2 a, glm::vec2 b, glm::vec2 c) {
    float dist = std::min({segment(p, a, b), segment(p, b, c), segment(p, c, a)});

    // Inside when all three edges agree on the side, whatever the winding.
    float winding = glm::sign(cross2(b - a, p - a)) +
                    glm::sign(cross2(c - b, p - b)) +
                    glm::sign(cross2(a - c, p - c));
    return std::abs(winding) > 2.5f ? -dist : dist;
}

float box(glm::vec2 p, glm::vec2 center, glm::vec2 halfSize) {
    glm::vec2 d = glm::abs(p - center) - halfSize;
    return glm::length(glm::max(d, glm::vec2(0.0f))) + std::min(std::max(d.x, d.y), 0.0f);
}

float roundedRectangle(glm::vec2 p, glm::vec2 leftTop, glm::vec2 rightBottom,
                       glm::vec4 radii) {
    glm::vec2 center = (leftTop + rightBottom) * 0.5f;
    glm::vec2 halfSize = glm::abs(rightBottom - leftTop) * 0.5f;
    glm::vec2 q = p - center;

    float r;
    if (q.x < 0.0f) {
        r = q.y < 0.0f ? radii.x : radii.w;
    } else {
        r = q.y < 0.0f ? radii.y : radii.z;
    }
    r = glm::clamp(r, 0.0f, std::min(halfSize.x, halfSize.y));

    glm::vec2 d = glm::abs(q) - halfSize + r;
    return glm::length(glm::max(d, glm::vec2(0.0f))) + std::min(std::max(d.x, d.y), 0.0f) - r;
}

float halfPlane(glm::vec2 p, glm::vec2 p0, glm::vec2 p1) {
    glm::vec2 dir = p1 - p0;
    return -cross2(dir, p - p0) / glm::length(dir);
}

float quadBezier(glm::vec2 p, glm::vec2 A, glm::vec2 B, glm::vec2 C) {
    glm::vec2 a = B - A;
    glm::vec2 b = A - 2.0f * B + C;
    glm::vec2 c = a * 2.0f;
    glm::vec2 d = A - p;

    float bb = glm::dot(b, b);
    if (bb < 1e-12f) {
        // Control point on the chord midpoint: the curve is the segment A-C.
        glm::vec2 ac = C - A;
        return orient(segment(p, A, C), ac, p - A);
    }

    float kk = 1.0f / bb;
    float kx = kk * glm::dot(a, b);
    float ky = kk * (2.0f * glm::dot(a, a) + glm::dot(d, b)) / 3.0f;
    float kz = kk * glm::dot(d, a);

    float pp = ky - kx * kx;
    float p3 = pp * pp * pp;
    float q = kx * (2.0f * kx * kx - 3.0f * ky) + kz;
    float h = q * q + 4.0f * p3;

    float t;
    float res;
    if (h >= 0.0f) {
        // one real root
        h = std::sqrt(h);
        glm::vec2 x = (glm::vec2(h, -h) - q) / 2.0f;
        glm::vec2 uv = glm::sign(x) * glm::pow(glm::abs(x), glm::vec2(1.0f / 3.0f));
        t = glm::clamp(uv.x + uv.y - kx, 0.0f, 1.0f);
        res = dot2(d + (c + b * t) * t);
    } else {
        // three real roots; the third is never the closest
        float z = std::sqrt(-pp);
        float v = std::acos(glm::clamp(q / (pp * z * 2.0f), -1.0f, 1.0f)) / 3.0f;
        float m = std::cos(v);
        float n = std::sin(v) * 1.732050808f;
        glm::vec2 ts = glm::clamp(glm::vec2(m + m, -n - m) * z - kx,
                                  glm::vec2(0.0f), glm::vec2(1.0f));
        float d0 = dot2(d + (c + b * ts.x) * ts.x);
        float d1 = dot2(d + (c + b * ts.y) * ts.y);
        if (d0 <= d1) {
            res = d0;
            t = ts.x;
        } else {
            res = d1;
            t = ts.y;
        }
    }

    glm::vec2 nearest = A + (c + b * t) * t;
    glm::vec2 tangent = c + 2.0f * b * t;
    return orient(std::sqrt(res), tangent, p - nearest);
}

float luminance(glm::vec3 rgb) {
    return 0.2126f * rgb.r + 0.7152f * rgb.g + 0.0722f * rgb.b;
}

float median(float r, float g, float b) {
    return std::max(std::min(r, g), std::min(std::max(r, g), b));
}

float sdfTexture(glm::vec2 p, glm::vec2 leftTop, glm::vec2 rightBottom,
                 uint32_t layer, const TextureAtlas* atlas, float scaleFactor) {
    glm::vec2 extent = rightBottom - leftTop;
    glm::vec2 uv = (p - leftTop) / extent;

    glm::vec4 texel = atlas ? atlas->sample(layer, uv) : glm::vec4(0.0f);
    float textureDistance = (0.5f - luminance(glm::vec3(texel))) *
                            TEXTURE_DISTANCE_RANGE * scaleFactor;
    float boxDistance = box(p, (leftTop + rightBottom) * 0.5f, glm::abs(extent) * 0.5f);
    return std::max(textureDistance, boxDistance);
}

float glyph(glm::vec2 p, glm::vec2 position, float size, uint32_t glyphId,
            const GlyphAtlas* atlas) {
    if (!atlas || size <= 0.0f) return 1.0f;

    glm::vec2 uv = (p - position) / size;
    if (uv.x < 0.0f || uv.y < 0.0f || uv.x > 1.0f || uv.y > 1.0f) return 1.0f;

    glm::vec3 msd = atlas->sampleGlyph(glyphId, uv);
    float coverage = glm::smoothstep(0.5f - GLYPH_SMOOTHING, 0.5f + GLYPH_SMOOTHING,
                                     median(msd.r, msd.g, msd.b));
    return 1.0f - 2.0f * coverage;
}

} // namespace sdf
} // namespace sdfvm
