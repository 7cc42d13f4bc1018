#include <sdfvm/transform.h>
#include <algorithm>
#include <cmath>

namespace sdfvm {

glm::mat3 makeTransform(float a, float b, float c, float d, float e, float f) {
    // glm is column-major: m[column][row]
    glm::mat3 m(1.0f);
    m[0][0] = a;
    m[1][0] = b;
    m[2][0] = c;
    m[0][1] = d;
    m[1][1] = e;
    m[2][1] = f;
    return m;
}

float determinant(const glm::mat3& m) {
    return m[0][0] * (m[1][1] * m[2][2] - m[2][1] * m[1][2]) -
           m[1][0] * (m[0][1] * m[2][2] - m[2][1] * m[0][2]) +
           m[2][0] * (m[0][1] * m[1][2] - m[1][1] * m[0][2]);
}

glm::mat3 invert(const glm::mat3& m) {
    float invDet = 1.0f / determinant(m);

    glm::mat3 r;
    r[0][0] = (m[1][1] * m[2][2] - m[2][1] * m[1][2]) * invDet;
    r[1][0] = (m[2][0] * m[1][2] - m[1][0] * m[2][2]) * invDet;
    r[2][0] = (m[1][0] * m[2][1] - m[2][0] * m[1][1]) * invDet;
    r[0][1] = (m[2][1] * m[0][2] - m[0][1] * m[2][2]) * invDet;
    r[1][1] = (m[0][0] * m[2][2] - m[2][0] * m[0][2]) * invDet;
    r[2][1] = (m[2][0] * m[0][1] - m[0][0] * m[2][1]) * invDet;
    r[0][2] = (m[0][1] * m[1][2] - m[1][1] * m[0][2]) * invDet;
    r[1][2] = (m[1][0] * m[0][2] - m[0][0] * m[1][2]) * invDet;
    r[2][2] = (m[0][0] * m[1][1] - m[1][0] * m[0][1]) * invDet;
    return r;
}

glm::vec2 apply(const glm::mat3& m, glm::vec2 p) {
    glm::vec3 r = m * glm::vec3(p, 1.0f);
    return glm::vec2(r);
}

SampleSet localSamples(const glm::mat3& transform, glm::vec2 screen) {
    glm::mat3 inverse = invert(transform);
    SampleSet samples;
    samples.center = apply(inverse, screen);
    samples.localPerScreen = glm::mat2(inverse);
    samples.minStep = GRADIENT_EPSILON *
                      std::sqrt(std::abs(glm::determinant(samples.localPerScreen)));
    return samples;
}

float gradientStep(const SampleSet& samples, float centerValue) {
    float magnitude = std::max({std::abs(samples.center.x), std::abs(samples.center.y),
                                std::abs(centerValue)});
    return std::max(samples.minStep, magnitude * GRADIENT_RELATIVE_STEP);
}

} // namespace sdfvm
