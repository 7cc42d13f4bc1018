#pragma once

#include <glm/glm.hpp>

namespace sdfvm {

// Smallest neighbour offset for the central-difference gradient, in screen
// units.
static constexpr float GRADIENT_EPSILON = 1e-4f;

// The offset also never drops below this fraction of the magnitudes at the
// sample, so that x +- offset stays resolvable in float far from the origin.
static constexpr float GRADIENT_RELATIVE_STEP = 1.0f / 4096.0f;

// Local -> screen affine transform from its 2x3 part:
//   x' = a*x + b*y + c
//   y' = d*x + e*y + f
glm::mat3 makeTransform(float a, float b, float c, float d, float e, float f);

float determinant(const glm::mat3& m);

// Closed-form adjugate / determinant. Does not check for a singular matrix.
glm::mat3 invert(const glm::mat3& m);

glm::vec2 apply(const glm::mat3& m, glm::vec2 p);

//=============================================================================
// SampleSet - a screen sample taken into shape-local space, with what the
// gradient estimate needs to map local differences back to screen units
//=============================================================================
struct SampleSet {
    glm::vec2 center;
    // Linear part of the inverse transform: local = localPerScreen * screen + t
    glm::mat2 localPerScreen{1.0f};
    // GRADIENT_EPSILON expressed in local units
    float minStep = GRADIENT_EPSILON;
};

SampleSet localSamples(const glm::mat3& transform, glm::vec2 screen);

// Neighbour offset, in local units, for a field whose value at the centre is
// centerValue.
float gradientStep(const SampleSet& samples, float centerValue);

// Central difference of f in screen units. The four neighbours are taken
// along the local axes and the differences divided by the offsets actually
// realised in float; the chain rule through localPerScreen brings the result
// back to screen space, which is exact for affine transforms.
template<typename F>
glm::vec2 centralDifference(const SampleSet& samples, F&& f, float centerValue) {
    float h = gradientStep(samples, centerValue);
    glm::vec2 xPlus = samples.center + glm::vec2(h, 0.0f);
    glm::vec2 xMinus = samples.center - glm::vec2(h, 0.0f);
    glm::vec2 yPlus = samples.center + glm::vec2(0.0f, h);
    glm::vec2 yMinus = samples.center - glm::vec2(0.0f, h);
    glm::vec2 local((f(xPlus) - f(xMinus)) / (xPlus.x - xMinus.x),
                    (f(yPlus) - f(yMinus)) / (yPlus.y - yMinus.y));
    return glm::transpose(samples.localPerScreen) * local;
}

template<typename F>
glm::vec2 centralDifference(const SampleSet& samples, F&& f) {
    float centerValue = f(samples.center);
    return centralDifference(samples, f, centerValue);
}

} // namespace sdfvm
