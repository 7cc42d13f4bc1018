#include <sdfvm/combine.h>
#include <glm/glm.hpp>
#include <algorithm>
#include <cmath>

namespace sdfvm {

float sigmoid(float x) {
    return 1.0f / (1.0f + std::exp(-x));
}

float combine(CombineOp op, float reg, float result, float parameter) {
    switch (op) {
        case CombineOp::None:
            return reg;
        case CombineOp::Replace:
            return result;
        case CombineOp::ReplaceIfInside:
            return result < 0.0f ? result : reg;
        case CombineOp::ReplaceIfOutside:
            return result > 0.0f ? result : reg;
        case CombineOp::And:
            return std::max(reg, result);
        case CombineOp::Or:
            return std::min(reg, result);
        case CombineOp::Xor:
            return reg + result - 2.0f * reg * result;
        case CombineOp::Subtract:
            return std::max(reg, -result);
        case CombineOp::Negate:
            return -result;
        case CombineOp::Lerp:
            return glm::mix(reg, result, parameter);
        case CombineOp::SmoothStep:
            // GLSL argument order: edges are (reg, result), x is the parameter
            return glm::smoothstep(reg, result, parameter);
        case CombineOp::Sigmoid:
            return glm::mix(reg, result, sigmoid(parameter));
    }
    return reg;
}

} // namespace sdfvm
