#pragma once

#include "instruction.h"
#include <cstdint>

namespace sdfvm {

//=============================================================================
// Uniforms - per-frame read-only block, 32 bytes on the wire
//=============================================================================
struct Uniforms {
    float windowSize[2] = {0.0f, 0.0f};
    float pointer[2] = {0.0f, 0.0f};
    float time = 0.0f;
    float scaleFactor = 1.0f;
    uint32_t registerCount = REGISTER_COUNT;
    uint32_t instructionCount = 0;
};

static_assert(sizeof(Uniforms) == 32, "Uniforms must be 32 bytes");

} // namespace sdfvm
