#pragma once

#include <sdfvm/instruction.h>
#include <sdfvm/transform.h>
#include <sdfvm/uniforms.h>
#include <glm/glm.hpp>
#include <array>
#include <span>

namespace sdfvm {

class TextureAtlas;
class GlyphAtlas;

//=============================================================================
// ExecutionState - everything one pixel's program mutates
//=============================================================================
struct ExecutionState {
    glm::mat3 transform{1.0f};
    BlendMode blendMode = BlendMode::AlphaComposite;
    glm::vec4 color{0.0f};
    std::array<float, REGISTER_COUNT> registers{};
};

//=============================================================================
// FrameInputs - read-only for the duration of a frame
//=============================================================================
struct FrameInputs {
    std::span<const Instruction> program;
    Uniforms uniforms;
    const TextureAtlas* textures = nullptr;
    const GlyphAtlas* glyphs = nullptr;
    bool gamma = true;
};

struct ShapeSample {
    float distance = 0.0f;
    glm::vec2 gradient{0.0f};    // unit length, or zero
    float gradientLength = 0.0f; // before normalization
};

// Distance and normalized gradient of a shape opcode at a sample set.
// Non-shape operations return zero distance and zero gradient.
ShapeSample evaluateShape(const Operation& operation, const SampleSet& samples,
                          const FrameInputs& inputs);

// Execute one instruction against the state for the screen sample `pixel`.
void step(ExecutionState& state, const Instruction& instruction, glm::vec2 pixel,
          const FrameInputs& inputs);

// Run the program for one sample and return the linear (not gamma encoded)
// colour together with the final state.
ExecutionState run(glm::vec2 pixel, const FrameInputs& inputs);

// Output colour of one sample, gamma encoded unless inputs.gamma is false.
glm::vec4 evaluate(glm::vec2 pixel, const FrameInputs& inputs);

// Entries of the program that are executed: the declared instruction count,
// capped by what the buffer really holds.
size_t executedLength(const FrameInputs& inputs);

} // namespace sdfvm
