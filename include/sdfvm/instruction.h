#pragma once

#include <glm/glm.hpp>
#include <cstdint>
#include <string>
#include <variant>

namespace sdfvm {

static constexpr uint32_t REGISTER_COUNT = 64;
static constexpr uint32_t OPERAND_COUNT = 16;

// Any target >= REGISTER_COUNT discards the result; this is the canonical one.
static constexpr uint32_t DISCARD_REGISTER = 0xFFFFFFFF;

// Register inspected by every paint opcode.
static constexpr uint32_t SHAPE_REGISTER = 1;

//=============================================================================
// Wire enums
//=============================================================================
enum class Opcode : uint32_t {
    None = 0,
    DrawCircle = 1,
    DrawTriangle = 2,
    DrawRectangle = 3,
    DrawHalfPlane = 4,
    DrawQuadPlane = 5,
    DrawSdfTexture = 6,
    DrawChar = 7,
    Fill = 8,
    FillLinearGradient = 9,
    FillRadialGradient = 10,
    FillTexture = 11,
    SetTransform = 12,
    SetBlendMode = 13,
    Load = 14,
};

enum class CombineOp : uint32_t {
    None = 0,
    Replace = 1,
    ReplaceIfInside = 2,
    ReplaceIfOutside = 3,
    And = 4,
    Or = 5,
    Xor = 6,
    Subtract = 7,
    Negate = 8,
    Lerp = 9,
    SmoothStep = 10,
    Sigmoid = 11,
};

enum class BlendMode : uint32_t {
    Replace = 0,
    Add = 1,
    Multiply = 2,
    Subtract = 3,
    Divide = 4,
    Min = 5,
    Max = 6,
    AlphaComposite = 7,
};

static constexpr uint32_t OPCODE_COUNT = 15;
static constexpr uint32_t COMBINE_OP_COUNT = 12;
static constexpr uint32_t BLEND_MODE_COUNT = 8;

const char* opcodeName(uint32_t opcode);
const char* combineOpName(uint32_t combineOp);
const char* blendModeName(uint32_t mode);

//=============================================================================
// Instruction - one 96-byte record of the instruction buffer
//
// Enum fields are kept as raw u32 so that out-of-range values coming off the
// wire survive until the interpreter skips them.
//=============================================================================
struct alignas(16) Instruction {
    uint32_t opcode = 0;
    float strokeWidth = -1.0f;     // < 0: fill, >= 0: |d| - w/2
    float parameter = 0.0f;        // lerp factor / smoothstep edge / sigmoid input
    uint32_t smoothFunction = 0;   // reserved
    float operands[OPERAND_COUNT] = {};
    uint32_t combineOp = 0;
    float smoothParameter = 0.0f;  // reserved
    uint32_t targetRegister = DISCARD_REGISTER;
    uint32_t _pad = 0;

    float slot(uint32_t i) const { return operands[i]; }
    glm::vec2 slot2(uint32_t i) const { return {operands[i], operands[i + 1]}; }
    glm::vec4 slot4(uint32_t i) const {
        return {operands[i], operands[i + 1], operands[i + 2], operands[i + 3]};
    }
};

static_assert(sizeof(Instruction) == 96, "Instruction must be 96 bytes");
static_assert(alignof(Instruction) == 16, "Instruction must be 16-byte aligned");

// Operand slot holding an integer (layer, glyph id, register index).
// Negative or non-finite values map to an out-of-range index.
uint32_t slotIndex(float value);

//=============================================================================
// Typed operations, one operand struct per opcode
//=============================================================================
namespace op {

struct NoOp {};

struct Circle {
    glm::vec2 center{0.0f};
    float radius = 0.0f;
};

struct Triangle {
    glm::vec2 a{0.0f};
    glm::vec2 b{0.0f};
    glm::vec2 c{0.0f};
};

struct Rectangle {
    glm::vec2 leftTop{0.0f};
    glm::vec2 rightBottom{0.0f};
    // left-top, right-top, right-bottom, left-bottom
    glm::vec4 radii{0.0f};
};

struct HalfPlane {
    glm::vec2 p0{0.0f};
    glm::vec2 p1{0.0f};
};

struct QuadPlane {
    glm::vec2 start{0.0f};
    glm::vec2 control{0.0f};
    glm::vec2 end{0.0f};
};

struct SdfTexture {
    glm::vec2 leftTop{0.0f};
    glm::vec2 rightBottom{0.0f};
    uint32_t layer = 0;
};

struct Char {
    glm::vec2 position{0.0f};
    float size = 0.0f;
    uint32_t glyph = 0;
};

struct Fill {
    glm::vec4 color{0.0f};
};

struct LinearGradient {
    glm::vec4 start{0.0f};
    glm::vec4 end{0.0f};
    glm::vec2 from{0.0f};
    glm::vec2 to{0.0f};
};

struct RadialGradient {
    glm::vec4 inner{0.0f};
    glm::vec4 outer{0.0f};
    glm::vec2 center{0.0f};
    float radius = 0.0f;
};

struct FillTexture {
    glm::vec2 leftTop{0.0f};
    glm::vec2 rightBottom{0.0f};
    glm::vec2 uvLeftTop{0.0f};
    glm::vec2 uvRightBottom{1.0f};
    uint32_t layer = 0;
};

// x' = a*x + b*y + c, y' = d*x + e*y + f
struct SetTransform {
    float a = 1.0f, b = 0.0f, c = 0.0f;
    float d = 0.0f, e = 1.0f, f = 0.0f;
};

struct SetBlendMode {
    BlendMode mode = BlendMode::AlphaComposite;
};

struct Load {
    uint32_t index = 0;
};

struct UnknownOp {
    uint32_t opcode = 0;
};

} // namespace op

using Operation = std::variant<op::NoOp,
                               op::Circle,
                               op::Triangle,
                               op::Rectangle,
                               op::HalfPlane,
                               op::QuadPlane,
                               op::SdfTexture,
                               op::Char,
                               op::Fill,
                               op::LinearGradient,
                               op::RadialGradient,
                               op::FillTexture,
                               op::SetTransform,
                               op::SetBlendMode,
                               op::Load,
                               op::UnknownOp>;

// Fields of the record that do not depend on the opcode.
struct InstructionHeader {
    float strokeWidth = -1.0f;
    float parameter = 0.0f;
    CombineOp combine = CombineOp::None;
    uint32_t target = DISCARD_REGISTER;
    uint32_t smoothFunction = 0;
    float smoothParameter = 0.0f;
};

Operation decode(const Instruction& instruction);
Instruction encode(const Operation& operation, const InstructionHeader& header = {});

// One line, e.g. "DrawCircle center=(0, 0) radius=50 -> r1 Replace"
std::string disassemble(const Instruction& instruction);

} // namespace sdfvm
