#include <sdfvm/program-buffer.h>
#include <sdfvm/transform.h>
#include <ytrace/ytrace.hpp>
#include <cmath>
#include <cstring>
#include <variant>

namespace sdfvm {

namespace {

bool validTarget(uint32_t target) {
    return target < REGISTER_COUNT || target == DISCARD_REGISTER;
}

float transformDeterminant(const op::SetTransform& t) {
    return determinant(makeTransform(t.a, t.b, t.c, t.d, t.e, t.f));
}

InstructionHeader paintHeader() {
    InstructionHeader header;
    header.target = DISCARD_REGISTER;
    header.combine = CombineOp::None;
    return header;
}

} // namespace

Result<ProgramBuffer::Ptr> ProgramBuffer::createImpl() {
    return Ok(Ptr(new ProgramBuffer()));
}

//=============================================================================
// add
//=============================================================================
Result<uint32_t> ProgramBuffer::add(const Operation& operation, const InstructionHeader& header) {
    if (!validTarget(header.target)) {
        return Err<uint32_t>("ProgramBuffer::add: target register " +
                             std::to_string(header.target) + " out of range");
    }
    if (static_cast<uint32_t>(header.combine) >= COMBINE_OP_COUNT) {
        return Err<uint32_t>("ProgramBuffer::add: unknown combine op " +
                             std::to_string(static_cast<uint32_t>(header.combine)));
    }
    if (auto* unknown = std::get_if<op::UnknownOp>(&operation)) {
        return Err<uint32_t>("ProgramBuffer::add: unknown opcode " +
                             std::to_string(unknown->opcode));
    }
    if (auto* transform = std::get_if<op::SetTransform>(&operation)) {
        float det = transformDeterminant(*transform);
        if (!(std::abs(det) >= MIN_DETERMINANT)) {
            return Err<uint32_t>("ProgramBuffer::add: degenerate transform, determinant " +
                                 std::to_string(det));
        }
    }
    if (auto* mode = std::get_if<op::SetBlendMode>(&operation)) {
        if (static_cast<uint32_t>(mode->mode) >= BLEND_MODE_COUNT) {
            return Err<uint32_t>("ProgramBuffer::add: unknown blend mode " +
                                 std::to_string(static_cast<uint32_t>(mode->mode)));
        }
    }
    if (auto* load = std::get_if<op::Load>(&operation)) {
        if (load->index >= REGISTER_COUNT) {
            return Err<uint32_t>("ProgramBuffer::add: load from register " +
                                 std::to_string(load->index) + " out of range");
        }
    }
    return append(encode(operation, header));
}

Result<uint32_t> ProgramBuffer::append(const Instruction& instruction) {
    _instructions.push_back(instruction);
    return Ok(static_cast<uint32_t>(_instructions.size() - 1));
}

Result<uint32_t> ProgramBuffer::addCircle(glm::vec2 center, float radius,
                                          const InstructionHeader& header) {
    return add(op::Circle{center, radius}, header);
}

Result<uint32_t> ProgramBuffer::addTriangle(glm::vec2 a, glm::vec2 b, glm::vec2 c,
                                            const InstructionHeader& header) {
    return add(op::Triangle{a, b, c}, header);
}

Result<uint32_t> ProgramBuffer::addRectangle(glm::vec2 leftTop, glm::vec2 rightBottom,
                                             glm::vec4 radii, const InstructionHeader& header) {
    return add(op::Rectangle{leftTop, rightBottom, radii}, header);
}

Result<uint32_t> ProgramBuffer::addHalfPlane(glm::vec2 p0, glm::vec2 p1,
                                             const InstructionHeader& header) {
    if (p0 == p1) {
        return Err<uint32_t>("ProgramBuffer::addHalfPlane: p0 and p1 coincide");
    }
    return add(op::HalfPlane{p0, p1}, header);
}

Result<uint32_t> ProgramBuffer::addQuadPlane(glm::vec2 start, glm::vec2 control, glm::vec2 end,
                                             const InstructionHeader& header) {
    return add(op::QuadPlane{start, control, end}, header);
}

Result<uint32_t> ProgramBuffer::addSdfTexture(glm::vec2 leftTop, glm::vec2 rightBottom,
                                              uint32_t layer, const InstructionHeader& header) {
    return add(op::SdfTexture{leftTop, rightBottom, layer}, header);
}

Result<uint32_t> ProgramBuffer::addChar(glm::vec2 position, float size, uint32_t glyphId,
                                        const InstructionHeader& header) {
    return add(op::Char{position, size, glyphId}, header);
}

Result<uint32_t> ProgramBuffer::addLoad(uint32_t sourceRegister, const InstructionHeader& header) {
    return add(op::Load{sourceRegister}, header);
}

Result<uint32_t> ProgramBuffer::addFill(glm::vec4 color) {
    return add(op::Fill{color}, paintHeader());
}

Result<uint32_t> ProgramBuffer::addLinearGradient(glm::vec4 start, glm::vec4 end,
                                                  glm::vec2 from, glm::vec2 to) {
    if (from == to) {
        return Err<uint32_t>("ProgramBuffer::addLinearGradient: from and to coincide");
    }
    return add(op::LinearGradient{start, end, from, to}, paintHeader());
}

Result<uint32_t> ProgramBuffer::addRadialGradient(glm::vec4 inner, glm::vec4 outer,
                                                  glm::vec2 center, float radius) {
    if (!(radius > 0.0f)) {
        return Err<uint32_t>("ProgramBuffer::addRadialGradient: radius must be positive");
    }
    return add(op::RadialGradient{inner, outer, center, radius}, paintHeader());
}

Result<uint32_t> ProgramBuffer::addTextureFill(glm::vec2 leftTop, glm::vec2 rightBottom,
                                               glm::vec2 uvLeftTop, glm::vec2 uvRightBottom,
                                               uint32_t layer) {
    return add(op::FillTexture{leftTop, rightBottom, uvLeftTop, uvRightBottom, layer},
               paintHeader());
}

Result<uint32_t> ProgramBuffer::setTransform(const glm::mat3& m) {
    if (m[0][2] != 0.0f || m[1][2] != 0.0f || m[2][2] != 1.0f) {
        return Err<uint32_t>("ProgramBuffer::setTransform: not an affine matrix");
    }
    return add(op::SetTransform{m[0][0], m[1][0], m[2][0], m[0][1], m[1][1], m[2][1]},
               paintHeader());
}

Result<uint32_t> ProgramBuffer::setBlendMode(BlendMode mode) {
    return add(op::SetBlendMode{mode}, paintHeader());
}

//=============================================================================
// uniforms
//=============================================================================
Uniforms ProgramBuffer::uniforms(glm::vec2 windowSize, glm::vec2 pointer, float time,
                                 float scaleFactor) const {
    Uniforms u;
    u.windowSize[0] = windowSize.x;
    u.windowSize[1] = windowSize.y;
    u.pointer[0] = pointer.x;
    u.pointer[1] = pointer.y;
    u.time = time;
    u.scaleFactor = scaleFactor;
    u.registerCount = REGISTER_COUNT;
    u.instructionCount = size();
    return u;
}

//=============================================================================
// Serialization
//=============================================================================
std::vector<uint8_t> ProgramBuffer::serialize() const {
    std::vector<uint8_t> out(_instructions.size() * sizeof(Instruction));
    if (!out.empty()) {
        std::memcpy(out.data(), _instructions.data(), out.size());
    }
    return out;
}

Result<ProgramBuffer::Ptr> ProgramBuffer::deserialize(const uint8_t* data, size_t size) {
    if (size % sizeof(Instruction) != 0) {
        return Err<Ptr>("ProgramBuffer::deserialize: " + std::to_string(size) +
                        " bytes is not a multiple of " + std::to_string(sizeof(Instruction)));
    }
    if (size > 0 && !data) {
        return Err<Ptr>("ProgramBuffer::deserialize: null data");
    }

    auto buffer = Ptr(new ProgramBuffer());
    buffer->_instructions.resize(size / sizeof(Instruction));
    if (size > 0) {
        std::memcpy(buffer->_instructions.data(), data, size);
    }

    auto warnings = validate(buffer->view());
    for (const auto& w : warnings) {
        ywarn("ProgramBuffer::deserialize: {}", w);
    }
    ydebug("ProgramBuffer::deserialize: {} instructions, {} warnings",
           buffer->size(), warnings.size());
    return Ok(std::move(buffer));
}

//=============================================================================
// validate
//=============================================================================
std::vector<std::string> ProgramBuffer::validate(std::span<const Instruction> program) {
    std::vector<std::string> warnings;
    for (size_t i = 0; i < program.size(); ++i) {
        const Instruction& ins = program[i];
        std::string where = "instruction " + std::to_string(i) + ": ";

        Operation operation = decode(ins);
        if (auto* unknown = std::get_if<op::UnknownOp>(&operation)) {
            warnings.push_back(where + "unknown opcode " + std::to_string(unknown->opcode));
            continue;
        }
        if (ins.targetRegister >= REGISTER_COUNT && ins.targetRegister != DISCARD_REGISTER) {
            warnings.push_back(where + "target register " + std::to_string(ins.targetRegister) +
                               " out of range, result discarded");
        }
        if (ins.targetRegister < REGISTER_COUNT && ins.combineOp >= COMBINE_OP_COUNT) {
            warnings.push_back(where + "unknown combine op " + std::to_string(ins.combineOp));
        }
        if (auto* transform = std::get_if<op::SetTransform>(&operation)) {
            float det = transformDeterminant(*transform);
            if (!(std::abs(det) >= MIN_DETERMINANT)) {
                warnings.push_back(where + "degenerate transform, determinant " +
                                   std::to_string(det));
            }
        }
        if (auto* mode = std::get_if<op::SetBlendMode>(&operation)) {
            if (static_cast<uint32_t>(mode->mode) >= BLEND_MODE_COUNT) {
                warnings.push_back(where + "unknown blend mode, compositing falls back to Replace");
            }
        }
        if (auto* load = std::get_if<op::Load>(&operation)) {
            if (load->index >= REGISTER_COUNT) {
                warnings.push_back(where + "load from register out of range, reads 0");
            }
        }
    }
    return warnings;
}

} // namespace sdfvm
