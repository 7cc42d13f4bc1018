#pragma once

#include <sdfvm/base/object.h>
#include <sdfvm/base/factory.h>
#include <sdfvm/instruction.h>
#include <sdfvm/uniforms.h>
#include <sdfvm/result.hpp>
#include <glm/glm.hpp>
#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <vector>

namespace sdfvm {

//=============================================================================
// ProgramBuffer - host-side builder for the instruction buffer
//
// The interpreter trusts its input; this is where instructions get checked
// before they reach it: targets must be a register or DISCARD_REGISTER and
// transforms must be invertible.
//=============================================================================
class ProgramBuffer : public base::Object,
                      public base::ObjectFactory<ProgramBuffer> {
public:
    using Ptr = std::shared_ptr<ProgramBuffer>;

    static Result<Ptr> createImpl();

    ~ProgramBuffer() override = default;
    const char* typeName() const override { return "ProgramBuffer"; }

    // Smallest |det| accepted for a SetTransform.
    static constexpr float MIN_DETERMINANT = 1e-8f;

    // Returns the index of the appended instruction.
    Result<uint32_t> add(const Operation& operation, const InstructionHeader& header = {});

    // --- shapes ---
    Result<uint32_t> addCircle(glm::vec2 center, float radius, const InstructionHeader& header);
    Result<uint32_t> addTriangle(glm::vec2 a, glm::vec2 b, glm::vec2 c,
                                 const InstructionHeader& header);
    Result<uint32_t> addRectangle(glm::vec2 leftTop, glm::vec2 rightBottom, glm::vec4 radii,
                                  const InstructionHeader& header);
    Result<uint32_t> addHalfPlane(glm::vec2 p0, glm::vec2 p1, const InstructionHeader& header);
    Result<uint32_t> addQuadPlane(glm::vec2 start, glm::vec2 control, glm::vec2 end,
                                  const InstructionHeader& header);
    Result<uint32_t> addSdfTexture(glm::vec2 leftTop, glm::vec2 rightBottom, uint32_t layer,
                                   const InstructionHeader& header);
    Result<uint32_t> addChar(glm::vec2 position, float size, uint32_t glyphId,
                             const InstructionHeader& header);
    Result<uint32_t> addLoad(uint32_t sourceRegister, const InstructionHeader& header);

    // --- paint (evaluated for their colour, never write a register) ---
    Result<uint32_t> addFill(glm::vec4 color);
    Result<uint32_t> addLinearGradient(glm::vec4 start, glm::vec4 end, glm::vec2 from, glm::vec2 to);
    Result<uint32_t> addRadialGradient(glm::vec4 inner, glm::vec4 outer, glm::vec2 center,
                                       float radius);
    Result<uint32_t> addTextureFill(glm::vec2 leftTop, glm::vec2 rightBottom,
                                    glm::vec2 uvLeftTop, glm::vec2 uvRightBottom, uint32_t layer);

    // --- state ---
    Result<uint32_t> setTransform(const glm::mat3& localToScreen);
    Result<uint32_t> setBlendMode(BlendMode mode);

    uint32_t size() const { return static_cast<uint32_t>(_instructions.size()); }
    bool empty() const { return _instructions.empty(); }
    void clear() { _instructions.clear(); }

    const std::vector<Instruction>& instructions() const { return _instructions; }
    std::span<const Instruction> view() const { return _instructions; }

    // Uniform block matching this buffer.
    Uniforms uniforms(glm::vec2 windowSize, glm::vec2 pointer = glm::vec2(0.0f),
                      float time = 0.0f, float scaleFactor = 1.0f) const;

    // --- wire format: tightly packed 96-byte records ---
    std::vector<uint8_t> serialize() const;
    static Result<Ptr> deserialize(const uint8_t* data, size_t size);
    static Result<Ptr> deserialize(const std::vector<uint8_t>& bytes) {
        return deserialize(bytes.data(), bytes.size());
    }

    // Problems in a raw buffer that the interpreter would silently skip or
    // mis-render: unknown opcodes / combine ops / blend modes, bad targets,
    // degenerate transforms. Empty when the buffer is clean.
    static std::vector<std::string> validate(std::span<const Instruction> program);

private:
    ProgramBuffer() = default;

    Result<uint32_t> append(const Instruction& instruction);

    std::vector<Instruction> _instructions;
};

} // namespace sdfvm
