#include <sdfvm/instruction.h>
#include <cmath>
#include <sstream>

namespace sdfvm {

namespace {

constexpr const char* OPCODE_NAMES[OPCODE_COUNT] = {
    "None",
    "DrawCircle",
    "DrawTriangle",
    "DrawRectangle",
    "DrawHalfPlane",
    "DrawQuadPlane",
    "DrawSdfTexture",
    "DrawChar",
    "Fill",
    "FillLinearGradient",
    "FillRadialGradient",
    "FillTexture",
    "SetTransform",
    "SetBlendMode",
    "Load",
};

constexpr const char* COMBINE_OP_NAMES[COMBINE_OP_COUNT] = {
    "None",
    "Replace",
    "ReplaceIfInside",
    "ReplaceIfOutside",
    "And",
    "Or",
    "Xor",
    "Subtract",
    "Negate",
    "Lerp",
    "SmoothStep",
    "Sigmoid",
};

constexpr const char* BLEND_MODE_NAMES[BLEND_MODE_COUNT] = {
    "Replace",
    "Add",
    "Multiply",
    "Subtract",
    "Divide",
    "Min",
    "Max",
    "AlphaComposite",
};

void put2(Instruction& ins, uint32_t i, glm::vec2 v) {
    ins.operands[i] = v.x;
    ins.operands[i + 1] = v.y;
}

void put4(Instruction& ins, uint32_t i, glm::vec4 v) {
    ins.operands[i] = v.x;
    ins.operands[i + 1] = v.y;
    ins.operands[i + 2] = v.z;
    ins.operands[i + 3] = v.w;
}

template<typename... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};
template<typename... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

std::ostream& operator<<(std::ostream& os, glm::vec2 v) {
    return os << "(" << v.x << ", " << v.y << ")";
}

std::ostream& operator<<(std::ostream& os, glm::vec4 v) {
    return os << "(" << v.x << ", " << v.y << ", " << v.z << ", " << v.w << ")";
}

} // namespace

const char* opcodeName(uint32_t opcode) {
    return opcode < OPCODE_COUNT ? OPCODE_NAMES[opcode] : "Unknown";
}

const char* combineOpName(uint32_t combineOp) {
    return combineOp < COMBINE_OP_COUNT ? COMBINE_OP_NAMES[combineOp] : "Unknown";
}

const char* blendModeName(uint32_t mode) {
    return mode < BLEND_MODE_COUNT ? BLEND_MODE_NAMES[mode] : "Unknown";
}

uint32_t slotIndex(float value) {
    if (!(value >= 0.0f) || !std::isfinite(value) || value >= 4294967040.0f) {
        return 0xFFFFFFFF;
    }
    return static_cast<uint32_t>(value);
}

//=============================================================================
// decode
//=============================================================================
Operation decode(const Instruction& ins) {
    switch (static_cast<Opcode>(ins.opcode)) {
        case Opcode::None:
            return op::NoOp{};
        case Opcode::DrawCircle:
            return op::Circle{ins.slot2(0), ins.slot(2)};
        case Opcode::DrawTriangle:
            return op::Triangle{ins.slot2(0), ins.slot2(2), ins.slot2(4)};
        case Opcode::DrawRectangle:
            return op::Rectangle{ins.slot2(0), ins.slot2(2), ins.slot4(4)};
        case Opcode::DrawHalfPlane:
            return op::HalfPlane{ins.slot2(0), ins.slot2(2)};
        case Opcode::DrawQuadPlane:
            return op::QuadPlane{ins.slot2(0), ins.slot2(2), ins.slot2(4)};
        case Opcode::DrawSdfTexture:
            return op::SdfTexture{ins.slot2(0), ins.slot2(2), slotIndex(ins.slot(4))};
        case Opcode::DrawChar:
            return op::Char{ins.slot2(0), ins.slot(2), slotIndex(ins.slot(3))};
        case Opcode::Fill:
            return op::Fill{ins.slot4(0)};
        case Opcode::FillLinearGradient:
            return op::LinearGradient{ins.slot4(0), ins.slot4(4), ins.slot2(8), ins.slot2(10)};
        case Opcode::FillRadialGradient:
            return op::RadialGradient{ins.slot4(0), ins.slot4(4), ins.slot2(8), ins.slot(10)};
        case Opcode::FillTexture:
            return op::FillTexture{ins.slot2(0), ins.slot2(2), ins.slot2(4), ins.slot2(6),
                                   slotIndex(ins.slot(8))};
        case Opcode::SetTransform:
            return op::SetTransform{ins.slot(0), ins.slot(1), ins.slot(2),
                                    ins.slot(3), ins.slot(4), ins.slot(5)};
        case Opcode::SetBlendMode:
            return op::SetBlendMode{static_cast<BlendMode>(slotIndex(ins.slot(0)))};
        case Opcode::Load:
            return op::Load{slotIndex(ins.slot(0))};
    }
    return op::UnknownOp{ins.opcode};
}

//=============================================================================
// encode
//=============================================================================
Instruction encode(const Operation& operation, const InstructionHeader& header) {
    Instruction ins;
    ins.strokeWidth = header.strokeWidth;
    ins.parameter = header.parameter;
    ins.smoothFunction = header.smoothFunction;
    ins.combineOp = static_cast<uint32_t>(header.combine);
    ins.smoothParameter = header.smoothParameter;
    ins.targetRegister = header.target;

    auto setOpcode = [&](Opcode opcode) { ins.opcode = static_cast<uint32_t>(opcode); };

    std::visit(Overloaded{
        [&](const op::NoOp&) { setOpcode(Opcode::None); },
        [&](const op::Circle& o) {
            setOpcode(Opcode::DrawCircle);
            put2(ins, 0, o.center);
            ins.operands[2] = o.radius;
        },
        [&](const op::Triangle& o) {
            setOpcode(Opcode::DrawTriangle);
            put2(ins, 0, o.a);
            put2(ins, 2, o.b);
            put2(ins, 4, o.c);
        },
        [&](const op::Rectangle& o) {
            setOpcode(Opcode::DrawRectangle);
            put2(ins, 0, o.leftTop);
            put2(ins, 2, o.rightBottom);
            put4(ins, 4, o.radii);
        },
        [&](const op::HalfPlane& o) {
            setOpcode(Opcode::DrawHalfPlane);
            put2(ins, 0, o.p0);
            put2(ins, 2, o.p1);
        },
        [&](const op::QuadPlane& o) {
            setOpcode(Opcode::DrawQuadPlane);
            put2(ins, 0, o.start);
            put2(ins, 2, o.control);
            put2(ins, 4, o.end);
        },
        [&](const op::SdfTexture& o) {
            setOpcode(Opcode::DrawSdfTexture);
            put2(ins, 0, o.leftTop);
            put2(ins, 2, o.rightBottom);
            ins.operands[4] = static_cast<float>(o.layer);
        },
        [&](const op::Char& o) {
            setOpcode(Opcode::DrawChar);
            put2(ins, 0, o.position);
            ins.operands[2] = o.size;
            ins.operands[3] = static_cast<float>(o.glyph);
        },
        [&](const op::Fill& o) {
            setOpcode(Opcode::Fill);
            put4(ins, 0, o.color);
        },
        [&](const op::LinearGradient& o) {
            setOpcode(Opcode::FillLinearGradient);
            put4(ins, 0, o.start);
            put4(ins, 4, o.end);
            put2(ins, 8, o.from);
            put2(ins, 10, o.to);
        },
        [&](const op::RadialGradient& o) {
            setOpcode(Opcode::FillRadialGradient);
            put4(ins, 0, o.inner);
            put4(ins, 4, o.outer);
            put2(ins, 8, o.center);
            ins.operands[10] = o.radius;
        },
        [&](const op::FillTexture& o) {
            setOpcode(Opcode::FillTexture);
            put2(ins, 0, o.leftTop);
            put2(ins, 2, o.rightBottom);
            put2(ins, 4, o.uvLeftTop);
            put2(ins, 6, o.uvRightBottom);
            ins.operands[8] = static_cast<float>(o.layer);
        },
        [&](const op::SetTransform& o) {
            setOpcode(Opcode::SetTransform);
            ins.operands[0] = o.a;
            ins.operands[1] = o.b;
            ins.operands[2] = o.c;
            ins.operands[3] = o.d;
            ins.operands[4] = o.e;
            ins.operands[5] = o.f;
        },
        [&](const op::SetBlendMode& o) {
            setOpcode(Opcode::SetBlendMode);
            ins.operands[0] = static_cast<float>(static_cast<uint32_t>(o.mode));
        },
        [&](const op::Load& o) {
            setOpcode(Opcode::Load);
            ins.operands[0] = static_cast<float>(o.index);
        },
        [&](const op::UnknownOp& o) { ins.opcode = o.opcode; },
    }, operation);

    return ins;
}

//=============================================================================
// disassemble
//=============================================================================
std::string disassemble(const Instruction& ins) {
    std::ostringstream ss;
    ss << opcodeName(ins.opcode);

    std::visit(Overloaded{
        [&](const op::NoOp&) {},
        [&](const op::Circle& o) { ss << " center=" << o.center << " radius=" << o.radius; },
        [&](const op::Triangle& o) { ss << " a=" << o.a << " b=" << o.b << " c=" << o.c; },
        [&](const op::Rectangle& o) {
            ss << " lt=" << o.leftTop << " rb=" << o.rightBottom << " radii=" << o.radii;
        },
        [&](const op::HalfPlane& o) { ss << " p0=" << o.p0 << " p1=" << o.p1; },
        [&](const op::QuadPlane& o) {
            ss << " start=" << o.start << " control=" << o.control << " end=" << o.end;
        },
        [&](const op::SdfTexture& o) {
            ss << " lt=" << o.leftTop << " rb=" << o.rightBottom << " layer=" << o.layer;
        },
        [&](const op::Char& o) {
            ss << " pos=" << o.position << " size=" << o.size << " glyph=" << o.glyph;
        },
        [&](const op::Fill& o) { ss << " color=" << o.color; },
        [&](const op::LinearGradient& o) {
            ss << " start=" << o.start << " end=" << o.end << " from=" << o.from << " to=" << o.to;
        },
        [&](const op::RadialGradient& o) {
            ss << " inner=" << o.inner << " outer=" << o.outer << " center=" << o.center
               << " radius=" << o.radius;
        },
        [&](const op::FillTexture& o) {
            ss << " lt=" << o.leftTop << " rb=" << o.rightBottom << " uv=" << o.uvLeftTop
               << "-" << o.uvRightBottom << " layer=" << o.layer;
        },
        [&](const op::SetTransform& o) {
            ss << " [" << o.a << " " << o.b << " " << o.c << "; " << o.d << " " << o.e << " "
               << o.f << "]";
        },
        [&](const op::SetBlendMode& o) {
            ss << " mode=" << blendModeName(static_cast<uint32_t>(o.mode));
        },
        [&](const op::Load& o) { ss << " r" << o.index; },
        [&](const op::UnknownOp& o) { ss << "(" << o.opcode << ")"; },
    }, decode(ins));

    if (ins.targetRegister < REGISTER_COUNT) {
        ss << " -> r" << ins.targetRegister << " " << combineOpName(ins.combineOp);
    }
    if (ins.strokeWidth >= 0.0f) {
        ss << " stroke=" << ins.strokeWidth;
    }
    if (ins.parameter != 0.0f) {
        ss << " param=" << ins.parameter;
    }
    return ss.str();
}

} // namespace sdfvm
