#include <sdfvm/interpreter.h>
#include <sdfvm/combine.h>
#include <sdfvm/compositor.h>
#include <sdfvm/paint.h>
#include <sdfvm/sdf-primitives.h>
#include <algorithm>
#include <cmath>
#include <variant>

namespace sdfvm {

namespace {

template<typename... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};
template<typename... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

template<typename F>
ShapeSample sampleField(const SampleSet& samples, F&& field) {
    ShapeSample out;
    out.distance = field(samples.center);
    glm::vec2 gradient = centralDifference(samples, field, out.distance);
    out.gradientLength = glm::length(gradient);
    if (out.gradientLength != 0.0f) {
        out.gradient = gradient / out.gradientLength;
    }
    return out;
}

} // namespace

//=============================================================================
// evaluateShape
//=============================================================================
ShapeSample evaluateShape(const Operation& operation, const SampleSet& samples,
                          const FrameInputs& inputs) {
    return std::visit(Overloaded{
        [&](const op::Circle& o) {
            return sampleField(samples, [&](glm::vec2 p) {
                return sdf::circle(p, o.center, o.radius);
            });
        },
        [&](const op::Triangle& o) {
            return sampleField(samples, [&](glm::vec2 p) {
                return sdf::triangle(p, o.a, o.b, o.c);
            });
        },
        [&](const op::Rectangle& o) {
            return sampleField(samples, [&](glm::vec2 p) {
                return sdf::roundedRectangle(p, o.leftTop, o.rightBottom, o.radii);
            });
        },
        [&](const op::HalfPlane& o) {
            return sampleField(samples, [&](glm::vec2 p) {
                return sdf::halfPlane(p, o.p0, o.p1);
            });
        },
        [&](const op::QuadPlane& o) {
            return sampleField(samples, [&](glm::vec2 p) {
                return sdf::quadBezier(p, o.start, o.control, o.end);
            });
        },
        [&](const op::SdfTexture& o) {
            float scale = inputs.uniforms.scaleFactor;
            return sampleField(samples, [&](glm::vec2 p) {
                return sdf::sdfTexture(p, o.leftTop, o.rightBottom, o.layer,
                                       inputs.textures, scale);
            });
        },
        [&](const op::Char& o) {
            return sampleField(samples, [&](glm::vec2 p) {
                return sdf::glyph(p, o.position, o.size, o.glyph, inputs.glyphs);
            });
        },
        [](const auto&) { return ShapeSample{}; },
    }, operation);
}

//=============================================================================
// step
//=============================================================================
void step(ExecutionState& state, const Instruction& instruction, glm::vec2 pixel,
          const FrameInputs& inputs) {
    Operation operation = decode(instruction);
    if (std::holds_alternative<op::NoOp>(operation) ||
        std::holds_alternative<op::UnknownOp>(operation)) {
        return;
    }

    float result = 0.0f;
    float gradientLength = 0.0f;

    // Paint ops colour the pixel only while register 1 says "inside".
    auto paint = [&](auto&& colorAt) {
        float shape = state.registers[SHAPE_REGISTER];
        if (!paintsAt(shape)) return;
        glm::vec2 local = apply(invert(state.transform), pixel);
        glm::vec4 color = colorAt(local);
        color.a *= antialias(shape);
        state.color = blend(state.blendMode, color, state.color);
    };

    std::visit(Overloaded{
        [&](const op::SetTransform& o) {
            state.transform = makeTransform(o.a, o.b, o.c, o.d, o.e, o.f);
        },
        [&](const op::SetBlendMode& o) {
            state.blendMode = o.mode;
        },
        [&](const op::Load& o) {
            result = o.index < REGISTER_COUNT ? state.registers[o.index] : 0.0f;
        },
        [&](const op::Fill& o) {
            paint([&](glm::vec2) { return o.color; });
        },
        [&](const op::LinearGradient& o) {
            paint([&](glm::vec2 p) { return linearGradient(p, o); });
        },
        [&](const op::RadialGradient& o) {
            paint([&](glm::vec2 p) { return radialGradient(p, o); });
        },
        [&](const op::FillTexture& o) {
            paint([&](glm::vec2 p) { return textureFill(p, o, inputs.textures); });
        },
        [&](const auto&) {
            ShapeSample shape = evaluateShape(operation, localSamples(state.transform, pixel),
                                              inputs);
            result = shape.distance;
            gradientLength = shape.gradientLength;
        },
    }, operation);

    if (instruction.strokeWidth >= 0.0f) {
        result = std::abs(result) - instruction.strokeWidth * 0.5f;
    }

    // Lipschitz correction: local distance -> screen distance
    if (gradientLength != 0.0f) {
        result /= gradientLength;
    }

    uint32_t target = instruction.targetRegister;
    if (target >= REGISTER_COUNT) return;

    state.registers[target] = combine(static_cast<CombineOp>(instruction.combineOp),
                                      state.registers[target], result, instruction.parameter);
}

//=============================================================================
// run / evaluate
//=============================================================================
size_t executedLength(const FrameInputs& inputs) {
    return std::min<size_t>(inputs.uniforms.instructionCount, inputs.program.size());
}

ExecutionState run(glm::vec2 pixel, const FrameInputs& inputs) {
    ExecutionState state;
    size_t count = executedLength(inputs);
    for (size_t i = 0; i < count; ++i) {
        step(state, inputs.program[i], pixel, inputs);
    }
    return state;
}

glm::vec4 evaluate(glm::vec2 pixel, const FrameInputs& inputs) {
    glm::vec4 color = run(pixel, inputs).color;
    return inputs.gamma ? gammaEncode(color) : color;
}

} // namespace sdfvm
