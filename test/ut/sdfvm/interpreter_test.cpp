//=============================================================================
// Interpreter tests
//
// End-to-end programs evaluated for single samples: register combining,
// transforms, strokes and the paint gate on register 1.
//=============================================================================

#include <boost/ut.hpp>
#include <sdfvm/interpreter.h>
#include <sdfvm/program-buffer.h>

#include <cmath>
#include <cstring>
#include <vector>

using namespace boost::ut;
using namespace sdfvm;

namespace {

const glm::vec4 RED(1.0f, 0.0f, 0.0f, 1.0f);
const glm::vec4 BLUE(0.0f, 0.0f, 1.0f, 1.0f);
const glm::vec4 CLEAR(0.0f);

bool near(glm::vec4 a, glm::vec4 b, float eps = 1e-3f) {
    return std::abs(a.r - b.r) < eps && std::abs(a.g - b.g) < eps &&
           std::abs(a.b - b.b) < eps && std::abs(a.a - b.a) < eps;
}

InstructionHeader toRegister(uint32_t reg, CombineOp op = CombineOp::Replace,
                             float strokeWidth = -1.0f) {
    InstructionHeader header;
    header.target = reg;
    header.combine = op;
    header.strokeWidth = strokeWidth;
    return header;
}

ProgramBuffer::Ptr makeBuffer() {
    auto res = ProgramBuffer::create();
    return res ? *res : nullptr;
}

FrameInputs inputsFor(const ProgramBuffer& buffer) {
    FrameInputs inputs;
    inputs.program = buffer.view();
    inputs.uniforms = buffer.uniforms({200.0f, 200.0f});
    return inputs;
}

FrameInputs inputsFor(const std::vector<Instruction>& program) {
    FrameInputs inputs;
    inputs.program = program;
    inputs.uniforms.instructionCount = static_cast<uint32_t>(program.size());
    return inputs;
}

} // namespace

suite interpreter_scenario_tests = [] {
    "filled circle"_test = [] {
        auto buffer = makeBuffer();
        expect((buffer != nullptr) >> fatal);
        expect(buffer->addCircle({0.0f, 0.0f}, 50.0f, toRegister(1)).has_value());
        expect(buffer->addFill(RED).has_value());
        auto inputs = inputsFor(*buffer);

        expect(near(evaluate({0.0f, 0.0f}, inputs), RED));
        expect(near(evaluate({30.0f, 0.0f}, inputs), RED));
        expect(near(evaluate({100.0f, 0.0f}, inputs), CLEAR));
    };

    "intersection of two circles"_test = [] {
        auto buffer = makeBuffer();
        expect((buffer != nullptr) >> fatal);
        expect(buffer->addCircle({0.0f, 0.0f}, 50.0f, toRegister(1)).has_value());
        expect(buffer->addCircle({60.0f, 0.0f}, 50.0f, toRegister(1, CombineOp::And)).has_value());
        expect(buffer->addFill(RED).has_value());
        auto inputs = inputsFor(*buffer);

        expect(near(evaluate({30.0f, 0.0f}, inputs), RED));
        expect(near(evaluate({-30.0f, 0.0f}, inputs), CLEAR));
        expect(near(evaluate({90.0f, 0.0f}, inputs), CLEAR));
    };

    "union of two circles"_test = [] {
        auto buffer = makeBuffer();
        expect((buffer != nullptr) >> fatal);
        expect(buffer->addCircle({0.0f, 0.0f}, 20.0f, toRegister(1)).has_value());
        expect(buffer->addCircle({100.0f, 0.0f}, 20.0f, toRegister(1, CombineOp::Or)).has_value());
        expect(buffer->addFill(RED).has_value());
        auto inputs = inputsFor(*buffer);

        expect(near(evaluate({5.0f, 0.0f}, inputs), RED));
        expect(near(evaluate({95.0f, 0.0f}, inputs), RED));
        expect(near(evaluate({50.0f, 0.0f}, inputs), CLEAR));
    };

    "scaled rectangle"_test = [] {
        auto buffer = makeBuffer();
        expect((buffer != nullptr) >> fatal);
        expect(buffer->setTransform(makeTransform(2.0f, 0.0f, 0.0f, 0.0f, 2.0f, 0.0f))
                   .has_value());
        expect(buffer->addRectangle({-10.0f, -10.0f}, {10.0f, 10.0f}, glm::vec4(0.0f),
                                    toRegister(1)).has_value());
        expect(buffer->addFill(RED).has_value());
        auto inputs = inputsFor(*buffer);

        // local half extent 10 is 20 on screen
        expect(near(evaluate({18.0f, 0.0f}, inputs), RED));
        expect(near(evaluate({0.0f, -18.0f}, inputs), RED));
        expect(near(evaluate({22.0f, 0.0f}, inputs), CLEAR));
    };

    "distance is measured in screen pixels under a transform"_test = [] {
        auto buffer = makeBuffer();
        expect((buffer != nullptr) >> fatal);
        expect(buffer->setTransform(makeTransform(2.0f, 0.0f, 0.0f, 0.0f, 2.0f, 0.0f))
                   .has_value());
        expect(buffer->addRectangle({-10.0f, -10.0f}, {10.0f, 10.0f}, glm::vec4(0.0f),
                                    toRegister(1)).has_value());
        auto inputs = inputsFor(*buffer);

        // half a screen pixel inside the edge at x = 20
        ExecutionState state = run({19.5f, 0.0f}, inputs);
        expect(std::abs(state.registers[1] + 0.5f) < 0.02f) << "r1=" << state.registers[1];
    };

    "distance is measured in screen pixels under a non-uniform scale"_test = [] {
        auto buffer = makeBuffer();
        expect((buffer != nullptr) >> fatal);
        expect(buffer->setTransform(makeTransform(3.0f, 0.0f, 0.0f, 0.0f, 1.0f, 0.0f))
                   .has_value());
        expect(buffer->addRectangle({-10.0f, -10.0f}, {10.0f, 10.0f}, glm::vec4(0.0f),
                                    toRegister(1)).has_value());
        auto inputs = inputsFor(*buffer);

        // screen edges at x = 30 and y = 10
        float nearX = run({29.5f, 0.5f}, inputs).registers[1];
        float nearY = run({0.5f, 9.5f}, inputs).registers[1];
        expect(std::abs(nearX + 0.5f) < 0.02f) << "r1=" << nearX;
        expect(std::abs(nearY + 0.5f) < 0.02f) << "r1=" << nearY;
    };

    "distance stays exact at large screen coordinates"_test = [] {
        for (float x : {1450.0f, 2450.0f}) {
            auto buffer = makeBuffer();
            expect((buffer != nullptr) >> fatal);
            expect(buffer->addCircle({x, 0.0f}, 100.0f, toRegister(1)).has_value());
            FrameInputs inputs = inputsFor(*buffer);
            inputs.uniforms = buffer->uniforms({4096.0f, 4096.0f});

            glm::vec2 pixel(x + 50.5f, 0.5f);
            float exact = glm::length(pixel - glm::vec2(x, 0.0f)) - 100.0f;
            float r1 = run(pixel, inputs).registers[1];
            expect(std::abs(r1 - exact) < 1e-2f) << "x=" << pixel.x << " r1=" << r1
                                                 << " exact=" << exact;
        }
    };

    "stroked circle"_test = [] {
        auto buffer = makeBuffer();
        expect((buffer != nullptr) >> fatal);
        expect(buffer->addCircle({0.0f, 0.0f}, 50.0f, toRegister(1, CombineOp::Replace, 4.0f))
                   .has_value());
        expect(buffer->addFill(RED).has_value());
        auto inputs = inputsFor(*buffer);

        expect(near(evaluate({50.0f, 0.0f}, inputs), RED));
        expect(near(evaluate({0.0f, -50.0f}, inputs), RED));
        expect(near(evaluate({45.0f, 0.0f}, inputs), CLEAR));
        expect(near(evaluate({55.0f, 0.0f}, inputs), CLEAR));
        expect(near(evaluate({0.0f, 0.0f}, inputs), CLEAR));
    };

    "edge pixels are partially covered"_test = [] {
        auto buffer = makeBuffer();
        expect((buffer != nullptr) >> fatal);
        expect(buffer->addCircle({0.0f, 0.0f}, 50.0f, toRegister(1)).has_value());
        expect(buffer->addFill(RED).has_value());
        auto inputs = inputsFor(*buffer);
        inputs.gamma = false;

        glm::vec4 edge = evaluate({49.5f, 0.0f}, inputs);
        expect(std::abs(edge.a - 0.5f) < 0.05f) << "alpha=" << edge.a;
    };

    "gradient fill across a shape"_test = [] {
        auto buffer = makeBuffer();
        expect((buffer != nullptr) >> fatal);
        expect(buffer->addRectangle({0.0f, 0.0f}, {100.0f, 10.0f}, glm::vec4(0.0f), toRegister(1))
                   .has_value());
        expect(buffer->addLinearGradient(glm::vec4(0.0f, 0.0f, 0.0f, 1.0f), glm::vec4(1.0f),
                                         {0.0f, 0.0f}, {100.0f, 0.0f}).has_value());
        auto inputs = inputsFor(*buffer);
        inputs.gamma = false;

        glm::vec4 middle = evaluate({50.0f, 5.0f}, inputs);
        expect(std::abs(middle.r - 0.5f) < 1e-3f) << "r=" << middle.r;
        expect(std::abs(middle.a - 1.0f) < 1e-3f);
    };
};

suite interpreter_register_tests = [] {
    "discarded result leaves registers untouched"_test = [] {
        auto buffer = makeBuffer();
        expect((buffer != nullptr) >> fatal);
        expect(buffer->addCircle({0.0f, 0.0f}, 50.0f, toRegister(DISCARD_REGISTER)).has_value());
        expect(buffer->addFill(RED).has_value());
        auto inputs = inputsFor(*buffer);

        ExecutionState state = run({0.0f, 0.0f}, inputs);
        expect(state.registers[1] == 0.0f);
        expect(state.color == CLEAR);
    };

    "any target past the register file is discarded"_test = [] {
        std::vector<Instruction> program = {
            encode(op::Circle{{0.0f, 0.0f}, 50.0f}, toRegister(1)),
            encode(op::Circle{{0.0f, 0.0f}, 10.0f}, toRegister(64)),
        };
        ExecutionState state = run({0.0f, 0.0f}, inputsFor(program));
        expect(std::abs(state.registers[1] + 50.0f) < 1e-3f);
    };

    "load copies a register"_test = [] {
        auto buffer = makeBuffer();
        expect((buffer != nullptr) >> fatal);
        expect(buffer->addCircle({0.0f, 0.0f}, 50.0f, toRegister(2)).has_value());
        expect(buffer->addLoad(2, toRegister(1)).has_value());
        expect(buffer->addFill(RED).has_value());
        auto inputs = inputsFor(*buffer);

        ExecutionState state = run({10.0f, 0.0f}, inputs);
        expect(state.registers[1] == state.registers[2]);
        expect(near(state.color, RED));
    };

    "load from outside the register file reads zero"_test = [] {
        std::vector<Instruction> program = {
            encode(op::Circle{{0.0f, 0.0f}, 50.0f}, toRegister(1)),
            encode(op::Load{0}, toRegister(1)),
        };
        program[1].operands[0] = 500.0f;
        ExecutionState state = run({0.0f, 0.0f}, inputsFor(program));
        expect(state.registers[1] == 0.0f);
    };

    "subtract carves a hole"_test = [] {
        auto buffer = makeBuffer();
        expect((buffer != nullptr) >> fatal);
        expect(buffer->addCircle({0.0f, 0.0f}, 50.0f, toRegister(1)).has_value());
        expect(buffer->addCircle({0.0f, 0.0f}, 20.0f, toRegister(1, CombineOp::Subtract))
                   .has_value());
        expect(buffer->addFill(RED).has_value());
        auto inputs = inputsFor(*buffer);

        expect(near(evaluate({35.0f, 0.0f}, inputs), RED));
        expect(near(evaluate({5.0f, 0.0f}, inputs), CLEAR));
    };
};

suite interpreter_robustness_tests = [] {
    "unknown opcode is a no-op"_test = [] {
        Instruction garbage;
        garbage.opcode = 99;
        garbage.targetRegister = 1;
        garbage.combineOp = static_cast<uint32_t>(CombineOp::Replace);
        garbage.operands[0] = 1000.0f;

        std::vector<Instruction> clean = {
            encode(op::Circle{{0.0f, 0.0f}, 50.0f}, toRegister(1)),
            encode(op::Fill{RED}),
        };
        std::vector<Instruction> dirty = {clean[0], garbage, clean[1]};

        glm::vec2 p(10.0f, 5.0f);
        ExecutionState a = run(p, inputsFor(clean));
        ExecutionState b = run(p, inputsFor(dirty));
        expect(a.color == b.color);
        expect(a.registers == b.registers);
    };

    "paint with nothing inside leaves the colour"_test = [] {
        std::vector<Instruction> program = {encode(op::Fill{RED})};
        ExecutionState state = run({0.0f, 0.0f}, inputsFor(program));
        expect(state.color == CLEAR);
    };

    "only the declared instruction count executes"_test = [] {
        std::vector<Instruction> program = {
            encode(op::Circle{{0.0f, 0.0f}, 50.0f}, toRegister(1)),
            encode(op::Fill{RED}),
            encode(op::SetBlendMode{BlendMode::Replace}),
            encode(op::Fill{BLUE}),
        };
        FrameInputs inputs = inputsFor(program);
        inputs.uniforms.instructionCount = 2;
        expect(near(evaluate({0.0f, 0.0f}, inputs), RED));

        inputs.uniforms.instructionCount = 100;
        expect(executedLength(inputs) == 4_u);
        expect(near(evaluate({0.0f, 0.0f}, inputs), BLUE));
    };

    "evaluation is deterministic"_test = [] {
        auto buffer = makeBuffer();
        expect((buffer != nullptr) >> fatal);
        expect(buffer->addQuadPlane({-40.0f, 0.0f}, {0.0f, 60.0f}, {40.0f, 0.0f}, toRegister(1))
                   .has_value());
        expect(buffer->addTriangle({-30.0f, -30.0f}, {30.0f, -30.0f}, {0.0f, 30.0f},
                                   toRegister(1, CombineOp::Xor)).has_value());
        expect(buffer->addRadialGradient(RED, BLUE, {0.0f, 0.0f}, 40.0f).has_value());
        auto inputs = inputsFor(*buffer);

        for (float x = -50.0f; x <= 50.0f; x += 7.3f) {
            glm::vec4 first = evaluate({x, 3.1f}, inputs);
            glm::vec4 second = evaluate({x, 3.1f}, inputs);
            expect(std::memcmp(&first, &second, sizeof(glm::vec4)) == 0);
        }
    };
};

suite interpreter_state_tests = [] {
    "blend mode persists for later paints"_test = [] {
        std::vector<Instruction> program = {
            encode(op::Circle{{0.0f, 0.0f}, 50.0f}, toRegister(1)),
            encode(op::SetBlendMode{BlendMode::Add}),
            encode(op::Fill{RED}),
            encode(op::Fill{BLUE}),
        };
        FrameInputs inputs = inputsFor(program);
        inputs.gamma = false;

        ExecutionState state = run({0.0f, 0.0f}, inputs);
        expect(state.blendMode == BlendMode::Add);
        expect(near(state.color, glm::vec4(1.0f, 0.0f, 1.0f, 2.0f)));
    };

    "transform persists and is not stacked"_test = [] {
        std::vector<Instruction> program = {
            encode(op::SetTransform{2.0f, 0.0f, 0.0f, 0.0f, 2.0f, 0.0f}),
            encode(op::SetTransform{1.0f, 0.0f, 100.0f, 0.0f, 1.0f, 0.0f}),
            encode(op::Circle{{0.0f, 0.0f}, 10.0f}, toRegister(1)),
            encode(op::Fill{RED}),
        };
        FrameInputs inputs = inputsFor(program);

        ExecutionState state = run({100.0f, 0.0f}, inputs);
        expect(state.transform == makeTransform(1.0f, 0.0f, 100.0f, 0.0f, 1.0f, 0.0f));
        expect(near(state.color, RED));
        // unscaled: radius 10, not 20
        expect(near(run({115.0f, 0.0f}, inputs).color, CLEAR));
    };

    "paint colours use the local coordinate"_test = [] {
        std::vector<Instruction> program = {
            encode(op::SetTransform{1.0f, 0.0f, 100.0f, 0.0f, 1.0f, 0.0f}),
            encode(op::Circle{{0.0f, 0.0f}, 50.0f}, toRegister(1)),
            encode(op::RadialGradient{RED, BLUE, {0.0f, 0.0f}, 40.0f}),
        };
        FrameInputs inputs = inputsFor(program);
        inputs.gamma = false;

        // screen (100, 0) is the gradient centre
        expect(near(run({100.0f, 0.0f}, inputs).color, RED));
    };

    "evaluateShape ignores non-shape operations"_test = [] {
        FrameInputs inputs;
        SampleSet samples = localSamples(glm::mat3(1.0f), {3.0f, 4.0f});
        ShapeSample sample = evaluateShape(op::Fill{RED}, samples, inputs);
        expect(sample.distance == 0.0f);
        expect(sample.gradient == glm::vec2(0.0f));
    };

    "evaluateShape returns a unit gradient"_test = [] {
        FrameInputs inputs;
        SampleSet samples = localSamples(glm::mat3(1.0f), {0.0f, 2.0f});
        ShapeSample sample = evaluateShape(
            op::QuadPlane{{-10.0f, 0.0f}, {0.0f, 10.0f}, {10.0f, 0.0f}}, samples, inputs);
        expect(std::abs(sample.distance - 3.0f) < 1e-3f) << "d=" << sample.distance;
        expect(sample.gradient.y < -0.9f);
        expect(std::abs(sample.gradient.x) < 0.1f);
        expect(std::abs(glm::length(sample.gradient) - 1.0f) < 1e-3f);
    };
};
