#include <sdfvm/yaml-program.h>
#include <sdfvm/transform.h>
#include <ytrace/ytrace.hpp>
#include <yaml-cpp/yaml.h>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <map>
#include <sstream>

namespace sdfvm {

//=============================================================================
// Helpers
//=============================================================================
namespace {

const std::map<std::string, CombineOp> COMBINE_NAMES = {
    {"none", CombineOp::None},
    {"replace", CombineOp::Replace},
    {"replace-if-inside", CombineOp::ReplaceIfInside},
    {"replace-if-outside", CombineOp::ReplaceIfOutside},
    {"and", CombineOp::And},
    {"or", CombineOp::Or},
    {"xor", CombineOp::Xor},
    {"subtract", CombineOp::Subtract},
    {"negate", CombineOp::Negate},
    {"lerp", CombineOp::Lerp},
    {"smooth-step", CombineOp::SmoothStep},
    {"sigmoid", CombineOp::Sigmoid},
};

const std::map<std::string, BlendMode> BLEND_NAMES = {
    {"replace", BlendMode::Replace},
    {"add", BlendMode::Add},
    {"multiply", BlendMode::Multiply},
    {"subtract", BlendMode::Subtract},
    {"divide", BlendMode::Divide},
    {"min", BlendMode::Min},
    {"max", BlendMode::Max},
    {"alpha-composite", BlendMode::AlphaComposite},
};

float readFloat(const YAML::Node& item, const char* key, float fallback) {
    if (!item[key]) return fallback;
    return item[key].as<float>();
}

Result<glm::vec2> readVec2(const YAML::Node& item, const char* key, glm::vec2 fallback) {
    YAML::Node node = item[key];
    if (!node) return Ok(fallback);
    if (!node.IsSequence() || node.size() != 2) {
        return Err<glm::vec2>(std::string("'") + key + "' must be a list of two numbers");
    }
    return Ok(glm::vec2(node[0].as<float>(), node[1].as<float>()));
}

Result<glm::vec4> readColor(const YAML::Node& item, const char* key, glm::vec4 fallback) {
    YAML::Node node = item[key];
    if (!node) return Ok(fallback);
    if (node.IsSequence()) {
        if (node.size() != 4) {
            return Err<glm::vec4>(std::string("'") + key + "' must be a list of four numbers");
        }
        return Ok(glm::vec4(node[0].as<float>(), node[1].as<float>(),
                            node[2].as<float>(), node[3].as<float>()));
    }
    auto color = parseColorString(node.as<std::string>());
    if (!color) return Err<glm::vec4>(std::string("'") + key + "'", color);
    return color;
}

Result<InstructionHeader> readHeader(const YAML::Node& item) {
    InstructionHeader header;
    header.strokeWidth = readFloat(item, "stroke", -1.0f);
    header.parameter = readFloat(item, "parameter", 0.0f);

    if (YAML::Node target = item["target"]) {
        std::string str = target.as<std::string>();
        if (str == "discard") {
            header.target = DISCARD_REGISTER;
        } else {
            header.target = target.as<uint32_t>();
        }
    }

    if (YAML::Node combine = item["combine"]) {
        auto it = COMBINE_NAMES.find(combine.as<std::string>());
        if (it == COMBINE_NAMES.end()) {
            return Err<InstructionHeader>("unknown combine '" + combine.as<std::string>() + "'");
        }
        header.combine = it->second;
    } else if (header.target < REGISTER_COUNT) {
        header.combine = CombineOp::Replace;
    }
    return Ok(header);
}

// matrix: [a, b, c, d, e, f]  or any of translate / rotate (degrees) / scale,
// applied as translate * rotate * scale.
Result<glm::mat3> readTransform(const YAML::Node& item) {
    if (YAML::Node matrix = item["matrix"]) {
        if (!matrix.IsSequence() || matrix.size() != 6) {
            return Err<glm::mat3>("'matrix' must be a list of six numbers [a, b, c, d, e, f]");
        }
        return Ok(makeTransform(matrix[0].as<float>(), matrix[1].as<float>(),
                                matrix[2].as<float>(), matrix[3].as<float>(),
                                matrix[4].as<float>(), matrix[5].as<float>()));
    }

    auto translate = readVec2(item, "translate", glm::vec2(0.0f));
    if (!translate) return Err<glm::mat3>("transform", translate);

    glm::vec2 scale(1.0f);
    if (YAML::Node s = item["scale"]) {
        if (s.IsSequence()) {
            auto pair = readVec2(item, "scale", glm::vec2(1.0f));
            if (!pair) return Err<glm::mat3>("transform", pair);
            scale = *pair;
        } else {
            scale = glm::vec2(s.as<float>());
        }
    }

    float radians = readFloat(item, "rotate", 0.0f) * 3.14159265358979323846f / 180.0f;
    float cs = std::cos(radians);
    float sn = std::sin(radians);

    return Ok(makeTransform(cs * scale.x, -sn * scale.y, translate->x,
                            sn * scale.x, cs * scale.y, translate->y));
}

Result<uint32_t> parseInstruction(ProgramBuffer& buffer, const YAML::Node& item,
                                  const std::string& where) {
    if (!item.IsMap() || !item["op"]) {
        return Err<uint32_t>(where + ": entry needs an 'op' key");
    }
    std::string opName = item["op"].as<std::string>();

    auto headerRes = readHeader(item);
    if (!headerRes) return Err<uint32_t>(where, headerRes);
    auto header = *headerRes;

    if (opName == "none") {
        return buffer.add(op::NoOp{}, header);
    }
    if (opName == "circle") {
        auto centerRes = readVec2(item, "center", glm::vec2(0.0f));
        if (!centerRes) return Err<uint32_t>(where, centerRes);
        auto center = *centerRes;
        return buffer.addCircle(center, readFloat(item, "radius", 0.0f), header);
    }
    if (opName == "triangle") {
        auto aRes = readVec2(item, "a", glm::vec2(0.0f));
        if (!aRes) return Err<uint32_t>(where, aRes);
        auto a = *aRes;
        auto bRes = readVec2(item, "b", glm::vec2(0.0f));
        if (!bRes) return Err<uint32_t>(where, bRes);
        auto b = *bRes;
        auto cRes = readVec2(item, "c", glm::vec2(0.0f));
        if (!cRes) return Err<uint32_t>(where, cRes);
        auto c = *cRes;
        return buffer.addTriangle(a, b, c, header);
    }
    if (opName == "rectangle") {
        auto ltRes = readVec2(item, "lt", glm::vec2(0.0f));
        if (!ltRes) return Err<uint32_t>(where, ltRes);
        auto lt = *ltRes;
        auto rbRes = readVec2(item, "rb", glm::vec2(0.0f));
        if (!rbRes) return Err<uint32_t>(where, rbRes);
        auto rb = *rbRes;
        glm::vec4 radii(0.0f);
        if (YAML::Node round = item["round"]) {
            if (round.IsSequence()) {
                if (round.size() != 4) {
                    return Err<uint32_t>(where + ": 'round' must be one number or four");
                }
                radii = glm::vec4(round[0].as<float>(), round[1].as<float>(),
                                  round[2].as<float>(), round[3].as<float>());
            } else {
                radii = glm::vec4(round.as<float>());
            }
        }
        return buffer.addRectangle(lt, rb, radii, header);
    }
    if (opName == "half-plane") {
        auto p0Res = readVec2(item, "p0", glm::vec2(0.0f));
        if (!p0Res) return Err<uint32_t>(where, p0Res);
        auto p0 = *p0Res;
        auto p1Res = readVec2(item, "p1", glm::vec2(1.0f, 0.0f));
        if (!p1Res) return Err<uint32_t>(where, p1Res);
        auto p1 = *p1Res;
        return buffer.addHalfPlane(p0, p1, header);
    }
    if (opName == "quad-plane" || opName == "bezier") {
        auto startRes = readVec2(item, "start", glm::vec2(0.0f));
        if (!startRes) return Err<uint32_t>(where, startRes);
        auto start = *startRes;
        auto controlRes = readVec2(item, "control", glm::vec2(0.0f));
        if (!controlRes) return Err<uint32_t>(where, controlRes);
        auto control = *controlRes;
        auto endRes = readVec2(item, "end", glm::vec2(0.0f));
        if (!endRes) return Err<uint32_t>(where, endRes);
        auto end = *endRes;
        return buffer.addQuadPlane(start, control, end, header);
    }
    if (opName == "sdf-texture") {
        auto ltRes = readVec2(item, "lt", glm::vec2(0.0f));
        if (!ltRes) return Err<uint32_t>(where, ltRes);
        auto lt = *ltRes;
        auto rbRes = readVec2(item, "rb", glm::vec2(0.0f));
        if (!rbRes) return Err<uint32_t>(where, rbRes);
        auto rb = *rbRes;
        uint32_t layer = item["layer"] ? item["layer"].as<uint32_t>() : 0;
        return buffer.addSdfTexture(lt, rb, layer, header);
    }
    if (opName == "char") {
        auto positionRes = readVec2(item, "position", glm::vec2(0.0f));
        if (!positionRes) return Err<uint32_t>(where, positionRes);
        auto position = *positionRes;
        uint32_t glyph = item["glyph"] ? item["glyph"].as<uint32_t>() : 0;
        return buffer.addChar(position, readFloat(item, "size", 16.0f), glyph, header);
    }
    if (opName == "load") {
        if (!item["register"]) return Err<uint32_t>(where + ": load needs 'register'");
        return buffer.addLoad(item["register"].as<uint32_t>(), header);
    }
    if (opName == "fill") {
        auto colorRes = readColor(item, "color", glm::vec4(1.0f));
        if (!colorRes) return Err<uint32_t>(where, colorRes);
        auto color = *colorRes;
        return buffer.addFill(color);
    }
    if (opName == "linear-gradient") {
        auto startRes = readColor(item, "start", glm::vec4(0.0f, 0.0f, 0.0f, 1.0f));
        if (!startRes) return Err<uint32_t>(where, startRes);
        auto start = *startRes;
        auto endRes = readColor(item, "end", glm::vec4(1.0f));
        if (!endRes) return Err<uint32_t>(where, endRes);
        auto end = *endRes;
        auto fromRes = readVec2(item, "from", glm::vec2(0.0f));
        if (!fromRes) return Err<uint32_t>(where, fromRes);
        auto from = *fromRes;
        auto toRes = readVec2(item, "to", glm::vec2(1.0f, 0.0f));
        if (!toRes) return Err<uint32_t>(where, toRes);
        auto to = *toRes;
        return buffer.addLinearGradient(start, end, from, to);
    }
    if (opName == "radial-gradient") {
        auto innerRes = readColor(item, "inner", glm::vec4(1.0f));
        if (!innerRes) return Err<uint32_t>(where, innerRes);
        auto inner = *innerRes;
        auto outerRes = readColor(item, "outer", glm::vec4(0.0f, 0.0f, 0.0f, 1.0f));
        if (!outerRes) return Err<uint32_t>(where, outerRes);
        auto outer = *outerRes;
        auto centerRes = readVec2(item, "center", glm::vec2(0.0f));
        if (!centerRes) return Err<uint32_t>(where, centerRes);
        auto center = *centerRes;
        return buffer.addRadialGradient(inner, outer, center, readFloat(item, "radius", 1.0f));
    }
    if (opName == "texture") {
        auto ltRes = readVec2(item, "lt", glm::vec2(0.0f));
        if (!ltRes) return Err<uint32_t>(where, ltRes);
        auto lt = *ltRes;
        auto rbRes = readVec2(item, "rb", glm::vec2(0.0f));
        if (!rbRes) return Err<uint32_t>(where, rbRes);
        auto rb = *rbRes;
        auto uvLtRes = readVec2(item, "uv-lt", glm::vec2(0.0f));
        if (!uvLtRes) return Err<uint32_t>(where, uvLtRes);
        auto uvLt = *uvLtRes;
        auto uvRbRes = readVec2(item, "uv-rb", glm::vec2(1.0f));
        if (!uvRbRes) return Err<uint32_t>(where, uvRbRes);
        auto uvRb = *uvRbRes;
        uint32_t layer = item["layer"] ? item["layer"].as<uint32_t>() : 0;
        return buffer.addTextureFill(lt, rb, uvLt, uvRb, layer);
    }
    if (opName == "transform") {
        auto matrixRes = readTransform(item);
        if (!matrixRes) return Err<uint32_t>(where, matrixRes);
        auto matrix = *matrixRes;
        return buffer.setTransform(matrix);
    }
    if (opName == "blend-mode") {
        std::string mode = item["mode"] ? item["mode"].as<std::string>() : "alpha-composite";
        auto it = BLEND_NAMES.find(mode);
        if (it == BLEND_NAMES.end()) {
            return Err<uint32_t>(where + ": unknown blend mode '" + mode + "'");
        }
        return buffer.setBlendMode(it->second);
    }

    return Err<uint32_t>(where + ": unknown op '" + opName + "'");
}


} // namespace

//=============================================================================
// parseColorString
//=============================================================================
Result<glm::vec4> parseColorString(const std::string& color) {
    if (color.empty() || color[0] != '#') {
        return Err<glm::vec4>("color '" + color + "' must start with '#'");
    }
    std::string hex = color.substr(1);
    if (hex.size() == 3) hex = std::string{hex[0], hex[0], hex[1], hex[1], hex[2], hex[2]};
    if (hex.size() == 6) hex += "ff";
    if (hex.size() != 8) {
        return Err<glm::vec4>("color '" + color + "' must be #rgb, #rrggbb or #rrggbbaa");
    }

    glm::vec4 out;
    for (int i = 0; i < 4; ++i) {
        std::string byte = hex.substr(i * 2, 2);
        char* end = nullptr;
        unsigned long v = std::strtoul(byte.c_str(), &end, 16);
        if (end != byte.c_str() + 2) {
            return Err<glm::vec4>("color '" + color + "' has invalid hex digits");
        }
        out[i] = static_cast<float>(v) / 255.0f;
    }
    return Ok(out);
}

//=============================================================================
// parseProgramYaml / loadProgramYaml
//=============================================================================
Result<ProgramDocument> parseProgramYaml(const std::string& yaml) {
    auto bufferRes = ProgramBuffer::create();
    if (!bufferRes) return Err<ProgramDocument>("parseProgramYaml", bufferRes);

    ProgramDocument doc;
    doc.buffer = *bufferRes;

    try {
        YAML::Node root = YAML::Load(yaml);
        if (!root || !root.IsMap()) {
            return Err<ProgramDocument>("parseProgramYaml: document must be a map");
        }

        if (YAML::Node u = root["uniforms"]) {
            if (u["width"]) doc.width = u["width"].as<uint32_t>();
            if (u["height"]) doc.height = u["height"].as<uint32_t>();
            if (u["scale"]) doc.scale = u["scale"].as<float>();
            if (u["time"]) doc.time = u["time"].as<float>();
            if (u["mouse"]) {
                auto mouse = readVec2(u, "mouse", glm::vec2(0.0f));
                if (!mouse) return Err<ProgramDocument>("parseProgramYaml: uniforms", mouse);
                doc.mouse = *mouse;
            }
        }

        YAML::Node program = root["program"];
        if (!program || !program.IsSequence()) {
            return Err<ProgramDocument>("parseProgramYaml: missing 'program' list");
        }

        size_t index = 0;
        for (const auto& item : program) {
            std::string where = "program[" + std::to_string(index++) + "]";
            if (auto res = parseInstruction(*doc.buffer, item, where); !res) {
                return Err<ProgramDocument>("parseProgramYaml", res);
            }
        }
    } catch (const YAML::Exception& e) {
        return Err<ProgramDocument>(std::string("parseProgramYaml: YAML error: ") + e.what());
    }

    ydebug("parseProgramYaml: {} instructions", doc.buffer->size());
    return Ok(std::move(doc));
}

Result<ProgramDocument> loadProgramYaml(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return Err<ProgramDocument>("loadProgramYaml: cannot open " + path);
    }
    std::stringstream ss;
    ss << file.rdbuf();

    auto doc = parseProgramYaml(ss.str());
    if (!doc) return Err<ProgramDocument>("loadProgramYaml: " + path, doc);
    yinfo("Loaded program {} ({} instructions)", path, doc->buffer->size());
    return doc;
}

} // namespace sdfvm
