// sdfvm-render: evaluate an SDF program over a frame and write a PNG
//
// Reads a YAML program, loads the texture / glyph atlases named in the
// config, runs the interpreter for every pixel on worker threads and writes
// the gamma encoded frame.
//
// Precedence for frame parameters: command line > program uniforms > config.

#include <sdfvm/atlas.h>
#include <sdfvm/config.h>
#include <sdfvm/frame-renderer.h>
#include <sdfvm/yaml-program.h>
#include <ytrace/ytrace.hpp>
#include <spdlog/spdlog.h>

#include <args.hxx>
#include <cstdint>
#include <iostream>
#include <sstream>
#include <string>

using namespace sdfvm;

namespace {

constexpr int EXIT_USAGE = 1;
constexpr int EXIT_FAILURE_RUNTIME = 2;

bool parsePoint(const std::string& text, glm::vec2& out) {
    std::istringstream ss(text);
    char comma = 0;
    float x = 0.0f, y = 0.0f;
    if (!(ss >> x >> comma >> y) || comma != ',') return false;
    out = glm::vec2(x, y);
    return true;
}

Result<TextureAtlas::Ptr> loadTextures(const Config& config) {
    auto size = config.get<uint32_t>(Config::KEY_ATLAS_TEXTURE_SIZE, TextureAtlas::DEFAULT_SIZE);
    auto atlas = TextureAtlas::create(size, size);
    if (!atlas) return atlas;
    for (const auto& path : config.getList(Config::KEY_ATLAS_TEXTURES)) {
        if (auto res = (*atlas)->addLayerFromFile(path); !res) {
            return Err<TextureAtlas::Ptr>("texture atlas", res);
        }
    }
    return atlas;
}

Result<GlyphAtlas::Ptr> loadGlyphs(const Config& config) {
    auto pageSize = config.get<uint32_t>(Config::KEY_ATLAS_GLYPH_SIZE,
                                         GlyphAtlas::DEFAULT_PAGE_SIZE);
    auto cellSize = config.get<uint32_t>(Config::KEY_ATLAS_GLYPH_CELL_SIZE,
                                         GlyphAtlas::DEFAULT_CELL_SIZE);
    auto atlas = GlyphAtlas::create(pageSize, cellSize);
    if (!atlas) return atlas;
    for (const auto& path : config.getList(Config::KEY_ATLAS_GLYPH_PAGES)) {
        if (auto res = (*atlas)->addPageFromFile(path); !res) {
            return Err<GlyphAtlas::Ptr>("glyph atlas", res);
        }
    }
    return atlas;
}

} // namespace

int main(int argc, char** argv) {
    args::ArgumentParser parser("sdfvm-render - render an SDF program to PNG");
    args::HelpFlag help(parser, "help", "Show help", {'h', "help"});
    args::ValueFlag<std::string> outputFlag(parser, "output", "Output PNG path", {'o', "output"},
                                            "out.png");
    args::ValueFlag<std::string> configFlag(parser, "config", "Config file", {'c', "config"});
    args::ValueFlag<uint32_t> widthFlag(parser, "width", "Frame width in pixels", {'W', "width"});
    args::ValueFlag<uint32_t> heightFlag(parser, "height", "Frame height in pixels",
                                         {'H', "height"});
    args::ValueFlag<float> scaleFlag(parser, "scale", "Device pixel scale factor",
                                     {'s', "scale"});
    args::ValueFlag<uint32_t> threadsFlag(parser, "threads", "Worker threads (0 = all cores)",
                                          {'t', "threads"});
    args::ValueFlag<float> timeFlag(parser, "time", "Time uniform in seconds", {"time"});
    args::ValueFlag<std::string> mouseFlag(parser, "x,y", "Pointer position uniform", {"mouse"});
    args::Flag noGammaFlag(parser, "no-gamma", "Write linear colour", {"no-gamma"});
    args::Flag verboseFlag(parser, "verbose", "Debug logging", {'v', "verbose"});
    args::Flag disassembleFlag(parser, "disassemble", "Print the decoded program and exit",
                               {"disassemble"});
    args::Positional<std::string> programFile(parser, "program", "YAML program file");

    try {
        parser.ParseCLI(argc, argv);
    } catch (const args::Help&) {
        std::cout << parser;
        return 0;
    } catch (const args::ParseError& e) {
        std::cerr << e.what() << std::endl;
        std::cerr << parser;
        return EXIT_USAGE;
    } catch (const args::ValidationError& e) {
        std::cerr << e.what() << std::endl;
        std::cerr << parser;
        return EXIT_USAGE;
    }

    if (!programFile) {
        std::cerr << "Error: no program file specified\n";
        return EXIT_USAGE;
    }

    glm::vec2 mouse(0.0f);
    bool mouseGiven = false;
    if (mouseFlag) {
        if (!parsePoint(args::get(mouseFlag), mouse)) {
            std::cerr << "Error: --mouse expects x,y\n";
            return EXIT_USAGE;
        }
        mouseGiven = true;
    }

    // Command line flags that map onto config keys become the override layer.
    YAML::Node overrides;
    if (threadsFlag) overrides["render"]["threads"] = args::get(threadsFlag);
    if (noGammaFlag) overrides["render"]["gamma"] = false;
    if (verboseFlag) overrides["log"]["level"] = "debug";

    auto configRes = Config::create(configFlag ? args::get(configFlag) : std::string(), overrides);
    if (!configRes) {
        std::cerr << "Error: " << error_msg(configRes) << "\n";
        return EXIT_FAILURE_RUNTIME;
    }
    auto config = *configRes;

    auto level = spdlog::level::from_str(config->get<std::string>(Config::KEY_LOG_LEVEL, "info"));
    spdlog::set_level(level);
    spdlog::info("sdfvm-render starting");

    auto docRes = loadProgramYaml(args::get(programFile));
    if (!docRes) {
        yerror("{}", error_msg(docRes));
        return EXIT_FAILURE_RUNTIME;
    }
    ProgramDocument doc = std::move(*docRes);

    for (const auto& warning : ProgramBuffer::validate(doc.buffer->view())) {
        ywarn("{}", warning);
    }

    if (disassembleFlag) {
        const auto& instructions = doc.buffer->instructions();
        for (size_t i = 0; i < instructions.size(); ++i) {
            std::cout << i << ": " << disassemble(instructions[i]) << "\n";
        }
        return 0;
    }

    uint32_t width = widthFlag ? args::get(widthFlag)
                   : doc.width.value_or(config->get<uint32_t>(Config::KEY_RENDER_WIDTH, 512));
    uint32_t height = heightFlag ? args::get(heightFlag)
                    : doc.height.value_or(config->get<uint32_t>(Config::KEY_RENDER_HEIGHT, 512));
    float scale = scaleFlag ? args::get(scaleFlag)
                : doc.scale.value_or(config->get<float>(Config::KEY_RENDER_SCALE_FACTOR, 1.0f));
    float time = timeFlag ? args::get(timeFlag)
               : doc.time.value_or(config->get<float>(Config::KEY_RENDER_TIME, 0.0f));
    if (!mouseGiven) mouse = doc.mouse.value_or(glm::vec2(0.0f));

    auto textures = loadTextures(*config);
    if (!textures) {
        yerror("{}", error_msg(textures));
        return EXIT_FAILURE_RUNTIME;
    }
    auto glyphs = loadGlyphs(*config);
    if (!glyphs) {
        yerror("{}", error_msg(glyphs));
        return EXIT_FAILURE_RUNTIME;
    }

    auto renderer = FrameRenderer::create(config->get<uint32_t>(Config::KEY_RENDER_THREADS, 0));
    if (!renderer) {
        yerror("{}", error_msg(renderer));
        return EXIT_FAILURE_RUNTIME;
    }

    FrameInputs inputs;
    inputs.program = doc.buffer->view();
    inputs.uniforms = doc.buffer->uniforms(glm::vec2(width, height), mouse, time, scale);
    inputs.textures = textures->get();
    inputs.glyphs = glyphs->get();
    inputs.gamma = config->get<bool>(Config::KEY_RENDER_GAMMA, true);

    auto image = (*renderer)->render(inputs, width, height);
    if (!image) {
        yerror("{}", error_msg(image));
        return EXIT_FAILURE_RUNTIME;
    }

    std::string output = args::get(outputFlag);
    if (auto res = image->writePng(output); !res) {
        yerror("{}", error_msg(res));
        return EXIT_FAILURE_RUNTIME;
    }

    spdlog::info("Rendered {}x{} ({} instructions) to {}", width, height,
                 doc.buffer->size(), output);
    return 0;
}
