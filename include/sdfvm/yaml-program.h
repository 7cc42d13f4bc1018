#pragma once

#include <sdfvm/program-buffer.h>
#include <sdfvm/result.hpp>
#include <glm/glm.hpp>
#include <optional>
#include <string>

namespace sdfvm {

//=============================================================================
// YAML program documents
//
//   uniforms:            # optional, every key optional
//     width: 512
//     height: 512
//     scale: 1.0
//     time: 0.0
//     mouse: [0, 0]
//   program:
//     - op: circle
//       center: [0, 0]
//       radius: 50
//       target: 1
//       combine: replace
//     - op: fill
//       color: "#ff0000"
//
// Colours are "#rgb", "#rrggbb", "#rrggbbaa" or a list of four floats.
// target is a register index or "discard" (the default).
//=============================================================================
struct ProgramDocument {
    ProgramBuffer::Ptr buffer;
    std::optional<uint32_t> width;
    std::optional<uint32_t> height;
    std::optional<float> scale;
    std::optional<float> time;
    std::optional<glm::vec2> mouse;
};

Result<ProgramDocument> parseProgramYaml(const std::string& yaml);
Result<ProgramDocument> loadProgramYaml(const std::string& path);

// "#rrggbb" style colour to straight RGBA in [0, 1].
Result<glm::vec4> parseColorString(const std::string& color);

} // namespace sdfvm
