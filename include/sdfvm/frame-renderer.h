#pragma once

#include <sdfvm/base/object.h>
#include <sdfvm/base/factory.h>
#include <sdfvm/interpreter.h>
#include <sdfvm/result.hpp>
#include <glm/glm.hpp>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace sdfvm {

//=============================================================================
// Image - row-major float RGBA frame
//=============================================================================
struct Image {
    uint32_t width = 0;
    uint32_t height = 0;
    std::vector<glm::vec4> pixels;

    const glm::vec4& at(uint32_t x, uint32_t y) const { return pixels[size_t(y) * width + x]; }
    glm::vec4& at(uint32_t x, uint32_t y) { return pixels[size_t(y) * width + x]; }

    // Channels clamped to [0, 1]; NaN becomes 0.
    std::vector<uint8_t> toRgba8() const;
    Result<void> writePng(const std::string& path) const;
};

//=============================================================================
// FrameRenderer - evaluates every pixel of a frame on worker threads
//
// Pixel (x, y) is sampled at ((x + 0.5) / scale, (y + 0.5) / scale) in
// the program's coordinate space. Rows are claimed through an atomic
// counter; each row is written by exactly one worker.
//=============================================================================
class FrameRenderer : public base::Object,
                      public base::ObjectFactory<FrameRenderer> {
public:
    using Ptr = std::shared_ptr<FrameRenderer>;

    // threadCount 0 picks std::thread::hardware_concurrency()
    static Result<Ptr> createImpl(ContextType& ctx, uint32_t threadCount = 0);

    ~FrameRenderer() override = default;
    const char* typeName() const override { return "FrameRenderer"; }

    virtual uint32_t threadCount() const = 0;

    virtual Result<Image> render(const FrameInputs& inputs, uint32_t width, uint32_t height) = 0;
};

} // namespace sdfvm
