#include <sdfvm/frame-renderer.h>
#include <ytrace/ytrace.hpp>

#define STB_IMAGE_WRITE_IMPLEMENTATION
#include <stb_image_write.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cmath>
#include <thread>

namespace sdfvm {

//=============================================================================
// Image
//=============================================================================
std::vector<uint8_t> Image::toRgba8() const {
    std::vector<uint8_t> out(pixels.size() * 4);
    auto quantize = [](float v) -> uint8_t {
        if (!(v > 0.0f)) return 0;
        if (v >= 1.0f) return 255;
        return static_cast<uint8_t>(std::lround(v * 255.0f));
    };
    for (size_t i = 0; i < pixels.size(); ++i) {
        out[i * 4 + 0] = quantize(pixels[i].r);
        out[i * 4 + 1] = quantize(pixels[i].g);
        out[i * 4 + 2] = quantize(pixels[i].b);
        out[i * 4 + 3] = quantize(pixels[i].a);
    }
    return out;
}

Result<void> Image::writePng(const std::string& path) const {
    if (width == 0 || height == 0) {
        return Err("Image::writePng: empty image");
    }
    auto rgba = toRgba8();
    if (!stbi_write_png(path.c_str(), static_cast<int>(width), static_cast<int>(height), 4,
                        rgba.data(), static_cast<int>(width * 4))) {
        return Err("Image::writePng: failed to write " + path);
    }
    yinfo("Image::writePng: wrote {}x{} to {}", width, height, path);
    return Ok();
}

//=============================================================================
// FrameRendererImpl
//=============================================================================
class FrameRendererImpl : public FrameRenderer {
public:
    explicit FrameRendererImpl(uint32_t threadCount) : _threadCount(threadCount) {}

    Result<void> init() {
        if (_threadCount == 0) {
            _threadCount = std::max(1u, std::thread::hardware_concurrency());
        }
        yinfo("FrameRenderer: using {} threads", _threadCount);
        return Ok();
    }

    uint32_t threadCount() const override { return _threadCount; }

    Result<Image> render(const FrameInputs& inputs, uint32_t width, uint32_t height) override {
        yfunc();
        if (width == 0 || height == 0) {
            return Err<Image>("FrameRenderer::render: frame size must be non-zero");
        }
        float scale = inputs.uniforms.scaleFactor;
        if (!(scale > 0.0f) || !std::isfinite(scale)) {
            return Err<Image>("FrameRenderer::render: scale factor must be positive");
        }
        if (inputs.uniforms.instructionCount > inputs.program.size()) {
            ywarn("FrameRenderer::render: uniforms declare {} instructions, buffer holds {}",
                  inputs.uniforms.instructionCount, inputs.program.size());
        }

        auto start = std::chrono::steady_clock::now();

        Image image;
        image.width = width;
        image.height = height;
        image.pixels.resize(size_t(width) * height);

        std::atomic<uint32_t> nextRow{0};
        auto worker = [&]() {
            for (uint32_t y = nextRow++; y < height; y = nextRow++) {
                for (uint32_t x = 0; x < width; ++x) {
                    glm::vec2 sample((x + 0.5f) / scale, (y + 0.5f) / scale);
                    image.at(x, y) = evaluate(sample, inputs);
                }
            }
        };

        uint32_t workerCount = std::min(_threadCount, height);
        if (workerCount <= 1) {
            worker();
        } else {
            std::vector<std::thread> workers;
            workers.reserve(workerCount);
            for (uint32_t i = 0; i < workerCount; ++i) {
                workers.emplace_back(worker);
            }
            for (auto& t : workers) {
                t.join();
            }
        }

        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);
        ydebug("FrameRenderer::render: {}x{} with {} instructions on {} threads in {} ms",
               width, height, executedLength(inputs), workerCount, elapsed.count());
        return Ok(std::move(image));
    }

private:
    uint32_t _threadCount;
};

Result<FrameRenderer::Ptr> FrameRenderer::createImpl(ContextType&, uint32_t threadCount) {
    auto impl = std::make_shared<FrameRendererImpl>(threadCount);
    if (auto res = impl->init(); !res) {
        return Err<Ptr>("Failed to initialize FrameRenderer", res);
    }
    return Ok<Ptr>(impl);
}

} // namespace sdfvm
