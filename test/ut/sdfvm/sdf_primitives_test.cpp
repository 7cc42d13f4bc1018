//=============================================================================
// SDF primitive tests
//
// Sign convention (negative inside), exact distances for the closed-form
// shapes, and the atlas-backed primitives against small in-memory atlases.
//=============================================================================

#include <boost/ut.hpp>
#include <sdfvm/sdf-primitives.h>
#include <sdfvm/atlas.h>

#include <cmath>
#include <vector>

using namespace boost::ut;
using namespace sdfvm;

namespace {

bool near(float a, float b, float eps = 1e-4f) {
    return std::abs(a - b) < eps;
}

std::vector<uint8_t> solidImage(uint32_t w, uint32_t h, uint8_t r, uint8_t g, uint8_t b) {
    std::vector<uint8_t> pixels(size_t(w) * h * 4);
    for (size_t i = 0; i < size_t(w) * h; ++i) {
        pixels[i * 4 + 0] = r;
        pixels[i * 4 + 1] = g;
        pixels[i * 4 + 2] = b;
        pixels[i * 4 + 3] = 255;
    }
    return pixels;
}

} // namespace

suite sdf_circle_tests = [] {
    "circle distance outside"_test = [] {
        expect(near(sdf::circle({3.0f, 4.0f}, {0.0f, 0.0f}, 2.0f), 3.0f));
    };

    "circle distance inside is negative"_test = [] {
        expect(near(sdf::circle({1.0f, 0.0f}, {0.0f, 0.0f}, 2.0f), -1.0f));
        expect(near(sdf::circle({10.0f, 10.0f}, {10.0f, 10.0f}, 5.0f), -5.0f));
    };

    "circle boundary is zero"_test = [] {
        expect(near(sdf::circle({0.0f, 5.0f}, {0.0f, 0.0f}, 5.0f), 0.0f));
    };
};

suite sdf_segment_tests = [] {
    "segment distance to interior"_test = [] {
        expect(near(sdf::segment({5.0f, 3.0f}, {0.0f, 0.0f}, {10.0f, 0.0f}), 3.0f));
    };

    "segment distance beyond endpoint"_test = [] {
        expect(near(sdf::segment({13.0f, 4.0f}, {0.0f, 0.0f}, {10.0f, 0.0f}), 5.0f));
    };

    "segment distance is never negative"_test = [] {
        for (float y = -3.0f; y <= 3.0f; y += 0.5f) {
            expect(sdf::segment({5.0f, y}, {0.0f, 0.0f}, {10.0f, 0.0f}) >= 0.0f);
        }
    };

    "degenerate segment is distance to the point"_test = [] {
        expect(near(sdf::segment({3.0f, 4.0f}, {0.0f, 0.0f}, {0.0f, 0.0f}), 5.0f));
    };
};

suite sdf_triangle_tests = [] {
    "triangle inside point"_test = [] {
        float d = sdf::triangle({2.0f, 2.0f}, {0.0f, 0.0f}, {10.0f, 0.0f}, {0.0f, 10.0f});
        expect(near(d, -2.0f)) << "d=" << d;
    };

    "triangle outside point"_test = [] {
        float d = sdf::triangle({-3.0f, 0.0f}, {0.0f, 0.0f}, {10.0f, 0.0f}, {0.0f, 10.0f});
        expect(near(d, 3.0f)) << "d=" << d;
    };

    "triangle sign does not depend on winding"_test = [] {
        glm::vec2 a(0.0f, 0.0f), b(10.0f, 0.0f), c(0.0f, 10.0f);
        glm::vec2 inside(2.0f, 2.0f), outside(8.0f, 8.0f);
        expect(near(sdf::triangle(inside, a, b, c), sdf::triangle(inside, a, c, b)));
        expect(near(sdf::triangle(outside, a, b, c), sdf::triangle(outside, a, c, b)));
        expect(sdf::triangle(outside, a, c, b) > 0.0f);
    };
};

suite sdf_rectangle_tests = [] {
    "box distances"_test = [] {
        glm::vec2 center(0.0f), half(10.0f, 5.0f);
        expect(near(sdf::box({0.0f, 0.0f}, center, half), -5.0f));
        expect(near(sdf::box({15.0f, 0.0f}, center, half), 5.0f));
        expect(near(sdf::box({13.0f, 9.0f}, center, half), 5.0f));
    };

    "rounded rectangle with zero radii equals box"_test = [] {
        glm::vec2 lt(-10.0f, -5.0f), rb(10.0f, 5.0f);
        std::vector<glm::vec2> points = {
            {0.0f, 0.0f}, {15.0f, 0.0f}, {13.0f, 9.0f}, {-12.0f, -7.0f}, {9.0f, -4.0f},
        };
        for (auto p : points) {
            expect(sdf::roundedRectangle(p, lt, rb, glm::vec4(0.0f)) ==
                   sdf::box(p, glm::vec2(0.0f), glm::vec2(10.0f, 5.0f)));
        }
    };

    "rounded corner only affects its own quadrant"_test = [] {
        glm::vec2 lt(0.0f, 0.0f), rb(20.0f, 20.0f);
        glm::vec4 radii(5.0f, 0.0f, 0.0f, 0.0f);
        // left-top corner pulled in to the arc around (5, 5)
        float rounded = sdf::roundedRectangle({0.0f, 0.0f}, lt, rb, radii);
        expect(near(rounded, std::sqrt(50.0f) - 5.0f)) << "d=" << rounded;
        // right-top corner stays sharp
        expect(near(sdf::roundedRectangle({20.0f, 0.0f}, lt, rb, radii), 0.0f));
    };

    "radii are clamped to the shorter half extent"_test = [] {
        float d = sdf::roundedRectangle({0.0f, 0.0f}, {-10.0f, -5.0f}, {10.0f, 5.0f},
                                        glm::vec4(100.0f));
        expect(near(d, -5.0f)) << "d=" << d;
    };
};

suite sdf_half_plane_tests = [] {
    "left of direction is inside"_test = [] {
        expect(near(sdf::halfPlane({0.0f, 1.0f}, {0.0f, 0.0f}, {1.0f, 0.0f}), -1.0f));
    };

    "right of direction is outside"_test = [] {
        expect(near(sdf::halfPlane({0.0f, -2.0f}, {0.0f, 0.0f}, {1.0f, 0.0f}), 2.0f));
    };

    "distance does not depend on direction length"_test = [] {
        expect(near(sdf::halfPlane({3.0f, 4.0f}, {0.0f, 0.0f}, {100.0f, 0.0f}), -4.0f));
    };

    "points on the line are zero"_test = [] {
        expect(near(sdf::halfPlane({5.0f, 0.0f}, {0.0f, 0.0f}, {1.0f, 0.0f}), 0.0f));
    };
};

suite sdf_quad_bezier_tests = [] {
    "distance at the apex of a symmetric arc"_test = [] {
        glm::vec2 a(-10.0f, 0.0f), b(0.0f, 10.0f), c(10.0f, 0.0f);
        // curve apex is (0, 5)
        float below = sdf::quadBezier({0.0f, 2.0f}, a, b, c);
        float above = sdf::quadBezier({0.0f, 8.0f}, a, b, c);
        expect(near(std::abs(below), 3.0f, 1e-3f)) << "d=" << below;
        expect(near(std::abs(above), 3.0f, 1e-3f)) << "d=" << above;
        expect(below > 0.0f);
        expect(above < 0.0f);
    };

    "nearest point clamps to the endpoints"_test = [] {
        glm::vec2 a(0.0f, 0.0f), b(5.0f, 10.0f), c(10.0f, 0.0f);
        expect(near(std::abs(sdf::quadBezier({-3.0f, -4.0f}, a, b, c)), 5.0f, 1e-3f));
        expect(near(std::abs(sdf::quadBezier({13.0f, -4.0f}, a, b, c)), 5.0f, 1e-3f));
    };

    "collinear control point falls back to the segment"_test = [] {
        glm::vec2 a(0.0f, 0.0f), b(5.0f, 0.0f), c(10.0f, 0.0f);
        float d = sdf::quadBezier({5.0f, 1.0f}, a, b, c);
        expect(near(d, -1.0f)) << "d=" << d;
        expect(near(sdf::quadBezier({5.0f, -3.0f}, a, b, c), 3.0f));
    };
};

suite sdf_helper_tests = [] {
    "median of three"_test = [] {
        expect(sdf::median(0.1f, 0.5f, 0.9f) == 0.5f);
        expect(sdf::median(0.9f, 0.1f, 0.5f) == 0.5f);
        expect(sdf::median(0.5f, 0.9f, 0.1f) == 0.5f);
    };

    "luminance of white is one"_test = [] {
        expect(near(sdf::luminance(glm::vec3(1.0f)), 1.0f));
        expect(sdf::luminance(glm::vec3(0.0f)) == 0.0f);
    };
};

suite sdf_texture_tests = [] {
    "bright texture is inside, bounded by its rectangle"_test = [] {
        auto atlas = TextureAtlas::create(2u, 2u);
        expect(atlas.has_value() >> fatal);
        auto white = solidImage(2, 2, 255, 255, 255);
        expect((*atlas)->addLayer(white.data(), 2, 2).has_value() >> fatal);

        glm::vec2 lt(0.0f, 0.0f), rb(10.0f, 10.0f);
        // box distance -5 wins over texture distance -8
        expect(near(sdf::sdfTexture({5.0f, 5.0f}, lt, rb, 0, atlas->get(), 1.0f), -5.0f));
        // outside the rectangle the box distance dominates
        expect(near(sdf::sdfTexture({20.0f, 5.0f}, lt, rb, 0, atlas->get(), 1.0f), 10.0f));
    };

    "dark texture is outside"_test = [] {
        auto atlas = TextureAtlas::create(2u, 2u);
        expect(atlas.has_value() >> fatal);
        auto black = solidImage(2, 2, 0, 0, 0);
        expect((*atlas)->addLayer(black.data(), 2, 2).has_value() >> fatal);

        float d = sdf::sdfTexture({5.0f, 5.0f}, {0.0f, 0.0f}, {10.0f, 10.0f}, 0,
                                  atlas->get(), 1.0f);
        expect(near(d, 0.5f * sdf::TEXTURE_DISTANCE_RANGE));
    };

    "missing layer or atlas is outside"_test = [] {
        expect(sdf::sdfTexture({5.0f, 5.0f}, {0.0f, 0.0f}, {10.0f, 10.0f}, 3, nullptr, 1.0f) > 0.0f);
    };
};

suite sdf_glyph_tests = [] {
    // 4x4 page of 2x2 cells: glyph 3 is the bottom-right cell
    auto makeAtlas = [] {
        auto atlas = GlyphAtlas::create(4u, 2u);
        std::vector<uint8_t> page(4 * 4 * 4, 0);
        for (uint32_t y = 2; y < 4; ++y) {
            for (uint32_t x = 2; x < 4; ++x) {
                size_t idx = (size_t(y) * 4 + x) * 4;
                page[idx + 0] = 255;
                page[idx + 1] = 255;
                page[idx + 2] = 255;
                page[idx + 3] = 255;
            }
        }
        if (atlas) {
            auto added = (*atlas)->addPage(page.data(), 4, 4);
            expect(added.has_value());
        }
        return atlas;
    };

    "covered glyph cell is inside"_test = [makeAtlas] {
        auto atlas = makeAtlas();
        expect(atlas.has_value() >> fatal);
        expect(near(sdf::glyph({5.0f, 5.0f}, {0.0f, 0.0f}, 10.0f, 3, atlas->get()), -1.0f));
    };

    "empty glyph cell is outside"_test = [makeAtlas] {
        auto atlas = makeAtlas();
        expect(atlas.has_value() >> fatal);
        expect(near(sdf::glyph({5.0f, 5.0f}, {0.0f, 0.0f}, 10.0f, 0, atlas->get()), 1.0f));
    };

    "outside the glyph quad is outside"_test = [makeAtlas] {
        auto atlas = makeAtlas();
        expect(atlas.has_value() >> fatal);
        expect(sdf::glyph({20.0f, 5.0f}, {0.0f, 0.0f}, 10.0f, 3, atlas->get()) == 1.0f);
    };

    "glyph on a missing page is outside"_test = [makeAtlas] {
        auto atlas = makeAtlas();
        expect(atlas.has_value() >> fatal);
        expect(near(sdf::glyph({5.0f, 5.0f}, {0.0f, 0.0f}, 10.0f, 4, atlas->get()), 1.0f));
        expect(sdf::glyph({5.0f, 5.0f}, {0.0f, 0.0f}, 10.0f, 3, nullptr) == 1.0f);
    };
};
