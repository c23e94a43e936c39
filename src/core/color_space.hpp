#pragma once

#include "core/types.hpp"
#include <cstddef>
#include <cstdint>
#include <cmath>

namespace codevis {

struct LinearColor {
    float r = 0.0f;
    float g = 0.0f;
    float b = 0.0f;

    LinearColor() = default;
    LinearColor(float r, float g, float b) : r(r), g(g), b(b) {}
};

struct OKLab {
    float L = 0.0f;
    float a = 0.0f;
    float b = 0.0f;

    OKLab() = default;
    OKLab(float L, float a, float b) : L(L), a(a), b(b) {}
};

class ColorSpace {
public:
    // Builds the sRGB lookup tables. Must run before any worker thread starts.
    static void init();

    static float srgb_to_linear(uint8_t srgb);
    static uint8_t linear_to_srgb(float linear);

    static OKLab to_oklab(const LinearColor& linear);
    static OKLab srgb_to_oklab(const Color& c);

    static LinearColor from_oklab(const OKLab& lab);
    static Color oklab_to_srgb(const OKLab& lab);

    // Shifts the hue of `c` by an amount derived from `file_index`, scaled by
    // `amount` in [0, 1]. An amount of 0 returns `c` unchanged.
    static Color modulate(const Color& c, std::size_t file_index, float amount);

private:
    static float srgb_decode_lut_[256];
    static uint8_t srgb_encode_lut_[4096];
    static bool initialized_;

    static float srgb_decode(uint8_t c);
    static uint8_t srgb_encode(float c);
};

}
