#include "core/color_space.hpp"
#include <cmath>
#include <algorithm>

namespace codevis {

namespace {

constexpr float kPi = 3.14159265358979323846f;
constexpr double kGoldenFraction = 0.6180339887498949;
// Chroma added to every color so grays still pick up a per-file tint.
constexpr float kTintChroma = 0.05f;

}

float ColorSpace::srgb_decode_lut_[256];
uint8_t ColorSpace::srgb_encode_lut_[4096];
bool ColorSpace::initialized_ = false;

void ColorSpace::init() {
    if (initialized_) return;

    for (int i = 0; i < 256; ++i) {
        srgb_decode_lut_[i] = srgb_decode(static_cast<uint8_t>(i));
    }

    for (int i = 0; i < 4096; ++i) {
        srgb_encode_lut_[i] = srgb_encode(i / 4095.0f);
    }

    initialized_ = true;
}

float ColorSpace::srgb_decode(uint8_t c) {
    float cv = c / 255.0f;
    if (cv <= 0.04045f) {
        return cv / 12.92f;
    }
    return std::pow((cv + 0.055f) / 1.055f, 2.4f);
}

uint8_t ColorSpace::srgb_encode(float c) {
    c = std::clamp(c, 0.0f, 1.0f);
    float result;
    if (c <= 0.0031308f) {
        result = 12.92f * c;
    } else {
        result = 1.055f * std::pow(c, 1.0f / 2.4f) - 0.055f;
    }
    return static_cast<uint8_t>(std::clamp(std::round(result * 255.0f), 0.0f, 255.0f));
}

float ColorSpace::srgb_to_linear(uint8_t srgb) {
    if (initialized_) {
        return srgb_decode_lut_[srgb];
    }
    return srgb_decode(srgb);
}

uint8_t ColorSpace::linear_to_srgb(float linear) {
    if (initialized_) {
        int idx = static_cast<int>(std::clamp(linear, 0.0f, 1.0f) * 4095.0f + 0.5f);
        return srgb_encode_lut_[idx];
    }
    return srgb_encode(linear);
}

OKLab ColorSpace::to_oklab(const LinearColor& linear) {
    float l = 0.4122214708f * linear.r + 0.5363325363f * linear.g + 0.0514459929f * linear.b;
    float m = 0.2119034982f * linear.r + 0.6806995451f * linear.g + 0.1073969566f * linear.b;
    float s = 0.0883024619f * linear.r + 0.2817188376f * linear.g + 0.6299787005f * linear.b;

    float l_ = std::cbrt(l);
    float m_ = std::cbrt(m);
    float s_ = std::cbrt(s);

    return {0.2104542553f * l_ + 0.7936177850f * m_ - 0.0040720468f * s_,
            1.9779984951f * l_ - 2.4285922050f * m_ + 0.4505937099f * s_,
            0.0259040371f * l_ + 0.7827717662f * m_ - 0.8086757660f * s_};
}

OKLab ColorSpace::srgb_to_oklab(const Color& c) {
    return to_oklab({srgb_to_linear(c.r), srgb_to_linear(c.g), srgb_to_linear(c.b)});
}

LinearColor ColorSpace::from_oklab(const OKLab& lab) {
    float l_ = lab.L + 0.3963377774f * lab.a + 0.2158037573f * lab.b;
    float m_ = lab.L - 0.1055613458f * lab.a - 0.0638541728f * lab.b;
    float s_ = lab.L - 0.0894841775f * lab.a - 1.2914855480f * lab.b;

    float l = l_ * l_ * l_;
    float m = m_ * m_ * m_;
    float s = s_ * s_ * s_;

    float r = 4.0767416621f * l - 3.3077115913f * m + 0.2309699292f * s;
    float g = -1.2684380046f * l + 2.3809276044f * m - 0.0913817355f * s;
    float b = -0.0041960863f * l - 0.0748454739f * m + 1.0915434158f * s;

    return {std::clamp(r, 0.0f, 1.0f),
            std::clamp(g, 0.0f, 1.0f),
            std::clamp(b, 0.0f, 1.0f)};
}

Color ColorSpace::oklab_to_srgb(const OKLab& lab) {
    LinearColor linear = from_oklab(lab);
    return Color(linear_to_srgb(linear.r), linear_to_srgb(linear.g), linear_to_srgb(linear.b));
}

Color ColorSpace::modulate(const Color& c, std::size_t file_index, float amount) {
    if (amount <= 0.0f) return c;
    amount = std::min(amount, 1.0f);

    // Golden-ratio sequence keeps neighbouring files far apart on the hue wheel.
    double phase = std::fmod(static_cast<double>(file_index) * kGoldenFraction, 1.0);
    float theta = static_cast<float>(phase) * 2.0f * kPi;
    float angle = (static_cast<float>(phase) * 2.0f - 1.0f) * kPi * amount;

    OKLab lab = srgb_to_oklab(c);
    const float cos_a = std::cos(angle);
    const float sin_a = std::sin(angle);
    OKLab shifted(lab.L,
                  lab.a * cos_a - lab.b * sin_a + kTintChroma * amount * std::cos(theta),
                  lab.a * sin_a + lab.b * cos_a + kTintChroma * amount * std::sin(theta));
    return oklab_to_srgb(shifted);
}

}
