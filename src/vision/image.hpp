#pragma once
// =============================================================================
// Image primitives - decode/encode via stb, crops, colour spaces, edges
// =============================================================================

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "result.hpp"

namespace rampart::vision {

// Interleaved 8-bit RGB, stride = w * 3
struct RgbImage {
    int w = 0;
    int h = 0;
    std::vector<uint8_t> pix;

    RgbImage() = default;
    RgbImage(int width, int height) : w(width), h(height), pix(static_cast<size_t>(width) * height * 3, 0) {}

    bool empty() const { return w <= 0 || h <= 0 || pix.empty(); }
    const uint8_t* at(int x, int y) const { return &pix[(static_cast<size_t>(y) * w + x) * 3]; }
    uint8_t* at(int x, int y) { return &pix[(static_cast<size_t>(y) * w + x) * 3]; }
};

struct Gray8 {
    int w = 0;
    int h = 0;
    std::vector<uint8_t> pix;

    Gray8() = default;
    Gray8(int width, int height) : w(width), h(height), pix(static_cast<size_t>(width) * height, 0) {}

    bool empty() const { return w <= 0 || h <= 0 || pix.empty(); }
    uint8_t at(int x, int y) const { return pix[static_cast<size_t>(y) * w + x]; }
};

struct Hsv {
    uint8_t h = 0;   // [0,180)
    uint8_t s = 0;
    uint8_t v = 0;
};

// --- stb codecs ---
Result<RgbImage> decodeImage(const uint8_t* data, size_t size);
Result<RgbImage> loadImageFile(const std::string& path_utf8);
Result<void> writePng(const std::string& path_utf8, const RgbImage& img);
Result<void> writePng(const std::string& path_utf8, const Gray8& img);
std::vector<uint8_t> encodePng(const RgbImage& img);

// Region clipped to the image; empty result if nothing overlaps
RgbImage crop(const RgbImage& img, int x, int y, int w, int h);

// ITU-R BT.601 luma in fixed point
inline uint8_t rgbToGray(uint8_t r, uint8_t g, uint8_t b) {
    return static_cast<uint8_t>((77 * r + 150 * g + 29 * b + 128) >> 8);
}

Gray8 toGray(const RgbImage& img);
double meanBrightness(const Gray8& img);

// OpenCV 8-bit convention: H = degrees / 2
Hsv rgbToHsv(uint8_t r, uint8_t g, uint8_t b);

// Bilinear
Gray8 resize(const Gray8& img, int w, int h);

// Sobel 3x3, L1 magnitude, non-maximum suppression, hysteresis; output 0/255
Gray8 canny(const Gray8& img, double low_threshold, double high_threshold);

// Normalized correlation coefficient of two equally sized images in [-1,1];
// 0 when either image is flat or sizes differ
float correlationCoefficient(const Gray8& a, const Gray8& b);

} // namespace rampart::vision
