// =============================================================================
// Image primitives
// =============================================================================
#include "vision/image.hpp"
#include "rampart_log.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <limits>

// Implementation macros live in stb_image_impl.cpp
#include <stb_image.h>
#include <stb_image_write.h>

static constexpr const char* TAG = "image";

namespace rampart::vision {

// =============================================================================
// Codecs
// =============================================================================

Result<RgbImage> decodeImage(const uint8_t* data, size_t size) {
    if (data == nullptr || size == 0) {
        return Err<RgbImage>("empty image buffer", ErrorCode::PerceptionDecodeError);
    }
    if (size > static_cast<size_t>(std::numeric_limits<int>::max())) {
        return Err<RgbImage>("image buffer too large", ErrorCode::PerceptionDecodeError);
    }

    int w = 0, h = 0, channels = 0;
    unsigned char* px = stbi_load_from_memory(data, static_cast<int>(size), &w, &h, &channels, 3);
    if (!px) {
        const char* why = stbi_failure_reason();
        return Err<RgbImage>(std::string("decode failed: ") + (why ? why : "unknown"),
                             ErrorCode::PerceptionDecodeError);
    }

    RgbImage img;
    img.w = w;
    img.h = h;
    img.pix.assign(px, px + static_cast<size_t>(w) * h * 3);
    stbi_image_free(px);
    return img;
}

Result<RgbImage> loadImageFile(const std::string& path_utf8) {
    int w = 0, h = 0, channels = 0;
    unsigned char* px = stbi_load(path_utf8.c_str(), &w, &h, &channels, 3);
    if (!px) {
        std::string err = "stbi_load failed: " + path_utf8;
        RLOG_ERROR(TAG, "%s", err.c_str());
        return Err<RgbImage>(err, ErrorCode::IoError);
    }
    RgbImage img;
    img.w = w;
    img.h = h;
    img.pix.assign(px, px + static_cast<size_t>(w) * h * 3);
    stbi_image_free(px);
    return img;
}

Result<void> writePng(const std::string& path_utf8, const RgbImage& img) {
    if (img.empty()) return Error("invalid image", ErrorCode::InvalidArgument);
    if (stbi_write_png(path_utf8.c_str(), img.w, img.h, 3, img.pix.data(), img.w * 3) == 0) {
        std::string err = "stbi_write_png failed: " + path_utf8;
        RLOG_ERROR(TAG, "%s", err.c_str());
        return Error(err, ErrorCode::IoError);
    }
    return Ok();
}

Result<void> writePng(const std::string& path_utf8, const Gray8& img) {
    if (img.empty()) return Error("invalid image", ErrorCode::InvalidArgument);
    if (stbi_write_png(path_utf8.c_str(), img.w, img.h, 1, img.pix.data(), img.w) == 0) {
        std::string err = "stbi_write_png failed: " + path_utf8;
        RLOG_ERROR(TAG, "%s", err.c_str());
        return Error(err, ErrorCode::IoError);
    }
    return Ok();
}

static void appendToVector(void* context, void* data, int size) {
    auto* out = static_cast<std::vector<uint8_t>*>(context);
    auto* bytes = static_cast<const uint8_t*>(data);
    out->insert(out->end(), bytes, bytes + size);
}

std::vector<uint8_t> encodePng(const RgbImage& img) {
    std::vector<uint8_t> out;
    if (img.empty()) return out;
    if (stbi_write_png_to_func(appendToVector, &out, img.w, img.h, 3, img.pix.data(), img.w * 3) == 0) {
        RLOG_ERROR(TAG, "PNG encode failed (%dx%d)", img.w, img.h);
        out.clear();
    }
    return out;
}

// =============================================================================
// Geometry / colour
// =============================================================================

RgbImage crop(const RgbImage& img, int x, int y, int w, int h) {
    int x0 = std::max(0, x);
    int y0 = std::max(0, y);
    int x1 = std::min(img.w, x + w);
    int y1 = std::min(img.h, y + h);
    if (x1 <= x0 || y1 <= y0) return RgbImage{};

    RgbImage out(x1 - x0, y1 - y0);
    const size_t row_bytes = static_cast<size_t>(out.w) * 3;
    for (int row = 0; row < out.h; ++row) {
        std::copy_n(img.at(x0, y0 + row), row_bytes, out.at(0, row));
    }
    return out;
}

Gray8 toGray(const RgbImage& img) {
    Gray8 g(img.w, img.h);
    const size_t n = static_cast<size_t>(img.w) * img.h;
    for (size_t i = 0; i < n; ++i) {
        g.pix[i] = rgbToGray(img.pix[i * 3 + 0], img.pix[i * 3 + 1], img.pix[i * 3 + 2]);
    }
    return g;
}

double meanBrightness(const Gray8& img) {
    if (img.empty()) return 0.0;
    uint64_t sum = 0;
    for (uint8_t p : img.pix) sum += p;
    return static_cast<double>(sum) / static_cast<double>(img.pix.size());
}

Hsv rgbToHsv(uint8_t r, uint8_t g, uint8_t b) {
    const int vmax = std::max({r, g, b});
    const int vmin = std::min({r, g, b});
    const int diff = vmax - vmin;

    Hsv out;
    out.v = static_cast<uint8_t>(vmax);
    out.s = vmax == 0 ? 0 : static_cast<uint8_t>(std::lround(255.0 * diff / vmax));

    if (diff == 0) {
        out.h = 0;
        return out;
    }
    double h;
    if (vmax == r)      h = 60.0 * (g - b) / diff;
    else if (vmax == g) h = 120.0 + 60.0 * (b - r) / diff;
    else                h = 240.0 + 60.0 * (r - g) / diff;
    if (h < 0) h += 360.0;

    long hh = std::lround(h / 2.0);
    if (hh >= 180) hh -= 180;
    out.h = static_cast<uint8_t>(hh);
    return out;
}

Gray8 resize(const Gray8& img, int w, int h) {
    if (img.empty() || w <= 0 || h <= 0) return Gray8{};
    if (img.w == w && img.h == h) return img;

    Gray8 out(w, h);
    const double sx = static_cast<double>(img.w) / w;
    const double sy = static_cast<double>(img.h) / h;
    for (int y = 0; y < h; ++y) {
        double fy = std::clamp((y + 0.5) * sy - 0.5, 0.0, static_cast<double>(img.h - 1));
        int y0 = static_cast<int>(fy);
        int y1 = std::min(y0 + 1, img.h - 1);
        double wy = fy - y0;
        for (int x = 0; x < w; ++x) {
            double fx = std::clamp((x + 0.5) * sx - 0.5, 0.0, static_cast<double>(img.w - 1));
            int x0 = static_cast<int>(fx);
            int x1 = std::min(x0 + 1, img.w - 1);
            double wx = fx - x0;
            double top = img.at(x0, y0) * (1.0 - wx) + img.at(x1, y0) * wx;
            double bot = img.at(x0, y1) * (1.0 - wx) + img.at(x1, y1) * wx;
            out.pix[static_cast<size_t>(y) * w + x] =
                static_cast<uint8_t>(std::lround(top * (1.0 - wy) + bot * wy));
        }
    }
    return out;
}

// =============================================================================
// Canny
// =============================================================================

Gray8 canny(const Gray8& img, double low_threshold, double high_threshold) {
    Gray8 edges(img.w, img.h);
    if (img.w < 3 || img.h < 3) return edges;
    if (low_threshold > high_threshold) std::swap(low_threshold, high_threshold);

    const int w = img.w;
    const int h = img.h;
    std::vector<int> gx(static_cast<size_t>(w) * h, 0);
    std::vector<int> gy(static_cast<size_t>(w) * h, 0);
    std::vector<int> mag(static_cast<size_t>(w) * h, 0);

    auto px = [&](int x, int y) -> int {
        x = std::clamp(x, 0, w - 1);
        y = std::clamp(y, 0, h - 1);
        return img.at(x, y);
    };

    for (int y = 0; y < h; ++y) {
        for (int x = 0; x < w; ++x) {
            int dx = (px(x + 1, y - 1) + 2 * px(x + 1, y) + px(x + 1, y + 1))
                   - (px(x - 1, y - 1) + 2 * px(x - 1, y) + px(x - 1, y + 1));
            int dy = (px(x - 1, y + 1) + 2 * px(x, y + 1) + px(x + 1, y + 1))
                   - (px(x - 1, y - 1) + 2 * px(x, y - 1) + px(x + 1, y - 1));
            size_t i = static_cast<size_t>(y) * w + x;
            gx[i] = dx;
            gy[i] = dy;
            mag[i] = std::abs(dx) + std::abs(dy);
        }
    }

    // 0 = none, 1 = weak, 2 = strong
    std::vector<uint8_t> label(static_cast<size_t>(w) * h, 0);
    constexpr double TAN22 = 0.41421356;
    constexpr double TAN67 = 2.41421356;
    std::vector<size_t> stack;

    for (int y = 1; y < h - 1; ++y) {
        for (int x = 1; x < w - 1; ++x) {
            size_t i = static_cast<size_t>(y) * w + x;
            int m = mag[i];
            if (m <= low_threshold) continue;

            double ax = std::abs(gx[i]);
            double ay = std::abs(gy[i]);
            int n1, n2;
            if (ay <= ax * TAN22) {
                n1 = mag[i - 1];
                n2 = mag[i + 1];
            } else if (ay >= ax * TAN67) {
                n1 = mag[i - w];
                n2 = mag[i + w];
            } else if ((gx[i] > 0) == (gy[i] > 0)) {
                n1 = mag[i - w - 1];
                n2 = mag[i + w + 1];
            } else {
                n1 = mag[i - w + 1];
                n2 = mag[i + w - 1];
            }
            if (m > n1 && m >= n2) {
                if (m > high_threshold) {
                    label[i] = 2;
                    stack.push_back(i);
                } else {
                    label[i] = 1;
                }
            }
        }
    }

    // Hysteresis: grow strong edges through 8-connected weak ones
    while (!stack.empty()) {
        size_t i = stack.back();
        stack.pop_back();
        edges.pix[i] = 255;
        int x = static_cast<int>(i % w);
        int y = static_cast<int>(i / w);
        for (int dy = -1; dy <= 1; ++dy) {
            for (int dx = -1; dx <= 1; ++dx) {
                int nx = x + dx, ny = y + dy;
                if (nx < 0 || ny < 0 || nx >= w || ny >= h) continue;
                size_t j = static_cast<size_t>(ny) * w + nx;
                if (label[j] == 1) {
                    label[j] = 2;
                    stack.push_back(j);
                }
            }
        }
    }
    return edges;
}

// =============================================================================
// Correlation
// =============================================================================

float correlationCoefficient(const Gray8& a, const Gray8& b) {
    if (a.empty() || b.empty() || a.w != b.w || a.h != b.h) return 0.0f;

    const size_t n = a.pix.size();
    double mean_a = 0, mean_b = 0;
    for (size_t i = 0; i < n; ++i) {
        mean_a += a.pix[i];
        mean_b += b.pix[i];
    }
    mean_a /= n;
    mean_b /= n;

    double cov = 0, var_a = 0, var_b = 0;
    for (size_t i = 0; i < n; ++i) {
        double da = a.pix[i] - mean_a;
        double db = b.pix[i] - mean_b;
        cov += da * db;
        var_a += da * da;
        var_b += db * db;
    }
    if (var_a <= 0.0 || var_b <= 0.0) return 0.0f;
    return static_cast<float>(cov / std::sqrt(var_a * var_b));
}

} // namespace rampart::vision
