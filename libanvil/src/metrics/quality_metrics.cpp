#include "../../include/quality_metrics.hpp"
#include "../../include/errors.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <string>
#include <vector>

namespace anvil {

namespace {

void require_same_geometry(const PixelGrid& a, const PixelGrid& b) {
    if (a.width != b.width || a.height != b.height) {
        throw DimensionMismatchError("image dimensions must match: " +
                                     std::to_string(a.width) + "x" + std::to_string(a.height) + " vs " +
                                     std::to_string(b.width) + "x" + std::to_string(b.height));
    }
    if (!a.is_consistent() || !b.is_consistent()) {
        throw DimensionMismatchError("pixel buffer length does not match image dimensions");
    }
}

std::vector<double> luma_plane(const PixelGrid& img) {
    std::vector<double> plane(img.pixel_count());
    const uint8_t* p = img.rgba.data();
    for (std::size_t i = 0; i < plane.size(); ++i, p += 4) {
        plane[i] = luminance(p[0], p[1], p[2]);
    }
    return plane;
}

// SSIM of one window of a luma plane pair
double window_ssim(const std::vector<double>& l1, const std::vector<double>& l2,
                   const std::size_t stride,
                   const std::size_t x0, const std::size_t y0,
                   const std::size_t w, const std::size_t h) {
    const auto n = static_cast<double>(w * h);

    double sum1 = 0.0;
    double sum2 = 0.0;
    for (std::size_t y = y0; y < y0 + h; ++y) {
        for (std::size_t x = x0; x < x0 + w; ++x) {
            sum1 += l1[y * stride + x];
            sum2 += l2[y * stride + x];
        }
    }
    const double mu1 = sum1 / n;
    const double mu2 = sum2 / n;

    double var1 = 0.0;
    double var2 = 0.0;
    double cov = 0.0;
    for (std::size_t y = y0; y < y0 + h; ++y) {
        for (std::size_t x = x0; x < x0 + w; ++x) {
            const double d1 = l1[y * stride + x] - mu1;
            const double d2 = l2[y * stride + x] - mu2;
            var1 += d1 * d1;
            var2 += d2 * d2;
            cov += d1 * d2;
        }
    }
    var1 /= n;
    var2 /= n;
    cov /= n;

    return ((2.0 * mu1 * mu2 + kSsimC1) * (2.0 * cov + kSsimC2)) /
           ((mu1 * mu1 + mu2 * mu2 + kSsimC1) * (var1 + var2 + kSsimC2));
}

double linearize(const double c) noexcept {
    return c > 0.04045 ? std::pow((c + 0.055) / 1.055, 2.4) : c / 12.92;
}

double lab_f(const double t) noexcept {
    return t > 0.008856 ? std::cbrt(t) : 7.787 * t + 16.0 / 116.0;
}

std::vector<double> sobel_magnitude(const PixelGrid& img) {
    const std::size_t w = img.width;
    const std::size_t h = img.height;
    const auto luma = luma_plane(img);
    std::vector<double> mag(w * h, 0.0);
    if (w < 3 || h < 3) return mag;

    for (std::size_t y = 1; y + 1 < h; ++y) {
        for (std::size_t x = 1; x + 1 < w; ++x) {
            const double tl = luma[(y - 1) * w + x - 1];
            const double tc = luma[(y - 1) * w + x];
            const double tr = luma[(y - 1) * w + x + 1];
            const double ml = luma[y * w + x - 1];
            const double mr = luma[y * w + x + 1];
            const double bl = luma[(y + 1) * w + x - 1];
            const double bc = luma[(y + 1) * w + x];
            const double br = luma[(y + 1) * w + x + 1];

            const double gx = (tr + 2.0 * mr + br) - (tl + 2.0 * ml + bl);
            const double gy = (bl + 2.0 * bc + br) - (tl + 2.0 * tc + tr);
            mag[y * w + x] = std::sqrt(gx * gx + gy * gy) / 255.0;
        }
    }
    return mag;
}

} // namespace

double compute_ssim(const PixelGrid& reference, const PixelGrid& candidate) {
    require_same_geometry(reference, candidate);
    if (reference.pixel_count() == 0) {
        return 1.0;
    }

    const auto l1 = luma_plane(reference);
    const auto l2 = luma_plane(candidate);
    const std::size_t w = reference.width;
    const std::size_t h = reference.height;

    double total = 0.0;
    std::size_t blocks = 0;
    for (std::size_t y = 0; y + kSsimBlockSize <= h; y += kSsimBlockSize) {
        for (std::size_t x = 0; x + kSsimBlockSize <= w; x += kSsimBlockSize) {
            total += window_ssim(l1, l2, w, x, y, kSsimBlockSize, kSsimBlockSize);
            ++blocks;
        }
    }

    // thumbnails smaller than one block
    if (blocks == 0) {
        total = window_ssim(l1, l2, w, 0, 0, w, h);
        blocks = 1;
    }

    return std::clamp(total / static_cast<double>(blocks), 0.0, 1.0);
}

double compute_psnr(const PixelGrid& reference, const PixelGrid& candidate) {
    require_same_geometry(reference, candidate);

    double sq_sum = 0.0;
    std::size_t count = 0;
    const auto& a = reference.rgba;
    const auto& b = candidate.rgba;
    for (std::size_t i = 0; i < a.size(); i += 4) {
        for (std::size_t c = 0; c < 3; ++c) {
            const double d = static_cast<double>(a[i + c]) - static_cast<double>(b[i + c]);
            sq_sum += d * d;
        }
        count += 3;
    }

    if (count == 0 || sq_sum == 0.0) {
        return std::numeric_limits<double>::infinity();
    }
    const double mse = sq_sum / static_cast<double>(count);
    return 20.0 * std::log10(255.0 / std::sqrt(mse));
}

Lab srgb_to_lab(const uint8_t r, const uint8_t g, const uint8_t b) noexcept {
    const double rl = linearize(r / 255.0);
    const double gl = linearize(g / 255.0);
    const double bl = linearize(b / 255.0);

    // linear sRGB -> XYZ, normalized by the D65 white point
    const double x = (rl * 0.4124564 + gl * 0.3575761 + bl * 0.1804375) / 0.95047;
    const double y = (rl * 0.2126729 + gl * 0.7151522 + bl * 0.0721750) / 1.00000;
    const double z = (rl * 0.0193339 + gl * 0.1191920 + bl * 0.9503041) / 1.08883;

    const double fx = lab_f(x);
    const double fy = lab_f(y);
    const double fz = lab_f(z);

    return Lab{116.0 * fy - 16.0, 500.0 * (fx - fy), 200.0 * (fy - fz)};
}

double compute_delta_e(const PixelGrid& reference, const PixelGrid& candidate, std::size_t stride) {
    require_same_geometry(reference, candidate);
    if (stride == 0) stride = 1;

    double sum = 0.0;
    std::size_t count = 0;
    const std::size_t n = reference.pixel_count();
    for (std::size_t i = 0; i < n; i += stride) {
        const uint8_t* p = reference.rgba.data() + i * 4;
        const uint8_t* q = candidate.rgba.data() + i * 4;
        if (p[0] == q[0] && p[1] == q[1] && p[2] == q[2]) {
            ++count;
            continue;
        }
        const Lab l1 = srgb_to_lab(p[0], p[1], p[2]);
        const Lab l2 = srgb_to_lab(q[0], q[1], q[2]);
        const double dl = l1.l - l2.l;
        const double da = l1.a - l2.a;
        const double db = l1.b - l2.b;
        sum += std::sqrt(dl * dl + da * da + db * db);
        ++count;
    }
    return count > 0 ? sum / static_cast<double>(count) : 0.0;
}

double compute_edge_preservation(const PixelGrid& reference, const PixelGrid& candidate) {
    require_same_geometry(reference, candidate);

    const auto e1 = sobel_magnitude(reference);
    const auto e2 = sobel_magnitude(candidate);

    std::size_t edges = 0;
    std::size_t preserved = 0;
    for (std::size_t i = 0; i < e1.size(); ++i) {
        if (e1[i] > kEdgeThreshold || e2[i] > kEdgeThreshold) {
            ++edges;
            if (std::abs(e1[i] - e2[i]) < kEdgeThreshold) {
                ++preserved;
            }
        }
    }
    return edges > 0 ? static_cast<double>(preserved) / static_cast<double>(edges) : 1.0;
}

QualityMetrics compute_quality_metrics(const PixelGrid& reference, const PixelGrid& candidate) {
    require_same_geometry(reference, candidate);
    QualityMetrics m;
    m.ssim = compute_ssim(reference, candidate);
    m.psnr = compute_psnr(reference, candidate);
    m.delta_e = compute_delta_e(reference, candidate);
    m.edge_preservation = compute_edge_preservation(reference, candidate);
    return m;
}

} // namespace anvil
