#ifndef ANVIL_PIXEL_GRID_HPP
#define ANVIL_PIXEL_GRID_HPP

#include <cstddef>
#include <cstdint>
#include <vector>

namespace anvil {

/**
 * @brief A decoded RGBA image, row-major, 4 bytes per pixel, no padding.
 */
struct PixelGrid {
    uint32_t width = 0;        ///< Width in pixels
    uint32_t height = 0;       ///< Height in pixels
    std::vector<uint8_t> rgba; ///< width * height * 4 bytes

    PixelGrid() = default;

    /// Allocates a zero-filled (transparent black) grid.
    PixelGrid(const uint32_t w, const uint32_t h)
        : width(w), height(h), rgba(static_cast<std::size_t>(w) * h * 4, 0) {}

    [[nodiscard]] std::size_t pixel_count() const noexcept {
        return static_cast<std::size_t>(width) * height;
    }

    /// True when the buffer length matches the declared geometry.
    [[nodiscard]] bool is_consistent() const noexcept {
        return rgba.size() == pixel_count() * 4;
    }

    [[nodiscard]] uint8_t* pixel(const uint32_t x, const uint32_t y) noexcept {
        return rgba.data() + (static_cast<std::size_t>(y) * width + x) * 4;
    }

    [[nodiscard]] const uint8_t* pixel(const uint32_t x, const uint32_t y) const noexcept {
        return rgba.data() + (static_cast<std::size_t>(y) * width + x) * 4;
    }

    /// True if any pixel is not fully opaque.
    [[nodiscard]] bool has_transparency() const noexcept {
        for (std::size_t i = 3; i < rgba.size(); i += 4) {
            if (rgba[i] < 255) return true;
        }
        return false;
    }
};

/**
 * @brief One frame of an animation as composited on the canvas.
 */
struct DecodedFrame {
    PixelGrid grid;          ///< Full-canvas pixels
    uint32_t delay_ms = 100; ///< Display duration
};

/**
 * @brief ITU-R BT.601 luma of an 8-bit RGB triple.
 */
inline double luminance(const uint8_t r, const uint8_t g, const uint8_t b) noexcept {
    return 0.299 * r + 0.587 * g + 0.114 * b;
}

} // namespace anvil

#endif // ANVIL_PIXEL_GRID_HPP
