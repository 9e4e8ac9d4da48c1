#include "../../include/palette.hpp"
#include "../../include/errors.hpp"
#include "../../include/logger.hpp"
#include "../../include/png_io.hpp"
#include <libimagequant.h>
#include <algorithm>
#include <memory>
#include <set>
#include <string>
#include <unordered_map>

namespace anvil {

namespace {
    struct LiqDelete {
        void operator()(liq_attr* p) const noexcept { liq_attr_destroy(p); }
        void operator()(liq_histogram* p) const noexcept { liq_histogram_destroy(p); }
        void operator()(liq_image* p) const noexcept { liq_image_destroy(p); }
        void operator()(liq_result* p) const noexcept { liq_result_destroy(p); }
    };
    template <typename T>
    using LiqPtr = std::unique_ptr<T, LiqDelete>;

    void check(const liq_error err, const char* what) {
        if (err != LIQ_OK) {
            Logger::log(LogLevel::Error, std::string(what) + " failed (liq_error " + std::to_string(err) + ")",
                        "webp_codec");
            throw CodecError(std::string(what) + " failed");
        }
    }

    LiqPtr<liq_attr> make_attr(const int max_colors) {
        LiqPtr<liq_attr> attr(liq_attr_create());
        if (!attr) {
            throw CodecError("liq_attr_create failed");
        }
        check(liq_set_max_colors(attr.get(), std::clamp(max_colors, 2, 256)), "liq_set_max_colors");
        return attr;
    }

    uint32_t pack(const uint8_t* p) noexcept {
        return (static_cast<uint32_t>(p[0]) << 16) | (static_cast<uint32_t>(p[1]) << 8) | p[2];
    }

    bool same_pixel(const uint8_t* p, const uint8_t* q) noexcept {
        return p[0] == q[0] && p[1] == q[1] && p[2] == q[2] && p[3] == q[3];
    }
}

Palette generate_palette(const std::span<const DecodedFrame> frames, uint32_t max_colors, const bool diff_stats) {
    max_colors = std::clamp<uint32_t>(max_colors, 1, 256);

    // color -> pixel count
    std::unordered_map<uint32_t, unsigned int> counts;
    const PixelGrid* previous = nullptr;
    for (const auto& frame : frames) {
        const auto& grid = frame.grid;
        const bool compare = diff_stats && previous && previous->width == grid.width &&
                             previous->height == grid.height;
        for (std::size_t i = 0; i < grid.rgba.size(); i += 4) {
            const uint8_t* p = grid.rgba.data() + i;
            if (p[3] <= kPaletteAlphaThreshold) continue;
            if (compare && same_pixel(p, previous->rgba.data() + i)) continue;
            ++counts[pack(p)];
        }
        previous = &grid;
    }

    Palette palette;
    if (counts.empty()) {
        // fully transparent input still needs one entry
        palette.colors.push_back({0, 0, 0});
        return palette;
    }

    std::vector<liq_histogram_entry> entries;
    entries.reserve(counts.size());
    for (const auto& [rgb, count] : counts) {
        liq_histogram_entry e{};
        e.color = liq_color{static_cast<unsigned char>(rgb >> 16), static_cast<unsigned char>(rgb >> 8),
                            static_cast<unsigned char>(rgb), 255};
        e.count = count;
        entries.push_back(e);
    }

    const auto attr = make_attr(static_cast<int>(max_colors));
    const LiqPtr<liq_histogram> histogram(liq_histogram_create(attr.get()));
    if (!histogram) {
        throw CodecError("liq_histogram_create failed");
    }
    check(liq_histogram_add_colors(histogram.get(), attr.get(), entries.data(), static_cast<int>(entries.size()), 0.0),
          "liq_histogram_add_colors");

    liq_result* raw = nullptr;
    check(liq_histogram_quantize(histogram.get(), attr.get(), &raw), "liq_histogram_quantize");
    const LiqPtr<liq_result> result(raw);

    const liq_palette* quantized = liq_get_palette(result.get());
    for (unsigned int i = 0; i < quantized->count && palette.colors.size() < max_colors; ++i) {
        const liq_color& c = quantized->entries[i];
        palette.colors.push_back({c.r, c.g, c.b});
    }
    Logger::log(LogLevel::Debug, "Palette of " + std::to_string(palette.colors.size()) + " colors from " +
                std::to_string(entries.size()) + " distinct", "webp_codec");
    return palette;
}

std::vector<uint8_t> encode_palette_png(const Palette& palette) {
    if (palette.colors.empty()) {
        throw CodecError("cannot store an empty palette");
    }
    PixelGrid grid(16, 16);
    for (std::size_t i = 0; i < 256; ++i) {
        const auto& c = palette.colors[std::min(i, palette.colors.size() - 1)];
        uint8_t* p = grid.rgba.data() + i * 4;
        p[0] = c[0];
        p[1] = c[1];
        p[2] = c[2];
        p[3] = 255;
    }
    return encode_png(grid);
}

Palette decode_palette_png(const std::span<const uint8_t> data) {
    const PixelGrid grid = decode_png(data);
    Palette palette;
    std::set<PaletteColor> seen;
    for (std::size_t i = 0; i < grid.rgba.size() && palette.colors.size() < 256; i += 4) {
        const PaletteColor c{grid.rgba[i], grid.rgba[i + 1], grid.rgba[i + 2]};
        if (seen.insert(c).second) {
            palette.colors.push_back(c);
        }
    }
    if (palette.colors.empty()) {
        throw DecodeError("palette image has no pixels");
    }
    return palette;
}

float dithering_level(const DitherMethod dither, const int bayer_scale) noexcept {
    switch (dither) {
        case DitherMethod::None:
            return 0.0f;
        case DitherMethod::Bayer:
            return static_cast<float>(5 - std::clamp(bayer_scale, 0, 5)) / 5.0f;
        case DitherMethod::FloydSteinberg:
            return 1.0f;
    }
    return 0.0f;
}

void apply_palette(PixelGrid& grid, const Palette& palette, const DitherMethod dither, const int bayer_scale) {
    if (palette.colors.empty() || grid.pixel_count() == 0) return;

    std::vector<uint8_t> indices(grid.pixel_count(), 0);
    std::vector<PaletteColor> mapped = palette.colors;
    // libimagequant needs at least two colors
    if (palette.colors.size() > 1) {
        const auto attr = make_attr(static_cast<int>(palette.colors.size()));
        const LiqPtr<liq_image> image(liq_image_create_rgba(attr.get(), grid.rgba.data(),
                                                            static_cast<int>(grid.width),
                                                            static_cast<int>(grid.height), 0.0));
        if (!image) {
            throw CodecError("liq_image_create_rgba failed");
        }
        // as many fixed colors as max_colors: the result is exactly the palette
        for (const auto& c : palette.colors) {
            check(liq_image_add_fixed_color(image.get(), liq_color{c[0], c[1], c[2], 255}),
                  "liq_image_add_fixed_color");
        }

        liq_result* raw = nullptr;
        check(liq_image_quantize(image.get(), attr.get(), &raw), "liq_image_quantize");
        const LiqPtr<liq_result> result(raw);
        check(liq_set_dithering_level(result.get(), dithering_level(dither, bayer_scale)),
              "liq_set_dithering_level");
        check(liq_write_remapped_image(result.get(), image.get(), indices.data(), indices.size()),
              "liq_write_remapped_image");

        const liq_palette* remapped = liq_get_palette(result.get());
        mapped.clear();
        for (unsigned int i = 0; i < remapped->count; ++i) {
            mapped.push_back({remapped->entries[i].r, remapped->entries[i].g, remapped->entries[i].b});
        }
    }

    for (std::size_t i = 0; i < indices.size(); ++i) {
        uint8_t* p = grid.rgba.data() + i * 4;
        if (p[3] <= kPaletteAlphaThreshold || indices[i] >= mapped.size()) continue;
        const auto& c = mapped[indices[i]];
        p[0] = c[0];
        p[1] = c[1];
        p[2] = c[2];
    }
}

} // namespace anvil
