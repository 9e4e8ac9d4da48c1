#include "../../include/png_io.hpp"
#include "../../include/errors.hpp"
#include "../../include/logger.hpp"
#include <png.h>
#include <zlib.h>
#include <cstring>
#include <string>

namespace anvil {

namespace {
    /**
     * @brief libpng error handler that throws a C++ exception.
     * @param msg The error message from libpng.
     */
    void png_error_fn(png_structp, const png_const_charp msg) {
        Logger::log(LogLevel::Error, std::string("libpng: ") + msg, "libpng");
        throw std::runtime_error(msg);
    }

    /**
     * @brief libpng warning handler.
     * @param msg The warning message from libpng.
     */
    void png_warning_fn(png_structp, const png_const_charp msg) {
        Logger::log(LogLevel::Debug, std::string("libpng: ") + msg, "libpng");
    }

    /**
     * @brief RAII wrapper for libpng read structs (png_structp, png_infop).
     */
    struct PngRead {
        png_structp png = nullptr;
        png_infop info = nullptr;

        ~PngRead() {
            if (png || info) png_destroy_read_struct(&png, &info, nullptr);
        }
    };

    /**
     * @brief RAII wrapper for libpng write structs (png_structp, png_infop).
     */
    struct PngWrite {
        png_structp png = nullptr;
        png_infop info = nullptr;

        ~PngWrite() {
            if (png || info) png_destroy_write_struct(&png, &info);
        }
    };

    // in-memory source for png_set_read_fn
    struct ReadCursor {
        std::span<const uint8_t> data;
        std::size_t pos = 0;
    };

    void read_from_span(png_structp png, png_bytep out, const png_size_t length) {
        auto* cursor = static_cast<ReadCursor*>(png_get_io_ptr(png));
        if (cursor->pos + length > cursor->data.size()) {
            png_error(png, "unexpected end of PNG data");
        }
        std::memcpy(out, cursor->data.data() + cursor->pos, length);
        cursor->pos += length;
    }

    void write_to_vector(png_structp png, png_bytep in, const png_size_t length) {
        auto* out = static_cast<std::vector<uint8_t>*>(png_get_io_ptr(png));
        out->insert(out->end(), in, in + length);
    }

    void flush_noop(png_structp) {}
}

bool is_png(const std::span<const uint8_t> data) noexcept {
    return data.size() >= 8 && png_sig_cmp(data.data(), 0, 8) == 0;
}

std::vector<uint8_t> encode_png(const PixelGrid& grid) {
    if (grid.width == 0 || grid.height == 0 || !grid.is_consistent()) {
        throw CodecError("cannot encode an empty or inconsistent grid as PNG");
    }

    const bool alpha = grid.has_transparency();
    const int channels = alpha ? 4 : 3;
    std::vector<uint8_t> out;

    try {
        PngWrite wr;
        wr.png = png_create_write_struct(PNG_LIBPNG_VER_STRING, nullptr, png_error_fn, png_warning_fn);
        if (!wr.png) throw std::runtime_error("png_create_write_struct failed");
        wr.info = png_create_info_struct(wr.png);
        if (!wr.info) throw std::runtime_error("png_create_info_struct failed");

        png_set_write_fn(wr.png, &out, write_to_vector, flush_noop);

        // snapshots are short-lived, favour speed
        png_set_compression_level(wr.png, Z_BEST_SPEED);
        png_set_compression_strategy(wr.png, Z_DEFAULT_STRATEGY);

        png_set_IHDR(wr.png, wr.info, grid.width, grid.height, 8,
                     alpha ? PNG_COLOR_TYPE_RGBA : PNG_COLOR_TYPE_RGB,
                     PNG_INTERLACE_NONE, PNG_COMPRESSION_TYPE_BASE, PNG_FILTER_TYPE_BASE);
        png_write_info(wr.png, wr.info);

        std::vector<uint8_t> row(static_cast<std::size_t>(grid.width) * channels);
        for (uint32_t y = 0; y < grid.height; ++y) {
            const uint8_t* src = grid.pixel(0, y);
            if (alpha) {
                std::memcpy(row.data(), src, row.size());
            } else {
                for (uint32_t x = 0; x < grid.width; ++x) {
                    row[x * 3 + 0] = src[x * 4 + 0];
                    row[x * 3 + 1] = src[x * 4 + 1];
                    row[x * 3 + 2] = src[x * 4 + 2];
                }
            }
            png_write_row(wr.png, row.data());
        }
        png_write_end(wr.png, wr.info);
    } catch (const std::runtime_error& e) {
        throw CodecError(std::string("PNG encode failed: ") + e.what());
    }
    return out;
}

PixelGrid decode_png(const std::span<const uint8_t> data) {
    if (!is_png(data)) {
        throw DecodeError("not a PNG image");
    }

    try {
        PngRead rd;
        rd.png = png_create_read_struct(PNG_LIBPNG_VER_STRING, nullptr, png_error_fn, png_warning_fn);
        if (!rd.png) throw std::runtime_error("png_create_read_struct failed");
        rd.info = png_create_info_struct(rd.png);
        if (!rd.info) throw std::runtime_error("png_create_info_struct failed");

        ReadCursor cursor{data, 0};
        png_set_read_fn(rd.png, &cursor, read_from_span);
        png_read_info(rd.png, rd.info);

        png_uint_32 width = 0;
        png_uint_32 height = 0;
        int bit_depth = 0;
        int color_type = 0;
        png_get_IHDR(rd.png, rd.info, &width, &height, &bit_depth, &color_type, nullptr, nullptr, nullptr);

        if (bit_depth == 16) png_set_strip_16(rd.png);
        if (color_type == PNG_COLOR_TYPE_PALETTE) png_set_palette_to_rgb(rd.png);
        if (color_type == PNG_COLOR_TYPE_GRAY && bit_depth < 8) png_set_expand_gray_1_2_4_to_8(rd.png);
        if (png_get_valid(rd.png, rd.info, PNG_INFO_tRNS)) png_set_tRNS_to_alpha(rd.png);
        if (!(color_type & PNG_COLOR_MASK_ALPHA)) png_set_filler(rd.png, 0xFF, PNG_FILLER_AFTER);
        if (color_type == PNG_COLOR_TYPE_GRAY || color_type == PNG_COLOR_TYPE_GRAY_ALPHA) png_set_gray_to_rgb(rd.png);
        png_set_interlace_handling(rd.png);
        png_read_update_info(rd.png, rd.info);

        const std::size_t rowbytes = png_get_rowbytes(rd.png, rd.info);
        if (rowbytes != static_cast<std::size_t>(width) * 4) {
            throw std::runtime_error("rowbytes mismatch, expected RGBA8");
        }

        PixelGrid grid(width, height);
        std::vector<png_bytep> rows(height);
        for (png_uint_32 y = 0; y < height; ++y) {
            rows[y] = grid.pixel(0, y);
        }
        png_read_image(rd.png, rows.data());
        png_read_end(rd.png, nullptr);
        return grid;
    } catch (const std::runtime_error& e) {
        throw DecodeError(std::string("PNG decode failed: ") + e.what());
    }
}

} // namespace anvil
