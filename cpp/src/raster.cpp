#include "psrisk/raster.hpp"

#include <ft2build.h>
#include FT_FREETYPE_H
#include <png.h>

#include <algorithm>
#include <cmath>
#include <memory>
#include <stdexcept>

#include "psrisk/common.hpp"
#include "psrisk/errors.hpp"

namespace psrisk {

namespace {

using LibraryHandle = std::unique_ptr<FT_LibraryRec_, decltype(&FT_Done_FreeType)>;
using FaceHandle = std::unique_ptr<FT_FaceRec_, decltype(&FT_Done_Face)>;

constexpr char32_t kReplacementChar = 0xFFFD;

// Invalid sequences decode to U+FFFD one byte at a time.
std::vector<char32_t> decode_utf8(const std::string& text) {
    std::vector<char32_t> output;
    size_t index = 0;
    while (index < text.size()) {
        const auto lead = static_cast<unsigned char>(text[index]);
        int extra = 0;
        char32_t code = 0;
        if (lead < 0x80) {
            code = lead;
        } else if ((lead & 0xE0) == 0xC0) {
            extra = 1;
            code = lead & 0x1F;
        } else if ((lead & 0xF0) == 0xE0) {
            extra = 2;
            code = lead & 0x0F;
        } else if ((lead & 0xF8) == 0xF0) {
            extra = 3;
            code = lead & 0x07;
        } else {
            output.push_back(kReplacementChar);
            ++index;
            continue;
        }
        if (index + static_cast<size_t>(extra) >= text.size()) {
            output.push_back(kReplacementChar);
            ++index;
            continue;
        }
        bool valid = true;
        for (int offset = 1; offset <= extra; ++offset) {
            const auto next = static_cast<unsigned char>(text[index + static_cast<size_t>(offset)]);
            if ((next & 0xC0) != 0x80) {
                valid = false;
                break;
            }
            code = (code << 6) | (next & 0x3F);
        }
        if (!valid) {
            output.push_back(kReplacementChar);
            ++index;
            continue;
        }
        output.push_back(code);
        index += static_cast<size_t>(extra) + 1;
    }
    return output;
}

// Regular and bold faces loaded once per rasterize call; FreeType handles are not shared across threads.
class FontSet {
public:
    explicit FontSet(const RasterConfig& config)
        : library_(init_library()), regular_(load(config.font_path)),
          bold_(config.bold_font_path.empty() ? FaceHandle(nullptr, &FT_Done_Face) : load(config.bold_font_path)) {}

    FT_Face face(int weight) const { return weight >= 600 && bold_ ? bold_.get() : regular_.get(); }

private:
    static LibraryHandle init_library() {
        FT_Library library = nullptr;
        if (FT_Init_FreeType(&library) != 0) {
            throw ComputationError("FreeType could not be initialised");
        }
        return LibraryHandle(library, &FT_Done_FreeType);
    }

    FaceHandle load(const std::string& path) const {
        FT_Face face = nullptr;
        if (FT_New_Face(library_.get(), path.c_str(), 0, &face) != 0) {
            throw ComputationError("cannot load font '" + path + "'");
        }
        return FaceHandle(face, &FT_Done_Face);
    }

    // Members are destroyed in reverse order, so faces go before the library.
    LibraryHandle library_;
    FaceHandle regular_;
    FaceHandle bold_;
};

int hex_value(char ch) {
    if (ch >= '0' && ch <= '9') {
        return ch - '0';
    }
    if (ch >= 'a' && ch <= 'f') {
        return ch - 'a' + 10;
    }
    return ch - 'A' + 10;
}

// Pixel centre test against a rectangle with rounded corners.
bool inside(double px, double py, double x0, double y0, double x1, double y1, double radius) {
    if (px < x0 || px >= x1 || py < y0 || py >= y1) {
        return false;
    }
    const double r = std::min(radius, std::min(x1 - x0, y1 - y0) / 2.0);
    if (r <= 0.0) {
        return true;
    }
    const double cx = px < x0 + r ? x0 + r : (px > x1 - r ? x1 - r : px);
    const double cy = py < y0 + r ? y0 + r : (py > y1 - r ? y1 - r : py);
    const double dx = px - cx;
    const double dy = py - cy;
    return dx * dx + dy * dy <= r * r;
}

void draw_rect(RgbaImage& image, const LayoutRect& rect) {
    const Rgba fill = parse_color(rect.fill);
    const double half = rect.stroke.has_value() ? rect.stroke_width / 2.0 : 0.0;
    const double x0 = rect.x - half;
    const double y0 = rect.y - half;
    const double x1 = rect.x + rect.width + half;
    const double y1 = rect.y + rect.height + half;
    const Rgba stroke = rect.stroke.has_value() ? parse_color(*rect.stroke) : fill;
    const double radius = rect.corner_radius;

    const int min_x = std::max(0, static_cast<int>(std::floor(x0)));
    const int min_y = std::max(0, static_cast<int>(std::floor(y0)));
    const int max_x = std::min(image.width(), static_cast<int>(std::ceil(x1)));
    const int max_y = std::min(image.height(), static_cast<int>(std::ceil(y1)));
    for (int y = min_y; y < max_y; ++y) {
        for (int x = min_x; x < max_x; ++x) {
            const double px = x + 0.5;
            const double py = y + 0.5;
            if (!inside(px, py, x0, y0, x1, y1, radius + half)) {
                continue;
            }
            const bool interior = inside(px, py, rect.x + half, rect.y + half, rect.x + rect.width - half,
                                         rect.y + rect.height - half, std::max(0.0, radius - half));
            image.set_pixel(x, y, interior ? fill : stroke);
        }
    }
}

void blend_pixel(RgbaImage& image, int x, int y, Rgba color, unsigned coverage) {
    if (coverage == 0 || x < 0 || y < 0 || x >= image.width() || y >= image.height()) {
        return;
    }
    const Rgba base = image.pixel(x, y);
    const auto mix = [coverage](unsigned top, unsigned bottom) {
        return static_cast<std::uint8_t>((top * coverage + bottom * (255 - coverage) + 127) / 255);
    };
    image.set_pixel(x, y, Rgba{mix(color.r, base.r), mix(color.g, base.g), mix(color.b, base.b),
                               mix(255, base.a)});
}

void load_glyph(FT_Face face, char32_t code, FT_Int32 flags) {
    if (FT_Load_Char(face, code, flags) != 0) {
        throw ComputationError("FreeType failed to load glyph U+" + std::to_string(static_cast<unsigned long>(code)));
    }
}

unsigned coverage_at(const FT_Bitmap& bitmap, unsigned row, unsigned column) {
    const unsigned char* line = bitmap.buffer + static_cast<long>(row) * bitmap.pitch;
    if (bitmap.pixel_mode == FT_PIXEL_MODE_MONO) {
        return (line[column >> 3] >> (7 - (column & 7))) & 1 ? 255 : 0;
    }
    return line[column];
}

// Anchors on the advance width; rotation -90 turns the run to read bottom to top around (x, y).
void draw_text(RgbaImage& image, const FontSet& fonts, const LayoutText& text) {
    const auto codes = decode_utf8(text.text);
    if (codes.empty()) {
        return;
    }
    FT_Face face = fonts.face(text.font_weight);
    if (FT_Set_Pixel_Sizes(face, 0, static_cast<FT_UInt>(std::max(1, text.font_size))) != 0) {
        throw ComputationError("FreeType cannot use font size " + std::to_string(text.font_size));
    }

    long width = 0;
    for (const auto code : codes) {
        load_glyph(face, code, FT_LOAD_DEFAULT);
        width += face->glyph->advance.x;
    }
    long pen = 0;
    if (text.anchor == TextAnchor::kMiddle) {
        pen = -width / 2;
    } else if (text.anchor == TextAnchor::kEnd) {
        pen = -width;
    }

    const Rgba color = parse_color(text.fill);
    const int origin_x = static_cast<int>(std::lround(text.x));
    const int origin_y = static_cast<int>(std::lround(text.y));
    for (const auto code : codes) {
        load_glyph(face, code, FT_LOAD_RENDER);
        const FT_GlyphSlot slot = face->glyph;
        const FT_Bitmap& bitmap = slot->bitmap;
        const int left = static_cast<int>(pen >> 6) + slot->bitmap_left;
        const int top = -slot->bitmap_top;
        for (unsigned row = 0; row < bitmap.rows; ++row) {
            for (unsigned column = 0; column < bitmap.width; ++column) {
                const int dx = left + static_cast<int>(column);
                const int dy = top + static_cast<int>(row);
                const unsigned coverage = coverage_at(bitmap, row, column);
                if (text.rotation == -90) {
                    blend_pixel(image, origin_x + dy, origin_y - dx, color, coverage);
                } else {
                    blend_pixel(image, origin_x + dx, origin_y + dy, color, coverage);
                }
            }
        }
        pen += slot->advance.x;
    }
}

void write_to_vector(png_structp png, png_bytep data, png_size_t length) {
    auto* output = static_cast<std::vector<std::uint8_t>*>(png_get_io_ptr(png));
    output->insert(output->end(), data, data + length);
}

void flush_noop(png_structp) {}

}  // namespace

RgbaImage::RgbaImage(int width, int height, Rgba fill) : width_(width), height_(height) {
    if (width <= 0 || height <= 0) {
        throw std::runtime_error("image dimensions must be positive");
    }
    pixels_.resize(static_cast<size_t>(width) * static_cast<size_t>(height) * 4);
    for (size_t i = 0; i < pixels_.size(); i += 4) {
        pixels_[i] = fill.r;
        pixels_[i + 1] = fill.g;
        pixels_[i + 2] = fill.b;
        pixels_[i + 3] = fill.a;
    }
}

Rgba RgbaImage::pixel(int x, int y) const {
    if (x < 0 || y < 0 || x >= width_ || y >= height_) {
        throw std::out_of_range("pixel outside image");
    }
    const size_t offset = (static_cast<size_t>(y) * static_cast<size_t>(width_) + static_cast<size_t>(x)) * 4;
    return Rgba{pixels_[offset], pixels_[offset + 1], pixels_[offset + 2], pixels_[offset + 3]};
}

void RgbaImage::set_pixel(int x, int y, Rgba color) {
    if (x < 0 || y < 0 || x >= width_ || y >= height_) {
        return;
    }
    const size_t offset = (static_cast<size_t>(y) * static_cast<size_t>(width_) + static_cast<size_t>(x)) * 4;
    pixels_[offset] = color.r;
    pixels_[offset + 1] = color.g;
    pixels_[offset + 2] = color.b;
    pixels_[offset + 3] = color.a;
}

Rgba parse_color(const std::string& value) {
    if (!is_hex_color(value)) {
        throw ValidationError("invalid colour '" + value + "'", {{"color", "expected #rgb or #rrggbb"}});
    }
    Rgba color;
    if (value.size() == 4) {
        color.r = static_cast<std::uint8_t>(hex_value(value[1]) * 17);
        color.g = static_cast<std::uint8_t>(hex_value(value[2]) * 17);
        color.b = static_cast<std::uint8_t>(hex_value(value[3]) * 17);
    } else {
        color.r = static_cast<std::uint8_t>(hex_value(value[1]) * 16 + hex_value(value[2]));
        color.g = static_cast<std::uint8_t>(hex_value(value[3]) * 16 + hex_value(value[4]));
        color.b = static_cast<std::uint8_t>(hex_value(value[5]) * 16 + hex_value(value[6]));
    }
    return color;
}

RgbaImage rasterize(const MatrixLayout& layout, const RasterConfig& fonts) {
    RgbaImage image(layout.width, layout.height);
    for (const auto& rect : layout.rects) {
        draw_rect(image, rect);
    }
    if (layout.texts.empty()) {
        return image;
    }
    const FontSet faces(fonts);
    for (const auto& text : layout.texts) {
        draw_text(image, faces, text);
    }
    return image;
}

std::vector<std::uint8_t> encode_png(const RgbaImage& image) {
    png_structp png = png_create_write_struct(PNG_LIBPNG_VER_STRING, nullptr, nullptr, nullptr);
    if (png == nullptr) {
        throw std::runtime_error("png_create_write_struct failed");
    }
    png_infop info = png_create_info_struct(png);
    if (info == nullptr) {
        png_destroy_write_struct(&png, nullptr);
        throw std::runtime_error("png_create_info_struct failed");
    }

    std::vector<std::uint8_t> output;
    std::vector<png_bytep> rows(static_cast<size_t>(image.height()));
    const size_t stride = static_cast<size_t>(image.width()) * 4;
    for (int y = 0; y < image.height(); ++y) {
        rows[static_cast<size_t>(y)] = const_cast<png_bytep>(image.pixels().data() + stride * static_cast<size_t>(y));
    }

    if (setjmp(png_jmpbuf(png))) {
        png_destroy_write_struct(&png, &info);
        throw std::runtime_error("libpng failed to encode image");
    }

    png_set_write_fn(png, &output, write_to_vector, flush_noop);
    png_set_IHDR(png, info, static_cast<png_uint_32>(image.width()), static_cast<png_uint_32>(image.height()), 8,
                 PNG_COLOR_TYPE_RGBA, PNG_INTERLACE_NONE, PNG_COMPRESSION_TYPE_DEFAULT, PNG_FILTER_TYPE_DEFAULT);
    png_set_compression_level(png, 9);
    png_write_info(png, info);
    png_write_image(png, rows.data());
    png_write_end(png, nullptr);
    png_destroy_write_struct(&png, &info);
    return output;
}

std::string matrix_filename(MatrixSize size, const std::string& date) {
    return "risk_matrix_" + to_string(size) + "_" + (date.empty() ? iso_date() : date) + ".png";
}

ImageRendering render_image(const RiskMatrixOptions& options, const BandThresholds& thresholds,
                            const RasterConfig& fonts) {
    const auto layout = compute_layout(options, thresholds);
    ImageRendering rendering;
    rendering.buffer = encode_png(rasterize(layout, fonts));
    rendering.filename = matrix_filename(options.size);
    rendering.width = layout.width;
    rendering.height = layout.height;
    return rendering;
}

ImageRendering render_image_with_highlights(const std::vector<RiskRating>& ratings, RiskMatrixOptions options,
                                            const RasterConfig& fonts) {
    options.highlight_cells.clear();
    for (const auto& rating : ratings) {
        options.highlight_cells.push_back(CellHighlight{rating.severity, rating.likelihood});
    }
    return render_image(options, RiskThresholdConfig{}.matrix, fonts);
}

std::map<MatrixSize, ImageRendering> render_all_sizes(const RiskMatrixOptions& options, const RasterConfig& fonts) {
    std::map<MatrixSize, ImageRendering> renderings;
    for (auto size : {MatrixSize::kSmall, MatrixSize::kMedium, MatrixSize::kLarge}) {
        auto sized = options;
        sized.size = size;
        renderings.emplace(size, render_image(sized, RiskThresholdConfig{}.matrix, fonts));
    }
    return renderings;
}

std::future<ImageRendering> render_image_async(RiskMatrixOptions options, BandThresholds thresholds,
                                               RasterConfig fonts) {
    // Option errors are thrown here rather than from the future.
    validate_options(options);
    return std::async(std::launch::async, [options = std::move(options), thresholds, fonts = std::move(fonts)]() {
        return render_image(options, thresholds, fonts);
    });
}

}  // namespace psrisk
