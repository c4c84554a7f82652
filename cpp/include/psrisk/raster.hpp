#ifndef PSRISK_RASTER_HPP
#define PSRISK_RASTER_HPP

#include <cstdint>
#include <future>
#include <map>
#include <string>
#include <vector>

#include "psrisk/config.hpp"
#include "psrisk/matrix.hpp"
#include "psrisk/risk.hpp"

namespace psrisk {

struct Rgba {
    std::uint8_t r = 0;
    std::uint8_t g = 0;
    std::uint8_t b = 0;
    std::uint8_t a = 255;
};

// Row-major 8-bit RGBA pixels.
class RgbaImage {
public:
    RgbaImage(int width, int height, Rgba fill = Rgba{255, 255, 255, 255});

    int width() const { return width_; }
    int height() const { return height_; }
    const std::vector<std::uint8_t>& pixels() const { return pixels_; }

    Rgba pixel(int x, int y) const;
    // Writes are clipped to the image bounds.
    void set_pixel(int x, int y, Rgba color);

private:
    int width_ = 0;
    int height_ = 0;
    std::vector<std::uint8_t> pixels_;
};

struct ImageRendering {
    std::vector<std::uint8_t> buffer;
    std::string mime_type = "image/png";
    std::string filename;
    int width = 0;
    int height = 0;
};

// Throws ValidationError unless value is #rgb or #rrggbb.
Rgba parse_color(const std::string& value);

// Text is drawn with FreeType from the faces in fonts. Throws ComputationError when a face cannot be loaded.
RgbaImage rasterize(const MatrixLayout& layout, const RasterConfig& fonts = RasterConfig{});
std::vector<std::uint8_t> encode_png(const RgbaImage& image);

// risk_matrix_<size>_<YYYY-MM-DD>.png; the date defaults to today in UTC.
std::string matrix_filename(MatrixSize size, const std::string& date = "");

ImageRendering render_image(const RiskMatrixOptions& options,
                            const BandThresholds& thresholds = RiskThresholdConfig{}.matrix,
                            const RasterConfig& fonts = RasterConfig{});
ImageRendering render_image_with_highlights(const std::vector<RiskRating>& ratings,
                                            RiskMatrixOptions options = RiskMatrixOptions(),
                                            const RasterConfig& fonts = RasterConfig{});
std::map<MatrixSize, ImageRendering> render_all_sizes(const RiskMatrixOptions& options,
                                                      const RasterConfig& fonts = RasterConfig{});
std::future<ImageRendering> render_image_async(RiskMatrixOptions options,
                                               BandThresholds thresholds = RiskThresholdConfig{}.matrix,
                                               RasterConfig fonts = RasterConfig{});

}  // namespace psrisk

#endif  // PSRISK_RASTER_HPP
