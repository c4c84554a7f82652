#ifndef PSRISK_MATRIX_HPP
#define PSRISK_MATRIX_HPP

#include <optional>
#include <string>
#include <vector>

#include "psrisk/config.hpp"
#include "psrisk/risk.hpp"

namespace psrisk {

enum class MatrixSize {
    kSmall,
    kMedium,
    kLarge,
};

struct SizeConfig {
    int cell_size = 60;
    int label_width = 100;
    int label_height = 40;
    int font_size = 12;
    int score_font_size = 16;
    int title_font_size = 18;
    int legend_height = 40;
    int padding = 15;
};

struct CellHighlight {
    int severity = 1;
    int likelihood = 1;
};

struct RiskMatrixOptions {
    MatrixSize size = MatrixSize::kMedium;
    bool include_labels = true;
    bool include_legend = true;
    bool show_scores = true;
    std::optional<std::string> title = std::nullopt;
    std::vector<CellHighlight> highlight_cells;
    std::string background_color = "#ffffff";
};

enum class RectRole {
    kBackground,
    kCell,
    kLegendSwatch,
};

struct LayoutRect {
    RectRole role = RectRole::kCell;
    double x = 0.0;
    double y = 0.0;
    double width = 0.0;
    double height = 0.0;
    std::string fill;
    std::optional<std::string> stroke = std::nullopt;
    int stroke_width = 0;
    int corner_radius = 0;
    // Grid coordinates, set for cells only.
    int severity = 0;
    int likelihood = 0;
    bool highlighted = false;
};

enum class TextAnchor {
    kStart,
    kMiddle,
    kEnd,
};

// Text positioned at its baseline. rotation is in degrees about (x, y).
struct LayoutText {
    double x = 0.0;
    double y = 0.0;
    std::string text;
    int font_size = 12;
    int font_weight = 400;
    std::string fill;
    TextAnchor anchor = TextAnchor::kStart;
    int rotation = 0;
};

struct MatrixLayout {
    MatrixSize size = MatrixSize::kMedium;
    int width = 0;
    int height = 0;
    std::vector<LayoutRect> rects;
    std::vector<LayoutText> texts;
};

struct SvgRendering {
    std::string markup;
    int width = 0;
    int height = 0;
};

const SizeConfig& size_config(MatrixSize size);
std::string to_string(MatrixSize size);
std::optional<MatrixSize> parse_matrix_size(const std::string& value);

// Throws ValidationError for a malformed background colour or out-of-range highlight.
void validate_options(const RiskMatrixOptions& options);

// Pure layout stage shared by the vector and raster outputs.
MatrixLayout compute_layout(const RiskMatrixOptions& options,
                            const BandThresholds& thresholds = RiskThresholdConfig{}.matrix);
std::string to_svg(const MatrixLayout& layout);
SvgRendering render_svg(const RiskMatrixOptions& options,
                        const BandThresholds& thresholds = RiskThresholdConfig{}.matrix);

std::string escape_xml(const std::string& text);
bool is_hex_color(const std::string& value);

}  // namespace psrisk

#endif  // PSRISK_MATRIX_HPP
