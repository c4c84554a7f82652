#include "psrisk/matrix.hpp"

#include <cctype>
#include <cmath>
#include <cstdio>
#include <set>
#include <sstream>
#include <utility>

#include "psrisk/common.hpp"
#include "psrisk/errors.hpp"

namespace psrisk {

namespace {

struct BandColors {
    const char* bg;
    const char* text;
    const char* border;
};

constexpr BandColors kLowColors{"#dcfce7", "#166534", "#86efac"};
constexpr BandColors kMediumColors{"#fef3c7", "#92400e", "#fcd34d"};
constexpr BandColors kHighColors{"#fee2e2", "#991b1b", "#fca5a5"};
constexpr const char* kTextColor = "#374151";
constexpr const char* kHighlightColor = "#3b82f6";
constexpr int kLegendSpacing = 100;

const BandColors& colors_for(RiskBand band) {
    switch (band) {
        case RiskBand::kLow:
            return kLowColors;
        case RiskBand::kMedium:
            return kMediumColors;
        case RiskBand::kHigh:
            return kHighColors;
    }
    return kLowColors;
}

std::string number(double value) {
    if (std::fabs(value - std::round(value)) < 1e-9) {
        return std::to_string(static_cast<long long>(std::llround(value)));
    }
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%.2f", value);
    std::string text = buffer;
    while (!text.empty() && text.back() == '0') {
        text.pop_back();
    }
    return text;
}

const char* anchor_name(TextAnchor anchor) {
    switch (anchor) {
        case TextAnchor::kStart:
            return "start";
        case TextAnchor::kMiddle:
            return "middle";
        case TextAnchor::kEnd:
            return "end";
    }
    return "start";
}

LayoutText text_at(double x, double y, std::string text, int font_size, const std::string& fill,
                   TextAnchor anchor, int weight = 400) {
    LayoutText output;
    output.x = x;
    output.y = y;
    output.text = std::move(text);
    output.font_size = font_size;
    output.font_weight = weight;
    output.fill = fill;
    output.anchor = anchor;
    return output;
}

}  // namespace

const SizeConfig& size_config(MatrixSize size) {
    static const SizeConfig small{40, 80, 30, 10, 12, 14, 30, 10};
    static const SizeConfig medium{60, 100, 40, 12, 16, 18, 40, 15};
    static const SizeConfig large{80, 120, 50, 14, 20, 22, 50, 20};
    switch (size) {
        case MatrixSize::kSmall:
            return small;
        case MatrixSize::kMedium:
            return medium;
        case MatrixSize::kLarge:
            return large;
    }
    return medium;
}

std::string to_string(MatrixSize size) {
    switch (size) {
        case MatrixSize::kSmall:
            return "small";
        case MatrixSize::kMedium:
            return "medium";
        case MatrixSize::kLarge:
            return "large";
    }
    return "medium";
}

std::optional<MatrixSize> parse_matrix_size(const std::string& value) {
    const auto lowered = to_lower(trim(value));
    if (lowered == "small") {
        return MatrixSize::kSmall;
    }
    if (lowered == "medium") {
        return MatrixSize::kMedium;
    }
    if (lowered == "large") {
        return MatrixSize::kLarge;
    }
    return std::nullopt;
}

bool is_hex_color(const std::string& value) {
    if (value.size() != 4 && value.size() != 7) {
        return false;
    }
    if (value.front() != '#') {
        return false;
    }
    for (size_t i = 1; i < value.size(); ++i) {
        if (std::isxdigit(static_cast<unsigned char>(value[i])) == 0) {
            return false;
        }
    }
    return true;
}

std::string escape_xml(const std::string& text) {
    std::string output;
    output.reserve(text.size());
    for (char ch : text) {
        switch (ch) {
            case '&':
                output += "&amp;";
                break;
            case '<':
                output += "&lt;";
                break;
            case '>':
                output += "&gt;";
                break;
            case '"':
                output += "&quot;";
                break;
            case '\'':
                output += "&apos;";
                break;
            case '\t':
            case '\n':
                output.push_back(ch);
                break;
            default:
                // C0 controls are not allowed in XML 1.0.
                if (static_cast<unsigned char>(ch) >= 0x20 && ch != 0x7f) {
                    output.push_back(ch);
                }
        }
    }
    return output;
}

void validate_options(const RiskMatrixOptions& options) {
    std::vector<FieldError> errors;
    if (!is_hex_color(options.background_color)) {
        errors.push_back({"backgroundColor", "backgroundColor must be #rgb or #rrggbb, got '" +
                                                 options.background_color + "'"});
    }
    for (const auto& cell : options.highlight_cells) {
        if (cell.severity < kMinLevel || cell.severity > kMaxLevel || cell.likelihood < kMinLevel ||
            cell.likelihood > kMaxLevel) {
            errors.push_back({"highlightCells", "highlight cell " + std::to_string(cell.severity) + "-" +
                                                    std::to_string(cell.likelihood) +
                                                    " must have severity and likelihood within 1-5"});
        }
    }
    if (!errors.empty()) {
        const auto message = errors.front().message;
        throw ValidationError(message, std::move(errors));
    }
}

MatrixLayout compute_layout(const RiskMatrixOptions& options, const BandThresholds& thresholds) {
    validate_options(options);
    const auto& config = size_config(options.size);
    const bool has_title = options.title.has_value() && !options.title->empty();

    const int grid_size = kMaxLevel * config.cell_size;
    const int label_width = options.include_labels ? config.label_width : 0;
    const int label_height = options.include_labels ? config.label_height : 0;
    const int axis_title_space = options.include_labels ? config.font_size * 2 : 0;
    const int title_height = has_title ? config.title_font_size * 2 : 0;
    const int legend_height = options.include_legend ? config.legend_height : 0;

    MatrixLayout layout;
    layout.size = options.size;
    layout.width = config.padding * 2 + axis_title_space + label_width + grid_size;
    layout.height = config.padding * 2 + title_height + label_height + grid_size + label_height + legend_height;

    LayoutRect background;
    background.role = RectRole::kBackground;
    background.width = layout.width;
    background.height = layout.height;
    background.fill = options.background_color;
    layout.rects.push_back(background);

    double top = config.padding;
    if (has_title) {
        layout.texts.push_back(text_at(layout.width / 2.0, top + config.title_font_size, *options.title,
                                       config.title_font_size, kTextColor, TextAnchor::kMiddle, 700));
        top += title_height;
    }

    const double grid_x = config.padding + axis_title_space + label_width;
    const double grid_y = top + label_height;

    std::set<std::pair<int, int>> highlighted;
    for (const auto& cell : options.highlight_cells) {
        highlighted.insert({cell.severity, cell.likelihood});
    }

    // Likelihood 5 on the top row, severity 1 in the left column.
    for (int row = 0; row < kMaxLevel; ++row) {
        const int likelihood = kMaxLevel - row;
        for (int column = 0; column < kMaxLevel; ++column) {
            const int severity = column + 1;
            const auto& colors = colors_for(matrix_band(severity, likelihood, thresholds));
            LayoutRect cell;
            cell.role = RectRole::kCell;
            cell.x = grid_x + column * config.cell_size;
            cell.y = grid_y + row * config.cell_size;
            cell.width = config.cell_size;
            cell.height = config.cell_size;
            cell.fill = colors.bg;
            cell.severity = severity;
            cell.likelihood = likelihood;
            cell.highlighted = highlighted.count({severity, likelihood}) != 0;
            cell.stroke = std::string(cell.highlighted ? kHighlightColor : colors.border);
            cell.stroke_width = cell.highlighted ? 3 : 1;
            cell.corner_radius = 2;
            layout.rects.push_back(cell);

            if (options.show_scores) {
                layout.texts.push_back(text_at(cell.x + config.cell_size / 2.0,
                                               cell.y + config.cell_size / 2.0 + config.score_font_size / 3.0,
                                               std::to_string(severity * likelihood), config.score_font_size,
                                               colors.text, TextAnchor::kMiddle, 600));
            }
        }
    }

    if (options.include_labels) {
        const double label_x = config.padding + axis_title_space;
        for (int row = 0; row < kMaxLevel; ++row) {
            const int likelihood = kMaxLevel - row;
            layout.texts.push_back(text_at(label_x + label_width - 8,
                                           grid_y + row * config.cell_size + config.cell_size / 2.0 +
                                               config.font_size / 3.0,
                                           std::to_string(likelihood) + " - " + likelihood_label(likelihood),
                                           config.font_size, kTextColor, TextAnchor::kEnd));
        }
        for (int column = 0; column < kMaxLevel; ++column) {
            layout.texts.push_back(text_at(grid_x + column * config.cell_size + config.cell_size / 2.0,
                                           top + label_height - 8, std::to_string(column + 1), config.font_size,
                                           kTextColor, TextAnchor::kMiddle));
        }

        const double vertical_x = config.padding + config.font_size / 2.0;
        const double vertical_y = grid_y + grid_size / 2.0;
        auto vertical = text_at(vertical_x, vertical_y, "Likelihood", config.font_size, kTextColor,
                                TextAnchor::kMiddle, 600);
        vertical.rotation = -90;
        layout.texts.push_back(vertical);
        layout.texts.push_back(text_at(grid_x + grid_size / 2.0, grid_y + grid_size + label_height - 5, "Severity",
                                       config.font_size, kTextColor, TextAnchor::kMiddle, 600));
    }

    if (options.include_legend) {
        const double legend_y = grid_y + grid_size + label_height + 5;
        const double box = config.legend_height * 0.5;
        const RiskBand bands[] = {RiskBand::kLow, RiskBand::kMedium, RiskBand::kHigh};
        double x = grid_x;
        for (auto band : bands) {
            const auto& colors = colors_for(band);
            LayoutRect swatch;
            swatch.role = RectRole::kLegendSwatch;
            swatch.x = x;
            swatch.y = legend_y + (config.legend_height - box) / 2.0;
            swatch.width = box;
            swatch.height = box;
            swatch.fill = colors.bg;
            swatch.stroke = std::string(colors.border);
            swatch.stroke_width = 1;
            swatch.corner_radius = 2;
            layout.rects.push_back(swatch);
            layout.texts.push_back(text_at(x + box + 8,
                                           legend_y + config.legend_height / 2.0 + config.font_size / 3.0,
                                           band_label(band), config.font_size, kTextColor, TextAnchor::kStart));
            x += kLegendSpacing;
        }
    }

    return layout;
}

std::string to_svg(const MatrixLayout& layout) {
    std::ostringstream out;
    out << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
        << "<svg xmlns=\"http://www.w3.org/2000/svg\" width=\"" << layout.width << "\" height=\"" << layout.height
        << "\" viewBox=\"0 0 " << layout.width << " " << layout.height << "\">\n";

    for (const auto& rect : layout.rects) {
        out << "  <rect";
        if (rect.role == RectRole::kCell) {
            out << " class=\"cell\" data-severity=\"" << rect.severity << "\" data-likelihood=\"" << rect.likelihood
                << "\"";
        } else if (rect.role == RectRole::kLegendSwatch) {
            out << " class=\"legend-swatch\"";
        }
        if (rect.role != RectRole::kBackground) {
            out << " x=\"" << number(rect.x) << "\" y=\"" << number(rect.y) << "\"";
        }
        out << " width=\"" << number(rect.width) << "\" height=\"" << number(rect.height) << "\" fill=\""
            << escape_xml(rect.fill) << "\"";
        if (rect.stroke.has_value()) {
            out << " stroke=\"" << escape_xml(*rect.stroke) << "\" stroke-width=\"" << rect.stroke_width << "\"";
        }
        if (rect.corner_radius > 0) {
            out << " rx=\"" << rect.corner_radius << "\"";
        }
        out << "/>\n";
    }

    for (const auto& text : layout.texts) {
        out << "  <text x=\"" << number(text.x) << "\" y=\"" << number(text.y) << "\" text-anchor=\""
            << anchor_name(text.anchor) << "\" font-family=\"Arial, sans-serif\" font-size=\"" << text.font_size
            << "\"";
        if (text.font_weight != 400) {
            out << " font-weight=\"" << text.font_weight << "\"";
        }
        out << " fill=\"" << text.fill << "\"";
        if (text.rotation != 0) {
            out << " transform=\"rotate(" << text.rotation << ", " << number(text.x) << ", " << number(text.y)
                << ")\"";
        }
        out << ">" << escape_xml(text.text) << "</text>\n";
    }

    out << "</svg>\n";
    return out.str();
}

SvgRendering render_svg(const RiskMatrixOptions& options, const BandThresholds& thresholds) {
    auto layout = compute_layout(options, thresholds);
    return SvgRendering{to_svg(layout), layout.width, layout.height};
}

}  // namespace psrisk
