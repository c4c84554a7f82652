#include <cstdint>
#include <string>
#include <vector>

#include "psrisk/errors.hpp"
#include "psrisk/matrix.hpp"
#include "psrisk/raster.hpp"
#include "test_support.hpp"

namespace psrisk_test {

namespace {

int count_occurrences(const std::string& haystack, const std::string& needle) {
    int count = 0;
    for (auto pos = haystack.find(needle); pos != std::string::npos; pos = haystack.find(needle, pos + 1)) {
        count += 1;
    }
    return count;
}

std::uint32_t read_be32(const std::vector<std::uint8_t>& bytes, size_t offset) {
    return (static_cast<std::uint32_t>(bytes[offset]) << 24) | (static_cast<std::uint32_t>(bytes[offset + 1]) << 16) |
           (static_cast<std::uint32_t>(bytes[offset + 2]) << 8) | static_cast<std::uint32_t>(bytes[offset + 3]);
}

void test_svg_structure() {
    psrisk::RiskMatrixOptions bare;
    bare.include_labels = false;
    bare.include_legend = false;
    auto svg = psrisk::render_svg(bare);
    expect_true(count_occurrences(svg.markup, "<rect") == 26, "background plus 25 cells");
    expect_true(count_occurrences(svg.markup, "class=\"cell\"") == 25, "25 tagged cells");

    auto full = psrisk::render_svg(psrisk::RiskMatrixOptions());
    expect_true(count_occurrences(full.markup, "<rect") == 29, "legend adds three swatches");
    expect_true(count_occurrences(full.markup, "class=\"legend-swatch\"") == 3, "swatches are tagged");
    expect_true(contains(full.markup, "5 - Almost Certain"), "likelihood labels");
    expect_true(contains(full.markup, ">High Risk<"), "legend labels");
    expect_true(contains(full.markup, "rotate(-90"), "vertical axis title rotated");

    psrisk::RiskMatrixOptions unscored = bare;
    unscored.show_scores = false;
    expect_true(!contains(psrisk::render_svg(unscored).markup, "<text"), "scores can be hidden");
    expect_true(contains(svg.markup, ">25</text>"), "cell value is severity times likelihood");
}

void test_grid_orientation() {
    auto layout = psrisk::compute_layout(psrisk::RiskMatrixOptions());
    const psrisk::LayoutRect* top_left = nullptr;
    const psrisk::LayoutRect* bottom_right = nullptr;
    for (const auto& rect : layout.rects) {
        if (rect.role != psrisk::RectRole::kCell) {
            continue;
        }
        if (top_left == nullptr || rect.x + rect.y < top_left->x + top_left->y) {
            top_left = &rect;
        }
        if (bottom_right == nullptr || rect.x + rect.y > bottom_right->x + bottom_right->y) {
            bottom_right = &rect;
        }
    }
    expect_true(top_left != nullptr && top_left->severity == 1 && top_left->likelihood == 5,
                "top left is severity 1 likelihood 5");
    expect_true(bottom_right != nullptr && bottom_right->severity == 5 && bottom_right->likelihood == 1,
                "bottom right is severity 5 likelihood 1");
}

void test_dimensions() {
    psrisk::RiskMatrixOptions options;
    options.size = psrisk::MatrixSize::kSmall;
    const auto small = psrisk::compute_layout(options);
    options.size = psrisk::MatrixSize::kMedium;
    const auto medium = psrisk::compute_layout(options);
    options.size = psrisk::MatrixSize::kLarge;
    const auto large = psrisk::compute_layout(options);
    expect_true(small.width < medium.width && medium.width < large.width, "widths grow with size");
    expect_true(small.height < medium.height && medium.height < large.height, "heights grow with size");

    psrisk::RiskMatrixOptions plain;
    plain.include_labels = false;
    plain.include_legend = false;
    const auto base = psrisk::compute_layout(plain);
    auto labelled = plain;
    labelled.include_labels = true;
    expect_true(psrisk::compute_layout(labelled).width > base.width, "labels widen the matrix");
    auto titled = plain;
    titled.title = "Unit 100";
    expect_true(psrisk::compute_layout(titled).height > base.height, "title adds height");
    auto legend = plain;
    legend.include_legend = true;
    expect_true(psrisk::compute_layout(legend).height > base.height, "legend adds height");
    expect_true(base.width == 15 * 2 + 5 * 60, "medium grid without labels");
}

void test_escaping_and_validation() {
    psrisk::RiskMatrixOptions options;
    options.title = "<script>alert('x')</script> & \"Unit\"";
    auto svg = psrisk::render_svg(options);
    expect_true(!contains(svg.markup, "<script"), "script tag neutralised");
    expect_true(contains(svg.markup, "&lt;script&gt;alert(&apos;x&apos;)"), "title escaped");
    expect_true(contains(svg.markup, "&amp; &quot;Unit&quot;"), "ampersand and quotes escaped");

    expect_equal(psrisk::escape_xml(std::string("Unit\x01 1\x1f" "0\t\n\x7f")), "Unit 10\t\n",
                 "control characters dropped");
    options.title = std::string("Bad\x0b title\x1b[0m");
    auto controlled = psrisk::render_svg(options);
    expect_true(contains(controlled.markup, "Bad title[0m"), "title keeps printable text");
    expect_true(controlled.markup.find('\x0b') == std::string::npos &&
                    controlled.markup.find('\x1b') == std::string::npos,
                "svg carries no control characters");

    options.title = std::nullopt;
    options.background_color = "white";
    try {
        psrisk::render_svg(options);
        expect_true(false, "named colour rejected");
    } catch (const psrisk::ValidationError& exc) {
        expect_true(!exc.errors().empty() && exc.errors().front().field == "backgroundColor", "colour field error");
    }
    options.background_color = "#abc";
    expect_true(psrisk::render_svg(options).markup.size() > 0, "short hex colour accepted");

    options.highlight_cells = {{3, 6}};
    auto message = expect_throws<psrisk::ValidationError>([&]() { psrisk::render_svg(options); },
                                                          "out of range highlight rejected");
    expect_true(contains(message, "3-6"), "highlight error names the cell");

    options.highlight_cells = {{4, 2}};
    auto layout = psrisk::compute_layout(options);
    int highlighted = 0;
    for (const auto& rect : layout.rects) {
        if (rect.highlighted) {
            highlighted += 1;
            expect_true(rect.severity == 4 && rect.likelihood == 2, "highlighted cell coordinates");
        }
    }
    expect_true(highlighted == 1, "one cell highlighted");

    expect_true(psrisk::is_hex_color("#A1b2C3") && !psrisk::is_hex_color("#12345"), "hex colour check");
    expect_true(psrisk::parse_matrix_size("Large") == psrisk::MatrixSize::kLarge, "size parsed");
    expect_true(!psrisk::parse_matrix_size("huge").has_value(), "unknown size");
}

void test_custom_thresholds() {
    psrisk::RiskMatrixOptions options;
    auto conservative = psrisk::compute_layout(options, psrisk::matrix_threshold_preset("conservative"));
    for (const auto& rect : conservative.rects) {
        if (rect.role == psrisk::RectRole::kCell && rect.severity == 3 && rect.likelihood == 3) {
            expect_equal(rect.fill, "#fee2e2", "conservative preset colours 9 as high");
        }
    }
}

void test_raster() {
    psrisk::RiskMatrixOptions options;
    options.include_labels = false;
    options.include_legend = false;
    const auto layout = psrisk::compute_layout(options);
    const auto image = psrisk::rasterize(layout);
    expect_true(image.width() == layout.width && image.height() == layout.height, "raster matches layout");

    for (const auto& rect : layout.rects) {
        if (rect.role == psrisk::RectRole::kCell && rect.severity == 5 && rect.likelihood == 5) {
            auto pixel = image.pixel(static_cast<int>(rect.x) + 6, static_cast<int>(rect.y) + 6);
            expect_true(pixel.r == 0xfe && pixel.g == 0xe2 && pixel.b == 0xe2, "high cell filled with band colour");
        }
    }
    expect_true(image.pixel(1, 1).r == 255 && image.pixel(1, 1).g == 255, "background painted");
    expect_throws<std::out_of_range>([&]() { image.pixel(image.width(), 0); }, "pixel read outside image");

    auto color = psrisk::parse_color("#0f8");
    expect_true(color.r == 0x00 && color.g == 0xff && color.b == 0x88, "short colour expanded");
    expect_throws<psrisk::ValidationError>([]() { psrisk::parse_color("#zzzzzz"); }, "bad colour rejected");
}

psrisk::MatrixLayout text_layout(int width, int height, const std::string& label, double x, double y,
                                 psrisk::TextAnchor anchor, int rotation) {
    psrisk::MatrixLayout layout;
    layout.width = width;
    layout.height = height;
    psrisk::LayoutText text;
    text.x = x;
    text.y = y;
    text.text = label;
    text.font_size = 24;
    text.font_weight = 400;
    text.fill = "#000000";
    text.anchor = anchor;
    text.rotation = rotation;
    layout.texts.push_back(text);
    return layout;
}

// Dark pixels inside [x0, x1) x [y0, y1).
int ink(const psrisk::RgbaImage& image, int x0, int y0, int x1, int y1) {
    int count = 0;
    for (int y = y0; y < y1; ++y) {
        for (int x = x0; x < x1; ++x) {
            if (image.pixel(x, y).r < 128) {
                count += 1;
            }
        }
    }
    return count;
}

void test_text_rendering() {
    const auto plain = psrisk::rasterize(text_layout(200, 60, "Risk", 10, 40, psrisk::TextAnchor::kStart, 0));
    expect_true(ink(plain, 10, 10, 120, 50) > 30, "text drawn right of a start anchor");
    expect_true(ink(plain, 0, 0, 9, 60) == 0, "nothing drawn left of a start anchor");
    expect_true(ink(plain, 0, 46, 200, 60) == 0, "no descenders below the baseline for 'Risk'");

    const auto centred = psrisk::rasterize(text_layout(200, 60, "Severity", 100, 40, psrisk::TextAnchor::kMiddle, 0));
    expect_true(ink(centred, 0, 0, 100, 60) > 10 && ink(centred, 100, 0, 200, 60) > 10,
                "middle anchor straddles x");

    const auto ended = psrisk::rasterize(text_layout(200, 60, "Level", 190, 40, psrisk::TextAnchor::kEnd, 0));
    expect_true(ink(ended, 193, 0, 200, 60) == 0 && ink(ended, 0, 0, 190, 60) > 10, "end anchor finishes at x");

    const auto rotated = psrisk::rasterize(text_layout(60, 200, "Likelihood", 40, 190, psrisk::TextAnchor::kStart, -90));
    expect_true(ink(rotated, 0, 0, 40, 190) > 30, "rotated text runs upward left of the baseline");
    expect_true(ink(rotated, 42, 0, 60, 200) == 0, "rotated text stays on its side of the baseline");

    const auto accented = psrisk::rasterize(text_layout(200, 60, "\xC3\x9Cnit \xC3\xA9", 10, 40,
                                                        psrisk::TextAnchor::kStart, 0));
    expect_true(ink(accented, 10, 5, 120, 50) > 20, "non-ASCII title rendered");
    const auto broken = psrisk::rasterize(text_layout(200, 60, "A\xFF\xC3", 10, 40, psrisk::TextAnchor::kStart, 0));
    expect_true(ink(broken, 10, 5, 120, 50) > 0, "invalid UTF-8 still rendered");

    auto layout = psrisk::compute_layout(psrisk::RiskMatrixOptions());
    psrisk::RasterConfig regular_only;
    regular_only.bold_font_path.clear();
    const auto unbolded = psrisk::rasterize(layout, regular_only);
    expect_true(unbolded.pixels() != psrisk::rasterize(layout).pixels(), "bold face used for heavy text");

    psrisk::RasterConfig missing;
    missing.font_path = "/nonexistent/font.ttf";
    expect_throws<psrisk::ComputationError>([&]() { psrisk::rasterize(layout, missing); }, "missing font rejected");
    layout.texts.clear();
    const auto shapes = psrisk::rasterize(layout, missing);
    expect_true(shapes.width() == layout.width, "layout without text needs no font");
}

void test_png_output() {
    const auto rendering = psrisk::render_image(psrisk::RiskMatrixOptions());
    const std::uint8_t signature[] = {0x89, 'P', 'N', 'G', '\r', '\n', 0x1a, '\n'};
    bool signature_ok = rendering.buffer.size() > 24;
    for (size_t i = 0; signature_ok && i < sizeof(signature); ++i) {
        signature_ok = rendering.buffer[i] == signature[i];
    }
    expect_true(signature_ok, "PNG signature");
    expect_true(signature_ok && rendering.buffer[12] == 'I' && rendering.buffer[13] == 'H', "IHDR chunk first");
    if (signature_ok) {
        expect_true(read_be32(rendering.buffer, 16) == static_cast<std::uint32_t>(rendering.width), "IHDR width");
        expect_true(read_be32(rendering.buffer, 20) == static_cast<std::uint32_t>(rendering.height), "IHDR height");
    }
    expect_equal(rendering.mime_type, "image/png", "mime type");
    expect_true(contains(rendering.filename, "risk_matrix_medium_") && contains(rendering.filename, ".png"),
                "filename pattern");
    expect_equal(psrisk::matrix_filename(psrisk::MatrixSize::kLarge, "2024-03-01"),
                 "risk_matrix_large_2024-03-01.png", "explicit date filename");

    const auto again = psrisk::render_image(psrisk::RiskMatrixOptions());
    expect_true(again.buffer == rendering.buffer, "PNG bytes deterministic");

    const auto highlighted = psrisk::render_image_with_highlights({psrisk::RiskRating{5, 5, std::nullopt}});
    expect_true(highlighted.buffer != rendering.buffer, "highlight changes pixels");

    const auto sizes = psrisk::render_all_sizes(psrisk::RiskMatrixOptions());
    expect_true(sizes.size() == 3, "three sizes rendered");
    expect_true(sizes.at(psrisk::MatrixSize::kSmall).width < sizes.at(psrisk::MatrixSize::kLarge).width,
                "sizes differ");

    auto future = psrisk::render_image_async(psrisk::RiskMatrixOptions());
    const auto async_rendering = future.get();
    expect_true(async_rendering.buffer == rendering.buffer, "async rendering matches");

    psrisk::RiskMatrixOptions bad;
    bad.background_color = "#12";
    expect_throws<psrisk::ValidationError>([&]() { psrisk::render_image_async(bad); },
                                           "async validates before dispatch");
}

}  // namespace

void run_matrix_tests() {
    test_svg_structure();
    test_grid_orientation();
    test_dimensions();
    test_escaping_and_validation();
    test_custom_thresholds();
    test_raster();
    test_text_rendering();
    test_png_output();
}

}  // namespace psrisk_test
