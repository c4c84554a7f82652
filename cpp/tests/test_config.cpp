#include <cstdio>
#include <sstream>
#include <stdexcept>

#include "psrisk/config.hpp"
#include "psrisk/errors.hpp"
#include "psrisk/logging.hpp"
#include "test_support.hpp"

namespace psrisk_test {

namespace {

void test_defaults() {
    psrisk::EngineSettings settings;
    expect_true(settings.server.port == 8080 && settings.server.workers == 4, "server defaults");
    expect_true(settings.risk_thresholds.score.high.min == 61, "score high band starts at 61");
    expect_true(settings.risk_thresholds.matrix.medium.min == 5, "matrix medium band starts at 5");
    expect_near(settings.gap_analysis.marginal_ratio, 0.5, 1e-12, "marginal ratio default");
    expect_near(settings.compliance.partial_weight, 0.5, 1e-12, "partial weight default");
    expect_true(!settings.dataset_path.has_value(), "no dataset by default");
}

void test_from_toml() {
    const auto path = write_temp_file("psrisk_test_config.toml",
                                      "dataset_path = \"/var/lib/psrisk/dataset.ini\"\n"
                                      "\n"
                                      "[logging]\n"
                                      "level = \"debug\"\n"
                                      "json = false\n"
                                      "\n"
                                      "[server]\n"
                                      "enabled = false\n"
                                      "host = \"127.0.0.1\"\n"
                                      "port = 9090  # admin port\n"
                                      "workers = 2\n"
                                      "\n"
                                      "[risk_thresholds]\n"
                                      "preset = \"conservative\"\n"
                                      "matrix_low = \"1-3\"\n"
                                      "matrix_medium = \"4-14\"\n"
                                      "\n"
                                      "[gap_analysis]\n"
                                      "non_independent_policy = \"discount\"\n"
                                      "discount_exponent = 0.25\n"
                                      "\n"
                                      "[compliance]\n"
                                      "compliant_threshold = 85\n"
                                      "excluded_clauses = [\"PED:PED-HazOps-1\", \"EPA_RMP:68.95\"]\n"
                                      "\n"
                                      "[raster]\n"
                                      "font_path = \"/opt/fonts/Plant.ttf\"\n"
                                      "bold_font_path = \"\"\n");
    auto settings = psrisk::EngineSettings::from_toml(path);
    std::remove(path.c_str());

    expect_equal(settings.dataset_path.value_or(""), "/var/lib/psrisk/dataset.ini", "dataset path");
    expect_equal(settings.logging.level, "debug", "logging level");
    expect_true(!settings.logging.json, "text logging");
    expect_true(!settings.server.enabled, "server disabled");
    expect_equal(settings.server.host, "127.0.0.1", "server host");
    expect_true(settings.server.port == 9090, "inline comment stripped");
    expect_true(settings.risk_thresholds.score.high.min == 41, "preset applied");
    expect_true(settings.risk_thresholds.matrix.low.max == 3, "matrix range parsed");
    expect_equal(settings.gap_analysis.non_independent_policy, "discount", "policy parsed");
    expect_near(settings.gap_analysis.discount_exponent, 0.25, 1e-12, "exponent parsed");
    expect_true(settings.compliance.compliant_threshold == 85, "compliance threshold parsed");
    expect_true(settings.compliance.excluded_clauses.size() == 2, "excluded clauses parsed");
    expect_equal(settings.raster.font_path, "/opt/fonts/Plant.ttf", "raster font parsed");
    expect_true(settings.raster.bold_font_path.empty(), "empty bold font kept");
}

void test_invalid_settings() {
    expect_throws<std::runtime_error>([]() { psrisk::EngineSettings::from_toml("/nonexistent/psrisk.toml"); },
                                      "missing config file rejected");

    const auto gap_path = write_temp_file("psrisk_test_gap.toml", "[risk_thresholds]\nlow = \"1-20\"\nmedium = \"30-60\"\n");
    expect_throws<psrisk::ValidationError>([&]() { psrisk::EngineSettings::from_toml(gap_path); },
                                           "non-contiguous bands rejected");
    std::remove(gap_path.c_str());

    const auto policy_path = write_temp_file("psrisk_test_policy.toml", "[gap_analysis]\nnon_independent_policy = \"ignore\"\n");
    expect_throws<std::runtime_error>([&]() { psrisk::EngineSettings::from_toml(policy_path); },
                                      "unknown independence policy rejected");
    std::remove(policy_path.c_str());

    const auto weight_path = write_temp_file("psrisk_test_weight.toml", "[compliance]\npartial_weight = 1.5\n");
    expect_throws<std::runtime_error>([&]() { psrisk::EngineSettings::from_toml(weight_path); },
                                      "partial weight above 1 rejected");
    std::remove(weight_path.c_str());

    const auto font_path = write_temp_file("psrisk_test_font.toml", "[raster]\nfont_path = \"\"\n");
    expect_throws<std::runtime_error>([&]() { psrisk::EngineSettings::from_toml(font_path); },
                                      "empty raster font rejected");
    std::remove(font_path.c_str());

    expect_throws<psrisk::ValidationError>([]() { psrisk::score_threshold_preset("strict"); },
                                           "unknown preset rejected");
    auto relaxed = psrisk::matrix_threshold_preset("relaxed");
    expect_true(relaxed.high.min == 17, "relaxed matrix preset");
}

void test_structured_logging() {
    std::ostringstream sink;
    psrisk::set_log_stream(&sink);
    psrisk::LoggingConfig config;
    config.level = "WARN";
    psrisk::configure_logging(config);

    auto logger = psrisk::get_logger("psrisk").child("tests");
    logger.info("suppressed_event");
    logger.warn("threshold_changed", {{"band", "high"}});
    const auto output = sink.str();
    expect_true(!contains(output, "suppressed_event"), "level filter drops info");
    expect_true(contains(output, "\"name\":\"psrisk.tests\""), "child logger name");
    expect_true(contains(output, "\"message\":\"threshold_changed\"") && contains(output, "\"band\":\"high\""),
                "json line carries extras");

    psrisk::set_log_stream(nullptr);
    psrisk::configure_logging(psrisk::LoggingConfig{});
}

}  // namespace

void run_config_tests() {
    test_defaults();
    test_from_toml();
    test_invalid_settings();
    test_structured_logging();
}

}  // namespace psrisk_test
