#include "psrisk/config.hpp"

#include <fstream>
#include <stdexcept>
#include <string>

#include "psrisk/common.hpp"
#include "psrisk/errors.hpp"

namespace psrisk {

namespace {

std::optional<std::string> parse_optional_string(const std::string& value) {
    auto stripped = strip_quotes(trim(value));
    if (stripped == "null" || stripped == "none") {
        return std::nullopt;
    }
    return stripped;
}

ScoreRange parse_range(const std::string& key, const std::string& value) {
    auto text = strip_quotes(trim(value));
    auto dash = text.find('-');
    if (dash == std::string::npos) {
        throw std::runtime_error("invalid range for " + key + ": " + text);
    }
    ScoreRange range;
    range.min = std::stoi(trim(text.substr(0, dash)));
    range.max = std::stoi(trim(text.substr(dash + 1)));
    return range;
}

std::string describe(const ScoreRange& range) {
    return std::to_string(range.min) + "-" + std::to_string(range.max);
}

}  // namespace

void BandThresholds::validate(int max_score) const {
    std::vector<FieldError> errors;
    const std::pair<const char*, const ScoreRange*> bands[] = {
        {"low", &low}, {"medium", &medium}, {"high", &high}};
    for (const auto& [name, range] : bands) {
        if (range->min < 1 || range->max > max_score || range->min > range->max) {
            errors.push_back({name, std::string(name) + " range " + describe(*range) + " must lie within 1-" +
                                        std::to_string(max_score) + " with min <= max"});
        }
    }
    if (low.min != 1) {
        errors.push_back({"low", "low range must start at 1"});
    }
    if (medium.min != low.max + 1) {
        errors.push_back({"medium", "medium range must start immediately after low (" + describe(low) + ")"});
    }
    if (high.min != medium.max + 1) {
        errors.push_back({"high", "high range must start immediately after medium (" + describe(medium) + ")"});
    }
    if (high.max != max_score) {
        errors.push_back({"high", "high range must end at " + std::to_string(max_score)});
    }
    if (!errors.empty()) {
        throw ValidationError("risk band thresholds must be contiguous and cover 1-" + std::to_string(max_score),
                              std::move(errors));
    }
}

BandThresholds score_threshold_preset(const std::string& name) {
    if (name == "default") {
        return BandThresholds{{1, 20}, {21, 60}, {61, 125}};
    }
    if (name == "conservative") {
        return BandThresholds{{1, 10}, {11, 40}, {41, 125}};
    }
    if (name == "relaxed") {
        return BandThresholds{{1, 30}, {31, 80}, {81, 125}};
    }
    throw ValidationError("unknown threshold preset: " + name, {{"preset", "unknown threshold preset: " + name}});
}

BandThresholds matrix_threshold_preset(const std::string& name) {
    if (name == "default") {
        return BandThresholds{{1, 4}, {5, 14}, {15, 25}};
    }
    if (name == "conservative") {
        return BandThresholds{{1, 2}, {3, 8}, {9, 25}};
    }
    if (name == "relaxed") {
        return BandThresholds{{1, 6}, {7, 16}, {17, 25}};
    }
    throw ValidationError("unknown threshold preset: " + name,
                          {{"matrix_preset", "unknown threshold preset: " + name}});
}

EngineSettings EngineSettings::from_toml(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("unable to open config file: " + path);
    }

    EngineSettings settings;
    std::string current_section;
    std::string line;

    while (std::getline(file, line)) {
        line = trim(strip_comment(line));
        if (line.empty()) {
            continue;
        }
        if (line.front() == '[' && line.back() == ']') {
            current_section = trim(line.substr(1, line.size() - 2));
            continue;
        }
        auto eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            continue;
        }
        auto key = trim(line.substr(0, eq_pos));
        auto value = trim(line.substr(eq_pos + 1));

        if (current_section == "logging") {
            if (key == "level") {
                settings.logging.level = strip_quotes(value);
            } else if (key == "json") {
                settings.logging.json = parse_bool(value);
            } else if (key == "log_file") {
                settings.logging.log_file = parse_optional_string(value);
            } else if (key == "max_bytes") {
                settings.logging.max_bytes = std::stoi(value);
            } else if (key == "backup_count") {
                settings.logging.backup_count = std::stoi(value);
            }
        } else if (current_section == "server") {
            if (key == "enabled") {
                settings.server.enabled = parse_bool(value);
            } else if (key == "host") {
                settings.server.host = strip_quotes(value);
            } else if (key == "port") {
                settings.server.port = std::stoi(value);
            } else if (key == "workers") {
                settings.server.workers = std::stoi(value);
            } else if (key == "backlog") {
                settings.server.backlog = std::stoi(value);
            } else if (key == "read_timeout_seconds") {
                settings.server.read_timeout_seconds = std::stod(value);
            }
        } else if (current_section == "risk_thresholds") {
            auto& thresholds = settings.risk_thresholds;
            if (key == "preset") {
                thresholds.score = score_threshold_preset(strip_quotes(value));
            } else if (key == "matrix_preset") {
                thresholds.matrix = matrix_threshold_preset(strip_quotes(value));
            } else if (key == "low") {
                thresholds.score.low = parse_range(key, value);
            } else if (key == "medium") {
                thresholds.score.medium = parse_range(key, value);
            } else if (key == "high") {
                thresholds.score.high = parse_range(key, value);
            } else if (key == "matrix_low") {
                thresholds.matrix.low = parse_range(key, value);
            } else if (key == "matrix_medium") {
                thresholds.matrix.medium = parse_range(key, value);
            } else if (key == "matrix_high") {
                thresholds.matrix.high = parse_range(key, value);
            }
        } else if (current_section == "lopa_trigger") {
            if (key == "required_severity") {
                settings.lopa_trigger.required_severity = std::stoi(value);
            } else if (key == "score_threshold") {
                settings.lopa_trigger.score_threshold = std::stoi(value);
            } else if (key == "recommend_on_high_band") {
                settings.lopa_trigger.recommend_on_high_band = parse_bool(value);
            }
        } else if (current_section == "gap_analysis") {
            auto& gap = settings.gap_analysis;
            if (key == "adequate_ratio") {
                gap.adequate_ratio = std::stod(value);
            } else if (key == "marginal_ratio") {
                gap.marginal_ratio = std::stod(value);
            } else if (key == "ratio_tolerance") {
                gap.ratio_tolerance = std::stod(value);
            } else if (key == "non_independent_policy") {
                gap.non_independent_policy = strip_quotes(value);
            } else if (key == "discount_exponent") {
                gap.discount_exponent = std::stod(value);
            } else if (key == "sil1_max_rrf") {
                gap.sil1_max_rrf = std::stod(value);
            } else if (key == "sil2_max_rrf") {
                gap.sil2_max_rrf = std::stod(value);
            } else if (key == "sil3_max_rrf") {
                gap.sil3_max_rrf = std::stod(value);
            }
        } else if (current_section == "compliance") {
            auto& compliance = settings.compliance;
            if (key == "compliant_threshold") {
                compliance.compliant_threshold = std::stoi(value);
            } else if (key == "partial_threshold") {
                compliance.partial_threshold = std::stoi(value);
            } else if (key == "partial_weight") {
                compliance.partial_weight = std::stod(value);
            } else if (key == "exclude_not_applicable") {
                compliance.exclude_not_applicable = parse_bool(value);
            } else if (key == "excluded_clauses") {
                compliance.excluded_clauses = parse_string_list(value);
            }
        } else if (current_section == "raster") {
            if (key == "font_path") {
                settings.raster.font_path = strip_quotes(value);
            } else if (key == "bold_font_path") {
                settings.raster.bold_font_path = strip_quotes(value);
            }
        } else if (current_section.empty()) {
            if (key == "dataset_path") {
                settings.dataset_path = parse_optional_string(value);
            }
        }
    }

    if (!(settings.server.read_timeout_seconds > 0.0)) {
        throw std::runtime_error("server read_timeout_seconds must be positive");
    }
    if (settings.raster.font_path.empty()) {
        throw std::runtime_error("raster font_path must not be empty");
    }
    settings.risk_thresholds.score.validate(125);
    settings.risk_thresholds.matrix.validate(25);

    const auto& gap = settings.gap_analysis;
    if (gap.non_independent_policy != "exclude" && gap.non_independent_policy != "discount") {
        throw std::runtime_error("non_independent_policy must be exclude or discount: " + gap.non_independent_policy);
    }
    if (!(gap.marginal_ratio > 0.0 && gap.marginal_ratio <= gap.adequate_ratio)) {
        throw std::runtime_error("gap_analysis requires 0 < marginal_ratio <= adequate_ratio");
    }
    if (!(gap.sil1_max_rrf < gap.sil2_max_rrf && gap.sil2_max_rrf < gap.sil3_max_rrf)) {
        throw std::runtime_error("gap_analysis SIL band edges must be increasing");
    }
    const auto& compliance = settings.compliance;
    if (compliance.partial_threshold > compliance.compliant_threshold) {
        throw std::runtime_error("compliance partial_threshold must not exceed compliant_threshold");
    }
    if (compliance.partial_weight < 0.0 || compliance.partial_weight > 1.0) {
        throw std::runtime_error("compliance partial_weight must be within 0..1");
    }

    return settings;
}

}  // namespace psrisk
