#ifndef PSRISK_CONFIG_HPP
#define PSRISK_CONFIG_HPP

#include <optional>
#include <string>
#include <vector>

namespace psrisk {

struct LoggingConfig {
    std::string level = "INFO";
    bool json = true;
    std::optional<std::string> log_file = std::nullopt;
    int max_bytes = 1'000'000;
    int backup_count = 3;
};

struct ServerConfig {
    bool enabled = true;
    std::string host = "0.0.0.0";
    int port = 8080;
    int workers = 4;
    int backlog = 16;
    // A client that sends nothing for this long is dropped.
    double read_timeout_seconds = 5.0;
};

// Inclusive score range of one risk band.
struct ScoreRange {
    int min = 1;
    int max = 1;
};

struct BandThresholds {
    ScoreRange low{1, 20};
    ScoreRange medium{21, 60};
    ScoreRange high{61, 125};

    // Throws ValidationError unless the three ranges are contiguous and cover 1..max_score.
    void validate(int max_score) const;
};

struct RiskThresholdConfig {
    BandThresholds score{};
    BandThresholds matrix{{1, 4}, {5, 14}, {15, 25}};
};

struct LopaTriggerConfig {
    int required_severity = 4;
    int score_threshold = 61;
    bool recommend_on_high_band = true;
};

struct GapAnalysisConfig {
    double adequate_ratio = 1.0;
    double marginal_ratio = 0.5;
    double ratio_tolerance = 1e-9;
    // "exclude" gives non-independent layers no credit; "discount" credits rrf^discount_exponent.
    std::string non_independent_policy = "exclude";
    double discount_exponent = 0.5;
    double sil1_max_rrf = 100.0;
    double sil2_max_rrf = 1'000.0;
    double sil3_max_rrf = 10'000.0;
};

struct ComplianceConfig {
    int compliant_threshold = 90;
    int partial_threshold = 50;
    double partial_weight = 0.5;
    bool exclude_not_applicable = false;
    // Entries of the form "STANDARD_ID:clause".
    std::vector<std::string> excluded_clauses;
};

// Faces used to draw matrix text into PNG output.
struct RasterConfig {
    std::string font_path = "/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf";
    // Empty reuses font_path.
    std::string bold_font_path = "/usr/share/fonts/truetype/dejavu/DejaVuSans-Bold.ttf";
};

struct EngineSettings {
    LoggingConfig logging{};
    ServerConfig server{};
    RiskThresholdConfig risk_thresholds{};
    LopaTriggerConfig lopa_trigger{};
    GapAnalysisConfig gap_analysis{};
    ComplianceConfig compliance{};
    RasterConfig raster{};
    std::optional<std::string> dataset_path = std::nullopt;

    static EngineSettings from_toml(const std::string& path);
};

BandThresholds score_threshold_preset(const std::string& name);
BandThresholds matrix_threshold_preset(const std::string& name);

}  // namespace psrisk

#endif  // PSRISK_CONFIG_HPP
