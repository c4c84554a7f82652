#ifndef PSRISK_RISK_HPP
#define PSRISK_RISK_HPP

#include <optional>
#include <string>
#include <vector>

#include "psrisk/config.hpp"

namespace psrisk {

constexpr int kMinLevel = 1;
constexpr int kMaxLevel = 5;
constexpr int kMaxScore = kMaxLevel * kMaxLevel * kMaxLevel;
constexpr int kMaxMatrixScore = kMaxLevel * kMaxLevel;

enum class RiskBand {
    kLow,
    kMedium,
    kHigh,
};

struct RiskRating {
    int severity = 1;
    int likelihood = 1;
    std::optional<int> detectability = std::nullopt;
};

// One deviation row of a hazard review. Unrated rows are drafts.
struct RiskEntry {
    std::string id;
    std::string analysis_id;
    std::string node_id;
    std::string guide_word;
    std::string parameter;
    std::string deviation;
    std::vector<std::string> causes;
    std::vector<std::string> consequences;
    std::vector<std::string> safeguards;
    std::vector<std::string> recommendations;
    std::optional<RiskRating> rating = std::nullopt;
};

struct LopaTrigger {
    bool required = false;
    bool recommended = false;
    std::string reason;
};

class RiskScorer {
public:
    RiskScorer() = default;
    explicit RiskScorer(BandThresholds thresholds, LopaTriggerConfig trigger = {});

    static int score(int severity, int likelihood, std::optional<int> detectability = std::nullopt);
    static int score(const RiskRating& rating);

    RiskBand band(int score) const;
    RiskBand band(const RiskRating& rating) const;
    LopaTrigger check_lopa_trigger(const RiskRating& rating) const;

    const BandThresholds& thresholds() const { return thresholds_; }

private:
    BandThresholds thresholds_{};
    LopaTriggerConfig trigger_{};
};

// Throws ValidationError naming the field when value is outside 1..5.
void validate_level(const std::string& field, int value);

RiskBand matrix_band(int severity, int likelihood, const BandThresholds& thresholds = {{1, 4}, {5, 14}, {15, 25}});

std::string to_string(RiskBand band);
std::string band_label(RiskBand band);
std::string severity_label(int severity);
std::string likelihood_label(int likelihood);

bool is_lopa_recommended(int severity, int likelihood);
// Tolerable event frequency per year for a consequence severity.
double target_frequency_for_severity(int severity);

}  // namespace psrisk

#endif  // PSRISK_RISK_HPP
