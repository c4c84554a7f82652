#include "psrisk/risk.hpp"

#include "psrisk/errors.hpp"

namespace psrisk {

namespace {

RiskBand band_for(int value, const BandThresholds& thresholds, int max_score) {
    if (value < 1 || value > max_score) {
        throw ValidationError("score must be between 1 and " + std::to_string(max_score),
                              {{"score", "score " + std::to_string(value) + " is outside 1-" +
                                             std::to_string(max_score)}});
    }
    if (value <= thresholds.low.max) {
        return RiskBand::kLow;
    }
    if (value <= thresholds.medium.max) {
        return RiskBand::kMedium;
    }
    return RiskBand::kHigh;
}

}  // namespace

void validate_level(const std::string& field, int value) {
    if (value < kMinLevel || value > kMaxLevel) {
        throw ValidationError(field + " must be between 1 and 5",
                              {{field, field + " must be between 1 and 5, got " + std::to_string(value)}});
    }
}

RiskScorer::RiskScorer(BandThresholds thresholds, LopaTriggerConfig trigger)
    : thresholds_(thresholds), trigger_(trigger) {
    thresholds_.validate(kMaxScore);
}

int RiskScorer::score(int severity, int likelihood, std::optional<int> detectability) {
    validate_level("severity", severity);
    validate_level("likelihood", likelihood);
    const int detect = detectability.value_or(1);
    validate_level("detectability", detect);
    return severity * likelihood * detect;
}

int RiskScorer::score(const RiskRating& rating) {
    return score(rating.severity, rating.likelihood, rating.detectability);
}

RiskBand RiskScorer::band(int score) const {
    return band_for(score, thresholds_, kMaxScore);
}

RiskBand RiskScorer::band(const RiskRating& rating) const {
    return band(score(rating));
}

LopaTrigger RiskScorer::check_lopa_trigger(const RiskRating& rating) const {
    const int value = score(rating);
    LopaTrigger trigger;
    if (rating.severity >= trigger_.required_severity) {
        trigger.required = true;
        trigger.recommended = true;
        trigger.reason = "consequence severity level " + std::to_string(rating.severity) + " (" +
                         severity_label(rating.severity) + ") requires LOPA";
        return trigger;
    }
    if (trigger_.recommend_on_high_band && band(value) == RiskBand::kHigh) {
        trigger.recommended = true;
        trigger.reason = "score " + std::to_string(value) + " falls in the high risk band";
        return trigger;
    }
    if (trigger_.score_threshold > 0 && value >= trigger_.score_threshold) {
        trigger.recommended = true;
        trigger.reason = "score " + std::to_string(value) + " meets LOPA threshold " +
                         std::to_string(trigger_.score_threshold);
        return trigger;
    }
    if (is_lopa_recommended(rating.severity, rating.likelihood)) {
        trigger.recommended = true;
        trigger.reason = "moderate severity with likely occurrence";
        return trigger;
    }
    trigger.reason = "LOPA not required for score " + std::to_string(value);
    return trigger;
}

RiskBand matrix_band(int severity, int likelihood, const BandThresholds& thresholds) {
    validate_level("severity", severity);
    validate_level("likelihood", likelihood);
    return band_for(severity * likelihood, thresholds, kMaxMatrixScore);
}

std::string to_string(RiskBand band) {
    switch (band) {
        case RiskBand::kLow:
            return "low";
        case RiskBand::kMedium:
            return "medium";
        case RiskBand::kHigh:
            return "high";
    }
    return "low";
}

std::string band_label(RiskBand band) {
    switch (band) {
        case RiskBand::kLow:
            return "Low Risk";
        case RiskBand::kMedium:
            return "Medium Risk";
        case RiskBand::kHigh:
            return "High Risk";
    }
    return "Low Risk";
}

std::string severity_label(int severity) {
    static const char* kLabels[] = {"Negligible", "Minor", "Moderate", "Major", "Catastrophic"};
    validate_level("severity", severity);
    return kLabels[severity - 1];
}

std::string likelihood_label(int likelihood) {
    static const char* kLabels[] = {"Rare", "Unlikely", "Possible", "Likely", "Almost Certain"};
    validate_level("likelihood", likelihood);
    return kLabels[likelihood - 1];
}

bool is_lopa_recommended(int severity, int likelihood) {
    return severity >= 4 || (severity == 3 && likelihood >= 4);
}

double target_frequency_for_severity(int severity) {
    validate_level("severity", severity);
    static const double kTargets[] = {1e-2, 1e-3, 1e-4, 1e-5, 1e-6};
    return kTargets[severity - 1];
}

}  // namespace psrisk
