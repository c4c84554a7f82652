#include "psrisk/lopa.hpp"

#include <cmath>
#include <cstdio>
#include <map>
#include <sstream>

namespace psrisk {

namespace {

struct IplTypeInfo {
    IplType type;
    const char* name;
    const char* label;
    double typical_pfd;
    double min_creditable_pfd;
};

const IplTypeInfo kIplTypes[] = {
    {IplType::kSafetyInstrumentedFunction, "safety_instrumented_function", "safety instrumented function", 0.01,
     1e-5},
    {IplType::kBasicProcessControl, "basic_process_control", "basic process control", 0.1, 0.01},
    {IplType::kReliefDevice, "relief_device", "relief device", 0.01, 0.001},
    {IplType::kPhysicalContainment, "physical_containment", "physical containment", 0.01, 0.001},
    {IplType::kMechanical, "mechanical", "mechanical device", 0.01, 0.001},
    {IplType::kHumanIntervention, "human_intervention", "human intervention", 0.1, 0.01},
    {IplType::kEmergencyResponse, "emergency_response", "emergency response", 0.1, 0.01},
    {IplType::kOther, "other", "other layer", 0.1, 0.01},
};

constexpr double kMaxCreditedLayerPfd = 0.1;
constexpr double kAtypicalPfdFactor = 10.0;

const IplTypeInfo& info(IplType type) {
    for (const auto& entry : kIplTypes) {
        if (entry.type == type) {
            return entry;
        }
    }
    return kIplTypes[sizeof(kIplTypes) / sizeof(kIplTypes[0]) - 1];
}

std::string number(double value) {
    std::ostringstream out;
    out << value;
    return out.str();
}

std::string ipl_ref(size_t index, const Ipl& ipl) {
    std::string ref = "IPL " + std::to_string(index + 1);
    if (!ipl.name.empty()) {
        ref += " (" + ipl.name + ")";
    }
    return ref;
}

bool is_power_of_ten(double value, int* exponent) {
    const double log_value = std::log10(value);
    const double rounded = std::round(log_value);
    if (std::fabs(log_value - rounded) < 1e-9) {
        *exponent = static_cast<int>(rounded);
        return true;
    }
    return false;
}

std::string scientific(double value) {
    int exponent = 0;
    if (is_power_of_ten(value, &exponent)) {
        return "10^" + std::to_string(exponent);
    }
    exponent = static_cast<int>(std::floor(std::log10(value)));
    const double mantissa = value / std::pow(10.0, exponent);
    char buffer[48];
    std::snprintf(buffer, sizeof(buffer), "%.1f x 10^%d", mantissa, exponent);
    return buffer;
}

void human_response_warnings(const std::string& ref, const Ipl& ipl, std::vector<std::string>* warnings) {
    if (ipl.pfd < kMaxCreditedLayerPfd) {
        warnings->push_back(ref + ": operator response credited below PFD 0.10 needs a documented independent "
                                  "alarm, written procedure, trained operators and more than 10 minutes to respond");
    }
    if (!ipl.human_response.has_value()) {
        return;
    }
    const auto& evidence = *ipl.human_response;
    if (evidence.response_time_minutes.has_value() && *evidence.response_time_minutes < kMinHumanResponseMinutes) {
        warnings->push_back(ref + ": response time " + number(*evidence.response_time_minutes) +
                            " min is below the 10 min needed for operator response credit");
    }
    if (evidence.independent_alarm.has_value() && !*evidence.independent_alarm) {
        warnings->push_back(ref + ": operator response has no independent alarm");
    }
    if (evidence.written_procedure.has_value() && !*evidence.written_procedure) {
        warnings->push_back(ref + ": operator response has no written procedure");
    }
    if (evidence.operators_trained.has_value() && !*evidence.operators_trained) {
        warnings->push_back(ref + ": operators are not trained on the response");
    }
}

}  // namespace

GapAnalyzer::GapAnalyzer() : GapAnalyzer(GapAnalysisConfig{}) {}

GapAnalyzer::GapAnalyzer(GapAnalysisConfig config, Logger logger)
    : config_(std::move(config)), logger_(std::move(logger)) {}

std::vector<FieldError> GapAnalyzer::validate(const LopaScenario& scenario) const {
    std::vector<FieldError> errors;
    const double ief = scenario.initiating_event_frequency;
    const bool ief_valid =
        std::isfinite(ief) && ief >= kMinInitiatingEventFrequency && ief <= kMaxInitiatingEventFrequency;
    if (!ief_valid) {
        errors.push_back({"initiating_event_frequency",
                          "initiating event frequency must be between " + number(kMinInitiatingEventFrequency) +
                              " and " + number(kMaxInitiatingEventFrequency) + " per year, got " + number(ief)});
    }
    const double target = scenario.target_frequency;
    const bool target_valid = std::isfinite(target) && target > 0.0 && target <= 1.0;
    if (!target_valid) {
        errors.push_back(
            {"target_frequency", "target frequency must be within (0, 1] per year, got " + number(target)});
    }
    if (ief_valid && target_valid && target >= ief) {
        errors.push_back({"target_frequency", "target frequency " + number(target) +
                                                  " must be less than initiating event frequency " + number(ief)});
    }
    for (size_t i = 0; i < scenario.ipls.size(); ++i) {
        const auto& ipl = scenario.ipls[i];
        const std::string field = "ipls[" + std::to_string(i) + "]";
        if (!std::isfinite(ipl.pfd) || ipl.pfd <= 0.0 || ipl.pfd > kMaxCreditablePfd) {
            errors.push_back({field + ".pfd", ipl_ref(i, ipl) + ": PFD must be within (0, 1], got " + number(ipl.pfd)});
        }
        if (ipl.sil.has_value() && (*ipl.sil < 1 || *ipl.sil > 4)) {
            errors.push_back(
                {field + ".sil", ipl_ref(i, ipl) + ": SIL must be between 1 and 4, got " + std::to_string(*ipl.sil)});
        }
    }
    return errors;
}

GapStatus GapAnalyzer::classify(double gap_ratio) const {
    const double slack = 1.0 - config_.ratio_tolerance;
    if (gap_ratio >= config_.adequate_ratio * slack) {
        return GapStatus::kAdequate;
    }
    if (gap_ratio >= config_.marginal_ratio * slack) {
        return GapStatus::kMarginal;
    }
    return GapStatus::kInadequate;
}

int GapAnalyzer::required_sil(double additional_rrf) const {
    const double stretch = 1.0 + config_.ratio_tolerance;
    if (additional_rrf <= config_.sil1_max_rrf * stretch) {
        return 1;
    }
    if (additional_rrf <= config_.sil2_max_rrf * stretch) {
        return 2;
    }
    if (additional_rrf <= config_.sil3_max_rrf * stretch) {
        return 3;
    }
    return 4;
}

IplCredit GapAnalyzer::credit(const Ipl& ipl) const {
    IplCredit result;
    result.ipl_id = ipl.id;
    result.name = ipl.name;
    result.pfd = ipl.pfd;
    result.rrf = rrf_from_pfd(ipl.pfd);
    if (ipl.independent_of_initiator && ipl.independent_of_other_ipls) {
        result.credited = true;
        result.credited_rrf = result.rrf;
    } else if (config_.non_independent_policy == "discount") {
        result.credited_rrf = std::pow(result.rrf, config_.discount_exponent);
    }
    return result;
}

std::vector<std::string> GapAnalyzer::crediting_warnings(const std::vector<Ipl>& ipls) const {
    std::vector<std::string> warnings;
    for (size_t i = 0; i < ipls.size(); ++i) {
        const auto& ipl = ipls[i];
        const std::string ref = ipl_ref(i, ipl);
        const auto& type_info = info(ipl.type);
        if (ipl.pfd < kMinCreditablePfd) {
            warnings.push_back(ref + ": PFD " + format_pfd(ipl.pfd) + " is below the minimum creditable PFD " +
                               format_pfd(kMinCreditablePfd));
        } else if (ipl.pfd < type_info.min_creditable_pfd) {
            warnings.push_back(ref + ": PFD " + format_pfd(ipl.pfd) + " is below the minimum creditable value " +
                               format_pfd(type_info.min_creditable_pfd) + " for a " + type_info.label);
        }
        if (ipl.pfd > kMaxCreditedLayerPfd) {
            warnings.push_back(ref + ": PFD " + format_pfd(ipl.pfd) +
                               " exceeds 0.1; layers weaker than RRF 10 are not normally credited");
        }
        if (ipl.type == IplType::kSafetyInstrumentedFunction) {
            if (!ipl.sil.has_value()) {
                warnings.push_back(ref + ": safety instrumented function has no SIL assigned");
            } else if (*ipl.sil >= 1 && *ipl.sil <= 4) {
                const auto range = sil_pfd_range(*ipl.sil);
                if (ipl.pfd < range.min || ipl.pfd > range.max) {
                    warnings.push_back(ref + ": PFD " + format_pfd(ipl.pfd) + " is outside the SIL " +
                                       std::to_string(*ipl.sil) + " range " + format_pfd(range.min) + " to " +
                                       format_pfd(range.max));
                }
            }
        }
        const double typical_ratio = ipl.pfd / type_info.typical_pfd;
        if (ipl.pfd > 0.0 && (typical_ratio < 1.0 / kAtypicalPfdFactor || typical_ratio > kAtypicalPfdFactor)) {
            warnings.push_back(ref + ": PFD " + format_pfd(ipl.pfd) + " differs from the typical " +
                               format_pfd(type_info.typical_pfd) + " for a " + type_info.label +
                               " by more than a factor of 10; document the justification");
        }
        if (ipl.type == IplType::kHumanIntervention) {
            human_response_warnings(ref, ipl, &warnings);
        }
        if (ipl.type == IplType::kBasicProcessControl) {
            if (ipl.pfd < kMaxCreditedLayerPfd) {
                warnings.push_back(ref + ": basic process control is not normally credited below PFD 0.10");
            }
            warnings.push_back(ref + ": verify the control loop is not the one that causes the initiating event");
        }
        if (!ipl.independent_of_initiator) {
            warnings.push_back(ref + ": layer is not independent of initiator and is not fully credited");
        }
        if (!ipl.independent_of_other_ipls) {
            warnings.push_back(ref + ": layer is not independent of other IPLs and is not fully credited");
        }
    }
    return warnings;
}

std::vector<std::string> GapAnalyzer::common_cause_warnings(const std::vector<Ipl>& ipls) const {
    std::vector<std::string> warnings;
    std::map<std::string, int> per_type;
    int dependent = 0;
    for (const auto& ipl : ipls) {
        per_type[to_string(ipl.type)] += 1;
        if (!ipl.independent_of_other_ipls) {
            dependent += 1;
        }
    }
    for (const auto& [type, count] : per_type) {
        if (count > 1) {
            warnings.push_back(std::to_string(count) + " layers of type " + type +
                               " may share common cause failures; verify independence");
        }
    }
    if (per_type.count(to_string(IplType::kHumanIntervention)) != 0 &&
        per_type[to_string(IplType::kHumanIntervention)] > 1) {
        warnings.push_back("several operator responses are credited; verify different operators and actions "
                           "with no common error mode");
    }
    if (per_type.count(to_string(IplType::kBasicProcessControl)) != 0 &&
        per_type.count(to_string(IplType::kSafetyInstrumentedFunction)) != 0) {
        warnings.push_back("basic process control and a safety instrumented function are both credited; verify "
                           "they share no sensors, final elements or power supplies");
    }
    if (dependent > 0) {
        warnings.push_back(std::to_string(dependent) +
                           " layer(s) marked as not independent of other IPLs; common cause factors must be addressed");
    }
    return warnings;
}

std::vector<std::string> GapAnalyzer::recommendations(const GapAnalysis& analysis) const {
    std::vector<std::string> output;
    if (analysis.is_adequate()) {
        return output;
    }
    const double additional = analysis.required_rrf / analysis.total_rrf;
    const int sil = analysis.required_sil.value_or(required_sil(additional));

    output.push_back("Protection is " + to_string(analysis.gap_status) + ": achieved RRF " +
                     format_rrf(analysis.total_rrf) + " against required RRF " + format_rrf(analysis.required_rrf) +
                     " (" + std::to_string(orders_of_magnitude(additional)) + " order(s) of magnitude short).");
    output.push_back("Provide additional risk reduction of at least " + format_rrf(additional) + ", e.g. a SIL " +
                     std::to_string(sil) + " safety instrumented function.");

    bool has_sif = false;
    bool has_relief = false;
    for (const auto& ipl : analysis.scenario.ipls) {
        has_sif = has_sif || ipl.type == IplType::kSafetyInstrumentedFunction;
        has_relief = has_relief || ipl.type == IplType::kReliefDevice;
    }
    if (!has_sif) {
        output.push_back("Consider adding a safety instrumented function rated SIL " + std::to_string(sil) +
                         " as an independent protection layer.");
    }
    if (!has_relief) {
        output.push_back("Evaluate whether a relief device can mitigate the consequence.");
    }
    if (analysis.gap_status == GapStatus::kMarginal) {
        output.push_back("Verify the PFD claimed for existing layers; shorter proof-test intervals may close the "
                         "marginal gap.");
    }
    for (const auto& credit : analysis.credits) {
        if (!credit.credited) {
            output.push_back("Restore independence of IPL '" + credit.name +
                             "' or replace it; it is not fully credited in the risk reduction.");
        }
    }
    output.push_back("Schedule a LOPA review to confirm the initiating event frequency and target frequency.");
    return output;
}

GapAnalysis GapAnalyzer::analyze(const LopaScenario& scenario) const {
    auto errors = validate(scenario);
    if (!errors.empty()) {
        logger_.warn("lopa_scenario_invalid",
                     {{"scenario_id", scenario.id}, {"error_count", std::to_string(errors.size())}});
        const auto message = "invalid LOPA scenario: " + errors.front().message;
        throw ValidationError(message, std::move(errors));
    }

    GapAnalysis analysis;
    analysis.scenario = scenario;
    analysis.total_rrf = 1.0;
    for (const auto& ipl : scenario.ipls) {
        auto layer = credit(ipl);
        analysis.total_rrf *= layer.credited_rrf;
        analysis.credits.push_back(std::move(layer));
    }
    analysis.required_rrf = scenario.initiating_event_frequency / scenario.target_frequency;
    analysis.gap_ratio = analysis.total_rrf / analysis.required_rrf;
    analysis.gap_status = classify(analysis.gap_ratio);
    analysis.mitigated_event_likelihood = scenario.initiating_event_frequency / analysis.total_rrf;
    if (!analysis.is_adequate()) {
        analysis.required_sil = required_sil(analysis.required_rrf / analysis.total_rrf);
    }
    analysis.recommendations = recommendations(analysis);
    analysis.warnings = crediting_warnings(scenario.ipls);
    for (auto& warning : common_cause_warnings(scenario.ipls)) {
        analysis.warnings.push_back(std::move(warning));
    }

    logger_.debug("gap_analysis_complete", {{"scenario_id", scenario.id},
                                             {"gap_status", to_string(analysis.gap_status)},
                                             {"gap_ratio", number(analysis.gap_ratio)},
                                             {"warnings", std::to_string(analysis.warnings.size())}});
    return analysis;
}

double rrf_from_pfd(double pfd) {
    if (!std::isfinite(pfd) || pfd <= 0.0 || pfd > kMaxCreditablePfd) {
        throw ValidationError("PFD must be within (0, 1]", {{"pfd", "PFD must be within (0, 1], got " + number(pfd)}});
    }
    return 1.0 / pfd;
}

std::string to_string(IplType type) {
    return info(type).name;
}

std::string to_string(InitiatingEventCategory category) {
    switch (category) {
        case InitiatingEventCategory::kEquipmentFailure:
            return "equipment_failure";
        case InitiatingEventCategory::kControlSystemFailure:
            return "control_system_failure";
        case InitiatingEventCategory::kHumanError:
            return "human_error";
        case InitiatingEventCategory::kExternalEvent:
            return "external_event";
        case InitiatingEventCategory::kLossOfUtility:
            return "loss_of_utility";
        case InitiatingEventCategory::kOther:
            return "other";
    }
    return "other";
}

std::string to_string(GapStatus status) {
    switch (status) {
        case GapStatus::kAdequate:
            return "adequate";
        case GapStatus::kMarginal:
            return "marginal";
        case GapStatus::kInadequate:
            return "inadequate";
    }
    return "inadequate";
}

std::optional<IplType> parse_ipl_type(const std::string& value) {
    for (const auto& entry : kIplTypes) {
        if (value == entry.name) {
            return entry.type;
        }
    }
    return std::nullopt;
}

std::optional<InitiatingEventCategory> parse_initiating_event_category(const std::string& value) {
    const InitiatingEventCategory categories[] = {
        InitiatingEventCategory::kEquipmentFailure, InitiatingEventCategory::kControlSystemFailure,
        InitiatingEventCategory::kHumanError,       InitiatingEventCategory::kExternalEvent,
        InitiatingEventCategory::kLossOfUtility,    InitiatingEventCategory::kOther,
    };
    for (auto category : categories) {
        if (value == to_string(category)) {
            return category;
        }
    }
    return std::nullopt;
}

double typical_pfd(IplType type) {
    return info(type).typical_pfd;
}

PfdRange creditable_pfd_range(IplType type) {
    return PfdRange{info(type).min_creditable_pfd, kMaxCreditedLayerPfd};
}

PfdRange sil_pfd_range(int sil) {
    switch (sil) {
        case 1:
            return PfdRange{1e-2, 1e-1};
        case 2:
            return PfdRange{1e-3, 1e-2};
        case 3:
            return PfdRange{1e-4, 1e-3};
        case 4:
            return PfdRange{1e-5, 1e-4};
        default:
            throw ValidationError("SIL must be between 1 and 4",
                                  {{"sil", "SIL must be between 1 and 4, got " + std::to_string(sil)}});
    }
}

double typical_pfd_for_sil(int sil) {
    const auto range = sil_pfd_range(sil);
    return range.max / 2.0;
}

std::optional<int> sil_from_pfd(double pfd) {
    for (int sil = 1; sil <= 4; ++sil) {
        const auto range = sil_pfd_range(sil);
        if (pfd >= range.min && pfd <= range.max) {
            return sil;
        }
    }
    return std::nullopt;
}

std::string format_frequency(double frequency) {
    if (frequency >= 1.0) {
        char buffer[48];
        std::snprintf(buffer, sizeof(buffer), "%.1f per year", frequency);
        return buffer;
    }
    if (frequency <= 0.0) {
        return "0 per year";
    }
    return scientific(frequency) + " per year";
}

std::string format_pfd(double pfd) {
    if (pfd >= 0.01) {
        char buffer[32];
        std::snprintf(buffer, sizeof(buffer), "%.2f", pfd);
        return buffer;
    }
    if (pfd <= 0.0) {
        return number(pfd);
    }
    return scientific(pfd);
}

std::string format_rrf(double rrf) {
    char buffer[32];
    if (rrf < 1'000.0) {
        std::snprintf(buffer, sizeof(buffer), "%.0f", rrf);
    } else if (rrf < 1'000'000.0) {
        const double thousands = rrf / 1'000.0;
        std::snprintf(buffer, sizeof(buffer), thousands < 10.0 ? "%.1fK" : "%.0fK", thousands);
    } else {
        const double millions = rrf / 1'000'000.0;
        std::snprintf(buffer, sizeof(buffer), millions < 10.0 ? "%.1fM" : "%.0fM", millions);
    }
    return buffer;
}

int orders_of_magnitude(double ratio) {
    if (!(ratio > 1.0)) {
        return 0;
    }
    return static_cast<int>(std::ceil(std::log10(ratio) - 1e-9));
}

}  // namespace psrisk
