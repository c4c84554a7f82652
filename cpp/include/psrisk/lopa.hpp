#ifndef PSRISK_LOPA_HPP
#define PSRISK_LOPA_HPP

#include <optional>
#include <string>
#include <vector>

#include "psrisk/config.hpp"
#include "psrisk/errors.hpp"
#include "psrisk/logging.hpp"

namespace psrisk {

constexpr double kMinCreditablePfd = 1e-5;
constexpr double kMaxCreditablePfd = 1.0;
constexpr double kMinInitiatingEventFrequency = 1e-8;
constexpr double kMaxInitiatingEventFrequency = 100.0;
constexpr double kMinHumanResponseMinutes = 10.0;

enum class IplType {
    kSafetyInstrumentedFunction,
    kBasicProcessControl,
    kReliefDevice,
    kPhysicalContainment,
    kMechanical,
    kHumanIntervention,
    kEmergencyResponse,
    kOther,
};

enum class InitiatingEventCategory {
    kEquipmentFailure,
    kControlSystemFailure,
    kHumanError,
    kExternalEvent,
    kLossOfUtility,
    kOther,
};

enum class GapStatus {
    kAdequate,
    kMarginal,
    kInadequate,
};

// Documented conditions behind an operator response credit; unset means not recorded.
struct HumanResponseEvidence {
    std::optional<double> response_time_minutes = std::nullopt;
    std::optional<bool> independent_alarm = std::nullopt;
    std::optional<bool> written_procedure = std::nullopt;
    std::optional<bool> operators_trained = std::nullopt;
};

struct Ipl {
    std::string id;
    std::string name;
    IplType type = IplType::kOther;
    std::string description;
    double pfd = 1.0;
    bool independent_of_initiator = true;
    bool independent_of_other_ipls = true;
    std::optional<int> sil = std::nullopt;
    std::optional<HumanResponseEvidence> human_response = std::nullopt;
};

struct LopaScenario {
    std::string id;
    std::string analysis_id;
    std::string node_id;
    std::optional<std::string> entry_id = std::nullopt;
    std::string scenario_description;
    std::string consequence;
    double initiating_event_frequency = 0.0;
    InitiatingEventCategory initiating_event_category = InitiatingEventCategory::kOther;
    std::string initiating_event_description;
    double target_frequency = 0.0;
    std::vector<Ipl> ipls;
};

// Audit record of how much reduction one layer was given.
struct IplCredit {
    std::string ipl_id;
    std::string name;
    double pfd = 1.0;
    double rrf = 1.0;
    double credited_rrf = 1.0;
    bool credited = false;
};

struct GapAnalysis {
    LopaScenario scenario;
    std::vector<IplCredit> credits;
    double total_rrf = 1.0;
    double required_rrf = 1.0;
    double gap_ratio = 1.0;
    GapStatus gap_status = GapStatus::kInadequate;
    double mitigated_event_likelihood = 0.0;
    std::optional<int> required_sil = std::nullopt;
    std::vector<std::string> recommendations;
    std::vector<std::string> warnings;

    bool is_adequate() const { return gap_status == GapStatus::kAdequate; }
};

struct PfdRange {
    double min = 0.0;
    double max = 1.0;
};

class GapAnalyzer {
public:
    GapAnalyzer();
    explicit GapAnalyzer(GapAnalysisConfig config, Logger logger = get_logger("psrisk.lopa"));

    // Throws ValidationError listing every invalid field of the scenario.
    GapAnalysis analyze(const LopaScenario& scenario) const;

    std::vector<FieldError> validate(const LopaScenario& scenario) const;
    GapStatus classify(double gap_ratio) const;
    // SIL needed to supply additional_rrf of risk reduction.
    int required_sil(double additional_rrf) const;
    std::vector<std::string> crediting_warnings(const std::vector<Ipl>& ipls) const;
    // Layer combinations that may fail together.
    std::vector<std::string> common_cause_warnings(const std::vector<Ipl>& ipls) const;

    const GapAnalysisConfig& config() const { return config_; }

private:
    IplCredit credit(const Ipl& ipl) const;
    std::vector<std::string> recommendations(const GapAnalysis& analysis) const;

    GapAnalysisConfig config_{};
    Logger logger_;
};

double rrf_from_pfd(double pfd);

std::string to_string(IplType type);
std::string to_string(InitiatingEventCategory category);
std::string to_string(GapStatus status);
std::optional<IplType> parse_ipl_type(const std::string& value);
std::optional<InitiatingEventCategory> parse_initiating_event_category(const std::string& value);

double typical_pfd(IplType type);
PfdRange creditable_pfd_range(IplType type);
PfdRange sil_pfd_range(int sil);
double typical_pfd_for_sil(int sil);
std::optional<int> sil_from_pfd(double pfd);

std::string format_frequency(double frequency);
std::string format_pfd(double pfd);
std::string format_rrf(double rrf);
int orders_of_magnitude(double ratio);

}  // namespace psrisk

#endif  // PSRISK_LOPA_HPP
