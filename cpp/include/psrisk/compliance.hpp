#ifndef PSRISK_COMPLIANCE_HPP
#define PSRISK_COMPLIANCE_HPP

#include <memory>
#include <string>
#include <vector>

#include "psrisk/config.hpp"
#include "psrisk/logging.hpp"
#include "psrisk/lopa.hpp"
#include "psrisk/records.hpp"
#include "psrisk/risk.hpp"
#include "psrisk/standards.hpp"

namespace psrisk {

enum class ComplianceStatus {
    kCompliant,
    kPartiallyCompliant,
    kNonCompliant,
    kNotApplicable,
    kNotAssessed,
};

enum class GapSeverity {
    kCritical,
    kMajor,
    kMinor,
};

struct AreaAssessment {
    ComplianceStatus status = ComplianceStatus::kNotAssessed;
    std::string evidence;
};

struct ComplianceCheckResult {
    StandardId standard_id;
    std::string clause_id;
    std::string clause_title;
    bool mandatory = true;
    ComplianceStatus status = ComplianceStatus::kNotAssessed;
    std::string evidence;
    std::vector<std::string> gaps;
    std::vector<std::string> recommendations;
};

struct ComplianceGap {
    StandardId standard_id;
    std::string clause_id;
    std::string description;
    GapSeverity severity = GapSeverity::kMinor;
    std::vector<std::string> remediation;
};

struct StandardComplianceSummary {
    StandardId standard_id;
    std::string standard_name;
    int total_clauses = 0;
    int compliant_count = 0;
    int partially_compliant_count = 0;
    int non_compliant_count = 0;
    int not_applicable_count = 0;
    int not_assessed_count = 0;
    int compliance_percentage = 0;
    ComplianceStatus overall_status = ComplianceStatus::kNotAssessed;

    int assessed_count() const { return compliant_count + partially_compliant_count + non_compliant_count; }
};

// Records of one analysis as read at computation time.
struct ReviewSnapshot {
    std::vector<RiskEntry> entries;
    std::vector<GapAnalysis> gap_analyses;
};

struct ComplianceReport {
    std::vector<ComplianceCheckResult> results;
    std::vector<StandardComplianceSummary> summaries;
    std::vector<ComplianceGap> gaps;
    int overall_percentage = 0;
    ComplianceStatus overall_status = ComplianceStatus::kNotAssessed;
};

struct MissingRequirements {
    std::vector<std::string> documentation;
    std::vector<std::string> risk_assessment;
    std::vector<std::string> safeguards;
    std::vector<std::string> recommendations;
    std::vector<std::string> lopa;

    bool empty() const {
        return documentation.empty() && risk_assessment.empty() && safeguards.empty() && recommendations.empty() &&
               lopa.empty();
    }
};

struct AnalysisComplianceStatus {
    std::string analysis_id;
    std::string analysis_name;
    std::string project_id;
    std::string analysis_status;
    int entry_count = 0;
    bool has_lopa = false;
    int lopa_count = 0;
    std::vector<StandardId> standards_checked;
    std::vector<StandardComplianceSummary> summaries;
    ComplianceStatus overall_status = ComplianceStatus::kNotAssessed;
    int overall_percentage = 0;
    std::string checked_at;
};

struct ProjectComplianceStatus {
    std::string project_id;
    std::string project_name;
    int analysis_count = 0;
    int entry_count = 0;
    bool has_lopa = false;
    int lopa_count = 0;
    std::vector<StandardId> standards_checked;
    std::vector<StandardComplianceSummary> summaries;
    ComplianceStatus overall_status = ComplianceStatus::kNotAssessed;
    int overall_percentage = 0;
    std::string checked_at;
};

// Pure clause-level evaluation of a snapshot against the standards catalogue.
class ComplianceEvaluator {
public:
    ComplianceEvaluator() = default;
    explicit ComplianceEvaluator(ComplianceConfig config, RiskScorer scorer = RiskScorer());

    AreaAssessment assess_area(ComplianceArea area, const ReviewSnapshot& snapshot) const;
    ComplianceCheckResult check_clause(const RegulatoryStandard& standard, const Clause& clause,
                                       const ReviewSnapshot& snapshot) const;
    // Throws ComputationError when the standard has no clauses.
    std::vector<ComplianceCheckResult> check_standard(const RegulatoryStandard& standard,
                                                      const ReviewSnapshot& snapshot) const;
    StandardComplianceSummary summarize(const RegulatoryStandard& standard,
                                        const std::vector<ComplianceCheckResult>& results) const;
    ComplianceReport evaluate(const ReviewSnapshot& snapshot, const std::vector<StandardId>& standards) const;
    MissingRequirements missing_requirements(const ReviewSnapshot& snapshot) const;

    int compliance_percentage(const StandardComplianceSummary& summary) const;
    ComplianceStatus classify(int percentage, int assessed_clauses) const;
    int overall_percentage(const std::vector<StandardComplianceSummary>& summaries) const;
    ComplianceStatus overall_status(const std::vector<StandardComplianceSummary>& summaries) const;

    const ComplianceConfig& config() const { return config_; }

private:
    bool excluded(StandardId standard, const std::string& clause_id) const;
    std::vector<const RiskEntry*> lopa_candidates(const ReviewSnapshot& snapshot) const;

    ComplianceConfig config_{};
    RiskScorer scorer_{};
};

// Loads records through the store and rolls clause results up to analysis and project scope.
class ComplianceAggregator {
public:
    ComplianceAggregator(std::shared_ptr<const RecordStore> store, std::shared_ptr<const AccessPolicy> access,
                         ComplianceEvaluator evaluator = ComplianceEvaluator(),
                         GapAnalyzer analyzer = GapAnalyzer(), Logger logger = get_logger("psrisk.compliance"));

    AnalysisComplianceStatus analysis_compliance(const std::string& analysis_id,
                                                 const std::vector<StandardId>& standards = {}) const;
    ProjectComplianceStatus project_compliance(const std::string& project_id,
                                               const std::vector<StandardId>& standards = {}) const;
    ComplianceReport analysis_report(const std::string& analysis_id,
                                     const std::vector<StandardId>& standards = {}) const;

    // Reads entries and analyzes scenarios. Throws ComputationError on invalid persisted data.
    ReviewSnapshot load_snapshot(const std::string& analysis_id) const;

private:
    AnalysisRecord require_analysis(const std::string& analysis_id) const;

    std::shared_ptr<const RecordStore> store_;
    std::shared_ptr<const AccessPolicy> access_;
    ComplianceEvaluator evaluator_;
    GapAnalyzer analyzer_;
    Logger logger_;
};

std::string to_string(ComplianceStatus status);
std::string to_string(GapSeverity severity);
GapSeverity gap_severity(bool standard_mandatory, bool clause_mandatory);

}  // namespace psrisk

#endif  // PSRISK_COMPLIANCE_HPP
