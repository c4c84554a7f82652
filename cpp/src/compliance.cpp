#include "psrisk/compliance.hpp"

#include <algorithm>
#include <cmath>
#include <iterator>
#include <set>
#include <stdexcept>

#include "psrisk/common.hpp"
#include "psrisk/errors.hpp"

namespace psrisk {

namespace {

int severity_rank(ComplianceStatus status) {
    switch (status) {
        case ComplianceStatus::kNonCompliant:
            return 3;
        case ComplianceStatus::kPartiallyCompliant:
            return 2;
        case ComplianceStatus::kCompliant:
            return 1;
        default:
            return 0;
    }
}

bool is_assessed(ComplianceStatus status) {
    return severity_rank(status) > 0;
}

std::string percent(int count, int total) {
    const int value = total == 0 ? 0 : static_cast<int>(std::lround(100.0 * count / total));
    return std::to_string(count) + " of " + std::to_string(total) + " entries (" + std::to_string(value) + "%)";
}

AreaAssessment share_rule(int count, int total, double compliant_share, double partial_share,
                          const std::string& subject) {
    AreaAssessment assessment;
    assessment.evidence = percent(count, total) + " " + subject;
    const double share = total == 0 ? 0.0 : static_cast<double>(count) / total;
    if (share >= compliant_share) {
        assessment.status = ComplianceStatus::kCompliant;
    } else if (count > 0 && share >= partial_share) {
        assessment.status = ComplianceStatus::kPartiallyCompliant;
    } else {
        assessment.status = ComplianceStatus::kNonCompliant;
    }
    return assessment;
}

std::string remediation_for(ComplianceArea area) {
    switch (area) {
        case ComplianceArea::kHazardIdentification:
            return "Record causes and consequences for every deviation.";
        case ComplianceArea::kRiskAssessment:
            return "Assign severity and likelihood ratings to all risk entries.";
        case ComplianceArea::kRiskRanking:
            return "Rank every deviation on the risk matrix.";
        case ComplianceArea::kSafeguards:
            return "Document the existing safeguards for each deviation.";
        case ComplianceArea::kRecommendations:
            return "Add recommendations for every high-risk entry.";
        case ComplianceArea::kLopa:
            return "Perform LOPA for high-consequence scenarios and close inadequate protection gaps.";
        case ComplianceArea::kSilDetermination:
            return "Determine the required SIL of safety instrumented functions from LOPA results.";
        case ComplianceArea::kDocumentation:
            return "Complete causes, consequences, safeguards and recommendations for all entries.";
        case ComplianceArea::kTeamComposition:
            return "Record the review team and its competencies.";
        case ComplianceArea::kMethodology:
            return "Apply a broader set of guide words across the study nodes.";
        case ComplianceArea::kFollowUp:
            return "Raise recommendations so findings can be tracked to closure.";
        case ComplianceArea::kManagementOfChange:
            return "Route modifications arising from the study through management of change.";
    }
    return "Review the clause requirements.";
}

bool mentions_change_management(const RiskEntry& entry) {
    for (const auto& recommendation : entry.recommendations) {
        const auto text = " " + to_lower(recommendation) + " ";
        if (text.find("management of change") != std::string::npos ||
            text.find("change management") != std::string::npos || text.find(" moc ") != std::string::npos ||
            text.find(" moc.") != std::string::npos) {
            return true;
        }
    }
    return false;
}

bool covers(const GapAnalysis& analysis, const RiskEntry& entry) {
    const auto& scenario = analysis.scenario;
    if (scenario.entry_id.has_value() && *scenario.entry_id == entry.id) {
        return true;
    }
    return !scenario.node_id.empty() && scenario.node_id == entry.node_id;
}

}  // namespace

ComplianceEvaluator::ComplianceEvaluator(ComplianceConfig config, RiskScorer scorer)
    : config_(std::move(config)), scorer_(std::move(scorer)) {}

bool ComplianceEvaluator::excluded(StandardId standard, const std::string& clause_id) const {
    const auto key = to_string(standard) + ":" + clause_id;
    return std::find(config_.excluded_clauses.begin(), config_.excluded_clauses.end(), key) !=
           config_.excluded_clauses.end();
}

std::vector<const RiskEntry*> ComplianceEvaluator::lopa_candidates(const ReviewSnapshot& snapshot) const {
    std::vector<const RiskEntry*> output;
    for (const auto& entry : snapshot.entries) {
        if (entry.rating.has_value() && scorer_.check_lopa_trigger(*entry.rating).recommended) {
            output.push_back(&entry);
        }
    }
    return output;
}

AreaAssessment ComplianceEvaluator::assess_area(ComplianceArea area, const ReviewSnapshot& snapshot) const {
    const auto& entries = snapshot.entries;
    const int total = static_cast<int>(entries.size());
    const bool is_lopa_area = area == ComplianceArea::kLopa || area == ComplianceArea::kSilDetermination;
    if (total == 0 && !(is_lopa_area && !snapshot.gap_analyses.empty())) {
        return AreaAssessment{ComplianceStatus::kNotAssessed, "no risk entries recorded"};
    }

    auto count_if = [&](auto predicate) {
        return static_cast<int>(std::count_if(entries.begin(), entries.end(), predicate));
    };

    switch (area) {
        case ComplianceArea::kHazardIdentification: {
            const int documented = count_if(
                [](const RiskEntry& entry) { return !entry.causes.empty() && !entry.consequences.empty(); });
            return share_rule(documented, total, 0.7, 0.0, "record causes and consequences");
        }
        case ComplianceArea::kRiskAssessment:
        case ComplianceArea::kRiskRanking: {
            const int rated = count_if([](const RiskEntry& entry) { return entry.rating.has_value(); });
            return share_rule(rated, total, 0.9, 0.0, "carry a severity and likelihood rating");
        }
        case ComplianceArea::kSafeguards: {
            const int guarded = count_if([](const RiskEntry& entry) { return !entry.safeguards.empty(); });
            return share_rule(guarded, total, 0.8, 0.5, "document safeguards");
        }
        case ComplianceArea::kRecommendations: {
            int high = 0;
            int addressed = 0;
            for (const auto& entry : entries) {
                if (entry.rating.has_value() && scorer_.band(*entry.rating) == RiskBand::kHigh) {
                    high += 1;
                    if (!entry.recommendations.empty()) {
                        addressed += 1;
                    }
                }
            }
            AreaAssessment assessment;
            if (high == 0) {
                assessment.status = ComplianceStatus::kCompliant;
                assessment.evidence = "no high-risk entries require recommendations";
            } else {
                assessment.evidence = std::to_string(addressed) + " of " + std::to_string(high) +
                                      " high-risk entries have recommendations";
                if (addressed == high) {
                    assessment.status = ComplianceStatus::kCompliant;
                } else if (addressed > 0) {
                    assessment.status = ComplianceStatus::kPartiallyCompliant;
                } else {
                    assessment.status = ComplianceStatus::kNonCompliant;
                }
            }
            return assessment;
        }
        case ComplianceArea::kLopa:
        case ComplianceArea::kSilDetermination: {
            const auto candidates = lopa_candidates(snapshot);
            const auto& analyses = snapshot.gap_analyses;
            if (candidates.empty() && analyses.empty()) {
                return AreaAssessment{ComplianceStatus::kNotApplicable, "no entries warrant LOPA"};
            }
            if (analyses.empty()) {
                return AreaAssessment{ComplianceStatus::kNonCompliant,
                                      std::to_string(candidates.size()) +
                                          " entries warrant LOPA but no gap analysis was performed"};
            }
            int adequate = 0;
            int marginal = 0;
            int inadequate = 0;
            for (const auto& analysis : analyses) {
                switch (analysis.gap_status) {
                    case GapStatus::kAdequate:
                        adequate += 1;
                        break;
                    case GapStatus::kMarginal:
                        marginal += 1;
                        break;
                    case GapStatus::kInadequate:
                        inadequate += 1;
                        break;
                }
            }
            int uncovered = 0;
            for (const auto* entry : candidates) {
                const bool covered = std::any_of(analyses.begin(), analyses.end(),
                                                 [&](const GapAnalysis& analysis) { return covers(analysis, *entry); });
                if (!covered) {
                    uncovered += 1;
                }
            }
            AreaAssessment assessment;
            assessment.evidence = std::to_string(analyses.size()) + " gap analyses: " + std::to_string(adequate) +
                                  " adequate, " + std::to_string(marginal) + " marginal, " +
                                  std::to_string(inadequate) + " inadequate";
            if (inadequate > 0) {
                assessment.status = ComplianceStatus::kNonCompliant;
            } else if (marginal > 0) {
                assessment.status = ComplianceStatus::kPartiallyCompliant;
            } else {
                assessment.status = ComplianceStatus::kCompliant;
            }
            if (uncovered > 0) {
                assessment.evidence += "; " + std::to_string(uncovered) + " LOPA-triggering entries not covered";
                if (assessment.status == ComplianceStatus::kCompliant) {
                    assessment.status = ComplianceStatus::kPartiallyCompliant;
                }
            }
            return assessment;
        }
        case ComplianceArea::kDocumentation: {
            double completeness = 0.0;
            for (const auto& entry : entries) {
                int filled = 0;
                filled += entry.causes.empty() ? 0 : 1;
                filled += entry.consequences.empty() ? 0 : 1;
                filled += entry.safeguards.empty() ? 0 : 1;
                filled += entry.recommendations.empty() ? 0 : 1;
                completeness += filled / 4.0;
            }
            completeness /= total;
            AreaAssessment assessment;
            assessment.evidence = "average entry completeness " +
                                  std::to_string(static_cast<int>(std::lround(completeness * 100.0))) + "%";
            if (completeness >= 0.8) {
                assessment.status = ComplianceStatus::kCompliant;
            } else if (completeness >= 0.5) {
                assessment.status = ComplianceStatus::kPartiallyCompliant;
            } else {
                assessment.status = ComplianceStatus::kNonCompliant;
            }
            return assessment;
        }
        case ComplianceArea::kMethodology: {
            std::set<std::string> guide_words;
            std::set<std::string> nodes;
            for (const auto& entry : entries) {
                if (!entry.guide_word.empty()) {
                    guide_words.insert(to_lower(entry.guide_word));
                }
                if (!entry.node_id.empty()) {
                    nodes.insert(entry.node_id);
                }
            }
            AreaAssessment assessment;
            assessment.evidence = std::to_string(guide_words.size()) + " guide words applied across " +
                                  std::to_string(nodes.size()) + " nodes";
            assessment.status = guide_words.size() >= 3 && !nodes.empty() ? ComplianceStatus::kCompliant
                                                                           : ComplianceStatus::kPartiallyCompliant;
            return assessment;
        }
        case ComplianceArea::kFollowUp: {
            const int tracked = count_if([](const RiskEntry& entry) { return !entry.recommendations.empty(); });
            if (tracked == 0) {
                return AreaAssessment{ComplianceStatus::kNotAssessed, "no recommendations raised to follow up"};
            }
            return share_rule(tracked, total, 0.8, 0.0, "raise recommendations for follow-up");
        }
        case ComplianceArea::kManagementOfChange: {
            const int referenced = count_if(mentions_change_management);
            if (referenced == 0) {
                return AreaAssessment{ComplianceStatus::kNotAssessed,
                                      "no recommendation references management of change"};
            }
            return AreaAssessment{ComplianceStatus::kCompliant,
                                  std::to_string(referenced) + " entries reference management of change"};
        }
        case ComplianceArea::kTeamComposition:
            return AreaAssessment{ComplianceStatus::kNotAssessed, "team composition is not recorded with entries"};
    }
    return AreaAssessment{ComplianceStatus::kNotAssessed, ""};
}

ComplianceCheckResult ComplianceEvaluator::check_clause(const RegulatoryStandard& standard, const Clause& clause,
                                                        const ReviewSnapshot& snapshot) const {
    ComplianceCheckResult result;
    result.standard_id = standard.id;
    result.clause_id = clause.id;
    result.clause_title = clause.title;
    result.mandatory = clause.mandatory;

    if (excluded(standard.id, clause.id)) {
        result.status = ComplianceStatus::kNotApplicable;
        result.evidence = "excluded by scope configuration";
        return result;
    }

    bool all_not_applicable = !clause.areas.empty();
    ComplianceStatus worst = ComplianceStatus::kNotAssessed;
    std::vector<std::string> evidence;
    for (auto area : clause.areas) {
        const auto assessment = assess_area(area, snapshot);
        evidence.push_back(to_string(area) + ": " + assessment.evidence);
        if (assessment.status != ComplianceStatus::kNotApplicable) {
            all_not_applicable = false;
        }
        if (!is_assessed(assessment.status)) {
            continue;
        }
        if (severity_rank(assessment.status) > severity_rank(worst)) {
            worst = assessment.status;
        }
        if (assessment.status == ComplianceStatus::kNonCompliant ||
            assessment.status == ComplianceStatus::kPartiallyCompliant) {
            result.gaps.push_back(to_string(area) + ": " + assessment.evidence);
            result.recommendations.push_back(remediation_for(area));
        }
    }
    result.evidence = join(evidence, "; ");
    if (is_assessed(worst)) {
        result.status = worst;
    } else if (all_not_applicable) {
        result.status = ComplianceStatus::kNotApplicable;
    } else {
        result.status = ComplianceStatus::kNotAssessed;
    }
    return result;
}

std::vector<ComplianceCheckResult> ComplianceEvaluator::check_standard(const RegulatoryStandard& standard,
                                                                       const ReviewSnapshot& snapshot) const {
    if (standard.clauses.empty()) {
        throw ComputationError("clause table for " + standard.code + " is empty");
    }
    std::vector<ComplianceCheckResult> results;
    results.reserve(standard.clauses.size());
    for (const auto& clause : standard.clauses) {
        results.push_back(check_clause(standard, clause, snapshot));
    }
    return results;
}

StandardComplianceSummary ComplianceEvaluator::summarize(const RegulatoryStandard& standard,
                                                         const std::vector<ComplianceCheckResult>& results) const {
    StandardComplianceSummary summary;
    summary.standard_id = standard.id;
    summary.standard_name = standard.name;
    summary.total_clauses = static_cast<int>(results.size());
    for (const auto& result : results) {
        switch (result.status) {
            case ComplianceStatus::kCompliant:
                summary.compliant_count += 1;
                break;
            case ComplianceStatus::kPartiallyCompliant:
                summary.partially_compliant_count += 1;
                break;
            case ComplianceStatus::kNonCompliant:
                summary.non_compliant_count += 1;
                break;
            case ComplianceStatus::kNotApplicable:
                summary.not_applicable_count += 1;
                break;
            case ComplianceStatus::kNotAssessed:
                summary.not_assessed_count += 1;
                break;
        }
    }
    summary.compliance_percentage = compliance_percentage(summary);
    summary.overall_status = classify(summary.compliance_percentage, summary.assessed_count());
    return summary;
}

int ComplianceEvaluator::compliance_percentage(const StandardComplianceSummary& summary) const {
    int denominator = summary.total_clauses;
    if (config_.exclude_not_applicable) {
        denominator -= summary.not_applicable_count;
    }
    if (denominator <= 0) {
        return 0;
    }
    const double achieved = summary.compliant_count + config_.partial_weight * summary.partially_compliant_count;
    return static_cast<int>(std::lround(achieved / denominator * 100.0));
}

ComplianceStatus ComplianceEvaluator::classify(int percentage, int assessed_clauses) const {
    if (assessed_clauses == 0) {
        return ComplianceStatus::kNotAssessed;
    }
    if (percentage >= config_.compliant_threshold) {
        return ComplianceStatus::kCompliant;
    }
    if (percentage >= config_.partial_threshold) {
        return ComplianceStatus::kPartiallyCompliant;
    }
    return ComplianceStatus::kNonCompliant;
}

int ComplianceEvaluator::overall_percentage(const std::vector<StandardComplianceSummary>& summaries) const {
    if (summaries.empty()) {
        return 0;
    }
    double sum = 0.0;
    for (const auto& summary : summaries) {
        sum += summary.compliance_percentage;
    }
    return static_cast<int>(std::lround(sum / static_cast<double>(summaries.size())));
}

ComplianceStatus ComplianceEvaluator::overall_status(const std::vector<StandardComplianceSummary>& summaries) const {
    int assessed = 0;
    for (const auto& summary : summaries) {
        assessed += summary.assessed_count();
    }
    return classify(overall_percentage(summaries), assessed);
}

ComplianceReport ComplianceEvaluator::evaluate(const ReviewSnapshot& snapshot,
                                               const std::vector<StandardId>& standards) const {
    ComplianceReport report;
    const auto selected = standards.empty() ? all_standard_ids() : standards;
    for (auto id : selected) {
        const auto& standard = find_standard(id);
        auto results = check_standard(standard, snapshot);
        report.summaries.push_back(summarize(standard, results));
        for (const auto& result : results) {
            if (result.status != ComplianceStatus::kNonCompliant &&
                result.status != ComplianceStatus::kPartiallyCompliant) {
                continue;
            }
            ComplianceGap gap;
            gap.standard_id = standard.id;
            gap.clause_id = result.clause_id;
            gap.description = standard.name + " clause " + result.clause_id + " (" + result.clause_title + ") is " +
                              to_string(result.status) + ": " + join(result.gaps, "; ");
            gap.severity = gap_severity(standard.mandatory, result.mandatory);
            gap.remediation = result.recommendations;
            report.gaps.push_back(std::move(gap));
        }
        report.results.insert(report.results.end(), std::make_move_iterator(results.begin()),
                              std::make_move_iterator(results.end()));
    }
    std::stable_sort(report.gaps.begin(), report.gaps.end(), [](const ComplianceGap& a, const ComplianceGap& b) {
        return static_cast<int>(a.severity) < static_cast<int>(b.severity);
    });
    report.overall_percentage = overall_percentage(report.summaries);
    report.overall_status = overall_status(report.summaries);
    return report;
}

MissingRequirements ComplianceEvaluator::missing_requirements(const ReviewSnapshot& snapshot) const {
    MissingRequirements missing;
    for (const auto& entry : snapshot.entries) {
        const std::string ref = "Entry " + entry.id;
        if (entry.causes.empty()) {
            missing.documentation.push_back(ref + " has no causes");
        }
        if (entry.consequences.empty()) {
            missing.documentation.push_back(ref + " has no consequences");
        }
        if (!entry.rating.has_value()) {
            missing.risk_assessment.push_back(ref + " has no risk rating");
        }
        if (entry.safeguards.empty()) {
            missing.safeguards.push_back(ref + " has no safeguards");
        }
        if (entry.rating.has_value() && scorer_.band(*entry.rating) == RiskBand::kHigh &&
            entry.recommendations.empty()) {
            missing.recommendations.push_back("High-risk " + to_lower(ref) + " has no recommendations");
        }
    }
    for (const auto* entry : lopa_candidates(snapshot)) {
        const bool covered =
            std::any_of(snapshot.gap_analyses.begin(), snapshot.gap_analyses.end(),
                        [&](const GapAnalysis& analysis) { return covers(analysis, *entry); });
        if (!covered) {
            missing.lopa.push_back("Entry " + entry->id + " warrants LOPA (" +
                                   scorer_.check_lopa_trigger(*entry->rating).reason + ") but no gap analysis covers it");
        }
    }
    for (const auto& analysis : snapshot.gap_analyses) {
        if (analysis.gap_status == GapStatus::kInadequate) {
            missing.lopa.push_back("Scenario " + analysis.scenario.id + " has inadequate protection (gap ratio " +
                                   format_rrf(analysis.total_rrf) + "/" + format_rrf(analysis.required_rrf) + ")");
        }
    }
    return missing;
}

ComplianceAggregator::ComplianceAggregator(std::shared_ptr<const RecordStore> store,
                                           std::shared_ptr<const AccessPolicy> access, ComplianceEvaluator evaluator,
                                           GapAnalyzer analyzer, Logger logger)
    : store_(std::move(store)),
      access_(std::move(access)),
      evaluator_(std::move(evaluator)),
      analyzer_(std::move(analyzer)),
      logger_(std::move(logger)) {
    if (!store_) {
        throw std::runtime_error("compliance aggregator requires a record store");
    }
    if (!access_) {
        access_ = std::make_shared<AllowAllAccess>();
    }
}

AnalysisRecord ComplianceAggregator::require_analysis(const std::string& analysis_id) const {
    if (!is_uuid(analysis_id)) {
        throw ValidationError("Invalid analysis ID format", {{"id", "Invalid analysis ID format"}});
    }
    auto analysis = store_->find_analysis(analysis_id);
    if (!analysis.has_value()) {
        throw NotFoundError("Analysis not found");
    }
    access_->check_project_access(analysis->project_id);
    return *analysis;
}

ReviewSnapshot ComplianceAggregator::load_snapshot(const std::string& analysis_id) const {
    ReviewSnapshot snapshot;
    snapshot.entries = store_->entries_for_analysis(analysis_id);
    for (const auto& entry : snapshot.entries) {
        if (!entry.rating.has_value()) {
            continue;
        }
        try {
            RiskScorer::score(*entry.rating);
        } catch (const ValidationError& exc) {
            logger_.error("invalid_persisted_entry", {{"analysis_id", analysis_id},
                                                      {"entry_id", entry.id},
                                                      {"detail", exc.what()}});
            throw ComputationError("risk entry " + entry.id + " has an invalid rating: " + exc.what());
        }
    }
    for (const auto& scenario : store_->scenarios_for_analysis(analysis_id)) {
        try {
            snapshot.gap_analyses.push_back(analyzer_.analyze(scenario));
        } catch (const ValidationError& exc) {
            logger_.error("invalid_persisted_scenario", {{"analysis_id", analysis_id},
                                                         {"scenario_id", scenario.id},
                                                         {"detail", exc.what()}});
            throw ComputationError("LOPA scenario " + scenario.id + " is invalid: " + exc.what());
        }
    }
    return snapshot;
}

ComplianceReport ComplianceAggregator::analysis_report(const std::string& analysis_id,
                                                       const std::vector<StandardId>& standards) const {
    const auto analysis = require_analysis(analysis_id);
    return evaluator_.evaluate(load_snapshot(analysis.id), standards);
}

AnalysisComplianceStatus ComplianceAggregator::analysis_compliance(const std::string& analysis_id,
                                                                   const std::vector<StandardId>& standards) const {
    const auto analysis = require_analysis(analysis_id);
    const auto selected = standards.empty() ? all_standard_ids() : standards;
    const auto snapshot = load_snapshot(analysis.id);
    const auto report = evaluator_.evaluate(snapshot, selected);

    AnalysisComplianceStatus status;
    status.analysis_id = analysis.id;
    status.analysis_name = analysis.name;
    status.project_id = analysis.project_id;
    status.analysis_status = analysis.status;
    status.entry_count = static_cast<int>(snapshot.entries.size());
    status.lopa_count = static_cast<int>(snapshot.gap_analyses.size());
    status.has_lopa = status.lopa_count > 0;
    status.standards_checked = selected;
    status.summaries = report.summaries;
    status.overall_percentage = report.overall_percentage;
    status.overall_status = report.overall_status;
    status.checked_at = iso_timestamp();

    logger_.info("analysis_compliance_computed", {{"analysis_id", analysis.id},
                                                  {"standards", std::to_string(selected.size())},
                                                  {"overall_percentage", std::to_string(status.overall_percentage)},
                                                  {"overall_status", to_string(status.overall_status)}});
    return status;
}

ProjectComplianceStatus ComplianceAggregator::project_compliance(const std::string& project_id,
                                                                 const std::vector<StandardId>& standards) const {
    if (!is_uuid(project_id)) {
        throw ValidationError("Invalid project ID format", {{"id", "Invalid project ID format"}});
    }
    auto project = store_->find_project(project_id);
    if (!project.has_value()) {
        throw NotFoundError("Project not found");
    }
    access_->check_project_access(project->id);

    const auto selected = standards.empty() ? all_standard_ids() : standards;
    const auto analyses = store_->analyses_for_project(project->id);

    ProjectComplianceStatus status;
    status.project_id = project->id;
    status.project_name = project->name;
    status.analysis_count = static_cast<int>(analyses.size());
    status.standards_checked = selected;

    std::vector<std::vector<StandardComplianceSummary>> per_analysis;
    for (const auto& analysis : analyses) {
        const auto snapshot = load_snapshot(analysis.id);
        status.entry_count += static_cast<int>(snapshot.entries.size());
        status.lopa_count += static_cast<int>(snapshot.gap_analyses.size());
        per_analysis.push_back(evaluator_.evaluate(snapshot, selected).summaries);
    }
    status.has_lopa = status.lopa_count > 0;

    for (size_t index = 0; index < selected.size(); ++index) {
        const auto& standard = find_standard(selected[index]);
        StandardComplianceSummary combined;
        combined.standard_id = standard.id;
        combined.standard_name = standard.name;
        if (per_analysis.empty()) {
            combined.total_clauses = static_cast<int>(standard.clauses.size());
            combined.not_assessed_count = combined.total_clauses;
            status.summaries.push_back(combined);
            continue;
        }
        double percentage_sum = 0.0;
        for (const auto& summaries : per_analysis) {
            const auto& summary = summaries[index];
            combined.total_clauses += summary.total_clauses;
            combined.compliant_count += summary.compliant_count;
            combined.partially_compliant_count += summary.partially_compliant_count;
            combined.non_compliant_count += summary.non_compliant_count;
            combined.not_applicable_count += summary.not_applicable_count;
            combined.not_assessed_count += summary.not_assessed_count;
            percentage_sum += summary.compliance_percentage;
        }
        combined.compliance_percentage =
            static_cast<int>(std::lround(percentage_sum / static_cast<double>(per_analysis.size())));
        combined.overall_status = evaluator_.classify(combined.compliance_percentage, combined.assessed_count());
        status.summaries.push_back(combined);
    }

    status.overall_percentage = evaluator_.overall_percentage(status.summaries);
    status.overall_status = evaluator_.overall_status(status.summaries);
    if (per_analysis.empty()) {
        status.overall_percentage = 0;
        status.overall_status = ComplianceStatus::kNotAssessed;
    }
    status.checked_at = iso_timestamp();

    logger_.info("project_compliance_computed", {{"project_id", project->id},
                                                 {"analyses", std::to_string(status.analysis_count)},
                                                 {"overall_percentage", std::to_string(status.overall_percentage)},
                                                 {"overall_status", to_string(status.overall_status)}});
    return status;
}

std::string to_string(ComplianceStatus status) {
    switch (status) {
        case ComplianceStatus::kCompliant:
            return "compliant";
        case ComplianceStatus::kPartiallyCompliant:
            return "partially_compliant";
        case ComplianceStatus::kNonCompliant:
            return "non_compliant";
        case ComplianceStatus::kNotApplicable:
            return "not_applicable";
        case ComplianceStatus::kNotAssessed:
            return "not_assessed";
    }
    return "not_assessed";
}

std::string to_string(GapSeverity severity) {
    switch (severity) {
        case GapSeverity::kCritical:
            return "critical";
        case GapSeverity::kMajor:
            return "major";
        case GapSeverity::kMinor:
            return "minor";
    }
    return "minor";
}

GapSeverity gap_severity(bool standard_mandatory, bool clause_mandatory) {
    if (standard_mandatory && clause_mandatory) {
        return GapSeverity::kCritical;
    }
    if (standard_mandatory || clause_mandatory) {
        return GapSeverity::kMajor;
    }
    return GapSeverity::kMinor;
}

}  // namespace psrisk
