#include "psrisk/serialize.hpp"

namespace psrisk {

namespace {

void write_standards(JsonWriter& writer, const std::vector<StandardId>& standards) {
    writer.begin_array();
    for (auto id : standards) {
        writer.value(to_string(id));
    }
    writer.end_array();
}

void write_summaries(JsonWriter& writer, const std::vector<StandardComplianceSummary>& summaries) {
    writer.begin_array();
    for (const auto& summary : summaries) {
        write_json(writer, summary);
    }
    writer.end_array();
}

}  // namespace

void write_json(JsonWriter& writer, const StandardComplianceSummary& summary) {
    writer.begin_object()
        .key("standardId").value(to_string(summary.standard_id))
        .key("standardName").value(summary.standard_name)
        .key("totalClauses").value(summary.total_clauses)
        .key("compliantCount").value(summary.compliant_count)
        .key("partiallyCompliantCount").value(summary.partially_compliant_count)
        .key("nonCompliantCount").value(summary.non_compliant_count)
        .key("notApplicableCount").value(summary.not_applicable_count)
        .key("notAssessedCount").value(summary.not_assessed_count)
        .key("compliancePercentage").value(summary.compliance_percentage)
        .key("overallStatus").value(to_string(summary.overall_status))
        .end_object();
}

void write_json(JsonWriter& writer, const AnalysisComplianceStatus& status) {
    writer.begin_object()
        .key("analysisId").value(status.analysis_id)
        .key("analysisName").value(status.analysis_name)
        .key("projectId").value(status.project_id)
        .key("analysisStatus").value(status.analysis_status)
        .key("entryCount").value(status.entry_count)
        .key("hasLOPA").value(status.has_lopa)
        .key("lopaCount").value(status.lopa_count)
        .key("standardsChecked");
    write_standards(writer, status.standards_checked);
    writer.key("overallStatus").value(to_string(status.overall_status));
    writer.key("overallPercentage").value(status.overall_percentage);
    writer.key("summaries");
    write_summaries(writer, status.summaries);
    writer.key("checkedAt").value(status.checked_at);
    writer.end_object();
}

void write_json(JsonWriter& writer, const ProjectComplianceStatus& status) {
    writer.begin_object()
        .key("projectId").value(status.project_id)
        .key("projectName").value(status.project_name)
        .key("analysisCount").value(status.analysis_count)
        .key("entryCount").value(status.entry_count)
        .key("hasLOPA").value(status.has_lopa)
        .key("lopaCount").value(status.lopa_count)
        .key("standardsChecked");
    write_standards(writer, status.standards_checked);
    writer.key("overallStatus").value(to_string(status.overall_status));
    writer.key("overallPercentage").value(status.overall_percentage);
    writer.key("summaries");
    write_summaries(writer, status.summaries);
    writer.key("checkedAt").value(status.checked_at);
    writer.end_object();
}

void write_json(JsonWriter& writer, const ComplianceReport& report) {
    writer.begin_object().key("results").begin_array();
    for (const auto& result : report.results) {
        writer.begin_object()
            .key("standardId").value(to_string(result.standard_id))
            .key("clauseId").value(result.clause_id)
            .key("clauseTitle").value(result.clause_title)
            .key("status").value(to_string(result.status))
            .key("evidence").value(result.evidence)
            .key("gaps").string_array(result.gaps)
            .key("recommendations").string_array(result.recommendations)
            .end_object();
    }
    writer.end_array().key("summaries");
    write_summaries(writer, report.summaries);
    writer.key("gaps").begin_array();
    for (const auto& gap : report.gaps) {
        writer.begin_object()
            .key("standardId").value(to_string(gap.standard_id))
            .key("clauseId").value(gap.clause_id)
            .key("description").value(gap.description)
            .key("severity").value(to_string(gap.severity))
            .key("remediation").string_array(gap.remediation)
            .end_object();
    }
    writer.end_array()
        .key("overallPercentage").value(report.overall_percentage)
        .key("overallStatus").value(to_string(report.overall_status))
        .end_object();
}

void write_json(JsonWriter& writer, const GapAnalysis& analysis) {
    writer.begin_object()
        .key("scenarioId").value(analysis.scenario.id)
        .key("initiatingEventFrequency").value(analysis.scenario.initiating_event_frequency)
        .key("targetFrequency").value(analysis.scenario.target_frequency)
        .key("totalRRF").value(analysis.total_rrf)
        .key("requiredRRF").value(analysis.required_rrf)
        .key("gapRatio").value(analysis.gap_ratio)
        .key("gapStatus").value(to_string(analysis.gap_status))
        .key("mitigatedEventLikelihood").value(analysis.mitigated_event_likelihood)
        .key("requiredSIL");
    if (analysis.required_sil.has_value()) {
        writer.value(*analysis.required_sil);
    } else {
        writer.null();
    }
    writer.key("ipls").begin_array();
    for (const auto& credit : analysis.credits) {
        writer.begin_object()
            .key("id").value(credit.ipl_id)
            .key("name").value(credit.name)
            .key("pfd").value(credit.pfd)
            .key("rrf").value(credit.rrf)
            .key("creditedRRF").value(credit.credited_rrf)
            .key("credited").value(credit.credited)
            .end_object();
    }
    writer.end_array()
        .key("recommendations").string_array(analysis.recommendations)
        .key("warnings").string_array(analysis.warnings)
        .end_object();
}

std::string error_body(const std::string& code, const std::string& message, const std::vector<FieldError>& errors) {
    JsonWriter writer;
    writer.begin_object()
        .key("success").value(false)
        .key("error").begin_object()
        .key("code").value(code)
        .key("message").value(message);
    if (!errors.empty()) {
        writer.key("errors").begin_array();
        for (const auto& error : errors) {
            writer.begin_object().key("field").value(error.field).key("message").value(error.message).end_object();
        }
        writer.end_array();
    }
    writer.end_object().end_object();
    return writer.str();
}

}  // namespace psrisk
