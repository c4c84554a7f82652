#include "psrisk/standards.hpp"

#include <algorithm>

#include "psrisk/common.hpp"
#include "psrisk/errors.hpp"

namespace psrisk {

namespace {

constexpr auto kHaz = ComplianceArea::kHazardIdentification;
constexpr auto kAssess = ComplianceArea::kRiskAssessment;
constexpr auto kRank = ComplianceArea::kRiskRanking;
constexpr auto kGuard = ComplianceArea::kSafeguards;
constexpr auto kRec = ComplianceArea::kRecommendations;
constexpr auto kLopa = ComplianceArea::kLopa;
constexpr auto kSil = ComplianceArea::kSilDetermination;
constexpr auto kDoc = ComplianceArea::kDocumentation;
constexpr auto kTeam = ComplianceArea::kTeamComposition;
constexpr auto kMethod = ComplianceArea::kMethodology;
constexpr auto kFollow = ComplianceArea::kFollowUp;
constexpr auto kMoc = ComplianceArea::kManagementOfChange;

RegulatoryStandard iec_61511() {
    return RegulatoryStandard{
        StandardId::kIec61511,
        "IEC_61511",
        "IEC 61511",
        "Functional safety - Safety instrumented systems for the process industry sector",
        "functional_safety",
        "international",
        true,
        {
            {"8.1", "Hazard and risk assessment - Objectives", true, {kHaz, kAssess}},
            {"8.1.1", "General requirements for hazard and risk assessment", true, {kHaz, kMethod}},
            {"8.1.2", "Required competencies for hazard and risk assessment", true, {kTeam}},
            {"8.2", "Hazard and risk assessment methods", true, {kMethod, kAssess}},
            {"9", "SIS safety requirements specification", true, {kSil, kGuard}},
            {"9.2", "Safety Integrity Level determination", true, {kSil, kLopa, kRank}},
            {"9.3", "Safety requirements allocation", true, {kGuard, kSil}},
            {"11", "SIS design and engineering", true, {kGuard}},
            {"15", "SIS operation and maintenance", true, {kFollow, kGuard}},
            {"16", "SIS modification", true, {kMoc}},
            {"17", "SIS decommissioning", true, {kFollow}},
            {"Annex_A", "LOPA (Layers of Protection Analysis)", false, {kLopa, kSil, kAssess}},
        }};
}

RegulatoryStandard iso_31000() {
    return RegulatoryStandard{
        StandardId::kIso31000,
        "ISO_31000",
        "ISO 31000",
        "Risk management - Guidelines",
        "risk_management",
        "international",
        false,
        {
            {"4", "Principles", true, {kMethod}},
            {"5", "Framework", true, {kMethod, kDoc}},
            {"5.4", "Integration", true, {kMethod}},
            {"5.5", "Design", true, {kMethod}},
            {"6", "Process", true, {kMethod, kAssess}},
            {"6.3", "Scope, context and criteria", true, {kMethod}},
            {"6.4", "Risk assessment", true, {kAssess, kHaz}},
            {"6.4.2", "Risk identification", true, {kHaz}},
            {"6.4.3", "Risk analysis", true, {kAssess, kRank}},
            {"6.4.4", "Risk evaluation", true, {kRank}},
            {"6.5", "Risk treatment", true, {kRec, kGuard}},
            {"6.6", "Monitoring and review", true, {kFollow}},
            {"6.7", "Recording and reporting", true, {kDoc}},
        }};
}

RegulatoryStandard iso_9001() {
    return RegulatoryStandard{
        StandardId::kIso9001,
        "ISO_9001",
        "ISO 9001",
        "Quality management systems - Requirements",
        "quality_management",
        "international",
        false,
        {
            {"4.1", "Understanding the organization and its context", true, {kMethod}},
            {"4.4", "Quality management system and its processes", true, {kMethod, kDoc}},
            {"6.1", "Actions to address risks and opportunities", true, {kAssess, kHaz}},
            {"6.1.1", "Risk-based thinking", true, {kAssess, kRec}},
            {"7.1.6", "Organizational knowledge", true, {kTeam, kDoc}},
            {"7.2", "Competence", true, {kTeam}},
            {"7.5", "Documented information", true, {kDoc}},
            {"8.1", "Operational planning and control", true, {kMethod, kGuard}},
            {"8.3", "Design and development of products and services", true, {kMethod}},
            {"8.3.3", "Design and development inputs", true, {kHaz}},
            {"8.5.6", "Control of changes", true, {kMoc}},
            {"9.1", "Monitoring, measurement, analysis and evaluation", true, {kFollow, kAssess}},
            {"10.2", "Nonconformity and corrective action", true, {kRec, kFollow}},
            {"10.3", "Continual improvement", true, {kFollow, kMethod}},
        }};
}

RegulatoryStandard atex_dsear() {
    return RegulatoryStandard{
        StandardId::kAtexDsear,
        "ATEX_DSEAR",
        "ATEX/DSEAR",
        "Equipment and protective systems for explosive atmospheres",
        "explosive_atmospheres",
        "european_union",
        true,
        {
            {"DSEAR-5", "Risk assessment", true, {kHaz, kAssess}},
            {"DSEAR-5.1", "Risk assessment - Hazardous properties", true, {kHaz}},
            {"DSEAR-5.2", "Risk assessment - Work circumstances", true, {kHaz, kMethod}},
            {"DSEAR-5.3", "Risk assessment - Ignition sources", true, {kHaz, kAssess}},
            {"DSEAR-7", "Hazardous area classification (zoning)", true, {kHaz, kRank}},
            {"DSEAR-7.1", "Zone 0/20 - Continuous explosive atmosphere", true, {kHaz, kGuard}},
            {"DSEAR-7.2", "Zone 1/21 - Likely explosive atmosphere", true, {kHaz, kGuard}},
            {"DSEAR-7.3", "Zone 2/22 - Unlikely explosive atmosphere", true, {kHaz, kGuard}},
            {"DSEAR-6", "Elimination and reduction of risks", true, {kGuard, kRec}},
            {"DSEAR-6.1", "Prevention hierarchy - Substitution", true, {kRec, kGuard}},
            {"DSEAR-6.2", "Prevention hierarchy - Reduce quantity", true, {kRec, kGuard}},
            {"DSEAR-6.3", "Prevention hierarchy - Avoid release", true, {kGuard, kRec}},
            {"DSEAR-6.4", "Prevention hierarchy - Control ignition sources", true, {kGuard}},
            {"DSEAR-6.5", "Mitigation measures", true, {kGuard, kRec}},
            {"DSEAR-8", "Equipment for hazardous areas", true, {kGuard}},
            {"ATEX-Annex-I", "Essential health and safety requirements (EHSR)", true, {kGuard, kMethod}},
            {"DSEAR-9", "Explosion Protection Document", true, {kDoc}},
            {"DSEAR-9.1", "EPD content - Hazards identified", true, {kDoc, kHaz}},
            {"DSEAR-9.2", "EPD content - Protective measures", true, {kDoc, kGuard}},
            {"DSEAR-9.3", "EPD content - Zone classification", true, {kDoc}},
            {"DSEAR-11", "Co-ordination", true, {kTeam, kMethod}},
            {"DSEAR-5.4", "Review of risk assessment", true, {kFollow, kMoc}},
        }};
}

RegulatoryStandard ped() {
    return RegulatoryStandard{
        StandardId::kPed,
        "PED",
        "Pressure Equipment Directive (PED)",
        "Pressure Equipment Directive 2014/68/EU",
        "pressure_equipment",
        "european_union",
        true,
        {
            {"PED-Art-1", "Subject matter and scope", true, {kMethod, kHaz}},
            {"PED-Art-4", "Classification of pressure equipment", true, {kRank, kHaz}},
            {"PED-Art-4.1", "Fluid groups", true, {kHaz, kRank}},
            {"PED-Art-4.2", "Category determination tables", true, {kRank, kMethod}},
            {"PED-Annex-I", "Essential Safety Requirements (ESR)", true, {kHaz, kGuard, kAssess}},
            {"PED-Annex-I-1", "General - Hazard analysis", true, {kHaz, kAssess}},
            {"PED-Annex-I-2.1", "Design for adequate strength", true, {kHaz, kGuard}},
            {"PED-Annex-I-2.2", "Design for safe handling and operation", true, {kGuard, kMethod}},
            {"PED-Annex-I-2.3", "Means of examination", true, {kGuard, kFollow}},
            {"PED-Annex-I-2.4", "Means of draining and venting", true, {kGuard, kHaz}},
            {"PED-Annex-I-2.5", "Protection against exceeding allowable limits", true, {kGuard, kAssess}},
            {"PED-Annex-I-2.10", "Safety accessories", true, {kGuard, kFollow}},
            {"PED-Annex-I-2.11.1", "Pressure limiting devices", true, {kGuard}},
            {"PED-Annex-I-2.11.2", "Temperature monitoring devices", true, {kGuard}},
            {"PED-Annex-I-2.12", "External fire", true, {kGuard, kHaz}},
            {"PED-Annex-I-4", "Materials", true, {kGuard, kHaz}},
            {"PED-Annex-I-4.1", "Material properties", true, {kHaz, kGuard}},
            {"PED-Annex-I-3", "Manufacturing", true, {kMethod, kGuard}},
            {"PED-Annex-I-3.1.2", "Permanent joints", true, {kGuard, kMethod}},
            {"PED-Annex-I-3.1.3", "Non-destructive tests", true, {kMethod, kFollow}},
            {"PED-Annex-I-3.2", "Final assessment", true, {kMethod, kFollow}},
            {"PED-Annex-I-3.3", "Marking and labelling", true, {kDoc}},
            {"PED-Annex-I-3.4", "Operating instructions", true, {kDoc, kFollow}},
            {"PED-Annex-III", "Technical documentation", true, {kDoc}},
            {"PED-Art-14", "Conformity assessment procedures", true, {kMethod, kDoc}},
            {"PED-Art-2.6", "Assemblies", true, {kMethod, kHaz}},
            {"PED-HazOps-1", "Pressure hazard identification in HazOps", false, {kHaz, kAssess}},
            {"PED-HazOps-2", "Safeguards for pressure equipment", false, {kGuard, kRec}},
        }};
}

RegulatoryStandard osha_psm() {
    return RegulatoryStandard{
        StandardId::kOshaPsm,
        "OSHA_PSM",
        "OSHA Process Safety Management",
        "Process safety management of highly hazardous chemicals (29 CFR 1910.119)",
        "process_safety",
        "united_states",
        true,
        {
            {"1910.119(c)", "Employee participation", true, {kTeam, kMethod}},
            {"1910.119(d)", "Process safety information", true, {kDoc, kHaz}},
            {"1910.119(d)(3)", "Information pertaining to the equipment in the process", true, {kDoc, kGuard}},
            {"1910.119(e)(1)", "Process hazard analysis - Performance", true, {kHaz, kAssess}},
            {"1910.119(e)(2)", "Process hazard analysis - Methodology", true, {kMethod}},
            {"1910.119(e)(3)", "Process hazard analysis - Hazards and controls addressed", true,
             {kHaz, kGuard, kRank}},
            {"1910.119(e)(4)", "Process hazard analysis - Team composition", true, {kTeam}},
            {"1910.119(e)(5)", "Resolution of findings and recommendations", true, {kRec, kFollow}},
            {"1910.119(e)(6)", "Process hazard analysis revalidation", true, {kFollow}},
            {"1910.119(e)(7)", "Retention of process hazard analyses", true, {kDoc}},
            {"1910.119(f)", "Operating procedures", true, {kDoc, kGuard}},
            {"1910.119(j)", "Mechanical integrity", true, {kGuard, kFollow}},
            {"1910.119(l)", "Management of change", true, {kMoc}},
            {"1910.119(o)", "Compliance audits", true, {kFollow, kDoc}},
        }};
}

RegulatoryStandard epa_rmp() {
    return RegulatoryStandard{
        StandardId::kEpaRmp,
        "EPA_RMP",
        "EPA Risk Management Program",
        "Chemical accident prevention provisions (40 CFR Part 68)",
        "environmental_protection",
        "united_states",
        true,
        {
            {"68.15", "Management system", true, {kMethod, kTeam}},
            {"68.20", "Offsite consequence analysis", true, {kHaz, kAssess}},
            {"68.50", "Hazard review", true, {kHaz, kGuard}},
            {"68.65", "Process safety information", true, {kDoc}},
            {"68.67", "Process hazard analysis", true, {kHaz, kAssess, kMethod}},
            {"68.67(c)", "Process hazard analysis - Scope", true, {kHaz, kGuard, kRank}},
            {"68.67(e)", "Resolution of process hazard analysis findings", true, {kRec, kFollow}},
            {"68.67(f)", "Process hazard analysis update and revalidation", true, {kFollow}},
            {"68.69", "Operating procedures", true, {kDoc}},
            {"68.73", "Mechanical integrity", true, {kGuard, kFollow}},
            {"68.75", "Management of change", true, {kMoc}},
            {"68.79", "Compliance audits", true, {kFollow, kDoc}},
            {"68.95", "Emergency response program", false, {kGuard}},
        }};
}

RegulatoryStandard seveso_iii() {
    return RegulatoryStandard{
        StandardId::kSevesoIii,
        "SEVESO_III",
        "SEVESO III Directive",
        "Control of major-accident hazards involving dangerous substances (2012/18/EU)",
        "major_accident_hazards",
        "european_union",
        true,
        {
            {"Art-5", "General obligations of the operator", true, {kGuard, kMethod}},
            {"Art-8", "Major-accident prevention policy", true, {kMethod, kDoc}},
            {"Art-10", "Safety report", true, {kDoc, kHaz, kAssess}},
            {"Art-12", "Internal emergency plans", true, {kGuard}},
            {"Annex-II-4", "Identification and accidental risks analysis", true, {kHaz, kAssess, kRank}},
            {"Annex-II-5", "Protection and intervention measures", true, {kGuard, kRec}},
            {"Annex-III-b-i", "Organisation and personnel", true, {kTeam}},
            {"Annex-III-b-ii", "Identification and evaluation of major hazards", true, {kHaz, kRank}},
            {"Annex-III-b-iv", "Management of change", true, {kMoc}},
            {"Annex-III-b-vi", "Monitoring performance", true, {kFollow}},
            {"Annex-III-b-vii", "Audit and review", true, {kFollow, kDoc}},
            {"Art-9", "Domino effects", false, {kHaz, kAssess}},
        }};
}

RegulatoryStandard with_related(RegulatoryStandard standard, std::vector<StandardId> related) {
    standard.related = std::move(related);
    return standard;
}

template <typename Predicate>
std::vector<const RegulatoryStandard*> select_standards(Predicate predicate) {
    std::vector<const RegulatoryStandard*> output;
    for (const auto& standard : standards_catalogue()) {
        if (predicate(standard)) {
            output.push_back(&standard);
        }
    }
    return output;
}

}  // namespace

const std::vector<RegulatoryStandard>& standards_catalogue() {
    static const std::vector<RegulatoryStandard> catalogue = {
        with_related(iec_61511(), {StandardId::kIso31000, StandardId::kOshaPsm}),
        with_related(iso_31000(), {StandardId::kIec61511, StandardId::kIso9001}),
        with_related(iso_9001(), {StandardId::kIso31000}),
        with_related(atex_dsear(), {StandardId::kIec61511, StandardId::kSevesoIii}),
        with_related(ped(), {StandardId::kIec61511, StandardId::kAtexDsear, StandardId::kSevesoIii}),
        with_related(osha_psm(), {StandardId::kIec61511, StandardId::kEpaRmp}),
        with_related(epa_rmp(), {StandardId::kOshaPsm, StandardId::kSevesoIii}),
        with_related(seveso_iii(), {StandardId::kAtexDsear, StandardId::kEpaRmp}),
    };
    return catalogue;
}

const RegulatoryStandard& find_standard(StandardId id) {
    for (const auto& standard : standards_catalogue()) {
        if (standard.id == id) {
            return standard;
        }
    }
    throw NotFoundError("Standard not found: " + to_string(id));
}

const Clause* find_clause(StandardId id, const std::string& clause_id) {
    const auto& clauses = find_standard(id).clauses;
    auto it = std::find_if(clauses.begin(), clauses.end(),
                           [&](const Clause& clause) { return clause.id == clause_id; });
    return it == clauses.end() ? nullptr : &*it;
}

std::vector<std::pair<StandardId, const Clause*>> clauses_for_area(ComplianceArea area) {
    std::vector<std::pair<StandardId, const Clause*>> output;
    for (const auto& standard : standards_catalogue()) {
        for (const auto& clause : standard.clauses) {
            if (std::find(clause.areas.begin(), clause.areas.end(), area) != clause.areas.end()) {
                output.emplace_back(standard.id, &clause);
            }
        }
    }
    return output;
}

std::vector<const Clause*> mandatory_clauses(StandardId id) {
    std::vector<const Clause*> output;
    for (const auto& clause : find_standard(id).clauses) {
        if (clause.mandatory) {
            output.push_back(&clause);
        }
    }
    return output;
}

std::vector<std::pair<StandardId, const Clause*>> search_clauses(const std::string& keyword) {
    std::vector<std::pair<StandardId, const Clause*>> output;
    const auto needle = to_lower(trim(keyword));
    if (needle.empty()) {
        return output;
    }
    for (const auto& standard : standards_catalogue()) {
        for (const auto& clause : standard.clauses) {
            if (to_lower(clause.id).find(needle) != std::string::npos ||
                to_lower(clause.title).find(needle) != std::string::npos) {
                output.emplace_back(standard.id, &clause);
            }
        }
    }
    return output;
}

std::vector<const RegulatoryStandard*> standards_by_category(const std::string& category) {
    return select_standards([&](const RegulatoryStandard& standard) { return standard.category == category; });
}

std::vector<const RegulatoryStandard*> standards_by_jurisdiction(const std::string& jurisdiction) {
    return select_standards(
        [&](const RegulatoryStandard& standard) { return standard.jurisdiction == jurisdiction; });
}

std::vector<const RegulatoryStandard*> related_standards(StandardId id) {
    std::vector<const RegulatoryStandard*> output;
    for (auto related : find_standard(id).related) {
        output.push_back(&find_standard(related));
    }
    return output;
}

CatalogueStats catalogue_stats() {
    CatalogueStats stats;
    for (const auto& standard : standards_catalogue()) {
        stats.total_standards += 1;
        stats.total_clauses += static_cast<int>(standard.clauses.size());
        if (standard.mandatory) {
            stats.mandatory_standards += 1;
        }
        stats.standards_by_category[standard.category] += 1;
        stats.standards_by_jurisdiction[standard.jurisdiction] += 1;
    }
    return stats;
}

std::vector<StandardId> all_standard_ids() {
    std::vector<StandardId> ids;
    for (const auto& standard : standards_catalogue()) {
        ids.push_back(standard.id);
    }
    return ids;
}

std::string to_string(StandardId id) {
    switch (id) {
        case StandardId::kIec61511:
            return "IEC_61511";
        case StandardId::kIso31000:
            return "ISO_31000";
        case StandardId::kIso9001:
            return "ISO_9001";
        case StandardId::kAtexDsear:
            return "ATEX_DSEAR";
        case StandardId::kPed:
            return "PED";
        case StandardId::kOshaPsm:
            return "OSHA_PSM";
        case StandardId::kEpaRmp:
            return "EPA_RMP";
        case StandardId::kSevesoIii:
            return "SEVESO_III";
    }
    return "UNKNOWN";
}

std::string to_string(ComplianceArea area) {
    switch (area) {
        case ComplianceArea::kHazardIdentification:
            return "hazard_identification";
        case ComplianceArea::kRiskAssessment:
            return "risk_assessment";
        case ComplianceArea::kRiskRanking:
            return "risk_ranking";
        case ComplianceArea::kSafeguards:
            return "safeguards";
        case ComplianceArea::kRecommendations:
            return "recommendations";
        case ComplianceArea::kLopa:
            return "lopa";
        case ComplianceArea::kSilDetermination:
            return "sil_determination";
        case ComplianceArea::kDocumentation:
            return "documentation";
        case ComplianceArea::kTeamComposition:
            return "team_composition";
        case ComplianceArea::kMethodology:
            return "methodology";
        case ComplianceArea::kFollowUp:
            return "follow_up";
        case ComplianceArea::kManagementOfChange:
            return "management_of_change";
    }
    return "methodology";
}

std::optional<StandardId> parse_standard_id(const std::string& value) {
    for (auto id : all_standard_ids()) {
        if (to_string(id) == value) {
            return id;
        }
    }
    return std::nullopt;
}

std::vector<StandardId> resolve_standards(const std::vector<std::string>& tokens) {
    std::vector<StandardId> resolved;
    std::vector<std::string> invalid;
    for (const auto& raw : tokens) {
        const auto token = trim(raw);
        if (token.empty()) {
            continue;
        }
        auto id = parse_standard_id(token);
        if (!id.has_value()) {
            invalid.push_back(token);
            continue;
        }
        if (std::find(resolved.begin(), resolved.end(), *id) == resolved.end()) {
            resolved.push_back(*id);
        }
    }
    if (!invalid.empty()) {
        std::vector<std::string> valid;
        for (auto id : all_standard_ids()) {
            valid.push_back(to_string(id));
        }
        const std::string detail =
            "Invalid standard IDs: " + join(invalid, ", ") + ". Valid values: " + join(valid, ", ");
        throw ValidationError(detail, {{"standards", detail}});
    }
    return resolved;
}

std::vector<StandardId> parse_standards_filter(const std::string& comma_list) {
    return resolve_standards(split(comma_list, ','));
}

}  // namespace psrisk
