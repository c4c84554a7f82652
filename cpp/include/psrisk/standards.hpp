#ifndef PSRISK_STANDARDS_HPP
#define PSRISK_STANDARDS_HPP

#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace psrisk {

enum class StandardId {
    kIec61511,
    kIso31000,
    kIso9001,
    kAtexDsear,
    kPed,
    kOshaPsm,
    kEpaRmp,
    kSevesoIii,
};

// Parts of a hazard review that a clause can draw evidence from.
enum class ComplianceArea {
    kHazardIdentification,
    kRiskAssessment,
    kRiskRanking,
    kSafeguards,
    kRecommendations,
    kLopa,
    kSilDetermination,
    kDocumentation,
    kTeamComposition,
    kMethodology,
    kFollowUp,
    kManagementOfChange,
};

struct Clause {
    std::string id;
    std::string title;
    bool mandatory = true;
    std::vector<ComplianceArea> areas;
};

struct RegulatoryStandard {
    StandardId id;
    std::string code;
    std::string name;
    std::string title;
    std::string category;
    std::string jurisdiction;
    bool mandatory = false;
    std::vector<Clause> clauses;
    std::vector<StandardId> related = {};
};

struct CatalogueStats {
    int total_standards = 0;
    int total_clauses = 0;
    int mandatory_standards = 0;
    std::map<std::string, int> standards_by_category;
    std::map<std::string, int> standards_by_jurisdiction;
};

const std::vector<RegulatoryStandard>& standards_catalogue();
const RegulatoryStandard& find_standard(StandardId id);
const Clause* find_clause(StandardId id, const std::string& clause_id);
std::vector<std::pair<StandardId, const Clause*>> clauses_for_area(ComplianceArea area);
std::vector<const Clause*> mandatory_clauses(StandardId id);
// Case-insensitive match on clause id or title.
std::vector<std::pair<StandardId, const Clause*>> search_clauses(const std::string& keyword);
std::vector<const RegulatoryStandard*> standards_by_category(const std::string& category);
std::vector<const RegulatoryStandard*> standards_by_jurisdiction(const std::string& jurisdiction);
std::vector<const RegulatoryStandard*> related_standards(StandardId id);
CatalogueStats catalogue_stats();

std::vector<StandardId> all_standard_ids();
std::string to_string(StandardId id);
std::string to_string(ComplianceArea area);
std::optional<StandardId> parse_standard_id(const std::string& value);

// Resolves filter tokens into identifiers, preserving order and dropping duplicates.
// Throws ValidationError on field "standards" naming every unknown token.
std::vector<StandardId> resolve_standards(const std::vector<std::string>& tokens);
std::vector<StandardId> parse_standards_filter(const std::string& comma_list);

}  // namespace psrisk

#endif  // PSRISK_STANDARDS_HPP
