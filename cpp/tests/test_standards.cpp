#include "psrisk/errors.hpp"
#include "psrisk/standards.hpp"
#include "test_support.hpp"

namespace psrisk_test {

namespace {

void test_catalogue() {
    const auto& catalogue = psrisk::standards_catalogue();
    expect_true(catalogue.size() == 8, "catalogue lists eight standards");
    for (const auto& standard : catalogue) {
        expect_true(!standard.clauses.empty(), standard.code + " has clauses");
        expect_equal(psrisk::to_string(standard.id), standard.code, standard.code + " code matches identifier");
    }
    expect_true(psrisk::find_standard(psrisk::StandardId::kIec61511).clauses.size() == 12, "IEC 61511 clause count");
    expect_true(psrisk::find_standard(psrisk::StandardId::kOshaPsm).clauses.size() == 14, "OSHA PSM clause count");
    expect_equal(psrisk::find_standard(psrisk::StandardId::kPed).name, "Pressure Equipment Directive (PED)",
                 "PED display name");

    const auto* clause = psrisk::find_clause(psrisk::StandardId::kIec61511, "9.2");
    expect_true(clause != nullptr, "IEC 61511 clause 9.2 exists");
    expect_true(psrisk::find_clause(psrisk::StandardId::kIec61511, "99.9") == nullptr, "unknown clause is null");

    const auto lopa_clauses = psrisk::clauses_for_area(psrisk::ComplianceArea::kLopa);
    expect_true(!lopa_clauses.empty(), "some clauses draw on LOPA results");
}

void test_resolve_standards() {
    auto resolved = psrisk::resolve_standards({"OSHA_PSM", " IEC_61511 ", "OSHA_PSM", ""});
    expect_true(resolved.size() == 2, "duplicates and blanks collapsed");
    expect_true(resolved[0] == psrisk::StandardId::kOshaPsm && resolved[1] == psrisk::StandardId::kIec61511,
                "order preserved");

    expect_true(psrisk::parse_standards_filter("").empty(), "empty filter means all standards");
    expect_true(psrisk::parse_standards_filter("PED,EPA_RMP").size() == 2, "comma list parsed");

    try {
        psrisk::parse_standards_filter("IEC_61511,ISO_14001,FOO");
        expect_true(false, "unknown standards rejected");
    } catch (const psrisk::ValidationError& exc) {
        expect_true(contains(exc.what(), "ISO_14001") && contains(exc.what(), "FOO"), "message names invalid tokens");
        expect_true(contains(exc.what(), "SEVESO_III"), "message lists valid values");
        expect_true(exc.errors().size() == 1 && exc.errors().front().field == "standards", "error is on standards");
    }
    expect_true(!psrisk::parse_standard_id("iec_61511").has_value(), "identifiers are case sensitive");
}

void test_catalogue_lookups() {
    const auto mandatory = psrisk::mandatory_clauses(psrisk::StandardId::kIec61511);
    expect_true(mandatory.size() == 11, "IEC 61511 has eleven mandatory clauses");
    for (const auto* clause : mandatory) {
        expect_true(clause->id != "Annex_A", "informative annex is not mandatory");
    }

    const auto lopa = psrisk::search_clauses("  LOPA ");
    bool found_annex = false;
    for (const auto& [standard, clause] : lopa) {
        found_annex = found_annex || (standard == psrisk::StandardId::kIec61511 && clause->id == "Annex_A");
    }
    expect_true(found_annex, "search is case-insensitive over titles");
    expect_true(!psrisk::search_clauses("1910.119(d)").empty(), "search matches clause ids");
    expect_true(psrisk::search_clauses("").empty(), "blank search matches nothing");

    const auto us = psrisk::standards_by_jurisdiction("united_states");
    expect_true(us.size() == 2, "two United States regulations");
    expect_true(psrisk::standards_by_category("functional_safety").size() == 1, "one functional safety standard");
    expect_true(psrisk::standards_by_category("cooking").empty(), "unknown category is empty");

    const auto related = psrisk::related_standards(psrisk::StandardId::kPed);
    expect_true(related.size() == 3 && related.front()->id == psrisk::StandardId::kIec61511,
                "PED relates to three standards");

    const auto stats = psrisk::catalogue_stats();
    expect_true(stats.total_standards == 8, "stats count standards");
    expect_true(stats.total_clauses == 128, "stats count every clause");
    expect_true(stats.mandatory_standards == 6, "stats count mandatory standards");
    expect_true(stats.standards_by_jurisdiction.at("international") == 3, "stats group by jurisdiction");
}

}  // namespace

void run_standards_tests() {
    test_catalogue();
    test_resolve_standards();
    test_catalogue_lookups();
}

}  // namespace psrisk_test
