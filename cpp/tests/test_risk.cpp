#include "psrisk/errors.hpp"
#include "psrisk/risk.hpp"
#include "test_support.hpp"

namespace psrisk_test {

namespace {

void test_score_bounds() {
    expect_true(psrisk::RiskScorer::score(1, 1, 1) == 1, "minimum score is 1");
    expect_true(psrisk::RiskScorer::score(5, 5, 5) == 125, "maximum score is 125");
    expect_true(psrisk::RiskScorer::score(3, 4) == 12, "detectability defaults to 1");

    psrisk::RiskScorer scorer;
    expect_true(scorer.band(1) == psrisk::RiskBand::kLow, "score 1 is low");
    expect_true(scorer.band(125) == psrisk::RiskBand::kHigh, "score 125 is high");
    expect_true(scorer.band(20) == psrisk::RiskBand::kLow, "score 20 is low");
    expect_true(scorer.band(21) == psrisk::RiskBand::kMedium, "score 21 is medium");
    expect_true(scorer.band(60) == psrisk::RiskBand::kMedium, "score 60 is medium");
    expect_true(scorer.band(61) == psrisk::RiskBand::kHigh, "score 61 is high");
}

void test_score_monotone() {
    bool monotone = true;
    for (int s = 1; s <= 5; ++s) {
        for (int l = 1; l <= 5; ++l) {
            for (int d = 1; d <= 5; ++d) {
                const int base = psrisk::RiskScorer::score(s, l, d);
                if (s < 5 && psrisk::RiskScorer::score(s + 1, l, d) <= base) {
                    monotone = false;
                }
                if (l < 5 && psrisk::RiskScorer::score(s, l + 1, d) <= base) {
                    monotone = false;
                }
                if (d < 5 && psrisk::RiskScorer::score(s, l, d + 1) <= base) {
                    monotone = false;
                }
            }
        }
    }
    expect_true(monotone, "score strictly increases in each input");
}

void test_invalid_levels() {
    auto message = expect_throws<psrisk::ValidationError>([]() { psrisk::RiskScorer::score(0, 3); },
                                                          "severity 0 rejected");
    expect_true(contains(message, "severity"), "error names severity");
    expect_throws<psrisk::ValidationError>([]() { psrisk::RiskScorer::score(3, 6); }, "likelihood 6 rejected");
    expect_throws<psrisk::ValidationError>([]() { psrisk::RiskScorer::score(3, 3, 0); }, "detectability 0 rejected");
    try {
        psrisk::RiskScorer::score(2, 9);
        expect_true(false, "likelihood 9 rejected");
    } catch (const psrisk::ValidationError& exc) {
        expect_true(!exc.errors().empty() && exc.errors().front().field == "likelihood", "field error is likelihood");
        expect_true(contains(exc.errors().front().message, "9"), "field error names the value");
    }
    psrisk::RiskScorer scorer;
    expect_throws<psrisk::ValidationError>([&]() { scorer.band(0); }, "score 0 has no band");
    expect_throws<psrisk::ValidationError>([&]() { scorer.band(126); }, "score 126 has no band");
}

void test_matrix_band() {
    expect_true(psrisk::matrix_band(1, 4) == psrisk::RiskBand::kLow, "matrix 4 is low");
    expect_true(psrisk::matrix_band(1, 5) == psrisk::RiskBand::kMedium, "matrix 5 is medium");
    expect_true(psrisk::matrix_band(2, 5) == psrisk::RiskBand::kMedium, "matrix 10 is medium");
    expect_true(psrisk::matrix_band(3, 4) == psrisk::RiskBand::kMedium, "matrix 12 is medium");
    expect_throws<psrisk::ValidationError>([]() { psrisk::matrix_band(6, 1); }, "matrix severity 6 rejected");
    expect_true(psrisk::matrix_band(3, 5) == psrisk::RiskBand::kHigh, "matrix 15 is high");
    expect_true(psrisk::matrix_band(5, 5) == psrisk::RiskBand::kHigh, "matrix 25 is high");
}

void test_custom_thresholds() {
    psrisk::RiskScorer conservative(psrisk::score_threshold_preset("conservative"));
    expect_true(conservative.band(41) == psrisk::RiskBand::kHigh, "conservative preset raises 41 to high");
    expect_true(conservative.band(11) == psrisk::RiskBand::kMedium, "conservative preset raises 11 to medium");

    psrisk::BandThresholds gap{{1, 20}, {25, 60}, {61, 125}};
    expect_throws<psrisk::ValidationError>([&]() { psrisk::RiskScorer scorer(gap); },
                                           "non-contiguous thresholds rejected");
    psrisk::BandThresholds short_high{{1, 20}, {21, 60}, {61, 100}};
    expect_throws<psrisk::ValidationError>([&]() { short_high.validate(psrisk::kMaxScore); },
                                           "thresholds must reach 125");
}

void test_lopa_trigger() {
    psrisk::RiskScorer scorer;
    auto catastrophic = scorer.check_lopa_trigger({5, 1, std::nullopt});
    expect_true(catastrophic.required && catastrophic.recommended, "severity 5 requires LOPA");
    expect_true(contains(catastrophic.reason, "Catastrophic"), "reason names severity label");

    auto high_band = scorer.check_lopa_trigger({3, 5, 5});
    expect_true(!high_band.required && high_band.recommended, "high band recommends LOPA");

    auto moderate = scorer.check_lopa_trigger({3, 4, std::nullopt});
    expect_true(moderate.recommended && !moderate.required, "moderate severity likely recommends LOPA");

    auto low = scorer.check_lopa_trigger({2, 2, std::nullopt});
    expect_true(!low.required && !low.recommended, "low rating needs no LOPA");
    expect_true(contains(low.reason, "not required"), "reason explains no LOPA");

    expect_true(psrisk::is_lopa_recommended(4, 1), "severity 4 recommended");
    expect_true(psrisk::is_lopa_recommended(3, 4), "severity 3 likelihood 4 recommended");
    expect_true(!psrisk::is_lopa_recommended(3, 3), "severity 3 likelihood 3 not recommended");
}

void test_labels_and_targets() {
    expect_equal(psrisk::severity_label(1), "Negligible", "severity 1 label");
    expect_equal(psrisk::severity_label(5), "Catastrophic", "severity 5 label");
    expect_equal(psrisk::likelihood_label(5), "Almost Certain", "likelihood 5 label");
    expect_equal(psrisk::band_label(psrisk::RiskBand::kMedium), "Medium Risk", "medium band label");
    expect_near(psrisk::target_frequency_for_severity(1), 1e-2, 1e-15, "severity 1 target");
    expect_near(psrisk::target_frequency_for_severity(5), 1e-6, 1e-18, "severity 5 target");
}

}  // namespace

void run_risk_tests() {
    test_score_bounds();
    test_score_monotone();
    test_invalid_levels();
    test_matrix_band();
    test_custom_thresholds();
    test_lopa_trigger();
    test_labels_and_targets();
}

}  // namespace psrisk_test
