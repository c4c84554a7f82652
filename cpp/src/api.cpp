#include "psrisk/api.hpp"

namespace psrisk {

RiskScorer EngineRuntime::scorer() const {
    return RiskScorer(settings->risk_thresholds.score, settings->lopa_trigger);
}

GapAnalyzer EngineRuntime::analyzer() const {
    return GapAnalyzer(settings->gap_analysis);
}

EngineRuntime build_engine(std::shared_ptr<EngineSettings> settings, std::shared_ptr<const RecordStore> store,
                           std::shared_ptr<const AccessPolicy> access, Logger logger) {
    auto effective_settings = settings ? std::move(settings) : std::make_shared<EngineSettings>();
    configure_logging(effective_settings->logging);

    if (!store) {
        if (effective_settings->dataset_path.has_value()) {
            store = InMemoryRecordStore::load_dataset(*effective_settings->dataset_path);
            logger.info("dataset_loaded", {{"path", *effective_settings->dataset_path}});
        } else {
            store = std::make_shared<InMemoryRecordStore>();
        }
    }
    if (!access) {
        access = std::make_shared<AllowAllAccess>();
    }

    RiskScorer scorer(effective_settings->risk_thresholds.score, effective_settings->lopa_trigger);
    ComplianceEvaluator evaluator(effective_settings->compliance, scorer);
    GapAnalyzer analyzer(effective_settings->gap_analysis, logger.child("lopa"));
    auto aggregator = std::make_shared<ComplianceAggregator>(store, access, evaluator, analyzer,
                                                             logger.child("compliance"));
    auto router = std::make_shared<RequestRouter>(aggregator, effective_settings->risk_thresholds.matrix,
                                                  effective_settings->raster, logger.child("http"));
    auto server = std::make_shared<ComplianceServer>(router, effective_settings->server, logger.child("server"));
    if (effective_settings->server.enabled) {
        server->start();
    }

    return EngineRuntime{effective_settings, store, aggregator, router, server};
}

}  // namespace psrisk
