#ifndef PSRISK_API_HPP
#define PSRISK_API_HPP

#include <memory>

#include "psrisk/compliance.hpp"
#include "psrisk/config.hpp"
#include "psrisk/logging.hpp"
#include "psrisk/lopa.hpp"
#include "psrisk/records.hpp"
#include "psrisk/risk.hpp"
#include "psrisk/server.hpp"

namespace psrisk {

struct EngineRuntime {
    std::shared_ptr<EngineSettings> settings;
    std::shared_ptr<const RecordStore> store;
    std::shared_ptr<ComplianceAggregator> aggregator;
    std::shared_ptr<RequestRouter> router;
    std::shared_ptr<ComplianceServer> server;

    RiskScorer scorer() const;
    GapAnalyzer analyzer() const;
};

// Wires the engine from settings. Without a store the configured dataset is loaded, or an empty
// in-memory store is used. The HTTP server is started when settings enable it.
EngineRuntime build_engine(std::shared_ptr<EngineSettings> settings = nullptr,
                           std::shared_ptr<const RecordStore> store = nullptr,
                           std::shared_ptr<const AccessPolicy> access = nullptr,
                           Logger logger = get_logger("psrisk"));

}  // namespace psrisk

#endif  // PSRISK_API_HPP
