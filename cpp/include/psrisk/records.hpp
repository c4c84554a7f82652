#ifndef PSRISK_RECORDS_HPP
#define PSRISK_RECORDS_HPP

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "psrisk/lopa.hpp"
#include "psrisk/risk.hpp"

namespace psrisk {

struct ProjectRecord {
    std::string id;
    std::string name;
};

struct AnalysisRecord {
    std::string id;
    std::string project_id;
    std::string name;
    std::string status = "draft";
};

// Read-only view of the hazard review records owned by the surrounding workflow.
class RecordStore {
public:
    virtual ~RecordStore() = default;

    virtual std::optional<ProjectRecord> find_project(const std::string& project_id) const = 0;
    virtual std::optional<AnalysisRecord> find_analysis(const std::string& analysis_id) const = 0;
    virtual std::vector<AnalysisRecord> analyses_for_project(const std::string& project_id) const = 0;
    virtual std::vector<RiskEntry> entries_for_analysis(const std::string& analysis_id) const = 0;
    virtual std::vector<LopaScenario> scenarios_for_analysis(const std::string& analysis_id) const = 0;
};

// Access decision owned by the caller. Implementations throw ForbiddenError.
class AccessPolicy {
public:
    virtual ~AccessPolicy() = default;

    virtual void check_project_access(const std::string& project_id) const = 0;
};

class AllowAllAccess : public AccessPolicy {
public:
    void check_project_access(const std::string& project_id) const override;
};

class InMemoryRecordStore : public RecordStore {
public:
    void add_project(ProjectRecord project);
    void add_analysis(AnalysisRecord analysis);
    void add_entry(RiskEntry entry);
    void add_scenario(LopaScenario scenario);

    std::optional<ProjectRecord> find_project(const std::string& project_id) const override;
    std::optional<AnalysisRecord> find_analysis(const std::string& analysis_id) const override;
    std::vector<AnalysisRecord> analyses_for_project(const std::string& project_id) const override;
    std::vector<RiskEntry> entries_for_analysis(const std::string& analysis_id) const override;
    std::vector<LopaScenario> scenarios_for_analysis(const std::string& analysis_id) const override;

    // Loads [project], [analysis], [entry], [scenario] and [ipl] sections. An [ipl]
    // section belongs to the [scenario] section above it.
    static std::shared_ptr<InMemoryRecordStore> load_dataset(const std::string& path);

private:
    mutable std::mutex mutex_;
    std::map<std::string, ProjectRecord> projects_;
    std::vector<AnalysisRecord> analyses_;
    std::vector<RiskEntry> entries_;
    std::vector<LopaScenario> scenarios_;
};

}  // namespace psrisk

#endif  // PSRISK_RECORDS_HPP
