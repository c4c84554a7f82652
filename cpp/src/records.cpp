#include "psrisk/records.hpp"

#include <algorithm>
#include <fstream>
#include <stdexcept>

#include "psrisk/common.hpp"

namespace psrisk {

namespace {

// Errors name the line of the offending key, or the section header when a key is missing.
struct DatasetParser {
    std::shared_ptr<InMemoryRecordStore> store = std::make_shared<InMemoryRecordStore>();
    std::string section;
    std::map<std::string, std::string> fields;
    std::map<std::string, int> key_lines;
    std::optional<LopaScenario> scenario;
    int line_number = 0;
    int section_line = 0;

    [[noreturn]] void fail(int line, const std::string& message) const {
        throw std::runtime_error("dataset line " + std::to_string(line) + ": " + message);
    }

    int line_of(const std::string& key) const {
        auto it = key_lines.find(key);
        return it == key_lines.end() ? section_line : it->second;
    }

    bool has(const std::string& key) const { return fields.count(key) != 0; }

    std::string required(const std::string& key) const {
        auto it = fields.find(key);
        if (it == fields.end() || it->second.empty()) {
            fail(section_line, "[" + section + "] is missing " + key);
        }
        return strip_quotes(it->second);
    }

    int integer(const std::string& key) const {
        const auto text = required(key);
        size_t consumed = 0;
        int value = 0;
        try {
            value = std::stoi(text, &consumed);
        } catch (const std::logic_error&) {
            fail(line_of(key), key + " is not an integer: " + text);
        }
        if (consumed != text.size()) {
            fail(line_of(key), key + " is not an integer: " + text);
        }
        return value;
    }

    double number(const std::string& key) const {
        const auto text = required(key);
        size_t consumed = 0;
        double value = 0.0;
        try {
            value = std::stod(text, &consumed);
        } catch (const std::logic_error&) {
            fail(line_of(key), key + " is not a number: " + text);
        }
        if (consumed != text.size()) {
            fail(line_of(key), key + " is not a number: " + text);
        }
        return value;
    }

    std::string optional_text(const std::string& key) const {
        auto it = fields.find(key);
        return it == fields.end() ? std::string() : strip_quotes(it->second);
    }

    std::vector<std::string> list(const std::string& key) const {
        auto it = fields.find(key);
        return it == fields.end() ? std::vector<std::string>{} : parse_string_list(it->second);
    }

    bool flag(const std::string& key, bool fallback) const {
        auto it = fields.find(key);
        return it == fields.end() ? fallback : parse_bool(it->second);
    }

    void flush_scenario() {
        if (scenario.has_value()) {
            store->add_scenario(std::move(*scenario));
            scenario.reset();
        }
    }

    void flush_section() {
        if (section.empty()) {
            fields.clear();
            key_lines.clear();
            return;
        }
        if (section != "ipl" && section != "scenario") {
            flush_scenario();
        }
        if (section == "project") {
            store->add_project(ProjectRecord{required("id"), optional_text("name")});
        } else if (section == "analysis") {
            AnalysisRecord analysis{required("id"), required("project_id"), optional_text("name"), "draft"};
            if (fields.count("status") != 0) {
                analysis.status = optional_text("status");
            }
            store->add_analysis(std::move(analysis));
        } else if (section == "entry") {
            RiskEntry entry;
            entry.id = required("id");
            entry.analysis_id = required("analysis_id");
            entry.node_id = optional_text("node_id");
            entry.guide_word = optional_text("guide_word");
            entry.parameter = optional_text("parameter");
            entry.deviation = optional_text("deviation");
            entry.causes = list("causes");
            entry.consequences = list("consequences");
            entry.safeguards = list("safeguards");
            entry.recommendations = list("recommendations");
            if (has("severity") != has("likelihood")) {
                const auto present = has("severity") ? "severity" : "likelihood";
                fail(line_of(present), std::string(present) + " needs both severity and likelihood to rate an entry");
            }
            if (has("severity")) {
                RiskRating rating;
                rating.severity = integer("severity");
                rating.likelihood = integer("likelihood");
                if (has("detectability")) {
                    rating.detectability = integer("detectability");
                }
                entry.rating = rating;
            } else if (has("detectability")) {
                fail(line_of("detectability"), "detectability needs both severity and likelihood to rate an entry");
            }
            store->add_entry(std::move(entry));
        } else if (section == "scenario") {
            flush_scenario();
            LopaScenario next;
            next.id = required("id");
            next.analysis_id = required("analysis_id");
            next.node_id = optional_text("node_id");
            if (fields.count("entry_id") != 0) {
                next.entry_id = optional_text("entry_id");
            }
            next.scenario_description = optional_text("description");
            next.consequence = optional_text("consequence");
            next.initiating_event_frequency = number("initiating_event_frequency");
            next.target_frequency = number("target_frequency");
            next.initiating_event_description = optional_text("initiating_event_description");
            if (fields.count("initiating_event_category") != 0) {
                const auto category = optional_text("initiating_event_category");
                auto parsed = parse_initiating_event_category(category);
                if (!parsed.has_value()) {
                    fail(line_of("initiating_event_category"), "unknown initiating event category " + category);
                }
                next.initiating_event_category = *parsed;
            }
            scenario = std::move(next);
        } else if (section == "ipl") {
            if (!scenario.has_value()) {
                fail(section_line, "[ipl] must follow a [scenario]");
            }
            Ipl ipl;
            ipl.id = optional_text("id");
            ipl.name = optional_text("name");
            ipl.description = optional_text("description");
            const auto type = fields.count("type") != 0 ? optional_text("type") : std::string("other");
            auto parsed = parse_ipl_type(type);
            if (!parsed.has_value()) {
                fail(line_of("type"), "unknown IPL type " + type);
            }
            ipl.type = *parsed;
            ipl.pfd = number("pfd");
            ipl.independent_of_initiator = flag("independent_of_initiator", true);
            ipl.independent_of_other_ipls = flag("independent_of_other_ipls", true);
            if (fields.count("sil") != 0) {
                ipl.sil = integer("sil");
            }
            if (has("response_time_minutes") || has("independent_alarm") || has("written_procedure") ||
                has("operators_trained")) {
                HumanResponseEvidence evidence;
                if (has("response_time_minutes")) {
                    evidence.response_time_minutes = number("response_time_minutes");
                }
                if (has("independent_alarm")) {
                    evidence.independent_alarm = flag("independent_alarm", false);
                }
                if (has("written_procedure")) {
                    evidence.written_procedure = flag("written_procedure", false);
                }
                if (has("operators_trained")) {
                    evidence.operators_trained = flag("operators_trained", false);
                }
                ipl.human_response = evidence;
            }
            scenario->ipls.push_back(std::move(ipl));
        } else {
            fail(section_line, "unknown section [" + section + "]");
        }
        fields.clear();
        key_lines.clear();
    }
};

}  // namespace

void AllowAllAccess::check_project_access(const std::string&) const {}

void InMemoryRecordStore::add_project(ProjectRecord project) {
    std::lock_guard<std::mutex> guard(mutex_);
    projects_[project.id] = std::move(project);
}

void InMemoryRecordStore::add_analysis(AnalysisRecord analysis) {
    std::lock_guard<std::mutex> guard(mutex_);
    analyses_.push_back(std::move(analysis));
}

void InMemoryRecordStore::add_entry(RiskEntry entry) {
    std::lock_guard<std::mutex> guard(mutex_);
    entries_.push_back(std::move(entry));
}

void InMemoryRecordStore::add_scenario(LopaScenario scenario) {
    std::lock_guard<std::mutex> guard(mutex_);
    scenarios_.push_back(std::move(scenario));
}

std::optional<ProjectRecord> InMemoryRecordStore::find_project(const std::string& project_id) const {
    std::lock_guard<std::mutex> guard(mutex_);
    auto it = projects_.find(project_id);
    if (it == projects_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<AnalysisRecord> InMemoryRecordStore::find_analysis(const std::string& analysis_id) const {
    std::lock_guard<std::mutex> guard(mutex_);
    auto it = std::find_if(analyses_.begin(), analyses_.end(),
                           [&](const AnalysisRecord& analysis) { return analysis.id == analysis_id; });
    if (it == analyses_.end()) {
        return std::nullopt;
    }
    return *it;
}

std::vector<AnalysisRecord> InMemoryRecordStore::analyses_for_project(const std::string& project_id) const {
    std::lock_guard<std::mutex> guard(mutex_);
    std::vector<AnalysisRecord> output;
    for (const auto& analysis : analyses_) {
        if (analysis.project_id == project_id) {
            output.push_back(analysis);
        }
    }
    return output;
}

std::vector<RiskEntry> InMemoryRecordStore::entries_for_analysis(const std::string& analysis_id) const {
    std::lock_guard<std::mutex> guard(mutex_);
    std::vector<RiskEntry> output;
    for (const auto& entry : entries_) {
        if (entry.analysis_id == analysis_id) {
            output.push_back(entry);
        }
    }
    return output;
}

std::vector<LopaScenario> InMemoryRecordStore::scenarios_for_analysis(const std::string& analysis_id) const {
    std::lock_guard<std::mutex> guard(mutex_);
    std::vector<LopaScenario> output;
    for (const auto& scenario : scenarios_) {
        if (scenario.analysis_id == analysis_id) {
            output.push_back(scenario);
        }
    }
    return output;
}

std::shared_ptr<InMemoryRecordStore> InMemoryRecordStore::load_dataset(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("unable to open dataset file: " + path);
    }

    DatasetParser parser;
    std::string line;
    while (std::getline(file, line)) {
        parser.line_number += 1;
        line = trim(strip_comment(line));
        if (line.empty()) {
            continue;
        }
        if (line.front() == '[' && line.back() == ']') {
            parser.flush_section();
            parser.section = trim(line.substr(1, line.size() - 2));
            parser.section_line = parser.line_number;
            continue;
        }
        auto eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            continue;
        }
        const auto key = trim(line.substr(0, eq_pos));
        parser.fields[key] = trim(line.substr(eq_pos + 1));
        parser.key_lines[key] = parser.line_number;
    }
    parser.flush_section();
    parser.flush_scenario();
    return parser.store;
}

}  // namespace psrisk
