#ifndef PSRISK_SERIALIZE_HPP
#define PSRISK_SERIALIZE_HPP

#include <string>
#include <vector>

#include "psrisk/compliance.hpp"
#include "psrisk/errors.hpp"
#include "psrisk/json.hpp"
#include "psrisk/lopa.hpp"

namespace psrisk {

void write_json(JsonWriter& writer, const StandardComplianceSummary& summary);
void write_json(JsonWriter& writer, const AnalysisComplianceStatus& status);
void write_json(JsonWriter& writer, const ProjectComplianceStatus& status);
void write_json(JsonWriter& writer, const ComplianceReport& report);
void write_json(JsonWriter& writer, const GapAnalysis& analysis);

// {"success":true,"data":...}
template <typename T>
std::string success_body(const T& data) {
    JsonWriter writer;
    writer.begin_object().key("success").value(true).key("data");
    write_json(writer, data);
    writer.end_object();
    return writer.str();
}

std::string error_body(const std::string& code, const std::string& message,
                       const std::vector<FieldError>& errors = {});

}  // namespace psrisk

#endif  // PSRISK_SERIALIZE_HPP
