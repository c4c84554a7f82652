#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "psrisk/api.hpp"
#include "psrisk/compliance.hpp"
#include "psrisk/lopa.hpp"
#include "psrisk/matrix.hpp"
#include "psrisk/raster.hpp"
#include "psrisk/records.hpp"
#include "psrisk/risk.hpp"
#include "psrisk/serialize.hpp"

namespace py = pybind11;

PYBIND11_MODULE(psrisk_python, m) {
    m.doc() = "Pybind11 bindings for the psrisk C++ engine.";

    py::register_exception<psrisk::ValidationError>(m, "ValidationError", PyExc_ValueError);
    py::register_exception<psrisk::NotFoundError>(m, "NotFoundError", PyExc_LookupError);
    py::register_exception<psrisk::ForbiddenError>(m, "ForbiddenError", PyExc_PermissionError);
    py::register_exception<psrisk::ComputationError>(m, "ComputationError", PyExc_RuntimeError);

    py::enum_<psrisk::RiskBand>(m, "RiskBand")
        .value("LOW", psrisk::RiskBand::kLow)
        .value("MEDIUM", psrisk::RiskBand::kMedium)
        .value("HIGH", psrisk::RiskBand::kHigh);

    py::class_<psrisk::RiskRating>(m, "RiskRating")
        .def(py::init<>())
        .def(py::init([](int severity, int likelihood, std::optional<int> detectability) {
                 return psrisk::RiskRating{severity, likelihood, detectability};
             }),
             py::arg("severity"), py::arg("likelihood"), py::arg("detectability") = std::nullopt)
        .def_readwrite("severity", &psrisk::RiskRating::severity)
        .def_readwrite("likelihood", &psrisk::RiskRating::likelihood)
        .def_readwrite("detectability", &psrisk::RiskRating::detectability);

    py::class_<psrisk::LopaTrigger>(m, "LopaTrigger")
        .def_readonly("required", &psrisk::LopaTrigger::required)
        .def_readonly("recommended", &psrisk::LopaTrigger::recommended)
        .def_readonly("reason", &psrisk::LopaTrigger::reason);

    py::class_<psrisk::RiskScorer>(m, "RiskScorer")
        .def(py::init<>())
        .def_static("score", py::overload_cast<int, int, std::optional<int>>(&psrisk::RiskScorer::score),
                    py::arg("severity"), py::arg("likelihood"), py::arg("detectability") = std::nullopt)
        .def("band", py::overload_cast<int>(&psrisk::RiskScorer::band, py::const_))
        .def("check_lopa_trigger", &psrisk::RiskScorer::check_lopa_trigger);

    py::enum_<psrisk::IplType>(m, "IplType")
        .value("SAFETY_INSTRUMENTED_FUNCTION", psrisk::IplType::kSafetyInstrumentedFunction)
        .value("BASIC_PROCESS_CONTROL", psrisk::IplType::kBasicProcessControl)
        .value("RELIEF_DEVICE", psrisk::IplType::kReliefDevice)
        .value("PHYSICAL_CONTAINMENT", psrisk::IplType::kPhysicalContainment)
        .value("MECHANICAL", psrisk::IplType::kMechanical)
        .value("HUMAN_INTERVENTION", psrisk::IplType::kHumanIntervention)
        .value("EMERGENCY_RESPONSE", psrisk::IplType::kEmergencyResponse)
        .value("OTHER", psrisk::IplType::kOther);

    py::class_<psrisk::Ipl>(m, "Ipl")
        .def(py::init<>())
        .def_readwrite("id", &psrisk::Ipl::id)
        .def_readwrite("name", &psrisk::Ipl::name)
        .def_readwrite("type", &psrisk::Ipl::type)
        .def_readwrite("pfd", &psrisk::Ipl::pfd)
        .def_readwrite("independent_of_initiator", &psrisk::Ipl::independent_of_initiator)
        .def_readwrite("independent_of_other_ipls", &psrisk::Ipl::independent_of_other_ipls)
        .def_readwrite("sil", &psrisk::Ipl::sil);

    py::class_<psrisk::LopaScenario>(m, "LopaScenario")
        .def(py::init<>())
        .def_readwrite("id", &psrisk::LopaScenario::id)
        .def_readwrite("initiating_event_frequency", &psrisk::LopaScenario::initiating_event_frequency)
        .def_readwrite("target_frequency", &psrisk::LopaScenario::target_frequency)
        .def_readwrite("ipls", &psrisk::LopaScenario::ipls);

    py::class_<psrisk::GapAnalysis>(m, "GapAnalysis")
        .def_readonly("total_rrf", &psrisk::GapAnalysis::total_rrf)
        .def_readonly("required_rrf", &psrisk::GapAnalysis::required_rrf)
        .def_readonly("gap_ratio", &psrisk::GapAnalysis::gap_ratio)
        .def_readonly("mitigated_event_likelihood", &psrisk::GapAnalysis::mitigated_event_likelihood)
        .def_readonly("required_sil", &psrisk::GapAnalysis::required_sil)
        .def_readonly("recommendations", &psrisk::GapAnalysis::recommendations)
        .def_readonly("warnings", &psrisk::GapAnalysis::warnings)
        .def_property_readonly("gap_status",
                               [](const psrisk::GapAnalysis& analysis) { return psrisk::to_string(analysis.gap_status); })
        .def("to_json", [](const psrisk::GapAnalysis& analysis) {
            psrisk::JsonWriter writer;
            psrisk::write_json(writer, analysis);
            return writer.str();
        });

    py::class_<psrisk::GapAnalyzer>(m, "GapAnalyzer")
        .def(py::init<>())
        .def("analyze", &psrisk::GapAnalyzer::analyze);

    py::enum_<psrisk::MatrixSize>(m, "MatrixSize")
        .value("SMALL", psrisk::MatrixSize::kSmall)
        .value("MEDIUM", psrisk::MatrixSize::kMedium)
        .value("LARGE", psrisk::MatrixSize::kLarge);

    py::class_<psrisk::RiskMatrixOptions>(m, "RiskMatrixOptions")
        .def(py::init<>())
        .def_readwrite("size", &psrisk::RiskMatrixOptions::size)
        .def_readwrite("include_labels", &psrisk::RiskMatrixOptions::include_labels)
        .def_readwrite("include_legend", &psrisk::RiskMatrixOptions::include_legend)
        .def_readwrite("show_scores", &psrisk::RiskMatrixOptions::show_scores)
        .def_readwrite("title", &psrisk::RiskMatrixOptions::title)
        .def_readwrite("background_color", &psrisk::RiskMatrixOptions::background_color)
        .def("highlight", [](psrisk::RiskMatrixOptions& options, int severity, int likelihood) {
            options.highlight_cells.push_back(psrisk::CellHighlight{severity, likelihood});
        });

    m.def("render_svg", [](const psrisk::RiskMatrixOptions& options) { return psrisk::render_svg(options).markup; },
          py::arg("options") = psrisk::RiskMatrixOptions());
    m.def("render_image",
          [](const psrisk::RiskMatrixOptions& options) {
              auto image = psrisk::render_image(options);
              return py::make_tuple(
                  py::bytes(reinterpret_cast<const char*>(image.buffer.data()), image.buffer.size()),
                  image.filename, image.width, image.height);
          },
          py::arg("options") = psrisk::RiskMatrixOptions());

    py::class_<psrisk::InMemoryRecordStore, std::shared_ptr<psrisk::InMemoryRecordStore>>(m, "InMemoryRecordStore")
        .def(py::init<>())
        .def_static("load_dataset", &psrisk::InMemoryRecordStore::load_dataset);

    m.def("analysis_compliance_json",
          [](const std::shared_ptr<psrisk::InMemoryRecordStore>& store, const std::string& analysis_id,
             const std::string& standards) {
              psrisk::ComplianceAggregator aggregator(store, std::make_shared<psrisk::AllowAllAccess>());
              return psrisk::success_body(
                  aggregator.analysis_compliance(analysis_id, psrisk::parse_standards_filter(standards)));
          },
          py::arg("store"), py::arg("analysis_id"), py::arg("standards") = "");
    m.def("project_compliance_json",
          [](const std::shared_ptr<psrisk::InMemoryRecordStore>& store, const std::string& project_id,
             const std::string& standards) {
              psrisk::ComplianceAggregator aggregator(store, std::make_shared<psrisk::AllowAllAccess>());
              return psrisk::success_body(
                  aggregator.project_compliance(project_id, psrisk::parse_standards_filter(standards)));
          },
          py::arg("store"), py::arg("project_id"), py::arg("standards") = "");
}
