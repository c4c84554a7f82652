#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <chrono>
#include <future>
#include <memory>
#include <string>
#include <thread>

#include "psrisk/api.hpp"
#include "psrisk/compliance.hpp"
#include "psrisk/errors.hpp"
#include "psrisk/lopa.hpp"
#include "psrisk/records.hpp"
#include "psrisk/server.hpp"
#include "test_support.hpp"

namespace psrisk_test {

namespace {

const char* kProjectId = "3b8e1f40-2a6c-4d19-9e57-1c0d2b3a4f5e";
const char* kAnalysisId = "8a7b6c5d-4e3f-4a1b-9c8d-7e6f5a4b3c2d";
const char* kLockedAnalysisId = "a1b2c3d4-e5f6-4a7b-8c9d-0e1f2a3b4c5d";
const char* kLockedProjectId = "f0e1d2c3-b4a5-4968-8776-655443322110";

class LockedProjectAccess : public psrisk::AccessPolicy {
public:
    void check_project_access(const std::string& project_id) const override {
        if (project_id == kLockedProjectId) {
            throw psrisk::ForbiddenError("project " + project_id + " is restricted");
        }
    }
};

std::shared_ptr<psrisk::RequestRouter> make_router() {
    auto store = std::make_shared<psrisk::InMemoryRecordStore>();
    store->add_project({kProjectId, "Hydrotreater"});
    store->add_project({kLockedProjectId, "Restricted"});
    store->add_analysis({kAnalysisId, kProjectId, "Reactor loop", "approved"});
    store->add_analysis({kLockedAnalysisId, kLockedProjectId, "Restricted study", "draft"});
    psrisk::RiskEntry entry;
    entry.id = "e1";
    entry.analysis_id = kAnalysisId;
    entry.node_id = "N-1";
    entry.guide_word = "More";
    entry.causes = {"Feed pump overspeed"};
    entry.consequences = {"Reactor overpressure"};
    entry.safeguards = {"PSV-201"};
    entry.rating = psrisk::RiskRating{3, 2, std::nullopt};
    store->add_entry(entry);

    auto aggregator = std::make_shared<psrisk::ComplianceAggregator>(store, std::make_shared<LockedProjectAccess>());
    return std::make_shared<psrisk::RequestRouter>(aggregator, psrisk::RiskThresholdConfig{}.matrix);
}

psrisk::HttpResponse get(const psrisk::RequestRouter& router, const std::string& target) {
    return router.handle(psrisk::parse_request("GET " + target + " HTTP/1.1\r\nHost: localhost\r\n\r\n"));
}

int connect_local(int port) {
    const int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(static_cast<uint16_t>(port));
    ::inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);
    if (::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0) {
        ::close(fd);
        return -1;
    }
    return fd;
}

std::string fetch(int port, const std::string& target) {
    const int fd = connect_local(port);
    std::string reply;
    if (fd < 0) {
        return reply;
    }
    const std::string request = "GET " + target + " HTTP/1.1\r\nHost: localhost\r\n\r\n";
    ::send(fd, request.data(), request.size(), 0);
    char buffer[1024];
    ssize_t received = 0;
    while ((received = ::recv(fd, buffer, sizeof(buffer), 0)) > 0) {
        reply.append(buffer, static_cast<size_t>(received));
    }
    ::close(fd);
    return reply;
}

std::string header_value(const psrisk::HttpResponse& response, const std::string& name) {
    for (const auto& [key, value] : response.headers) {
        if (key == name) {
            return value;
        }
    }
    return "";
}

void test_request_parsing() {
    auto request = psrisk::parse_request(
        "GET /risk-matrix.svg?title=Unit%20100+A&highlight=4-3,5-5&labels= HTTP/1.1\r\nHost: x\r\n\r\n");
    expect_equal(request.method, "GET", "method parsed");
    expect_equal(request.path, "/risk-matrix.svg", "path parsed");
    expect_equal(request.query["title"], "Unit 100 A", "query decoded");
    expect_equal(request.query["highlight"], "4-3,5-5", "comma list kept");
    expect_true(request.query.count("labels") == 1 && request.query["labels"].empty(), "empty value kept");
    expect_throws<psrisk::ValidationError>([]() { psrisk::parse_request("garbage"); }, "malformed line rejected");
    expect_equal(psrisk::url_decode("a%2Cb%"), "a,b%", "trailing percent kept");

    auto options = psrisk::parse_matrix_query(request.query);
    expect_true(options.title.value_or("") == "Unit 100 A", "title option");
    expect_true(options.include_labels, "empty flag keeps default");
    expect_true(options.highlight_cells.size() == 2 && options.highlight_cells[1].likelihood == 5,
                "highlights parsed");

    psrisk::HttpRequest flags;
    flags.query = {{"legend", "no"}, {"scores", "0"}, {"size", "small"}, {"background", "f0f0f0"}};
    auto parsed = psrisk::parse_matrix_query(flags.query);
    expect_true(!parsed.include_legend && !parsed.show_scores, "false flags parsed");
    expect_true(parsed.size == psrisk::MatrixSize::kSmall, "size option");
    expect_equal(parsed.background_color, "#f0f0f0", "background gets a hash");

    try {
        psrisk::parse_matrix_query({{"labels", "maybe"}});
        expect_true(false, "bad flag rejected");
    } catch (const psrisk::ValidationError& exc) {
        expect_true(!exc.errors().empty() && exc.errors().front().field == "labels", "flag error field");
    }
    try {
        psrisk::parse_matrix_query({{"highlight", "4:3"}});
        expect_true(false, "bad highlight rejected");
    } catch (const psrisk::ValidationError& exc) {
        expect_true(!exc.errors().empty() && exc.errors().front().field == "highlight", "highlight error field");
    }
    expect_throws<psrisk::ValidationError>([]() { psrisk::parse_matrix_query({{"size", "poster"}}); },
                                           "bad size rejected");

    psrisk::HttpResponse response;
    response.body = "{}";
    response.headers.emplace_back("X-Test", "1");
    const auto wire = psrisk::serialize_response(response);
    expect_true(contains(wire, "HTTP/1.1 200 OK\r\n"), "status line");
    expect_true(contains(wire, "Content-Length: 2\r\n") && contains(wire, "X-Test: 1\r\n"), "headers serialized");
    expect_true(contains(wire, "\r\n\r\n{}"), "body after blank line");
}

void test_routes() {
    auto router = make_router();

    auto health = get(*router, "/health");
    expect_true(health.status == 200 && health.body == "{\"ok\":true}", "health route");

    auto ok = get(*router, std::string("/analyses/") + kAnalysisId + "/compliance?standards=IEC_61511,OSHA_PSM");
    expect_true(ok.status == 200, "analysis compliance succeeds");
    expect_true(contains(ok.body, "\"success\":true") && contains(ok.body, "\"analysisName\":\"Reactor loop\""),
                "success envelope");
    expect_true(contains(ok.body, "OSHA_PSM") && !contains(ok.body, "SEVESO_III"), "standards filter applied");

    auto project = get(*router, std::string("/projects/") + kProjectId + "/compliance");
    expect_true(project.status == 200 && contains(project.body, "\"projectName\":\"Hydrotreater\""),
                "project compliance succeeds");

    auto bad_id = get(*router, "/analyses/not-a-uuid/compliance");
    expect_true(bad_id.status == 400 && contains(bad_id.body, "\"code\":\"VALIDATION_ERROR\""), "bad id is 400");
    expect_true(contains(bad_id.body, "\"success\":false"), "error envelope");

    auto bad_standard =
        get(*router, std::string("/analyses/") + kAnalysisId + "/compliance?standards=IEC_61511,NFPA_70");
    expect_true(bad_standard.status == 400, "unknown standard is 400");
    expect_true(contains(bad_standard.body, "\"field\":\"standards\"") && contains(bad_standard.body, "NFPA_70"),
                "standards field error names the token");

    auto missing = get(*router, "/analyses/00000000-0000-4000-8000-000000000000/compliance");
    expect_true(missing.status == 404 && contains(missing.body, "Analysis not found"), "missing analysis is 404");

    auto forbidden = get(*router, std::string("/analyses/") + kLockedAnalysisId + "/compliance");
    expect_true(forbidden.status == 403 && contains(forbidden.body, "\"code\":\"FORBIDDEN\""), "forbidden is 403");
    expect_true(!contains(forbidden.body, "restricted"), "policy detail not leaked");

    auto unknown = get(*router, "/nowhere");
    expect_true(unknown.status == 404 && contains(unknown.body, "Route not found"), "unknown route");

    psrisk::HttpRequest post;
    post.method = "POST";
    post.path = "/health";
    expect_true(router->handle(post).status == 405, "non-GET rejected");
}

void test_matrix_routes() {
    auto router = make_router();
    auto svg = get(*router, "/risk-matrix.svg?legend=false&labels=false");
    expect_true(svg.status == 200 && svg.content_type == "image/svg+xml", "svg content type");
    expect_true(contains(svg.body, "<svg"), "svg body");

    auto png = get(*router, "/risk-matrix.png?size=small&highlight=5-5");
    expect_true(png.status == 200 && png.content_type == "image/png", "png content type");
    expect_true(png.body.size() > 8 && png.body.compare(1, 3, "PNG") == 0, "png body");
    const auto disposition = header_value(png, "Content-Disposition");
    expect_true(contains(disposition, "attachment") && contains(disposition, "risk_matrix_small_"),
                "png download filename");

    auto bad = get(*router, "/risk-matrix.svg?background=%23ggg");
    expect_true(bad.status == 400 && contains(bad.body, "backgroundColor"), "bad background is 400");
    auto out_of_range = get(*router, "/risk-matrix.png?highlight=0-3");
    expect_true(out_of_range.status == 400 && contains(out_of_range.body, "highlightCells"), "bad highlight is 400");
}

void test_socket_round_trip() {
    psrisk::ServerConfig config;
    config.host = "127.0.0.1";
    config.port = 0;
    config.workers = 2;
    psrisk::ComplianceServer server(make_router(), config);
    server.start();
    expect_true(server.running() && server.port() > 0, "server bound to an ephemeral port");

    const int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(static_cast<uint16_t>(server.port()));
    ::inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);
    std::string reply;
    if (::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0) {
        const std::string request = "GET /health HTTP/1.1\r\nHost: localhost\r\n\r\n";
        ::send(fd, request.data(), request.size(), 0);
        char buffer[1024];
        ssize_t received = 0;
        while ((received = ::recv(fd, buffer, sizeof(buffer), 0)) > 0) {
            reply.append(buffer, static_cast<size_t>(received));
        }
    }
    ::close(fd);
    expect_true(contains(reply, "HTTP/1.1 200 OK"), "socket status line");
    expect_true(contains(reply, "{\"ok\":true}"), "socket body");

    server.stop();
    expect_true(!server.running(), "server stopped");
}

void test_invalid_persisted_scenario() {
    auto store = std::make_shared<psrisk::InMemoryRecordStore>();
    store->add_project({kProjectId, "Hydrotreater"});
    store->add_analysis({kAnalysisId, kProjectId, "Reactor loop", "approved"});
    psrisk::RiskEntry entry;
    entry.id = "e1";
    entry.analysis_id = kAnalysisId;
    entry.causes = {"Cooling failure"};
    entry.consequences = {"Runaway"};
    entry.rating = psrisk::RiskRating{5, 3, std::nullopt};
    store->add_entry(entry);

    psrisk::LopaScenario scenario;
    scenario.id = "s-broken";
    scenario.analysis_id = kAnalysisId;
    scenario.entry_id = "e1";
    scenario.initiating_event_frequency = 0.1;
    scenario.target_frequency = 1e-5;
    psrisk::Ipl layer;
    layer.id = "ipl-1";
    layer.name = "Quench valve";
    layer.pfd = 0.0;
    scenario.ipls.push_back(layer);
    store->add_scenario(scenario);

    auto aggregator = std::make_shared<psrisk::ComplianceAggregator>(store, std::make_shared<psrisk::AllowAllAccess>());
    psrisk::RequestRouter router(aggregator, psrisk::RiskThresholdConfig{}.matrix);
    auto response = get(router, std::string("/analyses/") + kAnalysisId + "/compliance");
    expect_true(response.status == 500, "invalid stored scenario is a 500");
    expect_true(contains(response.body, "\"success\":false") && contains(response.body, "\"code\":\"INTERNAL_ERROR\""),
                "invalid stored scenario gives the error envelope");
    auto project = get(router, std::string("/projects/") + kProjectId + "/compliance");
    expect_true(project.status == 500, "project rollup reports the invalid scenario");
}

void test_stop_with_idle_client() {
    psrisk::ServerConfig config;
    config.host = "127.0.0.1";
    config.port = 0;
    config.workers = 1;
    psrisk::ComplianceServer server(make_router(), config);
    server.start();

    const int idle = connect_local(server.port());
    expect_true(idle >= 0, "idle client connected");
    std::this_thread::sleep_for(std::chrono::milliseconds(100));

    auto stopping = std::async(std::launch::async, [&server]() { server.stop(); });
    const bool stopped = stopping.wait_for(std::chrono::seconds(3)) == std::future_status::ready;
    expect_true(stopped, "stop returns while a client is connected and silent");
    if (idle >= 0) {
        ::close(idle);
    }
    stopping.wait();
    expect_true(!server.running(), "server stopped with idle client");
}

void test_read_timeout_frees_worker() {
    psrisk::ServerConfig config;
    config.host = "127.0.0.1";
    config.port = 0;
    config.workers = 1;
    config.read_timeout_seconds = 0.2;
    psrisk::ComplianceServer server(make_router(), config);
    server.start();

    const int idle = connect_local(server.port());
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    auto reply = std::async(std::launch::async, [&server]() { return fetch(server.port(), "/health"); });
    const bool served = reply.wait_for(std::chrono::seconds(3)) == std::future_status::ready;
    expect_true(served, "silent client is dropped after the read timeout");
    if (idle >= 0) {
        ::close(idle);
    }
    server.stop();
    expect_true(served && contains(reply.get(), "{\"ok\":true}"), "next client served by the freed worker");
}

void test_build_engine() {
    auto settings = std::make_shared<psrisk::EngineSettings>();
    settings->server.enabled = false;
    settings->risk_thresholds.score = psrisk::score_threshold_preset("conservative");
    settings->gap_analysis.non_independent_policy = "discount";

    auto store = std::make_shared<psrisk::InMemoryRecordStore>();
    store->add_project({kProjectId, "Hydrotreater"});
    store->add_analysis({kAnalysisId, kProjectId, "Reactor loop", "approved"});
    auto runtime = psrisk::build_engine(settings, store);

    expect_true(!runtime.server->running(), "disabled server not started");
    expect_true(runtime.scorer().band(41) == psrisk::RiskBand::kHigh, "runtime scorer uses configured bands");
    expect_equal(runtime.analyzer().config().non_independent_policy, "discount", "runtime analyzer configured");
    auto response = get(*runtime.router, std::string("/analyses/") + kAnalysisId + "/compliance");
    expect_true(response.status == 200 && contains(response.body, "\"entryCount\":0"), "wired router serves records");
    auto status = runtime.aggregator->analysis_compliance(kAnalysisId);
    expect_true(status.overall_status == psrisk::ComplianceStatus::kNotAssessed, "no entries is not assessed");
}

}  // namespace

void run_server_tests() {
    test_request_parsing();
    test_routes();
    test_matrix_routes();
    test_socket_round_trip();
    test_invalid_persisted_scenario();
    test_stop_with_idle_client();
    test_read_timeout_frees_worker();
    test_build_engine();
}

}  // namespace psrisk_test
