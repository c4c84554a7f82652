#ifndef PSRISK_SERVER_HPP
#define PSRISK_SERVER_HPP

#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "psrisk/compliance.hpp"
#include "psrisk/config.hpp"
#include "psrisk/logging.hpp"
#include "psrisk/matrix.hpp"

namespace psrisk {

struct HttpRequest {
    std::string method;
    std::string path;
    std::map<std::string, std::string> query;
};

struct HttpResponse {
    int status = 200;
    std::string content_type = "application/json";
    std::string body;
    std::vector<std::pair<std::string, std::string>> headers;
};

std::string url_decode(const std::string& value);
std::map<std::string, std::string> parse_query(const std::string& query);
// Parses the request line of a raw HTTP request. Throws ValidationError when it is malformed.
HttpRequest parse_request(const std::string& raw);
std::string reason_phrase(int status);
std::string serialize_response(const HttpResponse& response);

// Throws ValidationError naming the offending query parameter.
RiskMatrixOptions parse_matrix_query(const std::map<std::string, std::string>& query);

// Maps requests onto engine operations and engine errors onto the JSON error envelope.
class RequestRouter {
public:
    RequestRouter(std::shared_ptr<const ComplianceAggregator> aggregator, BandThresholds matrix_thresholds,
                  RasterConfig fonts = RasterConfig{}, Logger logger = get_logger("psrisk.http"));

    HttpResponse handle(const HttpRequest& request) const;

private:
    HttpResponse analysis_compliance(const std::string& id, const HttpRequest& request) const;
    HttpResponse project_compliance(const std::string& id, const HttpRequest& request) const;
    HttpResponse risk_matrix(const HttpRequest& request, bool png) const;
    // subject names the record kind in the forbidden message.
    HttpResponse guarded(const std::function<HttpResponse()>& handler, const std::string& subject) const;

    std::shared_ptr<const ComplianceAggregator> aggregator_;
    BandThresholds matrix_thresholds_;
    RasterConfig fonts_;
    Logger logger_;
};

// Accept loop feeding a fixed pool of worker threads.
class ComplianceServer {
public:
    ComplianceServer(std::shared_ptr<const RequestRouter> router, ServerConfig config,
                     Logger logger = get_logger("psrisk.server"));
    ~ComplianceServer();

    ComplianceServer(const ComplianceServer&) = delete;
    ComplianceServer& operator=(const ComplianceServer&) = delete;

    // Binds and listens before returning. Throws std::runtime_error when the socket cannot be bound.
    void start();
    void stop();
    bool running() const { return running_; }
    // Port actually bound, useful when the configured port is 0.
    int port() const { return bound_port_; }

private:
    void accept_loop();
    void worker_loop();
    void handle_client(int client_fd) const;

    std::shared_ptr<const RequestRouter> router_;
    ServerConfig config_;
    Logger logger_;
    std::atomic<bool> running_{false};
    std::atomic<int> bound_port_{0};
    int server_fd_ = -1;
    std::thread accept_thread_;
    std::vector<std::thread> workers_;
    std::mutex mutex_;
    std::condition_variable ready_;
    std::deque<int> pending_;
    // Connections a worker is serving; stop() shuts them down to unblock reads.
    std::set<int> active_;
};

}  // namespace psrisk

#endif  // PSRISK_SERVER_HPP
