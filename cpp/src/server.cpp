#include "psrisk/server.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <sstream>
#include <stdexcept>

#include "psrisk/common.hpp"
#include "psrisk/errors.hpp"
#include "psrisk/raster.hpp"
#include "psrisk/serialize.hpp"
#include "psrisk/standards.hpp"

namespace psrisk {

namespace {

constexpr size_t kMaxRequestBytes = 16 * 1024;

HttpResponse json_response(int status, std::string body) {
    HttpResponse response;
    response.status = status;
    response.body = std::move(body);
    return response;
}

HttpResponse error_response(int status, const std::string& code, const std::string& message,
                            const std::vector<FieldError>& errors = {}) {
    return json_response(status, error_body(code, message, errors));
}

bool parse_flag(const std::map<std::string, std::string>& query, const std::string& name, bool fallback) {
    auto it = query.find(name);
    if (it == query.end() || it->second.empty()) {
        return fallback;
    }
    const auto value = to_lower(it->second);
    if (value == "true" || value == "1" || value == "yes") {
        return true;
    }
    if (value == "false" || value == "0" || value == "no") {
        return false;
    }
    throw ValidationError("Invalid value for " + name + ": " + it->second,
                          {{name, "expected true or false, got '" + it->second + "'"}});
}

CellHighlight parse_highlight(const std::string& pair) {
    const auto dash = pair.find('-');
    const auto severity = dash == std::string::npos ? std::string() : trim(pair.substr(0, dash));
    const auto likelihood = dash == std::string::npos ? std::string() : trim(pair.substr(dash + 1));
    auto numeric = [](const std::string& text) {
        return !text.empty() && text.size() <= 3 &&
               std::all_of(text.begin(), text.end(), [](unsigned char ch) { return std::isdigit(ch) != 0; });
    };
    if (!numeric(severity) || !numeric(likelihood)) {
        throw ValidationError("Invalid highlight cell: " + pair,
                              {{"highlight", "expected severity-likelihood pairs such as 4-3, got '" + pair + "'"}});
    }
    return CellHighlight{std::stoi(severity), std::stoi(likelihood)};
}

// Splits "/a/b/c" into {"a", "b", "c"}.
std::vector<std::string> path_segments(const std::string& path) {
    std::vector<std::string> segments;
    for (auto& part : split(path, '/')) {
        if (!part.empty()) {
            segments.push_back(part);
        }
    }
    return segments;
}

bool send_all(int fd, const std::string& data) {
    size_t sent = 0;
    while (sent < data.size()) {
        const ssize_t written = ::send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (written < 0) {
            if (errno == EINTR) {
                continue;
            }
            return false;
        }
        sent += static_cast<size_t>(written);
    }
    return true;
}

}  // namespace

std::string url_decode(const std::string& value) {
    std::string output;
    output.reserve(value.size());
    for (size_t i = 0; i < value.size(); ++i) {
        const char ch = value[i];
        if (ch == '+') {
            output.push_back(' ');
        } else if (ch == '%' && i + 2 < value.size() && std::isxdigit(static_cast<unsigned char>(value[i + 1])) &&
                   std::isxdigit(static_cast<unsigned char>(value[i + 2]))) {
            output.push_back(static_cast<char>(std::stoi(value.substr(i + 1, 2), nullptr, 16)));
            i += 2;
        } else {
            output.push_back(ch);
        }
    }
    return output;
}

std::map<std::string, std::string> parse_query(const std::string& query) {
    std::map<std::string, std::string> params;
    for (const auto& pair : split(query, '&')) {
        if (pair.empty()) {
            continue;
        }
        const auto eq_pos = pair.find('=');
        if (eq_pos == std::string::npos) {
            params[url_decode(pair)] = "";
        } else {
            params[url_decode(pair.substr(0, eq_pos))] = url_decode(pair.substr(eq_pos + 1));
        }
    }
    return params;
}

HttpRequest parse_request(const std::string& raw) {
    const auto first_line_end = raw.find("\r\n");
    const std::string first_line = first_line_end == std::string::npos ? raw : raw.substr(0, first_line_end);
    const auto parts = split(first_line, ' ');
    if (parts.size() < 2 || parts[0].empty() || parts[1].empty() || parts[1].front() != '/') {
        throw ValidationError("Malformed request line", {{"request", "malformed request line"}});
    }
    HttpRequest request;
    request.method = parts[0];
    const auto& target = parts[1];
    const auto question = target.find('?');
    request.path = url_decode(target.substr(0, question));
    if (question != std::string::npos) {
        request.query = parse_query(target.substr(question + 1));
    }
    return request;
}

std::string reason_phrase(int status) {
    switch (status) {
        case 200:
            return "OK";
        case 400:
            return "Bad Request";
        case 403:
            return "Forbidden";
        case 404:
            return "Not Found";
        case 405:
            return "Method Not Allowed";
        case 500:
            return "Internal Server Error";
        default:
            return "Unknown";
    }
}

std::string serialize_response(const HttpResponse& response) {
    std::ostringstream header;
    header << "HTTP/1.1 " << response.status << " " << reason_phrase(response.status) << "\r\n"
           << "Content-Type: " << response.content_type << "\r\n"
           << "Content-Length: " << response.body.size() << "\r\n";
    for (const auto& [name, value] : response.headers) {
        header << name << ": " << value << "\r\n";
    }
    header << "Connection: close\r\n\r\n";
    return header.str() + response.body;
}

RiskMatrixOptions parse_matrix_query(const std::map<std::string, std::string>& query) {
    RiskMatrixOptions options;
    auto it = query.find("size");
    if (it != query.end() && !it->second.empty()) {
        auto size = parse_matrix_size(it->second);
        if (!size.has_value()) {
            throw ValidationError("Invalid size: " + it->second,
                                  {{"size", "expected small, medium or large, got '" + it->second + "'"}});
        }
        options.size = *size;
    }
    it = query.find("title");
    if (it != query.end() && !it->second.empty()) {
        options.title = it->second;
    }
    options.include_labels = parse_flag(query, "labels", true);
    options.include_legend = parse_flag(query, "legend", true);
    options.show_scores = parse_flag(query, "scores", true);
    it = query.find("highlight");
    if (it != query.end()) {
        for (const auto& raw : split(it->second, ',')) {
            const auto pair = trim(raw);
            if (pair.empty()) {
                continue;
            }
            options.highlight_cells.push_back(parse_highlight(pair));
        }
    }
    it = query.find("background");
    if (it != query.end() && !it->second.empty()) {
        options.background_color = it->second.front() == '#' ? it->second : "#" + it->second;
    }
    return options;
}

RequestRouter::RequestRouter(std::shared_ptr<const ComplianceAggregator> aggregator,
                             BandThresholds matrix_thresholds, RasterConfig fonts, Logger logger)
    : aggregator_(std::move(aggregator)),
      matrix_thresholds_(matrix_thresholds),
      fonts_(std::move(fonts)),
      logger_(std::move(logger)) {}

HttpResponse RequestRouter::handle(const HttpRequest& request) const {
    const auto started = std::chrono::steady_clock::now();
    HttpResponse response;
    const auto segments = path_segments(request.path);

    if (request.method != "GET") {
        response = error_response(405, "METHOD_NOT_ALLOWED", "Only GET is supported");
    } else if (segments.size() == 1 && segments[0] == "health") {
        response = json_response(200, "{\"ok\":true}");
    } else if (segments.size() == 3 && segments[0] == "analyses" && segments[2] == "compliance") {
        response = guarded([&]() { return analysis_compliance(segments[1], request); }, "analysis");
    } else if (segments.size() == 3 && segments[0] == "projects" && segments[2] == "compliance") {
        response = guarded([&]() { return project_compliance(segments[1], request); }, "project");
    } else if (segments.size() == 1 && segments[0] == "risk-matrix.png") {
        response = guarded([&]() { return risk_matrix(request, true); }, "risk matrix");
    } else if (segments.size() == 1 && segments[0] == "risk-matrix.svg") {
        response = guarded([&]() { return risk_matrix(request, false); }, "risk matrix");
    } else {
        response = error_response(404, "NOT_FOUND", "Route not found");
    }

    const auto elapsed =
        std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now() - started).count();
    logger_.debug("http_request", {{"method", request.method},
                                   {"path", request.path},
                                   {"status", std::to_string(response.status)},
                                   {"elapsed_us", std::to_string(elapsed)}});
    return response;
}

HttpResponse RequestRouter::guarded(const std::function<HttpResponse()>& handler, const std::string& subject) const {
    try {
        return handler();
    } catch (const ValidationError& exc) {
        return error_response(400, "VALIDATION_ERROR", exc.what(), exc.errors());
    } catch (const NotFoundError& exc) {
        return error_response(404, "NOT_FOUND", exc.what());
    } catch (const ForbiddenError& exc) {
        logger_.warn("access_denied", {{"subject", subject}, {"detail", exc.what()}});
        return error_response(403, "FORBIDDEN", "You do not have access to this " + subject);
    } catch (const ComputationError& exc) {
        logger_.error("computation_failed", {{"subject", subject}, {"detail", exc.what()}});
        return error_response(500, "INTERNAL_ERROR", "Compliance computation failed");
    } catch (const std::exception& exc) {
        logger_.error("request_failed", {{"subject", subject}, {"detail", exc.what()}});
        return error_response(500, "INTERNAL_ERROR", "An unexpected error occurred");
    }
}

HttpResponse RequestRouter::analysis_compliance(const std::string& id, const HttpRequest& request) const {
    auto it = request.query.find("standards");
    const auto standards =
        it == request.query.end() ? std::vector<StandardId>{} : parse_standards_filter(it->second);
    return json_response(200, success_body(aggregator_->analysis_compliance(id, standards)));
}

HttpResponse RequestRouter::project_compliance(const std::string& id, const HttpRequest& request) const {
    auto it = request.query.find("standards");
    const auto standards =
        it == request.query.end() ? std::vector<StandardId>{} : parse_standards_filter(it->second);
    return json_response(200, success_body(aggregator_->project_compliance(id, standards)));
}

HttpResponse RequestRouter::risk_matrix(const HttpRequest& request, bool png) const {
    const auto options = parse_matrix_query(request.query);
    HttpResponse response;
    if (png) {
        const auto image = render_image(options, matrix_thresholds_, fonts_);
        response.content_type = image.mime_type;
        response.body.assign(image.buffer.begin(), image.buffer.end());
        response.headers.emplace_back("Content-Disposition", "attachment; filename=\"" + image.filename + "\"");
    } else {
        auto svg = render_svg(options, matrix_thresholds_);
        response.content_type = "image/svg+xml";
        response.body = std::move(svg.markup);
    }
    return response;
}

ComplianceServer::ComplianceServer(std::shared_ptr<const RequestRouter> router, ServerConfig config, Logger logger)
    : router_(std::move(router)), config_(std::move(config)), logger_(std::move(logger)) {}

ComplianceServer::~ComplianceServer() {
    stop();
}

void ComplianceServer::start() {
    if (running_) {
        return;
    }
    const int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) {
        throw std::runtime_error(std::string("socket failed: ") + std::strerror(errno));
    }

    int opt = 1;
    ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(static_cast<uint16_t>(config_.port));
    if (::inet_pton(AF_INET, config_.host.c_str(), &addr.sin_addr) != 1) {
        ::close(fd);
        throw std::runtime_error("invalid listen address: " + config_.host);
    }
    if (::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        const std::string reason = std::strerror(errno);
        ::close(fd);
        throw std::runtime_error("bind " + config_.host + ":" + std::to_string(config_.port) + " failed: " + reason);
    }
    if (::listen(fd, config_.backlog) < 0) {
        const std::string reason = std::strerror(errno);
        ::close(fd);
        throw std::runtime_error("listen failed: " + reason);
    }

    sockaddr_in bound{};
    socklen_t bound_len = sizeof(bound);
    ::getsockname(fd, reinterpret_cast<sockaddr*>(&bound), &bound_len);
    bound_port_ = ntohs(bound.sin_port);
    server_fd_ = fd;
    running_ = true;

    const int worker_count = config_.workers > 0 ? config_.workers : 1;
    for (int i = 0; i < worker_count; ++i) {
        workers_.emplace_back(&ComplianceServer::worker_loop, this);
    }
    accept_thread_ = std::thread(&ComplianceServer::accept_loop, this);
    logger_.info("server_started", {{"host", config_.host},
                                    {"port", std::to_string(bound_port_.load())},
                                    {"workers", std::to_string(worker_count)}});
}

void ComplianceServer::stop() {
    {
        std::lock_guard<std::mutex> guard(mutex_);
        if (!running_.exchange(false)) {
            return;
        }
        for (int fd : active_) {
            ::shutdown(fd, SHUT_RDWR);
        }
    }
    ready_.notify_all();
    if (server_fd_ >= 0) {
        ::shutdown(server_fd_, SHUT_RDWR);
    }
    if (accept_thread_.joinable()) {
        accept_thread_.join();
    }
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();
    {
        std::lock_guard<std::mutex> guard(mutex_);
        for (int fd : pending_) {
            ::close(fd);
        }
        pending_.clear();
    }
    if (server_fd_ >= 0) {
        ::close(server_fd_);
        server_fd_ = -1;
    }
    logger_.info("server_stopped", {{"port", std::to_string(bound_port_.load())}});
}

void ComplianceServer::accept_loop() {
    while (running_) {
        sockaddr_in client{};
        socklen_t len = sizeof(client);
        const int client_fd = ::accept(server_fd_, reinterpret_cast<sockaddr*>(&client), &len);
        if (client_fd < 0) {
            if (running_ && errno != EINTR) {
                logger_.warn("accept_failed", {{"error", std::strerror(errno)}});
            }
            continue;
        }
        timeval timeout{};
        timeout.tv_sec = static_cast<int>(config_.read_timeout_seconds);
        timeout.tv_usec = static_cast<int>((config_.read_timeout_seconds - timeout.tv_sec) * 1e6);
        if (::setsockopt(client_fd, SOL_SOCKET, SO_RCVTIMEO, &timeout, sizeof(timeout)) != 0) {
            logger_.warn("client_timeout_failed", {{"error", std::strerror(errno)}});
        }
        {
            std::lock_guard<std::mutex> guard(mutex_);
            if (!running_) {
                ::close(client_fd);
                break;
            }
            pending_.push_back(client_fd);
        }
        ready_.notify_one();
    }
}

void ComplianceServer::worker_loop() {
    while (true) {
        int client_fd = -1;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            ready_.wait(lock, [this]() { return !running_ || !pending_.empty(); });
            if (!running_) {
                return;
            }
            client_fd = pending_.front();
            pending_.pop_front();
            active_.insert(client_fd);
        }
        handle_client(client_fd);
        {
            std::lock_guard<std::mutex> guard(mutex_);
            active_.erase(client_fd);
        }
        ::close(client_fd);
    }
}

void ComplianceServer::handle_client(int client_fd) const {
    std::string raw;
    char buffer[2048];
    while (raw.find("\r\n\r\n") == std::string::npos && raw.size() < kMaxRequestBytes) {
        const ssize_t read_bytes = ::recv(client_fd, buffer, sizeof(buffer), 0);
        if (read_bytes < 0 && errno == EINTR) {
            continue;
        }
        if (read_bytes < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            logger_.debug("client_read_timeout", {{"bytes", std::to_string(raw.size())}});
            break;
        }
        if (read_bytes <= 0) {
            break;
        }
        raw.append(buffer, static_cast<size_t>(read_bytes));
    }
    if (raw.empty()) {
        return;
    }

    HttpResponse response;
    try {
        response = router_->handle(parse_request(raw));
    } catch (const ValidationError& exc) {
        response = error_response(400, "VALIDATION_ERROR", exc.what(), exc.errors());
    }
    if (!send_all(client_fd, serialize_response(response))) {
        logger_.warn("response_send_failed", {{"error", std::strerror(errno)}});
    }
}

}  // namespace psrisk
