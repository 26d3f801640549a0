#include "server.hpp"
#include <cmath>
#include <limits>
#include <optional>
#include <stdexcept>
#include <httplib.h>
#include <nlohmann/json.hpp>
#include "errors.hpp"
#include "log.hpp"
#include "query_normalizer.hpp"
#include "util.hpp"

namespace {

constexpr int kHttpOk = 200;
constexpr int kHttpBadRequest = 400;
constexpr int kHttpUnprocessable = 422;
constexpr int kHttpInternalError = 500;

struct SearchRequest {
    std::vector<float> vector;
    int top_k = kDefaultTopK;
};

// Values beyond float range become +/-inf so the non-finite check rejects them.
float to_query_float(double v) {
    if (std::isfinite(v) && std::fabs(v) > std::numeric_limits<float>::max()) {
        return v > 0 ? std::numeric_limits<float>::infinity()
                     : -std::numeric_limits<float>::infinity();
    }
    return static_cast<float>(v);
}

// Numbers, or strings holding a number, as the request schema coerces them.
std::optional<double> number_or_numeric_string(const nlohmann::json& v) {
    if (v.is_number()) return v.get<double>();
    if (v.is_string()) return parse_float_string(v.get<std::string>());
    return std::nullopt;
}

// Throws std::invalid_argument with a client-facing message when the body
// does not match {"vector": [number...], "topK": int}.
SearchRequest parse_search_request(const nlohmann::json& body) {
    if (!body.is_object()) {
        throw std::invalid_argument("request body must be a JSON object");
    }

    SearchRequest req;
    auto vec = body.find("vector");
    if (vec == body.end()) {
        throw std::invalid_argument("Missing required field: vector");
    }
    if (!vec->is_array()) {
        throw std::invalid_argument("vector must be an array of numbers");
    }
    req.vector.reserve(vec->size());
    for (const auto& v : *vec) {
        std::optional<double> value = number_or_numeric_string(v);
        if (!value) {
            throw std::invalid_argument("vector must be an array of numbers");
        }
        req.vector.push_back(to_query_float(*value));
    }

    auto top_k = body.find("topK");
    if (top_k == body.end()) {
        return req;
    }
    double k;
    if (top_k->is_number()) {
        k = top_k->get<double>();
    } else if (top_k->is_string()) {
        std::optional<int64_t> parsed = parse_int_string(top_k->get<std::string>());
        if (!parsed) {
            throw std::invalid_argument("topK must be an integer");
        }
        k = static_cast<double>(*parsed);
    } else {
        throw std::invalid_argument("topK must be an integer");
    }
    if (k != std::floor(k)) {
        throw std::invalid_argument("topK must be an integer");
    }
    if (k < kMinTopK || k > kMaxTopK) {
        throw std::invalid_argument("topK must be between " + std::to_string(kMinTopK) +
                                    " and " + std::to_string(kMaxTopK));
    }
    req.top_k = static_cast<int>(k);
    return req;
}

}  // namespace

Server::Server(std::shared_ptr<const SearchService> service, std::string host, int port)
    : service_(std::move(service)), metrics_(), host_(std::move(host)), port_(port) {}

void Server::send_error(httplib::Response& res, int status, const std::string& code,
                        const std::string& message) const {
    res.status = status;
    nlohmann::json error_response;
    error_response["detail"] = message;
    error_response["error"]["code"] = code;
    error_response["error"]["message"] = message;
    // Messages may quote bytes from the request that are not valid UTF-8.
    res.set_content(error_response.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace),
                    "application/json");
}

void Server::handle_health(const httplib::Request&, httplib::Response& res) {
    res.status = kHttpOk;
    res.set_content(nlohmann::json{{"status", "ok"}}.dump(), "application/json");
}

void Server::handle_stats(const httplib::Request&, httplib::Response& res) {
    nlohmann::json response;
    response["status"] = service_ ? "ready" : "empty";
    response["count"] = service_ ? service_->catalog().size() : 0;
    response["dim"] = service_ ? service_->index().get_dim() : 0;
    response["backend"] = service_ ? service_->index().get_backend_name() : "";
    response["metric"] = "cosine";
    response["searches"] = metrics_.total_searches();
    response["uptime_sec"] = static_cast<int>(metrics_.uptime_sec());
    response["qps_1m"] = metrics_.qps_1m();

    LatencySummary latency = metrics_.latency();
    response["latency_ms"]["p50"] = latency.p50;
    response["latency_ms"]["p95"] = latency.p95;
    response["latency_ms"]["p99"] = latency.p99;

    res.status = kHttpOk;
    res.set_content(response.dump(), "application/json");
}

void Server::handle_search(const httplib::Request& req, httplib::Response& res) {
    if (!service_) {
        send_error(res, kHttpInternalError, "NOT_LOADED", "Index not loaded");
        return;
    }

    SearchRequest search_req;
    try {
        search_req = parse_search_request(nlohmann::json::parse(req.body));
    } catch (const nlohmann::json::parse_error& e) {
        send_error(res, kHttpUnprocessable, "INVALID_JSON",
                   "Failed to parse JSON at byte " + std::to_string(e.byte));
        return;
    } catch (const std::invalid_argument& e) {
        send_error(res, kHttpUnprocessable, "INVALID_REQUEST", e.what());
        return;
    }

    try {
        Timer timer;
        std::vector<SearchResult> results = service_->search(search_req.vector, search_req.top_k);
        double latency = timer.elapsed_ms();
        metrics_.record(latency);

        nlohmann::json response;
        response["results"] = results;
        res.status = kHttpOk;
        res.set_content(response.dump(), "application/json");

        log_query(latency, search_req.top_k, results.size(), service_->catalog().size(),
                  service_->catalog().dim, service_->index().get_backend_name());
    } catch (const QueryError& e) {
        send_error(res, kHttpBadRequest, "INVALID_VECTOR", e.what());
    } catch (const ServerFault& e) {
        LOG_ERROR("Search failed: " + std::string(e.what()));
        send_error(res, kHttpInternalError, "INVALID_METADATA", e.what());
    } catch (const std::exception& e) {
        LOG_ERROR("Search request failed: " + std::string(e.what()));
        send_error(res, kHttpInternalError, "INTERNAL_ERROR", "Internal error: " + std::string(e.what()));
    }
}

bool Server::run() {
    httplib::Server svr;

    svr.Get("/health", [this](const httplib::Request& req, httplib::Response& res) {
        handle_health(req, res);
    });

    svr.Get("/stats", [this](const httplib::Request& req, httplib::Response& res) {
        handle_stats(req, res);
    });

    svr.Post("/search", [this](const httplib::Request& req, httplib::Response& res) {
        handle_search(req, res);
    });

    LOG_INFO("Listening on " + host_ + ":" + std::to_string(port_));
    if (!svr.listen(host_, port_)) {
        LOG_ERROR("Failed to listen on " + host_ + ":" + std::to_string(port_));
        return false;
    }
    return true;
}
