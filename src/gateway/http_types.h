#pragma once

/// @file http_types.h
/// @brief Transport-independent HTTP request and response

#include <string>
#include <string_view>
#include <unordered_map>

#include <nlohmann/json.hpp>

namespace supportpulse::gateway {

enum class HttpMethod {
    kGet,
    kPost,
    kOptions
};

struct HttpRequest {
    HttpMethod method = HttpMethod::kGet;
    std::string path;
    std::unordered_map<std::string, std::string> query_params;
    std::unordered_map<std::string, std::string> headers;
    std::string body;
};

struct HttpResponse {
    int status_code = 200;
    std::unordered_map<std::string, std::string> headers;
    std::string body;
    std::string content_type = "application/json";

    static HttpResponse Ok(const nlohmann::json& body) {
        HttpResponse resp;
        resp.status_code = 200;
        resp.body = body.dump();
        return resp;
    }

    static HttpResponse Text(std::string body, std::string content_type = "text/plain") {
        HttpResponse resp;
        resp.status_code = 200;
        resp.body = std::move(body);
        resp.content_type = std::move(content_type);
        return resp;
    }

    /// @brief Error body `{"error_code": ..., "message": ...}`
    static HttpResponse Error(int status_code, std::string_view error_code,
                              std::string_view message) {
        HttpResponse resp;
        resp.status_code = status_code;
        resp.body = nlohmann::json{{"error_code", error_code}, {"message", message}}.dump();
        return resp;
    }

    static HttpResponse BadRequest(std::string_view error_code, std::string_view message) {
        return Error(400, error_code, message);
    }

    static HttpResponse NotFound(std::string_view message = "Not found") {
        return Error(404, "not_found", message);
    }

    static HttpResponse InternalError() {
        return Error(500, "internal_error", "Internal server error");
    }
};

}  // namespace supportpulse::gateway
