/// @file ollama_generator.cpp
/// @brief Ollama backend implementation

#include "insights/ollama_generator.h"

#include <absl/strings/str_cat.h>
#include <httplib.h>
#include <nlohmann/json.hpp>

#include "common/error.h"
#include "common/logging.h"

namespace supportpulse::insights {

using json = nlohmann::json;

OllamaTextGenerator::OllamaTextGenerator(OllamaConfig config)
    : config_(std::move(config)) {}

OllamaTextGenerator::~OllamaTextGenerator() = default;

std::string OllamaTextGenerator::Name() const {
    return absl::StrCat("ollama:", config_.model);
}

std::string OllamaTextGenerator::BuildRequestBody(const std::string& prompt) const {
    json body = {
        {"model", config_.model},
        {"prompt", prompt},
        {"stream", false},
        {"options", {
            {"temperature", config_.temperature},
            {"num_predict", config_.num_predict},
        }},
    };
    return body.dump();
}

absl::StatusOr<std::string> OllamaTextGenerator::Generate(const std::string& prompt,
                                                          const CancellationToken& cancel) {
    if (cancel && cancel->load()) {
        return InsightsBackendError("Generation cancelled before the request was sent");
    }

    httplib::Client client(config_.base_url);
    if (!client.is_valid()) {
        return InsightsBackendError(
            absl::StrCat("Invalid insights backend URL: ", config_.base_url));
    }

    const auto seconds = std::chrono::duration_cast<std::chrono::seconds>(config_.timeout);
    const auto micros =
        std::chrono::duration_cast<std::chrono::microseconds>(config_.timeout - seconds);
    client.set_connection_timeout(seconds.count(), micros.count());
    client.set_read_timeout(seconds.count(), micros.count());
    client.set_write_timeout(seconds.count(), micros.count());

    auto result = client.Post("/api/generate", BuildRequestBody(prompt), "application/json");
    if (!result) {
        return InsightsBackendError(absl::StrCat(
            "Insights backend unreachable: ", httplib::to_string(result.error())));
    }
    if (cancel && cancel->load()) {
        return InsightsBackendError("Generation cancelled while waiting for the backend");
    }
    if (result->status != 200) {
        return InsightsBackendError(absl::StrCat(
            "Insights backend returned HTTP ", result->status));
    }

    json reply = json::parse(result->body, nullptr, /*allow_exceptions=*/false);
    if (reply.is_discarded() || !reply.contains("response") || !reply["response"].is_string()) {
        return InsightsBackendError("Insights backend reply has no 'response' text");
    }

    SUPPORTPULSE_LOG_DEBUG("Insights backend returned {} characters",
                           reply["response"].get_ref<const std::string&>().size());
    return reply["response"].get<std::string>();
}

}  // namespace supportpulse::insights
