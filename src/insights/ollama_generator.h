#pragma once

/// @file ollama_generator.h
/// @brief Text generation through an Ollama-compatible /api/generate endpoint

#include <chrono>
#include <memory>
#include <string>

#include "insights/text_generator.h"

namespace supportpulse::insights {

struct OllamaConfig {
    std::string base_url = "http://localhost:11434";
    std::string model = "llama3.2:1b";
    double temperature = 0.7;
    int num_predict = 800;
    std::chrono::milliseconds timeout{5000};
};

/// @brief Non-streaming client of POST /api/generate
class OllamaTextGenerator : public TextGenerator {
public:
    explicit OllamaTextGenerator(OllamaConfig config);
    ~OllamaTextGenerator() override;

    absl::StatusOr<std::string> Generate(const std::string& prompt,
                                         const CancellationToken& cancel) override;

    std::string Name() const override;

    /// @brief Request body sent for a prompt
    std::string BuildRequestBody(const std::string& prompt) const;

private:
    OllamaConfig config_;
};

}  // namespace supportpulse::insights
