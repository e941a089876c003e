#pragma once

/// @file text_generator.h
/// @brief Interface of an external text-generation backend

#include <atomic>
#include <memory>
#include <string>

#include <absl/status/statusor.h>

namespace supportpulse::insights {

/// @brief Set to true when the caller stops waiting for a result
using CancellationToken = std::shared_ptr<std::atomic<bool>>;

inline CancellationToken MakeCancellationToken() {
    return std::make_shared<std::atomic<bool>>(false);
}

/// @brief Abstract text-generation backend
class TextGenerator {
public:
    virtual ~TextGenerator() = default;

    /// @brief Complete a prompt
    /// @param cancel Checked by implementations that can stop early; a
    ///        result produced after cancellation is discarded by the caller
    virtual absl::StatusOr<std::string> Generate(const std::string& prompt,
                                                 const CancellationToken& cancel) = 0;

    virtual std::string Name() const = 0;
};

}  // namespace supportpulse::insights
