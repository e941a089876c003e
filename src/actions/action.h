#pragma once

/// @file action.h
/// @brief Interface of a post-prediction action

#include <string>

#include <absl/status/status.h>

#include "inference/types.h"

namespace supportpulse::actions {

/// @brief Side effect run after a prediction has been answered
///
/// Actions run on ActionManager workers, never on the request thread.
/// Implementations must be safe to call from several workers at once.
class Action {
public:
    virtual ~Action() = default;

    /// @brief Unique name, used in reports and logs
    virtual std::string Name() const = 0;

    /// @brief Whether the action applies to this prediction
    virtual bool ShouldExecute(const inference::Prediction& prediction) const = 0;

    virtual absl::Status Execute(const inference::Prediction& prediction) = 0;
};

}  // namespace supportpulse::actions
