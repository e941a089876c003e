#include "registry/scoring_unit.h"

namespace supportpulse::registry {

std::string_view CapabilityName(Capability capability) {
    switch (capability) {
        case Capability::kIntent: return "intent";
        case Capability::kSentiment: return "sentiment";
        case Capability::kResponseTemplate: return "response_template";
    }
    return "intent";
}

std::optional<Capability> ParseCapability(std::string_view name) {
    for (Capability capability : kAllCapabilities) {
        if (CapabilityName(capability) == name) {
            return capability;
        }
    }
    return std::nullopt;
}

}  // namespace supportpulse::registry
