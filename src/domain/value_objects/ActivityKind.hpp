/**
 * @file ActivityKind.hpp
 * @brief Value Object mapping provider activity types to normalized activity-kind tags.
 */

#pragma once

#include <string>

namespace healthexport::domain {

/**
 * @enum ProviderActivityType
 * @brief Raw activity codes as the provider reports them.
 *
 * The provider's enumeration is open-ended: any integer may arrive, only the
 * codes the export recognizes are named here.
 */
enum class ProviderActivityType : int {
    FunctionalStrengthTraining = 20,
    Running = 37,
    TraditionalStrengthTraining = 50
};

/**
 * @enum ActivityKind
 * @brief Normalized workout / sub-activity kind.
 */
enum class ActivityKind {
    Running,
    StrengthTraining,
    FunctionalStrength,
    Other
};

inline ActivityKind ActivityKindFromProvider(ProviderActivityType type) {
    switch (type) {
        case ProviderActivityType::Running: return ActivityKind::Running;
        case ProviderActivityType::TraditionalStrengthTraining: return ActivityKind::StrengthTraining;
        case ProviderActivityType::FunctionalStrengthTraining: return ActivityKind::FunctionalStrength;
        default: return ActivityKind::Other;
    }
}

inline std::string ActivityKindToTag(ActivityKind kind) {
    switch (kind) {
        case ActivityKind::Running: return "running";
        case ActivityKind::StrengthTraining: return "strength_training";
        case ActivityKind::FunctionalStrength: return "functional_strength";
        case ActivityKind::Other: return "other";
        default: return "other";
    }
}

inline ActivityKind ActivityKindFromTag(const std::string& tag) {
    if (tag == "running") return ActivityKind::Running;
    if (tag == "strength_training") return ActivityKind::StrengthTraining;
    if (tag == "functional_strength") return ActivityKind::FunctionalStrength;
    return ActivityKind::Other;
}

} // namespace healthexport::domain
