#include "hough_ml/core/easing.hpp"
#include "hough_ml/core/errors.hpp"

#include <cmath>
#include <utility>

namespace hough_ml {
namespace core {

namespace {

constexpr double kEndpointTolerance = 1e-9;

void checkEndpoints(const EasingFunction::Function& fn) {
    if (!fn) {
        throw ConfigurationError("easing function is empty");
    }
    const double at_zero = fn(0.0);
    const double at_one = fn(1.0);
    if (!std::isfinite(at_zero) || std::abs(at_zero) > kEndpointTolerance) {
        throw ConfigurationError("easing function must satisfy ease(0) = 0, got " +
                                 std::to_string(at_zero));
    }
    if (!std::isfinite(at_one) || std::abs(at_one - 1.0) > kEndpointTolerance) {
        throw ConfigurationError("easing function must satisfy ease(1) = 1, got " +
                                 std::to_string(at_one));
    }
}

} // anonymous namespace

std::string toString(EasingKind kind) {
    switch (kind) {
        case EasingKind::kLinear:   return "Linear";
        case EasingKind::kInSquare: return "InSquare";
        case EasingKind::kInCubic:  return "InCubic";
        case EasingKind::kInSine:   return "InSine";
        case EasingKind::kInCirc:   return "InCirc";
        case EasingKind::kCustom:   return "Custom";
    }
    return "Unknown";
}

EasingFunction::EasingFunction(EasingKind kind) : kind_(kind) {
    if (kind_ == EasingKind::kCustom) {
        throw ConfigurationError("custom easing requires a function, use EasingFunction::custom");
    }
}

EasingFunction EasingFunction::custom(Function fn) {
    checkEndpoints(fn);
    EasingFunction easing(EasingKind::kLinear);
    easing.kind_ = EasingKind::kCustom;
    easing.fn_ = std::move(fn);
    return easing;
}

double EasingFunction::ease(double x) const {
    // Endpoints are exact for every curve
    if (x <= 0.0) return 0.0;
    if (x >= 1.0) return 1.0;

    switch (kind_) {
        case EasingKind::kLinear:
            return x;
        case EasingKind::kInSquare:
            return x * x;
        case EasingKind::kInCubic:
            return x * x * x;
        case EasingKind::kInSine:
            return 1.0 - std::cos(x * M_PI / 2.0);
        case EasingKind::kInCirc:
            return 1.0 - std::sqrt(1.0 - x * x);
        case EasingKind::kCustom:
            return fn_(x);
    }
    return x;
}

EasingRegistry::EasingRegistry() {
    for (EasingKind kind : {EasingKind::kLinear, EasingKind::kInSquare, EasingKind::kInCubic,
                            EasingKind::kInSine, EasingKind::kInCirc}) {
        easings_.emplace(toString(kind), EasingFunction(kind));
    }
}

void EasingRegistry::registerEasing(const std::string& name, EasingFunction::Function fn) {
    if (name.empty()) {
        throw ConfigurationError("easing name must not be empty");
    }
    if (easings_.count(name) > 0) {
        throw ConfigurationError("easing '" + name + "' is already registered");
    }
    easings_.emplace(name, EasingFunction::custom(std::move(fn)));
}

const EasingFunction& EasingRegistry::get(const std::string& name) const {
    auto it = easings_.find(name);
    if (it == easings_.end()) {
        throw UnknownStrategyError("unknown easing strategy: '" + name + "'");
    }
    return it->second;
}

bool EasingRegistry::contains(const std::string& name) const {
    return easings_.count(name) > 0;
}

std::vector<std::string> EasingRegistry::names() const {
    std::vector<std::string> result;
    result.reserve(easings_.size());
    for (const auto& entry : easings_) {
        result.push_back(entry.first);
    }
    return result;
}

} // namespace core
} // namespace hough_ml
