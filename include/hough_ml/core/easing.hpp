#ifndef HOUGH_ML_CORE_EASING_HPP
#define HOUGH_ML_CORE_EASING_HPP

#include <functional>
#include <map>
#include <string>
#include <vector>

namespace hough_ml {
namespace core {

enum class EasingKind {
    kLinear,
    kInSquare,
    kInCubic,
    kInSine,
    kInCirc,
    kCustom
};

std::string toString(EasingKind kind);

/**
 * @brief Monotonic map of [0, 1] onto [0, 1] with fixed endpoints
 *
 * Built-in curves dispatch on the kind; custom curves carry a function.
 */
class EasingFunction {
public:
    using Function = std::function<double(double)>;

    explicit EasingFunction(EasingKind kind = EasingKind::kLinear);

    /**
     * @brief Wrap a user curve
     * @throws ConfigurationError if fn is empty or fn(0) != 0 or fn(1) != 1
     */
    static EasingFunction custom(Function fn);

    /**
     * @brief Evaluate the curve; x is clamped to [0, 1] and the endpoints map exactly
     */
    double ease(double x) const;

    EasingKind kind() const { return kind_; }

private:
    EasingKind kind_;
    Function fn_;
};

/**
 * @brief Name to easing map, pre-filled with the built-in curves
 */
class EasingRegistry {
public:
    EasingRegistry();

    /**
     * @brief Register a custom curve under a new name
     * @throws ConfigurationError on duplicate name or endpoint violation
     */
    void registerEasing(const std::string& name, EasingFunction::Function fn);

    /**
     * @throws UnknownStrategyError if the name was never registered
     */
    const EasingFunction& get(const std::string& name) const;

    bool contains(const std::string& name) const;
    std::vector<std::string> names() const;

private:
    std::map<std::string, EasingFunction> easings_;
};

} // namespace core
} // namespace hough_ml

#endif // HOUGH_ML_CORE_EASING_HPP
