#ifndef HOUGH_ML_CORE_ERRORS_HPP
#define HOUGH_ML_CORE_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace hough_ml {
namespace core {

/**
 * @brief Malformed input data (empty or non-finite accumulator grid, bad histogram name)
 */
class InvalidInputError : public std::invalid_argument {
public:
    explicit InvalidInputError(const std::string& what)
        : std::invalid_argument(what) {}
};

/**
 * @brief Invalid parameter combination detected at entry of an operation
 */
class ConfigurationError : public std::invalid_argument {
public:
    explicit ConfigurationError(const std::string& what)
        : std::invalid_argument(what) {}
};

/**
 * @brief Easing strategy name not present in the registry
 */
class UnknownStrategyError : public std::out_of_range {
public:
    explicit UnknownStrategyError(const std::string& what)
        : std::out_of_range(what) {}
};

/**
 * @brief PDG id without a known charge and no default configured
 */
class LookupError : public std::out_of_range {
public:
    explicit LookupError(const std::string& what)
        : std::out_of_range(what) {}
};

} // namespace core
} // namespace hough_ml

#endif // HOUGH_ML_CORE_ERRORS_HPP
