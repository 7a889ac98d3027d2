#ifndef HOUGH_ML_CORE_CHARGE_TABLE_HPP
#define HOUGH_ML_CORE_CHARGE_TABLE_HPP

#include <cstddef>
#include <shared_mutex>
#include <unordered_map>
#include <utility>
#include <vector>

namespace hough_ml {
namespace core {

/**
 * @brief What chargeFor() does with an id that is not in the table
 */
enum class UnknownChargePolicy {
    kThrow,       // throw LookupError
    kUseDefault   // return the configured default charge
};

/**
 * @brief PDG id to electric charge lookup (units of e)
 *
 * Built from a static table at construction. Runtime registrations override
 * table entries, last write wins. One instance is created per process and
 * handed to its consumers; registration is serialized by an internal lock.
 */
class ChargeTable {
public:
    explicit ChargeTable(UnknownChargePolicy policy = UnknownChargePolicy::kThrow,
                         double default_charge = 0.0);

    /**
     * @brief Charge of a particle type
     *
     * A negative id missing from the table resolves to the negated charge of
     * its positive counterpart.
     *
     * @throws LookupError for unknown ids under UnknownChargePolicy::kThrow
     */
    double chargeFor(int pdg_id) const;

    /**
     * @brief Same as chargeFor() but never throws
     */
    double chargeOr(int pdg_id, double fallback) const;

    bool contains(int pdg_id) const;

    void registerCharge(int pdg_id, double charge);

    /**
     * @brief Runtime registrations in call order
     */
    std::vector<std::pair<int, double>> registrations() const;

    std::size_t size() const;

private:
    bool lookupLocked(int pdg_id, double& charge) const;

    UnknownChargePolicy policy_;
    double default_charge_;

    mutable std::shared_mutex mutex_;
    std::unordered_map<int, double> table_;
    std::vector<std::pair<int, double>> registrations_;
};

} // namespace core
} // namespace hough_ml

#endif // HOUGH_ML_CORE_CHARGE_TABLE_HPP
