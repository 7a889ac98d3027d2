#include "hough_ml/core/charge_table.hpp"
#include "hough_ml/core/errors.hpp"

#include <mutex>
#include <string>

namespace hough_ml {
namespace core {

namespace {

struct ChargeEntry {
    int pdg_id;
    double charge;
};

const ChargeEntry kStaticCharges[] = {
    // Gauge bosons
    {22, 0.0}, {23, 0.0}, {24, 1.0}, {-24, -1.0}, {21, 0.0},

    // Leptons
    {11, -1.0}, {-11, 1.0}, {12, 0.0}, {-12, 0.0},
    {13, -1.0}, {-13, 1.0}, {14, 0.0}, {-14, 0.0},
    {15, -1.0}, {-15, 1.0}, {16, 0.0}, {-16, 0.0},

    // Quarks
    {1, -1.0 / 3.0}, {-1, 1.0 / 3.0}, {2, 2.0 / 3.0}, {-2, -2.0 / 3.0},
    {3, -1.0 / 3.0}, {-3, 1.0 / 3.0}, {4, 2.0 / 3.0}, {-4, -2.0 / 3.0},
    {5, -1.0 / 3.0}, {-5, 1.0 / 3.0}, {6, 2.0 / 3.0}, {-6, -2.0 / 3.0},

    // Light mesons
    {111, 0.0}, {211, 1.0}, {-211, -1.0}, {113, 0.0}, {213, 1.0}, {-213, -1.0},
    {221, 0.0}, {331, 0.0}, {130, 0.0}, {310, 0.0}, {311, 0.0}, {-311, 0.0},
    {321, 1.0}, {-321, -1.0},

    // Charmed mesons
    {411, 1.0}, {-411, -1.0}, {421, 0.0}, {-421, 0.0},

    // Bottom mesons
    {511, 0.0}, {-511, 0.0}, {521, 1.0}, {-521, -1.0},

    // Baryons
    {2212, 1.0}, {-2212, -1.0}, {2112, 0.0}, {-2112, 0.0},
    {3122, 0.0}, {-3122, 0.0}, {3222, 1.0}, {-3222, -1.0},
    {3212, 0.0}, {-3212, 0.0}, {3112, -1.0}, {-3112, 1.0},
    {3312, -1.0}, {-3312, 1.0}, {3322, 0.0}, {-3322, 0.0},
};

} // anonymous namespace

ChargeTable::ChargeTable(UnknownChargePolicy policy, double default_charge)
    : policy_(policy), default_charge_(default_charge) {
    for (const auto& entry : kStaticCharges) {
        table_[entry.pdg_id] = entry.charge;
    }
}

bool ChargeTable::lookupLocked(int pdg_id, double& charge) const {
    auto it = table_.find(pdg_id);
    if (it != table_.end()) {
        charge = it->second;
        return true;
    }

    // Antiparticle of a known particle
    if (pdg_id < 0) {
        it = table_.find(-pdg_id);
        if (it != table_.end()) {
            charge = -it->second;
            return true;
        }
    }
    return false;
}

double ChargeTable::chargeFor(int pdg_id) const {
    double charge = 0.0;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        if (lookupLocked(pdg_id, charge)) {
            return charge;
        }
    }

    if (policy_ == UnknownChargePolicy::kUseDefault) {
        return default_charge_;
    }
    throw LookupError("unknown particle type: " + std::to_string(pdg_id));
}

double ChargeTable::chargeOr(int pdg_id, double fallback) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    double charge = 0.0;
    return lookupLocked(pdg_id, charge) ? charge : fallback;
}

bool ChargeTable::contains(int pdg_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    double charge = 0.0;
    return lookupLocked(pdg_id, charge);
}

void ChargeTable::registerCharge(int pdg_id, double charge) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    table_[pdg_id] = charge;
    registrations_.emplace_back(pdg_id, charge);
}

std::vector<std::pair<int, double>> ChargeTable::registrations() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return registrations_;
}

std::size_t ChargeTable::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return table_.size();
}

} // namespace core
} // namespace hough_ml
