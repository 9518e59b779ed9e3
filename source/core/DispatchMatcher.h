#ifndef DISPATCHMATCHER_H
#define DISPATCHMATCHER_H

#include "../../include/ddc_types.hpp"
#include "../../include/ddc_config.hpp"
#include "../../include/ddc_errors.hpp"
#include "GeoUtils.h"
#include "VehicleSuitability.h"
#include "DriverRegistry.h"
#include "DeliveryManager.h"
#include <algorithm>
#include <exception>
#include <vector>
#include <iostream>
using namespace std;

struct RankedDriver
{
    uint64_t driver_id;
    double distance_km;
    double average_rating;
    uint32_t total_deliveries;

    RankedDriver() : driver_id(0), distance_km(0), average_rating(0), total_deliveries(0) {}
};

// Picks the nearest suitable driver for a delivery and binds it through the
// DeliveryManager. Ranking works on a registry snapshot; the binding itself
// is the registry's compare-and-swap, so a stale snapshot can only cost a
// retry, never a double booking.
class DispatchMatcher
{
private:
    const DDCConfig &config_;
    const VehicleSuitabilityEvaluator &suitability_;
    DriverRegistry &registry_;
    DeliveryManager &deliveries_;

    bool qualifies(const DeliveryRecord &delivery, const DriverCandidate &candidate) const
    {
        const DriverProfile &driver = candidate.driver;
        if (driver.availability != AvailabilityStatus::AVAILABLE || !candidate.eligible)
            return false;
        if (driver.active_delivery_id != 0 || !driver.has_location)
            return false;
        if (!candidate.has_vehicle)
            return false;
        return suitability_.is_suitable(candidate.vehicle, delivery.type,
                                        delivery.weight_kg, delivery.volume_l);
    }

    static bool ranks_before(const RankedDriver &a, const RankedDriver &b)
    {
        if (a.distance_km != b.distance_km)
            return a.distance_km < b.distance_km;
        if (a.average_rating != b.average_rating)
            return a.average_rating > b.average_rating;
        if (a.total_deliveries != b.total_deliveries)
            return a.total_deliveries < b.total_deliveries;
        return a.driver_id < b.driver_id;
    }

    // Walks the ranking until one reservation sticks. `exclude` is the
    // driver currently holding the delivery, if any.
    uint64_t bind_first(const DeliveryRecord &delivery, uint64_t exclude, bool reassigning)
    {
        vector<RankedDriver> ranking = rank_candidates(delivery, registry_.snapshot());
        for (const auto &ranked : ranking)
        {
            if (ranked.driver_id == exclude)
                continue;

            bool bound = reassigning
                             ? deliveries_.reassign(delivery.delivery_id, ranked.driver_id,
                                                    "assignment timed out", TransitionActor::SYSTEM)
                             : deliveries_.assign(delivery.delivery_id, ranked.driver_id,
                                                  TransitionActor::SYSTEM);
            if (bound)
                return ranked.driver_id;

            if (config_.verbose)
            {
                cout << "[dispatch] Driver " << ranked.driver_id << " was taken, trying next for delivery "
                     << delivery.delivery_id << endl;
            }
        }
        return 0;
    }

public:
    DispatchMatcher(const DDCConfig &config, const VehicleSuitabilityEvaluator &suitability,
                    DriverRegistry &registry, DeliveryManager &deliveries)
        : config_(config), suitability_(suitability), registry_(registry), deliveries_(deliveries) {}

    vector<RankedDriver> rank_candidates(const DeliveryRecord &delivery,
                                         const vector<DriverCandidate> &candidates) const
    {
        vector<RankedDriver> ranking;
        for (const auto &candidate : candidates)
        {
            if (!qualifies(delivery, candidate))
                continue;

            RankedDriver ranked;
            ranked.driver_id = candidate.driver.driver_id;
            ranked.distance_km = GeoUtils::distance_km(candidate.driver.location, delivery.pickup_location);
            ranked.average_rating = candidate.driver.average_rating;
            ranked.total_deliveries = candidate.driver.total_deliveries;
            ranking.push_back(ranked);
        }

        sort(ranking.begin(), ranking.end(), ranks_before);
        return ranking;
    }

    // False when nobody qualifies; the delivery simply stays PENDING.
    bool find_best_driver(const DeliveryRecord &delivery, const vector<DriverCandidate> &candidates,
                          uint64_t &driver_id) const
    {
        vector<RankedDriver> ranking = rank_candidates(delivery, candidates);
        if (ranking.empty())
            return false;

        driver_id = ranking.front().driver_id;
        return true;
    }

    // Returns the bound driver id, or 0 if no candidate could be reserved.
    uint64_t dispatch(uint64_t delivery_id)
    {
        DeliveryRecord delivery;
        if (!deliveries_.get_delivery(delivery_id, delivery))
            throw EntityNotFoundError("Delivery", delivery_id);
        if (delivery.status != DeliveryStatus::PENDING)
        {
            throw InvalidTransitionError(delivery_id, delivery.status, DeliveryStatus::ASSIGNED,
                                         "Delivery " + std::to_string(delivery_id) +
                                             " is not waiting for a driver");
        }

        uint64_t driver_id = bind_first(delivery, 0, false);
        if (driver_id == 0 && config_.verbose)
            cout << "[dispatch] No driver available for delivery " << delivery_id << endl;
        return driver_id;
    }

    size_t run_matching_pass()
    {
        size_t assigned = 0;
        for (const auto &delivery : deliveries_.get_pending_deliveries())
        {
            try
            {
                if (bind_first(delivery, 0, false) != 0)
                    assigned++;
            }
            catch (const exception &e)
            {
                cerr << "[dispatch] Matching failed for delivery " << delivery.delivery_id
                     << ": " << e.what() << endl;
            }
        }

        if (assigned > 0 && config_.verbose)
            cout << "[dispatch] Matching pass assigned " << assigned << " deliveries" << endl;
        return assigned;
    }

    size_t run_reassignment_pass()
    {
        size_t reassigned = 0;
        for (const auto &delivery : deliveries_.get_reassignment_candidates())
        {
            try
            {
                if (bind_first(delivery, delivery.driver_id, true) != 0)
                    reassigned++;
            }
            catch (const exception &e)
            {
                cerr << "[dispatch] Reassignment failed for delivery " << delivery.delivery_id
                     << ": " << e.what() << endl;
            }
        }

        if (reassigned > 0 && config_.verbose)
            cout << "[dispatch] Reassignment pass moved " << reassigned << " deliveries" << endl;
        return reassigned;
    }
};

#endif // DISPATCHMATCHER_H
