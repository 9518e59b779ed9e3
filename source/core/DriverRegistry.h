#ifndef DRIVERREGISTRY_H
#define DRIVERREGISTRY_H

#include "../../include/ddc_types.hpp"
#include "../../include/ddc_errors.hpp"
#include "../../include/ddc_enums.hpp"
#include "Clock.h"
#include "GeoUtils.h"
#include "VehicleSuitability.h"
#include <map>
#include <memory>
#include <mutex>
#include <vector>
#include <algorithm>
#include <iostream>
using namespace std;

// Queryable view of the driver roster. The map is guarded by map_mutex_;
// each driver entry carries its own mutex and is never erased, so pointers
// to entries stay valid for the lifetime of the registry. Availability only
// moves AVAILABLE -> BUSY through try_reserve(), which makes double booking
// impossible.
class DriverRegistry
{
private:
    struct DriverEntry
    {
        mutable mutex entry_mutex;
        DriverProfile profile;
        bool has_vehicle;
        VehicleInfo vehicle;

        DriverEntry() : has_vehicle(false) {}
    };

    const Clock &clock_;
    const VehicleSuitabilityEvaluator &suitability_;

    map<uint64_t, unique_ptr<DriverEntry>> drivers_;
    map<uint64_t, uint64_t> vehicle_owner_;
    uint64_t next_driver_id_;
    uint64_t next_vehicle_id_;
    mutable mutex map_mutex_;

    DriverEntry *find_entry(uint64_t driver_id) const
    {
        lock_guard<mutex> lock(map_mutex_);
        auto it = drivers_.find(driver_id);
        return it == drivers_.end() ? nullptr : it->second.get();
    }

    DriverEntry *find_vehicle_entry(uint64_t vehicle_id) const
    {
        lock_guard<mutex> lock(map_mutex_);
        auto owner = vehicle_owner_.find(vehicle_id);
        if (owner == vehicle_owner_.end())
            return nullptr;
        auto it = drivers_.find(owner->second);
        return it == drivers_.end() ? nullptr : it->second.get();
    }

    vector<DriverEntry *> all_entries() const
    {
        lock_guard<mutex> lock(map_mutex_);
        vector<DriverEntry *> entries;
        entries.reserve(drivers_.size());
        for (const auto &kv : drivers_)
            entries.push_back(kv.second.get());
        return entries;
    }

    bool eligible_locked(const DriverProfile &driver, uint64_t now) const
    {
        return driver.is_active &&
               driver.account_status == DriverAccountStatus::ACTIVE &&
               driver.background_check == BackgroundCheckStatus::APPROVED &&
               driver.license_expiry > now;
    }

public:
    DriverRegistry(const Clock &clock, const VehicleSuitabilityEvaluator &suitability)
        : clock_(clock), suitability_(suitability), next_driver_id_(1),
          next_vehicle_id_(1) {}

    // ========================================================================
    // ROSTER
    // ========================================================================

    uint64_t register_driver(const DriverProfile &profile)
    {
        if (profile.full_name.empty())
            throw InvalidInputError("Driver name is required");
        validate_enum(profile.availability);
        if (profile.availability == AvailabilityStatus::BUSY)
            throw InvalidInputError("A new driver cannot start BUSY");
        if (profile.has_location)
            GeoUtils::validate(profile.location, "driver location");

        unique_ptr<DriverEntry> entry(new DriverEntry());
        entry->profile = profile;
        entry->profile.vehicle_id = 0;
        entry->profile.active_delivery_id = 0;
        entry->profile.created_time = clock_.now();

        lock_guard<mutex> lock(map_mutex_);
        uint64_t driver_id = profile.driver_id;
        if (driver_id == 0)
        {
            driver_id = next_driver_id_;
        }
        else if (drivers_.count(driver_id))
        {
            throw InvalidInputError("Driver " + std::to_string(driver_id) + " already registered");
        }
        next_driver_id_ = max(next_driver_id_, driver_id + 1);

        entry->profile.driver_id = driver_id;
        drivers_[driver_id] = move(entry);
        return driver_id;
    }

    // Binds a vehicle to its owner, replacing the owner's previous vehicle.
    uint64_t register_vehicle(const VehicleInfo &vehicle)
    {
        validate_enum(vehicle.type);
        if (vehicle.capacity_weight_kg < 0 || vehicle.capacity_volume_l < 0)
            throw InvalidInputError("Vehicle capacity must not be negative");

        DriverEntry *entry = find_entry(vehicle.owner_driver_id);
        if (!entry)
            throw EntityNotFoundError("Driver", vehicle.owner_driver_id);

        uint64_t vehicle_id;
        uint64_t replaced = 0;
        {
            lock_guard<mutex> lock(map_mutex_);
            vehicle_id = vehicle.vehicle_id;
            if (vehicle_id == 0)
            {
                vehicle_id = next_vehicle_id_;
            }
            else
            {
                auto owner = vehicle_owner_.find(vehicle_id);
                if (owner != vehicle_owner_.end() && owner->second != vehicle.owner_driver_id)
                    throw InvalidInputError("Vehicle " + std::to_string(vehicle_id) +
                                            " belongs to another driver");
            }
            next_vehicle_id_ = max(next_vehicle_id_, vehicle_id + 1);
            vehicle_owner_[vehicle_id] = vehicle.owner_driver_id;
        }

        {
            lock_guard<mutex> lock(entry->entry_mutex);
            if (entry->has_vehicle && entry->vehicle.vehicle_id != vehicle_id)
                replaced = entry->vehicle.vehicle_id;

            entry->vehicle = vehicle;
            entry->vehicle.vehicle_id = vehicle_id;
            entry->vehicle.created_time = clock_.now();
            suitability_.refresh_status(entry->vehicle);
            entry->has_vehicle = true;
            entry->profile.vehicle_id = vehicle_id;
        }

        if (replaced != 0)
        {
            lock_guard<mutex> lock(map_mutex_);
            vehicle_owner_.erase(replaced);
        }

        return vehicle_id;
    }

    bool get_driver(uint64_t driver_id, DriverProfile &driver) const
    {
        DriverEntry *entry = find_entry(driver_id);
        if (!entry)
            return false;

        lock_guard<mutex> lock(entry->entry_mutex);
        driver = entry->profile;
        return true;
    }

    bool get_vehicle(uint64_t vehicle_id, VehicleInfo &vehicle) const
    {
        DriverEntry *entry = find_vehicle_entry(vehicle_id);
        if (!entry)
            return false;

        lock_guard<mutex> lock(entry->entry_mutex);
        if (!entry->has_vehicle || entry->vehicle.vehicle_id != vehicle_id)
            return false;
        vehicle = entry->vehicle;
        return true;
    }

    size_t driver_count() const
    {
        lock_guard<mutex> lock(map_mutex_);
        return drivers_.size();
    }

    bool is_eligible(const DriverProfile &driver) const
    {
        return eligible_locked(driver, clock_.now());
    }

    // ========================================================================
    // DRIVER STATE
    // ========================================================================

    // Self-service availability changes (going online, on break, offline).
    // BUSY is owned by dispatch and cannot be requested here.
    bool set_availability(uint64_t driver_id, AvailabilityStatus status)
    {
        validate_enum(status);
        if (status == AvailabilityStatus::BUSY)
            throw InvalidInputError("BUSY is set by dispatch only");

        DriverEntry *entry = find_entry(driver_id);
        if (!entry)
            throw EntityNotFoundError("Driver", driver_id);

        lock_guard<mutex> lock(entry->entry_mutex);
        if (entry->profile.active_delivery_id != 0)
            return false;
        if (status == AvailabilityStatus::AVAILABLE && !entry->profile.is_active)
            return false;

        entry->profile.availability = status;
        return true;
    }

    // Returns false when the fix is older than the one already held.
    bool update_location(uint64_t driver_id, const GeoPoint &location, uint64_t timestamp)
    {
        GeoUtils::validate(location, "driver location");

        DriverEntry *entry = find_entry(driver_id);
        if (!entry)
            return false;

        lock_guard<mutex> lock(entry->entry_mutex);
        if (entry->profile.has_location && timestamp < entry->profile.last_location_update)
            return false;

        entry->profile.location = location;
        entry->profile.has_location = 1;
        entry->profile.last_location_update = timestamp;
        return true;
    }

    bool update_eligibility(uint64_t driver_id, BackgroundCheckStatus background,
                            DriverAccountStatus account, uint64_t license_expiry)
    {
        validate_enum(background);
        validate_enum(account);

        DriverEntry *entry = find_entry(driver_id);
        if (!entry)
            return false;

        lock_guard<mutex> lock(entry->entry_mutex);
        entry->profile.background_check = background;
        entry->profile.account_status = account;
        entry->profile.license_expiry = license_expiry;
        return true;
    }

    // Drivers are never removed; a deactivated driver is simply unmatchable.
    bool deactivate_driver(uint64_t driver_id)
    {
        DriverEntry *entry = find_entry(driver_id);
        if (!entry)
            return false;

        lock_guard<mutex> lock(entry->entry_mutex);
        if (entry->profile.active_delivery_id != 0)
            return false;

        entry->profile.is_active = 0;
        entry->profile.availability = AvailabilityStatus::OFFLINE;
        return true;
    }

    // ========================================================================
    // VEHICLE STATE
    // ========================================================================

    bool update_vehicle_compliance(uint64_t vehicle_id, uint64_t insurance_expiry,
                                   uint64_t registration_expiry, uint64_t next_inspection_due,
                                   uint64_t next_maintenance_due)
    {
        DriverEntry *entry = find_vehicle_entry(vehicle_id);
        if (!entry)
            return false;

        lock_guard<mutex> lock(entry->entry_mutex);
        if (!entry->has_vehicle || entry->vehicle.vehicle_id != vehicle_id)
            return false;

        entry->vehicle.insurance_expiry = insurance_expiry;
        entry->vehicle.registration_expiry = registration_expiry;
        entry->vehicle.next_inspection_due = next_inspection_due;
        entry->vehicle.next_maintenance_due = next_maintenance_due;
        suitability_.refresh_status(entry->vehicle);
        return true;
    }

    bool set_vehicle_status(uint64_t vehicle_id, VehicleStatus status, bool verified)
    {
        validate_enum(status);

        DriverEntry *entry = find_vehicle_entry(vehicle_id);
        if (!entry)
            return false;

        lock_guard<mutex> lock(entry->entry_mutex);
        if (!entry->has_vehicle || entry->vehicle.vehicle_id != vehicle_id)
            return false;

        entry->vehicle.status = status;
        entry->vehicle.is_verified = verified ? 1 : 0;
        if (status == VehicleStatus::ACTIVE)
            suitability_.refresh_status(entry->vehicle);
        return true;
    }

    // ========================================================================
    // DISPATCH BINDING
    // ========================================================================

    // Compare-and-swap on availability: only an AVAILABLE, eligible, unbound
    // driver moves to BUSY. Any other observed state fails the reservation.
    bool try_reserve(uint64_t driver_id, uint64_t delivery_id, uint64_t &vehicle_id)
    {
        DriverEntry *entry = find_entry(driver_id);
        if (!entry)
            return false;

        lock_guard<mutex> lock(entry->entry_mutex);
        DriverProfile &driver = entry->profile;
        if (driver.availability != AvailabilityStatus::AVAILABLE ||
            driver.active_delivery_id != 0 ||
            !eligible_locked(driver, clock_.now()))
        {
            return false;
        }

        driver.availability = AvailabilityStatus::BUSY;
        driver.active_delivery_id = delivery_id;
        vehicle_id = entry->has_vehicle ? entry->vehicle.vehicle_id : 0;
        return true;
    }

    // Releases the driver only if it is still bound to `delivery_id`.
    bool release(uint64_t driver_id, uint64_t delivery_id)
    {
        DriverEntry *entry = find_entry(driver_id);
        if (!entry)
            return false;

        lock_guard<mutex> lock(entry->entry_mutex);
        DriverProfile &driver = entry->profile;
        if (driver.active_delivery_id != delivery_id)
            return false;

        driver.active_delivery_id = 0;
        driver.availability = driver.is_active ? AvailabilityStatus::AVAILABLE
                                               : AvailabilityStatus::OFFLINE;
        return true;
    }

    bool record_delivery_outcome(uint64_t driver_id, bool successful, double earnings)
    {
        DriverEntry *entry = find_entry(driver_id);
        if (!entry)
            return false;

        lock_guard<mutex> lock(entry->entry_mutex);
        entry->profile.total_deliveries++;
        if (successful)
            entry->profile.successful_deliveries++;
        if (earnings > 0)
            entry->profile.total_earnings += earnings;
        return true;
    }

    bool apply_rating(uint64_t driver_id, int score)
    {
        DriverEntry *entry = find_entry(driver_id);
        if (!entry)
            return false;

        lock_guard<mutex> lock(entry->entry_mutex);
        DriverProfile &driver = entry->profile;
        double total = driver.average_rating * driver.rating_count + score;
        driver.rating_count++;
        driver.average_rating = total / driver.rating_count;
        return true;
    }

    // ========================================================================
    // QUERIES
    // ========================================================================

    // Point-in-time copy for the matcher; each entry is copied under its own
    // lock, so the result may be slightly stale across drivers.
    vector<DriverCandidate> snapshot() const
    {
        uint64_t now = clock_.now();
        vector<DriverCandidate> candidates;

        for (DriverEntry *entry : all_entries())
        {
            DriverCandidate candidate;
            {
                lock_guard<mutex> lock(entry->entry_mutex);
                candidate.driver = entry->profile;
                candidate.has_vehicle = entry->has_vehicle ? 1 : 0;
                if (entry->has_vehicle)
                    candidate.vehicle = entry->vehicle;
            }
            candidate.eligible = eligible_locked(candidate.driver, now) ? 1 : 0;
            candidates.push_back(candidate);
        }

        return candidates;
    }

    vector<DriverProfile> find_available_near(const GeoPoint &center, double radius_km) const
    {
        GeoUtils::validate(center, "search center");

        vector<pair<double, DriverProfile>> found;
        for (const auto &candidate : snapshot())
        {
            const DriverProfile &driver = candidate.driver;
            if (driver.availability != AvailabilityStatus::AVAILABLE || !candidate.eligible ||
                !driver.has_location || driver.active_delivery_id != 0)
                continue;

            double distance = GeoUtils::distance_km(driver.location, center);
            if (distance <= radius_km)
                found.push_back(make_pair(distance, driver));
        }

        sort(found.begin(), found.end(),
             [](const pair<double, DriverProfile> &a, const pair<double, DriverProfile> &b)
             { return a.first < b.first; });

        vector<DriverProfile> result;
        for (const auto &item : found)
            result.push_back(item.second);
        return result;
    }

    // License, insurance or registration lapsing within `days_ahead` days.
    vector<DriverProfile> get_drivers_with_expiring_documents(int days_ahead) const
    {
        uint64_t now = clock_.now();
        uint64_t horizon = now + static_cast<uint64_t>(days_ahead) * 86400ULL;

        auto expiring = [horizon](uint64_t date)
        { return date != 0 && date <= horizon; };

        vector<DriverProfile> result;
        for (const auto &candidate : snapshot())
        {
            bool flagged = expiring(candidate.driver.license_expiry);
            if (candidate.has_vehicle)
            {
                flagged = flagged || expiring(candidate.vehicle.insurance_expiry) ||
                          expiring(candidate.vehicle.registration_expiry);
            }
            if (flagged && candidate.driver.is_active)
                result.push_back(candidate.driver);
        }
        return result;
    }
};

#endif // DRIVERREGISTRY_H
