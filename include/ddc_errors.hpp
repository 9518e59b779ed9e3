#ifndef DDC_ERRORS_HPP
#define DDC_ERRORS_HPP

#include "ddc_types.hpp"
#include <stdexcept>
#include <string>

class DispatchError : public std::runtime_error
{
public:
    explicit DispatchError(const std::string &message)
        : std::runtime_error(message) {}
};

// Malformed coordinates: lat outside [-90,90], lon outside [-180,180], NaN.
class InvalidCoordinateError : public DispatchError
{
public:
    explicit InvalidCoordinateError(const std::string &message)
        : DispatchError(message) {}
};

// Unknown enum values, missing or out-of-range request fields.
class InvalidInputError : public DispatchError
{
public:
    explicit InvalidInputError(const std::string &message)
        : DispatchError(message) {}
};

class EntityNotFoundError : public DispatchError
{
public:
    EntityNotFoundError(const std::string &entity, uint64_t id)
        : DispatchError(entity + " " + std::to_string(id) + " not found"),
          entity_(entity), id_(id) {}

    const std::string &entity() const { return entity_; }
    uint64_t id() const { return id_; }

private:
    std::string entity_;
    uint64_t id_;
};

class InvalidTransitionError : public DispatchError
{
public:
    InvalidTransitionError(uint64_t delivery_id, DeliveryStatus current,
                           DeliveryStatus attempted, const std::string &message)
        : DispatchError(message), delivery_id_(delivery_id),
          current_(current), attempted_(attempted) {}

    uint64_t delivery_id() const { return delivery_id_; }
    DeliveryStatus current() const { return current_; }
    DeliveryStatus attempted() const { return attempted_; }

private:
    uint64_t delivery_id_;
    DeliveryStatus current_;
    DeliveryStatus attempted_;
};

#endif
