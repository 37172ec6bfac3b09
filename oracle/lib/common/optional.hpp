/*
 * Optional value
 */

#pragma once

#include <utility>

#include "lib/common/oracle_exception.hpp"

namespace fhecredit
{
namespace oracle
{

template <typename T> class Optional
{
public:
    // Construct without a value
    Optional();

    // Construct holding a copy of value
    Optional(const T &value);

    bool has_value() const;
    const T &value() const;

    void reset();

private:
    T value_;
    bool has_value_;
};

template <typename T> Optional<T>::Optional() : value_(), has_value_(false) {}

template <typename T> Optional<T>::Optional(const T &value) : value_(value), has_value_(true) {}

template <typename T> bool Optional<T>::has_value() const { return has_value_; }

template <typename T> const T &Optional<T>::value() const
{
    if (!has_value_)
        THROW_EXCEPTION(kInvalidInput, "Trying to access the value of an empty Optional");

    return value_;
}

template <typename T> void Optional<T>::reset()
{
    value_ = T();
    has_value_ = false;
}

} // namespace oracle
} // namespace fhecredit
