/**
 * @file value_object.h
 * @brief Base template for immutable value types
 */

#pragma once

#include <utility>

namespace fizzbuzz::domain {

/**
 * @brief Base template class for Value Objects
 *
 * Value Objects are immutable and defined by their value alone.
 * Two Value Objects holding the same value compare equal.
 *
 * Derived types keep their constructor private and expose a checked
 * factory, so an instance always satisfies the derived type's invariant.
 *
 * @tparam T The type of the underlying value
 */
template<typename T>
class ValueObject {
protected:
    T value_;

    explicit ValueObject(T value) : value_(std::move(value)) {}

public:
    // Copyable and movable, never reassignable
    ValueObject(const ValueObject&) = default;
    ValueObject& operator=(const ValueObject&) = delete;
    ValueObject(ValueObject&&) noexcept = default;
    ValueObject& operator=(ValueObject&&) noexcept = delete;

    /**
     * @brief Get the underlying value
     */
    [[nodiscard]] const T& getValue() const noexcept {
        return value_;
    }

    bool operator==(const ValueObject& other) const {
        return value_ == other.value_;
    }

    bool operator!=(const ValueObject& other) const {
        return !(*this == other);
    }

    /**
     * @brief Less than comparison (for use in ordered containers)
     */
    bool operator<(const ValueObject& other) const {
        return value_ < other.value_;
    }
};

} // namespace fizzbuzz::domain
