#include <hellostate/core/SessionState.h>
#include <hellostate/core/Logging.h>
#include <algorithm>
#include <cmath>
#include <utility>

namespace hellostate::core
{
    double clamp_decimal(const double value)
    {
        if (std::isnan(value)) return DECIMAL_MIN;
        return std::clamp(value, DECIMAL_MIN, DECIMAL_MAX);
    }

    // ----------------------------------------------------------
    //  Session State
    // ----------------------------------------------------------
#pragma region SessionState

    SessionState::SessionState(const SessionDefaults& defaults)
        : counter(defaults.counter),
          message(defaults.message),
          favorite_gum(defaults.favorite_gum),
          favorite_ice_shape(defaults.favorite_ice_shape),
          decimal(clamp_decimal(defaults.decimal))
    {
    }

    void SessionState::initialize(const std::int32_t starting_counter)
    {
        std::lock_guard lock(this->mutex);
        this->counter = starting_counter;
        logger()->debug("counter initialized to {}", starting_counter);
    }

    std::int32_t SessionState::get_counter() const
    {
        std::lock_guard lock(this->mutex);
        return this->counter;
    }

    void SessionState::increment_counter()
    {
        std::lock_guard lock(this->mutex);
        // Unsigned arithmetic wraps; the conversion back is modular since C++20.
        this->counter = static_cast<std::int32_t>(static_cast<std::uint32_t>(this->counter) + 1u);
    }

    std::string SessionState::get_message() const
    {
        std::lock_guard lock(this->mutex);
        return this->message;
    }

    void SessionState::set_message(std::string message)
    {
        std::lock_guard lock(this->mutex);
        this->message = std::move(message);
    }

    std::string SessionState::get_favorite_gum() const
    {
        std::lock_guard lock(this->mutex);
        return this->favorite_gum;
    }

    void SessionState::set_favorite_gum(std::string gum)
    {
        std::lock_guard lock(this->mutex);
        this->favorite_gum = std::move(gum);
    }

    std::string SessionState::get_favorite_ice_shape() const
    {
        std::lock_guard lock(this->mutex);
        return this->favorite_ice_shape;
    }

    void SessionState::set_favorite_ice_shape(std::string shape)
    {
        std::lock_guard lock(this->mutex);
        this->favorite_ice_shape = std::move(shape);
    }

    double SessionState::get_decimal() const
    {
        std::lock_guard lock(this->mutex);
        return this->decimal;
    }

    void SessionState::set_decimal(const double value)
    {
        const double clamped = clamp_decimal(value);
        if (clamped != value) logger()->debug("decimal {} clamped to {}", value, clamped);

        std::lock_guard lock(this->mutex);
        this->decimal = clamped;
    }

#pragma endregion
}
