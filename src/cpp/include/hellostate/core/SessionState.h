#pragma once

#include <cstdint>
#include <mutex>
#include <string>

namespace hellostate::core
{
    constexpr double DECIMAL_MIN = -10.0;
    constexpr double DECIMAL_MAX = 10.0;

    // Constrains a value to [DECIMAL_MIN, DECIMAL_MAX]. NaN maps to DECIMAL_MIN.
    [[nodiscard]] double clamp_decimal(double value);

    // ----------------------------------------------------------
    //  Session State
    // ----------------------------------------------------------

    // Initial values for a fresh session.
    struct SessionDefaults
    {
        std::int32_t counter = 0;
        std::string message = "Rust WASM is so Sigma!";
        std::string favorite_gum = "Hubba Bubba";
        std::string favorite_ice_shape = "Cube";
        double decimal = 0.0;
    };

    // The template record: a counter, three strings and a bounded decimal.
    // Every accessor holds the lock for its whole duration and getters hand
    // back copies, so a SessionState can be shared between threads.
    class SessionState
    {
    public:
        explicit SessionState(const SessionDefaults& defaults = SessionDefaults{});

        SessionState(const SessionState&) = delete;
        SessionState& operator=(const SessionState&) = delete;

        // Overwrites the counter only.
        void initialize(std::int32_t starting_counter);

        [[nodiscard]] std::int32_t get_counter() const;
        // Adds one, wrapping from INT32_MAX to INT32_MIN.
        void increment_counter();

        [[nodiscard]] std::string get_message() const;
        void set_message(std::string message);

        [[nodiscard]] std::string get_favorite_gum() const;
        void set_favorite_gum(std::string gum);

        [[nodiscard]] std::string get_favorite_ice_shape() const;
        void set_favorite_ice_shape(std::string shape);

        [[nodiscard]] double get_decimal() const;
        // Stores clamp_decimal(value).
        void set_decimal(double value);

    private:
        mutable std::mutex mutex;

        std::int32_t counter;
        std::string message;
        std::string favorite_gum;
        std::string favorite_ice_shape;
        double decimal;
    };
}
