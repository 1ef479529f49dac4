#pragma once

#include <cstdint>
#include <string>
#include <hellostate/core/SessionState.h>

namespace hellostate::state
{
    // The module-scoped session. Constructed with the default SessionDefaults
    // on the first call from any thread, never replaced, and destroyed with
    // the other statics at process exit.
    core::SessionState& session();

    // ----------------------------------------------------------
    //  Entry points over session()
    // ----------------------------------------------------------
    void initialize(std::int32_t starting_counter);

    [[nodiscard]] std::int32_t get_counter();
    void increment_counter();

    [[nodiscard]] std::string get_message();
    void set_message(std::string message);

    [[nodiscard]] std::string get_favorite_gum();
    void set_favorite_gum(std::string gum);

    [[nodiscard]] std::string get_favorite_ice_shape();
    void set_favorite_ice_shape(std::string shape);

    [[nodiscard]] double get_decimal();
    void set_decimal(double value);
}
