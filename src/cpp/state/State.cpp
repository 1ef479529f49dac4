#include <hellostate/state/State.h>
#include <utility>

namespace hellostate::state
{
    core::SessionState& session()
    {
        static core::SessionState instance;
        return instance;
    }

    void initialize(const std::int32_t starting_counter) { session().initialize(starting_counter); }

    std::int32_t get_counter() { return session().get_counter(); }
    void increment_counter() { session().increment_counter(); }

    std::string get_message() { return session().get_message(); }
    void set_message(std::string message) { session().set_message(std::move(message)); }

    std::string get_favorite_gum() { return session().get_favorite_gum(); }
    void set_favorite_gum(std::string gum) { session().set_favorite_gum(std::move(gum)); }

    std::string get_favorite_ice_shape() { return session().get_favorite_ice_shape(); }
    void set_favorite_ice_shape(std::string shape) { session().set_favorite_ice_shape(std::move(shape)); }

    double get_decimal() { return session().get_decimal(); }
    void set_decimal(const double value) { session().set_decimal(value); }
}
