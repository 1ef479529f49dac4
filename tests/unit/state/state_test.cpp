#include <catch2/catch.hpp>
#include <hellostate/state/State.h>
#include <string>

namespace state = hellostate::state;

TEST_CASE("module session is a single instance", "[unit][state]") {
  auto &first = state::session();
  auto &second = state::session();
  CHECK(&first == &second);

  state::set_message("through free function");
  CHECK(first.get_message() == "through free function");

  first.set_favorite_gum("through reference");
  CHECK(state::get_favorite_gum() == "through reference");
}

TEST_CASE("module entry points forward to the session", "[unit][state]") {
  SECTION("initialize then increment") {
    state::initialize(5);
    state::increment_counter();
    state::increment_counter();
    state::increment_counter();
    CHECK(state::get_counter() == 8);
  }

  SECTION("initialize leaves strings alone") {
    state::set_favorite_ice_shape("Pyramid");
    state::initialize(-3);
    CHECK(state::get_counter() == -3);
    CHECK(state::get_favorite_ice_shape() == "Pyramid");
  }

  SECTION("string round trips") {
    const std::string text = "Sigma \xE2\x9C\x93";
    state::set_message(text);
    state::set_favorite_gum(text + " gum");
    state::set_favorite_ice_shape(text + " shape");
    CHECK(state::get_message() == text);
    CHECK(state::get_favorite_gum() == text + " gum");
    CHECK(state::get_favorite_ice_shape() == text + " shape");
  }

  SECTION("decimal clamp") {
    state::set_decimal(4.5);
    CHECK(state::get_decimal() == 4.5);
    state::set_decimal(-10.0001);
    CHECK(state::get_decimal() == -10.0);
    state::set_decimal(10.0001);
    CHECK(state::get_decimal() == 10.0);
    state::set_decimal(10.0);
    CHECK(state::get_decimal() == 10.0);
  }
}
