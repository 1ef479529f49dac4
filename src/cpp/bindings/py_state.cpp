#include <pybind11/pybind11.h>
#include <hellostate/core/CrashHook.h>
#include <hellostate/core/Logging.h>
#include <hellostate/core/SessionState.h>
#include <hellostate/state/State.h>

namespace py = pybind11;
using hellostate::core::SessionDefaults;
using hellostate::core::SessionState;

PYBIND11_MODULE(_state_core, m) {
    m.doc() = "Bindings for hellostate's session state.";

    hellostate::core::install_crash_hook();
    hellostate::core::logger()->debug("module _state_core loaded");

    m.attr("DECIMAL_MIN") = hellostate::core::DECIMAL_MIN;
    m.attr("DECIMAL_MAX") = hellostate::core::DECIMAL_MAX;

    // Module-scoped session
    m.def(
        "init",
        []() { hellostate::core::install_crash_hook(); },
        "Install the crash reporter. Already done on import; repeated calls do nothing."
    );
    m.def(
        "wasm_init",
        &hellostate::state::initialize,
        "Set the starting counter value. Call once after importing.",
        py::arg("initial_counter")
    );
    m.def(
        "initialize",
        &hellostate::state::initialize,
        "Overwrite the counter, leaving every other field alone.",
        py::arg("starting_counter")
    );
    m.def("get_counter", &hellostate::state::get_counter, "Return the current counter value.");
    m.def(
        "increment_counter",
        &hellostate::state::increment_counter,
        "Add one to the counter. INT32_MAX wraps to INT32_MIN."
    );
    m.def("get_message", &hellostate::state::get_message, "Return the current message.");
    m.def("set_message", &hellostate::state::set_message, "Replace the message.", py::arg("message"));
    m.def("get_fave_gum", &hellostate::state::get_favorite_gum, "Return the favorite gum.");
    m.def("set_fave_gum", &hellostate::state::set_favorite_gum, "Replace the favorite gum.", py::arg("gum"));
    m.def("get_fave_ice_shape", &hellostate::state::get_favorite_ice_shape, "Return the favorite ice shape.");
    m.def(
        "set_fave_ice_shape",
        &hellostate::state::set_favorite_ice_shape,
        "Replace the favorite ice shape.",
        py::arg("shape")
    );
    m.def("get_decimal", &hellostate::state::get_decimal, "Return the decimal, always within [-10.0, 10.0].");
    m.def(
        "set_decimal",
        &hellostate::state::set_decimal,
        "Store the decimal clamped to [-10.0, 10.0].",
        py::arg("value")
    );

    // Explicit instances
    py::class_<SessionDefaults>(m, "SessionDefaults")
        .def(py::init<>())
        .def_readwrite("counter", &SessionDefaults::counter)
        .def_readwrite("message", &SessionDefaults::message)
        .def_readwrite("favorite_gum", &SessionDefaults::favorite_gum)
        .def_readwrite("favorite_ice_shape", &SessionDefaults::favorite_ice_shape)
        .def_readwrite("decimal", &SessionDefaults::decimal);

    py::class_<SessionState>(m, "SessionState")
        .def(py::init<>())
        .def(py::init<const SessionDefaults&>(), py::arg("defaults"))
        .def("initialize", &SessionState::initialize, py::arg("starting_counter"))
        .def("get_counter", &SessionState::get_counter)
        .def("increment_counter", &SessionState::increment_counter)
        .def("get_message", &SessionState::get_message)
        .def("set_message", &SessionState::set_message, py::arg("message"))
        .def("get_fave_gum", &SessionState::get_favorite_gum)
        .def("set_fave_gum", &SessionState::set_favorite_gum, py::arg("gum"))
        .def("get_fave_ice_shape", &SessionState::get_favorite_ice_shape)
        .def("set_fave_ice_shape", &SessionState::set_favorite_ice_shape, py::arg("shape"))
        .def("get_decimal", &SessionState::get_decimal)
        .def("set_decimal", &SessionState::set_decimal, py::arg("value"));

    m.def("clamp_decimal", &hellostate::core::clamp_decimal, "Clamp a value to [-10.0, 10.0].", py::arg("value"));
}
