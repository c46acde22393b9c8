#include <pybind11/pybind11.h>
#include <pybind11/functional.h>
#include <pybind11/stl.h>

#include "Errors.hpp"
#include "ErrorTrap.hpp"
#include "Session.hpp"

namespace py = pybind11;

namespace {

py::object toPython(const nlohmann::json& j) {
    using value_t = nlohmann::json::value_t;
    switch (j.type()) {
        case value_t::boolean:
            return py::bool_(j.get<bool>());
        case value_t::number_integer:
            return py::int_(j.get<std::int64_t>());
        case value_t::number_unsigned:
            return py::int_(j.get<std::uint64_t>());
        case value_t::number_float:
            return py::float_(j.get<double>());
        case value_t::string:
            return py::str(j.get<std::string>());
        case value_t::array: {
            py::list list;
            for (const auto& item : j) {
                list.append(toPython(item));
            }
            return std::move(list);
        }
        case value_t::object: {
            py::dict dict;
            for (const auto& item : j.items()) {
                dict[py::str(item.key())] = toPython(item.value());
            }
            return std::move(dict);
        }
        default:
            return py::none();
    }
}

// Hands each routed signal to a Python callable: router(signal, event_dict)
class PythonRouter : public XBridge::IEventRouter {
public:
    explicit PythonRouter(py::function callback) : m_callback(std::move(callback)) {}

    void route(int, const XBridge::ParsedEvent& event,
               const std::string& signalName, const std::string& parentSignalName) override {
        py::object payload = toPython(XBridge::toJson(event));
        if (!signalName.empty()) {
            m_callback(signalName, payload);
        }
        if (!parentSignalName.empty()) {
            m_callback(parentSignalName, payload);
        }
    }

private:
    py::function m_callback;
};

XBridge::EventHandler wrapHandler(py::function callback) {
    return [callback](const std::string& signal, const XBridge::ParsedEvent& event) {
        callback(signal, toPython(XBridge::toJson(event)));
    };
}

} // namespace

void bind_errors(py::module_& m) {
    py::register_exception<XBridge::XError>(m, "XError");
    py::register_exception<XBridge::ConnectionError>(m, "ConnectionError");
    py::register_exception<XBridge::ExtensionUnavailable>(m, "ExtensionUnavailable");
    py::register_exception<XBridge::UsageError>(m, "UsageError");
}

void bind_session(py::module_& m) {
    using XBridge::Config;
    using XBridge::Session;
    using XBridge::WindowEventRouter;

    py::class_<Config>(m, "Config")
        .def(py::init<>())
        .def_readwrite("display", &Config::displayName)
        .def_readwrite("xshm", &Config::useXShm)
        .def_readwrite("synchronize", &Config::synchronous)
        .def_readwrite("debug_events", &Config::debugEvents)
        .def_readwrite("slow_event_ms", &Config::slowEventMs)
        .def_static("from_environment", &Config::fromEnvironment)
        .def_static("from_json_file", py::overload_cast<const std::string&>(&Config::fromJsonFile), py::arg("path"))
        .def_static("from_json_file", py::overload_cast<const std::string&, const Config&>(&Config::fromJsonFile),
                    py::arg("path"), py::arg("base"))
        .def("to_dict", [](const Config& config) { return toPython(config.toJson()); });

    py::class_<WindowEventRouter>(m, "WindowEventRouter")
        .def("add_receiver", [](WindowEventRouter& router, Window window, py::function callback) {
            return router.addReceiver(window, wrapHandler(std::move(callback)));
        }, py::arg("window"), py::arg("callback"))
        .def("remove_receiver", &WindowEventRouter::removeReceiver, py::arg("window"), py::arg("id"))
        .def("remove_window", &WindowEventRouter::removeWindow, py::arg("window"))
        .def("add_fallback_receiver", [](WindowEventRouter& router, const std::string& signal, py::function callback) {
            return router.addFallbackReceiver(signal, wrapHandler(std::move(callback)));
        }, py::arg("signal"), py::arg("callback"))
        .def("remove_fallback_receiver", &WindowEventRouter::removeFallbackReceiver,
             py::arg("signal"), py::arg("id"))
        .def("receiver_count", &WindowEventRouter::receiverCount, py::arg("window"));

    py::class_<Session>(m, "Session")
        .def(py::init([]() { return std::make_unique<Session>(Config::fromEnvironment()); }))
        .def(py::init<Config>(), py::arg("config"))
        .def("init", &Session::init)
        .def("close", &Session::close)
        .def_property_readonly("initialized", &Session::isInitialized)

        // With a callable, that callable receives every signal of this
        // drain instead of the window router
        .def("drain", [](Session& session, py::object router) {
            if (router.is_none()) {
                return session.drain();
            }
            PythonRouter pythonRouter(router.cast<py::function>());
            session.setRouter(pythonRouter);
            struct Restore {
                Session& session;
                ~Restore() { session.setRouter(session.windowRouter()); }
            } restore{session};
            return session.drain();
        }, py::arg("router") = py::none())

        .def_property_readonly("router", &Session::windowRouter, py::return_value_policy::reference_internal)
        .def("select_input", &Session::selectInput, py::arg("window"), py::arg("event_mask"))
        .def("watch_cursor", &Session::watchCursor)
        .def("fileno", &Session::fileDescriptor)

        .def("get_frame", &Session::getFrame,
             py::arg("window"), py::arg("x"), py::arg("y"), py::arg("width"), py::arg("height"))
        .def("discard_frames", [](Session& session) { session.frames().discardAll(); },
             "Marks every segment stale, call once per damage cycle.")
        .def("close_window", [](Session& session, Window window) { session.frames().closeWindow(window); },
             py::arg("window"))

        .def("intern_atom", [](Session& session, const std::string& name) {
            return session.atoms().intern(name);
        }, py::arg("name"))
        .def("atom_name", [](Session& session, Atom atom) {
            return session.atoms().nameOf(atom);
        }, py::arg("atom"))

        // Raises XError for a protocol error since the previous check
        .def("check_errors", [](Session& session) {
            XBridge::throwIfError(session.context(), session.context().errors().consume());
        })

        .def_property_readonly("extensions", &Session::enabledExtensions)
        .def_property_readonly("xwayland", &Session::isXWayland)
        .def("info", [](const Session& session) { return toPython(session.info()); });
}
