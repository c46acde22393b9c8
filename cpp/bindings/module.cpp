#include <pybind11/pybind11.h>

namespace py = pybind11;

void bind_errors(py::module_&);
void bind_session(py::module_&);
void bind_image(py::module_&);

PYBIND11_MODULE(xbridge, m) {
    m.doc() = "X11 event routing and shared-memory window capture";
    bind_errors(m);
    bind_image(m);
    bind_session(m);
}
