#include "pltx/core/version.hpp"
#include <pybind11/pybind11.h>

namespace py = pybind11;

// Forward declarations for binding functions
namespace pltx {
void init_reader_bindings(py::module &m);
void init_service_bindings(py::module &m);
} // namespace pltx

/// Main Python module definition
PYBIND11_MODULE(pltx_stream_cpp, m) {
  m.doc() = "PLTX Stream C++ Core - lazy PLTX reading and per-signal "
            "streaming";

  // Version information
  m.attr("__version__") = pltx::Version::get_version_string();
  m.def("get_version", &pltx::Version::get_version_string,
        "Get library version string");

  // Reader layer (exceptions, PltxReader, SignalCursor)
  pltx::init_reader_bindings(m);

  // Streaming boundary (SignalCatalog, StreamService)
  pltx::init_service_bindings(m);
}
