/**
 * @file service_bindings.cpp
 * @brief Python bindings for the streaming boundary
 *
 * Exposes:
 * - OpenFileResult, ReaderSummary, StreamResult
 * - SignalCatalog: public name registry (read-only view)
 * - StreamService: open files and stream signals into Python callbacks
 */

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/functional.h>

#include <iostream>

#include "pltx/core/signal_catalog.hpp"
#include "pltx/core/stream_service.hpp"
#include "pltx/core/stream_sink.hpp"
#include "pltx/core/streaming_session.hpp"

namespace py = pybind11;

namespace pltx {

namespace {

/**
 * @brief Sink forwarding messages to Python callables
 *
 * Called with the GIL released; every callback re-acquires it. A Python
 * exception raised by on_message stops the stream.
 */
class PythonSink : public IStreamSink {
public:
    PythonSink(py::function on_message, py::object on_error)
        : on_message_(std::move(on_message))
        , on_error_(std::move(on_error)) {}

    bool send(const StreamMessage& message) override {
        py::gil_scoped_acquire acquire;
        try {
            on_message_(message);
        } catch (py::error_already_set& e) {
            std::cerr << "[Stream] Python callback raised: " << e.what() << std::endl;
            return false;
        }
        return true;
    }

    void fail(const std::string& reason) override {
        py::gil_scoped_acquire acquire;
        if (on_error_.is_none()) {
            return;
        }
        // close() still has to run after a raising error callback
        try {
            on_error_(reason);
        } catch (py::error_already_set& e) {
            std::cerr << "[Stream] Python error callback raised: " << e.what() << std::endl;
        }
    }

    void close() override {}

private:
    py::function on_message_;
    py::object on_error_;
};

} // namespace

/**
 * @brief Initialize streaming boundary bindings
 */
void init_service_bindings(py::module& m) {
    // ========================================================================
    // Result types
    // ========================================================================
    py::class_<OpenFileResult>(m, "OpenFileResult", "Reply to an open-file request")
        .def_readonly("reader_id", &OpenFileResult::reader_id)
        .def_readonly("name", &OpenFileResult::name)
        .def_readonly("path", &OpenFileResult::path)
        .def_readonly("source", &OpenFileResult::source)
        .def_readonly("headers", &OpenFileResult::headers)
        .def_readonly("tags", &OpenFileResult::tags)
        .def_readonly("created", &OpenFileResult::created);

    py::class_<ReaderSummary>(m, "ReaderSummary")
        .def_readonly("reader_id", &ReaderSummary::reader_id)
        .def_readonly("path", &ReaderSummary::path)
        .def_readonly("signals_count", &ReaderSummary::signals_count)
        .def_readonly("headers", &ReaderSummary::headers);

    py::enum_<StreamStatus>(m, "StreamStatus")
        .value("COMPLETED", StreamStatus::COMPLETED)
        .value("FAILED", StreamStatus::FAILED)
        .value("CANCELLED", StreamStatus::CANCELLED)
        .export_values();

    py::class_<StreamResult>(m, "StreamResult", "Outcome of one stream")
        .def_readonly("status", &StreamResult::status)
        .def_readonly("messages_sent", &StreamResult::messages_sent)
        .def_readonly("samples_sent", &StreamResult::samples_sent)
        .def_readonly("error", &StreamResult::error);

    // ========================================================================
    // SignalCatalog
    // ========================================================================
    py::class_<SignalCatalog>(m, "SignalCatalog", "Public signal name registry")
        .def("contains", &SignalCatalog::contains, py::arg("public_name"))
        .def("public_names", &SignalCatalog::public_names)
        .def("resolve", [](const SignalCatalog& c, const std::string& name) {
            CatalogEntry entry = c.resolve(name);
            return py::make_tuple(entry.reader_id, entry.internal_name);
        }, "Resolve a public name to (reader_id, internal_name)", py::arg("public_name"))
        .def("__len__", &SignalCatalog::size)
        .def("__contains__", &SignalCatalog::contains);

    // ========================================================================
    // StreamService
    // ========================================================================
    py::class_<StreamService>(m, "StreamService", "Open PLTX files and stream signals")
        .def(py::init([](const ReaderOptions& reader) {
            ServiceOptions options;
            options.reader = reader;
            return std::make_unique<StreamService>(options);
        }), py::arg("reader_options") = ReaderOptions())

        .def("open_file",
            py::overload_cast<const std::string&, const std::string&>(&StreamService::open_file),
            "Open a PLTX file and expose its signals",
            py::arg("path"), py::arg("mode") = std::string(constants::OFFLINE_MODE),
            py::call_guard<py::gil_scoped_release>())
        .def("close_file", &StreamService::close_file, py::arg("reader_id"))
        .def("list_readers", &StreamService::list_readers)
        .def("reader_headers", &StreamService::reader_headers, py::arg("reader_id"))

        .def("stream",
            [](StreamService& self, const std::string& name,
               py::function on_message, py::object on_error) {
                PythonSink sink(std::move(on_message), std::move(on_error));
                py::gil_scoped_release release;
                return self.stream(name, sink);
            },
            "Stream one signal into on_message(StreamMessage); on_error(str) on failure",
            py::arg("public_name"), py::arg("on_message"), py::arg("on_error") = py::none())

        .def_property_readonly("catalog",
            py::overload_cast<>(&StreamService::catalog, py::const_),
            py::return_value_policy::reference_internal);
}

} // namespace pltx
