/**
 * @file reader_bindings.cpp
 * @brief Python bindings for the reader layer
 *
 * Exposes:
 * - OpenError, LookupError, DecodeError, PltxIoError exceptions
 * - Sample, SignalMetadata, StreamMessage: value types
 * - PltxReader: opened file (shared)
 * - SignalCursor: Python iterator over one signal
 */

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/numpy.h>

#include "pltx/core/errors.hpp"
#include "pltx/core/types.hpp"
#include "pltx/data/pltx_reader.hpp"
#include "pltx/data/signal_cursor.hpp"

namespace py = pybind11;

namespace pltx {

namespace {

/// Copy a sample block into two NumPy arrays
py::tuple block_to_numpy(const SampleBlock& block) {
    return py::make_tuple(
        py::array_t<double>(block.timestamps.size(), block.timestamps.data()),
        py::array_t<double>(block.values.size(), block.values.data()));
}

} // namespace

/**
 * @brief Initialize reader layer bindings
 */
void init_reader_bindings(py::module& m) {
    // ========================================================================
    // Exceptions
    // ========================================================================
    py::register_exception<OpenError>(m, "OpenError", PyExc_OSError);
    py::register_exception<LookupError>(m, "LookupError", PyExc_LookupError);
    py::register_exception<DecodeError>(m, "DecodeError", PyExc_ValueError);
    py::register_exception<IoError>(m, "PltxIoError", PyExc_OSError);

    // ========================================================================
    // Value types
    // ========================================================================
    py::class_<Sample>(m, "Sample", "One (timestamp, value) record")
        .def(py::init<>())
        .def(py::init<double, double>(), py::arg("timestamp"), py::arg("value"))
        .def_readonly("timestamp", &Sample::timestamp)
        .def_readonly("value", &Sample::value)
        .def("__eq__", &Sample::operator==)
        .def("__repr__", [](const Sample& s) {
            return "<Sample t=" + std::to_string(s.timestamp) +
                   " v=" + std::to_string(s.value) + ">";
        });

    py::class_<SignalMetadata>(m, "SignalMetadata",
        "Metadata for a signal stored in a PLTX file")

        .def_readonly("signal_id", &SignalMetadata::signal_id)
        .def_readonly("name", &SignalMetadata::name)
        .def_readonly("unit", &SignalMetadata::unit)
        .def_readonly("description", &SignalMetadata::description)
        .def_readonly("source", &SignalMetadata::source)
        .def_readonly("total_samples", &SignalMetadata::total_samples)
        .def_readonly("chunk_count", &SignalMetadata::chunk_count)
        .def_readonly("start_time", &SignalMetadata::start_time)
        .def_readonly("end_time", &SignalMetadata::end_time)
        .def("duration", &SignalMetadata::duration, "Get duration in seconds")
        .def("__repr__", [](const SignalMetadata& meta) {
            return "<SignalMetadata name='" + meta.name + "' samples=" +
                   std::to_string(meta.total_samples) + ">";
        });

    py::class_<StreamMessage>(m, "StreamMessage", "One message of a signal stream")
        .def_readonly("timestamp", &StreamMessage::timestamp)
        .def_readonly("value", &StreamMessage::value)
        .def_readonly("desc", &StreamMessage::desc)
        .def_readonly("seq", &StreamMessage::seq)
        .def_readonly("end_flag", &StreamMessage::end_flag)
        .def("to_dict", [](const StreamMessage& msg) {
            py::dict d;
            d["timestamp"] = msg.timestamp;
            d["value"] = msg.value;
            d["desc"] = msg.desc;
            d["seq"] = msg.seq;
            d["end_flag"] = msg.end_flag;
            return d;
        });

    py::class_<ReaderOptions>(m, "ReaderOptions", "Reader options")
        .def(py::init<>())
        .def_readwrite("use_mmap", &ReaderOptions::use_mmap)
        .def_readwrite("max_chunk_bytes", &ReaderOptions::max_chunk_bytes);

    // ========================================================================
    // SignalCursor
    // ========================================================================
    py::class_<SignalCursor, std::unique_ptr<SignalCursor>>(m, "SignalCursor",
        "Forward-only iterator over one signal")

        .def("__iter__", [](SignalCursor& c) -> SignalCursor& { return c; },
            py::return_value_policy::reference_internal)
        .def("__next__", [](SignalCursor& c) {
            Sample sample;
            CursorState state;
            {
                py::gil_scoped_release release;
                state = c.next(sample);
            }
            if (state == CursorState::ERROR) {
                std::rethrow_exception(c.error());
            }
            if (state == CursorState::END) {
                throw py::stop_iteration();
            }
            return sample;
        })
        .def_property_readonly("seq", &SignalCursor::seq,
            "Number of samples produced so far")
        .def_property_readonly("finished", &SignalCursor::finished)
        .def_property_readonly("signal_name", &SignalCursor::signal_name)
        .def_property_readonly("metadata", &SignalCursor::metadata,
            py::return_value_policy::copy);

    // ========================================================================
    // PltxReader
    // ========================================================================
    py::class_<PltxReader, std::shared_ptr<PltxReader>>(m, "PltxReader",
        "Lazy reader for one PLTX file")

        .def_static("open", &PltxReader::open,
            "Open PLTX file", py::arg("path"), py::arg("options") = ReaderOptions(),
            py::call_guard<py::gil_scoped_release>())

        .def("list_signals", &PltxReader::list_signals,
            "Get all signals in index order")
        .def("get_signal_names", &PltxReader::get_signal_names)
        .def("has_signal", &PltxReader::has_signal, py::arg("name"))
        .def("signal_metadata", &PltxReader::signal_metadata, py::arg("name"),
            py::return_value_policy::copy)

        .def("open_cursor",
            py::overload_cast<const std::string&>(&PltxReader::open_cursor, py::const_),
            "Open a cursor over a signal", py::arg("name"))
        .def("open_cursor",
            py::overload_cast<const std::string&, double, double>(
                &PltxReader::open_cursor, py::const_),
            "Open a cursor restricted to [start_time, end_time]",
            py::arg("name"), py::arg("start_time"), py::arg("end_time"))

        .def("read_signal_all",
            [](const PltxReader& r, const std::string& name) {
                SampleBlock block;
                {
                    py::gil_scoped_release release;
                    block = r.read_signal_all(name);
                }
                return block_to_numpy(block);
            },
            "Load entire signal as (timestamps, values) NumPy arrays",
            py::arg("name"))
        .def("read_time_range",
            [](const PltxReader& r, const std::string& name, double start, double end) {
                SampleBlock block;
                {
                    py::gil_scoped_release release;
                    block = r.read_time_range(name, start, end);
                }
                return block_to_numpy(block);
            },
            "Load samples with start_time <= t <= end_time",
            py::arg("name"), py::arg("start_time"), py::arg("end_time"))

        .def_property_readonly("path", &PltxReader::path)
        .def_property_readonly("display_name", &PltxReader::display_name)
        .def_property_readonly("created", [](const PltxReader& r) { return r.header().created; })
        .def_property_readonly("compression", [](const PltxReader& r) {
            return std::string(format::compression_name(r.header().compression));
        })
        .def("get_file_size", &PltxReader::get_file_size)
        .def("__repr__", [](const PltxReader& r) {
            return "<PltxReader path='" + r.path() + "' signals=" +
                   std::to_string(r.index().signal_count()) + ">";
        });
}

} // namespace pltx
