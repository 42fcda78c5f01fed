#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/stl/filesystem.h>
#include <pybind11/numpy.h>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

#include "musedna/codec.hpp"
#include "musedna/rx/decoder.hpp"
#include "musedna/tx/encoder.hpp"
#include "musedna/utils/sequence.hpp"

namespace py = pybind11;

// Helper function to convert a NumPy array to a float vector
std::vector<float> numpy_to_float_vector(py::array_t<float, py::array::c_style | py::array::forcecast> input) {
    py::buffer_info buf_info = input.request();
    const float* ptr = static_cast<const float*>(buf_info.ptr);
    return std::vector<float>(ptr, ptr + buf_info.size);
}

PYBIND11_MODULE(musedna_codec, m) {
    m.doc() = "DNA <-> audio codec Python bindings";

    py::class_<musedna::CodecConfig>(m, "CodecConfig")
        .def(py::init<>())
        .def_readwrite("sample_rate_hz", &musedna::CodecConfig::sample_rate_hz)
        .def_readwrite("tone_duration_s", &musedna::CodecConfig::tone_duration_s)
        .def_readwrite("volume", &musedna::CodecConfig::volume)
        .def_readwrite("analysis_start_fraction", &musedna::CodecConfig::analysis_start_fraction)
        .def_readwrite("analysis_end_fraction", &musedna::CodecConfig::analysis_end_fraction)
        .def("samples_per_tone", &musedna::CodecConfig::samples_per_tone);

    py::enum_<musedna::tx::EncodeStatus>(m, "EncodeStatus")
        .value("Ok", musedna::tx::EncodeStatus::Ok)
        .value("InputError", musedna::tx::EncodeStatus::InputError)
        .value("WriteError", musedna::tx::EncodeStatus::WriteError);

    py::enum_<musedna::rx::DecodeStatus>(m, "DecodeStatus")
        .value("Ok", musedna::rx::DecodeStatus::Ok)
        .value("AudioLoadError", musedna::rx::DecodeStatus::AudioLoadError)
        .value("HeaderError", musedna::rx::DecodeStatus::HeaderError)
        .value("DecodingFailure", musedna::rx::DecodeStatus::DecodingFailure);

    py::class_<musedna::tx::EncodeResult>(m, "EncodeResult")
        .def(py::init<>())
        .def_readwrite("success", &musedna::tx::EncodeResult::success)
        .def_readwrite("status", &musedna::tx::EncodeResult::status)
        .def_readwrite("failure_reason", &musedna::tx::EncodeResult::failure_reason)
        .def_readwrite("sequence_length", &musedna::tx::EncodeResult::sequence_length)
        .def_readwrite("padding", &musedna::tx::EncodeResult::padding)
        .def_readwrite("block_count", &musedna::tx::EncodeResult::block_count)
        .def_readwrite("symbols", &musedna::tx::EncodeResult::symbols)
        .def_readwrite("samples", &musedna::tx::EncodeResult::samples);

    py::class_<musedna::rx::DecodeResult>(m, "DecodeResult")
        .def(py::init<>())
        .def_readwrite("success", &musedna::rx::DecodeResult::success)
        .def_readwrite("status", &musedna::rx::DecodeResult::status)
        .def_readwrite("failure_reason", &musedna::rx::DecodeResult::failure_reason)
        .def_readwrite("sequence", &musedna::rx::DecodeResult::sequence)
        .def_readwrite("corrected_symbols", &musedna::rx::DecodeResult::corrected_symbols)
        .def_readwrite("failed_block", &musedna::rx::DecodeResult::failed_block)
        .def_readwrite("declared_length", &musedna::rx::DecodeResult::declared_length)
        .def_readwrite("block_count", &musedna::rx::DecodeResult::block_count)
        .def_readwrite("detected_symbols", &musedna::rx::DecodeResult::detected_symbols)
        .def("status_message", &musedna::rx::DecodeResult::status_message);

    py::class_<musedna::tx::Encoder>(m, "Encoder")
        .def(py::init<const musedna::CodecConfig&>(), py::arg("config") = musedna::CodecConfig{})
        .def("encode", [](const musedna::tx::Encoder& self, const std::string& seq) {
            return self.encode(seq);
        })
        .def("encode_to_file", [](const musedna::tx::Encoder& self, const std::string& seq,
                                  const std::filesystem::path& path) {
            return self.encode_to_file(seq, path);
        });

    py::class_<musedna::rx::Decoder>(m, "Decoder")
        .def(py::init<const musedna::CodecConfig&>(), py::arg("config") = musedna::CodecConfig{})
        .def("decode_file", &musedna::rx::Decoder::decode_file)
        .def("decode_samples", [](musedna::rx::Decoder& self,
                                  py::array_t<float, py::array::c_style | py::array::forcecast> samples) {
            auto samples_vec = numpy_to_float_vector(samples);
            return self.decode_samples(std::span<const float>(samples_vec));
        });

    // Convenience functions mirroring the command-line tool
    m.def("encode", [](const std::string& seq, const std::filesystem::path& path) {
        return musedna::encode(seq, path);
    }, "Encode a DNA sequence into a WAV file", py::arg("sequence"), py::arg("output_path"));
    m.def("decode", [](const std::filesystem::path& path) {
        return musedna::decode(path);
    }, "Decode a WAV file into (sequence, status)", py::arg("audio_path"));
    m.def("random_sequence", &musedna::utils::random_sequence,
          "Random ATGC sequence", py::arg("length"), py::arg("seed"));
}
