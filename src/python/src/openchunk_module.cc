#include "openchunk/build_info.h"
#include "openchunk/build_info_generated.h"
#include "openchunk/chunk.h"
#include "openchunk/console_format.h"
#include "openchunk/type_tag.h"

#include <nanobind/nanobind.h>
#include <nanobind/operators.h>
#include <nanobind/stl/pair.h>
#include <nanobind/stl/string.h>

#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace nb = nanobind;
using namespace nb::literals;

namespace openchunk {
namespace {

    static nb::str sv_to_py(std::string_view s)
    {
        return nb::str(s.data(), s.size());
    }


    static std::span<const std::byte> py_bytes_span(const nb::bytes& data)
    {
        return std::span<const std::byte>(
            reinterpret_cast<const std::byte*>(data.data()), data.size());
    }


    static nb::bytes bytes_to_py(std::span<const std::byte> bytes)
    {
        return nb::bytes(reinterpret_cast<const char*>(bytes.data()),
                         bytes.size());
    }


    static std::pair<std::string, std::string> info_lines()
    {
        std::string line1;
        std::string line2;
        format_build_info_lines(&line1, &line2);
        return { std::move(line1), std::move(line2) };
    }


    static TypeTag require_tag(const TypeTagResult& res,
                               std::optional<TypeTag>* tag)
    {
        if (res.status != TypeTagStatus::Ok || !*tag) {
            std::string msg("invalid chunk type tag: ");
            msg.append(type_tag_status_name(res.status));
            if (res.status == TypeTagStatus::InvalidByte) {
                msg.append(" at byte ");
                msg.append(std::to_string(res.offset));
            }
            throw std::invalid_argument(msg);
        }
        return **tag;
    }


    static TypeTag tag_from_bytes(nb::bytes data)
    {
        std::optional<TypeTag> tag;
        const TypeTagResult res = TypeTag::from_bytes(py_bytes_span(data), &tag);
        return require_tag(res, &tag);
    }


    static TypeTag tag_from_string(const std::string& text)
    {
        std::optional<TypeTag> tag;
        const TypeTagResult res = TypeTag::from_string(text, &tag);
        return require_tag(res, &tag);
    }


    static std::pair<ChunkParseResult, nb::object>
    parse_chunk_py(nb::bytes data, uint32_t max_payload_bytes)
    {
        ChunkDecodeOptions options;
        options.limits.max_payload_bytes = max_payload_bytes;

        const std::span<const std::byte> bytes = py_bytes_span(data);
        std::optional<Chunk> chunk;
        ChunkParseResult res;
        {
            nb::gil_scoped_release gil_release;
            res = parse_chunk(bytes, &chunk, options);
        }
        if (!chunk) {
            return { res, nb::none() };
        }
        return { res, nb::cast(std::move(*chunk)) };
    }

}  // namespace
}  // namespace openchunk


NB_MODULE(_openchunk, m)
{
    using namespace openchunk;

    m.doc()               = "OpenChunk chunk codec bindings (nanobind).";
    m.attr("__version__") = OPENCHUNK_VERSION_STRING;

    nb::enum_<TypeTagStatus>(m, "TypeTagStatus")
        .value("Ok", TypeTagStatus::Ok)
        .value("WrongLength", TypeTagStatus::WrongLength)
        .value("InvalidByte", TypeTagStatus::InvalidByte);

    nb::enum_<ChunkStatus>(m, "ChunkStatus")
        .value("Ok", ChunkStatus::Ok)
        .value("Truncated", ChunkStatus::Truncated)
        .value("InvalidTag", ChunkStatus::InvalidTag)
        .value("ChecksumMismatch", ChunkStatus::ChecksumMismatch)
        .value("LimitExceeded", ChunkStatus::LimitExceeded);

    nb::enum_<ChunkWriteStatus>(m, "ChunkWriteStatus")
        .value("Ok", ChunkWriteStatus::Ok)
        .value("OutputTruncated", ChunkWriteStatus::OutputTruncated)
        .value("PayloadTooLarge", ChunkWriteStatus::PayloadTooLarge);

    nb::class_<ChunkParseResult>(m, "ChunkParseResult")
        .def_ro("status", &ChunkParseResult::status)
        .def_ro("consumed", &ChunkParseResult::consumed)
        .def_ro("needed", &ChunkParseResult::needed)
        .def_ro("tag_status", &ChunkParseResult::tag_status)
        .def_ro("tag_offset", &ChunkParseResult::tag_offset)
        .def_ro("stored_crc", &ChunkParseResult::stored_crc)
        .def_ro("computed_crc", &ChunkParseResult::computed_crc);

    nb::class_<TypeTag>(m, "TypeTag")
        .def_static("from_bytes", &tag_from_bytes, "data"_a)
        .def_static("from_string", &tag_from_string, "text"_a)
        .def("bytes",
             [](const TypeTag& t) {
                 const std::array<std::byte, kTypeTagSize> b = t.bytes();
                 return bytes_to_py(b);
             })
        .def_prop_ro("fourcc", &TypeTag::fourcc)
        .def_prop_ro("is_critical", &TypeTag::is_critical)
        .def_prop_ro("is_public", &TypeTag::is_public)
        .def_prop_ro("is_reserved_bit_valid", &TypeTag::is_reserved_bit_valid)
        .def_prop_ro("is_valid", &TypeTag::is_valid)
        .def_prop_ro("is_safe_to_copy", &TypeTag::is_safe_to_copy)
        .def("__str__", &TypeTag::to_string)
        .def("__repr__",
             [](const TypeTag& t) {
                 return std::string("TypeTag('") + t.to_string() + "')";
             })
        .def(nb::self == nb::self)
        .def(nb::self != nb::self)
        .def("__hash__", &TypeTag::fourcc);

    nb::class_<Chunk>(m, "Chunk")
        .def(
            "__init__",
            [](Chunk* self, const TypeTag& tag, nb::bytes payload) {
                const std::span<const std::byte> p = py_bytes_span(payload);
                new (self) Chunk(tag, std::vector<std::byte>(p.begin(),
                                                             p.end()));
            },
            "tag"_a, "payload"_a)
        .def_prop_ro("length", &Chunk::length)
        .def_prop_ro("chunk_type", &Chunk::chunk_type)
        .def_prop_ro("crc", &Chunk::crc)
        .def("data", [](const Chunk& c) { return bytes_to_py(c.data()); })
        .def("data_as_string", &Chunk::data_as_string)
        .def("as_bytes",
             [](const Chunk& c) {
                 const std::vector<std::byte> out = c.as_bytes();
                 return bytes_to_py(out);
             })
        .def("serialize",
             [](const Chunk& c) {
                 const std::vector<std::byte> out = c.serialize();
                 return bytes_to_py(out);
             })
        .def("__str__", &Chunk::data_as_string)
        .def(nb::self == nb::self)
        .def(nb::self != nb::self);

    m.def("parse_chunk", &parse_chunk_py, "data"_a,
          "max_payload_bytes"_a = 0U);

    m.def(
        "console_text",
        [](nb::bytes data, uint32_t max_bytes) {
            std::string out;
            const bool escaped = append_console_escaped(py_bytes_span(data),
                                                        max_bytes, &out);
            return std::make_pair(std::move(out), escaped);
        },
        "data"_a, "max_bytes"_a = 4096U);

    m.def("build_info", []() {
        const BuildInfo& bi = build_info();
        nb::dict d;
        d["version"]              = sv_to_py(bi.version);
        d["build_timestamp_utc"]  = sv_to_py(bi.build_timestamp_utc);
        d["build_type"]           = sv_to_py(bi.build_type);
        d["cmake_generator"]      = sv_to_py(bi.cmake_generator);
        d["system_name"]          = sv_to_py(bi.system_name);
        d["system_processor"]     = sv_to_py(bi.system_processor);
        d["cxx_compiler_id"]      = sv_to_py(bi.cxx_compiler_id);
        d["cxx_compiler_version"] = sv_to_py(bi.cxx_compiler_version);
        d["linkage_static"]       = nb::bool_(bi.linkage_static);
        d["linkage_shared"]       = nb::bool_(bi.linkage_shared);
        d["zlib_compiled_version"] = sv_to_py(bi.zlib_compiled_version);
        d["zlib_runtime_version"] = sv_to_py(zlib_runtime_version());
        return d;
    });

    m.def("info_lines", &info_lines);
}
