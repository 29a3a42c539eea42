#include "openchunk/build_info.h"
#include "openchunk/chunk.h"
#include "openchunk/console_format.h"
#include "openchunk/resource_policy.h"
#include "openchunk/type_tag.h"

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <optional>
#include <string>
#include <vector>

namespace openchunk {
namespace {

    enum class ReadFileStatus : uint8_t {
        Ok,
        OpenFailed,
        TooLarge,
        ReadFailed,
    };


    static void usage(const char* argv0)
    {
        std::printf(
            "Usage: %s [options] <file> [file...]\n"
            "\n"
            "Parses one serialized chunk per file and prints its fields.\n"
            "\n"
            "Options:\n"
            "  --help                  Show this help\n"
            "  --version               Print OpenChunk build info\n"
            "  --no-build-info         Hide build info header\n"
            "  --offset N              Byte offset of the chunk (default: 0)\n"
            "  --hex                   Also print the payload as hex\n"
            "  --max-bytes N           Payload bytes to display (default: 256, 0=all)\n"
            "  --max-file-bytes N      Refuse inputs larger than N bytes\n"
            "                          (default: 536870912, 0=unlimited)\n"
            "  --max-payload-bytes N   Reject chunks declaring more than N payload\n"
            "                          bytes (default: 2147483647, 0=unlimited)\n",
            argv0 ? argv0 : "chunkread");
    }


    static bool parse_u64_arg(const char* s, uint64_t* out)
    {
        if (!s || !*s || !out) {
            return false;
        }
        char* end            = nullptr;
        unsigned long long v = std::strtoull(s, &end, 10);
        if (!end || *end != '\0') {
            return false;
        }
        *out = static_cast<uint64_t>(v);
        return true;
    }


    static bool parse_u32_arg(const char* s, uint32_t* out)
    {
        uint64_t v = 0;
        if (!parse_u64_arg(s, &v) || v > 0xFFFFFFFFULL) {
            return false;
        }
        *out = static_cast<uint32_t>(v);
        return true;
    }


    static void print_build_info_header()
    {
        std::string line1;
        std::string line2;
        format_build_info_lines(&line1, &line2);
        std::printf("%s\n%s\n", line1.c_str(), line2.c_str());
    }


    static const char* read_file_status_name(ReadFileStatus status) noexcept
    {
        switch (status) {
        case ReadFileStatus::Ok: return "ok";
        case ReadFileStatus::OpenFailed: return "open_failed";
        case ReadFileStatus::TooLarge: return "too_large";
        case ReadFileStatus::ReadFailed: return "read_failed";
        }
        return "unknown";
    }


    static ReadFileStatus read_file_bytes(const char* path,
                                          uint64_t max_file_bytes,
                                          std::vector<std::byte>* out)
    {
        out->clear();
        std::FILE* f = std::fopen(path, "rb");
        if (!f) {
            return ReadFileStatus::OpenFailed;
        }

        std::byte buf[65536];
        for (;;) {
            const size_t n = std::fread(buf, 1, sizeof(buf), f);
            if (n == 0) {
                break;
            }
            if (max_file_bytes != 0U
                && static_cast<uint64_t>(out->size()) + n > max_file_bytes) {
                std::fclose(f);
                out->clear();
                return ReadFileStatus::TooLarge;
            }
            out->insert(out->end(), buf, buf + n);
        }
        const bool failed = std::ferror(f) != 0;
        std::fclose(f);
        if (failed) {
            out->clear();
            return ReadFileStatus::ReadFailed;
        }
        return ReadFileStatus::Ok;
    }


    static void print_chunk(const Chunk& chunk, uint64_t offset,
                            uint64_t consumed, bool show_hex,
                            uint32_t max_bytes)
    {
        const TypeTag& tag = chunk.chunk_type();
        const std::string tag_text = tag.to_string();
        std::printf("tag=%s length=%u crc=0x%08X\n", tag_text.c_str(),
                    static_cast<unsigned>(chunk.length()),
                    static_cast<unsigned>(chunk.crc()));
        std::printf("critical=%d public=%d reserved_bit_valid=%d "
                    "safe_to_copy=%d\n",
                    tag.is_critical() ? 1 : 0, tag.is_public() ? 1 : 0,
                    tag.is_reserved_bit_valid() ? 1 : 0,
                    tag.is_safe_to_copy() ? 1 : 0);

        const std::string text = chunk.data_as_string();
        const std::span<const std::byte> text_bytes(
            reinterpret_cast<const std::byte*>(text.data()), text.size());
        std::string line;
        (void)append_console_escaped(text_bytes, max_bytes, &line);
        std::printf("data=\"%s\"\n", line.c_str());

        if (show_hex) {
            line.clear();
            append_hex_bytes(chunk.data(), max_bytes, &line);
            std::printf("hex=%s\n", line.c_str());
        }
        std::printf("next_offset=%llu\n",
                    static_cast<unsigned long long>(offset + consumed));
    }


    static void print_parse_failure(const ChunkParseResult& res)
    {
        switch (res.status) {
        case ChunkStatus::Truncated:
            std::printf("needed=%llu\n",
                        static_cast<unsigned long long>(res.needed));
            break;
        case ChunkStatus::InvalidTag:
            std::printf("tag_status=%s tag_offset=%u\n",
                        type_tag_status_name(res.tag_status),
                        static_cast<unsigned>(res.tag_offset));
            break;
        case ChunkStatus::ChecksumMismatch:
            std::printf("stored_crc=0x%08X computed_crc=0x%08X\n",
                        static_cast<unsigned>(res.stored_crc),
                        static_cast<unsigned>(res.computed_crc));
            break;
        case ChunkStatus::LimitExceeded:
            std::printf("needed=%llu\n",
                        static_cast<unsigned long long>(res.needed));
            break;
        case ChunkStatus::Ok: break;
        }
    }

}  // namespace
}  // namespace openchunk


int
main(int argc, char** argv)
{
    using namespace openchunk;

    ChunkResourcePolicy policy;
    bool show_build_info = true;
    bool show_hex        = false;
    uint64_t offset      = 0;

    int first_path = 1;
    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        if (!arg) {
            continue;
        }
        if (std::strcmp(arg, "--help") == 0) {
            usage(argv[0]);
            return 0;
        }
        if (std::strcmp(arg, "--version") == 0) {
            print_build_info_header();
            return 0;
        }
        if (std::strcmp(arg, "--no-build-info") == 0) {
            show_build_info = false;
            first_path += 1;
            continue;
        }
        if (std::strcmp(arg, "--hex") == 0) {
            show_hex = true;
            first_path += 1;
            continue;
        }
        if (std::strcmp(arg, "--offset") == 0 && i + 1 < argc) {
            if (!parse_u64_arg(argv[i + 1], &offset)) {
                std::fprintf(stderr, "invalid --offset value\n");
                return 2;
            }
            i += 1;
            first_path += 2;
            continue;
        }
        if (std::strcmp(arg, "--max-bytes") == 0 && i + 1 < argc) {
            if (!parse_u32_arg(argv[i + 1], &policy.max_display_bytes)) {
                std::fprintf(stderr, "invalid --max-bytes value\n");
                return 2;
            }
            i += 1;
            first_path += 2;
            continue;
        }
        if (std::strcmp(arg, "--max-file-bytes") == 0 && i + 1 < argc) {
            if (!parse_u64_arg(argv[i + 1], &policy.max_file_bytes)) {
                std::fprintf(stderr, "invalid --max-file-bytes value\n");
                return 2;
            }
            i += 1;
            first_path += 2;
            continue;
        }
        if (std::strcmp(arg, "--max-payload-bytes") == 0 && i + 1 < argc) {
            if (!parse_u32_arg(argv[i + 1],
                               &policy.decode_limits.max_payload_bytes)) {
                std::fprintf(stderr, "invalid --max-payload-bytes value\n");
                return 2;
            }
            i += 1;
            first_path += 2;
            continue;
        }
        if (arg[0] == '-' && arg[1] != '\0') {
            std::fprintf(stderr, "chunkread: unknown option `%s`\n", arg);
            return 2;
        }
        break;
    }

    if (first_path >= argc) {
        usage(argv[0]);
        return 2;
    }

    if (show_build_info) {
        print_build_info_header();
    }

    ChunkDecodeOptions options;
    apply_resource_policy(policy, &options);

    int exit_code = 0;
    std::vector<std::byte> bytes;
    for (int argi = first_path; argi < argc; ++argi) {
        const char* path = argv[argi];
        const ReadFileStatus rs = read_file_bytes(path, policy.max_file_bytes,
                                                  &bytes);
        if (rs != ReadFileStatus::Ok) {
            std::fprintf(stderr, "chunkread: failed to read `%s` (%s)\n", path,
                         read_file_status_name(rs));
            exit_code = 1;
            continue;
        }

        std::printf("== %s\n", path);
        std::printf("size=%zu offset=%llu\n", bytes.size(),
                    static_cast<unsigned long long>(offset));
        if (offset > bytes.size()) {
            std::fprintf(stderr, "chunkread: offset past end of `%s`\n",
                         path);
            exit_code = 1;
            continue;
        }

        const std::span<const std::byte> input
            = std::span<const std::byte>(bytes).subspan(
                static_cast<size_t>(offset));
        std::optional<Chunk> chunk;
        const ChunkParseResult res = parse_chunk(input, &chunk, options);
        std::printf("status=%s\n", chunk_status_name(res.status));
        if (res.status != ChunkStatus::Ok || !chunk) {
            print_parse_failure(res);
            exit_code = 1;
            continue;
        }
        print_chunk(*chunk, offset, res.consumed, show_hex,
                    policy.max_display_bytes);
    }
    return exit_code;
}
