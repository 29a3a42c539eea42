#include "openchunk/build_info.h"
#include "openchunk/chunk.h"
#include "openchunk/type_tag.h"

#include <cstdio>
#include <cstring>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace openchunk {
namespace {

    static void usage(const char* argv0)
    {
        std::printf(
            "Usage: %s [options] <tag> <message> <out-file>\n"
            "\n"
            "Builds a chunk carrying <message> under the 4-letter type <tag>\n"
            "and writes its serialized bytes to <out-file>.\n"
            "\n"
            "Options:\n"
            "  --help                 Show this help\n"
            "  --version              Print OpenChunk build info\n"
            "  --force                Overwrite an existing output file\n"
            "  --append               Append to the output file instead\n",
            argv0 ? argv0 : "chunkwrite");
    }


    static void print_build_info_header()
    {
        std::string line1;
        std::string line2;
        format_build_info_lines(&line1, &line2);
        std::printf("%s\n%s\n", line1.c_str(), line2.c_str());
    }


    static bool file_exists(const char* path)
    {
        std::FILE* f = std::fopen(path, "rb");
        if (!f) {
            return false;
        }
        std::fclose(f);
        return true;
    }


    static bool write_file_bytes(const char* path,
                                 std::span<const std::byte> bytes,
                                 bool append)
    {
        std::FILE* f = std::fopen(path, append ? "ab" : "wb");
        if (!f) {
            return false;
        }
        size_t written = 0;
        if (!bytes.empty()) {
            written = std::fwrite(bytes.data(), 1, bytes.size(), f);
        }
        const bool close_ok = std::fclose(f) == 0;
        return close_ok && written == bytes.size();
    }

}  // namespace
}  // namespace openchunk


int
main(int argc, char** argv)
{
    using namespace openchunk;

    bool force  = false;
    bool append = false;

    int first_arg = 1;
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
        if (std::strcmp(arg, "--force") == 0) {
            force = true;
            first_arg += 1;
            continue;
        }
        if (std::strcmp(arg, "--append") == 0) {
            append = true;
            first_arg += 1;
            continue;
        }
        if (arg[0] == '-' && arg[1] != '\0') {
            std::fprintf(stderr, "chunkwrite: unknown option `%s`\n", arg);
            return 2;
        }
        break;
    }

    if (argc - first_arg != 3) {
        usage(argv[0]);
        return 2;
    }
    const char* tag_text = argv[first_arg + 0];
    const char* message  = argv[first_arg + 1];
    const char* out_path = argv[first_arg + 2];

    std::optional<TypeTag> tag;
    const TypeTagResult tag_res = TypeTag::from_string(tag_text, &tag);
    if (tag_res.status != TypeTagStatus::Ok || !tag) {
        if (tag_res.status == TypeTagStatus::InvalidByte) {
            std::fprintf(stderr,
                         "chunkwrite: invalid tag `%s` (%s at byte %u)\n",
                         tag_text, type_tag_status_name(tag_res.status),
                         static_cast<unsigned>(tag_res.offset));
        } else {
            std::fprintf(stderr, "chunkwrite: invalid tag `%s` (%s)\n",
                         tag_text, type_tag_status_name(tag_res.status));
        }
        return 1;
    }

    const std::string_view msg(message);
    const std::byte* msg_data = reinterpret_cast<const std::byte*>(msg.data());
    const Chunk chunk(*tag, std::vector<std::byte>(msg_data,
                                                   msg_data + msg.size()));

    if (!force && !append && file_exists(out_path)) {
        std::fprintf(stderr,
                     "chunkwrite: `%s` exists (use --force or --append)\n",
                     out_path);
        return 1;
    }

    const std::vector<std::byte> bytes = chunk.serialize();
    if (bytes.empty()) {
        std::fprintf(stderr, "chunkwrite: failed to serialize chunk\n");
        return 1;
    }
    if (!write_file_bytes(out_path, bytes, append)) {
        std::fprintf(stderr, "chunkwrite: failed to write `%s`\n", out_path);
        return 1;
    }

    std::printf("wrote %zu bytes to %s (tag=%s length=%u crc=0x%08X)\n",
                bytes.size(), out_path, chunk.chunk_type().to_string().c_str(),
                static_cast<unsigned>(chunk.length()),
                static_cast<unsigned>(chunk.crc()));
    return 0;
}
