/**
 * @file cli.cpp
 * @brief NELF command line interface.
 *
 * Reads a whole file into memory and hands it to the library for
 * decoding or validation, or encodes command line arguments into a file.
 */

#include <nelf/nelf.hpp>

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <string>
#include <vector>

using namespace nelf;

enum class Mode { Decode, Check, Encode };

static void print_version() {
    std::printf("nelf %s (C++)\n", version());
}

static void print_help(const char* prog_name) {
    std::printf("\nNELF: No Escape List Format (v%s C++)\n", version());
    std::printf("=======================================\n\n");
    std::printf("Usage:\n");
    std::printf("  %s [options] -d <input>\n", prog_name);
    std::printf("  %s [options] -c <input>\n", prog_name);
    std::printf("  %s -e <output> [strings...]\n\n", prog_name);
    std::printf("Modes:\n");
    std::printf("  -d             Decode and list elements\n");
    std::printf("  -c             Validate only, print element count\n");
    std::printf("  -e             Encode the remaining arguments into <output>\n");
    std::printf("  -h, --help     Show this help message\n");
    std::printf("  -v, --version  Show version information\n\n");
    std::printf("Options:\n");
    std::printf("  --raw              Do not require elements to be UTF-8\n");
    std::printf("  --max-elements N   Reject lists with more than N elements\n\n");
    std::printf("Output (-d):\n");
    std::printf("  <index>\\t<length>\\t<content>, one element per line\n\n");
    std::printf("Examples:\n");
    std::printf("  %s -e list.nelf hello \"\" \"a,b\"   # encode\n", prog_name);
    std::printf("  %s -d list.nelf                  # decode\n\n", prog_name);
}

static bool read_file(const std::string& path, std::vector<std::uint8_t>& buffer) {
    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file) {
        return false;
    }

    std::streamsize size = file.tellg();
    if (size < 0) {
        return false;
    }
    file.seekg(0, std::ios::beg);

    buffer.resize(static_cast<std::size_t>(size));
    if (size > 0 && !file.read(reinterpret_cast<char*>(buffer.data()), size)) {
        return false;
    }

    return true;
}

static bool write_file(const std::string& path, const std::uint8_t* data, std::size_t size) {
    std::ofstream file(path, std::ios::binary);
    if (!file) {
        return false;
    }
    file.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(size));
    return file.good();
}

static void report(const char* path, const ParseError& error) {
    std::fprintf(stderr, "Error: %s: %s at offset %zu\n", path, error.message(), error.offset);
}

static int do_decode(const char* input_path, const Config& config) {
    std::vector<std::uint8_t> input;
    if (!read_file(input_path, input)) {
        std::fprintf(stderr, "Error: Cannot read input file: %s\n", input_path);
        return 1;
    }

    DecodedList elements;
    ParseError error;
    if (decode(input.data(), input.size(), elements, error, config) != Error::Ok) {
        report(input_path, error);
        return 1;
    }

    for (std::size_t i = 0; i < elements.size(); ++i) {
        std::printf("%zu\t%zu\t", i, elements[i].size());
        std::fwrite(elements[i].data(), 1, elements[i].size(), stdout);
        std::printf("\n");
    }

    return 0;
}

static int do_check(const char* input_path, const Config& config) {
    std::vector<std::uint8_t> input;
    if (!read_file(input_path, input)) {
        std::fprintf(stderr, "Error: Cannot read input file: %s\n", input_path);
        return 1;
    }

    // Frame and view one element at a time; nothing is collected
    Reader reader(input.data(), input.size(), config);
    std::string_view element;
    while (!reader.at_end()) {
        if (reader.next(element) != Error::Ok) {
            report(input_path, reader.error());
            return 1;
        }
    }

    std::printf("Input:       %s (%zu bytes)\n", input_path, input.size());
    std::printf("Elements:    %zu\n", reader.count());

    return 0;
}

static int do_encode(const char* output_path, char** first, char** last, const Config& config) {
    std::vector<const char*> elements(first, last);

    std::vector<std::uint8_t> output;
    output.reserve(encoded_size(elements));

    ParseError error;
    if (encode(elements, output, error, config) != Error::Ok) {
        report(output_path, error);
        return 1;
    }

    if (!write_file(output_path, output.data(), output.size())) {
        std::fprintf(stderr, "Error: Cannot write output file: %s\n", output_path);
        return 1;
    }

    std::printf("Output:      %s (%zu bytes, %zu elements)\n", output_path, output.size(),
                elements.size());

    return 0;
}

static bool parse_count(const char* text, std::size_t& value) {
    if (text == nullptr || *text == '\0' || *text == '-') {
        return false;
    }
    char* end = nullptr;
    errno = 0;
    unsigned long long parsed = std::strtoull(text, &end, 10);
    if (errno != 0 || *end != '\0') {
        return false;
    }
    value = static_cast<std::size_t>(parsed);
    return true;
}

int main(int argc, char** argv) {
    // Check for help flag
    if (argc < 2 || std::strcmp(argv[1], "-h") == 0 || std::strcmp(argv[1], "--help") == 0) {
        print_help(argv[0]);
        return (argc < 2) ? 1 : 0;
    }

    // Check for version flag
    if (std::strcmp(argv[1], "-v") == 0 || std::strcmp(argv[1], "--version") == 0) {
        print_version();
        return 0;
    }

    Config config;
    int arg = 1;

    // Options precede the mode flag
    while (arg < argc && std::strncmp(argv[arg], "--", 2) == 0) {
        if (std::strcmp(argv[arg], "--raw") == 0) {
            config.text_validity = TextValidity::None;
            ++arg;
        } else if (std::strcmp(argv[arg], "--max-elements") == 0) {
            if (arg + 1 >= argc || !parse_count(argv[arg + 1], config.max_elements)) {
                std::fprintf(stderr, "Error: --max-elements requires a non-negative number\n");
                return 1;
            }
            arg += 2;
        } else {
            std::fprintf(stderr, "Error: Unknown option: %s\n", argv[arg]);
            return 1;
        }
    }

    if (arg >= argc) {
        std::fprintf(stderr, "Error: Missing mode (-d, -c or -e)\n");
        return 1;
    }

    Mode mode;
    if (std::strcmp(argv[arg], "-d") == 0) {
        mode = Mode::Decode;
    } else if (std::strcmp(argv[arg], "-c") == 0) {
        mode = Mode::Check;
    } else if (std::strcmp(argv[arg], "-e") == 0) {
        mode = Mode::Encode;
    } else {
        std::fprintf(stderr, "Error: Unknown mode: %s\n", argv[arg]);
        return 1;
    }
    ++arg;

    if (mode == Mode::Encode) {
        // Encode mode: -e <output> [strings...]
        if (arg >= argc) {
            std::fprintf(stderr, "Error: Encode requires an output file\n");
            std::fprintf(stderr, "Usage: %s -e <output> [strings...]\n", argv[0]);
            return 1;
        }
        const char* output_path = argv[arg];
        return do_encode(output_path, argv + arg + 1, argv + argc, config);
    }

    // Decode / check mode: exactly one input file
    if (argc - arg != 1) {
        std::fprintf(stderr, "Error: Expected exactly one input file\n");
        std::fprintf(stderr, "Usage: %s [options] -d|-c <input>\n", argv[0]);
        return 1;
    }

    const char* input_path = argv[arg];
    return (mode == Mode::Decode) ? do_decode(input_path, config) : do_check(input_path, config);
}
