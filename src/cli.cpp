/**
 * @file cli.cpp
 * @brief unravel command line interface.
 *
 * @cond INTERNAL
 * ============================================================================
 *  _____                                   ____
 * |_   _|_ _ _ __   __ _  __ _ _ __ __ _  / ___| _ __   __ _  ___ ___
 *   | |/ _` | '_ \ / _` |/ _` | '__/ _` | \___ \| '_ \ / _` |/ __/ _ \
 *   | | (_| | | | | (_| | (_| | | | (_| |  ___) | |_) | (_| | (_|  __/
 *   |_|\__,_|_| |_|\__,_|\__, |_|  \__,_| |____/| .__/ \__,_|\___\___|
 *                        |___/                  |_|
 * ============================================================================
 * @endcond
 *
 * Decodes a layered encoding given on the command line, in a file or on
 * standard input, or prints the analysis of a text.
 */

#include <unravel/json.hpp>
#include <unravel/unravel.hpp>

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>

using namespace unravel;

static constexpr const char* BANNER = "                                                \n"
                                      "  _   _ _   _ ____      ___     _______ _        \n"
                                      " | | | | \\ | |  _ \\    / \\ \\   / / ____| |       \n"
                                      " | | | |  \\| | |_) |  / _ \\ \\ / /|  _| | |       \n"
                                      " | |_| | |\\  |  _ <  / ___ \\ V / | |___| |___    \n"
                                      "  \\___/|_| \\_|_| \\_\\/_/   \\_\\_/  |_____|_____|   \n"
                                      "                                                \n"
                                      "          by  T A N A G R A  S P A C E          \n";

static constexpr int EXIT_DECODED = 0;
static constexpr int EXIT_ERROR = 1;
static constexpr int EXIT_UNDECODED = 2;

struct CliArgs {
    Options options;
    bool json = false;
    bool analyze_only = false;
    const char* file = nullptr;
    const char* text = nullptr;
};

static void print_version() {
    std::printf("unravel %s (C++)\n", version());
}

static void print_help(const char* prog_name) {
    std::printf("\n%s\n", BANNER);
    std::printf("Iterative decoder for layered text encodings (v%s C++)\n", version());
    std::printf("=======================================================\n\n");
    std::printf("Supported encodings: base64, hex, rot13, url (percent-encoding)\n\n");
    std::printf("Usage:\n");
    std::printf("  %s [options] <text>\n", prog_name);
    std::printf("  %s [options] -f <file>\n\n", prog_name);
    std::printf("Options:\n");
    std::printf("  -m, --max-iterations N  Iteration cap (default %d)\n", DEFAULT_MAX_ITERATIONS);
    std::printf("      --verbose           Trace every decoding step\n");
    std::printf("  -j, --json              Print the result as JSON\n");
    std::printf("  -a, --analyze           Print the text analysis only\n");
    std::printf("  -f, --file PATH         Read input from PATH ('-' for stdin)\n");
    std::printf("  -h, --help              Show this help message\n");
    std::printf("  -v, --version           Show version information\n\n");
    std::printf("Exit status:\n");
    std::printf("  0  decoded to a recognised result (flag, URL, hash, plain text)\n");
    std::printf("  1  usage or I/O error\n");
    std::printf("  2  decoding stopped without success\n\n");
    std::printf("Examples:\n");
    std::printf("  %s SGVsbG8gV29ybGQ=                 # base64\n", prog_name);
    std::printf("  %s -j NDg2NTZjNmM2Zg==              # base64 -> hex, JSON output\n", prog_name);
    std::printf("  %s -a 48656c6c6f                    # analysis only\n\n", prog_name);
}

static bool read_input(const char* path, std::string& out) {
    if (std::strcmp(path, "-") == 0) {
        out.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
    } else {
        std::ifstream file(path, std::ios::binary);
        if (!file) {
            return false;
        }
        out.assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
        if (file.bad()) {
            return false;
        }
    }

    // Drop the trailing newline editors and `echo` add
    while (!out.empty() && (out.back() == '\n' || out.back() == '\r')) {
        out.pop_back();
    }
    return true;
}

static bool parse_int(const char* text, int& value) {
    char* end = nullptr;
    long parsed = std::strtol(text, &end, 10);
    if (end == text || *end != '\0' || parsed < 1 || parsed > 1000) {
        return false;
    }
    value = static_cast<int>(parsed);
    return true;
}

// Returns -1 to continue, otherwise the process exit code
static int parse_args(int argc, char** argv, CliArgs& args) {
    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];

        if (std::strcmp(arg, "-h") == 0 || std::strcmp(arg, "--help") == 0) {
            print_help(argv[0]);
            return EXIT_DECODED;
        }
        if (std::strcmp(arg, "-v") == 0 || std::strcmp(arg, "--version") == 0) {
            print_version();
            return EXIT_DECODED;
        }
        if (std::strcmp(arg, "--verbose") == 0) {
            args.options.verbose = true;
        } else if (std::strcmp(arg, "-j") == 0 || std::strcmp(arg, "--json") == 0) {
            args.json = true;
        } else if (std::strcmp(arg, "-a") == 0 || std::strcmp(arg, "--analyze") == 0) {
            args.analyze_only = true;
        } else if (std::strcmp(arg, "-m") == 0 || std::strcmp(arg, "--max-iterations") == 0) {
            if (i + 1 >= argc || !parse_int(argv[i + 1], args.options.max_iterations)) {
                std::fprintf(stderr, "Error: %s requires an integer between 1 and 1000\n", arg);
                return EXIT_ERROR;
            }
            ++i;
        } else if (std::strcmp(arg, "-f") == 0 || std::strcmp(arg, "--file") == 0) {
            if (i + 1 >= argc) {
                std::fprintf(stderr, "Error: %s requires a path\n", arg);
                return EXIT_ERROR;
            }
            args.file = argv[++i];
        } else if (arg[0] == '-' && arg[1] != '\0') {
            std::fprintf(stderr, "Error: Unknown option: %s\n", arg);
            return EXIT_ERROR;
        } else if (args.text == nullptr) {
            args.text = arg;
        } else {
            std::fprintf(stderr, "Error: Only one input text may be given\n");
            return EXIT_ERROR;
        }
    }

    if ((args.text == nullptr) == (args.file == nullptr)) {
        std::fprintf(stderr, "Error: Give exactly one of <text> or -f <file>\n");
        std::fprintf(stderr, "Usage: %s [options] <text>\n", argv[0]);
        return EXIT_ERROR;
    }

    return -1;
}

static int do_analyze(const std::string& input, bool json) {
    TextAnalysis analysis = analyze(input);
    if (json) {
        std::printf("%s\n", dump_json(nlohmann::json(analysis)).c_str());
    } else {
        std::printf("%s\n", format_analysis(analysis).c_str());
    }
    return EXIT_DECODED;
}

static int do_decode(const std::string& input, const CliArgs& args) {
    Options options = args.options;
    // Keep stdout clean for the JSON document
    if (args.json) {
        options.log_stream = stderr;
    }

    Controller controller(options);
    SessionSnapshot session = controller.run(input);

    if (args.json) {
        nlohmann::json doc = make_run_result(session);
        doc["session"] = session.export_record();
        std::printf("%s\n", dump_json(doc).c_str());
    } else if (!options.verbose) {
        std::printf("%s\n", format_result_summary(session).c_str());
    }

    return session.is_complete() ? EXIT_DECODED : EXIT_UNDECODED;
}

int main(int argc, char** argv) {
    if (argc < 2) {
        print_help(argv[0]);
        return EXIT_ERROR;
    }

    CliArgs args;
    int status = parse_args(argc, argv, args);
    if (status >= 0) {
        return status;
    }

    std::string input;
    if (args.file != nullptr) {
        if (!read_input(args.file, input)) {
            std::fprintf(stderr, "Error: Cannot read input file: %s\n", args.file);
            return EXIT_ERROR;
        }
    } else {
        input = args.text;
    }

    if (input.empty()) {
        std::fprintf(stderr, "Error: Input text is empty\n");
        return EXIT_ERROR;
    }

    if (args.analyze_only) {
        return do_analyze(input, args.json);
    }
    return do_decode(input, args);
}
