#include "options.h"

#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

void printHelp(std::ostream& out, const char* prog){
    out << "c85c - compiler for the C85 register language (8085 assembly output)\n"
        << "\n"
        << "Usage:\n"
        << "  " << prog << " <input.c85> [options]\n"
        << "\n"
        << "Options:\n"
        << "  -o, --output <file>    Assembly output (default: input with .asm extension)\n"
        << "  -l, --listing <file>   Also write a numbered source listing\n"
        << "  -q, --quiet            No message on success\n"
        << "  -h, --help             Show this help\n";
}

std::string defaultOutputPath(const std::string& inputPath){
    fs::path p(inputPath);
    p.replace_extension(".asm");
    return p.string();
}

// symlinks and ".." resolved where the file system allows it
static fs::path resolvePath(const std::string& path){
    std::error_code ec;
    fs::path p = fs::absolute(fs::path(path), ec);
    if (ec) {
        return fs::path(path).lexically_normal();
    }
    fs::path canonical = fs::weakly_canonical(p, ec);
    if (!ec) {
        p = canonical;
    }
    return p.lexically_normal();
}

bool samePath(const std::string& a, const std::string& b){
    return resolvePath(a) == resolvePath(b);
}

Options parseArguments(int argc, char** argv){
    Options opts;

    for (int i = 1; i < argc; i++) {
        std::string a = argv[i];
        if (a == "-h" || a == "--help") {
            opts.help = true;
            return opts;
        }
        if (a == "-o" || a == "--output" || a == "-l" || a == "--listing") {
            if (i + 1 >= argc) {
                throw UsageError("option " + a + " requires a file name");
            }
            if (a == "-o" || a == "--output") {
                opts.outputPath = argv[++i];
            } else {
                opts.listingPath = argv[++i];
            }
        }
        else if (a == "-q" || a == "--quiet") {
            opts.quiet = true;
        }
        else if (!a.empty() && a[0] == '-') {
            throw UsageError("unknown argument: " + a);
        }
        else if (opts.inputPath.empty()) {
            opts.inputPath = a;
        }
        else {
            throw UsageError("only one input file may be given, got " + a);
        }
    }

    if (opts.inputPath.empty()) {
        throw UsageError("no input file");
    }
    if (opts.outputPath.empty()) {
        opts.outputPath = defaultOutputPath(opts.inputPath);
    }
    if (samePath(opts.inputPath, opts.outputPath)) {
        throw UsageError("output file " + opts.outputPath + " would overwrite the input, use -o");
    }
    if (!opts.listingPath.empty() && samePath(opts.inputPath, opts.listingPath)) {
        throw UsageError("listing file " + opts.listingPath + " would overwrite the input");
    }
    return opts;
}
