#include "compiler.h"
#include "listing.h"
#include "options.h"

#include <fstream>
#include <iostream>
#include <sstream>

static bool readSource(const std::string& path, std::string& out){
    std::ifstream sourceFile(path);
    if (!sourceFile.is_open()) {
        return false;
    }
    std::ostringstream ss;
    ss << sourceFile.rdbuf();
    out = ss.str();
    return true;
}

static bool writeListing(const Options& opts, const std::string& source, const CompileResult& result){
    std::ofstream listingFile(opts.listingPath);
    if (!listingFile.is_open()) {
        std::cerr << "ERROR: Unable to open listing file: " << opts.listingPath << std::endl;
        return false;
    }
    Listing listing(listingFile);
    listing.write(opts.inputPath, source, result, getTime());
    return true;
}

int main(int argc, char** argv) {
    Options opts;
    try {
        opts = parseArguments(argc, argv);
    } catch (const UsageError& e) {
        std::cerr << "ERROR: " << e.what() << "\n";
        printHelp(std::cerr, argv[0]);
        return 2;
    }
    if (opts.help) {
        printHelp(std::cout, argv[0]);
        return 0;
    }

    std::string source;
    if (!readSource(opts.inputPath, source)) {
        std::cerr << "ERROR: Unable to open source file: " << opts.inputPath << std::endl;
        return 1;
    }

    CompileResult result = compile(source);

    if (!opts.listingPath.empty() && !writeListing(opts, source, result)) {
        return 1;
    }

    if (!result.ok) {
        std::cerr << "ERROR: " << formatError(result) << std::endl;
        return 1;
    }

    std::ofstream objectFile(opts.outputPath);
    if (!objectFile.is_open()) {
        std::cerr << "ERROR: Unable to open object file: " << opts.outputPath << std::endl;
        return 1;
    }
    objectFile << joinLines(result.lines);
    objectFile.close();
    if (!objectFile) {
        std::cerr << "ERROR: Failed writing object file: " << opts.outputPath << std::endl;
        return 1;
    }

    if (!opts.quiet) {
        std::cout << "Compilation successful! Output written to " << opts.outputPath << std::endl;
    }
    return 0;
}
