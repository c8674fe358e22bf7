#ifndef OPTIONS_H
#define OPTIONS_H

#include <ostream>
#include <stdexcept>
#include <string>

struct Options {
    std::string inputPath;
    std::string outputPath;     // defaults to inputPath with a .asm extension
    std::string listingPath;    // empty: no listing
    bool quiet = false;
    bool help = false;
};

class UsageError : public std::runtime_error {
public:
    explicit UsageError(const std::string& msg) : std::runtime_error(msg) {}
};

// Throws UsageError on unknown flags, a flag missing its value, a missing input,
// or an output or listing path that names the input file
Options parseArguments(int argc, char** argv);

std::string defaultOutputPath(const std::string& inputPath);

// true when both names lead to the same file
bool samePath(const std::string& a, const std::string& b);

void printHelp(std::ostream& out, const char* prog);

#endif
