#ifndef LISTING_H
#define LISTING_H

#include "compiler.h"

#include <ostream>
#include <string>

// Human readable record of one compilation: numbered source, errors, symbols
class Listing {
public:
    explicit Listing(std::ostream& out) : listingFile(out) {}

    void createListingHeader(const std::string& sourceName, const std::string& timeStr);
    void listSource(const std::string& source, const CompileResult& result);
    void listSymbols(const SymbolTable& symbols);
    void createListingTrailer(int errorCount);

    // header, source, symbols (on success) and trailer in one go
    void write(const std::string& sourceName, const std::string& source,
               const CompileResult& result, const std::string& timeStr);

private:
    std::ostream& listingFile;
};

std::string getTime();

#endif
