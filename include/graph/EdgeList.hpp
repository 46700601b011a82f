#pragma once                              // ensure this header is included only once per translation unit
#include "graph/RouteMap.hpp"             // EdgeSpec
#include <stdexcept>                      // base for FileUnreadable
#include <string>                         // file path and content
#include <vector>                         // scanned edges

// Thrown when the input file cannot be opened or read.
class FileUnreadable : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Read the whole file at `path`; throws FileUnreadable.
std::string readEdgeFile(const std::string& path);

// Find every `<letter><letter><digits>` token in `text`, in order of appearance.
// Anything else (spaces, commas, newlines, junk) separates tokens.
std::vector<EdgeSpec> scanEdgeList(const std::string& text);
