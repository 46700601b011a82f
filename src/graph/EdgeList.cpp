#include "graph/EdgeList.hpp"      // declarations
#include <fstream>                  // std::ifstream
#include <iterator>                 // std::istreambuf_iterator
#include <regex>                    // token scanning

std::string readEdgeFile(const std::string& path) {
    std::ifstream in(path, std::ios::in | std::ios::binary);        // open as-is, no newline translation
    if (!in.is_open())
        throw FileUnreadable("unable to read input file: " + path);

    std::string content((std::istreambuf_iterator<char>(in)),
                        std::istreambuf_iterator<char>());           // slurp whole file
    return content;
}

std::vector<EdgeSpec> scanEdgeList(const std::string& text) {
    static const std::regex kEdge("([a-zA-Z])([a-zA-Z])([0-9]+)");   // origin, destination, distance

    std::vector<EdgeSpec> out;
    for (std::sregex_iterator it(text.begin(), text.end(), kEdge), end; it != end; ++it) {
        const std::smatch& m = *it;
        out.push_back({m[1].str(), m[2].str(), m[3].str()});
    }
    return out;
}
