// ==========================
// trains: route queries from an edge-list file
// ==========================
// Parses: [-v|--verbose] [-q|--query <command>]... <input-file>
// Reads the edge list, builds the RouteMap and prints one
// "Output #<n>: <result>" line per query. Without --query the
// fixed ten-query battery runs.
// ==========================

#include "graph/EdgeList.hpp"   // readEdgeFile, FileUnreadable
#include "graph/RouteMap.hpp"   // RouteMap, MalformedEdge
#include "algo/Battery.hpp"     // standardBattery, runBattery
#include <getopt.h>             // getopt_long for command-line parsing
#include <exception>            // std::exception
#include <iostream>             // I/O
#include <string>
#include <vector>

static void usage(std::ostream& os, const char* prog) {            // print usage
    os << "Usage: " << prog
       << " [-v|--verbose] [-q|--query <command>]... <input-file>\n"
       << "Need path of input file as only argument\n";
}

int main(int argc, char* argv[]) {                                  // entry point
    bool verbose = false;                                           // progress on stderr
    std::vector<std::string> queries;                               // --query commands, in order
    option lo[] = {{"verbose", no_argument,       nullptr, 'v'},
                   {"query",   required_argument, nullptr, 'q'},
                   {nullptr, 0, nullptr, 0}};                       // long options
    int li = 0;

    for (int opt; (opt = getopt_long(argc, argv, "vq:", lo, &li)) != -1; ) { // parse flags
        if (opt == 'v') verbose = true;
        else if (opt == 'q') queries.push_back(optarg);
        else { usage(std::cerr, argv[0]); return 1; }               // invalid flag
    }

    if (argc - optind != 1) {                                       // exactly one input file
        usage(std::cout, argv[0]);
        return 0;
    }
    const std::string path = argv[optind];

    try {
        const std::string text = readEdgeFile(path);
        if (verbose) std::cerr << "[trains] read " << text.size() << " bytes from " << path << "\n";

        const RouteMap map = RouteMap::fromText(text);
        if (verbose) std::cerr << "[trains] built " << map.label() << "\n";

        const auto& commands = queries.empty() ? standardBattery() : queries;
        if (verbose) std::cerr << "[trains] running " << commands.size() << " queries\n";

        for (const auto& line : runBattery(map, commands))
            std::cout << line << "\n";
    } catch (const FileUnreadable& e) {
        std::cerr << "[trains] " << e.what() << "\n";
        return 1;
    } catch (const MalformedEdge& e) {
        std::cerr << "[trains] malformed edge: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {                             // bad --query command
        std::cerr << "[trains] " << e.what() << "\n";
        return 1;
    }

    return 0;                                                       // success
}
