#include "algo/Battery.hpp"       // declarations
#include "algo/RouteQuery.hpp"    // QueryFactory, formatResult()
#include <memory>                 // std::unique_ptr
#include <stdexcept>              // std::invalid_argument
#include <utility>                // std::move

const std::vector<std::string>& standardBattery() {
    static const std::vector<std::string> kBattery = {
        "DISTANCE A-B-C",
        "DISTANCE A-D",
        "DISTANCE A-D-C",
        "DISTANCE A-E-B-C-D",
        "DISTANCE A-E-D",
        "CIRCULAR C 3",
        "EXACT A B 4",
        "SHORTEST A C",
        "SHORTEST B B",
        "LESSTHAN C C 30",
    };
    return kBattery;
}

std::vector<std::string> runBattery(const RouteMap& map, const std::vector<std::string>& commands) {
    // Parse everything first so a bad command fails before any output.
    std::vector<std::unique_ptr<IRouteQuery>> queries;
    queries.reserve(commands.size());
    for (const auto& cmd : commands) {
        auto q = QueryFactory::create(cmd);
        if (!q) throw std::invalid_argument("unknown query: " + cmd);
        queries.push_back(std::move(q));
    }

    std::vector<std::string> lines;
    lines.reserve(queries.size());
    for (std::size_t i = 0; i < queries.size(); ++i)
        lines.push_back("Output #" + std::to_string(i + 1) + ": " + formatResult(queries[i]->run(map)));
    return lines;
}
