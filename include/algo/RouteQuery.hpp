#pragma once
#include "graph/RouteMap.hpp"   // the map queries run against
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

// Value of one query; std::nullopt means "no such route"
using QueryResult = std::optional<std::uint64_t>;

// Strategy interface all route queries implement
struct IRouteQuery {
    virtual ~IRouteQuery() = default;
    virtual QueryResult run(const RouteMap& map) const = 0;
    virtual std::string describe() const = 0;   // canonical command line
};

// Factory that builds a query from one command line
// Accepts: "DISTANCE A-B-C", "CIRCULAR C 3", "EXACT A B 4",
//          "SHORTEST A C", "LESSTHAN C C 30" (keyword case-insensitive)
// Unknown keyword -> nullptr; bad arguments -> std::invalid_argument
struct QueryFactory {
    static std::unique_ptr<IRouteQuery> create(const std::string& line);
};

// "NO SUCH ROUTE" or the decimal value
std::string formatResult(const QueryResult& result);
