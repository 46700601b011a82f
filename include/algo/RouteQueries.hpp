#pragma once                              // ensure this header is included only once per translation unit
#include "graph/RouteMap.hpp"             // the map every query runs against
#include <cstddef>                        // std::size_t counts
#include <optional>                       // "no such route" is std::nullopt
#include <vector>                         // fixed stop lists

/**
 * @brief The five route queries over one RouteMap.
 *        Every call is independent and leaves the map untouched.
 */
class RouteQueries {
public:
    using Station  = RouteMap::Station;
    using Distance = RouteMap::Distance;
    using Length   = RouteMap::Length;

    explicit RouteQueries(const RouteMap& map) : m_map(map) {}

    // Length of the literal route through `stops` (at least one station).
    // std::nullopt at the first consecutive pair with no edge.
    std::optional<Length> routeDistance(const std::vector<Station>& stops) const;

    // Times `start` is reached again during `hops` rounds of fan-out.
    // std::nullopt if any expanded station is a dead end.
    std::optional<std::size_t> circularRoute(const Station& start, std::size_t hops) const;

    // Routes from `start` to `destination` with exactly `stops` intermediate stops.
    std::size_t exactStops(const Station& start, const Station& destination, std::size_t stops) const;

    // Shortest distance from `start` to `destination` over at least one hop.
    std::optional<Length> shortestRoute(const Station& start, const Station& destination) const;

    // Routes from `start` to `destination` shorter than `ceiling` (cycles allowed).
    std::size_t routesLessThan(const Station& start, const Station& destination, Distance ceiling) const;

private:
    const RouteMap& m_map;
};
