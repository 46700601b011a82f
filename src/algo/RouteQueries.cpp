// ===============================================
// RouteQueries.cpp
// Implements the route queries on top of the round-based traversal:
//   * fixed-path distance (no traversal, consecutive lookups)
//   * circular count (bare stations, aborts on a dead end)
//   * exact-stop count (full routes, fixed number of rounds)
//   * shortest route (full routes, pruned by the best distance so far)
//   * routes under a distance ceiling (full routes, pruned by the ceiling)
// ===============================================

#include "algo/RouteQueries.hpp"      // class declaration
#include "algo/Traversal.hpp"         // traverseRounds(), expand(), PartialRoute
#include <stdexcept>                  // std::invalid_argument for an empty route

std::optional<RouteQueries::Length>
RouteQueries::routeDistance(const std::vector<Station>& stops) const {
    if (stops.empty())
        throw std::invalid_argument("route needs at least one station");

    Length total = 0;                                                   // a single station travels nowhere
    for (std::size_t i = 1; i < stops.size(); ++i) {
        auto hop = m_map.lookup(stops[i - 1], stops[i]);                // direct edge between neighbours
        if (!hop) return std::nullopt;                                  // broken route: stop summing
        total += *hop;
    }
    return total;
}

std::optional<std::size_t>
RouteQueries::circularRoute(const Station& start, std::size_t hops) const {
    std::size_t returns = 0;                                            // arrivals back at start

    auto grow = [&](const Station& at) {                                // destinations only, no history
        std::vector<Station> out;
        for (const auto& e : m_map.outgoing(at)) {
            if (e.first == start) ++returns;
            out.push_back(e.first);
        }
        return out;
    };
    auto visit = [&](const Station& at) {                               // any dead end voids the count
        return m_map.hasStation(at) ? Verdict::Expand : Verdict::Abort;
    };

    auto last = traverseRounds(std::vector<Station>{start}, hops, grow, visit);
    if (!last) return std::nullopt;
    return returns;
}

std::size_t RouteQueries::exactStops(const Station& start, const Station& destination,
                                     std::size_t stops) const {
    auto grow  = [&](const PartialRoute& r) { return expand(m_map, r); };
    auto visit = [](const PartialRoute&) { return Verdict::Expand; };  // dead ends vanish in expand()

    // Frontier starts one hop out; each round adds one intermediate stop.
    auto last = traverseRounds(expand(m_map, startAt(start)), stops, grow, visit);
    if (!last) return 0;

    std::size_t count = 0;
    for (const auto& r : *last)
        if (r.current() == destination) ++count;
    return count;
}

std::optional<RouteQueries::Length>
RouteQueries::shortestRoute(const Station& start, const Station& destination) const {
    std::optional<Length> best;                                         // unset = infinite

    auto grow  = [&](const PartialRoute& r) { return expand(m_map, r); };
    auto visit = [&](const PartialRoute& r) {
        if (best && r.distance >= *best) return Verdict::Drop;          // cannot beat the best
        if (r.current() == destination) {                               // arrived: record, do not go on
            best = r.distance;
            return Verdict::Drop;
        }
        return Verdict::Expand;
    };

    // Seeding one hop out keeps the zero-length route start->start out of the race.
    traverseRounds(expand(m_map, startAt(start)), kUnboundedRounds, grow, visit);
    return best;
}

std::size_t RouteQueries::routesLessThan(const Station& start, const Station& destination,
                                         Distance ceiling) const {
    std::size_t count = 0;

    auto grow  = [&](const PartialRoute& r) { return expand(m_map, r); };
    auto visit = [&](const PartialRoute& r) {
        if (r.distance >= ceiling) return Verdict::Drop;
        if (r.current() == destination) ++count;                        // matches keep going
        return Verdict::Expand;
    };

    traverseRounds(expand(m_map, startAt(start)), kUnboundedRounds, grow, visit);
    return count;
}
