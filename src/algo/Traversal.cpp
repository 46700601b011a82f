#include "algo/Traversal.hpp"               // PartialRoute, expand()

PartialRoute startAt(const RouteMap::Station& start) {
    PartialRoute r;
    r.stops.push_back(start);
    return r;
}

std::vector<PartialRoute> expand(const RouteMap& map, const PartialRoute& route) {
    const auto& edges = map.outgoing(route.current());             // empty for a dead end
    std::vector<PartialRoute> out;
    out.reserve(edges.size());
    for (const auto& e : edges) {                                   // e = (destination, distance)
        PartialRoute r;
        r.stops = route.stops;                                     // copy the walk so far
        r.stops.push_back(e.first);                                 // step onto the destination
        r.distance = route.distance + e.second;
        out.push_back(std::move(r));
    }
    return out;
}
