#pragma once                              // ensure this header is included only once per translation unit

#include <cstddef>       // defines std::size_t type
#include <cstdint>       // std::uint32_t for distances
#include <optional>      // lookup() may have no answer
#include <stdexcept>     // base for MalformedEdge
#include <string>        // station labels and label()
#include <unordered_map> // adjacency storage
#include <vector>        // construction input

// ==========================
// Immutable rail map
// ==========================
// Directed, weighted adjacency keyed by station label:
// - Built once from (origin, destination, distance) triples
// - Repeated origin/destination pair: last distance wins
// - Only stations with outgoing edges appear as keys
// - Read-only afterwards, safe to share between queries
// ==========================

// Thrown when an edge triple cannot be turned into an edge.
class MalformedEdge : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

// One raw edge as it came out of the input, distance still a token.
struct EdgeSpec {
    std::string origin;
    std::string destination;
    std::string distance;
};

class RouteMap {
public:
    // Type aliases for readability
    using Station   = std::string;                                  // opaque station label
    using Distance  = std::uint32_t;                                // one edge
    using Length    = std::uint64_t;                                // sum of edges along a route
    using Adjacency = std::unordered_map<Station, Distance>;        // destination -> distance

    // ---- Constructors ----

    // Empty map (no stations)
    RouteMap() = default;

    // Build from raw triples; throws MalformedEdge on a bad triple
    explicit RouteMap(const std::vector<EdgeSpec>& edges);

    // Scan free-form text for edge tokens and build from them
    static RouteMap fromText(const std::string& text);

    // ---- Public API ----

    // Distance of the direct edge origin->destination, if any
    std::optional<Distance> lookup(const Station& origin, const Station& destination) const {
        auto it = m_adj.find(origin);
        if (it == m_adj.end()) return std::nullopt;
        auto e = it->second.find(destination);
        if (e == it->second.end()) return std::nullopt;
        return e->second;
    }

    // All (destination, distance) pairs leaving `station`; empty for a dead end
    const Adjacency& outgoing(const Station& station) const {
        auto it = m_adj.find(station);
        return it == m_adj.end() ? kNoEdges : it->second;
    }

    // Return true if `station` has at least one outgoing edge
    bool hasStation(const Station& station) const {
        return m_adj.count(station) > 0;
    }

    // Number of stations with outgoing edges
    std::size_t stationCount() const noexcept { return m_adj.size(); }

    // Number of distinct directed edges
    std::size_t edgeCount() const noexcept { return m_edges; }

    // Return a human-readable summary of the map (implemented in RouteMap.cpp)
    std::string label() const;

private:
    static const Adjacency kNoEdges;                                // shared empty adjacency
    std::unordered_map<Station, Adjacency> m_adj;                   // origin -> adjacency
    std::size_t m_edges = 0;                                        // distinct edge count

    // Helper: validate a triple and store it (implemented in RouteMap.cpp)
    void addEdge(const EdgeSpec& edge);
}; // end class RouteMap
