// ==========================
// RouteMap.cpp
// ==========================
// This file implements the out-of-line methods of the RouteMap class.
// Specifically: construction, fromText(), addEdge() and label().
// Lookups are inline in RouteMap.hpp.
// ==========================

#include "graph/RouteMap.hpp"   // include the RouteMap class declaration
#include "graph/EdgeList.hpp"   // scanEdgeList() for fromText()
#include <algorithm>            // std::all_of for digit checks
#include <cctype>               // std::isdigit
#include <limits>               // numeric_limits<Distance>
#include <sstream>              // used for building strings in label()

const RouteMap::Adjacency RouteMap::kNoEdges{};

// --------------------------
// Constructor
// --------------------------
// Purpose:
//   Build the adjacency from raw triples, in input order.
// Throws:
//   MalformedEdge on the first bad triple.
RouteMap::RouteMap(const std::vector<EdgeSpec>& edges) {
    for (const auto& e : edges) addEdge(e);             // later duplicates overwrite earlier ones
}

RouteMap RouteMap::fromText(const std::string& text) {
    return RouteMap(scanEdgeList(text));
}

// --------------------------
// addEdge
// --------------------------
// Purpose:
//   Validate one triple and insert origin->destination.
//   - origin and destination must be non-empty
//   - distance must be all digits and fit a Distance
//   A pair seen before keeps its slot and takes the new distance.
void RouteMap::addEdge(const EdgeSpec& edge) {
    if (edge.origin.empty() || edge.destination.empty())
        throw MalformedEdge("edge is missing its origin or destination");

    const std::string& tok = edge.distance;
    bool digits = !tok.empty() &&
                  std::all_of(tok.begin(), tok.end(),
                              [](char c){ return std::isdigit(static_cast<unsigned char>(c)) != 0; });
    if (!digits)
        throw MalformedEdge("bad distance '" + tok + "' on edge " + edge.origin + edge.destination);

    unsigned long long value = 0;
    try {
        value = std::stoull(tok);
    } catch (const std::out_of_range&) {
        throw MalformedEdge("distance '" + tok + "' is out of range on edge " + edge.origin + edge.destination);
    }
    if (value > std::numeric_limits<Distance>::max())
        throw MalformedEdge("distance '" + tok + "' is out of range on edge " + edge.origin + edge.destination);

    auto& adj = m_adj[edge.origin];                      // creates the origin on first use
    auto inserted = adj.insert_or_assign(edge.destination, static_cast<Distance>(value));
    if (inserted.second) ++m_edges;                      // overwrite does not add an edge
}

// --------------------------
// label
// --------------------------
// Format:
//   "RouteMap(SS,EE)" where SS = stations with outgoing edges, EE = edges.
std::string RouteMap::label() const {
    std::ostringstream oss;                              // create a string stream
    oss << "RouteMap(" << stationCount() << "S," << edgeCount() << "E)";
    return oss.str();                                    // return composed string
}
