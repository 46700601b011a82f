#pragma once                              // ensure this header is included only once per translation unit
#include "graph/RouteMap.hpp"             // Station, Length, outgoing()
#include <cstddef>                        // std::size_t round counts
#include <iterator>                       // std::make_move_iterator
#include <limits>                         // kUnboundedRounds
#include <optional>                       // aborted traversal has no frontier
#include <utility>                        // std::move
#include <vector>                         // frontiers

/**
 * @brief One concrete walk through the map: every stop from the query start to
 *        the current position, plus the distance covered so far.
 */
struct PartialRoute {
    std::vector<RouteMap::Station> stops;                           // stops[0] = start, back() = current
    RouteMap::Length distance = 0;                                  // sum of traversed edges

    const RouteMap::Station& current() const { return stops.back(); }
};

// Route starting (and standing) at `start`, nothing travelled yet.
PartialRoute startAt(const RouteMap::Station& start);

// One-hop extensions of `route`, one per outgoing edge of its current station.
// A dead end yields an empty vector.
std::vector<PartialRoute> expand(const RouteMap& map, const PartialRoute& route);

// What the per-node hook decides for a frontier member.
enum class Verdict {
    Drop,    // forget this node
    Expand,  // its children join the next round
    Abort    // stop the whole traversal, no result
};

// Round limit for traversals that run until the frontier dies out.
constexpr std::size_t kUnboundedRounds = std::numeric_limits<std::size_t>::max();

/**
 * @brief Breadth-first traversal by rounds.
 *
 * Each round hands every frontier node to `visit`; nodes it wants expanded are
 * passed to `grow` and their children form the next frontier. Stops after
 * `rounds` rounds or when the frontier is empty, whichever comes first.
 *
 * @return the last frontier, or std::nullopt if `visit` returned Abort.
 */
template <typename Node, typename Grow, typename Visit>
std::optional<std::vector<Node>> traverseRounds(std::vector<Node> frontier,
                                                std::size_t rounds,
                                                Grow&& grow,
                                                Visit&& visit) {
    std::vector<Node> next;                                         // next round's frontier
    for (std::size_t r = 0; r < rounds && !frontier.empty(); ++r) {
        for (const Node& node : frontier) {
            Verdict v = visit(node);
            if (v == Verdict::Abort) return std::nullopt;
            if (v == Verdict::Drop) continue;
            std::vector<Node> children = grow(node);
            next.insert(next.end(),
                        std::make_move_iterator(children.begin()),
                        std::make_move_iterator(children.end()));
        }
        frontier.swap(next);                                        // advance one hop
        next.clear();
    }
    return std::optional<std::vector<Node>>(std::move(frontier));
}
