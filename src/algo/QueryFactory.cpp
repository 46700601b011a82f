// ===============================================
// QueryFactory.cpp
// Wraps the five route queries as strategies (IRouteQuery):
//   * DISTANCE  fixed path, stations joined by '-'
//   * CIRCULAR  returns to a station within a hop count
//   * EXACT     routes with an exact number of stops
//   * SHORTEST  shortest distance (start may equal destination)
//   * LESSTHAN  routes shorter than a distance ceiling
// Exposes QueryFactory::create(line) to parse a command into a strategy.
// ===============================================

#include "algo/RouteQuery.hpp"        // interface and factory declaration
#include "algo/RouteQueries.hpp"      // the engine the strategies call
#include <algorithm>                  // std::all_of
#include <cctype>                     // std::tolower, std::isdigit
#include <limits>                     // range check for the ceiling
#include <sstream>                    // tokenizing and describe()
#include <stdexcept>                  // std::invalid_argument
#include <string>
#include <vector>

// ---------- helper: to-lower a string (safe cast to unsigned char) ----------
static std::string to_lower(std::string s) {
    for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

// ---------- helper: non-negative integer argument ----------
static std::uint64_t parse_number(const std::string& tok, const char* what) {
    bool digits = !tok.empty() &&
                  std::all_of(tok.begin(), tok.end(),
                              [](char c){ return std::isdigit(static_cast<unsigned char>(c)) != 0; });
    if (!digits)
        throw std::invalid_argument(std::string("expected a number for ") + what + ", got '" + tok + "'");
    try {
        return std::stoull(tok);
    } catch (const std::out_of_range&) {
        throw std::invalid_argument(std::string(what) + " out of range: " + tok);
    }
}

// ---------- helper: "A-B-C" -> {A, B, C} ----------
static std::vector<RouteMap::Station> split_path(const std::string& tok) {
    std::vector<RouteMap::Station> stops;
    std::string part;
    std::istringstream iss(tok);
    while (std::getline(iss, part, '-')) {
        if (part.empty()) throw std::invalid_argument("empty station in route: " + tok);
        stops.push_back(part);
    }
    if (tok.empty() || tok.back() == '-')
        throw std::invalid_argument("empty station in route: " + tok);
    return stops;
}

// =====================================================
// Strategies
// =====================================================
struct DistanceQuery final : IRouteQuery {
    std::vector<RouteMap::Station> stops;

    QueryResult run(const RouteMap& map) const override {
        auto d = RouteQueries(map).routeDistance(stops);
        if (!d) return std::nullopt;
        return *d;
    }
    std::string describe() const override {
        std::string s = "DISTANCE ";
        for (std::size_t i = 0; i < stops.size(); ++i) {
            if (i) s += '-';
            s += stops[i];
        }
        return s;
    }
};

struct CircularQuery final : IRouteQuery {
    RouteMap::Station start;
    std::size_t hops = 0;

    QueryResult run(const RouteMap& map) const override {
        auto n = RouteQueries(map).circularRoute(start, hops);
        if (!n) return std::nullopt;
        return *n;
    }
    std::string describe() const override {
        return "CIRCULAR " + start + " " + std::to_string(hops);
    }
};

struct ExactStopsQuery final : IRouteQuery {
    RouteMap::Station start, destination;
    std::size_t stops = 0;

    QueryResult run(const RouteMap& map) const override {
        return RouteQueries(map).exactStops(start, destination, stops);
    }
    std::string describe() const override {
        return "EXACT " + start + " " + destination + " " + std::to_string(stops);
    }
};

struct ShortestQuery final : IRouteQuery {
    RouteMap::Station start, destination;

    QueryResult run(const RouteMap& map) const override {
        auto d = RouteQueries(map).shortestRoute(start, destination);
        if (!d) return std::nullopt;
        return *d;
    }
    std::string describe() const override {
        return "SHORTEST " + start + " " + destination;
    }
};

struct LessThanQuery final : IRouteQuery {
    RouteMap::Station start, destination;
    RouteMap::Distance ceiling = 0;

    QueryResult run(const RouteMap& map) const override {
        return RouteQueries(map).routesLessThan(start, destination, ceiling);
    }
    std::string describe() const override {
        return "LESSTHAN " + start + " " + destination + " " + std::to_string(ceiling);
    }
};

// =====================================================
// Factory
// =====================================================
std::unique_ptr<IRouteQuery>
QueryFactory::create(const std::string& line) {
    std::istringstream iss(line);
    std::vector<std::string> toks;
    for (std::string t; iss >> t; ) toks.push_back(t);
    if (toks.empty()) return nullptr;

    const auto kw = to_lower(toks[0]);
    auto expect = [&](std::size_t n, const char* usage) {          // keyword + n arguments
        if (toks.size() != n + 1)
            throw std::invalid_argument(std::string("usage: ") + usage);
    };

    if (kw == "distance") {
        expect(1, "DISTANCE <A-B-...>");
        auto q = std::make_unique<DistanceQuery>();
        q->stops = split_path(toks[1]);
        return q;
    }
    if (kw == "circular") {
        expect(2, "CIRCULAR <start> <hops>");
        auto q = std::make_unique<CircularQuery>();
        q->start = toks[1];
        q->hops  = static_cast<std::size_t>(parse_number(toks[2], "hops"));
        return q;
    }
    if (kw == "exact") {
        expect(3, "EXACT <start> <destination> <stops>");
        auto q = std::make_unique<ExactStopsQuery>();
        q->start       = toks[1];
        q->destination = toks[2];
        q->stops       = static_cast<std::size_t>(parse_number(toks[3], "stops"));
        return q;
    }
    if (kw == "shortest") {
        expect(2, "SHORTEST <start> <destination>");
        auto q = std::make_unique<ShortestQuery>();
        q->start       = toks[1];
        q->destination = toks[2];
        return q;
    }
    if (kw == "lessthan") {
        expect(3, "LESSTHAN <start> <destination> <ceiling>");
        auto value = parse_number(toks[3], "ceiling");
        if (value > std::numeric_limits<RouteMap::Distance>::max())
            throw std::invalid_argument("ceiling out of range: " + toks[3]);
        auto q = std::make_unique<LessThanQuery>();
        q->start       = toks[1];
        q->destination = toks[2];
        q->ceiling     = static_cast<RouteMap::Distance>(value);
        return q;
    }
    return nullptr;                                                 // unknown keyword, caller decides
}

std::string formatResult(const QueryResult& result) {
    return result ? std::to_string(*result) : std::string("NO SUCH ROUTE");
}
