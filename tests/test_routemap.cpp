// ==========================
// tests/test_routemap.cpp
// ==========================
// Unit tests for the RouteMap class and the edge-list reader/scanner.
// Uses the doctest framework.
// ==========================

// Enable doctest main entry point (so this file produces a `main()`)
#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest.h"         // doctest framework header

// Include project headers
#include "graph/RouteMap.hpp"   // RouteMap, EdgeSpec, MalformedEdge
#include "graph/EdgeList.hpp"   // scanEdgeList, readEdgeFile, FileUnreadable

#include <cstdio>            // std::remove
#include <fstream>           // std::ofstream for a scratch input file
#include <string>            // std::string
#include <vector>            // std::vector

// ---------------------------
// Test 1: construction from triples and direct lookups
// ---------------------------
TEST_CASE("RouteMap from triples answers single-hop lookups") {
    RouteMap m({{"A","B","5"}, {"B","C","4"}, {"A","D","5"}});
    CHECK(m.lookup("A","B") == 5u);       // direct edge
    CHECK(m.lookup("A","D") == 5u);
    CHECK(m.lookup("B","C") == 4u);
    CHECK_FALSE(m.lookup("B","A"));       // edges are directed
    CHECK_FALSE(m.lookup("C","A"));       // C has no outgoing edges at all
    CHECK(m.stationCount() == 2);         // only A and B are origins
    CHECK(m.edgeCount() == 3);
}

// ---------------------------
// Test 2: repeated pair overwrites, last write wins
// ---------------------------
TEST_CASE("Repeated origin/destination pair keeps the last distance") {
    RouteMap m({{"A","B","5"}, {"A","B","9"}});
    CHECK(m.lookup("A","B") == 9u);
    CHECK(m.edgeCount() == 1);            // still one edge
    CHECK(m.outgoing("A").size() == 1);
}

// ---------------------------
// Test 3: outgoing() is exhaustive and empty for dead ends
// ---------------------------
TEST_CASE("outgoing() lists every edge once and nothing for a dead end") {
    RouteMap m({{"A","B","1"}, {"A","C","2"}, {"A","A","3"}});
    const auto& out = m.outgoing("A");
    CHECK(out.size() == 3);
    CHECK(out.at("B") == 1u);
    CHECK(out.at("C") == 2u);
    CHECK(out.at("A") == 3u);             // self-loop is allowed
    CHECK(m.outgoing("B").empty());       // known only as a destination
    CHECK(m.outgoing("Z").empty());       // never mentioned
    CHECK(m.hasStation("A"));
    CHECK_FALSE(m.hasStation("B"));
}

// ---------------------------
// Test 4: station labels are not limited to one character
// ---------------------------
TEST_CASE("Multi-character station labels") {
    RouteMap m({{"Paddington","Reading","36"}, {"Reading","Swindon","41"}});
    CHECK(m.lookup("Paddington","Reading") == 36u);
    CHECK(m.outgoing("Reading").count("Swindon") == 1);
}

// ---------------------------
// Test 5: malformed triples throw MalformedEdge
// ---------------------------
TEST_CASE("Malformed triples are rejected") {
    using V = std::vector<EdgeSpec>;
    CHECK_THROWS_AS(RouteMap(V{{"A","B","x1"}}), MalformedEdge);          // not a number
    CHECK_THROWS_AS(RouteMap(V{{"A","B","-3"}}), MalformedEdge);          // negative
    CHECK_THROWS_AS(RouteMap(V{{"A","B",""}}), MalformedEdge);            // missing distance
    CHECK_THROWS_AS(RouteMap(V{{"","B","3"}}), MalformedEdge);            // missing origin
    CHECK_THROWS_AS(RouteMap(V{{"A","","3"}}), MalformedEdge);            // missing destination
    CHECK_THROWS_AS(RouteMap(V{{"A","B","4294967296"}}), MalformedEdge);  // does not fit 32 bits
    CHECK_THROWS_AS(RouteMap(V{{"A","B","99999999999999999999999"}}), MalformedEdge);
    CHECK_NOTHROW(RouteMap(V{{"A","B","0"}}));                            // zero parses
    CHECK_NOTHROW(RouteMap(V{{"A","B","4294967295"}}));
}

// ---------------------------
// Test 6: MalformedEdge is an invalid_argument
// ---------------------------
TEST_CASE("MalformedEdge derives from std::invalid_argument") {
    CHECK_THROWS_AS(RouteMap(std::vector<EdgeSpec>{{"A","B","?"}}), std::invalid_argument);
}

// ---------------------------
// Test 7: scanning free-form text
// ---------------------------
TEST_CASE("scanEdgeList finds tokens regardless of separators") {
    auto edges = scanEdgeList("AB5, BC4\nCD8;;DC8 xx ab12");
    REQUIRE(edges.size() == 5);
    CHECK(edges[0].origin == "A");
    CHECK(edges[0].destination == "B");
    CHECK(edges[0].distance == "5");
    CHECK(edges[3].origin == "D");
    CHECK(edges[4].origin == "a");        // lower-case letters are stations too
    CHECK(edges[4].distance == "12");     // the whole digit run
}

TEST_CASE("scanEdgeList ignores text without edge tokens") {
    CHECK(scanEdgeList("").empty());
    CHECK(scanEdgeList("A B 5, 12, A5B").empty());
}

// ---------------------------
// Test 8: fromText end to end
// ---------------------------
TEST_CASE("RouteMap::fromText builds the reference map") {
    auto m = RouteMap::fromText("AB5, BC4, CD8, DC8, DE6, AD5, CE2, EB3, AE7");
    CHECK(m.stationCount() == 5);
    CHECK(m.edgeCount() == 9);
    CHECK(m.lookup("C","E") == 2u);
    CHECK(m.lookup("E","B") == 3u);
    CHECK_FALSE(m.lookup("E","D"));
}

TEST_CASE("RouteMap::fromText on empty input gives an empty map") {
    auto m = RouteMap::fromText("nothing to see here");
    CHECK(m.stationCount() == 0);
    CHECK(m.outgoing("A").empty());
}

// ---------------------------
// Test 9: label()
// ---------------------------
TEST_CASE("RouteMap::label() reports stations and edges") {
    auto m = RouteMap::fromText("AB1 BC2 BA3");
    CHECK(m.label() == "RouteMap(2S,3E)");
}

// ---------------------------
// Test 10: reading the input file
// ---------------------------
TEST_CASE("readEdgeFile returns the file content") {
    const std::string path = "test_routemap_input.txt";
    {
        std::ofstream out(path);
        out << "AB5, BC4\n";
    }
    CHECK(readEdgeFile(path) == "AB5, BC4\n");
    std::remove(path.c_str());
}

TEST_CASE("readEdgeFile on a missing file throws FileUnreadable") {
    CHECK_THROWS_AS(readEdgeFile("/nonexistent/dir/routes.txt"), FileUnreadable);
}
