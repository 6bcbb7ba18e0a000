#include <chtest.hpp>

#include <chroute/balancer/metadata.h>

#include "test_support.h"

using chroute::Severity;
using chroute::balancer::ActiveConnectionsOf;
using chroute::balancer::AvgResponseTimeOf;
using chroute::balancer::WeightOf;
using chroute::testing::MakeEndpoint;
using chroute::testing::RecordingDiagnostics;

TEST_CASE("Metadata defaults apply when keys are absent") {
    RecordingDiagnostics diag;
    auto e = MakeEndpoint("a");

    REQUIRE(WeightOf(e, diag) == 1);
    REQUIRE(ActiveConnectionsOf(e, diag) == 0);
    REQUIRE(AvgResponseTimeOf(e, diag) == 100);
    REQUIRE(diag.Count(Severity::warn) == 0);
}

TEST_CASE("Metadata values are parsed") {
    RecordingDiagnostics diag;
    auto e = MakeEndpoint("a", {{"weight", "7"}, {"activeConnections", "42"}, {"avgResponseTime", "250"}});

    REQUIRE(WeightOf(e, diag) == 7);
    REQUIRE(ActiveConnectionsOf(e, diag) == 42);
    REQUIRE(AvgResponseTimeOf(e, diag) == 250);
    REQUIRE(diag.Count(Severity::warn) == 0);
}

TEST_CASE("Zero weight is a valid weight") {
    RecordingDiagnostics diag;
    REQUIRE(WeightOf(MakeEndpoint("a", {{"weight", "0"}}), diag) == 0);
    REQUIRE(diag.Count(Severity::warn) == 0);
}

TEST_CASE("Malformed weight falls back to 1 with a warning") {
    RecordingDiagnostics diag;

    REQUIRE(WeightOf(MakeEndpoint("a", {{"weight", "abc"}}), diag) == 1);
    REQUIRE(WeightOf(MakeEndpoint("b", {{"weight", "3x"}}), diag) == 1);
    REQUIRE(WeightOf(MakeEndpoint("c", {{"weight", " 3"}}), diag) == 1);
    REQUIRE(WeightOf(MakeEndpoint("d", {{"weight", ""}}), diag) == 1);
    REQUIRE(WeightOf(MakeEndpoint("e", {{"weight", "-2"}}), diag) == 1);
    REQUIRE(WeightOf(MakeEndpoint("f", {{"weight", "99999999999"}}), diag) == 1);

    REQUIRE(diag.Count(Severity::warn) == 6);
    REQUIRE(diag.Contains("abc"));
    REQUIRE(diag.Contains("weight"));
}

TEST_CASE("Malformed activeConnections falls back to 0") {
    RecordingDiagnostics diag;

    REQUIRE(ActiveConnectionsOf(MakeEndpoint("a", {{"activeConnections", "many"}}), diag) == 0);
    REQUIRE(ActiveConnectionsOf(MakeEndpoint("b", {{"activeConnections", "-1"}}), diag) == 0);
    REQUIRE(diag.Count(Severity::warn) == 2);
}

TEST_CASE("avgResponseTime is clamped to at least 1") {
    RecordingDiagnostics diag;

    REQUIRE(AvgResponseTimeOf(MakeEndpoint("a", {{"avgResponseTime", "0"}}), diag) == 1);
    REQUIRE(AvgResponseTimeOf(MakeEndpoint("b", {{"avgResponseTime", "-30"}}), diag) == 1);
    REQUIRE(diag.Count(Severity::warn) == 0);

    REQUIRE(AvgResponseTimeOf(MakeEndpoint("c", {{"avgResponseTime", "fast"}}), diag) == 100);
    REQUIRE(diag.Count(Severity::warn) == 1);
}

TEST_CASE("A single leading plus sign is accepted") {
    RecordingDiagnostics diag;

    REQUIRE(WeightOf(MakeEndpoint("a", {{"weight", "+3"}}), diag) == 3);
    REQUIRE(ActiveConnectionsOf(MakeEndpoint("b", {{"activeConnections", "+0"}}), diag) == 0);
    REQUIRE(AvgResponseTimeOf(MakeEndpoint("c", {{"avgResponseTime", "+250"}}), diag) == 250);
    REQUIRE(diag.Count(Severity::warn) == 0);

    REQUIRE(WeightOf(MakeEndpoint("d", {{"weight", "+"}}), diag) == 1);
    REQUIRE(WeightOf(MakeEndpoint("e", {{"weight", "++3"}}), diag) == 1);
    REQUIRE(WeightOf(MakeEndpoint("f", {{"weight", "+-3"}}), diag) == 1);
    REQUIRE(AvgResponseTimeOf(MakeEndpoint("g", {{"avgResponseTime", "+-5"}}), diag) == 100);
    REQUIRE(diag.Count(Severity::warn) == 4);
}
