#include <chtest.hpp>

#include <chroute/discovery/endpoint.h>

using chroute::StatusCode;
using chroute::discovery::BuildServiceUrl;
using chroute::discovery::Endpoint;
using chroute::discovery::MakeInstanceId;
using chroute::discovery::ParseInstanceId;

TEST_CASE("BuildServiceUrl picks the scheme from the secure flag") {
    Endpoint e;
    e.host = "10.1.2.3";
    e.port = 8080;

    REQUIRE(BuildServiceUrl(e) == "http://10.1.2.3:8080");

    e.secure = true;
    e.port = 8443;
    REQUIRE(BuildServiceUrl(e) == "https://10.1.2.3:8443");
}

TEST_CASE("BuildServiceUrl joins paths with a single slash") {
    Endpoint e;
    e.host = "orders.local";
    e.port = 80;

    REQUIRE(BuildServiceUrl(e, "/api/v1") == "http://orders.local:80/api/v1");
    REQUIRE(BuildServiceUrl(e, "api/v1") == "http://orders.local:80/api/v1");
    REQUIRE(BuildServiceUrl(e, "") == "http://orders.local:80");
}

TEST_CASE("Endpoint metadata lookup") {
    Endpoint e;
    e.metadata["weight"] = "3";

    REQUIRE(e.Metadata("weight") != nullptr);
    REQUIRE(*e.Metadata("weight") == "3");
    REQUIRE(e.Metadata("activeConnections") == nullptr);
}

TEST_CASE("Instance ids round-trip") {
    auto id = MakeInstanceId("orders", "10.0.0.1", 8080);
    REQUIRE(id == "orders:10.0.0.1:8080");

    auto parts = ParseInstanceId(id);
    REQUIRE(parts.ok());
    REQUIRE(parts.value().service == "orders");
    REQUIRE(parts.value().host == "10.0.0.1");
    REQUIRE(parts.value().port == 8080);
}

TEST_CASE("ParseInstanceId rejects malformed ids") {
    REQUIRE(ParseInstanceId("orders:10.0.0.1").status().code() == StatusCode::invalid_argument);
    REQUIRE(ParseInstanceId("orders:10.0.0.1:http").status().code() == StatusCode::invalid_argument);
    REQUIRE(ParseInstanceId("orders:10.0.0.1:70000").status().code() == StatusCode::invalid_argument);
    REQUIRE(ParseInstanceId("orders:10.0.0.1:").status().code() == StatusCode::invalid_argument);

    auto extra = ParseInstanceId("orders:10.0.0.1:8080:blue");
    REQUIRE(extra.ok());
    REQUIRE(extra.value().port == 8080);
}
