#include <chtest.hpp>

#include <chroute/core/diagnostics.h>
#include <chroute/core/log.h>
#include <chroute/core/status.h>

TEST_CASE("Log levels parse with an info fallback") {
    REQUIRE(chroute::log::ParseLevel("debug") == chlog::level::debug);
    REQUIRE(chroute::log::ParseLevel("warning") == chlog::level::warn);
    REQUIRE(chroute::log::ParseLevel("off") == chlog::level::off);
    REQUIRE(chroute::log::ParseLevel("verbose") == chlog::level::info);
}

TEST_CASE("Default diagnostics forward to the logger") {
    chroute::log::Init("off");
    chroute::log::Init("off");

    auto diag = chroute::DefaultDiagnostics();
    REQUIRE(diag != nullptr);
    REQUIRE(diag == chroute::DefaultDiagnostics());
    diag->Warn("suppressed at level off");
    diag->Error("suppressed at level off");
}

TEST_CASE("Status renders code and message") {
    chroute::Status st(chroute::StatusCode::unavailable, "no endpoints");
    REQUIRE(!st.ok());
    REQUIRE(st.ToString() == "unavailable: no endpoints");
    REQUIRE(chroute::Status::Ok().ToString() == "ok");
}

TEST_CASE("Log level gates diagnostics") {
    chroute::log::Init("warn");
    REQUIRE(!chroute::log::Enabled(chlog::level::debug));
    REQUIRE(!chroute::log::Enabled(chlog::level::info));
    REQUIRE(chroute::log::Enabled(chlog::level::warn));
    REQUIRE(chroute::log::Enabled(chlog::level::error));

    chroute::LogDiagnostics diag;
    REQUIRE(!diag.Enabled(chroute::Severity::debug));
    REQUIRE(diag.Enabled(chroute::Severity::error));

    chroute::log::Init("off");
    REQUIRE(!chroute::log::Enabled(chlog::level::error));
    REQUIRE(!diag.Enabled(chroute::Severity::error));

    chroute::NullDiagnostics none;
    REQUIRE(!none.Enabled(chroute::Severity::error));
}
