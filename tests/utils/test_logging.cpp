#include <catch2/catch.hpp>

#include "tabstat/utils/logging.hpp"

#include <spdlog/spdlog.h>

using tabstat::utils::Logging;

TEST_CASE("Logging exposes one shared logger", "[utils][logging]") {
	auto &first = Logging::getLogger();
	auto &second = Logging::getLogger();
	REQUIRE(first != nullptr);
	REQUIRE(first.get() == second.get());
	REQUIRE(first->name() == "tabstat");
	REQUIRE(spdlog::get("tabstat") == first);
}

TEST_CASE("Logging init changes the level in place", "[utils][logging]") {
	const auto *before = Logging::getLogger().get();

	Logging::init(spdlog::level::debug);
	REQUIRE(Logging::getLogger().get() == before);
	REQUIRE(Logging::getLogger()->level() == spdlog::level::debug);
	REQUIRE_NOTHROW(TABSTAT_DEBUG("debug message with {} argument", 1));

	Logging::init();
	REQUIRE(Logging::getLogger()->level() == spdlog::level::warn);
}
