#include <catch2/catch.hpp>

#include "tabstat/core/errors.hpp"

#include <stdexcept>
#include <string>

using namespace tabstat;

TEST_CASE("Error kinds have stable identifiers", "[core][errors]") {
	REQUIRE(toString(ErrorKind::MissingColumn) == "MissingColumn");
	REQUIRE(toString(ErrorKind::InsufficientData) == "InsufficientData");
	REQUIRE(toString(ErrorKind::UnderdeterminedSystem) == "UnderdeterminedSystem");
	REQUIRE(toString(ErrorKind::InvalidParameter) == "InvalidParameter");
	REQUIRE(toString(ErrorKind::ModelFitFailed) == "ModelFitFailed");
}

TEST_CASE("MissingColumnError names the column", "[core][errors]") {
	const MissingColumnError error("revenue");
	REQUIRE(error.kind() == ErrorKind::MissingColumn);
	REQUIRE(error.column() == "revenue");
	REQUIRE(error.diagnostic() == "column 'revenue' not found in table");
	REQUIRE(std::string(error.what()) == "MissingColumn: column 'revenue' not found in table");
}

TEST_CASE("Typed errors are caught as AnalysisError and runtime_error", "[core][errors]") {
	REQUIRE_THROWS_AS(throw InsufficientDataError("no rows"), AnalysisError);
	REQUIRE_THROWS_AS(throw ModelFitFailedError("nothing converged"), std::runtime_error);

	try {
		throw UnderdeterminedSystemError("3 rows for 2 features");
	} catch (const AnalysisError &error) {
		REQUIRE(error.kind() == ErrorKind::UnderdeterminedSystem);
		REQUIRE(error.diagnostic() == "3 rows for 2 features");
	}
}
