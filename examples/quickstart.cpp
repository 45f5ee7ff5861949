#include "tabstat/analyzer.hpp"
#include "tabstat/core/errors.hpp"
#include "tabstat/utils/logging.hpp"

#include <cmath>
#include <iomanip>
#include <iostream>
#include <random>
#include <string>
#include <vector>

using namespace tabstat;

namespace {

// Daily sales with a weekly pattern, a price column and a few unusable cells.
core::Table buildSalesTable(std::size_t days) {
	std::mt19937 rng(42);
	std::normal_distribution<double> noise(0.0, 4.0);

	std::vector<core::Row> rows;
	rows.reserve(days + 2);
	const auto start = core::calendar::makeTimePoint(2024, 1, 1);
	for (std::size_t i = 0; i < days; ++i) {
		const double price = 9.0 + static_cast<double>(i % 5) * 0.5;
		const double promo = (i % 7 == 5 || i % 7 == 6) ? 1.0 : 0.0;
		const double sales = 200.0 + 0.8 * static_cast<double>(i) - 6.0 * price + 25.0 * promo + noise(rng);

		core::Row row;
		row["date"] = core::calendar::formatIso(start + std::chrono::hours{24} * static_cast<long long>(i));
		row["price"] = price;
		row["promo"] = promo;
		row["sales"] = sales;
		rows.push_back(std::move(row));
	}
	rows.push_back(core::Row{{"date", std::string("unknown")}, {"sales", std::string("n/a")}});
	rows.push_back(core::Row{{"price", std::string("free")}, {"promo", 1.0}});
	return core::Table(std::move(rows));
}

void printCorrelations(const models::CorrelationMatrix &matrix) {
	std::cout << "Correlation matrix (" << matrix.observations() << " rows)\n";
	for (const auto &row : matrix.columns()) {
		std::cout << "  " << std::setw(6) << row;
		for (const auto &column : matrix.columns()) {
			std::cout << std::setw(9) << std::fixed << std::setprecision(3) << matrix.at(row, column);
		}
		std::cout << '\n';
	}
}

void printRegression(const models::RegressionResult &result) {
	std::cout << "OLS sales ~ price + promo (R^2 = " << std::setprecision(3) << result.r_squared << ")\n";
	for (std::size_t i = 0; i < result.terms.size(); ++i) {
		const auto index = static_cast<Eigen::Index>(i);
		std::cout << "  " << std::setw(6) << result.terms[i] << std::setw(10) << result.coefficients(index)
		          << "  p=" << result.p_values(index) << '\n';
	}
}

void printForest(const models::ForestResult &result) {
	std::cout << "Random forest (" << result.n_trees << " trees, in-sample RMSE " << result.metrics.rmse << ")\n";
	for (std::size_t i = 0; i < result.features.size(); ++i) {
		std::cout << "  " << std::setw(6) << result.features[i] << "  importance " << result.importances[i] << '\n';
	}
}

void printForecast(const models::ForecastResult &result) {
	std::cout << "Forecast with " << models::toString(result.model) << ": ARIMA(" << result.p << "," << result.d
	          << "," << result.q << "), AIC " << result.aic << ", in-sample RMSE " << result.rmse << '\n';
	for (std::size_t i = 0; i < result.forecast.horizon(); ++i) {
		std::cout << "  " << core::calendar::formatIso(result.forecast.timestamps[i]) << "  "
		          << result.forecast.point[i] << '\n';
	}
}

} // namespace

int main() {
	AnalysisConfig config;
	config.setSeed(7).setTrees(50).setLogLevel(spdlog::level::info);
	const Analyzer analyzer(config);

	const auto table = buildSalesTable(90);

	try {
		printCorrelations(analyzer.correlate(table, {"sales", "price", "promo"}));
		printRegression(analyzer.fitOls(table, "sales", {"price", "promo"}));
		printForest(analyzer.fitForest(table, "sales", {"price", "promo"}));
		printForecast(analyzer.forecast(table, "date", "sales", 7, "arima"));
	} catch (const AnalysisError &error) {
		TABSTAT_ERROR("Analysis failed: {}", error.what());
		return 1;
	}
	return 0;
}
