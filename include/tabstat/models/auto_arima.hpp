#pragma once

#include "tabstat/core/forecast.hpp"
#include "tabstat/core/time_series.hpp"
#include "tabstat/models/arima.hpp"
#include "tabstat/models/iforecaster.hpp"

#include <cstddef>
#include <limits>
#include <memory>
#include <string>
#include <vector>

namespace tabstat::models {

/**
 * @brief Model orders selected by AutoARIMA.
 */
struct AutoARIMAComponents {
	int p = 0; // AR order
	int d = 0; // differencing order
	int q = 0; // MA order
	bool include_constant = false;
};

/**
 * @brief Model quality diagnostics of the selected model.
 */
struct AutoARIMAMetrics {
	double log_likelihood = std::numeric_limits<double>::quiet_NaN();
	double aic = std::numeric_limits<double>::quiet_NaN();
	double bic = std::numeric_limits<double>::quiet_NaN();
	double sigma2 = std::numeric_limits<double>::quiet_NaN();
};

/**
 * @brief Diagnostic information about the search.
 */
struct AutoARIMADiagnostics {
	int models_evaluated = 0;
	int models_failed = 0;
	int search_max_p = 0; // bounds after capping by the series length
	int search_max_q = 0;
	std::size_t training_data_size = 0;
};

/**
 * @brief Automatic non-seasonal ARIMA order selection.
 *
 * The differencing order comes from repeated KPSS tests. (p, q) is then chosen
 * by a stepwise AIC search starting from (0,0), (1,0), (0,1) and (2,2) and
 * moving to the best of the eight surrounding orders until none improves or
 * the model budget runs out. Neighbour fits of one step run concurrently;
 * results do not depend on the thread count.
 */
class AutoARIMA : public IForecaster {
public:
	AutoARIMA() = default;

	void fit(const core::TimeSeries &ts) override;
	void fit(const std::vector<double> &values);
	core::Forecast predict(int horizon) override;

	// Configuration methods (method chaining)
	AutoARIMA &setMaxP(int max_p);
	AutoARIMA &setMaxD(int max_d);
	AutoARIMA &setMaxQ(int max_q);
	AutoARIMA &setMaxModels(int max_models);
	/// When false, d is fixed at 0 (ARMA).
	AutoARIMA &setAllowDifferencing(bool allow);
	/// Worker threads for neighbour fits; 0 uses the hardware concurrency.
	AutoARIMA &setThreads(unsigned threads);

	std::string getName() const override {
		return "AutoARIMA";
	}

	const AutoARIMAComponents &components() const;
	const AutoARIMAMetrics &metrics() const;
	const AutoARIMADiagnostics &diagnostics() const;
	const ARIMA &model() const;
	const std::vector<double> &fittedValues() const override;

private:
	struct Order {
		int p = 0;
		int q = 0;
	};

	struct CandidateResult {
		bool valid = false;
		Order order;
		double aic = std::numeric_limits<double>::infinity();
		std::unique_ptr<ARIMA> model;
	};

	class CandidateEvaluator;

	static bool better(const CandidateResult &a, const CandidateResult &b);

	int max_p_ = 5;
	int max_d_ = 2;
	int max_q_ = 5;
	int max_models_ = 94;
	bool allow_differencing_ = true;
	unsigned threads_ = 0;

	AutoARIMAComponents components_;
	AutoARIMAMetrics metrics_;
	AutoARIMADiagnostics diagnostics_;
	std::unique_ptr<ARIMA> fitted_model_;
	bool is_fitted_ = false;
};

} // namespace tabstat::models
