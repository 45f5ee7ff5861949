#pragma once

#include "tabstat/models/iforecaster.hpp"

#include <Eigen/Dense>
#include <algorithm>
#include <limits>
#include <memory>
#include <optional>
#include <stdexcept>
#include <vector>

namespace tabstat::models {

class ARIMABuilder; // Forward declaration

/**
 * Non-seasonal ARIMA(p, d, q) fitted by conditional maximum likelihood.
 *
 * The series is differenced d times; the ARMA part is estimated on the
 * differenced values w_t around a constant mu (the mean when d = 0, the drift
 * when d = 1):
 *
 *   w_t - mu = sum phi_i (w_{t-i} - mu) + e_t + sum theta_j e_{t-j}
 *
 * mu is the sample mean of w_t. phi and theta minimise the conditional sum of
 * squares from Yule-Walker starting values; non-stationary or non-invertible
 * parameter sets are rejected during the search.
 *
 * The likelihood is summed from index max(p, conditioning) of w_t. Models
 * whose information criteria are compared must share the same conditioning.
 */
class ARIMA final : public IForecaster {
public:
	friend class ARIMABuilder;

	void fit(const core::TimeSeries &ts) override;
	void fit(const std::vector<double> &values);
	core::Forecast predict(int horizon) override;

	std::string getName() const override {
		return "ARIMA";
	}

	const std::vector<double> &fittedValues() const override {
		return fitted_values_;
	}

	int p() const {
		return p_;
	}
	int d() const {
		return d_;
	}
	int q() const {
		return q_;
	}
	bool hasConstant() const {
		return include_constant_;
	}
	/// Leading differenced values that only serve as lags.
	int conditioning() const {
		return conditioning_;
	}

	const Eigen::VectorXd &arCoefficients() const {
		return ar_coeffs_;
	}
	const Eigen::VectorXd &maCoefficients() const {
		return ma_coeffs_;
	}
	/// Mean (d = 0) or drift (d = 1) of the differenced series; 0 without a constant.
	double intercept() const {
		return intercept_;
	}
	double sigma2() const {
		return sigma2_;
	}
	/// Residuals of the differenced series, from the first scored index onwards.
	const std::vector<double> &residuals() const {
		return residuals_;
	}
	double logLikelihood() const {
		return log_likelihood_;
	}
	std::optional<double> aic() const {
		return aic_;
	}
	std::optional<double> bic() const {
		return bic_;
	}
	bool isFitted() const {
		return is_fitted_;
	}

	/// Estimated parameters counted by the information criteria, variance included.
	int parameterCount() const;

	/// Observations contributing to the conditional likelihood.
	std::size_t effectiveObservations() const {
		return residuals_.size();
	}

	// Static utility methods (public for testing and flexibility)
	static std::vector<double> difference(const std::vector<double> &data, int d);

	/**
	 * @brief Undoes d rounds of differencing on a forecast.
	 * @param last_values last value of the series after 0, 1, ..., d - 1 differences.
	 */
	static std::vector<double> integrate(const std::vector<double> &forecast_diff,
	                                     const std::vector<double> &last_values, int d);

	/**
	 * @brief True when every root of 1 - c_1 z - ... - c_k z^k lies outside a circle of radius `margin`.
	 *
	 * Pass AR coefficients as-is and negated MA coefficients.
	 */
	static bool rootsOutsideUnitCircle(const Eigen::VectorXd &coeffs, double margin = 1.01);

private:
	ARIMA(int p, int d, int q, bool include_constant, int conditioning);

	std::size_t firstScoredIndex() const {
		return static_cast<std::size_t>(std::max(p_, conditioning_));
	}

	static Eigen::VectorXd yuleWalker(const std::vector<double> &centered, int p);
	double conditionalSumOfSquares(const Eigen::VectorXd &ar, const Eigen::VectorXd &ma,
	                               std::vector<double> *errors_out) const;

	int p_, d_, q_;
	bool include_constant_;
	int conditioning_;
	Eigen::VectorXd ar_coeffs_;
	Eigen::VectorXd ma_coeffs_;
	double intercept_ = 0.0;
	double sigma2_ = 0.0;
	double log_likelihood_ = std::numeric_limits<double>::quiet_NaN();
	std::vector<double> history_;
	std::vector<double> differenced_history_;
	std::vector<double> last_values_;
	// One-step errors over the whole differenced series, zero before index p.
	std::vector<double> innovations_;
	std::vector<double> residuals_;
	std::vector<double> fitted_values_;
	std::optional<double> aic_;
	std::optional<double> bic_;
	bool is_fitted_ = false;
};

class ARIMABuilder {
public:
	ARIMABuilder &withAR(int p);
	ARIMABuilder &withDifferencing(int d);
	ARIMABuilder &withMA(int q);
	/// Defaults to a constant for d <= 1 and none for d = 2.
	ARIMABuilder &withConstant(bool include_constant);
	/// Starts the likelihood at index `n` of the differenced series (p when smaller).
	ARIMABuilder &withConditioning(int n);
	std::unique_ptr<ARIMA> build();

private:
	int p_ = 0;
	int d_ = 0;
	int q_ = 0;
	std::optional<bool> include_constant_;
	int conditioning_ = 0;
};

} // namespace tabstat::models
