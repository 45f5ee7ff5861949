#pragma once

#include "tabstat/cleaning/tabular_cleaner.hpp"

#include <Eigen/Dense>
#include <cstddef>
#include <limits>
#include <string>
#include <utility>
#include <vector>

namespace tabstat::models {

/**
 * @brief Name of the intercept term in coefficient listings.
 */
inline constexpr const char *kInterceptName = "const";

/**
 * Result of an ordinary least squares fit
 *
 * Coefficient vectors are aligned with `terms`, which always starts with the
 * intercept ("const") followed by the features in request order. Statistics
 * that are undefined for the data (R² of a constant target, for instance) are
 * NaN rather than omitted.
 */
struct RegressionResult {
	std::vector<std::string> terms;

	Eigen::VectorXd coefficients;
	Eigen::VectorXd std_errors;
	Eigen::VectorXd t_values;
	Eigen::VectorXd p_values;

	/// 1 - SS_res / SS_tot
	double r_squared = std::numeric_limits<double>::quiet_NaN();
	/// 1 - (1 - R²)(n - 1)/(n - k - 1)
	double adj_r_squared = std::numeric_limits<double>::quiet_NaN();
	/// (SS_reg / k) / (SS_res / (n - k - 1))
	double f_statistic = std::numeric_limits<double>::quiet_NaN();
	/// Upper tail of F(k, n - k - 1) at f_statistic
	double f_pvalue = std::numeric_limits<double>::quiet_NaN();
	/// sqrt(SS_res / n)
	double rmse = std::numeric_limits<double>::quiet_NaN();

	double ss_res = 0.0;
	double ss_tot = 0.0;
	double log_likelihood = std::numeric_limits<double>::quiet_NaN();
	double aic = std::numeric_limits<double>::quiet_NaN();
	double bic = std::numeric_limits<double>::quiet_NaN();

	std::size_t n_obs = 0;
	std::size_t df_model = 0;
	std::size_t df_resid = 0;

	std::vector<double> fitted;
	std::vector<double> residuals;

	/**
	 * @throws MissingColumnError when `term` is not part of the model.
	 */
	double coefficient(const std::string &term) const;

	/**
	 * @brief (term, coefficient) pairs, intercept first.
	 */
	std::vector<std::pair<std::string, double>> namedCoefficients() const;
};

/**
 * OLS with an intercept, solved with a column-pivoting Householder QR.
 *
 * A rank-deficient design (collinear or constant features) or one with no
 * residual degrees of freedom is rejected as underdetermined instead of
 * producing aliased coefficients.
 */
class LinearRegression {
public:
	/**
	 * @brief Regresses `target` on `features` over a cleaned table.
	 * @throws InvalidParameterError, MissingColumnError, InsufficientDataError, UnderdeterminedSystemError
	 */
	const RegressionResult &fit(const cleaning::CleanedTable &table, const std::string &target,
	                            const std::vector<std::string> &features);

	/**
	 * @brief Fits y on the columns of X; an intercept column is added internally.
	 */
	const RegressionResult &fit(const Eigen::VectorXd &y, const Eigen::MatrixXd &X,
	                            std::vector<std::string> feature_names);

	/**
	 * @brief Predictions for rows laid out in feature order.
	 */
	std::vector<double> predict(const Eigen::MatrixXd &X) const;

	const RegressionResult &result() const;

	bool isFitted() const {
		return is_fitted_;
	}

	// Relative threshold on the R diagonal below which a column counts as dependent.
	static constexpr double kRankTolerance = 1e-10;

private:
	RegressionResult result_;
	bool is_fitted_ = false;
};

} // namespace tabstat::models
