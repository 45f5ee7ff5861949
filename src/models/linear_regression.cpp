#include "tabstat/models/linear_regression.hpp"

#include "tabstat/core/errors.hpp"
#include "tabstat/utils/distributions.hpp"
#include "tabstat/utils/logging.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace tabstat::models {

namespace {

constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();
constexpr double kPi = 3.14159265358979323846;

} // namespace

double RegressionResult::coefficient(const std::string &term) const {
	const auto it = std::find(terms.begin(), terms.end(), term);
	if (it == terms.end()) {
		throw MissingColumnError(term);
	}
	return coefficients(static_cast<Eigen::Index>(std::distance(terms.begin(), it)));
}

std::vector<std::pair<std::string, double>> RegressionResult::namedCoefficients() const {
	std::vector<std::pair<std::string, double>> named;
	named.reserve(terms.size());
	for (std::size_t i = 0; i < terms.size(); ++i) {
		named.emplace_back(terms[i], coefficients(static_cast<Eigen::Index>(i)));
	}
	return named;
}

const RegressionResult &LinearRegression::fit(const cleaning::CleanedTable &table, const std::string &target,
                                              const std::vector<std::string> &features) {
	if (features.empty()) {
		throw InvalidParameterError("at least one feature is required");
	}
	if (std::find(features.begin(), features.end(), target) != features.end()) {
		throw InvalidParameterError("target '" + target + "' cannot also be a feature");
	}
	for (std::size_t i = 0; i < features.size(); ++i) {
		if (std::find(features.begin(), features.begin() + static_cast<std::ptrdiff_t>(i), features[i]) !=
		    features.begin() + static_cast<std::ptrdiff_t>(i)) {
			throw InvalidParameterError("feature '" + features[i] + "' listed twice");
		}
	}

	const auto &y_values = table.column(target);
	const auto n = static_cast<Eigen::Index>(table.rowCount());
	const auto k = static_cast<Eigen::Index>(features.size());

	Eigen::VectorXd y = Eigen::Map<const Eigen::VectorXd>(y_values.data(), n);
	Eigen::MatrixXd X(n, k);
	for (Eigen::Index j = 0; j < k; ++j) {
		const auto &column = table.column(features[static_cast<std::size_t>(j)]);
		X.col(j) = Eigen::Map<const Eigen::VectorXd>(column.data(), n);
	}
	return fit(y, X, features);
}

const RegressionResult &LinearRegression::fit(const Eigen::VectorXd &y, const Eigen::MatrixXd &X,
                                              std::vector<std::string> feature_names) {
	if (X.rows() != y.size()) {
		throw std::invalid_argument("Design matrix and response must have the same number of rows.");
	}
	if (static_cast<Eigen::Index>(feature_names.size()) != X.cols()) {
		throw std::invalid_argument("Feature names must match the design matrix columns.");
	}
	if (X.cols() == 0) {
		throw InvalidParameterError("at least one feature is required");
	}

	const auto n = static_cast<std::size_t>(y.size());
	const auto k = static_cast<std::size_t>(X.cols());
	if (n == 0) {
		throw InsufficientDataError("no rows left after cleaning");
	}
	if (n <= k + 1) {
		throw UnderdeterminedSystemError("need more than " + std::to_string(k + 1) + " rows for " +
		                                 std::to_string(k) + " feature(s), got " + std::to_string(n));
	}

	const auto p = static_cast<Eigen::Index>(k + 1);
	Eigen::MatrixXd design(static_cast<Eigen::Index>(n), p);
	design.col(0).setOnes();
	design.rightCols(static_cast<Eigen::Index>(k)) = X;

	Eigen::ColPivHouseholderQR<Eigen::MatrixXd> qr(design);
	qr.setThreshold(kRankTolerance);
	if (qr.rank() < p) {
		throw UnderdeterminedSystemError("design matrix is rank deficient (rank " + std::to_string(qr.rank()) +
		                                 " of " + std::to_string(p) + "); features are collinear or constant");
	}

	RegressionResult result;
	result.terms.reserve(static_cast<std::size_t>(p));
	result.terms.emplace_back(kInterceptName);
	for (auto &name : feature_names) {
		result.terms.push_back(std::move(name));
	}

	result.coefficients = qr.solve(y);
	const Eigen::VectorXd fitted = design * result.coefficients;
	const Eigen::VectorXd residuals = y - fitted;

	result.n_obs = n;
	result.df_model = k;
	result.df_resid = n - k - 1;
	const double n_d = static_cast<double>(n);
	const double k_d = static_cast<double>(k);
	const double df_resid = static_cast<double>(result.df_resid);

	const double y_mean = y.mean();
	result.ss_res = residuals.squaredNorm();
	result.ss_tot = (y.array() - y_mean).matrix().squaredNorm();
	result.rmse = std::sqrt(result.ss_res / n_d);

	// A constant target leaves nothing to explain.
	const double scale = y.squaredNorm();
	const bool constant_target = result.ss_tot <= std::numeric_limits<double>::epsilon() * std::max(1.0, scale);
	if (!constant_target) {
		result.r_squared = 1.0 - result.ss_res / result.ss_tot;
		result.adj_r_squared = 1.0 - (1.0 - result.r_squared) * (n_d - 1.0) / df_resid;
		const double ss_reg = std::max(0.0, result.ss_tot - result.ss_res);
		if (result.ss_res > 0.0) {
			result.f_statistic = (ss_reg / k_d) / (result.ss_res / df_resid);
			result.f_pvalue = utils::Distributions::fUpperTail(result.f_statistic, k_d, df_resid);
		} else {
			result.f_statistic = std::numeric_limits<double>::infinity();
			result.f_pvalue = 0.0;
		}
	} else {
		TABSTAT_DEBUG("OLS target is constant; R-squared and F statistic are undefined");
	}

	// Coefficient covariance sigma^2 (X'X)^-1 with X P = Q R, so (X'X)^-1 = P R^-1 R^-T P'.
	const double sigma2 = result.ss_res / df_resid;
	const Eigen::MatrixXd R = qr.matrixR().topLeftCorner(p, p).triangularView<Eigen::Upper>();
	const Eigen::MatrixXd R_inv = R.triangularView<Eigen::Upper>().solve(Eigen::MatrixXd::Identity(p, p));
	const Eigen::MatrixXd unscaled = qr.colsPermutation() * (R_inv * R_inv.transpose()) *
	                                 qr.colsPermutation().transpose();

	result.std_errors.resize(p);
	result.t_values.resize(p);
	result.p_values.resize(p);
	for (Eigen::Index i = 0; i < p; ++i) {
		const double se = std::sqrt(std::max(0.0, sigma2 * unscaled(i, i)));
		result.std_errors(i) = se;
		if (se > 0.0) {
			result.t_values(i) = result.coefficients(i) / se;
			result.p_values(i) = utils::Distributions::tTwoSided(result.t_values(i), df_resid);
		} else {
			result.t_values(i) = kNaN;
			result.p_values(i) = kNaN;
		}
	}

	if (result.ss_res > 0.0) {
		result.log_likelihood = -0.5 * n_d * (std::log(2.0 * kPi * result.ss_res / n_d) + 1.0);
		result.aic = -2.0 * result.log_likelihood + 2.0 * static_cast<double>(p);
		result.bic = -2.0 * result.log_likelihood + static_cast<double>(p) * std::log(n_d);
	} else {
		result.log_likelihood = std::numeric_limits<double>::infinity();
		result.aic = -std::numeric_limits<double>::infinity();
		result.bic = -std::numeric_limits<double>::infinity();
	}

	result.fitted.assign(fitted.data(), fitted.data() + fitted.size());
	result.residuals.assign(residuals.data(), residuals.data() + residuals.size());

	TABSTAT_DEBUG("OLS fitted {} terms on {} rows: R2={:.4f}, F={:.4f}", p, n, result.r_squared, result.f_statistic);

	result_ = std::move(result);
	is_fitted_ = true;
	return result_;
}

std::vector<double> LinearRegression::predict(const Eigen::MatrixXd &X) const {
	const auto &fitted = result();
	if (X.cols() + 1 != fitted.coefficients.size()) {
		throw std::invalid_argument("Prediction rows must have one value per feature.");
	}
	const Eigen::VectorXd predictions =
	    (X * fitted.coefficients.tail(X.cols())).array() + fitted.coefficients(0);
	return std::vector<double>(predictions.data(), predictions.data() + predictions.size());
}

const RegressionResult &LinearRegression::result() const {
	if (!is_fitted_) {
		throw std::logic_error("LinearRegression: call fit() before accessing results.");
	}
	return result_;
}

} // namespace tabstat::models
