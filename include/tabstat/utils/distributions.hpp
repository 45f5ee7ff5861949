#pragma once

namespace tabstat::utils {

/**
 * @brief Tail probabilities for the sampling distributions used in regression inference.
 */
class Distributions final {
public:
	/**
	 * @brief Regularized incomplete beta function I_x(a, b).
	 * @return NaN when x is outside [0, 1] or a, b are not positive.
	 */
	static double incompleteBeta(double a, double b, double x);

	/**
	 * @brief P(F > f) for F ~ F(d1, d2).
	 */
	static double fUpperTail(double f, double d1, double d2);

	/**
	 * @brief P(|T| > |t|) for T ~ Student-t with `df` degrees of freedom.
	 */
	static double tTwoSided(double t, double df);
};

} // namespace tabstat::utils
