#include "tabstat/utils/distributions.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <utility>

namespace tabstat::utils {

namespace {

constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

double clamp01(double value) {
	return std::min(1.0, std::max(0.0, value));
}

// Modified Lentz evaluation of the incomplete beta continued fraction.
std::pair<double, bool> betaContinuedFraction(double a, double b, double x) {
	const int max_iter = std::clamp<int>(400 + static_cast<int>(std::ceil((a + b) * 0.75)), 400, 5000);
	constexpr double eps = 3e-14;
	constexpr double fpmin = 1e-300;

	const double qab = a + b;
	const double qap = a + 1.0;
	const double qam = a - 1.0;

	double c = 1.0;
	double d = 1.0 - qab * x / qap;
	if (std::abs(d) < fpmin) {
		d = fpmin;
	}
	d = 1.0 / d;
	double h = d;

	for (int m = 1; m <= max_iter; ++m) {
		const int m2 = 2 * m;

		double aa = m * (b - m) * x / ((qam + m2) * (a + m2));
		d = 1.0 + aa * d;
		if (std::abs(d) < fpmin) {
			d = fpmin;
		}
		c = 1.0 + aa / c;
		if (std::abs(c) < fpmin) {
			c = fpmin;
		}
		d = 1.0 / d;
		h *= d * c;

		aa = -(a + m) * (qab + m) * x / ((a + m2) * (qap + m2));
		d = 1.0 + aa * d;
		if (std::abs(d) < fpmin) {
			d = fpmin;
		}
		c = 1.0 + aa / c;
		if (std::abs(c) < fpmin) {
			c = fpmin;
		}
		d = 1.0 / d;
		const double del = d * c;
		h *= del;

		if (std::abs(del - 1.0) <= eps) {
			return {h, true};
		}
	}
	return {h, false};
}

} // namespace

double Distributions::incompleteBeta(double a, double b, double x) {
	if (!(x >= 0.0 && x <= 1.0) || !(a > 0.0) || !(b > 0.0) || !std::isfinite(a) || !std::isfinite(b)) {
		return kNaN;
	}
	if (x == 0.0) {
		return 0.0;
	}
	if (x == 1.0) {
		return 1.0;
	}

	const double ln_beta = std::lgamma(a) + std::lgamma(b) - std::lgamma(a + b);
	const double bt = std::exp(a * std::log(x) + b * std::log1p(-x) - ln_beta);

	// The fraction converges quickly only below the mean; use the symmetry relation above it.
	if (x < (a + 1.0) / (a + b + 2.0)) {
		const auto [cf, ok] = betaContinuedFraction(a, b, x);
		return ok ? clamp01(bt * cf / a) : kNaN;
	}
	const auto [cf, ok] = betaContinuedFraction(b, a, 1.0 - x);
	return ok ? clamp01(1.0 - bt * cf / b) : kNaN;
}

double Distributions::fUpperTail(double f, double d1, double d2) {
	if (std::isnan(f) || !(d1 > 0.0) || !(d2 > 0.0)) {
		return kNaN;
	}
	if (f <= 0.0) {
		return 1.0;
	}
	if (std::isinf(f)) {
		return 0.0;
	}
	// P(F > f) = I_{d2 / (d2 + d1 f)}(d2 / 2, d1 / 2)
	const double x = d2 / (d2 + d1 * f);
	return incompleteBeta(d2 / 2.0, d1 / 2.0, x);
}

double Distributions::tTwoSided(double t, double df) {
	if (std::isnan(t) || !(df > 0.0)) {
		return kNaN;
	}
	if (std::isinf(t)) {
		return 0.0;
	}
	const double x = df / (df + t * t);
	return incompleteBeta(df / 2.0, 0.5, x);
}

} // namespace tabstat::utils
