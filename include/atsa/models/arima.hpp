#pragma once

#include "atsa/models/iforecaster.hpp"
#include "atsa/utils/logging.hpp"

#include <Eigen/Dense>

#include <memory>
#include <optional>
#include <vector>

namespace atsa::models {

class ARIMABuilder; // Forward declaration

/**
 * @class ARIMA
 * @brief Multiplicative seasonal ARIMA(p,d,q)(P,D,Q)s model.
 *
 * Coefficients maximise the conditional Gaussian likelihood (conditional sum
 * of squares) starting from Yule-Walker estimates. Forecast intervals come
 * from the psi-weights of the integrated model.
 */
class ARIMA final : public IForecaster {
public:
	friend class ARIMABuilder;

	void fit(const core::TimeSeries &ts) override;
	core::Forecast predict(int horizon, double confidence = 0.95) override;
	std::vector<double> fittedValues() const override;
	nlohmann::json modelInfo() const override;

	std::string getName() const override {
		return "ARIMA";
	}

	const Eigen::VectorXd &arCoefficients() const {
		return ar_coeffs_;
	}
	const Eigen::VectorXd &maCoefficients() const {
		return ma_coeffs_;
	}
	const Eigen::VectorXd &seasonalARCoefficients() const {
		return seasonal_ar_coeffs_;
	}
	const Eigen::VectorXd &seasonalMACoefficients() const {
		return seasonal_ma_coeffs_;
	}
	double intercept() const {
		return intercept_;
	}
	double sigma2() const {
		return sigma2_;
	}
	std::optional<double> aic() const {
		return aic_;
	}
	std::optional<double> bic() const {
		return bic_;
	}

	/// Coefficients of (1-B)^d (1-B^s)^D, constant term first.
	static std::vector<double> differencingPolynomial(int d, int D, int s);

	/// Applies a differencing polynomial; the result is shorter by its degree.
	static std::vector<double> applyDifferencing(const std::vector<double> &data, const std::vector<double> &poly);

private:
	ARIMA(int p, int d, int q, int P, int D, int Q, int s, std::optional<bool> include_intercept);

	struct Expanded {
		std::vector<double> ar; // a_k in w_t = sum a_k w_{t-k} + ...
		std::vector<double> ma; // m_k in ... + e_t + sum m_k e_{t-k}
	};

	Expanded expand(const Eigen::VectorXd &phi, const Eigen::VectorXd &theta, const Eigen::VectorXd &seasonal_phi,
	                const Eigen::VectorXd &seasonal_theta) const;
	std::vector<double> residualsFor(const Expanded &poly, double mu) const;
	void unpack(const std::vector<double> &params, Eigen::VectorXd &phi, Eigen::VectorXd &theta,
	            Eigen::VectorXd &seasonal_phi, Eigen::VectorXd &seasonal_theta, double &mu) const;
	std::vector<double> initialGuess() const;
	void requireFitted(const char *operation) const;

	static bool rootsOutsideUnitCircle(const std::vector<double> &coefficients);

	int p_, d_, q_;
	int P_, D_, Q_;
	int seasonal_period_;
	bool include_intercept_;

	Eigen::VectorXd ar_coeffs_;
	Eigen::VectorXd ma_coeffs_;
	Eigen::VectorXd seasonal_ar_coeffs_;
	Eigen::VectorXd seasonal_ma_coeffs_;
	double intercept_ = 0.0;
	Expanded expanded_;
	std::vector<double> diff_poly_;
	std::vector<double> history_;
	std::vector<double> differenced_;
	std::vector<double> residuals_; // aligned with differenced_
	std::size_t conditioning_ = 0;
	double sigma2_ = 0.0;
	std::optional<double> aic_;
	std::optional<double> bic_;
	double log_likelihood_ = 0.0;
	bool converged_ = false;
	bool is_fitted_ = false;
};

class ARIMABuilder {
public:
	ARIMABuilder &withAR(int p);
	ARIMABuilder &withDifferencing(int d);
	ARIMABuilder &withMA(int q);
	ARIMABuilder &withSeasonalAR(int P);
	ARIMABuilder &withSeasonalDifferencing(int D);
	ARIMABuilder &withSeasonalMA(int Q);
	ARIMABuilder &withSeasonalPeriod(int s);
	/// Overrides the default of fitting a mean only for undifferenced models.
	ARIMABuilder &withIntercept(bool include_intercept);
	std::unique_ptr<ARIMA> build();

private:
	int p_ = 0;
	int d_ = 0;
	int q_ = 0;
	int P_ = 0;
	int D_ = 0;
	int Q_ = 0;
	int s_ = 0;
	std::optional<bool> include_intercept_;
};

} // namespace atsa::models
