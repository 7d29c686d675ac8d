#pragma once

#include <functional>
#include <limits>
#include <vector>

namespace atsa::utils {

/**
 * @class NelderMeadOptimizer
 * @brief Derivative-free simplex minimizer with optional box constraints.
 *
 * Non-finite objective values are treated as +infinity, so objectives may
 * signal infeasible points by returning NaN or infinity.
 */
class NelderMeadOptimizer {
public:
	using Objective = std::function<double(const std::vector<double> &)>;

	struct Options {
		double reflection = 1.0;
		double expansion = 2.0;
		double contraction = 0.5;
		double shrink = 0.5;
		double step = 0.1;      // initial simplex edge, relative to max(|x|, 1) when relative_step
		bool relative_step = false;
		int max_iterations = 1000;
		double tolerance = 1e-8; // spread of objective values across the simplex
		int restarts = 1;        // extra runs seeded from the previous optimum
	};

	struct Result {
		std::vector<double> best;
		double value = std::numeric_limits<double>::quiet_NaN();
		int iterations = 0;
		bool converged = false;
	};

	Result minimize(const Objective &objective, const std::vector<double> &initial, const Options &options,
	                const std::vector<double> &lower_bounds = {}, const std::vector<double> &upper_bounds = {}) const;

private:
	struct Vertex {
		std::vector<double> point;
		double value;
	};

	Result run(const Objective &objective, const std::vector<double> &initial, const Options &options,
	           const std::vector<double> &lower, const std::vector<double> &upper) const;

	static void clamp(std::vector<double> &point, const std::vector<double> &lower, const std::vector<double> &upper);
	static double evaluate(const Objective &objective, const std::vector<double> &point);
};

} // namespace atsa::utils
