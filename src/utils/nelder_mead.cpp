#include "atsa/utils/nelder_mead.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace atsa::utils {

void NelderMeadOptimizer::clamp(std::vector<double> &point, const std::vector<double> &lower,
                                const std::vector<double> &upper) {
	for (std::size_t i = 0; i < point.size(); ++i) {
		if (!lower.empty()) {
			point[i] = std::max(lower[i], point[i]);
		}
		if (!upper.empty()) {
			point[i] = std::min(upper[i], point[i]);
		}
	}
}

double NelderMeadOptimizer::evaluate(const Objective &objective, const std::vector<double> &point) {
	const double value = objective(point);
	return std::isfinite(value) ? value : std::numeric_limits<double>::infinity();
}

NelderMeadOptimizer::Result NelderMeadOptimizer::minimize(const Objective &objective,
                                                          const std::vector<double> &initial,
                                                          const Options &options,
                                                          const std::vector<double> &lower_bounds,
                                                          const std::vector<double> &upper_bounds) const {
	if (initial.empty()) {
		throw std::invalid_argument("Nelder-Mead requires at least one parameter.");
	}
	if ((!lower_bounds.empty() && lower_bounds.size() != initial.size()) ||
	    (!upper_bounds.empty() && upper_bounds.size() != initial.size())) {
		throw std::invalid_argument("Bounds must match the number of parameters.");
	}

	Result best = run(objective, initial, options, lower_bounds, upper_bounds);
	for (int r = 0; r < options.restarts; ++r) {
		Result next = run(objective, best.best, options, lower_bounds, upper_bounds);
		next.iterations += best.iterations;
		const bool improved = next.value < best.value - options.tolerance;
		best = next.value <= best.value ? next : best;
		if (!improved) {
			break;
		}
	}
	return best;
}

NelderMeadOptimizer::Result NelderMeadOptimizer::run(const Objective &objective, const std::vector<double> &initial,
                                                     const Options &options, const std::vector<double> &lower,
                                                     const std::vector<double> &upper) const {
	const std::size_t n = initial.size();
	std::vector<Vertex> simplex;
	simplex.reserve(n + 1);

	std::vector<double> start = initial;
	clamp(start, lower, upper);
	simplex.push_back({start, evaluate(objective, start)});
	for (std::size_t i = 0; i < n; ++i) {
		std::vector<double> vertex = start;
		const double scale = options.relative_step ? std::max(std::abs(start[i]), 1.0) : 1.0;
		double step = options.step * scale;
		// Step inward when the upper bound would swallow the move.
		if (!upper.empty() && vertex[i] + step > upper[i]) {
			step = -step;
		}
		vertex[i] += step;
		clamp(vertex, lower, upper);
		simplex.push_back({vertex, evaluate(objective, vertex)});
	}

	const auto by_value = [](const Vertex &lhs, const Vertex &rhs) { return lhs.value < rhs.value; };
	const auto toward = [&](const std::vector<double> &from, const std::vector<double> &to, double coefficient) {
		std::vector<double> out(n);
		for (std::size_t j = 0; j < n; ++j) {
			out[j] = from[j] + coefficient * (to[j] - from[j]);
		}
		clamp(out, lower, upper);
		return out;
	};

	Result result;
	std::sort(simplex.begin(), simplex.end(), by_value);
	for (int iter = 0; iter < options.max_iterations; ++iter) {
		result.iterations = iter + 1;
		const double spread = simplex.back().value - simplex.front().value;
		if (std::isfinite(spread) && std::abs(spread) <= options.tolerance * (1.0 + std::abs(simplex.front().value))) {
			result.converged = true;
			break;
		}

		std::vector<double> center(n, 0.0);
		for (std::size_t i = 0; i < n; ++i) {
			for (std::size_t j = 0; j < n; ++j) {
				center[j] += simplex[i].point[j] / static_cast<double>(n);
			}
		}

		Vertex &worst = simplex.back();
		auto reflected = toward(center, worst.point, -options.reflection);
		const double reflected_value = evaluate(objective, reflected);

		if (reflected_value < simplex.front().value) {
			auto expanded = toward(center, reflected, options.expansion);
			const double expanded_value = evaluate(objective, expanded);
			worst = expanded_value < reflected_value ? Vertex {std::move(expanded), expanded_value}
			                                         : Vertex {std::move(reflected), reflected_value};
		} else if (reflected_value < simplex[n - 1].value) {
			worst = {std::move(reflected), reflected_value};
		} else {
			const bool outside = reflected_value < worst.value;
			auto contracted = toward(center, outside ? reflected : worst.point, options.contraction);
			const double contracted_value = evaluate(objective, contracted);
			if (contracted_value < std::min(worst.value, reflected_value)) {
				worst = {std::move(contracted), contracted_value};
			} else {
				for (std::size_t i = 1; i <= n; ++i) {
					simplex[i].point = toward(simplex.front().point, simplex[i].point, options.shrink);
					simplex[i].value = evaluate(objective, simplex[i].point);
				}
			}
		}
		std::sort(simplex.begin(), simplex.end(), by_value);
	}

	result.best = simplex.front().point;
	result.value = simplex.front().value;
	return result;
}

} // namespace atsa::utils
