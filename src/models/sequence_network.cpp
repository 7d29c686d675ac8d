#include "atsa/models/sequence_network.hpp"

#include "atsa/core/errors.hpp"
#include "atsa/utils/logging.hpp"
#include "atsa/utils/statistics.hpp"

#include <Eigen/Dense>

#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>
#include <random>

namespace atsa::models {

namespace {

using Matrix = Eigen::MatrixXd;

Matrix sigmoid(const Matrix &z) {
	return (1.0 / (1.0 + (-z.array()).exp())).matrix();
}

Matrix glorotUniform(Eigen::Index rows, Eigen::Index cols, std::mt19937 &rng) {
	const double limit = std::sqrt(6.0 / static_cast<double>(rows + cols));
	std::uniform_real_distribution<double> dist(-limit, limit);
	Matrix out(rows, cols);
	for (Eigen::Index i = 0; i < rows; ++i) {
		for (Eigen::Index j = 0; j < cols; ++j) {
			out(i, j) = dist(rng);
		}
	}
	return out;
}

// Matrix with orthonormal columns from the QR decomposition of a Gaussian draw.
Matrix orthogonal(Eigen::Index rows, Eigen::Index cols, std::mt19937 &rng) {
	std::normal_distribution<double> dist(0.0, 1.0);
	Matrix draw(rows, cols);
	for (Eigen::Index i = 0; i < rows; ++i) {
		for (Eigen::Index j = 0; j < cols; ++j) {
			draw(i, j) = dist(rng);
		}
	}
	Eigen::HouseholderQR<Matrix> qr(draw);
	Matrix q = qr.householderQ() * Matrix::Identity(rows, cols);
	const Matrix r = qr.matrixQR().topLeftCorner(cols, cols);
	for (Eigen::Index j = 0; j < cols; ++j) {
		if (r(j, j) < 0.0) {
			q.col(j) *= -1.0;
		}
	}
	return q;
}

struct Adam {
	double learning_rate = 0.001;
	double beta1 = 0.9;
	double beta2 = 0.999;
	double epsilon = 1e-7;
	long step = 0;

	void update(Matrix &param, const Matrix &grad, Matrix &m, Matrix &v) const {
		m = beta1 * m + (1.0 - beta1) * grad;
		v = beta2 * v + (1.0 - beta2) * grad.cwiseProduct(grad);
		const double correction1 = 1.0 - std::pow(beta1, static_cast<double>(step));
		const double correction2 = 1.0 - std::pow(beta2, static_cast<double>(step));
		param.array() -= learning_rate * (m.array() / correction1) / ((v.array() / correction2).sqrt() + epsilon);
	}
};

/**
 * LSTM layer over a batch laid out as (features x batch) per time step.
 * Gate rows are ordered input, forget, cell candidate, output.
 */
struct LstmLayer {
	Eigen::Index units = 0;
	Matrix W, U, b;
	Matrix dW, dU, db;
	Matrix mW, vW, mU, vU, mb, vb;

	std::vector<Matrix> x, h, c, i, f, g, o, tanh_c;

	void init(Eigen::Index input_dim, Eigen::Index hidden, std::mt19937 &rng) {
		units = hidden;
		W = glorotUniform(4 * hidden, input_dim, rng);
		U = orthogonal(4 * hidden, hidden, rng);
		b = Matrix::Zero(4 * hidden, 1);
		b.block(hidden, 0, hidden, 1).setOnes();
		for (Matrix *m : {&mW, &vW}) {
			*m = Matrix::Zero(W.rows(), W.cols());
		}
		for (Matrix *m : {&mU, &vU}) {
			*m = Matrix::Zero(U.rows(), U.cols());
		}
		for (Matrix *m : {&mb, &vb}) {
			*m = Matrix::Zero(b.rows(), 1);
		}
	}

	std::vector<Matrix> forward(const std::vector<Matrix> &inputs) {
		const std::size_t steps = inputs.size();
		const Eigen::Index batch = inputs.front().cols();
		const Eigen::Index H = units;
		x = inputs;
		h.assign(steps + 1, Matrix::Zero(H, batch));
		c.assign(steps + 1, Matrix::Zero(H, batch));
		i.resize(steps);
		f.resize(steps);
		g.resize(steps);
		o.resize(steps);
		tanh_c.resize(steps);
		for (std::size_t t = 0; t < steps; ++t) {
			Matrix z = W * x[t] + U * h[t];
			z.colwise() += b.col(0);
			i[t] = sigmoid(z.topRows(H));
			f[t] = sigmoid(z.middleRows(H, H));
			g[t] = z.middleRows(2 * H, H).array().tanh().matrix();
			o[t] = sigmoid(z.bottomRows(H));
			c[t + 1] = f[t].cwiseProduct(c[t]) + i[t].cwiseProduct(g[t]);
			tanh_c[t] = c[t + 1].array().tanh().matrix();
			h[t + 1] = o[t].cwiseProduct(tanh_c[t]);
		}
		return std::vector<Matrix>(h.begin() + 1, h.end());
	}

	// Inference pass; the cached training state is left untouched.
	std::vector<Matrix> infer(const std::vector<Matrix> &inputs) const {
		const Eigen::Index H = units;
		const Eigen::Index batch = inputs.front().cols();
		Matrix h_t = Matrix::Zero(H, batch);
		Matrix c_t = Matrix::Zero(H, batch);
		std::vector<Matrix> out;
		out.reserve(inputs.size());
		for (const auto &x_t : inputs) {
			Matrix z = W * x_t + U * h_t;
			z.colwise() += b.col(0);
			const Matrix gate_g = z.middleRows(2 * H, H).array().tanh().matrix();
			c_t = sigmoid(z.middleRows(H, H)).cwiseProduct(c_t) + sigmoid(z.topRows(H)).cwiseProduct(gate_g);
			h_t = sigmoid(z.bottomRows(H)).cwiseProduct(c_t.array().tanh().matrix());
			out.push_back(h_t);
		}
		return out;
	}

	// Accumulates parameter gradients and returns the gradient per input step.
	std::vector<Matrix> backward(const std::vector<Matrix> &dh_out) {
		const std::size_t steps = x.size();
		const Eigen::Index batch = x.front().cols();
		const Eigen::Index H = units;
		dW = Matrix::Zero(W.rows(), W.cols());
		dU = Matrix::Zero(U.rows(), U.cols());
		db = Matrix::Zero(b.rows(), 1);
		Matrix dh_next = Matrix::Zero(H, batch);
		Matrix dc_next = Matrix::Zero(H, batch);
		std::vector<Matrix> dx(steps);
		Matrix dz(4 * H, batch);
		for (std::size_t step = steps; step-- > 0;) {
			const Matrix dh = dh_out[step] + dh_next;
			const Matrix d_o = dh.cwiseProduct(tanh_c[step]);
			const Matrix dc = (dh.array() * o[step].array() * (1.0 - tanh_c[step].array().square())).matrix() + dc_next;
			const Matrix d_i = dc.cwiseProduct(g[step]);
			const Matrix d_g = dc.cwiseProduct(i[step]);
			const Matrix d_f = dc.cwiseProduct(c[step]);
			dc_next = dc.cwiseProduct(f[step]);

			dz.topRows(H) = (d_i.array() * i[step].array() * (1.0 - i[step].array())).matrix();
			dz.middleRows(H, H) = (d_f.array() * f[step].array() * (1.0 - f[step].array())).matrix();
			dz.middleRows(2 * H, H) = (d_g.array() * (1.0 - g[step].array().square())).matrix();
			dz.bottomRows(H) = (d_o.array() * o[step].array() * (1.0 - o[step].array())).matrix();

			dW.noalias() += dz * x[step].transpose();
			dU.noalias() += dz * h[step].transpose();
			db += dz.rowwise().sum();
			dx[step] = W.transpose() * dz;
			dh_next = U.transpose() * dz;
		}
		return dx;
	}

	void apply(const Adam &adam) {
		adam.update(W, dW, mW, vW);
		adam.update(U, dU, mU, vU);
		adam.update(b, db, mb, vb);
	}
};

} // namespace

struct SequenceNetwork::Network {
	LstmLayer first;
	LstmLayer second;
	Matrix dense_w; // 1 x H
	Matrix dense_b; // 1 x 1
	Matrix m_w, v_w, m_b, v_b;
	Adam adam;
	double dropout = 0.0;

	std::vector<Matrix> mask1;
	Matrix mask2;
	Matrix last;

	Network(Eigen::Index units, double dropout_rate, double learning_rate, std::mt19937 &rng) : dropout(dropout_rate) {
		first.init(1, units, rng);
		second.init(units, units, rng);
		dense_w = glorotUniform(1, units, rng);
		dense_b = Matrix::Zero(1, 1);
		m_w = Matrix::Zero(1, units);
		v_w = Matrix::Zero(1, units);
		m_b = Matrix::Zero(1, 1);
		v_b = Matrix::Zero(1, 1);
		adam.learning_rate = learning_rate;
	}

	Matrix dropoutMask(Eigen::Index rows, Eigen::Index cols, std::mt19937 &rng) const {
		std::bernoulli_distribution keep(1.0 - dropout);
		Matrix mask(rows, cols);
		for (Eigen::Index r = 0; r < rows; ++r) {
			for (Eigen::Index col = 0; col < cols; ++col) {
				mask(r, col) = keep(rng) ? 1.0 / (1.0 - dropout) : 0.0;
			}
		}
		return mask;
	}

	/// Training pass that caches activations for backward(). Dropout is active only when @p rng is given.
	Matrix forward(const std::vector<Matrix> &inputs, std::mt19937 *rng) {
		std::vector<Matrix> hidden = first.forward(inputs);
		const bool training = rng != nullptr && dropout > 0.0;
		mask1.clear();
		if (training) {
			for (auto &step : hidden) {
				mask1.push_back(dropoutMask(step.rows(), step.cols(), *rng));
				step = step.cwiseProduct(mask1.back());
			}
		}
		last = second.forward(hidden).back();
		if (training) {
			mask2 = dropoutMask(last.rows(), last.cols(), *rng);
			last = last.cwiseProduct(mask2);
		}
		Matrix out = dense_w * last;
		out.array() += dense_b(0, 0);
		return out;
	}

	/// Predictions (1 x batch) without dropout; safe to call concurrently.
	Matrix predict(const std::vector<Matrix> &inputs) const {
		const Matrix top = second.infer(first.infer(inputs)).back();
		Matrix out = dense_w * top;
		out.array() += dense_b(0, 0);
		return out;
	}

	void backward(const Matrix &d_out) {
		const Matrix grad_w = d_out * last.transpose();
		Matrix grad_b(1, 1);
		grad_b(0, 0) = d_out.sum();

		Matrix d_last = dense_w.transpose() * d_out;
		if (!mask1.empty()) {
			d_last = d_last.cwiseProduct(mask2);
		}
		std::vector<Matrix> dh2(second.x.size(), Matrix::Zero(d_last.rows(), d_last.cols()));
		dh2.back() = d_last;
		std::vector<Matrix> dh1 = second.backward(dh2);
		for (std::size_t t = 0; t < mask1.size(); ++t) {
			dh1[t] = dh1[t].cwiseProduct(mask1[t]);
		}
		first.backward(dh1);

		++adam.step;
		adam.update(dense_w, grad_w, m_w, v_w);
		adam.update(dense_b, grad_b, m_b, v_b);
		second.apply(adam);
		first.apply(adam);
	}
};

SequenceNetwork::SequenceNetwork(Options options) : options_(options) {
	if (options_.sequence_length < 1) {
		throw core::InvalidParameterError("sequence_length must be at least 1.");
	}
	if (options_.lstm_units < 1) {
		throw core::InvalidParameterError("lstm_units must be at least 1.");
	}
	if (!(options_.dropout >= 0.0 && options_.dropout < 1.0)) {
		throw core::InvalidParameterError("dropout must lie in [0, 1).");
	}
	if (options_.epochs < 1 || options_.batch_size < 1) {
		throw core::InvalidParameterError("epochs and batch_size must be positive.");
	}
	if (!(options_.validation_split >= 0.0 && options_.validation_split < 1.0)) {
		throw core::InvalidParameterError("validation_split must lie in [0, 1).");
	}
	if (options_.learning_rate <= 0.0) {
		throw core::InvalidParameterError("learning_rate must be positive.");
	}
}

SequenceNetwork::~SequenceNetwork() = default;

double SequenceNetwork::scale(double value) const {
	return (value - data_min_) / data_range_;
}

double SequenceNetwork::unscale(double value) const {
	return value * data_range_ + data_min_;
}

void SequenceNetwork::fit(const core::TimeSeries &ts) {
	history_ = ts.getValues();
	for (double v : history_) {
		if (!std::isfinite(v)) {
			throw core::FittingError("LSTM requires finite observations.");
		}
	}
	const auto L = static_cast<std::size_t>(options_.sequence_length);
	if (history_.size() <= L) {
		throw core::FittingError("Insufficient data for sequence creation: need more than " + std::to_string(L) +
		                         " observations, got " + std::to_string(history_.size()) + ".");
	}

	const auto [min_it, max_it] = std::minmax_element(history_.begin(), history_.end());
	data_min_ = *min_it;
	data_range_ = *max_it - *min_it;
	if (data_range_ == 0.0) {
		data_range_ = 1.0;
	}
	scaled_.resize(history_.size());
	std::transform(history_.begin(), history_.end(), scaled_.begin(), [this](double v) { return scale(v); });

	const std::size_t windows = history_.size() - L;
	const auto train_count = static_cast<std::size_t>(
	    std::floor(static_cast<double>(windows) * (1.0 - options_.validation_split)));
	if (train_count == 0) {
		throw core::FittingError("Insufficient data for sequence creation after the validation split.");
	}

	const auto batchInputs = [&](const std::vector<std::size_t> &rows) {
		std::vector<Matrix> inputs(L, Matrix(1, static_cast<Eigen::Index>(rows.size())));
		Matrix target(1, static_cast<Eigen::Index>(rows.size()));
		for (std::size_t j = 0; j < rows.size(); ++j) {
			for (std::size_t t = 0; t < L; ++t) {
				inputs[t](0, static_cast<Eigen::Index>(j)) = scaled_[rows[j] + t];
			}
			target(0, static_cast<Eigen::Index>(j)) = scaled_[rows[j] + L];
		}
		return std::make_pair(inputs, target);
	};

	std::mt19937 rng(options_.seed);
	network_ = std::make_unique<Network>(options_.lstm_units, options_.dropout, options_.learning_rate, rng);
	training_loss_.clear();
	validation_loss_.clear();

	std::vector<std::size_t> train_rows(train_count);
	std::iota(train_rows.begin(), train_rows.end(), 0);
	std::vector<std::size_t> val_rows(windows - train_count);
	std::iota(val_rows.begin(), val_rows.end(), train_count);

	const auto batch_size = static_cast<std::size_t>(options_.batch_size);
	for (int epoch = 0; epoch < options_.epochs; ++epoch) {
		std::shuffle(train_rows.begin(), train_rows.end(), rng);
		double loss_sum = 0.0;
		for (std::size_t start = 0; start < train_rows.size(); start += batch_size) {
			const std::vector<std::size_t> rows(
			    train_rows.begin() + static_cast<std::ptrdiff_t>(start),
			    train_rows.begin() + static_cast<std::ptrdiff_t>(std::min(start + batch_size, train_rows.size())));
			const auto [inputs, target] = batchInputs(rows);
			const Matrix prediction = network_->forward(inputs, &rng);
			const Matrix error = prediction - target;
			loss_sum += error.squaredNorm();
			network_->backward(2.0 * error / static_cast<double>(rows.size()));
		}
		const double epoch_loss = loss_sum / static_cast<double>(train_rows.size());
		if (!std::isfinite(epoch_loss)) {
			throw core::FittingError("LSTM training diverged at epoch " + std::to_string(epoch + 1) + ".");
		}
		training_loss_.push_back(epoch_loss);

		if (!val_rows.empty()) {
			const auto [inputs, target] = batchInputs(val_rows);
			const Matrix error = network_->predict(inputs) - target;
			validation_loss_.push_back(error.squaredNorm() / static_cast<double>(val_rows.size()));
		}
		ATSA_TRACE("LSTM epoch {}/{} loss={:.6f}", epoch + 1, options_.epochs, epoch_loss);
	}

	is_fitted_ = true;
	ATSA_DEBUG("LSTM trained on {} windows ({} held out), final loss {:.6f}.", train_count, val_rows.size(),
	           training_loss_.back());
}

void SequenceNetwork::requireFitted(const char *operation) const {
	if (!is_fitted_) {
		throw core::StateError(std::string(operation) + " called before fit.");
	}
}

core::Forecast SequenceNetwork::predict(int horizon, double confidence) {
	requireFitted("predict");
	if (horizon < 0) {
		throw core::InvalidParameterError("Forecast horizon must be non-negative.");
	}
	const double z = utils::stats::zForConfidence(confidence);
	const auto L = static_cast<std::size_t>(options_.sequence_length);

	std::vector<double> window(scaled_.end() - static_cast<std::ptrdiff_t>(L), scaled_.end());
	std::vector<double> path;
	path.reserve(static_cast<std::size_t>(horizon));
	for (int step = 0; step < horizon; ++step) {
		std::vector<Matrix> inputs(L, Matrix(1, 1));
		for (std::size_t t = 0; t < L; ++t) {
			inputs[t](0, 0) = window[t];
		}
		const double next_scaled = network_->predict(inputs)(0, 0);
		path.push_back(unscale(next_scaled));
		// The scaled prediction seeds the next step.
		window.erase(window.begin());
		window.push_back(next_scaled);
	}

	const double sigma = path.size() > 1 ? utils::stats::stddev(path) : 0.1 * utils::stats::stddev(history_);
	core::Forecast forecast;
	forecast.confidence = confidence;
	forecast.reserve(path.size());
	for (double value : path) {
		forecast.push(value, z * sigma);
	}
	return forecast;
}

std::vector<double> SequenceNetwork::fittedValues() const {
	requireFitted("fittedValues");
	const auto L = static_cast<std::size_t>(options_.sequence_length);
	const std::size_t windows = history_.size() - L;
	std::vector<Matrix> inputs(L, Matrix(1, static_cast<Eigen::Index>(windows)));
	for (std::size_t j = 0; j < windows; ++j) {
		for (std::size_t t = 0; t < L; ++t) {
			inputs[t](0, static_cast<Eigen::Index>(j)) = scaled_[j + t];
		}
	}
	const Matrix prediction = network_->predict(inputs);
	std::vector<double> fitted(history_.size(), std::numeric_limits<double>::quiet_NaN());
	for (std::size_t j = 0; j < windows; ++j) {
		fitted[L + j] = unscale(prediction(0, static_cast<Eigen::Index>(j)));
	}
	return fitted;
}

nlohmann::json SequenceNetwork::modelInfo() const {
	requireFitted("modelInfo");
	nlohmann::json info;
	info["sequence_length"] = options_.sequence_length;
	info["lstm_units"] = options_.lstm_units;
	info["dropout"] = options_.dropout;
	info["epochs"] = options_.epochs;
	info["batch_size"] = options_.batch_size;
	info["training_loss"] = training_loss_.back();
	info["validation_loss"] = validation_loss_.empty() ? nlohmann::json(nullptr) : nlohmann::json(validation_loss_.back());
	return info;
}

} // namespace atsa::models
