#include "timecast/models/recurrent.hpp"
#include "timecast/utils/logging.hpp"

#include <cmath>
#include <random>
#include <stdexcept>

namespace timecast::models {

namespace {

constexpr double kAdamBeta1 = 0.9;
constexpr double kAdamBeta2 = 0.999;
constexpr double kAdamEpsilon = 1e-8;

Eigen::VectorXd sigmoid(const Eigen::VectorXd &a) {
	return (1.0 / (1.0 + (-a.array()).exp())).matrix();
}

// Activations of one LSTM time step, kept for back-propagation.
struct StepCache {
	double x = 0.0;
	Eigen::VectorXd h_prev;
	Eigen::VectorXd c_prev;
	Eigen::VectorXd i, f, g, o;
	Eigen::VectorXd c;
	Eigen::VectorXd tanh_c;
	Eigen::VectorXd h;
};

} // namespace

Recurrent::Recurrent(RecurrentOptions options) : IForecaster(options.confidence_level), options_(options) {
}

void Recurrent::initialise() {
	const auto H = static_cast<Eigen::Index>(options_.hidden_units);
	const double bound = 1.0 / std::sqrt(static_cast<double>(options_.hidden_units));
	std::mt19937_64 rng(options_.seed);
	std::uniform_real_distribution<double> dist(-bound, bound);
	auto draw = [&](Eigen::Index rows, Eigen::Index cols) {
		Eigen::MatrixXd m(rows, cols);
		for (Eigen::Index c = 0; c < cols; ++c) {
			for (Eigen::Index r = 0; r < rows; ++r) {
				m(r, c) = dist(rng);
			}
		}
		return m;
	};

	params_.input_weights = draw(4 * H, 1);
	params_.recurrent_weights = draw(4 * H, H);
	params_.bias = Eigen::VectorXd::Zero(4 * H);
	params_.bias.segment(H, H).setOnes(); // forget gate starts open
	params_.output_weights = draw(1, H);
	params_.output_bias = 0.0;

	adam_m_.input_weights = Eigen::MatrixXd::Zero(4 * H, 1);
	adam_m_.recurrent_weights = Eigen::MatrixXd::Zero(4 * H, H);
	adam_m_.bias = Eigen::VectorXd::Zero(4 * H);
	adam_m_.output_weights = Eigen::RowVectorXd::Zero(H);
	adam_m_.output_bias = 0.0;
	adam_v_ = adam_m_;
	adam_t_ = 0;
}

double Recurrent::step(const std::vector<double> &window) const {
	const auto H = static_cast<Eigen::Index>(options_.hidden_units);
	Eigen::VectorXd h = Eigen::VectorXd::Zero(H);
	Eigen::VectorXd c = Eigen::VectorXd::Zero(H);
	for (double x : window) {
		const Eigen::VectorXd a =
		    params_.input_weights.col(0) * x + params_.recurrent_weights * h + params_.bias;
		const Eigen::VectorXd i = sigmoid(a.segment(0, H));
		const Eigen::VectorXd f = sigmoid(a.segment(H, H));
		const Eigen::VectorXd g = a.segment(2 * H, H).array().tanh().matrix();
		const Eigen::VectorXd o = sigmoid(a.segment(3 * H, H));
		c = f.cwiseProduct(c) + i.cwiseProduct(g);
		h = o.cwiseProduct(c.array().tanh().matrix());
	}
	return params_.output_weights.dot(h) + params_.output_bias;
}

double Recurrent::trainEpoch(const std::vector<std::vector<double>> &inputs, const std::vector<double> &targets) {
	const auto H = static_cast<Eigen::Index>(options_.hidden_units);
	const double samples = static_cast<double>(inputs.size());

	Eigen::MatrixXd d_input = Eigen::MatrixXd::Zero(4 * H, 1);
	Eigen::MatrixXd d_recurrent = Eigen::MatrixXd::Zero(4 * H, H);
	Eigen::VectorXd d_bias = Eigen::VectorXd::Zero(4 * H);
	Eigen::RowVectorXd d_output = Eigen::RowVectorXd::Zero(H);
	double d_output_bias = 0.0;
	double loss = 0.0;

	std::vector<StepCache> cache(options_.lookback);
	for (std::size_t s = 0; s < inputs.size(); ++s) {
		// Forward pass.
		Eigen::VectorXd h = Eigen::VectorXd::Zero(H);
		Eigen::VectorXd c = Eigen::VectorXd::Zero(H);
		for (std::size_t t = 0; t < inputs[s].size(); ++t) {
			auto &step_cache = cache[t];
			step_cache.x = inputs[s][t];
			step_cache.h_prev = h;
			step_cache.c_prev = c;
			const Eigen::VectorXd a =
			    params_.input_weights.col(0) * step_cache.x + params_.recurrent_weights * h + params_.bias;
			step_cache.i = sigmoid(a.segment(0, H));
			step_cache.f = sigmoid(a.segment(H, H));
			step_cache.g = a.segment(2 * H, H).array().tanh().matrix();
			step_cache.o = sigmoid(a.segment(3 * H, H));
			step_cache.c = step_cache.f.cwiseProduct(c) + step_cache.i.cwiseProduct(step_cache.g);
			step_cache.tanh_c = step_cache.c.array().tanh().matrix();
			step_cache.h = step_cache.o.cwiseProduct(step_cache.tanh_c);
			h = step_cache.h;
			c = step_cache.c;
		}
		const double prediction = params_.output_weights.dot(h) + params_.output_bias;
		const double error = prediction - targets[s];
		loss += error * error;

		// Backward pass through time.
		const double dy = 2.0 * error / samples;
		d_output += dy * h.transpose();
		d_output_bias += dy;
		Eigen::VectorXd dh = params_.output_weights.transpose() * dy;
		Eigen::VectorXd dc = Eigen::VectorXd::Zero(H);
		for (std::size_t t = inputs[s].size(); t-- > 0;) {
			const auto &sc = cache[t];
			const Eigen::VectorXd d_o = dh.cwiseProduct(sc.tanh_c);
			dc += dh.cwiseProduct(sc.o).cwiseProduct((1.0 - sc.tanh_c.array().square()).matrix());
			const Eigen::VectorXd d_f = dc.cwiseProduct(sc.c_prev);
			const Eigen::VectorXd d_i = dc.cwiseProduct(sc.g);
			const Eigen::VectorXd d_g = dc.cwiseProduct(sc.i);

			Eigen::VectorXd da(4 * H);
			da.segment(0, H) = (d_i.array() * sc.i.array() * (1.0 - sc.i.array())).matrix();
			da.segment(H, H) = (d_f.array() * sc.f.array() * (1.0 - sc.f.array())).matrix();
			da.segment(2 * H, H) = (d_g.array() * (1.0 - sc.g.array().square())).matrix();
			da.segment(3 * H, H) = (d_o.array() * sc.o.array() * (1.0 - sc.o.array())).matrix();

			d_input.col(0) += da * sc.x;
			d_recurrent += da * sc.h_prev.transpose();
			d_bias += da;
			dh = params_.recurrent_weights.transpose() * da;
			dc = dc.cwiseProduct(sc.f);
		}
	}

	const double norm = std::sqrt(d_input.squaredNorm() + d_recurrent.squaredNorm() + d_bias.squaredNorm() +
	                              d_output.squaredNorm() + d_output_bias * d_output_bias);
	if (std::isfinite(norm) && norm > options_.gradient_clip) {
		const double scale = options_.gradient_clip / norm;
		d_input *= scale;
		d_recurrent *= scale;
		d_bias *= scale;
		d_output *= scale;
		d_output_bias *= scale;
	}

	++adam_t_;
	const double correction1 = 1.0 - std::pow(kAdamBeta1, static_cast<double>(adam_t_));
	const double correction2 = 1.0 - std::pow(kAdamBeta2, static_cast<double>(adam_t_));
	const double rate = options_.learning_rate;
	auto update = [&](auto &param, const auto &grad, auto &m, auto &v) {
		m = kAdamBeta1 * m + (1.0 - kAdamBeta1) * grad;
		v = kAdamBeta2 * v + (1.0 - kAdamBeta2) * grad.cwiseProduct(grad);
		param.array() -= rate * (m.array() / correction1) / ((v.array() / correction2).sqrt() + kAdamEpsilon);
	};
	update(params_.input_weights, d_input, adam_m_.input_weights, adam_v_.input_weights);
	update(params_.recurrent_weights, d_recurrent, adam_m_.recurrent_weights, adam_v_.recurrent_weights);
	update(params_.bias, d_bias, adam_m_.bias, adam_v_.bias);
	update(params_.output_weights, d_output, adam_m_.output_weights, adam_v_.output_weights);

	adam_m_.output_bias = kAdamBeta1 * adam_m_.output_bias + (1.0 - kAdamBeta1) * d_output_bias;
	adam_v_.output_bias = kAdamBeta2 * adam_v_.output_bias + (1.0 - kAdamBeta2) * d_output_bias * d_output_bias;
	params_.output_bias -=
	    rate * (adam_m_.output_bias / correction1) / (std::sqrt(adam_v_.output_bias / correction2) + kAdamEpsilon);

	return loss / samples;
}

void Recurrent::fit(const core::TimeSeries &ts) {
	ensureTrainable(ts);
	markFitted(false);
	loss_history_.clear();

	const auto &values = ts.getValues();
	const std::size_t lookback = options_.lookback;

	std::vector<double> diffs(values.size() - 1);
	for (std::size_t i = 1; i < values.size(); ++i) {
		diffs[i - 1] = values[i] - values[i - 1];
	}
	diff_mean_ = utils::mean(diffs);
	double ss = 0.0;
	for (double d : diffs) {
		ss += (d - diff_mean_) * (d - diff_mean_);
	}
	const double sd = std::sqrt(ss / static_cast<double>(diffs.size()));
	diff_scale_ = sd > 1e-12 ? sd : 1.0;

	std::vector<double> standardised(diffs.size());
	for (std::size_t i = 0; i < diffs.size(); ++i) {
		standardised[i] = (diffs[i] - diff_mean_) / diff_scale_;
	}

	std::vector<std::vector<double>> inputs;
	std::vector<double> targets;
	for (std::size_t s = lookback; s < standardised.size(); ++s) {
		inputs.emplace_back(standardised.begin() + static_cast<std::ptrdiff_t>(s - lookback),
		                    standardised.begin() + static_cast<std::ptrdiff_t>(s));
		targets.push_back(standardised[s]);
	}

	initialise();
	for (std::size_t epoch = 0; epoch < options_.epochs; ++epoch) {
		deadline().check("Recurrent training");
		const double loss = trainEpoch(inputs, targets);
		if (!std::isfinite(loss)) {
			throw core::TrainingError("Recurrent training diverged at epoch " + std::to_string(epoch + 1) + ".");
		}
		loss_history_.push_back(loss);
	}
	if (!params_.recurrent_weights.allFinite() || !params_.input_weights.allFinite() ||
	    !params_.output_weights.allFinite() || !std::isfinite(params_.output_bias)) {
		throw core::TrainingError("Recurrent training produced non-finite weights.");
	}

	std::vector<double> residuals(inputs.size());
	for (std::size_t s = 0; s < inputs.size(); ++s) {
		residuals[s] = (targets[s] - step(inputs[s])) * diff_scale_;
	}
	sigma_ = utils::residualStdDev(residuals, 1);

	last_window_.assign(standardised.end() - static_cast<std::ptrdiff_t>(lookback), standardised.end());
	last_level_ = values.back();

	markFitted(true);
	TIMECAST_DEBUG("Recurrent fitted with {} data points, {} training windows, final loss = {:.6f}, sigma = {:.6f}.",
	               values.size(), inputs.size(), loss_history_.empty() ? 0.0 : loss_history_.back(), sigma_);
}

core::Forecast Recurrent::predict(int horizon, const std::optional<RegressorTable> &future_regressors) const {
	ensurePredictable(horizon, future_regressors);

	core::Forecast forecast;
	auto &series = forecast.primary();
	series.reserve(static_cast<std::size_t>(horizon));

	std::vector<double> window = last_window_;
	double level = last_level_;
	for (int h = 0; h < horizon; ++h) {
		const double next = step(window);
		level += next * diff_scale_ + diff_mean_;
		series.push_back(level);
		window.erase(window.begin());
		window.push_back(next);
	}

	applyResidualBounds(forecast, sigma_, [](std::size_t h) { return std::sqrt(static_cast<double>(h)); });
	return forecast;
}

// --- Builder Implementation ---

RecurrentBuilder &RecurrentBuilder::withOptions(RecurrentOptions options) {
	options_ = options;
	return *this;
}

RecurrentBuilder &RecurrentBuilder::withLookback(std::size_t lookback) {
	options_.lookback = lookback;
	return *this;
}

RecurrentBuilder &RecurrentBuilder::withHiddenUnits(std::size_t units) {
	options_.hidden_units = units;
	return *this;
}

RecurrentBuilder &RecurrentBuilder::withEpochs(std::size_t epochs) {
	options_.epochs = epochs;
	return *this;
}

RecurrentBuilder &RecurrentBuilder::withLearningRate(double rate) {
	options_.learning_rate = rate;
	return *this;
}

RecurrentBuilder &RecurrentBuilder::withSeed(std::uint64_t seed) {
	options_.seed = seed;
	return *this;
}

RecurrentBuilder &RecurrentBuilder::withConfidenceLevel(double level) {
	options_.confidence_level = level;
	return *this;
}

std::unique_ptr<Recurrent> RecurrentBuilder::build() {
	if (options_.lookback == 0 || options_.hidden_units == 0 || options_.epochs == 0) {
		throw std::invalid_argument("Recurrent lookback, hidden units and epochs must be positive.");
	}
	if (!(options_.learning_rate > 0.0) || !(options_.gradient_clip > 0.0)) {
		throw std::invalid_argument("Recurrent learning rate and gradient clip must be positive.");
	}
	return std::unique_ptr<Recurrent>(new Recurrent(options_));
}

} // namespace timecast::models
