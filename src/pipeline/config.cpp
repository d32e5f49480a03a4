#include "timecast/pipeline/config.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <functional>
#include <limits>
#include <stdexcept>
#include <string>

namespace timecast::pipeline {

namespace {

std::string trim(const std::string &text) {
	const auto first = text.find_first_not_of(" \t");
	if (first == std::string::npos) {
		return "";
	}
	const auto last = text.find_last_not_of(" \t");
	return text.substr(first, last - first + 1);
}

std::vector<std::string> splitList(const std::string &text) {
	std::vector<std::string> items;
	std::string current;
	for (char ch : text) {
		if (ch == ',') {
			items.push_back(trim(current));
			current.clear();
		} else {
			current.push_back(ch);
		}
	}
	items.push_back(trim(current));
	items.erase(std::remove(items.begin(), items.end(), std::string()), items.end());
	return items;
}

std::size_t parseSize(const std::string &key, const std::string &value) {
	const std::string text = trim(value);
	if (text.empty() || !std::all_of(text.begin(), text.end(), [](unsigned char ch) { return std::isdigit(ch); })) {
		throw std::invalid_argument("Option '" + key + "' expects a non-negative integer, got '" + value + "'.");
	}
	try {
		return static_cast<std::size_t>(std::stoull(text));
	} catch (const std::out_of_range &) {
		throw std::invalid_argument("Option '" + key + "' is out of range: '" + value + "'.");
	}
}

int parseInt(const std::string &key, const std::string &value) {
	std::size_t consumed = 0;
	int parsed = 0;
	try {
		parsed = std::stoi(value, &consumed);
	} catch (const std::logic_error &) {
		throw std::invalid_argument("Option '" + key + "' expects an integer, got '" + value + "'.");
	}
	if (trim(value.substr(consumed)).size() > 0) {
		throw std::invalid_argument("Option '" + key + "' expects an integer, got '" + value + "'.");
	}
	return parsed;
}

double parseDouble(const std::string &key, const std::string &value) {
	std::size_t consumed = 0;
	double parsed = 0.0;
	try {
		parsed = std::stod(value, &consumed);
	} catch (const std::logic_error &) {
		throw std::invalid_argument("Option '" + key + "' expects a number, got '" + value + "'.");
	}
	if (trim(value.substr(consumed)).size() > 0 || !std::isfinite(parsed)) {
		throw std::invalid_argument("Option '" + key + "' expects a finite number, got '" + value + "'.");
	}
	return parsed;
}

bool parseBool(const std::string &key, const std::string &value) {
	std::string lowered = trim(value);
	std::transform(lowered.begin(), lowered.end(), lowered.begin(),
	               [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
	if (lowered == "true" || lowered == "1" || lowered == "yes" || lowered == "on") {
		return true;
	}
	if (lowered == "false" || lowered == "0" || lowered == "no" || lowered == "off") {
		return false;
	}
	throw std::invalid_argument("Option '" + key + "' expects a boolean, got '" + value + "'.");
}

std::chrono::milliseconds parseDuration(const std::string &key, const std::string &value) {
	std::string text = trim(value);
	double scale = 1000.0;
	if (text.size() > 2 && text.compare(text.size() - 2, 2, "ms") == 0) {
		scale = 1.0;
		text.resize(text.size() - 2);
	} else if (!text.empty() && text.back() == 's') {
		text.pop_back();
	} else if (!text.empty() && text.back() == 'm') {
		scale = 60000.0;
		text.pop_back();
	}
	const double millis = parseDouble(key, text) * scale;
	if (std::abs(millis) >= static_cast<double>(std::numeric_limits<long long>::max())) {
		throw std::invalid_argument("Option '" + key + "' is out of range: '" + value + "'.");
	}
	return std::chrono::milliseconds(static_cast<long long>(std::llround(millis)));
}

} // namespace

GapPolicy parseGapPolicy(const std::string &name) {
	if (name == "interpolate") {
		return GapPolicy::Interpolate;
	}
	if (name == "reject") {
		return GapPolicy::Reject;
	}
	throw std::invalid_argument("Unknown gap policy: '" + name + "'. Expected interpolate or reject.");
}

std::string gapPolicyName(GapPolicy policy) {
	return policy == GapPolicy::Reject ? "reject" : "interpolate";
}

void PipelineConfig::validate() const {
	if (candidate_models.empty()) {
		throw std::invalid_argument("At least one candidate model is required.");
	}
	if (fold_count < 1 || fold_count > kMaxFoldCount) {
		throw std::invalid_argument("fold_count must lie in [1, " + std::to_string(kMaxFoldCount) + "].");
	}
	if (fold_test_length < 1 || fold_test_length > kMaxFoldTestLength) {
		throw std::invalid_argument("fold_test_length must lie in [1, " + std::to_string(kMaxFoldTestLength) +
		                            "].");
	}
	if (forecast_horizon < 1) {
		throw std::invalid_argument("forecast_horizon must be at least 1.");
	}
	if (!(confidence_level > 0.0 && confidence_level < 1.0)) {
		throw std::invalid_argument("confidence_level must be strictly between 0 and 1.");
	}
	if (worker_pool_size < 1) {
		throw std::invalid_argument("worker_pool_size must be at least 1.");
	}
	if (per_model_timeout <= std::chrono::milliseconds::zero()) {
		throw std::invalid_argument("per_model_timeout must be positive.");
	}
	if (recurrent_lookback < 1 || recurrent_hidden_units < 1 || recurrent_epochs < 1) {
		throw std::invalid_argument("Recurrent lookback, hidden units and epochs must be at least 1.");
	}
	if (!(recurrent_learning_rate > 0.0)) {
		throw std::invalid_argument("recurrent_learning_rate must be positive.");
	}
	if (regressor_screening.max_lags < 0) {
		throw std::invalid_argument("regressor_screening.max_lags must not be negative.");
	}
	if (regressor_screening.min_abs_correlation < 0.0 || regressor_screening.min_abs_correlation > 1.0) {
		throw std::invalid_argument("regressor_screening.min_abs_correlation must lie in [0, 1].");
	}
}

models::ModelOptions PipelineConfig::modelOptions(const std::vector<std::string> &regressors) const {
	models::ModelOptions options;
	options.confidence_level = confidence_level;
	options.seasonal_periods = seasonal_periods;
	options.fourier_order = fourier_order;
	options.regressors = regressors;
	options.recurrent.lookback = recurrent_lookback;
	options.recurrent.hidden_units = recurrent_hidden_units;
	options.recurrent.epochs = recurrent_epochs;
	options.recurrent.learning_rate = recurrent_learning_rate;
	options.recurrent.seed = random_seed;
	options.recurrent.confidence_level = confidence_level;
	return options;
}

PipelineConfig PipelineConfig::fromOptions(const std::map<std::string, std::string> &options) {
	PipelineConfig config;

	using Setter = std::function<void(const std::string &, const std::string &)>;
	const std::map<std::string, Setter> setters = {
	    {"candidate_models",
	     [&config](const std::string &, const std::string &value) {
		     config.candidate_models.clear();
		     for (const auto &name : splitList(value)) {
			     const auto kind = models::ModelFactory::parse(name);
			     if (std::find(config.candidate_models.begin(), config.candidate_models.end(), kind) ==
			         config.candidate_models.end()) {
				     config.candidate_models.push_back(kind);
			     }
		     }
	     }},
	    {"fold_count", [&config](const std::string &k, const std::string &v) { config.fold_count = parseSize(k, v); }},
	    {"fold_test_length",
	     [&config](const std::string &k, const std::string &v) { config.fold_test_length = parseSize(k, v); }},
	    {"forecast_horizon",
	     [&config](const std::string &k, const std::string &v) { config.forecast_horizon = parseSize(k, v); }},
	    {"confidence_level",
	     [&config](const std::string &k, const std::string &v) { config.confidence_level = parseDouble(k, v); }},
	    {"ensemble_policy",
	     [&config](const std::string &, const std::string &v) {
		     config.ensemble_policy = selectors::parseEnsemblePolicy(trim(v));
	     }},
	    {"primary_metric",
	     [&config](const std::string &, const std::string &v) { config.primary_metric = utils::parseCVMetric(trim(v)); }},
	    {"worker_pool_size",
	     [&config](const std::string &k, const std::string &v) { config.worker_pool_size = parseSize(k, v); }},
	    {"per_model_timeout",
	     [&config](const std::string &k, const std::string &v) { config.per_model_timeout = parseDuration(k, v); }},
	    {"random_seed",
	     [&config](const std::string &k, const std::string &v) {
		     config.random_seed = static_cast<std::uint64_t>(parseSize(k, v));
	     }},
	    {"parallel_folds",
	     [&config](const std::string &k, const std::string &v) { config.parallel_folds = parseBool(k, v); }},
	    {"gap_policy", [&config](const std::string &, const std::string &v) { config.gap_policy = parseGapPolicy(trim(v)); }},
	    {"transformation",
	     [&config](const std::string &, const std::string &v) {
		     config.transformation = transform::parseTransformKind(trim(v));
	     }},
	    {"seasonal_periods",
	     [&config](const std::string &k, const std::string &v) {
		     config.seasonal_periods.clear();
		     for (const auto &item : splitList(v)) {
			     config.seasonal_periods.push_back(parseSize(k, item));
		     }
	     }},
	    {"fourier_order",
	     [&config](const std::string &k, const std::string &v) { config.fourier_order = parseSize(k, v); }},
	    {"recurrent_lookback",
	     [&config](const std::string &k, const std::string &v) { config.recurrent_lookback = parseSize(k, v); }},
	    {"recurrent_hidden_units",
	     [&config](const std::string &k, const std::string &v) { config.recurrent_hidden_units = parseSize(k, v); }},
	    {"recurrent_epochs",
	     [&config](const std::string &k, const std::string &v) { config.recurrent_epochs = parseSize(k, v); }},
	    {"recurrent_learning_rate",
	     [&config](const std::string &k, const std::string &v) { config.recurrent_learning_rate = parseDouble(k, v); }},
	    {"regressor_screening.enabled",
	     [&config](const std::string &k, const std::string &v) { config.regressor_screening.enabled = parseBool(k, v); }},
	    {"regressor_screening.max_lags",
	     [&config](const std::string &k, const std::string &v) { config.regressor_screening.max_lags = parseInt(k, v); }},
	    {"regressor_screening.mode",
	     [&config](const std::string &, const std::string &v) {
		     config.regressor_screening.mode = utils::parseCorrelationMode(trim(v));
	     }},
	    {"regressor_screening.min_abs_correlation",
	     [&config](const std::string &k, const std::string &v) {
		     config.regressor_screening.min_abs_correlation = parseDouble(k, v);
	     }},
	};

	for (const auto &[key, value] : options) {
		const auto it = setters.find(key);
		if (it == setters.end()) {
			throw std::invalid_argument("Unknown pipeline option: '" + key + "'.");
		}
		it->second(key, value);
	}

	config.validate();
	return config;
}

} // namespace timecast::pipeline
