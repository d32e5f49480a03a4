#include "timecast/models/model_factory.hpp"
#include "timecast/models/decomposition.hpp"
#include "timecast/models/seasonal_regression.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace timecast::models {

namespace {

std::string normalise(const std::string &text) {
	std::string lowered;
	lowered.reserve(text.size());
	for (char ch : text) {
		if (ch == '-' || ch == ' ') {
			lowered.push_back('_');
		} else {
			lowered.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
		}
	}
	return lowered;
}

} // namespace

std::unique_ptr<IForecaster> ModelFactory::create(ModelKind kind, const ModelOptions &options) {
	switch (kind) {
	case ModelKind::SeasonalRegression:
		return SeasonalRegressionBuilder()
		    .withSeasonalPeriods(options.seasonal_periods)
		    .withFourierOrder(options.fourier_order)
		    .withRegressors(options.regressors)
		    .withConfidenceLevel(options.confidence_level)
		    .build();
	case ModelKind::Decomposition:
		return DecompositionBuilder()
		    .withSeasonalPeriod(options.seasonal_periods.empty() ? 0 : options.seasonal_periods.front())
		    .withConfidenceLevel(options.confidence_level)
		    .build();
	case ModelKind::Recurrent: {
		RecurrentOptions recurrent = options.recurrent;
		recurrent.confidence_level = options.confidence_level;
		return RecurrentBuilder().withOptions(recurrent).build();
	}
	}
	throw std::invalid_argument("Unknown model kind.");
}

std::unique_ptr<IForecaster> ModelFactory::create(const std::string &model_name, const ModelOptions &options) {
	return create(parse(model_name), options);
}

ModelKind ModelFactory::parse(const std::string &model_name) {
	const std::string key = normalise(model_name);
	if (key == "decomposition" || key == "decomp") {
		return ModelKind::Decomposition;
	}
	if (key == "seasonalregression" || key == "seasonal_regression" || key == "regression") {
		return ModelKind::SeasonalRegression;
	}
	if (key == "recurrent" || key == "lstm" || key == "rnn") {
		return ModelKind::Recurrent;
	}

	std::string supported_list;
	for (const auto &supported : supportedModels()) {
		if (!supported_list.empty()) {
			supported_list += ", ";
		}
		supported_list += supported;
	}
	throw std::invalid_argument("Unknown model: '" + model_name + "'. Supported models: " + supported_list);
}

std::string ModelFactory::name(ModelKind kind) {
	switch (kind) {
	case ModelKind::SeasonalRegression:
		return "SeasonalRegression";
	case ModelKind::Decomposition:
		return "Decomposition";
	case ModelKind::Recurrent:
		return "Recurrent";
	}
	return "Unknown";
}

std::vector<std::string> ModelFactory::supportedModels() {
	return {name(ModelKind::SeasonalRegression), name(ModelKind::Decomposition), name(ModelKind::Recurrent)};
}

int ModelFactory::priority(ModelKind kind) {
	return static_cast<int>(kind);
}

int ModelFactory::priority(const std::string &model_name) {
	const auto models = supportedModels();
	const auto it = std::find(models.begin(), models.end(), model_name);
	if (it == models.end()) {
		return static_cast<int>(models.size());
	}
	return priority(parse(model_name));
}

} // namespace timecast::models
