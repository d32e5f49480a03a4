#include <catch2/catch_test_macros.hpp>

#include "timecast/models/decomposition.hpp"
#include "timecast/models/model_factory.hpp"
#include "timecast/models/recurrent.hpp"
#include "timecast/models/seasonal_regression.hpp"

#include <stdexcept>

using timecast::models::ModelFactory;
using timecast::models::ModelKind;
using timecast::models::ModelOptions;

TEST_CASE("ModelFactory resolves names and aliases", "[models][factory]") {
	REQUIRE(ModelFactory::parse("Decomposition") == ModelKind::Decomposition);
	REQUIRE(ModelFactory::parse("decomp") == ModelKind::Decomposition);
	REQUIRE(ModelFactory::parse("seasonal-regression") == ModelKind::SeasonalRegression);
	REQUIRE(ModelFactory::parse("SeasonalRegression") == ModelKind::SeasonalRegression);
	REQUIRE(ModelFactory::parse("LSTM") == ModelKind::Recurrent);
	REQUIRE_THROWS_AS(ModelFactory::parse("prophet"), std::invalid_argument);

	REQUIRE(ModelFactory::supportedModels().size() == 3);
	REQUIRE(ModelFactory::name(ModelKind::Recurrent) == "Recurrent");
}

TEST_CASE("ModelFactory priorities follow declaration order", "[models][factory]") {
	REQUIRE(ModelFactory::priority(ModelKind::SeasonalRegression) < ModelFactory::priority(ModelKind::Decomposition));
	REQUIRE(ModelFactory::priority(ModelKind::Decomposition) < ModelFactory::priority(ModelKind::Recurrent));
	REQUIRE(ModelFactory::priority("Recurrent") == ModelFactory::priority(ModelKind::Recurrent));
	REQUIRE(ModelFactory::priority("Custom") > ModelFactory::priority(ModelKind::Recurrent));
}

TEST_CASE("ModelFactory forwards options to each variant", "[models][factory]") {
	ModelOptions options;
	options.confidence_level = 0.8;
	options.seasonal_periods = {7, 30};
	options.fourier_order = 2;
	options.regressors = {"promo"};
	options.recurrent.lookback = 5;

	auto regression = ModelFactory::create(ModelKind::SeasonalRegression, options);
	REQUIRE(regression->getName() == "SeasonalRegression");
	REQUIRE(regression->confidenceLevel() == 0.8);
	REQUIRE(regression->requiredRegressors() == std::vector<std::string>{"promo"});
	// 2 + two full pairs for each period + regressor
	REQUIRE(regression->minTrainingLength() == 2 + 4 + 4 + 1 + 2);

	auto decomposition = ModelFactory::create("decomposition", options);
	auto *typed = dynamic_cast<timecast::models::Decomposition *>(decomposition.get());
	REQUIRE(typed != nullptr);
	REQUIRE(typed->seasonalPeriod() == 7);
	REQUIRE(decomposition->requiredRegressors().empty());

	auto recurrent = ModelFactory::create(ModelKind::Recurrent, options);
	REQUIRE(recurrent->minTrainingLength() == 11);
	REQUIRE(recurrent->confidenceLevel() == 0.8);
}
