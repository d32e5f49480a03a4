#pragma once

#include "timecast/transform/transformer.hpp"

#include <memory>
#include <string>
#include <vector>

namespace timecast::transform {

enum class TransformKind { None, Log, LogModified };

/// Leaves values untouched.
class Identity final : public Transformer {
public:
	void fit(const std::vector<double> &data) override;
	void transform(std::vector<double> &data) const override;
	void inverseTransform(std::vector<double> &data) const override;

	const char *name() const override {
		return "none";
	}
};

/**
 * @class Log
 * @brief Signed logarithm: sign(x) * ln|x|, with 0 mapped to 0.
 *
 * The inverse sign(y) * exp|y| cannot recover values with |x| <= 1.
 */
class Log final : public Transformer {
public:
	void fit(const std::vector<double> &data) override;
	void transform(std::vector<double> &data) const override;
	void inverseTransform(std::vector<double> &data) const override;

	const char *name() const override {
		return "log";
	}
};

/**
 * @class LogModified
 * @brief Shifted signed logarithm: sign(x) * ln(|x| + 1), exactly invertible.
 */
class LogModified final : public Transformer {
public:
	void fit(const std::vector<double> &data) override;
	void transform(std::vector<double> &data) const override;
	void inverseTransform(std::vector<double> &data) const override;

	const char *name() const override {
		return "log_modified";
	}
};

std::unique_ptr<Transformer> makeTransformer(TransformKind kind);

/// @throws std::invalid_argument If @p name is not "none", "log" or "log_modified".
TransformKind parseTransformKind(const std::string &name);

std::string transformKindName(TransformKind kind);

} // namespace timecast::transform
