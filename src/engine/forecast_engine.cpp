#include "quant-forecast/engine/forecast_engine.hpp"
#include "quant-forecast/core/errors.hpp"
#include "quant-forecast/data/preparator.hpp"
#include "quant-forecast/engine/result_packager.hpp"
#include "quant-forecast/models/model_factory.hpp"
#include "quant-forecast/selectors/method_selector.hpp"
#include "quant-forecast/utils/logging.hpp"

#include <algorithm>
#include <cstdint>
#include <iomanip>
#include <sstream>
#include <utility>

namespace quantforecast::engine {

namespace {

constexpr std::uint64_t kFnvOffsetBasis = 14695981039346656037ULL;
constexpr std::uint64_t kFnvPrime = 1099511628211ULL;

class Fnv1a {
public:
	void update(const void *data, std::size_t size) {
		const auto *bytes = static_cast<const unsigned char *>(data);
		for (std::size_t i = 0; i < size; ++i) {
			hash_ ^= bytes[i];
			hash_ *= kFnvPrime;
		}
	}

	void update(const std::string &text) {
		const auto length = static_cast<std::uint64_t>(text.size());
		update(&length, sizeof(length));
		update(text.data(), text.size());
	}

	template <typename T>
	void updateValue(T value) {
		update(&value, sizeof(value));
	}

	std::uint64_t digest() const {
		return hash_;
	}

private:
	std::uint64_t hash_ = kFnvOffsetBasis;
};

void requirePositivePeriods(int periods) {
	if (periods <= 0) {
		throw core::InsufficientDataError("Forecast periods must be positive.");
	}
}

} // namespace

ForecastEngine::ForecastEngine(core::ForecastConfig config) : config_(std::move(config)) {
	config_.validate();
}

ForecastResult ForecastEngine::analyze(const data::Table &table, const std::string &target_column,
                                       const std::string &date_column, int periods, double confidence_level) const {
	requirePositivePeriods(periods);
	try {
		const auto series = data::DataPreparator(config_.min_data_points).prepare(table, target_column, date_column);
		const auto chars = characterize(series);
		const auto method = selectMethod(chars);
		QUANT_INFO("Forecasting '{}' with {}.", target_column, core::displayName(method));
		return run(series, method, periods, confidence_level);
	} catch (const core::ValidationError &) {
		throw;
	} catch (const core::ForecastError &e) {
		QUANT_ERROR("Forecast of '{}' failed: {}", target_column, e.what());
		throw;
	} catch (const std::exception &e) {
		QUANT_ERROR("Forecast of '{}' failed: {}", target_column, e.what());
		throw core::ForecastError(e.what());
	}
}

ForecastResult ForecastEngine::forecastWith(const core::TimeSeries &series, core::MethodVariant method, int periods,
                                            double confidence_level) const {
	requirePositivePeriods(periods);
	if (series.size() < config_.min_data_points) {
		throw core::InsufficientDataError("Need at least " + std::to_string(config_.min_data_points) +
		                                  " data points for forecasting.");
	}
	try {
		return run(series, method, periods, confidence_level);
	} catch (const core::ForecastError &e) {
		QUANT_ERROR("{} forecast failed: {}", core::displayName(method), e.what());
		throw;
	} catch (const std::exception &e) {
		QUANT_ERROR("{} forecast failed: {}", core::displayName(method), e.what());
		throw core::ForecastError(e.what());
	}
}

analysis::DataCharacteristics ForecastEngine::characterize(const core::TimeSeries &series) const {
	return analysis::CharacteristicsAnalyzer(config_).characterize(series);
}

core::MethodVariant ForecastEngine::selectMethod(const analysis::DataCharacteristics &chars) const {
	return selectors::MethodSelector(config_).select(chars);
}

int ForecastEngine::clampHorizon(int periods) const {
	return std::min(periods, config_.max_forecast_horizon);
}

ForecastResult ForecastEngine::run(const core::TimeSeries &series, core::MethodVariant method, int periods,
                                   double confidence_level) const {
	const int horizon = clampHorizon(periods);
	if (horizon < periods) {
		QUANT_DEBUG("Requested {} periods, clamped to {}.", periods, horizon);
	}

	auto model = models::ModelFactory::create(method, config_, confidence_level);
	model->fit(series);
	const auto forecast = model->predict(horizon);

	QUANT_INFO("{} produced {} forecast steps.", model->getName(), forecast.horizon());
	return ResultPackager(config_.period_days).package(*model, forecast, series);
}

std::string cacheKey(const core::TimeSeries &series, const std::string &target_column,
                     const std::string &date_column, int horizon, double confidence_level) {
	Fnv1a hasher;
	hasher.update(target_column);
	hasher.update(date_column);
	hasher.updateValue(static_cast<std::int64_t>(horizon));
	hasher.updateValue(confidence_level);
	hasher.updateValue(static_cast<std::uint64_t>(series.size()));

	const auto &timestamps = series.getTimestamps();
	const auto &values = series.getValues();
	for (std::size_t i = 0; i < series.size(); ++i) {
		hasher.updateValue(static_cast<std::int64_t>(timestamps[i].time_since_epoch().count()));
		hasher.updateValue(values[i]);
	}

	std::ostringstream out;
	out << std::hex << std::setw(16) << std::setfill('0') << hasher.digest();
	return out.str();
}

} // namespace quantforecast::engine
