#include "rowcast/rowcast.hpp"

#include <exception>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

using namespace rowcast;

namespace {

// Monthly passenger counts, first 36 months of the AirPassengers series
std::vector<double> airPassengersData() {
	return {
		112., 118., 132., 129., 121., 135., 148., 148., 136., 119., 104., 118.,
		115., 126., 141., 135., 125., 149., 170., 170., 158., 133., 114., 140.,
		145., 150., 178., 163., 172., 178., 199., 199., 184., 162., 146., 166.
	};
}

core::Dataset monthlyDataset(const std::vector<double> &values) {
	core::Dataset dataset;
	dataset.reserve(values.size());
	for (std::size_t i = 0; i < values.size(); ++i) {
		const int year = 1949 + static_cast<int>(i / 12);
		const int month = 1 + static_cast<int>(i % 12);
		const std::string date = std::to_string(year) + (month < 10 ? "-0" : "-") + std::to_string(month) + "-01";
		dataset.push_back({{"month", date}, {"passengers", values[i]}});
	}
	return dataset;
}

void printHeader(const std::string &title) {
	std::cout << "\n=== " << title << " ===\n\n";
}

void runForecasts(const core::Dataset &dataset) {
	printHeader("Forecast");
	for (const auto &tag : engine::ModelFactory::supportedModels()) {
		engine::ForecastOptions options;
		options.date_column = "month";
		options.value_column = "passengers";
		options.periods = 6;
		options.model = engine::forecastModelOrDefault(tag);
		options.confidence_level = 0.9;

		const auto result = engine::forecast(dataset, options);
		std::cout << "  " << std::setw(24) << std::left << tag << "-> " << engine::toString(result.model);
		if (result.accuracy && result.accuracy->r_squared) {
			std::cout << " (R2 " << std::fixed << std::setprecision(3) << *result.accuracy->r_squared << ")";
		}
		std::cout << "\n";
		for (std::size_t h = 0; h < result.forecast.size(); ++h) {
			const auto &record = result.forecast[h];
			std::cout << "    " << core::toString(record.get("month")) << "  " << std::fixed << std::setprecision(1)
			          << core::numberOrZero(record.get("passengers"));
			if (result.confidence_interval) {
				std::cout << "  [" << core::numberOrZero(result.confidence_interval->lower[h].get("passengers"))
				          << ", " << core::numberOrZero(result.confidence_interval->upper[h].get("passengers"))
				          << "]";
			}
			std::cout << "\n";
		}
		std::cout.unsetf(std::ios::floatfield);
	}
}

void runAnomalies(core::Dataset dataset) {
	printHeader("Anomalies");
	dataset[20].set("passengers", 420.0);

	for (const auto method : {engine::AnomalyMethod::ZScore, engine::AnomalyMethod::Iqr}) {
		engine::AnomalyOptions options;
		options.value_column = "passengers";
		options.method = method;

		for (const auto &result : engine::detectAnomalies(dataset, options)) {
			if (!result.is_anomaly) {
				continue;
			}
			std::cout << "  " << std::setw(8) << std::left << engine::toString(method) << "row " << result.index
			          << " value " << result.value << " score " << result.score << " ("
			          << engine::toString(result.severity) << ")\n";
		}
	}
}

void runClustering(const core::Dataset &dataset) {
	printHeader("Clustering");

	core::Dataset features;
	for (std::size_t i = 0; i < dataset.size(); ++i) {
		core::DataRecord record = dataset[i];
		record.set("month_of_year", static_cast<double>(i % 12 + 1));
		features.push_back(std::move(record));
	}

	engine::ClusterOptions options;
	options.features = {"month_of_year", "passengers"};
	options.k = 3;

	clustering::RandomEngine rng(1949);
	const auto result = engine::cluster(features, options, rng);
	std::cout << "  " << result.iterations << " iterations, " << (result.converged ? "converged" : "not converged")
	          << "\n";
	for (std::size_t c = 0; c < result.centroids_original.size(); ++c) {
		const auto &centroid = result.centroids_original[c];
		std::cout << "  cluster " << c << ": " << result.cluster_sizes[c] << " rows, month " << std::fixed
		          << std::setprecision(1) << centroid[0] << ", passengers " << centroid[1] << "\n";
	}
	std::cout.unsetf(std::ios::floatfield);
}

} // namespace

int main() {
#ifndef ROWCAST_NO_LOGGING
	utils::Logging::init(spdlog::level::warn);
#endif

	try {
		const auto dataset = monthlyDataset(airPassengersData());
		runForecasts(dataset);
		runAnomalies(dataset);
		runClustering(dataset);
	} catch (const std::exception &e) {
		std::cerr << "Error: " << e.what() << "\n";
		return 1;
	}
	return 0;
}
