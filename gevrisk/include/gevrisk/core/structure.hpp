#pragma once

#include <string>
#include <vector>

namespace gevrisk::core {

/**
 * @struct Structure
 * @brief One monitored dam.
 */
struct Structure {
	std::string name;
	std::string hazard;
	double latitude = 0.0;
	double longitude = 0.0;
	std::string agency;
	/// Threshold of the exceedance analysis, in feet.
	double crest_elevation = 0.0;
};

/// Water levels of one structure, earliest first. Missing values are NaN.
using ObservationSeries = std::vector<double>;

/**
 * @struct ObservationTable
 * @brief Observation series by column, one column per structure.
 */
struct ObservationTable {
	std::vector<std::string> column_names;
	std::vector<ObservationSeries> columns;

	std::size_t columnCount() const {
		return columns.size();
	}

	std::size_t rowCount() const {
		return columns.empty() ? 0 : columns.front().size();
	}
};

} // namespace gevrisk::core
