#pragma once

#include "gevrisk/analysis/batch_runner.hpp"
#include "gevrisk/core/structure.hpp"
#include "gevrisk/core/window.hpp"

#include <optional>
#include <string>
#include <vector>

namespace gevrisk::analysis {

/// Serialized form of an absent statistic.
inline constexpr const char *kMissingMarker = "NA";

/// Name, Hazard, Lat, Lon, Agency.
inline constexpr std::size_t kMetadataColumns = 5;

/// Formats a value with 15 significant digits; absent or NaN becomes the missing marker.
std::string formatCell(const std::optional<double> &value);

/**
 * @struct Table
 * @brief Header plus text rows, ready for a delimited writer.
 */
struct Table {
	std::vector<std::string> header;
	std::vector<std::vector<std::string>> rows;
};

/**
 * @struct ResultRow
 * @brief One structure's metadata followed by its per-window statistics.
 */
struct ResultRow {
	core::Structure structure;
	std::vector<std::optional<double>> ks_p_values;       ///< window order
	std::vector<std::optional<double>> overtopping_risks; ///< window order

	std::size_t columnCount() const {
		return kMetadataColumns + ks_p_values.size() + overtopping_risks.size();
	}

	std::vector<std::string> cells() const;
};

struct ResultTable {
	std::size_t window_count = 0;
	std::vector<ResultRow> rows;

	/// Name,Hazard,Lat,Lon,Agency,KS_PValue_W1..WK,OverRisk_W1..WK
	std::vector<std::string> header() const;

	Table toTable() const;
};

/**
 * @class ResultAssembler
 * @brief Merges structure metadata with the window statistics of a run.
 *
 * Rows follow the input order of the structures and every structure gets a row,
 * including structures whose windows all failed.
 */
class ResultAssembler {
public:
	/**
	 * @throws MalformedInputError if the statistics do not line up with the
	 * structures or have differing window counts.
	 */
	static ResultTable assemble(const std::vector<core::Structure> &structures, const StructureStatistics &statistics);

	/// Name,Hazard,Lat,Lon,Agency,ReturnPeriod_W1..WK
	static Table returnPeriods(const ResultTable &results);

	/// One line per (structure, window) with the fitted GEV parameters.
	static Table parameters(const std::vector<core::Structure> &structures, const StructureStatistics &statistics,
	                        const core::WindowPlan &plan);
};

} // namespace gevrisk::analysis
