#include "gevrisk/analysis/result_table.hpp"
#include "gevrisk/errors.hpp"
#include "gevrisk/stats/exceedance.hpp"

#include <cmath>
#include <iomanip>
#include <sstream>

namespace gevrisk::analysis {

namespace {

std::vector<std::string> metadataCells(const core::Structure &structure) {
	return {structure.name, structure.hazard, formatCell(structure.latitude), formatCell(structure.longitude),
	        structure.agency};
}

std::vector<std::string> metadataHeader() {
	return {"Name", "Hazard", "Lat", "Lon", "Agency"};
}

void appendNumbered(std::vector<std::string> &header, const std::string &prefix, std::size_t count) {
	for (std::size_t n = 1; n <= count; ++n) {
		header.push_back(prefix + std::to_string(n));
	}
}

} // namespace

std::string formatCell(const std::optional<double> &value) {
	if (!value || std::isnan(*value)) {
		return kMissingMarker;
	}
	std::ostringstream out;
	out << std::setprecision(15) << *value;
	return out.str();
}

std::vector<std::string> ResultRow::cells() const {
	auto cells = metadataCells(structure);
	cells.reserve(columnCount());
	for (const auto &value : ks_p_values) {
		cells.push_back(formatCell(value));
	}
	for (const auto &value : overtopping_risks) {
		cells.push_back(formatCell(value));
	}
	return cells;
}

std::vector<std::string> ResultTable::header() const {
	auto header = metadataHeader();
	appendNumbered(header, "KS_PValue_W", window_count);
	appendNumbered(header, "OverRisk_W", window_count);
	return header;
}

Table ResultTable::toTable() const {
	Table table;
	table.header = header();
	table.rows.reserve(rows.size());
	for (const auto &row : rows) {
		table.rows.push_back(row.cells());
	}
	return table;
}

ResultTable ResultAssembler::assemble(const std::vector<core::Structure> &structures,
                                      const StructureStatistics &statistics) {
	if (structures.size() != statistics.size()) {
		throw MalformedInputError("Cannot assemble results: " + std::to_string(structures.size()) +
		                          " structures but statistics for " + std::to_string(statistics.size()) + ".");
	}

	ResultTable table;
	table.window_count = statistics.empty() ? 0 : statistics.front().size();
	table.rows.reserve(structures.size());

	for (std::size_t s = 0; s < structures.size(); ++s) {
		const auto &windows = statistics[s];
		if (windows.size() != table.window_count) {
			throw MalformedInputError("Structure '" + structures[s].name + "' has " + std::to_string(windows.size()) +
			                          " window statistics, expected " + std::to_string(table.window_count) + ".");
		}

		ResultRow row;
		row.structure = structures[s];
		row.ks_p_values.reserve(windows.size());
		row.overtopping_risks.reserve(windows.size());
		for (const auto &window : windows) {
			row.ks_p_values.push_back(window.ks_p_value);
			row.overtopping_risks.push_back(window.overtopping_risk);
		}
		table.rows.push_back(std::move(row));
	}
	return table;
}

Table ResultAssembler::returnPeriods(const ResultTable &results) {
	Table table;
	table.header = metadataHeader();
	appendNumbered(table.header, "ReturnPeriod_W", results.window_count);

	for (const auto &row : results.rows) {
		auto cells = metadataCells(row.structure);
		for (const auto &risk : row.overtopping_risks) {
			cells.push_back(formatCell(stats::toReturnPeriod(risk)));
		}
		table.rows.push_back(std::move(cells));
	}
	return table;
}

Table ResultAssembler::parameters(const std::vector<core::Structure> &structures,
                                  const StructureStatistics &statistics, const core::WindowPlan &plan) {
	if (structures.size() != statistics.size()) {
		throw MalformedInputError("Cannot assemble parameters: structure and statistic counts differ.");
	}

	Table table;
	table.header = {"Name",        "Window",     "FirstRow",    "LastRow",   "FullSpan",     "Location",
	                "Scale",       "Shape",      "Location_SE", "Scale_SE",  "Shape_SE",     "NegLogLik",
	                "KS_Statistic", "KS_PValue", "OverRisk",    "Method",    "Status"};

	for (std::size_t s = 0; s < structures.size(); ++s) {
		if (statistics[s].size() != plan.windowCount()) {
			throw MalformedInputError("Structure '" + structures[s].name + "' does not match the window plan.");
		}
		for (std::size_t w = 0; w < statistics[s].size(); ++w) {
			const auto &statistic = statistics[s][w];
			const auto &window = plan.window(w);

			std::vector<std::string> cells{structures[s].name, std::to_string(w + 1), std::to_string(window.start + 1),
			                               std::to_string(window.end()), window.full_span ? "TRUE" : "FALSE"};
			if (statistic.fit) {
				const auto &fit = *statistic.fit;
				cells.push_back(formatCell(fit.params.location));
				cells.push_back(formatCell(fit.params.scale));
				cells.push_back(formatCell(fit.params.shape));
				for (std::size_t i = 0; i < 3; ++i) {
					cells.push_back(fit.standard_errors ? formatCell((*fit.standard_errors)[i]) : kMissingMarker);
				}
				cells.push_back(formatCell(fit.negative_log_likelihood));
				cells.push_back(formatCell(statistic.ks_statistic));
				cells.push_back(formatCell(statistic.ks_p_value));
				cells.push_back(formatCell(statistic.overtopping_risk));
				cells.push_back(estimation::describe(fit.method));
				cells.push_back("ok");
			} else {
				// Parameters, errors, likelihood, KS, risk and method.
				cells.insert(cells.end(), 11, std::string(kMissingMarker));
				cells.push_back(statistic.failure.empty() ? "failed" : statistic.failure);
			}
			table.rows.push_back(std::move(cells));
		}
	}
	return table;
}

} // namespace gevrisk::analysis
