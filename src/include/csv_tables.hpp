#pragma once

#include "gevrisk/analysis/result_table.hpp"
#include "gevrisk/core/structure.hpp"

#include <iosfwd>
#include <string>
#include <vector>

namespace gevrisk::io {

/**
 * @struct MetadataColumns
 * @brief Header names of the structure metadata fields, matched case-insensitively.
 */
struct MetadataColumns {
	std::string name = "Name";
	std::string hazard = "Hazard";
	std::string latitude = "Lat";
	std::string longitude = "Lon";
	std::string agency = "Agency";
	std::string crest_elevation = "TOPDAM_FT";
};

/// Splits one delimited record, honouring double-quoted fields.
std::vector<std::string> splitRecord(const std::string &line, char delimiter = ',');

/**
 * @brief Reads structure metadata, one record per line after the header.
 * @throws MalformedInputError for missing columns, ragged rows or a
 * non-numeric crest elevation.
 */
std::vector<core::Structure> readStructures(std::istream &in, const MetadataColumns &columns = {});
std::vector<core::Structure> readStructures(const std::string &path, const MetadataColumns &columns = {});

/**
 * @brief Reads the observation table. The first column is a row index and is
 * dropped; each remaining column becomes one series. Empty cells and NA are NaN.
 * @throws MalformedInputError for ragged rows or unparsable numbers.
 */
core::ObservationTable readObservations(std::istream &in);
core::ObservationTable readObservations(const std::string &path);

/**
 * @brief Checks that every structure has exactly one observation column.
 * @throws MalformedInputError on a count mismatch.
 */
void validateAlignment(const std::vector<core::Structure> &structures, const core::ObservationTable &observations);

void writeTable(std::ostream &out, const analysis::Table &table, char delimiter = ',');
void writeTable(const std::string &path, const analysis::Table &table, char delimiter = ',');

} // namespace gevrisk::io
