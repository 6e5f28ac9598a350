#include "csv_tables.hpp"

#include "gevrisk/errors.hpp"
#include "gevrisk/utils/logging.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <istream>
#include <limits>
#include <ostream>
#include <stdexcept>

namespace gevrisk::io {

namespace {

std::string trim(const std::string &text) {
	const auto first = std::find_if_not(text.begin(), text.end(), [](unsigned char c) { return std::isspace(c); });
	const auto last = std::find_if_not(text.rbegin(), text.rend(), [](unsigned char c) { return std::isspace(c); });
	if (first >= last.base()) {
		return {};
	}
	return std::string(first, last.base());
}

std::string lower(std::string text) {
	std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) { return std::tolower(c); });
	return text;
}

bool isMissing(const std::string &cell) {
	const auto value = lower(cell);
	return value.empty() || value == "na" || value == "nan";
}

// Reads the next non-blank record; false at end of input.
bool nextRecord(std::istream &in, std::string &line, std::size_t &line_number) {
	while (std::getline(in, line)) {
		++line_number;
		if (!line.empty() && line.back() == '\r') {
			line.pop_back();
		}
		if (line_number == 1 && line.rfind("\xEF\xBB\xBF", 0) == 0) {
			line.erase(0, 3);
		}
		if (!trim(line).empty()) {
			return true;
		}
	}
	return false;
}

double parseNumber(const std::string &cell, std::size_t line_number, const std::string &column) {
	const std::string text = trim(cell);
	if (isMissing(text)) {
		return std::numeric_limits<double>::quiet_NaN();
	}
	char *end = nullptr;
	const double value = std::strtod(text.c_str(), &end);
	if (end != text.c_str() + text.size()) {
		throw MalformedInputError("Line " + std::to_string(line_number) + ", column '" + column +
		                          "': cannot parse '" + text + "' as a number.");
	}
	return value;
}

std::size_t findColumn(const std::vector<std::string> &header, const std::string &name) {
	const auto wanted = lower(name);
	for (std::size_t i = 0; i < header.size(); ++i) {
		if (lower(trim(header[i])) == wanted) {
			return i;
		}
	}
	std::string available;
	for (const auto &column : header) {
		available += (available.empty() ? "" : ", ") + trim(column);
	}
	throw MalformedInputError("Metadata table has no '" + name + "' column (columns: " + available + ").");
}

std::ifstream openInput(const std::string &path) {
	std::ifstream in(path);
	if (!in) {
		throw std::runtime_error("Cannot open '" + path + "' for reading.");
	}
	return in;
}

std::string escapeCell(const std::string &cell, char delimiter) {
	const bool needs_quote = cell.find_first_of(std::string{delimiter, '"', '\n', '\r'}) != std::string::npos;
	if (!needs_quote) {
		return cell;
	}
	std::string out = "\"";
	for (char c : cell) {
		if (c == '"') {
			out += "\"\"";
		} else {
			out += c;
		}
	}
	out += '"';
	return out;
}

} // namespace

std::vector<std::string> splitRecord(const std::string &line, char delimiter) {
	std::vector<std::string> cells;
	std::string current;
	bool quoted = false;
	for (std::size_t i = 0; i < line.size(); ++i) {
		const char c = line[i];
		if (quoted) {
			if (c == '"') {
				if (i + 1 < line.size() && line[i + 1] == '"') {
					current += '"';
					++i;
				} else {
					quoted = false;
				}
			} else {
				current += c;
			}
		} else if (c == '"') {
			quoted = true;
		} else if (c == delimiter) {
			cells.push_back(std::move(current));
			current.clear();
		} else {
			current += c;
		}
	}
	if (quoted) {
		throw MalformedInputError("Unterminated quoted field in record: " + line);
	}
	cells.push_back(std::move(current));
	return cells;
}

std::vector<core::Structure> readStructures(std::istream &in, const MetadataColumns &columns) {
	std::string line;
	std::size_t line_number = 0;
	if (!nextRecord(in, line, line_number)) {
		throw MalformedInputError("Metadata table is empty.");
	}
	const auto header = splitRecord(line);
	const std::size_t name_col = findColumn(header, columns.name);
	const std::size_t hazard_col = findColumn(header, columns.hazard);
	const std::size_t lat_col = findColumn(header, columns.latitude);
	const std::size_t lon_col = findColumn(header, columns.longitude);
	const std::size_t agency_col = findColumn(header, columns.agency);
	const std::size_t crest_col = findColumn(header, columns.crest_elevation);

	std::vector<core::Structure> structures;
	while (nextRecord(in, line, line_number)) {
		const auto cells = splitRecord(line);
		if (cells.size() != header.size()) {
			throw MalformedInputError("Metadata line " + std::to_string(line_number) + " has " +
			                          std::to_string(cells.size()) + " fields, expected " +
			                          std::to_string(header.size()) + ".");
		}

		core::Structure structure;
		structure.name = trim(cells[name_col]);
		structure.hazard = trim(cells[hazard_col]);
		structure.latitude = parseNumber(cells[lat_col], line_number, columns.latitude);
		structure.longitude = parseNumber(cells[lon_col], line_number, columns.longitude);
		structure.agency = trim(cells[agency_col]);
		structure.crest_elevation = parseNumber(cells[crest_col], line_number, columns.crest_elevation);
		if (!std::isfinite(structure.crest_elevation)) {
			throw MalformedInputError("Metadata line " + std::to_string(line_number) + ": structure '" +
			                          structure.name + "' has no crest elevation.");
		}
		structures.push_back(std::move(structure));
	}

	GEVRISK_DEBUG("Read {} structures", structures.size());
	return structures;
}

std::vector<core::Structure> readStructures(const std::string &path, const MetadataColumns &columns) {
	auto in = openInput(path);
	return readStructures(in, columns);
}

core::ObservationTable readObservations(std::istream &in) {
	std::string line;
	std::size_t line_number = 0;
	if (!nextRecord(in, line, line_number)) {
		throw MalformedInputError("Observation table is empty.");
	}
	const auto header = splitRecord(line);
	if (header.size() < 2) {
		throw MalformedInputError("Observation table needs a row index column and at least one series column.");
	}

	core::ObservationTable table;
	for (std::size_t c = 1; c < header.size(); ++c) {
		table.column_names.push_back(trim(header[c]));
	}
	table.columns.resize(header.size() - 1);

	while (nextRecord(in, line, line_number)) {
		const auto cells = splitRecord(line);
		if (cells.size() != header.size()) {
			throw MalformedInputError("Observation line " + std::to_string(line_number) + " has " +
			                          std::to_string(cells.size()) + " fields, expected " +
			                          std::to_string(header.size()) + ".");
		}
		// Column 0 is the row index.
		for (std::size_t c = 1; c < cells.size(); ++c) {
			table.columns[c - 1].push_back(parseNumber(cells[c], line_number, table.column_names[c - 1]));
		}
	}

	GEVRISK_DEBUG("Read {} observation series of {} rows", table.columnCount(), table.rowCount());
	return table;
}

core::ObservationTable readObservations(const std::string &path) {
	auto in = openInput(path);
	return readObservations(in);
}

void validateAlignment(const std::vector<core::Structure> &structures, const core::ObservationTable &observations) {
	if (structures.size() != observations.columnCount()) {
		throw MalformedInputError("Metadata lists " + std::to_string(structures.size()) +
		                          " structures but the observation table has " +
		                          std::to_string(observations.columnCount()) + " series columns.");
	}
}

void writeTable(std::ostream &out, const analysis::Table &table, char delimiter) {
	auto write_record = [&](const std::vector<std::string> &cells) {
		for (std::size_t i = 0; i < cells.size(); ++i) {
			if (i > 0) {
				out << delimiter;
			}
			out << escapeCell(cells[i], delimiter);
		}
		out << '\n';
	};

	write_record(table.header);
	for (const auto &row : table.rows) {
		write_record(row);
	}
}

void writeTable(const std::string &path, const analysis::Table &table, char delimiter) {
	std::ofstream out(path);
	if (!out) {
		throw std::runtime_error("Cannot open '" + path + "' for writing.");
	}
	writeTable(out, table, delimiter);
	out.flush();
	if (!out) {
		throw std::runtime_error("Failed while writing '" + path + "'.");
	}
	GEVRISK_INFO("Wrote {} rows to {}", table.rows.size(), path);
}

} // namespace gevrisk::io
