#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "csv_tables.hpp"
#include "run_config.hpp"
#include "gevrisk/errors.hpp"

#include <cmath>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace gevrisk::io;
using gevrisk::MalformedInputError;

TEST_CASE("splitRecord honours quoted fields", "[io][csv]") {
	REQUIRE(splitRecord("a,b,,d") == std::vector<std::string>{"a", "b", "", "d"});
	REQUIRE(splitRecord("\"Lake, North\",\"say \"\"hi\"\"\",3") ==
	        std::vector<std::string>{"Lake, North", "say \"hi\"", "3"});
	REQUIRE(splitRecord("x;y", ';') == std::vector<std::string>{"x", "y"});
	REQUIRE_THROWS_AS(splitRecord("\"open,field"), MalformedInputError);
}

TEST_CASE("readStructures locates columns by name", "[io][csv][metadata]") {
	std::istringstream in("\xEF\xBB\xBFid,name,HAZARD,Lat,Lon,Agency,TOPDAM_FT,Extra\r\n"
	                      "1,Dam_A,High,38.5,-121.5,USACE,100,x\r\n"
	                      "\n"
	                      "2,\"Dam, B\",Low,,NA,BOR,200.5,y\n");

	const auto structures = readStructures(in);
	REQUIRE(structures.size() == 2);
	REQUIRE(structures[0].name == "Dam_A");
	REQUIRE(structures[0].hazard == "High");
	REQUIRE(structures[0].latitude == Catch::Approx(38.5));
	REQUIRE(structures[0].crest_elevation == Catch::Approx(100.0));
	REQUIRE(structures[1].name == "Dam, B");
	REQUIRE(std::isnan(structures[1].latitude));
	REQUIRE(std::isnan(structures[1].longitude));
	REQUIRE(structures[1].agency == "BOR");
	REQUIRE(structures[1].crest_elevation == Catch::Approx(200.5));
}

TEST_CASE("readStructures rejects malformed metadata", "[io][csv][metadata][errors]") {
	SECTION("missing crest column") {
		std::istringstream in("Name,Hazard,Lat,Lon,Agency\nA,High,1,2,X\n");
		REQUIRE_THROWS_AS(readStructures(in), MalformedInputError);
	}

	SECTION("custom crest column") {
		std::istringstream in("Name,Hazard,Lat,Lon,Agency,Crest\nA,High,1,2,X,55\n");
		MetadataColumns columns;
		columns.crest_elevation = "crest";
		const auto structures = readStructures(in, columns);
		REQUIRE(structures.at(0).crest_elevation == Catch::Approx(55.0));
	}

	SECTION("ragged row") {
		std::istringstream in("Name,Hazard,Lat,Lon,Agency,TOPDAM_FT\nA,High,1,2,X\n");
		REQUIRE_THROWS_AS(readStructures(in), MalformedInputError);
	}

	SECTION("missing crest value") {
		std::istringstream in("Name,Hazard,Lat,Lon,Agency,TOPDAM_FT\nA,High,1,2,X,NA\n");
		REQUIRE_THROWS_AS(readStructures(in), MalformedInputError);
	}

	SECTION("non-numeric crest") {
		std::istringstream in("Name,Hazard,Lat,Lon,Agency,TOPDAM_FT\nA,High,1,2,X,tall\n");
		REQUIRE_THROWS_AS(readStructures(in), MalformedInputError);
	}

	SECTION("empty input") {
		std::istringstream in("");
		REQUIRE_THROWS_AS(readStructures(in), MalformedInputError);
	}
}

TEST_CASE("readObservations drops the row index column", "[io][csv][observations]") {
	std::istringstream in(",Dam_A,Dam_B\n1,10.5,200\n2,,201\n3,NA,NaN\n4,11,202.25\n");

	const auto table = readObservations(in);
	REQUIRE(table.columnCount() == 2);
	REQUIRE(table.rowCount() == 4);
	REQUIRE(table.column_names == std::vector<std::string>{"Dam_A", "Dam_B"});
	REQUIRE(table.columns[0][0] == Catch::Approx(10.5));
	REQUIRE(std::isnan(table.columns[0][1]));
	REQUIRE(std::isnan(table.columns[0][2]));
	REQUIRE(std::isnan(table.columns[1][2]));
	REQUIRE(table.columns[1][3] == Catch::Approx(202.25));

	std::istringstream bad(",A\n1,abc\n");
	REQUIRE_THROWS_AS(readObservations(bad), MalformedInputError);

	std::istringstream ragged(",A,B\n1,2\n");
	REQUIRE_THROWS_AS(readObservations(ragged), MalformedInputError);

	std::istringstream index_only("row\n1\n");
	REQUIRE_THROWS_AS(readObservations(index_only), MalformedInputError);
}

TEST_CASE("validateAlignment requires one column per structure", "[io][csv]") {
	std::vector<gevrisk::core::Structure> structures(2);
	gevrisk::core::ObservationTable table;
	table.columns.resize(3);
	REQUIRE_THROWS_AS(validateAlignment(structures, table), MalformedInputError);

	table.columns.resize(2);
	REQUIRE_NOTHROW(validateAlignment(structures, table));
}

TEST_CASE("writeTable quotes only where needed", "[io][csv][write]") {
	gevrisk::analysis::Table table;
	table.header = {"Name", "OverRisk_W1"};
	table.rows = {{"Dam_A", "0.25"}, {"Lake, \"North\"", "NA"}};

	std::ostringstream out;
	writeTable(out, table);
	REQUIRE(out.str() == "Name,OverRisk_W1\nDam_A,0.25\n\"Lake, \"\"North\"\"\",NA\n");

	REQUIRE_THROWS_AS(readObservations(std::string("/nonexistent/dir/data.csv")), std::runtime_error);
}

TEST_CASE("parseArguments maps flags onto the run configuration", "[io][cli]") {
	SECTION("defaults") {
		const char *argv[] = {"gevrisk_cli", "--out", "results.csv"};
		const auto config = parseArguments(3, argv);
		REQUIRE(config.out_path == "results.csv");
		REQUIRE(config.info_path == "dam_info.csv");
		REQUIRE(config.data_path == "dam_data.csv");
		REQUIRE(config.step == 1);
		REQUIRE(config.threads == 0);
		REQUIRE(config.fit_method == gevrisk::estimation::FitMethod::NelderMead);
		REQUIRE(config.ks_method == gevrisk::stats::KsMethod::Asymptotic);
		REQUIRE(config.log_level == spdlog::level::info);
		REQUIRE(config.return_periods_path.empty());
	}

	SECTION("every option") {
		const char *argv[] = {"gevrisk_cli", "--info", "i.csv", "--data", "d.csv", "--out", "o.csv",
		                      "--step", "3", "--threads", "2", "--return-periods-out", "rp.csv",
		                      "--params-out", "p.csv", "--crest-column", "CREST", "--ks-exact",
		                      "--polish", "--verbose"};
		const auto config = parseArguments(20, argv);
		REQUIRE(config.info_path == "i.csv");
		REQUIRE(config.data_path == "d.csv");
		REQUIRE(config.step == 3);
		REQUIRE(config.threads == 2);
		REQUIRE(config.return_periods_path == "rp.csv");
		REQUIRE(config.params_path == "p.csv");
		REQUIRE(config.columns.crest_elevation == "CREST");
		REQUIRE(config.ks_method == gevrisk::stats::KsMethod::Exact);
		REQUIRE(config.fit_method == gevrisk::estimation::FitMethod::NelderMeadLbfgs);
		REQUIRE(config.log_level == spdlog::level::debug);
	}

	SECTION("usage errors") {
		const char *missing_out[] = {"gevrisk_cli"};
		REQUIRE_THROWS_AS(parseArguments(1, missing_out), std::invalid_argument);

		const char *zero_step[] = {"gevrisk_cli", "--out", "o.csv", "--step", "0"};
		REQUIRE_THROWS_AS(parseArguments(5, zero_step), std::invalid_argument);

		const char *negative_step[] = {"gevrisk_cli", "--out", "o.csv", "--step", "-2"};
		REQUIRE_THROWS_AS(parseArguments(5, negative_step), std::invalid_argument);

		const char *dangling[] = {"gevrisk_cli", "--out"};
		REQUIRE_THROWS_AS(parseArguments(2, dangling), std::invalid_argument);

		const char *unknown[] = {"gevrisk_cli", "--out", "o.csv", "--bogus"};
		REQUIRE_THROWS_AS(parseArguments(4, unknown), std::invalid_argument);
	}

	SECTION("help needs no output path") {
		const char *argv[] = {"gevrisk_cli", "--help"};
		REQUIRE(parseArguments(2, argv).show_help);
		REQUIRE(usage("gevrisk_cli").find("--out") != std::string::npos);
	}
}
