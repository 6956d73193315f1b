#include "TempFileFixture.hpp"
#include <DatasetConfig.hpp>
#include <DatasetErrors.hpp>
#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <filesystem>

using msms::ConfigError;
using msms::parse_config;

TEST_CASE("parse_config reads every section", "[config]") {
	auto config = parse_config(R"(
backend: hybrid
sources: [a.mgf, b.mgf]
on_demand:
  index_path: spectra.idx
hybrid:
  layout: embedded
  metadata_path: spectra.duckdb
  array_path: spectra.h5
  insert_batch_size: 500
  prefetch_chunk_size: 64
  compression: false
  rebuild: true
logging:
  level: debug
)");

	CHECK(config.backend == msms::Backend::HYBRID);
	CHECK(config.sources == std::vector<std::string> {"a.mgf", "b.mgf"});
	CHECK(config.on_demand.index_path == "spectra.idx");
	CHECK(config.hybrid.layout == msms::StorageLayout::EMBEDDED);
	CHECK(config.hybrid.metadata_path == "spectra.duckdb");
	CHECK(config.hybrid.array_path == "spectra.h5");
	CHECK(config.hybrid.insert_batch_size == 500);
	CHECK(config.hybrid.prefetch_chunk_size == 64);
	CHECK_FALSE(config.hybrid.compression);
	CHECK(config.hybrid.rebuild);
	CHECK(config.logging.level == "debug");
}

TEST_CASE("parse_config keeps defaults for absent keys", "[config]") {
	auto config = parse_config("sources:\n  - only.mgf\n");

	CHECK(config.backend == msms::Backend::IN_MEMORY);
	CHECK(config.on_demand.index_path.empty());
	CHECK(config.hybrid.layout == msms::StorageLayout::SPLIT);
	CHECK(config.hybrid.insert_batch_size == 10000);
	CHECK(config.hybrid.prefetch_chunk_size == 0);
	CHECK(config.hybrid.compression);
	CHECK_FALSE(config.hybrid.rebuild);
	CHECK(config.logging.level == "info");
}

TEST_CASE("parse_config rejects invalid values", "[config]") {
	CHECK_THROWS_WITH(parse_config("backend: sqlite\nsources: [a.mgf]\n"),
	                  Catch::Matchers::ContainsSubstring("Unknown backend"));
	CHECK_THROWS_WITH(parse_config("sources: [a.mgf]\nhybrid:\n  layout: columnar\n"),
	                  Catch::Matchers::ContainsSubstring("layout"));
	CHECK_THROWS_WITH(parse_config("sources: [a.mgf]\nhybrid:\n  insert_batch_size: 0\n"),
	                  Catch::Matchers::ContainsSubstring("insert_batch_size"));
	CHECK_THROWS_WITH(parse_config("sources: [a.mgf]\nhybrid:\n  prefetch_chunk_size: -1\n"),
	                  Catch::Matchers::ContainsSubstring("negative"));
	CHECK_THROWS_WITH(parse_config("sources: [a.mgf]\nhybrid:\n  compression: sometimes\n"),
	                  Catch::Matchers::ContainsSubstring("hybrid.compression"));
	CHECK_THROWS_WITH(parse_config("sources: [a.mgf]\nlogging:\n  level: loud\n"),
	                  Catch::Matchers::ContainsSubstring("log level"));
	CHECK_THROWS_WITH(parse_config("sources: [a.mgf]\nhybird: {}\n"), Catch::Matchers::ContainsSubstring("hybird"));
	CHECK_THROWS_AS(parse_config("sources: a.mgf\n"), ConfigError);
	CHECK_THROWS_AS(parse_config("sources: [a.mgf\n"), ConfigError);
	CHECK_THROWS_AS(parse_config("- just\n- a list\n"), ConfigError);
}

TEST_CASE("parse_config validates backend requirements", "[config]") {
	CHECK_THROWS_WITH(parse_config("backend: in_memory\n"), Catch::Matchers::ContainsSubstring("source"));
	CHECK_THROWS_WITH(parse_config("backend: hybrid\nsources: [a.mgf]\n"),
	                  Catch::Matchers::ContainsSubstring("metadata_path"));
	CHECK_THROWS_WITH(parse_config("backend: hybrid\nsources: [a.mgf]\nhybrid:\n  metadata_path: m.duckdb\n"),
	                  Catch::Matchers::ContainsSubstring("array_path"));
	// The embedded layout has no array file
	CHECK_NOTHROW(parse_config(
	    "backend: hybrid\nsources: [a.mgf]\nhybrid:\n  layout: embedded\n  metadata_path: m.duckdb\n"));
}

TEST_CASE("load_config resolves paths against the file's directory", "[config]") {
	TempFileFixture fixture;
	auto path = fixture.write("config.yaml", "backend: on_demand\n"
	                                         "sources: [runs/a.mgf, /abs/b.mgf]\n"
	                                         "on_demand:\n  index_path: a.idx\n");
	auto base = std::filesystem::path(path).parent_path();

	auto config = msms::load_config(path);
	CHECK(config.backend == msms::Backend::ON_DEMAND);
	REQUIRE(config.sources.size() == 2);
	CHECK(config.sources[0] == (base / "runs/a.mgf").lexically_normal().string());
	CHECK(config.sources[1] == "/abs/b.mgf");
	CHECK(config.on_demand.index_path == (base / "a.idx").lexically_normal().string());
	CHECK(config.hybrid.metadata_path.empty());

	CHECK_THROWS_AS(msms::load_config(fixture.path("absent.yaml")), ConfigError);
}
