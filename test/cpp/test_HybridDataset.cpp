#include "TempFileFixture.hpp"
#include <HybridDataset.hpp>
#include <InMemoryDataset.hpp>
#include <catch2/catch_template_test_macros.hpp>
#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <filesystem>
#include <type_traits>

using msms::EmbeddedHybridDataset;
using msms::HybridConfig;
using msms::SplitHybridDataset;

static const std::vector<std::string> TWO_FILES = {DATA_DIR + "basic_3spectra.mgf", DATA_DIR + "second_file.mgf"};

template <typename DatasetT>
static std::string layout_tag() {
	return std::is_same_v<DatasetT, SplitHybridDataset> ? "split" : "embedded";
}

// Store paths unique to the test and layout, removed when the fixture goes away
template <typename DatasetT>
static HybridConfig store_config(TempFileFixture &fixture, const std::string &name) {
	HybridConfig config;
	auto stem = name + "_" + layout_tag<DatasetT>();
	config.layout = std::is_same_v<DatasetT, SplitHybridDataset> ? msms::StorageLayout::SPLIT
	                                                              : msms::StorageLayout::EMBEDDED;
	config.metadata_path = fixture.path(stem + ".duckdb");
	fixture.track(config.metadata_path + ".wal");
	config.array_path = fixture.path(stem + ".h5");
	// Small batches so ingestion spans several transactions
	config.insert_batch_size = 2;
	return config;
}

TEMPLATE_TEST_CASE("HybridDataset returns the same records as InMemoryDataset", "[hybrid]", EmbeddedHybridDataset,
                   SplitHybridDataset) {
	TempFileFixture fixture;
	auto config = store_config<TestType>(fixture, "equal");
	auto dataset = TestType::build(TWO_FILES, config);
	msms::InMemoryDataset in_memory(TWO_FILES);

	REQUIRE(dataset->length() == 5);
	for (int64_t i = 0; i < dataset->length(); i++) {
		CHECK(dataset->get(i) == in_memory.get(i));
	}
	CHECK(dataset->get_by_id("E") == in_memory.get_by_id("E"));
	CHECK(dataset->metadata().count() == 5);
}

TEMPLATE_TEST_CASE("HybridDataset keeps unknown values and empty spectra", "[hybrid]", EmbeddedHybridDataset,
                   SplitHybridDataset) {
	TempFileFixture fixture;
	auto config = store_config<TestType>(fixture, "sparse");
	std::vector<std::string> sources {DATA_DIR + "missing_params.mgf", DATA_DIR + "global_params.mgf"};
	auto dataset = TestType::build(sources, config);
	msms::InMemoryDataset in_memory(sources);

	REQUIRE(dataset->length() == in_memory.length());
	for (int64_t i = 0; i < dataset->length(); i++) {
		CHECK(dataset->get(i) == in_memory.get(i));
	}
	auto empty = dataset->get_by_id("empty_spectrum");
	CHECK(empty.num_peaks() == 0);
	CHECK_FALSE(dataset->get_by_id("bad_charge").charge().has_value());
	CHECK(dataset->get(3).extra_field("COM") == "Example run");
}

TEMPLATE_TEST_CASE("HybridDataset batch keeps input order", "[hybrid]", EmbeddedHybridDataset, SplitHybridDataset) {
	TempFileFixture fixture;
	auto dataset = TestType::build(TWO_FILES, store_config<TestType>(fixture, "batch"));

	auto records = dataset->batch({3, 1, 2, 1, 4});
	REQUIRE(records.size() == 5);
	CHECK(records[0].id() == "D");
	CHECK(records[1].id() == "B");
	CHECK(records[2].id() == "C");
	CHECK(records[3].id() == "B");
	CHECK(records[4].id() == "E");
	CHECK(records[4].mz_array() == std::vector<double> {180.0, 190.0});
	CHECK(dataset->batch({}).empty());

	CHECK_THROWS_AS(dataset->batch({0, 5}), msms::OutOfRangeError);
	CHECK_THROWS_AS(dataset->get(-1), msms::OutOfRangeError);
	CHECK_THROWS_AS(dataset->get(5), msms::OutOfRangeError);
	CHECK_THROWS_AS(dataset->get_by_id("missing"), msms::NotFoundError);
}

TEMPLATE_TEST_CASE("HybridDataset query runs in the metadata store", "[hybrid]", EmbeddedHybridDataset,
                   SplitHybridDataset) {
	TempFileFixture fixture;
	auto dataset = TestType::build(TWO_FILES, store_config<TestType>(fixture, "query"));

	auto charge2 = dataset->query(msms::SpectrumPredicate::parse("charge == 2"));
	REQUIRE(charge2.size() == 3);
	CHECK(charge2[0].id() == "A");
	CHECK(charge2[1].id() == "C");
	CHECK(charge2[2].id() == "E");
	CHECK(charge2[1].mz_array() == std::vector<double> {130.0, 140.0, 150.0, 160.0});

	auto orbitrap = dataset->query(msms::SpectrumPredicate::parse("source_instrument = 'Orbitrap'"));
	REQUIRE(orbitrap.size() == 2);
	CHECK(orbitrap[0].id() == "C");
	CHECK(orbitrap[1].id() == "D");

	auto late = dataset->query(msms::SpectrumPredicate::parse("retention_time >= 37.75 AND scans != '202'"));
	REQUIRE(late.size() == 2);
	CHECK(late[0].id() == "C");
	CHECK(late[1].id() == "D");

	// Extra fields compared with numbers; text that is not a number never matches
	CHECK(dataset->query(msms::SpectrumPredicate::parse("source_instrument > 0")).empty());
	CHECK(dataset->query(msms::SpectrumPredicate::parse("charge == 0")).empty());
	CHECK(dataset->query(msms::SpectrumPredicate()).size() == 5);
}

TEMPLATE_TEST_CASE("HybridDataset reopens existing stores without re-ingesting", "[hybrid][reopen]",
                   EmbeddedHybridDataset, SplitHybridDataset) {
	TempFileFixture fixture;
	auto config = store_config<TestType>(fixture, "reopen");
	{
		auto built = TestType::build(TWO_FILES, config);
		CHECK(built->length() == 5);
	}
	REQUIRE(TestType::exists(config));

	auto reopened = TestType::open(config);
	msms::InMemoryDataset in_memory(TWO_FILES);
	REQUIRE(reopened->length() == 5);
	CHECK(reopened->get(0) == in_memory.get(0));
	CHECK(reopened->batch({4, 0})[0] == in_memory.get(4));
	CHECK(reopened->metadata().info(msms::INFO_RECORD_COUNT) == "5");
	CHECK(reopened->metadata().info(msms::INFO_LAYOUT) == layout_tag<TestType>());
}

TEMPLATE_TEST_CASE("HybridDataset refuses to overwrite a store unless asked", "[hybrid][reopen]",
                   EmbeddedHybridDataset, SplitHybridDataset) {
	TempFileFixture fixture;
	auto config = store_config<TestType>(fixture, "overwrite");
	TestType::build({DATA_DIR + "basic_3spectra.mgf"}, config);

	CHECK_THROWS_WITH(TestType::build(TWO_FILES, config), Catch::Matchers::ContainsSubstring("rebuild"));
	CHECK(TestType::open(config)->length() == 3);

	config.rebuild = true;
	auto rebuilt = TestType::build(TWO_FILES, config);
	CHECK(rebuilt->length() == 5);
}

TEMPLATE_TEST_CASE("HybridDataset removes partial stores when a build fails", "[hybrid]", EmbeddedHybridDataset,
                   SplitHybridDataset) {
	TempFileFixture fixture;
	auto config = store_config<TestType>(fixture, "failed");

	CHECK_THROWS_AS(TestType::build({DATA_DIR + "duplicate_ids.mgf"}, config), msms::DuplicateIdError);
	CHECK_FALSE(std::filesystem::exists(config.metadata_path));
	CHECK_FALSE(std::filesystem::exists(config.array_path));

	CHECK_THROWS_AS(TestType::build({DATA_DIR + "basic_3spectra.mgf", DATA_DIR + "malformed_peak.mgf"}, config),
	                msms::ParseError);
	CHECK_FALSE(TestType::exists(config));
	CHECK_THROWS_AS(TestType::open(config), msms::StorageError);
}

TEMPLATE_TEST_CASE("HybridDataset prefetches aligned chunks", "[hybrid][prefetch]", EmbeddedHybridDataset,
                   SplitHybridDataset) {
	TempFileFixture fixture;
	auto config = store_config<TestType>(fixture, "prefetch");
	config.prefetch_chunk_size = 2;
	auto dataset = TestType::build(TWO_FILES, config);
	msms::InMemoryDataset in_memory(TWO_FILES);

	CHECK(dataset->get(0) == in_memory.get(0));
	CHECK(dataset->get(1) == in_memory.get(1));
	CHECK(dataset->prefetch_count() == 1);
	CHECK(dataset->get(2) == in_memory.get(2));
	CHECK(dataset->get(3) == in_memory.get(3));
	CHECK(dataset->prefetch_count() == 2);
	// Last chunk is short
	CHECK(dataset->get(4) == in_memory.get(4));
	CHECK(dataset->prefetch_count() == 3);
	CHECK(dataset->get(1) == in_memory.get(1));
	CHECK(dataset->prefetch_count() == 4);
}

TEST_CASE("HybridDataset open rejects a store of the other layout", "[hybrid][reopen]") {
	TempFileFixture fixture;
	auto config = store_config<EmbeddedHybridDataset>(fixture, "wrong_layout");
	EmbeddedHybridDataset::build({DATA_DIR + "basic_3spectra.mgf"}, config);

	CHECK_THROWS_WITH(SplitHybridDataset::open(config), Catch::Matchers::ContainsSubstring("layout"));
}

TEST_CASE("SplitHybridDataset open requires the array file", "[hybrid][reopen]") {
	TempFileFixture fixture;
	auto config = store_config<SplitHybridDataset>(fixture, "missing_arrays");
	SplitHybridDataset::build({DATA_DIR + "basic_3spectra.mgf"}, config);

	std::filesystem::remove(config.array_path);
	CHECK_THROWS_AS(SplitHybridDataset::open(config), msms::StorageError);
}

TEST_CASE("SplitHybridDataset writes uncompressed arrays when asked", "[hybrid]") {
	TempFileFixture fixture;
	auto config = store_config<SplitHybridDataset>(fixture, "uncompressed");
	config.compression = false;
	auto dataset = SplitHybridDataset::build(TWO_FILES, config);
	CHECK(dataset->get(2).intensity_array() == std::vector<double> {3.0, 4.0, 5.0, 6.0});
}
