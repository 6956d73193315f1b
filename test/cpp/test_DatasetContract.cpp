// Properties every backend must satisfy, exercised through open_dataset()

#include "TempFileFixture.hpp"
#include <DatasetFactory.hpp>
#include <HybridDataset.hpp>
#include <InMemoryDataset.hpp>
#include <OnDemandDataset.hpp>
#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>
#include <memory>

using msms::Backend;
using msms::DatasetConfig;

static const std::vector<std::string> TWO_FILES = {DATA_DIR + "basic_3spectra.mgf", DATA_DIR + "second_file.mgf"};

struct BackendCase {
	std::string name;
	Backend backend;
	msms::StorageLayout layout;
};

static DatasetConfig contract_config(TempFileFixture &fixture, const BackendCase &backend,
                                     const std::vector<std::string> &sources) {
	DatasetConfig config;
	config.backend = backend.backend;
	config.sources = sources;
	config.logging.level = "warn";
	config.on_demand.index_path = fixture.path("contract_" + backend.name + ".idx");
	fixture.track(config.on_demand.index_path + ".tmp");
	config.hybrid.layout = backend.layout;
	config.hybrid.metadata_path = fixture.path("contract_" + backend.name + ".duckdb");
	fixture.track(config.hybrid.metadata_path + ".wal");
	config.hybrid.array_path = fixture.path("contract_" + backend.name + ".h5");
	return config;
}

static BackendCase any_backend() {
	return GENERATE(BackendCase {"in_memory", Backend::IN_MEMORY, msms::StorageLayout::SPLIT},
	                BackendCase {"on_demand", Backend::ON_DEMAND, msms::StorageLayout::SPLIT},
	                BackendCase {"embedded", Backend::HYBRID, msms::StorageLayout::EMBEDDED},
	                BackendCase {"split", Backend::HYBRID, msms::StorageLayout::SPLIT});
}

TEST_CASE("Every backend agrees with the in-memory records", "[contract]") {
	auto backend = any_backend();
	TempFileFixture fixture;
	auto dataset = msms::open_dataset(contract_config(fixture, backend, TWO_FILES));
	msms::InMemoryDataset reference(TWO_FILES);

	INFO("backend " << backend.name);
	REQUIRE(dataset->length() == 5);
	for (int64_t i = 0; i < dataset->length(); i++) {
		auto record = dataset->get(i);
		CHECK(record == reference.get(i));
		CHECK(dataset->batch({i})[0].id() == record.id());
		CHECK(dataset->get_by_id(record.id()) == record);
	}
}

TEST_CASE("Every backend orders batches and queries the same way", "[contract]") {
	auto backend = any_backend();
	TempFileFixture fixture;
	auto dataset = msms::open_dataset(contract_config(fixture, backend, {DATA_DIR + "basic_3spectra.mgf"}));

	INFO("backend " << backend.name);
	auto ids = [](const std::vector<msms::SpectrumRecord> &records) {
		std::vector<std::string> out;
		for (const auto &record : records) {
			out.push_back(record.id());
		}
		return out;
	};

	CHECK(ids(dataset->batch({2, 0, 1})) == std::vector<std::string> {"C", "A", "B"});
	CHECK(ids(dataset->query(msms::SpectrumPredicate().where("charge", msms::CompareOp::EQ, int64_t(2)))) ==
	      std::vector<std::string> {"A", "C"});
	CHECK(ids(dataset->query(msms::SpectrumPredicate::parse("precursor_mz > 500"))) ==
	      std::vector<std::string> {"B", "C"});
	CHECK(ids(dataset->query(msms::SpectrumPredicate::parse("id = 'B'"))) == std::vector<std::string> {"B"});
	CHECK(dataset->query(msms::SpectrumPredicate::parse("charge == 5")).empty());
}

TEST_CASE("Every backend rejects out-of-range access", "[contract]") {
	auto backend = any_backend();
	TempFileFixture fixture;
	auto dataset = msms::open_dataset(contract_config(fixture, backend, {DATA_DIR + "basic_3spectra.mgf"}));

	INFO("backend " << backend.name);
	CHECK_THROWS_AS(dataset->get(dataset->length()), msms::OutOfRangeError);
	CHECK_THROWS_AS(dataset->get(-1), msms::OutOfRangeError);
	CHECK_THROWS_AS(dataset->batch({0, -1}), msms::OutOfRangeError);
	CHECK_THROWS_AS(dataset->get_by_id("Z"), msms::NotFoundError);
	CHECK(dataset->get(0).id() == "A");
}

TEST_CASE("Every backend refuses duplicate ids", "[contract]") {
	auto backend = any_backend();
	TempFileFixture fixture;
	auto config = contract_config(fixture, backend, {DATA_DIR + "duplicate_ids.mgf"});

	INFO("backend " << backend.name);
	std::unique_ptr<msms::SpectraDataset> dataset;
	CHECK_THROWS_AS(dataset = msms::open_dataset(config), msms::DuplicateIdError);
	CHECK(dataset == nullptr);
}

TEST_CASE("open_dataset picks the concrete backend", "[contract][factory]") {
	TempFileFixture fixture;

	auto in_memory = msms::open_dataset(
	    contract_config(fixture, {"f_mem", Backend::IN_MEMORY, msms::StorageLayout::SPLIT}, TWO_FILES));
	CHECK(dynamic_cast<msms::InMemoryDataset *>(in_memory.get()) != nullptr);

	auto on_demand = msms::open_dataset(
	    contract_config(fixture, {"f_od", Backend::ON_DEMAND, msms::StorageLayout::SPLIT}, TWO_FILES));
	CHECK(dynamic_cast<msms::OnDemandDataset *>(on_demand.get()) != nullptr);

	auto embedded = msms::open_dataset(
	    contract_config(fixture, {"f_emb", Backend::HYBRID, msms::StorageLayout::EMBEDDED}, TWO_FILES));
	CHECK(dynamic_cast<msms::EmbeddedHybridDataset *>(embedded.get()) != nullptr);

	auto split = msms::open_dataset(
	    contract_config(fixture, {"f_split", Backend::HYBRID, msms::StorageLayout::SPLIT}, TWO_FILES));
	CHECK(dynamic_cast<msms::SplitHybridDataset *>(split.get()) != nullptr);
}

TEST_CASE("open_dataset reopens an existing hybrid store", "[contract][factory]") {
	TempFileFixture fixture;
	auto config =
	    contract_config(fixture, {"f_reopen", Backend::HYBRID, msms::StorageLayout::SPLIT}, {DATA_DIR + "basic_3spectra.mgf"});
	msms::open_dataset(config);

	// Different sources are ignored while the store exists
	config.sources = TWO_FILES;
	CHECK(msms::open_dataset(config)->length() == 3);

	config.hybrid.rebuild = true;
	CHECK(msms::open_dataset(config)->length() == 5);
}

TEST_CASE("Every backend treats nan and inf values as unknown", "[contract]") {
	auto backend = any_backend();
	TempFileFixture fixture;
	auto dataset = msms::open_dataset(contract_config(fixture, backend, {DATA_DIR + "non_finite.mgf"}));
	msms::InMemoryDataset reference({DATA_DIR + "non_finite.mgf"});

	INFO("backend " << backend.name);
	REQUIRE(dataset->length() == 2);
	auto record = dataset->get(0);
	CHECK_FALSE(record.retention_time().has_value());
	CHECK(record == dataset->get(0));
	CHECK(record == reference.get(0));

	auto ids = [&](const std::string &expression) {
		std::vector<std::string> out;
		for (const auto &match : dataset->query(msms::SpectrumPredicate::parse(expression))) {
			out.push_back(match.id());
		}
		return out;
	};
	CHECK(ids("retention_time > 10") == std::vector<std::string> {"finite_rt"});
	CHECK(ids("retention_time < 10").empty());
	CHECK(ids("precursor_intensity > 0") == std::vector<std::string> {"finite_rt"});
	CHECK(ids("LABEL > 1") == std::vector<std::string> {"finite_rt"});
	CHECK(ids("SCORE != 0") == std::vector<std::string> {"finite_rt"});
	CHECK(ids("LABEL = 'inf'") == std::vector<std::string> {"nan_rt"});
}
