#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "SpectrumPredicate.hpp"
#include "SpectrumRecord.hpp"

namespace duckdb {
class DuckDB;
class Connection;
} // namespace duckdb

namespace msms {

// Where the peak arrays of a hybrid store live
enum class StorageLayout {
	// mz/intensity list columns next to the metadata
	EMBEDDED,
	// external HDF5 file, addressed by array_key
	SPLIT
};

const char *layout_name(StorageLayout layout);
// Throws ConfigError
StorageLayout parse_layout(const std::string &name);

static constexpr int STORE_FORMAT_VERSION = 1;

// dataset_info keys
static constexpr const char *INFO_LAYOUT = "layout";
static constexpr const char *INFO_FORMAT_VERSION = "format_version";
static constexpr const char *INFO_RECORD_COUNT = "record_count";
static constexpr const char *INFO_SOURCES = "sources";

struct PeakArrays {
	std::vector<double> mz;
	std::vector<double> intensity;
};

// One row of the spectra table
struct MetadataRow {
	int64_t row_index = 0;
	std::string id;
	double precursor_mz = 0;
	std::optional<double> precursor_intensity;
	std::optional<int32_t> charge;
	std::optional<double> retention_time;
	std::optional<std::string> scans;
	MetadataFields extra_fields;

	// SPLIT layout: key into the array store
	std::optional<int64_t> array_key;
	// EMBEDDED layout: arrays stored in the row
	std::optional<PeakArrays> arrays;
};

SpectrumRecord join_record(MetadataRow &&row, PeakArrays &&arrays);

// DuckDB file holding the scalar metadata of a hybrid dataset.
//
// Table spectra has one row per record keyed by id and by row_index (the
// ingestion position). Table dataset_info holds key/value facts about the
// store. Every read failure is reported as StorageError.
class MetadataStore {
public:
	~MetadataStore();

	MetadataStore(const MetadataStore &) = delete;
	MetadataStore &operator=(const MetadataStore &) = delete;

	// New store with an empty schema for layout. path must not exist yet.
	static std::unique_ptr<MetadataStore> create(const std::string &path, StorageLayout layout);

	// Attach to an existing store, read-only
	static std::unique_ptr<MetadataStore> open(const std::string &path);

	// Append records as rows first_row_index, first_row_index + 1, ... in a
	// single transaction. For the SPLIT layout array_keys holds the array store
	// key of each record; it is ignored for EMBEDDED.
	void append(const std::vector<SpectrumRecord> &records, int64_t first_row_index,
	            const std::vector<int64_t> &array_keys);

	void set_info(const std::string &key, const std::string &value);
	std::optional<std::string> info(const std::string &key) const;

	StorageLayout layout() const {
		return layout_;
	}
	const std::string &path() const {
		return path_;
	}

	int64_t count() const;

	std::optional<MetadataRow> fetch_by_id(const std::string &id) const;

	// rows must be sorted and unique. Result is ordered by row_index; rows that
	// do not exist are absent.
	std::vector<MetadataRow> fetch_rows(const std::vector<int64_t> &rows) const;

	// Rows in [begin, end), ordered by row_index
	std::vector<MetadataRow> fetch_range(int64_t begin, int64_t end) const;

	// Matching rows ordered by row_index. The predicate is translated to a
	// parameterized WHERE clause.
	std::vector<MetadataRow> query(const SpectrumPredicate &predicate) const;

private:
	MetadataStore(std::string path, std::unique_ptr<duckdb::DuckDB> db, StorageLayout layout);

	std::string path_;
	std::unique_ptr<duckdb::DuckDB> db_;
	std::unique_ptr<duckdb::Connection> con_;
	StorageLayout layout_;

	std::string select_list() const;
};

} // namespace msms
