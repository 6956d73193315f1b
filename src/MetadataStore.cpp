#include "MetadataStore.hpp"
#include "DatasetErrors.hpp"
#include "duckdb.hpp"
#include <algorithm>
#include <array>
#include <filesystem>

namespace msms {

const char *layout_name(StorageLayout layout) {
	switch (layout) {
	case StorageLayout::EMBEDDED:
		return "embedded";
	case StorageLayout::SPLIT:
		return "split";
	default:
		throw std::invalid_argument("Invalid storage layout");
	}
}

StorageLayout parse_layout(const std::string &name) {
	if (name == "embedded") {
		return StorageLayout::EMBEDDED;
	}
	if (name == "split") {
		return StorageLayout::SPLIT;
	}
	throw ConfigError("Unknown storage layout '" + name + "' (expected embedded or split)");
}

SpectrumRecord join_record(MetadataRow &&row, PeakArrays &&arrays) {
	return SpectrumRecord(std::move(row.id), row.precursor_mz, row.precursor_intensity, row.charge,
	                      row.retention_time, std::move(row.scans), std::move(arrays.mz), std::move(arrays.intensity),
	                      std::move(row.extra_fields));
}

//===--------------------------------------------------------------------===//
// Query helpers
//===--------------------------------------------------------------------===//

// Columns a predicate may reference directly
static const std::array<const char *, 6> CORE_COLUMNS = {FIELD_ID,     FIELD_PRECURSOR_MZ,   FIELD_PRECURSOR_INTENSITY,
                                                          FIELD_CHARGE, FIELD_RETENTION_TIME, FIELD_SCANS};

static const char *CoreColumn(const std::string &field) {
	for (auto column : CORE_COLUMNS) {
		if (field == column) {
			return column;
		}
	}
	throw std::invalid_argument("Field '" + field + "' is not a metadata column");
}

static duckdb::unique_ptr<duckdb::QueryResult> Execute(duckdb::Connection &con, const std::string &sql,
                                                       duckdb::vector<duckdb::Value> &params) {
	auto stmt = con.Prepare(sql);
	if (stmt->HasError()) {
		throw StorageError("Failed to prepare metadata query: " + stmt->GetError());
	}
	auto result = stmt->Execute(params, false);
	if (result->HasError()) {
		throw StorageError("Metadata query failed: " + result->GetError());
	}
	return result;
}

static void ExecuteStatement(duckdb::Connection &con, const std::string &sql) {
	auto result = con.Query(sql);
	if (result->HasError()) {
		throw StorageError("Metadata statement failed: " + result->GetError());
	}
}

template <typename T>
static std::optional<T> OptionalValue(const duckdb::Value &value) {
	if (value.IsNull()) {
		return std::nullopt;
	}
	return value.GetValue<T>();
}

static std::vector<double> DoubleList(const duckdb::Value &value) {
	std::vector<double> out;
	if (value.IsNull()) {
		return out;
	}
	auto &children = duckdb::ListValue::GetChildren(value);
	out.reserve(children.size());
	for (auto &child : children) {
		out.push_back(child.GetValue<double>());
	}
	return out;
}

static std::vector<std::string> StringList(const duckdb::Value &value) {
	std::vector<std::string> out;
	if (value.IsNull()) {
		return out;
	}
	for (auto &child : duckdb::ListValue::GetChildren(value)) {
		out.push_back(child.GetValue<std::string>());
	}
	return out;
}

static duckdb::Value DoubleListValue(const std::vector<double> &values) {
	duckdb::vector<duckdb::Value> children;
	children.reserve(values.size());
	for (auto v : values) {
		children.push_back(duckdb::Value::DOUBLE(v));
	}
	return duckdb::Value::LIST(duckdb::LogicalType::DOUBLE, std::move(children));
}

// Column order follows select_list()
static std::vector<MetadataRow> ReadRows(duckdb::QueryResult &result, StorageLayout layout) {
	auto &materialized = result.Cast<duckdb::MaterializedQueryResult>();
	std::vector<MetadataRow> rows;
	rows.reserve(materialized.RowCount());

	for (duckdb::idx_t r = 0; r < materialized.RowCount(); r++) {
		MetadataRow row;
		row.row_index = materialized.GetValue(0, r).GetValue<int64_t>();
		row.id = materialized.GetValue(1, r).GetValue<std::string>();
		row.precursor_mz = materialized.GetValue(2, r).GetValue<double>();
		row.precursor_intensity = OptionalValue<double>(materialized.GetValue(3, r));
		row.charge = OptionalValue<int32_t>(materialized.GetValue(4, r));
		row.retention_time = OptionalValue<double>(materialized.GetValue(5, r));
		row.scans = OptionalValue<std::string>(materialized.GetValue(6, r));

		auto keys = StringList(materialized.GetValue(7, r));
		auto values = StringList(materialized.GetValue(8, r));
		if (keys.size() != values.size()) {
			throw StorageError("Corrupt parameter lists for spectrum '" + row.id + "'");
		}
		for (size_t i = 0; i < keys.size(); i++) {
			row.extra_fields.emplace_back(std::move(keys[i]), std::move(values[i]));
		}

		if (layout == StorageLayout::SPLIT) {
			row.array_key = OptionalValue<int64_t>(materialized.GetValue(9, r));
		} else {
			auto mz = materialized.GetValue(9, r);
			auto intensity = materialized.GetValue(10, r);
			if (!mz.IsNull() && !intensity.IsNull()) {
				row.arrays = PeakArrays {DoubleList(mz), DoubleList(intensity)};
			}
		}
		rows.push_back(std::move(row));
	}
	return rows;
}

static constexpr const char *EXTRA_FIELD_VALUE = "list_extract(param_values, list_position(param_keys, ?))";
static constexpr const char *EXTRA_FIELD_NUMBER =
    "TRY_CAST(list_extract(param_values, list_position(param_keys, ?)) AS DOUBLE)";

// Translate a predicate into a WHERE clause over the spectra table. Core
// fields map onto their columns; extra fields are looked up by key in the
// parameter lists and cast to DOUBLE for numeric comparisons. Text that is not
// a finite number becomes NULL and never matches, since DuckDB orders NaN
// above every number.
static std::string PredicateClause(const SpectrumPredicate &predicate, duckdb::vector<duckdb::Value> &params) {
	std::string clause;
	for (const auto &cmp : predicate.comparisons()) {
		if (!clause.empty()) {
			clause += " AND ";
		}

		std::string lhs;
		bool core = is_core_field(cmp.field);
		if (core) {
			lhs = CoreColumn(cmp.field);
		} else if (std::holds_alternative<std::string>(cmp.value)) {
			lhs = EXTRA_FIELD_VALUE;
			params.emplace_back(cmp.field);
		} else {
			lhs = std::string("(CASE WHEN isfinite(") + EXTRA_FIELD_NUMBER + ") THEN " + EXTRA_FIELD_NUMBER + " END)";
			params.emplace_back(cmp.field);
			params.emplace_back(cmp.field);
		}

		if (std::holds_alternative<std::string>(cmp.value)) {
			params.emplace_back(std::get<std::string>(cmp.value));
		} else {
			double v = std::holds_alternative<int64_t>(cmp.value) ? static_cast<double>(std::get<int64_t>(cmp.value))
			                                                       : std::get<double>(cmp.value);
			params.push_back(duckdb::Value::DOUBLE(v));
		}
		clause += lhs + " " + compare_op_symbol(cmp.op) + " ?";
	}
	return clause;
}

//===--------------------------------------------------------------------===//
// MetadataStore
//===--------------------------------------------------------------------===//

MetadataStore::MetadataStore(std::string path, std::unique_ptr<duckdb::DuckDB> db, StorageLayout layout)
    : path_(std::move(path)), db_(std::move(db)), con_(std::make_unique<duckdb::Connection>(*db_)), layout_(layout) {
}

MetadataStore::~MetadataStore() = default;

std::unique_ptr<MetadataStore> MetadataStore::create(const std::string &path, StorageLayout layout) {
	if (std::filesystem::exists(path)) {
		throw StorageError("Metadata store already exists: " + path);
	}

	std::unique_ptr<duckdb::DuckDB> db;
	try {
		db = std::make_unique<duckdb::DuckDB>(path);
	} catch (const std::exception &e) {
		throw StorageError("Cannot create metadata store " + path + ": " + e.what());
	}
	std::unique_ptr<MetadataStore> store(new MetadataStore(path, std::move(db), layout));

	std::string arrays = layout == StorageLayout::SPLIT ? "array_key BIGINT NOT NULL"
	                                                    : "mz DOUBLE[] NOT NULL, intensity DOUBLE[] NOT NULL";
	ExecuteStatement(*store->con_, "CREATE TABLE spectra ("
	                               "id VARCHAR PRIMARY KEY, "
	                               "row_index BIGINT NOT NULL UNIQUE, "
	                               "precursor_mz DOUBLE NOT NULL, "
	                               "precursor_intensity DOUBLE, "
	                               "charge INTEGER, "
	                               "retention_time DOUBLE, "
	                               "scans VARCHAR, "
	                               "param_keys VARCHAR[], "
	                               "param_values VARCHAR[], " +
	                                   arrays + ")");
	ExecuteStatement(*store->con_, "CREATE TABLE dataset_info (key VARCHAR PRIMARY KEY, value VARCHAR NOT NULL)");
	store->set_info(INFO_LAYOUT, layout_name(layout));
	store->set_info(INFO_FORMAT_VERSION, std::to_string(STORE_FORMAT_VERSION));
	return store;
}

std::unique_ptr<MetadataStore> MetadataStore::open(const std::string &path) {
	if (!std::filesystem::exists(path)) {
		throw StorageError("Metadata store does not exist: " + path);
	}

	std::unique_ptr<duckdb::DuckDB> db;
	try {
		duckdb::DBConfig config;
		config.options.access_mode = duckdb::AccessMode::READ_ONLY;
		db = std::make_unique<duckdb::DuckDB>(path, &config);
	} catch (const std::exception &e) {
		throw StorageError("Cannot open metadata store " + path + ": " + e.what());
	}
	// Layout is read back below; SPLIT is only a placeholder until then
	std::unique_ptr<MetadataStore> store(new MetadataStore(path, std::move(db), StorageLayout::SPLIT));

	std::optional<std::string> layout;
	std::optional<std::string> version;
	try {
		layout = store->info(INFO_LAYOUT);
		version = store->info(INFO_FORMAT_VERSION);
	} catch (const StorageError &e) {
		throw StorageError(path + " is not a spectra store: " + e.what());
	}
	if (!layout || !version) {
		throw StorageError(path + " is not a spectra store: dataset_info is incomplete");
	}
	if (*version != std::to_string(STORE_FORMAT_VERSION)) {
		throw StorageError("Unsupported store format version " + *version + " in " + path);
	}
	try {
		store->layout_ = parse_layout(*layout);
	} catch (const ConfigError &e) {
		throw StorageError("Corrupt store " + path + ": " + e.what());
	}
	return store;
}

void MetadataStore::append(const std::vector<SpectrumRecord> &records, int64_t first_row_index,
                           const std::vector<int64_t> &array_keys) {
	if (layout_ == StorageLayout::SPLIT && array_keys.size() != records.size()) {
		throw std::invalid_argument("append: one array key per record is required");
	}

	try {
		con_->BeginTransaction();
		duckdb::Appender appender(*con_, "spectra");
		for (size_t i = 0; i < records.size(); i++) {
			const auto &record = records[i];
			duckdb::vector<duckdb::Value> keys;
			duckdb::vector<duckdb::Value> values;
			for (const auto &[k, v] : record.extra_fields()) {
				keys.emplace_back(k);
				values.emplace_back(v);
			}

			appender.BeginRow();
			appender.Append(duckdb::Value(record.id()));
			appender.Append(duckdb::Value::BIGINT(first_row_index + static_cast<int64_t>(i)));
			appender.Append(duckdb::Value::DOUBLE(record.precursor_mz()));
			appender.Append(record.precursor_intensity() ? duckdb::Value::DOUBLE(*record.precursor_intensity())
			                                             : duckdb::Value(duckdb::LogicalType::DOUBLE));
			appender.Append(record.charge() ? duckdb::Value::INTEGER(*record.charge())
			                                : duckdb::Value(duckdb::LogicalType::INTEGER));
			appender.Append(record.retention_time() ? duckdb::Value::DOUBLE(*record.retention_time())
			                                        : duckdb::Value(duckdb::LogicalType::DOUBLE));
			appender.Append(record.scans() ? duckdb::Value(*record.scans())
			                               : duckdb::Value(duckdb::LogicalType::VARCHAR));
			appender.Append(duckdb::Value::LIST(duckdb::LogicalType::VARCHAR, std::move(keys)));
			appender.Append(duckdb::Value::LIST(duckdb::LogicalType::VARCHAR, std::move(values)));
			if (layout_ == StorageLayout::SPLIT) {
				appender.Append(duckdb::Value::BIGINT(array_keys[i]));
			} else {
				appender.Append(DoubleListValue(record.mz_array()));
				appender.Append(DoubleListValue(record.intensity_array()));
			}
			appender.EndRow();
		}
		appender.Close();
		con_->Commit();
	} catch (const std::exception &e) {
		if (con_->HasActiveTransaction()) {
			con_->Rollback();
		}
		throw StorageError("Failed to append " + std::to_string(records.size()) + " spectra to " + path_ + ": " +
		                   e.what());
	}
}

void MetadataStore::set_info(const std::string &key, const std::string &value) {
	duckdb::vector<duckdb::Value> params {duckdb::Value(key), duckdb::Value(value)};
	Execute(*con_, "INSERT OR REPLACE INTO dataset_info VALUES (?, ?)", params);
}

std::optional<std::string> MetadataStore::info(const std::string &key) const {
	duckdb::vector<duckdb::Value> params {duckdb::Value(key)};
	auto result = Execute(*con_, "SELECT value FROM dataset_info WHERE key = ?", params);
	auto &materialized = result->Cast<duckdb::MaterializedQueryResult>();
	if (materialized.RowCount() == 0) {
		return std::nullopt;
	}
	return materialized.GetValue(0, 0).GetValue<std::string>();
}

int64_t MetadataStore::count() const {
	duckdb::vector<duckdb::Value> params;
	auto result = Execute(*con_, "SELECT count(*) FROM spectra", params);
	return result->Cast<duckdb::MaterializedQueryResult>().GetValue(0, 0).GetValue<int64_t>();
}

std::string MetadataStore::select_list() const {
	std::string columns = "SELECT row_index, id, precursor_mz, precursor_intensity, charge, retention_time, scans, "
	                      "param_keys, param_values, ";
	columns += layout_ == StorageLayout::SPLIT ? "array_key" : "mz, intensity";
	return columns + " FROM spectra";
}

std::optional<MetadataRow> MetadataStore::fetch_by_id(const std::string &id) const {
	duckdb::vector<duckdb::Value> params {duckdb::Value(id)};
	auto result = Execute(*con_, select_list() + " WHERE id = ?", params);
	auto rows = ReadRows(*result, layout_);
	if (rows.empty()) {
		return std::nullopt;
	}
	return std::move(rows.front());
}

std::vector<MetadataRow> MetadataStore::fetch_rows(const std::vector<int64_t> &rows) const {
	if (rows.empty()) {
		return {};
	}
	duckdb::vector<duckdb::Value> members;
	members.reserve(rows.size());
	for (auto row : rows) {
		members.push_back(duckdb::Value::BIGINT(row));
	}
	// The BETWEEN bound lets DuckDB prune row groups before the membership test
	duckdb::vector<duckdb::Value> params {duckdb::Value::BIGINT(rows.front()), duckdb::Value::BIGINT(rows.back()),
	                                      duckdb::Value::LIST(duckdb::LogicalType::BIGINT, std::move(members))};
	auto result = Execute(*con_,
	                      select_list() +
	                          " WHERE row_index BETWEEN ? AND ? AND list_contains(?, row_index) ORDER BY row_index",
	                      params);
	return ReadRows(*result, layout_);
}

std::vector<MetadataRow> MetadataStore::fetch_range(int64_t begin, int64_t end) const {
	duckdb::vector<duckdb::Value> params {duckdb::Value::BIGINT(begin), duckdb::Value::BIGINT(end)};
	auto result =
	    Execute(*con_, select_list() + " WHERE row_index >= ? AND row_index < ? ORDER BY row_index", params);
	return ReadRows(*result, layout_);
}

std::vector<MetadataRow> MetadataStore::query(const SpectrumPredicate &predicate) const {
	duckdb::vector<duckdb::Value> params;
	auto sql = select_list();
	if (!predicate.empty()) {
		sql += " WHERE " + PredicateClause(predicate, params);
	}
	sql += " ORDER BY row_index";
	auto result = Execute(*con_, sql, params);
	return ReadRows(*result, layout_);
}

} // namespace msms
