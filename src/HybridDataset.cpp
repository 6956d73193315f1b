#include "HybridDataset.hpp"
#include "MGFReader.hpp"
#include "msms_logging.hpp"
#include <algorithm>
#include <chrono>
#include <filesystem>
#include <unordered_set>

namespace msms {

template <typename ArrayStoreT>
static std::vector<std::string> StoreFiles(const HybridConfig &config) {
	std::vector<std::string> files {config.metadata_path, config.metadata_path + ".wal"};
	for (auto &path : ArrayStoreT::files(config)) {
		files.push_back(std::move(path));
	}
	return files;
}

static void RemoveFiles(const std::vector<std::string> &files) {
	for (const auto &path : files) {
		std::error_code ec;
		std::filesystem::remove(path, ec);
		if (ec) {
			logger()->warn("Could not remove {}: {}", path, ec.message());
		}
	}
}

template <typename ArrayStoreT>
HybridDataset<ArrayStoreT>::HybridDataset(std::unique_ptr<MetadataStore> metadata, std::unique_ptr<ArrayStoreT> arrays,
                                          int64_t length, size_t prefetch_chunk_size)
    : metadata_(std::move(metadata)), arrays_(std::move(arrays)), length_(length),
      prefetch_chunk_size_(prefetch_chunk_size) {
}

template <typename ArrayStoreT>
bool HybridDataset<ArrayStoreT>::exists(const HybridConfig &config) {
	return !config.metadata_path.empty() && std::filesystem::exists(config.metadata_path);
}

template <typename ArrayStoreT>
std::unique_ptr<HybridDataset<ArrayStoreT>> HybridDataset<ArrayStoreT>::build(const std::vector<std::string> &mgf_files,
                                                                               const HybridConfig &config) {
	if (config.metadata_path.empty()) {
		throw ConfigError("A metadata_path is required for the hybrid backend");
	}
	if (config.insert_batch_size == 0) {
		throw ConfigError("insert_batch_size must be positive");
	}

	auto files = StoreFiles<ArrayStoreT>(config);
	for (const auto &path : files) {
		if (std::filesystem::exists(path)) {
			if (!config.rebuild) {
				throw StorageError("Store file " + path + " already exists; set rebuild to replace it");
			}
			logger()->info("Removing existing store file {}", path);
		}
	}
	RemoveFiles(files);

	auto started = std::chrono::steady_clock::now();
	int64_t next_row = 0;
	try {
		auto store = MetadataStore::create(config.metadata_path, ArrayStoreT::LAYOUT);
		typename ArrayStoreT::Writer writer(config);
		std::unordered_set<std::string> seen;

		for (const auto &path : mgf_files) {
			MGFReader reader(path);
			while (true) {
				auto records = reader.read(config.insert_batch_size);
				if (records.empty()) {
					break;
				}
				std::vector<int64_t> array_keys;
				array_keys.reserve(records.size());
				for (const auto &record : records) {
					if (!seen.insert(record.id()).second) {
						throw DuplicateIdError(record.id());
					}
					array_keys.push_back(writer.append(record));
				}
				store->append(records, next_row, array_keys);
				next_row += static_cast<int64_t>(records.size());
			}
		}
		writer.close();

		std::string sources;
		for (const auto &path : mgf_files) {
			if (!sources.empty()) {
				sources += '\n';
			}
			sources += path;
		}
		store->set_info(INFO_SOURCES, sources);
		store->set_info(INFO_RECORD_COUNT, std::to_string(next_row));
	} catch (...) {
		RemoveFiles(files);
		throw;
	}

	std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - started;
	logger()->info("Built {} store {} with {} spectra from {} file(s) in {:.3f}s", layout_name(ArrayStoreT::LAYOUT),
	               config.metadata_path, next_row, mgf_files.size(), elapsed.count());
	return open(config);
}

template <typename ArrayStoreT>
std::unique_ptr<HybridDataset<ArrayStoreT>> HybridDataset<ArrayStoreT>::open(const HybridConfig &config) {
	auto store = MetadataStore::open(config.metadata_path);
	if (store->layout() != ArrayStoreT::LAYOUT) {
		throw StorageError("Store " + config.metadata_path + " uses the " + layout_name(store->layout()) +
		                   " layout, expected " + layout_name(ArrayStoreT::LAYOUT));
	}

	auto length = store->count();
	auto recorded = store->info(INFO_RECORD_COUNT);
	if (!recorded || *recorded != std::to_string(length)) {
		throw StorageError("Store " + config.metadata_path + " is incomplete: " + std::to_string(length) +
		                   " rows, record_count " + recorded.value_or("missing"));
	}

	auto arrays = std::make_unique<ArrayStoreT>(config);
	arrays->check_consistency(length);

	logger()->info("Opened {} store {} ({} spectra)", layout_name(ArrayStoreT::LAYOUT), config.metadata_path, length);
	return std::unique_ptr<HybridDataset>(
	    new HybridDataset(std::move(store), std::move(arrays), length, config.prefetch_chunk_size));
}

template <typename ArrayStoreT>
std::vector<SpectrumRecord> HybridDataset<ArrayStoreT>::assemble(std::vector<MetadataRow> rows) const {
	auto arrays = arrays_->fetch(rows);
	std::vector<SpectrumRecord> records;
	records.reserve(rows.size());
	for (size_t i = 0; i < rows.size(); i++) {
		records.push_back(join_record(std::move(rows[i]), std::move(arrays[i])));
	}
	return records;
}

template <typename ArrayStoreT>
SpectrumRecord HybridDataset<ArrayStoreT>::prefetched(int64_t index) const {
	auto chunk = static_cast<int64_t>(prefetch_chunk_size_);
	auto begin = index / chunk * chunk;

	std::lock_guard<std::mutex> guard(prefetch_mutex_);
	if (begin != chunk_begin_) {
		auto end = std::min(begin + chunk, length_);
		auto records = assemble(metadata_->fetch_range(begin, end));
		if (static_cast<int64_t>(records.size()) != end - begin) {
			throw StorageError("Expected " + std::to_string(end - begin) + " rows in [" + std::to_string(begin) +
			                   ", " + std::to_string(end) + "), found " + std::to_string(records.size()));
		}
		chunk_ = std::move(records);
		chunk_begin_ = begin;
		prefetches_++;
		logger()->debug("Prefetched rows [{}, {})", begin, end);
	}
	return chunk_[static_cast<size_t>(index - begin)];
}

template <typename ArrayStoreT>
SpectrumRecord HybridDataset<ArrayStoreT>::get(int64_t index) const {
	check_index(index, length_);
	if (prefetch_chunk_size_ > 0) {
		return prefetched(index);
	}
	auto records = assemble(metadata_->fetch_rows({index}));
	if (records.empty()) {
		throw StorageError("Row " + std::to_string(index) + " is missing from " + metadata_->path());
	}
	return std::move(records.front());
}

template <typename ArrayStoreT>
SpectrumRecord HybridDataset<ArrayStoreT>::get_by_id(const std::string &id) const {
	auto row = metadata_->fetch_by_id(id);
	if (!row) {
		throw NotFoundError(id);
	}
	std::vector<MetadataRow> rows;
	rows.push_back(std::move(*row));
	return std::move(assemble(std::move(rows)).front());
}

template <typename ArrayStoreT>
int64_t HybridDataset<ArrayStoreT>::length() const {
	return length_;
}

template <typename ArrayStoreT>
std::vector<SpectrumRecord> HybridDataset<ArrayStoreT>::batch(const std::vector<int64_t> &indices) const {
	for (auto index : indices) {
		check_index(index, length_);
	}

	std::vector<int64_t> unique(indices);
	std::sort(unique.begin(), unique.end());
	unique.erase(std::unique(unique.begin(), unique.end()), unique.end());

	auto records = assemble(metadata_->fetch_rows(unique));
	if (records.size() != unique.size()) {
		throw StorageError("Expected " + std::to_string(unique.size()) + " rows from " + metadata_->path() +
		                   ", found " + std::to_string(records.size()));
	}

	std::vector<SpectrumRecord> result;
	result.reserve(indices.size());
	for (auto index : indices) {
		auto position = std::lower_bound(unique.begin(), unique.end(), index) - unique.begin();
		result.push_back(records[static_cast<size_t>(position)]);
	}
	return result;
}

template <typename ArrayStoreT>
std::vector<SpectrumRecord> HybridDataset<ArrayStoreT>::query(const SpectrumPredicate &predicate) const {
	return assemble(metadata_->query(predicate));
}

template <typename ArrayStoreT>
size_t HybridDataset<ArrayStoreT>::prefetch_count() const {
	std::lock_guard<std::mutex> guard(prefetch_mutex_);
	return prefetches_;
}

template class HybridDataset<EmbeddedArrayStore>;
template class HybridDataset<HDF5ArrayStore>;

} // namespace msms
