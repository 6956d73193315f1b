#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "ArrayStore.hpp"
#include "HDF5ArrayStore.hpp"
#include "MetadataStore.hpp"
#include "SpectraDataset.hpp"

namespace msms {

// Scalar metadata in DuckDB, peak arrays in ArrayStoreT (see ArrayStore.hpp).
//
// Instances are created by build() (ingest the sources into fresh store files)
// or open() (attach to files a previous build wrote). Both return a read-only
// dataset.
template <typename ArrayStoreT>
class HybridDataset final : public SpectraDataset {
public:
	// Stream the sources into new store files in batches of
	// config.insert_batch_size, one transaction per batch, then open them.
	// Existing store files are replaced when config.rebuild is set and are
	// otherwise a StorageError. Partially written files are removed on failure.
	// Throws ParseError, DuplicateIdError or StorageError.
	static std::unique_ptr<HybridDataset> build(const std::vector<std::string> &mgf_files,
	                                            const HybridConfig &config);

	// Attach to existing store files without re-ingesting. Throws StorageError
	// when the files are missing, were built with the other layout, or disagree
	// on the record count.
	static std::unique_ptr<HybridDataset> open(const HybridConfig &config);

	// True if the metadata store file exists
	static bool exists(const HybridConfig &config);

	SpectrumRecord get(int64_t index) const override;
	SpectrumRecord get_by_id(const std::string &id) const override;
	int64_t length() const override;
	std::vector<SpectrumRecord> batch(const std::vector<int64_t> &indices) const override;
	std::vector<SpectrumRecord> query(const SpectrumPredicate &predicate) const override;

	const MetadataStore &metadata() const {
		return *metadata_;
	}

	// Number of range fetches issued by sequential prefetch
	size_t prefetch_count() const;

private:
	HybridDataset(std::unique_ptr<MetadataStore> metadata, std::unique_ptr<ArrayStoreT> arrays, int64_t length,
	              size_t prefetch_chunk_size);

	std::unique_ptr<MetadataStore> metadata_;
	std::unique_ptr<ArrayStoreT> arrays_;
	int64_t length_;

	size_t prefetch_chunk_size_;
	mutable std::mutex prefetch_mutex_;
	mutable int64_t chunk_begin_ = -1;
	mutable std::vector<SpectrumRecord> chunk_;
	mutable size_t prefetches_ = 0;

	std::vector<SpectrumRecord> assemble(std::vector<MetadataRow> rows) const;
	SpectrumRecord prefetched(int64_t index) const;
};

using EmbeddedHybridDataset = HybridDataset<EmbeddedArrayStore>;
using SplitHybridDataset = HybridDataset<HDF5ArrayStore>;

extern template class HybridDataset<EmbeddedArrayStore>;
extern template class HybridDataset<HDF5ArrayStore>;

} // namespace msms
