#pragma once

#include <string>
#include <vector>
#include "FileHandleCache.hpp"
#include "SpectraDataset.hpp"
#include "SpectrumIndex.hpp"

namespace msms {

struct OnDemandConfig {
	// Persisted byte-offset index. Empty disables persistence.
	std::string index_path;
};

// Keeps only a byte-offset index in memory and re-reads each record from its
// source file on access, through a single-slot file handle cache.
//
// Not safe for concurrent calls on the same instance.
class OnDemandDataset final : public SpectraDataset {
public:
	// Throws ParseError, DuplicateIdError or StorageError
	explicit OnDemandDataset(const std::vector<std::string> &mgf_files, const OnDemandConfig &config = {});

	SpectrumRecord get(int64_t index) const override;
	SpectrumRecord get_by_id(const std::string &id) const override;
	int64_t length() const override;
	std::vector<SpectrumRecord> batch(const std::vector<int64_t> &indices) const override;

	// Re-reads and parses every record. O(n) in the dataset size.
	std::vector<SpectrumRecord> query(const SpectrumPredicate &predicate) const override;

	void save_index(const std::string &index_path) const;

	const FileHandleCache &handle_cache() const {
		return cache_;
	}
	// True when construction reused a persisted index
	bool index_reused() const {
		return index_reused_;
	}

private:
	SpectrumIndex index_;
	bool index_reused_ = false;
	mutable FileHandleCache cache_;

	SpectrumRecord read_entry(size_t position) const;
};

} // namespace msms
