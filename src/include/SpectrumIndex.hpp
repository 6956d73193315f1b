#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "SpectrumRecord.hpp"

namespace msms {

// Byte location of one record
struct IndexEntry {
	std::string id;
	uint32_t source;
	uint64_t offset;
	uint64_t length;
};

// A source file as it was when the index was built
struct IndexedSource {
	std::string path;
	uint64_t size;
	int64_t mtime;
	MetadataFields global_params;
};

// id -> (source, offset, length) table over one or more MGF files, in
// ingestion order. Immutable once built.
class SpectrumIndex {
public:
	// One linear pass per file; record peaks are validated but never kept.
	// Throws ParseError, DuplicateIdError or StorageError.
	static SpectrumIndex build(const std::vector<std::string> &paths);

	// Load a persisted index. Returns std::nullopt when the file is missing,
	// unreadable, lists different sources, or any source changed size or
	// modification time since it was written.
	static std::optional<SpectrumIndex> load(const std::string &index_path, const std::vector<std::string> &paths);

	// Throws StorageError if the index cannot be written
	void save(const std::string &index_path) const;

	size_t size() const {
		return entries_.size();
	}
	const IndexEntry &entry(size_t position) const {
		return entries_[position];
	}
	const IndexedSource &source(uint32_t ordinal) const {
		return sources_[ordinal];
	}
	const std::vector<IndexedSource> &sources() const {
		return sources_;
	}

	std::optional<size_t> find(const std::string &id) const;

private:
	std::vector<IndexedSource> sources_;
	std::vector<IndexEntry> entries_;
	std::unordered_map<std::string, size_t> positions_;

	// Throws DuplicateIdError
	void add(IndexEntry entry);
};

// Current size and modification time of a file. Throws StorageError.
IndexedSource stat_source(const std::string &path);

} // namespace msms
