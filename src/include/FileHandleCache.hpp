#pragma once

#include <cstdint>
#include <fstream>
#include <string>

namespace msms {

// Cache of open source files with a capacity of exactly one handle.
//
// Reading from the cached file reuses its handle. Reading from any other file
// evicts (closes) the cached handle before opening the new one, so at most one
// descriptor is open at any time. The handle is released on destruction.
//
// Not thread-safe: switching files closes and reopens without atomicity.
class FileHandleCache {
public:
	static constexpr size_t CAPACITY = 1;

	FileHandleCache() = default;
	~FileHandleCache();

	FileHandleCache(const FileHandleCache &) = delete;
	FileHandleCache &operator=(const FileHandleCache &) = delete;

	// Read exactly length bytes at offset of path. No seek is issued when the
	// previous read on the same handle ended at offset.
	// Throws StorageError on open, seek or short-read failure; the handle is
	// dropped so that the next call reopens the file.
	std::string read(const std::string &path, uint64_t offset, uint64_t length);

	// Close the cached handle, if any
	void release();

	bool is_open() const {
		return stream_.is_open();
	}
	// Path of the cached handle, empty when nothing is open
	const std::string &cached_path() const {
		return path_;
	}

	size_t open_count() const {
		return opens_;
	}
	size_t eviction_count() const {
		return evictions_;
	}
	size_t seek_count() const {
		return seeks_;
	}

private:
	std::ifstream stream_;
	std::string path_;
	// Offset the stream is positioned at after the last successful read
	uint64_t position_ = 0;

	size_t opens_ = 0;
	size_t evictions_ = 0;
	size_t seeks_ = 0;

	std::ifstream &acquire(const std::string &path);
};

} // namespace msms
