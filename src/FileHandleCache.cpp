#include "FileHandleCache.hpp"
#include "DatasetErrors.hpp"
#include "msms_logging.hpp"

namespace msms {

FileHandleCache::~FileHandleCache() {
	release();
}

void FileHandleCache::release() {
	if (stream_.is_open()) {
		stream_.close();
	}
	stream_.clear();
	path_.clear();
	position_ = 0;
}

std::ifstream &FileHandleCache::acquire(const std::string &path) {
	if (stream_.is_open() && path_ == path) {
		return stream_;
	}

	if (stream_.is_open()) {
		logger()->debug("Evicting cached handle for {} in favour of {}", path_, path);
		evictions_++;
	}
	release();

	stream_.open(path, std::ios::binary);
	if (!stream_.is_open()) {
		stream_.clear();
		throw StorageError("Cannot open source file: " + path);
	}
	opens_++;
	path_ = path;
	position_ = 0;
	return stream_;
}

std::string FileHandleCache::read(const std::string &path, uint64_t offset, uint64_t length) {
	auto &stream = acquire(path);

	if (position_ != offset) {
		stream.seekg(static_cast<std::streamoff>(offset), std::ios::beg);
		seeks_++;
		if (!stream) {
			release();
			throw StorageError("Seek to byte " + std::to_string(offset) + " failed in " + path);
		}
	}

	std::string buffer(length, '\0');
	stream.read(buffer.data(), static_cast<std::streamsize>(length));
	if (static_cast<uint64_t>(stream.gcount()) != length) {
		auto got = stream.gcount();
		release();
		throw StorageError("Short read in " + path + ": expected " + std::to_string(length) + " bytes at offset " +
		                   std::to_string(offset) + ", got " + std::to_string(got));
	}
	position_ = offset + length;
	return buffer;
}

} // namespace msms
