#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace msms {

// Root of every error raised by the dataset backends.
class DatasetError : public std::runtime_error {
public:
	explicit DatasetError(const std::string &msg) : std::runtime_error(msg) {
	}
};

// Malformed source record. Raised during construction only; the backend under
// construction is never returned.
class ParseError : public DatasetError {
public:
	explicit ParseError(const std::string &msg) : DatasetError(msg) {
	}
};

class DuplicateIdError : public DatasetError {
public:
	explicit DuplicateIdError(const std::string &id)
	    : DatasetError("Duplicate spectrum id: " + id), id_(id) {
	}

	const std::string &id() const {
		return id_;
	}

private:
	std::string id_;
};

class OutOfRangeError : public DatasetError {
public:
	OutOfRangeError(int64_t index, int64_t length)
	    : DatasetError("Index " + std::to_string(index) + " out of range for dataset of length " +
	                   std::to_string(length)) {
	}
};

class NotFoundError : public DatasetError {
public:
	explicit NotFoundError(const std::string &id) : DatasetError("Spectrum id not found: " + id) {
	}
};

// I/O or store failure at read time. Always propagated to the caller.
class StorageError : public DatasetError {
public:
	explicit StorageError(const std::string &msg) : DatasetError(msg) {
	}
};

class ConfigError : public DatasetError {
public:
	explicit ConfigError(const std::string &msg) : DatasetError(msg) {
	}
};

} // namespace msms
