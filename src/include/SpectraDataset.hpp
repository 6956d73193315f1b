#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include "DatasetErrors.hpp"
#include "SpectrumPredicate.hpp"
#include "SpectrumRecord.hpp"

namespace msms {

// Read-only access to an ingested collection of spectra. Every backend
// implements this interface independently.
//
// Records are addressed by 0-based ingestion position (files in the order they
// were given, records in file order). Instances are immutable after
// construction; length() never changes.
class SpectraDataset {
public:
	virtual ~SpectraDataset() = default;

	// Throws OutOfRangeError unless 0 <= index < length()
	virtual SpectrumRecord get(int64_t index) const = 0;

	// Throws NotFoundError if no record has this id
	virtual SpectrumRecord get_by_id(const std::string &id) const = 0;

	virtual int64_t length() const = 0;

	// Records in the same order as indices. Indices need not be sorted and may
	// repeat. Any out-of-range index fails the whole call with OutOfRangeError.
	virtual std::vector<SpectrumRecord> batch(const std::vector<int64_t> &indices) const = 0;

	// Records matching predicate, in ingestion order
	virtual std::vector<SpectrumRecord> query(const SpectrumPredicate &predicate) const = 0;
};

inline void check_index(int64_t index, int64_t length) {
	if (index < 0 || index >= length) {
		throw OutOfRangeError(index, length);
	}
}

} // namespace msms
