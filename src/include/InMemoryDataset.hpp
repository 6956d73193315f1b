#pragma once

#include <string>
#include <unordered_map>
#include <vector>
#include "SpectraDataset.hpp"

namespace msms {

// Parses every source once and keeps all records resident. Reads do no I/O.
// Memory use is proportional to the total size of the records; there is no
// internal guard.
class InMemoryDataset final : public SpectraDataset {
public:
	// Throws ParseError, DuplicateIdError or StorageError (unreadable file)
	explicit InMemoryDataset(const std::vector<std::string> &mgf_files);

	SpectrumRecord get(int64_t index) const override;
	SpectrumRecord get_by_id(const std::string &id) const override;
	int64_t length() const override;
	std::vector<SpectrumRecord> batch(const std::vector<int64_t> &indices) const override;
	std::vector<SpectrumRecord> query(const SpectrumPredicate &predicate) const override;

	// Resident record, without copying
	const SpectrumRecord &at(int64_t index) const;

private:
	std::vector<SpectrumRecord> records_;
	std::unordered_map<std::string, size_t> positions_;
};

} // namespace msms
