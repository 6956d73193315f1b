#include "InMemoryDataset.hpp"
#include "MGFReader.hpp"
#include "msms_logging.hpp"
#include <chrono>

namespace msms {

static constexpr size_t READ_BATCH_SIZE = 2048;

InMemoryDataset::InMemoryDataset(const std::vector<std::string> &mgf_files) {
	auto started = std::chrono::steady_clock::now();

	for (const auto &path : mgf_files) {
		MGFReader reader(path);
		while (true) {
			auto records = reader.read(READ_BATCH_SIZE);
			if (records.empty()) {
				break;
			}
			for (auto &record : records) {
				auto [it, inserted] = positions_.emplace(record.id(), records_.size());
				if (!inserted) {
					throw DuplicateIdError(record.id());
				}
				records_.push_back(std::move(record));
			}
		}
	}

	std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - started;
	logger()->info("Loaded {} spectra from {} file(s) into memory in {:.3f}s", records_.size(), mgf_files.size(),
	               elapsed.count());
}

const SpectrumRecord &InMemoryDataset::at(int64_t index) const {
	check_index(index, length());
	return records_[static_cast<size_t>(index)];
}

SpectrumRecord InMemoryDataset::get(int64_t index) const {
	return at(index);
}

SpectrumRecord InMemoryDataset::get_by_id(const std::string &id) const {
	auto it = positions_.find(id);
	if (it == positions_.end()) {
		throw NotFoundError(id);
	}
	return records_[it->second];
}

int64_t InMemoryDataset::length() const {
	return static_cast<int64_t>(records_.size());
}

std::vector<SpectrumRecord> InMemoryDataset::batch(const std::vector<int64_t> &indices) const {
	for (auto index : indices) {
		check_index(index, length());
	}
	std::vector<SpectrumRecord> result;
	result.reserve(indices.size());
	for (auto index : indices) {
		result.push_back(records_[static_cast<size_t>(index)]);
	}
	return result;
}

std::vector<SpectrumRecord> InMemoryDataset::query(const SpectrumPredicate &predicate) const {
	std::vector<SpectrumRecord> result;
	for (const auto &record : records_) {
		if (predicate.matches(record)) {
			result.push_back(record);
		}
	}
	return result;
}

} // namespace msms
