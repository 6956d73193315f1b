#include "OnDemandDataset.hpp"
#include "MGFReader.hpp"
#include "msms_logging.hpp"
#include <chrono>

namespace msms {

OnDemandDataset::OnDemandDataset(const std::vector<std::string> &mgf_files, const OnDemandConfig &config) {
	auto started = std::chrono::steady_clock::now();

	if (!config.index_path.empty()) {
		if (auto persisted = SpectrumIndex::load(config.index_path, mgf_files)) {
			index_ = std::move(*persisted);
			index_reused_ = true;
			logger()->info("Reusing persisted index {} ({} spectra)", config.index_path, index_.size());
			return;
		}
	}

	index_ = SpectrumIndex::build(mgf_files);
	if (!config.index_path.empty()) {
		index_.save(config.index_path);
	}

	std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - started;
	logger()->info("Indexed {} spectra from {} file(s) in {:.3f}s", index_.size(), mgf_files.size(),
	               elapsed.count());
}

SpectrumRecord OnDemandDataset::read_entry(size_t position) const {
	const auto &entry = index_.entry(position);
	const auto &source = index_.source(entry.source);
	auto text = cache_.read(source.path, entry.offset, entry.length);
	return MGFReader::parse_record(text, source.global_params, entry.id, source.path);
}

SpectrumRecord OnDemandDataset::get(int64_t index) const {
	check_index(index, length());
	return read_entry(static_cast<size_t>(index));
}

SpectrumRecord OnDemandDataset::get_by_id(const std::string &id) const {
	auto position = index_.find(id);
	if (!position) {
		throw NotFoundError(id);
	}
	return read_entry(*position);
}

int64_t OnDemandDataset::length() const {
	return static_cast<int64_t>(index_.size());
}

std::vector<SpectrumRecord> OnDemandDataset::batch(const std::vector<int64_t> &indices) const {
	for (auto index : indices) {
		check_index(index, length());
	}
	std::vector<SpectrumRecord> result;
	result.reserve(indices.size());
	for (auto index : indices) {
		result.push_back(read_entry(static_cast<size_t>(index)));
	}
	return result;
}

std::vector<SpectrumRecord> OnDemandDataset::query(const SpectrumPredicate &predicate) const {
	std::vector<SpectrumRecord> result;
	for (size_t position = 0; position < index_.size(); position++) {
		auto record = read_entry(position);
		if (predicate.matches(record)) {
			result.push_back(std::move(record));
		}
	}
	return result;
}

void OnDemandDataset::save_index(const std::string &index_path) const {
	index_.save(index_path);
}

} // namespace msms
