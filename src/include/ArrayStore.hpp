#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include "DatasetErrors.hpp"
#include "MetadataStore.hpp"

namespace msms {

struct HybridConfig {
	// Chooses the concrete dataset type when opened through open_dataset()
	StorageLayout layout = StorageLayout::SPLIT;
	std::string metadata_path;
	// SPLIT layout only
	std::string array_path;
	size_t insert_batch_size = 10000;
	// 0 disables sequential prefetch
	size_t prefetch_chunk_size = 0;
	bool compression = true;
	// Replace existing store files at build time
	bool rebuild = false;
};

// Array stores are the template parameter of HybridDataset. Each provides:
//
//   static constexpr StorageLayout LAYOUT;
//   static std::vector<std::string> files(const HybridConfig &);
//   class Writer {
//       explicit Writer(const HybridConfig &);
//       int64_t append(const SpectrumRecord &);   // array_key of the record
//       void close();
//   };
//   explicit ArrayStore(const HybridConfig &);      // read side
//   std::vector<PeakArrays> fetch(std::vector<MetadataRow> &rows) const;
//   void check_consistency(int64_t count) const;
//
// fetch() returns the arrays of rows in the same order and throws
// StorageError when a payload is missing.

// Peaks kept in the mz/intensity list columns of the metadata store itself.
class EmbeddedArrayStore {
public:
	static constexpr StorageLayout LAYOUT = StorageLayout::EMBEDDED;

	static std::vector<std::string> files(const HybridConfig &) {
		return {};
	}

	// Arrays are written by MetadataStore::append alongside the scalars
	class Writer {
	public:
		explicit Writer(const HybridConfig &) {
		}
		int64_t append(const SpectrumRecord &) {
			return -1;
		}
		void close() {
		}
	};

	explicit EmbeddedArrayStore(const HybridConfig &) {
	}

	// Moves the arrays out of rows
	std::vector<PeakArrays> fetch(std::vector<MetadataRow> &rows) const {
		std::vector<PeakArrays> out;
		out.reserve(rows.size());
		for (auto &row : rows) {
			if (!row.arrays) {
				throw StorageError("Spectrum '" + row.id + "' has no peak arrays in the metadata store");
			}
			out.push_back(std::move(*row.arrays));
			row.arrays.reset();
		}
		return out;
	}

	void check_consistency(int64_t) const {
	}
};

} // namespace msms
