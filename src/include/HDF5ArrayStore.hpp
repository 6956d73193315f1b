#pragma once

#include <cstdint>
#include <mutex>
#include <string>
#include <vector>
#include "ArrayStore.hpp"
#include "H5Cpp.h"
#include <hdf5.h>

namespace msms {

/* layout of the array file */
static constexpr const char *ARRAYS_GROUP = "/spectra";
static constexpr const char *ARRAYS_MZ = "/spectra/mz";
static constexpr const char *ARRAYS_INTENSITY = "/spectra/intensity";
static constexpr const char *ARRAYS_INDPTR = "/spectra/indptr";
static constexpr int ARRAYS_FORMAT_VERSION = 1;

// Peak arrays in an HDF5 file, CSR style: the arrays of all records are
// concatenated into /spectra/mz and /spectra/intensity and record k spans
// [indptr[k], indptr[k+1]). The array_key of a record is k.
class HDF5ArrayStore {
public:
	static constexpr StorageLayout LAYOUT = StorageLayout::SPLIT;

	static std::vector<std::string> files(const HybridConfig &config) {
		return {config.array_path};
	}

	// Appends to chunked, extendible datasets, buffering peaks between writes
	class Writer {
	public:
		// Truncates array_path. Throws StorageError.
		explicit Writer(const HybridConfig &config);

		int64_t append(const SpectrumRecord &record);
		// Flush buffered peaks and write the root attributes
		void close();

	private:
		std::string path_;
		H5::H5File file_;
		H5::DataSet mz_;
		H5::DataSet intensity_;
		H5::DataSet indptr_;

		std::vector<double> mz_buffer_;
		std::vector<double> intensity_buffer_;
		std::vector<int64_t> indptr_buffer_;
		hsize_t peaks_written_ = 0;
		hsize_t offsets_written_ = 0;
		int64_t count_ = 0;
		bool closed_ = false;

		void flush();
	};

	// Opens array_path read-only. Throws StorageError.
	explicit HDF5ArrayStore(const HybridConfig &config);
	~HDF5ArrayStore();

	HDF5ArrayStore(const HDF5ArrayStore &) = delete;
	HDF5ArrayStore &operator=(const HDF5ArrayStore &) = delete;

	// One hyperslab read per dataset covering every requested record
	std::vector<PeakArrays> fetch(std::vector<MetadataRow> &rows) const;

	// Throws StorageError unless the file holds exactly count records
	void check_consistency(int64_t count) const;

	int64_t count() const {
		return static_cast<int64_t>(indptr_.size()) - 1;
	}

private:
	std::string path_;
	hid_t file_handle = -1;
	hid_t ds_mz = -1;
	hid_t ds_intensity = -1;
	std::vector<int64_t> indptr_;
	// HDF5 library calls are not reentrant
	mutable std::mutex mutex_;

	void close_handles();
};

} // namespace msms
