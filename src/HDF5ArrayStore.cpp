#include "HDF5ArrayStore.hpp"
#include "DatasetErrors.hpp"
#include <algorithm>
#include <filesystem>

namespace msms {

// Elements per chunk of the extendible datasets
static constexpr hsize_t CHUNK_ELEMENTS = 65536;
// Buffered peaks that trigger a write
static constexpr size_t FLUSH_PEAKS = 1 << 20;

//===--------------------------------------------------------------------===//
// Writer
//===--------------------------------------------------------------------===//

static H5::DataSet CreateExtendible(H5::H5File &file, const char *name, const H5::PredType &dtype,
                                    bool use_compression) {
	hsize_t dims[1] = {0};
	hsize_t max_dims[1] = {H5S_UNLIMITED};
	H5::DataSpace dataspace(1, dims, max_dims);

	// Unlimited datasets must be chunked
	H5::DSetCreatPropList plist;
	hsize_t chunk_dims[1] = {CHUNK_ELEMENTS};
	plist.setChunk(1, chunk_dims);
	if (use_compression) {
		plist.setDeflate(4);
	}
	return file.createDataSet(name, dtype, dataspace, plist);
}

template <typename T>
static void AppendToDataset(H5::DataSet &dataset, const std::vector<T> &data, hsize_t &written,
                            const H5::DataType &dtype) {
	if (data.empty()) {
		return;
	}
	hsize_t start[1] = {written};
	hsize_t count[1] = {data.size()};
	hsize_t new_size[1] = {written + data.size()};
	dataset.extend(new_size);

	H5::DataSpace file_space = dataset.getSpace();
	file_space.selectHyperslab(H5S_SELECT_SET, count, start);
	H5::DataSpace mem_space(1, count);
	dataset.write(data.data(), dtype, mem_space, file_space);
	written += data.size();
}

static H5::H5File CreateArrayFile(const std::string &path) {
	if (path.empty()) {
		throw ConfigError("An array_path is required for the split layout");
	}
	H5::Exception::dontPrint();
	try {
		return H5::H5File(path, H5F_ACC_TRUNC);
	} catch (const H5::Exception &e) {
		throw StorageError("Cannot create array file " + path + ": " + e.getDetailMsg());
	}
}

HDF5ArrayStore::Writer::Writer(const HybridConfig &config)
    : path_(config.array_path), file_(CreateArrayFile(config.array_path)) {
	try {
		H5::Group group = file_.createGroup(ARRAYS_GROUP);
		mz_ = CreateExtendible(file_, ARRAYS_MZ, H5::PredType::NATIVE_DOUBLE, config.compression);
		intensity_ = CreateExtendible(file_, ARRAYS_INTENSITY, H5::PredType::NATIVE_DOUBLE, config.compression);
		indptr_ = CreateExtendible(file_, ARRAYS_INDPTR, H5::PredType::NATIVE_INT64, config.compression);
	} catch (const H5::Exception &e) {
		throw StorageError("Cannot create array file " + path_ + ": " + e.getDetailMsg());
	}
	indptr_buffer_.push_back(0);
}

int64_t HDF5ArrayStore::Writer::append(const SpectrumRecord &record) {
	if (closed_) {
		throw StorageError("Array file " + path_ + " is already closed");
	}
	const auto &mz = record.mz_array();
	const auto &intensity = record.intensity_array();
	mz_buffer_.insert(mz_buffer_.end(), mz.begin(), mz.end());
	intensity_buffer_.insert(intensity_buffer_.end(), intensity.begin(), intensity.end());
	indptr_buffer_.push_back(static_cast<int64_t>(peaks_written_ + mz_buffer_.size()));

	if (mz_buffer_.size() >= FLUSH_PEAKS) {
		flush();
	}
	return count_++;
}

void HDF5ArrayStore::Writer::flush() {
	try {
		hsize_t intensity_written = peaks_written_;
		AppendToDataset(mz_, mz_buffer_, peaks_written_, H5::PredType::NATIVE_DOUBLE);
		AppendToDataset(intensity_, intensity_buffer_, intensity_written, H5::PredType::NATIVE_DOUBLE);
		AppendToDataset(indptr_, indptr_buffer_, offsets_written_, H5::PredType::NATIVE_INT64);
	} catch (const H5::Exception &e) {
		throw StorageError("Failed writing peak arrays to " + path_ + ": " + e.getDetailMsg());
	}
	mz_buffer_.clear();
	intensity_buffer_.clear();
	indptr_buffer_.clear();
}

void HDF5ArrayStore::Writer::close() {
	if (closed_) {
		return;
	}
	flush();
	try {
		H5::Group group = file_.openGroup(ARRAYS_GROUP);
		H5::DataSpace scalar_space(H5S_SCALAR);

		int version = ARRAYS_FORMAT_VERSION;
		H5::Attribute attr_version = group.createAttribute("format-version", H5::PredType::NATIVE_INT, scalar_space);
		attr_version.write(H5::PredType::NATIVE_INT, &version);

		int64_t count = count_;
		H5::Attribute attr_count = group.createAttribute("count", H5::PredType::NATIVE_INT64, scalar_space);
		attr_count.write(H5::PredType::NATIVE_INT64, &count);

		file_.close();
	} catch (const H5::Exception &e) {
		throw StorageError("Failed finalizing array file " + path_ + ": " + e.getDetailMsg());
	}
	closed_ = true;
}

//===--------------------------------------------------------------------===//
// Reader
//===--------------------------------------------------------------------===//

static hsize_t DatasetLength(hid_t dataset) {
	hid_t dataspace = H5Dget_space(dataset);
	if (dataspace < 0) {
		throw StorageError("Failed to get dataspace");
	}
	hsize_t dims[1] = {0};
	int rank = H5Sget_simple_extent_ndims(dataspace);
	if (rank != 1) {
		H5Sclose(dataspace);
		throw StorageError("Expected a one-dimensional dataset, found rank " + std::to_string(rank));
	}
	H5Sget_simple_extent_dims(dataspace, dims, nullptr);
	H5Sclose(dataspace);
	return dims[0];
}

static std::vector<int64_t> ReadOffsets(hid_t file_id, const std::string &path) {
	hid_t ds_id = H5Dopen2(file_id, ARRAYS_INDPTR, H5P_DEFAULT);
	if (ds_id < 0) {
		throw StorageError("Failed to open " + std::string(ARRAYS_INDPTR) + " in " + path);
	}
	std::vector<int64_t> offsets;
	try {
		offsets.resize(DatasetLength(ds_id));
	} catch (const StorageError &e) {
		H5Dclose(ds_id);
		throw StorageError(std::string(ARRAYS_INDPTR) + " in " + path + ": " + e.what());
	}
	if (!offsets.empty() &&
	    H5Dread(ds_id, H5T_NATIVE_INT64, H5S_ALL, H5S_ALL, H5P_DEFAULT, static_cast<void *>(offsets.data())) < 0) {
		H5Dclose(ds_id);
		throw StorageError("Failed to read " + std::string(ARRAYS_INDPTR) + " in " + path);
	}
	H5Dclose(ds_id);
	return offsets;
}

static int ReadFormatVersion(hid_t file_id) {
	if (H5Aexists_by_name(file_id, ARRAYS_GROUP, "format-version", H5P_DEFAULT) <= 0) {
		return -1;
	}
	hid_t attr_id = H5Aopen_by_name(file_id, ARRAYS_GROUP, "format-version", H5P_DEFAULT, H5P_DEFAULT);
	if (attr_id < 0) {
		return -1;
	}
	int version = -1;
	if (H5Aread(attr_id, H5T_NATIVE_INT, &version) < 0) {
		version = -1;
	}
	H5Aclose(attr_id);
	return version;
}

HDF5ArrayStore::HDF5ArrayStore(const HybridConfig &config) : path_(config.array_path) {
	// Disable HDF5's automatic error printing
	H5Eset_auto(H5E_DEFAULT, nullptr, nullptr);

	if (path_.empty() || !std::filesystem::exists(path_)) {
		throw StorageError("Array file does not exist: " + path_);
	}

	file_handle = H5Fopen(path_.c_str(), H5F_ACC_RDONLY, H5P_DEFAULT);
	if (file_handle < 0) {
		throw StorageError("H5Fopen failed for " + path_);
	}

	try {
		int version = ReadFormatVersion(file_handle);
		if (version != ARRAYS_FORMAT_VERSION) {
			throw StorageError(path_ + " is not a peak array file (format-version " + std::to_string(version) + ")");
		}

		ds_mz = H5Dopen2(file_handle, ARRAYS_MZ, H5P_DEFAULT);
		if (ds_mz < 0) {
			throw StorageError("Failed to open " + std::string(ARRAYS_MZ) + " in " + path_);
		}
		ds_intensity = H5Dopen2(file_handle, ARRAYS_INTENSITY, H5P_DEFAULT);
		if (ds_intensity < 0) {
			throw StorageError("Failed to open " + std::string(ARRAYS_INTENSITY) + " in " + path_);
		}
		indptr_ = ReadOffsets(file_handle, path_);

		if (indptr_.empty() || indptr_.front() != 0) {
			throw StorageError("Corrupt offsets in " + path_);
		}
		if (!std::is_sorted(indptr_.begin(), indptr_.end())) {
			throw StorageError("Offsets in " + path_ + " are not monotonic");
		}
		auto n_peaks = static_cast<hsize_t>(indptr_.back());
		if (DatasetLength(ds_mz) != n_peaks || DatasetLength(ds_intensity) != n_peaks) {
			throw StorageError("Peak datasets in " + path_ + " do not match their offsets");
		}
	} catch (const StorageError &) {
		close_handles();
		throw;
	}
}

HDF5ArrayStore::~HDF5ArrayStore() {
	close_handles();
}

void HDF5ArrayStore::close_handles() {
	if (ds_mz >= 0) {
		H5Dclose(ds_mz);
		ds_mz = -1;
	}
	if (ds_intensity >= 0) {
		H5Dclose(ds_intensity);
		ds_intensity = -1;
	}
	if (file_handle >= 0) {
		H5Fclose(file_handle);
		file_handle = -1;
	}
}

void HDF5ArrayStore::check_consistency(int64_t expected) const {
	if (count() != expected) {
		throw StorageError("Array file " + path_ + " holds " + std::to_string(count()) +
		                   " records but the metadata store holds " + std::to_string(expected));
	}
}

namespace {
struct PeakSpan {
	hsize_t start;
	hsize_t count;
};
} // namespace

// Read the union of spans (sorted, disjoint) into out with a single H5Dread.
// Selected elements arrive in file order.
static void ReadSelection(hid_t dataset, const std::vector<PeakSpan> &spans, std::vector<double> &out,
                          const std::string &what) {
	hid_t file_space = H5Dget_space(dataset);
	if (file_space < 0) {
		throw StorageError("Failed to get dataspace of " + what);
	}
	herr_t status = 0;
	for (size_t i = 0; i < spans.size() && status >= 0; i++) {
		hsize_t start[1] = {spans[i].start};
		hsize_t count[1] = {spans[i].count};
		status = H5Sselect_hyperslab(file_space, i == 0 ? H5S_SELECT_SET : H5S_SELECT_OR, start, nullptr, count,
		                             nullptr);
	}
	if (status < 0) {
		H5Sclose(file_space);
		throw StorageError("Failed to select peaks in " + what);
	}

	hsize_t dims[1] = {out.size()};
	hid_t mem_space = H5Screate_simple(1, dims, nullptr);
	if (mem_space < 0) {
		H5Sclose(file_space);
		throw StorageError("Failed to create memory dataspace for " + what);
	}
	status = H5Dread(dataset, H5T_NATIVE_DOUBLE, mem_space, file_space, H5P_DEFAULT, out.data());
	H5Sclose(mem_space);
	H5Sclose(file_space);
	if (status < 0) {
		throw StorageError("Failed to read peaks from " + what);
	}
}

std::vector<PeakArrays> HDF5ArrayStore::fetch(std::vector<MetadataRow> &rows) const {
	std::vector<PeakSpan> requested(rows.size());
	for (size_t i = 0; i < rows.size(); i++) {
		const auto &row = rows[i];
		if (!row.array_key) {
			throw StorageError("Spectrum '" + row.id + "' has no array key");
		}
		auto key = *row.array_key;
		if (key < 0 || key >= count()) {
			throw StorageError("Spectrum '" + row.id + "' has array key " + std::to_string(key) +
			                   " but " + path_ + " holds " + std::to_string(count()) + " records");
		}
		auto start = static_cast<hsize_t>(indptr_[key]);
		requested[i] = PeakSpan {start, static_cast<hsize_t>(indptr_[key + 1]) - start};
	}

	// Coalesce into sorted, disjoint spans
	std::vector<PeakSpan> merged;
	for (const auto &span : requested) {
		if (span.count > 0) {
			merged.push_back(span);
		}
	}
	std::sort(merged.begin(), merged.end(), [](const PeakSpan &a, const PeakSpan &b) { return a.start < b.start; });
	size_t out_pos = 0;
	for (size_t i = 0; i < merged.size(); i++) {
		if (out_pos > 0 && merged[i].start <= merged[out_pos - 1].start + merged[out_pos - 1].count) {
			auto end = std::max(merged[out_pos - 1].start + merged[out_pos - 1].count, merged[i].start + merged[i].count);
			merged[out_pos - 1].count = end - merged[out_pos - 1].start;
		} else {
			merged[out_pos++] = merged[i];
		}
	}
	merged.resize(out_pos);

	std::vector<hsize_t> buffer_offsets(merged.size());
	hsize_t total = 0;
	for (size_t i = 0; i < merged.size(); i++) {
		buffer_offsets[i] = total;
		total += merged[i].count;
	}

	std::vector<double> mz(total);
	std::vector<double> intensity(total);
	if (total > 0) {
		std::lock_guard<std::mutex> guard(mutex_);
		ReadSelection(ds_mz, merged, mz, path_ + ":" + ARRAYS_MZ);
		ReadSelection(ds_intensity, merged, intensity, path_ + ":" + ARRAYS_INTENSITY);
	}

	std::vector<PeakArrays> out(rows.size());
	for (size_t i = 0; i < requested.size(); i++) {
		const auto &span = requested[i];
		if (span.count == 0) {
			continue;
		}
		auto it = std::upper_bound(merged.begin(), merged.end(), span.start,
		                           [](hsize_t start, const PeakSpan &s) { return start < s.start; });
		auto j = static_cast<size_t>(std::distance(merged.begin(), it)) - 1;
		auto begin = buffer_offsets[j] + (span.start - merged[j].start);
		out[i].mz.assign(mz.begin() + begin, mz.begin() + begin + span.count);
		out[i].intensity.assign(intensity.begin() + begin, intensity.begin() + begin + span.count);
	}
	return out;
}

} // namespace msms
