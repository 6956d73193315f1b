#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace msms {

// Ordered (KEY, value) pairs as they appear in the source. Keys are upper-cased.
using MetadataFields = std::vector<std::pair<std::string, std::string>>;

// Scalar value of a metadata field, as seen by predicates.
using FieldValue = std::variant<int64_t, double, std::string>;

// Names of the scalar fields every record carries
static constexpr const char *FIELD_ID = "id";
static constexpr const char *FIELD_PRECURSOR_MZ = "precursor_mz";
static constexpr const char *FIELD_PRECURSOR_INTENSITY = "precursor_intensity";
static constexpr const char *FIELD_CHARGE = "charge";
static constexpr const char *FIELD_RETENTION_TIME = "retention_time";
static constexpr const char *FIELD_SCANS = "scans";

class SpectrumRecord {
public:
	// Throws ParseError if mz and intensity differ in length.
	SpectrumRecord(std::string id, double precursor_mz, std::optional<double> precursor_intensity,
	               std::optional<int32_t> charge, std::optional<double> retention_time,
	               std::optional<std::string> scans, std::vector<double> mz, std::vector<double> intensity,
	               MetadataFields extra_fields = {});

	const std::string &id() const {
		return id_;
	}
	double precursor_mz() const {
		return precursor_mz_;
	}
	const std::optional<double> &precursor_intensity() const {
		return precursor_intensity_;
	}
	const std::optional<int32_t> &charge() const {
		return charge_;
	}
	const std::optional<double> &retention_time() const {
		return retention_time_;
	}
	const std::optional<std::string> &scans() const {
		return scans_;
	}
	const std::vector<double> &mz_array() const {
		return mz_;
	}
	const std::vector<double> &intensity_array() const {
		return intensity_;
	}
	const MetadataFields &extra_fields() const {
		return extra_fields_;
	}
	size_t num_peaks() const {
		return mz_.size();
	}

	// Value of a scalar field by name. Core fields are matched case-insensitively,
	// anything else is looked up among the extra fields (returned as text).
	// std::nullopt when the field is unknown for this record.
	std::optional<FieldValue> field(const std::string &name) const;

	// Extra field value by key, case-insensitive
	std::optional<std::string> extra_field(const std::string &key) const;

	bool operator==(const SpectrumRecord &other) const = default;

private:
	std::string id_;
	double precursor_mz_;
	std::optional<double> precursor_intensity_;
	std::optional<int32_t> charge_;
	std::optional<double> retention_time_;
	std::optional<std::string> scans_;
	std::vector<double> mz_;
	std::vector<double> intensity_;
	MetadataFields extra_fields_;
};

// True if name refers to one of the fixed scalar fields (case-insensitive).
bool is_core_field(const std::string &name);

// Lower-cased core field name, or upper-cased extra field key.
std::string canonical_field_name(const std::string &name);

} // namespace msms
