#include "SpectrumRecord.hpp"
#include "DatasetErrors.hpp"
#include <algorithm>
#include <array>
#include <cctype>

namespace msms {

static const std::array<const char *, 6> CORE_FIELDS = {FIELD_ID,     FIELD_PRECURSOR_MZ,   FIELD_PRECURSOR_INTENSITY,
                                                        FIELD_CHARGE, FIELD_RETENTION_TIME, FIELD_SCANS};

static std::string ToLower(std::string s) {
	std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
	return s;
}

static std::string ToUpper(std::string s) {
	std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::toupper(c); });
	return s;
}

bool is_core_field(const std::string &name) {
	auto lowered = ToLower(name);
	return std::any_of(CORE_FIELDS.begin(), CORE_FIELDS.end(), [&](const char *f) { return lowered == f; });
}

std::string canonical_field_name(const std::string &name) {
	return is_core_field(name) ? ToLower(name) : ToUpper(name);
}

SpectrumRecord::SpectrumRecord(std::string id, double precursor_mz, std::optional<double> precursor_intensity,
                               std::optional<int32_t> charge, std::optional<double> retention_time,
                               std::optional<std::string> scans, std::vector<double> mz, std::vector<double> intensity,
                               MetadataFields extra_fields)
    : id_(std::move(id)), precursor_mz_(precursor_mz), precursor_intensity_(precursor_intensity), charge_(charge),
      retention_time_(retention_time), scans_(std::move(scans)), mz_(std::move(mz)), intensity_(std::move(intensity)),
      extra_fields_(std::move(extra_fields)) {
	if (mz_.size() != intensity_.size()) {
		throw ParseError("Spectrum '" + id_ + "' has " + std::to_string(mz_.size()) + " m/z values but " +
		                 std::to_string(intensity_.size()) + " intensities");
	}
}

std::optional<std::string> SpectrumRecord::extra_field(const std::string &key) const {
	auto upper = ToUpper(key);
	for (const auto &[k, v] : extra_fields_) {
		if (k == upper) {
			return v;
		}
	}
	return std::nullopt;
}

std::optional<FieldValue> SpectrumRecord::field(const std::string &name) const {
	auto lowered = ToLower(name);
	if (lowered == FIELD_ID) {
		return FieldValue(id_);
	}
	if (lowered == FIELD_PRECURSOR_MZ) {
		return FieldValue(precursor_mz_);
	}
	if (lowered == FIELD_PRECURSOR_INTENSITY) {
		if (!precursor_intensity_) {
			return std::nullopt;
		}
		return FieldValue(*precursor_intensity_);
	}
	if (lowered == FIELD_CHARGE) {
		if (!charge_) {
			return std::nullopt;
		}
		return FieldValue(static_cast<int64_t>(*charge_));
	}
	if (lowered == FIELD_RETENTION_TIME) {
		if (!retention_time_) {
			return std::nullopt;
		}
		return FieldValue(*retention_time_);
	}
	if (lowered == FIELD_SCANS) {
		if (!scans_) {
			return std::nullopt;
		}
		return FieldValue(*scans_);
	}

	auto value = extra_field(name);
	if (!value) {
		return std::nullopt;
	}
	return FieldValue(std::move(*value));
}

} // namespace msms
