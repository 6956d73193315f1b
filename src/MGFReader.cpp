// MGF (Mascot Generic Format) decoder.
// Records are delimited by BEGIN IONS / END IONS lines; inside a record every
// line is either a KEY=value parameter or a peak line "m/z intensity [charge]".

#include "MGFReader.hpp"
#include "DatasetErrors.hpp"
#include "msms_logging.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace msms {

static constexpr std::string_view BEGIN_IONS = "BEGIN IONS";
static constexpr std::string_view END_IONS = "END IONS";

static constexpr const char *PARAM_TITLE = "TITLE";
static constexpr const char *PARAM_PEPMASS = "PEPMASS";
static constexpr const char *PARAM_CHARGE = "CHARGE";
static constexpr const char *PARAM_RTINSECONDS = "RTINSECONDS";
static constexpr const char *PARAM_SCANS = "SCANS";

enum class LineKind { BLANK, COMMENT, BEGIN, END, PARAM, PEAK, OTHER };

static std::string_view Trim(std::string_view s) {
	size_t start = 0;
	while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) {
		start++;
	}
	size_t end = s.size();
	while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) {
		end--;
	}
	return s.substr(start, end - start);
}

// line must already be trimmed
static LineKind Classify(std::string_view line) {
	if (line.empty()) {
		return LineKind::BLANK;
	}
	char c = line[0];
	if (c == '#' || c == ';' || c == '!' || c == '/') {
		return LineKind::COMMENT;
	}
	if (line == BEGIN_IONS) {
		return LineKind::BEGIN;
	}
	if (line == END_IONS) {
		return LineKind::END;
	}
	if (std::isalpha(static_cast<unsigned char>(c)) && line.find('=') != std::string_view::npos) {
		return LineKind::PARAM;
	}
	if (std::isdigit(static_cast<unsigned char>(c)) || c == '.' || c == '-' || c == '+') {
		return LineKind::PEAK;
	}
	return LineKind::OTHER;
}

static std::vector<std::string_view> SplitWhitespace(std::string_view s) {
	std::vector<std::string_view> tokens;
	size_t i = 0;
	while (i < s.size()) {
		while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i]))) {
			i++;
		}
		size_t start = i;
		while (i < s.size() && !std::isspace(static_cast<unsigned char>(s[i]))) {
			i++;
		}
		if (i > start) {
			tokens.push_back(s.substr(start, i - start));
		}
	}
	return tokens;
}

// Whole-token numeric conversion: false on failure instead of throwing
static bool SafeStod(std::string_view token, double &out) {
	if (token.empty()) {
		return false;
	}
	std::string s(token);
	try {
		size_t pos = 0;
		out = std::stod(s, &pos);
		return pos == s.size();
	} catch (const std::invalid_argument &) {
		return false;
	} catch (const std::out_of_range &) {
		return false;
	}
}

// Leading-number conversion, used for values such as "10.5-11.0".
// nan and inf read as unknown.
static std::optional<double> LeadingDouble(std::string_view token) {
	std::string s(token);
	try {
		size_t pos = 0;
		double value = std::stod(s, &pos);
		if (pos == 0 || !std::isfinite(value)) {
			return std::nullopt;
		}
		return value;
	} catch (const std::invalid_argument &) {
		return std::nullopt;
	} catch (const std::out_of_range &) {
		return std::nullopt;
	}
}

// "2+", "3-", "+2", "2", "2+ and 3+" (first wins). std::nullopt if unparseable.
static std::optional<int32_t> ParseCharge(std::string_view value) {
	auto tokens = SplitWhitespace(value);
	if (tokens.empty()) {
		return std::nullopt;
	}
	auto token = tokens[0];
	if (!token.empty() && token.back() == ',') {
		token.remove_suffix(1);
	}

	int sign = 1;
	if (!token.empty() && (token.back() == '+' || token.back() == '-')) {
		sign = token.back() == '-' ? -1 : 1;
		token.remove_suffix(1);
	} else if (!token.empty() && (token.front() == '+' || token.front() == '-')) {
		sign = token.front() == '-' ? -1 : 1;
		token.remove_prefix(1);
	}

	if (token.empty() || token.size() > 9 ||
	    !std::all_of(token.begin(), token.end(), [](unsigned char c) { return std::isdigit(c); })) {
		return std::nullopt;
	}
	return sign * static_cast<int32_t>(std::stol(std::string(token)));
}

static std::string Upper(std::string_view s) {
	std::string out(s);
	std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return std::toupper(c); });
	return out;
}

// Where a line sits; formatted only when an error is reported
struct LineLocation {
	const std::string &source;
	uint64_t line;
	// Line numbers count from the start of a single record's text
	bool record_relative;

	std::string describe() const {
		if (record_relative) {
			return source + " (record line " + std::to_string(line) + ")";
		}
		return source + ":" + std::to_string(line);
	}
};

// Accumulates one record's parameters and peaks
class RecordBuilder {
public:
	RecordBuilder(const MetadataFields &defaults, bool keep_peaks) : params_(defaults), keep_peaks_(keep_peaks) {
	}

	void add_param(std::string_view line) {
		auto eq = line.find('=');
		auto key = Upper(Trim(line.substr(0, eq)));
		auto value = std::string(Trim(line.substr(eq + 1)));
		set_param(params_, key, std::move(value));
	}

	void add_peak(std::string_view line, const LineLocation &where) {
		auto tokens = SplitWhitespace(line);
		if (tokens.size() < 2 || tokens.size() > 3) {
			throw ParseError("Malformed peak line at " + where.describe() + ": expected 'm/z intensity', got '" +
			                 std::string(line) + "'");
		}
		double mz = 0;
		double intensity = 0;
		if (!SafeStod(tokens[0], mz) || !SafeStod(tokens[1], intensity)) {
			throw ParseError("Malformed peak line at " + where.describe() + ": '" + std::string(line) + "'");
		}
		if (!std::isfinite(mz) || !std::isfinite(intensity)) {
			throw ParseError("Non-finite peak value at " + where.describe() + ": '" + std::string(line) + "'");
		}
		if (keep_peaks_) {
			mz_.push_back(mz);
			intensity_.push_back(intensity);
		}
	}

	SpectrumRecord build(const std::string &fallback_id, const std::string &where) {
		std::string id = fallback_id;
		double precursor_mz = 0.0;
		std::optional<double> precursor_intensity;
		std::optional<int32_t> charge;
		std::optional<double> retention_time;
		std::optional<std::string> scans;
		MetadataFields extra;

		for (auto &[key, value] : params_) {
			if (key == PARAM_TITLE) {
				if (!value.empty()) {
					id = value;
				}
			} else if (key == PARAM_PEPMASS) {
				auto tokens = SplitWhitespace(value);
				if (tokens.empty() || !SafeStod(tokens[0], precursor_mz) || !std::isfinite(precursor_mz)) {
					throw ParseError("Invalid PEPMASS '" + value + "' in record ending at " + where);
				}
				if (tokens.size() > 1) {
					double intensity = 0;
					if (!SafeStod(tokens[1], intensity)) {
						throw ParseError("Invalid PEPMASS intensity '" + value + "' in record ending at " + where);
					}
					if (std::isfinite(intensity)) {
						precursor_intensity = intensity;
					}
				}
			} else if (key == PARAM_CHARGE) {
				charge = ParseCharge(value);
				if (!charge && !value.empty()) {
					logger()->warn("Unparseable CHARGE '{}' treated as unknown at {}", value, where);
				}
			} else if (key == PARAM_RTINSECONDS) {
				retention_time = LeadingDouble(value);
			} else if (key == PARAM_SCANS) {
				scans = value;
			} else {
				extra.emplace_back(key, value);
			}
		}

		return SpectrumRecord(std::move(id), precursor_mz, precursor_intensity, charge, retention_time,
		                      std::move(scans), std::move(mz_), std::move(intensity_), std::move(extra));
	}

	static void set_param(MetadataFields &params, const std::string &key, std::string value) {
		for (auto &entry : params) {
			if (entry.first == key) {
				entry.second = std::move(value);
				return;
			}
		}
		params.emplace_back(key, std::move(value));
	}

private:
	MetadataFields params_;
	bool keep_peaks_;
	std::vector<double> mz_;
	std::vector<double> intensity_;
};

// Feed one line belonging to an open record. Returns true once END IONS is seen.
static bool FeedRecordLine(RecordBuilder &builder, std::string_view raw, const LineLocation &where) {
	auto line = Trim(raw);
	switch (Classify(line)) {
	case LineKind::BLANK:
	case LineKind::COMMENT:
		return false;
	case LineKind::END:
		return true;
	case LineKind::PARAM:
		builder.add_param(line);
		return false;
	case LineKind::PEAK:
		builder.add_peak(line, where);
		return false;
	case LineKind::BEGIN:
		throw ParseError("BEGIN IONS inside an open record at " + where.describe() + " (missing END IONS)");
	case LineKind::OTHER:
	default:
		throw ParseError("Unrecognized line at " + where.describe() + ": '" + std::string(line) + "'");
	}
}

struct MGFReader::Impl {
	std::string filepath;
	std::string file_name;
	std::ifstream file;

	// Byte offset of the next unread line
	uint64_t offset = 0;
	uint64_t line_number = 0;
	// Records returned so far (used for fallback ids)
	size_t ordinal = 0;

	MetadataFields global_params;
	bool seen_first_record = false;

	// BEGIN IONS line consumed while scanning the header
	bool has_pending_begin = false;
	uint64_t pending_begin_offset = 0;
	uint64_t pending_begin_line = 0;

	std::string line_buffer;

	explicit Impl(const std::string &path) : filepath(path) {
		file.open(path, std::ios::binary);
		if (!file.is_open()) {
			throw StorageError("MGFReader: cannot open file: " + path);
		}
		file_name = std::filesystem::path(path).filename().string();

		// Collect global parameters up to the first record
		uint64_t start = 0;
		if (find_begin(start)) {
			has_pending_begin = true;
			pending_begin_offset = start;
			pending_begin_line = line_number;
		}
	}

	std::string where() const {
		return filepath + ":" + std::to_string(line_number);
	}

	// Read the next line into line_buffer. line_start receives its byte offset.
	bool next_line(uint64_t &line_start) {
		if (!std::getline(file, line_buffer)) {
			if (file.bad()) {
				throw StorageError("MGFReader: read error in " + filepath);
			}
			return false;
		}
		line_start = offset;
		offset += line_buffer.size();
		// getline sets eof only when the last line has no terminating newline
		if (!file.eof()) {
			offset += 1;
		}
		line_number++;
		return true;
	}

	// Advance to the next BEGIN IONS line. False at end of file.
	bool find_begin(uint64_t &record_start) {
		if (has_pending_begin) {
			has_pending_begin = false;
			record_start = pending_begin_offset;
			return true;
		}

		uint64_t line_start = 0;
		while (next_line(line_start)) {
			auto line = Trim(line_buffer);
			switch (Classify(line)) {
			case LineKind::BLANK:
			case LineKind::COMMENT:
				continue;
			case LineKind::BEGIN:
				seen_first_record = true;
				record_start = line_start;
				return true;
			case LineKind::PARAM:
				if (!seen_first_record) {
					auto eq = line.find('=');
					RecordBuilder::set_param(global_params, Upper(Trim(line.substr(0, eq))),
					                         std::string(Trim(line.substr(eq + 1))));
					continue;
				}
				throw ParseError("Parameter outside of BEGIN IONS/END IONS at " + where() + ": '" +
				                 std::string(line) + "'");
			default:
				throw ParseError("Unexpected content outside of BEGIN IONS/END IONS at " + where() + ": '" +
				                 std::string(line) + "'");
			}
		}
		return false;
	}

	// Consume lines of an open record through END IONS. Returns the end offset.
	uint64_t consume_record(RecordBuilder &builder, uint64_t record_start) {
		uint64_t begin_line = line_number;
		uint64_t line_start = 0;
		while (next_line(line_start)) {
			if (FeedRecordLine(builder, line_buffer, LineLocation {filepath, line_number, false})) {
				return offset;
			}
		}
		throw ParseError("Unterminated record starting at " + filepath + ":" + std::to_string(begin_line) +
		                 " (byte " + std::to_string(record_start) + "): end of file before END IONS");
	}

	std::string fallback_id() const {
		return file_name + "#" + std::to_string(ordinal);
	}
};

MGFReader::MGFReader(const std::string &path) : impl_(std::make_unique<Impl>(path)) {
}

MGFReader::~MGFReader() = default;
MGFReader::MGFReader(MGFReader &&) noexcept = default;
MGFReader &MGFReader::operator=(MGFReader &&) noexcept = default;

std::vector<SpectrumRecord> MGFReader::read(size_t n) {
	std::vector<SpectrumRecord> records;
	records.reserve(std::min(n, size_t(4096)));

	for (size_t i = 0; i < n; i++) {
		uint64_t start = 0;
		if (!impl_->find_begin(start)) {
			break;
		}
		RecordBuilder builder(impl_->global_params, /*keep_peaks=*/true);
		impl_->consume_record(builder, start);
		records.push_back(builder.build(impl_->fallback_id(), impl_->where()));
		impl_->ordinal++;
	}
	return records;
}

std::optional<MGFRecordSpan> MGFReader::next_span() {
	uint64_t start = 0;
	if (!impl_->find_begin(start)) {
		return std::nullopt;
	}
	RecordBuilder builder(impl_->global_params, /*keep_peaks=*/false);
	uint64_t end = impl_->consume_record(builder, start);
	// build() applies the same validation as a full read
	auto record = builder.build(impl_->fallback_id(), impl_->where());
	impl_->ordinal++;
	return MGFRecordSpan {record.id(), start, end - start};
}

const MetadataFields &MGFReader::global_params() const {
	return impl_->global_params;
}

const std::string &MGFReader::path() const {
	return impl_->filepath;
}

SpectrumRecord MGFReader::parse_record(std::string_view text, const MetadataFields &defaults,
                                       const std::string &fallback_id, const std::string &source) {
	RecordBuilder builder(defaults, /*keep_peaks=*/true);
	bool in_record = false;
	bool finished = false;
	uint64_t line_no = 0;
	size_t pos = 0;

	while (pos < text.size()) {
		size_t nl = text.find('\n', pos);
		auto raw = text.substr(pos, nl == std::string_view::npos ? std::string_view::npos : nl - pos);
		pos = nl == std::string_view::npos ? text.size() : nl + 1;
		line_no++;
		LineLocation where {source, line_no, true};

		auto line = Trim(raw);
		if (finished) {
			if (Classify(line) != LineKind::BLANK) {
				throw ParseError("Trailing content after END IONS at " + where.describe());
			}
			continue;
		}
		if (!in_record) {
			auto kind = Classify(line);
			if (kind == LineKind::BLANK || kind == LineKind::COMMENT) {
				continue;
			}
			if (kind != LineKind::BEGIN) {
				throw ParseError("Expected BEGIN IONS at " + where.describe() + ", got '" + std::string(line) + "'");
			}
			in_record = true;
			continue;
		}
		if (FeedRecordLine(builder, raw, where)) {
			finished = true;
		}
	}

	if (!finished) {
		throw ParseError("Incomplete record in " + source + ": missing " +
		                 std::string(in_record ? END_IONS : BEGIN_IONS));
	}
	return builder.build(fallback_id, source);
}

} // namespace msms
