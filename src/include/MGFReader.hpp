#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include "SpectrumRecord.hpp"

namespace msms {

// Location of one record inside its source file. The span starts at the first
// byte of the BEGIN IONS line and ends after the newline terminating END IONS.
struct MGFRecordSpan {
	std::string id;
	uint64_t offset;
	uint64_t length;
};

// Streaming MGF decoder.
//
// KEY=value lines before the first BEGIN IONS are global parameters and act as
// defaults for every record of the file. Records without a TITLE get the id
// "<file name>#<ordinal>", ordinal being the 0-based position in the file.
//
// Throws ParseError on malformed content (file and line are reported) and
// StorageError if the file cannot be opened or read.
class MGFReader {
public:
	explicit MGFReader(const std::string &path);
	~MGFReader();

	// Non-copyable, moveable
	MGFReader(const MGFReader &) = delete;
	MGFReader &operator=(const MGFReader &) = delete;
	MGFReader(MGFReader &&) noexcept;
	MGFReader &operator=(MGFReader &&) noexcept;

	// Read up to n spectra. Returns 0..n records (0 = end of file).
	[[nodiscard]] std::vector<SpectrumRecord> read(size_t n);

	// Validate the next record without keeping its peaks and return its span.
	// std::nullopt at end of file.
	[[nodiscard]] std::optional<MGFRecordSpan> next_span();

	const MetadataFields &global_params() const;
	const std::string &path() const;

	// Parse one record from an exact byte span previously reported by
	// next_span(). defaults are the file's global parameters and fallback_id is
	// the id used when the record carries no TITLE.
	static SpectrumRecord parse_record(std::string_view text, const MetadataFields &defaults,
	                                   const std::string &fallback_id, const std::string &source);

private:
	struct Impl;
	std::unique_ptr<Impl> impl_;
};

} // namespace msms
