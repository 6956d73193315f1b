#include "SpectrumIndex.hpp"
#include "DatasetErrors.hpp"
#include "MGFReader.hpp"
#include "msms_logging.hpp"
#include <filesystem>
#include <fstream>

namespace msms {

static constexpr const char *INDEX_MAGIC = "MSMS-INDEX";
static constexpr int INDEX_FORMAT_VERSION = 1;

IndexedSource stat_source(const std::string &path) {
	std::error_code ec;
	auto size = std::filesystem::file_size(path, ec);
	if (ec) {
		throw StorageError("Cannot stat source file " + path + ": " + ec.message());
	}
	auto mtime = std::filesystem::last_write_time(path, ec);
	if (ec) {
		throw StorageError("Cannot stat source file " + path + ": " + ec.message());
	}
	return IndexedSource {path, static_cast<uint64_t>(size), static_cast<int64_t>(mtime.time_since_epoch().count()),
	                      {}};
}

void SpectrumIndex::add(IndexEntry entry) {
	auto [it, inserted] = positions_.emplace(entry.id, entries_.size());
	if (!inserted) {
		throw DuplicateIdError(entry.id);
	}
	entries_.push_back(std::move(entry));
}

std::optional<size_t> SpectrumIndex::find(const std::string &id) const {
	auto it = positions_.find(id);
	if (it == positions_.end()) {
		return std::nullopt;
	}
	return it->second;
}

SpectrumIndex SpectrumIndex::build(const std::vector<std::string> &paths) {
	SpectrumIndex index;
	for (uint32_t ordinal = 0; ordinal < paths.size(); ordinal++) {
		auto source = stat_source(paths[ordinal]);
		MGFReader reader(paths[ordinal]);
		while (auto span = reader.next_span()) {
			index.add(IndexEntry {std::move(span->id), ordinal, span->offset, span->length});
		}
		source.global_params = reader.global_params();
		index.sources_.push_back(std::move(source));
	}
	return index;
}

//===--------------------------------------------------------------------===//
// Persistence
//===--------------------------------------------------------------------===//
// One record per line, tab-separated:
//   MSMS-INDEX <version>
//   S <path> <size> <mtime>
//   P <source> <key> <value>
//   E <source> <offset> <length> <id>
// Text fields escape backslash, tab, CR and LF.

static std::string Escape(const std::string &s) {
	std::string out;
	out.reserve(s.size());
	for (char c : s) {
		switch (c) {
		case '\\':
			out += "\\\\";
			break;
		case '\t':
			out += "\\t";
			break;
		case '\n':
			out += "\\n";
			break;
		case '\r':
			out += "\\r";
			break;
		default:
			out += c;
		}
	}
	return out;
}

static bool Unescape(const std::string &s, std::string &out) {
	out.clear();
	out.reserve(s.size());
	for (size_t i = 0; i < s.size(); i++) {
		if (s[i] != '\\') {
			out += s[i];
			continue;
		}
		if (++i >= s.size()) {
			return false;
		}
		switch (s[i]) {
		case '\\':
			out += '\\';
			break;
		case 't':
			out += '\t';
			break;
		case 'n':
			out += '\n';
			break;
		case 'r':
			out += '\r';
			break;
		default:
			return false;
		}
	}
	return true;
}

static std::vector<std::string> SplitTabs(const std::string &line) {
	std::vector<std::string> fields;
	size_t start = 0;
	while (true) {
		size_t tab = line.find('\t', start);
		fields.push_back(line.substr(start, tab == std::string::npos ? std::string::npos : tab - start));
		if (tab == std::string::npos) {
			break;
		}
		start = tab + 1;
	}
	return fields;
}

void SpectrumIndex::save(const std::string &index_path) const {
	auto tmp_path = index_path + ".tmp";
	{
		std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
		if (!out) {
			throw StorageError("Cannot write index file: " + tmp_path);
		}
		out << INDEX_MAGIC << '\t' << INDEX_FORMAT_VERSION << '\n';
		for (uint32_t ordinal = 0; ordinal < sources_.size(); ordinal++) {
			const auto &source = sources_[ordinal];
			out << "S\t" << Escape(source.path) << '\t' << source.size << '\t' << source.mtime << '\n';
			for (const auto &[key, value] : source.global_params) {
				out << "P\t" << ordinal << '\t' << Escape(key) << '\t' << Escape(value) << '\n';
			}
		}
		for (const auto &entry : entries_) {
			out << "E\t" << entry.source << '\t' << entry.offset << '\t' << entry.length << '\t' << Escape(entry.id)
			    << '\n';
		}
		out.flush();
		if (!out) {
			throw StorageError("Failed writing index file: " + tmp_path);
		}
	}

	std::error_code ec;
	std::filesystem::rename(tmp_path, index_path, ec);
	if (ec) {
		std::filesystem::remove(tmp_path, ec);
		throw StorageError("Cannot move index file into place at " + index_path);
	}
}

std::optional<SpectrumIndex> SpectrumIndex::load(const std::string &index_path, const std::vector<std::string> &paths) {
	std::ifstream in(index_path, std::ios::binary);
	if (!in) {
		return std::nullopt;
	}

	auto reject = [&](const std::string &why) -> std::optional<SpectrumIndex> {
		logger()->warn("Ignoring persisted index {}: {}", index_path, why);
		return std::nullopt;
	};

	std::string line;
	if (!std::getline(in, line)) {
		return reject("empty file");
	}
	auto header = SplitTabs(line);
	if (header.size() != 2 || header[0] != INDEX_MAGIC || header[1] != std::to_string(INDEX_FORMAT_VERSION)) {
		return reject("unrecognized header");
	}

	SpectrumIndex index;
	size_t line_number = 1;
	while (std::getline(in, line)) {
		line_number++;
		auto fields = SplitTabs(line);
		auto where = "line " + std::to_string(line_number);
		try {
			if (fields[0] == "S" && fields.size() == 4) {
				IndexedSource source;
				if (!Unescape(fields[1], source.path)) {
					return reject("bad escape at " + where);
				}
				source.size = std::stoull(fields[2]);
				source.mtime = std::stoll(fields[3]);
				index.sources_.push_back(std::move(source));
			} else if (fields[0] == "P" && fields.size() == 4) {
				auto ordinal = std::stoul(fields[1]);
				std::string key;
				std::string value;
				if (ordinal >= index.sources_.size() || !Unescape(fields[2], key) || !Unescape(fields[3], value)) {
					return reject("bad parameter at " + where);
				}
				index.sources_[ordinal].global_params.emplace_back(std::move(key), std::move(value));
			} else if (fields[0] == "E" && fields.size() == 5) {
				IndexEntry entry;
				entry.source = static_cast<uint32_t>(std::stoul(fields[1]));
				entry.offset = std::stoull(fields[2]);
				entry.length = std::stoull(fields[3]);
				if (entry.source >= index.sources_.size() || !Unescape(fields[4], entry.id)) {
					return reject("bad entry at " + where);
				}
				index.add(std::move(entry));
			} else {
				return reject("unrecognized record at " + where);
			}
		} catch (const std::invalid_argument &) {
			return reject("bad number at " + where);
		} catch (const std::out_of_range &) {
			return reject("number out of range at " + where);
		} catch (const DuplicateIdError &e) {
			return reject(e.what());
		}
	}

	if (index.sources_.size() != paths.size()) {
		return reject("source list differs");
	}
	for (size_t i = 0; i < paths.size(); i++) {
		const auto &recorded = index.sources_[i];
		if (recorded.path != paths[i]) {
			return reject("source list differs");
		}
		std::error_code ec;
		if (!std::filesystem::exists(paths[i], ec)) {
			return reject("source " + paths[i] + " no longer exists");
		}
		auto current = stat_source(paths[i]);
		if (current.size != recorded.size || current.mtime != recorded.mtime) {
			return reject("source " + paths[i] + " changed since the index was written");
		}
	}
	return index;
}

} // namespace msms
