#pragma once

#include <string>
#include <vector>
#include "ArrayStore.hpp"
#include "OnDemandDataset.hpp"

namespace msms {

enum class Backend { IN_MEMORY, ON_DEMAND, HYBRID };

const char *backend_name(Backend backend);
// Throws ConfigError
Backend parse_backend(const std::string &name);

struct LoggingConfig {
	std::string level = "info";
};

struct DatasetConfig {
	Backend backend = Backend::IN_MEMORY;
	std::vector<std::string> sources;
	OnDemandConfig on_demand;
	HybridConfig hybrid;
	LoggingConfig logging;
};

// Parse and validate a YAML document. Sections and keys that are absent keep
// their defaults. Throws ConfigError on malformed YAML, values of the wrong
// type, unknown keys or invalid values.
DatasetConfig parse_config(const std::string &yaml_text);

// parse_config() on the contents of path. Relative paths in the document are
// resolved against the directory containing path.
DatasetConfig load_config(const std::string &path);

} // namespace msms
