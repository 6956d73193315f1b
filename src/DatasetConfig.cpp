#include "DatasetConfig.hpp"
#include "DatasetErrors.hpp"
#include "msms_logging.hpp"
#include <filesystem>
#include <fstream>
#include <iterator>
#include <set>
#include <yaml-cpp/yaml.h>

namespace msms {

const char *backend_name(Backend backend) {
	switch (backend) {
	case Backend::IN_MEMORY:
		return "in_memory";
	case Backend::ON_DEMAND:
		return "on_demand";
	case Backend::HYBRID:
		return "hybrid";
	default:
		throw std::invalid_argument("Invalid backend");
	}
}

Backend parse_backend(const std::string &name) {
	if (name == "in_memory") {
		return Backend::IN_MEMORY;
	}
	if (name == "on_demand") {
		return Backend::ON_DEMAND;
	}
	if (name == "hybrid") {
		return Backend::HYBRID;
	}
	throw ConfigError("Unknown backend '" + name + "' (expected in_memory, on_demand or hybrid)");
}

static void CheckKeys(const YAML::Node &node, const std::string &section, const std::set<std::string> &allowed) {
	if (!node.IsMap()) {
		throw ConfigError("'" + section + "' must be a mapping");
	}
	for (const auto &pair : node) {
		auto key = pair.first.as<std::string>();
		if (allowed.count(key) == 0) {
			throw ConfigError("Unknown key '" + key + "' in " + section);
		}
	}
}

template <typename T>
static void ReadValue(const YAML::Node &node, const std::string &key, const std::string &section, T &out) {
	if (!node[key]) {
		return;
	}
	try {
		out = node[key].as<T>();
	} catch (const YAML::Exception &e) {
		throw ConfigError("Invalid value for " + section + "." + key + ": " + e.what());
	}
}

// Non-negative integer that fits size_t
static void ReadCount(const YAML::Node &node, const std::string &key, const std::string &section, size_t &out) {
	int64_t value = static_cast<int64_t>(out);
	ReadValue(node, key, section, value);
	if (value < 0) {
		throw ConfigError(section + "." + key + " must not be negative");
	}
	out = static_cast<size_t>(value);
}

static void ParseOnDemand(const YAML::Node &node, OnDemandConfig &config) {
	CheckKeys(node, "on_demand", {"index_path"});
	ReadValue(node, "index_path", "on_demand", config.index_path);
}

static void ParseHybrid(const YAML::Node &node, HybridConfig &config) {
	CheckKeys(node, "hybrid", {"layout", "metadata_path", "array_path", "insert_batch_size", "prefetch_chunk_size",
	                           "compression", "rebuild"});
	if (node["layout"]) {
		std::string layout;
		ReadValue(node, "layout", "hybrid", layout);
		config.layout = parse_layout(layout);
	}
	ReadValue(node, "metadata_path", "hybrid", config.metadata_path);
	ReadValue(node, "array_path", "hybrid", config.array_path);
	ReadCount(node, "insert_batch_size", "hybrid", config.insert_batch_size);
	ReadCount(node, "prefetch_chunk_size", "hybrid", config.prefetch_chunk_size);
	ReadValue(node, "compression", "hybrid", config.compression);
	ReadValue(node, "rebuild", "hybrid", config.rebuild);

	if (config.insert_batch_size == 0) {
		throw ConfigError("hybrid.insert_batch_size must be positive");
	}
}

static void ParseLogging(const YAML::Node &node, LoggingConfig &config) {
	CheckKeys(node, "logging", {"level"});
	ReadValue(node, "level", "logging", config.level);
	parse_log_level(config.level);
}

static void Validate(const DatasetConfig &config) {
	if (config.sources.empty()) {
		throw ConfigError("At least one source file is required");
	}
	if (config.backend == Backend::HYBRID) {
		if (config.hybrid.metadata_path.empty()) {
			throw ConfigError("hybrid.metadata_path is required for the hybrid backend");
		}
		if (config.hybrid.layout == StorageLayout::SPLIT && config.hybrid.array_path.empty()) {
			throw ConfigError("hybrid.array_path is required for the split layout");
		}
	}
}

DatasetConfig parse_config(const std::string &yaml_text) {
	YAML::Node root;
	try {
		root = YAML::Load(yaml_text);
	} catch (const YAML::Exception &e) {
		throw ConfigError(std::string("Malformed YAML: ") + e.what());
	}
	if (!root.IsMap()) {
		throw ConfigError("Configuration must be a YAML mapping");
	}

	DatasetConfig config;
	CheckKeys(root, "configuration", {"backend", "sources", "on_demand", "hybrid", "logging"});

	if (root["backend"]) {
		std::string backend;
		ReadValue(root, "backend", "configuration", backend);
		config.backend = parse_backend(backend);
	}
	if (root["sources"]) {
		if (!root["sources"].IsSequence()) {
			throw ConfigError("'sources' must be a list of file paths");
		}
		ReadValue(root, "sources", "configuration", config.sources);
	}
	if (root["on_demand"]) {
		ParseOnDemand(root["on_demand"], config.on_demand);
	}
	if (root["hybrid"]) {
		ParseHybrid(root["hybrid"], config.hybrid);
	}
	if (root["logging"]) {
		ParseLogging(root["logging"], config.logging);
	}

	Validate(config);
	return config;
}

static void Resolve(const std::filesystem::path &base, std::string &path) {
	if (!path.empty() && std::filesystem::path(path).is_relative()) {
		path = (base / path).lexically_normal().string();
	}
}

DatasetConfig load_config(const std::string &path) {
	std::string text;
	{
		std::ifstream in(path, std::ios::binary);
		if (!in) {
			throw ConfigError("Cannot read configuration file: " + path);
		}
		text.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
	}

	auto config = parse_config(text);
	auto base = std::filesystem::path(path).parent_path();
	for (auto &source : config.sources) {
		Resolve(base, source);
	}
	Resolve(base, config.on_demand.index_path);
	Resolve(base, config.hybrid.metadata_path);
	Resolve(base, config.hybrid.array_path);
	return config;
}

} // namespace msms
