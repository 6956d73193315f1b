#include "DatasetFactory.hpp"
#include "HybridDataset.hpp"
#include "InMemoryDataset.hpp"
#include "OnDemandDataset.hpp"
#include "msms_logging.hpp"

namespace msms {

template <typename DatasetT>
static std::unique_ptr<SpectraDataset> OpenHybrid(const DatasetConfig &config) {
	if (DatasetT::exists(config.hybrid) && !config.hybrid.rebuild) {
		return DatasetT::open(config.hybrid);
	}
	return DatasetT::build(config.sources, config.hybrid);
}

std::unique_ptr<SpectraDataset> open_dataset(const DatasetConfig &config) {
	set_log_level(config.logging.level);

	switch (config.backend) {
	case Backend::IN_MEMORY:
		return std::make_unique<InMemoryDataset>(config.sources);
	case Backend::ON_DEMAND:
		return std::make_unique<OnDemandDataset>(config.sources, config.on_demand);
	case Backend::HYBRID:
		if (config.hybrid.layout == StorageLayout::EMBEDDED) {
			return OpenHybrid<EmbeddedHybridDataset>(config);
		}
		return OpenHybrid<SplitHybridDataset>(config);
	default:
		throw ConfigError("Invalid backend");
	}
}

} // namespace msms
