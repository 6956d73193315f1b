#pragma once

#include <memory>
#include "DatasetConfig.hpp"
#include "SpectraDataset.hpp"

namespace msms {

// Construct the backend selected by config and apply its logging level.
// A hybrid store is reopened when its files exist and rebuild is not set;
// otherwise it is built from the sources.
std::unique_ptr<SpectraDataset> open_dataset(const DatasetConfig &config);

} // namespace msms
