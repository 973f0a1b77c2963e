#pragma once

// Convenience header pulling in the public API of the three engines.

#include "rowcast/core/cell.hpp"
#include "rowcast/core/dataset.hpp"
#include "rowcast/core/timestamp.hpp"
#include "rowcast/engine/anomaly_engine.hpp"
#include "rowcast/engine/cluster_engine.hpp"
#include "rowcast/engine/forecast_engine.hpp"
#include "rowcast/engine/forecast_types.hpp"
#include "rowcast/engine/model_factory.hpp"
#include "rowcast/utils/logging.hpp"
