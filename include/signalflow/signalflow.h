#pragma once

#include "analytics_dataframe.h"
#include "basket_runner.h"
#include "change_point.h"
#include "column_view.h"
#include "dataframe_io.h"
#include "indicators.h"
#include "pipeline_config.h"
#include "pivot_detector.h"
#include "segment_cost.h"
#include "signal_fuser.h"
#include "signal_merge.h"
#include "signal_pipeline.h"
#include "simple_logger.h"
#include "technical_signals.h"
#include "time_series.h"

#include <arrow/status.h>

namespace signalflow {

constexpr const char* VERSION = "1.0.0";

// Registers the Arrow compute kernels the table operations rely on. Call
// once before touching any AnalyticsDataFrame.
arrow::Status initialize();

} // namespace signalflow
