#pragma once

#include "txdedup/app/app_service.h"
#include "txdedup/core/clock.h"
#include "txdedup/core/id_generator.h"
#include "txdedup/core/services.h"

#include <ostream>

// execute_detect: run the detection pipeline and print the JSON report to `out`.
// Takes only interface types so it runs against any storage backend.
// Exceptions from the transaction source propagate to the caller.
int execute_detect(const txdedup::app::DetectionPipelineRequest& req,
                   txdedup::core::Services& services, txdedup::core::IIdGenerator& id_gen,
                   txdedup::core::IClock& clock, bool show_trace, std::ostream& out);
