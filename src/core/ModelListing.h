#pragma once
#include "../probes/Probe.h"
#include <string>

namespace infer_scan {

// Human-readable rendering of a single-host probe (--target mode).
std::string format_model_listing(const ProbeOutcome& outcome);

}
