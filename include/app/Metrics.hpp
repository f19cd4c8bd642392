#pragma once

#include <string>
#include "model/Snapshot.hpp"

namespace zenmon::app {

// Serialize a Snapshot into Prometheus text exposition format (version 0.0.4).
// Unavailable readings are written as NaN.
[[nodiscard]] std::string snapshot_to_prometheus(const zenmon::model::Snapshot& snap);

} // namespace zenmon::app
