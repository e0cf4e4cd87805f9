#pragma once

#include "hostwarden/config/schema.hpp"
#include "hostwarden/metrics/snapshot.hpp"
#include "hostwarden/metrics/source.hpp"

#include <cstddef>

namespace hostwarden::monitor {

inline constexpr std::size_t kTopProcessCount = 5;

/// Runs every enabled check concurrently and joins them. A check that fails or throws
/// becomes a collection error in its own slot; the others are unaffected.
[[nodiscard]] metrics::MetricSnapshot collect_snapshot(metrics::IMetricSource &source,
                                                       const config::Config &config);

} // namespace hostwarden::monitor
