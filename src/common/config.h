#ifndef SUBGATE_COMMON_CONFIG_H_
#define SUBGATE_COMMON_CONFIG_H_

#include <cstddef>
#include <cstdint>

namespace Subgate {

/// Admission configs
/// Rows added on top of the visible-row sum when sizing the unlocked fast tier
/// (3 above + 3 below the viewport).
constexpr size_t kFastBufferMargin = 6;
/// Upper bound applied to a single pane count after clamping.
constexpr size_t kMaxPaneRowCount = UINT32_MAX;
/// Initial value of the invisible-row base limit when no configuration is loaded.
constexpr int64_t kDefaultInactiveBaseLimit = 100;
/// Separator between the pair, token and chain fields of a subscription key.
constexpr char kKeySeparator = '|';

} // namespace Subgate

#endif // SUBGATE_COMMON_CONFIG_H_
