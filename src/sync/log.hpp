#pragma once

#include "core/types.hpp"
#include <QLoggingCategory>
#include <QString>

Q_DECLARE_LOGGING_CATEGORY(ladleSyncLog)
Q_DECLARE_LOGGING_CATEGORY(ladleImagesLog)
Q_DECLARE_LOGGING_CATEGORY(ladleQueueLog)

namespace ladle::sync {

/** True when LADLE_DEBUG_SYNC is set in the environment. */
[[nodiscard]] bool sync_debug_enabled();

/**
 * Turn on debug output for every ladle.* category. Called once at startup
 * when sync debugging was requested.
 */
void enable_sync_debug_output();

[[nodiscard]] inline QString to_qstring(const Uuid& id) {
    return QString::fromStdString(id.to_string());
}

} // namespace ladle::sync
