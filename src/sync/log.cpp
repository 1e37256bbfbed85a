#include "sync/log.hpp"

Q_LOGGING_CATEGORY(ladleSyncLog, "ladle.sync", QtInfoMsg)
Q_LOGGING_CATEGORY(ladleImagesLog, "ladle.images", QtInfoMsg)
Q_LOGGING_CATEGORY(ladleQueueLog, "ladle.queue", QtInfoMsg)

namespace ladle::sync {

bool sync_debug_enabled() {
    return qEnvironmentVariableIsSet("LADLE_DEBUG_SYNC");
}

void enable_sync_debug_output() {
    QLoggingCategory::setFilterRules(QStringLiteral("ladle.*.debug=true"));
}

} // namespace ladle::sync
