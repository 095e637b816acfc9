#include "Log.h"

Q_LOGGING_CATEGORY(lcSync, "bookreel.sync", QtInfoMsg)
Q_LOGGING_CATEGORY(lcCapture, "bookreel.capture", QtInfoMsg)
Q_LOGGING_CATEGORY(lcMedia, "bookreel.media", QtInfoMsg)
Q_LOGGING_CATEGORY(lcStorage, "bookreel.storage", QtInfoMsg)
Q_LOGGING_CATEGORY(lcExport, "bookreel.export", QtInfoMsg)

namespace Log {

void setVerbose(bool verbose) {
    QLoggingCategory::setFilterRules(verbose
        ? QStringLiteral("bookreel.*.debug=true")
        : QStringLiteral("bookreel.*.debug=false"));
}

} // namespace Log
