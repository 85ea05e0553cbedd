#pragma once

#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(lcFingerprint)
Q_DECLARE_LOGGING_CATEGORY(lcCache)
Q_DECLARE_LOGGING_CATEGORY(lcScan)
Q_DECLARE_LOGGING_CATEGORY(lcMerge)
Q_DECLARE_LOGGING_CATEGORY(lcDedup)
Q_DECLARE_LOGGING_CATEGORY(lcOrganize)

namespace Logging {

void enableVerbose(bool verbose);

} // namespace Logging
