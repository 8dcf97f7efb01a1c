// Qt logging categories of the engine and the bridge that routes core log
// lines into them.
#pragma once
#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(sfXfer)
Q_DECLARE_LOGGING_CATEGORY(sfCore)

namespace scpflow {

// Installs a core log sink that forwards SCPFLOW_LOG* lines to the
// "scpflow.core" category. Safe to call more than once.
void installQtLogBridge();

// Restores the default core sink.
void removeQtLogBridge();

} // namespace scpflow
