#include "EngineLogging.hpp"
#include "scpflow/Log.hpp"

#include <QString>

Q_LOGGING_CATEGORY(sfXfer, "scpflow.transfer")
Q_LOGGING_CATEGORY(sfCore, "scpflow.core")

namespace scpflow {

void installQtLogBridge() {
    setLogSink([](LogLevel level, const std::string& line) {
        const QString msg = QString::fromStdString(line);
        switch (level) {
        case LogLevel::Debug:
            qCDebug(sfCore).noquote() << msg;
            break;
        case LogLevel::Info:
            qCInfo(sfCore).noquote() << msg;
            break;
        case LogLevel::Warning:
            qCWarning(sfCore).noquote() << msg;
            break;
        case LogLevel::Error:
            qCCritical(sfCore).noquote() << msg;
            break;
        }
    });
}

void removeQtLogBridge() { setLogSink(LogSink()); }

} // namespace scpflow
