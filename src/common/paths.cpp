#include "common/paths.hpp"

#include <QDir>

namespace timekeep {

namespace {

constexpr const char *kAppDirName = "timekeep";
constexpr const char *kDatabaseFileName = "timekeep.sqlite3";

} // namespace

QString dataDirPath()
{
    const QString xdgData = qEnvironmentVariable("XDG_DATA_HOME");
    if (!xdgData.isEmpty()) {
        return xdgData + QDir::separator() + QLatin1String(kAppDirName);
    }

    const QString home = qEnvironmentVariable("HOME");
    if (home.isEmpty()) {
        return QStringLiteral(".local/share/") + QLatin1String(kAppDirName);
    }
    return home + QStringLiteral("/.local/share/") + QLatin1String(kAppDirName);
}

QString defaultDatabasePath()
{
    const QString overridePath = qEnvironmentVariable("TIMEKEEP_DB");
    if (!overridePath.isEmpty()) {
        return overridePath;
    }
    return dataDirPath() + QDir::separator() + QLatin1String(kDatabaseFileName);
}

QString logsDirPath()
{
    return dataDirPath() + QStringLiteral("/logs");
}

bool traceRequestedByEnvironment()
{
    return qEnvironmentVariableIntValue("TIMEKEEP_TRACE") == 1;
}

} // namespace timekeep
