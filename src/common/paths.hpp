#pragma once

#include <QString>

namespace timekeep {

// Per-user data directory: $XDG_DATA_HOME/timekeep, falling back to
// $HOME/.local/share/timekeep.
QString dataDirPath();

// $TIMEKEEP_DB when set, otherwise <dataDir>/timekeep.sqlite3.
QString defaultDatabasePath();

QString logsDirPath();

bool traceRequestedByEnvironment();

} // namespace timekeep
