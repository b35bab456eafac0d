#pragma once

#include <vector>

#include <QByteArray>
#include <QDate>
#include <QString>

#include "common/models.hpp"

namespace timekeep {

// Writes rows as UTF-8 CSV: ID,Project,Task,Notes,Start,End,Duration.
// Throws StorageError when the destination cannot be written.
void exportRows(const std::vector<TimeEntry> &rows, const QString &destination);

// The same document as a byte array, used by exportRows.
QByteArray renderCsv(const std::vector<TimeEntry> &rows);

QString defaultExportFileName(const QDate &from, const QDate &to);

} // namespace timekeep
