#include "query/csv_export.hpp"

#include <QFile>
#include <QStringList>

#include "common/errors.hpp"
#include "common/time_utils.hpp"
#include "query/query_engine.hpp"

namespace timekeep {

namespace {

const QStringList kHeader = {
    QStringLiteral("ID"),
    QStringLiteral("Project"),
    QStringLiteral("Task"),
    QStringLiteral("Notes"),
    QStringLiteral("Start"),
    QStringLiteral("End"),
    QStringLiteral("Duration"),
};

QString csvField(const QString &value)
{
    if (!value.contains(QLatin1Char(','))
        && !value.contains(QLatin1Char('"'))
        && !value.contains(QLatin1Char('\n'))
        && !value.contains(QLatin1Char('\r'))) {
        return value;
    }
    QString escaped = value;
    escaped.replace(QLatin1String("\""), QLatin1String("\"\""));
    return QLatin1Char('"') + escaped + QLatin1Char('"');
}

void appendRecord(QByteArray &out, const QStringList &fields)
{
    QStringList escaped;
    escaped.reserve(fields.size());
    for (const QString &field : fields) {
        escaped.push_back(csvField(field));
    }
    out += escaped.join(QLatin1Char(',')).toUtf8();
    out += "\r\n";
}

} // namespace

QByteArray renderCsv(const std::vector<TimeEntry> &rows)
{
    QByteArray out;
    appendRecord(out, kHeader);

    for (const TimeEntry &entry : rows) {
        appendRecord(out, {
            QString::number(entry.id),
            QString::fromStdString(entry.project),
            QString::fromStdString(entry.task),
            QString::fromStdString(entry.notes),
            QString::fromStdString(toLocalIso8601(entry.start)),
            entry.end ? QString::fromStdString(toLocalIso8601(*entry.end)) : QString(),
            QString::fromStdString(formatDuration(effectiveDuration(entry))),
        });
    }
    return out;
}

void exportRows(const std::vector<TimeEntry> &rows, const QString &destination)
{
    const QByteArray data = renderCsv(rows);

    QFile file(destination);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        throw StorageError("failed to open " + destination.toStdString()
                           + " for writing: " + file.errorString().toStdString());
    }
    if (file.write(data) != data.size()) {
        throw StorageError("failed to write " + destination.toStdString()
                           + ": " + file.errorString().toStdString());
    }
    if (!file.flush()) {
        throw StorageError("failed to flush " + destination.toStdString());
    }
}

QString defaultExportFileName(const QDate &from, const QDate &to)
{
    return QStringLiteral("timekeep_%1_%2.csv")
        .arg(from.toString(Qt::ISODate), to.toString(Qt::ISODate));
}

} // namespace timekeep
