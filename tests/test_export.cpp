#include <QtTest/QtTest>

#include <QDateTime>
#include <QFile>
#include <QTemporaryDir>

#include <vector>

#include "common/errors.hpp"
#include "common/time_utils.hpp"
#include "query/csv_export.hpp"

namespace {

timekeep::TimePoint localTime(const QDate &date, int hour, int minute, int second = 0)
{
    const QDateTime dt(date, QTime(hour, minute, second));
    return timekeep::TimePoint{std::chrono::seconds{dt.toSecsSinceEpoch()}};
}

// Minimal RFC 4180 reader: quoted fields may hold commas, quotes and newlines.
QList<QStringList> parseCsv(const QString &text)
{
    QList<QStringList> records;
    QStringList record;
    QString field;
    bool quoted = false;

    for (int i = 0; i < text.size(); ++i) {
        const QChar c = text.at(i);
        if (quoted) {
            if (c == QLatin1Char('"')) {
                if (i + 1 < text.size() && text.at(i + 1) == QLatin1Char('"')) {
                    field += c;
                    ++i;
                } else {
                    quoted = false;
                }
            } else {
                field += c;
            }
            continue;
        }
        if (c == QLatin1Char('"')) {
            quoted = true;
        } else if (c == QLatin1Char(',')) {
            record.push_back(field);
            field.clear();
        } else if (c == QLatin1Char('\r')) {
            continue;
        } else if (c == QLatin1Char('\n')) {
            record.push_back(field);
            records.push_back(record);
            record.clear();
            field.clear();
        } else {
            field += c;
        }
    }
    if (!field.isEmpty() || !record.isEmpty()) {
        record.push_back(field);
        records.push_back(record);
    }
    return records;
}

} // namespace

class ExportTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void testHeaderOnly();
    void testRowsRoundTrip();
    void testQuotingIsMinimal();
    void testUnwritableDestination();
    void testDefaultFileName();

private:
    QTemporaryDir m_tempDir;
    std::vector<timekeep::TimeEntry> sampleRows() const;
};

void ExportTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
}

std::vector<timekeep::TimeEntry> ExportTests::sampleRows() const
{
    const QDate day(2024, 6, 15);

    timekeep::TimeEntry tricky;
    tricky.id = 7;
    tricky.project = "Client, Inc";
    tricky.task = "Say \"hi\"";
    tricky.notes = "line one\nline two";
    tricky.start = localTime(day, 9, 0);
    tricky.end = localTime(day, 10, 1, 1);
    tricky.durationSeconds = 3661;

    // No cached duration: the exporter recomputes it from the interval.
    timekeep::TimeEntry uncached;
    uncached.id = 8;
    uncached.project = "Plain";
    uncached.task = "Review";
    uncached.start = localTime(day, 11, 0);
    uncached.end = localTime(day, 11, 30);

    timekeep::TimeEntry open;
    open.id = 9;
    open.project = "Plain";
    open.task = "Ongoing";
    open.start = localTime(day, 12, 0);

    return {tricky, uncached, open};
}

void ExportTests::testHeaderOnly()
{
    const QByteArray csv = timekeep::renderCsv({});
    QCOMPARE(csv, QByteArray("ID,Project,Task,Notes,Start,End,Duration\r\n"));
}

void ExportTests::testRowsRoundTrip()
{
    const QString path = m_tempDir.path() + "/export.csv";
    timekeep::exportRows(sampleRows(), path);

    QFile file(path);
    QVERIFY(file.open(QIODevice::ReadOnly));
    const QByteArray bytes = file.readAll();
    QVERIFY(bytes.endsWith("\r\n"));

    const QList<QStringList> records = parseCsv(QString::fromUtf8(bytes));
    QCOMPARE(int(records.size()), 4);
    QCOMPARE(records[0].join(QLatin1Char(',')),
             QStringLiteral("ID,Project,Task,Notes,Start,End,Duration"));

    const QStringList tricky = records[1];
    QCOMPARE(int(tricky.size()), 7);
    QCOMPARE(tricky[0], QStringLiteral("7"));
    QCOMPARE(tricky[1], QStringLiteral("Client, Inc"));
    QCOMPARE(tricky[2], QStringLiteral("Say \"hi\""));
    QCOMPARE(tricky[3], QStringLiteral("line one\nline two"));
    QCOMPARE(tricky[4], QStringLiteral("2024-06-15T09:00:00"));
    QCOMPARE(tricky[5], QStringLiteral("2024-06-15T10:01:01"));
    QCOMPARE(tricky[6], QStringLiteral("01:01:01"));

    QCOMPARE(records[2][6], QStringLiteral("00:30:00"));

    const QStringList open = records[3];
    QCOMPARE(open[0], QStringLiteral("9"));
    QVERIFY(open[5].isEmpty());
    QCOMPARE(open[6], QStringLiteral("00:00:00"));

    // Exporting again overwrites rather than appends.
    timekeep::exportRows({}, path);
    QFile again(path);
    QVERIFY(again.open(QIODevice::ReadOnly));
    QCOMPARE(again.readAll(), QByteArray("ID,Project,Task,Notes,Start,End,Duration\r\n"));
}

void ExportTests::testQuotingIsMinimal()
{
    const QByteArray csv = timekeep::renderCsv(sampleRows());
    QVERIFY(csv.contains("\"Client, Inc\""));
    QVERIFY(csv.contains("\"Say \"\"hi\"\"\""));
    QVERIFY(csv.contains("\r\n8,Plain,Review,,2024-06-15T11:00:00,2024-06-15T11:30:00,00:30:00\r\n"));
}

void ExportTests::testUnwritableDestination()
{
    const QString path = m_tempDir.path() + "/missing-dir/export.csv";
    QVERIFY_EXCEPTION_THROWN(timekeep::exportRows(sampleRows(), path), timekeep::StorageError);
    QVERIFY(!QFile::exists(path));
}

void ExportTests::testDefaultFileName()
{
    QCOMPARE(timekeep::defaultExportFileName(QDate(2024, 6, 1), QDate(2024, 6, 15)),
             QStringLiteral("timekeep_2024-06-01_2024-06-15.csv"));
}

QTEST_MAIN(ExportTests)
#include "test_export.moc"
