#include <QtTest/QtTest>

#include <QDateTime>

#include <nlohmann/json.hpp>

#include "common/json_utils.hpp"

class ModelsJsonTests : public QObject
{
    Q_OBJECT
private slots:
    void testClosedEntryToJson();
    void testOpenEntryToJson();
    void testEntryListToJson();
    void testEntryLogContext();

private:
    static timekeep::TimeEntry sampleEntry()
    {
        const QDateTime start(QDate(2024, 6, 15), QTime(9, 30, 0));
        timekeep::TimeEntry entry;
        entry.id = 3;
        entry.projectId = 1;
        entry.project = "Alpha";
        entry.task = "Write";
        entry.notes = "draft";
        entry.start = timekeep::TimePoint{std::chrono::seconds{start.toSecsSinceEpoch()}};
        return entry;
    }
};

void ModelsJsonTests::testClosedEntryToJson()
{
    timekeep::TimeEntry entry = sampleEntry();
    entry.end = entry.start + std::chrono::seconds(3600);
    entry.durationSeconds = 3600;

    const nlohmann::json j = entry;
    QCOMPARE(j.value("id", int64_t(0)), int64_t(3));
    QCOMPARE(j.value("projectId", int64_t(0)), int64_t(1));
    QCOMPARE(QString::fromStdString(j.value("project", "")), QStringLiteral("Alpha"));
    QCOMPARE(QString::fromStdString(j.value("task", "")), QStringLiteral("Write"));
    QCOMPARE(QString::fromStdString(j.value("notes", "")), QStringLiteral("draft"));
    QCOMPARE(QString::fromStdString(j.value("start", "")), QStringLiteral("2024-06-15T09:30:00"));
    QCOMPARE(QString::fromStdString(j.value("end", "")), QStringLiteral("2024-06-15T10:30:00"));
    QCOMPARE(j.value("durationSeconds", int64_t(0)), int64_t(3600));
}

void ModelsJsonTests::testOpenEntryToJson()
{
    const nlohmann::json j = sampleEntry();
    QVERIFY(j.contains("end"));
    QVERIFY(j["end"].is_null());
    QVERIFY(j.contains("durationSeconds"));
    QVERIFY(j["durationSeconds"].is_null());
}

void ModelsJsonTests::testEntryListToJson()
{
    timekeep::TimeEntry second = sampleEntry();
    second.id = 4;
    const std::vector<timekeep::TimeEntry> entries = {sampleEntry(), second};

    const nlohmann::json j = entries;
    QVERIFY(j.is_array());
    QCOMPARE(j.size(), static_cast<size_t>(2));
    QCOMPARE(j[1].value("id", int64_t(0)), int64_t(4));
}

void ModelsJsonTests::testEntryLogContext()
{
    const nlohmann::json ctx = timekeep::entryLogContext(sampleEntry());
    QCOMPARE(ctx.value("id", int64_t(0)), int64_t(3));
    QCOMPARE(QString::fromStdString(ctx.value("project", "")), QStringLiteral("Alpha"));
    QVERIFY(ctx.value("open", false));
    QVERIFY(!ctx.contains("notes"));
}

QTEST_MAIN(ModelsJsonTests)
#include "test_models_and_json.moc"
