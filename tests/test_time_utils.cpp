#include <QtTest/QtTest>

#include <QDateTime>

#include "common/time_utils.hpp"

namespace {

timekeep::TimePoint localTime(const QDate &date, int hour, int minute, int second = 0)
{
    const QDateTime dt(date, QTime(hour, minute, second));
    return timekeep::TimePoint{std::chrono::seconds{dt.toSecsSinceEpoch()}};
}

} // namespace

class TimeUtilsTests : public QObject
{
    Q_OBJECT
private slots:
    void testFormatDuration();
    void testParseClock();
    void testClampInterval();
    void testLocalIsoRoundTrip();
    void testLocalIsoLenientForms();
    void testDayBoundaries();
};

void TimeUtilsTests::testFormatDuration()
{
    QCOMPARE(QString::fromStdString(timekeep::formatDuration(3661)), QStringLiteral("01:01:01"));
    QCOMPARE(QString::fromStdString(timekeep::formatDuration(-5)), QStringLiteral("-00:00:05"));
    QCOMPARE(QString::fromStdString(timekeep::formatDuration(0)), QStringLiteral("00:00:00"));
    QCOMPARE(QString::fromStdString(timekeep::formatDuration(59)), QStringLiteral("00:00:59"));
    QCOMPARE(QString::fromStdString(timekeep::formatDuration(360000)), QStringLiteral("100:00:00"));
    QCOMPARE(QString::fromStdString(timekeep::formatDuration(-3600 * 25 - 61)),
             QStringLiteral("-25:01:01"));
}

void TimeUtilsTests::testParseClock()
{
    QCOMPARE(timekeep::parseClock("9:30").value_or(-1), int64_t(34200));
    QCOMPARE(timekeep::parseClock("09:30").value_or(-1), int64_t(34200));
    QCOMPARE(timekeep::parseClock("1:02:03").value_or(-1), int64_t(3723));
    QCOMPARE(timekeep::parseClock(" 2:15 ").value_or(-1), int64_t(8100));
    QCOMPARE(timekeep::parseClock("120:00").value_or(-1), int64_t(432000));
    // Hours go through plain integer parsing, the sign is not applied to the rest.
    QCOMPARE(timekeep::parseClock("-1:30").value_or(0), int64_t(-1800));

    QVERIFY(!timekeep::parseClock("1:60").has_value());
    QVERIFY(!timekeep::parseClock("1:30:60").has_value());
    QVERIFY(!timekeep::parseClock("1:-1").has_value());
    QVERIFY(!timekeep::parseClock("bad").has_value());
    QVERIFY(!timekeep::parseClock("930").has_value());
    QVERIFY(!timekeep::parseClock("1:2:3:4").has_value());
    QVERIFY(!timekeep::parseClock("a:30").has_value());
    QVERIFY(!timekeep::parseClock("1:").has_value());
    QVERIFY(!timekeep::parseClock("").has_value());

    // Hour counts whose total would not fit in 64-bit seconds are rejected.
    QCOMPARE(timekeep::parseClock("2562047788015214:59:59").value_or(-1),
             int64_t(9223372036854773999LL));
    QVERIFY(!timekeep::parseClock("2562047788015215:00").has_value());
    QVERIFY(!timekeep::parseClock("9999999999999999:00").has_value());
    QVERIFY(!timekeep::parseClock("-9999999999999999:00").has_value());
}

void TimeUtilsTests::testClampInterval()
{
    const QDate today(2024, 6, 15);
    const QDate yesterday = today.addDays(-1);

    const auto windowStart = timekeep::startOfDay(today);
    const auto windowEnd = timekeep::endOfDay(today);

    const auto spanning = timekeep::clampInterval(localTime(yesterday, 23, 0),
                                                  localTime(today, 1, 0),
                                                  windowStart,
                                                  windowEnd);
    QVERIFY(spanning.start == windowStart);
    QCOMPARE(spanning.seconds(), int64_t(3600));

    const auto before = timekeep::clampInterval(localTime(yesterday, 10, 0),
                                                localTime(yesterday, 11, 0),
                                                windowStart,
                                                windowEnd);
    QVERIFY(before.end <= before.start);
    QCOMPARE(before.seconds(), int64_t(0));

    const auto inside = timekeep::clampInterval(localTime(today, 9, 0),
                                                localTime(today, 9, 45),
                                                windowStart,
                                                windowEnd);
    QCOMPARE(inside.seconds(), int64_t(45 * 60));
}

void TimeUtilsTests::testLocalIsoRoundTrip()
{
    const auto parsed = timekeep::fromLocalIso8601("2024-03-05T14:07:09");
    QVERIFY(parsed.has_value());
    QVERIFY(*parsed == localTime(QDate(2024, 3, 5), 14, 7, 9));
    QCOMPARE(QString::fromStdString(timekeep::toLocalIso8601(*parsed)),
             QStringLiteral("2024-03-05T14:07:09"));

    const auto withMillis = *parsed + std::chrono::milliseconds(750);
    QCOMPARE(QString::fromStdString(timekeep::toLocalIso8601(withMillis)),
             QStringLiteral("2024-03-05T14:07:09"));
}

void TimeUtilsTests::testLocalIsoLenientForms()
{
    const auto canonical = timekeep::fromLocalIso8601("2024-03-05T14:07:09");
    QVERIFY(canonical.has_value());

    const auto spaced = timekeep::fromLocalIso8601("2024-03-05 14:07:09");
    QVERIFY(spaced.has_value());
    QVERIFY(*spaced == *canonical);

    const auto fraction = timekeep::fromLocalIso8601("2024-03-05T14:07:09.123456");
    QVERIFY(fraction.has_value());
    QVERIFY(*fraction == *canonical);

    const auto minutes = timekeep::fromLocalIso8601("2024-03-05T14:07");
    QVERIFY(minutes.has_value());
    QVERIFY(*minutes == localTime(QDate(2024, 3, 5), 14, 7));

    const auto dateOnly = timekeep::fromLocalIso8601("2024-03-05");
    QVERIFY(dateOnly.has_value());
    QVERIFY(*dateOnly == timekeep::startOfDay(QDate(2024, 3, 5)));

    QVERIFY(!timekeep::fromLocalIso8601("").has_value());
    QVERIFY(!timekeep::fromLocalIso8601("yesterday").has_value());
    QVERIFY(!timekeep::fromLocalIso8601("2024-13-01T00:00:00").has_value());
    QVERIFY(!timekeep::fromLocalIso8601("2024-03-05T25:00:00").has_value());
    QVERIFY(!timekeep::fromLocalIso8601("2024-03-05T14:07:09.").has_value());
    QVERIFY(!timekeep::fromLocalIso8601("2024-03-05T14:07:09+02:00").has_value());
}

void TimeUtilsTests::testDayBoundaries()
{
    const QDate day(2024, 6, 15);
    QCOMPARE(QString::fromStdString(timekeep::toLocalIso8601(timekeep::startOfDay(day))),
             QStringLiteral("2024-06-15T00:00:00"));
    QCOMPARE(QString::fromStdString(timekeep::toLocalIso8601(timekeep::endOfDay(day))),
             QStringLiteral("2024-06-15T23:59:59"));
    QCOMPARE(timekeep::localDateOf(localTime(day, 23, 59, 59)), day);

    QVERIFY(timekeep::parseIsoDate("2024-06-15") == day);
    QVERIFY(!timekeep::parseIsoDate("2024-6-15").has_value());
    QVERIFY(!timekeep::parseIsoDate("2024-02-30").has_value());
}

QTEST_MAIN(TimeUtilsTests)
#include "test_time_utils.moc"
