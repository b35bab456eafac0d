#include "common/time_utils.hpp"

#include <algorithm>
#include <limits>

#include <QDateTime>
#include <QString>
#include <QStringList>
#include <QTime>

namespace timekeep {

namespace {

const QString kTimestampFormat = QStringLiteral("yyyy-MM-dd'T'HH:mm:ss");
const QString kMinuteTimestampFormat = QStringLiteral("yyyy-MM-dd'T'HH:mm");

// Largest hour count whose total still fits in int64 seconds.
constexpr int64_t kMaxClockHours = (std::numeric_limits<int64_t>::max() - 3599) / 3600;

TimePoint fromQDateTime(const QDateTime &value)
{
    return TimePoint{std::chrono::seconds{value.toSecsSinceEpoch()}};
}

QDateTime toQDateTime(TimePoint timestamp)
{
    const auto secs = std::chrono::duration_cast<std::chrono::seconds>(
                          truncateToSeconds(timestamp).time_since_epoch())
                          .count();
    return QDateTime::fromSecsSinceEpoch(secs);
}

std::optional<int64_t> parseClockField(const QString &field)
{
    const QString trimmed = field.trimmed();
    if (trimmed.isEmpty()) {
        return std::nullopt;
    }
    bool ok = false;
    const qlonglong value = trimmed.toLongLong(&ok);
    if (!ok) {
        return std::nullopt;
    }
    return static_cast<int64_t>(value);
}

} // namespace

int64_t Interval::seconds() const
{
    if (end <= start) {
        return 0;
    }
    return wholeSecondsBetween(start, end);
}

std::string formatDuration(int64_t seconds)
{
    const bool negative = seconds < 0;
    // Magnitude as unsigned so INT64_MIN does not overflow.
    const uint64_t magnitude = negative
        ? static_cast<uint64_t>(-(seconds + 1)) + 1
        : static_cast<uint64_t>(seconds);

    const uint64_t hours = magnitude / 3600;
    const uint64_t minutes = (magnitude % 3600) / 60;
    const uint64_t secs = magnitude % 60;

    const QString text = QStringLiteral("%1%2:%3:%4")
                             .arg(negative ? QStringLiteral("-") : QString())
                             .arg(static_cast<qulonglong>(hours), 2, 10, QLatin1Char('0'))
                             .arg(static_cast<qulonglong>(minutes), 2, 10, QLatin1Char('0'))
                             .arg(static_cast<qulonglong>(secs), 2, 10, QLatin1Char('0'));
    return text.toStdString();
}

std::optional<int64_t> parseClock(const std::string &text)
{
    const QStringList parts = QString::fromStdString(text).trimmed().split(QLatin1Char(':'));
    if (parts.size() != 2 && parts.size() != 3) {
        return std::nullopt;
    }

    const auto hours = parseClockField(parts.at(0));
    const auto minutes = parseClockField(parts.at(1));
    if (!hours || !minutes) {
        return std::nullopt;
    }

    int64_t secs = 0;
    if (parts.size() == 3) {
        const auto parsed = parseClockField(parts.at(2));
        if (!parsed) {
            return std::nullopt;
        }
        secs = *parsed;
    }

    if (*minutes < 0 || *minutes >= 60 || secs < 0 || secs >= 60) {
        return std::nullopt;
    }
    if (*hours > kMaxClockHours || *hours < -kMaxClockHours) {
        return std::nullopt;
    }
    return *hours * 3600 + *minutes * 60 + secs;
}

Interval clampInterval(TimePoint start,
                       TimePoint end,
                       TimePoint windowStart,
                       TimePoint windowEnd)
{
    return Interval{std::max(start, windowStart), std::min(end, windowEnd)};
}

int64_t wholeSecondsBetween(TimePoint from, TimePoint to)
{
    return std::chrono::duration_cast<std::chrono::seconds>(to - from).count();
}

TimePoint truncateToSeconds(TimePoint timestamp)
{
    return std::chrono::floor<std::chrono::seconds>(timestamp);
}

std::string toLocalIso8601(TimePoint timestamp)
{
    return toQDateTime(timestamp).toString(kTimestampFormat).toStdString();
}

std::optional<TimePoint> fromLocalIso8601(const std::string &value)
{
    QString text = QString::fromStdString(value).trimmed();
    if (text.size() == 10) {
        const auto date = parseIsoDate(text.toStdString());
        if (!date) {
            return std::nullopt;
        }
        return startOfDay(*date);
    }

    if (text.size() > 10 && text.at(10) == QLatin1Char(' ')) {
        text[10] = QLatin1Char('T');
    }

    const int fraction = text.indexOf(QLatin1Char('.'), 10);
    if (fraction == 19) {
        const QString digits = text.mid(20);
        if (digits.isEmpty()) {
            return std::nullopt;
        }
        for (const QChar ch : digits) {
            if (!ch.isDigit()) {
                return std::nullopt;
            }
        }
        text.truncate(19);
    }

    QDateTime parsed;
    if (text.size() == 19) {
        parsed = QDateTime::fromString(text, kTimestampFormat);
    } else if (text.size() == 16) {
        parsed = QDateTime::fromString(text, kMinuteTimestampFormat);
    }
    if (!parsed.isValid()) {
        return std::nullopt;
    }
    return fromQDateTime(parsed);
}

std::optional<QDate> parseIsoDate(const std::string &value)
{
    const QString text = QString::fromStdString(value).trimmed();
    if (text.size() != 10) {
        return std::nullopt;
    }
    const QDate date = QDate::fromString(text, QStringLiteral("yyyy-MM-dd"));
    if (!date.isValid()) {
        return std::nullopt;
    }
    return date;
}

TimePoint startOfDay(const QDate &date)
{
    return fromQDateTime(QDateTime(date, QTime(0, 0, 0)));
}

TimePoint endOfDay(const QDate &date)
{
    return fromQDateTime(QDateTime(date, QTime(23, 59, 59)));
}

QDate localDateOf(TimePoint timestamp)
{
    return toQDateTime(timestamp).date();
}

} // namespace timekeep
