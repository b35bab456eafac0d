#pragma once

#include <optional>
#include <string>

#include <QObject>
#include <QString>

#include "common/models.hpp"

namespace timekeep {

class TimekeepStore;

// Front door for starting and stopping timers. Starting always goes through
// TimekeepStore::startEntry, so a running entry is closed, never rejected.
// The running-entry view is re-read from the store after every mutation.
class SessionController : public QObject
{
    Q_OBJECT
    Q_PROPERTY(bool running READ isRunning NOTIFY runningChanged)
public:
    explicit SessionController(TimekeepStore &store, QObject *parent = nullptr);

    bool isRunning() const;
    std::optional<EntryId> runningEntryId() const;
    std::optional<TimeEntry> runningEntry() const;

    EntryId start(const std::string &project,
                  const std::string &task,
                  const std::string &notes);

    // Stops the tracked running entry; no-op when nothing runs.
    void stop();
    void stop(EntryId id);

    Q_INVOKABLE void refresh();
    Q_INVOKABLE bool startFromUi(const QString &project,
                                 const QString &task,
                                 const QString &notes);
    Q_INVOKABLE void stopFromUi();

signals:
    void runningChanged();

private:
    TimekeepStore &m_store;
    std::optional<TimeEntry> m_running;
};

} // namespace timekeep
