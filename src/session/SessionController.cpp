#include "session/SessionController.hpp"

#include <nlohmann/json.hpp>

#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "store/timekeep_store.hpp"

namespace timekeep {

SessionController::SessionController(TimekeepStore &store, QObject *parent)
    : QObject(parent)
    , m_store(store)
{
    refresh();
}

bool SessionController::isRunning() const
{
    return m_running.has_value();
}

std::optional<EntryId> SessionController::runningEntryId() const
{
    if (!m_running) {
        return std::nullopt;
    }
    return m_running->id;
}

std::optional<TimeEntry> SessionController::runningEntry() const
{
    return m_running;
}

EntryId SessionController::start(const std::string &project,
                                 const std::string &task,
                                 const std::string &notes)
{
    const EntryId id = m_store.startEntry(project, task, notes);
    refresh();
    return id;
}

void SessionController::stop()
{
    if (!m_running) {
        refresh();
    }
    if (!m_running) {
        return;
    }
    stop(m_running->id);
}

void SessionController::stop(EntryId id)
{
    m_store.stopEntry(id);
    refresh();
}

void SessionController::refresh()
{
    const std::optional<EntryId> previous = runningEntryId();
    m_running = m_store.getRunningEntry();
    if (runningEntryId() != previous) {
        emit runningChanged();
    }
}

bool SessionController::startFromUi(const QString &project,
                                    const QString &task,
                                    const QString &notes)
{
    logging::CorrelationScope corrScope;
    EntryId id = 0;
    try {
        id = start(project.toStdString(), task.toStdString(), notes.toStdString());
    } catch (const ValidationError &ex) {
        TIMEKEEP_LOG_WARN(QStringLiteral("SessionController"),
                          QStringLiteral("startFromUi"),
                          QStringLiteral("start_rejected"),
                          QStringLiteral("validation_error"),
                          QStringLiteral("user_input"),
                          logging::defaultWho(),
                          corrScope.id(),
                          (nlohmann::json{{"error", ex.what()}}));
        return false;
    }
    TIMEKEEP_LOG_INFO(QStringLiteral("SessionController"),
                      QStringLiteral("startFromUi"),
                      QStringLiteral("start_timer"),
                      QStringLiteral("user_action"),
                      QStringLiteral("store_start_entry"),
                      logging::defaultWho(),
                      corrScope.id(),
                      (m_running ? entryLogContext(*m_running) : nlohmann::json{{"id", id}}));
    return true;
}

void SessionController::stopFromUi()
{
    refresh();
    const std::optional<EntryId> stopped = runningEntryId();
    stop();
    TIMEKEEP_LOG_INFO(QStringLiteral("SessionController"),
                      QStringLiteral("stopFromUi"),
                      QStringLiteral("stop_timer"),
                      QStringLiteral("user_action"),
                      QStringLiteral("store_stop_entry"),
                      logging::defaultWho(),
                      QString(),
                      (nlohmann::json{{"entryId", stopped.value_or(0)}}));
}

} // namespace timekeep
