#include "cli/TimekeepCli.hpp"

#include <iostream>
#include <optional>

#include <QDir>
#include <QFileInfo>

#include <nlohmann/json.hpp>

#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "common/time_utils.hpp"
#include "common/timekeep_version.hpp"
#include "query/csv_export.hpp"
#include "query/query_engine.hpp"
#include "session/SessionController.hpp"
#include "store/timekeep_store.hpp"

namespace timekeep {

namespace {

const QString kAnyProject = QStringLiteral("(any)");

QString usageText()
{
    return QStringLiteral(
        "Usage:\n"
        "  timekeep start --project NAME [--task TEXT] [--notes TEXT]\n"
        "  timekeep stop [--id N]\n"
        "  timekeep status\n"
        "  timekeep today\n"
        "  timekeep list [--from YYYY-MM-DD] [--to YYYY-MM-DD] [--project NAME] "
        "[--format table|json]\n"
        "  timekeep edit --id N [--project NAME] [--task TEXT] [--notes TEXT] "
        "[--start TS] [--end TS]\n"
        "  timekeep delete --id N\n"
        "  timekeep export [--from YYYY-MM-DD] [--to YYYY-MM-DD] [--project NAME] "
        "[--out PATH]\n"
        "  timekeep projects\n"
        "  timekeep check\n"
        "  timekeep --version\n"
        "Global options: --db PATH\n");
}

QString getArgValue(const QStringList &args, const QString &key)
{
    const int idx = args.indexOf(key);
    if (idx < 0 || idx + 1 >= args.size()) {
        return {};
    }
    return args.at(idx + 1);
}

std::optional<QString> getOptionalArg(const QStringList &args, const QString &key)
{
    const int idx = args.indexOf(key);
    if (idx < 0) {
        return std::nullopt;
    }
    if (idx + 1 >= args.size()) {
        return QString();
    }
    return args.at(idx + 1);
}

std::optional<EntryId> parseEntryId(const QString &value)
{
    bool ok = false;
    const qlonglong id = value.toLongLong(&ok);
    if (!ok || id <= 0) {
        return std::nullopt;
    }
    return static_cast<EntryId>(id);
}

// --from/--to default to the first of the month and today.
void resolveRange(const QStringList &args, const QDate &today, QDate *from, QDate *to)
{
    const auto defaults = defaultFilterRange(today);
    const QString fromValue = getArgValue(args, QStringLiteral("--from"));
    const QString toValue = getArgValue(args, QStringLiteral("--to"));

    *from = defaults.first;
    *to = defaults.second;
    if (!fromValue.isEmpty()) {
        *from = parseIsoDate(fromValue.toStdString()).value_or(QDate());
    }
    if (!toValue.isEmpty()) {
        *to = parseIsoDate(toValue.toStdString()).value_or(QDate());
    }
}

std::optional<std::string> projectFilter(const QStringList &args)
{
    const QString value = getArgValue(args, QStringLiteral("--project")).trimmed();
    if (value.isEmpty() || value == kAnyProject) {
        return std::nullopt;
    }
    return value.toStdString();
}

std::string endText(const TimeEntry &entry)
{
    return entry.end ? toLocalIso8601(*entry.end) : std::string();
}

void renderTable(const std::vector<TimeEntry> &entries, const QueryEngine &engine)
{
    const auto cell = [](const std::string &value, int width) {
        return QString::fromStdString(value).leftJustified(width, QLatin1Char(' '), true)
            .toStdString();
    };

    std::cout << cell("ID", 6) << " " << cell("Project", 16) << " "
              << cell("Task", 24) << " " << cell("Notes", 20) << " "
              << cell("Start", 19) << " " << cell("End", 19) << " "
              << "Duration" << "\n";

    for (const TimeEntry &entry : entries) {
        std::cout << cell(std::to_string(entry.id), 6) << " "
                  << cell(entry.project, 16) << " "
                  << cell(entry.task, 24) << " "
                  << cell(entry.notes, 20) << " "
                  << cell(toLocalIso8601(entry.start), 19) << " "
                  << cell(endText(entry), 19) << " "
                  << formatDuration(engine.elapsedSeconds(entry)) << "\n";
    }
}

} // namespace

int TimekeepCli::run(int argc, char *argv[])
{
    // CLI entry: parse the subcommand and delegate to its handler.
    QStringList args;
    args.reserve(argc);
    for (int i = 0; i < argc; ++i) {
        args.push_back(QString::fromLocal8Bit(argv[i]));
    }

    if (args.size() < 2) {
        std::cerr << usageText().toStdString();
        return 1;
    }

    const QString command = args.at(1);
    if (command == QStringLiteral("--version")) {
        std::cout << "timekeep " << TIMEKEEP_VERSION << std::endl;
        return 0;
    }

    // Every log line written while this command runs shares one corr id.
    logging::CorrelationScope corrScope(logging::newCorrelationId());

    TIMEKEEP_LOG_INFO(QStringLiteral("TimekeepCli"),
                      QStringLiteral("run"),
                      QStringLiteral("cli_command"),
                      QStringLiteral("user_invocation"),
                      QStringLiteral("cli"),
                      logging::defaultWho(),
                      corrScope.id(),
                      (nlohmann::json{{"command", command.toStdString()}}));

    try {
        if (command == QStringLiteral("start")) {
            return runStart(args);
        }
        if (command == QStringLiteral("stop")) {
            return runStop(args);
        }
        if (command == QStringLiteral("status")) {
            return runStatus(args);
        }
        if (command == QStringLiteral("today")) {
            return runToday(args);
        }
        if (command == QStringLiteral("list")) {
            return runList(args);
        }
        if (command == QStringLiteral("edit")) {
            return runEdit(args);
        }
        if (command == QStringLiteral("delete")) {
            return runDelete(args);
        }
        if (command == QStringLiteral("export")) {
            return runExport(args);
        }
        if (command == QStringLiteral("projects")) {
            return runProjects(args);
        }
        if (command == QStringLiteral("check")) {
            return runCheck(args);
        }
    } catch (const ValidationError &ex) {
        std::cerr << ex.what() << std::endl;
        return 1;
    } catch (const StorageError &ex) {
        TIMEKEEP_LOG_ERROR(QStringLiteral("TimekeepCli"),
                           QStringLiteral("run"),
                           QStringLiteral("storage_failure"),
                           QStringLiteral("io_error"),
                           QStringLiteral("sqlite_or_file"),
                           logging::defaultWho(),
                           corrScope.id(),
                           (nlohmann::json{{"command", command.toStdString()},
                                           {"error", ex.what()}}));
        std::cerr << "Storage error: " << ex.what() << std::endl;
        return 2;
    }

    std::cerr << usageText().toStdString();
    return 1;
}

std::unique_ptr<TimekeepStore> TimekeepCli::openStore(const QStringList &args) const
{
    const QString dbPath = getArgValue(args, QStringLiteral("--db"));
    if (dbPath.isEmpty()) {
        return std::make_unique<TimekeepStore>();
    }
    return std::make_unique<TimekeepStore>(dbPath.toStdString());
}

int TimekeepCli::runStart(const QStringList &args)
{
    const QString project = getArgValue(args, QStringLiteral("--project")).trimmed();
    if (project.isEmpty()) {
        std::cerr << "Please enter a project name." << std::endl;
        return 1;
    }

    auto store = openStore(args);
    SessionController session(*store);
    const std::optional<EntryId> previous = session.runningEntryId();
    const EntryId id = session.start(project.toStdString(),
                                     getArgValue(args, QStringLiteral("--task")).toStdString(),
                                     getArgValue(args, QStringLiteral("--notes")).toStdString());

    if (previous) {
        std::cout << "Stopped entry " << *previous << "." << std::endl;
    }
    const auto running = session.runningEntry();
    std::cout << "Started entry " << id << ": " << project.toStdString();
    if (running) {
        std::cout << " / " << running->task;
    }
    std::cout << std::endl;
    return 0;
}

int TimekeepCli::runStop(const QStringList &args)
{
    auto store = openStore(args);
    SessionController session(*store);

    const QString idValue = getArgValue(args, QStringLiteral("--id"));
    std::optional<EntryId> id = session.runningEntryId();
    if (!idValue.isEmpty()) {
        id = parseEntryId(idValue);
        if (!id) {
            std::cerr << "Invalid entry id." << std::endl;
            return 1;
        }
    }

    if (!id) {
        std::cout << "Nothing is running." << std::endl;
        return 0;
    }

    session.stop(*id);
    const auto entry = store->getEntry(*id);
    if (entry && entry->end) {
        std::cout << "Stopped entry " << *id << " ("
                  << formatDuration(effectiveDuration(*entry)) << ")." << std::endl;
    } else {
        std::cout << "Entry " << *id << " is not running." << std::endl;
    }
    return 0;
}

int TimekeepCli::runStatus(const QStringList &args)
{
    auto store = openStore(args);
    QueryEngine engine(*store);
    SessionController session(*store);

    const auto running = session.runningEntry();
    if (running) {
        std::cout << "Running: " << running->project << " - " << running->task
                  << " (" << formatDuration(engine.elapsedSeconds(*running)) << ")"
                  << std::endl;
    } else {
        std::cout << "Not running" << std::endl;
    }
    std::cout << "Today: " << formatDuration(engine.sumToday()) << std::endl;
    return 0;
}

int TimekeepCli::runToday(const QStringList &args)
{
    auto store = openStore(args);
    QueryEngine engine(*store);
    std::cout << "Today: " << formatDuration(engine.sumToday()) << std::endl;
    return 0;
}

int TimekeepCli::runList(const QStringList &args)
{
    const QString format = getArgValue(args, QStringLiteral("--format")).isEmpty()
        ? QStringLiteral("table")
        : getArgValue(args, QStringLiteral("--format")).toLower();
    if (format != QStringLiteral("table") && format != QStringLiteral("json")) {
        std::cerr << "Invalid format. Use table or json." << std::endl;
        return 1;
    }

    auto store = openStore(args);
    QueryEngine engine(*store);

    QDate from;
    QDate to;
    resolveRange(args, engine.today(), &from, &to);
    const auto project = projectFilter(args);
    const auto entries = engine.queryEntries(from, to, project);

    TIMEKEEP_LOG_INFO(QStringLiteral("TimekeepCli"),
                      QStringLiteral("runList"),
                      QStringLiteral("list_entries"),
                      QStringLiteral("user_invocation"),
                      QStringLiteral("sqlite_query"),
                      logging::defaultWho(),
                      QString(),
                      (nlohmann::json{{"entries", entries.size()},
                                      {"format", format.toStdString()}}));

    if (format == QStringLiteral("json")) {
        int64_t total = 0;
        for (const TimeEntry &entry : entries) {
            total += engine.elapsedSeconds(entry);
        }
        nlohmann::json payload;
        payload["from"] = from.toString(Qt::ISODate).toStdString();
        payload["to"] = to.toString(Qt::ISODate).toStdString();
        payload["project"] = project ? nlohmann::json(*project) : nlohmann::json();
        payload["totalSeconds"] = total;
        payload["entries"] = entries;
        std::cout << payload.dump(2) << std::endl;
        return 0;
    }

    renderTable(entries, engine);
    return 0;
}

int TimekeepCli::runEdit(const QStringList &args)
{
    const auto id = parseEntryId(getArgValue(args, QStringLiteral("--id")));
    if (!id) {
        std::cerr << usageText().toStdString();
        return 1;
    }

    auto store = openStore(args);
    const auto existing = store->getEntry(*id);
    if (!existing) {
        std::cerr << "Entry " << *id << " not found." << std::endl;
        return 1;
    }

    // Omitted options keep the stored value, like a pre-filled edit form.
    const auto project = getOptionalArg(args, QStringLiteral("--project"));
    const auto task = getOptionalArg(args, QStringLiteral("--task"));
    const auto notes = getOptionalArg(args, QStringLiteral("--notes"));
    const auto start = getOptionalArg(args, QStringLiteral("--start"));
    const auto end = getOptionalArg(args, QStringLiteral("--end"));

    std::optional<std::string> endValue;
    if (end) {
        endValue = end->toStdString();
    } else if (existing->end) {
        endValue = toLocalIso8601(*existing->end);
    }

    store->updateEntry(*id,
                       project ? project->toStdString() : existing->project,
                       task ? task->toStdString() : existing->task,
                       notes ? notes->toStdString() : existing->notes,
                       start ? start->toStdString() : toLocalIso8601(existing->start),
                       endValue);

    const auto updated = store->getEntry(*id);
    std::cout << "Updated entry " << *id;
    if (updated && updated->end) {
        std::cout << " (" << formatDuration(effectiveDuration(*updated)) << ")";
    }
    std::cout << "." << std::endl;
    return 0;
}

int TimekeepCli::runDelete(const QStringList &args)
{
    const auto id = parseEntryId(getArgValue(args, QStringLiteral("--id")));
    if (!id) {
        std::cerr << usageText().toStdString();
        return 1;
    }

    auto store = openStore(args);
    store->deleteEntry(*id);
    std::cout << "Deleted entry " << *id << "." << std::endl;
    return 0;
}

int TimekeepCli::runExport(const QStringList &args)
{
    auto store = openStore(args);
    QueryEngine engine(*store);

    QDate from;
    QDate to;
    resolveRange(args, engine.today(), &from, &to);
    const auto entries = engine.queryEntries(from, to, projectFilter(args));
    if (entries.empty()) {
        std::cout << "Nothing to export." << std::endl;
        return 0;
    }

    QString outPath = getArgValue(args, QStringLiteral("--out"));
    if (outPath.isEmpty()) {
        outPath = QDir::current().filePath(defaultExportFileName(from, to));
    }

    exportRows(entries, outPath);

    TIMEKEEP_LOG_INFO(QStringLiteral("TimekeepCli"),
                      QStringLiteral("runExport"),
                      QStringLiteral("export_csv"),
                      QStringLiteral("user_invocation"),
                      QStringLiteral("csv_file"),
                      logging::defaultWho(),
                      QString(),
                      (nlohmann::json{{"entries", entries.size()},
                                      {"out", outPath.toStdString()}}));
    std::cout << "Saved to " << QFileInfo(outPath).absoluteFilePath().toStdString()
              << std::endl;
    return 0;
}

int TimekeepCli::runProjects(const QStringList &args)
{
    auto store = openStore(args);
    for (const std::string &name : store->listProjectNames()) {
        std::cout << name << "\n";
    }
    std::cout.flush();
    return 0;
}

int TimekeepCli::runCheck(const QStringList &args)
{
    auto store = openStore(args);
    std::string message;
    if (!store->integrityCheck(&message)) {
        std::cerr << "Integrity check failed: " << message << std::endl;
        return 2;
    }
    std::cout << "Database OK." << std::endl;
    return 0;
}

} // namespace timekeep
