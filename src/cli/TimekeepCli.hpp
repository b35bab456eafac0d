#pragma once

#include <memory>

#include <QString>
#include <QStringList>

namespace timekeep {

class TimekeepStore;

class TimekeepCli
{
public:
    // CLI dispatcher for the timer, history and export commands.
    // returns exit code: 0 ok, 1 usage or validation error, 2 storage error
    int run(int argc, char *argv[]);

private:
    // Each subcommand opens the store, performs one operation and renders text.
    int runStart(const QStringList &args);
    int runStop(const QStringList &args);
    int runStatus(const QStringList &args);
    int runToday(const QStringList &args);
    int runList(const QStringList &args);
    int runEdit(const QStringList &args);
    int runDelete(const QStringList &args);
    int runExport(const QStringList &args);
    int runProjects(const QStringList &args);
    int runCheck(const QStringList &args);

    std::unique_ptr<TimekeepStore> openStore(const QStringList &args) const;
};

} // namespace timekeep
