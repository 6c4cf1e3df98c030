#include "common/logging.hpp"

#include <QCoreApplication>
#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QUuid>

#include <unistd.h>

#include <cstdio>
#include <mutex>

namespace snapfreeze::logging {

namespace {

constexpr qint64 kRotateAtBytes = 5 * 1024 * 1024;

struct PendingWrite {
    QString path;
    QByteArray line;
};

struct SinkState {
    std::mutex mutex;
    QString processName;
    bool trace = false;
    bool held = false;
    std::vector<PendingWrite> pending;
    std::vector<QByteArray> frozenRoots;
};

SinkState &sink()
{
    static SinkState state;
    return state;
}

thread_local QString t_corrId;

const char *levelName(LogLevel level)
{
    switch (level) {
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Warn:
        return "WARN";
    case LogLevel::Error:
        return "ERROR";
    }
    return "INFO";
}

QString fileFor(const QString &processName, const char *suffix)
{
    return logsDirPath() + QLatin1Char('/')
        + (processName.isEmpty() ? QStringLiteral("snapfreeze") : processName)
        + QLatin1String(suffix);
}

bool liesUnder(const QByteArray &path, const QByteArray &mountPoint)
{
    if (mountPoint.isEmpty()) {
        return false;
    }
    if (mountPoint.endsWith('/')) {
        return path.startsWith(mountPoint);
    }
    return path == mountPoint || path.startsWith(mountPoint + '/');
}

// Caller holds the sink mutex.
bool logDirFrozen(const SinkState &state)
{
    if (state.frozenRoots.empty()) {
        return false;
    }
    const QByteArray dir = QFile::encodeName(QDir::cleanPath(QDir(logsDirPath()).absolutePath()));
    for (const auto &root : state.frozenRoots) {
        if (liesUnder(dir, root)) {
            return true;
        }
    }
    return false;
}

void toStderr(const QByteArray &line)
{
    std::fprintf(stderr, "%s\n", line.constData());
}

void appendToFile(const QString &path, const QByteArray &line)
{
    QDir().mkpath(QFileInfo(path).absolutePath());

    const QFileInfo existing(path);
    if (existing.exists() && existing.size() >= kRotateAtBytes) {
        const QString previous = path + QStringLiteral(".1");
        QFile::remove(previous);
        QFile::rename(path, previous);
    }

    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Append)) {
        toStderr(line);
        return;
    }
    file.write(line + '\n');
}

// Caller holds the sink mutex.
void route(SinkState &state, const QString &path, const QByteArray &line)
{
    if (state.held) {
        state.pending.push_back({path, line});
    } else if (logDirFrozen(state)) {
        toStderr(line);
    } else {
        appendToFile(path, line);
    }
}

} // namespace

void initLogging(const QString &processName, bool traceEnabled)
{
    auto &state = sink();
    std::lock_guard<std::mutex> lock(state.mutex);
    state.processName = processName;
    state.trace = traceEnabled;
}

bool isTraceEnabled()
{
    auto &state = sink();
    std::lock_guard<std::mutex> lock(state.mutex);
    return state.trace;
}

QString logsDirPath()
{
    const QString configured = qEnvironmentVariable("SNAPFREEZE_LOG_DIR");
    if (!configured.isEmpty()) {
        return configured;
    }
    const QString home = qEnvironmentVariable("HOME");
    return home.isEmpty()
        ? QStringLiteral(".local/share/snapfreeze/logs")
        : home + QStringLiteral("/.local/share/snapfreeze/logs");
}

void holdFileOutput()
{
    auto &state = sink();
    std::lock_guard<std::mutex> lock(state.mutex);
    state.held = true;
}

void releaseFileOutput(const std::vector<std::string> &stillFrozen)
{
    auto &state = sink();
    std::lock_guard<std::mutex> lock(state.mutex);

    state.held = false;
    state.frozenRoots.clear();
    for (const auto &mountPoint : stillFrozen) {
        state.frozenRoots.push_back(QByteArray::fromStdString(mountPoint));
    }

    std::vector<PendingWrite> pending;
    pending.swap(state.pending);
    for (const auto &write : pending) {
        route(state, write.path, write.line);
    }
}

bool isFileOutputHeld()
{
    auto &state = sink();
    std::lock_guard<std::mutex> lock(state.mutex);
    return state.held;
}

std::size_t heldEventCount()
{
    auto &state = sink();
    std::lock_guard<std::mutex> lock(state.mutex);
    return state.pending.size();
}

void setCorrelationId(const QString &corrId)
{
    t_corrId = corrId;
}

QString currentCorrelationId()
{
    return t_corrId;
}

QString newCorrelationId()
{
    const QString uuid = QUuid::createUuid().toString(QUuid::WithoutBraces);
    return QStringLiteral("run-") + uuid.left(8);
}

CorrelationScope::CorrelationScope(const QString &corrId)
    : m_prev(t_corrId)
{
    t_corrId = corrId;
}

CorrelationScope::~CorrelationScope()
{
    t_corrId = m_prev;
}

QString defaultProcessName()
{
    {
        auto &state = sink();
        std::lock_guard<std::mutex> lock(state.mutex);
        if (!state.processName.isEmpty()) {
            return state.processName;
        }
    }
    if (QCoreApplication::instance() && !QCoreApplication::applicationName().isEmpty()) {
        return QCoreApplication::applicationName();
    }
    return QStringLiteral("snapfreeze");
}

QString defaultWho()
{
    char host[256] = {};
    if (gethostname(host, sizeof(host) - 1) != 0) {
        host[0] = '\0';
    }
    return QStringLiteral("host:%1,uid:%2")
        .arg(QString::fromLocal8Bit(host))
        .arg(static_cast<qulonglong>(getuid()));
}

void logEvent(LogLevel level,
              const QString &processName,
              const QString &component,
              const QString &where,
              const QString &what,
              const QString &why,
              const QString &how,
              const QString &who,
              const QString &correlationId,
              const nlohmann::json &context)
{
    nlohmann::json event;
    event["ts"] = QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs).toStdString();
    event["level"] = levelName(level);
    event["process"] = processName.toStdString();
    event["pid"] = static_cast<long long>(getpid());
    event["component"] = component.toStdString();
    event["where"] = where.toStdString();
    event["what"] = what.toStdString();
    event["why"] = why.toStdString();
    event["how"] = how.toStdString();
    event["who"] = who.toStdString();
    event["corr"] = (correlationId.isEmpty() ? currentCorrelationId() : correlationId).toStdString();
    event["context"] = context;

    // Mount points are raw bytes and need not be valid UTF-8.
    const QByteArray line = QByteArray::fromStdString(
        event.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));

    const QString process = processName.isEmpty() ? defaultProcessName() : processName;

    auto &state = sink();
    std::lock_guard<std::mutex> lock(state.mutex);
    if (level != LogLevel::Debug || state.trace) {
        route(state, fileFor(process, ".log"), line);
    }
    if (state.trace) {
        route(state, fileFor(process, "-trace.log"), line);
    }
}

} // namespace snapfreeze::logging
