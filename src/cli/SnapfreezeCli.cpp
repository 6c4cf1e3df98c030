#include "cli/SnapfreezeCli.hpp"

#include <iostream>
#include <memory>

#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QCoreApplication>

#include <nlohmann/json.hpp>

#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "common/process_utils.hpp"
#include "common/snapfreeze_version.hpp"
#include "core/critical_section.hpp"
#include "core/freeze_controller.hpp"
#include "core/mount_table.hpp"
#include "core/run_lock.hpp"
#include "provider/aws_cli_snapshot_api.hpp"
#include "provider/instance_context.hpp"
#include "provider/tag_spec.hpp"

namespace snapfreeze {

namespace {

void renderResultLines(const RunReport &report, std::ostream &out)
{
    for (const auto &result : report.results) {
        if (result.success) {
            out << "  " << result.volumeId << " -> " << result.snapshotId << "\n";
        } else {
            out << "  " << result.volumeId << " FAILED: " << result.errorDetail << "\n";
        }
    }
}

std::string targetList(const std::vector<MountTarget> &targets)
{
    if (targets.empty()) {
        return "none";
    }
    std::string text;
    for (const auto &target : targets) {
        if (!text.empty()) {
            text += ", ";
        }
        text += target.mountPoint + " (" + toKindString(target.kind) + ")";
    }
    return text;
}

} // namespace

RunConfig SnapfreezeCli::parseConfig(const QStringList &arguments)
{
    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral(
        "Freeze writable filesystems, snapshot every attached volume, unfreeze."));
    const QCommandLineOption helpOption = parser.addHelpOption();
    const QCommandLineOption versionOption = parser.addVersionOption();

    QCommandLineOption descriptionOption(QStringList() << "description",
                                         "Snapshot description.", "text");
    QCommandLineOption tagsOption(QStringList() << "tags",
                                  "Snapshot tags as name=value;name2=value2.", "tags");
    QCommandLineOption formatOption(QStringList() << "format",
                                    "Report format: text or json.", "format",
                                    QStringLiteral("text"));
    QCommandLineOption awsCliOption(QStringList() << "aws-cli",
                                    "Path of the aws command line client.", "path");
    QCommandLineOption metadataOption(QStringList() << "metadata-url",
                                      "Instance metadata service base URL.", "url");
    QCommandLineOption timeoutOption(QStringList() << "command-timeout",
                                     "Timeout for each provider call, in seconds.",
                                     "seconds", QStringLiteral("60"));
    QCommandLineOption lockOption(QStringList() << "lock-file",
                                  "Single-instance lock file.", "path");
    QCommandLineOption mountTableOption(QStringList() << "mount-table",
                                        "Mount table to enumerate.", "path",
                                        QString::fromLatin1(kDefaultMountTablePath));
    QCommandLineOption traceOption(QStringList() << "trace",
                                   "Enable verbose trace logging.");

    parser.addOption(descriptionOption);
    parser.addOption(tagsOption);
    parser.addOption(formatOption);
    parser.addOption(awsCliOption);
    parser.addOption(metadataOption);
    parser.addOption(timeoutOption);
    parser.addOption(lockOption);
    parser.addOption(mountTableOption);
    parser.addOption(traceOption);

    if (!parser.parse(arguments)) {
        throw ConfigError(parser.errorText().toStdString());
    }

    RunConfig config;
    config.helpText = parser.helpText();
    if (parser.isSet(helpOption)) {
        config.showHelp = true;
        return config;
    }
    if (parser.isSet(versionOption)) {
        config.showVersion = true;
        return config;
    }
    if (!parser.positionalArguments().isEmpty()) {
        throw ConfigError("unexpected argument '"
                          + parser.positionalArguments().first().toStdString() + "'");
    }

    config.description = parser.value(descriptionOption).toStdString();
    config.tags = parseTags(parser.value(tagsOption).toStdString());

    config.format = parser.value(formatOption).toLower();
    if (config.format != QStringLiteral("text") && config.format != QStringLiteral("json")) {
        throw ConfigError("unknown format '" + config.format.toStdString() + "'");
    }

    const QString envAwsCli = qEnvironmentVariable("SNAPFREEZE_AWS_CLI");
    if (parser.isSet(awsCliOption)) {
        config.awsCli = parser.value(awsCliOption);
    } else if (!envAwsCli.isEmpty()) {
        config.awsCli = envAwsCli;
    }

    const QString envMetadata = qEnvironmentVariable("SNAPFREEZE_METADATA_URL");
    if (parser.isSet(metadataOption)) {
        config.metadataUrl = parser.value(metadataOption);
    } else if (!envMetadata.isEmpty()) {
        config.metadataUrl = envMetadata;
    }

    bool ok = false;
    const int seconds = parser.value(timeoutOption).toInt(&ok);
    if (!ok || seconds <= 0) {
        throw ConfigError("invalid command timeout '"
                          + parser.value(timeoutOption).toStdString() + "'");
    }
    config.commandTimeout = std::chrono::seconds(seconds);

    config.lockFile = parser.isSet(lockOption) ? parser.value(lockOption)
                                               : defaultLockFilePath();
    config.mountTable = parser.value(mountTableOption);
    config.trace = parser.isSet(traceOption)
        || qEnvironmentVariableIntValue("SNAPFREEZE_TRACE") == 1;

    return config;
}

void SnapfreezeCli::renderText(const RunReport &report, std::ostream &out)
{
    out << "snapfreeze run " << report.correlationId << "\n";
    if (!report.instanceId.empty()) {
        out << "Instance: " << report.instanceId << " (" << report.region << ")\n";
    }
    out << "State: " << toStateString(report.state) << "\n";
    out << "Frozen filesystems: " << targetList(report.frozenTargets) << "\n";
    out << "Frozen for: " << report.frozenDuration.count() << " ms\n";
    out << "Snapshots: " << report.succeededCount() << " succeeded, "
        << report.failedCount() << " failed\n";
    renderResultLines(report, out);
    if (report.errorKind != ErrorKind::None) {
        out << "Error (" << toErrorKindString(report.errorKind) << "): "
            << report.errorMessage << "\n";
    }
}

void SnapfreezeCli::renderJson(const RunReport &report, std::ostream &out)
{
    const nlohmann::json payload = report;
    out << payload.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
}

void SnapfreezeCli::renderDiagnostics(const RunReport &report, std::ostream &err)
{
    if (!report.stillFrozen.empty()) {
        err << "snapfreeze: CRITICAL: the following filesystems may still be frozen: "
            << targetList(report.stillFrozen) << "\n"
            << "snapfreeze: CRITICAL: run 'fsfreeze --unfreeze <mountpoint>' for each\n";
    }
    err << "snapfreeze: error (" << toErrorKindString(report.errorKind) << "): "
        << report.errorMessage << "\n";
    if (!report.results.empty()) {
        err << "snapfreeze: snapshot output:\n";
        renderResultLines(report, err);
    }
}

int SnapfreezeCli::run(const QStringList &arguments)
{
    RunConfig config;
    try {
        config = parseConfig(arguments);
    } catch (const ConfigError &ex) {
        std::cerr << "snapfreeze: " << ex.what() << "\n"
                  << "Try 'snapfreeze --help' for more information.\n";
        return ex.exitCode();
    }

    if (config.showHelp) {
        std::cout << config.helpText.toStdString();
        return kExitSuccess;
    }
    if (config.showVersion) {
        std::cout << "snapfreeze " << SNAPFREEZE_VERSION << "\n";
        return kExitSuccess;
    }

    logging::initLogging(QStringLiteral("snapfreeze"), config.trace);
    logging::CorrelationScope correlation(logging::newCorrelationId());
    SFLOG_INFO(QStringLiteral("SnapfreezeCli"),
               QStringLiteral("run"),
               QStringLiteral("run_start"),
               QStringLiteral("user_invocation"),
               QStringLiteral("cli"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"version", SNAPFREEZE_VERSION},
                               {"tags", config.tags.size()},
                               {"format", config.format.toStdString()},
                               {"timeoutSec", std::chrono::duration_cast<std::chrono::seconds>(
                                                  config.commandTimeout).count()}}));

    // Prepared before the lock and the freeze so the frozen window stays minimal.
    SnapshotRequest request;
    request.description = config.description;
    request.tags = config.tags;

    try {
        RunLock lock(config.lockFile);

        Ec2InstanceContext context(config.metadataUrl, config.awsCli, config.commandTimeout);
        FreezeController freezer(std::make_unique<IoctlFreezeBackend>());
        AwsCliSnapshotApi api(config.awsCli, config.commandTimeout);
        const QString mountTable = config.mountTable;
        CriticalSection section(context, freezer, api, [mountTable]() {
            return listMountTargets(mountTable);
        });

        const RunReport report = section.run(request);
        if (config.format == QStringLiteral("json")) {
            renderJson(report, std::cout);
        } else {
            renderText(report, std::cout);
        }
        if (report.exitCode != kExitSuccess) {
            renderDiagnostics(report, std::cerr);
        }
        return report.exitCode;
    } catch (const SnapfreezeError &ex) {
        // Only reachable before the critical section starts (lock, setup).
        std::cerr << "snapfreeze: " << ex.what() << "\n";
        return ex.exitCode();
    }
}

} // namespace snapfreeze
