#include "provider/aws_cli_snapshot_api.hpp"

#include <nlohmann/json.hpp>

#include "common/errors.hpp"
#include "common/interruption.hpp"
#include "common/logging.hpp"
#include "common/process_utils.hpp"
#include "provider/tag_spec.hpp"

namespace snapfreeze {

AwsCliSnapshotApi::AwsCliSnapshotApi(const QString &awsCli,
                                     std::chrono::milliseconds timeout)
    : m_awsCli(awsCli)
    , m_timeout(timeout)
{
}

QStringList AwsCliSnapshotApi::buildArguments(const SnapshotRequest &request,
                                              const std::string &region)
{
    QStringList args = {
        QStringLiteral("ec2"),
        QStringLiteral("create-snapshot"),
        QStringLiteral("--region"),
        QString::fromStdString(region),
        QStringLiteral("--volume-id"),
        QString::fromStdString(request.volumeId),
    };

    if (!request.description.empty()) {
        args << QStringLiteral("--description")
             << QString::fromStdString(request.description);
    }

    // No tags means no tag specification at all, not an empty one.
    if (!request.tags.empty()) {
        args << QStringLiteral("--tag-specifications")
             << QString::fromStdString(tagSpecificationJson(request.tags).dump());
    }

    args << QStringLiteral("--output") << QStringLiteral("json");
    return args;
}

std::optional<std::string> AwsCliSnapshotApi::parseSnapshotId(const QString &output)
{
    try {
        const auto parsed = nlohmann::json::parse(output.toStdString());
        if (!parsed.is_object()) {
            return std::nullopt;
        }
        const std::string snapshotId = parsed.value("SnapshotId", "");
        if (snapshotId.empty()) {
            return std::nullopt;
        }
        return snapshotId;
    } catch (const nlohmann::json::exception &) {
        return std::nullopt;
    }
}

SnapshotResult AwsCliSnapshotApi::createSnapshot(const SnapshotRequest &request,
                                                 const std::string &region)
{
    const QStringList args = buildArguments(request, region);
    const CommandResult command = runCommand(m_awsCli, args, m_timeout);

    if (command.interrupted) {
        throw InterruptedError(interruption::pendingSignal());
    }

    if (!command.ok()) {
        return SnapshotResult::failed(request.volumeId,
                                      command.failureText(m_awsCli).toStdString());
    }

    const auto snapshotId = parseSnapshotId(command.standardOutput);
    if (!snapshotId.has_value()) {
        SFLOG_WARN(QStringLiteral("AwsCliSnapshotApi"),
                   QStringLiteral("createSnapshot"),
                   QStringLiteral("unparsable_output"),
                   QStringLiteral("missing_snapshot_id"),
                   QStringLiteral("aws_cli"),
                   logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"volumeId", request.volumeId},
                                   {"stdout", command.standardOutput.left(512).toStdString()}}));
        return SnapshotResult::failed(request.volumeId,
                                      "no SnapshotId in provider response");
    }

    return SnapshotResult::succeeded(request.volumeId, *snapshotId);
}

} // namespace snapfreeze
