#pragma once

#include <chrono>
#include <optional>
#include <string>

#include <QString>
#include <QStringList>

#include "core/snapshot_requester.hpp"

namespace snapfreeze {

/**
 * SnapshotApi backed by the AWS command line client:
 *
 *   aws ec2 create-snapshot --region R --volume-id V [--description D]
 *       [--tag-specifications JSON] --output json
 *
 * Credentials come from the CLI's own chain (instance role, environment).
 * No retry: one attempt per volume, bounded by the command timeout.
 */
class AwsCliSnapshotApi : public SnapshotApi
{
public:
    AwsCliSnapshotApi(const QString &awsCli, std::chrono::milliseconds timeout);

    SnapshotResult createSnapshot(const SnapshotRequest &request,
                                  const std::string &region) override;

    // Exposed for tests.
    static QStringList buildArguments(const SnapshotRequest &request,
                                      const std::string &region);
    static std::optional<std::string> parseSnapshotId(const QString &output);

private:
    QString m_awsCli;
    std::chrono::milliseconds m_timeout;
};

} // namespace snapfreeze
