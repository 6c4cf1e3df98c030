#pragma once

#include <chrono>
#include <string>
#include <vector>

#include <QByteArray>
#include <QNetworkAccessManager>
#include <QString>

namespace snapfreeze {

// Identity of the running instance and the volumes attached to it. Every
// call may reach a remote service and throws ContextError on failure.
class InstanceContext
{
public:
    virtual ~InstanceContext() = default;

    virtual std::string instanceId() = 0;
    virtual std::string region() = 0;
    virtual std::vector<std::string> attachedVolumes(const std::string &instanceId,
                                                     const std::string &region) = 0;
};

/**
 * EC2 implementation.
 *
 * Identity and placement come from the instance metadata service (IMDSv2
 * session token, falling back to IMDSv1 when the token endpoint refuses).
 * Attached volumes come from `aws ec2 describe-volumes`.
 */
class Ec2InstanceContext : public InstanceContext
{
public:
    Ec2InstanceContext(const QString &metadataUrl,
                       const QString &awsCli,
                       std::chrono::milliseconds timeout);

    std::string instanceId() override;
    std::string region() override;
    std::vector<std::string> attachedVolumes(const std::string &instanceId,
                                             const std::string &region) override;

private:
    QByteArray fetchToken();
    QString fetchMetadata(const QString &path);

    QNetworkAccessManager m_network;
    QString m_metadataUrl;
    QString m_awsCli;
    std::chrono::milliseconds m_timeout;
    QByteArray m_token;
    bool m_tokenRequested = false;
};

// "us-east-1a" -> "us-east-1". Throws ContextError for an empty zone.
std::string regionFromAvailabilityZone(const std::string &zone);

// Volume ids from `describe-volumes --output json`, in response order.
// Throws ContextError when the document is not a describe-volumes response.
std::vector<std::string> parseDescribeVolumesOutput(const QString &output);

} // namespace snapfreeze
