#include "provider/instance_context.hpp"

#include <cctype>

#include <QEventLoop>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QTimer>
#include <QUrl>

#include <nlohmann/json.hpp>

#include "common/errors.hpp"
#include "common/interruption.hpp"
#include "common/logging.hpp"
#include "common/process_utils.hpp"

namespace snapfreeze {

namespace {

constexpr const char *kTokenPath = "/latest/api/token";
constexpr const char *kInstanceIdPath = "/latest/meta-data/instance-id";
constexpr const char *kZonePath = "/latest/meta-data/placement/availability-zone";
constexpr const char *kTokenTtlHeader = "X-aws-ec2-metadata-token-ttl-seconds";
constexpr const char *kTokenHeader = "X-aws-ec2-metadata-token";
constexpr const char *kTokenTtlSeconds = "300";

struct HttpResult {
    bool ok = false;
    int status = 0;
    QByteArray body;
    QString error;
};

// Blocks on a local event loop until the reply finishes or the timeout fires.
HttpResult waitForReply(QNetworkReply *reply, std::chrono::milliseconds timeout)
{
    QEventLoop loop;
    QTimer timer;
    timer.setSingleShot(true);
    QObject::connect(&timer, &QTimer::timeout, &loop, &QEventLoop::quit);
    QObject::connect(reply, &QNetworkReply::finished, &loop, &QEventLoop::quit);
    timer.start(static_cast<int>(timeout.count()));
    loop.exec();

    HttpResult result;
    if (!reply->isFinished()) {
        reply->abort();
        result.error = QStringLiteral("timed out after %1 ms").arg(timeout.count());
        reply->deleteLater();
        return result;
    }

    result.status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    result.body = reply->readAll();
    if (reply->error() != QNetworkReply::NoError) {
        result.error = reply->errorString();
    } else {
        result.ok = result.status >= 200 && result.status < 300;
        if (!result.ok) {
            result.error = QStringLiteral("HTTP status %1").arg(result.status);
        }
    }
    reply->deleteLater();
    return result;
}

} // namespace

Ec2InstanceContext::Ec2InstanceContext(const QString &metadataUrl,
                                       const QString &awsCli,
                                       std::chrono::milliseconds timeout)
    : m_metadataUrl(metadataUrl)
    , m_awsCli(awsCli)
    , m_timeout(timeout)
{
    while (m_metadataUrl.endsWith(QLatin1Char('/'))) {
        m_metadataUrl.chop(1);
    }
}

QByteArray Ec2InstanceContext::fetchToken()
{
    if (m_tokenRequested) {
        return m_token;
    }
    m_tokenRequested = true;

    QNetworkRequest request(QUrl(m_metadataUrl + QLatin1String(kTokenPath)));
    request.setRawHeader(kTokenTtlHeader, kTokenTtlSeconds);
    const HttpResult result = waitForReply(m_network.put(request, QByteArray()), m_timeout);
    if (result.ok) {
        m_token = result.body.trimmed();
    } else {
        SFLOG_WARN(QStringLiteral("InstanceContext"),
                   QStringLiteral("fetchToken"),
                   QStringLiteral("imds_token_unavailable"),
                   result.error,
                   QStringLiteral("imdsv1_fallback"),
                   logging::defaultWho(),
                   QString(),
                   nlohmann::json::object());
    }
    return m_token;
}

QString Ec2InstanceContext::fetchMetadata(const QString &path)
{
    interruption::throwIfInterrupted();

    const QByteArray token = fetchToken();
    QNetworkRequest request(QUrl(m_metadataUrl + path));
    if (!token.isEmpty()) {
        request.setRawHeader(kTokenHeader, token);
    }

    const HttpResult result = waitForReply(m_network.get(request), m_timeout);
    if (!result.ok) {
        throw ContextError("instance metadata " + path.toStdString() + ": "
                           + result.error.toStdString());
    }

    const QString value = QString::fromUtf8(result.body).trimmed();
    if (value.isEmpty()) {
        throw ContextError("instance metadata " + path.toStdString() + " is empty");
    }
    return value;
}

std::string Ec2InstanceContext::instanceId()
{
    return fetchMetadata(QLatin1String(kInstanceIdPath)).toStdString();
}

std::string Ec2InstanceContext::region()
{
    return regionFromAvailabilityZone(fetchMetadata(QLatin1String(kZonePath)).toStdString());
}

std::vector<std::string> Ec2InstanceContext::attachedVolumes(const std::string &instanceId,
                                                             const std::string &region)
{
    const QStringList args = {
        QStringLiteral("ec2"),
        QStringLiteral("describe-volumes"),
        QStringLiteral("--region"),
        QString::fromStdString(region),
        QStringLiteral("--filters"),
        QStringLiteral("Name=attachment.instance-id,Values=%1")
            .arg(QString::fromStdString(instanceId)),
        QStringLiteral("--output"),
        QStringLiteral("json"),
    };

    const CommandResult command = runCommand(m_awsCli, args, m_timeout);
    if (command.interrupted) {
        throw InterruptedError(interruption::pendingSignal());
    }
    if (!command.ok()) {
        throw ContextError("describe-volumes failed: "
                           + command.failureText(m_awsCli).toStdString());
    }

    return parseDescribeVolumesOutput(command.standardOutput);
}

std::string regionFromAvailabilityZone(const std::string &zone)
{
    if (zone.empty()) {
        throw ContextError("availability zone is empty");
    }

    std::string region = zone;
    if (std::isalpha(static_cast<unsigned char>(region.back()))) {
        region.pop_back();
    }
    if (region.empty()) {
        throw ContextError("availability zone '" + zone + "' has no region part");
    }
    return region;
}

std::vector<std::string> parseDescribeVolumesOutput(const QString &output)
{
    nlohmann::json parsed;
    try {
        parsed = nlohmann::json::parse(output.toStdString());
    } catch (const nlohmann::json::parse_error &ex) {
        throw ContextError(std::string("describe-volumes output is not JSON: ") + ex.what());
    }

    if (!parsed.is_object() || !parsed.contains("Volumes") || !parsed.at("Volumes").is_array()) {
        throw ContextError("describe-volumes output has no Volumes array");
    }

    std::vector<std::string> volumes;
    for (const auto &volume : parsed.at("Volumes")) {
        if (!volume.is_object() || !volume.contains("VolumeId")) {
            continue;
        }
        const auto &volumeId = volume.at("VolumeId");
        if (!volumeId.is_string()) {
            throw ContextError("describe-volumes output has a non-string VolumeId: "
                               + volumeId.dump());
        }
        if (!volumeId.get_ref<const std::string &>().empty()) {
            volumes.push_back(volumeId.get<std::string>());
        }
    }
    return volumes;
}

} // namespace snapfreeze
