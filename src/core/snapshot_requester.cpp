#include "core/snapshot_requester.hpp"

#include <exception>

#include <QString>

#include <nlohmann/json.hpp>

#include "common/errors.hpp"
#include "common/interruption.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"

namespace snapfreeze {

SnapshotRequester::SnapshotRequester(SnapshotApi &api)
    : m_api(api)
{
}

std::vector<SnapshotResult> SnapshotRequester::requestSnapshots(
    const std::vector<std::string> &volumes,
    const SnapshotRequest &request,
    const std::string &region)
{
    m_collected.clear();
    m_collected.reserve(volumes.size());

    for (const auto &volumeId : volumes) {
        interruption::throwIfInterrupted();

        SnapshotRequest perVolume = request;
        perVolume.volumeId = volumeId;

        SnapshotResult result;
        try {
            result = m_api.createSnapshot(perVolume, region);
        } catch (const InterruptedError &) {
            throw;
        } catch (const std::exception &ex) {
            result = SnapshotResult::failed(volumeId, ex.what());
        }
        result.volumeId = volumeId;

        if (result.success) {
            SFLOG_INFO(QStringLiteral("SnapshotRequester"),
                       QStringLiteral("requestSnapshots"),
                       QStringLiteral("snapshot_created"),
                       QStringLiteral("critical_section"),
                       QStringLiteral("provider_api"),
                       logging::defaultWho(),
                       QString(),
                       (nlohmann::json{{"result", result}}));
        } else {
            SFLOG_WARN(QStringLiteral("SnapshotRequester"),
                       QStringLiteral("requestSnapshots"),
                       QStringLiteral("snapshot_failed"),
                       QString::fromStdString(result.errorDetail),
                       QStringLiteral("provider_api"),
                       logging::defaultWho(),
                       QString(),
                       (nlohmann::json{{"result", result}}));
        }

        m_collected.push_back(result);
    }

    return m_collected;
}

} // namespace snapfreeze
