#include "core/mount_table.hpp"

#include <algorithm>
#include <optional>
#include <set>
#include <utility>

#include <QFile>

#include <nlohmann/json.hpp>

#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"

namespace snapfreeze {

namespace {

bool isOctalDigit(char ch)
{
    return ch >= '0' && ch <= '7';
}

struct MountEntry {
    std::string device;
    std::string mountPoint;
    std::optional<FilesystemKind> kind;
};

} // namespace

std::string decodeMountField(const QByteArray &field)
{
    std::string decoded;
    decoded.reserve(static_cast<size_t>(field.size()));

    for (qsizetype i = 0; i < field.size(); ++i) {
        if (field[i] == '\\' && i + 3 < field.size()
            && isOctalDigit(field[i + 1])
            && isOctalDigit(field[i + 2])
            && isOctalDigit(field[i + 3])) {
            const int value = (field[i + 1] - '0') * 64 + (field[i + 2] - '0') * 8
                + (field[i + 3] - '0');
            decoded.push_back(static_cast<char>(value));
            i += 3;
            continue;
        }
        decoded.push_back(field[i]);
    }
    return decoded;
}

bool isRootMount(const std::string &mountPoint)
{
    return mountPoint == "/";
}

std::vector<MountTarget> parseMountTable(const QByteArrayList &lines)
{
    std::vector<MountEntry> entries;
    std::string rootDevice;

    for (const QByteArray &line : lines) {
        const QByteArray simplified = line.simplified();
        if (simplified.isEmpty() || simplified.startsWith('#')) {
            continue;
        }

        // Format: <device> <mount point> <type> <options> <dump> <pass>
        const QByteArrayList fields = simplified.split(' ');
        if (fields.size() < 3) {
            continue;
        }

        MountEntry entry;
        entry.device = decodeMountField(fields[0]);
        entry.mountPoint = decodeMountField(fields[1]);
        entry.kind = parseKindString(fields[2].toStdString());

        // The last mount on / is the live root, whatever its kind.
        if (isRootMount(entry.mountPoint)) {
            rootDevice = entry.device;
            continue;
        }
        if (entry.kind.has_value()) {
            entries.push_back(std::move(entry));
        }
    }

    std::vector<MountTarget> targets;
    for (const auto &entry : entries) {
        // Freezing root can hang the whole system, and a bind mount of the
        // root device freezes root.
        if (!rootDevice.empty() && entry.device == rootDevice) {
            continue;
        }

        MountTarget target;
        target.device = entry.device;
        target.mountPoint = entry.mountPoint;
        target.kind = *entry.kind;

        // A later entry for the same mount point shadows the earlier one.
        targets.erase(std::remove(targets.begin(), targets.end(), target),
                      targets.end());
        targets.push_back(target);
    }

    // FIFREEZE works per superblock: a second mount of the same device would
    // fail with EBUSY. The first mount point wins.
    std::set<std::string> seenDevices;
    targets.erase(std::remove_if(targets.begin(), targets.end(),
                                 [&seenDevices](const MountTarget &target) {
                                     return !seenDevices.insert(target.device).second;
                                 }),
                  targets.end());

    return targets;
}

std::vector<MountTarget> listMountTargets(const QString &mountTablePath)
{
    QFile file(mountTablePath);
    if (!file.open(QIODevice::ReadOnly)) {
        throw EnumerationError("cannot read mount table " + mountTablePath.toStdString()
                                   + ": " + file.errorString().toStdString(),
                               0);
    }

    const std::vector<MountTarget> targets = parseMountTable(file.readAll().split('\n'));

    SFLOG_INFO(QStringLiteral("MountTable"),
               QStringLiteral("listMountTargets"),
               QStringLiteral("mount_targets_listed"),
               QStringLiteral("pre_freeze"),
               QStringLiteral("proc_mounts"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"path", mountTablePath.toStdString()},
                               {"targets", targets}}));

    return targets;
}

} // namespace snapfreeze
