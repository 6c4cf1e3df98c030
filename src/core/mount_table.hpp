#pragma once

#include <string>
#include <vector>

#include <QByteArray>
#include <QByteArrayList>
#include <QString>

#include "common/models.hpp"

namespace snapfreeze {

constexpr const char *kDefaultMountTablePath = "/proc/self/mounts";

/**
 * Enumerate the mounted filesystems that can be frozen.
 *
 * Reads the mount table at `mountTablePath` and keeps only freezable
 * filesystem kinds. The root mount, and any other mount of the root device,
 * is never returned. Each device is listed once, at its first mount point, so
 * bind mounts are not frozen twice. The result is a point-in-time copy of the
 * table; it is not re-validated later.
 *
 * Throws EnumerationError when the table cannot be read.
 */
std::vector<MountTarget> listMountTargets(
    const QString &mountTablePath = QString::fromLatin1(kDefaultMountTablePath));

// Parse pre-read mount table lines (fstab format). Paths stay raw bytes; they
// need not be valid UTF-8.
std::vector<MountTarget> parseMountTable(const QByteArrayList &lines);

// Decode the octal escapes (\040, \011, \012, \134) the kernel uses in mount paths.
std::string decodeMountField(const QByteArray &field);

bool isRootMount(const std::string &mountPoint);

} // namespace snapfreeze
