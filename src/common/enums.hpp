#pragma once

namespace snapfreeze {

enum class FilesystemKind {
    Ext2,
    Ext3,
    Ext4,
    Xfs,
    Btrfs,
    Jfs,
    Reiserfs,
    F2fs,
    Nilfs2,
    Gfs2
};

enum class RunState {
    Idle,
    Syncing,
    Freezing,
    Snapshotting,
    Unfreezing,
    Done,
    Failed,
    FailedRecovered
};

enum class ErrorKind {
    None,
    Config,
    Context,
    Enumeration,
    Lock,
    Freeze,
    Unfreeze,
    Interrupted,
    Internal
};

} // namespace snapfreeze
