#pragma once

namespace pctoolkit {

enum class StorageType {
    Unknown,
    Hdd,
    Ssd,
    NvmeSsd
};

enum class CleanupKind {
    TempFiles,
    Trash,
    Memory,
    DiskCleanup
};

} // namespace pctoolkit
