// SEALBID - Database Implementation
// Copyright (c) 2024 SEALBID Developers
// MIT License

#include "sealbid/db/database.h"
#include "sealbid/db/memorydb.h"

#ifdef SEALBID_USE_LEVELDB
#include "sealbid/db/leveldb.h"
#endif

namespace sealbid {
namespace db {

std::string Status::ToString() const {
    const char* name = "Unknown";
    switch (code_) {
        case Code::OK:               return "OK";
        case Code::NOT_FOUND:        name = "NotFound"; break;
        case Code::CORRUPTION:       name = "Corruption"; break;
        case Code::NOT_SUPPORTED:    name = "NotSupported"; break;
        case Code::INVALID_ARGUMENT: name = "InvalidArgument"; break;
        case Code::IO_ERROR:         name = "IOError"; break;
    }
    return message_.empty() ? std::string(name) : std::string(name) + ": " + message_;
}

// ============================================================================
// Database Factory Functions
// ============================================================================

std::pair<Status, std::unique_ptr<Database>> OpenDatabase(
    const std::filesystem::path& path,
    const Options& options)
{
#ifdef SEALBID_USE_LEVELDB
    return OpenLevelDB(path, options);
#else
    (void)path;
    (void)options;
    return {Status::NotSupported("built without LevelDB; use the memory backend"),
            nullptr};
#endif
}

std::unique_ptr<Database> CreateMemoryDatabase() {
    return std::make_unique<MemoryDatabase>();
}

bool HasPersistentBackend() {
#ifdef SEALBID_USE_LEVELDB
    return true;
#else
    return false;
#endif
}

Status DestroyDatabase(const std::filesystem::path& path) {
#ifdef SEALBID_USE_LEVELDB
    return DestroyLevelDB(path);
#else
    (void)path;
    return Status::NotSupported("built without LevelDB");
#endif
}

} // namespace db
} // namespace sealbid
