// MINTGUARD - Issuance State Database
// Copyright (c) 2024 MINTGUARD Developers
// MIT License
//
// Persists the registry, cooldowns and ledger as the canonical record store.
// Each entry is one field of the data model under a key prefix; a commit
// rewrites the state in a single atomic batch.

#ifndef MINTGUARD_DB_STATEDB_H
#define MINTGUARD_DB_STATEDB_H

#include "mintguard/core/types.h"
#include "mintguard/db/database.h"
#include "mintguard/issuance/ledger.h"
#include "mintguard/issuance/registry.h"

#include <filesystem>
#include <memory>

namespace mintguard {
namespace db {

/// Schema version written with every commit
constexpr uint32_t STATE_DB_VERSION = 1;

/// Height value meaning "nothing executed yet"
constexpr BlockHeight NO_HEIGHT = -1;

/**
 * Persistent store for the complete issuance state.
 */
class IssuanceStateDB {
public:
    /**
     * Open or create the LevelDB store at `dbPath`.
     * @throws std::runtime_error if the database cannot be opened
     */
    explicit IssuanceStateDB(const std::filesystem::path& dbPath,
                             const Options& options = Options());

    /// Use an already-open database (MemoryDatabase in tests)
    explicit IssuanceStateDB(std::unique_ptr<Database> db);

    IssuanceStateDB(const IssuanceStateDB&) = delete;
    IssuanceStateDB& operator=(const IssuanceStateDB&) = delete;

    /**
     * Rebuild registry and ledger from the store.
     *
     * An empty store yields empty state and NO_HEIGHT. Any malformed entry,
     * a gap in the issuer slots, a slot without a record (or the reverse)
     * or a supply that does not match the balances is reported as
     * Corruption. Stored parameters whose rules differ from
     * registry.Params() give InvalidArgument. On any failure the targets
     * are left unchanged.
     */
    Status Load(issuance::IssuerRegistry& registry, issuance::TokenLedger& ledger,
                BlockHeight& lastHeight) const;

    /**
     * Write the full state, the registry's parameters and `height` in one
     * batch, deleting every key that no longer corresponds to state.
     * Cooldowns ending at or before `height` are not written.
     */
    Status Commit(const issuance::IssuerRegistry& registry,
                  const issuance::TokenLedger& ledger, BlockHeight height);

    /// Last executed height, or NO_HEIGHT
    BlockHeight ReadLastHeight() const;

    Database& GetDatabase() { return *db_; }

private:
    std::unique_ptr<Database> db_;
};

} // namespace db
} // namespace mintguard

#endif // MINTGUARD_DB_STATEDB_H
