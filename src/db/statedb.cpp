// MINTGUARD - Issuance State Database Implementation
// Copyright (c) 2024 MINTGUARD Developers
// MIT License

#include "mintguard/db/statedb.h"
#include "mintguard/issuance/issuer.h"
#include "mintguard/util/logging.h"

#include <map>
#include <stdexcept>
#include <unordered_map>

namespace mintguard {
namespace db {

using issuance::IssuerRecord;

IssuanceStateDB::IssuanceStateDB(const std::filesystem::path& dbPath, const Options& options) {
    auto [status, database] = OpenDatabase(dbPath, options);
    if (!status.ok()) {
        throw std::runtime_error("Failed to open issuance state database: " + status.ToString());
    }
    db_ = std::move(database);
}

IssuanceStateDB::IssuanceStateDB(std::unique_ptr<Database> db) : db_(std::move(db)) {
    if (!db_) {
        throw std::invalid_argument("IssuanceStateDB requires a database");
    }
}

// ============================================================================
// Load
// ============================================================================

namespace {

/// Decode the part of `key` after its prefix byte
template<typename T>
bool DecodeKeyBody(const std::string& key, T& out) {
    return DeserializeFromString(key.substr(1), out);
}

} // namespace

Status IssuanceStateDB::Load(issuance::IssuerRegistry& registry, issuance::TokenLedger& ledger,
                             BlockHeight& lastHeight) const {
    std::map<uint32_t, Identity> slots;
    std::unordered_map<Identity, IssuerRecord, IdentityHasher> records;
    issuance::CooldownTracker::Map cooldowns;
    issuance::TokenLedger::BalanceMap balances;
    issuance::TokenLedger::AllowanceMap allowances;
    Amount totalSupply = 0;
    BlockHeight height = NO_HEIGHT;

    auto it = db_->NewIterator();
    for (it->SeekToFirst(); it->Valid(); it->Next()) {
        const std::string key = it->key().ToString();
        const std::string value = it->value().ToString();
        if (key.empty()) {
            return Status::Corruption("empty key");
        }

        bool ok = false;
        switch (key[0]) {
            case prefix::ISSUER_SLOT: {
                uint32_t slot = 0;
                Identity identity;
                ok = DecodeKeyBody(key, slot) && DeserializeFromString(value, identity);
                if (ok) slots.emplace(slot, identity);
                break;
            }
            case prefix::ISSUER_RECORD: {
                Identity identity;
                IssuerRecord record;
                ok = DecodeKeyBody(key, identity) && DeserializeFromString(value, record);
                if (ok) records.emplace(identity, record);
                break;
            }
            case prefix::COOLDOWN: {
                Identity identity;
                BlockHeight until = 0;
                ok = DecodeKeyBody(key, identity) && DeserializeFromString(value, until);
                if (ok) cooldowns.emplace(identity, until);
                break;
            }
            case prefix::BALANCE: {
                Identity identity;
                Amount amount = 0;
                ok = DecodeKeyBody(key, identity) && DeserializeFromString(value, amount);
                if (ok) balances.emplace(identity, amount);
                break;
            }
            case prefix::ALLOWANCE: {
                Identity owner;
                Identity spender;
                Amount amount = 0;
                DataStream ks(key.substr(1));
                try {
                    ks >> owner >> spender;
                    ok = ks.empty() && DeserializeFromString(value, amount);
                } catch (const std::ios_base::failure&) {
                    ok = false;
                }
                if (ok) allowances.emplace(std::make_pair(owner, spender), amount);
                break;
            }
            case prefix::TOTAL_SUPPLY:
                ok = key.size() == 1 && DeserializeFromString(value, totalSupply);
                break;
            case prefix::LAST_HEIGHT:
                ok = key.size() == 1 && DeserializeFromString(value, height);
                break;
            case prefix::PARAMS: {
                issuance::IssuanceParams stored = registry.Params();
                ok = key.size() == 1 && DeserializeFromString(value, stored);
                if (ok && !stored.SameRules(registry.Params())) {
                    return Status::InvalidArgument(
                        "stored issuance parameters differ from the configured ones");
                }
                break;
            }
            case prefix::VERSION: {
                uint32_t version = 0;
                ok = key.size() == 1 && DeserializeFromString(value, version);
                if (ok && version != STATE_DB_VERSION) {
                    return Status::NotSupported("state schema version " + std::to_string(version));
                }
                break;
            }
            default:
                break;
        }

        if (!ok) {
            return Status::Corruption("malformed entry with prefix '" + std::string(1, key[0]) + "'");
        }
    }

    Status iterStatus = it->status();
    if (!iterStatus.ok()) {
        return iterStatus;
    }

    // Slots must be dense and every slot must own exactly one record
    if (slots.size() != records.size()) {
        return Status::Corruption("issuer slot count " + std::to_string(slots.size()) +
                                  " does not match record count " +
                                  std::to_string(records.size()));
    }

    std::vector<std::pair<Identity, IssuerRecord>> issuers;
    issuers.reserve(slots.size());
    uint32_t expected = 0;
    for (const auto& [slot, identity] : slots) {
        if (slot != expected++) {
            return Status::Corruption("gap in issuer slots at " + std::to_string(slot));
        }
        auto rec = records.find(identity);
        if (rec == records.end()) {
            return Status::Corruption("issuer " + identity.ToHex() + " has no record");
        }
        issuers.emplace_back(identity, rec->second);
    }

    // Validate the ledger before touching the registry so a failure leaves both as they were
    issuance::TokenLedger restoredLedger;
    if (!restoredLedger.Restore(balances, allowances, totalSupply)) {
        return Status::Corruption("ledger balances do not match total supply");
    }

    std::string error;
    if (!registry.Restore(std::move(issuers), std::move(cooldowns), error)) {
        return Status::Corruption(error);
    }
    if (!ledger.Restore(std::move(balances), std::move(allowances), totalSupply)) {
        return Status::Corruption("ledger balances do not match total supply");
    }
    lastHeight = height;

    LOG_DEBUG(util::LogCategory::DB) << "Loaded state: " << registry.Count() << " issuer(s), "
        << ledger.Balances().size() << " balance(s), supply " << FormatAmount(totalSupply)
        << ", last height " << height;
    return Status::Ok();
}

// ============================================================================
// Commit
// ============================================================================

Status IssuanceStateDB::Commit(const issuance::IssuerRegistry& registry,
                               const issuance::TokenLedger& ledger, BlockHeight height) {
    std::map<std::string, std::string> entries;

    const std::vector<Identity> issuers = registry.GetIssuers();
    for (uint32_t slot = 0; slot < issuers.size(); ++slot) {
        const Identity& identity = issuers[slot];
        entries[MakeKey(prefix::ISSUER_SLOT, slot)] = SerializeToString(identity);
        entries[MakeKey(prefix::ISSUER_RECORD, identity)] =
            SerializeToString(*registry.GetRecord(identity));
    }

    // A cooldown that has run out at `height` can never apply again
    for (const auto& [identity, until] : registry.Cooldowns().Entries()) {
        if (until > height) {
            entries[MakeKey(prefix::COOLDOWN, identity)] = SerializeToString(until);
        }
    }

    for (const auto& [identity, amount] : ledger.Balances()) {
        entries[MakeKey(prefix::BALANCE, identity)] = SerializeToString(amount);
    }

    for (const auto& [pair, amount] : ledger.Allowances()) {
        entries[MakeKey(prefix::ALLOWANCE, pair.first, pair.second)] = SerializeToString(amount);
    }

    entries[MakeKey(prefix::TOTAL_SUPPLY)] = SerializeToString(ledger.TotalSupply());
    entries[MakeKey(prefix::LAST_HEIGHT)] = SerializeToString(height);
    entries[MakeKey(prefix::VERSION)] = SerializeToString(STATE_DB_VERSION);
    entries[MakeKey(prefix::PARAMS)] = SerializeToString(registry.Params());

    WriteBatch batch;

    // Collect stale keys first; the iterator must be gone before the write
    {
        auto it = db_->NewIterator();
        for (it->SeekToFirst(); it->Valid(); it->Next()) {
            std::string key = it->key().ToString();
            if (entries.find(key) == entries.end()) {
                batch.Delete(key);
            }
        }
        Status iterStatus = it->status();
        if (!iterStatus.ok()) {
            return iterStatus;
        }
    }

    for (const auto& [key, value] : entries) {
        batch.Put(key, value);
    }

    WriteOptions options;
    options.sync = true;
    Status s = db_->Write(options, &batch);
    if (!s.ok()) {
        LOG_ERROR(util::LogCategory::DB) << "Commit at height " << height
            << " failed: " << s.ToString();
        return s;
    }

    LOG_DEBUG(util::LogCategory::DB) << "Committed " << entries.size() << " entries at height "
        << height;
    return Status::Ok();
}

BlockHeight IssuanceStateDB::ReadLastHeight() const {
    std::string value;
    if (!db_->Get(MakeKey(prefix::LAST_HEIGHT), &value).ok()) {
        return NO_HEIGHT;
    }
    BlockHeight height = NO_HEIGHT;
    if (!DeserializeFromString(value, height)) {
        return NO_HEIGHT;
    }
    return height;
}

} // namespace db
} // namespace mintguard
