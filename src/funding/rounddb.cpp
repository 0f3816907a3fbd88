// Copyright (c) 2026 The RevSplit developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "funding/rounddb.h"

#include "logging.h"
#include "util/system.h"
#include "version.h"

std::unique_ptr<CRoundDB> g_rounddb;

namespace {

template<typename T>
std::pair<char, T> MakeKey(char prefix, const T& key)
{
    return std::make_pair(prefix, key);
}

template<typename Record>
void ForEachRecord(CDBWrapper& db, char prefix, std::function<bool(const Record&)> func)
{
    std::unique_ptr<CDBIterator> it(db.NewIterator());
    it->Seek(MakeKey(prefix, std::string()));

    while (it->Valid()) {
        std::pair<char, std::string> key;
        if (!it->GetKey(key) || key.first != prefix) {
            break;
        }
        Record record;
        if (it->GetValue(record)) {
            if (!func(record)) {
                break;
            }
        } else {
            LogPrintf("ERROR: CRoundDB: unreadable record '%c' %s\n", prefix, key.second);
        }
        it->Next();
    }
}

} // anonymous namespace

CRoundDB::CRoundDB(size_t nCacheSize, bool fWipe)
{
    db = std::make_unique<CDBWrapper>(GetDataDir() / "rounds", nCacheSize, fWipe);
}

CRoundDB::~CRoundDB() = default;

bool CRoundDB::CheckSchemaVersion()
{
    int nVersion = 0;
    if (db->Read(DB_ROUND_VERSION, nVersion)) {
        if (nVersion != DB_SCHEMA_VERSION) {
            return error("CRoundDB: schema version %d, expected %d", nVersion, DB_SCHEMA_VERSION);
        }
        return true;
    }
    if (!db->IsEmpty()) {
        return error("CRoundDB: database has no schema version");
    }
    return db->Write(DB_ROUND_VERSION, DB_SCHEMA_VERSION, true);
}

// =============================================================================
// Funding rounds
// =============================================================================

bool CRoundDB::WriteRound(const FundingRoundRecord& round)
{
    return db->Write(MakeKey(DB_ROUND, round.roundId), round, true);
}

bool CRoundDB::ReadRound(const std::string& roundId, FundingRoundRecord& round) const
{
    return db->Read(MakeKey(DB_ROUND, roundId), round);
}

bool CRoundDB::HasRound(const std::string& roundId) const
{
    return db->Exists(MakeKey(DB_ROUND, roundId));
}

void CRoundDB::ForEachRound(std::function<bool(const FundingRoundRecord&)> func) const
{
    ForEachRecord<FundingRoundRecord>(*db, DB_ROUND, func);
}

// =============================================================================
// Deployment records
// =============================================================================

bool CRoundDB::WriteDeployment(const DeploymentRecord& record)
{
    // PENDING must be on disk before the provisioner starts
    return db->Write(MakeKey(DB_DEPLOYMENT, record.roundId), record, true);
}

bool CRoundDB::ReadDeployment(const std::string& roundId, DeploymentRecord& record) const
{
    return db->Read(MakeKey(DB_DEPLOYMENT, roundId), record);
}

bool CRoundDB::HasDeployment(const std::string& roundId) const
{
    return db->Exists(MakeKey(DB_DEPLOYMENT, roundId));
}

void CRoundDB::ForEachDeployment(std::function<bool(const DeploymentRecord&)> func) const
{
    ForEachRecord<DeploymentRecord>(*db, DB_DEPLOYMENT, func);
}

bool CRoundDB::Sync()
{
    return db->Sync();
}

// =============================================================================
// Batch
// =============================================================================

CRoundDB::Batch::Batch(CRoundDB& db) : parent(db)
{
}

void CRoundDB::Batch::WriteRound(const FundingRoundRecord& round)
{
    batch.Write(MakeKey(DB_ROUND, round.roundId), round);
}

void CRoundDB::Batch::WriteDeployment(const DeploymentRecord& record)
{
    batch.Write(MakeKey(DB_DEPLOYMENT, record.roundId), record);
}

bool CRoundDB::Batch::Commit()
{
    return parent.db->WriteBatch(batch, true);
}

bool InitRoundDB(size_t nCacheSize, bool fWipe)
{
    try {
        g_rounddb.reset();
        g_rounddb = std::make_unique<CRoundDB>(nCacheSize, fWipe);
        if (!g_rounddb->CheckSchemaVersion()) {
            g_rounddb.reset();
            return false;
        }
        LogPrintf("Round DB initialized\n");
        return true;
    } catch (const std::exception& e) {
        g_rounddb.reset();
        return error("InitRoundDB: %s", e.what());
    }
}
