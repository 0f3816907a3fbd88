// Copyright (c) 2026 The RevSplit developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef REVSPLIT_FUNDING_ROUNDDB_H
#define REVSPLIT_FUNDING_ROUNDDB_H

/**
 * Funding round database
 *
 * DB Keys:
 * 'R' + roundId    -> FundingRoundRecord
 * 'Y' + roundId    -> DeploymentRecord
 * 'V'              -> schema version
 */

#include "dbwrapper.h"
#include "deploy/deployment.h"
#include "funding/round.h"

#include <functional>
#include <memory>
#include <string>

static const char DB_ROUND = 'R';
static const char DB_DEPLOYMENT = 'Y';
static const char DB_ROUND_VERSION = 'V';

class CRoundDB
{
private:
    std::unique_ptr<CDBWrapper> db;

public:
    explicit CRoundDB(size_t nCacheSize, bool fWipe = false);
    ~CRoundDB();

    bool CheckSchemaVersion();

    // Funding rounds
    bool WriteRound(const FundingRoundRecord& round);
    bool ReadRound(const std::string& roundId, FundingRoundRecord& round) const;
    bool HasRound(const std::string& roundId) const;
    void ForEachRound(std::function<bool(const FundingRoundRecord&)> func) const;

    // Deployment records (written synchronously, see CDeploymentOrchestrator)
    bool WriteDeployment(const DeploymentRecord& record);
    bool ReadDeployment(const std::string& roundId, DeploymentRecord& record) const;
    bool HasDeployment(const std::string& roundId) const;
    void ForEachDeployment(std::function<bool(const DeploymentRecord&)> func) const;

    // Batch operations for atomic updates
    class Batch
    {
    private:
        CDBBatch batch;
        CRoundDB& parent;

    public:
        explicit Batch(CRoundDB& db);

        void WriteRound(const FundingRoundRecord& round);
        void WriteDeployment(const DeploymentRecord& record);

        bool Commit();
    };

    Batch CreateBatch() { return Batch(*this); }

    bool Sync();
};

// Global round DB instance
extern std::unique_ptr<CRoundDB> g_rounddb;

/**
 * InitRoundDB - Open (or create) the round database under the data dir
 */
bool InitRoundDB(size_t nCacheSize, bool fWipe = false);

#endif // REVSPLIT_FUNDING_ROUNDDB_H
