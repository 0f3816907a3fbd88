// Copyright (c) 2009-2016 The Bitcoin Core developers
// Copyright (c) 2026 The RevSplit developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef REVSPLIT_RPC_REGISTER_H
#define REVSPLIT_RPC_REGISTER_H

/** These are in one header file to avoid creating tons of single-function
 * headers for everything under src/rpc/ */
class CRPCTable;

/** Register funding round and deployment RPC commands */
void RegisterFundingRPCCommands(CRPCTable& tableRPC);
/** Register ledger RPC commands */
void RegisterLedgerRPCCommands(CRPCTable& tableRPC);

static inline void RegisterAllCoreRPCCommands(CRPCTable& tableRPC)
{
    RegisterFundingRPCCommands(tableRPC);
    RegisterLedgerRPCCommands(tableRPC);
}

#endif // REVSPLIT_RPC_REGISTER_H
