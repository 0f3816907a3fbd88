// Copyright (c) 2010 Satoshi Nakamoto
// Copyright (c) 2009-2015 The Bitcoin developers
// Copyright (c) 2026 The RevSplit developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef REVSPLIT_RPC_PROTOCOL_H
#define REVSPLIT_RPC_PROTOCOL_H

#include <string>

class UniValue;

//! RevSplit RPC error codes
enum RPCErrorCode {
    //! Standard JSON-RPC 2.0 errors
    RPC_INVALID_REQUEST = -32600,
    RPC_METHOD_NOT_FOUND = -32601,
    RPC_INVALID_PARAMS = -32602,
    RPC_INTERNAL_ERROR = -32603,
    RPC_PARSE_ERROR = -32700,

    //! General application defined errors
    RPC_MISC_ERROR = -1,              //!< std::exception thrown in command handling
    RPC_TYPE_ERROR = -3,              //!< Unexpected type was passed as parameter
    RPC_INVALID_ADDRESS_OR_KEY = -5,  //!< Invalid address or unknown ledger/round
    RPC_INVALID_PARAMETER = -8,       //!< Invalid, missing or duplicate parameter
    RPC_DATABASE_ERROR = -20,         //!< Database error

    //! Ledger errors
    RPC_LEDGER_NOTHING_DUE = -30,     //!< Nothing to release for the claimant
    RPC_LEDGER_UNAUTHORIZED = -31,    //!< Caller is not the ledger admin
    RPC_LEDGER_PAUSED = -32,          //!< Ledger is paused
    RPC_LEDGER_INVARIANT = -33,       //!< Operation would break a ledger invariant

    //! Deployment errors
    RPC_DEPLOY_FAILED = -40,          //!< Provisioning failed, retry is possible
    RPC_DEPLOY_AMBIGUOUS = -41,       //!< Provisioning outcome unknown, reconcile manually
    RPC_ALREADY_EXISTS = -42,         //!< Already deployed, in progress or duplicate
};

UniValue JSONRPCError(int code, const std::string& message);

#endif // REVSPLIT_RPC_PROTOCOL_H
