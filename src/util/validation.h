// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2014 The Bitcoin developers
// Copyright (c) 2026 The RevSplit developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef REVSPLIT_UTIL_VALIDATION_H
#define REVSPLIT_UTIL_VALIDATION_H

#include <string>

/** Reject codes, one per error class. */
static const unsigned char REJECT_INVALID = 0x10;
static const unsigned char REJECT_DEGENERATE = 0x11;
static const unsigned char REJECT_DUPLICATE = 0x12;
static const unsigned char REJECT_DEPLOY_FAILED = 0x20;
static const unsigned char REJECT_AMBIGUOUS = 0x21;
static const unsigned char REJECT_NOTHING_DUE = 0x30;
static const unsigned char REJECT_UNAUTHORIZED = 0x31;
static const unsigned char REJECT_PAUSED = 0x32;
static const unsigned char REJECT_NOTFOUND = 0x40;

/** Capture information about the outcome of a ledger, deployment or funding operation */
class CValidationState
{
private:
    enum mode_state {
        MODE_VALID,   //!< everything ok
        MODE_INVALID, //!< request rejected, nothing changed
        MODE_ERROR,   //!< run-time error or broken invariant
    } mode;
    std::string strRejectReason;
    unsigned int chRejectCode;
    std::string strDebugMessage;

public:
    CValidationState() : mode(MODE_VALID), chRejectCode(0) {}

    bool Invalid(bool ret = false,
        unsigned int _chRejectCode = 0,
        const std::string& _strRejectReason = "",
        const std::string& _strDebugMessage = "")
    {
        if (mode == MODE_ERROR)
            return ret;
        chRejectCode = _chRejectCode;
        strRejectReason = _strRejectReason;
        strDebugMessage = _strDebugMessage;
        mode = MODE_INVALID;
        return ret;
    }
    bool Error(const std::string& strRejectReasonIn, const std::string& strDebugMessageIn = "")
    {
        if (mode == MODE_VALID) {
            strRejectReason = strRejectReasonIn;
            strDebugMessage = strDebugMessageIn;
        }
        mode = MODE_ERROR;
        return false;
    }
    bool IsValid() const
    {
        return mode == MODE_VALID;
    }
    bool IsInvalid() const
    {
        return mode == MODE_INVALID;
    }
    bool IsError() const
    {
        return mode == MODE_ERROR;
    }
    unsigned int GetRejectCode() const { return chRejectCode; }
    std::string GetRejectReason() const { return strRejectReason; }
    std::string GetDebugMessage() const { return strDebugMessage; }
};

/** Convert CValidationState to a human-readable message for logging */
std::string FormatStateMessage(const CValidationState& state);

#endif // REVSPLIT_UTIL_VALIDATION_H
