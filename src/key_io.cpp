// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2014 The Bitcoin developers
// Copyright (c) 2026 The RevSplit developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "key_io.h"

#include "utilstrencodings.h"

bool IsValidDestinationString(const std::string& str)
{
    if (str.size() != 2 + DESTINATION_HEX_LENGTH) {
        return false;
    }
    if (str[0] != '0' || (str[1] != 'x')) {
        return false;
    }
    for (size_t i = 2; i < str.size(); ++i) {
        if (HexDigit(str[i]) < 0) {
            return false;
        }
    }
    return true;
}

std::string NormalizeDestination(const std::string& str)
{
    if (!IsValidDestinationString(str)) {
        return std::string();
    }
    return ToLower(str);
}
