// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2014 The Bitcoin developers
// Copyright (c) 2026 The RevSplit developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "utilmoneystr.h"

#include "logging.h"
#include "utilstrencodings.h"

#include <limits>
#include <stdexcept>
#include <string.h>


std::string FormatMoney(const CAmount& n, bool fPlus)
{
    // Note: not using straight sprintf here because we do NOT want
    // localized number formatting.
    int64_t n_abs = (n > 0 ? n : -n);
    int64_t quotient = n_abs / COIN;
    int64_t remainder = n_abs % COIN;
    std::string str = strprintf("%d.%08d", quotient, remainder);

    // Right-trim excess zeros before the decimal point:
    int nTrim = 0;
    for (int i = str.size() - 1; (str[i] == '0' && IsDigit(str[i - 2])); --i)
        ++nTrim;
    if (nTrim)
        str.erase(str.size() - nTrim, nTrim);

    if (n < 0)
        str.insert((unsigned int)0, 1, '-');
    else if (fPlus && n > 0)
        str.insert((unsigned int)0, 1, '+');
    return str;
}


bool ParseMoney(const std::string& str, CAmount& nRet)
{
    if (str.size() != strlen(str.c_str())) // No embedded NUL characters allowed
        return false;
    return ParseMoney(str.c_str(), nRet);
}

bool ParseMoney(const char* pszIn, CAmount& nRet)
{
    std::string strWhole;
    int64_t nUnits = 0;
    bool fDigits = false;
    const char* p = pszIn;
    while (IsSpace(*p))
        p++;
    for (; *p; p++) {
        if (*p == '.') {
            p++;
            int64_t nMult = COIN / 10;
            while (IsDigit(*p) && (nMult > 0)) {
                nUnits += nMult * (*p++ - '0');
                nMult /= 10;
                fDigits = true;
            }
            break;
        }
        if (IsSpace(*p))
            break;
        if (!IsDigit(*p))
            return false;
        strWhole.insert(strWhole.end(), *p);
        fDigits = true;
    }
    for (; *p; p++)
        if (!IsSpace(*p))
            return false;
    if (!fDigits)
        return false;
    if (strWhole.size() > 10) // guard against 63 bit overflow
        return false;
    if (nUnits < 0 || nUnits > COIN)
        return false;
    int64_t nWhole = atoi64(strWhole);
    CAmount nValue = nWhole * COIN + nUnits;

    nRet = nValue;
    return true;
}

bool AddNoOverflow(CAmount a, CAmount b, CAmount& result)
{
    __int128 sum = static_cast<__int128>(a) + static_cast<__int128>(b);
    if (a < 0 || b < 0 || sum > MAX_MONEY) {
        LogPrintf("ERROR: AddNoOverflow: %lld + %lld leaves money range\n",
                  (long long)a, (long long)b);
        return false;
    }
    result = static_cast<CAmount>(sum);
    return true;
}

CAmount MulDivFloor(CAmount a, int64_t num, int64_t den)
{
    if (a < 0 || num < 0 || den <= 0) {
        throw std::invalid_argument(strprintf("MulDivFloor: bad operands %lld * %lld / %lld",
                                              (long long)a, (long long)num, (long long)den));
    }
    __int128 quotient = static_cast<__int128>(a) * static_cast<__int128>(num) / den;
    if (quotient > std::numeric_limits<CAmount>::max()) {
        throw std::range_error(strprintf("MulDivFloor: %lld * %lld / %lld does not fit",
                                         (long long)a, (long long)num, (long long)den));
    }
    return static_cast<CAmount>(quotient);
}
