// Copyright (c) 2025 The ZKLend developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef ZKLEND_LENDING_ENCRYPTEDAMOUNT_H
#define ZKLEND_LENDING_ENCRYPTEDAMOUNT_H

/**
 * EncryptedAmount - placeholder for a confidential balance
 *
 * The quantity is kept as a plain u64 behind an opaque value type so that
 * the lending rules only ever add to it, subtract from it and compare it
 * against a threshold. Nothing outside this class reads the raw value
 * except the interest and liquidation arithmetic (Reveal()).
 *
 * Add is checked (fails without modifying on overflow).
 * Sub saturates at zero.
 */

#include "serialize.h"

#include <stdint.h>
#include <string>

class EncryptedAmount
{
private:
    uint64_t nValue;

public:
    EncryptedAmount() : nValue(0) {}
    explicit EncryptedAmount(uint64_t nValueIn) : nValue(nValueIn) {}

    //! Returns false and leaves the amount unchanged if the sum does not fit.
    bool Add(uint64_t amount)
    {
        if (amount > UINT64_MAX - nValue) {
            return false;
        }
        nValue += amount;
        return true;
    }

    void Sub(uint64_t amount)
    {
        nValue = amount >= nValue ? 0 : nValue - amount;
    }

    bool Covers(uint64_t threshold) const { return nValue >= threshold; }
    bool IsZero() const { return nValue == 0; }
    void SetZero() { nValue = 0; }

    uint64_t Reveal() const { return nValue; }

    /** Hex of the serialized ciphertext placeholder, used for display. */
    std::string GetHex() const;

    friend bool operator==(const EncryptedAmount& a, const EncryptedAmount& b) { return a.nValue == b.nValue; }
    friend bool operator!=(const EncryptedAmount& a, const EncryptedAmount& b) { return a.nValue != b.nValue; }

    SERIALIZE_METHODS(EncryptedAmount, obj)
    {
        READWRITE(obj.nValue);
    }
};

#endif // ZKLEND_LENDING_ENCRYPTEDAMOUNT_H
