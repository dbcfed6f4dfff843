// Copyright (c) 2025 The ZKLend developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "lending/lending.h"

namespace {

struct LendErrorDesc
{
    LendError err;
    const char* reason;
};

const LendErrorDesc LendErrorReasons[] =
{
    {LendError::INVALID_PROOF, "bad-lend-invalid-proof"},
    {LendError::MATH_OVERFLOW, "bad-lend-math-overflow"},
    {LendError::INSUFFICIENT_COLLATERAL, "bad-lend-insufficient-collateral"},
    {LendError::INSUFFICIENT_LIQUIDITY, "bad-lend-insufficient-liquidity"},
    {LendError::REPAY_EXCEEDS_BORROW, "bad-lend-repay-exceeds-borrow"},
    {LendError::LIQUIDATION_NOT_ALLOWED, "bad-lend-liquidation-not-allowed"},
    {LendError::UNAUTHORIZED_VOTER, "bad-lend-unauthorized-voter"},
    {LendError::INVALID_PROPOSAL, "bad-lend-invalid-proposal"},
    {LendError::COLLATERAL_SUFFICIENT, "bad-lend-collateral-sufficient"},
    {LendError::COLLATERAL_LOCK_TIME_NOT_MET, "bad-lend-lock-time-not-met"},
    {LendError::UNAUTHORIZED_BORROWER, "bad-lend-unauthorized-borrower"},
    {LendError::BORROW_LIMIT_EXCEEDED, "bad-lend-borrow-limit-exceeded"},
    {LendError::TRANSFER_FAILED, "bad-lend-transfer-failed"},
    {LendError::RECORD_MISSING, "bad-lend-record-missing"},
    {LendError::RECORD_EXISTS, "bad-lend-record-exists"},
};

} // anonymous namespace

std::string LendErrorReason(LendError err)
{
    for (const LendErrorDesc& desc : LendErrorReasons) {
        if (desc.err == err) {
            return desc.reason;
        }
    }
    return "bad-lend-unknown";
}

LendError GetLendError(const CValidationState& state)
{
    if (state.IsValid()) {
        return LendError::NONE;
    }
    const std::string reason = state.GetRejectReason();
    for (const LendErrorDesc& desc : LendErrorReasons) {
        if (reason == desc.reason) {
            return desc.err;
        }
    }
    return LendError::UNKNOWN;
}

bool LendReject(CValidationState& state, LendError err, const std::string& strDebug)
{
    return state.DoS(100, false, REJECT_INVALID, LendErrorReason(err), false, strDebug);
}
