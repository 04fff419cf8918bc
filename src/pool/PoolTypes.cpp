// Copyright 2021 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "pool/PoolTypes.h"
#include "util/types.h"

#include <fmt/format.h>
#include <stdexcept>

namespace cpamm
{

bool
PoolSnapshot::operator==(PoolSnapshot const& other) const
{
    return reserveX == other.reserveX && reserveY == other.reserveY &&
           totalPoolShares == other.totalPoolShares &&
           feeBps == other.feeBps && shareDecimals == other.shareDecimals &&
           locked == other.locked;
}

bool
PoolSnapshot::operator!=(PoolSnapshot const& other) const
{
    return !(*this == other);
}

PoolEffect
PoolEffect::transfer(PoolToken token, PoolParty from, PoolParty to,
                     uint64_t amount)
{
    PoolEffect e;
    e.type = POOL_EFFECT_TRANSFER;
    e.token = token;
    e.from = from;
    e.to = to;
    e.amount = amount;
    return e;
}

PoolEffect
PoolEffect::mint(PoolToken token, PoolParty to, uint64_t amount)
{
    PoolEffect e;
    e.type = POOL_EFFECT_MINT;
    e.token = token;
    e.from = POOL_PARTY_VAULT;
    e.to = to;
    e.amount = amount;
    return e;
}

PoolEffect
PoolEffect::burn(PoolToken token, PoolParty from, uint64_t amount)
{
    PoolEffect e;
    e.type = POOL_EFFECT_BURN;
    e.token = token;
    e.from = from;
    e.to = POOL_PARTY_VAULT;
    e.amount = amount;
    return e;
}

bool
PoolEffect::operator==(PoolEffect const& other) const
{
    return type == other.type && token == other.token && from == other.from &&
           to == other.to && amount == other.amount;
}

PoolOperationType
PoolOperation::type() const
{
    return static_cast<PoolOperationType>(body.index());
}

DepositRequest const&
PoolOperation::deposit() const
{
    return std::get<DepositRequest>(body);
}

WithdrawRequest const&
PoolOperation::withdraw() const
{
    return std::get<WithdrawRequest>(body);
}

SwapRequest const&
PoolOperation::swap() const
{
    return std::get<SwapRequest>(body);
}

PoolOperation
PoolOperation::makeDeposit(uint64_t shareAmount, uint64_t maxAmountX,
                           uint64_t maxAmountY)
{
    PoolOperation op;
    op.body = DepositRequest{shareAmount, maxAmountX, maxAmountY};
    return op;
}

PoolOperation
PoolOperation::makeWithdraw(uint64_t shareAmount, uint64_t minAmountX,
                            uint64_t minAmountY)
{
    PoolOperation op;
    op.body = WithdrawRequest{shareAmount, minAmountX, minAmountY};
    return op;
}

PoolOperation
PoolOperation::makeSwap(PoolAsset inputSide, uint64_t inputAmount,
                        uint64_t minOutput)
{
    PoolOperation op;
    op.body = SwapRequest{inputSide, inputAmount, minOutput};
    return op;
}

PoolToken
toPoolToken(PoolAsset asset)
{
    return asset == POOL_ASSET_X ? POOL_TOKEN_X : POOL_TOKEN_Y;
}

PoolAsset
otherAsset(PoolAsset asset)
{
    return asset == POOL_ASSET_X ? POOL_ASSET_Y : POOL_ASSET_X;
}

std::string
toString(PoolResultCode code)
{
    switch (code)
    {
    case POOL_SUCCESS:
        return "POOL_SUCCESS";
    case POOL_LOCKED:
        return "POOL_LOCKED";
    case POOL_INVALID_AMOUNT:
        return "POOL_INVALID_AMOUNT";
    case POOL_SLIPPAGE_EXCEEDED:
        return "POOL_SLIPPAGE_EXCEEDED";
    case POOL_ARITHMETIC_OVERFLOW:
        return "POOL_ARITHMETIC_OVERFLOW";
    case POOL_UNDEFINED_PRICE:
        return "POOL_UNDEFINED_PRICE";
    case POOL_INSUFFICIENT_LIQUIDITY:
        return "POOL_INSUFFICIENT_LIQUIDITY";
    case POOL_EFFECT_FAILED:
        return "POOL_EFFECT_FAILED";
    }
    return "UNKNOWN";
}

std::string
toString(PoolTransactionResultCode code)
{
    switch (code)
    {
    case txSUCCESS:
        return "txSUCCESS";
    case txFAILED:
        return "txFAILED";
    case txMISSING_OPERATION:
        return "txMISSING_OPERATION";
    case txNO_ACCOUNT:
        return "txNO_ACCOUNT";
    }
    return "UNKNOWN";
}

std::string
toString(PoolOperationType type)
{
    switch (type)
    {
    case POOL_DEPOSIT:
        return "deposit";
    case POOL_WITHDRAW:
        return "withdraw";
    case POOL_SWAP:
        return "swap";
    }
    return "unknown";
}

std::string
toString(PoolAsset asset)
{
    return asset == POOL_ASSET_X ? "X" : "Y";
}

std::string
toString(PoolToken token)
{
    switch (token)
    {
    case POOL_TOKEN_X:
        return "X";
    case POOL_TOKEN_Y:
        return "Y";
    case POOL_TOKEN_SHARE:
        return "SHARE";
    }
    return "?";
}

static char const*
partyName(PoolParty party)
{
    return party == POOL_PARTY_USER ? "user" : "vault";
}

std::string
toString(PoolEffect const& effect)
{
    switch (effect.type)
    {
    case POOL_EFFECT_TRANSFER:
        return fmt::format(FMT_STRING("transfer {} {} {} -> {}"),
                           effect.amount, toString(effect.token),
                           partyName(effect.from), partyName(effect.to));
    case POOL_EFFECT_MINT:
        return fmt::format(FMT_STRING("mint {} {} -> {}"), effect.amount,
                           toString(effect.token), partyName(effect.to));
    case POOL_EFFECT_BURN:
        return fmt::format(FMT_STRING("burn {} {} <- {}"), effect.amount,
                           toString(effect.token), partyName(effect.from));
    }
    return "unknown effect";
}

std::string
toString(PoolSnapshot const& snapshot)
{
    return fmt::format(
        FMT_STRING("reserveX={} reserveY={} totalPoolShares={} feeBps={} "
                   "shareDecimals={} locked={}"),
        snapshot.reserveX, snapshot.reserveY, snapshot.totalPoolShares,
        snapshot.feeBps, snapshot.shareDecimals, snapshot.locked);
}

std::string
toString(PoolOperationResult const& result)
{
    if (result.code != POOL_SUCCESS)
    {
        return fmt::format(FMT_STRING("{} {}"), toString(result.type),
                           toString(result.code));
    }
    if (result.type == POOL_SWAP)
    {
        return fmt::format(FMT_STRING("swap {} in={} out={}"),
                           toString(result.code), result.swap.deposit,
                           result.swap.withdraw);
    }
    return fmt::format(FMT_STRING("{} {} x={} y={} shares={}"),
                       toString(result.type), toString(result.code),
                       result.amounts.amountX, result.amounts.amountY,
                       result.shareAmount);
}

PoolAsset
poolAssetFromString(std::string const& name)
{
    if (iequals(name, "X"))
    {
        return POOL_ASSET_X;
    }
    if (iequals(name, "Y"))
    {
        return POOL_ASSET_Y;
    }
    throw std::invalid_argument(
        fmt::format(FMT_STRING("unknown pool asset '{}'"), name));
}
}
