#pragma once

// Copyright 2021 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace cpamm
{

// fee is expressed in basis points of the input amount
static constexpr uint32_t FEE_BPS_DENOMINATOR = 10000;
static constexpr uint32_t DEFAULT_SHARE_DECIMALS = 6;

enum PoolAsset
{
    POOL_ASSET_X = 0,
    POOL_ASSET_Y = 1
};

enum PoolToken
{
    POOL_TOKEN_X = 0,
    POOL_TOKEN_Y = 1,
    POOL_TOKEN_SHARE = 2
};

// The two endpoints of a transfer: the account that submitted the operation
// and the pool's custodial vault.
enum PoolParty
{
    POOL_PARTY_USER = 0,
    POOL_PARTY_VAULT = 1
};

enum PoolResultCode
{
    // codes considered as "success" for the operation
    POOL_SUCCESS = 0,

    // codes considered as "failure" for the operation
    POOL_LOCKED = -1,               // administrative lock engaged
    POOL_INVALID_AMOUNT = -2,       // zero or out-of-domain request value
    POOL_SLIPPAGE_EXCEEDED = -3,    // computed amount violates a bound
    POOL_ARITHMETIC_OVERFLOW = -4,  // result does not fit in 64 bits
    POOL_UNDEFINED_PRICE = -5,      // zero reserve on the priced side
    POOL_INSUFFICIENT_LIQUIDITY = -6, // more than the pool holds
    POOL_EFFECT_FAILED = -7         // the ledger refused an effect
};

// Read-only view of a pool, owned by the ledger. Operations never mutate it,
// they compute the deltas the ledger has to apply.
struct PoolSnapshot
{
    uint64_t reserveX{0};
    uint64_t reserveY{0};
    uint64_t totalPoolShares{0};
    uint32_t feeBps{0};
    uint32_t shareDecimals{DEFAULT_SHARE_DECIMALS};
    bool locked{false};

    bool operator==(PoolSnapshot const& other) const;
    bool operator!=(PoolSnapshot const& other) const;
};

struct DepositRequest
{
    uint64_t shareAmount{0};
    uint64_t maxAmountX{0};
    uint64_t maxAmountY{0};
};

struct WithdrawRequest
{
    uint64_t shareAmount{0};
    uint64_t minAmountX{0};
    uint64_t minAmountY{0};
};

struct SwapRequest
{
    PoolAsset inputSide{POOL_ASSET_X};
    uint64_t inputAmount{0};
    uint64_t minOutput{0};
};

// amounts moved by a deposit or a withdrawal
struct CurveResult
{
    uint64_t amountX{0};
    uint64_t amountY{0};
};

// amount taken in and amount paid out by a swap
struct SwapResult
{
    uint64_t deposit{0};
    uint64_t withdraw{0};
};

enum PoolEffectType
{
    POOL_EFFECT_TRANSFER = 0,
    POOL_EFFECT_MINT = 1,
    POOL_EFFECT_BURN = 2
};

// An instruction for the ledger. Mints only use `to`, burns only use `from`.
struct PoolEffect
{
    PoolEffectType type{POOL_EFFECT_TRANSFER};
    PoolToken token{POOL_TOKEN_X};
    PoolParty from{POOL_PARTY_USER};
    PoolParty to{POOL_PARTY_VAULT};
    uint64_t amount{0};

    static PoolEffect transfer(PoolToken token, PoolParty from, PoolParty to,
                               uint64_t amount);
    static PoolEffect mint(PoolToken token, PoolParty to, uint64_t amount);
    static PoolEffect burn(PoolToken token, PoolParty from, uint64_t amount);

    bool operator==(PoolEffect const& other) const;
};

enum PoolOperationType
{
    POOL_DEPOSIT = 0,
    POOL_WITHDRAW = 1,
    POOL_SWAP = 2
};

struct PoolOperation
{
    std::variant<DepositRequest, WithdrawRequest, SwapRequest> body;

    PoolOperationType type() const;

    DepositRequest const& deposit() const;
    WithdrawRequest const& withdraw() const;
    SwapRequest const& swap() const;

    static PoolOperation makeDeposit(uint64_t shareAmount, uint64_t maxAmountX,
                                     uint64_t maxAmountY);
    static PoolOperation makeWithdraw(uint64_t shareAmount,
                                      uint64_t minAmountX,
                                      uint64_t minAmountY);
    static PoolOperation makeSwap(PoolAsset inputSide, uint64_t inputAmount,
                                  uint64_t minOutput);
};

struct PoolOperationResult
{
    PoolOperationType type{POOL_DEPOSIT};
    PoolResultCode code{POOL_SUCCESS};

    // deposit and withdraw
    CurveResult amounts;
    uint64_t shareAmount{0};

    // swap
    SwapResult swap;

    // ledger instructions, empty unless code is POOL_SUCCESS
    std::vector<PoolEffect> effects;
};

enum PoolTransactionResultCode
{
    txSUCCESS = 0,
    txFAILED = -1,            // one of the operations failed
    txMISSING_OPERATION = -2, // no operation was specified
    txNO_ACCOUNT = -3         // source account not found
};

struct PoolTransactionResult
{
    PoolTransactionResultCode code{txSUCCESS};
    std::vector<PoolOperationResult> results;
};

PoolToken toPoolToken(PoolAsset asset);
PoolAsset otherAsset(PoolAsset asset);

std::string toString(PoolResultCode code);
std::string toString(PoolTransactionResultCode code);
std::string toString(PoolOperationType type);
std::string toString(PoolAsset asset);
std::string toString(PoolToken token);
std::string toString(PoolEffect const& effect);
std::string toString(PoolSnapshot const& snapshot);
std::string toString(PoolOperationResult const& result);

// throws std::invalid_argument on unknown names
PoolAsset poolAssetFromString(std::string const& name);
}
