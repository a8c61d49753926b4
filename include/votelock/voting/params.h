// VOTELOCK - Voting Parameters
// Copyright (c) 2024 VOTELOCK Developers
// MIT License
//
// Constants, result codes and epoch helpers shared by the voting modules.

#ifndef VOTELOCK_VOTING_PARAMS_H
#define VOTELOCK_VOTING_PARAMS_H

#include <votelock/core/types.h>

namespace votelock {
namespace voting {

// ============================================================================
// Voting Constants
// ============================================================================

/// Epoch width; slope changes are only ever scheduled on epoch boundaries
constexpr Timestamp EPOCH_LENGTH = WEEK;

/// Maximum weekly steps a single rolling pass advances a global point.
/// Pools idle for longer must be checkpointed within this window.
constexpr int MAX_ROLLING_WEEKS = 64;

/// Minimum lock duration at creation
constexpr Timestamp MIN_LOCK_DURATION = WEEK;

/// First lock id handed out
constexpr LockId FIRST_LOCK_ID = 1;

// ============================================================================
// Result Codes
// ============================================================================

enum class VotingError {
    OK = 0,

    // Access control
    UNAUTHORIZED,

    // Pool configuration
    ALREADY_CONFIGURED,
    MULTIPLIER_TOO_LOW,
    INVALID_MAX_LOCK_DURATION,
    POOL_NOT_CONFIGURED,

    // Lock validity
    ZERO_LOCK,
    NEGATIVE_BALANCE,
    UNLOCK_TIME_NOT_ALIGNED,
    LOCK_TOO_SHORT,
    LOCK_TOO_LONG,
    ONLY_EXTENSIONS,
    NO_LOCK_FOUND,
    LOCK_EXPIRED,

    // Arithmetic and ordering
    ARITHMETIC_OVERFLOW,
    STALE_TIMESTAMP,

    // Queries
    TIMESTAMP_IN_FUTURE
};

/// Convert result code to string
const char* VotingErrorToString(VotingError error);

// ============================================================================
// Epoch Helpers
// ============================================================================

/// Start of the epoch containing t (floor to a multiple of EPOCH_LENGTH)
inline Timestamp EpochAlign(Timestamp t) {
    Timestamp q = t / EPOCH_LENGTH;
    if (t % EPOCH_LENGTH != 0 && t < 0) {
        --q;
    }
    return q * EPOCH_LENGTH;
}

inline bool IsEpochAligned(Timestamp t) {
    return t % EPOCH_LENGTH == 0;
}

} // namespace voting
} // namespace votelock

#endif // VOTELOCK_VOTING_PARAMS_H
