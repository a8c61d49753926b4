// VOTELOCK - Voting Parameters Implementation
// Copyright (c) 2024 VOTELOCK Developers
// MIT License

#include <votelock/voting/params.h>

namespace votelock {
namespace voting {

const char* VotingErrorToString(VotingError error) {
    switch (error) {
        case VotingError::OK: return "OK";
        case VotingError::UNAUTHORIZED: return "UNAUTHORIZED";
        case VotingError::ALREADY_CONFIGURED: return "ALREADY_CONFIGURED";
        case VotingError::MULTIPLIER_TOO_LOW: return "MULTIPLIER_TOO_LOW";
        case VotingError::INVALID_MAX_LOCK_DURATION: return "INVALID_MAX_LOCK_DURATION";
        case VotingError::POOL_NOT_CONFIGURED: return "POOL_NOT_CONFIGURED";
        case VotingError::ZERO_LOCK: return "ZERO_LOCK";
        case VotingError::NEGATIVE_BALANCE: return "NEGATIVE_BALANCE";
        case VotingError::UNLOCK_TIME_NOT_ALIGNED: return "UNLOCK_TIME_NOT_ALIGNED";
        case VotingError::LOCK_TOO_SHORT: return "LOCK_TOO_SHORT";
        case VotingError::LOCK_TOO_LONG: return "LOCK_TOO_LONG";
        case VotingError::ONLY_EXTENSIONS: return "ONLY_EXTENSIONS";
        case VotingError::NO_LOCK_FOUND: return "NO_LOCK_FOUND";
        case VotingError::LOCK_EXPIRED: return "LOCK_EXPIRED";
        case VotingError::ARITHMETIC_OVERFLOW: return "ARITHMETIC_OVERFLOW";
        case VotingError::STALE_TIMESTAMP: return "STALE_TIMESTAMP";
        case VotingError::TIMESTAMP_IN_FUTURE: return "TIMESTAMP_IN_FUTURE";
        default: return "UNKNOWN";
    }
}

} // namespace voting
} // namespace votelock
