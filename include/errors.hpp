#pragma once

#include <stdexcept>
#include <string>

namespace wh {

enum class ErrorCategory { Validation, Phase, Integrity, Authorization, Host };

enum class ErrorCode {
    // Validation
    DescriptionTooLong,
    SymbolTooLong,
    InvalidDeadlines,
    ZeroStake,
    StakeBelowMinimum,
    DuplicateCommitment,
    // Phase
    CommitPhaseEnded,
    CommitPhaseNotEnded,
    RevealPhaseEnded,
    RevealPhaseNotEnded,
    AlreadyRevealed,
    AlreadyFinalized,
    AlreadySettled,
    InvalidTopicState,
    // Integrity
    HashMismatch,
    UnknownParticipant,
    PartialSettlementNotAllowed,
    DuplicateSettlementEntry,
    ArithmeticOverflow,
    // Authorization
    UnauthorizedOracle,
    // Host
    TopicAlreadyExists,
    TopicNotFound,
    InsufficientFunds,
    CorruptAccountData,
};

const char* errorName(ErrorCode code);
const char* errorMessage(ErrorCode code);
ErrorCategory errorCategory(ErrorCode code);
const char* categoryName(ErrorCategory category);

// Every rejected instruction surfaces as a ProgramError; the host discards the
// instruction's staged writes before it propagates.
class ProgramError : public std::runtime_error {
public:
    explicit ProgramError(ErrorCode code);
    ProgramError(ErrorCode code, const std::string& detail);

    ErrorCode code() const { return code_; }
    ErrorCategory category() const { return errorCategory(code_); }

private:
    ErrorCode code_;
};

} // namespace wh
