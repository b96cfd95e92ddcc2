#include "errors.hpp"

namespace wh {

namespace {

std::string describe(ErrorCode code, const std::string& detail) {
    std::string out = std::string(errorName(code)) + ": " + errorMessage(code);
    if (!detail.empty()) {
        out += " (" + detail + ")";
    }
    return out;
}

} // namespace

const char* errorName(ErrorCode code) {
    switch (code) {
    case ErrorCode::DescriptionTooLong: return "DescriptionTooLong";
    case ErrorCode::SymbolTooLong: return "SymbolTooLong";
    case ErrorCode::InvalidDeadlines: return "InvalidDeadlines";
    case ErrorCode::ZeroStake: return "ZeroStake";
    case ErrorCode::StakeBelowMinimum: return "StakeBelowMinimum";
    case ErrorCode::DuplicateCommitment: return "DuplicateCommitment";
    case ErrorCode::CommitPhaseEnded: return "CommitPhaseEnded";
    case ErrorCode::CommitPhaseNotEnded: return "CommitPhaseNotEnded";
    case ErrorCode::RevealPhaseEnded: return "RevealPhaseEnded";
    case ErrorCode::RevealPhaseNotEnded: return "RevealPhaseNotEnded";
    case ErrorCode::AlreadyRevealed: return "AlreadyRevealed";
    case ErrorCode::AlreadyFinalized: return "AlreadyFinalized";
    case ErrorCode::AlreadySettled: return "AlreadySettled";
    case ErrorCode::InvalidTopicState: return "InvalidTopicState";
    case ErrorCode::HashMismatch: return "HashMismatch";
    case ErrorCode::UnknownParticipant: return "UnknownParticipant";
    case ErrorCode::PartialSettlementNotAllowed: return "PartialSettlementNotAllowed";
    case ErrorCode::DuplicateSettlementEntry: return "DuplicateSettlementEntry";
    case ErrorCode::ArithmeticOverflow: return "ArithmeticOverflow";
    case ErrorCode::UnauthorizedOracle: return "UnauthorizedOracle";
    case ErrorCode::TopicAlreadyExists: return "TopicAlreadyExists";
    case ErrorCode::TopicNotFound: return "TopicNotFound";
    case ErrorCode::InsufficientFunds: return "InsufficientFunds";
    case ErrorCode::CorruptAccountData: return "CorruptAccountData";
    }
    return "Unknown";
}

const char* errorMessage(ErrorCode code) {
    switch (code) {
    case ErrorCode::DescriptionTooLong: return "Description too long (max 256 bytes)";
    case ErrorCode::SymbolTooLong: return "Symbol too long (max 32 bytes)";
    case ErrorCode::InvalidDeadlines: return "Invalid deadline configuration";
    case ErrorCode::ZeroStake: return "Stake amount must be greater than zero";
    case ErrorCode::StakeBelowMinimum: return "Stake amount is below the minimum required";
    case ErrorCode::DuplicateCommitment: return "Participant already committed to this topic";
    case ErrorCode::CommitPhaseEnded: return "Commit phase has ended";
    case ErrorCode::CommitPhaseNotEnded: return "Commit phase has not ended yet";
    case ErrorCode::RevealPhaseEnded: return "Reveal phase has ended";
    case ErrorCode::RevealPhaseNotEnded: return "Reveal phase has not ended yet";
    case ErrorCode::AlreadyRevealed: return "Commitment has already been revealed";
    case ErrorCode::AlreadyFinalized: return "Topic has already been finalized";
    case ErrorCode::AlreadySettled: return "Topic has already been settled";
    case ErrorCode::InvalidTopicState: return "Topic is not in the correct state for this operation";
    case ErrorCode::HashMismatch: return "Commitment hash does not match the revealed values";
    case ErrorCode::UnknownParticipant: return "No commitment exists for this participant";
    case ErrorCode::PartialSettlementNotAllowed:
        return "Settlement must cover every unsettled commitment the batch limit allows";
    case ErrorCode::DuplicateSettlementEntry: return "Participant listed more than once";
    case ErrorCode::ArithmeticOverflow: return "Arithmetic overflow in stake or reward calculation";
    case ErrorCode::UnauthorizedOracle: return "Unauthorized: only the truth authority can call this";
    case ErrorCode::TopicAlreadyExists: return "A topic with this id already exists";
    case ErrorCode::TopicNotFound: return "Topic does not exist";
    case ErrorCode::InsufficientFunds: return "Insufficient funds for transfer";
    case ErrorCode::CorruptAccountData: return "Account data failed to decode";
    }
    return "Unknown error";
}

ErrorCategory errorCategory(ErrorCode code) {
    switch (code) {
    case ErrorCode::DescriptionTooLong:
    case ErrorCode::SymbolTooLong:
    case ErrorCode::InvalidDeadlines:
    case ErrorCode::ZeroStake:
    case ErrorCode::StakeBelowMinimum:
    case ErrorCode::DuplicateCommitment:
        return ErrorCategory::Validation;
    case ErrorCode::CommitPhaseEnded:
    case ErrorCode::CommitPhaseNotEnded:
    case ErrorCode::RevealPhaseEnded:
    case ErrorCode::RevealPhaseNotEnded:
    case ErrorCode::AlreadyRevealed:
    case ErrorCode::AlreadyFinalized:
    case ErrorCode::AlreadySettled:
    case ErrorCode::InvalidTopicState:
        return ErrorCategory::Phase;
    case ErrorCode::HashMismatch:
    case ErrorCode::UnknownParticipant:
    case ErrorCode::PartialSettlementNotAllowed:
    case ErrorCode::DuplicateSettlementEntry:
    case ErrorCode::ArithmeticOverflow:
        return ErrorCategory::Integrity;
    case ErrorCode::UnauthorizedOracle:
        return ErrorCategory::Authorization;
    case ErrorCode::TopicAlreadyExists:
    case ErrorCode::TopicNotFound:
    case ErrorCode::InsufficientFunds:
    case ErrorCode::CorruptAccountData:
        return ErrorCategory::Host;
    }
    return ErrorCategory::Host;
}

const char* categoryName(ErrorCategory category) {
    switch (category) {
    case ErrorCategory::Validation: return "validation";
    case ErrorCategory::Phase: return "phase";
    case ErrorCategory::Integrity: return "integrity";
    case ErrorCategory::Authorization: return "authorization";
    case ErrorCategory::Host: return "host";
    }
    return "unknown";
}

ProgramError::ProgramError(ErrorCode code) : ProgramError(code, std::string()) {}

ProgramError::ProgramError(ErrorCode code, const std::string& detail)
    : std::runtime_error(describe(code, detail)), code_(code) {}

} // namespace wh
