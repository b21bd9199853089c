#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace tradebot {

/**
 * Broad error classification carried on every ExecutionResult.
 */
enum class ErrorKind : uint8_t {
    None = 0,
    Validation,          // Malformed input or configuration
    SafetyRejection,     // Blocked by a safety limit or trading rule
    ConcurrencyConflict, // Another trade for the bot holds the lock
    ExternalApi,         // Market data or broker failure
    DataIntegrity        // Duplicate or inconsistent records
};

inline const char* error_kind_to_string(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::None:
        return "None";
    case ErrorKind::Validation:
        return "ValidationError";
    case ErrorKind::SafetyRejection:
        return "SafetyRejection";
    case ErrorKind::ConcurrencyConflict:
        return "ConcurrencyConflict";
    case ErrorKind::ExternalApi:
        return "ExternalAPIError";
    case ErrorKind::DataIntegrity:
        return "DataIntegrityError";
    default:
        return "Unknown";
    }
}

// Precise reason a trade request was refused
enum class RejectReason : uint8_t {
    None = 0,
    BotNotFound,
    BotNotTradeable,
    InvalidSize,
    SizeBelowMinimum,
    SizeAboveMaximum,
    TemperatureTooLow,
    DailyTradeLimit,
    DailyLossLimit,
    PendingOrderExists,
    CooldownActive,
    TradeInProgress,
    PriceUnavailable,
    BrokerError
};

inline const char* reject_reason_to_string(RejectReason reason) {
    switch (reason) {
    case RejectReason::None:
        return "None";
    case RejectReason::BotNotFound:
        return "BotNotFound";
    case RejectReason::BotNotTradeable:
        return "BotNotTradeable";
    case RejectReason::InvalidSize:
        return "InvalidSize";
    case RejectReason::SizeBelowMinimum:
        return "SizeBelowMinimum";
    case RejectReason::SizeAboveMaximum:
        return "SizeAboveMaximum";
    case RejectReason::TemperatureTooLow:
        return "TemperatureTooLow";
    case RejectReason::DailyTradeLimit:
        return "DailyTradeLimit";
    case RejectReason::DailyLossLimit:
        return "DailyLossLimit";
    case RejectReason::PendingOrderExists:
        return "PendingOrderExists";
    case RejectReason::CooldownActive:
        return "CooldownActive";
    case RejectReason::TradeInProgress:
        return "TradeInProgress";
    case RejectReason::PriceUnavailable:
        return "PriceUnavailable";
    case RejectReason::BrokerError:
        return "BrokerError";
    default:
        return "Unknown";
    }
}

inline ErrorKind error_kind_for(RejectReason reason) {
    switch (reason) {
    case RejectReason::None:
        return ErrorKind::None;
    case RejectReason::BotNotFound:
    case RejectReason::InvalidSize:
        return ErrorKind::Validation;
    case RejectReason::TradeInProgress:
        return ErrorKind::ConcurrencyConflict;
    case RejectReason::PriceUnavailable:
    case RejectReason::BrokerError:
        return ErrorKind::ExternalApi;
    default:
        return ErrorKind::SafetyRejection;
    }
}

/**
 * Thrown by the configuration loader for documents that cannot be used.
 * Never thrown from the evaluation or execution paths.
 */
class ValidationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace tradebot
