#pragma once

#include <stdexcept>
#include <string>

namespace escrow::domain {

enum class ErrorCode {
    INVALID_ARGUMENT,
    INVALID_STATE_TRANSITION,
    INSUFFICIENT_ESCROW_BALANCE,
    CONTENTION,
    CURRENCY_MISMATCH,
    NOT_FOUND
};

inline std::string toString(ErrorCode code) {
    switch (code) {
        case ErrorCode::INVALID_ARGUMENT: return "INVALID_ARGUMENT";
        case ErrorCode::INVALID_STATE_TRANSITION: return "INVALID_STATE_TRANSITION";
        case ErrorCode::INSUFFICIENT_ESCROW_BALANCE: return "INSUFFICIENT_ESCROW_BALANCE";
        case ErrorCode::CONTENTION: return "CONTENTION";
        case ErrorCode::CURRENCY_MISMATCH: return "CURRENCY_MISMATCH";
        case ErrorCode::NOT_FOUND: return "NOT_FOUND";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Базовое исключение escrow-домена
 *
 * Код ошибки определяет, как её обработает вызывающая сторона:
 * - INVALID_ARGUMENT, CURRENCY_MISMATCH: ошибка клиента, не повторять
 * - INVALID_STATE_TRANSITION: операция недопустима в текущем статусе
 * - INSUFFICIENT_ESCROW_BALANCE: нарушение инварианта, фатально
 * - CONTENTION: конфликт блокировки/версии, можно повторить с backoff
 */
class EscrowException : public std::runtime_error {
public:
    EscrowException(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    ErrorCode code() const { return code_; }

    bool isRetryable() const { return code_ == ErrorCode::CONTENTION; }

private:
    ErrorCode code_;
};

class InvalidArgumentException : public EscrowException {
public:
    explicit InvalidArgumentException(const std::string& message)
        : EscrowException(ErrorCode::INVALID_ARGUMENT, message) {}
};

class InvalidStateTransitionException : public EscrowException {
public:
    explicit InvalidStateTransitionException(const std::string& message)
        : EscrowException(ErrorCode::INVALID_STATE_TRANSITION, message) {}
};

class InsufficientEscrowBalanceException : public EscrowException {
public:
    explicit InsufficientEscrowBalanceException(const std::string& message)
        : EscrowException(ErrorCode::INSUFFICIENT_ESCROW_BALANCE, message) {}
};

class ContentionException : public EscrowException {
public:
    explicit ContentionException(const std::string& message)
        : EscrowException(ErrorCode::CONTENTION, message) {}
};

class CurrencyMismatchException : public EscrowException {
public:
    CurrencyMismatchException(const std::string& left, const std::string& right)
        : EscrowException(ErrorCode::CURRENCY_MISMATCH,
                          "Currency mismatch: " + left + " vs " + right) {}
};

class NotFoundException : public EscrowException {
public:
    explicit NotFoundException(const std::string& message)
        : EscrowException(ErrorCode::NOT_FOUND, message) {}
};

} // namespace escrow::domain
