#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

/**
 * @file LedgerErrors.hpp
 * @brief Исключения движка сверки склада и денег
 *
 * Все ошибки наследуются от LedgerException (std::runtime_error).
 * HTTP-слой переводит их в статусы:
 * ValidationError → 400, NotFoundError → 404,
 * DuplicateReference/DuplicateTransaction → 200 (идемпотентный повтор),
 * InsufficientStock / AlreadyApproved / BalanceMismatch / InvalidState → 409,
 * ConcurrencyTimeoutError → 503.
 */

namespace pharmacy::domain {

class LedgerException : public std::runtime_error {
public:
    explicit LedgerException(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Хранилище: по (reference_type, reference_id) уже есть записи
 */
class ConflictError : public LedgerException {
public:
    explicit ConflictError(const std::string& referenceKey)
        : LedgerException("Reference already recorded: " + referenceKey)
        , referenceKey_(referenceKey) {}

    const std::string& referenceKey() const { return referenceKey_; }

private:
    std::string referenceKey_;
};

/**
 * @brief Хранилище: голова журнала сущности сдвинулась (повторяемая)
 */
class ConcurrencyConflict : public LedgerException {
public:
    explicit ConcurrencyConflict(const std::string& entityKey)
        : LedgerException("Ledger head moved for " + entityKey)
        , entityKey_(entityKey) {}

    const std::string& entityKey() const { return entityKey_; }

private:
    std::string entityKey_;
};

/**
 * @brief Складское событие с этой ссылкой уже применено
 */
class DuplicateReferenceError : public LedgerException {
public:
    explicit DuplicateReferenceError(const std::string& referenceKey)
        : LedgerException("Reference already applied: " + referenceKey)
        , referenceKey_(referenceKey) {}

    const std::string& referenceKey() const { return referenceKey_; }

private:
    std::string referenceKey_;
};

/**
 * @brief Строка выписки с таким tran_id уже импортирована
 */
class DuplicateTransactionError : public LedgerException {
public:
    explicit DuplicateTransactionError(const std::string& tranId)
        : LedgerException("Transaction already imported: " + tranId)
        , tranId_(tranId) {}

    const std::string& tranId() const { return tranId_; }

private:
    std::string tranId_;
};

class InsufficientStockError : public LedgerException {
public:
    InsufficientStockError(const std::string& entityKey, int64_t requested, int64_t available)
        : LedgerException("Insufficient stock for " + entityKey +
                          ": requested " + std::to_string(requested) +
                          ", available " + std::to_string(available))
        , entityKey_(entityKey)
        , requested_(requested)
        , available_(available) {}

    const std::string& entityKey() const { return entityKey_; }
    int64_t requested() const { return requested_; }
    int64_t available() const { return available_; }

private:
    std::string entityKey_;
    int64_t requested_;
    int64_t available_;
};

/**
 * @brief Остаток в выписке не совпал с вычисленным; строка сохранена как FLAGGED
 */
class BalanceMismatchError : public LedgerException {
public:
    BalanceMismatchError(const std::string& tranId, int64_t entryId,
                         const std::string& expected, const std::string& declared)
        : LedgerException("Balance mismatch for " + tranId +
                          ": computed " + expected + ", declared " + declared)
        , tranId_(tranId)
        , entryId_(entryId)
        , expected_(expected)
        , declared_(declared) {}

    const std::string& tranId() const { return tranId_; }
    int64_t entryId() const { return entryId_; }
    const std::string& expected() const { return expected_; }
    const std::string& declared() const { return declared_; }

private:
    std::string tranId_;
    int64_t entryId_;
    std::string expected_;
    std::string declared_;
};

/**
 * @brief Не удалось захватить блокировку за отведённое число попыток (повторяемая)
 */
class ConcurrencyTimeoutError : public LedgerException {
public:
    explicit ConcurrencyTimeoutError(const std::string& what)
        : LedgerException("Concurrency timeout: " + what) {}
};

class AlreadyApprovedError : public LedgerException {
public:
    AlreadyApprovedError(int64_t entryId, const std::string& approvedBy)
        : LedgerException("Entry " + std::to_string(entryId) + " already approved by " + approvedBy)
        , entryId_(entryId)
        , approvedBy_(approvedBy) {}

    int64_t entryId() const { return entryId_; }
    const std::string& approvedBy() const { return approvedBy_; }

private:
    int64_t entryId_;
    std::string approvedBy_;
};

class InvalidStateError : public LedgerException {
public:
    explicit InvalidStateError(const std::string& message)
        : LedgerException(message) {}
};

class NotFoundError : public LedgerException {
public:
    explicit NotFoundError(const std::string& message)
        : LedgerException(message) {}
};

class ValidationError : public LedgerException {
public:
    explicit ValidationError(const std::string& message)
        : LedgerException(message) {}
};

} // namespace pharmacy::domain
