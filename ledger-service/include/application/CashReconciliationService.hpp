// include/application/CashReconciliationService.hpp
#pragma once

#include "application/IdempotencyGuard.hpp"
#include "domain/errors/LedgerErrors.hpp"
#include "ports/input/IBalanceProjector.hpp"
#include "ports/input/ICashService.hpp"
#include "ports/output/IBankAccountRepository.hpp"
#include "ports/output/IBankEntryRepository.hpp"
#include "ports/output/ILedgerStore.hpp"
#include "settings/LedgerSettings.hpp"
#include <KeyedLockManager.hpp>
#include <algorithm>
#include <iostream>
#include <memory>
#include <thread>

namespace pharmacy::application {

/**
 * @brief Сервис сверки банковского счёта
 *
 * Импорт строки выписки:
 *   - tran_id уже есть → DuplicateTransactionError
 *   - running_balance = текущий остаток счёта ± amount
 *   - declared_balance расходится с вычисленным больше допуска →
 *     строка сохраняется FLAGGED без движения в журнале, BalanceMismatchError
 *   - иначе CR/DR дописывается в журнал, строка сохраняется IMPORTED
 *
 * Заявка tran_id, движение и строка выписки фиксируются одной транзакцией append.
 *
 * Статусы: IMPORTED → APPROVED (финальный), IMPORTED → FLAGGED (ждёт resolveFlagged).
 */
class CashReconciliationService : public ports::input::ICashService {
public:
    CashReconciliationService(
        std::shared_ptr<ports::output::ILedgerStore> store,
        std::shared_ptr<ports::input::IBalanceProjector> projector,
        std::shared_ptr<IdempotencyGuard> guard,
        std::shared_ptr<ports::output::IBankAccountRepository> accounts,
        std::shared_ptr<ports::output::IBankEntryRepository> entries,
        std::shared_ptr<KeyedLockManager> locks,
        std::shared_ptr<settings::LedgerSettings> settings
    ) : store_(std::move(store))
      , projector_(std::move(projector))
      , guard_(std::move(guard))
      , accounts_(std::move(accounts))
      , entries_(std::move(entries))
      , locks_(std::move(locks))
      , settings_(std::move(settings))
    {}

    domain::BankAccount openAccount(const std::string& accountId, const domain::Money& openingBalance) override {
        if (accountId.empty()) {
            throw domain::ValidationError("account_id is required");
        }
        if (accountId.find('#') != std::string::npos) {
            throw domain::ValidationError("account_id must not contain '#'");
        }

        domain::BankAccount account;
        account.accountId = accountId;
        account.openingBalance = openingBalance;
        account.currency = openingBalance.currency;
        account.openedAt = domain::Timestamp::now();

        if (accounts_->insertIfAbsent(account)) {
            std::cout << "[CashReconciliationService] Opened account " << accountId
                      << " with " << openingBalance.toString() << std::endl;
            return account;
        }

        auto existing = accounts_->find(accountId);
        if (!existing) {
            throw domain::NotFoundError("Account not found: " + accountId);
        }
        if (existing->openingBalance != openingBalance) {
            throw domain::InvalidStateError("Account " + accountId + " already opened with balance " +
                                            existing->openingBalance.toString());
        }
        return *existing;
    }

    domain::BankLedgerEntry importStatementEntry(const domain::StatementEntryRequest& request) override {
        return importEntry(request, std::nullopt);
    }

    domain::BankLedgerEntry approve(int64_t entryId, const std::string& approver) override {
        if (approver.empty()) {
            throw domain::ValidationError("approver is required");
        }

        auto entry = entries_->findById(entryId);
        if (!entry) {
            throw domain::NotFoundError("Bank entry not found: " + std::to_string(entryId));
        }
        if (entry->status == domain::EntryStatus::FLAGGED) {
            throw domain::InvalidStateError("Entry " + std::to_string(entryId) +
                                            " is FLAGGED and must be resolved, not approved");
        }
        if (entry->approvedBy) {
            throw domain::AlreadyApprovedError(entryId, *entry->approvedBy);
        }

        auto now = domain::Timestamp::now();
        if (!entries_->markApproved(entryId, approver, now)) {
            // Проиграли гонку: строку утвердил кто-то другой
            auto winner = entries_->findById(entryId);
            throw domain::AlreadyApprovedError(entryId, winner && winner->approvedBy ? *winner->approvedBy : "unknown");
        }

        std::cout << "[CashReconciliationService] Entry " << entryId << " approved by " << approver << std::endl;

        auto approved = entries_->findById(entryId);
        if (!approved) {
            throw domain::NotFoundError("Bank entry not found: " + std::to_string(entryId));
        }
        return *approved;
    }

    std::vector<domain::BankLedgerEntry> unreconciled(const std::optional<std::string>& accountId) override {
        return entries_->findUnreconciled(accountId);
    }

    domain::BankLedgerEntry resolveFlagged(int64_t entryId, const domain::FlagResolution& resolution) override {
        auto flagged = entries_->findById(entryId);
        if (!flagged) {
            throw domain::NotFoundError("Bank entry not found: " + std::to_string(entryId));
        }
        if (flagged->status != domain::EntryStatus::FLAGGED) {
            throw domain::InvalidStateError("Entry " + std::to_string(entryId) + " is not FLAGGED");
        }

        auto corrections = entries_->findCorrections(entryId);

        domain::StatementEntryRequest request;
        request.accountId = flagged->accountId;
        request.tranId = flagged->tranId + "-R" + std::to_string(corrections.size() + 1);
        request.occurredAt = resolution.occurredAt.value_or(flagged->occurredAt);
        request.direction = resolution.direction;
        request.amount = resolution.amount;
        request.description = resolution.description.empty()
            ? "Correction of " + flagged->tranId
            : resolution.description;
        request.reference = flagged->reference;
        request.declaredBalance = resolution.declaredBalance;

        std::cout << "[CashReconciliationService] Resolving flagged " << flagged->tranId
                  << " with " << request.tranId << std::endl;
        return importEntry(request, entryId);
    }

    domain::Money balance(const std::string& accountId) override {
        auto account = requireAccount(accountId);
        return domain::Money(projector_->current(domain::LedgerDomain::CASH, accountId), account.currency);
    }

    domain::Money balanceAsOf(const std::string& accountId, const domain::Timestamp& at) override {
        auto account = requireAccount(accountId);
        return domain::Money(projector_->asOf(domain::LedgerDomain::CASH, accountId, at), account.currency);
    }

    std::vector<domain::BankLedgerEntry> statement(const std::string& accountId,
                                                   const std::optional<domain::Timestamp>& from,
                                                   const std::optional<domain::Timestamp>& to) override {
        requireAccount(accountId);

        std::vector<domain::BankLedgerEntry> result;
        for (auto& entry : entries_->findByAccount(accountId)) {
            if (from && entry.occurredAt < *from) continue;
            if (to && entry.occurredAt > *to) continue;
            result.push_back(std::move(entry));
        }
        std::reverse(result.begin(), result.end());
        return result;
    }

    domain::ContinuityReport verifyContinuity(const std::string& accountId) override {
        auto account = requireAccount(accountId);

        domain::ContinuityReport report;
        report.accountId = accountId;

        int64_t balance = account.openingBalance.minor;
        for (const auto& entry : entries_->findByAccount(accountId)) {
            if (entry.status == domain::EntryStatus::FLAGGED) {
                continue;
            }
            balance += entry.signedAmount();
            ++report.checkedEntries;
            if (entry.runningBalance.minor != balance && !report.firstBrokenEntryId) {
                report.firstBrokenEntryId = entry.entryId;
            }
        }

        report.replayedBalance = domain::Money(balance, account.currency);
        report.projectedBalance = domain::Money(projector_->current(domain::LedgerDomain::CASH, accountId),
                                                account.currency);
        report.continuous = !report.firstBrokenEntryId && report.replayedBalance == report.projectedBalance;

        if (!report.continuous) {
            std::cerr << "[CashReconciliationService] Continuity broken for " << accountId
                      << ": replayed=" << report.replayedBalance.toString()
                      << " projected=" << report.projectedBalance.toString() << std::endl;
        }
        return report;
    }

private:
    std::shared_ptr<ports::output::ILedgerStore> store_;
    std::shared_ptr<ports::input::IBalanceProjector> projector_;
    std::shared_ptr<IdempotencyGuard> guard_;
    std::shared_ptr<ports::output::IBankAccountRepository> accounts_;
    std::shared_ptr<ports::output::IBankEntryRepository> entries_;
    std::shared_ptr<KeyedLockManager> locks_;
    std::shared_ptr<settings::LedgerSettings> settings_;

    domain::BankAccount requireAccount(const std::string& accountId) {
        auto account = accounts_->find(accountId);
        if (!account) {
            throw domain::NotFoundError("Account not found: " + accountId);
        }
        return *account;
    }

    static void validate(const domain::StatementEntryRequest& request) {
        if (request.tranId.empty()) {
            throw domain::ValidationError("tran_id is required");
        }
        if (request.direction != domain::MovementKind::CR && request.direction != domain::MovementKind::DR) {
            throw domain::ValidationError("direction must be CR or DR");
        }
        if (!request.amount.isPositive()) {
            throw domain::ValidationError("amount must be positive");
        }
    }

    domain::BankLedgerEntry importEntry(const domain::StatementEntryRequest& request,
                                        const std::optional<int64_t>& correctsEntryId) {
        validate(request);
        auto account = requireAccount(request.accountId);

        auto reference = domain::Reference::of(domain::ReferenceType::BANK_STATEMENT, request.tranId);
        if (entries_->findByTranId(request.tranId) || guard_->isClaimed(reference)) {
            std::cout << "[CashReconciliationService] Duplicate tran_id: " << request.tranId << std::endl;
            throw domain::DuplicateTransactionError(request.tranId);
        }

        domain::BankLedgerEntry entry;
        entry.accountId = request.accountId;
        entry.tranId = request.tranId;
        entry.occurredAt = request.occurredAt;
        entry.direction = request.direction;
        entry.amount = domain::Money(request.amount.minor, account.currency);
        entry.declaredBalance = request.declaredBalance;
        entry.description = domain::truncateDescription(request.description);
        entry.reference = request.reference;
        entry.correctsEntryId = correctsEntryId;
        entry.importedAt = domain::Timestamp::now();

        for (int attempt = 1; attempt <= settings_->getLockAttempts(); ++attempt) {
            auto lease = locks_->tryAcquire({request.accountId}, settings_->getLockTimeout());
            if (!lease) {
                std::cout << "[CashReconciliationService] Lock busy, attempt " << attempt << std::endl;
                std::this_thread::sleep_for(std::chrono::milliseconds(5 * attempt));
                continue;
            }

            requireInOrder(entry);

            auto head = store_->head(request.accountId);
            int64_t computed = projector_->current(domain::LedgerDomain::CASH, request.accountId)
                               + entry.signedAmount();
            entry.runningBalance = domain::Money(computed, account.currency);

            bool flagged = request.declaredBalance && mismatches(*request.declaredBalance, entry.runningBalance);
            std::vector<domain::LedgerEntry> movements;
            if (flagged) {
                // Строка FLAGGED без движения; tran_id остаётся занятым
                entry.status = domain::EntryStatus::FLAGGED;
                entry.ledgerEntryId.reset();
            } else {
                entry.status = domain::EntryStatus::IMPORTED;
                domain::LedgerEntry movement;
                movement.domain = domain::LedgerDomain::CASH;
                movement.entityKey = request.accountId;
                movement.signedAmount = entry.signedAmount();
                movement.kind = request.direction;
                movement.reference = reference;
                movement.occurredAt = request.occurredAt;
                movement.remarks = entry.description;
                movements.push_back(movement);
            }

            auto work = [&](const domain::EntryIds& ids, ports::output::ILedgerTransaction& tx) {
                if (!guard_->claim(tx, reference)) {
                    throw domain::DuplicateTransactionError(request.tranId);
                }
                if (!ids.empty()) {
                    entry.ledgerEntryId = ids.front();
                }
                auto id = tx.insertBankEntry(entry);
                if (!id) {
                    throw domain::DuplicateTransactionError(request.tranId);
                }
                entry.entryId = *id;
            };

            try {
                store_->append(movements, {{request.accountId, head}}, work);
            } catch (const domain::ConcurrencyConflict& e) {
                std::cout << "[CashReconciliationService] " << e.what() << ", retrying" << std::endl;
                continue;
            } catch (const domain::ConflictError&) {
                throw domain::DuplicateTransactionError(request.tranId);
            }

            if (flagged) {
                std::cerr << "[CashReconciliationService] FLAGGED " << request.tranId
                          << ": computed " << entry.runningBalance.toString()
                          << ", declared " << request.declaredBalance->toString() << std::endl;
                throw domain::BalanceMismatchError(request.tranId, entry.entryId, entry.runningBalance.toString(),
                                                   request.declaredBalance->toString());
            }

            std::cout << "[CashReconciliationService] Imported " << request.tranId << " "
                      << domain::toString(request.direction) << " " << entry.amount.toString()
                      << " -> " << entry.runningBalance.toString() << std::endl;
            return entry;
        }

        std::cerr << "[CashReconciliationService] Gave up after " << settings_->getLockAttempts()
                  << " attempts, tran_id=" << request.tranId << std::endl;
        throw domain::ConcurrencyTimeoutError("statement entry " + request.tranId);
    }

    bool mismatches(const domain::Money& declared, const domain::Money& computed) const {
        int64_t diff = declared.minor - computed.minor;
        if (diff < 0) {
            diff = -diff;
        }
        return diff > settings_->getBalanceTolerance().minor;
    }

    /**
     * @brief Строки выписки импортируются в хронологическом порядке
     *
     * running_balance считается от текущего остатка, поэтому строка
     * задним числом нарушила бы непрерывность уже принятых строк.
     */
    void requireInOrder(const domain::BankLedgerEntry& entry) {
        auto accepted = entries_->findByAccount(entry.accountId);
        for (auto it = accepted.rbegin(); it != accepted.rend(); ++it) {
            if (it->status == domain::EntryStatus::FLAGGED) {
                continue;
            }
            if (entry.occurredAt < it->occurredAt) {
                throw domain::ValidationError("Statement line " + entry.tranId + " at " +
                                              entry.occurredAt.toString() + " is older than " +
                                              it->tranId + " at " + it->occurredAt.toString());
            }
            return;
        }
    }
};

} // namespace pharmacy::application
