#pragma once

#include "ports/output/IBankEntryRepository.hpp"
#include <algorithm>
#include <map>
#include <mutex>
#include <unordered_map>

namespace pharmacy::adapters::secondary {

/**
 * @brief In-memory строки выписки
 *
 * markApproved выполняет проверку и запись под одной блокировкой,
 * как UPDATE ... WHERE approved_by IS NULL в PostgreSQL-версии.
 */
class InMemoryBankEntryRepository : public ports::output::IBankEntryRepository {
public:
    std::optional<int64_t> insert(const domain::BankLedgerEntry& entry) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (byTranId_.count(entry.tranId)) {
            return std::nullopt;
        }
        domain::BankLedgerEntry stored = entry;
        stored.entryId = nextId_++;
        entries_[stored.entryId] = stored;
        byTranId_[stored.tranId] = stored.entryId;
        return stored.entryId;
    }

    std::optional<domain::BankLedgerEntry> findById(int64_t entryId) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(entryId);
        if (it == entries_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    std::optional<domain::BankLedgerEntry> findByTranId(const std::string& tranId) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = byTranId_.find(tranId);
        if (it == byTranId_.end()) {
            return std::nullopt;
        }
        return entries_.at(it->second);
    }

    std::vector<domain::BankLedgerEntry> findByAccount(const std::string& accountId) override {
        std::vector<domain::BankLedgerEntry> result;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            for (const auto& [id, entry] : entries_) {
                if (entry.accountId == accountId) {
                    result.push_back(entry);
                }
            }
        }
        sortChronologically(result);
        return result;
    }

    std::vector<domain::BankLedgerEntry> findUnreconciled(const std::optional<std::string>& accountId) override {
        std::vector<domain::BankLedgerEntry> result;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            for (const auto& [id, entry] : entries_) {
                if (accountId && entry.accountId != *accountId) continue;
                if (entry.status != domain::EntryStatus::IMPORTED || entry.approvedBy) continue;
                result.push_back(entry);
            }
        }
        sortChronologically(result);
        return result;
    }

    std::vector<domain::BankLedgerEntry> findCorrections(int64_t flaggedEntryId) override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<domain::BankLedgerEntry> result;
        for (const auto& [id, entry] : entries_) {
            if (entry.correctsEntryId && *entry.correctsEntryId == flaggedEntryId) {
                result.push_back(entry);
            }
        }
        return result;
    }

    bool markApproved(int64_t entryId, const std::string& approver, const domain::Timestamp& at) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(entryId);
        if (it == entries_.end()) {
            return false;
        }
        auto& entry = it->second;
        if (entry.approvedBy || entry.status != domain::EntryStatus::IMPORTED) {
            return false;
        }
        entry.approvedBy = approver;
        entry.approvedAt = at;
        entry.status = domain::EntryStatus::APPROVED;
        return true;
    }

    /**
     * @brief Удалить строку, вставленную в откатываемой транзакции
     */
    void erase(int64_t entryId) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(entryId);
        if (it == entries_.end()) {
            return;
        }
        byTranId_.erase(it->second.tranId);
        entries_.erase(it);
    }

private:
    std::mutex mutex_;
    std::map<int64_t, domain::BankLedgerEntry> entries_;
    std::unordered_map<std::string, int64_t> byTranId_;
    int64_t nextId_ = 1;

    static void sortChronologically(std::vector<domain::BankLedgerEntry>& entries) {
        std::sort(entries.begin(), entries.end(),
            [](const domain::BankLedgerEntry& a, const domain::BankLedgerEntry& b) {
                if (a.occurredAt != b.occurredAt) {
                    return a.occurredAt < b.occurredAt;
                }
                return a.entryId < b.entryId;
            });
    }
};

} // namespace pharmacy::adapters::secondary
