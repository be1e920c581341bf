// include/application/StockReconciliationService.hpp
#pragma once

#include "application/IdempotencyGuard.hpp"
#include "domain/errors/LedgerErrors.hpp"
#include "ports/input/IBalanceProjector.hpp"
#include "ports/input/IStockService.hpp"
#include "ports/output/IDocumentRepository.hpp"
#include "ports/output/ILedgerStore.hpp"
#include "ports/output/IStockBatchRepository.hpp"
#include "settings/LedgerSettings.hpp"
#include <KeyedLockManager.hpp>
#include <algorithm>
#include <functional>
#include <iostream>
#include <map>
#include <memory>
#include <thread>

namespace pharmacy::application {

/**
 * @brief Сервис сверки склада: приход, продажа, корректировка
 *
 * Проверка "хватает ли остатка" и запись в журнал выполняются
 * под блокировкой ключей партий (KeyedLockManager) и дополнительно
 * защищены проверкой головы журнала в ILedgerStore::append.
 *
 * Попытка:
 *   1. захватить ключи всех партий события (не дождались - повтор с паузой)
 *   2. спроецировать остатки и проверить, что ни одна партия не уйдёт в минус
 *   3. одним append дописать все строки; в той же транзакции заявить ссылку
 *      в IdempotencyGuard, создать новые партии и сохранить документ
 *   4. ConcurrencyConflict - повтор
 *
 * Исчерпали попытки - ConcurrencyTimeoutError; ничего не записано.
 */
class StockReconciliationService : public ports::input::IStockService {
public:
    StockReconciliationService(
        std::shared_ptr<ports::output::ILedgerStore> store,
        std::shared_ptr<ports::input::IBalanceProjector> projector,
        std::shared_ptr<IdempotencyGuard> guard,
        std::shared_ptr<ports::output::IStockBatchRepository> batches,
        std::shared_ptr<ports::output::IDocumentRepository> documents,
        std::shared_ptr<KeyedLockManager> locks,
        std::shared_ptr<settings::LedgerSettings> settings
    ) : store_(std::move(store))
      , projector_(std::move(projector))
      , guard_(std::move(guard))
      , batches_(std::move(batches))
      , documents_(std::move(documents))
      , locks_(std::move(locks))
      , settings_(std::move(settings))
    {}

    // =========================================================================
    // Движения
    // =========================================================================

    domain::StockMovementResult receive(const domain::ReceiveRequest& request) override {
        requireBatch(request.batch);
        if (request.quantity <= 0) {
            throw domain::ValidationError("Receipt quantity must be positive");
        }
        if (request.unitCost.isNegative()) {
            throw domain::ValidationError("Unit cost must not be negative");
        }

        domain::ReceiptLine line;
        line.batch = request.batch;
        line.quantity = request.quantity;
        line.unitCost = request.unitCost;
        line.manufacturer = request.manufacturer;
        line.expiryDate = request.expiryDate;
        line.sellingPrice = request.sellingPrice;
        line.reorderLevel = request.reorderLevel;
        line.location = request.location;

        Movement movement;
        movement.batch = request.batch;
        movement.signedQuantity = request.quantity;
        movement.kind = domain::MovementKind::IN;
        movement.remarks = request.remarks.empty() ? "Receipt" : request.remarks;
        movement.newBatch = line;

        return applyMovements({movement}, request.reference,
                              request.occurredAt.value_or(domain::Timestamp::now()), nullptr);
    }

    domain::StockMovementResult sell(const domain::SellRequest& request) override {
        requireBatch(request.batch);
        if (request.quantity <= 0) {
            throw domain::ValidationError("Sale quantity must be positive");
        }
        if (request.unitPrice.isNegative()) {
            throw domain::ValidationError("Unit price must not be negative");
        }

        Movement movement;
        movement.batch = request.batch;
        movement.signedQuantity = -request.quantity;
        movement.kind = domain::MovementKind::OUT;
        movement.remarks = request.remarks.empty() ? "Sale" : request.remarks;

        return applyMovements({movement}, request.reference,
                              request.occurredAt.value_or(domain::Timestamp::now()), nullptr);
    }

    domain::StockMovementResult adjust(const domain::AdjustRequest& request) override {
        requireBatch(request.batch);
        if (request.delta == 0) {
            throw domain::ValidationError("Adjustment delta must not be zero");
        }
        if (request.reason.empty()) {
            throw domain::ValidationError("Adjustment reason is required");
        }

        Movement movement;
        movement.batch = request.batch;
        movement.signedQuantity = request.delta;
        movement.kind = domain::MovementKind::ADJUST;
        movement.remarks = request.reason;

        return applyMovements({movement}, request.reference,
                              request.occurredAt.value_or(domain::Timestamp::now()), nullptr);
    }

    domain::StockMovementResult recordSale(const domain::SaleEvent& event) override {
        if (event.receiptNumber.empty()) {
            throw domain::ValidationError("Receipt number is required");
        }
        if (event.lines.empty()) {
            throw domain::ValidationError("Sale has no lines");
        }

        std::vector<Movement> movements;
        domain::Money lineSum;
        for (const auto& line : event.lines) {
            requireBatch(line.batch);
            if (line.quantity <= 0) {
                throw domain::ValidationError("Sale quantity must be positive for " + line.batch.entityKey());
            }
            Movement movement;
            movement.batch = line.batch;
            movement.signedQuantity = -line.quantity;
            movement.kind = domain::MovementKind::OUT;
            movement.remarks = "Sale " + event.receiptNumber;
            movements.push_back(movement);
            lineSum = lineSum + line.lineTotal();
        }

        auto occurredAt = event.saleDate.value_or(domain::Timestamp::now());

        domain::SaleRecord record;
        record.receiptNumber = event.receiptNumber;
        record.saleDate = occurredAt;
        record.pharmacistName = event.pharmacistName;
        record.paymentMode = event.paymentMode;
        record.lines = event.lines;
        record.subtotal = event.subtotal.value_or(lineSum);
        record.cgstAmount = event.cgstAmount;
        record.sgstAmount = event.sgstAmount;
        record.totalAmount = event.totalAmount.value_or(record.subtotal + record.cgstAmount + record.sgstAmount);
        record.createdAt = domain::Timestamp::now();

        auto reference = domain::Reference::of(domain::ReferenceType::POS, event.receiptNumber);
        return applyMovements(movements, reference, occurredAt,
            [&record, &reference](ports::output::ILedgerTransaction& tx) {
                if (!tx.saveSale(record)) {
                    std::cerr << "[StockReconciliationService] Sale record already exists: "
                              << record.receiptNumber << std::endl;
                    throw domain::DuplicateReferenceError(reference.key());
                }
            });
    }

    domain::StockMovementResult recordReceipt(const domain::ReceiptEvent& event) override {
        if (event.invoiceNumber.empty()) {
            throw domain::ValidationError("Invoice number is required");
        }
        if (event.lines.empty()) {
            throw domain::ValidationError("Invoice has no lines");
        }

        std::vector<Movement> movements;
        domain::Money lineSum;
        for (const auto& line : event.lines) {
            requireBatch(line.batch);
            if (line.quantity <= 0) {
                throw domain::ValidationError("Receipt quantity must be positive for " + line.batch.entityKey());
            }
            Movement movement;
            movement.batch = line.batch;
            movement.signedQuantity = line.quantity;
            movement.kind = domain::MovementKind::IN;
            movement.remarks = "Invoice " + event.invoiceNumber;
            movement.newBatch = line;
            movements.push_back(movement);
            lineSum = lineSum + line.lineTotal();
        }

        auto occurredAt = event.invoiceDate.value_or(domain::Timestamp::now());

        domain::SupplierInvoice invoice;
        invoice.invoiceNumber = event.invoiceNumber;
        invoice.invoiceDate = occurredAt;
        invoice.supplierName = event.supplierName;
        invoice.supplierGstin = event.supplierGstin;
        invoice.poReference = event.poReference;
        invoice.deliveryDate = event.deliveryDate;
        invoice.vehicleNumber = event.vehicleNumber;
        invoice.lines = event.lines;
        invoice.subtotal = event.subtotal.value_or(lineSum);
        invoice.cgstAmount = event.cgstAmount;
        invoice.sgstAmount = event.sgstAmount;
        invoice.totalAmount = event.totalAmount.value_or(invoice.subtotal + invoice.cgstAmount + invoice.sgstAmount);
        invoice.paymentStatus = event.paymentStatus;
        invoice.createdAt = domain::Timestamp::now();

        auto reference = domain::Reference::of(domain::ReferenceType::SUPPLIER_INVOICE, event.invoiceNumber);
        return applyMovements(movements, reference, occurredAt,
            [&invoice, &reference](ports::output::ILedgerTransaction& tx) {
                if (!tx.saveInvoice(invoice)) {
                    std::cerr << "[StockReconciliationService] Invoice already exists: "
                              << invoice.invoiceNumber << std::endl;
                    throw domain::DuplicateReferenceError(reference.key());
                }
            });
    }

    // =========================================================================
    // Отчёты
    // =========================================================================

    std::vector<domain::StockPosition> reorderCandidates() override {
        std::vector<domain::StockPosition> result;
        for (auto& position : positions()) {
            if (position.needsReorder()) {
                result.push_back(std::move(position));
            }
        }
        sortByQuantity(result);
        return result;
    }

    std::vector<domain::StockPosition> lowStock(int64_t threshold) override {
        if (threshold < 0) {
            throw domain::ValidationError("Threshold must not be negative");
        }
        std::vector<domain::StockPosition> result;
        for (auto& position : positions()) {
            if (position.currentQuantity <= threshold) {
                result.push_back(std::move(position));
            }
        }
        sortByQuantity(result);
        return result;
    }

    std::vector<domain::StockPosition> expiringWithin(int days, const domain::Timestamp& today) override {
        if (days < 0) {
            throw domain::ValidationError("Days must not be negative");
        }
        auto from = today.toDateString();
        auto to = today.plusDays(days).toDateString();

        std::vector<domain::StockPosition> result;
        for (auto& position : positions()) {
            if (!position.batch.expiryDate) {
                continue;
            }
            auto expiry = position.batch.expiryDate->toDateString();
            if (expiry >= from && expiry <= to) {
                result.push_back(std::move(position));
            }
        }
        std::sort(result.begin(), result.end(),
            [](const domain::StockPosition& a, const domain::StockPosition& b) {
                return *a.batch.expiryDate < *b.batch.expiryDate;
            });
        return result;
    }

    std::vector<domain::StockPosition> inventory() override {
        auto result = positions();
        std::sort(result.begin(), result.end(),
            [](const domain::StockPosition& a, const domain::StockPosition& b) {
                return a.batch.key < b.batch.key;
            });
        return result;
    }

    std::optional<domain::StockPosition> position(const domain::BatchKey& batch) override {
        auto meta = batches_->find(batch);
        if (!meta) {
            return std::nullopt;
        }
        return domain::StockPosition{*meta, projector_->current(domain::LedgerDomain::STOCK, batch.entityKey())};
    }

    std::optional<domain::SaleRecord> findSale(const std::string& receiptNumber) override {
        return documents_->findSale(receiptNumber);
    }

    std::optional<domain::SupplierInvoice> findInvoice(const std::string& invoiceNumber) override {
        return documents_->findInvoice(invoiceNumber);
    }

    domain::SupplierInvoice updateInvoicePaymentStatus(const std::string& invoiceNumber,
                                                       domain::PaymentStatus status) override {
        if (!documents_->updateInvoicePaymentStatus(invoiceNumber, status)) {
            throw domain::NotFoundError("Invoice not found: " + invoiceNumber);
        }
        std::cout << "[StockReconciliationService] Invoice " << invoiceNumber
                  << " payment status -> " << domain::toString(status) << std::endl;

        auto invoice = documents_->findInvoice(invoiceNumber);
        if (!invoice) {
            throw domain::NotFoundError("Invoice not found: " + invoiceNumber);
        }
        return *invoice;
    }

private:
    std::shared_ptr<ports::output::ILedgerStore> store_;
    std::shared_ptr<ports::input::IBalanceProjector> projector_;
    std::shared_ptr<IdempotencyGuard> guard_;
    std::shared_ptr<ports::output::IStockBatchRepository> batches_;
    std::shared_ptr<ports::output::IDocumentRepository> documents_;
    std::shared_ptr<KeyedLockManager> locks_;
    std::shared_ptr<settings::LedgerSettings> settings_;

    /**
     * @brief Одна строка события: партия + количество со знаком
     */
    struct Movement {
        domain::BatchKey batch;
        int64_t signedQuantity = 0;
        domain::MovementKind kind = domain::MovementKind::ADJUST;
        std::string remarks;
        std::optional<domain::ReceiptLine> newBatch;   ///< Метаданные, если партия приходит впервые
    };

    static void requireBatch(const domain::BatchKey& batch) {
        if (!batch.isValid()) {
            throw domain::ValidationError("medicine_name and batch_number are required");
        }
        // '#' разделяет поля в entity_key
        if (batch.medicineName.find('#') != std::string::npos ||
            batch.batchNumber.find('#') != std::string::npos) {
            throw domain::ValidationError("medicine_name and batch_number must not contain '#'");
        }
    }

    static void sortByQuantity(std::vector<domain::StockPosition>& positions) {
        std::sort(positions.begin(), positions.end(),
            [](const domain::StockPosition& a, const domain::StockPosition& b) {
                if (a.currentQuantity != b.currentQuantity) {
                    return a.currentQuantity < b.currentQuantity;
                }
                return a.batch.key < b.batch.key;
            });
    }

    std::vector<domain::StockPosition> positions() {
        std::vector<domain::StockPosition> result;
        for (const auto& batch : batches_->findAll()) {
            result.push_back(domain::StockPosition{
                batch, projector_->current(domain::LedgerDomain::STOCK, batch.key.entityKey())});
        }
        return result;
    }

    domain::StockBatch makeBatch(const domain::ReceiptLine& line) const {
        domain::StockBatch batch;
        batch.key = line.batch;
        batch.manufacturer = line.manufacturer;
        batch.expiryDate = line.expiryDate;
        batch.reorderLevel = line.reorderLevel.value_or(domain::DEFAULT_REORDER_LEVEL);
        batch.costPrice = line.unitCost;
        batch.sellingPrice = line.sellingPrice.value_or(line.unitCost);
        batch.location = line.location;
        batch.createdAt = domain::Timestamp::now();
        return batch;
    }

    /**
     * @brief Проверить и атомарно записать строки события
     *
     * @param saveDocument Сохранение родительской записи в транзакции append
     *                     (nullptr - события без документа)
     */
    domain::StockMovementResult applyMovements(
        const std::vector<Movement>& movements,
        const domain::Reference& reference,
        const domain::Timestamp& occurredAt,
        const std::function<void(ports::output::ILedgerTransaction&)>& saveDocument) {
        bool guarded = movements.front().kind != domain::MovementKind::ADJUST && reference.isDeduplicated();
        if (guarded && guard_->isClaimed(reference)) {
            std::cout << "[StockReconciliationService] Duplicate reference: " << reference.key() << std::endl;
            throw domain::DuplicateReferenceError(reference.key());
        }

        std::vector<std::string> keys;
        for (const auto& movement : movements) {
            keys.push_back(movement.batch.entityKey());
        }

        for (int attempt = 1; attempt <= settings_->getLockAttempts(); ++attempt) {
            auto lease = locks_->tryAcquire(keys, settings_->getLockTimeout());
            if (!lease) {
                std::cout << "[StockReconciliationService] Lock busy, attempt " << attempt << std::endl;
                std::this_thread::sleep_for(std::chrono::milliseconds(5 * attempt));
                continue;
            }

            ports::output::ExpectedHeads heads;
            std::map<std::string, int64_t> after;
            std::map<std::string, int64_t> requested;
            for (const auto& movement : movements) {
                auto key = movement.batch.entityKey();
                if (!heads.count(key)) {
                    if (!movement.newBatch && !batches_->find(movement.batch)) {
                        throw domain::NotFoundError("Unknown batch: " + key);
                    }
                    heads[key] = store_->head(key);
                    after[key] = projector_->current(domain::LedgerDomain::STOCK, key);
                }
                after[key] += movement.signedQuantity;
                if (movement.signedQuantity < 0) {
                    requested[key] -= movement.signedQuantity;
                }
            }

            for (const auto& [key, quantity] : after) {
                if (quantity < 0) {
                    int64_t available = quantity + requested[key];
                    std::cout << "[StockReconciliationService] Insufficient stock for " << key
                              << ": requested " << requested[key] << ", available " << available << std::endl;
                    throw domain::InsufficientStockError(key, requested[key], available);
                }
            }

            std::vector<domain::LedgerEntry> entries;
            for (const auto& movement : movements) {
                domain::LedgerEntry entry;
                entry.domain = domain::LedgerDomain::STOCK;
                entry.entityKey = movement.batch.entityKey();
                entry.signedAmount = movement.signedQuantity;
                entry.kind = movement.kind;
                entry.reference = reference;
                entry.occurredAt = occurredAt;
                entry.remarks = movement.remarks;
                entries.push_back(entry);
            }

            auto work = [&](const domain::EntryIds&, ports::output::ILedgerTransaction& tx) {
                if (guarded && !guard_->claim(tx, reference)) {
                    throw domain::DuplicateReferenceError(reference.key());
                }
                for (const auto& movement : movements) {
                    if (movement.newBatch && tx.insertBatchIfAbsent(makeBatch(*movement.newBatch))) {
                        std::cout << "[StockReconciliationService] New batch " << movement.batch.entityKey() << std::endl;
                    }
                }
                if (saveDocument) {
                    saveDocument(tx);
                }
            };

            domain::EntryIds ids;
            try {
                ids = store_->append(entries, heads, work);
            } catch (const domain::ConcurrencyConflict& e) {
                std::cout << "[StockReconciliationService] " << e.what() << ", retrying" << std::endl;
                continue;
            } catch (const domain::ConflictError&) {
                throw domain::DuplicateReferenceError(reference.key());
            }

            domain::StockMovementResult result;
            result.entryIds = ids;
            auto today = domain::Timestamp::now();
            for (const auto& movement : movements) {
                result.quantitiesAfter.push_back(after[movement.batch.entityKey()]);
                if (movement.kind == domain::MovementKind::OUT) {
                    addExpiryWarning(result, movement.batch, today);
                }
            }

            std::cout << "[StockReconciliationService] Applied " << entries.size() << " "
                      << domain::toString(movements.front().kind) << " movement(s), ref="
                      << reference.key() << std::endl;
            return result;
        }

        std::cerr << "[StockReconciliationService] Gave up after " << settings_->getLockAttempts()
                  << " attempts, ref=" << reference.key() << std::endl;
        throw domain::ConcurrencyTimeoutError("stock movement " + reference.key());
    }

    void addExpiryWarning(domain::StockMovementResult& result,
                          const domain::BatchKey& key,
                          const domain::Timestamp& today) {
        auto batch = batches_->find(key);
        if (!batch || !batch->isExpired(today)) {
            return;
        }
        for (const auto& warning : result.warnings) {
            if (warning.message.find(key.entityKey()) != std::string::npos) {
                return;
            }
        }
        std::string message = "Batch " + key.entityKey() + " expired on " + batch->expiryDate->toDateString();
        std::cout << "[StockReconciliationService] WARNING: " << message << std::endl;
        result.warnings.push_back(domain::StockWarning{"EXPIRED_BATCH", message});
    }
};

} // namespace pharmacy::application
