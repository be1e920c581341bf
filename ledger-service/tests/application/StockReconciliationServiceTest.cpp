/**
 * @file StockReconciliationServiceTest.cpp
 * @brief Unit tests for StockReconciliationService
 */

#include <gtest/gtest.h>
#include "application/BalanceProjector.hpp"
#include "application/StockReconciliationService.hpp"
#include "adapters/secondary/persistence/InMemoryBankAccountRepository.hpp"
#include "adapters/secondary/persistence/InMemoryDocumentRepository.hpp"
#include "adapters/secondary/persistence/InMemoryIdempotencyRepository.hpp"
#include "adapters/secondary/persistence/InMemoryLedgerStore.hpp"
#include "adapters/secondary/persistence/InMemoryProjectionRepository.hpp"
#include "adapters/secondary/persistence/InMemoryStockBatchRepository.hpp"
#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace pharmacy;
using namespace pharmacy::application;
using namespace pharmacy::adapters::secondary;
using namespace std::chrono_literals;

namespace {

domain::Reference invoiceRef(const std::string& id) {
    return domain::Reference::of(domain::ReferenceType::SUPPLIER_INVOICE, id);
}

domain::Reference posRef(const std::string& id) {
    return domain::Reference::of(domain::ReferenceType::POS, id);
}

const domain::BatchKey B1{"Paracetamol 500mg", "B1"};
const domain::BatchKey B2{"Amoxicillin 250mg", "B2"};

/**
 * @brief Хранилище документов, у которого можно сломать следующую запись накладной
 */
class FailingDocumentRepository : public InMemoryDocumentRepository {
public:
    bool saveInvoice(const domain::SupplierInvoice& invoice) override {
        if (failNextInvoice) {
            failNextInvoice = false;
            throw std::runtime_error("supplier_invoices insert failed");
        }
        return InMemoryDocumentRepository::saveInvoice(invoice);
    }

    bool failNextInvoice = false;
};

} // namespace

class StockReconciliationServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        claims_ = std::make_shared<InMemoryIdempotencyRepository>();
        batches_ = std::make_shared<InMemoryStockBatchRepository>();
        documents_ = std::make_shared<FailingDocumentRepository>();
        store_ = std::make_shared<InMemoryLedgerStore>(claims_, batches_, documents_, nullptr);
        guard_ = std::make_shared<IdempotencyGuard>(claims_);
        locks_ = std::make_shared<KeyedLockManager>();
        settings_ = std::make_shared<settings::LedgerSettings>();
        settings_->setLockTimeout(1000ms);
        settings_->setLockAttempts(5);

        projector_ = std::make_shared<BalanceProjector>(
            store_, std::make_shared<InMemoryProjectionRepository>(),
            std::make_shared<InMemoryBankAccountRepository>(), settings_);

        service_ = std::make_shared<StockReconciliationService>(
            store_, projector_, guard_, batches_, documents_, locks_, settings_);
    }

    domain::StockMovementResult receive(const domain::BatchKey& batch, int64_t quantity,
                                        const std::string& invoice,
                                        std::optional<domain::Timestamp> expiry = std::nullopt) {
        domain::ReceiveRequest request;
        request.batch = batch;
        request.quantity = quantity;
        request.unitCost = domain::Money::parse("5.00");
        request.reference = invoiceRef(invoice);
        request.manufacturer = "Cipla";
        request.expiryDate = expiry;
        return service_->receive(request);
    }

    domain::StockMovementResult sell(const domain::BatchKey& batch, int64_t quantity, const std::string& receipt) {
        domain::SellRequest request;
        request.batch = batch;
        request.quantity = quantity;
        request.unitPrice = domain::Money::parse("10.00");
        request.reference = posRef(receipt);
        return service_->sell(request);
    }

    int64_t quantityOf(const domain::BatchKey& batch) {
        return projector_->current(domain::LedgerDomain::STOCK, batch.entityKey());
    }

    std::shared_ptr<InMemoryIdempotencyRepository> claims_;
    std::shared_ptr<InMemoryLedgerStore> store_;
    std::shared_ptr<InMemoryStockBatchRepository> batches_;
    std::shared_ptr<FailingDocumentRepository> documents_;
    std::shared_ptr<IdempotencyGuard> guard_;
    std::shared_ptr<KeyedLockManager> locks_;
    std::shared_ptr<settings::LedgerSettings> settings_;
    std::shared_ptr<BalanceProjector> projector_;
    std::shared_ptr<StockReconciliationService> service_;
};

// ============================================================================
// RECEIVE / SELL
// ============================================================================

TEST_F(StockReconciliationServiceTest, ReceiveSellOversell) {
    EXPECT_EQ(receive(B1, 100, "1").quantityAfter(), 100);
    EXPECT_EQ(quantityOf(B1), 100);

    EXPECT_EQ(sell(B1, 30, "1").quantityAfter(), 70);
    EXPECT_EQ(quantityOf(B1), 70);

    try {
        sell(B1, 80, "2");
        FAIL() << "Expected InsufficientStockError";
    } catch (const domain::InsufficientStockError& e) {
        EXPECT_EQ(e.requested(), 80);
        EXPECT_EQ(e.available(), 70);
    }
    EXPECT_EQ(quantityOf(B1), 70);
}

TEST_F(StockReconciliationServiceTest, RejectedSale_DoesNotConsumeReference) {
    receive(B1, 10, "1");

    EXPECT_THROW(sell(B1, 20, "R-1"), domain::InsufficientStockError);
    EXPECT_FALSE(guard_->isClaimed(posRef("R-1")));

    EXPECT_EQ(sell(B1, 5, "R-1").quantityAfter(), 5);
}

TEST_F(StockReconciliationServiceTest, Receive_CreatesBatchWithDefaults) {
    receive(B1, 100, "1", domain::Timestamp::fromString("2026-12-31"));

    auto position = service_->position(B1);

    ASSERT_TRUE(position.has_value());
    EXPECT_EQ(position->currentQuantity, 100);
    EXPECT_EQ(position->batch.reorderLevel, domain::DEFAULT_REORDER_LEVEL);
    EXPECT_EQ(position->batch.manufacturer, "Cipla");
    EXPECT_EQ(position->batch.costPrice.toString(), "5.00");
    EXPECT_EQ(position->batch.sellingPrice.toString(), "5.00");
    ASSERT_TRUE(position->batch.expiryDate.has_value());
    EXPECT_EQ(position->batch.expiryDate->toDateString(), "2026-12-31");
}

TEST_F(StockReconciliationServiceTest, Sell_UnknownBatch_ThrowsNotFound) {
    EXPECT_THROW(sell(B1, 1, "R-1"), domain::NotFoundError);
    EXPECT_FALSE(guard_->isClaimed(posRef("R-1")));
}

TEST_F(StockReconciliationServiceTest, Receive_HashInBatchFields_ThrowsValidation) {
    // Оба ключа дали бы entity_key "Vit C#Lot#A"
    EXPECT_THROW(receive(domain::BatchKey{"Vit C#Lot", "A"}, 100, "INV-H1"), domain::ValidationError);
    EXPECT_THROW(receive(domain::BatchKey{"Vit C", "Lot#A"}, 1, "INV-H2"), domain::ValidationError);

    EXPECT_EQ(store_->size(), 0u);
    EXPECT_TRUE(batches_->findAll().empty());
}

TEST_F(StockReconciliationServiceTest, RecordSale_HashInBatchName_ThrowsValidation) {
    domain::SaleEvent event;
    event.receiptNumber = "R-H1";
    event.lines = {domain::SaleLine{domain::BatchKey{"Vit C#Lot", "A"}, 1, domain::Money::parse("2.00")}};

    EXPECT_THROW(service_->recordSale(event), domain::ValidationError);
    EXPECT_FALSE(guard_->isClaimed(posRef("R-H1")));
}

TEST_F(StockReconciliationServiceTest, Sell_NonPositiveQuantity_ThrowsValidation) {
    receive(B1, 10, "1");

    EXPECT_THROW(sell(B1, 0, "R-1"), domain::ValidationError);
    EXPECT_THROW(sell(B1, -5, "R-2"), domain::ValidationError);
}

TEST_F(StockReconciliationServiceTest, Sell_DuplicateReference_AppliedOnce) {
    receive(B1, 100, "1");
    sell(B1, 10, "R-1001");

    EXPECT_THROW(sell(B1, 10, "R-1001"), domain::DuplicateReferenceError);
    EXPECT_EQ(quantityOf(B1), 90);
}

TEST_F(StockReconciliationServiceTest, Receive_DuplicateInvoice_AppliedOnce) {
    receive(B1, 100, "INV-1");

    EXPECT_THROW(receive(B1, 100, "INV-1"), domain::DuplicateReferenceError);
    EXPECT_EQ(quantityOf(B1), 100);
}

TEST_F(StockReconciliationServiceTest, Sell_ExpiredBatch_AcceptedWithWarning) {
    receive(B1, 10, "1", domain::Timestamp::fromString("2020-01-31"));

    auto result = sell(B1, 2, "R-1");

    EXPECT_EQ(result.quantityAfter(), 8);
    ASSERT_TRUE(result.hasWarnings());
    EXPECT_EQ(result.warnings[0].code, "EXPIRED_BATCH");
}

// ============================================================================
// ADJUST
// ============================================================================

TEST_F(StockReconciliationServiceTest, Adjust_ManualIsRepeatable) {
    receive(B1, 100, "1");

    domain::AdjustRequest request;
    request.batch = B1;
    request.delta = -5;
    request.reason = "Damaged strips";

    service_->adjust(request);
    service_->adjust(request);

    EXPECT_EQ(quantityOf(B1), 90);
}

TEST_F(StockReconciliationServiceTest, Adjust_WithDocumentReference_NotDeduplicated) {
    receive(B1, 100, "1");

    domain::AdjustRequest request;
    request.batch = B1;
    request.delta = 3;
    request.reason = "Recount";
    request.reference = posRef("R-1");

    service_->adjust(request);
    service_->adjust(request);

    EXPECT_EQ(quantityOf(B1), 106);
    EXPECT_FALSE(guard_->isClaimed(posRef("R-1")));
}

TEST_F(StockReconciliationServiceTest, Adjust_BelowZero_ThrowsInsufficientStock) {
    receive(B1, 10, "1");

    domain::AdjustRequest request;
    request.batch = B1;
    request.delta = -11;
    request.reason = "Write-off";

    EXPECT_THROW(service_->adjust(request), domain::InsufficientStockError);
    EXPECT_EQ(quantityOf(B1), 10);
}

TEST_F(StockReconciliationServiceTest, Adjust_RequiresReasonAndDelta) {
    receive(B1, 10, "1");

    domain::AdjustRequest request;
    request.batch = B1;
    request.delta = 0;
    request.reason = "Recount";
    EXPECT_THROW(service_->adjust(request), domain::ValidationError);

    request.delta = 1;
    request.reason.clear();
    EXPECT_THROW(service_->adjust(request), domain::ValidationError);
}

// ============================================================================
// MULTI-LINE EVENTS
// ============================================================================

TEST_F(StockReconciliationServiceTest, RecordReceipt_CreatesBatchesAndInvoice) {
    domain::ReceiptEvent event;
    event.invoiceNumber = "INV-2024-001";
    event.supplierName = "MedPlus Distributors";
    event.cgstAmount = domain::Money::parse("30.00");
    event.sgstAmount = domain::Money::parse("30.00");

    domain::ReceiptLine first;
    first.batch = B1;
    first.quantity = 100;
    first.unitCost = domain::Money::parse("5.00");
    first.reorderLevel = 20;

    domain::ReceiptLine second;
    second.batch = B2;
    second.quantity = 50;
    second.unitCost = domain::Money::parse("10.00");
    second.sellingPrice = domain::Money::parse("14.00");

    event.lines = {first, second};

    auto result = service_->recordReceipt(event);

    EXPECT_EQ(result.entryIds.size(), 2u);
    EXPECT_EQ(result.quantitiesAfter, (std::vector<int64_t>{100, 50}));

    auto invoice = service_->findInvoice("INV-2024-001");
    ASSERT_TRUE(invoice.has_value());
    EXPECT_EQ(invoice->subtotal.toString(), "1000.00");
    EXPECT_EQ(invoice->totalAmount.toString(), "1060.00");
    EXPECT_EQ(invoice->paymentStatus, domain::PaymentStatus::PENDING);

    EXPECT_EQ(service_->position(B1)->batch.reorderLevel, 20);
    EXPECT_EQ(service_->position(B2)->batch.sellingPrice.toString(), "14.00");
}

TEST_F(StockReconciliationServiceTest, RecordSale_OneShortLine_RejectsWholeSale) {
    receive(B1, 100, "1");
    receive(B2, 5, "2");

    domain::SaleEvent event;
    event.receiptNumber = "R-2001";
    event.lines = {
        domain::SaleLine{B1, 10, domain::Money::parse("2.00")},
        domain::SaleLine{B2, 6, domain::Money::parse("12.00")}
    };

    EXPECT_THROW(service_->recordSale(event), domain::InsufficientStockError);

    EXPECT_EQ(quantityOf(B1), 100);
    EXPECT_EQ(quantityOf(B2), 5);
    EXPECT_FALSE(service_->findSale("R-2001").has_value());
    EXPECT_FALSE(guard_->isClaimed(posRef("R-2001")));
}

TEST_F(StockReconciliationServiceTest, RecordReceipt_InvoiceWriteFails_NothingCommitted) {
    domain::ReceiptEvent event;
    event.invoiceNumber = "INV-FAIL-1";
    domain::ReceiptLine line;
    line.batch = B1;
    line.quantity = 100;
    line.unitCost = domain::Money::parse("5.00");
    event.lines = {line};

    documents_->failNextInvoice = true;
    EXPECT_THROW(service_->recordReceipt(event), std::runtime_error);

    EXPECT_EQ(store_->size(), 0u);
    EXPECT_EQ(quantityOf(B1), 0);
    EXPECT_FALSE(batches_->find(B1).has_value());
    EXPECT_FALSE(service_->findInvoice("INV-FAIL-1").has_value());
    EXPECT_FALSE(guard_->isClaimed(invoiceRef("INV-FAIL-1")));

    auto result = service_->recordReceipt(event);

    EXPECT_EQ(result.quantityAfter(), 100);
    EXPECT_EQ(quantityOf(B1), 100);
    EXPECT_TRUE(batches_->find(B1).has_value());
    EXPECT_TRUE(service_->findInvoice("INV-FAIL-1").has_value());
    EXPECT_TRUE(guard_->isClaimed(invoiceRef("INV-FAIL-1")));
}

TEST_F(StockReconciliationServiceTest, RecordSale_RepeatedBatchLines_AreSummed) {
    receive(B1, 70, "1");

    domain::SaleEvent event;
    event.receiptNumber = "R-2002";
    event.lines = {
        domain::SaleLine{B1, 40, domain::Money::parse("2.00")},
        domain::SaleLine{B1, 40, domain::Money::parse("2.00")}
    };

    EXPECT_THROW(service_->recordSale(event), domain::InsufficientStockError);
    EXPECT_EQ(quantityOf(B1), 70);
}

TEST_F(StockReconciliationServiceTest, RecordSale_SavesReceiptWithTotals) {
    receive(B1, 100, "1");

    domain::SaleEvent event;
    event.receiptNumber = "R-2003";
    event.pharmacistName = "A. Sharma";
    event.paymentMode = domain::PaymentMode::UPI;
    event.lines = {domain::SaleLine{B1, 4, domain::Money::parse("2.50")}};
    event.cgstAmount = domain::Money::parse("0.25");
    event.sgstAmount = domain::Money::parse("0.25");

    auto result = service_->recordSale(event);
    EXPECT_EQ(result.quantityAfter(), 96);

    auto sale = service_->findSale("R-2003");
    ASSERT_TRUE(sale.has_value());
    EXPECT_EQ(sale->subtotal.toString(), "10.00");
    EXPECT_EQ(sale->totalAmount.toString(), "10.50");
    EXPECT_EQ(sale->status, domain::PaymentStatus::PAID);

    EXPECT_THROW(service_->recordSale(event), domain::DuplicateReferenceError);
    EXPECT_EQ(quantityOf(B1), 96);
}

TEST_F(StockReconciliationServiceTest, UpdateInvoicePaymentStatus) {
    domain::ReceiptEvent event;
    event.invoiceNumber = "INV-9";
    domain::ReceiptLine line;
    line.batch = B1;
    line.quantity = 1;
    event.lines = {line};
    service_->recordReceipt(event);

    auto updated = service_->updateInvoicePaymentStatus("INV-9", domain::PaymentStatus::PAID);
    EXPECT_EQ(updated.paymentStatus, domain::PaymentStatus::PAID);

    EXPECT_THROW(service_->updateInvoicePaymentStatus("INV-404", domain::PaymentStatus::PAID),
                 domain::NotFoundError);
}

// ============================================================================
// REPORTS
// ============================================================================

TEST_F(StockReconciliationServiceTest, ReorderCandidates_SortedByQuantity) {
    receive(B1, 30, "1");
    receive(B2, 10, "2");
    receive(domain::BatchKey{"Cetirizine", "C1"}, 500, "3");

    auto candidates = service_->reorderCandidates();

    ASSERT_EQ(candidates.size(), 2u);
    EXPECT_EQ(candidates[0].batch.key, B2);
    EXPECT_EQ(candidates[1].batch.key, B1);
}

TEST_F(StockReconciliationServiceTest, LowStock_InclusiveThreshold) {
    receive(B1, 10, "1");
    receive(B2, 11, "2");

    auto low = service_->lowStock(10);

    ASSERT_EQ(low.size(), 1u);
    EXPECT_EQ(low[0].batch.key, B1);
    EXPECT_THROW(service_->lowStock(-1), domain::ValidationError);
}

TEST_F(StockReconciliationServiceTest, ExpiringWithin_WindowAndOrder) {
    auto today = domain::Timestamp::fromString("2024-06-01");
    receive(B1, 10, "1", domain::Timestamp::fromString("2024-06-20"));
    receive(B2, 10, "2", domain::Timestamp::fromString("2024-06-05"));
    receive(domain::BatchKey{"Cetirizine", "C1"}, 10, "3", domain::Timestamp::fromString("2024-09-01"));
    receive(domain::BatchKey{"Ibuprofen", "I1"}, 10, "4", domain::Timestamp::fromString("2024-05-01"));

    auto expiring = service_->expiringWithin(30, today);

    ASSERT_EQ(expiring.size(), 2u);
    EXPECT_EQ(expiring[0].batch.key, B2);
    EXPECT_EQ(expiring[1].batch.key, B1);
}

TEST_F(StockReconciliationServiceTest, Inventory_SortedByMedicineAndBatch) {
    receive(B1, 10, "1");
    receive(B2, 10, "2");

    auto all = service_->inventory();

    ASSERT_EQ(all.size(), 2u);
    EXPECT_EQ(all[0].batch.key.medicineName, "Amoxicillin 250mg");
    EXPECT_EQ(all[1].batch.key.medicineName, "Paracetamol 500mg");
}

// ============================================================================
// CONCURRENCY
// ============================================================================

TEST_F(StockReconciliationServiceTest, ConcurrentSales_NeverOversell) {
    receive(B1, 100, "1");

    std::atomic<int> accepted{0};
    std::atomic<int> rejected{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 20; ++i) {
        threads.emplace_back([this, i, &accepted, &rejected]() {
            try {
                sell(B1, 10, "R-" + std::to_string(i));
                ++accepted;
            } catch (const domain::InsufficientStockError&) {
                ++rejected;
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(accepted.load(), 10);
    EXPECT_EQ(rejected.load(), 10);
    EXPECT_EQ(quantityOf(B1), 0);
}

TEST_F(StockReconciliationServiceTest, ConcurrentDuplicates_AppliedOnce) {
    receive(B1, 100, "1");

    std::atomic<int> accepted{0};
    std::atomic<int> duplicates{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([this, &accepted, &duplicates]() {
            try {
                sell(B1, 1, "R-same");
                ++accepted;
            } catch (const domain::DuplicateReferenceError&) {
                ++duplicates;
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(accepted.load(), 1);
    EXPECT_EQ(duplicates.load(), 7);
    EXPECT_EQ(quantityOf(B1), 99);
}

TEST_F(StockReconciliationServiceTest, LockHeldElsewhere_TimesOutWithoutClaim) {
    receive(B1, 100, "1");
    settings_->setLockTimeout(10ms);
    settings_->setLockAttempts(2);

    auto lease = locks_->tryAcquire({B1.entityKey()}, 10ms);
    ASSERT_TRUE(lease.has_value());

    bool timedOut = false;
    std::thread seller([this, &timedOut]() {
        try {
            sell(B1, 1, "R-blocked");
        } catch (const domain::ConcurrencyTimeoutError&) {
            timedOut = true;
        }
    });
    seller.join();

    EXPECT_TRUE(timedOut);
    EXPECT_FALSE(guard_->isClaimed(posRef("R-blocked")));
    EXPECT_EQ(quantityOf(B1), 100);

    lease.reset();
    EXPECT_EQ(sell(B1, 1, "R-blocked").quantityAfter(), 99);
}

TEST_F(StockReconciliationServiceTest, DifferentBatches_DoNotBlockEachOther) {
    receive(B1, 10, "1");
    receive(B2, 10, "2");
    settings_->setLockTimeout(10ms);
    settings_->setLockAttempts(1);

    auto lease = locks_->tryAcquire({B1.entityKey()}, 10ms);
    ASSERT_TRUE(lease.has_value());

    int64_t after = -1;
    std::thread seller([this, &after]() {
        after = sell(B2, 3, "R-free").quantityAfter();
    });
    seller.join();

    EXPECT_EQ(after, 7);
}
