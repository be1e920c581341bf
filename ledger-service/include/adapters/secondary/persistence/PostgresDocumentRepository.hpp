// include/adapters/secondary/persistence/PostgresDocumentRepository.hpp
#pragma once

#include "ports/output/IDocumentRepository.hpp"
#include "settings/DbSettings.hpp"
#include <pqxx/pqxx>
#include <iostream>
#include <memory>

namespace pharmacy::adapters::secondary {

/**
 * @brief PostgreSQL чеки и накладные
 *
 * Таблицы:
 * - pos_sales (receipt_number PK) + pos_sale_items (строки чека)
 * - supplier_invoices (invoice_number PK) + supplier_invoice_items (строки накладной)
 *
 * Суммы - BIGINT в пайсах, даты - BIGINT Unix ms.
 * После вставки меняется только supplier_invoices.payment_status.
 */
class PostgresDocumentRepository : public ports::output::IDocumentRepository {
public:
    explicit PostgresDocumentRepository(std::shared_ptr<settings::DbSettings> settings)
        : settings_(std::move(settings))
    {
        initSchema();
    }

    bool saveSale(const domain::SaleRecord& sale) override {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);
            bool saved = saveSaleIn(txn, sale);
            txn.commit();
            return saved;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresDocumentRepository] saveSale error: " << e.what() << std::endl;
            throw;
        }
    }

    /**
     * @brief Вставка продажи со строками в переданной транзакции, без commit
     * @return false если документ с таким номером уже есть
     */
    static bool saveSaleIn(pqxx::work& txn, const domain::SaleRecord& sale) {
        auto result = txn.exec_params(
            "INSERT INTO pos_sales "
            "(receipt_number, sale_date, pharmacist_name, payment_mode, subtotal, cgst_amount, "
            " sgst_amount, total_amount, currency, status, created_at) "
            "VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9, $10, $11) "
            "ON CONFLICT (receipt_number) DO NOTHING "
            "RETURNING receipt_number",
            sale.receiptNumber,
            sale.saleDate.toUnixMillis(),
            sale.pharmacistName,
            domain::toString(sale.paymentMode),
            sale.subtotal.minor,
            sale.cgstAmount.minor,
            sale.sgstAmount.minor,
            sale.totalAmount.minor,
            sale.totalAmount.currency,
            domain::toString(sale.status),
            sale.createdAt.toUnixMillis()
        );

        if (result.empty()) {
            return false;
        }

        int lineNo = 1;
        for (const auto& line : sale.lines) {
            txn.exec_params(
                "INSERT INTO pos_sale_items "
                "(receipt_number, line_no, medicine_name, batch_number, quantity, unit_price, total_price) "
                "VALUES ($1, $2, $3, $4, $5, $6, $7)",
                sale.receiptNumber,
                lineNo++,
                line.batch.medicineName,
                line.batch.batchNumber,
                line.quantity,
                line.unitPrice.minor,
                line.lineTotal().minor
            );
        }

        std::cout << "[PostgresDocumentRepository] Saved sale " << sale.receiptNumber << std::endl;
        return true;
    }

    std::optional<domain::SaleRecord> findSale(const std::string& receiptNumber) override {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto header = txn.exec_params(
                "SELECT receipt_number, sale_date, pharmacist_name, payment_mode, subtotal, cgst_amount, "
                "       sgst_amount, total_amount, currency, status, created_at "
                "FROM pos_sales WHERE receipt_number = $1",
                receiptNumber
            );
            if (header.empty()) {
                return std::nullopt;
            }

            const auto& row = header[0];
            auto currency = row["currency"].as<std::string>();

            domain::SaleRecord sale;
            sale.receiptNumber = row["receipt_number"].as<std::string>();
            sale.saleDate = domain::Timestamp::fromUnixMillis(row["sale_date"].as<int64_t>());
            sale.pharmacistName = row["pharmacist_name"].is_null() ? "" : row["pharmacist_name"].as<std::string>();
            sale.paymentMode = domain::paymentModeFromString(row["payment_mode"].as<std::string>());
            sale.subtotal = domain::Money(row["subtotal"].as<int64_t>(), currency);
            sale.cgstAmount = domain::Money(row["cgst_amount"].as<int64_t>(), currency);
            sale.sgstAmount = domain::Money(row["sgst_amount"].as<int64_t>(), currency);
            sale.totalAmount = domain::Money(row["total_amount"].as<int64_t>(), currency);
            sale.status = domain::paymentStatusFromString(row["status"].as<std::string>());
            sale.createdAt = domain::Timestamp::fromUnixMillis(row["created_at"].as<int64_t>());

            auto items = txn.exec_params(
                "SELECT medicine_name, batch_number, quantity, unit_price "
                "FROM pos_sale_items WHERE receipt_number = $1 ORDER BY line_no",
                receiptNumber
            );
            for (const auto& item : items) {
                domain::SaleLine line;
                line.batch.medicineName = item["medicine_name"].as<std::string>();
                line.batch.batchNumber = item["batch_number"].as<std::string>();
                line.quantity = item["quantity"].as<int64_t>();
                line.unitPrice = domain::Money(item["unit_price"].as<int64_t>(), currency);
                sale.lines.push_back(line);
            }

            return sale;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresDocumentRepository] findSale error: " << e.what() << std::endl;
            throw;
        }
    }

    bool saveInvoice(const domain::SupplierInvoice& invoice) override {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);
            bool saved = saveInvoiceIn(txn, invoice);
            txn.commit();
            return saved;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresDocumentRepository] saveInvoice error: " << e.what() << std::endl;
            throw;
        }
    }

    /**
     * @brief Вставка накладной со строками в переданной транзакции, без commit
     * @return false если документ с таким номером уже есть
     */
    static bool saveInvoiceIn(pqxx::work& txn, const domain::SupplierInvoice& invoice) {
        std::optional<int64_t> deliveryDate;
        if (invoice.deliveryDate) {
            deliveryDate = invoice.deliveryDate->toUnixMillis();
        }

        auto result = txn.exec_params(
            "INSERT INTO supplier_invoices "
            "(invoice_number, invoice_date, supplier_name, supplier_gstin, po_reference, delivery_date, "
            " vehicle_number, subtotal, cgst_amount, sgst_amount, total_amount, currency, payment_status, created_at) "
            "VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9, $10, $11, $12, $13, $14) "
            "ON CONFLICT (invoice_number) DO NOTHING "
            "RETURNING invoice_number",
            invoice.invoiceNumber,
            invoice.invoiceDate.toUnixMillis(),
            invoice.supplierName,
            invoice.supplierGstin,
            invoice.poReference,
            deliveryDate,
            invoice.vehicleNumber,
            invoice.subtotal.minor,
            invoice.cgstAmount.minor,
            invoice.sgstAmount.minor,
            invoice.totalAmount.minor,
            invoice.totalAmount.currency,
            domain::toString(invoice.paymentStatus),
            invoice.createdAt.toUnixMillis()
        );

        if (result.empty()) {
            return false;
        }

        int lineNo = 1;
        for (const auto& line : invoice.lines) {
            std::optional<std::string> expiry;
            if (line.expiryDate) {
                expiry = line.expiryDate->toDateString();
            }
            txn.exec_params(
                "INSERT INTO supplier_invoice_items "
                "(invoice_number, line_no, medicine_name, batch_number, manufacturer, expiry_date, "
                " quantity, unit_price, total_price) "
                "VALUES ($1, $2, $3, $4, $5, $6::DATE, $7, $8, $9)",
                invoice.invoiceNumber,
                lineNo++,
                line.batch.medicineName,
                line.batch.batchNumber,
                line.manufacturer,
                expiry,
                line.quantity,
                line.unitCost.minor,
                line.lineTotal().minor
            );
        }

        std::cout << "[PostgresDocumentRepository] Saved invoice " << invoice.invoiceNumber << std::endl;
        return true;
    }

    std::optional<domain::SupplierInvoice> findInvoice(const std::string& invoiceNumber) override {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto header = txn.exec_params(
                "SELECT invoice_number, invoice_date, supplier_name, supplier_gstin, po_reference, delivery_date, "
                "       vehicle_number, subtotal, cgst_amount, sgst_amount, total_amount, currency, "
                "       payment_status, created_at "
                "FROM supplier_invoices WHERE invoice_number = $1",
                invoiceNumber
            );
            if (header.empty()) {
                return std::nullopt;
            }

            const auto& row = header[0];
            auto currency = row["currency"].as<std::string>();

            domain::SupplierInvoice invoice;
            invoice.invoiceNumber = row["invoice_number"].as<std::string>();
            invoice.invoiceDate = domain::Timestamp::fromUnixMillis(row["invoice_date"].as<int64_t>());
            invoice.supplierName = textOrEmpty(row["supplier_name"]);
            invoice.supplierGstin = textOrEmpty(row["supplier_gstin"]);
            invoice.poReference = textOrEmpty(row["po_reference"]);
            if (!row["delivery_date"].is_null()) {
                invoice.deliveryDate = domain::Timestamp::fromUnixMillis(row["delivery_date"].as<int64_t>());
            }
            invoice.vehicleNumber = textOrEmpty(row["vehicle_number"]);
            invoice.subtotal = domain::Money(row["subtotal"].as<int64_t>(), currency);
            invoice.cgstAmount = domain::Money(row["cgst_amount"].as<int64_t>(), currency);
            invoice.sgstAmount = domain::Money(row["sgst_amount"].as<int64_t>(), currency);
            invoice.totalAmount = domain::Money(row["total_amount"].as<int64_t>(), currency);
            invoice.paymentStatus = domain::paymentStatusFromString(row["payment_status"].as<std::string>());
            invoice.createdAt = domain::Timestamp::fromUnixMillis(row["created_at"].as<int64_t>());

            auto items = txn.exec_params(
                "SELECT medicine_name, batch_number, manufacturer, TO_CHAR(expiry_date, 'YYYY-MM-DD') AS expiry_date, "
                "       quantity, unit_price "
                "FROM supplier_invoice_items WHERE invoice_number = $1 ORDER BY line_no",
                invoiceNumber
            );
            for (const auto& item : items) {
                domain::ReceiptLine line;
                line.batch.medicineName = item["medicine_name"].as<std::string>();
                line.batch.batchNumber = item["batch_number"].as<std::string>();
                line.manufacturer = textOrEmpty(item["manufacturer"]);
                if (!item["expiry_date"].is_null()) {
                    line.expiryDate = domain::Timestamp::fromString(item["expiry_date"].as<std::string>());
                }
                line.quantity = item["quantity"].as<int64_t>();
                line.unitCost = domain::Money(item["unit_price"].as<int64_t>(), currency);
                invoice.lines.push_back(line);
            }

            return invoice;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresDocumentRepository] findInvoice error: " << e.what() << std::endl;
            throw;
        }
    }

    bool updateInvoicePaymentStatus(const std::string& invoiceNumber, domain::PaymentStatus status) override {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec_params(
                "UPDATE supplier_invoices SET payment_status = $2 "
                "WHERE invoice_number = $1 "
                "RETURNING invoice_number",
                invoiceNumber,
                domain::toString(status)
            );

            txn.commit();
            return !result.empty();

        } catch (const std::exception& e) {
            std::cerr << "[PostgresDocumentRepository] updateInvoicePaymentStatus error: " << e.what() << std::endl;
            throw;
        }
    }

private:
    std::shared_ptr<settings::DbSettings> settings_;

    static std::string textOrEmpty(const pqxx::field& field) {
        return field.is_null() ? "" : field.as<std::string>();
    }

    void initSchema() {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            txn.exec(R"(
                CREATE TABLE IF NOT EXISTS pos_sales (
                    receipt_number VARCHAR(50) PRIMARY KEY,
                    sale_date BIGINT NOT NULL,
                    pharmacist_name VARCHAR(100),
                    payment_mode VARCHAR(20) NOT NULL DEFAULT 'CASH',
                    subtotal BIGINT NOT NULL,
                    cgst_amount BIGINT NOT NULL DEFAULT 0,
                    sgst_amount BIGINT NOT NULL DEFAULT 0,
                    total_amount BIGINT NOT NULL,
                    currency VARCHAR(3) NOT NULL DEFAULT 'INR',
                    status VARCHAR(20) NOT NULL DEFAULT 'PAID',
                    created_at BIGINT NOT NULL
                )
            )");

            txn.exec(R"(
                CREATE TABLE IF NOT EXISTS pos_sale_items (
                    receipt_number VARCHAR(50) REFERENCES pos_sales(receipt_number),
                    line_no INT NOT NULL,
                    medicine_name VARCHAR(200) NOT NULL,
                    batch_number VARCHAR(50) NOT NULL,
                    quantity BIGINT NOT NULL,
                    unit_price BIGINT NOT NULL,
                    total_price BIGINT NOT NULL,
                    PRIMARY KEY (receipt_number, line_no)
                )
            )");

            txn.exec(R"(
                CREATE TABLE IF NOT EXISTS supplier_invoices (
                    invoice_number VARCHAR(50) PRIMARY KEY,
                    invoice_date BIGINT NOT NULL,
                    supplier_name VARCHAR(200),
                    supplier_gstin VARCHAR(20),
                    po_reference VARCHAR(50),
                    delivery_date BIGINT,
                    vehicle_number VARCHAR(20),
                    subtotal BIGINT NOT NULL,
                    cgst_amount BIGINT NOT NULL DEFAULT 0,
                    sgst_amount BIGINT NOT NULL DEFAULT 0,
                    total_amount BIGINT NOT NULL,
                    currency VARCHAR(3) NOT NULL DEFAULT 'INR',
                    payment_status VARCHAR(20) NOT NULL DEFAULT 'PENDING',
                    created_at BIGINT NOT NULL
                )
            )");

            txn.exec(R"(
                CREATE TABLE IF NOT EXISTS supplier_invoice_items (
                    invoice_number VARCHAR(50) REFERENCES supplier_invoices(invoice_number),
                    line_no INT NOT NULL,
                    medicine_name VARCHAR(200) NOT NULL,
                    batch_number VARCHAR(50) NOT NULL,
                    manufacturer VARCHAR(200),
                    expiry_date DATE,
                    quantity BIGINT NOT NULL,
                    unit_price BIGINT NOT NULL,
                    total_price BIGINT NOT NULL,
                    PRIMARY KEY (invoice_number, line_no)
                )
            )");

            txn.commit();
            std::cout << "[PostgresDocumentRepository] Schema initialized" << std::endl;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresDocumentRepository] initSchema error: " << e.what() << std::endl;
        }
    }
};

} // namespace pharmacy::adapters::secondary
