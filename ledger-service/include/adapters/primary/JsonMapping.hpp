#pragma once

#include <IResponse.hpp>
#include "domain/BankLedgerEntry.hpp"
#include "domain/CashRequests.hpp"
#include "domain/LedgerEntry.hpp"
#include "domain/SaleRecord.hpp"
#include "domain/StockPosition.hpp"
#include "domain/StockRequests.hpp"
#include "domain/SupplierInvoice.hpp"
#include "domain/errors/LedgerErrors.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <iostream>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>

namespace pharmacy::adapters::primary {

// ============================================================================
// Ответы
// ============================================================================

inline void sendJson(IResponse& res, int status, const nlohmann::json& body) {
    res.setResult(status, "application/json", body.dump());
}

inline void sendError(IResponse& res, int status, const std::string& message) {
    nlohmann::json body;
    body["error"] = message;
    sendJson(res, status, body);
}

/**
 * @brief Путь без query string
 */
inline std::string stripQuery(const std::string& fullPath) {
    auto pos = fullPath.find('?');
    return pos == std::string::npos ? fullPath : fullPath.substr(0, pos);
}

/**
 * @brief Выполнить обработчик, переведя исключения движка в HTTP-статусы
 *
 * Повтор уже применённого события - не ошибка: 200 и "duplicate": true.
 */
template <typename Fn>
void withLedgerErrors(IResponse& res, const std::string& component, Fn&& fn) {
    try {
        fn();
    } catch (const nlohmann::json::exception& e) {
        sendError(res, 400, std::string("Invalid JSON: ") + e.what());
    } catch (const domain::ValidationError& e) {
        sendError(res, 400, e.what());
    } catch (const std::invalid_argument& e) {
        sendError(res, 400, e.what());
    } catch (const std::out_of_range& e) {
        // std::stoll / std::stoi на слишком длинном числе
        sendError(res, 400, std::string("Value out of range: ") + e.what());
    } catch (const domain::NotFoundError& e) {
        sendError(res, 404, e.what());
    } catch (const domain::DuplicateReferenceError& e) {
        std::cout << "[" << component << "] Idempotent replay: " << e.referenceKey() << std::endl;
        nlohmann::json body;
        body["duplicate"] = true;
        body["reference"] = e.referenceKey();
        body["message"] = e.what();
        sendJson(res, 200, body);
    } catch (const domain::DuplicateTransactionError& e) {
        std::cout << "[" << component << "] Idempotent replay: " << e.tranId() << std::endl;
        nlohmann::json body;
        body["duplicate"] = true;
        body["tran_id"] = e.tranId();
        body["message"] = e.what();
        sendJson(res, 200, body);
    } catch (const domain::InsufficientStockError& e) {
        nlohmann::json body;
        body["error"] = e.what();
        body["code"] = "INSUFFICIENT_STOCK";
        body["entity_key"] = e.entityKey();
        body["requested"] = e.requested();
        body["available"] = e.available();
        sendJson(res, 409, body);
    } catch (const domain::BalanceMismatchError& e) {
        nlohmann::json body;
        body["error"] = e.what();
        body["code"] = "BALANCE_MISMATCH";
        body["tran_id"] = e.tranId();
        body["entry_id"] = e.entryId();
        body["status"] = "FLAGGED";
        body["computed_balance"] = e.expected();
        body["declared_balance"] = e.declared();
        sendJson(res, 409, body);
    } catch (const domain::AlreadyApprovedError& e) {
        nlohmann::json body;
        body["error"] = e.what();
        body["code"] = "ALREADY_APPROVED";
        body["approved_by"] = e.approvedBy();
        sendJson(res, 409, body);
    } catch (const domain::InvalidStateError& e) {
        sendError(res, 409, e.what());
    } catch (const domain::ConcurrencyTimeoutError& e) {
        std::cerr << "[" << component << "] " << e.what() << std::endl;
        res.setHeader("Retry-After", "1");
        sendError(res, 503, e.what());
    } catch (const domain::LedgerException& e) {
        sendError(res, 409, e.what());
    } catch (const std::exception& e) {
        std::cerr << "[" << component << "] Error: " << e.what() << std::endl;
        sendError(res, 500, "Internal server error");
    }
}

// ============================================================================
// Разбор запросов
// ============================================================================

/**
 * @brief Сумма из JSON: строка "5000.00" (точно) или число
 * @throws std::invalid_argument если поле не сумма
 */
inline domain::Money moneyFrom(const nlohmann::json& value, const std::string& currency = "INR") {
    if (value.is_string()) {
        return domain::Money::parse(value.get<std::string>(), currency);
    }
    if (value.is_number_integer()) {
        constexpr int64_t limit = std::numeric_limits<int64_t>::max() / 100;
        if (value.is_number_unsigned() && value.get<uint64_t>() > static_cast<uint64_t>(limit)) {
            throw std::invalid_argument("Amount out of range: " + value.dump());
        }
        auto units = value.get<int64_t>();
        if (units > limit || units < -limit) {
            throw std::invalid_argument("Amount out of range: " + value.dump());
        }
        return domain::Money(units * 100, currency);
    }
    if (value.is_number()) {
        return domain::Money::fromDouble(value.get<double>(), currency);
    }
    throw std::invalid_argument("Amount must be a string or a number");
}

inline std::optional<domain::Money> optionalMoney(const nlohmann::json& body, const std::string& key) {
    if (!body.contains(key) || body[key].is_null()) {
        return std::nullopt;
    }
    return moneyFrom(body[key]);
}

inline domain::Money moneyOrZero(const nlohmann::json& body, const std::string& key) {
    return optionalMoney(body, key).value_or(domain::Money());
}

inline std::optional<domain::Timestamp> optionalTimestamp(const nlohmann::json& body, const std::string& key) {
    if (!body.contains(key) || body[key].is_null()) {
        return std::nullopt;
    }
    return domain::Timestamp::fromString(body[key].get<std::string>());
}

inline domain::BatchKey batchFrom(const nlohmann::json& body) {
    return domain::BatchKey{body.value("medicine_name", ""), body.value("batch_number", "")};
}

/**
 * @brief {"reference_type": "POS", "reference_id": "R-1001"}; без полей - MANUAL
 */
inline domain::Reference referenceFrom(const nlohmann::json& body) {
    domain::Reference reference;
    if (body.contains("reference_type") && !body["reference_type"].is_null()) {
        reference.type = domain::referenceTypeFromString(body["reference_type"].get<std::string>());
    }
    if (body.contains("reference_id") && !body["reference_id"].is_null()) {
        reference.id = body["reference_id"].get<std::string>();
    }
    return reference;
}

// ============================================================================
// Сериализация
// ============================================================================

inline nlohmann::json referenceToJson(const domain::Reference& reference) {
    nlohmann::json j;
    j["type"] = domain::toString(reference.type);
    j["id"] = reference.id ? nlohmann::json(*reference.id) : nlohmann::json(nullptr);
    return j;
}

inline nlohmann::json toJson(const domain::StockPosition& position) {
    const auto& batch = position.batch;
    nlohmann::json j;
    j["medicine_name"] = batch.key.medicineName;
    j["batch_number"] = batch.key.batchNumber;
    j["manufacturer"] = batch.manufacturer;
    j["expiry_date"] = batch.expiryDate ? nlohmann::json(batch.expiryDate->toDateString()) : nlohmann::json(nullptr);
    j["current_quantity"] = position.currentQuantity;
    j["reorder_level"] = batch.reorderLevel;
    j["cost_price"] = batch.costPrice.toString();
    j["selling_price"] = batch.sellingPrice.toString();
    j["location"] = batch.location;
    return j;
}

inline nlohmann::json toJson(const domain::StockMovementResult& result) {
    nlohmann::json j;
    j["entry_ids"] = result.entryIds;
    j["quantities_after"] = result.quantitiesAfter;
    j["quantity_after"] = result.quantityAfter();
    j["warnings"] = nlohmann::json::array();
    for (const auto& warning : result.warnings) {
        j["warnings"].push_back({{"code", warning.code}, {"message", warning.message}});
    }
    return j;
}

inline nlohmann::json toJson(const domain::LedgerEntry& entry) {
    nlohmann::json j;
    j["entry_id"] = entry.entryId;
    j["domain"] = domain::toString(entry.domain);
    j["entity_key"] = entry.entityKey;
    j["signed_amount"] = entry.signedAmount;
    j["movement_kind"] = domain::toString(entry.kind);
    j["reference"] = referenceToJson(entry.reference);
    j["occurred_at"] = entry.occurredAt.toString();
    j["recorded_at"] = entry.recordedAt.toString();
    j["remarks"] = entry.remarks;
    return j;
}

inline nlohmann::json toJson(const domain::SaleRecord& sale) {
    nlohmann::json j;
    j["receipt_number"] = sale.receiptNumber;
    j["sale_date"] = sale.saleDate.toString();
    j["pharmacist_name"] = sale.pharmacistName;
    j["payment_mode"] = domain::toString(sale.paymentMode);
    j["items"] = nlohmann::json::array();
    for (const auto& line : sale.lines) {
        j["items"].push_back({
            {"medicine_name", line.batch.medicineName},
            {"batch_number", line.batch.batchNumber},
            {"quantity", line.quantity},
            {"unit_price", line.unitPrice.toString()},
            {"total_price", line.lineTotal().toString()}
        });
    }
    j["subtotal"] = sale.subtotal.toString();
    j["cgst_amount"] = sale.cgstAmount.toString();
    j["sgst_amount"] = sale.sgstAmount.toString();
    j["total_amount"] = sale.totalAmount.toString();
    j["status"] = domain::toString(sale.status);
    return j;
}

inline nlohmann::json toJson(const domain::SupplierInvoice& invoice) {
    nlohmann::json j;
    j["invoice_number"] = invoice.invoiceNumber;
    j["invoice_date"] = invoice.invoiceDate.toDateString();
    j["supplier_name"] = invoice.supplierName;
    j["supplier_gstin"] = invoice.supplierGstin;
    j["po_reference"] = invoice.poReference;
    j["delivery_date"] = invoice.deliveryDate ? nlohmann::json(invoice.deliveryDate->toDateString())
                                              : nlohmann::json(nullptr);
    j["vehicle_number"] = invoice.vehicleNumber;
    j["items"] = nlohmann::json::array();
    for (const auto& line : invoice.lines) {
        j["items"].push_back({
            {"medicine_name", line.batch.medicineName},
            {"batch_number", line.batch.batchNumber},
            {"manufacturer", line.manufacturer},
            {"expiry_date", line.expiryDate ? nlohmann::json(line.expiryDate->toDateString()) : nlohmann::json(nullptr)},
            {"quantity", line.quantity},
            {"unit_price", line.unitCost.toString()},
            {"total_price", line.lineTotal().toString()}
        });
    }
    j["subtotal"] = invoice.subtotal.toString();
    j["cgst_amount"] = invoice.cgstAmount.toString();
    j["sgst_amount"] = invoice.sgstAmount.toString();
    j["total_amount"] = invoice.totalAmount.toString();
    j["payment_status"] = domain::toString(invoice.paymentStatus);
    return j;
}

inline nlohmann::json toJson(const domain::BankLedgerEntry& entry) {
    nlohmann::json j;
    j["entry_id"] = entry.entryId;
    j["account_id"] = entry.accountId;
    j["tran_id"] = entry.tranId;
    j["occurred_at"] = entry.occurredAt.toString();
    j["direction"] = domain::toString(entry.direction);
    j["amount"] = entry.amount.toString();
    j["running_balance"] = entry.runningBalance.toString();
    j["declared_balance"] = entry.declaredBalance ? nlohmann::json(entry.declaredBalance->toString())
                                                  : nlohmann::json(nullptr);
    j["description"] = entry.description;
    j["reference"] = referenceToJson(entry.reference);
    j["status"] = domain::toString(entry.status);
    j["approved_by"] = entry.approvedBy ? nlohmann::json(*entry.approvedBy) : nlohmann::json(nullptr);
    j["approved_at"] = entry.approvedAt ? nlohmann::json(entry.approvedAt->toString()) : nlohmann::json(nullptr);
    j["ledger_entry_id"] = entry.ledgerEntryId ? nlohmann::json(*entry.ledgerEntryId) : nlohmann::json(nullptr);
    j["corrects_entry_id"] = entry.correctsEntryId ? nlohmann::json(*entry.correctsEntryId) : nlohmann::json(nullptr);
    return j;
}

inline nlohmann::json toJson(const domain::ContinuityReport& report) {
    nlohmann::json j;
    j["account_id"] = report.accountId;
    j["continuous"] = report.continuous;
    j["checked_entries"] = report.checkedEntries;
    j["first_broken_entry_id"] = report.firstBrokenEntryId ? nlohmann::json(*report.firstBrokenEntryId)
                                                           : nlohmann::json(nullptr);
    j["replayed_balance"] = report.replayedBalance.toString();
    j["projected_balance"] = report.projectedBalance.toString();
    return j;
}

} // namespace pharmacy::adapters::primary
