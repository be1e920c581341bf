#pragma once

#include <IHttpHandler.hpp>
#include "adapters/primary/JsonMapping.hpp"
#include "ports/input/IStockService.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>

namespace pharmacy::adapters::primary {

/**
 * @brief HTTP Handler документов: чеки кассы и накладные поставщиков
 *
 * Endpoints:
 * - POST /api/v1/sales                          → чек (все строки атомарно)
 * - GET  /api/v1/sales/{receipt}                → чек по номеру
 * - POST /api/v1/invoices                       → накладная (все строки атомарно)
 * - GET  /api/v1/invoices/{number}              → накладная по номеру
 * - POST /api/v1/invoices/{number}/payment-status → смена статуса оплаты
 */
class DocumentHandler : public IHttpHandler
{
public:
    explicit DocumentHandler(std::shared_ptr<ports::input::IStockService> stockService)
        : stockService_(std::move(stockService))
    {
        std::cout << "[DocumentHandler] Created" << std::endl;
    }

    void handle(IRequest& req, IResponse& res) override
    {
        std::string method = req.getMethod();
        std::string path = stripQuery(req.getPath());

        withLedgerErrors(res, "DocumentHandler", [&]() {
            if (method == "POST" && path == "/api/v1/sales") {
                handleRecordSale(req, res);
            } else if (method == "GET" && path.find(SALES_PREFIX) == 0) {
                handleGetSale(res, path.substr(SALES_PREFIX.size()));
            } else if (method == "POST" && path == "/api/v1/invoices") {
                handleRecordReceipt(req, res);
            } else if (method == "POST" && path.find(INVOICES_PREFIX) == 0 && endsWith(path, STATUS_SUFFIX)) {
                auto number = path.substr(INVOICES_PREFIX.size(),
                                          path.size() - INVOICES_PREFIX.size() - STATUS_SUFFIX.size());
                handleUpdatePaymentStatus(req, res, number);
            } else if (method == "GET" && path.find(INVOICES_PREFIX) == 0) {
                handleGetInvoice(res, path.substr(INVOICES_PREFIX.size()));
            } else {
                sendError(res, 404, "Not found");
            }
        });
    }

private:
    inline static const std::string SALES_PREFIX = "/api/v1/sales/";
    inline static const std::string INVOICES_PREFIX = "/api/v1/invoices/";
    inline static const std::string STATUS_SUFFIX = "/payment-status";

    std::shared_ptr<ports::input::IStockService> stockService_;

    static bool endsWith(const std::string& value, const std::string& suffix)
    {
        return value.size() >= suffix.size() &&
               value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
    }

    void handleRecordSale(IRequest& req, IResponse& res)
    {
        auto body = nlohmann::json::parse(req.getBody());

        domain::SaleEvent event;
        event.receiptNumber = body.value("receipt_number", "");
        event.saleDate = optionalTimestamp(body, "sale_date");
        event.pharmacistName = body.value("pharmacist_name", "");
        event.paymentMode = domain::paymentModeFromString(body.value("payment_mode", "CASH"));
        for (const auto& item : body.value("items", nlohmann::json::array())) {
            domain::SaleLine line;
            line.batch = batchFrom(item);
            line.quantity = item.value("quantity", static_cast<int64_t>(0));
            line.unitPrice = moneyOrZero(item, "unit_price");
            event.lines.push_back(line);
        }
        event.subtotal = optionalMoney(body, "subtotal");
        event.cgstAmount = moneyOrZero(body, "cgst_amount");
        event.sgstAmount = moneyOrZero(body, "sgst_amount");
        event.totalAmount = optionalMoney(body, "total_amount");

        auto result = stockService_->recordSale(event);

        nlohmann::json response = toJson(result);
        response["receipt_number"] = event.receiptNumber;
        sendJson(res, 201, response);
    }

    void handleRecordReceipt(IRequest& req, IResponse& res)
    {
        auto body = nlohmann::json::parse(req.getBody());

        domain::ReceiptEvent event;
        event.invoiceNumber = body.value("invoice_number", "");
        event.invoiceDate = optionalTimestamp(body, "invoice_date");
        event.supplierName = body.value("supplier_name", "");
        event.supplierGstin = body.value("supplier_gstin", "");
        event.poReference = body.value("po_reference", "");
        event.deliveryDate = optionalTimestamp(body, "delivery_date");
        event.vehicleNumber = body.value("vehicle_number", "");
        for (const auto& item : body.value("items", nlohmann::json::array())) {
            domain::ReceiptLine line;
            line.batch = batchFrom(item);
            line.quantity = item.value("quantity", static_cast<int64_t>(0));
            line.unitCost = moneyOrZero(item, "unit_price");
            line.manufacturer = item.value("manufacturer", "");
            line.expiryDate = optionalTimestamp(item, "expiry_date");
            line.sellingPrice = optionalMoney(item, "selling_price");
            if (item.contains("reorder_level") && !item["reorder_level"].is_null()) {
                line.reorderLevel = item["reorder_level"].get<int64_t>();
            }
            line.location = item.value("location", "");
            event.lines.push_back(line);
        }
        event.subtotal = optionalMoney(body, "subtotal");
        event.cgstAmount = moneyOrZero(body, "cgst_amount");
        event.sgstAmount = moneyOrZero(body, "sgst_amount");
        event.totalAmount = optionalMoney(body, "total_amount");
        event.paymentStatus = domain::paymentStatusFromString(body.value("payment_status", "PENDING"));

        auto result = stockService_->recordReceipt(event);

        nlohmann::json response = toJson(result);
        response["invoice_number"] = event.invoiceNumber;
        sendJson(res, 201, response);
    }

    void handleGetSale(IResponse& res, const std::string& receiptNumber)
    {
        auto sale = stockService_->findSale(receiptNumber);
        if (!sale) {
            sendError(res, 404, "Sale not found");
            return;
        }
        sendJson(res, 200, toJson(*sale));
    }

    void handleGetInvoice(IResponse& res, const std::string& invoiceNumber)
    {
        auto invoice = stockService_->findInvoice(invoiceNumber);
        if (!invoice) {
            sendError(res, 404, "Invoice not found");
            return;
        }
        sendJson(res, 200, toJson(*invoice));
    }

    void handleUpdatePaymentStatus(IRequest& req, IResponse& res, const std::string& invoiceNumber)
    {
        auto body = nlohmann::json::parse(req.getBody());
        auto status = domain::paymentStatusFromString(body.at("payment_status").get<std::string>());

        auto invoice = stockService_->updateInvoicePaymentStatus(invoiceNumber, status);
        sendJson(res, 200, toJson(invoice));
    }
};

} // namespace pharmacy::adapters::primary
