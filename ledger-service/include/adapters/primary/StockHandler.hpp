#pragma once

#include <IHttpHandler.hpp>
#include "adapters/primary/JsonMapping.hpp"
#include "ports/input/IStockService.hpp"
#include "settings/LedgerSettings.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>

namespace pharmacy::adapters::primary {

/**
 * @brief HTTP Handler складских движений и отчётов
 *
 * Endpoints:
 * - POST /api/v1/stock/receipts       → приход одной партии
 * - POST /api/v1/stock/sales          → продажа из одной партии
 * - POST /api/v1/stock/adjustments    → ручная корректировка
 * - GET  /api/v1/stock                → все партии
 * - GET  /api/v1/stock/reorder        → кандидаты на дозаказ
 * - GET  /api/v1/stock/low?threshold=N
 * - GET  /api/v1/stock/expiring?days=N
 * - GET  /api/v1/stock/position?medicine=&batch=
 */
class StockHandler : public IHttpHandler
{
public:
    StockHandler(
        std::shared_ptr<ports::input::IStockService> stockService,
        std::shared_ptr<settings::LedgerSettings> settings
    ) : stockService_(std::move(stockService))
      , settings_(std::move(settings))
    {
        std::cout << "[StockHandler] Created" << std::endl;
    }

    void handle(IRequest& req, IResponse& res) override
    {
        std::string method = req.getMethod();
        std::string path = stripQuery(req.getPath());

        withLedgerErrors(res, "StockHandler", [&]() {
            if (method == "POST" && path == "/api/v1/stock/receipts") {
                handleReceive(req, res);
            } else if (method == "POST" && path == "/api/v1/stock/sales") {
                handleSell(req, res);
            } else if (method == "POST" && path == "/api/v1/stock/adjustments") {
                handleAdjust(req, res);
            } else if (method == "GET" && path == "/api/v1/stock") {
                sendPositions(res, stockService_->inventory());
            } else if (method == "GET" && path == "/api/v1/stock/reorder") {
                sendPositions(res, stockService_->reorderCandidates());
            } else if (method == "GET" && path == "/api/v1/stock/low") {
                auto threshold = std::stoll(req.getQueryParam("threshold").value_or("10"));
                sendPositions(res, stockService_->lowStock(threshold));
            } else if (method == "GET" && path == "/api/v1/stock/expiring") {
                auto days = req.getQueryParam("days");
                int horizon = days ? std::stoi(*days) : settings_->getExpiryWarningDays();
                sendPositions(res, stockService_->expiringWithin(horizon, domain::Timestamp::now()));
            } else if (method == "GET" && path == "/api/v1/stock/position") {
                handlePosition(req, res);
            } else {
                sendError(res, 404, "Not found");
            }
        });
    }

private:
    std::shared_ptr<ports::input::IStockService> stockService_;
    std::shared_ptr<settings::LedgerSettings> settings_;

    void handleReceive(IRequest& req, IResponse& res)
    {
        auto body = nlohmann::json::parse(req.getBody());

        domain::ReceiveRequest request;
        request.batch = batchFrom(body);
        request.quantity = body.value("quantity", static_cast<int64_t>(0));
        request.unitCost = moneyOrZero(body, "unit_cost");
        request.reference = referenceFrom(body);
        request.manufacturer = body.value("manufacturer", "");
        request.expiryDate = optionalTimestamp(body, "expiry_date");
        request.sellingPrice = optionalMoney(body, "selling_price");
        if (body.contains("reorder_level") && !body["reorder_level"].is_null()) {
            request.reorderLevel = body["reorder_level"].get<int64_t>();
        }
        request.location = body.value("location", "");
        request.occurredAt = optionalTimestamp(body, "occurred_at");
        request.remarks = body.value("remarks", "");

        auto result = stockService_->receive(request);
        sendJson(res, 201, toJson(result));
    }

    void handleSell(IRequest& req, IResponse& res)
    {
        auto body = nlohmann::json::parse(req.getBody());

        domain::SellRequest request;
        request.batch = batchFrom(body);
        request.quantity = body.value("quantity", static_cast<int64_t>(0));
        request.unitPrice = moneyOrZero(body, "unit_price");
        request.reference = referenceFrom(body);
        request.occurredAt = optionalTimestamp(body, "occurred_at");
        request.remarks = body.value("remarks", "");

        auto result = stockService_->sell(request);
        sendJson(res, 201, toJson(result));
    }

    void handleAdjust(IRequest& req, IResponse& res)
    {
        auto body = nlohmann::json::parse(req.getBody());

        domain::AdjustRequest request;
        request.batch = batchFrom(body);
        request.delta = body.value("delta", static_cast<int64_t>(0));
        request.reason = body.value("reason", "");
        request.reference = referenceFrom(body);
        request.occurredAt = optionalTimestamp(body, "occurred_at");

        auto result = stockService_->adjust(request);
        sendJson(res, 201, toJson(result));
    }

    void handlePosition(IRequest& req, IResponse& res)
    {
        domain::BatchKey batch{
            req.getQueryParam("medicine").value_or(""),
            req.getQueryParam("batch").value_or("")
        };
        if (!batch.isValid()) {
            sendError(res, 400, "medicine and batch are required");
            return;
        }

        auto position = stockService_->position(batch);
        if (!position) {
            sendError(res, 404, "Batch not found");
            return;
        }
        sendJson(res, 200, toJson(*position));
    }

    void sendPositions(IResponse& res, const std::vector<domain::StockPosition>& positions)
    {
        nlohmann::json response;
        response["items"] = nlohmann::json::array();
        for (const auto& position : positions) {
            response["items"].push_back(toJson(position));
        }
        response["count"] = positions.size();
        sendJson(res, 200, response);
    }
};

} // namespace pharmacy::adapters::primary
