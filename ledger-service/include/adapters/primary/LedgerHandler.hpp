#pragma once

#include <IHttpHandler.hpp>
#include "adapters/primary/JsonMapping.hpp"
#include "ports/input/IBalanceProjector.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>

namespace pharmacy::adapters::primary {

/**
 * @brief HTTP Handler чтения журнала
 *
 * Endpoints:
 * - GET  /api/v1/ledger?entity=&as_of=&domain=   → записи сущности и свёртка
 * - GET  /api/v1/ledger/verify?entity=&domain=   → сверка кэша с пересчётом
 * - POST /api/v1/ledger/rebuild?entity=&domain=  → пересчёт кэша
 *
 * domain по умолчанию: STOCK для ключа партии ("name#batch"), иначе CASH.
 */
class LedgerHandler : public IHttpHandler
{
public:
    explicit LedgerHandler(std::shared_ptr<ports::input::IBalanceProjector> projector)
        : projector_(std::move(projector))
    {
        std::cout << "[LedgerHandler] Created" << std::endl;
    }

    void handle(IRequest& req, IResponse& res) override
    {
        std::string method = req.getMethod();
        std::string path = stripQuery(req.getPath());

        withLedgerErrors(res, "LedgerHandler", [&]() {
            auto entity = req.getQueryParam("entity").value_or("");
            if (entity.empty()) {
                sendError(res, 400, "entity is required");
                return;
            }
            auto ledger = ledgerOf(req, entity);

            if (method == "GET" && path == "/api/v1/ledger") {
                handleRead(req, res, ledger, entity);
            } else if (method == "GET" && path == "/api/v1/ledger/verify") {
                nlohmann::json response;
                response["entity_key"] = entity;
                response["domain"] = domain::toString(ledger);
                response["consistent"] = projector_->verify(ledger, entity);
                sendJson(res, 200, response);
            } else if (method == "POST" && path == "/api/v1/ledger/rebuild") {
                nlohmann::json response;
                response["entity_key"] = entity;
                response["domain"] = domain::toString(ledger);
                response["value"] = projector_->rebuild(ledger, entity);
                sendJson(res, 200, response);
            } else {
                sendError(res, 404, "Not found");
            }
        });
    }

private:
    std::shared_ptr<ports::input::IBalanceProjector> projector_;

    static domain::LedgerDomain ledgerOf(IRequest& req, const std::string& entity)
    {
        auto explicitDomain = req.getQueryParam("domain").value_or("");
        if (!explicitDomain.empty()) {
            return domain::ledgerDomainFromString(explicitDomain);
        }
        return entity.find('#') != std::string::npos ? domain::LedgerDomain::STOCK
                                                     : domain::LedgerDomain::CASH;
    }

    void handleRead(IRequest& req, IResponse& res, domain::LedgerDomain ledger, const std::string& entity)
    {
        std::optional<domain::Timestamp> asOf;
        auto asOfParam = req.getQueryParam("as_of").value_or("");
        if (!asOfParam.empty()) {
            asOf = domain::Timestamp::fromString(asOfParam);
        }

        nlohmann::json response;
        response["entity_key"] = entity;
        response["domain"] = domain::toString(ledger);
        response["entries"] = nlohmann::json::array();
        for (const auto& entry : projector_->read(entity, asOf)) {
            response["entries"].push_back(toJson(entry));
        }

        if (asOf) {
            response["as_of"] = asOf->toString();
            response["value"] = projector_->asOf(ledger, entity, *asOf);
        } else {
            response["value"] = projector_->current(ledger, entity);
        }
        sendJson(res, 200, response);
    }
};

} // namespace pharmacy::adapters::primary
