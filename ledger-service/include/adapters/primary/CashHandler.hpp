#pragma once

#include <IHttpHandler.hpp>
#include "adapters/primary/JsonMapping.hpp"
#include "ports/input/ICashService.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>

namespace pharmacy::adapters::primary {

/**
 * @brief HTTP Handler сверки банковского счёта
 *
 * Endpoints:
 * - POST /api/v1/bank/accounts                 → открыть счёт
 * - POST /api/v1/bank/entries                  → импорт строки выписки
 * - POST /api/v1/bank/entries/{id}/approve     → утверждение (один раз)
 * - POST /api/v1/bank/entries/{id}/resolve     → корректировка FLAGGED-строки
 * - GET  /api/v1/bank/unreconciled?account_id=
 * - GET  /api/v1/bank/balance?account_id=&as_of=
 * - GET  /api/v1/bank/statement?account_id=&from=&to=
 * - GET  /api/v1/bank/continuity?account_id=
 */
class CashHandler : public IHttpHandler
{
public:
    explicit CashHandler(std::shared_ptr<ports::input::ICashService> cashService)
        : cashService_(std::move(cashService))
    {
        std::cout << "[CashHandler] Created" << std::endl;
    }

    void handle(IRequest& req, IResponse& res) override
    {
        std::string method = req.getMethod();
        std::string path = stripQuery(req.getPath());

        withLedgerErrors(res, "CashHandler", [&]() {
            if (method == "POST" && path == "/api/v1/bank/accounts") {
                handleOpenAccount(req, res);
            } else if (method == "POST" && path == "/api/v1/bank/entries") {
                handleImport(req, res);
            } else if (method == "POST" && path.find(ENTRIES_PREFIX) == 0) {
                handleEntryAction(req, res, path.substr(ENTRIES_PREFIX.size()));
            } else if (method == "GET" && path == "/api/v1/bank/unreconciled") {
                auto account = req.getQueryParam("account_id");
                if (account && account->empty()) {
                    account.reset();
                }
                sendEntries(res, cashService_->unreconciled(account));
            } else if (method == "GET" && path == "/api/v1/bank/balance") {
                handleBalance(req, res);
            } else if (method == "GET" && path == "/api/v1/bank/statement") {
                handleStatement(req, res);
            } else if (method == "GET" && path == "/api/v1/bank/continuity") {
                auto accountId = requireAccountParam(req);
                sendJson(res, 200, toJson(cashService_->verifyContinuity(accountId)));
            } else {
                sendError(res, 404, "Not found");
            }
        });
    }

private:
    inline static const std::string ENTRIES_PREFIX = "/api/v1/bank/entries/";

    std::shared_ptr<ports::input::ICashService> cashService_;

    static std::string requireAccountParam(IRequest& req)
    {
        auto accountId = req.getQueryParam("account_id").value_or("");
        if (accountId.empty()) {
            throw domain::ValidationError("account_id is required");
        }
        return accountId;
    }

    void handleOpenAccount(IRequest& req, IResponse& res)
    {
        auto body = nlohmann::json::parse(req.getBody());

        auto accountId = body.value("account_id", "");
        auto opening = moneyOrZero(body, "opening_balance");

        auto account = cashService_->openAccount(accountId, opening);

        nlohmann::json response;
        response["account_id"] = account.accountId;
        response["opening_balance"] = account.openingBalance.toString();
        response["currency"] = account.currency;
        response["opened_at"] = account.openedAt.toString();
        sendJson(res, 201, response);
    }

    void handleImport(IRequest& req, IResponse& res)
    {
        auto body = nlohmann::json::parse(req.getBody());

        domain::StatementEntryRequest request;
        request.accountId = body.value("account_id", "");
        request.tranId = body.value("tran_id", "");
        request.occurredAt = domain::Timestamp::fromString(body.at("occurred_at").get<std::string>());
        request.direction = domain::movementKindFromString(body.value("direction", "CR"));
        request.amount = moneyFrom(body.at("amount"));
        request.description = body.value("description", "");
        request.reference = referenceFrom(body);
        request.declaredBalance = optionalMoney(body, "declared_balance");

        auto entry = cashService_->importStatementEntry(request);
        sendJson(res, 201, toJson(entry));
    }

    /**
     * @brief "{id}/approve" или "{id}/resolve"
     */
    void handleEntryAction(IRequest& req, IResponse& res, const std::string& rest)
    {
        auto slash = rest.find('/');
        if (slash == std::string::npos) {
            sendError(res, 404, "Not found");
            return;
        }

        int64_t entryId = std::stoll(rest.substr(0, slash));
        std::string action = rest.substr(slash + 1);

        if (action == "approve") {
            auto body = nlohmann::json::parse(req.getBody());
            auto entry = cashService_->approve(entryId, body.value("approved_by", ""));
            sendJson(res, 200, toJson(entry));
        } else if (action == "resolve") {
            auto body = nlohmann::json::parse(req.getBody());

            domain::FlagResolution resolution;
            resolution.direction = domain::movementKindFromString(body.value("direction", "CR"));
            resolution.amount = moneyFrom(body.at("amount"));
            resolution.occurredAt = optionalTimestamp(body, "occurred_at");
            resolution.description = body.value("description", "");
            resolution.declaredBalance = optionalMoney(body, "declared_balance");

            auto entry = cashService_->resolveFlagged(entryId, resolution);
            sendJson(res, 201, toJson(entry));
        } else {
            sendError(res, 404, "Not found");
        }
    }

    void handleBalance(IRequest& req, IResponse& res)
    {
        auto accountId = requireAccountParam(req);
        auto asOf = req.getQueryParam("as_of");

        nlohmann::json response;
        response["account_id"] = accountId;
        if (asOf && !asOf->empty()) {
            auto at = domain::Timestamp::fromString(*asOf);
            response["balance"] = cashService_->balanceAsOf(accountId, at).toString();
            response["as_of"] = at.toString();
        } else {
            response["balance"] = cashService_->balance(accountId).toString();
        }
        sendJson(res, 200, response);
    }

    void handleStatement(IRequest& req, IResponse& res)
    {
        auto accountId = requireAccountParam(req);

        std::optional<domain::Timestamp> from;
        std::optional<domain::Timestamp> to;
        auto fromParam = req.getQueryParam("from").value_or("");
        auto toParam = req.getQueryParam("to").value_or("");
        if (!fromParam.empty()) {
            from = domain::Timestamp::fromString(fromParam);
        }
        if (!toParam.empty()) {
            to = domain::Timestamp::fromString(toParam);
        }

        sendEntries(res, cashService_->statement(accountId, from, to));
    }

    void sendEntries(IResponse& res, const std::vector<domain::BankLedgerEntry>& entries)
    {
        nlohmann::json response;
        response["entries"] = nlohmann::json::array();
        for (const auto& entry : entries) {
            response["entries"].push_back(toJson(entry));
        }
        response["count"] = entries.size();
        sendJson(res, 200, response);
    }
};

} // namespace pharmacy::adapters::primary
