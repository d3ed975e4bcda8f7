#pragma once

#include "domain/Company.hpp"
#include "domain/User.hpp"
#include "domain/Transaction.hpp"
#include "domain/Ledger.hpp"
#include "ports/input/ITransactionService.hpp"
#include "ports/input/ILedgerService.hpp"
#include "ports/input/IReportService.hpp"
#include <nlohmann/json.hpp>

namespace bookkeeping::adapters::primary::json
{

    // Суммы выдаются строками "1234.50": double теряет точность копеек

    inline nlohmann::json money(const domain::Money &m)
    {
        return m.toString();
    }

    inline nlohmann::json optionalMoney(const std::optional<domain::Money> &m)
    {
        return m ? money(*m) : nlohmann::json(nullptr);
    }

    inline nlohmann::json toJson(const domain::Company &c)
    {
        nlohmann::json j;
        j["id"] = c.id;
        j["name"] = c.name;
        j["address"] = c.address;
        j["phone"] = c.phone;
        j["email"] = c.email;
        j["balance"] = money(c.balance);
        j["created_at"] = c.createdAt.toString();
        return j;
    }

    inline nlohmann::json toJson(const domain::User &u)
    {
        nlohmann::json j;
        j["id"] = u.id;
        j["company_id"] = u.companyId ? nlohmann::json(*u.companyId) : nlohmann::json(nullptr);
        j["name"] = u.name;
        j["email"] = u.email;
        j["role"] = u.role;
        j["department"] = u.department;
        j["balance"] = money(u.balance);
        j["created_at"] = u.createdAt.toString();
        return j;
    }

    inline nlohmann::json toJson(const domain::Transaction &t)
    {
        nlohmann::json j;
        j["id"] = t.id;
        j["date"] = t.date.toString();
        j["amount"] = money(t.amount);
        j["from"] = t.from.toString();
        j["to"] = t.to.toString();
        j["type"] = t.transactionType();
        j["description"] = t.description;
        j["reference"] = t.reference;
        j["created_at"] = t.createdAt.toString();
        return j;
    }

    inline nlohmann::json toJson(const ports::input::TransactionReceipt &r)
    {
        nlohmann::json j;
        j["transaction"] = toJson(r.transaction);
        j["from_balance"] = optionalMoney(r.fromBalance);
        j["to_balance"] = optionalMoney(r.toBalance);
        return j;
    }

    inline nlohmann::json toJson(const domain::LedgerEntry &e)
    {
        nlohmann::json j;
        j["transaction_id"] = e.transactionId;
        j["date"] = e.date.toString();
        j["type"] = domain::toString(e.type);
        j["description"] = e.description;
        j["reference"] = e.reference;
        j["other_party"] = e.otherParty;
        j["other_endpoint"] = e.otherEndpoint.toString();
        j["amount"] = money(e.amount);
        j["balance_after"] = money(e.balanceAfter);
        return j;
    }

    inline nlohmann::json toJson(const ports::input::ConsistencyIssue &issue)
    {
        nlohmann::json j;
        j["account"] = issue.account.toString();
        j["name"] = issue.name;
        j["stored"] = money(issue.stored);
        j["replayed"] = money(issue.replayed);
        return j;
    }

    inline nlohmann::json toJson(const ports::input::ReportSummary &r)
    {
        nlohmann::json j;
        j["companies"] = r.companyCount;
        j["users"] = r.userCount;
        j["balances"] = {
            {"company_total", money(r.balances.companyTotal)},
            {"user_total", money(r.balances.userTotal)},
            {"grand_total", money(r.balances.grandTotal)}};
        j["transactions"] = {
            {"count", r.transactions.count},
            {"total_amount", money(r.transactions.totalAmount)},
            {"average_amount", money(r.transactions.averageAmount)}};
        j["cash"] = {
            {"deposits", money(r.cash.deposits)},
            {"withdrawals", money(r.cash.withdrawals)},
            {"pool", money(r.cash.pool)}};
        return j;
    }

    template <typename T>
    nlohmann::json toJsonArray(const std::vector<T> &items)
    {
        nlohmann::json arr = nlohmann::json::array();
        for (const auto &item : items)
        {
            arr.push_back(toJson(item));
        }
        return arr;
    }

} // namespace bookkeeping::adapters::primary::json
