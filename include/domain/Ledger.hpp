#pragma once

#include "Transaction.hpp"
#include "enums/EntryType.hpp"
#include <vector>
#include <string>
#include <functional>
#include <algorithm>

namespace bookkeeping::domain {

/**
 * @brief Строка выписки по счёту
 */
struct LedgerEntry {
    int64_t transactionId = 0;
    Date date;
    EntryType type = EntryType::CREDIT;
    std::string description;
    std::string reference;
    std::string otherParty;     ///< Имя контрагента или "Cash Deposit"/"Cash Withdrawal"
    Endpoint otherEndpoint;
    Money amount;
    Money balanceAfter;         ///< Баланс счёта сразу после этой транзакции
    Timestamp createdAt;
};

/**
 * @brief Пересчёт выписки счёта по журналу транзакций
 *
 * Два прохода по одной отсортированной последовательности:
 * 1. Вперёд (старые → новые) — накопление running balance от 0.
 * 2. Разворот — выдача новых первыми.
 *
 * @example
 * ```
 * 2025-10-25  debit  30 000  → -30 000
 * 2025-10-27  credit 75 000  →  45 000
 * 2025-10-28  debit  25 000  →  20 000
 * 2025-10-29  credit 50 000  →  70 000
 * результат: [70 000, 20 000, 45 000, -30 000]
 * ```
 */
class Ledger {
public:
    using NameResolver = std::function<std::string(const Endpoint&)>;

    /**
     * @param subject     Счёт, для которого строится выписка
     * @param journal     Транзакции (могут включать посторонние — они пропускаются)
     * @param nameOf      Отображаемое имя реального контрагента
     */
    static std::vector<LedgerEntry> derive(const AccountRef& subject,
                                           std::vector<Transaction> journal,
                                           const NameResolver& nameOf) {
        journal.erase(std::remove_if(journal.begin(), journal.end(),
                                     [&](const Transaction& t) { return !t.touches(subject); }),
                      journal.end());
        std::sort(journal.begin(), journal.end(), chronologicalLess);

        std::vector<LedgerEntry> entries;
        entries.reserve(journal.size());

        Money running;
        for (const auto& t : journal) {
            LedgerEntry entry;
            entry.transactionId = t.id;
            entry.date = t.date;
            entry.description = t.description;
            entry.reference = t.reference;
            entry.amount = t.amount;
            entry.createdAt = t.createdAt;

            if (t.to.is(subject)) {
                running += t.amount;
                entry.type = EntryType::CREDIT;
                entry.otherEndpoint = t.from;
                entry.otherParty = t.from.isCash() ? "Cash Deposit" : nameOf(t.from);
            } else {
                running -= t.amount;
                entry.type = EntryType::DEBIT;
                entry.otherEndpoint = t.to;
                entry.otherParty = t.to.isCash() ? "Cash Withdrawal" : nameOf(t.to);
            }

            entry.balanceAfter = running;
            entries.push_back(std::move(entry));
        }

        std::reverse(entries.begin(), entries.end());
        return entries;
    }

    /**
     * @brief Баланс по выписке: balanceAfter самой свежей строки или 0
     */
    static Money closingBalance(const std::vector<LedgerEntry>& entries) {
        return entries.empty() ? Money{} : entries.front().balanceAfter;
    }
};

} // namespace bookkeeping::domain
