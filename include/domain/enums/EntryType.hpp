#pragma once

#include <string>

namespace bookkeeping::domain {

/**
 * @brief Тип строки выписки относительно счёта
 */
enum class EntryType {
    CREDIT,     ///< Счёт получатель (to), баланс растёт
    DEBIT       ///< Счёт отправитель (from), баланс уменьшается
};

inline std::string toString(EntryType type) {
    switch (type) {
        case EntryType::CREDIT: return "Credit";
        case EntryType::DEBIT:  return "Debit";
        default: return "Unknown";
    }
}

} // namespace bookkeeping::domain
