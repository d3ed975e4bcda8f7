#pragma once

#include "enums/AccountKind.hpp"
#include "Errors.hpp"
#include <string>
#include <variant>
#include <optional>
#include <cstdint>

namespace bookkeeping::domain {

/**
 * @brief Ссылка на реальный счёт: (вид, id)
 */
struct AccountRef {
    AccountKind kind = AccountKind::COMPANY;
    int64_t id = 0;

    static AccountRef company(int64_t id) { return AccountRef{AccountKind::COMPANY, id}; }
    static AccountRef user(int64_t id) { return AccountRef{AccountKind::USER, id}; }

    /**
     * @brief "company:3" / "user:7"
     */
    std::string toString() const {
        return domain::toString(kind) + ":" + std::to_string(id);
    }

    bool operator==(const AccountRef&) const = default;
};

struct CompanyEndpoint {
    int64_t id = 0;
    bool operator==(const CompanyEndpoint&) const = default;
};

struct UserEndpoint {
    int64_t id = 0;
    bool operator==(const UserEndpoint&) const = default;
};

/**
 * @brief Виртуальный кассовый пул: деньги входят в систему или покидают её
 *
 * Единственный экземпляр, баланс не хранится.
 */
struct CashEndpoint {
    bool operator==(const CashEndpoint&) const { return true; }
};

template <class... Ts>
struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

/**
 * @brief Сторона транзакции: Company(id) | User(id) | Cash
 *
 * Хранится как (type, id), где для cash id всегда 0.
 */
class Endpoint {
public:
    using Variant = std::variant<CompanyEndpoint, UserEndpoint, CashEndpoint>;

    Endpoint() : value_(CashEndpoint{}) {}

    static Endpoint company(int64_t id) { return Endpoint(CompanyEndpoint{id}); }
    static Endpoint user(int64_t id) { return Endpoint(UserEndpoint{id}); }
    static Endpoint cash() { return Endpoint(CashEndpoint{}); }

    static Endpoint of(const AccountRef& ref) {
        return ref.kind == AccountKind::COMPANY ? company(ref.id) : user(ref.id);
    }

    /**
     * @brief Восстановить из колонок хранилища (from_type, from_id)
     * @throws std::invalid_argument для неизвестного типа
     */
    static Endpoint fromStorage(const std::string& type, int64_t id) {
        if (type == "cash") return cash();
        return of(AccountRef{parseAccountKind(type), id});
    }

    /**
     * @brief Разобрать "cash", "company:3", "user:7"
     * @throws ValidationError{field} при некорректной записи
     */
    static Endpoint parse(const std::string& text, const std::string& field) {
        if (text == "cash") return cash();

        auto colon = text.find(':');
        if (colon == std::string::npos || colon + 1 >= text.size()) {
            throw ValidationError(field, "expected company:<id>, user:<id> or cash, got '" + text + "'");
        }
        try {
            AccountKind kind = parseAccountKind(text.substr(0, colon));
            std::size_t used = 0;
            std::string idText = text.substr(colon + 1);
            int64_t id = std::stoll(idText, &used);
            if (used != idText.size() || id <= 0) {
                throw std::invalid_argument(idText);
            }
            return of(AccountRef{kind, id});
        } catch (const std::logic_error&) {
            throw ValidationError(field, "expected company:<id>, user:<id> or cash, got '" + text + "'");
        }
    }

    bool isCash() const {
        return std::holds_alternative<CashEndpoint>(value_);
    }

    /**
     * @brief Реальный счёт этой стороны или nullopt для кассы
     */
    std::optional<AccountRef> account() const {
        return std::visit(overloaded{
            [](const CompanyEndpoint& e) -> std::optional<AccountRef> { return AccountRef::company(e.id); },
            [](const UserEndpoint& e) -> std::optional<AccountRef> { return AccountRef::user(e.id); },
            [](const CashEndpoint&) -> std::optional<AccountRef> { return std::nullopt; }
        }, value_);
    }

    bool is(const AccountRef& ref) const {
        auto own = account();
        return own && *own == ref;
    }

    std::string typeName() const {
        return std::visit(overloaded{
            [](const CompanyEndpoint&) { return std::string("company"); },
            [](const UserEndpoint&) { return std::string("user"); },
            [](const CashEndpoint&) { return std::string("cash"); }
        }, value_);
    }

    int64_t storageId() const {
        auto ref = account();
        return ref ? ref->id : 0;
    }

    std::string toString() const {
        auto ref = account();
        return ref ? ref->toString() : "cash";
    }

    const Variant& value() const { return value_; }

    bool operator==(const Endpoint& other) const { return value_ == other.value_; }

private:
    explicit Endpoint(Variant value) : value_(std::move(value)) {}

    Variant value_;
};

} // namespace bookkeeping::domain
