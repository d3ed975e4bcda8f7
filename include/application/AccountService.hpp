#pragma once

#include "ports/input/IAccountService.hpp"
#include "ports/output/ICompanyRepository.hpp"
#include "ports/output/IUserRepository.hpp"
#include "ports/output/ITransactionRepository.hpp"
#include "domain/Errors.hpp"
#include <memory>
#include <regex>
#include <iostream>

namespace bookkeeping::application {

/**
 * @brief Сервис управления счетами компаний и пользователей
 *
 * Баланс здесь только читается: изменить его может лишь TransactionService.
 *
 * Удаление счёта, на который ссылается хотя бы одна транзакция,
 * запрещено (AccountInUseError): иначе журнал осиротеет и выписку
 * контрагента уже не восстановить.
 */
class AccountService : public ports::input::IAccountService {
public:
    static constexpr std::size_t MAX_NAME_LENGTH = 100;
    static constexpr std::size_t MAX_EMAIL_LENGTH = 254;

    AccountService(
        std::shared_ptr<ports::output::ICompanyRepository> companyRepo,
        std::shared_ptr<ports::output::IUserRepository> userRepo,
        std::shared_ptr<ports::output::ITransactionRepository> transactionRepo
    ) : companyRepo_(std::move(companyRepo))
      , userRepo_(std::move(userRepo))
      , transactionRepo_(std::move(transactionRepo))
    {
        std::cout << "[AccountService] Created" << std::endl;
    }

    // =========================================================================
    // Companies
    // =========================================================================

    domain::Company addCompany(const ports::input::CompanyRequest& request) override {
        validateCompany(request);
        if (companyRepo_->findByName(request.name)) {
            throw domain::ValidationError("name", "company '" + request.name + "' already exists");
        }

        auto company = companyRepo_->insert(
            domain::Company(request.name, request.address, request.phone, request.email));

        std::cout << "[AccountService] Added company #" << company.id << " '" << company.name << "'" << std::endl;
        return company;
    }

    domain::Company updateCompany(int64_t id, const ports::input::CompanyRequest& request) override {
        auto company = requireCompany(id);
        validateCompany(request);

        auto sameName = companyRepo_->findByName(request.name);
        if (sameName && sameName->id != id) {
            throw domain::ValidationError("name", "company '" + request.name + "' already exists");
        }

        company.name = request.name;
        company.address = request.address;
        company.phone = request.phone;
        company.email = request.email;
        if (!companyRepo_->updateDetails(company)) {
            throw domain::NotFoundError("company", id);
        }

        std::cout << "[AccountService] Updated company #" << id << std::endl;
        return company;
    }

    std::optional<domain::Company> getCompany(int64_t id) override {
        return companyRepo_->findById(id);
    }

    std::vector<domain::Company> listCompanies() override {
        return companyRepo_->findAll();
    }

    void removeCompany(int64_t id) override {
        auto company = requireCompany(id);
        requireUnreferenced(domain::AccountRef::company(id), "company '" + company.name + "'");

        if (!companyRepo_->deleteById(id)) {
            throw domain::NotFoundError("company", id);
        }
        std::cout << "[AccountService] Removed company #" << id << std::endl;
    }

    // =========================================================================
    // Users
    // =========================================================================

    domain::User addUser(const ports::input::UserRequest& request) override {
        validateUser(request);

        auto user = userRepo_->insert(domain::User(
            request.name, request.companyId, request.email, request.role, request.department));

        std::cout << "[AccountService] Added user #" << user.id << " '" << user.name << "'" << std::endl;
        return user;
    }

    domain::User updateUser(int64_t id, const ports::input::UserRequest& request) override {
        auto user = requireUser(id);
        validateUser(request);

        user.name = request.name;
        user.companyId = request.companyId;
        user.email = request.email;
        user.role = request.role;
        user.department = request.department;
        if (!userRepo_->updateDetails(user)) {
            throw domain::NotFoundError("user", id);
        }

        std::cout << "[AccountService] Updated user #" << id << std::endl;
        return user;
    }

    std::optional<domain::User> getUser(int64_t id) override {
        return userRepo_->findById(id);
    }

    std::vector<domain::User> listUsers() override {
        return userRepo_->findAll();
    }

    std::vector<domain::User> listUsersByCompany(int64_t companyId) override {
        requireCompany(companyId);
        return userRepo_->findByCompanyId(companyId);
    }

    void removeUser(int64_t id) override {
        auto user = requireUser(id);
        requireUnreferenced(domain::AccountRef::user(id), "user '" + user.name + "'");

        if (!userRepo_->deleteById(id)) {
            throw domain::NotFoundError("user", id);
        }
        std::cout << "[AccountService] Removed user #" << id << std::endl;
    }

    // =========================================================================
    // Balances
    // =========================================================================

    domain::Money getBalance(const domain::AccountRef& account) override {
        if (account.kind == domain::AccountKind::COMPANY) {
            return requireCompany(account.id).balance;
        }
        return requireUser(account.id).balance;
    }

    std::string displayName(const domain::Endpoint& endpoint) override {
        auto ref = endpoint.account();
        if (!ref) return "Cash";

        if (ref->kind == domain::AccountKind::COMPANY) {
            auto company = companyRepo_->findById(ref->id);
            return company ? company->name : ref->toString();
        }
        auto user = userRepo_->findById(ref->id);
        return user ? user->name : ref->toString();
    }

private:
    std::shared_ptr<ports::output::ICompanyRepository> companyRepo_;
    std::shared_ptr<ports::output::IUserRepository> userRepo_;
    std::shared_ptr<ports::output::ITransactionRepository> transactionRepo_;

    domain::Company requireCompany(int64_t id) {
        auto company = companyRepo_->findById(id);
        if (!company) {
            throw domain::NotFoundError("company", id);
        }
        return *company;
    }

    domain::User requireUser(int64_t id) {
        auto user = userRepo_->findById(id);
        if (!user) {
            throw domain::NotFoundError("user", id);
        }
        return *user;
    }

    void requireUnreferenced(const domain::AccountRef& account, const std::string& label) {
        auto references = transactionRepo_->countReferencing(account);
        if (references > 0) {
            std::cout << "[AccountService] REJECTED removal of " << account.toString()
                      << ": " << references << " transaction(s)" << std::endl;
            throw domain::AccountInUseError(label, references);
        }
    }

    void validateCompany(const ports::input::CompanyRequest& request) {
        validateName(request.name);
        validateEmail(request.email);
        validatePhone(request.phone);
    }

    void validateUser(const ports::input::UserRequest& request) {
        validateName(request.name);
        validateEmail(request.email);
        if (request.companyId && !companyRepo_->findById(*request.companyId)) {
            throw domain::NotFoundError("company", *request.companyId);
        }
    }

    static void validateName(const std::string& name) {
        if (name.find_first_not_of(" \t") == std::string::npos) {
            throw domain::ValidationError("name", "is required");
        }
        if (name.size() > MAX_NAME_LENGTH) {
            throw domain::ValidationError("name", "longer than " + std::to_string(MAX_NAME_LENGTH) + " characters");
        }
    }

    static void validateEmail(const std::string& email) {
        if (email.empty()) return;

        static const std::regex pattern(R"(^[a-zA-Z0-9._%+-]+@[a-zA-Z0-9.-]+\.[a-zA-Z]{2,}$)");
        if (email.size() > MAX_EMAIL_LENGTH || !std::regex_match(email, pattern)) {
            throw domain::ValidationError("email", "'" + email + "' is not a valid address");
        }
    }

    /**
     * @brief 10–15 цифр после удаления пробелов, дефисов, точек и скобок
     */
    static void validatePhone(const std::string& phone) {
        if (phone.empty()) return;

        static const std::regex separators(R"([\s\-\(\)\.])");
        static const std::regex digits(R"(^\+?\d{10,15}$)");
        std::string clean = std::regex_replace(phone, separators, "");
        if (!std::regex_match(clean, digits)) {
            throw domain::ValidationError("phone", "'" + phone + "' must contain 10 to 15 digits");
        }
    }
};

} // namespace bookkeeping::application
