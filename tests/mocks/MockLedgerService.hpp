#pragma once

#include "ports/input/ILedgerService.hpp"
#include <gmock/gmock.h>

namespace bookkeeping::tests::mocks {

class MockLedgerService : public ports::input::ILedgerService {
public:
    MOCK_METHOD(std::vector<domain::LedgerEntry>, getLedger, (const domain::AccountRef&), (override));
    MOCK_METHOD(void, verifyAccount, (const domain::AccountRef&), (override));
    MOCK_METHOD(std::vector<ports::input::ConsistencyIssue>, audit, (), (override));
};

} // namespace bookkeeping::tests::mocks
