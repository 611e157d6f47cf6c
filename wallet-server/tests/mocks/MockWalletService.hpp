#pragma once

#include "ports/input/IWalletService.hpp"
#include <gmock/gmock.h>

namespace walletgate::tests {

class MockWalletService : public ports::input::IWalletService {
public:
    MOCK_METHOD(domain::WalletState, status, (), (override));
    MOCK_METHOD(void, configureNetwork, (const std::string& networkUrl, const std::string& chainId), (override));
    MOCK_METHOD(domain::NetworkConfig, network, (), (const, override));
    MOCK_METHOD(domain::Result<domain::WalletState>, unlock,
                (const std::string& password, const std::string& source), (override));
    MOCK_METHOD(domain::WalletState, lock, (), (override));
    MOCK_METHOD(domain::Result<std::string>, balance, (const std::string& contract), (override));
    MOCK_METHOD(domain::Result<domain::TransactionResult>, sendTransaction,
                (const domain::TransactionRequest& request), (override));
    MOCK_METHOD(domain::Result<domain::SignatureResult>, signMessage, (const std::string& message), (override));
    MOCK_METHOD(domain::Result<domain::TokenInfo>, addToken, (const domain::TokenInfo& token), (override));
    MOCK_METHOD(std::vector<domain::TokenInfo>, listTokens, (), (override));
};

} // namespace walletgate::tests
