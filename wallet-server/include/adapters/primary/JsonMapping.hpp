#pragma once

#include "domain/Session.hpp"
#include "domain/Timestamp.hpp"
#include "domain/WalletModels.hpp"
#include "protocol/ProtocolConstants.hpp"

#include <nlohmann/json.hpp>

namespace walletgate::adapters::primary {

/// GET /wallet/status
inline nlohmann::json statusToJson(const domain::WalletState& state) {
    return {
        {"available", state.available},
        {"locked", state.locked},
        {"wallet_type", protocol::toString(state.walletType)},
        {"network", state.network},
        {"chain_id", state.chainId},
        {"version", protocol::config::PROTOCOL_VERSION}
    };
}

/// GET /wallet/info
inline nlohmann::json infoToJson(const domain::WalletState& state) {
    return {
        {"address", state.address},
        {"truncated_address", state.truncatedAddress()},
        {"locked", state.locked},
        {"chain_id", state.chainId},
        {"network", state.network},
        {"wallet_type", protocol::toString(state.walletType)},
        {"version", protocol::config::PROTOCOL_VERSION}
    };
}

inline nlohmann::json sessionToJson(const domain::Session& session) {
    return {
        {"session_token", session.token},
        {"expires_at", domain::Timestamp(session.expiresAt).toString()},
        {"permissions", protocol::toStrings(session.permissions)}
    };
}

inline nlohmann::json transactionToJson(const domain::TransactionResult& result) {
    return {
        {"success", result.success},
        {"transaction_hash", result.transactionHash},
        {"result", result.result},
        {"errors", result.errors}
    };
}

inline nlohmann::json signatureToJson(const domain::SignatureResult& result) {
    return {
        {"signature", result.signature},
        {"message", result.message},
        {"address", result.address}
    };
}

inline nlohmann::json tokenToJson(const domain::TokenInfo& token) {
    return {
        {"contract_address", token.contractAddress},
        {"token_name", token.tokenName},
        {"token_symbol", token.tokenSymbol},
        {"decimals", token.decimals}
    };
}

} // namespace walletgate::adapters::primary
