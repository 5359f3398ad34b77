#pragma once
#include <string>

// Delivers an already signed request body to the exchange. No retries:
// the caller owns retry policy, and a resent action needs a fresh nonce anyway.
class ExchangeClient {
public:
    // e.g. "https://api.hyperliquid.xyz"
    explicit ExchangeClient(std::string base_url);

    // POST <base>/exchange. Returns the response body, or an
    // {"error": ...} JSON string when the transfer or HTTP status fails.
    std::string post_action(const std::string& body_json);

private:
    std::string base_url_;

    std::string post(const std::string& path, const std::string& body_json);
};
