// place_order: build an L1 action from config.json, sign it, print the
// exchange request body and (with "send": true) POST it.
//
//   HL_PRIVATE_KEY=0x... ./place_order [path/to/config.json]

#include <cstdint>
#include <cstdlib>
#include <exception>
#include <fstream>
#include <iostream>
#include <string>

#include <nlohmann/json.hpp>

#include "exchange_client.hpp"
#include "log.hpp"
#include "phantom_agent.hpp"
#include "private_key_signer.hpp"
#include "request_config.hpp"
#include "wire_codec.hpp"

using json = nlohmann::json;

int main(int argc, char** argv) {
    // ---------- Open config file ----------
    const std::string cfg_path = (argc > 1) ? argv[1] : "../config.json";
    std::ifstream cfg(cfg_path);
    if (!cfg.is_open()) {
        log_line("place_order", "Failed to open " + cfg_path);
        return 1;
    }

    // ---------- Key (never in the config) ----------
    const char* pk = std::getenv("HL_PRIVATE_KEY");
    if (!pk || !*pk) {
        log_line("place_order", "HL_PRIVATE_KEY is not set");
        return 1;
    }

    try {
        // ---------- Parse JSON ----------
        json j;
        cfg >> j;
        const PlaceOrderConfig pc = parse_place_order_config(j);

        PrivateKeySigner signer(pk);
        const std::uint64_t nonce = pc.nonce ? *pc.nonce : timestamp_ms();

        log_line("place_order",
                 std::string("action=") + action_type(pc.action) +
                 " network=" + (pc.is_mainnet ? "mainnet" : "testnet") +
                 " signer=" + signer.address() +
                 " nonce=" + std::to_string(nonce) +
                 (pc.vault_address ? " vault=" + pc.vault_address->to_hex() : std::string()));

        // ---------- Sign ----------
        const Signature sig = sign_l1_action(signer, pc.action, pc.vault_address, nonce, pc.is_mainnet);
        const auto request = build_exchange_request(pc.action, nonce, sig, pc.vault_address);

        std::cout << request.dump(2) << std::endl;

        // ---------- Submit ----------
        if (!pc.send) return 0;

        ExchangeClient client(pc.endpoint);
        const std::string resp = client.post_action(request.dump());
        std::cout << resp << std::endl;

        const auto rj = json::parse(resp, nullptr, false);
        if (rj.is_discarded() || (rj.is_object() && rj.contains("error"))) return 1;
        if (rj.is_object() && rj.value("status", "") == "err") {
            log_line("place_order", "exchange rejected the action");
            return 1;
        }
        return 0;
    } catch (const std::exception& e) {
        log_line("place_order", std::string("Error: ") + e.what());
        return 1;
    }
}
