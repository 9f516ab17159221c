#include <iostream>
#include <memory>
#include <nftmart.hpp>

using namespace nftmart;

int main() {
    std::cout << "=== NFT Marketplace Demo ===" << std::endl;

    // Example 1: Operator key, value ledger and one collection
    std::cout << "\n1. Setting up the marketplace..." << std::endl;

    auto operator_key = Key::generate();
    if (!operator_key.is_ok()) {
        std::cerr << "Failed to generate operator key" << std::endl;
        return 1;
    }

    MarketplaceConfig config;
    config.operator_id = operator_key.value().getId();

    auto value = std::make_shared<ledger::ValueLedger>();
    value->credit("alice", 1000);
    value->credit("bob", 1000);
    value->credit("carol", 1000);

    Marketplace market(config, value);

    auto punks = std::make_shared<ledger::MemoryRegistry>("punks");
    if (!market.registerCollection("punks", punks).is_ok()) {
        std::cerr << "Failed to register collection" << std::endl;
        return 1;
    }

    TokenId first = punks->mint("alice");
    TokenId second = punks->mint("alice");
    std::cout << "   Operator: " << config.operator_id.substr(0, 16) << "..." << std::endl;
    std::cout << "   Minted punks#" << first << " and punks#" << second << " to alice" << std::endl;

    // Example 2: List and buy
    std::cout << "\n2. Listing punks#" << first << " and selling it to bob..." << std::endl;

    (void)punks->approve("alice", market.getAccount(), first);
    auto listed = market.listItem("punks", first, 100, "alice");
    if (!listed.is_ok()) {
        std::cerr << "   List failed: " << listed.error().message.c_str() << std::endl;
        return 1;
    }

    auto bob_auth = ledger::signFeeAuthorization(operator_key.value(), "dave", 500, "bob");
    if (!bob_auth.is_ok()) {
        std::cerr << "Failed to sign fee authorization" << std::endl;
        return 1;
    }

    auto bought = market.buyItem("punks", first, 100, bob_auth.value(), "dave", 500, "bob");
    if (bought.is_ok()) {
        const auto &record = bought.value();
        std::cout << "   Marketplace share: " << record.marketplace_share << std::endl;
        std::cout << "   Collection share:  " << record.collection_share << std::endl;
        std::cout << "   Seller share:      " << record.payee_share << std::endl;
    } else {
        std::cerr << "   Buy failed: " << bought.error().message.c_str() << std::endl;
    }

    // Example 3: Offer, cancel, offer again and accept
    std::cout << "\n3. Offers on punks#" << second << "..." << std::endl;

    (void)market.makeOffer("punks", second, 50, 50, "carol");
    std::cout << "   carol offers 50, escrowed: " << market.getEscrowedAmount() << std::endl;
    (void)market.cancelOffer("punks", second, "carol");
    std::cout << "   carol cancels, balance back to " << value->balanceOf("carol") << std::endl;

    (void)market.makeOffer("punks", second, 80, 90, "carol");
    std::cout << "   carol offers 80 staking 90, retained surplus: " << market.getRetainedSurplus() << std::endl;

    (void)punks->approve("alice", market.getAccount(), second);
    auto alice_auth = ledger::signFeeAuthorization(operator_key.value(), "dave", 500, "alice");
    if (!alice_auth.is_ok()) {
        std::cerr << "Failed to sign fee authorization" << std::endl;
        return 1;
    }
    auto accepted = market.acceptOffer("punks", second, alice_auth.value(), "dave", 500, "carol", "alice");
    if (accepted.is_ok()) {
        auto owner = punks->ownerOf(second);
        std::cout << "   Offer accepted, new owner: " << (owner.is_ok() ? owner.value() : "?") << std::endl;
    } else {
        std::cerr << "   Accept failed: " << accepted.error().message.c_str() << std::endl;
    }

    // Example 4: A rejected call leaves nothing behind
    std::cout << "\n4. Rejected purchase..." << std::endl;
    auto missing = market.buyItem("punks", first, 100, bob_auth.value(), "dave", 500, "bob");
    std::cout << "   " << (missing.is_ok() ? "unexpected success" : missing.error().message.c_str()) << std::endl;

    // Example 5: Snapshot
    std::cout << "\n5. Snapshot..." << std::endl;
    auto snapshot = market.serialize();
    if (snapshot.is_ok()) {
        std::cout << "   Snapshot size: " << snapshot.value().size() << " bytes" << std::endl;
    }

    std::cout << "\nBalances: alice=" << value->balanceOf("alice") << " bob=" << value->balanceOf("bob")
              << " carol=" << value->balanceOf("carol") << " dave=" << value->balanceOf("dave")
              << " operator=" << value->balanceOf(config.operator_id) << std::endl;
    std::cout << std::endl;
    market.printSummary();

    return 0;
}
