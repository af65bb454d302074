#include "burnbox/engine.hpp"
#include "burnbox/errors.hpp"
#include "burnbox/log.hpp"

#include <cstdint>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace {

void usage() {
    std::cerr << "Usage:\n";
    std::cerr << "  burnbox_cli [--blob-dir <dir>] [--verbose] limits\n";
    std::cerr << "  burnbox_cli [--blob-dir <dir>] [--tier free|premium] [--verbose] demo <text> [password]\n";
}

std::string mib_of(std::uint64_t bytes) {
    return std::to_string(bytes / (1024 * 1024)) + " MiB";
}

void print_limits(const burnbox::TransferEngine& engine) {
    for (const auto tier : {burnbox::Tier::free, burnbox::Tier::premium}) {
        const auto& lim = engine.get_tier_limits(tier);
        std::cout << burnbox::tier_name(tier) << ": max_size=" << mib_of(lim.max_content_size) << " transfers=" << lim.max_transfers_per_window
                  << " per " << lim.window.count() / 1000 << "s expiry=" << lim.expiry.count() / 1000 << "s\n";
    }
}

int run_demo(burnbox::TransferEngine& engine, burnbox::Tier tier, const std::string& text, const std::optional<std::string>& password) {
    const auto receipt = engine.create_text_transfer("cli", tier, text, password);
    std::cout << "transfer=" << receipt.transfer_id << '\n';
    std::cout << "expires_at_ms=" << receipt.expires_at << '\n';

    const auto preview = engine.peek_transfer(receipt.transfer_id);
    std::cout << "password_protected=" << (preview.password_protected ? "yes" : "no") << '\n';

    std::optional<std::string_view> pw;
    if (password) {
        pw = *password;
    }
    const auto delivery = engine.retrieve_transfer(receipt.transfer_id, pw);
    const auto bytes = delivery.content.view();
    std::cout << "content=" << std::string(bytes.begin(), bytes.end()) << '\n';

    try {
        static_cast<void>(engine.retrieve_transfer(receipt.transfer_id, pw));
        std::cerr << "second retrieval unexpectedly succeeded\n";
        return 3;
    } catch (const burnbox::TransferError& ex) {
        std::cout << "second_retrieval=" << ex.what() << '\n';
    }
    return 0;
}

}

int main(int argc, char** argv) {
    try {
        burnbox::EngineConfig config;
        config.run_reaper = false;
        burnbox::Tier tier = burnbox::Tier::free;
        std::vector<std::string> rest;
        for (int i = 1; i < argc; ++i) {
            const std::string arg = argv[i];
            if (arg == "--blob-dir") {
                if (i + 1 >= argc) {
                    usage();
                    return 1;
                }
                config.blob_dir = argv[++i];
            } else if (arg == "--tier") {
                const auto picked = i + 1 < argc ? burnbox::tier_from_name(argv[++i]) : std::nullopt;
                if (!picked) {
                    usage();
                    return 1;
                }
                tier = *picked;
            } else if (arg == "--verbose") {
                config.log_level = spdlog::level::debug;
            } else {
                rest.push_back(arg);
            }
        }

        burnbox::log::init(config.log_level);

        if (rest.size() == 1 && rest[0] == "limits") {
            const burnbox::TransferEngine engine(config);
            print_limits(engine);
            return 0;
        }

        if ((rest.size() == 2 || rest.size() == 3) && rest[0] == "demo") {
            burnbox::TransferEngine engine(config);
            std::optional<std::string> password;
            if (rest.size() == 3) {
                password = rest[2];
            }
            return run_demo(engine, tier, rest[1], password);
        }

        usage();
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << ex.what() << '\n';
        return 2;
    }
}
