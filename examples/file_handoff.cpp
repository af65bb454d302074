#include "burnbox/engine.hpp"
#include "burnbox/errors.hpp"
#include "burnbox/log.hpp"

#include <chrono>
#include <filesystem>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>

int main() {
    try {
        burnbox::log::init(spdlog::level::warn);

        burnbox::EngineConfig cfg;
        cfg.blob_dir = std::filesystem::temp_directory_path() / "burnbox-handoff";
        cfg.reaper_interval = std::chrono::seconds(5);
        cfg.admin_ids = {"ops"};
        burnbox::TransferEngine engine(cfg);

        const std::string body = "ssid=lab-5g\npsk=correct horse battery staple\n";
        std::istringstream in(body);
        const auto receipt = engine.create_file_transfer("alice", burnbox::Tier::free, in, body.size(), "wifi.txt", std::string("blue-door"));
        std::cout << "transfer=" << receipt.transfer_id << '\n';

        const auto stats = engine.user_stats("alice");
        std::cout << "used=" << stats.used << '/' << stats.limit << '\n';

        try {
            static_cast<void>(engine.retrieve_transfer(receipt.transfer_id, "red-door"));
        } catch (const burnbox::TransferError& ex) {
            std::cout << "first_try=" << ex.what() << '\n';
        }

        const auto got = engine.retrieve_transfer(receipt.transfer_id, "blue-door");
        const auto bytes = got.content.view();
        std::cout << "file=" << got.file_name << '\n';
        std::cout << "body=" << std::string(bytes.begin(), bytes.end());
        std::cout << "blobs_left=" << engine.blobs().count() << '\n';
        return 0;
    } catch (const std::exception& ex) {
        std::cerr << ex.what() << '\n';
        return 2;
    }
}
