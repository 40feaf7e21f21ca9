#include <cstddef>       // std::size_t
#include <exception>     // std::exception
#include <iostream>      // std::cerr, std::cout
#include <string>        // std::string, std::to_string

#include "common.hpp"
#include "logging.hpp"
#include "transaction_log.hpp"

int main(int argc, char* argv[]) {
    try {
        txlog::TransactionLog log;

        if (argc > 1) {
            for (int i = 1; i < argc; ++i) {
                log.append(argv[i]);
            }
        } else {
            for (std::size_t i = 1; i <= txlog::DEMO_DEFAULT_ENTRIES; ++i) {
                log.append("entry-" + std::to_string(i));
            }
        }
        txlog::log_message("appended {} entries: {}", log.length(), log);

        std::cout << "forward:";
        for (const auto& value : log) {
            std::cout << ' ' << value;
        }
        std::cout << "\nbackward:";
        auto cursor = log.cursor_back();
        while (auto value = cursor.next_back()) {
            std::cout << ' ' << *value;
        }
        std::cout << '\n';

        while (auto value = log.pop()) {
            std::cout << "popped " << *value << " (" << log.length() << " left)\n";
        }
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }
}
