#include "config/config_loader.hpp"
#include "exchange/simulated_exchange.hpp"
#include "gateway/order_gateway.hpp"
#include "persistence/csv_response_recorder.hpp"
#include "persistence/summary_writer.hpp"
#include "time/clock.hpp"

#include <chrono>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <thread>

namespace {

using namespace std::chrono_literals;

NewOrder make_order(std::uint64_t id, std::uint32_t symbol, OrderSide side,
                    std::uint64_t price, std::uint64_t qty) {
    return NewOrder{.order_id = OrderID{id},
                    .symbol_id = SymbolID{symbol},
                    .side = side,
                    .price = Price{price},
                    .quantity = Quantity{qty}};
}

// Time from now until `target`, or zero if it has passed.
std::chrono::milliseconds until(const Clock& clock, TimeOfDay target) {
    TimeOfDay now = clock.time_of_day();
    if (target <= now) {
        return 0ms;
    }
    return std::chrono::seconds{target.value() - now.value()};
}

void wait_for_close(const OrderGateway& gateway, const Clock& clock) {
    auto deadline = std::chrono::steady_clock::now() +
                    until(clock, gateway.config().session.window.close) + 2s;
    while (gateway.phase() != Phase::CLOSED && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(100ms);
    }
}

void wait_for_drain(const OrderGateway& gateway) {
    auto deadline = std::chrono::steady_clock::now() + 30s;
    while (gateway.queued_count() > 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(100ms);
    }
}

void run_demo_traffic(OrderGateway& gateway, const Clock& clock) {
    std::cout << "Waiting for logon window...\n";
    if (!gateway.wait_for_open(until(clock, gateway.config().session.window.open) + 2s)) {
        std::cerr << "Session did not open; no orders sent.\n";
        return;
    }

    std::cout << "Sending orders...\n";
    for (std::uint64_t i = 0; i < 5; ++i) {
        gateway.new_order(make_order(1000 + i, 1, OrderSide::BUY, 10000 + 100 * i, 10 + i));
        std::this_thread::sleep_for(100ms);
    }

    gateway.modify_order(OrderID{1001}, Price{10550}, Quantity{99});
    gateway.cancel_order(OrderID{1002});
    gateway.modify_order(OrderID{9999}, Price{11110}, Quantity{1});
    gateway.cancel_order(OrderID{8888});
    gateway.modify_order(OrderID{1003}, Price{12000}, Quantity{50});
    gateway.modify_order(OrderID{1003}, Price{13000}, Quantity{60});

    for (std::uint64_t i = 0; i < 10; ++i) {
        gateway.new_order(make_order(2000 + i, 2, OrderSide::SELL, 20000 + 100 * i, 20 + i));
    }

    std::cout << "\nRepeated modify/cancel on one order...\n";
    gateway.new_order(make_order(5000, 4, OrderSide::SELL, 5000, 5));
    for (std::uint64_t i = 1; i <= gateway.config().throttle.max_orders_per_second; ++i) {
        gateway.new_order(make_order(5000 + i, 4, OrderSide::SELL, 5100 + 100 * i, 6 + i));
    }
    gateway.modify_order(OrderID{5000}, Price{6000}, Quantity{7});
    gateway.modify_order(OrderID{5000}, Price{7000}, Quantity{8});
    gateway.cancel_order(OrderID{5000});
    gateway.modify_order(OrderID{5000}, Price{8000}, Quantity{9});

    std::cout << "\nDuplicate ids and invalid orders...\n";
    gateway.new_order(make_order(6000, 5, OrderSide::BUY, 10000, 10));
    gateway.new_order(make_order(6000, 5, OrderSide::SELL, 20000, 20));
    gateway.new_order(make_order(8000, 7, OrderSide::BUY, 10000, 0));
    gateway.new_order(make_order(8002, 7, OrderSide::BUY, 0, 10));

    std::cout << "\nWaiting for logout window...\n";
    wait_for_close(gateway, clock);
    gateway.new_order(make_order(3000, 1, OrderSide::SELL, 30000, 1));

    wait_for_drain(gateway);
}

void run_from_config(const GatewayConfig& config, const Clock& clock) {
    CSVResponseRecorder recorder(config.output_dir);
    SimulatedExchange exchange(config.exchange, clock);
    OrderGateway gateway(config, clock, exchange, recorder);

    std::cout << "Session window: " << format_time_of_day(config.session.window.open)
              << " - " << format_time_of_day(config.session.window.close) << "\n";
    std::cout << "Throttle: " << config.throttle.max_orders_per_second << " orders per "
              << config.throttle.interval.count() << " ms\n\n";

    Timestamp started_at = clock.now();
    gateway.start();
    run_demo_traffic(gateway, clock);
    gateway.stop();
    recorder.flush();

    GatewayStats stats = gateway.stats();
    std::cout << "\nRUN SUMMARY\n-----------\n";
    std::cout << "Submitted:     " << stats.submitted << "\n";
    std::cout << "Sent:          " << stats.sent << "\n";
    std::cout << "Queued:        " << stats.queued << "\n";
    std::cout << "Rejected:      " << stats.rejected << "\n";
    std::cout << "Modified:      " << stats.modified << "\n";
    std::cout << "Cancelled:     " << stats.cancelled << "\n";
    std::cout << "Ignored:       " << stats.ignored << "\n";
    std::cout << "Still queued:  " << stats.still_queued << "\n";

    SummaryWriter summary;
    summary.set_config(config);
    summary.set_stats(stats);
    summary.set_run_window(started_at, clock.now());
    summary.write(config.output_dir);
    std::cout << "\nResponse log written to " << config.output_dir.string() << "/\n";
}

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [options]\n";
    std::cout << "\nOptions:\n";
    std::cout << "  --config <path>  Load gateway configuration from JSON file\n";
    std::cout << "  --output <path>  Override output directory (default: from config)\n";
    std::cout << "  --help           Show this help message\n";
    std::cout << "\nIf no config file is specified, tries config.json then "
                 "config_template.json.\n";
}

} // namespace

int main(int argc, char* argv[]) {
    std::string config_path;
    std::string output_path;

    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--config") == 0) {
            if (i + 1 < argc) {
                config_path = argv[++i];
            } else {
                std::cerr << "Error: --config requires a path argument\n";
                return 1;
            }
        } else if (std::strcmp(argv[i], "--output") == 0 ||
                   std::strcmp(argv[i], "-o") == 0) {
            if (i + 1 < argc) {
                output_path = argv[++i];
            } else {
                std::cerr << "Error: --output requires a path argument\n";
                return 1;
            }
        } else if (std::strcmp(argv[i], "--help") == 0 ||
                   std::strcmp(argv[i], "-h") == 0) {
            print_usage(argv[0]);
            return 0;
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    try {
        SystemClock clock;
        GatewayConfig config;
        if (!config_path.empty()) {
            std::cout << "Loading config from: " << config_path << "\n";
            config = load_config(config_path, clock);
        } else if (std::filesystem::exists("config.json")) {
            std::cout << "Loading config from: config.json\n";
            config = load_config("config.json", clock);
        } else if (std::filesystem::exists("config_template.json")) {
            std::cout << "Loading config from: config_template.json\n";
            config = load_config("config_template.json", clock);
        } else {
            std::cerr << "Error: No config file found.\n";
            std::cerr << "Please provide config.json, config_template.json, or use "
                         "--config <path>\n";
            return 1;
        }

        if (!output_path.empty()) {
            config.output_dir = output_path;
        }
        std::cout << "Output directory: " << config.output_dir.string() << "\n\n";

        run_from_config(config, clock);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
