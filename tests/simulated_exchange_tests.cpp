#include <gtest/gtest.h>

#include "exchange/simulated_exchange.hpp"
#include "time/manual_clock.hpp"

#include <chrono>
#include <vector>

namespace {

Order make_order(std::uint64_t id) {
    return Order{.order_id = OrderID{id},
                 .price = Price{1000},
                 .quantity = Quantity{10},
                 .submitted_at = Timestamp{0},
                 .symbol_id = SymbolID{1},
                 .side = OrderSide::BUY,
                 .status = OrderStatus::SENT};
}

ExchangeConfig instant_exchange(double reject_probability, std::uint64_t seed = 42) {
    return ExchangeConfig{.latency = std::chrono::milliseconds{0},
                          .reject_probability = reject_probability,
                          .seed = seed};
}

std::vector<Verdict> verdicts(SimulatedExchange& exchange, int n) {
    std::vector<Verdict> result;
    for (int i = 0; i < n; ++i) {
        result.push_back(exchange.send(make_order(static_cast<std::uint64_t>(i + 1))).verdict);
    }
    return result;
}

} // namespace

class SimulatedExchangeTest : public ::testing::Test {
protected:
    ManualClock clock{Timestamp{5 * MICROS_PER_SECOND}, make_time_of_day(10, 0, 0)};
};

TEST_F(SimulatedExchangeTest, SentAtComesFromInjectedClock) {
    SimulatedExchange exchange(instant_exchange(0.0), clock);

    EXPECT_EQ(exchange.send(make_order(1)).sent_at, Timestamp{5 * MICROS_PER_SECOND});

    clock.advance(from_millis(250));
    EXPECT_EQ(exchange.send(make_order(2)).sent_at,
              Timestamp{5 * MICROS_PER_SECOND} + from_millis(250));
}

TEST_F(SimulatedExchangeTest, ZeroRejectProbabilityAlwaysAccepts) {
    SimulatedExchange exchange(instant_exchange(0.0), clock);

    for (auto v : verdicts(exchange, 100)) {
        EXPECT_EQ(v, Verdict::ACCEPT);
    }
    EXPECT_EQ(exchange.orders_received(), 100);
}

TEST_F(SimulatedExchangeTest, FullRejectProbabilityAlwaysRejects) {
    SimulatedExchange exchange(instant_exchange(1.0), clock);

    for (auto v : verdicts(exchange, 100)) {
        EXPECT_EQ(v, Verdict::REJECT);
    }
    EXPECT_EQ(exchange.orders_received(), 100);
}

TEST_F(SimulatedExchangeTest, SameSeedGivesSameVerdicts) {
    SimulatedExchange a(instant_exchange(0.5, 7), clock);
    SimulatedExchange b(instant_exchange(0.5, 7), clock);

    EXPECT_EQ(verdicts(a, 200), verdicts(b, 200));
}

TEST_F(SimulatedExchangeTest, HalfRejectProbabilityMixesVerdicts) {
    SimulatedExchange exchange(instant_exchange(0.5), clock);

    int rejects = 0;
    for (auto v : verdicts(exchange, 1'000)) {
        rejects += v == Verdict::REJECT ? 1 : 0;
    }
    EXPECT_GT(rejects, 350);
    EXPECT_LT(rejects, 650);
}

TEST_F(SimulatedExchangeTest, CountsOnlyOrdersSent) {
    SimulatedExchange exchange(instant_exchange(0.0), clock);
    EXPECT_EQ(exchange.orders_received(), 0);
    (void)exchange.send(make_order(1));
    EXPECT_EQ(exchange.orders_received(), 1);
}
