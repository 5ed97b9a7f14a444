#include "../include/util/base64.hpp"
#include "../include/util/pip_math.hpp"

#include <cassert>
#include <cmath>
#include <iostream>

using namespace chartagent::util;

#define TEST(name) void name()
#define RUN_TEST(name)                                                                                                 \
    do {                                                                                                               \
        std::cout << "  " << #name << "... ";                                                                          \
        name();                                                                                                        \
        std::cout << "PASSED\n";                                                                                       \
    } while (0)

#define ASSERT_EQ(a, b) assert((a) == (b))
#define ASSERT_TRUE(x) assert(x)
#define ASSERT_FALSE(x) assert(!(x))
#define ASSERT_NEAR(a, b, eps) assert(std::abs((a) - (b)) < (eps))

TEST(pair_normalization) {
    ASSERT_EQ(normalize_pair("eur/usd"), "EURUSD");
    ASSERT_EQ(normalize_pair("USD_JPY"), "USDJPY");
    ASSERT_TRUE(is_jpy_pair("usd/jpy"));
    ASSERT_TRUE(is_jpy_pair("EURJPY"));
    ASSERT_FALSE(is_jpy_pair("JPYUSD"));
    ASSERT_FALSE(is_jpy_pair("JPY"));
}

TEST(pip_sizes) {
    ASSERT_EQ(pip_size("EURUSD"), 0.0001);
    ASSERT_EQ(pip_size("USDJPY"), 0.01);
    ASSERT_NEAR(pips_to_price(20, "EURUSD"), 0.0020, 1e-12);
    ASSERT_NEAR(price_to_pips(0.35, "GBPJPY"), 35.0, 1e-9);
}

TEST(pip_values) {
    ASSERT_EQ(pip_value_per_lot("EURUSD"), 10.0);
    ASSERT_EQ(pip_value_per_lot("USDJPY"), 9.40);
    ASSERT_EQ(pip_value_per_lot("USDCHF"), 10.60);
    ASSERT_EQ(pip_value_per_lot("USDCAD"), 7.60);
    ASSERT_EQ(pip_value_per_lot("XAUUSD"), 10.0); // Fallback
    ASSERT_NEAR(pip_value("EURUSD", 0.1), 1.0, 1e-12);
}

TEST(position_sizing) {
    // 1% of 10k over 20 pips at $10/pip
    ASSERT_NEAR(position_size(10000, 1.0, 20, "EURUSD"), 0.5, 1e-12);
    ASSERT_NEAR(position_size(10000, 2.0, 30, "USDJPY"), 0.71, 1e-12);
    ASSERT_EQ(position_size(10000, 1.0, 0, "EURUSD"), 0.0);
    ASSERT_EQ(position_size(10000, 1.0, -5, "EURUSD"), 0.0);
}

TEST(profit_and_loss) {
    // 10 pips on one lot
    ASSERT_NEAR(profit_loss(true, 1.1000, 1.1010, 1.0, "EURUSD"), 100.0, 1e-6);
    ASSERT_NEAR(profit_loss(false, 1.1000, 1.1010, 1.0, "EURUSD"), -100.0, 1e-6);
    ASSERT_NEAR(profit_loss(false, 150.00, 149.50, 0.1, "USDJPY"), 47.0, 1e-6);
}

TEST(base64_padding) {
    auto enc = [](const std::string& s) {
        return base64_encode(reinterpret_cast<const uint8_t*>(s.data()), s.size());
    };
    ASSERT_EQ(enc("Man"), "TWFu");
    ASSERT_EQ(enc("Ma"), "TWE=");
    ASSERT_EQ(enc("M"), "TQ==");
    ASSERT_EQ(enc(""), "");
    ASSERT_EQ(base64_encode(std::vector<uint8_t>{0xFF, 0xD8, 0xFF, 0xE0}), "/9j/4A==");
}

int main() {
    std::cout << "\n=== Pip Math Tests ===\n\n";

    RUN_TEST(pair_normalization);
    RUN_TEST(pip_sizes);
    RUN_TEST(pip_values);
    RUN_TEST(position_sizing);
    RUN_TEST(profit_and_loss);
    RUN_TEST(base64_padding);

    std::cout << "\n=== All Pip Math Tests Passed! ===\n";
    return 0;
}
