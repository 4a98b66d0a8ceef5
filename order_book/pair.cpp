#include "pair.H"

#include <algorithm>
#include <cctype>
#include <iterator>
#include <stdexcept>

namespace keeper::orders {

static std::pair<std::string, std::string> split_pair(const std::string& pair) {
    size_t pos = pair.find_first_of("/-");
    if (pos == std::string::npos || pos == 0 || pos + 1 == pair.size() ||
        pair.find_first_of("/-", pos + 1) != std::string::npos) {
        throw std::invalid_argument("Malformed pair: " + pair);
    }

    auto upper = [](std::string token) {
        std::transform(token.begin(), token.end(), token.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        return token;
    };
    return {upper(pair.substr(0, pos)), upper(pair.substr(pos + 1))};
}

std::string token_sell(const std::string& pair) {
    return split_pair(pair).first;
}

std::string token_buy(const std::string& pair) {
    return split_pair(pair).second;
}

template <typename Predicate>
static std::vector<Order> filter_orders(const std::vector<Order>& orders, Predicate predicate) {
    std::vector<Order> result;
    std::copy_if(orders.begin(), orders.end(), std::back_inserter(result), predicate);
    return result;
}

std::vector<Order> our_buy_orders(const std::vector<Order>& orders, const std::string& pair) {
    return filter_orders(orders, [&pair](const Order& order) { return order.pair == pair && !order.is_sell; });
}

std::vector<Order> our_sell_orders(const std::vector<Order>& orders, const std::string& pair) {
    return filter_orders(orders, [&pair](const Order& order) { return order.pair == pair && order.is_sell; });
}

} // namespace keeper::orders
