#include "normalizer/event_normalizer.hpp"

namespace crossbook::normalizer {

namespace {

template <typename SideEvent>
void append(std::vector<OrderEvent>& out, const std::vector<std::pair<Price, Quantity>>& levels) {
    for (const auto& [price, quantity] : levels) {
        out.emplace_back(SideEvent{price, quantity});
    }
}

template <typename SideEvent>
void append(std::vector<OrderEvent>& out, const std::vector<dydx::RestingOrder>& orders) {
    for (const auto& order : orders) {
        out.emplace_back(SideEvent{order.price, order.size});
    }
}

template <typename Book>
std::vector<OrderEvent> book_events(const Book& book) {
    std::vector<OrderEvent> events;
    events.reserve(book.bids.size() + book.asks.size());
    append<Buy>(events, book.bids);
    append<Sell>(events, book.asks);
    return events;
}

}  // namespace

std::vector<OrderEvent> to_events(const dydx::Subscribed& snapshot) {
    return book_events(snapshot);
}

std::vector<OrderEvent> to_events(const dydx::ChannelData& delta) {
    return book_events(delta);
}

std::vector<OrderEvent> to_events(const aevo::Snapshot& snapshot) {
    return book_events(snapshot);
}

std::vector<OrderEvent> to_events(const aevo::Update& update) {
    return book_events(update);
}

}  // namespace crossbook::normalizer
