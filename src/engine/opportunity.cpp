#include "engine/opportunity.hpp"
#include <algorithm>
#include <stdexcept>

namespace crossbook {

Result<Opportunity, std::string> evaluate(
    Venue venue,
    const OrderEvent& event,
    const VenueCrossing& candidate,
    const Notional& balance_before
) {
    const Price incoming_price = price_of(event);
    const Quantity matched = std::min(quantity_of(event), candidate.quantity);

    try {
        const Price spread = incoming_price.checked_sub(candidate.price).abs();
        const Notional balance = balance_before.checked_add(spread * matched);

        return Result<Opportunity, std::string>::Ok(Opportunity{
            .incoming_venue = venue,
            .incoming_side = side_of(event),
            .incoming_price = incoming_price,
            .resting_venue = candidate.exchange,
            .resting_price = candidate.price,
            .spread = spread,
            .matched = matched,
            .balance = balance
        });
    } catch (const std::overflow_error& e) {
        return Result<Opportunity, std::string>::Err(
            std::string(e.what()) + " pricing " + incoming_price.to_string() + " x " +
            matched.to_string() + " against " + candidate.price.to_string()
        );
    }
}

}  // namespace crossbook
