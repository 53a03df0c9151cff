#include "dydx/feed_handler.hpp"
#include "dydx/message_parser.hpp"
#include "normalizer/event_normalizer.hpp"

namespace crossbook::dydx {

FeedHandler::FeedHandler(
    std::shared_ptr<network::TransportChannel> channel,
    Instrument instrument,
    std::shared_ptr<spdlog::logger> log,
    MessageCallback on_message
)
    : channel_(std::move(channel))
    , instrument_(std::move(instrument))
    , log_(std::move(log))
    , on_message_(std::move(on_message))
{}

FeedHandler::~FeedHandler() {
    stop();
}

void FeedHandler::start() {
    if (state_ != FeedState::Idle) {
        return;
    }

    log_->info("dydx feed starting for {} via {}", instrument_, channel_->describe());
    set_state(FeedState::AwaitConnected);

    std::weak_ptr<FeedHandler> weak = weak_from_this();
    channel_->open(network::TransportChannel::Handlers{
        [weak]() {
            if (auto self = weak.lock()) {
                self->on_channel_open();
            }
        },
        [weak](std::string_view message) {
            if (auto self = weak.lock()) {
                self->on_channel_message(message);
            }
        },
        [weak](std::string_view reason) {
            if (auto self = weak.lock()) {
                self->on_channel_closed(reason);
            }
        }
    });
}

void FeedHandler::stop() {
    switch (state_) {
        case FeedState::Idle:
            set_state(FeedState::Stopped);
            return;
        case FeedState::Terminated:
        case FeedState::Stopped:
            return;
        default:
            break;
    }

    log_->info("dydx feed stopping");
    set_state(FeedState::Stopped);
    channel_->close();
}

void FeedHandler::on_channel_open() {
    // The indexer speaks first
    log_->debug("dydx channel open, waiting for \"connected\"");
}

void FeedHandler::on_channel_message(std::string_view message) {
    if (state_ != FeedState::AwaitConnected &&
        state_ != FeedState::AwaitSnapshot &&
        state_ != FeedState::StreamDeltas) {
        return;
    }

    auto parsed = MessageParser::parse(message);
    if (parsed.is_err()) {
        return terminate(std::move(parsed).error());
    }

    const auto& msg = parsed.value();
    log_->trace("dydx <- {}", MessageParser::type_name(msg));

    switch (state_) {
        case FeedState::AwaitConnected: handle_connected(msg); break;
        case FeedState::AwaitSnapshot:  handle_snapshot(msg); break;
        case FeedState::StreamDeltas:   handle_delta(msg); break;
        default: break;
    }
}

void FeedHandler::handle_connected(const Message& message) {
    if (!std::holds_alternative<Connected>(message)) {
        return terminate(ProtocolViolation{"\"connected\"", MessageParser::type_name(message)});
    }

    set_state(FeedState::AwaitSnapshot);
    channel_->send(MessageParser::subscribe_request(instrument_));
    log_->info("dydx subscribed to {} {}", kOrderbookChannel, instrument_);
}

void FeedHandler::handle_snapshot(const Message& message) {
    const auto* snapshot = std::get_if<Subscribed>(&message);
    if (snapshot == nullptr) {
        return terminate(ProtocolViolation{"\"subscribed\"", MessageParser::type_name(message)});
    }

    log_->info("dydx snapshot: {} bid orders, {} ask orders",
               snapshot->bids.size(), snapshot->asks.size());

    set_state(FeedState::StreamDeltas);
    emit_events(normalizer::to_events(*snapshot));
}

void FeedHandler::handle_delta(const Message& message) {
    const auto* delta = std::get_if<ChannelData>(&message);
    if (delta == nullptr) {
        return terminate(ProtocolViolation{"\"channel_data\"", MessageParser::type_name(message)});
    }

    emit_events(normalizer::to_events(*delta));
}

void FeedHandler::on_channel_closed(std::string_view reason) {
    if (state_ == FeedState::Terminated || state_ == FeedState::Stopped) {
        return;
    }
    terminate(TransportFailure{std::string(reason)});
}

void FeedHandler::emit_events(const std::vector<OrderEvent>& events) {
    for (const auto& event : events) {
        // The consumer may stop us part way through a message
        if (state_ != FeedState::StreamDeltas) {
            return;
        }
        if (on_message_) {
            on_message_(FeedMessage{event});
        }
    }
}

void FeedHandler::terminate(FeedError error) {
    log_->error("dydx feed terminated in {}: {}", to_string(state_), describe(error));

    set_state(FeedState::Terminated);
    channel_->close();

    if (on_message_) {
        on_message_(FeedMessage{std::move(error)});
    }
}

void FeedHandler::set_state(FeedState new_state) {
    if (state_ != new_state) {
        log_->debug("dydx FeedState: {} -> {}", to_string(state_), to_string(new_state));
        state_ = new_state;
    }
}

FeedState FeedHandler::state() const noexcept {
    return state_;
}

const Instrument& FeedHandler::instrument() const noexcept {
    return instrument_;
}

}  // namespace crossbook::dydx
