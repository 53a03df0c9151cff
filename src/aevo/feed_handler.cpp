#include "aevo/feed_handler.hpp"
#include "aevo/message_parser.hpp"
#include "normalizer/event_normalizer.hpp"

namespace crossbook::aevo {

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

    log_->info("aevo feed starting for {} via {}", instrument_, channel_->describe());
    set_state(FeedState::Subscribing);

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

    log_->info("aevo feed stopping");
    set_state(FeedState::Stopped);
    pending_snapshot_.reset();
    channel_->close();
}

void FeedHandler::on_channel_open() {
    if (state_ != FeedState::Subscribing) {
        return;
    }

    // No greeting on this venue: subscribe straight away
    set_state(FeedState::AwaitSnapshot);
    channel_->send(MessageParser::subscribe_request(instrument_));
    log_->info("aevo subscribed to {}", MessageParser::channel_name(instrument_));
}

void FeedHandler::on_channel_message(std::string_view message) {
    switch (state_) {
        case FeedState::Subscribing:
            return terminate(ProtocolViolation{"no message before subscribing", excerpt(message, 64)});
        case FeedState::AwaitSnapshot: return handle_snapshot(message);
        case FeedState::AwaitAck:      return handle_ack(message);
        case FeedState::StreamUpdates: return handle_update(message);
        default: return;
    }
}

void FeedHandler::handle_snapshot(std::string_view message) {
    auto parsed = MessageParser::parse(message);
    if (parsed.is_err()) {
        return terminate(std::move(parsed).error());
    }

    auto* snapshot = std::get_if<Snapshot>(&parsed.value());
    if (snapshot == nullptr) {
        return terminate(ProtocolViolation{"\"snapshot\"", MessageParser::type_name(parsed.value())});
    }

    log_->info("aevo snapshot: {} bid levels, {} ask levels",
               snapshot->bids.size(), snapshot->asks.size());

    pending_snapshot_ = std::move(*snapshot);
    set_state(FeedState::AwaitAck);
}

void FeedHandler::handle_ack(std::string_view message) {
    auto ack = MessageParser::parse_ack(message);
    if (ack.is_err()) {
        return terminate(ProtocolViolation{"subscription acknowledgement", excerpt(message, 64)});
    }

    log_->debug("aevo discarded acknowledgement for {} channel(s)", ack.value().channels.size());

    set_state(FeedState::StreamUpdates);

    auto snapshot = std::move(*pending_snapshot_);
    pending_snapshot_.reset();
    emit_events(normalizer::to_events(snapshot));
}

void FeedHandler::handle_update(std::string_view message) {
    auto parsed = MessageParser::parse(message);
    if (parsed.is_err()) {
        return terminate(std::move(parsed).error());
    }

    const auto& msg = parsed.value();
    if (const auto* update = std::get_if<Update>(&msg)) {
        return emit_events(normalizer::to_events(*update));
    }
    if (std::holds_alternative<Snapshot>(msg)) {
        // The venue re-snapshots on its own; the deltas stay authoritative
        log_->debug("aevo ignoring repeated snapshot");
        return;
    }
    terminate(ProtocolViolation{"\"update\"", MessageParser::type_name(msg)});
}

void FeedHandler::on_channel_closed(std::string_view reason) {
    if (state_ == FeedState::Terminated || state_ == FeedState::Stopped) {
        return;
    }
    terminate(TransportFailure{std::string(reason)});
}

void FeedHandler::emit_events(const std::vector<OrderEvent>& events) {
    for (const auto& event : events) {
        if (state_ != FeedState::StreamUpdates) {
            return;
        }
        if (on_message_) {
            on_message_(FeedMessage{event});
        }
    }
}

void FeedHandler::terminate(FeedError error) {
    log_->error("aevo feed terminated in {}: {}", to_string(state_), describe(error));

    set_state(FeedState::Terminated);
    pending_snapshot_.reset();
    channel_->close();

    if (on_message_) {
        on_message_(FeedMessage{std::move(error)});
    }
}

void FeedHandler::set_state(FeedState new_state) {
    if (state_ != new_state) {
        log_->debug("aevo FeedState: {} -> {}", to_string(state_), to_string(new_state));
        state_ = new_state;
    }
}

FeedState FeedHandler::state() const noexcept {
    return state_;
}

const Instrument& FeedHandler::instrument() const noexcept {
    return instrument_;
}

}  // namespace crossbook::aevo
