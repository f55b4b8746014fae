#include "lanbeam/transport/memory_transport.hpp"

#include <spdlog/spdlog.h>

namespace lanbeam::transport {
namespace {

constexpr const char* kOfferPrefix = "lanbeam-memory-offer:";
constexpr const char* kAnswerPrefix = "lanbeam-memory-answer:";

std::optional<std::uint64_t> parse_handle(const std::string& description, const std::string& prefix) {
    if (description.rfind(prefix, 0) != 0) {
        return std::nullopt;
    }
    const std::string digits = description.substr(prefix.size());
    if (digits.empty() || digits.find_first_not_of("0123456789") != std::string::npos) {
        return std::nullopt;
    }
    try {
        return std::stoull(digits);
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

} // namespace

// ──────────────────────────────────────────────────────────
// MemoryChannel
// ──────────────────────────────────────────────────────────

MemoryChannel::MemoryChannel(std::shared_ptr<Link> link) : link_(std::move(link)) {}

std::pair<std::shared_ptr<MemoryChannel>, std::shared_ptr<MemoryChannel>> MemoryChannel::make_pair() {
    auto link = std::make_shared<Link>();
    std::shared_ptr<MemoryChannel> a(new MemoryChannel(link));
    std::shared_ptr<MemoryChannel> b(new MemoryChannel(link));
    a->peer_ = b;
    b->peer_ = a;
    return {a, b};
}

void MemoryChannel::open_link() {
    {
        std::lock_guard lock(link_->mutex);
        if (link_->closed) {
            return;
        }
        link_->open = true;
    }
    link_->cv.notify_all();
}

Result<void> MemoryChannel::send_text(const std::string& text) {
    return deliver(ChannelMessage(std::in_place_index<0>, text));
}

Result<void> MemoryChannel::send_binary(const std::uint8_t* data, std::size_t size) {
    return deliver(ChannelMessage(std::in_place_index<1>, Bytes(data, data + size)));
}

Result<void> MemoryChannel::deliver(ChannelMessage message) {
    if (!is_open()) {
        return Err<void>(ErrorKind::TransportFatal, "data channel is not open");
    }
    auto peer = peer_.lock();
    if (!peer) {
        return Err<void>(ErrorKind::TransportFatal, "remote endpoint is gone");
    }
    peer->inbound_.append(std::move(message));
    messages_sent_++;
    return Ok();
}

bool MemoryChannel::is_open() const {
    std::lock_guard lock(link_->mutex);
    return link_->open && !link_->closed;
}

bool MemoryChannel::wait_open(std::chrono::milliseconds timeout) {
    std::unique_lock lock(link_->mutex);
    link_->cv.wait_for(lock, timeout, [this]() { return link_->open || link_->closed; });
    return link_->open && !link_->closed;
}

void MemoryChannel::close() {
    {
        std::lock_guard lock(link_->mutex);
        if (link_->closed) {
            return;
        }
        link_->closed = true;
        link_->open = false;
    }
    link_->cv.notify_all();

    inbound_.close();
    if (auto peer = peer_.lock()) {
        peer->inbound_.close();
    }
    spdlog::debug("[MemoryChannel] closed");
}

// ──────────────────────────────────────────────────────────
// MemoryTransportHub
// ──────────────────────────────────────────────────────────

class MemoryTransportHub::MemoryPendingOffer : public PendingOffer {
public:
    MemoryPendingOffer(MemoryTransportHub& hub, std::uint64_t id)
        : hub_(hub), id_(id), description_(kOfferPrefix + std::to_string(id)) {}

    const std::string& local_description() const override { return description_; }

    Result<std::shared_ptr<DataChannel>> accept_answer(const std::string& answer_description) override {
        auto channel = hub_.complete(id_, answer_description);
        if (channel.is_error()) {
            return Err<std::shared_ptr<DataChannel>>(channel.error());
        }
        return Ok(std::shared_ptr<DataChannel>(channel.value()));
    }

private:
    MemoryTransportHub& hub_;
    std::uint64_t id_;
    std::string description_;
};

Result<std::unique_ptr<PendingOffer>> MemoryTransportHub::create_offer() {
    auto [offerer, answerer] = MemoryChannel::make_pair();

    std::lock_guard lock(mutex_);
    const std::uint64_t id = next_id_++;
    slots_[id] = Slot{offerer, answerer, false};
    return Ok(std::unique_ptr<PendingOffer>(std::make_unique<MemoryPendingOffer>(*this, id)));
}

Result<AnsweredSession> MemoryTransportHub::create_answer(const std::string& offer_description) {
    const auto id = parse_handle(offer_description, kOfferPrefix);
    if (!id) {
        return Err<AnsweredSession>(ErrorKind::TransportFatal, "offer was not created by this transport");
    }

    std::lock_guard lock(mutex_);
    auto it = slots_.find(*id);
    if (it == slots_.end() || it->second.answered) {
        return Err<AnsweredSession>(ErrorKind::TransportFatal, "unknown or already answered offer");
    }
    it->second.answered = true;

    AnsweredSession session;
    session.local_description = kAnswerPrefix + std::to_string(*id);
    session.channel = it->second.answerer;
    return Ok(std::move(session));
}

Result<std::shared_ptr<MemoryChannel>> MemoryTransportHub::complete(std::uint64_t id,
                                                                     const std::string& answer_description) {
    const auto answer_id = parse_handle(answer_description, kAnswerPrefix);
    if (!answer_id || *answer_id != id) {
        return Err<std::shared_ptr<MemoryChannel>>(ErrorKind::TransportFatal, "answer does not match offer");
    }

    std::lock_guard lock(mutex_);
    auto it = slots_.find(id);
    if (it == slots_.end() || !it->second.answered) {
        return Err<std::shared_ptr<MemoryChannel>>(ErrorKind::TransportFatal, "offer was never answered");
    }
    auto offerer = it->second.offerer;
    slots_.erase(it);

    offerer->open_link();
    return Ok(std::move(offerer));
}

} // namespace lanbeam::transport
