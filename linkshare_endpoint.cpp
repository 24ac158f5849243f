#include "linkshare_endpoint.h"
#include "linkshare_log.h"

namespace linkshare {

namespace {

template<class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template<class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

} // namespace

Endpoint::Endpoint(Channel& channel, Scheduler& sched, const Config& cfg)
    : channel_(channel),
      sender_(channel, sched, cfg),
      receiver_(channel, sched, cfg),
      queue_(sender_, cfg) {
    channel_.on_message([this](InboundEvent&& ev) { handle(std::move(ev)); });
    channel_.on_close([this] { on_closed(); });
}

Endpoint::~Endpoint() {
    channel_.on_message(nullptr);
    channel_.on_close(nullptr);
}

void Endpoint::handle(InboundEvent&& ev) {
    if (auto* chunk = std::get_if<Bytes>(&ev)) {
        ++chunks_received_;
        receiver_.on_chunk(std::move(*chunk));
        return;
    }
    ++control_messages_;
    handle_control(std::get<ControlMessage>(ev));
}

void Endpoint::handle_control(const ControlMessage& m) {
    log_debug("CHANNEL") << "<- " << type_name(m) << std::endl;
    std::visit(overloaded{
        [this](const msg::Meta& meta) { receiver_.on_meta(meta.descriptor, meta.offer_id); },
        [this](const msg::ReadyToReceive& r) { sender_.on_ready_to_receive(r.offer_id); },
        [this](const msg::End& end) { receiver_.on_end(end.sha256); },
        [this](const msg::TransferCompleteAck& a) { sender_.on_transfer_complete_ack(a.offer_id); },
        [this](const msg::Cancelled& c) {
            // origin names the peer's engine that gave up; without it both directions are dropped
            if (c.origin != msg::CancelOrigin::Receiver) receiver_.on_cancelled(c.reason);
            if (c.origin != msg::CancelOrigin::Sender) sender_.on_remote_cancelled(c.reason);
        },
    }, m);
}

void Endpoint::on_closed() {
    log_err("CHANNEL") << "peer connection closed" << std::endl;
    receiver_.on_channel_closed();
    sender_.on_channel_closed();
    if (disconnected_) disconnected_();
}

} // namespace linkshare
