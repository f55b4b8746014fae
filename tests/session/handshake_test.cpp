#include "lanbeam/crypto/identity.hpp"
#include "lanbeam/crypto/token.hpp"
#include "lanbeam/protocol/framing.hpp"
#include "lanbeam/protocol/messages.hpp"
#include "lanbeam/session/handshake.hpp"
#include "lanbeam/transport/memory_transport.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <optional>
#include <thread>

using namespace lanbeam;
using namespace lanbeam::session;
using lanbeam::transport::MemoryChannel;

namespace {

crypto::KeyPair make_key() {
    auto key = crypto::KeyPair::generate();
    EXPECT_TRUE(key.is_ok());
    return std::move(key.value());
}

struct HandshakeRun {
    std::optional<Result<HandshakeResult>> initiator;
    std::optional<Result<HandshakeResult>> responder;
    SessionState initiator_state = SessionState::Negotiating;
    SessionState responder_state = SessionState::Negotiating;
};

/**
 * Both roles on their own thread over one in-memory link. A failing side
 * closes its end, the way the orchestrator does.
 */
HandshakeRun run_both(const crypto::KeyPair& initiator_key,
                      const HandshakeOptions& initiator_options,
                      const crypto::KeyPair& responder_key,
                      const HandshakeOptions& responder_options) {
    auto [a, b] = MemoryChannel::make_pair();
    a->open_link();

    TransferSession initiator_session{"hs", SessionRole::Sender};
    TransferSession responder_session{"hs", SessionRole::Receiver};
    HandshakeRun run;

    std::thread responder([&, b = b]() {
        run.responder = run_responder(*b, responder_key, responder_options, responder_session);
        if (run.responder->is_error()) {
            b->close();
        }
    });

    run.initiator = run_initiator(*a, initiator_key, initiator_options, initiator_session);
    if (run.initiator->is_error()) {
        a->close();
    }
    responder.join();

    run.initiator_state = initiator_session.state();
    run.responder_state = responder_session.state();
    return run;
}

} // namespace

TEST(HandshakeTest, UngatedPeersAuthenticateEachOther) {
    auto initiator_key = make_key();
    auto responder_key = make_key();

    auto run = run_both(initiator_key, {}, responder_key, {});
    ASSERT_TRUE(run.initiator->is_ok()) << run.initiator->error().message;
    ASSERT_TRUE(run.responder->is_ok()) << run.responder->error().message;

    EXPECT_EQ(run.initiator->value().remote_key.der(), responder_key.public_key_der());
    EXPECT_EQ(run.responder->value().remote_key.der(), initiator_key.public_key_der());
    EXPECT_EQ(run.initiator->value().nonce_material, run.responder->value().nonce_material);
    EXPECT_EQ(run.initiator->value().nonce_material.size(), 2 * crypto::kNonceSize);
    EXPECT_EQ(run.initiator_state, SessionState::Authenticating);
    EXPECT_EQ(run.responder_state, SessionState::Authenticating);
}

TEST(HandshakeTest, PinAcceptedOnSecondAttempt) {
    auto initiator_key = make_key();
    auto responder_key = make_key();

    HandshakeOptions responder_options;
    responder_options.pin = "4711";

    std::vector<PinPrompt> prompts;
    HandshakeOptions initiator_options;
    initiator_options.pin_prompt = [&](const PinPrompt& prompt) -> std::optional<std::string> {
        prompts.push_back(prompt);
        return prompt.attempt == 1 ? "0000" : "4711";
    };

    auto run = run_both(initiator_key, initiator_options, responder_key, responder_options);
    ASSERT_TRUE(run.initiator->is_ok()) << run.initiator->error().message;
    ASSERT_TRUE(run.responder->is_ok()) << run.responder->error().message;

    ASSERT_EQ(prompts.size(), 2u);
    EXPECT_FALSE(prompts[0].previous_rejected);
    EXPECT_TRUE(prompts[1].previous_rejected);
    EXPECT_EQ(prompts[1].attempt, 2u);
    EXPECT_EQ(run.initiator_state, SessionState::Authenticating);
}

TEST(HandshakeTest, PinAttemptsExhausted) {
    auto initiator_key = make_key();
    auto responder_key = make_key();

    HandshakeOptions responder_options;
    responder_options.pin = "4711";
    responder_options.max_pin_attempts = 3;

    std::atomic<int> prompts{0};
    HandshakeOptions initiator_options;
    initiator_options.pin_prompt = [&](const PinPrompt&) -> std::optional<std::string> {
        prompts++;
        return std::string("1234");
    };

    auto run = run_both(initiator_key, initiator_options, responder_key, responder_options);
    ASSERT_TRUE(run.initiator->is_error());
    ASSERT_TRUE(run.responder->is_error());
    EXPECT_EQ(run.initiator->error().kind, ErrorKind::TransportFatal);
    EXPECT_EQ(run.responder->error().kind, ErrorKind::TransportFatal);
    EXPECT_EQ(prompts.load(), 3);
}

TEST(HandshakeTest, CancelledPinPromptIsUserDeclined) {
    auto initiator_key = make_key();
    auto responder_key = make_key();

    HandshakeOptions responder_options;
    responder_options.pin = "4711";

    HandshakeOptions initiator_options;
    initiator_options.pin_prompt = [](const PinPrompt&) -> std::optional<std::string> { return std::nullopt; };

    auto run = run_both(initiator_key, initiator_options, responder_key, responder_options);
    ASSERT_TRUE(run.initiator->is_error());
    EXPECT_EQ(run.initiator->error().kind, ErrorKind::UserDeclined);
    ASSERT_TRUE(run.responder->is_error());
    EXPECT_EQ(run.responder->error().kind, ErrorKind::TransportFatal);
}

TEST(HandshakeTest, InitiatorGateIsEnforcedToo) {
    auto initiator_key = make_key();
    auto responder_key = make_key();

    HandshakeOptions initiator_options;
    initiator_options.pin = "9999";

    HandshakeOptions responder_options;
    responder_options.pin_prompt = [](const PinPrompt&) -> std::optional<std::string> { return std::string("9999"); };

    auto run = run_both(initiator_key, initiator_options, responder_key, responder_options);
    ASSERT_TRUE(run.initiator->is_ok()) << run.initiator->error().message;
    ASSERT_TRUE(run.responder->is_ok()) << run.responder->error().message;
}

TEST(HandshakeTest, PairingIsRememberedForLaterSessions) {
    auto initiator_key = make_key();
    auto responder_key = make_key();

    HandshakeOptions responder_options;
    responder_options.require_pairing = true;
    responder_options.paired_keys = std::make_shared<PairedKeys>();

    std::atomic<int> decisions{0};
    HandshakeOptions initiator_options;
    initiator_options.pairing_decision = [&](const PairingRequest& request) {
        decisions++;
        EXPECT_EQ(request.fingerprint.size(), 64u);
        return true;
    };

    auto first = run_both(initiator_key, initiator_options, responder_key, responder_options);
    ASSERT_TRUE(first.initiator->is_ok()) << first.initiator->error().message;
    ASSERT_TRUE(first.responder->is_ok()) << first.responder->error().message;
    EXPECT_EQ(decisions.load(), 1);
    EXPECT_EQ(responder_options.paired_keys->size(), 1u);
    EXPECT_TRUE(responder_options.paired_keys->contains(initiator_key.public_key_der()));

    auto second = run_both(initiator_key, initiator_options, responder_key, responder_options);
    ASSERT_TRUE(second.initiator->is_ok());
    ASSERT_TRUE(second.responder->is_ok());
    EXPECT_EQ(decisions.load(), 1);
}

TEST(HandshakeTest, DeclinedPairingWithoutPinEndsSession) {
    auto initiator_key = make_key();
    auto responder_key = make_key();

    HandshakeOptions responder_options;
    responder_options.require_pairing = true;

    HandshakeOptions initiator_options;
    initiator_options.pairing_decision = [](const PairingRequest&) { return false; };

    auto run = run_both(initiator_key, initiator_options, responder_key, responder_options);
    ASSERT_TRUE(run.initiator->is_error());
    ASSERT_TRUE(run.responder->is_error());
    EXPECT_EQ(run.initiator->error().kind, ErrorKind::UserDeclined);
    EXPECT_EQ(run.responder->error().kind, ErrorKind::UserDeclined);
}

TEST(HandshakeTest, DeclinedPairingFallsBackToPin) {
    auto initiator_key = make_key();
    auto responder_key = make_key();

    HandshakeOptions responder_options;
    responder_options.require_pairing = true;
    responder_options.pin = "2468";

    HandshakeOptions initiator_options;
    initiator_options.pairing_decision = [](const PairingRequest&) { return false; };
    initiator_options.pin_prompt = [](const PinPrompt&) -> std::optional<std::string> { return std::string("2468"); };

    auto run = run_both(initiator_key, initiator_options, responder_key, responder_options);
    ASSERT_TRUE(run.initiator->is_ok()) << run.initiator->error().message;
    ASSERT_TRUE(run.responder->is_ok()) << run.responder->error().message;
}

TEST(HandshakeTest, ResponderRejectsTokenForWrongNonces) {
    auto forger_key = make_key();
    auto responder_key = make_key();

    auto [a, b] = MemoryChannel::make_pair();
    a->open_link();

    TransferSession responder_session{"hs", SessionRole::Receiver};
    std::optional<Result<HandshakeResult>> responder_result;
    std::thread responder([&, b = b]() {
        responder_result = run_responder(*b, responder_key, HandshakeOptions{}, responder_session);
        b->close();
    });

    auto nonce = crypto::generate_nonce();
    ASSERT_TRUE(nonce.is_ok());
    ASSERT_TRUE(protocol::send_message(*a, protocol::to_json(protocol::NonceMessage{nonce.value()})).is_ok());
    ASSERT_TRUE(protocol::read_message(a->inbound()).is_ok());

    // Signed over material from some other session
    auto token = crypto::create_token(forger_key, Bytes(64, 0x5a));
    ASSERT_TRUE(token.is_ok());
    protocol::TokenMessage forged{forger_key.public_key_der(), token.value()};
    ASSERT_TRUE(protocol::send_message(*a, protocol::to_json(forged)).is_ok());

    auto reply = protocol::read_message(a->inbound());
    responder.join();

    ASSERT_TRUE(reply.is_ok());
    auto gate = protocol::parse_gate(reply.value());
    ASSERT_TRUE(gate.is_ok());
    EXPECT_EQ(gate.value().status, protocol::GateStatus::InvalidSignature);
    EXPECT_FALSE(gate.value().identity.has_value());

    ASSERT_TRUE(responder_result->is_error());
    EXPECT_EQ(responder_result->error().kind, ErrorKind::TransportFatal);
}

TEST(HandshakeTest, InitialGateStatusPrefersPairing) {
    auto key = make_key();
    auto remote = key.public_key();
    ASSERT_TRUE(remote.is_ok());

    HandshakeOptions options;
    EXPECT_EQ(initial_gate_status(options, remote.value()), protocol::GateStatus::Ok);

    options.pin = "1";
    EXPECT_EQ(initial_gate_status(options, remote.value()), protocol::GateStatus::PinRequired);

    options.require_pairing = true;
    EXPECT_EQ(initial_gate_status(options, remote.value()), protocol::GateStatus::Pair);

    options.paired_keys = std::make_shared<PairedKeys>();
    options.paired_keys->remember(key.public_key_der());
    EXPECT_EQ(initial_gate_status(options, remote.value()), protocol::GateStatus::PinRequired);
}

TEST(HandshakeTest, AcceptsLongestAllowedInitiatorNonce) {
    auto initiator_key = make_key();
    auto responder_key = make_key();
    auto link = MemoryChannel::make_pair();
    auto a = link.first;
    auto b = link.second;
    a->open_link();

    TransferSession responder_session{"hs", SessionRole::Receiver};
    std::optional<Result<HandshakeResult>> responder_result;
    std::thread responder([&, b = b]() {
        responder_result = run_responder(*b, responder_key, {}, responder_session);
        if (responder_result->is_error()) {
            b->close();
        }
    });

    // Initiator driven by hand so it can send a nonce of the maximum length
    [&]() {
        const Bytes long_nonce(crypto::kMaxNonceSize, 0x5a);
        ASSERT_TRUE(protocol::send_message(*a, protocol::to_json(protocol::NonceMessage{long_nonce})).is_ok());
        auto reply = protocol::read_message(a->inbound());
        ASSERT_TRUE(reply.is_ok());
        auto responder_nonce = protocol::parse_nonce(reply.value());
        ASSERT_TRUE(responder_nonce.is_ok());

        const Bytes material = crypto::combine_nonces(long_nonce, responder_nonce.value().nonce);
        auto token = crypto::create_token(initiator_key, material);
        ASSERT_TRUE(token.is_ok());
        protocol::TokenMessage own{initiator_key.public_key_der(), token.value()};
        ASSERT_TRUE(protocol::send_message(*a, protocol::to_json(own)).is_ok());

        auto gate_message = protocol::read_message(a->inbound());
        ASSERT_TRUE(gate_message.is_ok());
        auto gate = protocol::parse_gate(gate_message.value());
        ASSERT_TRUE(gate.is_ok());
        EXPECT_EQ(gate.value().status, protocol::GateStatus::Ok);
        ASSERT_TRUE(gate.value().identity.has_value());

        auto responder_public = crypto::PublicKey::from_der(gate.value().identity->public_key_der);
        ASSERT_TRUE(responder_public.is_ok());
        EXPECT_TRUE(crypto::verify_nonce_token(gate.value().identity->token, responder_public.value(), material).is_ok());

        protocol::GateMessage open_gate;
        open_gate.status = protocol::GateStatus::Ok;
        ASSERT_TRUE(protocol::send_message(*a, protocol::to_json(open_gate)).is_ok());
    }();
    // Buffered messages stay readable; closing only unblocks a responder left waiting
    a->close();
    responder.join();

    ASSERT_TRUE(responder_result.has_value());
    ASSERT_TRUE(responder_result->is_ok()) << responder_result->error().message;
    EXPECT_EQ(responder_result->value().nonce_material.size(), crypto::kMaxNonceSize + crypto::kNonceSize);
    EXPECT_EQ(responder_result->value().remote_key.der(), initiator_key.public_key_der());
}
