/**
 * @file transport_test.cpp
 * @brief Tests for the verified listener/dialer pair and stream semantics
 *
 * (c) 2026 FastDrop Project
 * Licensed under MIT License
 */

#include "fastdrop/TransportDialer.h"
#include "fastdrop/TransportListener.h"
#include "test_support.h"

#include <gtest/gtest.h>

#include <netinet/in.h>
#include <sys/socket.h>

#include <cerrno>
#include <thread>

using namespace FastDrop;
using FastDropTest::ConnectedPair;
using FastDropTest::connectPair;
using FastDropTest::makeIdentity;
using FastDropTest::transportUnavailable;

namespace {

bool sendString(TransportStream& stream, const std::string& text) {
    std::string err;
    return stream.sendExact(reinterpret_cast<const uint8_t*>(text.data()), text.size(), err);
}

std::string recvString(TransportStream& stream, size_t size) {
    std::string out(size, '\0');
    std::string err;
    if (!stream.recvExact(reinterpret_cast<uint8_t*>(&out[0]), size, err)) {
        return "<" + err + ">";
    }
    return out;
}

/// errno from binding a fresh socket of the given type to the listener's port
int bindErrnoOnPort(const Endpoint& endpoint, int type) {
    sockaddr_storage addr{};
    socklen_t addrLen = 0;
    if (!endpointToSockaddr(endpoint, addr, addrLen)) {
        return EINVAL;
    }
    SocketHandle sock(::socket(addr.ss_family, type, 0));
    if (::bind(sock.get(), reinterpret_cast<const sockaddr*>(&addr), addrLen) != 0) {
        return errno;
    }
    return 0;
}

}  // namespace

class TransportProtocolTest : public ::testing::TestWithParam<TransportProtocol> {
protected:
    void SetUp() override {
        if (transportUnavailable(GetParam())) {
            GTEST_SKIP() << "Linked OpenSSL has no QUIC server support";
        }
    }
};

TEST_P(TransportProtocolTest, ConnectsAndVerifiesBothIdentities) {
    ConnectedPair pair;
    ASSERT_TRUE(connectPair(GetParam(), pair));

    EXPECT_EQ(pair.sender->protocol(), GetParam());
    EXPECT_EQ(pair.receiver->protocol(), GetParam());
    EXPECT_EQ(pair.receiver->peerIdentity(), pair.senderIdentity->peerIdentity());
    EXPECT_EQ(pair.sender->peerIdentity(), pair.receiverIdentity->peerIdentity());
}

TEST_P(TransportProtocolTest, StreamCarriesBytesBothWays) {
    ConnectedPair pair;
    ASSERT_TRUE(connectPair(GetParam(), pair));

    std::string err;
    auto outgoing = pair.receiver->openStream(err);
    ASSERT_TRUE(outgoing) << err;
    ASSERT_TRUE(sendString(*outgoing, "ping"));

    auto incoming = pair.sender->acceptStream(5000, err);
    ASSERT_TRUE(incoming) << err;
    EXPECT_EQ(recvString(*incoming, 4), "ping");

    ASSERT_TRUE(sendString(*incoming, "pong"));
    EXPECT_EQ(recvString(*outgoing, 4), "pong");
}

TEST_P(TransportProtocolTest, CloseUnblocksPeerRead) {
    ConnectedPair pair;
    ASSERT_TRUE(connectPair(GetParam(), pair));

    std::string err;
    auto outgoing = pair.receiver->openStream(err);
    ASSERT_TRUE(outgoing) << err;
    ASSERT_TRUE(sendString(*outgoing, "x"));
    auto incoming = pair.sender->acceptStream(5000, err);
    ASSERT_TRUE(incoming) << err;
    EXPECT_EQ(recvString(*incoming, 1), "x");

    std::thread closer([&pair]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        pair.receiver->close();
    });

    uint8_t byte = 0;
    EXPECT_FALSE(incoming->recvExact(&byte, 1, err));
    closer.join();
    EXPECT_TRUE(pair.receiver->isClosed());
}

/**
 * @test A wrong certificate behind the ticket endpoint is rejected on either transport
 */
TEST_P(TransportProtocolTest, WrongSenderIdentityIsRejected) {
    auto realSender = makeIdentity("sender");
    auto impostor = makeIdentity("impostor");
    auto receiver = makeIdentity("receiver");
    ASSERT_TRUE(realSender && impostor && receiver);

    TransportListener listener(impostor);
    SessionError bindError;
    ASSERT_TRUE(listener.bind(GetParam(), "127.0.0.1", bindError)) << bindError.toString();

    SessionTicket ticket;
    ticket.protocol = GetParam();
    ticket.senderIdentity = realSender->peerIdentity();
    ticket.endpoints = {listener.localEndpoint()};
    ticket.nonce = 1;

    SessionError acceptError;
    std::unique_ptr<Connection> accepted;
    std::thread acceptThread([&]() {
        accepted = listener.acceptOne(3000, acceptError);
    });

    TransportDialer dialer(receiver);
    SessionError error;
    auto connection = dialer.dial(ticket, 5000, error);
    EXPECT_FALSE(connection);
    EXPECT_EQ(error.kind, ErrorKind::IdentityMismatch);

    listener.cancel();
    acceptThread.join();
}

TEST_P(TransportProtocolTest, AcceptTimesOut) {
    TransportListener listener(makeIdentity("sender"));
    SessionError error;
    ASSERT_TRUE(listener.bind(GetParam(), "127.0.0.1", error)) << error.toString();

    EXPECT_FALSE(listener.acceptOne(200, error));
    EXPECT_EQ(error.kind, ErrorKind::Timeout);
}

TEST_P(TransportProtocolTest, CancelAbortsAccept) {
    TransportListener listener(makeIdentity("sender"));
    SessionError error;
    ASSERT_TRUE(listener.bind(GetParam(), "127.0.0.1", error)) << error.toString();

    std::thread canceller([&listener]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        listener.cancel();
    });
    EXPECT_FALSE(listener.acceptOne(0, error));
    canceller.join();
    EXPECT_EQ(error.kind, ErrorKind::Cancelled);
}

INSTANTIATE_TEST_SUITE_P(BothTransports, TransportProtocolTest,
                         ::testing::Values(TransportProtocol::Tcp, TransportProtocol::Quic),
                         [](const ::testing::TestParamInfo<TransportProtocol>& info) {
                             return std::string(transportProtocolName(info.param));
                         });

//=============================================================================
// Quic
//=============================================================================

/**
 * @test The port a Quic listener puts in the ticket is a UDP port, a Tcp listener's a TCP port
 */
TEST(TransportBindTest, ListenerSocketMatchesTransport) {
    TransportListener tcp(makeIdentity("sender"));
    SessionError error;
    ASSERT_TRUE(tcp.bind(TransportProtocol::Tcp, "127.0.0.1", error)) << error.toString();
    EXPECT_EQ(bindErrnoOnPort(tcp.localEndpoint(), SOCK_STREAM), EADDRINUSE);

    TransportListener quic(makeIdentity("sender"));
    if (!quicTransportAvailable()) {
        EXPECT_FALSE(quic.bind(TransportProtocol::Quic, "127.0.0.1", error));
        EXPECT_EQ(error.kind, ErrorKind::ConnectFailed);
        EXPECT_EQ(error.network, NetworkErrorKind::BindFailed);
        return;
    }
    ASSERT_TRUE(quic.bind(TransportProtocol::Quic, "127.0.0.1", error)) << error.toString();
    EXPECT_EQ(bindErrnoOnPort(quic.localEndpoint(), SOCK_DGRAM), EADDRINUSE);
}

class QuicTransportTest : public ::testing::Test {
protected:
    void SetUp() override {
        if (!quicTransportAvailable()) {
            GTEST_SKIP() << "Linked OpenSSL has no QUIC server support";
        }
    }
};

TEST_F(QuicTransportTest, IndependentStreamsInterleave) {
    ConnectedPair pair;
    ASSERT_TRUE(connectPair(TransportProtocol::Quic, pair));
    ASSERT_TRUE(pair.sender->supportsMultiplexing());

    std::string err;
    auto first = pair.sender->openStream(err);
    auto second = pair.sender->openStream(err);
    ASSERT_TRUE(first && second) << err;
    EXPECT_NE(first->streamId(), second->streamId());

    const std::string big = FastDropTest::patternContent(300000, 7);
    std::thread writer([&]() {
        sendString(*first, big);
    });
    ASSERT_TRUE(sendString(*second, "small"));

    auto a = pair.receiver->acceptStream(5000, err);
    ASSERT_TRUE(a) << err;
    auto b = pair.receiver->acceptStream(5000, err);
    ASSERT_TRUE(b) << err;

    auto& bigStream = (a->streamId() == first->streamId()) ? a : b;
    auto& smallStream = (a->streamId() == first->streamId()) ? b : a;
    EXPECT_EQ(recvString(*smallStream, 5), "small");
    EXPECT_EQ(recvString(*bigStream, big.size()), big);
    writer.join();
}

TEST_F(QuicTransportTest, FinishedStreamEndsPeerRead) {
    ConnectedPair pair;
    ASSERT_TRUE(connectPair(TransportProtocol::Quic, pair));

    std::string err;
    auto outgoing = pair.sender->openStream(err);
    ASSERT_TRUE(outgoing) << err;
    ASSERT_TRUE(sendString(*outgoing, "last"));
    ASSERT_TRUE(outgoing->finish(err)) << err;

    auto incoming = pair.receiver->acceptStream(5000, err);
    ASSERT_TRUE(incoming) << err;
    EXPECT_EQ(recvString(*incoming, 4), "last");

    uint8_t byte = 0;
    EXPECT_FALSE(incoming->recvExact(&byte, 1, err));
    EXPECT_FALSE(incoming->timedOut());
}

TEST_F(QuicTransportTest, SilentPeerTimesOutRead) {
    ConnectedPair pair;
    ASSERT_TRUE(connectPair(TransportProtocol::Quic, pair));
    pair.sender->setIdleTimeout(300);

    std::string err;
    auto outgoing = pair.receiver->openStream(err);
    ASSERT_TRUE(outgoing) << err;
    ASSERT_TRUE(sendString(*outgoing, "?"));
    auto incoming = pair.sender->acceptStream(5000, err);
    ASSERT_TRUE(incoming) << err;
    EXPECT_EQ(recvString(*incoming, 1), "?");

    uint8_t byte = 0;
    EXPECT_FALSE(incoming->recvExact(&byte, 1, err));
    EXPECT_TRUE(incoming->timedOut());
}

/**
 * @test Nobody answers on a UDP port, so the dial runs out its deadline
 */
TEST_F(QuicTransportTest, UnansweredDialTimesOut) {
    auto identity = makeIdentity("receiver");
    ASSERT_TRUE(identity);

    Endpoint silent;
    {
        TransportListener listener(makeIdentity("gone"));
        SessionError bindError;
        ASSERT_TRUE(listener.bind(TransportProtocol::Quic, "127.0.0.1", bindError));
        silent = listener.localEndpoint();
    }

    SessionTicket ticket;
    ticket.protocol = TransportProtocol::Quic;
    ticket.senderIdentity = identity->peerIdentity();
    ticket.endpoints = {silent};

    TransportDialer dialer(identity);
    SessionError error;
    EXPECT_FALSE(dialer.dial(ticket, 500, error));
    EXPECT_EQ(error.kind, ErrorKind::Timeout);
}

//=============================================================================
// Tcp
//=============================================================================

TEST(TcpTransportTest, SupportsSingleStreamOnly) {
    ConnectedPair pair;
    ASSERT_TRUE(connectPair(TransportProtocol::Tcp, pair));
    EXPECT_FALSE(pair.sender->supportsMultiplexing());

    std::string err;
    ASSERT_TRUE(pair.sender->openStream(err)) << err;
    EXPECT_FALSE(pair.sender->openStream(err));
}

//=============================================================================
// Failures
//=============================================================================

TEST(TransportFailureTest, ClosedPortIsRefused) {
    auto identity = makeIdentity("receiver");
    ASSERT_TRUE(identity);

    Endpoint closed;
    {
        TransportListener listener(makeIdentity("gone"));
        SessionError bindError;
        ASSERT_TRUE(listener.bind(TransportProtocol::Tcp, "127.0.0.1", bindError));
        closed = listener.localEndpoint();
    }

    SessionTicket ticket;
    ticket.protocol = TransportProtocol::Tcp;
    ticket.senderIdentity = identity->peerIdentity();
    ticket.endpoints = {closed};

    TransportDialer dialer(identity);
    SessionError error;
    EXPECT_FALSE(dialer.dial(ticket, 2000, error));
    EXPECT_EQ(error.kind, ErrorKind::ConnectFailed);
    EXPECT_EQ(error.network, NetworkErrorKind::Refused);
}

TEST(TransportFailureTest, TicketWithoutEndpointsIsMalformed) {
    TransportDialer dialer(makeIdentity("receiver"));
    SessionTicket ticket;
    SessionError error;
    EXPECT_FALSE(dialer.dial(ticket, 1000, error));
    EXPECT_EQ(error.kind, ErrorKind::TicketMalformed);
}
