#include <catch2/catch_test_macros.hpp>
#include "infra/simulated_device.hpp"
#include "network/client.hpp"
#include "network/error.hpp"
#include "network/real_transport.hpp"
#include <array>
#include <chrono>
#include <thread>

using namespace bacnet;
using namespace bacnet::network;
using bacnet::test::SimulatedDevice;
using namespace std::chrono_literals;
using udp = boost::asio::ip::udp;

namespace {

// A SimulatedDevice answering on a loopback UDP socket, served by its own
// io_context thread
class LoopbackDevice {
public:
    explicit LoopbackDevice(uint32_t instance)
        : device_(instance),
          socket_(io_, udp::endpoint(boost::asio::ip::address_v4::loopback(), 0)) {
        receive();
        thread_ = std::thread([this] { io_.run(); });
    }

    ~LoopbackDevice() {
        io_.stop();
        thread_.join();
    }

    SimulatedDevice& device() { return device_; }
    Endpoint endpoint() const { return socket_.local_endpoint(); }

private:
    void receive() {
        socket_.async_receive_from(
            boost::asio::buffer(buffer_), sender_,
            [this](const boost::system::error_code& ec, size_t n) {
                if (ec) {
                    return;
                }
                if (auto reply = device_.handle(buffer_.data(), n)) {
                    boost::system::error_code send_ec;
                    socket_.send_to(boost::asio::buffer(*reply), sender_, 0, send_ec);
                }
                receive();
            });
    }

    SimulatedDevice device_;
    boost::asio::io_context io_;
    udp::socket socket_;
    std::array<uint8_t, protocol::BUFFER_SIZE> buffer_{};
    udp::endpoint sender_;
    std::thread thread_;
};

// A bound loopback socket that never answers
Endpoint SilentEndpoint(udp::socket& socket) {
    socket.open(udp::v4());
    socket.bind(udp::endpoint(boost::asio::ip::address_v4::loopback(), 0));
    return socket.local_endpoint();
}

// True once a plain socket can bind `port` on all interfaces
bool WaitPortFree(uint16_t port, std::chrono::milliseconds timeout) {
    boost::asio::io_context io;
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        udp::socket socket(io);
        boost::system::error_code ec;
        socket.open(udp::v4(), ec);
        if (!ec) {
            socket.bind(udp::endpoint(boost::asio::ip::address_v4::any(), port), ec);
        }
        if (!ec) {
            return true;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(10ms);
    }
}

} // namespace

TEST_CASE("UdpTransportFactory lifecycle is idempotent", "[network][transport][real]") {
    UdpTransportFactory factory(1);
    CHECK_FALSE(factory.is_running());

    // stop() without run() is safe
    factory.stop();

    factory.run();
    CHECK(factory.is_running());
    factory.run();
    CHECK(factory.is_running());

    factory.stop();
    CHECK_FALSE(factory.is_running());
    factory.stop();

    // Restart after stop
    factory.run();
    CHECK(factory.is_running());
}

TEST_CASE("UdpTransport refuses IO while the factory is stopped", "[network][transport][real]") {
    UdpTransportFactory factory(1);
    auto transport = factory.connect(Endpoint(boost::asio::ip::address_v4::loopback(), 47808));
    CHECK(transport->local_endpoint().port() != 0);

    std::array<uint8_t, 16> buf{};
    try {
        transport->read(buf.data(), buf.size());
        FAIL("read on a stopped factory succeeded");
    } catch (const Error& e) {
        CHECK(e.kind() == ErrorKind::Io);
    }
    try {
        transport->write(buf.data(), buf.size());
        FAIL("write on a stopped factory succeeded");
    } catch (const Error& e) {
        CHECK(e.kind() == ErrorKind::Io);
    }
}

TEST_CASE("Client talks to a device over loopback UDP", "[network][transport][real]") {
    LoopbackDevice loopback(77);
    const message::ObjectId temperature(protocol::ObjectType::AnalogInput, 1);
    loopback.device().set_property(temperature,
                                   static_cast<uint32_t>(protocol::PropertyId::PresentValue),
                                   {21.5f});

    UdpTransportFactory factory(1);
    factory.run();

    Client::Config config;
    config.timeout = 2s;
    Client client(factory, loopback.endpoint(), config);

    message::ReadProperty request;
    request.object_id = temperature;
    auto ack = client.read_property(request);
    REQUIRE(ack.values.size() == 1);
    CHECK(std::get<float>(ack.values[0]) == 21.5f);

    auto i_am = client.who_is();
    REQUIRE(i_am.has_value());
    CHECK(i_am->device_id.instance == 77);

    CHECK(loopback.device().requests() == 2);
}

TEST_CASE("UdpTransport receive timeout", "[network][transport][real][timeout]") {
    boost::asio::io_context peer_io;
    udp::socket silent(peer_io);
    Endpoint peer = SilentEndpoint(silent);

    UdpTransportFactory factory(1);
    factory.run();
    auto transport = factory.connect(peer);
    transport->set_timeout(100ms);
    CHECK(transport->timeout() == 100ms);

    const uint8_t probe[] = {0x01, 0x02, 0x03};
    CHECK(transport->write(probe, sizeof(probe)) == sizeof(probe));

    std::array<uint8_t, 64> buf{};
    auto start = std::chrono::steady_clock::now();
    try {
        transport->read(buf.data(), buf.size());
        FAIL("read without a reply succeeded");
    } catch (const Error& e) {
        CHECK(e.kind() == ErrorKind::Timeout);
    }
    auto elapsed = std::chrono::steady_clock::now() - start;
    CHECK(elapsed >= 90ms);
    CHECK(elapsed < 2s);

    SECTION("The transport still works after a timeout") {
        // The probe reached the silent socket; answer it now
        std::array<uint8_t, 64> received{};
        udp::endpoint client_endpoint;
        size_t n = silent.receive_from(boost::asio::buffer(received), client_endpoint);
        CHECK(n == sizeof(probe));
        silent.send_to(boost::asio::buffer(received.data(), n), client_endpoint);

        transport->set_timeout(2s);
        auto datagram = transport->read(buf.data(), buf.size());
        CHECK(datagram.size == sizeof(probe));
        CHECK(datagram.sender == peer);
        CHECK(buf[2] == 0x03);
    }
}

TEST_CASE("Stopping the factory interrupts a blocked read", "[network][transport][real]") {
    boost::asio::io_context peer_io;
    udp::socket silent(peer_io);
    Endpoint peer = SilentEndpoint(silent);

    UdpTransportFactory factory(1);
    factory.run();
    auto transport = factory.connect(peer);
    transport->set_timeout(300ms);

    std::thread stopper([&factory] {
        std::this_thread::sleep_for(50ms);
        factory.stop();
    });

    std::array<uint8_t, 64> buf{};
    try {
        transport->read(buf.data(), buf.size());
        FAIL("read on a stopped factory succeeded");
    } catch (const Error& e) {
        CHECK(e.kind() == ErrorKind::Io);
    }
    stopper.join();
}

TEST_CASE("Broadcast sockets", "[network][transport][real][broadcast]") {
    UdpTransportFactory factory(1);
    factory.run();

    SECTION("IPv6 has no broadcast") {
        Endpoint v6(boost::asio::ip::address_v6::loopback(), 47808);
        try {
            factory.connect_broadcast(v6);
            FAIL("IPv6 broadcast socket was created");
        } catch (const Error& e) {
            CHECK(e.kind() == ErrorKind::Io);
        }
    }

    SECTION("Bound to the broadcast port on all interfaces") {
        const uint16_t port = 47999;
        std::unique_ptr<Transport> transport;
        try {
            transport = factory.connect_broadcast(
                Endpoint(boost::asio::ip::address_v4::broadcast(), port));
        } catch (const Error& e) {
            WARN("Skipping: unable to bind broadcast port: " << e.what());
            return;
        }
        CHECK(transport->local_endpoint().port() == port);
        CHECK(transport->local_endpoint().address() == boost::asio::ip::address_v4::any());

        // Port sharing lets a second discovery bind the same port
        std::unique_ptr<Transport> second;
        CHECK_NOTHROW(second = factory.connect_broadcast(
                          Endpoint(boost::asio::ip::address_v4::broadcast(), port)));
    }
}

TEST_CASE("Destroying a transport releases its socket", "[network][transport][real]") {
    boost::asio::io_context peer_io;
    udp::socket silent(peer_io);
    Endpoint peer = SilentEndpoint(silent);

    UdpTransportFactory factory(1);

    SECTION("After a timed-out read on a running factory") {
        factory.run();
        auto transport = factory.connect(peer);
        const uint16_t port = transport->local_endpoint().port();
        transport->set_timeout(20ms);

        std::array<uint8_t, 64> buf{};
        CHECK_THROWS_AS(transport->read(buf.data(), buf.size()), Error);
        transport.reset();

        CHECK(WaitPortFree(port, 1s));
        CHECK(factory.is_running());
    }

    SECTION("While the factory is stopped") {
        auto transport = factory.connect(peer);
        const uint16_t port = transport->local_endpoint().port();
        transport.reset();

        CHECK(WaitPortFree(port, 0ms));
    }
}
