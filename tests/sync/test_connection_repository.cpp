#include <catch2/catch_test_macros.hpp>

#include <chrono>

#include "sync/connection_repository.hpp"
#include "sync/record_codec.hpp"
#include "sync_harness.hpp"

using namespace ladle;
using namespace ladle::sync;

namespace {

const std::string kConnectionType = "Connection";

Connection makeRequest(const Uuid& from, const Uuid& to) {
    auto connection = create_connection_request(Uuid::generate(), from, to);
    connection.from_username = "alice";
    connection.to_username = "bob";
    return connection;
}

} // namespace

TEST_CASE("ConnectionRepository: requests", "[sync][connections]") {
    InMemoryRemoteStore remote;
    test::Device device(remote);
    ConnectionRepository connections(device.context());
    const auto alice = Uuid::generate();
    const auto bob = Uuid::generate();

    auto request = makeRequest(alice, bob);
    REQUIRE(connections.create(request).is_ok());
    REQUIRE(*connections.fetch(request.id).unwrap() == request);
    connections.wait_for_background();

    SECTION("requests are copied to both partitions") {
        REQUIRE(remote.record(Partition::Private, kConnectionType, request.id.to_string()).has_value());
        auto shared = remote.record(Partition::Public, kConnectionType, request.id.to_string());
        REQUIRE(shared.has_value());
        REQUIRE(connection_from_record(*shared).unwrap() == request);
    }

    SECTION("invalid requests are rejected") {
        REQUIRE(connections.create(makeRequest(alice, alice)).unwrap_err().kind == ErrorKind::InvalidData);
        REQUIRE(connections.create(request).unwrap_err().kind == ErrorKind::InvalidData);
        REQUIRE(connections.create(makeRequest(bob, alice)).unwrap_err().kind == ErrorKind::InvalidData);
        REQUIRE(connections.fetch_all().unwrap().size() == 1);
    }

    SECTION("pending requests are listed by direction") {
        REQUIRE(connections.fetch_sent_requests(alice).unwrap().size() == 1);
        REQUIRE(connections.fetch_sent_requests(bob).unwrap().empty());
        REQUIRE(connections.fetch_received_requests(bob).unwrap().size() == 1);
        REQUIRE(connections.fetch_received_requests(alice).unwrap().empty());
        REQUIRE(connections.fetch_for_user(alice).unwrap().size() == 1);
        REQUIRE(connections.fetch_for_user(bob).unwrap().size() == 1);
        REQUIRE(connections.fetch_accepted(alice).unwrap().empty());
        REQUIRE_FALSE(connections.are_connected(alice, bob).unwrap());
        REQUIRE(connections.fetch_between(bob, alice).unwrap()->id == request.id);
    }

    SECTION("accepting makes the users connected") {
        auto accepted = connections.accept(request.id).unwrap();
        REQUIRE(accepted.status == ConnectionStatus::Accepted);
        REQUIRE(accepted.updated_at >= request.updated_at);
        REQUIRE(connections.are_connected(alice, bob).unwrap());
        REQUIRE(connections.are_connected(bob, alice).unwrap());
        REQUIRE(connections.fetch_accepted(bob).unwrap().size() == 1);
        REQUIRE(connections.fetch_received_requests(bob).unwrap().empty());
        connections.wait_for_background();

        auto shared = remote.record(Partition::Public, kConnectionType, request.id.to_string());
        REQUIRE(connection_from_record(*shared).unwrap().status == ConnectionStatus::Accepted);

        const auto opsBefore = device.operations();
        REQUIRE(connections.accept(request.id).unwrap() == accepted);
        REQUIRE(device.operations() == opsBefore);
    }

    SECTION("removing deletes both copies") {
        REQUIRE(connections.remove(request.id).is_ok());
        REQUIRE(device.isTombstoned(request.id));
        connections.wait_for_background();
        REQUIRE(remote.record_count(Partition::Private) == 0);
        REQUIRE(remote.record_count(Partition::Public) == 0);
        REQUIRE(connections.remove(request.id).unwrap_err().kind == ErrorKind::NotFound);
    }

    SECTION("unknown connections are not found") {
        REQUIRE(connections.accept(Uuid::generate()).unwrap_err().kind == ErrorKind::NotFound);
        REQUIRE(connections.update(makeRequest(alice, Uuid::generate())).unwrap_err().kind ==
                ErrorKind::NotFound);
    }
}

TEST_CASE("ConnectionRepository: the recipient pulls requests from the public partition", "[sync][connections]") {
    InMemoryRemoteStore remote;
    test::Device sender(remote);
    test::Device recipient(remote);
    ConnectionRepository sent(sender.context());
    ConnectionRepository received(recipient.context());
    const auto alice = Uuid::generate();
    const auto bob = Uuid::generate();

    auto request = makeRequest(alice, bob);
    request.created_at = request.created_at - std::chrono::minutes(1);
    request.updated_at = request.created_at;
    REQUIRE(sent.create(request).is_ok());
    sent.wait_for_background();

    auto summary = received.sync_from_remote(bob).unwrap();
    REQUIRE(summary.inserted == 1);
    REQUIRE(received.fetch_received_requests(bob).unwrap().size() == 1);

    REQUIRE(received.accept(request.id).is_ok());
    received.wait_for_background();

    auto back = sent.sync_from_remote(alice).unwrap();
    REQUIRE(back.updated == 1);
    REQUIRE(sent.are_connected(alice, bob).unwrap());
}
