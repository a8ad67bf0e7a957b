/**
 * @file TestConnectionRegistry.cpp
 * @brief Unit tests for ConnectionRegistry.
 */

#include <catch2/catch_test_macros.hpp>

#include <rdv/net/session/ConnectionRegistry.hpp>

#include <algorithm>
#include <memory>

using namespace rdv;
using namespace rdv::net;
using namespace rdv::net::session;

namespace {

class StubConnection final : public transport::IConnection
{
public:
    explicit StubConnection(PeerId id) : id_{std::move(id)} {}

    const PeerId& remoteId() const noexcept override { return id_; }
    bool isOpen() const noexcept override { return !closed; }
    core::Expected<void> send(const protocol::Envelope&) override { return {}; }
    void close() override { closed = true; }
    void setHandlers(transport::ConnectionHandlers) override {}
    void clearHandlers() override {}

    bool closed{false};

private:
    PeerId id_;
};

std::shared_ptr<StubConnection> stub(const PeerId& id)
{
    return std::make_shared<StubConnection>(id);
}

} // namespace

TEST_CASE("Registry holds one entry per remote", "[session][registry]")
{
    ConnectionRegistry registry;
    auto first = stub("anon-1");
    auto second = stub("anon-1");

    REQUIRE(registry.insert("anon-1", first) == nullptr);
    auto displaced = registry.insert("anon-1", second);

    REQUIRE(displaced == first);
    REQUIRE(registry.size() == 1);
    REQUIRE(registry.find("anon-1") == second);
}

TEST_CASE("Re-inserting the same connection displaces nothing", "[session][registry]")
{
    ConnectionRegistry registry;
    auto conn = stub("anon-1");

    registry.insert("anon-1", conn);
    REQUIRE(registry.insert("anon-1", conn) == nullptr);
}

TEST_CASE("A stale close cannot evict the newer connection", "[session][registry]")
{
    ConnectionRegistry registry;
    auto old = stub("anon-1");
    auto current = stub("anon-1");

    registry.insert("anon-1", old);
    registry.insert("anon-1", current);

    REQUIRE_FALSE(registry.erase("anon-1", old.get()));
    REQUIRE(registry.contains("anon-1"));
    REQUIRE(registry.erase("anon-1", current.get()));
    REQUIRE(registry.empty());
}

TEST_CASE("Registry ids, forEach and takeAll", "[session][registry]")
{
    ConnectionRegistry registry;
    registry.insert("anon-1", stub("anon-1"));
    registry.insert("anon-2", stub("anon-2"));
    registry.insert("anon-3", stub("anon-3"));

    auto ids = registry.ids();
    std::ranges::sort(ids);
    REQUIRE(ids == std::vector<PeerId>{"anon-1", "anon-2", "anon-3"});

    int visited = 0;
    registry.forEach([&](const PeerId& id, const auto& conn)
    {
        REQUIRE(conn->remoteId() == id);
        ++visited;
    });
    REQUIRE(visited == 3);

    auto all = registry.takeAll();
    REQUIRE(all.size() == 3);
    REQUIRE(registry.empty());
    REQUIRE(registry.find("anon-2") == nullptr);
}
