// /////////////////////////////////////////////////////////////////////////////
/// @file ConnectionRegistry.cpp
/// @brief ConnectionRegistry implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <rdv/net/session/ConnectionRegistry.hpp>

#include <utility>

namespace rdv::net::session {

ConnectionRegistry::ConnectionPtr ConnectionRegistry::insert(const PeerId& id, ConnectionPtr connection)
{
    auto& slot = connections_[id];
    auto displaced = std::exchange(slot, std::move(connection));
    if (displaced == slot)
    {
        return nullptr;
    }
    return displaced;
}

bool ConnectionRegistry::erase(const PeerId& id, const transport::IConnection* connection)
{
    auto it = connections_.find(id);
    if (it == connections_.end() || it->second.get() != connection)
    {
        return false;
    }
    connections_.erase(it);
    return true;
}

ConnectionRegistry::ConnectionPtr ConnectionRegistry::find(const PeerId& id) const
{
    auto it = connections_.find(id);
    return (it != connections_.end()) ? it->second : nullptr;
}

bool ConnectionRegistry::contains(const PeerId& id) const
{
    return connections_.contains(id);
}

std::vector<PeerId> ConnectionRegistry::ids() const
{
    std::vector<PeerId> out;
    out.reserve(connections_.size());
    for (const auto& [id, connection] : connections_)
    {
        out.push_back(id);
    }
    return out;
}

void ConnectionRegistry::forEach(const std::function<void(const PeerId&, const ConnectionPtr&)>& callback) const
{
    for (const auto& [id, connection] : connections_)
    {
        callback(id, connection);
    }
}

std::vector<ConnectionRegistry::ConnectionPtr> ConnectionRegistry::takeAll()
{
    std::vector<ConnectionPtr> out;
    out.reserve(connections_.size());
    for (auto& [id, connection] : connections_)
    {
        out.push_back(std::move(connection));
    }
    connections_.clear();
    return out;
}

} // namespace rdv::net::session
