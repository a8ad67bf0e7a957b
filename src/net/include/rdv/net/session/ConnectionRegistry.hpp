// /////////////////////////////////////////////////////////////////////////////
/// @file ConnectionRegistry.hpp
/// @brief Host-side map of open connections keyed by remote identity.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <rdv/net/transport/ITransport.hpp>
#include <rdv/core/NonCopyable.hpp>
#include <rdv/core/Types.hpp>

#include <functional>
#include <memory>
#include <unordered_map>
#include <vector>

namespace rdv::net::session {

// /////////////////////////////////////////////////////////////////////////////
/// @class ConnectionRegistry
/// @brief At most one connection per remote identity.
///
/// An entry exists from the moment the connection's open handshake
/// completes until it closes. Only the session's lifecycle handlers
/// mutate it.
// /////////////////////////////////////////////////////////////////////////////
class ConnectionRegistry final : public core::NonCopyable<ConnectionRegistry>
{
public:
    using ConnectionPtr = std::shared_ptr<transport::IConnection>;

    ConnectionRegistry() = default;

    /// @brief Registers @p connection under @p id.
    /// @return The connection it displaced, or nullptr.
    ConnectionPtr insert(const PeerId& id, ConnectionPtr connection);

    /// @brief Removes @p id only while it still maps to @p connection.
    /// @return @c true if an entry was removed.
    bool erase(const PeerId& id, const transport::IConnection* connection);

    [[nodiscard]] ConnectionPtr find(const PeerId& id) const;
    [[nodiscard]] bool contains(const PeerId& id) const;
    [[nodiscard]] std::vector<PeerId> ids() const;
    [[nodiscard]] core::usize size() const noexcept { return connections_.size(); }
    [[nodiscard]] bool empty() const noexcept { return connections_.empty(); }

    void forEach(const std::function<void(const PeerId&, const ConnectionPtr&)>& callback) const;

    /// @brief Empties the registry and hands every entry to the caller.
    [[nodiscard]] std::vector<ConnectionPtr> takeAll();

private:
    std::unordered_map<PeerId, ConnectionPtr> connections_;
};

} // namespace rdv::net::session
