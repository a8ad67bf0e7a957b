// /////////////////////////////////////////////////////////////////////////////
/// @file InviteCode.cpp
/// @brief Invite code generation and identity mapping.
// /////////////////////////////////////////////////////////////////////////////

#include <rdv/net/session/InviteCode.hpp>
#include <rdv/core/Assert.hpp>

#include <algorithm>

namespace rdv::net::session {

RandomInviteCodeSource::RandomInviteCodeSource()
    : engine_{std::random_device{}()}
{}

RandomInviteCodeSource::RandomInviteCodeSource(core::u64 seed)
    : engine_{seed}
{}

std::string RandomInviteCodeSource::next(core::u32 length)
{
    RDV_ASSERT(length > 0);

    std::uniform_int_distribution<int> first{1, 9};
    std::uniform_int_distribution<int> rest{0, 9};

    std::string code;
    code.reserve(length);
    code.push_back(static_cast<char>('0' + first(engine_)));
    for (core::u32 i = 1; i < length; ++i)
    {
        code.push_back(static_cast<char>('0' + rest(engine_)));
    }
    return code;
}

namespace InviteCode {

bool isValid(std::string_view code, core::u32 length) noexcept
{
    return code.size() == length
        && std::all_of(code.begin(), code.end(), [](char c) { return c >= '0' && c <= '9'; });
}

PeerId toIdentity(std::string_view prefix, std::string_view code)
{
    PeerId id;
    id.reserve(prefix.size() + code.size());
    id.append(prefix);
    id.append(code);
    return id;
}

std::string fromIdentity(std::string_view prefix, std::string_view id)
{
    if (!prefix.empty() && id.starts_with(prefix))
    {
        return std::string{id.substr(prefix.size())};
    }
    return std::string{id};
}

} // namespace InviteCode

} // namespace rdv::net::session
