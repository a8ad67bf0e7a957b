/**
 * @file NonCopyable.hpp
 * @brief CRTP base class that deletes copy operations.
 *
 * Session objects, transports and registries own live connection handles
 * and timer ids; copying one would duplicate ownership of those handles.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef RDV_CORE_NON_COPYABLE_HPP
    #define RDV_CORE_NON_COPYABLE_HPP

namespace rdv::core {

/**
 * @brief Inherit (privately or publicly) to disable copy construction and
 *        assignment while keeping the type movable.
 * @tparam Derived The CRTP derived class.
 */
template <typename Derived>
class NonCopyable {
protected:
    NonCopyable()  = default;
    ~NonCopyable() = default;

    NonCopyable(const NonCopyable &)            = delete;
    NonCopyable &operator=(const NonCopyable &) = delete;

    NonCopyable(NonCopyable &&)            = default;
    NonCopyable &operator=(NonCopyable &&) = default;
};

} // namespace rdv::core

#endif // RDV_CORE_NON_COPYABLE_HPP
