#ifndef SWIM_MEMBERSHIP_LIST_HPP
#define SWIM_MEMBERSHIP_LIST_HPP

/**
 * @file MembershipList.hpp
 *
 * This module declares the Swim::MembershipList implementation.
 *
 * © 2018-2020 by Richard Walters
 */

#include "Member.hpp"

#include <functional>
#include <Json/Value.hpp>
#include <memory>
#include <stddef.h>
#include <string>
#include <vector>

namespace Swim {

    /**
     * This is one server's view of every member it knows about, along with
     * the health it currently attributes to each member.  It is safe to use
     * from multiple threads at once.
     */
    class MembershipList {
        // Types
    public:
        /**
         * This is what the list holds for each member.
         */
        struct Entry {
            /**
             * This is the last known identity of the member, including the
             * incarnation at which the health was last set.
             */
            Member member;

            /**
             * This is the health currently attributed to the member.
             */
            Health health = Health::Alive;
        };

        // Lifecycle Methods
    public:
        ~MembershipList() noexcept;
        MembershipList(const MembershipList&) = delete;
        MembershipList(MembershipList&&) noexcept;
        MembershipList& operator=(const MembershipList&) = delete;
        MembershipList& operator=(MembershipList&&) noexcept;

        // Public Methods
    public:
        /**
         * This is the constructor of the class.
         */
        MembershipList();

        /**
         * Merge the given information about a member into the list.  The
         * update is applied only if it supersedes what the list holds.
         * A departed member never changes again.
         *
         * @param[in] member
         *     This is the identity of the member, including the incarnation
         *     to which the given health applies.
         *
         * @param[in] health
         *     This is the health of the member.
         *
         * @return
         *     An indication of whether or not the entry for the member
         *     changed is returned.
         */
        bool Upsert(
            const Member& member,
            Health health
        );

        /**
         * Look up the health of the member with the given identifier.
         *
         * @param[in] memberId
         *     This is the unique identifier of the member to look up.
         *
         * @param[out] health
         *     This is where to store the health of the member, if known.
         *
         * @return
         *     An indication of whether or not the member is known
         *     is returned.
         */
        bool HealthOf(
            const std::string& memberId,
            Health& health
        ) const;

        /**
         * Look up the entry for the member with the given identifier.
         *
         * @param[in] memberId
         *     This is the unique identifier of the member to look up.
         *
         * @param[out] entry
         *     This is where to store a copy of the entry, if found.
         *
         * @return
         *     An indication of whether or not the member is known
         *     is returned.
         */
        bool Find(
            const std::string& memberId,
            Entry& entry
        ) const;

        /**
         * Return the entry for the member with the given identifier.
         *
         * @param[in] memberId
         *     This is the unique identifier of the member to look up.
         *
         * @return
         *     The entry for the member is returned.
         *
         * @throw std::out_of_range
         *     This is thrown if the member is not in the list.
         */
        Entry GetEntry(const std::string& memberId) const;

        /**
         * Return the identity of the member with the given identifier.
         *
         * @param[in] memberId
         *     This is the unique identifier of the member to look up.
         *
         * @return
         *     The identity of the member is returned.
         *
         * @throw std::out_of_range
         *     This is thrown if the member is not in the list.
         */
        Member GetMember(const std::string& memberId) const;

        /**
         * Determine whether or not the member with the given identifier is
         * in the list.
         *
         * @param[in] memberId
         *     This is the unique identifier of the member to look up.
         *
         * @return
         *     An indication of whether or not the member is in the list
         *     is returned.
         */
        bool Contains(const std::string& memberId) const;

        /**
         * Return a snapshot of all entries that satisfy the given predicate.
         *
         * @param[in] predicate
         *     This is called for each entry, and returns whether or not to
         *     include the entry in the result.  If empty, every entry is
         *     included.
         *
         * @return
         *     The matching entries are returned, ordered by member
         *     identifier.
         */
        std::vector< Entry > Each(
            std::function< bool(const Entry& entry) > predicate = nullptr
        ) const;

        /**
         * Return the number of members in the list.
         *
         * @return
         *     The number of members in the list is returned.
         */
        size_t GetSize() const;

        /**
         * Return a JSON rendering of the list, for diagnostics.
         *
         * @return
         *     A JSON object keyed by member identifier is returned.
         */
        Json::Value Encode() const;

        // Private properties
    private:
        /**
         * This is the type of structure that contains the private
         * properties of the instance.  It is defined in the implementation
         * and declared here to ensure that it is scoped inside the class.
         */
        struct Impl;

        /**
         * This contains the private properties of the instance.
         */
        std::unique_ptr< Impl > impl_;
    };

}

#endif /* SWIM_MEMBERSHIP_LIST_HPP */
