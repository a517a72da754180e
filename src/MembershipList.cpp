/**
 * @file MembershipList.cpp
 *
 * This module contains the implementation of the Swim::MembershipList class.
 *
 * © 2018-2020 by Richard Walters
 */

#include <map>
#include <mutex>
#include <stdexcept>
#include <Swim/MembershipList.hpp>

namespace Swim {

    /**
     * This contains the private properties of a MembershipList instance.
     */
    struct MembershipList::Impl {
        /**
         * This is used to synchronize access to the entries.
         */
        mutable std::mutex mutex;

        /**
         * These are the members in the list, keyed by member identifier.
         */
        std::map< std::string, Entry > entries;
    };

    MembershipList::~MembershipList() noexcept = default;
    MembershipList::MembershipList(MembershipList&&) noexcept = default;
    MembershipList& MembershipList::operator=(MembershipList&&) noexcept = default;

    MembershipList::MembershipList()
        : impl_(new Impl())
    {
    }

    bool MembershipList::Upsert(
        const Member& member,
        Health health
    ) {
        std::lock_guard< decltype(impl_->mutex) > lock(impl_->mutex);
        auto entriesEntry = impl_->entries.find(member.id);
        if (entriesEntry == impl_->entries.end()) {
            Entry entry;
            entry.member = member;
            entry.health = health;
            (void)impl_->entries.insert({member.id, std::move(entry)});
            return true;
        }
        auto& entry = entriesEntry->second;
        if (
            !Supersedes(
                member.incarnation,
                health,
                entry.member.incarnation,
                entry.health
            )
        ) {
            return false;
        }
        Entry updated;
        updated.member = member;
        updated.health = health;
        entry = std::move(updated);
        return true;
    }

    bool MembershipList::HealthOf(
        const std::string& memberId,
        Health& health
    ) const {
        std::lock_guard< decltype(impl_->mutex) > lock(impl_->mutex);
        const auto entriesEntry = impl_->entries.find(memberId);
        if (entriesEntry == impl_->entries.end()) {
            return false;
        }
        health = entriesEntry->second.health;
        return true;
    }

    bool MembershipList::Find(
        const std::string& memberId,
        Entry& entry
    ) const {
        std::lock_guard< decltype(impl_->mutex) > lock(impl_->mutex);
        const auto entriesEntry = impl_->entries.find(memberId);
        if (entriesEntry == impl_->entries.end()) {
            return false;
        }
        entry = entriesEntry->second;
        return true;
    }

    auto MembershipList::GetEntry(const std::string& memberId) const -> Entry {
        std::lock_guard< decltype(impl_->mutex) > lock(impl_->mutex);
        const auto entriesEntry = impl_->entries.find(memberId);
        if (entriesEntry == impl_->entries.end()) {
            throw std::out_of_range("unknown member: " + memberId);
        }
        return entriesEntry->second;
    }

    Member MembershipList::GetMember(const std::string& memberId) const {
        return GetEntry(memberId).member;
    }

    bool MembershipList::Contains(const std::string& memberId) const {
        std::lock_guard< decltype(impl_->mutex) > lock(impl_->mutex);
        return (impl_->entries.find(memberId) != impl_->entries.end());
    }

    auto MembershipList::Each(
        std::function< bool(const Entry& entry) > predicate
    ) const -> std::vector< Entry > {
        std::vector< Entry > matches;
        std::lock_guard< decltype(impl_->mutex) > lock(impl_->mutex);
        for (const auto& entriesEntry: impl_->entries) {
            if (
                (predicate == nullptr)
                || predicate(entriesEntry.second)
            ) {
                matches.push_back(entriesEntry.second);
            }
        }
        return matches;
    }

    size_t MembershipList::GetSize() const {
        std::lock_guard< decltype(impl_->mutex) > lock(impl_->mutex);
        return impl_->entries.size();
    }

    Json::Value MembershipList::Encode() const {
        auto json = Json::Object({});
        std::lock_guard< decltype(impl_->mutex) > lock(impl_->mutex);
        for (const auto& entriesEntry: impl_->entries) {
            json[entriesEntry.first] = Json::Object({
                {"member", (Json::Value)entriesEntry.second.member},
                {"health", HealthToString(entriesEntry.second.health)},
            });
        }
        return json;
    }

}
