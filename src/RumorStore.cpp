/**
 * @file RumorStore.cpp
 *
 * This module contains the implementation of the Swim::RumorStore class.
 *
 * © 2018-2020 by Richard Walters
 */

#include <map>
#include <mutex>
#include <Swim/RumorStore.hpp>
#include <utility>

namespace {

    /**
     * This holds one rumor in the store, along with how many more gossip
     * rounds it will be pushed to other servers.
     */
    struct StoredRumor {
        Swim::Rumor rumor;
        size_t heat = 0;
    };

    /**
     * Rumors are indexed first by kind, then by key.
     */
    using RumorIndex = std::pair< Swim::Rumor::Kind, std::string >;

}

namespace Swim {

    /**
     * This contains the private properties of a RumorStore instance.
     */
    struct RumorStore::Impl {
        /**
         * This is used to synchronize access to the rumors.  It is
         * recursive so that visitors given to With may query the store
         * again.
         */
        mutable std::recursive_mutex mutex;

        /**
         * This is the number of gossip rounds a changed rumor stays hot.
         */
        size_t heatRounds = 3;

        std::map< RumorIndex, StoredRumor > rumors;
    };

    RumorStore::~RumorStore() noexcept = default;
    RumorStore::RumorStore(RumorStore&&) noexcept = default;
    RumorStore& RumorStore::operator=(RumorStore&&) noexcept = default;

    RumorStore::RumorStore(size_t heatRounds)
        : impl_(new Impl())
    {
        impl_->heatRounds = heatRounds;
    }

    void RumorStore::SetHeatRounds(size_t heatRounds) {
        std::lock_guard< decltype(impl_->mutex) > lock(impl_->mutex);
        impl_->heatRounds = heatRounds;
    }

    bool RumorStore::Insert(const Rumor& rumor) {
        if (rumor.kind == Rumor::Kind::Unknown) {
            return false;
        }
        const RumorIndex index(rumor.kind, rumor.GetKey());
        std::lock_guard< decltype(impl_->mutex) > lock(impl_->mutex);
        auto rumorsEntry = impl_->rumors.find(index);
        if (rumorsEntry == impl_->rumors.end()) {
            StoredRumor storedRumor;
            storedRumor.rumor = rumor;
            storedRumor.heat = impl_->heatRounds;
            (void)impl_->rumors.insert({index, std::move(storedRumor)});
            return true;
        }
        auto& storedRumor = rumorsEntry->second;
        if (!MergeRumor(storedRumor.rumor, rumor)) {
            return false;
        }
        storedRumor.heat = impl_->heatRounds;
        return true;
    }

    bool RumorStore::Get(
        const std::string& key,
        Rumor::Kind kind,
        Rumor& rumor
    ) const {
        std::lock_guard< decltype(impl_->mutex) > lock(impl_->mutex);
        const auto rumorsEntry = impl_->rumors.find(RumorIndex(kind, key));
        if (rumorsEntry == impl_->rumors.end()) {
            return false;
        }
        rumor = rumorsEntry->second.rumor;
        return true;
    }

    void RumorStore::With(
        const std::string& key,
        Rumor::Kind kind,
        std::function< void(const Rumor* rumor) > visitor
    ) const {
        std::lock_guard< decltype(impl_->mutex) > lock(impl_->mutex);
        const auto rumorsEntry = impl_->rumors.find(RumorIndex(kind, key));
        if (rumorsEntry == impl_->rumors.end()) {
            visitor(nullptr);
        } else {
            visitor(&rumorsEntry->second.rumor);
        }
    }

    std::vector< Rumor > RumorStore::GetHotRumors() const {
        std::vector< Rumor > hotRumors;
        std::lock_guard< decltype(impl_->mutex) > lock(impl_->mutex);
        for (const auto& rumorsEntry: impl_->rumors) {
            if (rumorsEntry.second.heat > 0) {
                hotRumors.push_back(rumorsEntry.second.rumor);
            }
        }
        return hotRumors;
    }

    std::vector< Rumor > RumorStore::GetAllRumors() const {
        std::vector< Rumor > allRumors;
        std::lock_guard< decltype(impl_->mutex) > lock(impl_->mutex);
        allRumors.reserve(impl_->rumors.size());
        for (const auto& rumorsEntry: impl_->rumors) {
            allRumors.push_back(rumorsEntry.second.rumor);
        }
        return allRumors;
    }

    void RumorStore::CoolDown() {
        std::lock_guard< decltype(impl_->mutex) > lock(impl_->mutex);
        for (auto& rumorsEntry: impl_->rumors) {
            auto& heat = rumorsEntry.second.heat;
            if (heat > 0) {
                --heat;
            }
        }
    }

    size_t RumorStore::Heat(
        const std::string& key,
        Rumor::Kind kind
    ) const {
        std::lock_guard< decltype(impl_->mutex) > lock(impl_->mutex);
        const auto rumorsEntry = impl_->rumors.find(RumorIndex(kind, key));
        if (rumorsEntry == impl_->rumors.end()) {
            return 0;
        }
        return rumorsEntry->second.heat;
    }

    void RumorStore::Each(
        Rumor::Kind kind,
        std::function< void(const Rumor& rumor) > visitor
    ) const {
        std::lock_guard< decltype(impl_->mutex) > lock(impl_->mutex);
        auto rumorsEntry = impl_->rumors.lower_bound(RumorIndex(kind, ""));
        while (
            (rumorsEntry != impl_->rumors.end())
            && (rumorsEntry->first.first == kind)
        ) {
            visitor(rumorsEntry->second.rumor);
            ++rumorsEntry;
        }
    }

    size_t RumorStore::GetSize() const {
        std::lock_guard< decltype(impl_->mutex) > lock(impl_->mutex);
        return impl_->rumors.size();
    }

    Json::Value RumorStore::Encode() const {
        auto json = Json::Array({});
        std::lock_guard< decltype(impl_->mutex) > lock(impl_->mutex);
        for (const auto& rumorsEntry: impl_->rumors) {
            auto encodedRumor = rumorsEntry.second.rumor.Encode();
            encodedRumor["heat"] = rumorsEntry.second.heat;
            json.Add(std::move(encodedRumor));
        }
        return json;
    }

}
