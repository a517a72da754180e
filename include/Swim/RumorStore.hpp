#ifndef SWIM_RUMOR_STORE_HPP
#define SWIM_RUMOR_STORE_HPP

/**
 * @file RumorStore.hpp
 *
 * This module declares the Swim::RumorStore class.
 *
 * © 2018-2020 by Richard Walters
 */

#include "Rumor.hpp"

#include <functional>
#include <Json/Value.hpp>
#include <memory>
#include <stddef.h>
#include <string>
#include <vector>

namespace Swim {

    /**
     * This holds the newest version of every rumor heard by one server,
     * keyed by rumor key and kind.  Rumors whose value changed recently are
     * "hot" and are pushed to other servers until they cool down.
     *
     * All methods may be called concurrently from any thread.
     */
    class RumorStore {
        // Lifecycle Methods
    public:
        ~RumorStore() noexcept;
        RumorStore(const RumorStore&) = delete;
        RumorStore(RumorStore&&) noexcept;
        RumorStore& operator=(const RumorStore&) = delete;
        RumorStore& operator=(RumorStore&&) noexcept;

        // Public Methods
    public:
        /**
         * This is the constructor of the class.
         *
         * @param[in] heatRounds
         *     This is the number of gossip rounds for which a rumor stays
         *     hot after its stored value changes.
         */
        explicit RumorStore(size_t heatRounds = 3);

        /**
         * Change the number of gossip rounds for which a rumor stays hot
         * after its stored value changes.  Rumors which are already hot
         * keep their current heat.
         *
         * @param[in] heatRounds
         *     This is the new number of rounds.
         */
        void SetHeatRounds(size_t heatRounds);

        /**
         * Merge the given rumor into the store.  If no rumor with the same
         * key and kind is stored yet, the rumor is simply added.  A rumor
         * whose stored value changes becomes hot.
         *
         * @param[in] rumor
         *     This is the rumor to merge.
         *
         * @return
         *     An indication of whether or not the stored value changed
         *     is returned.
         */
        bool Insert(const Rumor& rumor);

        /**
         * Look up the rumor with the given key and kind.
         *
         * @param[in] key
         *     This is the key of the rumor to find.
         *
         * @param[in] kind
         *     This is the kind of the rumor to find.
         *
         * @param[out] rumor
         *     This is where to store a copy of the rumor, if found.
         *
         * @return
         *     An indication of whether or not the rumor was found
         *     is returned.
         */
        bool Get(
            const std::string& key,
            Rumor::Kind kind,
            Rumor& rumor
        ) const;

        /**
         * Call the given function with the rumor having the given key and
         * kind, while holding the store lock.  The function receives a null
         * pointer if no such rumor is stored.  The function may call into
         * other stores, and into this store.
         *
         * @param[in] key
         *     This is the key of the rumor to visit.
         *
         * @param[in] kind
         *     This is the kind of the rumor to visit.
         *
         * @param[in] visitor
         *     This is the function to call with the rumor.
         */
        void With(
            const std::string& key,
            Rumor::Kind kind,
            std::function< void(const Rumor* rumor) > visitor
        ) const;

        /**
         * Return copies of all rumors which are currently hot.
         *
         * @return
         *     Copies of all hot rumors are returned.
         */
        std::vector< Rumor > GetHotRumors() const;

        /**
         * Return copies of all rumors in the store, hot or not.
         *
         * @return
         *     Copies of all stored rumors are returned.
         */
        std::vector< Rumor > GetAllRumors() const;

        /**
         * Take one gossip round of heat away from every hot rumor.
         */
        void CoolDown();

        /**
         * Return the number of gossip rounds for which the rumor with the
         * given key and kind will stay hot.
         *
         * @param[in] key
         *     This is the key of the rumor.
         *
         * @param[in] kind
         *     This is the kind of the rumor.
         *
         * @return
         *     The remaining heat of the rumor is returned.  Zero is returned
         *     if the rumor is cold or not stored at all.
         */
        size_t Heat(
            const std::string& key,
            Rumor::Kind kind
        ) const;

        /**
         * Call the given function with every stored rumor of the given kind,
         * in key order, while holding the store lock.
         *
         * @param[in] kind
         *     This is the kind of rumors to visit.
         *
         * @param[in] visitor
         *     This is the function to call with each rumor.
         */
        void Each(
            Rumor::Kind kind,
            std::function< void(const Rumor& rumor) > visitor
        ) const;

        /**
         * Return the number of rumors in the store.
         *
         * @return
         *     The number of rumors in the store is returned.
         */
        size_t GetSize() const;

        /**
         * Return a JSON rendering of the store contents, for diagnostics.
         *
         * @return
         *     A JSON array holding every stored rumor along with its heat
         *     is returned.
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

#endif /* SWIM_RUMOR_STORE_HPP */
