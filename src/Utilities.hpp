#ifndef SWIM_UTILITIES_HPP
#define SWIM_UTILITIES_HPP

/**
 * @file Utilities.hpp
 *
 * This module contains the declaration of free functions used by other parts
 * of the library implementation.
 *
 * © 2019-2020 by Richard Walters
 */

#include <algorithm>
#include <random>
#include <set>
#include <sstream>
#include <stddef.h>
#include <string>
#include <Swim/IServer.hpp>
#include <vector>

namespace Swim {

    /**
     * Generate a new unique member identifier, formatted like a UUID.
     *
     * @return
     *     The new member identifier is returned.
     */
    std::string GenerateMemberId();

    /**
     * Return a human-readable string representation of the given quorum
     * rule.
     *
     * @param[in] quorumRule
     *     This is the quorum rule to turn into a string.
     *
     * @return
     *     A human-readable string representation of the given quorum rule
     *     is returned.
     */
    std::string QuorumRuleToString(IServer::QuorumRule quorumRule);

    /**
     * Parse the given string as a quorum rule.
     *
     * @param[in] quorumRuleAsString
     *     This is the string to parse.
     *
     * @param[out] quorumRule
     *     This is where to store the parsed quorum rule.
     *
     * @return
     *     An indication of whether or not the string named a quorum rule
     *     is returned.
     */
    bool QuorumRuleFromString(
        const std::string& quorumRuleAsString,
        IServer::QuorumRule& quorumRule
    );

    /**
     * This is the template for a function which builds and returns a
     * human-readable string representation of a set of elements.
     *
     * @param[in] s
     *     This is the set of elements to format as a string.
     *
     * @return
     *     A human-readable representation of the given set is returned.
     */
    template< typename T > std::string FormatSet(const std::set< T >& s) {
        std::ostringstream builder;
        builder << '{';
        bool first = true;
        for (const auto& element: s) {
            if (!first) {
                builder << ", ";
            }
            first = false;
            builder << element;
        }
        builder << '}';
        return builder.str();
    }

    /**
     * Pick up to the given number of elements at random from the given
     * collection, without repeating any element.
     *
     * @param[in] elements
     *     These are the elements from which to pick.
     *
     * @param[in] count
     *     This is the maximum number of elements to pick.
     *
     * @param[in,out] rng
     *     This is the pseudo-random number generator to use.
     *
     * @return
     *     The picked elements are returned, in random order.
     */
    template< typename T > std::vector< T > PickRandom(
        std::vector< T > elements,
        size_t count,
        std::mt19937& rng
    ) {
        std::shuffle(elements.begin(), elements.end(), rng);
        if (elements.size() > count) {
            elements.resize(count);
        }
        return elements;
    }

}

#endif /* SWIM_UTILITIES_HPP */
