#pragma once
//
// Created by moinshaikh on 2/14/26.
//

#ifndef REPLICATE_ERRORS_HPP
#define REPLICATE_ERRORS_HPP

#include<stdexcept>
#include<string>

namespace Replicate
{
    /**
     * @brief Raised when shapes cannot be composed, broadcast or validated.
     *
     * Covers an invalid sample shape, an observation that does not broadcast against
     * the event shape, an event rank below what a bijector needs, and two distributions
     * whose sample shapes disagree in a pairwise operation.
     */
    class ShapeError : public std::runtime_error
    {
    public:
        explicit ShapeError(const std::string &message) : std::runtime_error(message) {}
    };

    /**
     * @brief A ShapeError found while resolving a shape that is only known at evaluation time.
     *
     * Thrown on the first sample()/logProbability() call after a Variable backing the
     * sample shape was assigned an invalid value. Construction succeeded; the value did not.
     */
    class ValidationDeferredError : public ShapeError
    {
    public:
        explicit ValidationDeferredError(const std::string &message) : ShapeError(message) {}
    };

    /**
     * @brief Raised when a collaborator does not implement a requested capability.
     *
     * Summary statistics, default event space bijectors and KL divergence pairs are all
     * optional; asking for a missing one ends up here.
     */
    class UnsupportedStatisticError : public std::runtime_error
    {
    public:
        explicit UnsupportedStatisticError(const std::string &message) : std::runtime_error(message) {}
    };
}

#endif //REPLICATE_ERRORS_HPP
