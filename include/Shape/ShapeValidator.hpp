#pragma once
//
// Created by moinshaikh on 2/15/26.
//

#ifndef REPLICATE_SHAPEVALIDATOR_HPP
#define REPLICATE_SHAPEVALIDATOR_HPP

#include<initializer_list>
#include<optional>

#include<torch/torch.h>

#include"ShapeAlgebra.hpp"
#include"../Variable.hpp"

namespace Replicate
{
    namespace ShapeValidator
    {
        /**
         * @brief Validates a sample shape value and returns it as a Shape.
         *
         * A rank-0 value n becomes [n], a rank-1 value is returned unchanged.
         *
         * @throws ShapeError If the value has rank 2 or more, is not of an integer dtype or
         *         holds a negative entry.
         */
        Shape normalize(const torch::Tensor &value);
    }

    /**
     * @class SampleShape
     * @brief The replicate shape of a SampleDistribution, fixed or backed by a Variable.
     *
     * A fixed value is validated once, at construction. A Variable-backed value is validated
     * every time it is resolved, since the caller may assign an invalid value at any point
     * after construction.
     */
    class SampleShape
    {
    private:
        Parameter value;                 ///< The raw sample shape
        std::optional<Shape> validated;  ///< Normalized value of a fixed sample shape
    public:
        SampleShape(int64_t size);
        SampleShape(std::initializer_list<int64_t> dims);
        SampleShape(const Shape &dims);
        SampleShape(torch::Tensor value);
        SampleShape(const Variable &variable);

        inline bool isDynamic() const
        {
            return value.isDynamic();
        }

        /**
         * @brief The validated shape when it is known at construction, nullopt otherwise.
         */
        inline const std::optional<Shape> &staticValue() const
        {
            return validated;
        }

        /**
         * @brief Reads and validates the current value.
         *
         * @throws ValidationDeferredError If a Variable-backed value fails validation.
         */
        Shape resolve() const;
    };
}

#endif //REPLICATE_SHAPEVALIDATOR_HPP
