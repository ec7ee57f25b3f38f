#pragma once
//
// Created by moinshaikh on 2/14/26.
//

#ifndef REPLICATE_VARIABLE_HPP
#define REPLICATE_VARIABLE_HPP

#include<memory>
#include<optional>

#include<torch/torch.h>

namespace Replicate
{
    /**
     * @class Variable
     * @brief An externally mutable tensor cell.
     *
     * Copies of a Variable share the same cell, so a distribution holding a copy observes
     * every assign() made by the caller. The shape (and rank) of the held value may change
     * between assignments.
     */
    class Variable
    {
    private:
        std::shared_ptr<torch::Tensor> cell;  ///< Shared storage for the current value
    public:
        explicit Variable(torch::Tensor initial);

        /**
         * @brief Returns the current value.
         */
        torch::Tensor read() const;

        /**
         * @brief Replaces the current value; every copy of this Variable sees the new one.
         *
         * @param value The new value. It need not have the shape of the old one.
         */
        void assign(torch::Tensor value);
    };

    /**
     * @class Parameter
     * @brief A distribution parameter that is either fixed or read from a Variable.
     *
     * This is the shape provider every collaborator queries at the start of an operation:
     * a fixed parameter has a shape known at construction, a dynamic one only when read.
     */
    class Parameter
    {
    private:
        torch::Tensor constant;            ///< Value of a fixed parameter
        std::optional<Variable> variable;  ///< Backing cell of a dynamic parameter
    public:
        Parameter(torch::Tensor value);
        Parameter(const Variable &variable);
        Parameter(double value);

        /**
         * @brief True when the value is read from a Variable.
         */
        inline bool isDynamic() const
        {
            return variable.has_value();
        }

        /**
         * @brief Reads the current value.
         */
        torch::Tensor value() const;

        /**
         * @brief The shape of a fixed parameter, or nullopt for a dynamic one.
         */
        std::optional<std::vector<int64_t>> staticShape() const;
    };
}

#endif //REPLICATE_VARIABLE_HPP
