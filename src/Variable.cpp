//
// Created by moinshaikh on 2/14/26.
//

#include<torch/torch.h>

#include"../include/Variable.hpp"
#include<doctest/doctest.h>

namespace Replicate
{
    Variable::Variable(torch::Tensor initial) : cell(std::make_shared<torch::Tensor>(std::move(initial)))
    {

    }

    torch::Tensor Variable::read() const
    {
        return *cell;
    }

    void Variable::assign(torch::Tensor value)
    {
        *cell = std::move(value);
    }

    Parameter::Parameter(torch::Tensor value) : constant(std::move(value))
    {

    }

    Parameter::Parameter(const Variable &variable) : variable(variable)
    {

    }

    /**
     * @brief Wraps a plain number as a rank-0 tensor of the default floating dtype.
     */
    Parameter::Parameter(double value) : constant(torch::scalar_tensor(value, torch::kFloat))
    {

    }

    torch::Tensor Parameter::value() const
    {
        return variable ? variable->read() : constant;
    }

    std::optional<std::vector<int64_t>> Parameter::staticShape() const
    {
        if (variable)
        {
            return std::nullopt;
        }
        return constant.sizes().vec();
    }

    TEST_CASE("Variable")
    {
        SUBCASE("Copies share the same cell")
        {
            Variable loc(torch::zeros({4, 5, 3}));
            Variable copy = loc;
            loc.assign(torch::zeros({}));
            CHECK(copy.read().dim() == 0);
        }

        SUBCASE("Parameters read through to the variable")
        {
            Variable scale(torch::ones({2}));
            Parameter parameter(scale);
            CHECK(parameter.isDynamic());
            CHECK_FALSE(parameter.staticShape().has_value());

            scale.assign(torch::ones({3, 1, 2}));
            CHECK(parameter.value().sizes().vec() == std::vector<int64_t>{3, 1, 2});
        }

        SUBCASE("Fixed parameters have a static shape")
        {
            Parameter parameter(torch::zeros({3, 2}));
            CHECK_FALSE(parameter.isDynamic());
            CHECK(*parameter.staticShape() == std::vector<int64_t>{3, 2});

            Parameter number(2.0);
            CHECK(number.value().dim() == 0);
            CHECK(number.value().item().toDouble() == doctest::Approx(2.0));
        }
    }
}
