//
// Created by moinshaikh on 2/18/26.
//

#include<torch/torch.h>

#include"../../include/Bijector/Sigmoid.hpp"
#include<doctest/doctest.h>

namespace Replicate
{
    Sigmoid::Sigmoid(Parameter low, Parameter high) : low(std::move(low)), high(std::move(high))
    {

    }

    torch::Tensor Sigmoid::forward(const torch::Tensor &x) const
    {
        auto lower = low.value();
        return lower + (high.value() - lower) * torch::sigmoid(x);
    }

    torch::Tensor Sigmoid::inverse(const torch::Tensor &y) const
    {
        auto lower = low.value();
        auto unit = (y - lower) / (high.value() - lower);
        return torch::log(unit) - torch::log1p(-unit);
    }

    /**
     * @brief log|J| = log(high - low) + log(sigmoid(x)) + log(sigmoid(-x)).
     */
    torch::Tensor Sigmoid::forwardLogDetJacobianImpl(const torch::Tensor &x) const
    {
        return torch::log(high.value() - low.value()) + torch::log_sigmoid(x) + torch::log_sigmoid(-x);
    }

    TEST_CASE("Sigmoid")
    {
        Sigmoid sigmoid(torch::zeros({5}), 2.0);

        SUBCASE("Maps onto the interval")
        {
            auto y = sigmoid.forward(torch::zeros({3, 5}));
            CHECK(y.sizes().vec() == Shape{3, 5});
            CHECK(torch::allclose(y, torch::ones({3, 5})));
        }

        SUBCASE("Round trips and the Jacobians agree")
        {
            auto x = torch::randn({3, 5});
            auto y = sigmoid.forward(x);
            CHECK(torch::allclose(sigmoid.inverse(y), x, 1e-4, 1e-4));
            CHECK(torch::allclose(sigmoid.forwardLogDetJacobian(x, 1),
                                  -sigmoid.inverseLogDetJacobian(y, 1), 1e-4, 1e-4));
        }
    }
}
