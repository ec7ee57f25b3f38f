//
// Created by moinshaikh on 2/18/26.
//

#include<torch/torch.h>

#include"../../include/Bijector/Exp.hpp"
#include<doctest/doctest.h>

namespace Replicate
{
    torch::Tensor Exp::forward(const torch::Tensor &x) const
    {
        return torch::exp(x);
    }

    torch::Tensor Exp::inverse(const torch::Tensor &y) const
    {
        return torch::log(y);
    }

    /**
     * @brief d exp(x)/dx = exp(x), so log|J| = x.
     */
    torch::Tensor Exp::forwardLogDetJacobianImpl(const torch::Tensor &x) const
    {
        return x;
    }

    torch::Tensor Exp::inverseLogDetJacobianImpl(const torch::Tensor &y) const
    {
        return -torch::log(y);
    }

    TEST_CASE("Exp")
    {
        Exp exp;
        auto x = torch::randn({4, 3, 2});
        auto y = exp.forward(x);

        SUBCASE("Round trips")
        {
            CHECK(torch::allclose(exp.inverse(y), x, 1e-5, 1e-5));
        }

        SUBCASE("Log-det-Jacobian sums over the requested event dimensions")
        {
            CHECK(exp.forwardLogDetJacobian(x, 0).sizes().vec() == Shape{4, 3, 2});
            auto ldj = exp.forwardLogDetJacobian(x, 2);
            CHECK(ldj.sizes().vec() == Shape{4});
            CHECK(torch::allclose(ldj, x.sum({-2, -1})));
            CHECK(torch::allclose(ldj, -exp.inverseLogDetJacobian(y, 2), 1e-5, 1e-5));
        }
    }
}
