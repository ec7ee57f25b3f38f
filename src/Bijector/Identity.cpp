//
// Created by moinshaikh on 2/18/26.
//

#include<torch/torch.h>

#include"../../include/Bijector/Identity.hpp"
#include"../../include/Errors.hpp"
#include<doctest/doctest.h>

namespace Replicate
{
    torch::Tensor Identity::forward(const torch::Tensor &x) const
    {
        return x;
    }

    torch::Tensor Identity::inverse(const torch::Tensor &y) const
    {
        return y;
    }

    torch::Tensor Identity::forwardLogDetJacobianImpl(const torch::Tensor &x) const
    {
        return torch::zeros({}, x.options());
    }

    torch::Tensor Identity::inverseLogDetJacobianImpl(const torch::Tensor &y) const
    {
        return torch::zeros({}, y.options());
    }

    TEST_CASE("Identity")
    {
        Identity identity;
        auto x = torch::randn({4, 3});

        CHECK(torch::equal(identity.forward(x), x));
        CHECK(torch::equal(identity.inverse(x), x));
        CHECK(identity.forwardLogDetJacobian(x, 0).item().toDouble() == 0.0);
        CHECK(identity.inverseLogDetJacobian(x, 2).item().toDouble() == 0.0);
        CHECK(identity.forwardEventShape({4, 3}) == Shape{4, 3});
        CHECK_THROWS_AS(identity.forwardLogDetJacobian(x, -1), ShapeError);
        CHECK_THROWS_AS(identity.forwardLogDetJacobian(x, 3), ShapeError);
    }
}
