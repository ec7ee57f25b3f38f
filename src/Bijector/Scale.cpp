//
// Created by moinshaikh on 2/18/26.
//

#include<cmath>

#include<torch/torch.h>

#include"../../include/Bijector/Scale.hpp"
#include<doctest/doctest.h>

namespace Replicate
{
    Scale::Scale(Parameter scale) : scale(std::move(scale))
    {

    }

    torch::Tensor Scale::forward(const torch::Tensor &x) const
    {
        return x * scale.value();
    }

    torch::Tensor Scale::inverse(const torch::Tensor &y) const
    {
        return y / scale.value();
    }

    torch::Tensor Scale::forwardLogDetJacobianImpl(const torch::Tensor &x) const
    {
        return torch::log(torch::abs(scale.value())).to(x.scalar_type());
    }

    TEST_CASE("Scale")
    {
        Scale scale(torch::tensor({2.f, 3.f}));

        SUBCASE("Scales elementwise")
        {
            auto y = scale.forward(torch::ones({4, 2}));
            CHECK(y[3][1].item().toDouble() == doctest::Approx(3.0));
            CHECK(torch::allclose(scale.inverse(y), torch::ones({4, 2})));
        }

        SUBCASE("Constant Jacobian counts every reduced element")
        {
            CHECK(scale.isConstantJacobian());
            auto x = torch::zeros({4, 2});
            auto perElement = scale.forwardLogDetJacobian(x, 0);
            CHECK(perElement.sizes().vec() == Shape{2});

            auto total = scale.forwardLogDetJacobian(x, 2);
            CHECK(total.item().toDouble() == doctest::Approx(4 * (std::log(2.0) + std::log(3.0))));

            auto inverse = scale.inverseLogDetJacobian(x, 2);
            CHECK(inverse.item().toDouble() == doctest::Approx(-total.item().toDouble()));
        }
    }
}
