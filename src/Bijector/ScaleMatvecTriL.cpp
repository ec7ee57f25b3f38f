//
// Created by moinshaikh on 2/19/26.
//

#include<cmath>

#include<torch/torch.h>

#include"../../include/Bijector/ScaleMatvecTriL.hpp"
#include<doctest/doctest.h>

namespace Replicate
{
    ScaleMatvecTriL::ScaleMatvecTriL(Parameter scaleTril) : scaleTril(std::move(scaleTril))
    {

    }

    torch::Tensor ScaleMatvecTriL::forward(const torch::Tensor &x) const
    {
        return torch::matmul(scaleTril.value(), x.unsqueeze(-1)).squeeze(-1);
    }

    torch::Tensor ScaleMatvecTriL::inverse(const torch::Tensor &y) const
    {
        return torch::linalg_solve_triangular(scaleTril.value(), y.unsqueeze(-1), /*upper=*/false).squeeze(-1);
    }

    torch::Tensor ScaleMatvecTriL::forwardLogDetJacobianImpl(const torch::Tensor &x) const
    {
        return scaleTril.value().diagonal(0, -2, -1).abs().log().sum(-1).to(x.scalar_type());
    }

    TEST_CASE("ScaleMatvecTriL")
    {
        float tril[2][2] = {{0.75f, 0.f},
                            {0.05f, 0.5f}};
        ScaleMatvecTriL affine(torch::from_blob(tril, {2, 2}).clone());
        auto x = torch::randn({4, 3, 2});

        SUBCASE("Applies the matrix to the last dimension")
        {
            auto y = affine.forward(torch::ones({2}));
            CHECK(y[0].item().toDouble() == doctest::Approx(0.75));
            CHECK(y[1].item().toDouble() == doctest::Approx(0.55));
        }

        SUBCASE("Round trips over batch dimensions")
        {
            auto y = affine.forward(x);
            CHECK(y.sizes().vec() == Shape{4, 3, 2});
            CHECK(torch::allclose(affine.inverse(y), x, 1e-5, 1e-5));
        }

        SUBCASE("Constant Jacobian is scaled by the number of vectors")
        {
            auto ldj = affine.forwardLogDetJacobian(x, 2);
            CHECK(ldj.dim() == 0);
            CHECK(ldj.item().toDouble() == doctest::Approx(3 * (std::log(0.75) + std::log(0.5))).epsilon(1e-5));
            CHECK(torch::allclose(affine.inverseLogDetJacobian(affine.forward(x), 2), -ldj, 1e-5, 1e-5));
        }
    }
}
