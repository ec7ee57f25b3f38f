//
// Created by moinshaikh on 2/19/26.
//

#include<algorithm>

#include<torch/torch.h>

#include"../../include/Bijector/Chain.hpp"
#include"../../include/Bijector/CorrelationCholesky.hpp"
#include"../../include/Bijector/Exp.hpp"
#include"../../include/Bijector/Identity.hpp"
#include"../../include/Bijector/Scale.hpp"
#include<doctest/doctest.h>

namespace Replicate
{
    /**
     * @brief Builds the chain and derives its minimum event ranks.
     *
     * @details Walking the members in application order, each member needs
     * forwardMinEventNdims() dimensions of its own input; relative to the chain's input that is
     * the member's requirement minus the rank change accumulated so far.
     */
    Chain::Chain(std::vector<std::shared_ptr<Bijector>> bijectors) : bijectors(std::move(bijectors))
    {
        int64_t minNdims = 0;
        int64_t rankChange = 0;
        for (auto it = this->bijectors.rbegin(); it != this->bijectors.rend(); ++it)
        {
            if (*it == nullptr)
            {
                throw std::runtime_error("Chain members must not be null");
            }
            minNdims = std::max(minNdims, (*it)->forwardMinEventNdims() - rankChange);
            rankChange += (*it)->inverseMinEventNdims() - (*it)->forwardMinEventNdims();
        }
        forwardMinNdims = minNdims;
        inverseMinNdims = minNdims + rankChange;
    }

    torch::Tensor Chain::forward(const torch::Tensor &x) const
    {
        auto y = x;
        for (auto it = bijectors.rbegin(); it != bijectors.rend(); ++it)
        {
            y = (*it)->forward(y);
        }
        return y;
    }

    torch::Tensor Chain::inverse(const torch::Tensor &y) const
    {
        auto x = y;
        for (const auto &bijector : bijectors)
        {
            x = bijector->inverse(x);
        }
        return x;
    }

    bool Chain::isConstantJacobian() const
    {
        return std::all_of(bijectors.begin(), bijectors.end(),
                           [](const std::shared_ptr<Bijector> &bijector) { return bijector->isConstantJacobian(); });
    }

    Shape Chain::forwardEventShapeImpl(const Shape &eventShape) const
    {
        auto shape = eventShape;
        for (auto it = bijectors.rbegin(); it != bijectors.rend(); ++it)
        {
            shape = (*it)->forwardEventShape(shape);
        }
        return shape;
    }

    Shape Chain::inverseEventShapeImpl(const Shape &eventShape) const
    {
        auto shape = eventShape;
        for (const auto &bijector : bijectors)
        {
            shape = bijector->inverseEventShape(shape);
        }
        return shape;
    }

    torch::Tensor Chain::forwardLogDetJacobianImpl(const torch::Tensor &x) const
    {
        auto ldj = torch::zeros({}, x.options());
        auto current = x;
        auto eventNdims = forwardMinNdims;
        for (auto it = bijectors.rbegin(); it != bijectors.rend(); ++it)
        {
            ldj = ldj + (*it)->forwardLogDetJacobian(current, eventNdims);
            eventNdims += (*it)->inverseMinEventNdims() - (*it)->forwardMinEventNdims();
            current = (*it)->forward(current);
        }
        return ldj;
    }

    torch::Tensor Chain::inverseLogDetJacobianImpl(const torch::Tensor &y) const
    {
        auto ldj = torch::zeros({}, y.options());
        auto current = y;
        auto eventNdims = inverseMinNdims;
        for (const auto &bijector : bijectors)
        {
            ldj = ldj + bijector->inverseLogDetJacobian(current, eventNdims);
            eventNdims -= bijector->inverseMinEventNdims() - bijector->forwardMinEventNdims();
            current = bijector->inverse(current);
        }
        return ldj;
    }

    TEST_CASE("Chain")
    {
        SUBCASE("Applies members right to left")
        {
            Chain chain({std::make_shared<Scale>(torch::tensor({2.f})), std::make_shared<Exp>()});
            auto y = chain.forward(torch::zeros({3}));
            CHECK(torch::allclose(y, torch::full({3}, 2.f)));
            CHECK(torch::allclose(chain.inverse(y), torch::zeros({3}), 1e-6, 1e-6));
        }

        SUBCASE("Constant members give a constant chain")
        {
            Chain constant({std::make_shared<Scale>(torch::tensor({2.f, 3.f})), std::make_shared<Identity>()});
            CHECK(constant.isConstantJacobian());
            auto ildj = constant.inverseLogDetJacobian(torch::zeros({3, 2}), 0);
            CHECK(torch::allclose(ildj, -torch::log(torch::tensor({2.f, 3.f}))));

            Chain mixed({std::make_shared<Exp>(), std::make_shared<Identity>()});
            CHECK_FALSE(mixed.isConstantJacobian());
        }

        SUBCASE("Rank changes propagate through the chain")
        {
            Chain chain({std::make_shared<Scale>(torch::scalar_tensor(2.0, torch::kDouble)),
                         std::make_shared<CorrelationCholesky>()});
            CHECK(chain.forwardMinEventNdims() == 1);
            CHECK(chain.inverseMinEventNdims() == 2);
            CHECK(chain.forwardEventShape({7, 3}) == Shape{7, 3, 3});
            CHECK(chain.inverseEventShape({7, 3, 3}) == Shape{7, 3});

            auto x = torch::randn({7, 3}, torch::kDouble);
            auto y = chain.forward(x);
            CHECK(torch::allclose(chain.inverse(y), x, 1e-8, 1e-8));
            CHECK(torch::allclose(chain.forwardLogDetJacobian(x, 1), -chain.inverseLogDetJacobian(y, 2)));
        }

        SUBCASE("Empty chain is the identity")
        {
            Chain empty(std::vector<std::shared_ptr<Bijector>>{});
            auto x = torch::randn({2});
            CHECK(torch::equal(empty.forward(x), x));
            CHECK(empty.forwardMinEventNdims() == 0);
        }
    }
}
