//
// Created by moinshaikh on 2/16/26.
//

#include<algorithm>
#include<cmath>

#include<ATen/Dispatch.h>
#include<spdlog/spdlog.h>
#include<torch/torch.h>

#include"../../include/Shape/ReductionEngine.hpp"
#include"../../include/Shape/ShapeAlgebra.hpp"
#include"../../include/Errors.hpp"
#include<doctest/doctest.h>

namespace Replicate
{
    namespace ReductionEngine
    {
        namespace
        {
            std::vector<int64_t> wrapAxes(const torch::Tensor &values, const std::vector<int64_t> &axes)
            {
                std::vector<int64_t> wrapped;
                wrapped.reserve(axes.size());
                for (auto axis : axes)
                {
                    auto positive = axis < 0 ? axis + values.dim() : axis;
                    if (positive < 0 || positive >= values.dim())
                    {
                        throw ShapeError("Cannot reduce axis " + std::to_string(axis) + " of a tensor of shape " +
                                         ShapeAlgebra::toString(values.sizes()));
                    }
                    wrapped.push_back(positive);
                }
                std::sort(wrapped.begin(), wrapped.end());
                if (std::adjacent_find(wrapped.begin(), wrapped.end()) != wrapped.end())
                {
                    throw ShapeError("Duplicate reduction axes for a tensor of shape " +
                                     ShapeAlgebra::toString(values.sizes()));
                }
                return wrapped;
            }
        }

        torch::Tensor reduceLogDensity(const torch::Tensor &values,
                                       const std::vector<int64_t> &axes,
                                       bool useCompensatedSum)
        {
            if (axes.empty())
            {
                return values;
            }
            if (useCompensatedSum)
            {
                spdlog::debug("Compensated sum over {} axes of a {} tensor", axes.size(),
                              ShapeAlgebra::toString(values.sizes()));
                return kahanSum(values, axes);
            }
            return values.sum(wrapAxes(values, axes));
        }

        /**
         * @brief Kahan-Babuska summation over a set of axes.
         *
         * @details The reduced axes are permuted to the front and flattened, giving a
         * [n, m] matrix with one column per output element. Rows are then folded in one at a
         * time. For each addend a with running sum s:
         * \f[
         * t = s + a, \qquad c \mathrel{+}= \begin{cases} (s - t) + a & |s| \ge |a| \\ (a - t) + s & \text{otherwise} \end{cases}
         * \f]
         * and s becomes t. The compensation c is added back once all rows are consumed.
         *
         * The loop runs on a detached copy. When @p values requires grad, the result is
         * attached to the graph of the plain sum, whose gradient is the same.
         */
        torch::Tensor kahanSum(const torch::Tensor &values, const std::vector<int64_t> &axes)
        {
            if (axes.empty())
            {
                return values;
            }
            auto reduced = wrapAxes(values, axes);

            std::vector<int64_t> perm(reduced.begin(), reduced.end());
            Shape keptShape;
            for (int64_t axis = 0; axis < values.dim(); ++axis)
            {
                if (!std::binary_search(reduced.begin(), reduced.end(), axis))
                {
                    perm.push_back(axis);
                    keptShape.push_back(values.size(axis));
                }
            }

            const int64_t columns = ShapeAlgebra::numElements(keptShape);
            const int64_t rows = columns == 0 ? 0 : values.numel() / columns;
            auto flat = values.detach().permute(perm).to(torch::kCPU).contiguous().reshape({rows, columns});
            auto result = torch::zeros({columns}, flat.options());

            AT_DISPATCH_FLOATING_TYPES_AND2(at::ScalarType::Half, at::ScalarType::BFloat16, flat.scalar_type(),
                                            "kahanSum", [&] {
                const scalar_t *input = flat.data_ptr<scalar_t>();
                scalar_t *sum = result.data_ptr<scalar_t>();
                std::vector<scalar_t> compensation(columns, scalar_t(0));
                for (int64_t row = 0; row < rows; ++row)
                {
                    const scalar_t *addends = input + row * columns;
                    for (int64_t column = 0; column < columns; ++column)
                    {
                        const scalar_t s = sum[column];
                        const scalar_t a = addends[column];
                        const scalar_t t = s + a;
                        if (std::abs(static_cast<double>(s)) >= std::abs(static_cast<double>(a)))
                        {
                            compensation[column] += (s - t) + a;
                        }
                        else
                        {
                            compensation[column] += (a - t) + s;
                        }
                        sum[column] = t;
                    }
                }
                for (int64_t column = 0; column < columns; ++column)
                {
                    sum[column] += compensation[column];
                }
            });

            auto compensated = result.reshape(keptShape).to(values.device());
            if (!values.requires_grad())
            {
                return compensated;
            }
            auto plain = values.sum(reduced);
            return plain + (compensated - plain.detach());
        }
    }

    TEST_CASE("ReductionEngine")
    {
        SUBCASE("Plain reduction removes exactly the requested axes")
        {
            auto values = torch::ones({6, 1, 5, 4, 3});
            auto reduced = ReductionEngine::reduceLogDensity(values, {2, 3}, false);
            CHECK(reduced.sizes().vec() == std::vector<int64_t>{6, 1, 3});
            CHECK(reduced[0][0][0].item().toDouble() == doctest::Approx(20));
        }

        SUBCASE("No axes is a no-op")
        {
            auto values = torch::rand({3, 2});
            CHECK(torch::equal(ReductionEngine::reduceLogDensity(values, {}, true), values));
        }

        SUBCASE("Compensated and plain sums agree on small inputs")
        {
            torch::manual_seed(0);
            auto values = torch::randn({4, 5, 3}, torch::kDouble);
            auto plain = ReductionEngine::reduceLogDensity(values, {0, 1}, false);
            auto compensated = ReductionEngine::reduceLogDensity(values, {0, 1}, true);
            CHECK(compensated.sizes().vec() == std::vector<int64_t>{3});
            CHECK(torch::allclose(plain, compensated, 1e-12, 1e-12));
        }

        SUBCASE("Negative axes wrap")
        {
            auto values = torch::arange(24, torch::kFloat).reshape({2, 3, 4});
            auto last = ReductionEngine::kahanSum(values, {-1});
            CHECK(last.sizes().vec() == std::vector<int64_t>{2, 3});
            CHECK(torch::allclose(last, values.sum(-1)));
        }

        SUBCASE("Reducing every axis gives a scalar, reducing nothing of size zero gives zero")
        {
            auto values = torch::full({3, 2}, 0.5);
            auto total = ReductionEngine::kahanSum(values, {0, 1});
            CHECK(total.dim() == 0);
            CHECK(total.item().toDouble() == doctest::Approx(3.0));

            auto empty = torch::zeros({0, 2});
            auto zero = ReductionEngine::kahanSum(empty, {0});
            CHECK(zero.sizes().vec() == std::vector<int64_t>{2});
            CHECK(zero.abs().sum().item().toDouble() == 0.0);
        }

        SUBCASE("Bad axes are rejected")
        {
            auto values = torch::zeros({2, 2});
            CHECK_THROWS_AS(ReductionEngine::kahanSum(values, {2}), ShapeError);
            CHECK_THROWS_AS(ReductionEngine::kahanSum(values, {0, -2}), ShapeError);
        }

        SUBCASE("Half precision inputs are accumulated in their own dtype")
        {
            auto half = ReductionEngine::kahanSum(torch::ones({8, 2}, torch::kHalf), {0});
            CHECK(half.scalar_type() == torch::kHalf);
            CHECK(torch::allclose(half.to(torch::kFloat), torch::full({2}, 8.f)));

            auto brain = ReductionEngine::reduceLogDensity(torch::ones({4, 3}, torch::kBFloat16), {-1}, true);
            CHECK(brain.scalar_type() == torch::kBFloat16);
            CHECK(torch::allclose(brain.to(torch::kFloat), torch::full({4}, 3.f)));
        }

        SUBCASE("Gradients flow through both reduction modes")
        {
            for (bool compensated : {false, true})
            {
                INFO("Compensated: " << compensated);
                auto values = torch::randn({5, 3}, torch::kDouble).requires_grad_();
                auto reduced = ReductionEngine::reduceLogDensity(values, {0}, compensated);
                CHECK(reduced.requires_grad());
                CHECK(torch::allclose(reduced, values.sum(0)));
                (reduced * torch::arange(3, torch::kDouble)).sum().backward();
                REQUIRE(values.grad().defined());
                CHECK(torch::allclose(values.grad(), torch::arange(3, torch::kDouble).expand({5, 3})));
            }
        }

        SUBCASE("Compensated float sum tracks a double reference")
        {
            // 0.1 is not representable; a naive float loop drifts visibly over 1e6 terms.
            auto values = torch::full({1000000}, 0.1, torch::kFloat);
            auto compensated = ReductionEngine::kahanSum(values, {0});
            auto reference = torch::full({1000000}, 0.1, torch::kDouble).sum();
            CHECK(compensated.scalar_type() == torch::kFloat);
            CHECK(compensated.item().toDouble() ==
                  doctest::Approx(reference.item().toDouble()).epsilon(1e-7));
        }
    }
}
