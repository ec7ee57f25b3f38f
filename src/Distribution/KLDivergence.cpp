//
// Created by moinshaikh on 2/24/26.
//
#include<cmath>
#include<map>
#include<numeric>
#include<utility>

#include<torch/torch.h>
#include<doctest/doctest.h>
#include"../../include/Distribution/KLDivergence.hpp"
#include"../../include/Distribution/Independent.hpp"
#include"../../include/Distribution/Normal.hpp"
#include"../../include/Distribution/Poisson.hpp"
#include"../../include/Distribution/SampleDistribution.hpp"
#include"../../include/Distribution/Uniform.hpp"
#include"../../include/Errors.hpp"

namespace Replicate
{
    namespace
    {
        using Registry = std::map<std::pair<std::type_index, std::type_index>, KLFunction>;

        /**
         * @details KL(N(mu_p, s_p) || N(mu_q, s_q)) =
         * log(s_q / s_p) + (s_p^2 + (mu_p - mu_q)^2) / (2 s_q^2) - 1/2
         */
        torch::Tensor normalNormal(Normal &p, Normal &q)
        {
            auto ratio = (p.getScale() / q.getScale()).pow(2);
            auto difference = ((p.getLoc() - q.getLoc()) / q.getScale()).pow(2);
            return 0.5 * (ratio + difference - 1 - torch::log(ratio));
        }

        torch::Tensor independentIndependent(Independent &p, Independent &q)
        {
            auto pEvent = p.resolvedEventShape();
            auto qEvent = q.resolvedEventShape();
            if (pEvent != qEvent)
            {
                throw ShapeError("KL divergence between Independent distributions with event shapes " +
                                 ShapeAlgebra::toString(pEvent) + " and " + ShapeAlgebra::toString(qEvent));
            }
            std::vector<int64_t> axes(p.getReinterpretedBatchNdims());
            std::iota(axes.begin(), axes.end(), -p.getReinterpretedBatchNdims());
            return klDivergence(*p.getBase(), *q.getBase()).sum(axes);
        }

        torch::Tensor sampleSample(SampleDistribution &p, SampleDistribution &q)
        {
            auto pSample = p.getSampleShape().resolve();
            auto qSample = q.getSampleShape().resolve();
            if (pSample != qSample)
            {
                throw ShapeError("KL divergence between Sample distributions with sample shapes " +
                                 ShapeAlgebra::toString(pSample) + " and " + ShapeAlgebra::toString(qSample));
            }
            auto replicates = static_cast<double>(ShapeAlgebra::numElements(pSample));
            return klDivergence(*p.getBase(), *q.getBase()) * replicates;
        }

        Registry &registry()
        {
            static Registry entries = []
            {
                Registry builtIn;
                builtIn[{typeid(Normal), typeid(Normal)}] = [](Distribution &p, Distribution &q)
                {
                    return normalNormal(static_cast<Normal &>(p), static_cast<Normal &>(q));
                };
                builtIn[{typeid(Independent), typeid(Independent)}] = [](Distribution &p, Distribution &q)
                {
                    return independentIndependent(static_cast<Independent &>(p), static_cast<Independent &>(q));
                };
                builtIn[{typeid(SampleDistribution), typeid(SampleDistribution)}] = [](Distribution &p, Distribution &q)
                {
                    return sampleSample(static_cast<SampleDistribution &>(p), static_cast<SampleDistribution &>(q));
                };
                return builtIn;
            }();
            return entries;
        }
    }

    void registerKLDivergence(std::type_index p, std::type_index q, KLFunction function)
    {
        registry()[{p, q}] = std::move(function);
    }

    torch::Tensor klDivergence(Distribution &p, Distribution &q)
    {
        auto entry = registry().find({std::type_index(typeid(p)), std::type_index(typeid(q))});
        if (entry == registry().end())
        {
            throw UnsupportedStatisticError("No KL divergence registered between " + p.name() + " and " + q.name());
        }
        return entry->second(p, q);
    }

    TEST_CASE("KL divergence")
    {
        SUBCASE("Normal and normal")
        {
            Normal p(torch::zeros({3}), 1.0);
            Normal q(torch::ones({3}), 2.0);
            auto kl = klDivergence(p, q);
            double expected = std::log(2.0) + (1.0 + 1.0) / 8.0 - 0.5;
            CHECK(kl.sizes().vec() == std::vector<int64_t>{3});
            CHECK(kl[0].item().toDouble() == doctest::Approx(expected));
            CHECK(klDivergence(p, p).abs().max().item().toDouble() == doctest::Approx(0.0));
        }

        SUBCASE("Samples of independent normals")
        {
            double qScale = 2.0;
            auto p = SampleDistribution(
                    std::make_shared<Independent>(std::make_shared<Normal>(torch::zeros({3, 2}), 1.0), 1), {5, 4});
            auto q = SampleDistribution(
                    std::make_shared<Independent>(std::make_shared<Normal>(torch::zeros({3, 2}), qScale), 1), {5, 4});
            auto kl = klDivergence(p, q);
            double expected = (5 * 4) * (0.5 * std::pow(qScale, -2.0) - 0.5 + std::log(qScale)) * 2;
            CHECK(kl.sizes().vec() == std::vector<int64_t>{3});
            CHECK(torch::allclose(kl, torch::full({3}, expected), 1e-5, 1e-5));
        }

        SUBCASE("Mismatched sample shapes")
        {
            auto normal = std::make_shared<Normal>(0.0, 1.0);
            SampleDistribution p(normal, 2);
            SampleDistribution q(normal, 3);
            CHECK_THROWS_AS(klDivergence(p, q), ShapeError);
        }

        SUBCASE("Unregistered pairs")
        {
            Parameter rate(torch::ones({3}));
            Poisson poisson(&rate, nullptr);
            Normal normal(torch::zeros({3}), 1.0);
            CHECK_THROWS_AS(klDivergence(poisson, normal), UnsupportedStatisticError);

            SampleDistribution p(std::make_shared<Poisson>(&rate, nullptr), 2);
            SampleDistribution q(std::make_shared<Poisson>(&rate, nullptr), 2);
            CHECK_THROWS_AS(klDivergence(p, q), UnsupportedStatisticError);
        }

        SUBCASE("Registering a new pair")
        {
            // Valid when the support of p lies inside the support of q.
            registerKLDivergence<Uniform, Uniform>([](Uniform &p, Uniform &q)
                                                   {
                                                       return torch::log((q.getHigh() - q.getLow()) /
                                                                         (p.getHigh() - p.getLow()));
                                                   });
            Uniform inner(torch::zeros({2}), 1.0);
            Uniform outer(-1.0, torch::full({2}, 3.0));
            auto kl = klDivergence(inner, outer);
            CHECK(torch::allclose(kl, torch::full({2}, std::log(4.f))));
            CHECK(klDivergence(inner, inner).abs().sum().item().toDouble() == doctest::Approx(0.0));
        }
    }
}
