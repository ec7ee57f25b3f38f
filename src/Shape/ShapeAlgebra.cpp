//
// Created by moinshaikh on 2/15/26.
//

#include<algorithm>
#include<numeric>
#include<sstream>

#include<torch/torch.h>

#include"../../include/Shape/ShapeAlgebra.hpp"
#include"../../include/Errors.hpp"
#include<doctest/doctest.h>

namespace Replicate
{
    int64_t AxisLayout::ndims(AxisGroup group) const
    {
        switch (group)
        {
            case AxisGroup::Prefix:
                return prefixNdims;
            case AxisGroup::Batch:
                return batchNdims;
            case AxisGroup::Sample:
                return sampleNdims;
            case AxisGroup::Event:
                return eventNdims;
        }
        return 0;
    }

    namespace ShapeAlgebra
    {
        Shape eventShape(const Shape &sampleShape, const Shape &baseEventShape)
        {
            return concat(sampleShape, baseEventShape);
        }

        Shape batchShape(const Shape &baseBatchShape)
        {
            return baseBatchShape;
        }

        /**
         * @brief Broadcasts two shapes.
         *
         * @details Dimensions are aligned from the right. A missing dimension counts as 1, a 1
         * stretches to the other size, and two different sizes that are both not 1 are an error.
         */
        Shape broadcastShapes(c10::ArrayRef<int64_t> lhs, c10::ArrayRef<int64_t> rhs)
        {
            const auto ndims = std::max(lhs.size(), rhs.size());
            Shape result(ndims, 1);
            for (size_t i = 0; i < ndims; ++i)
            {
                const int64_t l = i < lhs.size() ? lhs[lhs.size() - 1 - i] : 1;
                const int64_t r = i < rhs.size() ? rhs[rhs.size() - 1 - i] : 1;
                if (l != r && l != 1 && r != 1)
                {
                    throw ShapeError("Incompatible shapes for broadcasting: " + toString(lhs) +
                                     " vs. " + toString(rhs));
                }
                result[ndims - 1 - i] = l == 1 ? r : l;
            }
            return result;
        }

        int64_t numElements(c10::ArrayRef<int64_t> shape)
        {
            return std::accumulate(shape.begin(), shape.end(), int64_t{1}, std::multiplies<int64_t>());
        }

        std::string toString(c10::ArrayRef<int64_t> shape)
        {
            std::ostringstream out;
            out << "[";
            for (size_t i = 0; i < shape.size(); ++i)
            {
                if (i > 0) out << ", ";
                out << shape[i];
            }
            out << "]";
            return out.str();
        }

        torch::Tensor toTensor(const Shape &shape)
        {
            return torch::tensor(shape, torch::kLong).reshape({static_cast<int64_t>(shape.size())});
        }

        Shape fromTensor(const torch::Tensor &shape)
        {
            auto flat = shape.to(torch::kLong).contiguous().reshape({-1});
            return Shape(flat.data_ptr<int64_t>(), flat.data_ptr<int64_t>() + flat.numel());
        }

        Shape concat(const Shape &lhs, const Shape &rhs)
        {
            Shape result;
            result.reserve(lhs.size() + rhs.size());
            result.insert(result.end(), lhs.begin(), lhs.end());
            result.insert(result.end(), rhs.begin(), rhs.end());
            return result;
        }

        std::vector<int64_t> groupAxes(const AxisLayout &layout, const GroupOrder &order, AxisGroup group)
        {
            int64_t start = 0;
            for (auto current : order)
            {
                if (current == group)
                {
                    std::vector<int64_t> axes(layout.ndims(group));
                    std::iota(axes.begin(), axes.end(), start);
                    return axes;
                }
                start += layout.ndims(current);
            }
            return {};
        }

        /**
         * @brief Computes the axis permutation between two group orders.
         *
         * @details Walks the target order group by group and appends the source positions of
         * that group's axes. Axes keep their relative order inside a group, so only whole groups
         * move; this is what keeps e.g. the sample dimensions [5, 4] from turning into [4, 5].
         */
        std::vector<int64_t> permutation(const AxisLayout &layout, const GroupOrder &from, const GroupOrder &to)
        {
            std::vector<int64_t> result;
            result.reserve(layout.total());
            for (auto group : to)
            {
                auto axes = groupAxes(layout, from, group);
                result.insert(result.end(), axes.begin(), axes.end());
            }
            return result;
        }

        std::vector<int64_t> invertPermutation(const std::vector<int64_t> &permutation)
        {
            std::vector<int64_t> inverse(permutation.size());
            for (size_t i = 0; i < permutation.size(); ++i)
            {
                inverse[permutation[i]] = static_cast<int64_t>(i);
            }
            return inverse;
        }

        torch::Tensor expandToRank(const torch::Tensor &value, int64_t ndims)
        {
            if (value.dim() >= ndims)
            {
                return value;
            }
            Shape padded(ndims - value.dim(), 1);
            auto sizes = value.sizes();
            padded.insert(padded.end(), sizes.begin(), sizes.end());
            return value.reshape(padded);
        }
    }

    TEST_CASE("ShapeAlgebra")
    {
        SUBCASE("Event shape puts the sample dimensions first")
        {
            CHECK(ShapeAlgebra::eventShape({5, 4}, {2}) == Shape{5, 4, 2});
            CHECK(ShapeAlgebra::eventShape({}, {2}) == Shape{2});
            CHECK(ShapeAlgebra::eventShape({3}, {}) == Shape{3});
            CHECK(ShapeAlgebra::batchShape({3, 1}) == Shape{3, 1});
        }

        SUBCASE("broadcastShapes()")
        {
            CHECK(ShapeAlgebra::broadcastShapes({2, 1}, {4}) == Shape{2, 4});
            CHECK(ShapeAlgebra::broadcastShapes({}, {1, 2, 3}) == Shape{1, 2, 3});
            CHECK(ShapeAlgebra::broadcastShapes({6, 1, 3, 5, 4, 2}, {5, 4, 2}) ==
                  Shape{6, 1, 3, 5, 4, 2});
            CHECK(ShapeAlgebra::broadcastShapes({0}, {1}) == Shape{0});
            CHECK_THROWS_AS(ShapeAlgebra::broadcastShapes({3}, {4}), ShapeError);
            CHECK_THROWS_WITH(ShapeAlgebra::broadcastShapes({3}, {4}),
                              doctest::Contains("Incompatible shapes for broadcasting"));
        }

        SUBCASE("Shape tensors convert both ways")
        {
            auto tensor = ShapeAlgebra::toTensor({4, 5});
            CHECK(tensor.scalar_type() == torch::kLong);
            CHECK(tensor.sizes().vec() == Shape{2});
            CHECK(ShapeAlgebra::fromTensor(tensor) == Shape{4, 5});
            CHECK(ShapeAlgebra::toTensor({}).sizes().vec() == Shape{0});
            CHECK(ShapeAlgebra::fromTensor(ShapeAlgebra::toTensor({})).empty());
        }

        SUBCASE("Sampling permutation moves the batch in front of the sample dimensions")
        {
            // Base draws [6, 1] ++ [5, 4] ++ [3] ++ [2].
            AxisLayout layout{2, 1, 2, 1};
            auto perm = ShapeAlgebra::permutation(layout, kSampleMajor, kBatchMajor);
            CHECK(perm == std::vector<int64_t>{0, 1, 4, 2, 3, 5});

            auto drawn = torch::zeros({6, 1, 5, 4, 3, 2});
            CHECK(drawn.permute(perm).sizes().vec() == Shape{6, 1, 3, 5, 4, 2});
        }

        SUBCASE("Density permutation is the inverse of the sampling one")
        {
            AxisLayout layout{2, 1, 2, 1};
            auto toBase = ShapeAlgebra::permutation(layout, kBatchMajor, kSampleMajor);
            auto toCaller = ShapeAlgebra::permutation(layout, kSampleMajor, kBatchMajor);
            CHECK(toBase == std::vector<int64_t>{0, 1, 3, 4, 2, 5});
            CHECK(ShapeAlgebra::invertPermutation(toCaller) == toBase);

            auto observed = torch::zeros({6, 1, 3, 5, 4, 2});
            CHECK(observed.permute(toBase).sizes().vec() == Shape{6, 1, 5, 4, 3, 2});
        }

        SUBCASE("Group axes follow the requested order")
        {
            AxisLayout layout{1, 2, 3, 1};
            CHECK(ShapeAlgebra::groupAxes(layout, kSampleMajor, AxisGroup::Sample) ==
                  std::vector<int64_t>{1, 2, 3});
            CHECK(ShapeAlgebra::groupAxes(layout, kBatchMajor, AxisGroup::Sample) ==
                  std::vector<int64_t>{3, 4, 5});
            CHECK(ShapeAlgebra::groupAxes(layout, kBatchMajor, AxisGroup::Event) ==
                  std::vector<int64_t>{6});
            CHECK(layout.total() == 7);
        }

        SUBCASE("expandToRank() pads on the left only")
        {
            CHECK(ShapeAlgebra::expandToRank(torch::zeros({}), 3).sizes().vec() == Shape{1, 1, 1});
            CHECK(ShapeAlgebra::expandToRank(torch::zeros({2, 3}), 3).sizes().vec() == Shape{1, 2, 3});
            CHECK(ShapeAlgebra::expandToRank(torch::zeros({4, 2, 3}), 2).sizes().vec() == Shape{4, 2, 3});
        }
    }
}
