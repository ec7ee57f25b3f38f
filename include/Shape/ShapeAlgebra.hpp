#pragma once
//
// Created by moinshaikh on 2/15/26.
//

#ifndef REPLICATE_SHAPEALGEBRA_HPP
#define REPLICATE_SHAPEALGEBRA_HPP

#include<array>
#include<string>
#include<vector>

#include<c10/util/ArrayRef.h>
#include<torch/torch.h>

namespace Replicate
{
    using Shape = std::vector<int64_t>;

    /**
     * @brief Semantic role of a run of tensor axes.
     */
    enum class AxisGroup
    {
        Prefix,  ///< Caller supplied leading dimensions (sample requests, chains, ...)
        Batch,   ///< Batch dimensions of the base distribution
        Sample,  ///< i.i.d. replicate dimensions introduced by SampleDistribution
        Event    ///< Event dimensions of the base distribution
    };

    using GroupOrder = std::array<AxisGroup, 4>;

    /// Prefix ++ batch ++ sample ++ event: the layout seen by callers of SampleDistribution.
    constexpr GroupOrder kBatchMajor = {AxisGroup::Prefix, AxisGroup::Batch, AxisGroup::Sample, AxisGroup::Event};

    /// Prefix ++ sample ++ batch ++ event: the layout the base distribution draws and evaluates in.
    constexpr GroupOrder kSampleMajor = {AxisGroup::Prefix, AxisGroup::Sample, AxisGroup::Batch, AxisGroup::Event};

    /**
     * @brief Number of axes in each group of a tensor.
     */
    struct AxisLayout
    {
        int64_t prefixNdims = 0;
        int64_t batchNdims = 0;
        int64_t sampleNdims = 0;
        int64_t eventNdims = 0;

        int64_t ndims(AxisGroup group) const;

        int64_t total() const
        {
            return prefixNdims + batchNdims + sampleNdims + eventNdims;
        }
    };

    namespace ShapeAlgebra
    {
        /**
         * @brief Event shape of a SampleDistribution: sampleShape ++ baseEventShape.
         */
        Shape eventShape(const Shape &sampleShape, const Shape &baseEventShape);

        /**
         * @brief Batch shape of a SampleDistribution; replication happens inside each batch member.
         */
        Shape batchShape(const Shape &baseBatchShape);

        /**
         * @brief Broadcasts two shapes by aligning trailing dimensions.
         *
         * @throws ShapeError "Incompatible shapes for broadcasting" when a pair of aligned
         *         dimensions differ and neither is 1.
         */
        Shape broadcastShapes(c10::ArrayRef<int64_t> lhs, c10::ArrayRef<int64_t> rhs);

        int64_t numElements(c10::ArrayRef<int64_t> shape);

        std::string toString(c10::ArrayRef<int64_t> shape);

        /**
         * @brief Converts a shape to the int64 vector tensor returned by the *ShapeTensor() queries.
         */
        torch::Tensor toTensor(const Shape &shape);

        Shape fromTensor(const torch::Tensor &shape);

        Shape concat(const Shape &lhs, const Shape &rhs);

        /**
         * @brief Flat axis positions of @p group in a tensor laid out in @p order.
         */
        std::vector<int64_t> groupAxes(const AxisLayout &layout, const GroupOrder &order, AxisGroup group);

        /**
         * @brief The permutation which takes a tensor laid out in @p from to one laid out in @p to.
         *
         * The result is suitable for torch::Tensor::permute: entry i is the source axis that
         * ends up in position i.
         */
        std::vector<int64_t> permutation(const AxisLayout &layout, const GroupOrder &from, const GroupOrder &to);

        std::vector<int64_t> invertPermutation(const std::vector<int64_t> &permutation);

        /**
         * @brief Left pads @p value with unit dimensions until it has @p ndims dimensions.
         *
         * Tensors that already have at least @p ndims dimensions are returned as is.
         */
        torch::Tensor expandToRank(const torch::Tensor &value, int64_t ndims);
    }
}

#endif //REPLICATE_SHAPEALGEBRA_HPP
