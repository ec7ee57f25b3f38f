
//
// Created by moinshaikh on 2/25/26.
//

#pragma once
#include"Errors.hpp"
#include"Variable.hpp"


#include"Shape/ShapeAlgebra.hpp"
#include"Shape/ShapeValidator.hpp"
#include"Shape/ReductionEngine.hpp"


#include"Bijector/Bijector.hpp"
#include"Bijector/Chain.hpp"
#include"Bijector/CorrelationCholesky.hpp"
#include"Bijector/Exp.hpp"
#include"Bijector/Identity.hpp"
#include"Bijector/SampleBijector.hpp"
#include"Bijector/Scale.hpp"
#include"Bijector/ScaleMatvecTriL.hpp"
#include"Bijector/Sigmoid.hpp"


#include"Distribution/Distribution.hpp"
#include"Distribution/CholeskyLKJ.hpp"
#include"Distribution/Independent.hpp"
#include"Distribution/KLDivergence.hpp"
#include"Distribution/Normal.hpp"
#include"Distribution/Poisson.hpp"
#include"Distribution/SampleDistribution.hpp"
#include"Distribution/TransformedDistribution.hpp"
#include"Distribution/Uniform.hpp"
