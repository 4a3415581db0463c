/*
 Copyright (C) 2016 Quaternion Risk Management Ltd
 All rights reserved.

 This file is part of ORE, a free-software/open-source library
 for transparent pricing and risk analysis - http://opensourcerisk.org

 ORE is free software: you can redistribute it and/or modify it
 under the terms of the Modified BSD License.  You should have received a
 copy of the license along with this program.
 The license is also available online at <http://opensourcerisk.org>

 This program is distributed on the basis that it will form a useful
 contribution to risk analytics and model standardisation, but WITHOUT
 ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or
 FITNESS FOR A PARTICULAR PURPOSE. See the license for more details.
*/

/*! \file mle/math/parabolicminimumbracketer.hpp
    \brief minimum bracketing by parabolic extrapolation
    \ingroup math
*/

#pragma once

#include <mle/math/minimumbracketer.hpp>

namespace MathExt {

//! Minimum bracketer based on parabolic extrapolation
/*! The search starts downhill from the two given points and steps outward. Each new
    probe is the extremum of the parabola through the last three points, limited to
    maxMagnification times the last step. If the parabolic step is useless a default
    step of growthFactor times the last step is taken.

    If the two lowest points found have equal values, their midpoint is probed once. A
    function that is flat there is not bracketed.

    The search stops after maxIterations outward steps, in which case the result is
    NotBracketed.

    Reference: W. H. Press et al., Numerical Recipes, section 10.1

    \ingroup math
*/
class ParabolicMinimumBracketer : public MinimumBracketer {
public:
    explicit ParabolicMinimumBracketer(Size maxIterations = 100, Real maxMagnification = 100.0,
                                       Real growthFactor = GOLDEN);

    BracketingResult bracket(const ScalarFunction& f, Real lower, Real upper) const override;

    Size maxIterations() const { return maxIterations_; }
    Real maxMagnification() const { return maxMagnification_; }
    Real growthFactor() const { return growthFactor_; }

private:
    Size maxIterations_;
    Real maxMagnification_, growthFactor_;
};

} // namespace MathExt
