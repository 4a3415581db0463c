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

/*! \file mle/math/goldensectionminimizer1d.hpp
    \brief golden section search for a local minimum of a scalar function
    \ingroup math
*/

#pragma once

#include <mle/math/minimumbracketer.hpp>
#include <mle/math/scalarminimizer.hpp>

#include <ql/shared_ptr.hpp>

#include <ostream>
#include <string>

namespace MathExt {

//! outcome of a golden section search
struct MinimizationResult {
    enum class Status { Converged, BracketingFailed, MaxIterationsExceeded };

    Status status;
    //! abscissa of the minimum, the best point seen if the search did not converge
    Real xMin;
    //! function value at xMin
    Real fMin;
    //! number of golden section steps
    Size iterations;
    //! number of function evaluations, including the bracketing search
    Size evaluations;
    //! reason of a failed search, empty otherwise
    std::string message;

    bool converged() const { return status == Status::Converged; }
};

std::ostream& operator<<(std::ostream& out, MinimizationResult::Status status);

//! Golden section minimizer
/*! The bracketer supplies a triplet around a local minimum, which is then shrunk by
    golden section steps, each costing one function evaluation. The search stops when
    the width of the interval is at most accuracy * (|x1| + |x2|), x1 and x2 being the
    two interior points.

    With a valid bracket the search always converges, hence running out of iterations
    is reported as an error of the search itself, not of its input.

    Reference: W. H. Press et al., Numerical Recipes, section 10.2

    \ingroup math
*/
class GoldenSectionMinimizer1D : public ScalarMinimizer {
public:
    //! (sqrt(5) - 1) / 2
    static const Real GOLDEN;

    explicit GoldenSectionMinimizer1D(const QuantLib::ext::shared_ptr<MinimumBracketer>& bracketer = nullptr,
                                      Real accuracy = 1.0e-12, Size maxIterations = 10000);

    //! not supported, the search needs a lower and an upper bound
    Real minimize(const ScalarFunction& f, Real startPosition) const override;
    //! the start position is ignored
    Real minimize(const ScalarFunction& f, Real startPosition, Real lower, Real upper) const override;
    //! the abscissa of a local minimum, throws if the search does not converge
    Real minimize(const ScalarFunction& f, Real lower, Real upper) const;

    //! runs the search and reports its outcome, only invalid inputs throw
    MinimizationResult search(const ScalarFunction& f, Real lower, Real upper) const;

    const QuantLib::ext::shared_ptr<MinimumBracketer>& bracketer() const { return bracketer_; }
    Real accuracy() const { return accuracy_; }
    Size maxIterations() const { return maxIterations_; }

private:
    QuantLib::ext::shared_ptr<MinimumBracketer> bracketer_;
    Real accuracy_;
    Size maxIterations_;
};

} // namespace MathExt
