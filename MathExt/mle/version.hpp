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

/*! \file mle/version.hpp
    \brief Version
*/

#ifndef mathext_version_hpp
#define mathext_version_hpp

// Boost Version
// shared_mutex, posix_time and Boost.Test are used; any boost version above 1.65 should work.
#include <boost/version.hpp>
#if BOOST_VERSION < 106500
#error using an old version of Boost, please update.
#endif

// We require QuantLib 1.32 or higher (QuantLib::ext::shared_ptr and friends)
#include <ql/version.hpp>
#if QL_HEX_VERSION < 0x013200f0
#error using an old version of QuantLib, please update.
#endif

//! Version string
#define MATHEXT_VERSION "1.0.0"

//! Version number
#define MATHEXT_VERSION_NUM 1000000

#endif
