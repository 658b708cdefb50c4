////////////////////////////////////////////////////////////////////////////////
/// psi::rangeset - discontiguous selections of sequence positions and the
/// in-place algorithms operating on them
///
/// Copyright (c) Domagoj Saric.
///
/// Use, modification and distribution is subject to the
/// Boost Software License, Version 1.0.
/// (See accompanying file LICENSE_1_0.txt or copy at
/// http://www.boost.org/LICENSE_1_0.txt)
///
/// For more information, see http://www.boost.org
///
////////////////////////////////////////////////////////////////////////////////
//------------------------------------------------------------------------------
#pragma once

#include <psi/rangeset/batch_edit.hpp>
#include <psi/rangeset/indexing_view.hpp>
#include <psi/rangeset/partition.hpp>
#include <psi/rangeset/range.hpp>
#include <psi/rangeset/range_set.hpp>
#include <psi/rangeset/rotate.hpp>
#include <psi/rangeset/sequence_traits.hpp>
//------------------------------------------------------------------------------
