/*
 * Copyright (c) 2016 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Interface for iterating on the results of scanning a source of token sequences
/// \file "scanStreamInterface.hpp"
#ifndef _TOKMATCH_SCAN_STREAM_INTERFACE_HPP_INCLUDED
#define _TOKMATCH_SCAN_STREAM_INTERFACE_HPP_INCLUDED
#include "tokmatch/matchRecord.hpp"
#include <vector>

namespace tokmatch
{

/// \brief Forward declaration
class TokenSequenceInterface;

/// \brief Interface for iterating on the results of scanning a source of token sequences
/// \note The results are delivered in the order the sequences were fetched from the source
class ScanStreamInterface
{
public:
	/// \brief Destructor
	virtual ~ScanStreamInterface(){}

	/// \brief Get the next sequence with its matches (callbacks already called)
	/// \param[out] seq the sequence scanned (ownership passed)
	/// \param[out] matches the matches found in 'seq'
	/// \return true on success, false at the end of the source or on error
	/// \note A failing callback or a failed batch also ends with false. Only the error buffer (hasError) distinguishes this from the end of the source.
	virtual bool next( TokenSequenceInterface*& seq, std::vector<MatchRecord>& matches)=0;
};

}//namespace
#endif

