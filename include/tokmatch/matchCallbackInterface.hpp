/*
 * Copyright (c) 2016 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Interface for a function called for the matches of a pattern
/// \file "matchCallbackInterface.hpp"
#ifndef _TOKMATCH_MATCH_CALLBACK_INTERFACE_HPP_INCLUDED
#define _TOKMATCH_MATCH_CALLBACK_INTERFACE_HPP_INCLUDED
#include "tokmatch/matchRecord.hpp"
#include <vector>
#include <cstddef>

namespace tokmatch
{

/// \brief Forward declaration
class TokenMatcherInterface;
/// \brief Forward declaration
class TokenSequenceInterface;

/// \brief Interface for a function called for the matches of a pattern
class MatchCallbackInterface
{
public:
	/// \brief Destructor
	virtual ~MatchCallbackInterface(){}

	/// \brief Called for one match of the pattern the callback is registered for
	/// \param[in] matcher the matcher that found the match
	/// \param[in,out] seq the token sequence matched, the callback may modify it
	/// \param[in] idx index of the match in 'matches'
	/// \param[in] matches the complete list of matches found in 'seq'
	/// \note The positions in 'matches' refer to 'seq' as it was before the dispatch of the callbacks started
	/// \note Exceptions thrown abort the dispatch of the remaining callbacks
	virtual void call(
			const TokenMatcherInterface& matcher,
			TokenSequenceInterface& seq,
			std::size_t idx,
			const std::vector<MatchRecord>& matches)=0;
};

}//namespace
#endif

