/*
 * Copyright (c) 2016 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Immutable compiled state of a matcher shared by the scans running on it
/// \file "matchSnapshot.hpp"
#ifndef _TOKMATCH_MATCH_SNAPSHOT_HPP_INCLUDED
#define _TOKMATCH_MATCH_SNAPSHOT_HPP_INCLUDED
#include "tokmatch/matchRecord.hpp"
#include "utils.hpp"
#include <vector>
#include <map>

namespace strus
{
/// \brief Forward declaration
class ErrorBufferInterface;
/// \brief Forward declaration
class DebugTraceContextInterface;
}

namespace tokmatch
{

/// \brief Forward declaration
class TokenSequenceInterface;
/// \brief Forward declaration
class TokenMatcherInterface;
/// \brief Forward declaration
class MatchCallbackInterface;

typedef utils::SharedPtr<MatchCallbackInterface> MatchCallbackRef;

/// \brief Immutable compiled state of a matcher shared by the scans running on it
/// \note A new snapshot is built for every change of the registrations
class MatchSnapshot
{
public:
	MatchSnapshot()
		:m_callbacks(){}
	virtual ~MatchSnapshot(){}

	/// \brief Append the matches found in a token sequence to a list
	/// \note Throws on error
	virtual void match( std::vector<MatchRecord>& result, const TokenSequenceInterface& seq, strus::DebugTraceContextInterface* debugtrace) const=0;

	void defineCallback( uint32_t patternid, const MatchCallbackRef& callback);
	/// \brief Get the callback of a pattern identifier or NULL if it has none
	MatchCallbackInterface* callback( uint32_t patternid) const;

	/// \brief Call the callbacks for a list of matches in the order of the list
	/// \return false if a callback failed (error reported), the rest of the list is then skipped
	bool dispatch(
			const TokenMatcherInterface& matcher,
			TokenSequenceInterface& seq,
			const std::vector<MatchRecord>& matches,
			strus::ErrorBufferInterface* errorhnd,
			strus::DebugTraceContextInterface* debugtrace) const;

private:
	MatchSnapshot( const MatchSnapshot&){}		///> non copyable
	void operator=( const MatchSnapshot&){}		///> non copyable

private:
	typedef std::map<uint32_t,MatchCallbackRef> CallbackMap;
	CallbackMap m_callbacks;
};

typedef utils::SharedPtr<const MatchSnapshot> MatchSnapshotRef;

}//namespace
#endif

