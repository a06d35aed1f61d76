/*
 * Copyright (c) 2016 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include "matchSnapshot.hpp"
#include "tokmatch/matchCallbackInterface.hpp"
#include "tokmatch/tokenSequenceInterface.hpp"
#include "internationalization.hpp"
#include "strus/errorBufferInterface.hpp"
#include "strus/errorCodes.hpp"
#include "strus/debugTraceInterface.hpp"

using namespace tokmatch;

#define DEBUG_EVENT3( NAME, FMT, X1, X2, X3)	if (debugtrace) debugtrace->event( NAME, FMT, X1, X2, X3);

void MatchSnapshot::defineCallback( uint32_t patternid, const MatchCallbackRef& callback)
{
	m_callbacks[ patternid] = callback;
}

MatchCallbackInterface* MatchSnapshot::callback( uint32_t patternid) const
{
	CallbackMap::const_iterator ci = m_callbacks.find( patternid);
	return ci == m_callbacks.end() ? 0 : ci->second.get();
}

bool MatchSnapshot::dispatch(
		const TokenMatcherInterface& matcher,
		TokenSequenceInterface& seq,
		const std::vector<MatchRecord>& matches,
		strus::ErrorBufferInterface* errorhnd,
		strus::DebugTraceContextInterface* debugtrace) const
{
	if (m_callbacks.empty()) return true;
	std::size_t idx = 0;
	std::vector<MatchRecord>::const_iterator mi = matches.begin(), me = matches.end();
	for (; mi != me; ++mi,++idx)
	{
		MatchCallbackInterface* cb = callback( mi->patternid());
		if (!cb) continue;
		DEBUG_EVENT3( "callback", "name=%s start=%u end=%u", mi->name(), (unsigned int)mi->start(), (unsigned int)mi->end())
		try
		{
			cb->call( matcher, seq, idx, matches);
		}
		catch (const std::bad_alloc&)
		{
			errorhnd->report( strus::ErrorCodeOutOfMem, _TXT("out of memory in callback of pattern '%s'"), mi->name());
			return false;
		}
		catch (const std::exception& err)
		{
			errorhnd->report( strus::ErrorCodeRuntimeError, _TXT("callback of pattern '%s' failed at match %u: %s"), mi->name(), (unsigned int)idx, err.what());
			return false;
		}
	}
	return true;
}

