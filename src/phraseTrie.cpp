/*
 * Copyright (c) 2016 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Trie of phrases of token keys and the program matching it
/// \file "phraseTrie.cpp"
#include "phraseTrie.hpp"
#include "tokmatch/tokenSequenceInterface.hpp"
#include "errorUtils.hpp"
#include "internationalization.hpp"
#include "strus/debugTraceInterface.hpp"
#include <algorithm>
#include <limits>

using namespace tokmatch;

#define DEBUG_OPEN( NAME) if (debugtrace) debugtrace->open( NAME);
#define DEBUG_CLOSE() if (debugtrace) debugtrace->close();
#define DEBUG_EVENT3( NAME, FMT, X1, X2, X3)	if (debugtrace) debugtrace->event( NAME, FMT, X1, X2, X3);

uint32_t PhraseTrie::insert( const std::vector<uint32_t>& keys)
{
	uint32_t node = 0;
	std::vector<uint32_t>::const_iterator ki = keys.begin(), ke = keys.end();
	for (; ki != ke; ++ki)
	{
		EdgeMap::const_iterator ei = m_edges.find( edgeKey( node, *ki));
		if (ei == m_edges.end())
		{
			if (m_terminals.size() >= (std::size_t)std::numeric_limits<int32_t>::max())
			{
				throw std::bad_alloc();
			}
			uint32_t newnode = m_terminals.size();
			m_terminals.push_back( std::vector<PhraseTerminal>());
			m_edges[ edgeKey( node, *ki)] = newnode;
			node = newnode;
		}
		else
		{
			node = ei->second;
		}
	}
	return node;
}

void PhraseProgram::definePhrases( uint32_t patternid, const char* name, const std::vector<std::vector<uint32_t> >& phrases)
{
	if (phrases.empty())
	{
		throw configuration_error( string_format( _TXT("empty list of phrases for '%s'"), name));
	}
	std::vector<std::vector<uint32_t> >::const_iterator pi = phrases.begin(), pe = phrases.end();
	for (; pi != pe; ++pi)
	{
		if (pi->empty())
		{
			throw configuration_error( string_format( _TXT("empty phrase %u for '%s'"), (unsigned int)(pi - phrases.begin()), name));
		}
		uint32_t node = m_trie.insert( *pi);
		m_trie.addTerminal( node, PhraseTerminal( patternid, name, m_nofPhrases++));
	}
	++m_nofPatternIds;
}

struct PhraseMatch
{
	const PhraseTerminal* terminal;
	std::size_t end;

	PhraseMatch( const PhraseTerminal* terminal_, std::size_t end_)
		:terminal(terminal_),end(end_){}
	PhraseMatch( const PhraseMatch& o)
		:terminal(o.terminal),end(o.end){}

	bool operator<( const PhraseMatch& o) const
	{
		if (terminal->phraseidx == o.terminal->phraseidx) return end < o.end;
		return terminal->phraseidx < o.terminal->phraseidx;
	}
};

void PhraseProgram::match( std::vector<MatchRecord>& result, const TokenSequenceInterface& seq, strus::DebugTraceContextInterface* debugtrace) const
{
	DEBUG_OPEN( "phrases")
	std::vector<PhraseMatch> matches;
	std::size_t nofTokens = seq.size();
	for (std::size_t startpos = 0; startpos < nofTokens; ++startpos)
	{
		uint32_t node = 0;
		for (std::size_t pos = startpos; pos < nofTokens; ++pos)
		{
			AttributeValue key;
			if (!seq.getAttribute( pos, m_keyAttribute, key)) break;
			node = m_trie.child( node, key);
			if (!node) break;

			const std::vector<PhraseTerminal>& terminals = m_trie.terminals( node);
			std::vector<PhraseTerminal>::const_iterator ti = terminals.begin(), te = terminals.end();
			for (; ti != te; ++ti)
			{
				matches.push_back( PhraseMatch( &*ti, pos+1));
			}
		}
		if (matches.empty()) continue;

		std::sort( matches.begin(), matches.end());
		std::vector<PhraseMatch>::const_iterator mi = matches.begin(), me = matches.end();
		for (; mi != me; ++mi)
		{
			result.push_back( MatchRecord( mi->terminal->patternid, mi->terminal->name, startpos, mi->end));
			DEBUG_EVENT3( "match", "name=%s start=%u end=%u", mi->terminal->name, (unsigned int)startpos, (unsigned int)mi->end)
		}
		matches.clear();
	}
	DEBUG_CLOSE()
}

