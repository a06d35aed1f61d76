/*
 * Copyright (c) 2016 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Trie of phrases of token keys and the program matching it
/// \file "phraseTrie.hpp"
#ifndef _TOKMATCH_PHRASE_TRIE_HPP_INCLUDED
#define _TOKMATCH_PHRASE_TRIE_HPP_INCLUDED
#include "tokmatch/attributeKey.hpp"
#include "matchSnapshot.hpp"
#include <boost/unordered_map.hpp>
#include <vector>

namespace tokmatch
{

/// \brief Phrase ending in a node of the trie
struct PhraseTerminal
{
	uint32_t patternid;
	const char* name;
	uint32_t phraseidx;		///< index of the phrase in the order of definition

	PhraseTerminal( uint32_t patternid_, const char* name_, uint32_t phraseidx_)
		:patternid(patternid_),name(name_),phraseidx(phraseidx_){}
	PhraseTerminal( const PhraseTerminal& o)
		:patternid(o.patternid),name(o.name),phraseidx(o.phraseidx){}
};

/// \brief Trie of phrases of token keys
/// \note Node 0 is the root
class PhraseTrie
{
public:
	PhraseTrie()
		:m_terminals(1){}

	/// \brief Insert a path of keys and get its end node
	uint32_t insert( const std::vector<uint32_t>& keys);
	/// \brief Get the child of a node reached with a key or 0 if there is none
	uint32_t child( uint32_t node, uint32_t key) const
	{
		EdgeMap::const_iterator ei = m_edges.find( edgeKey( node, key));
		return ei == m_edges.end() ? 0 : ei->second;
	}

	void addTerminal( uint32_t node, const PhraseTerminal& terminal)
	{
		m_terminals[ node].push_back( terminal);
	}
	const std::vector<PhraseTerminal>& terminals( uint32_t node) const
	{
		return m_terminals[ node];
	}

	std::size_t nofNodes() const
	{
		return m_terminals.size();
	}

private:
	static uint64_t edgeKey( uint32_t node, uint32_t key)
	{
		return ((uint64_t)node << 32) | key;
	}

private:
	typedef boost::unordered_map<uint64_t,uint32_t> EdgeMap;
	EdgeMap m_edges;
	std::vector<std::vector<PhraseTerminal> > m_terminals;
};

/// \brief Immutable program matching all phrases registered in a phrase index
class PhraseProgram
	:public MatchSnapshot
{
public:
	explicit PhraseProgram( AttributeKey keyAttribute_)
		:m_keyAttribute(keyAttribute_),m_trie(),m_nofPhrases(0),m_nofPatternIds(0){}
	virtual ~PhraseProgram(){}

	/// \brief Add the phrases of a registration
	/// \note Registrations have to be added in ascending order of their pattern identifier handles
	void definePhrases( uint32_t patternid, const char* name, const std::vector<std::vector<uint32_t> >& phrases);

	virtual void match( std::vector<MatchRecord>& result, const TokenSequenceInterface& seq, strus::DebugTraceContextInterface* debugtrace) const;

	std::size_t nofPhrases() const		{return m_nofPhrases;}
	std::size_t nofNodes() const		{return m_trie.nofNodes();}
	unsigned int nofPatternIds() const	{return m_nofPatternIds;}

private:
	AttributeKey m_keyAttribute;
	PhraseTrie m_trie;
	std::size_t m_nofPhrases;
	unsigned int m_nofPatternIds;
};

}//namespace
#endif

