/*
 * Copyright (c) 2016 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Structure describing a match of a pattern in a token sequence
/// \file "matchRecord.hpp"
#ifndef _TOKMATCH_MATCH_RECORD_HPP_INCLUDED
#define _TOKMATCH_MATCH_RECORD_HPP_INCLUDED
#include "strus/base/stdint.h"
#include <cstddef>

namespace tokmatch
{

/// \brief Structure describing a match of a pattern in a token sequence
class MatchRecord
{
public:
	/// \brief Constructor
	MatchRecord( uint32_t patternid_, const char* name_, std::size_t start_, std::size_t end_)
		:m_patternid(patternid_),m_name(name_),m_start(start_),m_end(end_){}
	/// \brief Copy constructor
	MatchRecord( const MatchRecord& o)
		:m_patternid(o.m_patternid),m_name(o.m_name),m_start(o.m_start),m_end(o.m_end){}
	/// \brief Destructor
	~MatchRecord(){}

	/// \brief Handle of the pattern identifier, assigned in the order of the first registration of the identifier
	uint32_t patternid() const		{return m_patternid;}
	/// \brief Name of the pattern identifier
	/// \note The pointer is valid for the lifetime of the matcher that created the record
	const char* name() const		{return m_name;}
	/// \brief Position of the first token of the match
	std::size_t start() const		{return m_start;}
	/// \brief Position after the last token of the match
	std::size_t end() const			{return m_end;}

	bool operator==( const MatchRecord& o) const
	{
		return m_patternid == o.m_patternid && m_start == o.m_start && m_end == o.m_end;
	}
	bool operator!=( const MatchRecord& o) const
	{
		return !operator==( o);
	}

private:
	uint32_t m_patternid;
	const char* m_name;
	std::size_t m_start;
	std::size_t m_end;
};

}//namespace
#endif

