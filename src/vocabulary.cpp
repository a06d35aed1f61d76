/*
 * Copyright (c) 2016 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include "vocabulary.hpp"
#include "tokmatch/tokenFlagPredicateInterface.hpp"
#include "errorUtils.hpp"
#include "internationalization.hpp"
#include "strus/errorBufferInterface.hpp"

using namespace tokmatch;

Vocabulary::~Vocabulary()
{
	std::vector<TokenFlagPredicateInterface*>::iterator fi = m_flags.begin(), fe = m_flags.end();
	for (; fi != fe; ++fi)
	{
		delete *fi;
	}
}

uint32_t Vocabulary::getOrCreateSymbol( const std::string& str)
{
	try
	{
		{
			utils::SharedLock lock( m_mutex);
			uint32_t rt = m_symtab.get( str);
			if (rt) return rt;
		}
		utils::UniqueLock lock( m_mutex);
		return m_symtab.getOrCreate( str);
	}
	CATCH_ERROR_MAP_RETURN( _TXT("failed to create vocabulary symbol: %s"), *m_errorhnd, 0);
}

uint32_t Vocabulary::getSymbol( const std::string& str) const
{
	utils::SharedLock lock( m_mutex);
	return m_symtab.get( str);
}

const char* Vocabulary::symbolName( uint32_t symid) const
{
	utils::SharedLock lock( m_mutex);
	return m_symtab.key( symid);
}

unsigned int Vocabulary::addFlag( const std::string& name, TokenFlagPredicateInterface* predicate)
{
	try
	{
		if (!predicate)
		{
			throw configuration_error( _TXT("no predicate defined"));
		}
		utils::UniqueLock lock( m_mutex);
		m_flags.reserve( m_flags.size()+1);
		if (!name.empty())
		{
			if (m_flagnames.get( name))
			{
				throw configuration_error( string_format( _TXT("duplicate definition of flag '%s'"), name.c_str()));
			}
			m_flagnamemap.reserve( m_flagnamemap.size()+1);
			uint32_t nameid = m_flagnames.getOrCreate( name);
			if (nameid != m_flagnamemap.size()+1)
			{
				throw tokmatch::logic_error( _TXT("corrupt flag name table"));
			}
			m_flagnamemap.push_back( m_flags.size()+1);
		}
		m_flags.push_back( predicate);
		return m_flags.size();
	}
	catch (const std::bad_alloc&)
	{
		m_errorhnd->report( strus::ErrorCodeOutOfMem, _TXT("memory allocation error"));
	}
	catch (const configuration_error& err)
	{
		m_errorhnd->report( strus::ErrorCodeInvalidArgument, _TXT("failed to add flag: %s"), err.what());
	}
	catch (const std::exception& err)
	{
		m_errorhnd->report( strus::ErrorCodeRuntimeError, _TXT("failed to add flag: %s"), err.what());
	}
	delete predicate;
	return 0;
}

unsigned int Vocabulary::getFlagId( const std::string& name) const
{
	utils::SharedLock lock( m_mutex);
	uint32_t nameid = m_flagnames.get( name);
	return nameid ? m_flagnamemap[ nameid-1] : 0;
}

const TokenFlagPredicateInterface* Vocabulary::getFlag( unsigned int flagid) const
{
	utils::SharedLock lock( m_mutex);
	if (!flagid || flagid > m_flags.size()) return 0;
	return m_flags[ flagid-1];
}

unsigned int Vocabulary::nofFlags() const
{
	utils::SharedLock lock( m_mutex);
	return m_flags.size();
}

