/*
 * Copyright (c) 2016 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include "symbolTable.hpp"
#include "internationalization.hpp"
#include <cstdlib>
#include <limits>
#include <new>

using namespace tokmatch;

StringKeyBlock::StringKeyBlock( std::size_t blksize_)
	:m_blk((char*)std::calloc(blksize_,1)),m_blksize(blksize_),m_blkpos(0)
{
	if (!m_blk) throw std::bad_alloc();
}

StringKeyBlock::StringKeyBlock( const StringKeyBlock& o)
	:m_blk((char*)std::malloc(o.m_blksize)),m_blksize(o.m_blksize),m_blkpos(o.m_blkpos)
{
	if (!m_blk) throw std::bad_alloc();
	std::memcpy( m_blk, o.m_blk, o.m_blksize);
}

StringKeyBlock::~StringKeyBlock()
{
	std::free( m_blk);
}

const char* StringKeyBlock::allocKey( const char* key, std::size_t keylen)
{
	const char* rt = m_blk + m_blkpos;
	if (keylen >= m_blksize || keylen + m_blkpos + 1 > m_blksize) return 0;
	std::memcpy( m_blk + m_blkpos, key, keylen);
	m_blk[ m_blkpos + keylen] = 0;
	m_blkpos += keylen+1;
	return rt;
}

const char* StringKeyBlockList::allocKey( const char* key, std::size_t keylen)
{
	const char* rt = m_ar.empty() ? 0 : m_ar.back().allocKey( key, keylen);
	if (!rt)
	{
		if (keylen >= StringKeyBlock::DefaultSize)
		{
			m_ar.push_front( StringKeyBlock( keylen+1));
			rt = m_ar.front().allocKey( key, keylen);
		}
		else
		{
			m_ar.push_back( StringKeyBlock());
			rt = m_ar.back().allocKey( key, keylen);
		}
	}
	if (!rt) throw std::bad_alloc();
	return rt;
}

void StringKeyBlockList::clear()
{
	m_ar.clear();
}

uint32_t SymbolTable::getOrCreate( const std::string& key)
{
	Map::const_iterator itr = m_map.find( Key( key.c_str(), key.size()));
	if (itr == m_map.end())
	{
		if (m_invmap.size() >= (std::size_t)std::numeric_limits<int32_t>::max()-1)
		{
			throw std::bad_alloc();
		}
		const char* keystr = m_keystring_blocks.allocKey( key.c_str(), key.size());
		m_invmap.push_back( keystr);
		uint32_t rt = m_invmap.size();
		m_map[ Key( keystr, key.size())] = rt;
		return rt;
	}
	else
	{
		return itr->second;
	}
}

uint32_t SymbolTable::get( const std::string& key) const
{
	Map::const_iterator itr = m_map.find( Key( key.c_str(), key.size()));
	if (itr != m_map.end())
	{
		return itr->second;
	}
	return 0;
}

const char* SymbolTable::key( uint32_t value) const
{
	if (!value || value > (uint32_t)m_invmap.size()) return 0;
	return m_invmap[ value-1];
}

