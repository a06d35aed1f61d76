/*
 * Copyright (c) 2016 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Map of strings to identifiers with stable storage of the strings
/// \file "symbolTable.hpp"
#ifndef _TOKMATCH_SYMBOL_TABLE_HPP_INCLUDED
#define _TOKMATCH_SYMBOL_TABLE_HPP_INCLUDED
#include "strus/base/crc32.hpp"
#include "strus/base/stdint.h"
#include <boost/unordered_map.hpp>
#include <list>
#include <vector>
#include <string>
#include <cstring>

namespace tokmatch
{

/// \brief Block of memory the strings of a symbol table are allocated in
class StringKeyBlock
{
public:
	enum {DefaultSize = 16300};

public:
	explicit StringKeyBlock( std::size_t blksize_=DefaultSize);
	StringKeyBlock( const StringKeyBlock& o);
	~StringKeyBlock();

	const char* allocKey( const char* key, std::size_t keylen);

private:
	void operator=( const StringKeyBlock&){}	///> non copyable

private:
	char* m_blk;
	std::size_t m_blksize;
	std::size_t m_blkpos;
};

/// \brief List of blocks of memory the strings of a symbol table are allocated in
/// \note Strings once allocated never move
class StringKeyBlockList
{
public:
	StringKeyBlockList(){}

	const char* allocKey( const char* key, std::size_t keylen);
	void clear();

private:
	std::list<StringKeyBlock> m_ar;
};

/// \brief Map of strings to identifiers counted from 1 in the order of their insertion
class SymbolTable
{
private:
	struct Key
	{
		const char* str;
		std::size_t len;

		Key()
			:str(0),len(0){}
		Key( const char* str_, std::size_t len_)
			:str(str_),len(len_){}
		Key( const Key& o)
			:str(o.str),len(o.len){}
	};
	struct MapKeyEqual
	{
		bool operator()( const Key& a, const Key& b) const
		{
			return a.len == b.len && std::memcmp( a.str, b.str, a.len) == 0;
		}
	};
	struct HashFunc{
		std::size_t operator()( const Key& key)const
		{
			return strus::utils::Crc32::calc( key.str, key.len);
		}
	};

	typedef boost::unordered_map<Key,uint32_t,HashFunc,MapKeyEqual> Map;

public:
	SymbolTable(){}

	uint32_t getOrCreate( const std::string& key);
	uint32_t get( const std::string& key) const;

	/// \brief Get the string of an identifier
	/// \return the string or NULL if not defined
	const char* key( uint32_t value) const;

	std::size_t size() const
	{
		return m_invmap.size();
	}

private:
	SymbolTable( const SymbolTable&){}	///> non copyable
	void operator=( const SymbolTable&){}	///> non copyable

private:
	Map m_map;
	std::vector<const char*> m_invmap;
	StringKeyBlockList m_keystring_blocks;
};

}//namespace
#endif

