/*
 * Copyright (c) 2016 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Standard implementation of the vocabulary shared by token sequences and matchers
/// \file "vocabulary.hpp"
#ifndef _TOKMATCH_VOCABULARY_HPP_INCLUDED
#define _TOKMATCH_VOCABULARY_HPP_INCLUDED
#include "tokmatch/vocabularyInterface.hpp"
#include "symbolTable.hpp"
#include "utils.hpp"
#include <vector>
#include <string>

namespace strus
{
/// \brief Forward declaration
class ErrorBufferInterface;
}

namespace tokmatch
{

/// \brief Standard implementation of the vocabulary shared by token sequences and matchers
class Vocabulary
	:public VocabularyInterface
{
public:
	explicit Vocabulary( strus::ErrorBufferInterface* errorhnd_)
		:m_errorhnd(errorhnd_){}
	virtual ~Vocabulary();

	virtual uint32_t getOrCreateSymbol( const std::string& str);
	virtual uint32_t getSymbol( const std::string& str) const;
	virtual const char* symbolName( uint32_t symid) const;

	virtual unsigned int addFlag( const std::string& name, TokenFlagPredicateInterface* predicate);
	virtual unsigned int getFlagId( const std::string& name) const;
	virtual const TokenFlagPredicateInterface* getFlag( unsigned int flagid) const;
	virtual unsigned int nofFlags() const;

private:
	Vocabulary( const Vocabulary&){}	///> non copyable
	void operator=( const Vocabulary&){}	///> non copyable

private:
	strus::ErrorBufferInterface* m_errorhnd;
	mutable utils::SharedMutex m_mutex;
	SymbolTable m_symtab;
	SymbolTable m_flagnames;
	std::vector<unsigned int> m_flagnamemap;	///< flag name identifier -> flag identifier
	std::vector<TokenFlagPredicateInterface*> m_flags;
};

}//namespace
#endif

