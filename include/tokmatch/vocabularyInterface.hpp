/*
 * Copyright (c) 2016 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Interface for the shared vocabulary (string store and flag table)
/// \file "vocabularyInterface.hpp"
#ifndef _TOKMATCH_VOCABULARY_INTERFACE_HPP_INCLUDED
#define _TOKMATCH_VOCABULARY_INTERFACE_HPP_INCLUDED
#include "strus/base/stdint.h"
#include <string>

namespace tokmatch
{

/// \brief Forward declaration
class TokenFlagPredicateInterface;

/// \brief Interface for the vocabulary shared by the token sequences and the matchers
/// \note The vocabulary is append only: symbol and flag identifiers stay valid for its whole lifetime
/// \remark All methods are thread safe
class VocabularyInterface
{
public:
	/// \brief Destructor
	virtual ~VocabularyInterface(){}

	/// \brief Get the symbol identifier of a string, create it if it does not exist yet
	/// \param[in] str string to map
	/// \return the symbol identifier (> 0) or 0 on error
	virtual uint32_t getOrCreateSymbol( const std::string& str)=0;

	/// \brief Get the symbol identifier of a string
	/// \param[in] str string to map
	/// \return the symbol identifier or 0 if not defined
	virtual uint32_t getSymbol( const std::string& str) const=0;

	/// \brief Get the string of a symbol identifier
	/// \param[in] symid symbol identifier
	/// \return the string or NULL if not defined
	virtual const char* symbolName( uint32_t symid) const=0;

	/// \brief Register a custom boolean token attribute
	/// \param[in] name name of the flag for referencing it in pattern literals (may be empty)
	/// \param[in] predicate function evaluating the flag (ownership passed)
	/// \return the flag identifier (> 0) or 0 on error
	virtual unsigned int addFlag( const std::string& name, TokenFlagPredicateInterface* predicate)=0;

	/// \brief Get the identifier of a flag by name
	/// \return the flag identifier or 0 if not defined
	virtual unsigned int getFlagId( const std::string& name) const=0;

	/// \brief Get the predicate of a flag
	/// \return the predicate or NULL if not defined
	virtual const TokenFlagPredicateInterface* getFlag( unsigned int flagid) const=0;

	/// \brief Get the number of flags registered
	virtual unsigned int nofFlags() const=0;
};

}//namespace
#endif

