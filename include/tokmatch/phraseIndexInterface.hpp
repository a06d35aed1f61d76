/*
 * Copyright (c) 2016 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Interface of the index matching fixed multi token phrases
/// \file "phraseIndexInterface.hpp"
#ifndef _TOKMATCH_PHRASE_INDEX_INTERFACE_HPP_INCLUDED
#define _TOKMATCH_PHRASE_INDEX_INTERFACE_HPP_INCLUDED
#include "tokmatch/tokenMatcherInterface.hpp"
#include "tokmatch/attributeKey.hpp"
#include <vector>
#include <string>

namespace tokmatch
{

/// \brief Forward declaration
class MatchCallbackInterface;

/// \brief Interface of the index matching fixed multi token phrases
/// \note Tokens are compared by the value of the key attribute the index was created with
class PhraseIndexInterface
	:public TokenMatcherInterface
{
public:
	/// \brief Destructor
	virtual ~PhraseIndexInterface(){}

	/// \brief Get the attribute the tokens are compared with
	virtual AttributeKey keyAttribute() const=0;

	/// \brief Register a list of phrases given as key strings under a pattern identifier
	/// \param[in] name pattern identifier
	/// \param[in] callback function called for each match (ownership passed, may be NULL)
	/// \param[in] phrases list of phrases, each phrase a non empty list of key strings
	/// \return true on success, false on a configuration error (registration has no effect)
	virtual bool definePhrases( const std::string& name, MatchCallbackInterface* callback, const std::vector<std::vector<std::string> >& phrases)=0;

	/// \brief Register a list of phrases given as token sequences under a pattern identifier
	/// \param[in] name pattern identifier
	/// \param[in] callback function called for each match (ownership passed, may be NULL)
	/// \param[in] phrases list of non empty token sequences, the key attribute of their tokens is used
	/// \return true on success, false on a configuration error (registration has no effect)
	virtual bool definePhraseSequences( const std::string& name, MatchCallbackInterface* callback, const std::vector<const TokenSequenceInterface*>& phrases)=0;

	/// \brief Remove the registration of a pattern identifier
	/// \param[in] name pattern identifier
	/// \return true on success, false if not defined (error reported)
	virtual bool removePhrases( const std::string& name)=0;
};

}//namespace
#endif

