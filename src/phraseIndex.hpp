/*
 * Copyright (c) 2016 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Index matching fixed multi token phrases
/// \file "phraseIndex.hpp"
#ifndef _TOKMATCH_PHRASE_INDEX_HPP_INCLUDED
#define _TOKMATCH_PHRASE_INDEX_HPP_INCLUDED
#include "tokmatch/phraseIndexInterface.hpp"
#include "tokenMatcherImpl.hpp"
#include "phraseTrie.hpp"
#include <map>

namespace tokmatch
{

/// \brief Forward declaration
class VocabularyInterface;

/// \brief Index matching fixed multi token phrases
class PhraseIndex
	:public TokenMatcherImpl<PhraseIndexInterface>
{
public:
	/// \note Throws configuration_error if the key attribute is not symbolic
	PhraseIndex( VocabularyInterface* vocabulary_, AttributeKey keyAttribute_, strus::ErrorBufferInterface* errorhnd_);
	virtual ~PhraseIndex(){}

	virtual AttributeKey keyAttribute() const
	{
		return m_keyAttribute;
	}

	virtual bool definePhrases( const std::string& name, MatchCallbackInterface* callback, const std::vector<std::vector<std::string> >& phrases);
	virtual bool definePhraseSequences( const std::string& name, MatchCallbackInterface* callback, const std::vector<const TokenSequenceInterface*>& phrases);
	virtual bool removePhrases( const std::string& name);

	virtual MatchStatistics getStatistics() const;

private:
	typedef std::vector<std::vector<uint32_t> > PhraseList;
	struct Registration
	{
		PhraseList phrases;
		MatchCallbackRef callback;

		Registration()
			:phrases(),callback(){}
		Registration( const PhraseList& phrases_, const MatchCallbackRef& callback_)
			:phrases(phrases_),callback(callback_){}
		Registration( const Registration& o)
			:phrases(o.phrases),callback(o.callback){}
	};
	typedef std::map<uint32_t,Registration> RegistrationMap;

	void defineKeyPhrases( const std::string& name, const MatchCallbackRef& callback, const PhraseList& phrases);
	PhraseProgram* buildProgram( const RegistrationMap& registrations) const;

private:
	VocabularyInterface* m_vocabulary;
	AttributeKey m_keyAttribute;
	RegistrationMap m_registrations;
};

}//namespace
#endif

