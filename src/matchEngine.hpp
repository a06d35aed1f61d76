/*
 * Copyright (c) 2016 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Engine matching patterns of token constraints with quantifiers
/// \file "matchEngine.hpp"
#ifndef _TOKMATCH_MATCH_ENGINE_HPP_INCLUDED
#define _TOKMATCH_MATCH_ENGINE_HPP_INCLUDED
#include "tokmatch/matchEngineInterface.hpp"
#include "tokenMatcherImpl.hpp"
#include "matchAutomaton.hpp"
#include <map>

namespace tokmatch
{

/// \brief Forward declaration
class VocabularyInterface;

/// \brief Engine matching patterns of token constraints with quantifiers
class MatchEngine
	:public TokenMatcherImpl<MatchEngineInterface>
{
public:
	MatchEngine( const VocabularyInterface* vocabulary_, strus::ErrorBufferInterface* errorhnd_);
	virtual ~MatchEngine(){}

	virtual bool definePatterns( const std::string& name, MatchCallbackInterface* callback, const std::vector<Pattern>& patterns);
	virtual bool removePatterns( const std::string& name);

	virtual MatchStatistics getStatistics() const;

private:
	struct Registration
	{
		std::vector<Pattern> patterns;
		MatchCallbackRef callback;

		Registration()
			:patterns(),callback(){}
		Registration( const std::vector<Pattern>& patterns_, const MatchCallbackRef& callback_)
			:patterns(patterns_),callback(callback_){}
		Registration( const Registration& o)
			:patterns(o.patterns),callback(o.callback){}
	};
	typedef std::map<uint32_t,Registration> RegistrationMap;

	/// \brief Compile a program from a map of registrations
	/// \note Call with the lock held
	MatchProgram* buildProgram( const RegistrationMap& registrations) const;

private:
	const VocabularyInterface* m_vocabulary;
	RegistrationMap m_registrations;
};

}//namespace
#endif

