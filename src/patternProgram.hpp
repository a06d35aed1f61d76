/*
 * Copyright (c) 2016 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Loader of pattern definitions from source text
/// \file "patternProgram.hpp"
#ifndef _TOKMATCH_PATTERN_PROGRAM_HPP_INCLUDED
#define _TOKMATCH_PATTERN_PROGRAM_HPP_INCLUDED
#include "tokmatch/patternProgramInterface.hpp"
#include <vector>
#include <map>
#include <string>

namespace strus
{
/// \brief Forward declaration
class ErrorBufferInterface;
}

namespace tokmatch
{

/// \brief Forward declaration
class MatchEngineInterface;
/// \brief Forward declaration
class VocabularyInterface;

/// \brief Loader of pattern definitions from source text
/// \note A callback bound to a name is passed to the engine with the first registration of that name
class PatternProgram
	:public PatternProgramInterface
{
public:
	PatternProgram( MatchEngineInterface* engine_, VocabularyInterface* vocabulary_, strus::ErrorBufferInterface* errorhnd_)
		:m_errorhnd(errorhnd_),m_engine(engine_),m_vocabulary(vocabulary_){}
	virtual ~PatternProgram();

	virtual bool defineCallback( const std::string& name, MatchCallbackInterface* callback);
	virtual bool load( const std::string& source);
	virtual bool parsePattern( const std::string& source, Pattern& result) const;

private:
	struct Rule
	{
		std::string name;
		std::vector<Pattern> patterns;

		explicit Rule( const std::string& name_)
			:name(name_),patterns(){}
		Rule( const Rule& o)
			:name(o.name),patterns(o.patterns){}
	};

	void loadRules( char const*& src, std::vector<Rule>& rules) const;
	Pattern parsePatternLiteral( char const*& src) const;
	TokenConstraintSet parseConstraintSet( char const*& src) const;
	std::string parseKey( char const*& src) const;
	void parseConstraint( char const*& src, const std::string& key, TokenConstraintSet& result) const;
	AttributeValue parseBoolean( char const*& src, const std::string& key) const;

	void reportError( const std::string& source, const char* errpos, const char* msg) const;

	PatternProgram( const PatternProgram&){}	///> non copyable
	void operator=( const PatternProgram&){}	///> non copyable

private:
	strus::ErrorBufferInterface* m_errorhnd;
	MatchEngineInterface* m_engine;
	VocabularyInterface* m_vocabulary;
	typedef std::map<std::string,MatchCallbackInterface*> CallbackMap;
	CallbackMap m_callbacks;
};

}//namespace
#endif

