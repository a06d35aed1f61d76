/*
 * Copyright (c) 2016 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include "strus/base/stdint.h"
#include "strus/lib/error.hpp"
#include "strus/errorBufferInterface.hpp"
#include "tokmatch/lib/tokmatch.hpp"
#include "tokmatch/vocabularyInterface.hpp"
#include "tokmatch/matchEngineInterface.hpp"
#include "tokmatch/patternProgramInterface.hpp"
#include "tokmatch/tokenFlagPredicateInterface.hpp"
#include "tokmatch/annotatedTokenSequence.hpp"
#include "testUtils.hpp"
#include <stdexcept>
#include <iostream>
#include <string>
#include <vector>
#include <memory>
#include <cstring>

using namespace tokmatch;
using namespace tokmatch::test;

static strus::ErrorBufferInterface* g_errorBuffer = 0;

class CapitalizedFlag
	:public TokenFlagPredicateInterface
{
public:
	CapitalizedFlag(){}
	virtual ~CapitalizedFlag(){}

	virtual bool match( const TokenSequenceInterface& seq, std::size_t pos) const
	{
		AttributeValue value;
		return seq.getAttribute( pos, AttrIsTitle, value) && value;
	}
};

static const char* g_source =
	"# greetings and other rules\n"
	"GREETING = [{LOWER: \"hello\"}, {IS_PUNCT: true, OP: \"?\"}, {LOWER: \"world\"}]\n"
	"\t| [{LOWER: \"hi\"}];\n"
	"NUMBER = [{LIKE_NUM: true, OP: \"+\"}, {TEXT: \"%\"}];\n"
	"NAME = [{CAPITALIZED: true, OP: \"+\"}, {\"POS\": \"VERB\"}];\n"
	"GREETING = [{ORTH: 'Hey'}];\n";

struct ErrorCase
{
	const char* source;
	const char* errorlocation;
};

static const ErrorCase g_errorCases[] =
{
	{"X = [{LOWER: \"a\"}]", "line 1"},
	{"X = [{LOWER: \"a\"}];\nY = [];", "line 2"},
	{"X = [{FOO: true}];", "line 1"},
	{"X = [{OP: \"%\"}];", "line 1"},
	{"X = [{IS_ALPHA: \"yes\"}];", "line 1"},
	{"X = [{LENGTH: \"3\"}];", "line 1"},
	{"\n\nX = [{LOWER: \"a\"} {LOWER: \"b\"}];", "line 3"},
	{"X [{}];", "line 1"},
	{"X = [{LOWER: \"a}];", "line 1"},
	{0,0}
};

static void testLoad( VocabularyInterface* vocabulary)
{
	std::auto_ptr<MatchEngineInterface> engine( createMatchEngine_standard( vocabulary, g_errorBuffer));
	if (!engine.get()) throw std::runtime_error("failed to create match engine");
	std::auto_ptr<PatternProgramInterface> program( createPatternProgram_standard( engine.get(), vocabulary, g_errorBuffer));
	if (!program.get()) throw std::runtime_error("failed to create pattern program");

	std::vector<CallbackCall> calls;
	if (!program->defineCallback( "GREETING", new MatchCollector( &calls)))
	{
		throw std::runtime_error("failed to define callback");
	}
	if (!program->load( g_source))
	{
		throw std::runtime_error("failed to load pattern program");
	}
	AnnotatedTokenSequence seq = createSequence( vocabulary, "Hello , world ! 12 13 % hi Hey");
	std::vector<MatchRecord> result = engine->scan( seq);
	checkErrors( g_errorBuffer);
	checkMatches( "program", result, "GREETING[0..3] NUMBER[4..7] NUMBER[5..7] GREETING[7..8] GREETING[8..9]");
	if (calls.size() != 3 || calls[0].idx != 0 || calls[1].idx != 3 || calls[2].idx != 4)
	{
		throw std::runtime_error( "callback bound by name not called for every match");
	}

	AnnotatedTokenSequence names = createSequence( vocabulary, "John Smith runs");
	names.setStringAttribute( 2, AttrPos, "VERB");
	checkMatches( "program flags", engine->scan( names), "NAME[0..3] NAME[1..3]");

	unsigned int ei = 0;
	for (; g_errorCases[ei].source; ++ei)
	{
		if (program->load( g_errorCases[ei].source) || !g_errorBuffer->hasError())
		{
			throw std::runtime_error( std::string( "error not detected in source: ") + g_errorCases[ei].source);
		}
		const char* errmsg = g_errorBuffer->fetchError();
		if (!std::strstr( errmsg, g_errorCases[ei].errorlocation))
		{
			std::cerr << "error message: " << errmsg << std::endl;
			throw std::runtime_error( std::string( "error location not reported for source: ") + g_errorCases[ei].source);
		}
		if (engine->isDefined( "X"))
		{
			throw std::runtime_error( "rules of a failed load defined");
		}
	}
	printStatistics( std::cerr, engine->getStatistics());
}

static void testParsePattern( VocabularyInterface* vocabulary)
{
	std::auto_ptr<MatchEngineInterface> engine( createMatchEngine_standard( vocabulary, g_errorBuffer));
	if (!engine.get()) throw std::runtime_error("failed to create match engine");
	std::auto_ptr<PatternProgramInterface> program( createPatternProgram_standard( engine.get(), vocabulary, g_errorBuffer));
	if (!program.get()) throw std::runtime_error("failed to create pattern program");

	Pattern pattern;
	if (!program->parsePattern( "[{LOWER: \"a\", LENGTH: 1}, {OP: \"*\"}, {FLAG1: false, OP: \"!\"}]", pattern))
	{
		throw std::runtime_error("failed to parse pattern");
	}
	if (pattern.size() != 3
		|| pattern[0].predicates().size() != 2
		|| pattern[0].quantifier() != TokenConstraintSet::Exactly1
		|| pattern[0].predicates()[0].attribute() != (uint32_t)AttrLower
		|| pattern[0].predicates()[0].value() != vocabulary->getSymbol( "a")
		|| pattern[0].predicates()[1].attribute() != (uint32_t)AttrLength
		|| pattern[0].predicates()[1].value() != 1
		|| !pattern[1].isWildcard()
		|| pattern[1].quantifier() != TokenConstraintSet::ZeroOrMore
		|| pattern[2].quantifier() != TokenConstraintSet::Exactly0
		|| !pattern[2].predicates()[0].isFlag()
		|| pattern[2].predicates()[0].flagid() != 1
		|| pattern[2].predicates()[0].value() != 0)
	{
		throw std::runtime_error("unexpected result of parsed pattern");
	}
	if (program->parsePattern( "[{}] x", pattern) || !g_errorBuffer->hasError())
	{
		throw std::runtime_error("trailing characters after pattern not detected");
	}
	(void)g_errorBuffer->fetchError();
	if (program->parsePattern( "[{FLAG9: true}]", pattern) || !g_errorBuffer->hasError())
	{
		throw std::runtime_error("undefined flag not detected");
	}
	(void)g_errorBuffer->fetchError();
}

int main( int argc, const char** argv)
{
	try
	{
		g_errorBuffer = strus::createErrorBuffer_standard( 0, 1);
		if (!g_errorBuffer)
		{
			std::cerr << "construction of error buffer failed" << std::endl;
			return -1;
		}
		else if (argc > 1)
		{
			std::cerr << "too many arguments" << std::endl;
			return 1;
		}
		std::auto_ptr<VocabularyInterface> vocabulary( createVocabulary_standard( g_errorBuffer));
		if (!vocabulary.get()) throw std::runtime_error("failed to create vocabulary");
		if (1 != vocabulary->addFlag( "CAPITALIZED", new CapitalizedFlag()))
		{
			throw std::runtime_error("failed to define flag");
		}
		testLoad( vocabulary.get());
		testParsePattern( vocabulary.get());

		if (g_errorBuffer->hasError())
		{
			throw std::runtime_error("error loading patterns");
		}
		std::cerr << "OK" << std::endl;
		vocabulary.reset();
		delete g_errorBuffer;
		return 0;
	}
	catch (const std::runtime_error& err)
	{
		if (g_errorBuffer->hasError())
		{
			std::cerr << "error processing pattern program: "
					<< g_errorBuffer->fetchError() << " (" << err.what()
					<< ")" << std::endl;
		}
		else
		{
			std::cerr << "error processing pattern program: "
					<< err.what() << std::endl;
		}
	}
	catch (const std::bad_alloc&)
	{
		std::cerr << "out of memory processing pattern program" << std::endl;
	}
	delete g_errorBuffer;
	return -1;
}

