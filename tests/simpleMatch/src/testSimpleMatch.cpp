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
#include "tokmatch/versionTokmatch.hpp"
#include "tokmatch/vocabularyInterface.hpp"
#include "tokmatch/matchEngineInterface.hpp"
#include "tokmatch/annotatedTokenSequence.hpp"
#include "testUtils.hpp"
#include <stdexcept>
#include <iostream>
#include <string>
#include <vector>
#include <memory>
#include <cstring>

#undef TOKMATCH_LOWLEVEL_DEBUG

using namespace tokmatch;
using namespace tokmatch::test;

static strus::ErrorBufferInterface* g_errorBuffer = 0;

static void definePatterns( MatchEngineInterface* engine, VocabularyInterface* vocabulary, const char* name, const char* p1, const char* p2=0, MatchCallbackInterface* callback=0)
{
	std::vector<Pattern> patterns;
	patterns.push_back( textPattern( vocabulary, p1));
	if (p2) patterns.push_back( textPattern( vocabulary, p2));
	if (!engine->definePatterns( name, callback, patterns))
	{
		throw std::runtime_error( std::string( "failed to define patterns of ") + name);
	}
}

static std::vector<MatchRecord> scan( MatchEngineInterface* engine, VocabularyInterface* vocabulary, const char* text)
{
	AnnotatedTokenSequence seq = createSequence( vocabulary, text);
	std::vector<MatchRecord> rt = engine->scan( seq);
	checkErrors( g_errorBuffer);
#ifdef TOKMATCH_LOWLEVEL_DEBUG
	std::cerr << "scan '" << text << "':" << std::endl;
	printMatches( std::cerr, rt);
#endif
	return rt;
}

static void testPlainSequences( MatchEngineInterface* engine, VocabularyInterface* vocabulary)
{
	definePatterns( engine, vocabulary, "A", "a b");
	definePatterns( engine, vocabulary, "B", "b c");
	checkMatches( "plain", scan( engine, vocabulary, "a b c a b"), "A[0..2] B[1..3] A[3..5]");
	checkMatches( "plain no match", scan( engine, vocabulary, "c b a"), "");
	checkMatches( "plain empty", scan( engine, vocabulary, ""), "");
}

static void testNegation( MatchEngineInterface* engine, VocabularyInterface* vocabulary)
{
	definePatterns( engine, vocabulary, "N", "a b! c");
	checkMatches( "negation pass", scan( engine, vocabulary, "a c"), "N[0..2]");
	checkMatches( "negation fail", scan( engine, vocabulary, "a b c"), "A[0..2] B[1..3]");

	definePatterns( engine, vocabulary, "E", "x y!");
	checkMatches( "negation at end", scan( engine, vocabulary, "x"), "E[0..1]");
	checkMatches( "negation before token", scan( engine, vocabulary, "x y x z"), "E[2..3]");
	if (!engine->removePatterns( "N") || !engine->removePatterns( "E"))
	{
		throw std::runtime_error( "failed to remove patterns");
	}
}

static void testWildcard( MatchEngineInterface* engine, VocabularyInterface* vocabulary)
{
	definePatterns( engine, vocabulary, "W", "_");
	checkMatches( "wildcard", scan( engine, vocabulary, "x y z"), "W[0..1] W[1..2] W[2..3]");
	definePatterns( engine, vocabulary, "W", "x _ z");
	checkMatches( "wildcard inside", scan( engine, vocabulary, "x y z x z"), "W[0..3]");
	if (!engine->removePatterns( "W")) throw std::runtime_error( "failed to remove patterns");
}

static void testReRegistration( MatchEngineInterface* engine, VocabularyInterface* vocabulary)
{
	definePatterns( engine, vocabulary, "A", "c");
	checkMatches( "re-registration", scan( engine, vocabulary, "a b c"), "B[1..3] A[2..3]");
	definePatterns( engine, vocabulary, "A", "a b");
	checkMatches( "re-registration back", scan( engine, vocabulary, "a b c"), "A[0..2] B[1..3]");
}

static void testMultiplePatterns( MatchEngineInterface* engine, VocabularyInterface* vocabulary)
{
	std::vector<CallbackCall> calls;
	definePatterns( engine, vocabulary, "T", "x y", "y", new MatchCollector( &calls));
	std::vector<MatchRecord> result = scan( engine, vocabulary, "x y");
	checkMatches( "two patterns", result, "T[0..2] T[1..2]");
	if (calls.size() != 2 || calls[0].idx != 0 || calls[1].idx != 1)
	{
		throw std::runtime_error( "callback not called once for every match");
	}
	if (calls[0].record != result[0] || calls[1].record != result[1])
	{
		throw std::runtime_error( "callback called with unexpected matches");
	}
	if (result[0].patternid() != result[1].patternid())
	{
		throw std::runtime_error( "patterns of one identifier have different handles");
	}
	if (0!=std::strcmp( engine->patternName( result[0].patternid()), "T"))
	{
		throw std::runtime_error( "unexpected name of a pattern handle");
	}
	calls.clear();

	// Callbacks see the combined list and their index in it:
	result = scan( engine, vocabulary, "a b x y");
	checkMatches( "combined", result, "A[0..2] T[2..4] T[3..4]");
	if (calls.size() != 2 || calls[0].idx != 1 || calls[1].idx != 2)
	{
		throw std::runtime_error( "callback called with unexpected indices");
	}
	calls.clear();

	// Matching without dispatch does not call callbacks:
	AnnotatedTokenSequence seq = createSequence( vocabulary, "x y");
	result = engine->match( seq);
	if (!calls.empty()) throw std::runtime_error( "callback called by match");
	if (!engine->dispatch( seq, result)) throw std::runtime_error( "dispatch failed");
	if (calls.size() != 2) throw std::runtime_error( "callback not called by dispatch");

	if (!engine->removePatterns( "T")) throw std::runtime_error( "failed to remove patterns");
}

static void testIdempotence( MatchEngineInterface* engine, VocabularyInterface* vocabulary)
{
	AnnotatedTokenSequence seq = createSequence( vocabulary, "a b c b c a b");
	std::vector<MatchRecord> r1 = engine->scan( seq);
	std::vector<MatchRecord> r2 = engine->scan( seq);
	if (!compareMatches( std::cerr, r2, r1))
	{
		throw std::runtime_error( "scan not idempotent");
	}
}

static void testCallbackFailure( MatchEngineInterface* engine, VocabularyInterface* vocabulary)
{
	definePatterns( engine, vocabulary, "F", "z", 0, new FailingCallback());
	AnnotatedTokenSequence seq = createSequence( vocabulary, "a b z");
	std::vector<MatchRecord> result = engine->scan( seq);
	if (!result.empty() || !g_errorBuffer->hasError())
	{
		throw std::runtime_error( "failing callback not reported by scan");
	}
	(void)g_errorBuffer->fetchError();

	result = engine->match( seq);
	checkMatches( "match with failing callback", result, "A[0..2] F[2..3]");
	if (engine->dispatch( seq, result) || !g_errorBuffer->hasError())
	{
		throw std::runtime_error( "failing callback not reported by dispatch");
	}
	(void)g_errorBuffer->fetchError();
	if (!engine->removePatterns( "F")) throw std::runtime_error( "failed to remove patterns");
}

static void testConfigurationErrors( MatchEngineInterface* engine, VocabularyInterface* vocabulary)
{
	std::vector<Pattern> patterns;
	if (engine->definePatterns( "X", 0, patterns) || !g_errorBuffer->hasError())
	{
		throw std::runtime_error( "empty pattern list not rejected");
	}
	(void)g_errorBuffer->fetchError();

	patterns.push_back( Pattern());
	if (engine->definePatterns( "X", 0, patterns) || !g_errorBuffer->hasError())
	{
		throw std::runtime_error( "empty pattern not rejected");
	}
	(void)g_errorBuffer->fetchError();

	patterns.back().push_back( TokenConstraintSet()( flagAttribute( 77), 1));
	if (engine->definePatterns( "X", 0, patterns) || !g_errorBuffer->hasError())
	{
		throw std::runtime_error( "unknown flag not rejected");
	}
	(void)g_errorBuffer->fetchError();

	patterns.back().back() = TokenConstraintSet()( AttrIsAlpha, 2);
	if (engine->definePatterns( "X", 0, patterns) || !g_errorBuffer->hasError())
	{
		throw std::runtime_error( "non boolean value of boolean attribute not rejected");
	}
	(void)g_errorBuffer->fetchError();

	if (engine->isDefined( "X"))
	{
		throw std::runtime_error( "failed registration has an effect");
	}
	if (engine->removePatterns( "X") || !g_errorBuffer->hasError())
	{
		throw std::runtime_error( "removal of an undefined identifier not rejected");
	}
	(void)g_errorBuffer->fetchError();

	checkMatches( "after errors", scan( engine, vocabulary, "a b c"), "A[0..2] B[1..3]");
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
		std::cerr << "tokmatch version " << TOKMATCH_VERSION_STRING << std::endl;
		std::auto_ptr<VocabularyInterface> vocabulary( createVocabulary_standard( g_errorBuffer));
		if (!vocabulary.get()) throw std::runtime_error("failed to create vocabulary");
		std::auto_ptr<MatchEngineInterface> engine( createMatchEngine_standard( vocabulary.get(), g_errorBuffer));
		if (!engine.get()) throw std::runtime_error("failed to create match engine");

		testPlainSequences( engine.get(), vocabulary.get());
		testNegation( engine.get(), vocabulary.get());
		testWildcard( engine.get(), vocabulary.get());
		testReRegistration( engine.get(), vocabulary.get());
		testMultiplePatterns( engine.get(), vocabulary.get());
		testIdempotence( engine.get(), vocabulary.get());
		testCallbackFailure( engine.get(), vocabulary.get());
		testConfigurationErrors( engine.get(), vocabulary.get());

		if (!engine->isDefined( "A") || engine->isDefined( "T"))
		{
			throw std::runtime_error( "unexpected state of pattern definitions");
		}
		if (engine->nofPatternIds() < 6)
		{
			throw std::runtime_error( "unexpected number of pattern handles");
		}
		printStatistics( std::cerr, engine->getStatistics());
		if (g_errorBuffer->hasError())
		{
			throw std::runtime_error("error matching patterns");
		}
		std::cerr << "OK" << std::endl;
		engine.reset();
		vocabulary.reset();
		delete g_errorBuffer;
		return 0;
	}
	catch (const std::runtime_error& err)
	{
		if (g_errorBuffer->hasError())
		{
			std::cerr << "error processing pattern matching: "
					<< g_errorBuffer->fetchError() << " (" << err.what()
					<< ")" << std::endl;
		}
		else
		{
			std::cerr << "error processing pattern matching: "
					<< err.what() << std::endl;
		}
	}
	catch (const std::bad_alloc&)
	{
		std::cerr << "out of memory processing pattern matching" << std::endl;
	}
	delete g_errorBuffer;
	return -1;
}

