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
#include "tokmatch/scanStreamInterface.hpp"
#include "tokmatch/tokenSequenceSourceInterface.hpp"
#include "tokmatch/annotatedTokenSequence.hpp"
#include "testUtils.hpp"
#include <stdexcept>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>
#include <memory>
#include <cstdlib>
#include <ctime>

#define RANDINT(MIN,MAX) ((std::rand()%(MAX-MIN))+MIN)

using namespace tokmatch;
using namespace tokmatch::test;

static strus::ErrorBufferInterface* g_errorBuffer = 0;

static void initRand()
{
	time_t nowtime;
	struct tm* now;

	::time( &nowtime);
	now = ::localtime( &nowtime);

	unsigned int seed = (now->tm_year+10000) + (now->tm_mon+100) + (now->tm_mday+1);
	std::srand( seed+3);
}

static std::vector<std::string> createRandomTexts( unsigned int nofTexts, unsigned int maxSize, unsigned int nofTerms)
{
	std::vector<std::string> rt;
	ZipfDistribution termdist( nofTerms);
	unsigned int ti = 0;
	for (; ti < nofTexts; ++ti)
	{
		std::ostringstream text;
		unsigned int si = 0, se = RANDINT(0,maxSize);
		for (; si < se; ++si)
		{
			text << " t" << termdist.random();
		}
		rt.push_back( text.str());
	}
	return rt;
}

/// \brief Source of token sequences created from a list of texts
class TextListSource
	:public TokenSequenceSourceInterface
{
public:
	TextListSource( VocabularyInterface* vocabulary_, const std::vector<std::string>* texts_)
		:m_vocabulary(vocabulary_),m_texts(texts_),m_idx(0){}
	virtual ~TextListSource(){}

	virtual TokenSequenceInterface* fetch()
	{
		if (m_idx >= m_texts->size()) return 0;
		return new AnnotatedTokenSequence( createSequence( m_vocabulary, (*m_texts)[ m_idx++].c_str()));
	}

private:
	VocabularyInterface* m_vocabulary;
	const std::vector<std::string>* m_texts;
	std::size_t m_idx;
};

static void definePatterns( MatchEngineInterface* engine, VocabularyInterface* vocabulary, const char* name, const char* src, MatchCallbackInterface* callback)
{
	std::vector<Pattern> patterns;
	patterns.push_back( textPattern( vocabulary, src));
	if (!engine->definePatterns( name, callback, patterns))
	{
		throw std::runtime_error( std::string( "failed to define patterns of ") + name);
	}
}

static std::vector<std::string> scanStream( MatchEngineInterface* engine, VocabularyInterface* vocabulary, const std::vector<std::string>& texts, const MatchOptions& options)
{
	std::vector<std::string> rt;
	std::auto_ptr<ScanStreamInterface> stream( engine->createScanStream( new TextListSource( vocabulary, &texts), options));
	if (!stream.get()) throw std::runtime_error("failed to create scan stream");

	TokenSequenceInterface* seq = 0;
	std::vector<MatchRecord> matches;
	while (stream->next( seq, matches))
	{
		std::auto_ptr<TokenSequenceInterface> seqref( seq);
		rt.push_back( matchesToString( matches));
	}
	checkErrors( g_errorBuffer);
	return rt;
}

static void compareResults( const char* testname, const std::vector<std::string>& result, const std::vector<std::string>& expected)
{
	if (result.size() != expected.size())
	{
		throw std::runtime_error( std::string( "number of results differ in test ") + testname);
	}
	std::size_t ri = 0, re = result.size();
	for (; ri != re; ++ri)
	{
		if (result[ ri] != expected[ ri])
		{
			std::cerr << "result " << ri << " differs:" << std::endl
				<< "\tresult:   " << result[ ri] << std::endl
				<< "\texpected: " << expected[ ri] << std::endl;
			throw std::runtime_error( std::string( "results differ in test ") + testname);
		}
	}
}

static void testFailingCallbackEndsStream( MatchEngineInterface* engine, VocabularyInterface* vocabulary)
{
	definePatterns( engine, vocabulary, "FAIL", "t5", new FailingCallback());
	std::vector<std::string> texts;
	texts.push_back( "t1 t3");
	texts.push_back( "t5 t1");
	texts.push_back( "t2");

	std::auto_ptr<ScanStreamInterface> stream( engine->createScanStream( new TextListSource( vocabulary, &texts), MatchOptions()("threads",2)));
	if (!stream.get()) throw std::runtime_error("failed to create scan stream");
	TokenSequenceInterface* seq = 0;
	std::vector<MatchRecord> matches;
	unsigned int nofItems = 0;
	while (stream->next( seq, matches))
	{
		delete seq;
		++nofItems;
	}
	if (nofItems != 1 || seq != 0 || !matches.empty())
	{
		throw std::runtime_error( "scan stream not stopped by failing callback");
	}
	if (!g_errorBuffer->hasError())
	{
		throw std::runtime_error( "failing callback of a scan stream not reported");
	}
	(void)g_errorBuffer->fetchError();
	if (!engine->removePatterns( "FAIL"))
	{
		throw std::runtime_error( "failed to remove patterns of FAIL");
	}
}

int main( int argc, const char** argv)
{
	try
	{
		initRand();
		g_errorBuffer = strus::createErrorBuffer_standard( 0, 16);
		if (!g_errorBuffer)
		{
			std::cerr << "construction of error buffer failed" << std::endl;
			return -1;
		}
		else if (argc > 3)
		{
			std::cerr << "too many arguments" << std::endl;
			return 1;
		}
		unsigned int nofTexts = 300;
		unsigned int nofThreads = 4;
		if (argc > 1) nofTexts = getUintValue( argv[1]);
		if (argc > 2) nofThreads = getUintValue( argv[2]);

		std::auto_ptr<VocabularyInterface> vocabulary( createVocabulary_standard( g_errorBuffer));
		if (!vocabulary.get()) throw std::runtime_error("failed to create vocabulary");
		std::auto_ptr<MatchEngineInterface> engine( createMatchEngine_standard( vocabulary.get(), g_errorBuffer));
		if (!engine.get()) throw std::runtime_error("failed to create match engine");

		std::vector<CallbackCall> calls;
		definePatterns( engine.get(), vocabulary.get(), "PAIR", "t1 t2", new MatchCollector( &calls));
		definePatterns( engine.get(), vocabulary.get(), "SPAN", "t1 _* t3", new MatchCollector( &calls));
		definePatterns( engine.get(), vocabulary.get(), "REPEAT", "t1+ t4? t2", new MatchCollector( &calls));
		definePatterns( engine.get(), vocabulary.get(), "NOT", "t2 t1! t3", new MatchCollector( &calls));

		std::vector<std::string> texts = createRandomTexts( nofTexts, 40, 8);

		// Sequential scans as reference:
		std::vector<std::string> expected;
		std::size_t nofExpectedMatches = 0;
		std::vector<std::string>::const_iterator ti = texts.begin(), te = texts.end();
		for (; ti != te; ++ti)
		{
			AnnotatedTokenSequence seq = createSequence( vocabulary.get(), ti->c_str());
			std::vector<MatchRecord> matches = engine->scan( seq);
			checkErrors( g_errorBuffer);
			nofExpectedMatches += matches.size();
			expected.push_back( matchesToString( matches));
		}
		if (calls.size() != nofExpectedMatches)
		{
			throw std::runtime_error( "callbacks not called for every match of a sequential scan");
		}
		calls.clear();

		compareResults( "stream without threads", scanStream( engine.get(), vocabulary.get(), texts, MatchOptions()), expected);
		if (calls.size() != nofExpectedMatches)
		{
			throw std::runtime_error( "callbacks not called for every match of a stream");
		}
		calls.clear();
		compareResults( "stream with threads", scanStream( engine.get(), vocabulary.get(), texts, MatchOptions()("threads",nofThreads)), expected);
		if (calls.size() != nofExpectedMatches)
		{
			throw std::runtime_error( "callbacks not called for every match of a stream with threads");
		}
		calls.clear();
		compareResults( "stream with batches", scanStream( engine.get(), vocabulary.get(), texts, MatchOptions()("Threads",nofThreads)("BATCHSIZE",7)), expected);
		calls.clear();

		std::vector<std::string> optionNames = engine->getScanStreamOptions();
		if (optionNames.size() != 2 || optionNames[0] != "threads" || optionNames[1] != "batchSize")
		{
			throw std::runtime_error( "unexpected scan stream options");
		}
		std::auto_ptr<ScanStreamInterface> badstream( engine->createScanStream( new TextListSource( vocabulary.get(), &texts), MatchOptions()("workers",2)));
		if (badstream.get() || !g_errorBuffer->hasError())
		{
			throw std::runtime_error( "unknown scan stream option not rejected");
		}
		(void)g_errorBuffer->fetchError();

		testFailingCallbackEndsStream( engine.get(), vocabulary.get());
		calls.clear();

		if (g_errorBuffer->hasError())
		{
			throw std::runtime_error("error scanning streams");
		}
		std::cerr << "scanned " << texts.size() << " sequences with " << nofExpectedMatches << " matches" << std::endl;
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
			std::cerr << "error processing scan stream: "
					<< g_errorBuffer->fetchError() << " (" << err.what()
					<< ")" << std::endl;
		}
		else
		{
			std::cerr << "error processing scan stream: "
					<< err.what() << std::endl;
		}
	}
	catch (const std::bad_alloc&)
	{
		std::cerr << "out of memory processing scan stream" << std::endl;
	}
	delete g_errorBuffer;
	return -1;
}

