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
#include "tokmatch/matchCallbackInterface.hpp"
#include "tokmatch/annotatedTokenSequence.hpp"
#include "testUtils.hpp"
#include <stdexcept>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>
#include <memory>

using namespace tokmatch;
using namespace tokmatch::test;

static strus::ErrorBufferInterface* g_errorBuffer = 0;

/// \brief Expected value of an attribute, a string for symbols or a number
struct AttributeExpectation
{
	const char* token;
	AttributeKey key;
	const char* symbol;
	AttributeValue value;
};

static const AttributeExpectation g_expectations[] =
{
	{"Hello", AttrText, "Hello", 0},
	{"Hello", AttrLower, "hello", 0},
	{"Hello", AttrShape, "Xxxxx", 0},
	{"Hello", AttrLength, 0, 5},
	{"Hello", AttrIsAlpha, 0, 1},
	{"Hello", AttrIsAscii, 0, 1},
	{"Hello", AttrIsTitle, 0, 1},
	{"Hello", AttrIsLower, 0, 0},
	{"Hello", AttrIsUpper, 0, 0},
	{"Hello", AttrIsStop, 0, 0},
	{"Hello", AttrLikeNum, 0, 0},
	{"NASA", AttrIsUpper, 0, 1},
	{"NASA", AttrIsTitle, 0, 0},
	{"NASA", AttrShape, "XXXX", 0},
	{"ABCDEFG", AttrShape, "XXXX", 0},
	{"C3PO", AttrShape, "XdXX", 0},
	{"1,000", AttrLikeNum, 0, 1},
	{"1,000", AttrIsDigit, 0, 0},
	{"1,000", AttrShape, "d,ddd", 0},
	{"2016", AttrIsDigit, 0, 1},
	{"-3.5", AttrLikeNum, 0, 1},
	{"3/4", AttrLikeNum, 0, 1},
	{"Ten", AttrLikeNum, 0, 1},
	{"tenth", AttrLikeNum, 0, 0},
	{"www.example.com", AttrLikeUrl, 0, 1},
	{"example.org/index.html", AttrLikeUrl, 0, 1},
	{"D.C.", AttrLikeUrl, 0, 0},
	{"user@example.org", AttrLikeEmail, 0, 1},
	{"user@example.org", AttrLikeUrl, 0, 0},
	{"user@@example", AttrLikeEmail, 0, 0},
	{"!?", AttrIsPunct, 0, 1},
	{"a!", AttrIsPunct, 0, 0},
	{"\xC2\xBF", AttrIsPunct, 0, 1},
	{"Stra\xC3\x9F" "e", AttrLower, "stra\xC3\x9F" "e", 0},
	{"Stra\xC3\x9F" "e", AttrLength, 0, 6},
	{"Stra\xC3\x9F" "e", AttrIsAscii, 0, 0},
	{"Stra\xC3\x9F" "e", AttrIsAlpha, 0, 1},
	{"\xC3\x84PFEL", AttrLower, "\xC3\xA4" "pfel", 0},
	{"\xC3\x84PFEL", AttrIsUpper, 0, 1},
	{"\xC4\xB9ODZ", AttrLower, "\xC4\xBAodz", 0},
	{"\xC4\xB9ODZ", AttrIsUpper, 0, 1},
	{"\xC4\xB9ODZ", AttrShape, "XXXX", 0},
	{"\xC4\xB9ODZ", AttrLength, 0, 4},
	{"\xC4\xB0stanbul", AttrLower, "istanbul", 0},
	{"\xC4\xB0stanbul", AttrIsTitle, 0, 1},
	{"\xD5\x80", AttrLower, "\xD5\xB0", 0},
	{"\xD5\x80", AttrIsUpper, 0, 1},
	{"\xD5\x80", AttrShape, "X", 0},
	{"\xCE\x91\xCE\xB8\xCE\xAE\xCE\xBD\xCE\xB1", AttrIsTitle, 0, 1},
	{"\xCE\x91\xCE\xB8\xCE\xAE\xCE\xBD\xCE\xB1", AttrShape, "Xxxxx", 0},
	{"\xCE\x91\xCE\xB8\xCE\xAE\xCE\xBD\xCE\xB1", AttrLength, 0, 5},
	{"\xD9\xA3\xD9\xA0", AttrIsDigit, 0, 1},
	{"\xD9\xA3\xD9\xA0", AttrShape, "dd", 0},
	{"\xE2\x80\x94", AttrIsPunct, 0, 1},
	{"\xE2\x80\x94", AttrIsAlpha, 0, 0},
	{0, AttrText, 0, 0}
};

static void testDerivedAttributes( VocabularyInterface* vocabulary)
{
	unsigned int ei = 0;
	for (; g_expectations[ei].token; ++ei)
	{
		const AttributeExpectation& expectation = g_expectations[ ei];
		AnnotatedTokenSequence seq( vocabulary);
		seq.addToken( expectation.token);
		AttributeValue value;
		if (!seq.getAttribute( 0, expectation.key, value))
		{
			throw std::runtime_error( std::string( "attribute ") + attributeKeyName( expectation.key) + " not defined for token " + expectation.token);
		}
		AttributeValue expected = expectation.symbol ? vocabulary->getSymbol( expectation.symbol) : expectation.value;
		if (!expected && expectation.symbol)
		{
			throw std::runtime_error( std::string( "expected symbol not in vocabulary: ") + expectation.symbol);
		}
		if (value != expected)
		{
			std::ostringstream msg;
			msg << "unexpected value of attribute " << attributeKeyName( expectation.key) << " for token '" << expectation.token << "': ";
			if (expectation.symbol)
			{
				const char* name = vocabulary->symbolName( value);
				msg << "'" << (name ? name : "") << "' instead of '" << expectation.symbol << "'";
			}
			else
			{
				msg << value << " instead of " << expected;
			}
			throw std::runtime_error( msg.str());
		}
	}
	std::cerr << "checked " << ei << " derived attributes" << std::endl;
}

static void testExplicitAttributes( VocabularyInterface* vocabulary)
{
	AnnotatedTokenSequence seq = createSequence( vocabulary, "Hello world");
	AttributeValue value;
	if (seq.getAttribute( 0, AttrPos, value) || seq.getAttribute( 0, AttrLemma, value))
	{
		throw std::runtime_error( "explicit attribute defined without being set");
	}
	seq.setStringAttribute( 0, AttrPos, "INTJ");
	seq.setStringAttribute( 1, AttrLemma, "world");
	seq.setAttribute( 1, AttrIsStop, 1);
	if (!seq.getAttribute( 0, AttrPos, value) || value != vocabulary->getSymbol( "INTJ"))
	{
		throw std::runtime_error( "explicit symbolic attribute not set");
	}
	if (!seq.getAttribute( 1, AttrIsStop, value) || value != 1)
	{
		throw std::runtime_error( "explicit boolean attribute not set");
	}
	seq.resetAttribute( 0, AttrPos);
	if (seq.getAttribute( 0, AttrPos, value))
	{
		throw std::runtime_error( "attribute still defined after reset");
	}
	if (seq.getAttribute( 2, AttrText, value))
	{
		throw std::runtime_error( "attribute defined out of range");
	}
	bool errorDetected = false;
	try
	{
		seq.setAttribute( 0, AttrIsAlpha, 2);
	}
	catch (const std::runtime_error&)
	{
		errorDetected = true;
	}
	if (!errorDetected) throw std::runtime_error( "non boolean value of boolean attribute not rejected");
	errorDetected = false;
	try
	{
		seq.setStringAttribute( 5, AttrPos, "NOUN");
	}
	catch (const std::runtime_error&)
	{
		errorDetected = true;
	}
	if (!errorDetected) throw std::runtime_error( "position out of range not rejected");
}

static void testMerge( VocabularyInterface* vocabulary)
{
	AnnotatedTokenSequence seq( vocabulary);
	seq.addToken( "New");
	seq.addToken( "York", false);
	seq.addToken( "'s");
	seq.addToken( "finest");
	seq.setStringAttribute( 0, AttrPos, "PROPN");
	if (seq.spanText( 0, 4) != "New York's finest")
	{
		throw std::runtime_error( "unexpected span text");
	}
	seq.merge( 0, 2);
	AttributeValue value;
	if (seq.size() != 3 || seq.text( 0) != "New York" || seq.spaceAfter( 0))
	{
		throw std::runtime_error( "unexpected tokens after merge");
	}
	if (!seq.getAttribute( 0, AttrPos, value) || value != vocabulary->getSymbol( "PROPN"))
	{
		throw std::runtime_error( "explicit attribute of first token not kept by merge");
	}
	if (!seq.getAttribute( 0, AttrLength, value) || value != 8
		|| !seq.getAttribute( 0, AttrLower, value) || value != vocabulary->getSymbol( "new york")
		|| !seq.getAttribute( 0, AttrIsAlpha, value) || value != 0)
	{
		throw std::runtime_error( "derived attributes not recomputed by merge");
	}
	if (seq.text( 1) != "'s")
	{
		throw std::runtime_error( "unexpected token after merged span");
	}
	bool errorDetected = false;
	try
	{
		seq.merge( 2, 2);
	}
	catch (const std::runtime_error&)
	{
		errorDetected = true;
	}
	if (!errorDetected) throw std::runtime_error( "merge of empty span not rejected");
}

/// \brief Callback merging the tokens of a match
class MergeCallback
	:public MatchCallbackInterface
{
public:
	MergeCallback(){}
	virtual ~MergeCallback(){}

	virtual void call(
			const TokenMatcherInterface&,
			TokenSequenceInterface& seq,
			std::size_t idx,
			const std::vector<MatchRecord>& matches)
	{
		dynamic_cast<AnnotatedTokenSequence&>( seq).merge( matches[ idx].start(), matches[ idx].end());
	}
};

static void testRetokenizeCallback( VocabularyInterface* vocabulary)
{
	std::auto_ptr<MatchEngineInterface> engine( createMatchEngine_standard( vocabulary, g_errorBuffer));
	if (!engine.get()) throw std::runtime_error("failed to create match engine");
	std::vector<Pattern> patterns;
	patterns.push_back( Pattern());
	patterns.back().push_back( TokenConstraintSet()( AttrLower, vocabulary->getOrCreateSymbol( "new")));
	patterns.back().push_back( TokenConstraintSet()( AttrIsTitle, 1));
	if (!engine->definePatterns( "CITY", new MergeCallback(), patterns))
	{
		throw std::runtime_error("failed to define patterns");
	}
	AnnotatedTokenSequence seq = createSequence( vocabulary, "I like New York");
	std::vector<MatchRecord> result = engine->scan( seq);
	checkErrors( g_errorBuffer);
	checkMatches( "retokenize", result, "CITY[2..4]");
	if (seq.size() != 3 || seq.text( 2) != "New York")
	{
		throw std::runtime_error( "callback did not merge the tokens of the match");
	}
	if (!engine->scan( seq).empty())
	{
		throw std::runtime_error( "merged tokens still match");
	}
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

		testDerivedAttributes( vocabulary.get());
		testExplicitAttributes( vocabulary.get());
		testMerge( vocabulary.get());
		testRetokenizeCallback( vocabulary.get());

		if (g_errorBuffer->hasError())
		{
			throw std::runtime_error("error in token sequence");
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
			std::cerr << "error processing token sequence: "
					<< g_errorBuffer->fetchError() << " (" << err.what()
					<< ")" << std::endl;
		}
		else
		{
			std::cerr << "error processing token sequence: "
					<< err.what() << std::endl;
		}
	}
	catch (const std::bad_alloc&)
	{
		std::cerr << "out of memory processing token sequence" << std::endl;
	}
	delete g_errorBuffer;
	return -1;
}

