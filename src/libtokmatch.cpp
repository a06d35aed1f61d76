/*
 * Copyright (c) 2016 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Exported functions of the tokmatch library
/// \file libtokmatch.cpp
#include "tokmatch/lib/tokmatch.hpp"
#include "strus/errorBufferInterface.hpp"
#include "strus/base/dll_tags.hpp"
#include "vocabulary.hpp"
#include "matchEngine.hpp"
#include "phraseIndex.hpp"
#include "patternProgram.hpp"
#include "internationalization.hpp"
#include "errorUtils.hpp"

using namespace tokmatch;
static bool g_intl_initialized = false;

static void initLibrary()
{
	if (!g_intl_initialized)
	{
		tokmatch::initMessageTextDomain();
		g_intl_initialized = true;
	}
}

DLL_PUBLIC VocabularyInterface* tokmatch::createVocabulary_standard( strus::ErrorBufferInterface* errorhnd)
{
	try
	{
		initLibrary();
		return new Vocabulary( errorhnd);
	}
	CATCH_ERROR_MAP_RETURN( _TXT("error creating vocabulary: %s"), *errorhnd, 0);
}

DLL_PUBLIC MatchEngineInterface* tokmatch::createMatchEngine_standard( const VocabularyInterface* vocabulary, strus::ErrorBufferInterface* errorhnd)
{
	try
	{
		initLibrary();
		if (!vocabulary)
		{
			throw configuration_error( _TXT("no vocabulary defined"));
		}
		return new MatchEngine( vocabulary, errorhnd);
	}
	CATCH_ERROR_MAP_RETURN( _TXT("error creating token pattern match engine: %s"), *errorhnd, 0);
}

DLL_PUBLIC PhraseIndexInterface* tokmatch::createPhraseIndex_standard( VocabularyInterface* vocabulary, AttributeKey keyAttribute, strus::ErrorBufferInterface* errorhnd)
{
	try
	{
		initLibrary();
		return new PhraseIndex( vocabulary, keyAttribute, errorhnd);
	}
	CATCH_ERROR_MAP_RETURN( _TXT("error creating phrase index: %s"), *errorhnd, 0);
}

DLL_PUBLIC PatternProgramInterface* tokmatch::createPatternProgram_standard( MatchEngineInterface* engine, VocabularyInterface* vocabulary, strus::ErrorBufferInterface* errorhnd)
{
	try
	{
		initLibrary();
		if (!engine || !vocabulary)
		{
			throw configuration_error( _TXT("pattern program needs an engine and a vocabulary"));
		}
		return new PatternProgram( engine, vocabulary, errorhnd);
	}
	CATCH_ERROR_MAP_RETURN( _TXT("error creating pattern program loader: %s"), *errorhnd, 0);
}

