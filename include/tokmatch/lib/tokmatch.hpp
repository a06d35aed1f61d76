/*
 * Copyright (c) 2016 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Exported functions of the tokmatch library
/// \file "tokmatch.hpp"
#ifndef _TOKMATCH_LIB_TOKMATCH_HPP_INCLUDED
#define _TOKMATCH_LIB_TOKMATCH_HPP_INCLUDED
#include "tokmatch/attributeKey.hpp"

/// \brief strus toplevel namespace
namespace strus
{
/// \brief Forward declaration
class ErrorBufferInterface;
}//namespace

/// \brief tokmatch toplevel namespace
namespace tokmatch
{

/// \brief Forward declaration
class VocabularyInterface;
/// \brief Forward declaration
class MatchEngineInterface;
/// \brief Forward declaration
class PhraseIndexInterface;
/// \brief Forward declaration
class PatternProgramInterface;

/// \brief Create the standard vocabulary
/// \param[in] errorhnd reference to the error buffer (ErrorBufferInterface)
/// \return the vocabulary or NULL on error
VocabularyInterface* createVocabulary_standard(
		strus::ErrorBufferInterface* errorhnd);

/// \brief Create the standard engine matching patterns of token constraints
/// \param[in] vocabulary vocabulary the flags referred to are defined in (not owned, must outlive the engine)
/// \param[in] errorhnd reference to the error buffer (ErrorBufferInterface)
/// \return the engine or NULL on error
MatchEngineInterface* createMatchEngine_standard(
		const VocabularyInterface* vocabulary,
		strus::ErrorBufferInterface* errorhnd);

/// \brief Create the standard index for matching fixed phrases
/// \param[in] vocabulary vocabulary for mapping the key strings of phrases (not owned, must outlive the index)
/// \param[in] keyAttribute symbolic attribute the tokens are compared with (e.g. AttrText)
/// \param[in] errorhnd reference to the error buffer (ErrorBufferInterface)
/// \return the index or NULL on error
PhraseIndexInterface* createPhraseIndex_standard(
		VocabularyInterface* vocabulary,
		AttributeKey keyAttribute,
		strus::ErrorBufferInterface* errorhnd);

/// \brief Create a loader of pattern definitions from source text
/// \param[in] engine engine to register the patterns in (not owned, must outlive the loader)
/// \param[in] vocabulary vocabulary for mapping the strings of patterns to symbols (not owned, must outlive the loader)
/// \param[in] errorhnd reference to the error buffer (ErrorBufferInterface)
/// \return the loader or NULL on error
PatternProgramInterface* createPatternProgram_standard(
		MatchEngineInterface* engine,
		VocabularyInterface* vocabulary,
		strus::ErrorBufferInterface* errorhnd);

}//namespace
#endif

