/*
 * Copyright (c) 2016 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Names and types of the built-in token attributes
/// \file "attributeKey.cpp"
#include "tokmatch/attributeKey.hpp"
#include "tokmatch/tokenConstraint.hpp"
#include "strus/base/string_conv.hpp"
#include <cstring>

using namespace tokmatch;

static const char* g_attributeKeyNames[ NofAttributeKeys] = {
	"TEXT","LOWER","LENGTH","IS_ALPHA","IS_ASCII","IS_DIGIT","IS_LOWER","IS_UPPER","IS_TITLE",
	"IS_PUNCT","IS_SPACE","IS_STOP","LIKE_NUM","LIKE_URL","LIKE_EMAIL",
	"POS","TAG","DEP","LEMMA","SHAPE","ENT_TYPE"};

AttributeType tokmatch::attributeType( AttributeKey key)
{
	switch (key)
	{
		case AttrText:
		case AttrLower:
		case AttrPos:
		case AttrTag:
		case AttrDep:
		case AttrLemma:
		case AttrShape:
		case AttrEntType:
			return AttributeSymbol;
		case AttrLength:
			return AttributeNumber;
		case AttrIsAlpha:
		case AttrIsAscii:
		case AttrIsDigit:
		case AttrIsLower:
		case AttrIsUpper:
		case AttrIsTitle:
		case AttrIsPunct:
		case AttrIsSpace:
		case AttrIsStop:
		case AttrLikeNum:
		case AttrLikeUrl:
		case AttrLikeEmail:
			return AttributeBoolean;
	}
	return AttributeBoolean;
}

const char* tokmatch::attributeKeyName( AttributeKey key)
{
	return ((unsigned int)key < (unsigned int)NofAttributeKeys) ? g_attributeKeyNames[ key] : 0;
}

bool tokmatch::findAttributeKey( const char* name, AttributeKey& key)
{
	if (strus::caseInsensitiveEquals( name, "ORTH"))
	{
		key = AttrText;
		return true;
	}
	for (int ki=0; ki<NofAttributeKeys; ++ki)
	{
		if (strus::caseInsensitiveEquals( name, g_attributeKeyNames[ ki]))
		{
			key = (AttributeKey)ki;
			return true;
		}
	}
	return false;
}

static const char* g_quantifierNames[ TokenConstraintSet::NofQuantifiers] = {"","?","+","*","!"};

const char* TokenConstraintSet::quantifierName( Quantifier q)
{
	return ((unsigned int)q < (unsigned int)NofQuantifiers) ? g_quantifierNames[ q] : 0;
}

bool TokenConstraintSet::findQuantifier( const char* name, Quantifier& q)
{
	if (0==std::strcmp( name, "1"))
	{
		q = Exactly1;
		return true;
	}
	for (int qi=0; qi<NofQuantifiers; ++qi)
	{
		if (0==std::strcmp( name, g_quantifierNames[ qi]))
		{
			q = (Quantifier)qi;
			return true;
		}
	}
	return false;
}

