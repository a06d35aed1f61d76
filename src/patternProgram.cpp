/*
 * Copyright (c) 2016 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Loader of pattern definitions from source text
/// \file "patternProgram.cpp"
#include "patternProgram.hpp"
#include "tokmatch/matchEngineInterface.hpp"
#include "tokmatch/vocabularyInterface.hpp"
#include "tokmatch/matchCallbackInterface.hpp"
#include "lexems.hpp"
#include "errorUtils.hpp"
#include "internationalization.hpp"
#include "strus/errorBufferInterface.hpp"
#include <cstring>
#include <cstdlib>

using namespace tokmatch;
using namespace tokmatch::parser;

struct SourcePosition
{
	unsigned int line;
	unsigned int column;

	SourcePosition()
		:line(1),column(1){}
};

static SourcePosition getSourcePosition( const std::string& source, const char* itr)
{
	SourcePosition rt;
	char const* si = source.c_str();
	for (; si < itr; ++si)
	{
		if (*si == '\n')
		{
			++rt.line;
			rt.column = 1;
		}
		else if (*si == '\r')
		{}
		else
		{
			++rt.column;
		}
	}
	return rt;
}

PatternProgram::~PatternProgram()
{
	CallbackMap::iterator ci = m_callbacks.begin(), ce = m_callbacks.end();
	for (; ci != ce; ++ci)
	{
		delete ci->second;
	}
}

bool PatternProgram::defineCallback( const std::string& name, MatchCallbackInterface* callback)
{
	try
	{
		if (!callback)
		{
			throw configuration_error( _TXT("no callback defined"));
		}
		if (name.empty())
		{
			delete callback;
			throw configuration_error( _TXT("empty pattern identifier"));
		}
		CallbackMap::iterator ci = m_callbacks.find( name);
		if (ci == m_callbacks.end())
		{
			try
			{
				m_callbacks[ name] = callback;
			}
			catch (const std::bad_alloc&)
			{
				delete callback;
				throw;
			}
		}
		else
		{
			delete ci->second;
			ci->second = callback;
		}
		return true;
	}
	CATCH_ERROR_MAP_RETURN( _TXT("failed to define callback: %s"), *m_errorhnd, false);
}

AttributeValue PatternProgram::parseBoolean( char const*& src, const std::string& key) const
{
	if (isAlpha( *src))
	{
		std::string value = parse_IDENTIFIER( src);
		if (isEqual( value, "true")) return 1;
		if (isEqual( value, "false")) return 0;
	}
	else if (is_UNSIGNED( src))
	{
		unsigned int value = parse_UNSIGNED( src);
		if (value <= 1) return value;
	}
	throw syntax_error( string_format( _TXT("boolean value (true or false) expected for '%s'"), key.c_str()));
}

void PatternProgram::parseConstraint( char const*& src, const std::string& key, TokenConstraintSet& result) const
{
	if (isEqual( key, "OP"))
	{
		if (!isStringQuote( *src))
		{
			throw syntax_error( _TXT("quoted string expected as quantifier operator"));
		}
		std::string opstr = parse_STRING( src);
		TokenConstraintSet::Quantifier quantifier;
		if (!TokenConstraintSet::findQuantifier( opstr.c_str(), quantifier))
		{
			throw syntax_error( string_format( _TXT("unknown quantifier operator '%s', one of \"?\", \"+\", \"*\", \"!\", \"1\" expected"), opstr.c_str()));
		}
		result.setQuantifier( quantifier);
		return;
	}
	AttributeKey attrkey;
	if (findAttributeKey( key.c_str(), attrkey))
	{
		switch (attributeType( attrkey))
		{
			case AttributeSymbol:
			{
				if (!isStringQuote( *src))
				{
					throw syntax_error( string_format( _TXT("quoted string expected as value of '%s'"), key.c_str()));
				}
				std::string value = parse_STRING( src);
				uint32_t symid = m_vocabulary->getOrCreateSymbol( value);
				if (!symid) throw tokmatch::runtime_error( _TXT("failed to map value '%s' to a symbol"), value.c_str());
				result( attrkey, symid);
				return;
			}
			case AttributeNumber:
			{
				if (!is_UNSIGNED( src))
				{
					throw syntax_error( string_format( _TXT("unsigned integer expected as value of '%s'"), key.c_str()));
				}
				result( attrkey, parse_UNSIGNED( src));
				return;
			}
			case AttributeBoolean:
				result( attrkey, parseBoolean( src, key));
				return;
		}
	}
	unsigned int flagid = m_vocabulary->getFlagId( key);
	if (!flagid && key.size() > 4 && isEqual( key.substr( 0, 4), "FLAG"))
	{
		char const* fi = key.c_str() + 4;
		if (is_UNSIGNED( fi))
		{
			flagid = parse_UNSIGNED( fi);
			if (!m_vocabulary->getFlag( flagid)) flagid = 0;
		}
	}
	if (!flagid)
	{
		throw syntax_error( string_format( _TXT("unknown attribute or flag '%s'"), key.c_str()));
	}
	result( flagAttribute( flagid), parseBoolean( src, key));
}

std::string PatternProgram::parseKey( char const*& src) const
{
	if (isStringQuote( *src))
	{
		return parse_STRING( src);
	}
	else if (isAlpha( *src))
	{
		return parse_IDENTIFIER( src);
	}
	throw syntax_error( _TXT("attribute name expected as key of a token constraint"));
}

TokenConstraintSet PatternProgram::parseConstraintSet( char const*& src) const
{
	TokenConstraintSet rt;
	if (!isOpenCurlyBracket( *src))
	{
		throw syntax_error( _TXT("curly bracket '{' expected at start of a token constraint"));
	}
	(void)parse_OPERATOR( src);
	if (isCloseCurlyBracket( *src))
	{
		(void)parse_OPERATOR( src);
		return rt;
	}
	for (;;)
	{
		std::string key = parseKey( src);
		if (!isColon( *src))
		{
			throw syntax_error( string_format( _TXT("colon ':' expected after key '%s'"), key.c_str()));
		}
		(void)parse_OPERATOR( src);
		parseConstraint( src, key, rt);
		if (isComma( *src))
		{
			(void)parse_OPERATOR( src);
			continue;
		}
		if (isCloseCurlyBracket( *src))
		{
			(void)parse_OPERATOR( src);
			break;
		}
		throw syntax_error( _TXT("comma ',' or close curly bracket '}' expected in token constraint"));
	}
	return rt;
}

Pattern PatternProgram::parsePatternLiteral( char const*& src) const
{
	Pattern rt;
	if (!isOpenSquareBracket( *src))
	{
		throw syntax_error( _TXT("square bracket '[' expected at start of a pattern"));
	}
	(void)parse_OPERATOR( src);
	if (isCloseSquareBracket( *src))
	{
		throw syntax_error( _TXT("empty pattern"));
	}
	for (;;)
	{
		rt.push_back( parseConstraintSet( src));
		if (isComma( *src))
		{
			(void)parse_OPERATOR( src);
			continue;
		}
		if (isCloseSquareBracket( *src))
		{
			(void)parse_OPERATOR( src);
			break;
		}
		throw syntax_error( _TXT("comma ',' or close square bracket ']' expected in pattern"));
	}
	return rt;
}

void PatternProgram::loadRules( char const*& src, std::vector<Rule>& rules) const
{
	skipSpaces( src);
	while (*src)
	{
		if (!isAlpha( *src))
		{
			throw syntax_error( _TXT("identifier expected at start of rule"));
		}
		std::string name = parse_IDENTIFIER( src);
		if (!isAssign( *src))
		{
			throw syntax_error( string_format( _TXT("assign '=' expected after name '%s' starting a rule"), name.c_str()));
		}
		(void)parse_OPERATOR( src);

		std::vector<Rule>::iterator ri = rules.begin(), re = rules.end();
		for (; ri != re && ri->name != name; ++ri){}
		std::size_t ruleidx = ri - rules.begin();
		if (ri == re)
		{
			rules.push_back( Rule( name));
		}
		rules[ ruleidx].patterns.push_back( parsePatternLiteral( src));
		while (isOr( *src))
		{
			(void)parse_OPERATOR( src);
			rules[ ruleidx].patterns.push_back( parsePatternLiteral( src));
		}
		if (!isSemiColon( *src))
		{
			throw syntax_error( _TXT("semicolon ';' expected at end of rule"));
		}
		(void)parse_OPERATOR( src);
	}
}

void PatternProgram::reportError( const std::string& source, const char* errpos, const char* msg) const
{
	enum {MaxErrorSnippetLen=20};
	const char* se = (const char*)std::memchr( errpos, '\0', MaxErrorSnippetLen);
	std::size_t snippetSize = (!se)?MaxErrorSnippetLen:(se - errpos);
	char snippet[ MaxErrorSnippetLen+1];
	std::memcpy( snippet, errpos, snippetSize);
	snippet[ snippetSize] = 0;
	std::size_t ii=0;
	for (; snippet[ii]; ++ii)
	{
		if ((unsigned char)snippet[ii] < 32)
		{
			snippet[ii] = ' ';
		}
	}
	SourcePosition pos = getSourcePosition( source, errpos);
	m_errorhnd->report( strus::ErrorCodeSyntax, _TXT("error in pattern source at line %u, column %u: \"%s\" [at '%s']"), pos.line, pos.column, msg, snippet);
}

bool PatternProgram::load( const std::string& source)
{
	char const* si = source.c_str();
	try
	{
		std::vector<Rule> rules;
		loadRules( si, rules);

		std::vector<Rule>::const_iterator ri = rules.begin(), re = rules.end();
		for (; ri != re; ++ri)
		{
			MatchCallbackInterface* callback = 0;
			CallbackMap::iterator ci = m_callbacks.find( ri->name);
			if (ci != m_callbacks.end())
			{
				callback = ci->second;
				m_callbacks.erase( ci);
			}
			if (!m_engine->definePatterns( ri->name, callback, ri->patterns))
			{
				throw tokmatch::runtime_error( _TXT("failed to register patterns of rule '%s'"), ri->name.c_str());
			}
		}
		return true;
	}
	catch (const syntax_error& err)
	{
		reportError( source, si, err.what());
	}
	catch (const std::bad_alloc&)
	{
		m_errorhnd->report( strus::ErrorCodeOutOfMem, _TXT("out of memory when loading pattern source"));
	}
	catch (const std::runtime_error& err)
	{
		if (m_errorhnd->hasError())
		{
			m_errorhnd->explain( _TXT("error loading pattern source: %s"));
		}
		else
		{
			m_errorhnd->report( strus::ErrorCodeRuntimeError, _TXT("error loading pattern source: %s"), err.what());
		}
	}
	return false;
}

bool PatternProgram::parsePattern( const std::string& source, Pattern& result) const
{
	char const* si = source.c_str();
	try
	{
		skipSpaces( si);
		result = parsePatternLiteral( si);
		if (*si)
		{
			throw syntax_error( _TXT("unexpected characters after the end of the pattern"));
		}
		return true;
	}
	catch (const syntax_error& err)
	{
		reportError( source, si, err.what());
	}
	catch (const std::bad_alloc&)
	{
		m_errorhnd->report( strus::ErrorCodeOutOfMem, _TXT("out of memory when parsing pattern"));
	}
	catch (const std::runtime_error& err)
	{
		m_errorhnd->report( strus::ErrorCodeRuntimeError, _TXT("error parsing pattern: %s"), err.what());
	}
	return false;
}

