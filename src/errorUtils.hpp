/*
 * Copyright (c) 2016 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Exceptions of the library and the macros mapping them to the error buffer at the interface boundary
/// \file "errorUtils.hpp"
#ifndef _TOKMATCH_ERROR_UTILS_HPP_INCLUDED
#define _TOKMATCH_ERROR_UTILS_HPP_INCLUDED
#include "strus/errorBufferInterface.hpp"
#include "strus/errorCodes.hpp"
#include "internationalization.hpp"
#include <stdexcept>
#include <new>
#include <string>

namespace tokmatch
{

/// \brief Error in the definition of patterns, phrases or options
class configuration_error
	:public std::runtime_error
{
public:
	explicit configuration_error( const std::string& msg)
		:std::runtime_error(msg){}
};

/// \brief Error in the syntax of a pattern source
class syntax_error
	:public std::runtime_error
{
public:
	explicit syntax_error( const std::string& msg)
		:std::runtime_error(msg){}
};

/// \brief Reference to an undefined identifier
class lookup_error
	:public std::runtime_error
{
public:
	explicit lookup_error( const std::string& msg)
		:std::runtime_error(msg){}
};

}//namespace

#define CATCH_ERROR_MAP_BODY( contextExplainText, errorBuffer)\
	catch (const std::bad_alloc&)\
	{\
		(errorBuffer).report( strus::ErrorCodeOutOfMem, _TXT("memory allocation error"));\
	}\
	catch (const tokmatch::configuration_error& err)\
	{\
		(errorBuffer).report( strus::ErrorCodeInvalidArgument, contextExplainText, err.what());\
	}\
	catch (const tokmatch::syntax_error& err)\
	{\
		(errorBuffer).report( strus::ErrorCodeSyntax, contextExplainText, err.what());\
	}\
	catch (const tokmatch::lookup_error& err)\
	{\
		(errorBuffer).report( strus::ErrorCodeUnknownIdentifier, contextExplainText, err.what());\
	}\
	catch (const std::runtime_error& err)\
	{\
		(errorBuffer).report( strus::ErrorCodeRuntimeError, contextExplainText, err.what());\
	}\
	catch (const std::logic_error& err)\
	{\
		(errorBuffer).report( strus::ErrorCodeLogicError, contextExplainText, err.what());\
	}\
	catch (const std::exception& err)\
	{\
		(errorBuffer).report( strus::ErrorCodeUnknown, contextExplainText, err.what());\
	}

/// \brief Map the exceptions of a try block to the error buffer
#define CATCH_ERROR_MAP( contextExplainText, errorBuffer)\
	CATCH_ERROR_MAP_BODY( contextExplainText, errorBuffer)

/// \brief Map the exceptions of a try block to the error buffer and return a value
#define CATCH_ERROR_MAP_RETURN( contextExplainText, errorBuffer, value)\
	CATCH_ERROR_MAP_BODY( contextExplainText, errorBuffer)\
	return value;

#endif

