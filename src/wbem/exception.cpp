/*  $Id$
 * ===========================================================================
 *
 *                            PUBLIC DOMAIN NOTICE
 *               National Center for Biotechnology Information
 *
 *  This software/database is a "United States Government Work" under the
 *  terms of the United States Copyright Act.  It was written as part of
 *  the author's official duties as a United States Government employee and
 *  thus cannot be copyrighted.  This software/database is freely available
 *  to the public for use. The National Library of Medicine and the U.S.
 *  Government have not placed any restriction on its use or reproduction.
 *
 *  Although all reasonable efforts have been taken to ensure the accuracy
 *  and reliability of the software and data, the NLM and the U.S.
 *  Government do not and cannot warrant the performance or results that
 *  may be obtained by using this software or data. The NLM and the U.S.
 *  Government disclaim all warranties, express or implied, including
 *  warranties of performance, merchantability or fitness for any particular
 *  purpose.
 *
 *  Please cite the author in any work or product based on this material.
 *
 * ===========================================================================
 *
 * Author:  WBEM library group
 *
 * File Description:
 *   Exceptions and common enumerations of the xwbem library
 *
 */

#include <ncbi_pch.hpp>
#include <wbem/exception.hpp>


BEGIN_WBEM_SCOPE


const char* CCimException::GetErrCodeString(void) const
{
    switch ( GetErrCode() ) {
    case eValue:  return "eValue";
    case eType:   return "eType";
    case eKey:    return "eKey";
    case eParse:  return "eParse";
    default:      return CException::GetErrCodeString();
    }
}


const char* CCimRangeException::GetErrCodeString(void) const
{
    switch ( GetErrCode() ) {
    case eOutOfRange:  return "eOutOfRange";
    default:           return CCimException::GetErrCodeString();
    }
}


const char* GetEmbeddedObjectName(EEmbeddedObject embedded_object)
{
    switch ( embedded_object ) {
    case eEmbeddedObject_Instance:  return "instance";
    case eEmbeddedObject_Object:    return "object";
    default:                        return "";
    }
}


EEmbeddedObject GetEmbeddedObjectByName(const string& name)
{
    if ( NStr::EqualNocase(name, "instance") ) {
        return eEmbeddedObject_Instance;
    }
    if ( NStr::EqualNocase(name, "object") ) {
        return eEmbeddedObject_Object;
    }
    NCBI_THROW(CCimException, eValue,
               "Invalid embedded_object value: '" + name + "'");
}


END_WBEM_SCOPE
