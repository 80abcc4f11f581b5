#ifndef WBEM___EXCEPTION__HPP
#define WBEM___EXCEPTION__HPP

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
 *   Exceptions thrown by the WBEM CIM object library
 *
 */

/// @file exception.hpp
/// Exception classes of the xwbem library.

#include <wbem/wbem_defs.hpp>
#include <corelib/ncbiexpt.hpp>


/** @addtogroup WBEM
 *
 * @{
 */


BEGIN_WBEM_SCOPE


/////////////////////////////////////////////////////////////////////////////
///
/// CCimException --
///
/// Root of all errors raised by the CIM object model and its serializers.

class NCBI_XWBEM_EXPORT CCimException : public CException
{
public:
    enum EErrCode {
        eValue,      ///< Input structurally wrong for the declared type
        eType,       ///< Wrong category of input
        eKey,        ///< No such name in a case-insensitive dictionary
        eParse       ///< Malformed CIM-XML document
    };
    virtual const char* GetErrCodeString(void) const;
    NCBI_EXCEPTION_DEFAULT(CCimException, CException);
};


/////////////////////////////////////////////////////////////////////////////
///
/// CCimRangeException --
///
/// Integer value does not fit into the width of its CIM type.

class NCBI_XWBEM_EXPORT CCimRangeException : public CCimException
{
public:
    enum EErrCode {
        eOutOfRange
    };
    virtual const char* GetErrCodeString(void) const;
    NCBI_EXCEPTION_DEFAULT(CCimRangeException, CCimException);
};


END_WBEM_SCOPE


/* @} */

#endif  /* WBEM___EXCEPTION__HPP */
