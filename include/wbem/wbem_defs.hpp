#ifndef WBEM___WBEM_DEFS__HPP
#define WBEM___WBEM_DEFS__HPP

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
 *   Namespace and export macros of the WBEM CIM object library
 *
 */

/// @file wbem_defs.hpp
/// Common definitions for the xwbem library.

#include <corelib/ncbistd.hpp>


/** @addtogroup WBEM
 *
 * @{
 */


#if defined(NCBI_OS_MSWIN)  &&  defined(NCBI_DLL_BUILD)
#  if defined(NCBI_XWBEM_EXPORTS)
#    define NCBI_XWBEM_EXPORT __declspec(dllexport)
#  else
#    define NCBI_XWBEM_EXPORT __declspec(dllimport)
#  endif
#else
#  define NCBI_XWBEM_EXPORT
#endif


/// All library symbols live in ncbi::wbem
#define BEGIN_WBEM_SCOPE  BEGIN_NCBI_SCOPE BEGIN_SCOPE(wbem)
#define END_WBEM_SCOPE    END_SCOPE(wbem) END_NCBI_SCOPE
#define USING_WBEM_SCOPE  USING_NCBI_SCOPE; USING_SCOPE(wbem)


BEGIN_WBEM_SCOPE

/// Marker for a string typed value that carries an embedded CIM object.
enum EEmbeddedObject {
    eEmbeddedObject_None,      ///< Plain value
    eEmbeddedObject_Instance,  ///< Embedded CIM instance
    eEmbeddedObject_Object     ///< Embedded CIM class or instance
};

/// Name of the marker as used in CIM-XML ("instance", "object").
/// Empty string for eEmbeddedObject_None.
NCBI_XWBEM_EXPORT
extern const char* GetEmbeddedObjectName(EEmbeddedObject embedded_object);

/// Parse "instance" / "object" (case-insensitive).
/// Throw CCimException::eValue on anything else.
NCBI_XWBEM_EXPORT
extern EEmbeddedObject GetEmbeddedObjectByName(const string& name);

END_WBEM_SCOPE


/* @} */

#endif  /* WBEM___WBEM_DEFS__HPP */
