#ifndef WBEM___WBEM_CONFIG__HPP
#define WBEM___WBEM_CONFIG__HPP

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
 *   Process-wide options of the WBEM CIM object library
 *
 */

/// @file wbem_config.hpp
/// Configuration of the xwbem library.
///
/// Options are NCBI parameters, section [WBEM] of the application
/// registry, overridable through the environment:
///
///   [WBEM]
///   IGNORE_NULL_KEY_VALUE = false    ; WBEM_IGNORE_NULL_KEY_VALUE

#include <wbem/wbem_defs.hpp>


/** @addtogroup WBEM
 *
 * @{
 */


BEGIN_WBEM_SCOPE


/////////////////////////////////////////////////////////////////////////////
///
/// CWbemConfig --
///
/// Snapshot of the options, passed explicitly to the operations that
/// depend on them. A default constructed object reflects the process-wide
/// values at the moment of construction.
///
/// The process-wide values may be changed at any time. Changing them while
/// other threads construct objects gives unspecified results.

class NCBI_XWBEM_EXPORT CWbemConfig
{
public:
    CWbemConfig(void);

    /// Accept NULL keybinding values instead of throwing eValue.
    bool GetIgnoreNullKeyValue(void) const
        { return m_IgnoreNullKeyValue; }
    CWbemConfig& SetIgnoreNullKeyValue(bool value)
        { m_IgnoreNullKeyValue = value;  return *this; }

    /// Process-wide defaults
    static bool GetDefaultIgnoreNullKeyValue(void);
    static void SetDefaultIgnoreNullKeyValue(bool value);

private:
    bool m_IgnoreNullKeyValue;
};


END_WBEM_SCOPE


/* @} */

#endif  /* WBEM___WBEM_CONFIG__HPP */
