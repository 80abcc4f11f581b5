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

#include <ncbi_pch.hpp>
#include <wbem/wbem_config.hpp>
#include <corelib/ncbi_param.hpp>


BEGIN_NCBI_SCOPE

NCBI_PARAM_DECL(bool, WBEM, IGNORE_NULL_KEY_VALUE);
NCBI_PARAM_DEF_EX(bool, WBEM, IGNORE_NULL_KEY_VALUE, false,
                  eParam_NoThread, WBEM_IGNORE_NULL_KEY_VALUE);
typedef NCBI_PARAM_TYPE(WBEM, IGNORE_NULL_KEY_VALUE) TIgnoreNullKeyValueParam;

BEGIN_SCOPE(wbem)


CWbemConfig::CWbemConfig(void)
    : m_IgnoreNullKeyValue(GetDefaultIgnoreNullKeyValue())
{
}


bool CWbemConfig::GetDefaultIgnoreNullKeyValue(void)
{
    return TIgnoreNullKeyValueParam::GetDefault();
}


void CWbemConfig::SetDefaultIgnoreNullKeyValue(bool value)
{
    TIgnoreNullKeyValueParam::SetDefault(value);
}


END_SCOPE(wbem)
END_NCBI_SCOPE
