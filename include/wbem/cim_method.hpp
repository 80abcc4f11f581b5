#ifndef WBEM___CIM_METHOD__HPP
#define WBEM___CIM_METHOD__HPP

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
 *   CIM method declaration
 *
 */

/// @file cim_method.hpp
/// CCimMethod -- a method of a CIM class.

#include <wbem/cim_parameter.hpp>


/** @addtogroup WBEM
 *
 * @{
 */


BEGIN_WBEM_SCOPE


/////////////////////////////////////////////////////////////////////////////
///
/// CCimMethod --
///
/// Name, return type, parameters and qualifiers of a method. The return
/// type cannot be 'reference'.

class NCBI_XWBEM_EXPORT CCimMethod
{
public:
    CCimMethod(const string& name, ECimType return_type);

    const string& GetName(void) const { return m_Name; }
    void SetName(const string& name);

    ECimType GetReturnType(void) const { return m_ReturnType; }
    void SetReturnType(ECimType return_type);

    const TCimParameters& GetParameters(void) const { return m_Parameters; }
    void SetParameters(const TCimParameters& parameters);
    void SetParameters(const vector<CCimParameter>& parameters);
    /// Add or replace one parameter
    void SetParameter(const CCimParameter& parameter);

    bool IsSetClassOrigin(void) const { return !m_ClassOrigin.IsNull(); }
    string GetClassOrigin(void) const { return m_ClassOrigin; }
    void SetClassOrigin(const string& class_origin)
        { m_ClassOrigin = class_origin; }
    void ResetClassOrigin(void) { m_ClassOrigin = null; }

    TCimFlag GetPropagated(void) const { return m_Propagated; }
    void SetPropagated(TCimFlag value) { m_Propagated = value; }

    const TCimQualifiers& GetQualifiers(void) const { return m_Qualifiers; }
    void SetQualifiers(const TCimQualifiers& qualifiers);
    void SetQualifiers(const vector<CCimQualifier>& qualifiers);
    void SetQualifiers(const TCimNamedValues& qualifiers);
    void SetQualifier(const CCimQualifier& qualifier);

    bool operator==(const CCimMethod& other) const;
    bool operator!=(const CCimMethod& other) const
        { return !(*this == other); }
    size_t GetHash(void) const;

    /// <METHOD>
    xml::node ToCimXml(void) const;
    string ToCimXmlStr(void) const;

    string ToMof(unsigned int indent = NMof::kIndent) const;

private:
    string            m_Name;
    ECimType          m_ReturnType;
    TCimParameters    m_Parameters;
    CNullable<string> m_ClassOrigin;
    TCimFlag          m_Propagated;
    TCimQualifiers    m_Qualifiers;
};


typedef CNocaseDict<CCimMethod> TCimMethods;


END_WBEM_SCOPE


/* @} */

#endif  /* WBEM___CIM_METHOD__HPP */
