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

#include <ncbi_pch.hpp>
#include <wbem/cim_method.hpp>
#include <wbem/cim_xml.hpp>
#include "wbem_p.hpp"


BEGIN_WBEM_SCOPE


CCimMethod::CCimMethod(const string& name, ECimType return_type)
    : m_Name(name),
      m_ReturnType(eCimType_uint32)
{
    CheckName(m_Name, "method");
    SetReturnType(return_type);
}


void CCimMethod::SetName(const string& name)
{
    CheckName(name, "method");
    m_Name = name;
}


void CCimMethod::SetReturnType(ECimType return_type)
{
    if (return_type == eCimType_reference) {
        NCBI_THROW(CCimException, eValue,
                   "Method '" + m_Name + "' cannot return a reference");
    }
    m_ReturnType = return_type;
}


void CCimMethod::SetParameters(const TCimParameters& parameters)
{
    m_Parameters = BuildNamedObjects(parameters);
}


void CCimMethod::SetParameters(const vector<CCimParameter>& parameters)
{
    m_Parameters = BuildNamedObjects(parameters);
}


void CCimMethod::SetParameter(const CCimParameter& parameter)
{
    m_Parameters.Set(parameter.GetName(), parameter);
}


void CCimMethod::SetQualifiers(const TCimQualifiers& qualifiers)
{
    m_Qualifiers = BuildNamedObjects(qualifiers);
}


void CCimMethod::SetQualifiers(const vector<CCimQualifier>& qualifiers)
{
    m_Qualifiers = BuildNamedObjects(qualifiers);
}


void CCimMethod::SetQualifiers(const TCimNamedValues& qualifiers)
{
    m_Qualifiers = BuildNamedObjects<CCimQualifier>(qualifiers);
}


void CCimMethod::SetQualifier(const CCimQualifier& qualifier)
{
    m_Qualifiers.Set(qualifier.GetName(), qualifier);
}


bool CCimMethod::operator==(const CCimMethod& other) const
{
    return NStr::EqualNocase(m_Name, other.m_Name)
        &&  m_ReturnType == other.m_ReturnType
        &&  m_Parameters == other.m_Parameters
        &&  NullableEqualNocase(m_ClassOrigin, other.m_ClassOrigin)
        &&  NullableEqual(m_Propagated, other.m_Propagated)
        &&  m_Qualifiers == other.m_Qualifiers;
}


size_t CCimMethod::GetHash(void) const
{
    size_t ret = HashNocase(m_Name);
    ret = HashCombine(ret, m_ReturnType);
    ret = HashCombine(ret, HashNocaseDict(m_Parameters));
    ret = HashCombine(ret, NullableHashNocase(m_ClassOrigin));
    ret = HashCombine(ret, NullableHash(m_Propagated));
    return HashCombine(ret, HashNocaseDict(m_Qualifiers));
}


xml::node CCimMethod::ToCimXml(void) const
{
    xml::node node("METHOD");
    NCimXml::AddAttr(node, "NAME", m_Name);
    NCimXml::AddAttr(node, "TYPE", GetCimTypeName(m_ReturnType));
    if (IsSetClassOrigin()) {
        NCimXml::AddAttr(node, "CLASSORIGIN", GetClassOrigin());
    }
    NCimXml::AddFlag(node, "PROPAGATED", m_Propagated);
    ITERATE(TCimQualifiers, it, m_Qualifiers) {
        node.push_back(it->second.ToCimXml());
    }
    ITERATE(TCimParameters, it, m_Parameters) {
        node.push_back(it->second.ToCimXml());
    }
    return node;
}


string CCimMethod::ToCimXmlStr(void) const
{
    return NCimXml::NodeToString(ToCimXml());
}


string CCimMethod::ToMof(unsigned int indent) const
{
    string mof = NMof::QualifiersToMof(m_Qualifiers, indent);
    mof += NMof::Indent(indent);
    mof += GetCimTypeName(m_ReturnType);
    mof += ' ';
    mof += m_Name;
    if (m_Parameters.empty()) {
        return mof + "();\n";
    }
    mof += "(\n";
    bool first = true;
    ITERATE(TCimParameters, it, m_Parameters) {
        if ( !first ) {
            mof += ",\n";
        }
        first = false;
        mof += it->second.ToMof(indent + NMof::kIndent);
    }
    return mof + ");\n";
}


END_WBEM_SCOPE
