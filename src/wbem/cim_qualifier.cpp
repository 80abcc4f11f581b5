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
 *   CIM qualifier value
 *
 */

#include <ncbi_pch.hpp>
#include <wbem/cim_qualifier.hpp>
#include <wbem/cim_xml.hpp>
#include <wbem/cim_mof.hpp>
#include "wbem_p.hpp"


BEGIN_WBEM_SCOPE


CCimQualifier::CCimQualifier(const string&    name,
                             const CCimValue& value,
                             TCimTypeArg      type,
                             TCimFlag         propagated,
                             TCimFlag         overridable,
                             TCimFlag         tosubclass,
                             TCimFlag         toinstance,
                             TCimFlag         translatable)
    : m_Name(name),
      m_Type(ResolveCimType(type, value, "qualifier", name)),
      m_Propagated(propagated),
      m_Overridable(overridable),
      m_ToSubclass(tosubclass),
      m_ToInstance(toinstance),
      m_Translatable(translatable)
{
    CheckName(m_Name, "qualifier");
    x_CheckType(m_Type);
    SetValue(value);
}


void CCimQualifier::SetName(const string& name)
{
    CheckName(name, "qualifier");
    m_Name = name;
}


void CCimQualifier::SetType(ECimType type)
{
    x_CheckType(type);
    m_Value = m_Value.ConvertTo(type);
    m_Type  = type;
}


void CCimQualifier::SetValue(const CCimValue& value)
{
    if (value.IsEmbedded()  ||
        value.InferEmbeddedObject() != eEmbeddedObject_None) {
        NCBI_THROW(CCimException, eValue,
                   "Qualifier '" + m_Name +
                   "' cannot have an embedded object value");
    }
    m_Value = value.ConvertTo(m_Type);
}


void CCimQualifier::x_CheckType(ECimType type) const
{
    if (type == eCimType_reference) {
        NCBI_THROW(CCimException, eValue,
                   "Qualifier '" + m_Name + "' cannot have reference type");
    }
}


bool CCimQualifier::operator==(const CCimQualifier& other) const
{
    return NStr::EqualNocase(m_Name, other.m_Name)
        &&  m_Type == other.m_Type
        &&  m_Value == other.m_Value
        &&  NullableEqual(m_Propagated,   other.m_Propagated)
        &&  NullableEqual(m_Overridable,  other.m_Overridable)
        &&  NullableEqual(m_ToSubclass,   other.m_ToSubclass)
        &&  NullableEqual(m_ToInstance,   other.m_ToInstance)
        &&  NullableEqual(m_Translatable, other.m_Translatable);
}


size_t CCimQualifier::GetHash(void) const
{
    size_t ret = HashNocase(m_Name);
    ret = HashCombine(ret, m_Type);
    ret = HashCombine(ret, m_Value.GetHash());
    ret = HashCombine(ret, NullableHash(m_Propagated));
    ret = HashCombine(ret, NullableHash(m_Overridable));
    ret = HashCombine(ret, NullableHash(m_ToSubclass));
    ret = HashCombine(ret, NullableHash(m_ToInstance));
    return HashCombine(ret, NullableHash(m_Translatable));
}


xml::node CCimQualifier::ToCimXml(void) const
{
    xml::node node("QUALIFIER");
    NCimXml::AddAttr(node, "NAME", m_Name);
    NCimXml::AddAttr(node, "TYPE", GetCimTypeName(m_Type));
    NCimXml::AddFlag(node, "PROPAGATED",   m_Propagated);
    NCimXml::AddFlag(node, "OVERRIDABLE",  m_Overridable);
    NCimXml::AddFlag(node, "TOSUBCLASS",   m_ToSubclass);
    NCimXml::AddFlag(node, "TOINSTANCE",   m_ToInstance);
    NCimXml::AddFlag(node, "TRANSLATABLE", m_Translatable);
    if ( !m_Value.IsNull() ) {
        node.push_back(NCimXml::ValueToCimXml(m_Value, m_Type));
    }
    return node;
}


string CCimQualifier::ToCimXmlStr(void) const
{
    return NCimXml::NodeToString(ToCimXml());
}


string CCimQualifier::ToCimXmlStr(const string& indent) const
{
    return NCimXml::NodeToString(ToCimXml(), indent);
}


string CCimQualifier::ToMof(unsigned int indent, unsigned int line_pos) const
{
    string mof = m_Name;
    line_pos += (unsigned int) m_Name.size();
    if (m_Value.IsNull()) {
        return mof;
    }
    if (m_Value.IsArray()) {
        mof += ' ';
        line_pos += 1;
        mof += NMof::ValueToMof(m_Value, m_Type, indent, line_pos);
    } else {
        mof += " ( ";
        line_pos += 3;
        mof += NMof::ValueToMof(m_Value, m_Type, indent, line_pos, 2);
        mof += " )";
    }
    return mof;
}


END_WBEM_SCOPE
