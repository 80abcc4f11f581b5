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
 *   CIM method parameter
 *
 */

#include <ncbi_pch.hpp>
#include <wbem/cim_parameter.hpp>
#include <wbem/cim_instance_name.hpp>
#include <wbem/cim_class_name.hpp>
#include <wbem/cim_xml.hpp>
#include "wbem_p.hpp"


BEGIN_WBEM_SCOPE


static ECimType s_ResolveParameterType(const TCimTypeArg&  type,
                                       const CCimValue&    value,
                                       EEmbeddedObject     embedded_object,
                                       const string&       reference_class,
                                       const string&       name)
{
    if (type.IsNull()  &&  value.InferCimType().IsNull()) {
        if (embedded_object != eEmbeddedObject_None) {
            return eCimType_string;
        }
        if ( !reference_class.empty() ) {
            return eCimType_reference;
        }
    }
    return ResolveCimType(type, value, "parameter", name);
}


CCimParameter::CCimParameter(const string&     name,
                             TCimTypeArg       type,
                             const string&     reference_class,
                             TCimFlag          is_array,
                             TCimArraySize     array_size,
                             const CCimValue&  value,
                             EEmbeddedObject   embedded_object)
    : m_Name(name),
      m_Type(s_ResolveParameterType(type, value, embedded_object,
                                    reference_class, name)),
      m_IsArray(is_array.IsNull() ? value.IsArray() : bool(is_array)),
      m_EmbeddedObject(embedded_object)
{
    CheckName(m_Name, "parameter");
    if (m_EmbeddedObject == eEmbeddedObject_None) {
        m_EmbeddedObject = value.InferEmbeddedObject();
    }
    if ( !reference_class.empty() ) {
        SetReferenceClass(reference_class);
    }
    SetArraySize(array_size);
    SetValue(value);
}


CCimParameter CCimParameter::CreateValue(const string& name,
                                         const CCimValue& value)
{
    return CCimParameter(name, null, kEmptyStr, null, null, value);
}


void CCimParameter::SetName(const string& name)
{
    CheckName(name, "parameter");
    m_Name = name;
}


void CCimParameter::SetType(ECimType type)
{
    CCimValue value = m_Value.ConvertTo(type);
    ECimType saved = m_Type;
    m_Type = type;
    try {
        x_Validate(value);
    }
    catch (CCimException&) {
        m_Type = saved;
        throw;
    }
    m_Value = value;
    if (m_Type != eCimType_reference) {
        m_ReferenceClass = null;
    }
}


void CCimParameter::SetReferenceClass(const string& reference_class)
{
    if (m_Type != eCimType_reference) {
        NCBI_THROW(CCimException, eValue,
                   "Parameter '" + m_Name + "' of type " +
                   GetCimTypeName(m_Type) + " cannot have a reference class");
    }
    m_ReferenceClass = reference_class;
}


void CCimParameter::SetIsArray(bool is_array)
{
    bool saved = m_IsArray;
    m_IsArray = is_array;
    try {
        x_Validate(m_Value);
    }
    catch (CCimException&) {
        m_IsArray = saved;
        throw;
    }
}


void CCimParameter::SetArraySize(TCimArraySize array_size)
{
    if ( !array_size.IsNull()  &&  !m_IsArray ) {
        NCBI_THROW(CCimException, eValue,
                   "Scalar parameter '" + m_Name + "' cannot have an "
                   "array size");
    }
    m_ArraySize = array_size;
}


void CCimParameter::SetValue(const CCimValue& value)
{
    x_Validate(value);
    m_Value = value.ConvertTo(m_Type);
}


void CCimParameter::SetEmbeddedObject(EEmbeddedObject embedded_object)
{
    EEmbeddedObject saved = m_EmbeddedObject;
    m_EmbeddedObject = embedded_object;
    try {
        x_Validate(m_Value);
    }
    catch (CCimException&) {
        m_EmbeddedObject = saved;
        throw;
    }
}


void CCimParameter::SetQualifiers(const TCimQualifiers& qualifiers)
{
    m_Qualifiers = BuildNamedObjects(qualifiers);
}


void CCimParameter::SetQualifiers(const vector<CCimQualifier>& qualifiers)
{
    m_Qualifiers = BuildNamedObjects(qualifiers);
}


void CCimParameter::SetQualifiers(const TCimNamedValues& qualifiers)
{
    m_Qualifiers = BuildNamedObjects<CCimQualifier>(qualifiers);
}


void CCimParameter::SetQualifier(const CCimQualifier& qualifier)
{
    m_Qualifiers.Set(qualifier.GetName(), qualifier);
}


void CCimParameter::x_Validate(const CCimValue& value) const
{
    if (value.IsArray()  &&  !m_IsArray) {
        NCBI_THROW(CCimException, eValue,
                   "Scalar parameter '" + m_Name +
                   "' cannot have an array value");
    }
    if ( !value.IsNull()  &&  !value.IsArray()  &&  m_IsArray) {
        NCBI_THROW(CCimException, eValue,
                   "Array parameter '" + m_Name +
                   "' cannot have a scalar value " + value.AsString());
    }
    if (m_EmbeddedObject != eEmbeddedObject_None  &&
        m_Type != eCimType_string) {
        NCBI_THROW(CCimException, eValue,
                   "Parameter '" + m_Name + "' of type " +
                   GetCimTypeName(m_Type) + " cannot hold embedded objects");
    }
    if (m_EmbeddedObject == eEmbeddedObject_None  &&
        value.InferEmbeddedObject() != eEmbeddedObject_None) {
        NCBI_THROW(CCimException, eValue,
                   "Parameter '" + m_Name + "' has an embedded object value "
                   "but no embedded object marker");
    }
}


bool CCimParameter::operator==(const CCimParameter& other) const
{
    return NStr::EqualNocase(m_Name, other.m_Name)
        &&  m_Type == other.m_Type
        &&  NullableEqualNocase(m_ReferenceClass, other.m_ReferenceClass)
        &&  m_IsArray == other.m_IsArray
        &&  NullableEqual(m_ArraySize, other.m_ArraySize)
        &&  m_Value == other.m_Value
        &&  m_EmbeddedObject == other.m_EmbeddedObject
        &&  m_Qualifiers == other.m_Qualifiers;
}


size_t CCimParameter::GetHash(void) const
{
    size_t ret = HashNocase(m_Name);
    ret = HashCombine(ret, m_Type);
    ret = HashCombine(ret, NullableHashNocase(m_ReferenceClass));
    ret = HashCombine(ret, m_IsArray);
    ret = HashCombine(ret, NullableHash(m_ArraySize));
    ret = HashCombine(ret, m_Value.GetHash());
    ret = HashCombine(ret, m_EmbeddedObject);
    return HashCombine(ret, HashNocaseDict(m_Qualifiers));
}


xml::node CCimParameter::ToCimXml(bool as_value) const
{
    if (as_value) {
        xml::node node("PARAMVALUE");
        NCimXml::AddAttr(node, "NAME", m_Name);
        NCimXml::AddAttr(node, "PARAMTYPE", GetCimTypeName(m_Type));
        if (m_EmbeddedObject != eEmbeddedObject_None) {
            NCimXml::AddAttr(node, "EmbeddedObject",
                             GetEmbeddedObjectName(m_EmbeddedObject));
        }
        if ( !m_Value.IsNull() ) {
            node.push_back(NCimXml::ValueToCimXml(m_Value, m_Type));
        }
        return node;
    }

    bool is_ref = m_Type == eCimType_reference;
    const char* name = is_ref
        ? (m_IsArray ? "PARAMETER.REFARRAY" : "PARAMETER.REFERENCE")
        : (m_IsArray ? "PARAMETER.ARRAY" : "PARAMETER");
    xml::node node(name);
    NCimXml::AddAttr(node, "NAME", m_Name);
    if (is_ref) {
        if (IsSetReferenceClass()) {
            NCimXml::AddAttr(node, "REFERENCECLASS", GetReferenceClass());
        }
    } else {
        NCimXml::AddAttr(node, "TYPE", GetCimTypeName(m_Type));
    }
    if (m_IsArray  &&  !m_ArraySize.IsNull()) {
        NCimXml::AddAttr(node, "ARRAYSIZE", NStr::UIntToString(m_ArraySize));
    }
    ITERATE(TCimQualifiers, it, m_Qualifiers) {
        node.push_back(it->second.ToCimXml());
    }
    return node;
}


string CCimParameter::ToCimXmlStr(bool as_value) const
{
    return NCimXml::NodeToString(ToCimXml(as_value));
}


string CCimParameter::ToMof(unsigned int indent) const
{
    string mof = NMof::QualifiersToMof(m_Qualifiers, indent);
    mof += NMof::Indent(indent);
    mof += NMof::TypeToMof(m_Type, IsSetReferenceClass()
                           ? GetReferenceClass() : kEmptyStr);
    mof += ' ';
    mof += m_Name;
    if (m_IsArray) {
        mof += '[';
        if ( !m_ArraySize.IsNull() ) {
            mof += NStr::UIntToString(m_ArraySize);
        }
        mof += ']';
    }
    return mof;
}


END_WBEM_SCOPE
