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
 *   CIM property
 *
 */

#include <ncbi_pch.hpp>
#include <wbem/cim_property.hpp>
#include <wbem/cim_instance_name.hpp>
#include <wbem/cim_class_name.hpp>
#include <wbem/cim_xml.hpp>
#include <wbem/wbem_uri.hpp>
#include "wbem_p.hpp"


BEGIN_WBEM_SCOPE


// Type of a property whose value cannot tell it
static ECimType s_ResolvePropertyType(const TCimTypeArg&  type,
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
    return ResolveCimType(type, value, "property", name);
}


static string s_InferReferenceClass(const CCimValue& value)
{
    if (value.IsInstanceName()) {
        return value.GetInstanceName().GetClassname();
    }
    if (value.IsClassName()) {
        return value.GetClassName().GetClassname();
    }
    return kEmptyStr;
}


CCimProperty::CCimProperty(const string&     name,
                           const CCimValue&  value,
                           TCimTypeArg       type,
                           TCimFlag          is_array,
                           EEmbeddedObject   embedded_object,
                           const string&     reference_class)
    : m_Name(name),
      m_Type(s_ResolvePropertyType(type, value, embedded_object,
                                   reference_class, name)),
      m_IsArray(is_array.IsNull() ? value.IsArray() : bool(is_array)),
      m_EmbeddedObject(embedded_object)
{
    CheckName(m_Name, "property");
    if (m_EmbeddedObject == eEmbeddedObject_None) {
        m_EmbeddedObject = value.InferEmbeddedObject();
    }
    string refclass = reference_class;
    if (refclass.empty()  &&  m_Type == eCimType_reference) {
        refclass = s_InferReferenceClass(value);
    }
    if ( !refclass.empty() ) {
        SetReferenceClass(refclass);
    }
    SetValue(value);
}


void CCimProperty::SetName(const string& name)
{
    CheckName(name, "property");
    m_Name = name;
}


void CCimProperty::SetType(ECimType type)
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


void CCimProperty::SetValue(const CCimValue& value)
{
    x_Validate(value);
    m_Value = value.ConvertTo(m_Type);
}


void CCimProperty::SetIsArray(bool is_array)
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


void CCimProperty::SetArraySize(TCimArraySize array_size)
{
    if ( !array_size.IsNull()  &&  !m_IsArray ) {
        NCBI_THROW(CCimException, eValue,
                   "Scalar property '" + m_Name + "' cannot have an "
                   "array size");
    }
    m_ArraySize = array_size;
}


void CCimProperty::SetReferenceClass(const string& reference_class)
{
    if (m_Type != eCimType_reference) {
        NCBI_THROW(CCimException, eValue,
                   "Property '" + m_Name + "' of type " +
                   GetCimTypeName(m_Type) + " cannot have a reference class");
    }
    m_ReferenceClass = reference_class;
}


void CCimProperty::SetEmbeddedObject(EEmbeddedObject embedded_object)
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


void CCimProperty::SetQualifiers(const TCimQualifiers& qualifiers)
{
    m_Qualifiers = BuildNamedObjects(qualifiers);
}


void CCimProperty::SetQualifiers(const vector<CCimQualifier>& qualifiers)
{
    m_Qualifiers = BuildNamedObjects(qualifiers);
}


void CCimProperty::SetQualifiers(const TCimNamedValues& qualifiers)
{
    m_Qualifiers = BuildNamedObjects<CCimQualifier>(qualifiers);
}


void CCimProperty::SetQualifier(const CCimQualifier& qualifier)
{
    m_Qualifiers.Set(qualifier.GetName(), qualifier);
}


// Consistency of the value and the declaration
void CCimProperty::x_Validate(const CCimValue& value) const
{
    if (value.IsArray()  &&  !m_IsArray) {
        NCBI_THROW(CCimException, eValue,
                   "Scalar property '" + m_Name +
                   "' cannot have an array value");
    }
    if ( !value.IsNull()  &&  !value.IsArray()  &&  m_IsArray) {
        NCBI_THROW(CCimException, eValue,
                   "Array property '" + m_Name +
                   "' cannot have a scalar value " + value.AsString());
    }
    if (m_IsArray  &&  m_Type == eCimType_reference) {
        NCBI_THROW(CCimException, eValue,
                   "Property '" + m_Name +
                   "': arrays of references are not allowed");
    }
    if ( !m_ArraySize.IsNull()  &&  !m_IsArray ) {
        NCBI_THROW(CCimException, eValue,
                   "Scalar property '" + m_Name + "' cannot have an "
                   "array size");
    }
    EEmbeddedObject embedded = value.InferEmbeddedObject();
    if (m_EmbeddedObject != eEmbeddedObject_None) {
        if (m_Type != eCimType_string) {
            NCBI_THROW(CCimException, eValue,
                       "Property '" + m_Name + "' of type " +
                       GetCimTypeName(m_Type) +
                       " cannot hold embedded objects");
        }
        if (m_EmbeddedObject == eEmbeddedObject_Instance  &&
            embedded == eEmbeddedObject_Object) {
            NCBI_THROW(CCimException, eValue,
                       "Property '" + m_Name + "' holds embedded instances, "
                       "not classes");
        }
    } else if (embedded != eEmbeddedObject_None) {
        NCBI_THROW(CCimException, eValue,
                   "Property '" + m_Name + "' has an embedded object value "
                   "but no embedded object marker");
    }
}


bool CCimProperty::operator==(const CCimProperty& other) const
{
    return NStr::EqualNocase(m_Name, other.m_Name)
        &&  m_Type == other.m_Type
        &&  m_IsArray == other.m_IsArray
        &&  m_Value == other.m_Value
        &&  NullableEqual(m_ArraySize, other.m_ArraySize)
        &&  NullableEqualNocase(m_ClassOrigin, other.m_ClassOrigin)
        &&  NullableEqual(m_Propagated, other.m_Propagated)
        &&  NullableEqualNocase(m_ReferenceClass, other.m_ReferenceClass)
        &&  m_EmbeddedObject == other.m_EmbeddedObject
        &&  m_Qualifiers == other.m_Qualifiers;
}


size_t CCimProperty::GetHash(void) const
{
    size_t ret = HashNocase(m_Name);
    ret = HashCombine(ret, m_Type);
    ret = HashCombine(ret, m_IsArray);
    ret = HashCombine(ret, m_Value.GetHash());
    ret = HashCombine(ret, NullableHash(m_ArraySize));
    ret = HashCombine(ret, NullableHashNocase(m_ClassOrigin));
    ret = HashCombine(ret, NullableHash(m_Propagated));
    ret = HashCombine(ret, NullableHashNocase(m_ReferenceClass));
    ret = HashCombine(ret, m_EmbeddedObject);
    return HashCombine(ret, HashNocaseDict(m_Qualifiers));
}


xml::node CCimProperty::ToCimXml(void) const
{
    const char* name = m_Type == eCimType_reference ? "PROPERTY.REFERENCE"
        : (m_IsArray ? "PROPERTY.ARRAY" : "PROPERTY");
    xml::node node(name);
    NCimXml::AddAttr(node, "NAME", m_Name);
    if (m_Type == eCimType_reference) {
        if (IsSetReferenceClass()) {
            NCimXml::AddAttr(node, "REFERENCECLASS", GetReferenceClass());
        }
    } else {
        NCimXml::AddAttr(node, "TYPE", GetCimTypeName(m_Type));
        if (m_IsArray  &&  !m_ArraySize.IsNull()) {
            NCimXml::AddAttr(node, "ARRAYSIZE",
                             NStr::UIntToString(m_ArraySize));
        }
    }
    if (IsSetClassOrigin()) {
        NCimXml::AddAttr(node, "CLASSORIGIN", GetClassOrigin());
    }
    NCimXml::AddFlag(node, "PROPAGATED", m_Propagated);
    if (m_EmbeddedObject != eEmbeddedObject_None) {
        NCimXml::AddAttr(node, "EmbeddedObject",
                         GetEmbeddedObjectName(m_EmbeddedObject));
    }
    ITERATE(TCimQualifiers, it, m_Qualifiers) {
        node.push_back(it->second.ToCimXml());
    }
    if ( !m_Value.IsNull() ) {
        node.push_back(NCimXml::ValueToCimXml(m_Value, m_Type));
    }
    return node;
}


string CCimProperty::ToCimXmlStr(void) const
{
    return NCimXml::NodeToString(ToCimXml());
}


string CCimProperty::ToCimXmlStr(const string& indent) const
{
    return NCimXml::NodeToString(ToCimXml(), indent);
}


string CCimProperty::ToMof(bool is_instance, unsigned int indent) const
{
    string mof;
    unsigned int line_pos = indent;
    if (is_instance) {
        mof = NMof::Indent(indent) + m_Name + " = ";
        line_pos += (unsigned int) m_Name.size() + 3;
        mof += NMof::ValueToMof(m_Value, m_Type, indent + NMof::kIndent,
                                line_pos, 1);
        return mof + ";\n";
    }

    mof = NMof::QualifiersToMof(m_Qualifiers, indent);
    string decl = NMof::TypeToMof(m_Type, IsSetReferenceClass()
                                  ? GetReferenceClass() : kEmptyStr);
    decl += ' ';
    decl += m_Name;
    if (m_IsArray) {
        decl += '[';
        if ( !m_ArraySize.IsNull() ) {
            decl += NStr::UIntToString(m_ArraySize);
        }
        decl += ']';
    }
    mof += NMof::Indent(indent) + decl;
    line_pos += (unsigned int) decl.size();
    if ( !m_Value.IsNull() ) {
        mof += " = ";
        line_pos += 3;
        mof += NMof::ValueToMof(m_Value, m_Type, indent + NMof::kIndent,
                                line_pos, 1);
    }
    return mof + ";\n";
}


END_WBEM_SCOPE
