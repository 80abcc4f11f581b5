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
 *   CIM qualifier declaration
 *
 */

#include <ncbi_pch.hpp>
#include <wbem/cim_qualifier_decl.hpp>
#include <wbem/cim_xml.hpp>
#include <wbem/cim_mof.hpp>
#include "wbem_p.hpp"


BEGIN_WBEM_SCOPE


// Scopes in the order of the SCOPE element attributes; ANY is not one
static const char* const kScopeNames[] = {
    "CLASS",
    "ASSOCIATION",
    "REFERENCE",
    "PROPERTY",
    "METHOD",
    "PARAMETER",
    "INDICATION"
};

static const char* kScopeAny = "ANY";


static void s_CheckScopeName(const string& scope)
{
    if (NStr::EqualNocase(scope, kScopeAny)) {
        return;
    }
    for (size_t i = 0;  i < ArraySize(kScopeNames);  ++i) {
        if (NStr::EqualNocase(scope, kScopeNames[i])) {
            return;
        }
    }
    NCBI_THROW(CCimException, eValue, "Invalid qualifier scope: " + scope);
}


CCimQualifierDeclaration::CCimQualifierDeclaration(const string&     name,
                                                   ECimType          type,
                                                   const CCimValue&  value,
                                                   TCimFlag          is_array,
                                                   TCimArraySize     array_size,
                                                   TCimFlag          overridable,
                                                   TCimFlag          tosubclass,
                                                   TCimFlag          toinstance,
                                                   TCimFlag          translatable)
    : m_Name(name),
      m_Type(type),
      m_IsArray(is_array.IsNull() ? value.IsArray() : bool(is_array)),
      m_Overridable(overridable),
      m_ToSubclass(tosubclass),
      m_ToInstance(toinstance),
      m_Translatable(translatable)
{
    CheckName(m_Name, "qualifier declaration");
    if (m_Type == eCimType_reference) {
        NCBI_THROW(CCimException, eValue,
                   "Qualifier declaration '" + m_Name +
                   "' cannot have reference type");
    }
    SetArraySize(array_size);
    SetValue(value);
}


void CCimQualifierDeclaration::SetName(const string& name)
{
    CheckName(name, "qualifier declaration");
    m_Name = name;
}


void CCimQualifierDeclaration::SetType(ECimType type)
{
    if (type == eCimType_reference) {
        NCBI_THROW(CCimException, eValue,
                   "Qualifier declaration '" + m_Name +
                   "' cannot have reference type");
    }
    m_Value = m_Value.ConvertTo(type);
    m_Type  = type;
}


void CCimQualifierDeclaration::SetValue(const CCimValue& value)
{
    x_Validate(value);
    m_Value = value.ConvertTo(m_Type);
}


void CCimQualifierDeclaration::SetIsArray(bool is_array)
{
    bool saved = m_IsArray;
    m_IsArray = is_array;
    try {
        x_Validate(m_Value);
        SetArraySize(m_ArraySize);
    }
    catch (CCimException&) {
        m_IsArray = saved;
        throw;
    }
}


void CCimQualifierDeclaration::SetArraySize(TCimArraySize array_size)
{
    if ( !array_size.IsNull()  &&  !m_IsArray ) {
        NCBI_THROW(CCimException, eValue,
                   "Scalar qualifier declaration '" + m_Name +
                   "' cannot have an array size");
    }
    m_ArraySize = array_size;
}


void CCimQualifierDeclaration::SetScopes(const TScopes& scopes)
{
    TScopes new_scopes;
    ITERATE(TScopes, it, scopes) {
        s_CheckScopeName(it->first);
        new_scopes.Set(it->first, it->second);
    }
    m_Scopes = new_scopes;
}


void CCimQualifierDeclaration::SetScopes(const TScopeList& scopes)
{
    TScopes new_scopes;
    ITERATE(TScopeList, it, scopes) {
        s_CheckScopeName(it->first);
        new_scopes.Set(it->first, it->second);
    }
    m_Scopes = new_scopes;
}


void CCimQualifierDeclaration::SetScope(const string& scope, bool value)
{
    s_CheckScopeName(scope);
    m_Scopes.Set(scope, value);
}


void CCimQualifierDeclaration::x_Validate(const CCimValue& value) const
{
    if (value.IsArray()  &&  !m_IsArray) {
        NCBI_THROW(CCimException, eValue,
                   "Scalar qualifier declaration '" + m_Name +
                   "' cannot have an array value");
    }
    if ( !value.IsNull()  &&  !value.IsArray()  &&  m_IsArray) {
        NCBI_THROW(CCimException, eValue,
                   "Array qualifier declaration '" + m_Name +
                   "' cannot have a scalar value " + value.AsString());
    }
    if (value.InferEmbeddedObject() != eEmbeddedObject_None) {
        NCBI_THROW(CCimException, eValue,
                   "Qualifier declaration '" + m_Name +
                   "' cannot have an embedded object value");
    }
}


bool CCimQualifierDeclaration::operator==(
    const CCimQualifierDeclaration& other) const
{
    return NStr::EqualNocase(m_Name, other.m_Name)
        &&  m_Type == other.m_Type
        &&  m_Value == other.m_Value
        &&  m_IsArray == other.m_IsArray
        &&  NullableEqual(m_ArraySize, other.m_ArraySize)
        &&  m_Scopes == other.m_Scopes
        &&  NullableEqual(m_Overridable,  other.m_Overridable)
        &&  NullableEqual(m_ToSubclass,   other.m_ToSubclass)
        &&  NullableEqual(m_ToInstance,   other.m_ToInstance)
        &&  NullableEqual(m_Translatable, other.m_Translatable);
}


size_t CCimQualifierDeclaration::GetHash(void) const
{
    size_t ret = HashNocase(m_Name);
    ret = HashCombine(ret, m_Type);
    ret = HashCombine(ret, m_Value.GetHash());
    ret = HashCombine(ret, m_IsArray);
    ret = HashCombine(ret, NullableHash(m_ArraySize));
    ret = HashCombine(ret, HashNocaseDict(m_Scopes));
    ret = HashCombine(ret, NullableHash(m_Overridable));
    ret = HashCombine(ret, NullableHash(m_ToSubclass));
    ret = HashCombine(ret, NullableHash(m_ToInstance));
    return HashCombine(ret, NullableHash(m_Translatable));
}


xml::node CCimQualifierDeclaration::ToCimXml(void) const
{
    xml::node node("QUALIFIER.DECLARATION");
    NCimXml::AddAttr(node, "NAME", m_Name);
    NCimXml::AddAttr(node, "TYPE", GetCimTypeName(m_Type));
    NCimXml::AddFlag(node, "ISARRAY", m_IsArray);
    if ( !m_ArraySize.IsNull() ) {
        NCimXml::AddAttr(node, "ARRAYSIZE", NStr::UIntToString(m_ArraySize));
    }
    NCimXml::AddFlag(node, "OVERRIDABLE",  m_Overridable);
    NCimXml::AddFlag(node, "TOSUBCLASS",   m_ToSubclass);
    NCimXml::AddFlag(node, "TOINSTANCE",   m_ToInstance);
    NCimXml::AddFlag(node, "TRANSLATABLE", m_Translatable);

    if ( !m_Scopes.empty() ) {
        xml::node scope("SCOPE");
        const bool* any = m_Scopes.Find(kScopeAny);
        for (size_t i = 0;  i < ArraySize(kScopeNames);  ++i) {
            const bool* value = m_Scopes.Find(kScopeNames[i]);
            if (any  &&  *any) {
                NCimXml::AddFlag(scope, kScopeNames[i], true);
            } else if (value) {
                NCimXml::AddFlag(scope, kScopeNames[i], *value);
            }
        }
        node.push_back(scope);
    }
    if ( !m_Value.IsNull() ) {
        node.push_back(NCimXml::ValueToCimXml(m_Value, m_Type));
    }
    return node;
}


string CCimQualifierDeclaration::ToCimXmlStr(void) const
{
    return NCimXml::NodeToString(ToCimXml());
}


string CCimQualifierDeclaration::ToCimXmlStr(const string& indent) const
{
    return NCimXml::NodeToString(ToCimXml(), indent);
}


string CCimQualifierDeclaration::ToMof(void) const
{
    static const unsigned int kContIndent = 4;

    string mof = "Qualifier " + m_Name + " : " + GetCimTypeName(m_Type);
    if (m_IsArray) {
        mof += '[';
        if ( !m_ArraySize.IsNull() ) {
            mof += NStr::UIntToString(m_ArraySize);
        }
        mof += ']';
    }
    if ( !m_Value.IsNull() ) {
        mof += " = ";
        unsigned int line_pos = (unsigned int) mof.size();
        mof += NMof::ValueToMof(m_Value, m_Type, kContIndent, line_pos, 1);
    }

    list<string> scopes;
    ITERATE(TScopes, it, m_Scopes) {
        if (it->second) {
            scopes.push_back(it->first);
            NStr::ToLower(scopes.back());
        }
    }
    mof += ",\n" + NMof::Indent(kContIndent) +
        "Scope(" + NStr::Join(scopes, ", ") + ")";

    list<string> flavors;
    if ( !m_Overridable.IsNull() ) {
        flavors.push_back(bool(m_Overridable) ? "EnableOverride"
                                              : "DisableOverride");
    }
    if ( !m_ToSubclass.IsNull() ) {
        flavors.push_back(bool(m_ToSubclass) ? "ToSubclass" : "Restricted");
    }
    if ( !m_Translatable.IsNull()  &&  bool(m_Translatable) ) {
        flavors.push_back("Translatable");
    }
    if ( !flavors.empty() ) {
        mof += ",\n" + NMof::Indent(kContIndent) +
            "Flavor(" + NStr::Join(flavors, ", ") + ")";
    }
    return mof + ";\n";
}


END_WBEM_SCOPE
