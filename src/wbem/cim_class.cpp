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
 *   CIM class declaration
 *
 */

#include <ncbi_pch.hpp>
#include <wbem/cim_class.hpp>
#include <wbem/cim_xml.hpp>
#include "wbem_p.hpp"


BEGIN_WBEM_SCOPE


CCimClass::CCimClass(const string& classname, const string& superclass)
{
    SetClassname(classname);
    SetSuperclass(superclass);
}


CCimClass::CCimClass(const CCimClass& other)
    : CObject(),
      m_Classname(other.m_Classname),
      m_Superclass(other.m_Superclass),
      m_Properties(other.m_Properties),
      m_Methods(other.m_Methods),
      m_Qualifiers(other.m_Qualifiers)
{
    if (other.m_Path) {
        m_Path.Reset(new CCimClassName(*other.m_Path));
    }
}


CCimClass& CCimClass::operator=(const CCimClass& other)
{
    if (this != &other) {
        m_Classname  = other.m_Classname;
        m_Superclass = other.m_Superclass;
        m_Properties = other.m_Properties;
        m_Methods    = other.m_Methods;
        m_Qualifiers = other.m_Qualifiers;
        m_Path.Reset(other.m_Path ? new CCimClassName(*other.m_Path) : 0);
    }
    return *this;
}


void CCimClass::SetClassname(const string& classname)
{
    CheckName(classname, "class");
    m_Classname = classname;
}


void CCimClass::SetSuperclass(const string& superclass)
{
    if (superclass.empty()) {
        m_Superclass = null;
    } else {
        m_Superclass = superclass;
    }
}


void CCimClass::SetProperties(const TCimProperties& properties)
{
    m_Properties = BuildNamedObjects(properties);
}


void CCimClass::SetProperties(const vector<CCimProperty>& properties)
{
    m_Properties = BuildNamedObjects(properties);
}


void CCimClass::SetProperty(const CCimProperty& property)
{
    m_Properties.Set(property.GetName(), property);
}


void CCimClass::SetMethods(const TCimMethods& methods)
{
    m_Methods = BuildNamedObjects(methods);
}


void CCimClass::SetMethods(const vector<CCimMethod>& methods)
{
    m_Methods = BuildNamedObjects(methods);
}


void CCimClass::SetMethod(const CCimMethod& method)
{
    m_Methods.Set(method.GetName(), method);
}


void CCimClass::SetQualifiers(const TCimQualifiers& qualifiers)
{
    m_Qualifiers = BuildNamedObjects(qualifiers);
}


void CCimClass::SetQualifiers(const vector<CCimQualifier>& qualifiers)
{
    m_Qualifiers = BuildNamedObjects(qualifiers);
}


void CCimClass::SetQualifiers(const TCimNamedValues& qualifiers)
{
    m_Qualifiers = BuildNamedObjects<CCimQualifier>(qualifiers);
}


void CCimClass::SetQualifier(const CCimQualifier& qualifier)
{
    m_Qualifiers.Set(qualifier.GetName(), qualifier);
}


const CCimClassName& CCimClass::GetPath(void) const
{
    if ( !m_Path ) {
        NCBI_THROW(CCimException, eValue,
                   "Class " + m_Classname + " has no path");
    }
    return *m_Path;
}


void CCimClass::SetPath(const CCimClassName& path)
{
    m_Path.Reset(new CCimClassName(path));
}


bool CCimClass::operator==(const CCimClass& other) const
{
    if ( !NStr::EqualNocase(m_Classname, other.m_Classname)  ||
         !NullableEqualNocase(m_Superclass, other.m_Superclass)  ||
         m_Properties != other.m_Properties  ||
         m_Methods != other.m_Methods  ||
         m_Qualifiers != other.m_Qualifiers ) {
        return false;
    }
    if (m_Path.NotEmpty() != other.m_Path.NotEmpty()) {
        return false;
    }
    return !m_Path  ||  *m_Path == *other.m_Path;
}


size_t CCimClass::GetHash(void) const
{
    size_t ret = HashNocase(m_Classname);
    ret = HashCombine(ret, NullableHashNocase(m_Superclass));
    ret = HashCombine(ret, HashNocaseDict(m_Properties));
    ret = HashCombine(ret, HashNocaseDict(m_Methods));
    ret = HashCombine(ret, HashNocaseDict(m_Qualifiers));
    return HashCombine(ret, m_Path ? m_Path->GetHash() : 0);
}


xml::node CCimClass::ToCimXml(void) const
{
    xml::node node("CLASS");
    NCimXml::AddAttr(node, "NAME", m_Classname);
    if (IsSetSuperclass()) {
        NCimXml::AddAttr(node, "SUPERCLASS", GetSuperclass());
    }
    ITERATE(TCimQualifiers, it, m_Qualifiers) {
        node.push_back(it->second.ToCimXml());
    }
    ITERATE(TCimProperties, it, m_Properties) {
        node.push_back(it->second.ToCimXml());
    }
    ITERATE(TCimMethods, it, m_Methods) {
        node.push_back(it->second.ToCimXml());
    }
    return node;
}


string CCimClass::ToCimXmlStr(void) const
{
    return NCimXml::NodeToString(ToCimXml());
}


string CCimClass::ToCimXmlStr(const string& indent) const
{
    return NCimXml::NodeToString(ToCimXml(), indent);
}


string CCimClass::ToMof(void) const
{
    string mof = NMof::QualifiersToMof(m_Qualifiers, 0);
    mof += "class " + m_Classname;
    if (IsSetSuperclass()) {
        mof += " : " + GetSuperclass();
    }
    mof += " {\n";
    ITERATE(TCimProperties, it, m_Properties) {
        mof += '\n';
        mof += it->second.ToMof(false, NMof::kIndent);
    }
    ITERATE(TCimMethods, it, m_Methods) {
        mof += '\n';
        mof += it->second.ToMof(NMof::kIndent);
    }
    return mof + "\n};\n";
}


END_WBEM_SCOPE
