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
 *   CIM instance
 *
 */

#include <ncbi_pch.hpp>
#include <wbem/cim_instance.hpp>
#include <wbem/cim_class.hpp>
#include <wbem/cim_xml.hpp>
#include <wbem/error_codes.hpp>
#include "wbem_p.hpp"


#define NCBI_USE_ERRCODE_X   Wbem_Obj


BEGIN_WBEM_SCOPE


CCimInstance::CCimInstance(const string& classname)
    : m_HasPropertyList(false)
{
    SetClassname(classname);
}


CCimInstance::CCimInstance(const string& classname,
                           const TCimNamedValues& properties)
    : m_HasPropertyList(false)
{
    SetClassname(classname);
    SetProperties(properties);
}


CCimInstance::CCimInstance(const string& classname,
                           const vector<CCimProperty>& properties)
    : m_HasPropertyList(false)
{
    SetClassname(classname);
    SetProperties(properties);
}


CCimInstance::CCimInstance(const CCimInstance& other)
    : CObject(),
      m_Classname(other.m_Classname),
      m_Properties(other.m_Properties),
      m_Qualifiers(other.m_Qualifiers),
      m_HasPropertyList(other.m_HasPropertyList),
      m_PropertyList(other.m_PropertyList)
{
    if (other.m_Path) {
        m_Path.Reset(new CCimInstanceName(*other.m_Path));
    }
}


CCimInstance& CCimInstance::operator=(const CCimInstance& other)
{
    if (this != &other) {
        m_Classname       = other.m_Classname;
        m_Properties      = other.m_Properties;
        m_Qualifiers      = other.m_Qualifiers;
        m_HasPropertyList = other.m_HasPropertyList;
        m_PropertyList    = other.m_PropertyList;
        m_Path.Reset(other.m_Path
                     ? new CCimInstanceName(*other.m_Path) : 0);
    }
    return *this;
}


CRef<CCimInstance> CCimInstance::FromClass(
    const CCimClass&        cls,
    const TCimNamedValues&  property_values,
    const string&           name_space,
    bool                    include_path,
    bool                    include_class_origin,
    bool                    include_missing_properties,
    bool                    strict)
{
    CNocaseDict<CCimValue> values;
    ITERATE(TCimNamedValues, it, property_values) {
        if ( !cls.GetProperties().Has(it->first) ) {
            NCBI_THROW(CCimException, eValue,
                       "Property '" + it->first + "' is not declared in "
                       "class '" + cls.GetClassname() + "'");
        }
        values.Set(it->first, it->second);
    }

    CRef<CCimInstance> inst(new CCimInstance(cls.GetClassname()));
    ITERATE(TCimProperties, it, cls.GetProperties()) {
        const CCimProperty& decl = it->second;
        const CCimValue* value = values.Find(decl.GetName());
        if ( !value  &&  !include_missing_properties ) {
            continue;
        }
        try {
            CCimProperty prop(decl.GetName(),
                              value ? *value : decl.GetValue(),
                              decl.GetType(), decl.IsArray(),
                              decl.GetEmbeddedObject(),
                              decl.IsSetReferenceClass()
                              ? decl.GetReferenceClass() : kEmptyStr);
            if (include_class_origin  &&  decl.IsSetClassOrigin()) {
                prop.SetClassOrigin(decl.GetClassOrigin());
            }
            inst->SetProperty(prop);
        }
        catch (CCimException& e) {
            if (e.GetErrCode() != CCimException::eType) {
                throw;
            }
            NCBI_RETHROW(e, CCimException, eValue,
                         "Value of property '" + decl.GetName() +
                         "' does not match its declared type " +
                         GetCimTypeName(decl.GetType()));
        }
    }

    if (include_path) {
        CRef<CCimInstanceName> path =
            CCimInstanceName::FromInstance(cls, *inst, name_space,
                                           kEmptyStr, strict);
        inst->m_Path = path;
    }
    return inst;
}


void CCimInstance::SetClassname(const string& classname)
{
    CheckName(classname, "class");
    m_Classname = classname;
}


void CCimInstance::SetProperties(const TCimProperties& properties)
{
    TCimProperties checked = BuildNamedObjects(properties);
    m_Properties.clear();
    ITERATE(TCimProperties, it, checked) {
        SetProperty(it->second);
    }
}


void CCimInstance::SetProperties(const vector<CCimProperty>& properties)
{
    m_Properties.clear();
    ITERATE(vector<CCimProperty>, it, properties) {
        SetProperty(*it);
    }
}


void CCimInstance::SetProperties(const TCimNamedValues& properties)
{
    TCimProperties built = BuildNamedObjects<CCimProperty>(properties);
    m_Properties.clear();
    ITERATE(TCimProperties, it, built) {
        SetProperty(it->second);
    }
}


bool CCimInstance::x_IsFiltered(const string& name) const
{
    if ( !m_HasPropertyList ) {
        return false;
    }
    ITERATE(vector<string>, it, m_PropertyList) {
        if (NStr::EqualNocase(*it, name)) {
            return false;
        }
    }
    return !(m_Path  &&  m_Path->Has(name));
}


void CCimInstance::SetProperty(const CCimProperty& property)
{
    if (x_IsFiltered(property.GetName())) {
        ERR_POST_X(2, Info << "Property '" << property.GetName()
                   << "' of instance of " << m_Classname
                   << " is not in the property list and is ignored");
        return;
    }
    if (m_Path  &&  m_Path->Has(property.GetName())) {
        m_Path->SetKeybinding(m_Path->GetKeybindings()
                              .GetKey(property.GetName()),
                              property.GetValue());
    }
    m_Properties.Set(property.GetName(), property);
}


void CCimInstance::SetPropertyValue(const string& name, const CCimValue& value)
{
    const CCimProperty* existing = m_Properties.Find(name);
    if (existing) {
        CCimProperty prop(*existing);
        prop.SetValue(value);
        SetProperty(prop);
    } else {
        SetProperty(CCimProperty(name, value));
    }
}


const CCimValue& CCimInstance::operator[](const string& name) const
{
    return m_Properties.Get(name).GetValue();
}


CCimValue CCimInstance::Get(const string& name, const CCimValue& def) const
{
    const CCimProperty* prop = m_Properties.Find(name);
    return prop ? prop->GetValue() : def;
}


void CCimInstance::Update(const TCimNamedValues& values)
{
    ITERATE(TCimNamedValues, it, values) {
        SetPropertyValue(it->first, it->second);
    }
}


void CCimInstance::Update(const vector<CCimProperty>& properties)
{
    ITERATE(vector<CCimProperty>, it, properties) {
        SetProperty(*it);
    }
}


void CCimInstance::UpdateExisting(const TCimNamedValues& values)
{
    ITERATE(TCimNamedValues, it, values) {
        if (m_Properties.Has(it->first)) {
            SetPropertyValue(it->first, it->second);
        }
    }
}


void CCimInstance::SetQualifiers(const TCimQualifiers& qualifiers)
{
    m_Qualifiers = BuildNamedObjects(qualifiers);
}


void CCimInstance::SetQualifiers(const vector<CCimQualifier>& qualifiers)
{
    m_Qualifiers = BuildNamedObjects(qualifiers);
}


void CCimInstance::SetQualifiers(const TCimNamedValues& qualifiers)
{
    m_Qualifiers = BuildNamedObjects<CCimQualifier>(qualifiers);
}


void CCimInstance::SetQualifier(const CCimQualifier& qualifier)
{
    m_Qualifiers.Set(qualifier.GetName(), qualifier);
}


const CCimInstanceName& CCimInstance::GetPath(void) const
{
    if ( !m_Path ) {
        NCBI_THROW(CCimException, eValue,
                   "Instance of " + m_Classname + " has no path");
    }
    return *m_Path;
}


CCimInstanceName& CCimInstance::SetPath(void)
{
    if ( !m_Path ) {
        NCBI_THROW(CCimException, eValue,
                   "Instance of " + m_Classname + " has no path");
    }
    return *m_Path;
}


void CCimInstance::SetPath(const CCimInstanceName& path)
{
    CRef<CCimInstanceName> new_path(new CCimInstanceName(path));
    ITERATE(TCimProperties, it, m_Properties) {
        if (new_path->Has(it->first)) {
            new_path->SetKeybinding(
                new_path->GetKeybindings().GetKey(it->first),
                it->second.GetValue());
        }
    }
    m_Path = new_path;
}


void CCimInstance::SetPropertyList(const vector<string>& names)
{
    ERR_POST_X(1, Warning << "The property list of CIM instances is "
               "deprecated (instance of " << m_Classname << ")");
    m_HasPropertyList = true;
    m_PropertyList    = names;
}


void CCimInstance::ResetPropertyList(void)
{
    m_HasPropertyList = false;
    m_PropertyList.clear();
}


bool CCimInstance::operator==(const CCimInstance& other) const
{
    if ( !NStr::EqualNocase(m_Classname, other.m_Classname)  ||
         m_Properties != other.m_Properties  ||
         m_Qualifiers != other.m_Qualifiers  ||
         m_HasPropertyList != other.m_HasPropertyList ) {
        return false;
    }
    if (m_Path.NotEmpty() != other.m_Path.NotEmpty()) {
        return false;
    }
    if (m_Path  &&  *m_Path != *other.m_Path) {
        return false;
    }
    if (m_PropertyList.size() != other.m_PropertyList.size()) {
        return false;
    }
    for (size_t i = 0;  i < m_PropertyList.size();  ++i) {
        if ( !NStr::EqualNocase(m_PropertyList[i], other.m_PropertyList[i]) ) {
            return false;
        }
    }
    return true;
}


size_t CCimInstance::GetHash(void) const
{
    size_t ret = HashNocase(m_Classname);
    ret = HashCombine(ret, HashNocaseDict(m_Properties));
    ret = HashCombine(ret, HashNocaseDict(m_Qualifiers));
    ret = HashCombine(ret, m_Path ? m_Path->GetHash() : 0);
    ITERATE(vector<string>, it, m_PropertyList) {
        ret = HashCombine(ret, HashNocase(*it));
    }
    return ret;
}


xml::node CCimInstance::ToCimXml(bool ignore_path) const
{
    xml::node inst("INSTANCE");
    NCimXml::AddAttr(inst, "CLASSNAME", m_Classname);
    ITERATE(TCimQualifiers, it, m_Qualifiers) {
        inst.push_back(it->second.ToCimXml());
    }
    ITERATE(TCimProperties, it, m_Properties) {
        inst.push_back(it->second.ToCimXml());
    }
    if (ignore_path  ||  !m_Path) {
        return inst;
    }

    const char* name = !m_Path->IsSetNamespace() ? "VALUE.NAMEDINSTANCE"
        : (!m_Path->IsSetHost() ? "VALUE.OBJECTWITHLOCALPATH"
                                : "VALUE.INSTANCEWITHPATH");
    xml::node node(name);
    node.push_back(m_Path->ToCimXml());
    node.push_back(inst);
    return node;
}


string CCimInstance::ToCimXmlStr(void) const
{
    return NCimXml::NodeToString(ToCimXml());
}


string CCimInstance::ToCimXmlStr(const string& indent) const
{
    return NCimXml::NodeToString(ToCimXml(), indent);
}


string CCimInstance::ToMof(void) const
{
    string mof = NMof::QualifiersToMof(m_Qualifiers, 0);
    mof += "instance of " + m_Classname + " {\n";
    ITERATE(TCimProperties, it, m_Properties) {
        mof += it->second.ToMof(true, NMof::kIndent);
    }
    return mof + "};\n";
}


END_WBEM_SCOPE
