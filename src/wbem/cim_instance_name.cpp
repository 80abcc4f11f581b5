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
 *   CIM instance path
 *
 */

#include <ncbi_pch.hpp>
#include <wbem/cim_instance_name.hpp>
#include <wbem/cim_property.hpp>
#include <wbem/cim_instance.hpp>
#include <wbem/cim_class.hpp>
#include <wbem/cim_xml.hpp>
#include "wbem_p.hpp"


BEGIN_WBEM_SCOPE


static void s_CheckKeyValue(const string&      name,
                            const CCimValue&   value,
                            const CWbemConfig& config)
{
    if (name.empty()) {
        NCBI_THROW(CCimException, eValue, "Keybinding name must not be empty");
    }
    switch (value.GetKind()) {
    case CCimValue::eKind_Null:
        if ( !config.GetIgnoreNullKeyValue() ) {
            NCBI_THROW(CCimException, eValue,
                       "Keybinding '" + name + "' has a NULL value");
        }
        break;
    case CCimValue::eKind_Array:
    case CCimValue::eKind_Instance:
    case CCimValue::eKind_Class:
    case CCimValue::eKind_ClassName:
        NCBI_THROW(CCimException, eType,
                   "Keybinding '" + name + "' cannot have the value " +
                   value.AsString());
    default:
        break;
    }
}


CCimInstanceName::CCimInstanceName(const string& classname,
                                   const string& host,
                                   const string& name_space)
{
    SetClassname(classname);
    SetHost(host);
    SetNamespace(name_space);
}


CCimInstanceName::CCimInstanceName(const string&       classname,
                                   const TKeybindings& keybindings,
                                   const string&       host,
                                   const string&       name_space,
                                   const CWbemConfig&  config)
{
    SetClassname(classname);
    SetKeybindings(keybindings, config);
    SetHost(host);
    SetNamespace(name_space);
}


CCimInstanceName::CCimInstanceName(const string&          classname,
                                   const TCimNamedValues& keybindings,
                                   const string&          host,
                                   const string&          name_space,
                                   const CWbemConfig&     config)
{
    SetClassname(classname);
    SetKeybindings(keybindings, config);
    SetHost(host);
    SetNamespace(name_space);
}


CRef<CCimInstanceName> CCimInstanceName::FromWbemUri(const string& uri,
                                                     const CWbemConfig& config)
{
    SWbemUriParts parts;
    NWbemUri::Parse(uri, parts);
    if ( !parts.has_keys ) {
        NCBI_THROW(CCimException, eValue,
                   "WBEM URI of an instance path has no '.' after the "
                   "class name: " + uri);
    }
    CRef<CCimInstanceName> ret(
        new CCimInstanceName(parts.classname, parts.keybindings,
                             kEmptyStr, kEmptyStr, config));
    if ( !parts.host.IsNull() ) {
        ret->SetHost(parts.host);
    }
    if ( !parts.name_space.IsNull() ) {
        ret->SetNamespace(parts.name_space);
    }
    return ret;
}


CRef<CCimInstanceName> CCimInstanceName::FromInstance(
    const CCimClass&    cls,
    const CCimInstance& inst,
    const string&       name_space,
    const string&       host,
    bool                strict,
    const CWbemConfig&  config)
{
    CRef<CCimInstanceName> ret(
        new CCimInstanceName(cls.GetClassname(), host, name_space));
    ITERATE(TCimProperties, it, cls.GetProperties()) {
        const CCimQualifier* key = it->second.GetQualifiers().Find("Key");
        if ( !key  ||  !key->GetValue().IsBoolean()  ||
             !key->GetValue().GetBoolean() ) {
            continue;
        }
        const CCimProperty* prop = inst.GetProperties().Find(it->first);
        if ( !prop  ||  prop->GetValue().IsNull() ) {
            if (strict) {
                NCBI_THROW(CCimException, eValue,
                           "Key property '" + it->second.GetName() +
                           "' of class '" + cls.GetClassname() +
                           "' has no value in the instance");
            }
            continue;
        }
        ret->SetKeybinding(it->second.GetName(), prop->GetValue(), config);
    }
    return ret;
}


void CCimInstanceName::SetClassname(const string& classname)
{
    CheckName(classname, "class");
    m_Classname = classname;
}


void CCimInstanceName::SetHost(const string& host)
{
    if (host.empty()) {
        m_Host = null;
    } else {
        m_Host = host;
    }
}


void CCimInstanceName::SetNamespace(const string& name_space)
{
    string stripped = StripNamespace(name_space);
    if (stripped.empty()) {
        m_Namespace = null;
    } else {
        m_Namespace = stripped;
    }
}


void CCimInstanceName::SetKeybindings(const TKeybindings& keybindings,
                                      const CWbemConfig& config)
{
    TKeybindings new_keys;
    ITERATE(TKeybindings, it, keybindings) {
        s_CheckKeyValue(it->first, it->second, config);
        new_keys.Set(it->first, it->second);
    }
    m_Keybindings = new_keys;
}


void CCimInstanceName::SetKeybindings(const TCimNamedValues& keybindings,
                                      const CWbemConfig& config)
{
    TKeybindings new_keys;
    ITERATE(TCimNamedValues, it, keybindings) {
        s_CheckKeyValue(it->first, it->second, config);
        new_keys.Set(it->first, it->second);
    }
    m_Keybindings = new_keys;
}


void CCimInstanceName::SetKeybindings(const vector<CCimProperty>& properties,
                                      const CWbemConfig& config)
{
    TKeybindings new_keys;
    ITERATE(vector<CCimProperty>, it, properties) {
        s_CheckKeyValue(it->GetName(), it->GetValue(), config);
        new_keys.Set(it->GetName(), it->GetValue());
    }
    m_Keybindings = new_keys;
}


void CCimInstanceName::SetKeybinding(const string&      name,
                                     const CCimValue&   value,
                                     const CWbemConfig& config)
{
    s_CheckKeyValue(name, value, config);
    m_Keybindings.Set(name, value);
}


void CCimInstanceName::Update(const TCimNamedValues& keybindings,
                              const CWbemConfig& config)
{
    ITERATE(TCimNamedValues, it, keybindings) {
        s_CheckKeyValue(it->first, it->second, config);
    }
    ITERATE(TCimNamedValues, it, keybindings) {
        m_Keybindings.Set(it->first, it->second);
    }
}


void CCimInstanceName::Update(const TKeybindings& keybindings,
                              const CWbemConfig& config)
{
    ITERATE(TKeybindings, it, keybindings) {
        s_CheckKeyValue(it->first, it->second, config);
    }
    ITERATE(TKeybindings, it, keybindings) {
        m_Keybindings.Set(it->first, it->second);
    }
}


CCimValue CCimInstanceName::Get(const string& name, const CCimValue& def) const
{
    const CCimValue* value = m_Keybindings.Find(name);
    return value ? *value : def;
}


bool CCimInstanceName::operator==(const CCimInstanceName& other) const
{
    return NStr::EqualNocase(m_Classname, other.m_Classname)
        &&  m_Keybindings == other.m_Keybindings
        &&  NullableEqualNocase(m_Host, other.m_Host)
        &&  NullableEqualNocase(m_Namespace, other.m_Namespace);
}


size_t CCimInstanceName::GetHash(void) const
{
    size_t ret = HashNocase(m_Classname);
    ret = HashCombine(ret, HashNocaseDict(m_Keybindings));
    ret = HashCombine(ret, NullableHashNocase(m_Host));
    return HashCombine(ret, NullableHashNocase(m_Namespace));
}


string CCimInstanceName::ToWbemUri(EWbemUriFormat format) const
{
    return NWbemUri::FormatPath(m_Host, m_Namespace, m_Classname, format) +
        '.' + NWbemUri::FormatKeybindings(m_Keybindings, format);
}


xml::node CCimInstanceName::x_KeybindingToCimXml(const string&    name,
                                                 const CCimValue& value) const
{
    xml::node node("KEYBINDING");
    NCimXml::AddAttr(node, "NAME", name);

    const char* value_type = 0;
    switch (value.GetKind()) {
    case CCimValue::eKind_Null:
        return node;
    case CCimValue::eKind_InstanceName:
        node.push_back(NCimXml::CreateValueReference(value));
        return node;
    case CCimValue::eKind_Boolean:
        value_type = "boolean";
        break;
    case CCimValue::eKind_Integer:
    case CCimValue::eKind_Real:
        value_type = "numeric";
        break;
    case CCimValue::eKind_String:
    case CCimValue::eKind_Char16:
    case CCimValue::eKind_DateTime:
        value_type = "string";
        break;
    default:
        NCBI_THROW(CCimException, eType,
                   "Keybinding '" + name + "' cannot have the value " +
                   value.AsString());
    }
    xml::node key_value("KEYVALUE",
                        NCimXml::ScalarToText(value).c_str());
    NCimXml::AddAttr(key_value, "VALUETYPE", value_type);
    // TYPE keeps datetime, char16 and sized numbers apart from plain
    // strings and untyped numbers
    if (value.IsDateTime()) {
        NCimXml::AddAttr(key_value, "TYPE", "datetime");
    } else if (value.IsChar16()) {
        NCimXml::AddAttr(key_value, "TYPE", "char16");
    } else if (value.IsNumber()  &&  value.IsTyped()) {
        NCimXml::AddAttr(key_value, "TYPE",
                         GetCimTypeName(value.GetNumberType()));
    }
    node.push_back(key_value);
    return node;
}


xml::node CCimInstanceName::ToCimXml(bool ignore_host,
                                     bool ignore_namespace) const
{
    xml::node name("INSTANCENAME");
    NCimXml::AddAttr(name, "CLASSNAME", m_Classname);
    ITERATE(TKeybindings, it, m_Keybindings) {
        name.push_back(x_KeybindingToCimXml(it->first, it->second));
    }
    if (m_Namespace.IsNull()  ||  ignore_namespace) {
        return name;
    }
    if (m_Host.IsNull()  ||  ignore_host) {
        xml::node node("LOCALINSTANCEPATH");
        node.push_back(NCimXml::CreateLocalNamespacePath(m_Namespace));
        node.push_back(name);
        return node;
    }
    xml::node node("INSTANCEPATH");
    node.push_back(NCimXml::CreateNamespacePath(m_Host, m_Namespace));
    node.push_back(name);
    return node;
}


string CCimInstanceName::ToCimXmlStr(void) const
{
    return NCimXml::NodeToString(ToCimXml());
}


string CCimInstanceName::ToCimXmlStr(const string& indent) const
{
    return NCimXml::NodeToString(ToCimXml(), indent);
}


END_WBEM_SCOPE
