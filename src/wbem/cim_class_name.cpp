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
 *   CIM class path
 *
 */

#include <ncbi_pch.hpp>
#include <wbem/cim_class_name.hpp>
#include <wbem/cim_xml.hpp>
#include "wbem_p.hpp"


BEGIN_WBEM_SCOPE


CCimClassName::CCimClassName(const string& classname,
                             const string& host,
                             const string& name_space)
{
    SetClassname(classname);
    SetHost(host);
    SetNamespace(name_space);
}


CRef<CCimClassName> CCimClassName::FromWbemUri(const string& uri)
{
    SWbemUriParts parts;
    NWbemUri::Parse(uri, parts);
    if (parts.has_keys) {
        NCBI_THROW(CCimException, eValue,
                   "WBEM URI of a class path has keybindings: " + uri);
    }
    CRef<CCimClassName> ret(new CCimClassName(parts.classname));
    if ( !parts.host.IsNull() ) {
        ret->SetHost(parts.host);
    }
    if ( !parts.name_space.IsNull() ) {
        ret->SetNamespace(parts.name_space);
    }
    return ret;
}


void CCimClassName::SetClassname(const string& classname)
{
    CheckName(classname, "class");
    m_Classname = classname;
}


void CCimClassName::SetHost(const string& host)
{
    if (host.empty()) {
        m_Host = null;
    } else {
        m_Host = host;
    }
}


void CCimClassName::SetNamespace(const string& name_space)
{
    string stripped = StripNamespace(name_space);
    if (stripped.empty()) {
        m_Namespace = null;
    } else {
        m_Namespace = stripped;
    }
}


bool CCimClassName::operator==(const CCimClassName& other) const
{
    return NStr::EqualNocase(m_Classname, other.m_Classname)
        &&  NullableEqualNocase(m_Host, other.m_Host)
        &&  NullableEqualNocase(m_Namespace, other.m_Namespace);
}


size_t CCimClassName::GetHash(void) const
{
    size_t ret = HashNocase(m_Classname);
    ret = HashCombine(ret, NullableHashNocase(m_Host));
    return HashCombine(ret, NullableHashNocase(m_Namespace));
}


string CCimClassName::ToWbemUri(EWbemUriFormat format) const
{
    return NWbemUri::FormatPath(m_Host, m_Namespace, m_Classname, format);
}


xml::node CCimClassName::ToCimXml(bool ignore_host,
                                  bool ignore_namespace) const
{
    xml::node classname("CLASSNAME");
    NCimXml::AddAttr(classname, "NAME", m_Classname);
    if (m_Namespace.IsNull()  ||  ignore_namespace) {
        return classname;
    }
    if (m_Host.IsNull()  ||  ignore_host) {
        xml::node node("LOCALCLASSPATH");
        node.push_back(NCimXml::CreateLocalNamespacePath(m_Namespace));
        node.push_back(classname);
        return node;
    }
    xml::node node("CLASSPATH");
    node.push_back(NCimXml::CreateNamespacePath(m_Host, m_Namespace));
    node.push_back(classname);
    return node;
}


string CCimClassName::ToCimXmlStr(void) const
{
    return NCimXml::NodeToString(ToCimXml());
}


string CCimClassName::ToCimXmlStr(const string& indent) const
{
    return NCimXml::NodeToString(ToCimXml(), indent);
}


END_WBEM_SCOPE
