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
 *   CIM-XML (DSP0201) element construction helpers
 *
 */

#include <ncbi_pch.hpp>
#include <wbem/cim_xml.hpp>
#include <wbem/cim_instance_name.hpp>
#include <wbem/cim_class_name.hpp>
#include <wbem/cim_instance.hpp>
#include <wbem/cim_class.hpp>

#include <libxml/globals.h>
#include <libxml/xmlsave.h>


BEGIN_WBEM_SCOPE


xml::node NCimXml::CreateValue(const string& text)
{
    return xml::node("VALUE", text.c_str());
}


xml::node NCimXml::CreateValueNull(void)
{
    return xml::node("VALUE.NULL");
}


string NCimXml::ScalarToText(const CCimValue& value)
{
    switch (value.GetKind()) {
    case CCimValue::eKind_Boolean:
        return value.GetBoolean() ? "TRUE" : "FALSE";
    case CCimValue::eKind_String:
    case CCimValue::eKind_Char16:
        return value.GetString();
    case CCimValue::eKind_Integer:
        return value.IsNegative() ? NStr::Int8ToString(value.GetInt8())
                                  : NStr::UInt8ToString(value.GetUint8());
    case CCimValue::eKind_Real:
        return CCimValue::FormatReal(value.GetReal(),
                                     value.IsTyped() ? value.GetNumberType()
                                                     : eCimType_real64);
    case CCimValue::eKind_DateTime:
        return value.GetDateTime().AsString();
    case CCimValue::eKind_Instance:
        return NodeToString(value.GetInstance().ToCimXml(true));
    case CCimValue::eKind_Class:
        return NodeToString(value.GetClass().ToCimXml());
    default:
        break;
    }
    NCBI_THROW(CCimException, eType,
               "Value " + value.AsString() +
               " cannot be rendered as the text of a CIM-XML VALUE element");
}


xml::node NCimXml::CreateValueReference(const CCimValue& value)
{
    xml::node node("VALUE.REFERENCE");
    if (value.IsInstanceName()) {
        node.push_back(value.GetInstanceName().ToCimXml());
    } else if (value.IsClassName()) {
        node.push_back(value.GetClassName().ToCimXml());
    } else {
        NCBI_THROW(CCimException, eType,
                   "Value of a reference must be an instance or class path, "
                   "not " + value.AsString());
    }
    return node;
}


xml::node NCimXml::ValueToCimXml(const CCimValue& value, ECimType type)
{
    if (value.IsArray()) {
        bool is_ref = type == eCimType_reference;
        xml::node node(is_ref ? "VALUE.REFARRAY" : "VALUE.ARRAY");
        ITERATE(CCimValue::TArray, it, value.GetArray()) {
            if (it->IsNull()) {
                node.push_back(CreateValueNull());
            } else if (is_ref) {
                node.push_back(CreateValueReference(*it));
            } else {
                node.push_back(CreateValue(ScalarToText(*it)));
            }
        }
        return node;
    }
    if (type == eCimType_reference  ||  value.IsReference()) {
        return CreateValueReference(value);
    }
    return CreateValue(ScalarToText(value));
}


xml::node NCimXml::CreateLocalNamespacePath(const string& name_space)
{
    xml::node node("LOCALNAMESPACEPATH");
    list<string> parts;
    NStr::Split(name_space, "/", parts, NStr::fSplit_Tokenize);
    ITERATE(list<string>, it, parts) {
        xml::node ns("NAMESPACE");
        AddAttr(ns, "NAME", *it);
        node.push_back(ns);
    }
    return node;
}


xml::node NCimXml::CreateNamespacePath(const string& host,
                                       const string& name_space)
{
    xml::node node("NAMESPACEPATH");
    node.push_back(xml::node("HOST", host.c_str()));
    node.push_back(CreateLocalNamespacePath(name_space));
    return node;
}


void NCimXml::AddFlag(xml::node& node, const char* name, const TCimFlag& flag)
{
    if ( !flag.IsNull() ) {
        AddAttr(node, name, bool(flag) ? "true" : "false");
    }
}


void NCimXml::AddAttr(xml::node& node, const char* name, const string& value)
{
    node.get_attributes().insert(name, value.c_str());
}


string NCimXml::NodeToString(const xml::node& node)
{
    string text;
    node.node_to_string(text, xml::save_op_no_format | xml::save_op_no_decl);
    return text;
}


/// Indentation string of the libxml2 formatter, restored on destruction
class CXmlIndentGuard
{
public:
    CXmlIndentGuard(const char* indent)
        : m_SavedIndent(xmlTreeIndentString),
          m_SavedIndentOutput(xmlIndentTreeOutput)
    {
        xmlTreeIndentString = indent;
        xmlIndentTreeOutput = 1;
    }
    ~CXmlIndentGuard(void)
    {
        xmlTreeIndentString = m_SavedIndent;
        xmlIndentTreeOutput = m_SavedIndentOutput;
    }

private:
    const char* m_SavedIndent;
    int         m_SavedIndentOutput;
};


string NCimXml::NodeToString(const xml::node& node, const string& indent)
{
    string text;
    {{
        CXmlIndentGuard guard(indent.c_str());
        node.node_to_string(text, xml::save_op_no_decl);
    }}
    SIZE_TYPE end = text.find_last_not_of("\r\n");
    text.resize(end == NPOS ? 0 : end + 1);
    return text;
}


string NCimXml::NodeToString(const xml::node& node, unsigned int indent)
{
    return NodeToString(node, string(indent, ' '));
}


END_WBEM_SCOPE
