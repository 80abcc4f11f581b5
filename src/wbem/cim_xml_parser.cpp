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
 *   CIM-XML (DSP0201) object parser
 *
 */

#include <ncbi_pch.hpp>
#include <wbem/cim_xml_parser.hpp>
#include <memory>


BEGIN_WBEM_SCOPE


/////////////////////////////////////////////////////////////////////////////
//  Helpers
//

namespace {

// Parsed document owning the element passed to the node based parsers
class CCimXmlText
{
public:
    explicit CCimXmlText(const string& text)
    {
        xml::error_messages messages;
        try {
            m_Document.reset(new xml::document(text.data(), text.size(),
                                               &messages,
                                               xml::type_warnings_not_errors));
        }
        catch (xml::parser_exception& e) {
            NCBI_THROW(CCimException, eParse,
                       string("Malformed CIM-XML document: ") + e.what());
        }
        catch (std::exception& e) {
            NCBI_THROW(CCimException, eParse,
                       string("Cannot parse CIM-XML document: ") + e.what());
        }
    }

    const xml::node& GetRoot(void) const
        { return m_Document->get_root_node(); }

private:
    unique_ptr<xml::document> m_Document;
};

}


typedef vector<const xml::node*> TElements;

// Child elements, skipping text, comments and processing instructions
static TElements s_GetElements(const xml::node& node)
{
    TElements ret;
    for (xml::node::const_iterator it = node.begin();  it != node.end();  ++it) {
        if (it->get_type() == xml::node::type_element) {
            ret.push_back(&*it);
        }
    }
    return ret;
}


static bool s_IsElement(const xml::node& node, const char* name)
{
    return strcmp(node.get_name(), name) == 0;
}


static void s_Unexpected(const xml::node& node, const char* context)
{
    NCBI_THROW(CCimException, eParse,
               string("Unexpected element ") + node.get_name() +
               " in " + context);
}


static void s_CheckElement(const xml::node& node, const char* name)
{
    if ( !s_IsElement(node, name) ) {
        NCBI_THROW(CCimException, eParse,
                   string("Expected element ") + name + ", found " +
                   node.get_name());
    }
}


static const xml::node& s_GetSingleElement(const xml::node& node)
{
    TElements children = s_GetElements(node);
    if (children.size() != 1) {
        NCBI_THROW_FMT(CCimException, eParse,
                       "Element " << node.get_name() <<
                       " must have exactly one child element, found " <<
                       children.size());
    }
    return *children.front();
}


static bool s_FindAttr(const xml::node& node, const char* name, string* value)
{
    const xml::attributes& attrs = node.get_attributes();
    xml::attributes::const_iterator it = attrs.find(name);
    if (it == attrs.end()) {
        return false;
    }
    *value = it->get_value();
    return true;
}


static string s_GetAttr(const xml::node& node, const char* name)
{
    string value;
    if ( !s_FindAttr(node, name, &value) ) {
        NCBI_THROW(CCimException, eParse,
                   string("Element ") + node.get_name() +
                   " lacks the required attribute " + name);
    }
    return value;
}


static string s_GetOptionalAttr(const xml::node& node, const char* name)
{
    string value;
    s_FindAttr(node, name, &value);
    return value;
}


static TCimFlag s_GetFlag(const xml::node& node, const char* name)
{
    string value;
    if ( !s_FindAttr(node, name, &value) ) {
        return null;
    }
    if (NStr::EqualNocase(value, "true")) {
        return true;
    }
    if (NStr::EqualNocase(value, "false")) {
        return false;
    }
    NCBI_THROW(CCimException, eParse,
               string("Invalid boolean attribute ") + name + "=\"" + value +
               "\" in element " + node.get_name());
}


static ECimType s_GetType(const xml::node& node, const char* name)
{
    string value = s_GetAttr(node, name);
    try {
        return GetCimTypeByName(value);
    }
    catch (CCimException& e) {
        NCBI_RETHROW(e, CCimException, eParse,
                     string("Invalid ") + name + " attribute in element " +
                     node.get_name());
    }
}


static TCimArraySize s_GetArraySize(const xml::node& node)
{
    string value;
    if ( !s_FindAttr(node, "ARRAYSIZE", &value) ) {
        return null;
    }
    try {
        return NStr::StringToUInt(value);
    }
    catch (CStringException& e) {
        NCBI_RETHROW(e, CCimException, eParse,
                     "Invalid ARRAYSIZE attribute \"" + value +
                     "\" in element " + node.get_name());
    }
}


static EEmbeddedObject s_GetEmbeddedObject(const xml::node& node)
{
    string value;
    if ( !s_FindAttr(node, "EmbeddedObject", &value)  &&
         !s_FindAttr(node, "EMBEDDEDOBJECT", &value) ) {
        return eEmbeddedObject_None;
    }
    try {
        return GetEmbeddedObjectByName(value);
    }
    catch (CCimException& e) {
        NCBI_RETHROW(e, CCimException, eParse,
                     string("Invalid EmbeddedObject attribute in element ") +
                     node.get_name());
    }
}


static string s_GetText(const xml::node& node)
{
    const char* content = node.get_content();
    return content ? string(content) : kEmptyStr;
}


// NAMESPACE children joined with '/'
static string s_ParseLocalNamespacePath(const xml::node& node)
{
    s_CheckElement(node, "LOCALNAMESPACEPATH");
    string name_space;
    TElements children = s_GetElements(node);
    ITERATE(TElements, it, children) {
        s_CheckElement(**it, "NAMESPACE");
        if ( !name_space.empty() ) {
            name_space += '/';
        }
        name_space += s_GetAttr(**it, "NAME");
    }
    return name_space;
}


static void s_ParseNamespacePath(const xml::node& node,
                                 string* host, string* name_space)
{
    s_CheckElement(node, "NAMESPACEPATH");
    TElements children = s_GetElements(node);
    if (children.size() != 2) {
        NCBI_THROW(CCimException, eParse,
                   "NAMESPACEPATH must hold HOST and LOCALNAMESPACEPATH");
    }
    s_CheckElement(*children[0], "HOST");
    *host = NStr::TruncateSpaces(s_GetText(*children[0]));
    *name_space = s_ParseLocalNamespacePath(*children[1]);
}


// Path children of an element that has a namespace path and a name
static void s_SplitPath(const xml::node& node,
                        const xml::node** ns_path, const xml::node** name)
{
    TElements children = s_GetElements(node);
    if (children.size() != 2) {
        NCBI_THROW(CCimException, eParse,
                   string("Element ") + node.get_name() +
                   " must hold a namespace path and a name");
    }
    *ns_path = children[0];
    *name    = children[1];
}


// KEYVALUE text of the given VALUETYPE and optional TYPE
static CCimValue s_ParseKeyValue(const xml::node& node)
{
    string text = s_GetText(node);
    string value_type = s_GetOptionalAttr(node, "VALUETYPE");
    string type_name;
    if (s_FindAttr(node, "TYPE", &type_name)) {
        return CCimValue(text).ConvertTo(GetCimTypeByName(type_name));
    }
    if (value_type.empty()  ||  value_type == "string") {
        return CCimValue(text);
    }
    if (value_type == "boolean") {
        return CCimValue(text).ConvertTo(eCimType_boolean);
    }
    if (value_type != "numeric") {
        NCBI_THROW(CCimException, eParse,
                   "Invalid VALUETYPE attribute \"" + value_type +
                   "\" in element KEYVALUE");
    }

    // Untyped number: integer if possible, real otherwise
    string str = NStr::TruncateSpaces(text);
    try {
        if ( !str.empty()  &&
             str.find_first_not_of("+-0123456789") == NPOS ) {
            if (str[0] == '-') {
                return CCimValue(NStr::StringToInt8(str));
            }
            return CCimValue(NStr::StringToUInt8(str));
        }
        return CCimValue(NStr::StringToDouble(str, NStr::fDecimalPosix));
    }
    catch (CStringException& e) {
        NCBI_RETHROW(e, CCimException, eParse,
                     "Invalid numeric key value '" + text + "'");
    }
}


static CCimValue s_ParseEmbedded(const string& text)
{
    CCimXmlText doc(text);
    const xml::node& root = doc.GetRoot();
    if (s_IsElement(root, "INSTANCE")) {
        return CCimValue(*NCimXmlParser::ParseInstance(root));
    }
    if (s_IsElement(root, "CLASS")) {
        return CCimValue(*NCimXmlParser::ParseClass(root));
    }
    s_Unexpected(root, "embedded object");
    return CCimValue();
}


// VALUE* child of a property, qualifier or parameter element, if any
static const xml::node* s_FindValueElement(const xml::node& node)
{
    TElements children = s_GetElements(node);
    ITERATE(TElements, it, children) {
        if (NStr::StartsWith((*it)->get_name(), "VALUE")) {
            return *it;
        }
    }
    return 0;
}


/////////////////////////////////////////////////////////////////////////////
//  NCimXmlParser
//

CCimValue NCimXmlParser::ParseValue(const xml::node& node,
                                    TCimTypeArg      type,
                                    EEmbeddedObject  embedded)
{
    if (s_IsElement(node, "VALUE.NULL")) {
        return CCimValue();
    }
    if (s_IsElement(node, "VALUE")) {
        string text = s_GetText(node);
        if (embedded != eEmbeddedObject_None) {
            return s_ParseEmbedded(text);
        }
        CCimValue value(text);
        return type.IsNull() ? value : value.ConvertTo(type);
    }
    if (s_IsElement(node, "VALUE.ARRAY")) {
        CCimValue value = CCimValue::MakeArray();
        TElements children = s_GetElements(node);
        ITERATE(TElements, it, children) {
            if ( !s_IsElement(**it, "VALUE")  &&
                 !s_IsElement(**it, "VALUE.NULL") ) {
                s_Unexpected(**it, "VALUE.ARRAY");
            }
            value.SetArray().push_back(ParseValue(**it, type, embedded));
        }
        return value;
    }
    if (s_IsElement(node, "VALUE.REFERENCE")) {
        const xml::node& path = s_GetSingleElement(node);
        const char* name = path.get_name();
        if (NStr::EndsWith(name, "CLASSPATH")  ||
            s_IsElement(path, "CLASSNAME")) {
            return CCimValue(*ParseClassName(path));
        }
        return CCimValue(*ParseInstanceName(path));
    }
    if (s_IsElement(node, "VALUE.REFARRAY")) {
        CCimValue value = CCimValue::MakeArray();
        TElements children = s_GetElements(node);
        ITERATE(TElements, it, children) {
            if ( !s_IsElement(**it, "VALUE.REFERENCE")  &&
                 !s_IsElement(**it, "VALUE.NULL") ) {
                s_Unexpected(**it, "VALUE.REFARRAY");
            }
            value.SetArray().push_back(ParseValue(**it));
        }
        return value;
    }
    s_Unexpected(node, "value");
    return CCimValue();
}


CRef<CCimInstanceName>
NCimXmlParser::ParseInstanceName(const xml::node&   node,
                                 const CWbemConfig& config)
{
    string host, name_space;
    const xml::node* name = &node;
    if (s_IsElement(node, "INSTANCEPATH")) {
        const xml::node* ns_path = 0;
        s_SplitPath(node, &ns_path, &name);
        s_ParseNamespacePath(*ns_path, &host, &name_space);
    } else if (s_IsElement(node, "LOCALINSTANCEPATH")) {
        const xml::node* ns_path = 0;
        s_SplitPath(node, &ns_path, &name);
        name_space = s_ParseLocalNamespacePath(*ns_path);
    }
    s_CheckElement(*name, "INSTANCENAME");

    CRef<CCimInstanceName> path
        (new CCimInstanceName(s_GetAttr(*name, "CLASSNAME"),
                              host, name_space));
    TElements keys = s_GetElements(*name);
    ITERATE(TElements, it, keys) {
        const xml::node& key = **it;
        s_CheckElement(key, "KEYBINDING");
        string key_name = s_GetAttr(key, "NAME");
        TElements children = s_GetElements(key);
        if (children.size() > 1) {
            NCBI_THROW(CCimException, eParse,
                       "KEYBINDING '" + key_name + "' has more than one value");
        }
        CCimValue value;
        if ( !children.empty() ) {
            const xml::node& child = *children.front();
            if (s_IsElement(child, "KEYVALUE")) {
                value = s_ParseKeyValue(child);
            } else if (s_IsElement(child, "VALUE.REFERENCE")) {
                value = ParseValue(child);
            } else {
                s_Unexpected(child, "KEYBINDING");
            }
        }
        path->SetKeybinding(key_name, value, config);
    }
    return path;
}


CRef<CCimInstanceName>
NCimXmlParser::ParseInstanceName(const string&      text,
                                 const CWbemConfig& config)
{
    CCimXmlText doc(text);
    return ParseInstanceName(doc.GetRoot(), config);
}


CRef<CCimClassName> NCimXmlParser::ParseClassName(const xml::node& node)
{
    string host, name_space;
    const xml::node* name = &node;
    if (s_IsElement(node, "CLASSPATH")) {
        const xml::node* ns_path = 0;
        s_SplitPath(node, &ns_path, &name);
        s_ParseNamespacePath(*ns_path, &host, &name_space);
    } else if (s_IsElement(node, "LOCALCLASSPATH")) {
        const xml::node* ns_path = 0;
        s_SplitPath(node, &ns_path, &name);
        name_space = s_ParseLocalNamespacePath(*ns_path);
    }
    s_CheckElement(*name, "CLASSNAME");
    return CRef<CCimClassName>
        (new CCimClassName(s_GetAttr(*name, "NAME"), host, name_space));
}


CRef<CCimClassName> NCimXmlParser::ParseClassName(const string& text)
{
    CCimXmlText doc(text);
    return ParseClassName(doc.GetRoot());
}


CRef<CCimInstance> NCimXmlParser::ParseInstance(const xml::node& node)
{
    CRef<CCimInstanceName> path;
    const xml::node* inst = &node;
    if (s_IsElement(node, "VALUE.NAMEDINSTANCE")  ||
        s_IsElement(node, "VALUE.OBJECTWITHLOCALPATH")  ||
        s_IsElement(node, "VALUE.INSTANCEWITHPATH")) {
        const xml::node* name = 0;
        s_SplitPath(node, &name, &inst);
        path = ParseInstanceName(*name);
    }
    s_CheckElement(*inst, "INSTANCE");

    CRef<CCimInstance> ret(new CCimInstance(s_GetAttr(*inst, "CLASSNAME")));
    TElements children = s_GetElements(*inst);
    ITERATE(TElements, it, children) {
        if (s_IsElement(**it, "QUALIFIER")) {
            ret->SetQualifier(ParseQualifier(**it));
        } else if (NStr::StartsWith((*it)->get_name(), "PROPERTY")) {
            ret->SetProperty(ParseProperty(**it));
        } else {
            s_Unexpected(**it, "INSTANCE");
        }
    }
    if (path) {
        ret->SetPath(*path);
    }
    return ret;
}


CRef<CCimInstance> NCimXmlParser::ParseInstance(const string& text)
{
    CCimXmlText doc(text);
    return ParseInstance(doc.GetRoot());
}


CRef<CCimClass> NCimXmlParser::ParseClass(const xml::node& node)
{
    s_CheckElement(node, "CLASS");
    CRef<CCimClass> ret(new CCimClass(s_GetAttr(node, "NAME"),
                                      s_GetOptionalAttr(node, "SUPERCLASS")));
    TElements children = s_GetElements(node);
    ITERATE(TElements, it, children) {
        if (s_IsElement(**it, "QUALIFIER")) {
            ret->SetQualifier(ParseQualifier(**it));
        } else if (NStr::StartsWith((*it)->get_name(), "PROPERTY")) {
            ret->SetProperty(ParseProperty(**it));
        } else if (s_IsElement(**it, "METHOD")) {
            ret->SetMethod(ParseMethod(**it));
        } else {
            s_Unexpected(**it, "CLASS");
        }
    }
    return ret;
}


CRef<CCimClass> NCimXmlParser::ParseClass(const string& text)
{
    CCimXmlText doc(text);
    return ParseClass(doc.GetRoot());
}


CCimProperty NCimXmlParser::ParseProperty(const xml::node& node)
{
    string name = s_GetAttr(node, "NAME");
    EEmbeddedObject embedded = s_GetEmbeddedObject(node);
    const char* value_element = 0;
    ECimType type = eCimType_string;
    bool is_array = false;
    string reference_class;
    if (s_IsElement(node, "PROPERTY")) {
        type = s_GetType(node, "TYPE");
        value_element = "VALUE";
    } else if (s_IsElement(node, "PROPERTY.ARRAY")) {
        type = s_GetType(node, "TYPE");
        is_array = true;
        value_element = "VALUE.ARRAY";
    } else if (s_IsElement(node, "PROPERTY.REFERENCE")) {
        type = eCimType_reference;
        reference_class = s_GetOptionalAttr(node, "REFERENCECLASS");
        value_element = "VALUE.REFERENCE";
    } else {
        s_Unexpected(node, "property");
        return CCimProperty(name, CCimValue());
    }

    CCimValue value;
    vector<CCimQualifier> qualifiers;
    TElements children = s_GetElements(node);
    ITERATE(TElements, it, children) {
        if (s_IsElement(**it, "QUALIFIER")) {
            qualifiers.push_back(ParseQualifier(**it));
        } else if (s_IsElement(**it, value_element)) {
            value = ParseValue(**it, type, embedded);
        } else {
            s_Unexpected(**it, node.get_name());
        }
    }

    CCimProperty prop(name, value, type, is_array, embedded, reference_class);
    prop.SetArraySize(s_GetArraySize(node));
    string class_origin;
    if (s_FindAttr(node, "CLASSORIGIN", &class_origin)) {
        prop.SetClassOrigin(class_origin);
    }
    prop.SetPropagated(s_GetFlag(node, "PROPAGATED"));
    prop.SetQualifiers(qualifiers);
    return prop;
}


CCimProperty NCimXmlParser::ParseProperty(const string& text)
{
    CCimXmlText doc(text);
    return ParseProperty(doc.GetRoot());
}


CCimQualifier NCimXmlParser::ParseQualifier(const xml::node& node)
{
    s_CheckElement(node, "QUALIFIER");
    ECimType type = s_GetType(node, "TYPE");
    CCimValue value;
    TElements children = s_GetElements(node);
    ITERATE(TElements, it, children) {
        if ( !s_IsElement(**it, "VALUE")  &&
             !s_IsElement(**it, "VALUE.ARRAY") ) {
            s_Unexpected(**it, "QUALIFIER");
        }
        value = ParseValue(**it, type);
    }
    return CCimQualifier(s_GetAttr(node, "NAME"), value, type,
                         s_GetFlag(node, "PROPAGATED"),
                         s_GetFlag(node, "OVERRIDABLE"),
                         s_GetFlag(node, "TOSUBCLASS"),
                         s_GetFlag(node, "TOINSTANCE"),
                         s_GetFlag(node, "TRANSLATABLE"));
}


CCimQualifier NCimXmlParser::ParseQualifier(const string& text)
{
    CCimXmlText doc(text);
    return ParseQualifier(doc.GetRoot());
}


CCimQualifierDeclaration
NCimXmlParser::ParseQualifierDeclaration(const xml::node& node)
{
    s_CheckElement(node, "QUALIFIER.DECLARATION");
    ECimType type = s_GetType(node, "TYPE");
    CCimValue value;
    CCimQualifierDeclaration::TScopeList scopes;
    TElements children = s_GetElements(node);
    ITERATE(TElements, it, children) {
        const xml::node& child = **it;
        if (s_IsElement(child, "SCOPE")) {
            const xml::attributes& attrs = child.get_attributes();
            for (xml::attributes::const_iterator attr = attrs.begin();
                 attr != attrs.end();  ++attr) {
                TCimFlag flag = s_GetFlag(child, attr->get_name());
                scopes.push_back(make_pair(string(attr->get_name()),
                                           bool(flag)));
            }
        } else if (s_IsElement(child, "VALUE")  ||
                   s_IsElement(child, "VALUE.ARRAY")) {
            value = ParseValue(child, type);
        } else {
            s_Unexpected(child, "QUALIFIER.DECLARATION");
        }
    }

    CCimQualifierDeclaration decl(s_GetAttr(node, "NAME"), type, value,
                                  s_GetFlag(node, "ISARRAY"),
                                  s_GetArraySize(node),
                                  s_GetFlag(node, "OVERRIDABLE"),
                                  s_GetFlag(node, "TOSUBCLASS"),
                                  s_GetFlag(node, "TOINSTANCE"),
                                  s_GetFlag(node, "TRANSLATABLE"));
    decl.SetScopes(scopes);
    return decl;
}


CCimQualifierDeclaration
NCimXmlParser::ParseQualifierDeclaration(const string& text)
{
    CCimXmlText doc(text);
    return ParseQualifierDeclaration(doc.GetRoot());
}


CCimMethod NCimXmlParser::ParseMethod(const xml::node& node)
{
    s_CheckElement(node, "METHOD");
    CCimMethod method(s_GetAttr(node, "NAME"), s_GetType(node, "TYPE"));
    string class_origin;
    if (s_FindAttr(node, "CLASSORIGIN", &class_origin)) {
        method.SetClassOrigin(class_origin);
    }
    method.SetPropagated(s_GetFlag(node, "PROPAGATED"));
    TElements children = s_GetElements(node);
    ITERATE(TElements, it, children) {
        if (s_IsElement(**it, "QUALIFIER")) {
            method.SetQualifier(ParseQualifier(**it));
        } else if (NStr::StartsWith((*it)->get_name(), "PARAMETER")) {
            method.SetParameter(ParseParameter(**it));
        } else {
            s_Unexpected(**it, "METHOD");
        }
    }
    return method;
}


CCimMethod NCimXmlParser::ParseMethod(const string& text)
{
    CCimXmlText doc(text);
    return ParseMethod(doc.GetRoot());
}


CCimParameter NCimXmlParser::ParseParameter(const xml::node& node)
{
    string name = s_GetAttr(node, "NAME");

    if (s_IsElement(node, "PARAMVALUE")) {
        TCimTypeArg type;
        string type_name;
        if (s_FindAttr(node, "PARAMTYPE", &type_name)) {
            type = s_GetType(node, "PARAMTYPE");
        }
        EEmbeddedObject embedded = s_GetEmbeddedObject(node);
        CCimValue value;
        TElements children = s_GetElements(node);
        if (children.size() > 1) {
            NCBI_THROW(CCimException, eParse,
                       "PARAMVALUE '" + name + "' has more than one value");
        }
        if ( !children.empty() ) {
            value = ParseValue(*children.front(), type, embedded);
        }
        return CCimParameter(name, type, kEmptyStr, null, null,
                             value, embedded);
    }

    TCimTypeArg type;
    string reference_class;
    bool is_array = false;
    if (s_IsElement(node, "PARAMETER")) {
        type = s_GetType(node, "TYPE");
    } else if (s_IsElement(node, "PARAMETER.ARRAY")) {
        type = s_GetType(node, "TYPE");
        is_array = true;
    } else if (s_IsElement(node, "PARAMETER.REFERENCE")) {
        type = eCimType_reference;
        reference_class = s_GetOptionalAttr(node, "REFERENCECLASS");
    } else if (s_IsElement(node, "PARAMETER.REFARRAY")) {
        type = eCimType_reference;
        reference_class = s_GetOptionalAttr(node, "REFERENCECLASS");
        is_array = true;
    } else {
        s_Unexpected(node, "parameter");
    }

    CCimParameter param(name, type, reference_class, is_array,
                        is_array ? s_GetArraySize(node) : TCimArraySize());
    TElements children = s_GetElements(node);
    ITERATE(TElements, it, children) {
        if ( !s_IsElement(**it, "QUALIFIER") ) {
            s_Unexpected(**it, node.get_name());
        }
        param.SetQualifier(ParseQualifier(**it));
    }
    return param;
}


CCimParameter NCimXmlParser::ParseParameter(const string& text)
{
    CCimXmlText doc(text);
    return ParseParameter(doc.GetRoot());
}


END_WBEM_SCOPE
