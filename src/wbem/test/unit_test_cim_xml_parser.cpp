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
 *   Unit tests for reading CIM objects from CIM-XML
 *
 */

#include <ncbi_pch.hpp>
#include <corelib/test_boost.hpp>
#include <wbem/cim_xml_parser.hpp>
#include <wbem/cim_xml.hpp>
#include <wbem/cim_instance.hpp>
#include <wbem/cim_instance_name.hpp>
#include <wbem/cim_class.hpp>
#include <wbem/cim_class_name.hpp>
#include <wbem/cim_qualifier_decl.hpp>


USING_WBEM_SCOPE;


template <class TFunc>
static void s_CheckParseError(TFunc func, const string& text)
{
    try {
        func(text);
        BOOST_ERROR("malformed CIM-XML accepted: " + text);
    }
    catch (CCimException& e) {
        BOOST_CHECK_EQUAL(e.GetErrCode(), CCimException::eParse);
    }
}


static CRef<CCimInstance> s_ParseInstance(const string& text)
{
    return NCimXmlParser::ParseInstance(text);
}

static CCimProperty s_ParseProperty(const string& text)
{
    return NCimXmlParser::ParseProperty(text);
}

static CCimQualifier s_ParseQualifier(const string& text)
{
    return NCimXmlParser::ParseQualifier(text);
}


BOOST_AUTO_TEST_CASE(TestParseInstance)
{
    const string xml =
        "<INSTANCE CLASSNAME=\"CIM_Foo\">\n"
        "  <PROPERTY NAME=\"Name\" TYPE=\"string\"><VALUE>x</VALUE></PROPERTY>\n"
        "  <PROPERTY NAME=\"Size\" TYPE=\"uint16\"/>\n"
        "  <PROPERTY.ARRAY NAME=\"Levels\" TYPE=\"sint32\">\n"
        "    <VALUE.ARRAY><VALUE>-1</VALUE><VALUE.NULL/><VALUE>7</VALUE>"
        "</VALUE.ARRAY>\n"
        "  </PROPERTY.ARRAY>\n"
        "  <PROPERTY.ARRAY NAME=\"Flags\" TYPE=\"boolean\"><VALUE.ARRAY/>"
        "</PROPERTY.ARRAY>\n"
        "</INSTANCE>\n";

    CRef<CCimInstance> inst = NCimXmlParser::ParseInstance(xml);
    BOOST_CHECK_EQUAL(inst->GetClassname(), "CIM_Foo");
    BOOST_CHECK( !inst->IsSetPath() );
    BOOST_CHECK_EQUAL(inst->size(), 4u);
    BOOST_CHECK((*inst)["name"] == CCimValue("x"));

    const CCimProperty& size = inst->GetProperties().Get("Size");
    BOOST_CHECK_EQUAL(size.GetType(), eCimType_uint16);
    BOOST_CHECK(size.GetValue().IsNull());

    const CCimProperty& levels = inst->GetProperties().Get("Levels");
    BOOST_CHECK_EQUAL(levels.GetType(), eCimType_sint32);
    BOOST_CHECK(levels.IsArray());
    const CCimValue::TArray& items = levels.GetValue().GetArray();
    BOOST_CHECK_EQUAL(items.size(), 3u);
    BOOST_CHECK(items[0] == CCimValue(-1));
    BOOST_CHECK(items[1].IsNull());
    BOOST_CHECK(items[2] == CCimValue::MakeInteger(eCimType_sint32, 7));

    const CCimProperty& flags = inst->GetProperties().Get("Flags");
    BOOST_CHECK(flags.IsArray());
    BOOST_CHECK(flags.GetValue().GetArray().empty());
}


BOOST_AUTO_TEST_CASE(TestInstanceRoundTrip)
{
    CCimInstance embedded("CIM_Emb");
    embedded.SetProperty(CCimProperty("Text", CCimValue("a<b \"c\"")));

    CCimInstanceName ref("CIM_Bar");
    ref.SetKeybinding("k", CCimValue("v"));

    CCimValue counts = CCimValue::MakeArray();
    counts.SetArray().push_back(CCimValue(-5));
    counts.SetArray().push_back(CCimValue());

    CCimInstance inst("CIM_Foo");
    inst.SetProperty(CCimProperty("Name", CCimValue("x & y")));
    inst.SetProperty(CCimProperty("Size",
        CCimValue::MakeInteger(eCimType_uint32, 4000000000u)));
    inst.SetProperty(CCimProperty("Ratio",
        CCimValue::MakeReal(eCimType_real32, 1.5)));
    inst.SetProperty(CCimProperty("When", CCimValue(
        CCimDateTime::CreatePointInTime(2024, 1, 2, 3, 4, 5, 6, 60))));
    inst.SetProperty(CCimProperty("Letter", CCimValue::MakeChar16("z")));
    inst.SetProperty(CCimProperty("Enabled", CCimValue(true)));
    inst.SetProperty(CCimProperty("Counts", counts, eCimType_sint64));
    inst.SetProperty(CCimProperty("Ref", CCimValue(ref)));
    inst.SetProperty(CCimProperty("Obj", CCimValue(embedded)));
    inst.SetProperty(CCimProperty("Unset", CCimValue(), eCimType_uint8));
    inst.SetQualifier(CCimQualifier("Description", CCimValue("d")));

    CCimInstanceName path("CIM_Foo", "woot.com", "root/cimv2");
    path.SetKeybinding("Name", CCimValue("x & y"));
    inst.SetPath(path);

    CRef<CCimInstance> parsed =
        NCimXmlParser::ParseInstance(inst.ToCimXmlStr());
    BOOST_CHECK(*parsed == inst);
    BOOST_CHECK(parsed->GetPath() == path);
    BOOST_CHECK((*parsed)["Obj"].GetInstance() == embedded);
    BOOST_CHECK_EQUAL(parsed->GetProperties().Get("Obj").GetEmbeddedObject(),
                      eEmbeddedObject_Instance);

    // the indented form reads back the same
    parsed = NCimXmlParser::ParseInstance(inst.ToCimXmlStr("  "));
    BOOST_CHECK(*parsed == inst);

    inst.SetPath().ResetHost();
    parsed = NCimXmlParser::ParseInstance(inst.ToCimXmlStr());
    BOOST_CHECK(*parsed == inst);
    inst.SetPath().ResetNamespace();
    parsed = NCimXmlParser::ParseInstance(inst.ToCimXmlStr());
    BOOST_CHECK(*parsed == inst);
}


BOOST_AUTO_TEST_CASE(TestClassRoundTrip)
{
    CCimClass cls("CIM_Foo", "CIM_Base");
    cls.SetQualifier(CCimQualifier("Description", CCimValue("foo")));

    CCimProperty name("Name", CCimValue(), eCimType_string);
    name.SetQualifier(CCimQualifier("Key", true, null, null, false));
    cls.SetProperty(name);
    CCimProperty count("Count", CCimValue::MakeInteger(eCimType_uint32, 7));
    count.SetClassOrigin("CIM_Base");
    count.SetPropagated(true);
    cls.SetProperty(count);
    CCimProperty levels("Levels", CCimValue(), eCimType_uint8, true);
    levels.SetArraySize(4);
    cls.SetProperty(levels);

    CCimMethod method("Reset", eCimType_uint32);
    method.SetClassOrigin("CIM_Foo");
    method.SetQualifier(CCimQualifier("Description", CCimValue("r")));
    CCimParameter force("Force", eCimType_boolean);
    force.SetQualifier(CCimQualifier("In", true));
    method.SetParameter(force);
    method.SetParameter(CCimParameter("Names", eCimType_string, kEmptyStr,
                                      true, 4));
    method.SetParameter(CCimParameter("Target", eCimType_reference,
                                      "CIM_Bar"));
    method.SetParameter(CCimParameter("Targets", eCimType_reference,
                                      "CIM_Bar", true));
    cls.SetMethod(method);

    CRef<CCimClass> parsed = NCimXmlParser::ParseClass(cls.ToCimXmlStr());
    BOOST_CHECK(*parsed == cls);
    BOOST_CHECK_EQUAL(parsed->GetSuperclass(), "CIM_Base");
    const CCimMethod& reset = parsed->GetMethods().Get("reset");
    BOOST_CHECK_EQUAL(reset.GetParameters().size(), 4u);
    BOOST_CHECK(reset.GetParameters().Get("Targets").IsArray());
    BOOST_CHECK_EQUAL(reset.GetParameters().Get("Targets").GetType(),
                      eCimType_reference);

    CCimMethod parsed_method =
        NCimXmlParser::ParseMethod(method.ToCimXmlStr());
    BOOST_CHECK(parsed_method == method);

    CCimInstance embedded_class("CIM_Holder");
    embedded_class.SetProperty(CCimProperty("Cls", CCimValue(cls)));
    CRef<CCimInstance> holder =
        NCimXmlParser::ParseInstance(embedded_class.ToCimXmlStr());
    BOOST_CHECK((*holder)["Cls"].GetClass() == cls);
}


BOOST_AUTO_TEST_CASE(TestQualifierDeclarationRoundTrip)
{
    CCimQualifierDeclaration decl("Key", eCimType_boolean, CCimValue(false),
                                  null, null, false, false);
    decl.SetScope("property", true);
    decl.SetScope("reference", true);
    BOOST_CHECK(NCimXmlParser::ParseQualifierDeclaration(
        decl.ToCimXmlStr()) == decl);

    CCimValue values = CCimValue::MakeArray();
    values.SetArray().push_back(CCimValue("a"));
    CCimQualifierDeclaration list("Values", eCimType_string, values, true, 3,
                                  null, null, null, true);
    list.SetScope("property", true);
    BOOST_CHECK(NCimXmlParser::ParseQualifierDeclaration(
        list.ToCimXmlStr()) == list);

    // ANY is written out as every single scope
    CCimQualifierDeclaration any("Description", eCimType_string);
    any.SetScope("ANY", true);
    CCimQualifierDeclaration parsed =
        NCimXmlParser::ParseQualifierDeclaration(any.ToCimXmlStr());
    BOOST_CHECK_EQUAL(parsed.GetScopes().size(), 7u);
    BOOST_CHECK(*parsed.GetScopes().Find("indication"));
}


BOOST_AUTO_TEST_CASE(TestParseParameterValue)
{
    CCimParameter count = NCimXmlParser::ParseParameter(
        "<PARAMVALUE NAME=\"Count\" PARAMTYPE=\"uint16\">"
        "<VALUE>3</VALUE></PARAMVALUE>");
    BOOST_CHECK_EQUAL(count.GetName(), "Count");
    BOOST_CHECK_EQUAL(count.GetType(), eCimType_uint16);
    BOOST_CHECK(count.GetValue() == CCimValue::MakeInteger(eCimType_uint16, 3));

    CCimParameter text = NCimXmlParser::ParseParameter(
        "<PARAMVALUE NAME=\"S\"><VALUE>abc</VALUE></PARAMVALUE>");
    BOOST_CHECK_EQUAL(text.GetType(), eCimType_string);
    BOOST_CHECK(text.GetValue() == CCimValue("abc"));

    CCimParameter value = CCimParameter::CreateValue(
        "Force", CCimValue(true));
    BOOST_CHECK(NCimXmlParser::ParseParameter(value.ToCimXmlStr(true))
                == value);
}


BOOST_AUTO_TEST_CASE(TestParseValue)
{
    BOOST_CHECK(NCimXmlParser::ParseValue(NCimXml::CreateValueNull())
                .IsNull());
    BOOST_CHECK(NCimXmlParser::ParseValue(NCimXml::CreateValue("12"))
                == CCimValue("12"));
    BOOST_CHECK(NCimXmlParser::ParseValue(NCimXml::CreateValue("12"),
                                          eCimType_uint8)
                == CCimValue::MakeInteger(eCimType_uint8, 12));
    BOOST_CHECK(NCimXmlParser::ParseValue(NCimXml::CreateValue("true"),
                                          eCimType_boolean)
                == CCimValue(true));
    BOOST_CHECK_THROW(NCimXmlParser::ParseValue(NCimXml::CreateValue("300"),
                                                eCimType_uint8),
                      CCimRangeException);

    CCimClassName cls("CIM_Foo", kEmptyStr, "root");
    CCimValue ref = NCimXmlParser::ParseValue(
        NCimXml::CreateValueReference(CCimValue(cls)));
    BOOST_CHECK(ref.IsClassName());
    BOOST_CHECK(ref.GetClassName() == cls);

    BOOST_CHECK_THROW(NCimXmlParser::ParseValue(xml::node("KEYVALUE")),
                      CCimException);
}


BOOST_AUTO_TEST_CASE(TestParseKeybindings)
{
    CRef<CCimInstanceName> path = NCimXmlParser::ParseInstanceName(
        "<INSTANCENAME CLASSNAME=\"CIM_Foo\">"
        "<KEYBINDING NAME=\"N\"><KEYVALUE VALUETYPE=\"numeric\">-5"
        "</KEYVALUE></KEYBINDING>"
        "<KEYBINDING NAME=\"R\"><KEYVALUE VALUETYPE=\"numeric\">1.5"
        "</KEYVALUE></KEYBINDING>"
        "<KEYBINDING NAME=\"T\"><KEYVALUE VALUETYPE=\"numeric\" "
        "TYPE=\"uint32\">9</KEYVALUE></KEYBINDING>"
        "<KEYBINDING NAME=\"B\"><KEYVALUE VALUETYPE=\"boolean\">TRUE"
        "</KEYVALUE></KEYBINDING>"
        "<KEYBINDING NAME=\"S\"><KEYVALUE>text</KEYVALUE></KEYBINDING>"
        "</INSTANCENAME>");
    BOOST_CHECK((*path)["N"] == CCimValue(-5));
    BOOST_CHECK((*path)["R"] == CCimValue(1.5));
    BOOST_CHECK((*path)["T"] == CCimValue::MakeInteger(eCimType_uint32, 9));
    BOOST_CHECK((*path)["T"].IsTyped());
    BOOST_CHECK((*path)["B"] == CCimValue(true));
    BOOST_CHECK((*path)["S"] == CCimValue("text"));

    CCimInstanceName nested("CIM_Bar", "woot.com", "root");
    nested.SetKeybinding("Id", CCimValue::MakeInteger(eCimType_uint8, 1));
    CCimInstanceName outer("CIM_Assoc");
    outer.SetKeybinding("Ref", CCimValue(nested));
    outer.SetKeybinding("When",
        CCimValue(CCimDateTime::CreateInterval(2, 1)));
    outer.SetKeybinding("C", CCimValue::MakeChar16("q"));
    CRef<CCimInstanceName> parsed =
        NCimXmlParser::ParseInstanceName(outer.ToCimXmlStr());
    BOOST_CHECK(*parsed == outer);
    BOOST_CHECK((*parsed)["When"].IsDateTime());
    BOOST_CHECK((*parsed)["C"].IsChar16());

    BOOST_CHECK(*NCimXmlParser::ParseClassName(
        CCimClassName("CIM_Foo", "woot.com", "root/cimv2").ToCimXmlStr())
        == CCimClassName("CIM_Foo", "woot.com", "root/cimv2"));
}


BOOST_AUTO_TEST_CASE(TestParseNullKeybinding)
{
    const string xml = "<INSTANCENAME CLASSNAME=\"CIM_Foo\">"
        "<KEYBINDING NAME=\"k\"/></INSTANCENAME>";
    BOOST_CHECK_THROW(NCimXmlParser::ParseInstanceName(xml), CCimException);

    CWbemConfig config;
    config.SetIgnoreNullKeyValue(true);
    CRef<CCimInstanceName> path =
        NCimXmlParser::ParseInstanceName(xml, config);
    BOOST_CHECK(path->Has("k"));
    BOOST_CHECK((*path)["k"].IsNull());
}


BOOST_AUTO_TEST_CASE(TestParseErrors)
{
    s_CheckParseError(s_ParseInstance, "<INSTANCE CLASSNAME=\"C\">");
    s_CheckParseError(s_ParseInstance, "not xml at all");
    s_CheckParseError(s_ParseInstance, "<CLASS NAME=\"C\"/>");
    s_CheckParseError(s_ParseInstance, "<INSTANCE/>");
    s_CheckParseError(s_ParseInstance,
                      "<INSTANCE CLASSNAME=\"C\"><FOO/></INSTANCE>");
    s_CheckParseError(s_ParseProperty, "<PROPERTY NAME=\"P\"/>");
    s_CheckParseError(s_ParseProperty,
                      "<PROPERTY NAME=\"P\" TYPE=\"uint7\"/>");
    s_CheckParseError(s_ParseProperty,
                      "<PROPERTY NAME=\"P\" TYPE=\"uint8\" "
                      "PROPAGATED=\"maybe\"/>");
    s_CheckParseError(s_ParseProperty,
                      "<PROPERTY.ARRAY NAME=\"P\" TYPE=\"uint8\" "
                      "ARRAYSIZE=\"x\"/>");
    s_CheckParseError(s_ParseQualifier,
                      "<QUALIFIER NAME=\"Q\" TYPE=\"boolean\" "
                      "OVERRIDABLE=\"maybe\"/>");
    s_CheckParseError(s_ParseQualifier,
                      "<QUALIFIER NAME=\"Q\" TYPE=\"string\">"
                      "<VALUE.REFERENCE/></QUALIFIER>");

    BOOST_CHECK_THROW(NCimXmlParser::ParseProperty(
        "<PROPERTY NAME=\"P\" TYPE=\"uint8\"><VALUE>300</VALUE></PROPERTY>"),
                      CCimRangeException);
    BOOST_CHECK_THROW(NCimXmlParser::ParseProperty(
        "<PROPERTY NAME=\"P\" TYPE=\"uint8\"><VALUE>x</VALUE></PROPERTY>"),
                      CCimException);
}
