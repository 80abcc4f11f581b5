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
 *   Unit tests for the CIM-XML representation of CIM objects
 *
 */

#include <ncbi_pch.hpp>
#include <corelib/test_boost.hpp>
#include <wbem/cim_xml.hpp>
#include <wbem/cim_instance.hpp>
#include <wbem/cim_instance_name.hpp>
#include <wbem/cim_class.hpp>
#include <wbem/cim_class_name.hpp>
#include <wbem/cim_qualifier_decl.hpp>


USING_WBEM_SCOPE;


static const char* const kKeyName =
    "<KEYBINDING NAME=\"k\"><KEYVALUE VALUETYPE=\"string\">v</KEYVALUE>"
    "</KEYBINDING>";


BOOST_AUTO_TEST_CASE(TestValueText)
{
    BOOST_CHECK_EQUAL(NCimXml::ScalarToText(CCimValue(true)), "TRUE");
    BOOST_CHECK_EQUAL(NCimXml::ScalarToText(CCimValue(false)), "FALSE");
    BOOST_CHECK_EQUAL(NCimXml::ScalarToText(CCimValue(-42)), "-42");
    BOOST_CHECK_EQUAL(NCimXml::ScalarToText(
        CCimValue::MakeInteger(eCimType_uint64, kMax_UI8)),
                      "18446744073709551615");
    BOOST_CHECK_EQUAL(NCimXml::ScalarToText(CCimValue(1.5)), "1.5");
    BOOST_CHECK_EQUAL(NCimXml::ScalarToText(CCimValue("a b")), "a b");
    BOOST_CHECK_EQUAL(NCimXml::ScalarToText(
        CCimValue(CCimDateTime::CreateInterval(1, 2, 3, 4, 5))),
                      "00000001020304.000005:000");
    BOOST_CHECK_THROW(NCimXml::ScalarToText(CCimValue()), CCimException);
    BOOST_CHECK_THROW(NCimXml::ScalarToText(CCimValue::MakeArray()),
                      CCimException);
    BOOST_CHECK_THROW(NCimXml::ScalarToText(CCimValue(CCimClassName("C"))),
                      CCimException);

    BOOST_CHECK_EQUAL(NCimXml::NodeToString(NCimXml::CreateValueNull()),
                      "<VALUE.NULL/>");
    BOOST_CHECK_EQUAL(NCimXml::NodeToString(NCimXml::CreateValue("a<b&c")),
                      "<VALUE>a&lt;b&amp;c</VALUE>");
    BOOST_CHECK_EQUAL(NCimXml::NodeToString(
        NCimXml::CreateLocalNamespacePath("root/cimv2")),
                      "<LOCALNAMESPACEPATH><NAMESPACE NAME=\"root\"/>"
                      "<NAMESPACE NAME=\"cimv2\"/></LOCALNAMESPACEPATH>");
}


BOOST_AUTO_TEST_CASE(TestPropertyXml)
{
    BOOST_CHECK_EQUAL(
        CCimProperty("P", CCimValue(), eCimType_string).ToCimXmlStr(),
        "<PROPERTY NAME=\"P\" TYPE=\"string\"/>");
    BOOST_CHECK_EQUAL(
        CCimProperty("N", CCimValue(), eCimType_uint8, true).ToCimXmlStr(),
        "<PROPERTY.ARRAY NAME=\"N\" TYPE=\"uint8\"/>");
    BOOST_CHECK_EQUAL(
        CCimProperty("E", CCimValue::MakeArray(), eCimType_uint8)
        .ToCimXmlStr(),
        "<PROPERTY.ARRAY NAME=\"E\" TYPE=\"uint8\"><VALUE.ARRAY/>"
        "</PROPERTY.ARRAY>");

    CCimValue items = CCimValue::MakeArray();
    items.SetArray().push_back(CCimValue(1));
    items.SetArray().push_back(CCimValue());
    CCimProperty array("A", items, eCimType_uint8);
    array.SetArraySize(2);
    BOOST_CHECK_EQUAL(array.ToCimXmlStr(),
                      "<PROPERTY.ARRAY NAME=\"A\" TYPE=\"uint8\" ARRAYSIZE=\"2\">"
                      "<VALUE.ARRAY><VALUE>1</VALUE><VALUE.NULL/></VALUE.ARRAY>"
                      "</PROPERTY.ARRAY>");

    CCimProperty size("Size", CCimValue::MakeInteger(eCimType_uint32, 5));
    size.SetClassOrigin("CIM_Foo");
    size.SetPropagated(false);
    size.SetQualifier(CCimQualifier("Key", true, null, null, false));
    BOOST_CHECK_EQUAL(size.ToCimXmlStr(),
                      "<PROPERTY NAME=\"Size\" TYPE=\"uint32\" "
                      "CLASSORIGIN=\"CIM_Foo\" PROPAGATED=\"false\">"
                      "<QUALIFIER NAME=\"Key\" TYPE=\"boolean\" "
                      "OVERRIDABLE=\"false\"><VALUE>TRUE</VALUE></QUALIFIER>"
                      "<VALUE>5</VALUE></PROPERTY>");

    BOOST_CHECK_EQUAL(CCimProperty("S", CCimValue("a<b&c")).ToCimXmlStr(),
                      "<PROPERTY NAME=\"S\" TYPE=\"string\">"
                      "<VALUE>a&lt;b&amp;c</VALUE></PROPERTY>");

    CCimInstanceName ref("CIM_Bar");
    ref.SetKeybinding("k", CCimValue("v"));
    BOOST_CHECK_EQUAL(CCimProperty("R", CCimValue(ref)).ToCimXmlStr(),
                      string("<PROPERTY.REFERENCE NAME=\"R\" "
                             "REFERENCECLASS=\"CIM_Bar\"><VALUE.REFERENCE>"
                             "<INSTANCENAME CLASSNAME=\"CIM_Bar\">") +
                      kKeyName +
                      "</INSTANCENAME></VALUE.REFERENCE>"
                      "</PROPERTY.REFERENCE>");
}


BOOST_AUTO_TEST_CASE(TestEmbeddedObjectXml)
{
    CCimInstance embedded("CIM_Emb");
    embedded.SetProperty(CCimProperty("V",
        CCimValue::MakeInteger(eCimType_uint8, 1)));
    CCimProperty prop("E", CCimValue(embedded));
    string xml = prop.ToCimXmlStr();
    BOOST_CHECK(NStr::StartsWith(xml, "<PROPERTY NAME=\"E\" TYPE=\"string\" "
                                      "EmbeddedObject=\"instance\"><VALUE>"));
    // the embedded element is escaped text of the VALUE element
    BOOST_CHECK(xml.find("&lt;INSTANCE CLASSNAME=") != NPOS);
    BOOST_CHECK(xml.find("<INSTANCE") == NPOS);

    // the text itself is the single-line element, without a path
    BOOST_CHECK_EQUAL(NCimXml::ScalarToText(CCimValue(embedded)),
                      embedded.ToCimXmlStr());
    BOOST_CHECK(NStr::StartsWith(NCimXml::ScalarToText(CCimValue(embedded)),
                                 "<INSTANCE CLASSNAME="));
}


BOOST_AUTO_TEST_CASE(TestInstanceNameXml)
{
    CCimInstanceName path("CIM_Foo");
    path.SetKeybinding("Name", CCimValue("x"));
    path.SetKeybinding("Id", CCimValue::MakeInteger(eCimType_uint32, 7));
    path.SetKeybinding("Flag", CCimValue(true));
    path.SetKeybinding("N", CCimValue(-3));
    BOOST_CHECK_EQUAL(path.ToCimXmlStr(),
                      "<INSTANCENAME CLASSNAME=\"CIM_Foo\">"
                      "<KEYBINDING NAME=\"Name\">"
                      "<KEYVALUE VALUETYPE=\"string\">x</KEYVALUE></KEYBINDING>"
                      "<KEYBINDING NAME=\"Id\">"
                      "<KEYVALUE VALUETYPE=\"numeric\" TYPE=\"uint32\">7"
                      "</KEYVALUE></KEYBINDING>"
                      "<KEYBINDING NAME=\"Flag\">"
                      "<KEYVALUE VALUETYPE=\"boolean\">TRUE</KEYVALUE>"
                      "</KEYBINDING>"
                      "<KEYBINDING NAME=\"N\">"
                      "<KEYVALUE VALUETYPE=\"numeric\">-3</KEYVALUE>"
                      "</KEYBINDING></INSTANCENAME>");

    CCimInstanceName full("CIM_Foo", "woot.com", "root/cimv2");
    full.SetKeybinding("k", CCimValue("v"));
    const string name = string("<INSTANCENAME CLASSNAME=\"CIM_Foo\">") +
        kKeyName + "</INSTANCENAME>";
    const string local_ns = "<LOCALNAMESPACEPATH><NAMESPACE NAME=\"root\"/>"
        "<NAMESPACE NAME=\"cimv2\"/></LOCALNAMESPACEPATH>";
    BOOST_CHECK_EQUAL(full.ToCimXmlStr(),
                      "<INSTANCEPATH><NAMESPACEPATH><HOST>woot.com</HOST>" +
                      local_ns + "</NAMESPACEPATH>" + name +
                      "</INSTANCEPATH>");
    BOOST_CHECK_EQUAL(NCimXml::NodeToString(full.ToCimXml(true)),
                      "<LOCALINSTANCEPATH>" + local_ns + name +
                      "</LOCALINSTANCEPATH>");
    BOOST_CHECK_EQUAL(NCimXml::NodeToString(full.ToCimXml(false, true)),
                      name);

    CCimInstanceName datetime_key("CIM_Foo");
    datetime_key.SetKeybinding("T",
        CCimValue(CCimDateTime::CreateInterval(1)));
    BOOST_CHECK(datetime_key.ToCimXmlStr().find(
        "<KEYVALUE VALUETYPE=\"string\" TYPE=\"datetime\">"
        "00000001000000.000000:000</KEYVALUE>") != NPOS);

    CCimInstanceName null_key("CIM_Foo");
    CWbemConfig config;
    config.SetIgnoreNullKeyValue(true);
    null_key.SetKeybinding("k", CCimValue(), config);
    BOOST_CHECK_EQUAL(null_key.ToCimXmlStr(),
                      "<INSTANCENAME CLASSNAME=\"CIM_Foo\">"
                      "<KEYBINDING NAME=\"k\"/></INSTANCENAME>");
}


BOOST_AUTO_TEST_CASE(TestClassNameXml)
{
    BOOST_CHECK_EQUAL(CCimClassName("CIM_Foo").ToCimXmlStr(),
                      "<CLASSNAME NAME=\"CIM_Foo\"/>");
    CCimClassName path("CIM_Foo", "woot.com", "root");
    BOOST_CHECK_EQUAL(path.ToCimXmlStr(),
                      "<CLASSPATH><NAMESPACEPATH><HOST>woot.com</HOST>"
                      "<LOCALNAMESPACEPATH><NAMESPACE NAME=\"root\"/>"
                      "</LOCALNAMESPACEPATH></NAMESPACEPATH>"
                      "<CLASSNAME NAME=\"CIM_Foo\"/></CLASSPATH>");
    BOOST_CHECK_EQUAL(NCimXml::NodeToString(path.ToCimXml(true)),
                      "<LOCALCLASSPATH><LOCALNAMESPACEPATH>"
                      "<NAMESPACE NAME=\"root\"/></LOCALNAMESPACEPATH>"
                      "<CLASSNAME NAME=\"CIM_Foo\"/></LOCALCLASSPATH>");
}


BOOST_AUTO_TEST_CASE(TestInstanceXml)
{
    CCimInstance inst("CIM_Foo");
    inst.SetProperty(CCimProperty("k", CCimValue("v")));
    const string body = "<INSTANCE CLASSNAME=\"CIM_Foo\">"
        "<PROPERTY NAME=\"k\" TYPE=\"string\"><VALUE>v</VALUE></PROPERTY>"
        "</INSTANCE>";
    BOOST_CHECK_EQUAL(inst.ToCimXmlStr(), body);

    CCimInstanceName path("CIM_Foo");
    path.SetKeybinding("k", CCimValue("v"));
    inst.SetPath(path);
    BOOST_CHECK_EQUAL(inst.ToCimXmlStr(),
                      string("<VALUE.NAMEDINSTANCE>"
                             "<INSTANCENAME CLASSNAME=\"CIM_Foo\">") +
                      kKeyName + "</INSTANCENAME>" + body +
                      "</VALUE.NAMEDINSTANCE>");
    BOOST_CHECK_EQUAL(NCimXml::NodeToString(inst.ToCimXml(true)), body);

    inst.SetPath().SetNamespace("root");
    BOOST_CHECK(NStr::StartsWith(inst.ToCimXmlStr(),
                                 "<VALUE.OBJECTWITHLOCALPATH>"
                                 "<LOCALINSTANCEPATH>"));
    inst.SetPath().SetHost("woot.com");
    BOOST_CHECK(NStr::StartsWith(inst.ToCimXmlStr(),
                                 "<VALUE.INSTANCEWITHPATH><INSTANCEPATH>"));

    inst.SetQualifier(CCimQualifier("Description", CCimValue("d")));
    BOOST_CHECK(inst.ToCimXmlStr().find(
        "<INSTANCE CLASSNAME=\"CIM_Foo\">"
        "<QUALIFIER NAME=\"Description\" TYPE=\"string\">"
        "<VALUE>d</VALUE></QUALIFIER><PROPERTY") != NPOS);
}


BOOST_AUTO_TEST_CASE(TestParameterXml)
{
    BOOST_CHECK_EQUAL(CCimParameter("P", eCimType_uint32).ToCimXmlStr(),
                      "<PARAMETER NAME=\"P\" TYPE=\"uint32\"/>");
    BOOST_CHECK_EQUAL(CCimParameter("A", eCimType_string, kEmptyStr,
                                    true, 4).ToCimXmlStr(),
                      "<PARAMETER.ARRAY NAME=\"A\" TYPE=\"string\" "
                      "ARRAYSIZE=\"4\"/>");
    BOOST_CHECK_EQUAL(CCimParameter("F", eCimType_reference,
                                    "CIM_Foo").ToCimXmlStr(),
                      "<PARAMETER.REFERENCE NAME=\"F\" "
                      "REFERENCECLASS=\"CIM_Foo\"/>");
    BOOST_CHECK_EQUAL(CCimParameter("R", eCimType_reference, "CIM_Foo",
                                    true).ToCimXmlStr(),
                      "<PARAMETER.REFARRAY NAME=\"R\" "
                      "REFERENCECLASS=\"CIM_Foo\"/>");

    CCimParameter value = CCimParameter::CreateValue(
        "Count", CCimValue::MakeInteger(eCimType_uint16, 3));
    BOOST_CHECK_EQUAL(value.ToCimXmlStr(true),
                      "<PARAMVALUE NAME=\"Count\" PARAMTYPE=\"uint16\">"
                      "<VALUE>3</VALUE></PARAMVALUE>");
}


BOOST_AUTO_TEST_CASE(TestMethodAndClassXml)
{
    CCimMethod method("Reset", eCimType_uint32);
    method.SetClassOrigin("CIM_Foo");
    method.SetParameter(CCimParameter("Force", eCimType_boolean));
    BOOST_CHECK_EQUAL(method.ToCimXmlStr(),
                      "<METHOD NAME=\"Reset\" TYPE=\"uint32\" "
                      "CLASSORIGIN=\"CIM_Foo\">"
                      "<PARAMETER NAME=\"Force\" TYPE=\"boolean\"/></METHOD>");

    CCimClass cls("CIM_Foo", "CIM_Base");
    cls.SetQualifier(CCimQualifier("Abstract", true));
    cls.SetProperty(CCimProperty("Name", CCimValue(), eCimType_string));
    cls.SetMethod(CCimMethod("Stop", eCimType_uint32));
    BOOST_CHECK_EQUAL(cls.ToCimXmlStr(),
                      "<CLASS NAME=\"CIM_Foo\" SUPERCLASS=\"CIM_Base\">"
                      "<QUALIFIER NAME=\"Abstract\" TYPE=\"boolean\">"
                      "<VALUE>TRUE</VALUE></QUALIFIER>"
                      "<PROPERTY NAME=\"Name\" TYPE=\"string\"/>"
                      "<METHOD NAME=\"Stop\" TYPE=\"uint32\"/></CLASS>");

    // the class path is not part of the element
    cls.SetPath(CCimClassName("CIM_Foo", "woot.com", "root"));
    BOOST_CHECK(cls.ToCimXmlStr().find("woot.com") == NPOS);
}


BOOST_AUTO_TEST_CASE(TestQualifierDeclarationXml)
{
    CCimQualifierDeclaration decl("Key", eCimType_boolean, CCimValue(false),
                                  null, null, false, false);
    decl.SetScope("property", true);
    decl.SetScope("Reference", true);
    BOOST_CHECK_EQUAL(decl.ToCimXmlStr(),
                      "<QUALIFIER.DECLARATION NAME=\"Key\" TYPE=\"boolean\" "
                      "ISARRAY=\"false\" OVERRIDABLE=\"false\" "
                      "TOSUBCLASS=\"false\">"
                      "<SCOPE REFERENCE=\"true\" PROPERTY=\"true\"/>"
                      "<VALUE>FALSE</VALUE></QUALIFIER.DECLARATION>");

    CCimQualifierDeclaration any("Description", eCimType_string);
    any.SetScope("any", true);
    BOOST_CHECK(any.ToCimXmlStr().find(
        "<SCOPE CLASS=\"true\" ASSOCIATION=\"true\" REFERENCE=\"true\" "
        "PROPERTY=\"true\" METHOD=\"true\" PARAMETER=\"true\" "
        "INDICATION=\"true\"/>") != NPOS);

    CCimQualifierDeclaration values("Values", eCimType_string, CCimValue(),
                                    true, 3);
    BOOST_CHECK_EQUAL(values.ToCimXmlStr(),
                      "<QUALIFIER.DECLARATION NAME=\"Values\" TYPE=\"string\" "
                      "ISARRAY=\"true\" ARRAYSIZE=\"3\"/>");
}


BOOST_AUTO_TEST_CASE(TestIndentedXml)
{
    CCimInstance inst("CIM_Foo");
    inst.SetProperty(CCimProperty("k", CCimValue("v")));
    string flat = inst.ToCimXmlStr();
    string indented = inst.ToCimXmlStr("  ");
    BOOST_CHECK(flat.find('\n') == NPOS);
    BOOST_CHECK(indented.find('\n') != NPOS);
    BOOST_CHECK(indented.find("  <PROPERTY") != NPOS);
    // no trailing line break
    BOOST_CHECK(indented[indented.size() - 1] == '>');

    BOOST_CHECK_EQUAL(NCimXml::NodeToString(inst.ToCimXml(), 2u), indented);
}
