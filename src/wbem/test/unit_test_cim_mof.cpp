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
 *   Unit tests for the MOF representation of CIM objects
 *
 */

#include <ncbi_pch.hpp>
#include <corelib/test_boost.hpp>
#include <wbem/cim_mof.hpp>
#include <wbem/cim_instance.hpp>
#include <wbem/cim_instance_name.hpp>
#include <wbem/cim_class.hpp>
#include <wbem/cim_qualifier_decl.hpp>


USING_WBEM_SCOPE;


static string s_Repeat(const string& text, size_t count)
{
    string ret;
    for (size_t i = 0;  i < count;  ++i) {
        ret += text;
    }
    return ret;
}


static CCimValue s_StringArray(const string& item, size_t count)
{
    CCimValue ret = CCimValue::MakeArray();
    for (size_t i = 0;  i < count;  ++i) {
        ret.SetArray().push_back(CCimValue(item));
    }
    return ret;
}


BOOST_AUTO_TEST_CASE(TestMofStrEscapes)
{
    unsigned int line_pos = 0;
    BOOST_CHECK_EQUAL(NMof::MofStr("a\"b\\c\n", 3, line_pos),
                      "\"a\\\"b\\\\c\\n\"");
    BOOST_CHECK_EQUAL(line_pos, 11u);

    line_pos = 0;
    BOOST_CHECK_EQUAL(NMof::MofStr("\b\t\f\r'", 3, line_pos),
                      "\"\\b\\t\\f\\r\\'\"");
    line_pos = 0;
    BOOST_CHECK_EQUAL(NMof::MofStr(string("\x01"), 3, line_pos),
                      "\"\\x0001\"");
    line_pos = 0;
    BOOST_CHECK_EQUAL(NMof::MofStr(kEmptyStr, 3, line_pos), "\"\"");
    BOOST_CHECK_EQUAL(line_pos, 2u);
    line_pos = 0;
    BOOST_CHECK_EQUAL(NMof::MofStr("x", 3, line_pos, 0, '\''), "'x'");
}


BOOST_AUTO_TEST_CASE(TestMofStrWrapping)
{
    // twenty words of five columns; the line holds fifteen of them
    unsigned int line_pos = 0;
    string value = s_Repeat("abcd ", 19) + "abcd";
    BOOST_CHECK_EQUAL(NMof::MofStr(value, 3, line_pos),
                      "\"" + s_Repeat("abcd ", 15) + "\"\n   \"" +
                      s_Repeat("abcd ", 4) + "abcd\"");
    BOOST_CHECK_EQUAL(line_pos, 29u);

    // a word longer than the line is split where the line is full
    line_pos = 0;
    BOOST_CHECK_EQUAL(NMof::MofStr(string(100, 'x'), 3, line_pos),
                      "\"" + string(78, 'x') + "\"\n   \"" +
                      string(22, 'x') + "\"");
    BOOST_CHECK_EQUAL(line_pos, 27u);

    // short values are never split
    line_pos = 70;
    BOOST_CHECK_EQUAL(NMof::MofStr("abc", 3, line_pos), "\"abc\"");
}


BOOST_AUTO_TEST_CASE(TestValueToMof)
{
    unsigned int line_pos = 0;
    BOOST_CHECK_EQUAL(NMof::ValueToMof(CCimValue(), eCimType_string, 3,
                                       line_pos), "NULL");
    BOOST_CHECK_EQUAL(NMof::ValueToMof(CCimValue(true), eCimType_boolean,
                                       3, line_pos), "true");
    BOOST_CHECK_EQUAL(NMof::ValueToMof(CCimValue(-7), eCimType_sint32, 3,
                                       line_pos), "-7");
    BOOST_CHECK_EQUAL(NMof::ValueToMof(CCimValue(2.0), eCimType_real64, 3,
                                       line_pos), "2.0");
    BOOST_CHECK_EQUAL(NMof::ValueToMof(CCimValue::MakeArray(),
                                       eCimType_uint8, 3, line_pos), "{ }");
    BOOST_CHECK_EQUAL(NMof::ValueToMof(CCimValue::MakeChar16("c"),
                                       eCimType_char16, 3, line_pos), "'c'");
    BOOST_CHECK_EQUAL(NMof::ValueToMof(
        CCimValue(CCimDateTime::CreateInterval(1)), eCimType_datetime, 3,
        line_pos), "\"00000001000000.000000:000\"");

    CCimValue items = CCimValue::MakeArray();
    items.SetArray().push_back(CCimValue(1));
    items.SetArray().push_back(CCimValue());
    line_pos = 0;
    BOOST_CHECK_EQUAL(NMof::ValueToMof(items, eCimType_uint8, 3, line_pos),
                      "{ 1, NULL }");
    BOOST_CHECK_EQUAL(line_pos, 11u);

    BOOST_CHECK_EQUAL(NMof::TypeToMof(eCimType_uint32, kEmptyStr), "uint32");
    BOOST_CHECK_EQUAL(NMof::TypeToMof(eCimType_reference, "CIM_Foo"),
                      "CIM_Foo REF");
}


BOOST_AUTO_TEST_CASE(TestQualifierMof)
{
    BOOST_CHECK_EQUAL(CCimQualifier("Key", true).ToMof(0), "Key ( true )");
    BOOST_CHECK_EQUAL(CCimQualifier("Abstract", CCimValue(),
                                    eCimType_boolean).ToMof(0),
                      "Abstract");
    BOOST_CHECK_EQUAL(CCimQualifier("Values", s_StringArray("a", 2),
                                    eCimType_string).ToMof(0),
                      "Values { \"a\", \"a\" }");
    BOOST_CHECK_EQUAL(CCimQualifier("Values", CCimValue::MakeArray(),
                                    eCimType_string).ToMof(0),
                      "Values { }");

    TCimQualifiers quals;
    quals.Set("Key", CCimQualifier("Key", true));
    quals.Set("Description", CCimQualifier("Description", CCimValue("d")));
    BOOST_CHECK_EQUAL(NMof::QualifiersToMof(quals, 3),
                      "   [Key ( true ), Description ( \"d\" )]\n");
    BOOST_CHECK_EQUAL(NMof::QualifiersToMof(TCimQualifiers(), 3), "");

    // a list that does not fit goes one qualifier per line
    quals.Set("Description",
              CCimQualifier("Description", CCimValue(string(50, 'd'))));
    BOOST_CHECK_EQUAL(NMof::QualifiersToMof(quals, 0),
                      "[Key ( true ),\n Description ( \"" +
                      string(50, 'd') + "\" )]\n");
}


BOOST_AUTO_TEST_CASE(TestInstanceMof)
{
    CCimValue levels = CCimValue::MakeArray();
    levels.SetArray().push_back(CCimValue(-1));
    levels.SetArray().push_back(CCimValue(5));
    CCimInstance inst("C1");
    inst.SetProperty(CCimProperty("p1", levels, eCimType_sint32));
    BOOST_CHECK_EQUAL(inst.ToMof(),
                      "instance of C1 {\n   p1 = { -1, 5 };\n};\n");

    inst.SetProperty(CCimProperty("s", CCimValue("abc")));
    inst.SetProperty(CCimProperty("b", CCimValue(false)));
    inst.SetProperty(CCimProperty("n", CCimValue(), eCimType_uint8));
    inst.SetProperty(CCimProperty("c", CCimValue::MakeChar16("x")));
    inst.SetProperty(CCimProperty("e", CCimValue::MakeArray(),
                                  eCimType_uint16));
    CCimInstanceName ref("CIM_Bar");
    ref.SetKeybinding("k", CCimValue("v"));
    inst.SetProperty(CCimProperty("r", CCimValue(ref)));
    inst.SetQualifier(CCimQualifier("Description", CCimValue("d")));
    BOOST_CHECK_EQUAL(inst.ToMof(),
                      "[Description ( \"d\" )]\n"
                      "instance of C1 {\n"
                      "   p1 = { -1, 5 };\n"
                      "   s = \"abc\";\n"
                      "   b = false;\n"
                      "   n = NULL;\n"
                      "   c = 'x';\n"
                      "   e = { };\n"
                      "   r = \"/:CIM_Bar.k=\\\"v\\\"\";\n"
                      "};\n");
}


BOOST_AUTO_TEST_CASE(TestArrayWrapping)
{
    // twelve items of ten columns: six fit on the first line
    CCimInstance inst("C1");
    inst.SetProperty(CCimProperty("p", s_StringArray("abcdefgh", 12)));

    string first, second;
    for (size_t i = 0;  i < 6;  ++i) {
        first  += (i ? ", " : "") + string("\"abcdefgh\"");
        second += (i ? ", " : "") + string("\"abcdefgh\"");
    }
    BOOST_CHECK_EQUAL(inst.ToMof(),
                      "instance of C1 {\n   p = { " + first + ",\n      " +
                      second + " };\n};\n");
}


BOOST_AUTO_TEST_CASE(TestClassMof)
{
    CCimClass cls("CIM_Foo", "CIM_Base");
    cls.SetQualifier(CCimQualifier("Description", CCimValue("foo")));
    CCimProperty id("InstanceID", CCimValue(), eCimType_string);
    id.SetQualifier(CCimQualifier("Key", true));
    cls.SetProperty(id);
    cls.SetProperty(CCimProperty("Count",
        CCimValue::MakeInteger(eCimType_uint32, 7)));
    cls.SetMethod(CCimMethod("Reset", eCimType_uint32));
    BOOST_CHECK_EQUAL(cls.ToMof(),
                      "[Description ( \"foo\" )]\n"
                      "class CIM_Foo : CIM_Base {\n"
                      "\n"
                      "   [Key ( true )]\n"
                      "   string InstanceID;\n"
                      "\n"
                      "   uint32 Count = 7;\n"
                      "\n"
                      "   uint32 Reset();\n"
                      "\n"
                      "};\n");

    BOOST_CHECK_EQUAL(CCimClass("CIM_Base").ToMof(),
                      "class CIM_Base {\n\n};\n");

    CCimProperty levels("Levels", CCimValue(), eCimType_sint8, true);
    BOOST_CHECK_EQUAL(levels.ToMof(false), "   sint8 Levels[];\n");
    levels.SetArraySize(4);
    BOOST_CHECK_EQUAL(levels.ToMof(false), "   sint8 Levels[4];\n");

    CCimProperty ref("Ref", CCimValue(), eCimType_reference, null,
                     eEmbeddedObject_None, "CIM_Bar");
    BOOST_CHECK_EQUAL(ref.ToMof(false), "   CIM_Bar REF Ref;\n");
}


BOOST_AUTO_TEST_CASE(TestMethodMof)
{
    CCimMethod method("Reset", eCimType_uint32);
    method.SetParameter(CCimParameter("Force", eCimType_boolean));
    BOOST_CHECK_EQUAL(method.ToMof(),
                      "   uint32 Reset(\n      boolean Force);\n");

    method.SetParameter(CCimParameter("Targets", eCimType_reference,
                                      "CIM_Bar", true));
    CCimParameter timeout("Timeout", eCimType_uint32);
    timeout.SetQualifier(CCimQualifier("In", true));
    method.SetParameter(timeout);
    method.SetQualifier(CCimQualifier("Description", CCimValue("r")));
    BOOST_CHECK_EQUAL(method.ToMof(),
                      "   [Description ( \"r\" )]\n"
                      "   uint32 Reset(\n"
                      "      boolean Force,\n"
                      "      CIM_Bar REF Targets[],\n"
                      "      [In ( true )]\n"
                      "      uint32 Timeout);\n");
}


BOOST_AUTO_TEST_CASE(TestQualifierDeclarationMof)
{
    CCimQualifierDeclaration key("Key", eCimType_boolean, CCimValue(false),
                                 null, null, false, false);
    key.SetScope("PROPERTY", true);
    key.SetScope("REFERENCE", true);
    key.SetScope("METHOD", false);
    BOOST_CHECK_EQUAL(key.ToMof(),
                      "Qualifier Key : boolean = false,\n"
                      "    Scope(property, reference),\n"
                      "    Flavor(DisableOverride, Restricted);\n");

    CCimQualifierDeclaration values("Values", eCimType_string, CCimValue(),
                                    true, 3, null, null, null, true);
    values.SetScope("any", true);
    BOOST_CHECK_EQUAL(values.ToMof(),
                      "Qualifier Values : string[3],\n"
                      "    Scope(any),\n"
                      "    Flavor(Translatable);\n");
}
