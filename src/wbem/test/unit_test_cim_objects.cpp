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
 *   Unit tests for CIM properties, qualifiers, methods, classes and instances
 *
 */

#include <ncbi_pch.hpp>
#include <corelib/test_boost.hpp>
#include <wbem/cim_instance.hpp>
#include <wbem/cim_class.hpp>
#include <wbem/cim_qualifier_decl.hpp>


USING_WBEM_SCOPE;


/// Collects the diagnostics posted while it is alive
class CDiagCollector : public CDiagHandler
{
public:
    CDiagCollector(void)
        : m_SavedLevel(SetDiagPostLevel(eDiag_Info)),
          m_SavedHandler(GetDiagHandler(true))
        {
            SetDiagHandler(this, false);
        }
    ~CDiagCollector(void)
        {
            SetDiagHandler(m_SavedHandler, true);
            SetDiagPostLevel(m_SavedLevel);
        }

    virtual void Post(const SDiagMessage& mess)
        {
            m_Severities.push_back(mess.m_Severity);
            m_SubCodes.push_back(mess.m_ErrSubCode);
        }

    size_t Count(EDiagSev sev, int sub_code) const
        {
            size_t count = 0;
            for (size_t i = 0;  i < m_Severities.size();  ++i) {
                if (m_Severities[i] == sev  &&  m_SubCodes[i] == sub_code) {
                    ++count;
                }
            }
            return count;
        }

private:
    EDiagSev         m_SavedLevel;
    CDiagHandler*    m_SavedHandler;
    vector<EDiagSev> m_Severities;
    vector<int>      m_SubCodes;
};


static TCimNamedValues s_Values(const string& name1, const CCimValue& value1,
                                const string& name2 = kEmptyStr,
                                const CCimValue& value2 = CCimValue())
{
    TCimNamedValues values;
    values.push_back(TCimNamedValues::value_type(name1, value1));
    if ( !name2.empty() ) {
        values.push_back(TCimNamedValues::value_type(name2, value2));
    }
    return values;
}


static CCimQualifier s_KeyQualifier(void)
{
    return CCimQualifier("Key", CCimValue(true), null, null, false);
}


// CIM_Foo with a string key, a uint32 and a sint8 array
static CCimClass s_MakeFooClass(void)
{
    CCimClass cls("CIM_Foo", "CIM_Base");
    CCimProperty name("Name", CCimValue(), eCimType_string);
    name.SetQualifier(s_KeyQualifier());
    cls.SetProperty(name);
    CCimProperty size("Size", CCimValue(), eCimType_uint32);
    size.SetClassOrigin("CIM_Foo");
    cls.SetProperty(size);
    cls.SetProperty(CCimProperty("Levels", CCimValue::MakeArray(),
                                 eCimType_sint8));
    return cls;
}


BOOST_AUTO_TEST_CASE(TestPropertyTypeInference)
{
    CCimProperty str("S", CCimValue("abc"));
    BOOST_CHECK_EQUAL(str.GetType(), eCimType_string);
    BOOST_CHECK( !str.IsArray() );

    CCimProperty typed("N", CCimValue(5), eCimType_uint16);
    BOOST_CHECK_EQUAL(typed.GetValue().GetNumberType(), eCimType_uint16);

    // an untyped number cannot tell the type
    try {
        CCimProperty("N", CCimValue(5));
        BOOST_ERROR("untyped number accepted");
    }
    catch (CCimException& e) {
        BOOST_CHECK_EQUAL(e.GetErrCode(), CCimException::eType);
    }
    try {
        CCimProperty("N", CCimValue());
        BOOST_ERROR("NULL without a type accepted");
    }
    catch (CCimException& e) {
        BOOST_CHECK_EQUAL(e.GetErrCode(), CCimException::eValue);
    }

    CCimProperty text_to_int("N", CCimValue("12"), eCimType_uint8);
    BOOST_CHECK(text_to_int.GetValue() == CCimValue(12));
    BOOST_CHECK_THROW(CCimProperty("N", CCimValue("300"), eCimType_uint8),
                      CCimRangeException);

    CCimInstanceName path("CIM_Bar");
    CCimProperty ref("R", CCimValue(path));
    BOOST_CHECK_EQUAL(ref.GetType(), eCimType_reference);
    BOOST_CHECK_EQUAL(ref.GetReferenceClass(), "CIM_Bar");

    CCimProperty null_ref("R", CCimValue(), null, null,
                          eEmbeddedObject_None, "CIM_Bar");
    BOOST_CHECK_EQUAL(null_ref.GetType(), eCimType_reference);

    CCimProperty embedded("E", CCimValue(CCimInstance("CIM_Emb")));
    BOOST_CHECK_EQUAL(embedded.GetType(), eCimType_string);
    BOOST_CHECK_EQUAL(embedded.GetEmbeddedObject(), eEmbeddedObject_Instance);
}


BOOST_AUTO_TEST_CASE(TestPropertyConsistency)
{
    CCimValue::TArray items;
    items.push_back(CCimValue::MakeInteger(eCimType_uint8, 1));
    CCimProperty array("A", CCimValue(items));
    BOOST_CHECK(array.IsArray());
    BOOST_CHECK_EQUAL(array.GetType(), eCimType_uint8);

    BOOST_CHECK_THROW(array.SetValue(CCimValue::MakeInteger(eCimType_uint8, 1)),
                      CCimException);
    BOOST_CHECK_NO_THROW(array.SetValue(CCimValue()));
    BOOST_CHECK_NO_THROW(array.SetArraySize(4));
    BOOST_CHECK_EQUAL((unsigned int) array.GetArraySize(), 4u);

    CCimProperty scalar("S", CCimValue("x"));
    BOOST_CHECK_THROW(scalar.SetValue(CCimValue(items)), CCimException);
    BOOST_CHECK_THROW(scalar.SetArraySize(2), CCimException);
    BOOST_CHECK_THROW(scalar.SetReferenceClass("CIM_Bar"), CCimException);
    BOOST_CHECK_THROW(CCimProperty("S", CCimValue(items), eCimType_uint8,
                                   false),
                      CCimException);

    CCimProperty ref("R", CCimValue(CCimInstanceName("CIM_Bar")));
    BOOST_CHECK_THROW(ref.SetIsArray(true), CCimException);
    BOOST_CHECK( !ref.IsArray() );

    // embedded objects go into string properties only
    BOOST_CHECK_THROW(CCimProperty("E", CCimValue(), eCimType_uint8, null,
                                   eEmbeddedObject_Instance),
                      CCimException);
    BOOST_CHECK_THROW(CCimProperty("E", CCimValue(CCimClass("CIM_C")),
                                   eCimType_string, null,
                                   eEmbeddedObject_Instance),
                      CCimException);
    BOOST_CHECK_THROW(CCimProperty("", CCimValue("x")), CCimException);

    // type change converts the value
    CCimProperty num("N", CCimValue("7"));
    num.SetType(eCimType_uint32);
    BOOST_CHECK_EQUAL(num.GetValue().GetNumberType(), eCimType_uint32);
}


BOOST_AUTO_TEST_CASE(TestPropertyEquality)
{
    CCimProperty a("Name", CCimValue("x"));
    CCimProperty b("NAME", CCimValue("x"));
    BOOST_CHECK(a == b);
    BOOST_CHECK_EQUAL(a.GetHash(), b.GetHash());

    b.SetPropagated(true);
    BOOST_CHECK(a != b);
    b.SetPropagated(null);
    b.SetQualifier(s_KeyQualifier());
    BOOST_CHECK(a != b);

    CCimProperty c("Name", CCimValue::MakeChar16("x"));
    BOOST_CHECK(a != c);

    CCimProperty copy(b);
    copy.SetQualifier(CCimQualifier("Key", CCimValue(false)));
    BOOST_CHECK(b.GetQualifiers().Get("key").GetValue() == CCimValue(true));
}


BOOST_AUTO_TEST_CASE(TestQualifier)
{
    CCimQualifier q("Description", CCimValue("text"));
    BOOST_CHECK_EQUAL(q.GetType(), eCimType_string);
    BOOST_CHECK(q.GetOverridable().IsNull());

    CCimQualifier typed("MaxLen", CCimValue(256), eCimType_uint32);
    BOOST_CHECK_EQUAL(typed.GetValue().GetNumberType(), eCimType_uint32);

    BOOST_CHECK_THROW(CCimQualifier("MaxLen", CCimValue(256)), CCimException);
    try {
        CCimQualifier("Q", CCimValue());
        BOOST_ERROR("NULL qualifier without a type accepted");
    }
    catch (CCimException& e) {
        BOOST_CHECK_EQUAL(e.GetErrCode(), CCimException::eValue);
    }
    BOOST_CHECK_NO_THROW(CCimQualifier("Q", CCimValue(), eCimType_string));
    BOOST_CHECK_THROW(CCimQualifier("Q", CCimValue(CCimInstanceName("C"))),
                      CCimException);
    BOOST_CHECK_THROW(CCimQualifier("Q", CCimValue(CCimInstance("C"))),
                      CCimException);

    // a rejected type leaves the qualifier unchanged
    CCimQualifier null_value("Q", CCimValue(), eCimType_string);
    BOOST_CHECK_THROW(null_value.SetType(eCimType_reference), CCimException);
    BOOST_CHECK_EQUAL(null_value.GetType(), eCimType_string);
    BOOST_CHECK(null_value.GetValue().IsNull());
    BOOST_CHECK_THROW(typed.SetType(eCimType_boolean), CCimException);
    BOOST_CHECK_EQUAL(typed.GetType(), eCimType_uint32);
    BOOST_CHECK(typed.GetValue() == CCimValue(256));
    typed.SetType(eCimType_sint64);
    BOOST_CHECK_EQUAL(typed.GetValue().GetNumberType(), eCimType_sint64);

    CCimQualifier a("Key", CCimValue(true), null, null, false, true);
    CCimQualifier b("KEY", CCimValue(true), null, null, false, true);
    BOOST_CHECK(a == b);
    BOOST_CHECK_EQUAL(a.GetHash(), b.GetHash());
    b.SetTranslatable(true);
    BOOST_CHECK(a != b);
}


BOOST_AUTO_TEST_CASE(TestParameter)
{
    CCimParameter scalar("P", eCimType_uint32);
    BOOST_CHECK_EQUAL(scalar.GetType(), eCimType_uint32);
    BOOST_CHECK( !scalar.IsArray() );
    BOOST_CHECK(scalar.GetValue().IsNull());

    CCimParameter refs("R", eCimType_reference, "CIM_Foo", true);
    BOOST_CHECK(refs.IsArray());
    BOOST_CHECK_EQUAL(refs.GetReferenceClass(), "CIM_Foo");

    BOOST_CHECK_THROW(CCimParameter("P", eCimType_uint8, "CIM_Foo"),
                      CCimException);
    BOOST_CHECK_THROW(CCimParameter("P", eCimType_uint8, kEmptyStr, false, 3),
                      CCimException);
    BOOST_CHECK_THROW(CCimParameter("P", null), CCimException);

    CCimParameter value = CCimParameter::CreateValue("Count", CCimValue("3"));
    BOOST_CHECK_EQUAL(value.GetType(), eCimType_string);
    BOOST_CHECK_THROW(CCimParameter::CreateValue("Count", CCimValue(3)),
                      CCimException);

    CCimParameter copy(scalar);
    copy.SetQualifier(CCimQualifier("In", CCimValue(true)));
    BOOST_CHECK(copy != scalar);
    BOOST_CHECK(scalar.GetQualifiers().empty());
}


BOOST_AUTO_TEST_CASE(TestMethod)
{
    CCimMethod method("Reset", eCimType_uint32);
    method.SetParameter(CCimParameter("Force", eCimType_boolean));
    method.SetParameter(CCimParameter("Delay", eCimType_uint32));
    BOOST_CHECK_EQUAL(method.GetParameters().size(), 2u);
    BOOST_CHECK(method.GetParameters().Has("force"));

    BOOST_CHECK_THROW(CCimMethod("Get", eCimType_reference), CCimException);
    BOOST_CHECK_THROW(method.SetReturnType(eCimType_reference),
                      CCimException);
    BOOST_CHECK_THROW(CCimMethod("", eCimType_uint32), CCimException);

    CCimMethod other("RESET", eCimType_uint32);
    other.SetParameter(CCimParameter("Delay", eCimType_uint32));
    other.SetParameter(CCimParameter("Force", eCimType_boolean));
    BOOST_CHECK(method == other);
    BOOST_CHECK_EQUAL(method.GetHash(), other.GetHash());

    vector<CCimParameter> params;
    params.push_back(CCimParameter("Force", eCimType_boolean));
    other.SetParameters(params);
    BOOST_CHECK(method != other);
}


BOOST_AUTO_TEST_CASE(TestQualifierDeclaration)
{
    CCimQualifierDeclaration decl("Key", eCimType_boolean, CCimValue(false),
                                  null, null, false, false);
    BOOST_CHECK( !decl.IsArray() );
    CCimQualifierDeclaration::TScopeList scopes;
    scopes.push_back(make_pair(string("property"), true));
    scopes.push_back(make_pair(string("reference"), true));
    decl.SetScopes(scopes);
    BOOST_CHECK(decl.GetScopes().Get("PROPERTY"));

    BOOST_CHECK_THROW(decl.SetScope("everything", true), CCimException);
    BOOST_CHECK_NO_THROW(decl.SetScope("any", false));
    BOOST_CHECK_THROW(CCimQualifierDeclaration("Q", eCimType_reference),
                      CCimException);
    BOOST_CHECK_THROW(CCimQualifierDeclaration("Q", eCimType_string,
                                               CCimValue::MakeArray(), false),
                      CCimException);
    BOOST_CHECK_THROW(CCimQualifierDeclaration("Q", eCimType_string,
                                               CCimValue(), false, 4),
                      CCimException);

    CCimQualifierDeclaration values("ValueMap", eCimType_string,
                                    CCimValue(), true, 3);
    BOOST_CHECK(values.IsArray());
    BOOST_CHECK_EQUAL((unsigned int) values.GetArraySize(), 3u);
}


BOOST_AUTO_TEST_CASE(TestClass)
{
    CCimClass cls = s_MakeFooClass();
    BOOST_CHECK_EQUAL(cls.GetSuperclass(), "CIM_Base");
    BOOST_CHECK_EQUAL(cls.GetProperties().size(), 3u);
    BOOST_CHECK(cls.GetProperties().Has("size"));

    CCimClass copy(cls);
    copy.SetProperty(CCimProperty("Extra", CCimValue("x")));
    BOOST_CHECK_EQUAL(cls.GetProperties().size(), 3u);
    BOOST_CHECK(copy != cls);

    CCimClass same = s_MakeFooClass();
    same.SetClassname("cim_foo");
    BOOST_CHECK(same == cls);
    BOOST_CHECK_EQUAL(same.GetHash(), cls.GetHash());

    same.SetPath(CCimClassName("CIM_Foo", "woot.com", "root/cimv2"));
    BOOST_CHECK(same != cls);
    BOOST_CHECK_THROW(cls.GetPath(), CCimException);

    CCimClass no_super("CIM_Top");
    BOOST_CHECK( !no_super.IsSetSuperclass() );
}


BOOST_AUTO_TEST_CASE(TestInstanceProperties)
{
    CCimInstance inst("CIM_Foo",
                      s_Values("Name", CCimValue("x"),
                               "Flag", CCimValue(true)));
    BOOST_CHECK_EQUAL(inst.size(), 2u);
    BOOST_CHECK(inst["name"] == CCimValue("x"));
    BOOST_CHECK(inst.Get("Missing", CCimValue("d")) == CCimValue("d"));
    BOOST_CHECK(inst.Get("Missing").IsNull());
    BOOST_CHECK_THROW(inst["Missing"], CCimException);
    BOOST_CHECK_THROW(inst.Erase("Missing"), CCimException);

    // untyped numbers need a declared property
    BOOST_CHECK_THROW(CCimInstance("CIM_Foo", s_Values("N", CCimValue(1))),
                      CCimException);

    inst.SetPropertyValue("FLAG", CCimValue(false));
    BOOST_CHECK(inst["Flag"] == CCimValue(false));
    // the stored spelling of an existing property is kept
    BOOST_CHECK_EQUAL(inst.GetProperties().GetKey("flag"), "Flag");

    inst.SetProperty(CCimProperty("Size", CCimValue(), eCimType_uint32));
    inst.UpdateExisting(s_Values("Size", CCimValue("12"),
                                 "Other", CCimValue("z")));
    BOOST_CHECK( !inst.Has("Other") );
    BOOST_CHECK_EQUAL(inst["Size"].GetNumberType(), eCimType_uint32);
    BOOST_CHECK_EQUAL(inst["Size"].GetUint8(), 12u);

    inst.Update(s_Values("Other", CCimValue("z")));
    BOOST_CHECK(inst.Has("other"));

    inst.Erase("other");
    BOOST_CHECK( !inst.Has("Other") );
}


BOOST_AUTO_TEST_CASE(TestInstancePathSync)
{
    CCimInstance inst("CIM_Foo", s_Values("Name", CCimValue("x")));
    CCimInstanceName path("CIM_Foo", kEmptyStr, "root/cimv2");
    path.SetKeybinding("Name", CCimValue("old"));
    inst.SetPath(path);
    // the key takes the property value
    BOOST_CHECK(inst.GetPath()["Name"] == CCimValue("x"));

    inst.SetProperty(CCimProperty("name", CCimValue("y")));
    BOOST_CHECK(inst.GetPath()["Name"] == CCimValue("y"));
    BOOST_CHECK_EQUAL(inst.GetPath().GetKeybindings().GetKey("NAME"), "Name");

    CCimInstance copy(inst);
    copy.SetPropertyValue("Name", CCimValue("z"));
    BOOST_CHECK(inst.GetPath()["Name"] == CCimValue("y"));
    BOOST_CHECK(copy.GetPath()["Name"] == CCimValue("z"));

    copy.ResetPath();
    BOOST_CHECK( !copy.IsSetPath() );
    BOOST_CHECK_THROW(copy.GetPath(), CCimException);
}


BOOST_AUTO_TEST_CASE(TestInstanceEquality)
{
    CCimInstance a("CIM_Foo",
                   s_Values("Name", CCimValue("x"), "Flag", CCimValue(true)));
    CCimInstance b("cim_foo",
                   s_Values("FLAG", CCimValue(true), "name", CCimValue("x")));
    BOOST_CHECK(a == b);
    BOOST_CHECK_EQUAL(a.GetHash(), b.GetHash());

    b.SetQualifier(CCimQualifier("Description", CCimValue("d")));
    BOOST_CHECK(a != b);

    CCimInstance c(a);
    c.SetPath(CCimInstanceName("CIM_Foo"));
    BOOST_CHECK(a != c);
}


BOOST_AUTO_TEST_CASE(TestInstanceFromClass)
{
    CCimClass cls = s_MakeFooClass();
    CRef<CCimInstance> inst =
        CCimInstance::FromClass(cls,
                                s_Values("Name", CCimValue("x"),
                                         "Size", CCimValue(5)),
                                "root/cimv2");
    BOOST_CHECK_EQUAL(inst->size(), 2u);
    BOOST_CHECK_EQUAL(inst->GetProperties().Get("Size").GetType(),
                      eCimType_uint32);
    BOOST_CHECK( !inst->GetProperties().Get("Size").IsSetClassOrigin() );
    BOOST_CHECK(inst->IsSetPath());
    BOOST_CHECK_EQUAL(inst->GetPath().ToWbemUri(),
                      "/root/cimv2:CIM_Foo.Name=\"x\"");

    inst = CCimInstance::FromClass(cls, s_Values("Name", CCimValue("x")),
                                   kEmptyStr, false, true, true);
    BOOST_CHECK( !inst->IsSetPath() );
    BOOST_CHECK_EQUAL(inst->size(), 3u);
    BOOST_CHECK((*inst)["Size"].IsNull());
    BOOST_CHECK_EQUAL(inst->GetProperties().Get("Size").GetClassOrigin(),
                      "CIM_Foo");
    BOOST_CHECK((*inst)["Levels"].IsArray());

    BOOST_CHECK_THROW(CCimInstance::FromClass(cls,
                                              s_Values("Bogus", CCimValue("x"))),
                      CCimException);
    try {
        CCimInstance::FromClass(cls, s_Values("Size", CCimValue(true)));
        BOOST_ERROR("mistyped property value accepted");
    }
    catch (CCimException& e) {
        BOOST_CHECK_EQUAL(e.GetErrCode(), CCimException::eValue);
    }

    // missing key values
    inst = CCimInstance::FromClass(cls, s_Values("Size", CCimValue(1)));
    BOOST_CHECK_EQUAL(inst->GetPath().size(), 0u);
    BOOST_CHECK_THROW(CCimInstance::FromClass(cls,
                                              s_Values("Size", CCimValue(1)),
                                              kEmptyStr, true, false, false,
                                              true),
                      CCimException);
}


BOOST_AUTO_TEST_CASE(TestInstanceNameFromInstance)
{
    CCimClass cls = s_MakeFooClass();
    CCimInstance inst("CIM_Foo", s_Values("Name", CCimValue("x")));
    CRef<CCimInstanceName> path =
        CCimInstanceName::FromInstance(cls, inst, "root", "woot.com");
    BOOST_CHECK_EQUAL(path->ToWbemUri(), "//woot.com/root:CIM_Foo.Name=\"x\"");
    BOOST_CHECK_EQUAL(path->size(), 1u);

    CCimInstance no_key("CIM_Foo");
    BOOST_CHECK_THROW(CCimInstanceName::FromInstance(cls, no_key),
                      CCimException);
    path = CCimInstanceName::FromInstance(cls, no_key, kEmptyStr, kEmptyStr,
                                          false);
    BOOST_CHECK_EQUAL(path->size(), 0u);
}


BOOST_AUTO_TEST_CASE(TestInstancePropertyList)
{
    CDiagCollector diag;
    CCimInstance inst("CIM_Foo");
    CCimInstanceName path("CIM_Foo");
    path.SetKeybinding("Name", CCimValue("x"));
    inst.SetPath(path);

    vector<string> names;
    names.push_back("flag");
    inst.SetPropertyList(names);
    BOOST_CHECK(inst.IsSetPropertyList());
    BOOST_CHECK_EQUAL(diag.Count(eDiag_Warning, 1), 1u);

    inst.SetProperty(CCimProperty("Flag", CCimValue(true)));
    inst.SetProperty(CCimProperty("Other", CCimValue("o")));
    // keys of the path are never filtered
    inst.SetProperty(CCimProperty("Name", CCimValue("y")));
    BOOST_CHECK(inst.Has("Flag"));
    BOOST_CHECK( !inst.Has("Other") );
    BOOST_CHECK(inst.Has("Name"));
    BOOST_CHECK_EQUAL(diag.Count(eDiag_Info, 2), 1u);

    inst.ResetPropertyList();
    inst.SetProperty(CCimProperty("Other", CCimValue("o")));
    BOOST_CHECK(inst.Has("Other"));
}
