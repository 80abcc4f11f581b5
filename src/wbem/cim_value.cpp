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
 *   Loosely typed CIM value
 *
 */

#include <ncbi_pch.hpp>
#include <wbem/cim_value.hpp>
#include <wbem/cim_instance_name.hpp>
#include <wbem/cim_class_name.hpp>
#include <wbem/cim_instance.hpp>
#include <wbem/cim_class.hpp>
#include <corelib/ncbi_limits.h>
#include <corelib/ncbifloat.h>
#include <math.h>
#include <functional>
#include <limits>


BEGIN_WBEM_SCOPE


static const char* s_KindName(CCimValue::EKind kind)
{
    switch ( kind ) {
    case CCimValue::eKind_Null:          return "NULL";
    case CCimValue::eKind_Boolean:       return "boolean";
    case CCimValue::eKind_String:        return "string";
    case CCimValue::eKind_Char16:        return "char16";
    case CCimValue::eKind_Integer:       return "integer";
    case CCimValue::eKind_Real:          return "real";
    case CCimValue::eKind_DateTime:      return "datetime";
    case CCimValue::eKind_InstanceName:  return "instance path";
    case CCimValue::eKind_ClassName:     return "class path";
    case CCimValue::eKind_Instance:      return "instance";
    case CCimValue::eKind_Class:         return "class";
    case CCimValue::eKind_Array:         return "array";
    }
    return "unknown";
}


static CRef<CObject> s_CloneObject(CCimValue::EKind kind, const CObject& obj)
{
    CRef<CObject> ret;
    switch ( kind ) {
    case CCimValue::eKind_InstanceName:
        ret.Reset(new CCimInstanceName(
                      static_cast<const CCimInstanceName&>(obj)));
        break;
    case CCimValue::eKind_ClassName:
        ret.Reset(new CCimClassName(static_cast<const CCimClassName&>(obj)));
        break;
    case CCimValue::eKind_Instance:
        ret.Reset(new CCimInstance(static_cast<const CCimInstance&>(obj)));
        break;
    case CCimValue::eKind_Class:
        ret.Reset(new CCimClass(static_cast<const CCimClass&>(obj)));
        break;
    default:
        break;
    }
    return ret;
}


// Sign and magnitude of an integral real within the range of integer values
static bool s_SplitIntegralReal(double value, bool& negative, Uint8& magnitude)
{
    if (isnan(value)  ||  value != floor(value)  ||
        fabs(value) >= 18446744073709551616.0) {
        return false;
    }
    negative  = value < 0;
    magnitude = Uint8(fabs(value));
    return true;
}


static size_t s_IntegerHash(bool negative, Uint8 magnitude)
{
    return negative ? ~size_t(magnitude - 1) : size_t(magnitude);
}


CCimValue::CCimValue(void)
    : m_Kind(eKind_Null), m_Typed(false), m_Type(eCimType_string),
      m_Bool(false), m_Negative(false), m_Magnitude(0), m_Real(0)
{
}


CCimValue::CCimValue(bool value)
    : m_Kind(eKind_Boolean), m_Typed(true), m_Type(eCimType_boolean),
      m_Bool(value), m_Negative(false), m_Magnitude(0), m_Real(0)
{
}


CCimValue::CCimValue(int value)
    : m_Kind(eKind_Integer), m_Typed(false), m_Type(eCimType_sint64),
      m_Bool(false), m_Negative(false), m_Magnitude(0), m_Real(0)
{
    x_SetInteger(value < 0, value < 0 ? Uint8(-Int8(value)) : Uint8(value));
}


CCimValue::CCimValue(unsigned int value)
    : m_Kind(eKind_Integer), m_Typed(false), m_Type(eCimType_uint64),
      m_Bool(false), m_Negative(false), m_Magnitude(0), m_Real(0)
{
    x_SetInteger(false, value);
}


CCimValue::CCimValue(Int8 value)
    : m_Kind(eKind_Integer), m_Typed(false), m_Type(eCimType_sint64),
      m_Bool(false), m_Negative(false), m_Magnitude(0), m_Real(0)
{
    // 0 - Uint8(value) is the magnitude even for kMin_I8
    x_SetInteger(value < 0, value < 0 ? 0 - Uint8(value) : Uint8(value));
}


CCimValue::CCimValue(Uint8 value)
    : m_Kind(eKind_Integer), m_Typed(false), m_Type(eCimType_uint64),
      m_Bool(false), m_Negative(false), m_Magnitude(0), m_Real(0)
{
    x_SetInteger(false, value);
}


CCimValue::CCimValue(double value)
    : m_Kind(eKind_Real), m_Typed(false), m_Type(eCimType_real64),
      m_Bool(false), m_Negative(false), m_Magnitude(0), m_Real(value)
{
}


CCimValue::CCimValue(const char* value)
    : m_Kind(eKind_String), m_Typed(true), m_Type(eCimType_string),
      m_Bool(false), m_Negative(false), m_Magnitude(0), m_Real(0),
      m_String(value)
{
}


CCimValue::CCimValue(const string& value)
    : m_Kind(eKind_String), m_Typed(true), m_Type(eCimType_string),
      m_Bool(false), m_Negative(false), m_Magnitude(0), m_Real(0),
      m_String(value)
{
}


CCimValue::CCimValue(const CCimDateTime& value)
    : m_Kind(eKind_DateTime), m_Typed(true), m_Type(eCimType_datetime),
      m_Bool(false), m_Negative(false), m_Magnitude(0), m_Real(0),
      m_DateTime(value)
{
}


CCimValue::CCimValue(const CCimInstanceName& value)
    : m_Kind(eKind_InstanceName), m_Typed(true), m_Type(eCimType_reference),
      m_Bool(false), m_Negative(false), m_Magnitude(0), m_Real(0),
      m_Object(new CCimInstanceName(value))
{
}


CCimValue::CCimValue(const CCimClassName& value)
    : m_Kind(eKind_ClassName), m_Typed(true), m_Type(eCimType_reference),
      m_Bool(false), m_Negative(false), m_Magnitude(0), m_Real(0),
      m_Object(new CCimClassName(value))
{
}


CCimValue::CCimValue(const CCimInstance& value)
    : m_Kind(eKind_Instance), m_Typed(true), m_Type(eCimType_string),
      m_Bool(false), m_Negative(false), m_Magnitude(0), m_Real(0),
      m_Object(new CCimInstance(value))
{
}


CCimValue::CCimValue(const CCimClass& value)
    : m_Kind(eKind_Class), m_Typed(true), m_Type(eCimType_string),
      m_Bool(false), m_Negative(false), m_Magnitude(0), m_Real(0),
      m_Object(new CCimClass(value))
{
}


CCimValue::CCimValue(const TArray& value)
    : m_Kind(eKind_Array), m_Typed(false), m_Type(eCimType_string),
      m_Bool(false), m_Negative(false), m_Magnitude(0), m_Real(0),
      m_Array(value)
{
}


CCimValue::CCimValue(const CCimValue& other)
    : m_Kind(other.m_Kind), m_Typed(other.m_Typed), m_Type(other.m_Type),
      m_Bool(other.m_Bool), m_Negative(other.m_Negative),
      m_Magnitude(other.m_Magnitude), m_Real(other.m_Real),
      m_String(other.m_String), m_DateTime(other.m_DateTime),
      m_Array(other.m_Array)
{
    if (other.m_Object) {
        m_Object = s_CloneObject(m_Kind, *other.m_Object);
    }
}


CCimValue& CCimValue::operator=(const CCimValue& other)
{
    if (this != &other) {
        CRef<CObject> obj;
        if (other.m_Object) {
            obj = s_CloneObject(other.m_Kind, *other.m_Object);
        }
        m_Kind      = other.m_Kind;
        m_Typed     = other.m_Typed;
        m_Type      = other.m_Type;
        m_Bool      = other.m_Bool;
        m_Negative  = other.m_Negative;
        m_Magnitude = other.m_Magnitude;
        m_Real      = other.m_Real;
        m_String    = other.m_String;
        m_DateTime  = other.m_DateTime;
        m_Object    = obj;
        m_Array     = other.m_Array;
    }
    return *this;
}


CCimValue::~CCimValue(void)
{
}


void CCimValue::x_SetInteger(bool negative, Uint8 magnitude)
{
    m_Negative  = negative  &&  magnitude != 0;
    m_Magnitude = magnitude;
}


static void s_CheckRange(ECimType type, bool negative, Uint8 magnitude)
{
    Int8  min_value;
    Uint8 max_value;
    GetIntegerTypeRange(type, &min_value, &max_value);
    bool ok;
    if (negative) {
        ok = min_value < 0  &&  magnitude <= 0 - Uint8(min_value);
    } else {
        ok = magnitude <= max_value;
    }
    if ( !ok ) {
        NCBI_THROW_FMT(CCimRangeException, eOutOfRange,
                       "Integer value " << (negative ? "-" : "") <<
                       magnitude << " is out of range for CIM type " <<
                       GetCimTypeName(type));
    }
}


CCimValue CCimValue::MakeInteger(ECimType type, int value)
{
    return MakeInteger(type, Int8(value));
}


CCimValue CCimValue::MakeInteger(ECimType type, unsigned int value)
{
    return MakeInteger(type, Uint8(value));
}


CCimValue CCimValue::MakeInteger(ECimType type, Int8 value)
{
    CCimValue ret(value);
    s_CheckRange(type, ret.m_Negative, ret.m_Magnitude);
    ret.m_Typed = true;
    ret.m_Type  = type;
    return ret;
}


CCimValue CCimValue::MakeInteger(ECimType type, Uint8 value)
{
    CCimValue ret(value);
    s_CheckRange(type, false, value);
    ret.m_Typed = true;
    ret.m_Type  = type;
    return ret;
}


CCimValue CCimValue::MakeReal(ECimType type, double value)
{
    if ( !IsRealType(type) ) {
        NCBI_THROW(CCimException, eType,
                   string("Not a real CIM type: ") + GetCimTypeName(type));
    }
    CCimValue ret(type == eCimType_real32 ? double(float(value)) : value);
    ret.m_Typed = true;
    ret.m_Type  = type;
    return ret;
}


CCimValue CCimValue::MakeChar16(const string& value)
{
    CCimValue ret(value);
    ret.m_Kind = eKind_Char16;
    ret.m_Type = eCimType_char16;
    return ret;
}


CCimValue CCimValue::MakeArray(void)
{
    return CCimValue(TArray());
}


void CCimValue::x_CheckKind(EKind kind, const char* what) const
{
    if (m_Kind != kind) {
        NCBI_THROW_FMT(CCimException, eType,
                       "CIM value is " << s_KindName(m_Kind) <<
                       ", not " << what);
    }
}


ECimType CCimValue::GetNumberType(void) const
{
    if ( !IsNumber()  ||  !m_Typed ) {
        NCBI_THROW_FMT(CCimException, eType,
                       "CIM value has no number type tag: " << AsString());
    }
    return m_Type;
}


bool CCimValue::GetBoolean(void) const
{
    x_CheckKind(eKind_Boolean, "boolean");
    return m_Bool;
}


const string& CCimValue::GetString(void) const
{
    if ( !IsString()  &&  !IsChar16() ) {
        x_CheckKind(eKind_String, "string");
    }
    return m_String;
}


bool CCimValue::IsNegative(void) const
{
    if (IsReal()) {
        return m_Real < 0;
    }
    x_CheckKind(eKind_Integer, "integer");
    return m_Negative;
}


Int8 CCimValue::GetInt8(void) const
{
    x_CheckKind(eKind_Integer, "integer");
    if (m_Negative) {
        if (m_Magnitude > 0 - Uint8(kMin_I8)) {
            NCBI_THROW(CCimException, eValue, "Integer too small for Int8");
        }
        return Int8(0 - m_Magnitude);
    }
    if (m_Magnitude > Uint8(kMax_I8)) {
        NCBI_THROW(CCimException, eValue, "Integer too large for Int8");
    }
    return Int8(m_Magnitude);
}


Uint8 CCimValue::GetUint8(void) const
{
    x_CheckKind(eKind_Integer, "integer");
    if (m_Negative) {
        NCBI_THROW(CCimException, eValue,
                   "Negative integer cannot be represented as Uint8");
    }
    return m_Magnitude;
}


double CCimValue::GetReal(void) const
{
    if (IsInteger()) {
        return m_Negative ? -double(m_Magnitude) : double(m_Magnitude);
    }
    x_CheckKind(eKind_Real, "real");
    return m_Real;
}


const CCimDateTime& CCimValue::GetDateTime(void) const
{
    x_CheckKind(eKind_DateTime, "datetime");
    return m_DateTime;
}


const CCimInstanceName& CCimValue::GetInstanceName(void) const
{
    x_CheckKind(eKind_InstanceName, "instance path");
    return static_cast<const CCimInstanceName&>(m_Object.GetObject());
}


CCimInstanceName& CCimValue::SetInstanceName(void)
{
    x_CheckKind(eKind_InstanceName, "instance path");
    return static_cast<CCimInstanceName&>(m_Object.GetObject());
}


const CCimClassName& CCimValue::GetClassName(void) const
{
    x_CheckKind(eKind_ClassName, "class path");
    return static_cast<const CCimClassName&>(m_Object.GetObject());
}


CCimClassName& CCimValue::SetClassName(void)
{
    x_CheckKind(eKind_ClassName, "class path");
    return static_cast<CCimClassName&>(m_Object.GetObject());
}


const CCimInstance& CCimValue::GetInstance(void) const
{
    x_CheckKind(eKind_Instance, "instance");
    return static_cast<const CCimInstance&>(m_Object.GetObject());
}


CCimInstance& CCimValue::SetInstance(void)
{
    x_CheckKind(eKind_Instance, "instance");
    return static_cast<CCimInstance&>(m_Object.GetObject());
}


const CCimClass& CCimValue::GetClass(void) const
{
    x_CheckKind(eKind_Class, "class");
    return static_cast<const CCimClass&>(m_Object.GetObject());
}


CCimClass& CCimValue::SetClass(void)
{
    x_CheckKind(eKind_Class, "class");
    return static_cast<CCimClass&>(m_Object.GetObject());
}


const CCimValue::TArray& CCimValue::GetArray(void) const
{
    x_CheckKind(eKind_Array, "array");
    return m_Array;
}


CCimValue::TArray& CCimValue::SetArray(void)
{
    x_CheckKind(eKind_Array, "array");
    return m_Array;
}


TCimTypeArg CCimValue::InferCimType(void) const
{
    switch ( m_Kind ) {
    case eKind_Null:
        break;
    case eKind_Integer:
    case eKind_Real:
        if (m_Typed) {
            return m_Type;
        }
        break;
    case eKind_Array:
        ITERATE(TArray, it, m_Array) {
            if ( !it->IsNull() ) {
                return it->InferCimType();
            }
        }
        break;
    default:
        return m_Type;
    }
    return null;
}


EEmbeddedObject CCimValue::InferEmbeddedObject(void) const
{
    switch ( m_Kind ) {
    case eKind_Instance:
        return eEmbeddedObject_Instance;
    case eKind_Class:
        return eEmbeddedObject_Object;
    case eKind_Array:
        {{
            EEmbeddedObject ret = eEmbeddedObject_None;
            ITERATE(TArray, it, m_Array) {
                EEmbeddedObject elem = it->InferEmbeddedObject();
                if (elem == eEmbeddedObject_Object) {
                    return elem;
                }
                if (elem != eEmbeddedObject_None) {
                    ret = elem;
                }
            }
            return ret;
        }}
    default:
        return eEmbeddedObject_None;
    }
}


// Decimal integer text with optional sign
static CCimValue s_ParseInteger(ECimType type, const string& text)
{
    string str = NStr::TruncateSpaces(text);
    bool negative = NStr::StartsWith(str, "-");
    if (negative  ||  NStr::StartsWith(str, "+")) {
        str.erase(0, 1);
    }
    if (str.empty()  ||
        str.find_first_not_of("0123456789") != NPOS) {
        NCBI_THROW(CCimException, eValue,
                   "Invalid integer value for CIM type " +
                   string(GetCimTypeName(type)) + ": '" + text + "'");
    }
    Uint8 magnitude = 0;
    try {
        magnitude = NStr::StringToUInt8(str);
    }
    catch (CStringException& e) {
        // digits only, so it did not fit into 64 bits
        NCBI_RETHROW(e, CCimRangeException, eOutOfRange,
                     "Integer value " + text +
                     " is out of range for CIM type " +
                     GetCimTypeName(type));
    }
    s_CheckRange(type, negative, magnitude);
    if (negative) {
        return CCimValue::MakeInteger(type, Int8(0 - magnitude));
    }
    return CCimValue::MakeInteger(type, magnitude);
}


static double s_ParseReal(ECimType type, const string& text)
{
    string str = NStr::TruncateSpaces(text);
    if (NStr::EqualNocase(str, "INF")  ||  NStr::EqualNocase(str, "+INF")) {
        return HUGE_VAL;
    }
    if (NStr::EqualNocase(str, "-INF")) {
        return -HUGE_VAL;
    }
    if (NStr::EqualNocase(str, "NaN")) {
        return numeric_limits<double>::quiet_NaN();
    }
    try {
        return NStr::StringToDouble(str, NStr::fDecimalPosix);
    }
    catch (CStringException& e) {
        NCBI_RETHROW(e, CCimException, eValue,
                     "Invalid real value for CIM type " +
                     string(GetCimTypeName(type)) + ": '" + text + "'");
    }
}


static bool s_ParseBoolean(const string& text)
{
    string str = NStr::TruncateSpaces(text);
    if (NStr::EqualNocase(str, "true")) {
        return true;
    }
    if (NStr::EqualNocase(str, "false")) {
        return false;
    }
    NCBI_THROW(CCimException, eValue,
               "Invalid boolean value: '" + text + "'");
}


CCimValue CCimValue::ConvertTo(ECimType type) const
{
    if (IsNull()) {
        return *this;
    }
    if (IsArray()) {
        CCimValue ret = MakeArray();
        ret.m_Array.reserve(m_Array.size());
        ITERATE(TArray, it, m_Array) {
            ret.m_Array.push_back(it->ConvertTo(type));
        }
        return ret;
    }

    bool is_text = IsString()  ||  IsChar16();
    switch ( type ) {
    case eCimType_boolean:
        if (IsBoolean()) {
            return *this;
        }
        if (is_text) {
            return CCimValue(s_ParseBoolean(m_String));
        }
        break;
    case eCimType_string:
        if (IsString()  ||  IsEmbedded()) {
            return *this;
        }
        if (IsChar16()) {
            return CCimValue(m_String);
        }
        break;
    case eCimType_char16:
        if (is_text) {
            return MakeChar16(m_String);
        }
        break;
    case eCimType_datetime:
        if (IsDateTime()) {
            return *this;
        }
        if (is_text) {
            return CCimValue(CCimDateTime(m_String));
        }
        break;
    case eCimType_reference:
        if (IsReference()) {
            return *this;
        }
        if (is_text) {
            return CCimValue(*CCimInstanceName::FromWbemUri(m_String));
        }
        break;
    case eCimType_real32:
    case eCimType_real64:
        if (IsNumber()) {
            return MakeReal(type, GetReal());
        }
        if (is_text) {
            return MakeReal(type, s_ParseReal(type, m_String));
        }
        break;
    default:
        // integer types
        if (IsInteger()) {
            s_CheckRange(type, m_Negative, m_Magnitude);
            CCimValue ret(*this);
            ret.m_Typed = true;
            ret.m_Type  = type;
            return ret;
        }
        if (is_text) {
            return s_ParseInteger(type, m_String);
        }
        break;
    }
    NCBI_THROW_FMT(CCimException, eType,
                   "Cannot convert " << s_KindName(m_Kind) << " value " <<
                   AsString() << " to CIM type " << GetCimTypeName(type));
}


bool CCimValue::operator==(const CCimValue& other) const
{
    if (IsNumber()  &&  other.IsNumber()) {
        if (IsInteger()  &&  other.IsInteger()) {
            return m_Negative == other.m_Negative
                &&  m_Magnitude == other.m_Magnitude;
        }
        if (IsInteger()  ||  other.IsInteger()) {
            // Exact, a double only approximates large integers
            const CCimValue& integer = IsInteger() ? *this : other;
            const CCimValue& real    = IsInteger() ? other : *this;
            bool  negative;
            Uint8 magnitude;
            return s_SplitIntegralReal(real.m_Real, negative, magnitude)
                &&  negative == integer.m_Negative
                &&  magnitude == integer.m_Magnitude;
        }
        return m_Real == other.m_Real;
    }
    bool is_text = IsString()  ||  IsChar16();
    bool other_is_text = other.IsString()  ||  other.IsChar16();
    if (is_text  ||  other_is_text) {
        return is_text  &&  other_is_text  &&  m_String == other.m_String;
    }
    if (m_Kind != other.m_Kind) {
        return false;
    }
    switch ( m_Kind ) {
    case eKind_Null:
        return true;
    case eKind_Boolean:
        return m_Bool == other.m_Bool;
    case eKind_DateTime:
        return m_DateTime == other.m_DateTime;
    case eKind_InstanceName:
        return GetInstanceName() == other.GetInstanceName();
    case eKind_ClassName:
        return GetClassName() == other.GetClassName();
    case eKind_Instance:
        return GetInstance() == other.GetInstance();
    case eKind_Class:
        return GetClass() == other.GetClass();
    case eKind_Array:
        return m_Array == other.m_Array;
    default:
        return false;
    }
}


size_t CCimValue::GetHash(void) const
{
    switch ( m_Kind ) {
    case eKind_Null:
        return 0;
    case eKind_Boolean:
        return m_Bool ? 0x2f1 : 0x2f0;
    case eKind_String:
    case eKind_Char16:
        return hash<string>()(m_String);
    case eKind_Integer:
        return s_IntegerHash(m_Negative, m_Magnitude);
    case eKind_Real:
        {{
            // Integral reals hash like the equal integer
            bool  negative;
            Uint8 magnitude;
            if (s_SplitIntegralReal(m_Real, negative, magnitude)) {
                return s_IntegerHash(negative, magnitude);
            }
            return hash<double>()(m_Real);
        }}
    case eKind_DateTime:
        return m_DateTime.GetHash();
    case eKind_InstanceName:
        return GetInstanceName().GetHash();
    case eKind_ClassName:
        return GetClassName().GetHash();
    case eKind_Instance:
        return GetInstance().GetHash();
    case eKind_Class:
        return GetClass().GetHash();
    case eKind_Array:
        {{
            size_t ret = m_Array.size();
            ITERATE(TArray, it, m_Array) {
                ret = ret * 31 + it->GetHash();
            }
            return ret;
        }}
    }
    return 0;
}


string CCimValue::FormatReal(double value, ECimType type)
{
    if (isnan(value)) {
        return "NaN";
    }
    if (value == HUGE_VAL  ||  value == -HUGE_VAL) {
        return value < 0 ? "-INF" : "INF";
    }
    bool is_real32 = type == eCimType_real32;
    int max_precision = is_real32 ? 9 : 17;
    string ret;
    for (int precision = 1;  precision <= max_precision;  ++precision) {
        ret = NStr::DoubleToString(value, precision,
                                   NStr::fDoubleGeneral | NStr::fDoublePosix);
        double back = NStr::StringToDouble(ret, NStr::fDecimalPosix);
        if (is_real32 ? float(back) == float(value) : back == value) {
            break;
        }
    }
    if (ret.find_first_of(".nN") == NPOS) {
        SIZE_TYPE exp_pos = ret.find_first_of("eE");
        ret.insert(exp_pos == NPOS ? ret.size() : exp_pos, ".0");
    }
    return ret;
}


string CCimValue::AsString(void) const
{
    switch ( m_Kind ) {
    case eKind_Null:
        return "NULL";
    case eKind_Boolean:
        return m_Bool ? "true" : "false";
    case eKind_String:
        return '"' + m_String + '"';
    case eKind_Char16:
        return '\'' + m_String + '\'';
    case eKind_Integer:
        return (m_Negative ? "-" : "") + NStr::UInt8ToString(m_Magnitude);
    case eKind_Real:
        return FormatReal(m_Real, m_Typed ? m_Type : eCimType_real64);
    case eKind_DateTime:
        return m_DateTime.AsString();
    case eKind_InstanceName:
        return GetInstanceName().AsString();
    case eKind_ClassName:
        return GetClassName().AsString();
    case eKind_Instance:
        return "instance of " + GetInstance().GetClassname();
    case eKind_Class:
        return "class " + GetClass().GetClassname();
    case eKind_Array:
        {{
            string ret = "{";
            ITERATE(TArray, it, m_Array) {
                if (it != m_Array.begin()) {
                    ret += ", ";
                }
                ret += it->AsString();
            }
            return ret + "}";
        }}
    }
    return kEmptyStr;
}


CNcbiOstream& operator<<(CNcbiOstream& out, const CCimValue& value)
{
    return out << value.AsString();
}


END_WBEM_SCOPE
