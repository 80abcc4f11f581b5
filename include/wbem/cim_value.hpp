#ifndef WBEM___CIM_VALUE__HPP
#define WBEM___CIM_VALUE__HPP

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

/// @file cim_value.hpp
/// CCimValue -- a value of any CIM type, or a native value to be typed.

#include <wbem/cim_types.hpp>
#include <wbem/cim_datetime.hpp>
#include <corelib/ncbiobj.hpp>
#include <vector>


/** @addtogroup WBEM
 *
 * @{
 */


BEGIN_WBEM_SCOPE


class CCimInstanceName;
class CCimClassName;
class CCimInstance;
class CCimClass;


/////////////////////////////////////////////////////////////////////////////
///
/// CCimValue --
///
/// Closed set of value shapes handled by the CIM object model: NULL,
/// boolean, string, char16, integer, real, datetime, instance or class
/// path, embedded instance or class, and arrays of these.
///
/// Integers and reals either carry a CIM type tag (uint8, real32, ...) or
/// are untyped native numbers. The type of an untyped number cannot be
/// inferred and must be supplied by the owner of the value (property,
/// qualifier, ...), see ConvertTo().
///
/// Numbers compare equal by value regardless of their tags. NaN never
/// compares equal, not even to itself. A boolean never equals a string or
/// a number, NULL only equals NULL.
///
/// Copying a value deep-copies the CIM objects it holds.

class NCBI_XWBEM_EXPORT CCimValue
{
public:
    enum EKind {
        eKind_Null,
        eKind_Boolean,
        eKind_String,
        eKind_Char16,
        eKind_Integer,
        eKind_Real,
        eKind_DateTime,
        eKind_InstanceName,
        eKind_ClassName,
        eKind_Instance,
        eKind_Class,
        eKind_Array
    };
    typedef vector<CCimValue> TArray;

    /// NULL
    CCimValue(void);

    CCimValue(bool value);
    /// Untyped integers
    CCimValue(int value);
    CCimValue(unsigned int value);
    CCimValue(Int8 value);
    CCimValue(Uint8 value);
    /// Untyped real
    CCimValue(double value);
    /// String
    CCimValue(const char* value);
    CCimValue(const string& value);
    CCimValue(const CCimDateTime& value);
    /// Reference values
    CCimValue(const CCimInstanceName& value);
    CCimValue(const CCimClassName& value);
    /// Embedded objects
    CCimValue(const CCimInstance& value);
    CCimValue(const CCimClass& value);
    /// Array; elements may be NULL
    CCimValue(const TArray& value);

    CCimValue(const CCimValue& other);
    CCimValue& operator=(const CCimValue& other);
    ~CCimValue(void);

    /// Integer tagged with its CIM type.
    /// Throw CCimRangeException if the value does not fit into the type,
    /// CCimException::eType if the type is not an integer type.
    static CCimValue MakeInteger(ECimType type, int value);
    static CCimValue MakeInteger(ECimType type, unsigned int value);
    static CCimValue MakeInteger(ECimType type, Int8 value);
    static CCimValue MakeInteger(ECimType type, Uint8 value);

    /// Real tagged with its CIM type; real32 values are rounded to
    /// single precision.
    static CCimValue MakeReal(ECimType type, double value);

    static CCimValue MakeChar16(const string& value);

    /// Empty array
    static CCimValue MakeArray(void);

    EKind GetKind(void) const { return m_Kind; }

    bool IsNull(void) const  { return m_Kind == eKind_Null; }
    bool IsArray(void) const { return m_Kind == eKind_Array; }
    bool IsBoolean(void) const { return m_Kind == eKind_Boolean; }
    bool IsString(void) const  { return m_Kind == eKind_String; }
    bool IsChar16(void) const  { return m_Kind == eKind_Char16; }
    bool IsInteger(void) const { return m_Kind == eKind_Integer; }
    bool IsReal(void) const    { return m_Kind == eKind_Real; }
    bool IsNumber(void) const  { return IsInteger()  ||  IsReal(); }
    bool IsDateTime(void) const { return m_Kind == eKind_DateTime; }
    bool IsInstanceName(void) const { return m_Kind == eKind_InstanceName; }
    bool IsClassName(void) const { return m_Kind == eKind_ClassName; }
    bool IsReference(void) const
        { return IsInstanceName()  ||  IsClassName(); }
    bool IsInstance(void) const { return m_Kind == eKind_Instance; }
    bool IsClass(void) const    { return m_Kind == eKind_Class; }
    bool IsEmbedded(void) const { return IsInstance()  ||  IsClass(); }

    /// Numbers: whether they carry a CIM type tag
    bool IsTyped(void) const { return m_Typed; }
    /// CIM type tag of a typed number
    ECimType GetNumberType(void) const;

    bool GetBoolean(void) const;
    /// Text of a string or char16 value
    const string& GetString(void) const;
    bool IsNegative(void) const;
    /// Integer value. Throw CCimException::eValue if it does not fit.
    Int8 GetInt8(void) const;
    Uint8 GetUint8(void) const;
    /// Real or integer value as double
    double GetReal(void) const;
    const CCimDateTime& GetDateTime(void) const;

    const CCimInstanceName& GetInstanceName(void) const;
    CCimInstanceName& SetInstanceName(void);
    const CCimClassName& GetClassName(void) const;
    CCimClassName& SetClassName(void);
    const CCimInstance& GetInstance(void) const;
    CCimInstance& SetInstance(void);
    const CCimClass& GetClass(void) const;
    CCimClass& SetClass(void);

    const TArray& GetArray(void) const;
    TArray& SetArray(void);

    /// CIM type implied by the value: tagged numbers keep their tag,
    /// bool is boolean, text is string or char16, CCimDateTime is
    /// datetime, paths are reference, embedded objects are string.
    /// Arrays use the first non-NULL element.
    /// NULL, empty arrays and untyped numbers give a null result.
    TCimTypeArg InferCimType(void) const;

    /// Embedded object marker implied by the value (or any array element)
    EEmbeddedObject InferEmbeddedObject(void) const;

    /// Convert the value to the given CIM type:
    ///   - untyped and typed numbers are (re)tagged with range checks;
    ///   - strings are parsed for boolean, numeric, datetime and
    ///     reference (WBEM URI) types;
    ///   - embedded objects are kept for the string type;
    ///   - arrays are converted elementwise; NULL stays NULL.
    /// Throw CCimException::eValue for unparsable text,
    /// CCimRangeException for integers out of range,
    /// CCimException::eType for values of an incompatible kind.
    CCimValue ConvertTo(ECimType type) const;

    bool operator==(const CCimValue& other) const;
    bool operator!=(const CCimValue& other) const
        { return !(*this == other); }

    /// Consistent with operator==
    size_t GetHash(void) const;

    /// Readable form for diagnostics
    string AsString(void) const;

    /// Real number text: INF, -INF, NaN, or the shortest decimal form that
    /// reads back to the same value, always with a decimal point.
    static string FormatReal(double value, ECimType type = eCimType_real64);

private:
    void x_CheckKind(EKind kind, const char* what) const;
    void x_SetInteger(bool negative, Uint8 magnitude);

    EKind          m_Kind;
    bool           m_Typed;
    ECimType       m_Type;
    bool           m_Bool;
    bool           m_Negative;
    // Absolute value of an integer
    Uint8          m_Magnitude;
    double         m_Real;
    string         m_String;
    CCimDateTime   m_DateTime;
    CRef<CObject>  m_Object;
    TArray         m_Array;
};


NCBI_XWBEM_EXPORT
CNcbiOstream& operator<<(CNcbiOstream& out, const CCimValue& value);


/// (name, value) pairs, the loosely typed input form of properties,
/// qualifiers and keybindings
typedef vector< pair<string, CCimValue> > TCimNamedValues;


END_WBEM_SCOPE


/* @} */

#endif  /* WBEM___CIM_VALUE__HPP */
