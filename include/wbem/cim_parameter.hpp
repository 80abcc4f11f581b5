#ifndef WBEM___CIM_PARAMETER__HPP
#define WBEM___CIM_PARAMETER__HPP

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
 *   CIM method parameter
 *
 */

/// @file cim_parameter.hpp
/// CCimParameter -- a parameter of a CIM method, or a parameter value of a
/// method invocation.

#include <wbem/cim_qualifier.hpp>
#include <wbem/cim_mof.hpp>


/** @addtogroup WBEM
 *
 * @{
 */


BEGIN_WBEM_SCOPE


/////////////////////////////////////////////////////////////////////////////
///
/// CCimParameter --
///
/// Declaration of a method parameter: name, type, reference class, array
/// attributes and qualifiers. The value is only used when the parameter is
/// rendered as a PARAMVALUE element.
///
/// The type is inferred from the value when not given. Arrays of
/// references are allowed for parameters.

class NCBI_XWBEM_EXPORT CCimParameter
{
public:
    CCimParameter(const string&     name,
                  TCimTypeArg       type,
                  const string&     reference_class = kEmptyStr,
                  TCimFlag          is_array        = null,
                  TCimArraySize     array_size      = null,
                  const CCimValue&  value           = CCimValue(),
                  EEmbeddedObject   embedded_object = eEmbeddedObject_None);

    /// Parameter value with the type inferred from the value
    static CCimParameter CreateValue(const string& name,
                                     const CCimValue& value);

    const string& GetName(void) const { return m_Name; }
    void SetName(const string& name);

    ECimType GetType(void) const { return m_Type; }
    void SetType(ECimType type);

    bool IsSetReferenceClass(void) const { return !m_ReferenceClass.IsNull(); }
    string GetReferenceClass(void) const { return m_ReferenceClass; }
    void SetReferenceClass(const string& reference_class);
    void ResetReferenceClass(void) { m_ReferenceClass = null; }

    bool IsArray(void) const { return m_IsArray; }
    void SetIsArray(bool is_array);

    TCimArraySize GetArraySize(void) const { return m_ArraySize; }
    void SetArraySize(TCimArraySize array_size);

    /// @deprecated
    ///   Only meaningful for parameter values.
    const CCimValue& GetValue(void) const { return m_Value; }
    void SetValue(const CCimValue& value);

    EEmbeddedObject GetEmbeddedObject(void) const { return m_EmbeddedObject; }
    void SetEmbeddedObject(EEmbeddedObject embedded_object);

    const TCimQualifiers& GetQualifiers(void) const { return m_Qualifiers; }
    void SetQualifiers(const TCimQualifiers& qualifiers);
    void SetQualifiers(const vector<CCimQualifier>& qualifiers);
    void SetQualifiers(const TCimNamedValues& qualifiers);
    void SetQualifier(const CCimQualifier& qualifier);

    bool operator==(const CCimParameter& other) const;
    bool operator!=(const CCimParameter& other) const
        { return !(*this == other); }
    size_t GetHash(void) const;

    /// PARAMETER, PARAMETER.ARRAY, PARAMETER.REFERENCE or PARAMETER.REFARRAY
    /// for a declaration; PARAMVALUE if 'as_value' is true.
    xml::node ToCimXml(bool as_value = false) const;
    string ToCimXmlStr(bool as_value = false) const;

    /// Qualifier list, then "type name[]", without a terminator
    string ToMof(unsigned int indent = 2 * NMof::kIndent) const;

private:
    void x_Validate(const CCimValue& value) const;

    string            m_Name;
    ECimType          m_Type;
    CNullable<string> m_ReferenceClass;
    bool              m_IsArray;
    TCimArraySize     m_ArraySize;
    CCimValue         m_Value;
    EEmbeddedObject   m_EmbeddedObject;
    TCimQualifiers    m_Qualifiers;
};


typedef CNocaseDict<CCimParameter> TCimParameters;


END_WBEM_SCOPE


/* @} */

#endif  /* WBEM___CIM_PARAMETER__HPP */
