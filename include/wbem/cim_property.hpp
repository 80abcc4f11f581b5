#ifndef WBEM___CIM_PROPERTY__HPP
#define WBEM___CIM_PROPERTY__HPP

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
 *   CIM property
 *
 */

/// @file cim_property.hpp
/// CCimProperty -- a property of a CIM class or instance.

#include <wbem/cim_qualifier.hpp>
#include <wbem/cim_mof.hpp>


/** @addtogroup WBEM
 *
 * @{
 */


BEGIN_WBEM_SCOPE


/////////////////////////////////////////////////////////////////////////////
///
/// CCimProperty --
///
/// Named typed value with the metadata of a property declaration.
///
/// On construction, unspecified attributes are derived from the value:
///   - is_array from the shape of the value (scalar for NULL);
///   - the embedded object marker from embedded CCimInstance / CCimClass
///     values;
///   - the type from the value; for a NULL value the type is 'string' for
///     embedded objects and 'reference' when a reference class is given,
///     otherwise it must be specified;
///   - the reference class from the class name of a reference value.
///
/// Inconsistent combinations throw CCimException::eValue: array value for
/// a scalar property and vice versa, arrays of references, embedded objects
/// with a type other than string, array size of a scalar.
///
/// All setters re-validate.

class NCBI_XWBEM_EXPORT CCimProperty
{
public:
    CCimProperty(const string&     name,
                 const CCimValue&  value,
                 TCimTypeArg       type            = null,
                 TCimFlag          is_array        = null,
                 EEmbeddedObject   embedded_object = eEmbeddedObject_None,
                 const string&     reference_class = kEmptyStr);

    const string& GetName(void) const { return m_Name; }
    void SetName(const string& name);

    ECimType GetType(void) const { return m_Type; }
    void SetType(ECimType type);

    const CCimValue& GetValue(void) const { return m_Value; }
    /// The value is converted to the property type
    void SetValue(const CCimValue& value);

    bool IsArray(void) const { return m_IsArray; }
    void SetIsArray(bool is_array);

    TCimArraySize GetArraySize(void) const { return m_ArraySize; }
    void SetArraySize(TCimArraySize array_size);

    bool IsSetClassOrigin(void) const { return !m_ClassOrigin.IsNull(); }
    string GetClassOrigin(void) const { return m_ClassOrigin; }
    void SetClassOrigin(const string& class_origin)
        { m_ClassOrigin = class_origin; }
    void ResetClassOrigin(void) { m_ClassOrigin = null; }

    TCimFlag GetPropagated(void) const { return m_Propagated; }
    void SetPropagated(TCimFlag value) { m_Propagated = value; }

    bool IsSetReferenceClass(void) const { return !m_ReferenceClass.IsNull(); }
    string GetReferenceClass(void) const { return m_ReferenceClass; }
    void SetReferenceClass(const string& reference_class);
    void ResetReferenceClass(void) { m_ReferenceClass = null; }

    EEmbeddedObject GetEmbeddedObject(void) const { return m_EmbeddedObject; }
    void SetEmbeddedObject(EEmbeddedObject embedded_object);

    const TCimQualifiers& GetQualifiers(void) const { return m_Qualifiers; }
    void SetQualifiers(const TCimQualifiers& qualifiers);
    void SetQualifiers(const vector<CCimQualifier>& qualifiers);
    void SetQualifiers(const TCimNamedValues& qualifiers);
    /// Add or replace one qualifier
    void SetQualifier(const CCimQualifier& qualifier);

    bool operator==(const CCimProperty& other) const;
    bool operator!=(const CCimProperty& other) const
        { return !(*this == other); }
    size_t GetHash(void) const;

    /// <PROPERTY>, <PROPERTY.ARRAY> or <PROPERTY.REFERENCE>
    xml::node ToCimXml(void) const;
    string ToCimXmlStr(void) const;
    string ToCimXmlStr(const string& indent) const;

    /// In an instance: "name = value;"
    /// In a class: qualifiers, then "type name[] = default;"
    string ToMof(bool         is_instance = true,
                 unsigned int indent      = NMof::kIndent) const;

private:
    void x_Validate(const CCimValue& value) const;

    string            m_Name;
    ECimType          m_Type;
    CCimValue         m_Value;
    bool              m_IsArray;
    TCimArraySize     m_ArraySize;
    CNullable<string> m_ClassOrigin;
    TCimFlag          m_Propagated;
    CNullable<string> m_ReferenceClass;
    EEmbeddedObject   m_EmbeddedObject;
    TCimQualifiers    m_Qualifiers;
};


typedef CNocaseDict<CCimProperty> TCimProperties;


END_WBEM_SCOPE


/* @} */

#endif  /* WBEM___CIM_PROPERTY__HPP */
