#ifndef WBEM___CIM_QUALIFIER__HPP
#define WBEM___CIM_QUALIFIER__HPP

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
 *   CIM qualifier value
 *
 */

/// @file cim_qualifier.hpp
/// CCimQualifier -- a qualifier attached to a CIM element (DSP0004, 5.6.1).

#include <wbem/cim_value.hpp>
#include <wbem/nocase_dict.hpp>
#include <misc/xmlwrapp/xmlwrapp.hpp>


/** @addtogroup WBEM
 *
 * @{
 */


BEGIN_WBEM_SCOPE


/////////////////////////////////////////////////////////////////////////////
///
/// CCimQualifier --
///
/// Name, typed value and the flavor flags of a qualifier. The flavor flags
/// are tri-state: not specified, true or false.
///
/// The type is inferred from the value when not given; a NULL value or an
/// untyped number requires an explicit type. Qualifiers cannot have
/// reference type.

class NCBI_XWBEM_EXPORT CCimQualifier
{
public:
    CCimQualifier(const string&      name,
                  const CCimValue&   value,
                  TCimTypeArg        type         = null,
                  TCimFlag           propagated   = null,
                  TCimFlag           overridable  = null,
                  TCimFlag           tosubclass   = null,
                  TCimFlag           toinstance   = null,
                  TCimFlag           translatable = null);

    const string& GetName(void) const { return m_Name; }
    void SetName(const string& name);

    ECimType GetType(void) const { return m_Type; }
    /// Convert the current value to the new type
    void SetType(ECimType type);

    const CCimValue& GetValue(void) const { return m_Value; }
    /// The value is converted to the qualifier type
    void SetValue(const CCimValue& value);

    TCimFlag GetPropagated(void) const   { return m_Propagated; }
    void SetPropagated(TCimFlag value)   { m_Propagated = value; }
    TCimFlag GetOverridable(void) const  { return m_Overridable; }
    void SetOverridable(TCimFlag value)  { m_Overridable = value; }
    TCimFlag GetToSubclass(void) const   { return m_ToSubclass; }
    void SetToSubclass(TCimFlag value)   { m_ToSubclass = value; }
    TCimFlag GetToInstance(void) const   { return m_ToInstance; }
    void SetToInstance(TCimFlag value)   { m_ToInstance = value; }
    TCimFlag GetTranslatable(void) const { return m_Translatable; }
    void SetTranslatable(TCimFlag value) { m_Translatable = value; }

    bool operator==(const CCimQualifier& other) const;
    bool operator!=(const CCimQualifier& other) const
        { return !(*this == other); }
    size_t GetHash(void) const;

    /// <QUALIFIER> element
    xml::node ToCimXml(void) const;
    string ToCimXmlStr(void) const;
    string ToCimXmlStr(const string& indent) const;

    /// "Name ( value )", "Name { v1, v2 }" or "Name" for a NULL value.
    /// Long values wrap onto lines indented by 'indent' columns; 'line_pos'
    /// is the column the text starts at.
    string ToMof(unsigned int indent, unsigned int line_pos = 0) const;

private:
    void x_CheckType(ECimType type) const;

    string      m_Name;
    ECimType    m_Type;
    CCimValue   m_Value;
    TCimFlag    m_Propagated;
    TCimFlag    m_Overridable;
    TCimFlag    m_ToSubclass;
    TCimFlag    m_ToInstance;
    TCimFlag    m_Translatable;
};


typedef CNocaseDict<CCimQualifier> TCimQualifiers;


END_WBEM_SCOPE


/* @} */

#endif  /* WBEM___CIM_QUALIFIER__HPP */
