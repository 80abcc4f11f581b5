#ifndef WBEM___CIM_QUALIFIER_DECL__HPP
#define WBEM___CIM_QUALIFIER_DECL__HPP

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
 *   CIM qualifier declaration
 *
 */

/// @file cim_qualifier_decl.hpp
/// CCimQualifierDeclaration -- the declaration (qualifier type) of a CIM
/// qualifier.

#include <wbem/cim_qualifier.hpp>


/** @addtogroup WBEM
 *
 * @{
 */


BEGIN_WBEM_SCOPE


/////////////////////////////////////////////////////////////////////////////
///
/// CCimQualifierDeclaration --
///
/// Name, type and default value of a qualifier, the element kinds it may
/// be attached to (scopes), and its default flavors.
///
/// Scope names are CLASS, ASSOCIATION, INDICATION, PROPERTY, REFERENCE,
/// METHOD, PARAMETER and ANY, in any letter case.

class NCBI_XWBEM_EXPORT CCimQualifierDeclaration
{
public:
    typedef CNocaseDict<bool>            TScopes;
    typedef vector< pair<string, bool> > TScopeList;

    CCimQualifierDeclaration(const string&     name,
                             ECimType          type,
                             const CCimValue&  value        = CCimValue(),
                             TCimFlag          is_array     = null,
                             TCimArraySize     array_size   = null,
                             TCimFlag          overridable  = null,
                             TCimFlag          tosubclass   = null,
                             TCimFlag          toinstance   = null,
                             TCimFlag          translatable = null);

    const string& GetName(void) const { return m_Name; }
    void SetName(const string& name);

    ECimType GetType(void) const { return m_Type; }
    void SetType(ECimType type);

    /// Default value
    const CCimValue& GetValue(void) const { return m_Value; }
    void SetValue(const CCimValue& value);

    bool IsArray(void) const { return m_IsArray; }
    void SetIsArray(bool is_array);

    TCimArraySize GetArraySize(void) const { return m_ArraySize; }
    void SetArraySize(TCimArraySize array_size);

    const TScopes& GetScopes(void) const { return m_Scopes; }
    /// Throw CCimException::eValue for unknown scope names
    void SetScopes(const TScopes& scopes);
    void SetScopes(const TScopeList& scopes);
    void SetScope(const string& scope, bool value);

    TCimFlag GetOverridable(void) const  { return m_Overridable; }
    void SetOverridable(TCimFlag value)  { m_Overridable = value; }
    TCimFlag GetToSubclass(void) const   { return m_ToSubclass; }
    void SetToSubclass(TCimFlag value)   { m_ToSubclass = value; }
    TCimFlag GetToInstance(void) const   { return m_ToInstance; }
    void SetToInstance(TCimFlag value)   { m_ToInstance = value; }
    TCimFlag GetTranslatable(void) const { return m_Translatable; }
    void SetTranslatable(TCimFlag value) { m_Translatable = value; }

    bool operator==(const CCimQualifierDeclaration& other) const;
    bool operator!=(const CCimQualifierDeclaration& other) const
        { return !(*this == other); }
    size_t GetHash(void) const;

    /// <QUALIFIER.DECLARATION>
    xml::node ToCimXml(void) const;
    string ToCimXmlStr(void) const;
    string ToCimXmlStr(const string& indent) const;

    /// "Qualifier Name : type = default, Scope(...), Flavor(...);"
    /// The ToInstance flavor is not part of MOF and never rendered.
    string ToMof(void) const;

private:
    void x_Validate(const CCimValue& value) const;

    string          m_Name;
    ECimType        m_Type;
    CCimValue       m_Value;
    bool            m_IsArray;
    TCimArraySize   m_ArraySize;
    TScopes         m_Scopes;
    TCimFlag        m_Overridable;
    TCimFlag        m_ToSubclass;
    TCimFlag        m_ToInstance;
    TCimFlag        m_Translatable;
};


END_WBEM_SCOPE


/* @} */

#endif  /* WBEM___CIM_QUALIFIER_DECL__HPP */
