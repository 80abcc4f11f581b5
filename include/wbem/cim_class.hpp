#ifndef WBEM___CIM_CLASS__HPP
#define WBEM___CIM_CLASS__HPP

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
 *   CIM class declaration
 *
 */

/// @file cim_class.hpp
/// CCimClass -- the declaration of a CIM class.

#include <wbem/cim_property.hpp>
#include <wbem/cim_method.hpp>
#include <wbem/cim_class_name.hpp>


/** @addtogroup WBEM
 *
 * @{
 */


BEGIN_WBEM_SCOPE


/////////////////////////////////////////////////////////////////////////////
///
/// CCimClass --
///
/// Class name, superclass, qualifiers, property and method declarations,
/// and an optional class path. Copies are deep.

class NCBI_XWBEM_EXPORT CCimClass : public CObject
{
public:
    CCimClass(const string& classname, const string& superclass = kEmptyStr);
    CCimClass(const CCimClass& other);
    CCimClass& operator=(const CCimClass& other);

    const string& GetClassname(void) const { return m_Classname; }
    void SetClassname(const string& classname);

    bool IsSetSuperclass(void) const { return !m_Superclass.IsNull(); }
    string GetSuperclass(void) const { return m_Superclass; }
    /// An empty name resets the superclass
    void SetSuperclass(const string& superclass);
    void ResetSuperclass(void) { m_Superclass = null; }

    const TCimProperties& GetProperties(void) const { return m_Properties; }
    void SetProperties(const TCimProperties& properties);
    void SetProperties(const vector<CCimProperty>& properties);
    void SetProperty(const CCimProperty& property);

    const TCimMethods& GetMethods(void) const { return m_Methods; }
    void SetMethods(const TCimMethods& methods);
    void SetMethods(const vector<CCimMethod>& methods);
    void SetMethod(const CCimMethod& method);

    const TCimQualifiers& GetQualifiers(void) const { return m_Qualifiers; }
    void SetQualifiers(const TCimQualifiers& qualifiers);
    void SetQualifiers(const vector<CCimQualifier>& qualifiers);
    void SetQualifiers(const TCimNamedValues& qualifiers);
    void SetQualifier(const CCimQualifier& qualifier);

    bool IsSetPath(void) const { return m_Path.NotEmpty(); }
    /// Throw CCimException::eValue if there is no path
    const CCimClassName& GetPath(void) const;
    void SetPath(const CCimClassName& path);
    void ResetPath(void) { m_Path.Reset(); }

    bool operator==(const CCimClass& other) const;
    bool operator!=(const CCimClass& other) const
        { return !(*this == other); }
    size_t GetHash(void) const;

    /// <CLASS> with qualifiers, properties and methods, in this order.
    /// The path is not rendered.
    xml::node ToCimXml(void) const;
    string ToCimXmlStr(void) const;
    string ToCimXmlStr(const string& indent) const;

    string ToMof(void) const;

private:
    string               m_Classname;
    CNullable<string>    m_Superclass;
    TCimProperties       m_Properties;
    TCimMethods          m_Methods;
    TCimQualifiers       m_Qualifiers;
    CRef<CCimClassName>  m_Path;
};


END_WBEM_SCOPE


/* @} */

#endif  /* WBEM___CIM_CLASS__HPP */
