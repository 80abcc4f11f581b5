#ifndef WBEM___CIM_CLASS_NAME__HPP
#define WBEM___CIM_CLASS_NAME__HPP

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
 *   CIM class path
 *
 */

/// @file cim_class_name.hpp
/// CCimClassName -- the path of a CIM class: class name, namespace, host.

#include <wbem/wbem_uri.hpp>
#include <misc/xmlwrapp/xmlwrapp.hpp>


/** @addtogroup WBEM
 *
 * @{
 */


BEGIN_WBEM_SCOPE


/////////////////////////////////////////////////////////////////////////////
///
/// CCimClassName --
///
/// Namespace and host are optional; an empty string leaves them unset.
/// Leading and trailing slashes of the namespace are removed.
/// All components compare case-insensitively.

class NCBI_XWBEM_EXPORT CCimClassName : public CObject
{
public:
    CCimClassName(const string& classname,
                  const string& host       = kEmptyStr,
                  const string& name_space = kEmptyStr);

    /// Throw CCimException::eValue for malformed URIs or URIs of
    /// instance paths
    static CRef<CCimClassName> FromWbemUri(const string& uri);

    const string& GetClassname(void) const { return m_Classname; }
    /// Throw CCimException::eValue for an empty name
    void SetClassname(const string& classname);

    bool IsSetHost(void) const { return !m_Host.IsNull(); }
    string GetHost(void) const { return m_Host; }
    void SetHost(const string& host);
    void ResetHost(void) { m_Host = null; }

    bool IsSetNamespace(void) const { return !m_Namespace.IsNull(); }
    string GetNamespace(void) const { return m_Namespace; }
    void SetNamespace(const string& name_space);
    void ResetNamespace(void) { m_Namespace = null; }

    bool operator==(const CCimClassName& other) const;
    bool operator!=(const CCimClassName& other) const
        { return !(*this == other); }
    size_t GetHash(void) const;

    string ToWbemUri(EWbemUriFormat format = eWbemUri_Standard) const;
    /// Historical WBEM URI format
    string AsString(void) const { return ToWbemUri(eWbemUri_Historical); }

    /// CLASSNAME, LOCALCLASSPATH or CLASSPATH, depending on which of the
    /// namespace and host are set and not ignored
    xml::node ToCimXml(bool ignore_host      = false,
                       bool ignore_namespace = false) const;
    string ToCimXmlStr(void) const;
    string ToCimXmlStr(const string& indent) const;

private:
    string             m_Classname;
    CNullable<string>  m_Host;
    CNullable<string>  m_Namespace;
};


inline
CNcbiOstream& operator<<(CNcbiOstream& out, const CCimClassName& path)
{
    return out << path.AsString();
}


END_WBEM_SCOPE


/* @} */

#endif  /* WBEM___CIM_CLASS_NAME__HPP */
