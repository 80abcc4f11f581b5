#ifndef WBEM___CIM_INSTANCE_NAME__HPP
#define WBEM___CIM_INSTANCE_NAME__HPP

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
 *   CIM instance path
 *
 */

/// @file cim_instance_name.hpp
/// CCimInstanceName -- the path of a CIM instance: class name, keybindings,
/// namespace and host.

#include <wbem/wbem_uri.hpp>
#include <wbem/wbem_config.hpp>
#include <misc/xmlwrapp/xmlwrapp.hpp>


/** @addtogroup WBEM
 *
 * @{
 */


BEGIN_WBEM_SCOPE


class CCimProperty;
class CCimInstance;
class CCimClass;


/////////////////////////////////////////////////////////////////////////////
///
/// CCimInstanceName --
///
/// Class name, keybindings, and optional namespace and host. An empty
/// string leaves the namespace or host unset; leading and trailing slashes
/// of the namespace are removed.
///
/// Keybinding values are scalars: strings, char16, booleans, numbers,
/// datetimes and instance paths. Arrays, embedded objects and class paths
/// are rejected with CCimException::eType. NULL values are rejected with
/// CCimException::eValue unless CWbemConfig::GetIgnoreNullKeyValue() is set.
///
/// Equality ignores the case of names, the host and the namespace, and the
/// order of the keybindings.

class NCBI_XWBEM_EXPORT CCimInstanceName : public CObject
{
public:
    typedef CNocaseDict<CCimValue>   TKeybindings;
    typedef TKeybindings::const_iterator const_iterator;

    CCimInstanceName(const string& classname,
                     const string& host       = kEmptyStr,
                     const string& name_space = kEmptyStr);
    CCimInstanceName(const string&       classname,
                     const TKeybindings& keybindings,
                     const string&       host       = kEmptyStr,
                     const string&       name_space = kEmptyStr,
                     const CWbemConfig&  config     = CWbemConfig());
    CCimInstanceName(const string&          classname,
                     const TCimNamedValues& keybindings,
                     const string&          host       = kEmptyStr,
                     const string&          name_space = kEmptyStr,
                     const CWbemConfig&     config     = CWbemConfig());

    /// Throw CCimException::eValue for malformed URIs and URIs of class
    /// paths
    static CRef<CCimInstanceName> FromWbemUri(
        const string&      uri,
        const CWbemConfig& config = CWbemConfig());

    /// Path of 'inst' built from the key properties of 'cls' (the ones
    /// with a true Key qualifier). A key property without a value in
    /// 'inst' raises CCimException::eValue in strict mode and is left out
    /// otherwise.
    static CRef<CCimInstanceName> FromInstance(
        const CCimClass&    cls,
        const CCimInstance& inst,
        const string&       name_space = kEmptyStr,
        const string&       host       = kEmptyStr,
        bool                strict     = true,
        const CWbemConfig&  config     = CWbemConfig());

    const string& GetClassname(void) const { return m_Classname; }
    void SetClassname(const string& classname);

    bool IsSetHost(void) const { return !m_Host.IsNull(); }
    string GetHost(void) const { return m_Host; }
    void SetHost(const string& host);
    void ResetHost(void) { m_Host = null; }

    bool IsSetNamespace(void) const { return !m_Namespace.IsNull(); }
    string GetNamespace(void) const { return m_Namespace; }
    void SetNamespace(const string& name_space);
    void ResetNamespace(void) { m_Namespace = null; }

    const TKeybindings& GetKeybindings(void) const { return m_Keybindings; }
    void SetKeybindings(const TKeybindings& keybindings,
                        const CWbemConfig& config = CWbemConfig());
    void SetKeybindings(const TCimNamedValues& keybindings,
                        const CWbemConfig& config = CWbemConfig());
    /// Keybindings from the names and values of the properties
    void SetKeybindings(const vector<CCimProperty>& properties,
                        const CWbemConfig& config = CWbemConfig());

    /// Add or replace one keybinding
    void SetKeybinding(const string&      name,
                       const CCimValue&   value,
                       const CWbemConfig& config = CWbemConfig());
    /// Add or replace keybindings
    void Update(const TCimNamedValues& keybindings,
                const CWbemConfig& config = CWbemConfig());
    void Update(const TKeybindings& keybindings,
                const CWbemConfig& config = CWbemConfig());

    /// Throw CCimException::eKey if there is no such keybinding
    const CCimValue& operator[](const string& name) const
        { return m_Keybindings.Get(name); }
    /// Value of the keybinding, or 'def' if there is no such keybinding
    CCimValue Get(const string& name, const CCimValue& def = CCimValue()) const;
    bool Has(const string& name) const { return m_Keybindings.Has(name); }
    /// Throw CCimException::eKey if there is no such keybinding
    void Erase(const string& name) { m_Keybindings.Erase(name); }
    size_t size(void) const { return m_Keybindings.size(); }
    const_iterator begin(void) const { return m_Keybindings.begin(); }
    const_iterator end(void) const   { return m_Keybindings.end(); }

    bool operator==(const CCimInstanceName& other) const;
    bool operator!=(const CCimInstanceName& other) const
        { return !(*this == other); }
    /// Does not depend on the order of the keybindings
    size_t GetHash(void) const;

    string ToWbemUri(EWbemUriFormat format = eWbemUri_Standard) const;
    /// Historical WBEM URI format
    string AsString(void) const { return ToWbemUri(eWbemUri_Historical); }

    /// INSTANCENAME, LOCALINSTANCEPATH or INSTANCEPATH, depending on which
    /// of the namespace and host are set and not ignored
    xml::node ToCimXml(bool ignore_host      = false,
                       bool ignore_namespace = false) const;
    string ToCimXmlStr(void) const;
    string ToCimXmlStr(const string& indent) const;

private:
    xml::node x_KeybindingToCimXml(const string&    name,
                                   const CCimValue& value) const;

    string             m_Classname;
    TKeybindings       m_Keybindings;
    CNullable<string>  m_Host;
    CNullable<string>  m_Namespace;
};


inline
CNcbiOstream& operator<<(CNcbiOstream& out, const CCimInstanceName& path)
{
    return out << path.AsString();
}


END_WBEM_SCOPE


/* @} */

#endif  /* WBEM___CIM_INSTANCE_NAME__HPP */
