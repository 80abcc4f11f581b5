#ifndef WBEM___CIM_INSTANCE__HPP
#define WBEM___CIM_INSTANCE__HPP

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
 *   CIM instance
 *
 */

/// @file cim_instance.hpp
/// CCimInstance -- an instance of a CIM class.

#include <wbem/cim_property.hpp>
#include <wbem/cim_instance_name.hpp>


/** @addtogroup WBEM
 *
 * @{
 */


BEGIN_WBEM_SCOPE


class CCimClass;


/////////////////////////////////////////////////////////////////////////////
///
/// CCimInstance --
///
/// Class name, properties, qualifiers and an optional path. The properties
/// are accessible as a case-insensitive dictionary of values.
///
/// Setting a property whose name is a keybinding of the path also sets the
/// keybinding, so the path keeps identifying the instance.
///
/// Copies are deep: nested paths and property values are not shared.

class NCBI_XWBEM_EXPORT CCimInstance : public CObject
{
public:
    typedef TCimProperties::const_iterator const_iterator;

    explicit CCimInstance(const string& classname);
    CCimInstance(const string& classname, const TCimNamedValues& properties);
    CCimInstance(const string& classname,
                 const vector<CCimProperty>& properties);
    CCimInstance(const CCimInstance& other);
    CCimInstance& operator=(const CCimInstance& other);

    /// Instance of 'cls' with the given property values.
    ///
    /// Values are converted to the declared property types; values of
    /// the wrong type or shape raise CCimException::eValue, and so do
    /// values of properties the class does not declare. Properties without
    /// a value are left out, or take the class default if
    /// 'include_missing_properties' is set. The path is built from the key
    /// properties (see CCimInstanceName::FromInstance); in strict mode a
    /// missing key value raises CCimException::eValue.
    static CRef<CCimInstance> FromClass(
        const CCimClass&        cls,
        const TCimNamedValues&  property_values,
        const string&           name_space                 = kEmptyStr,
        bool                    include_path               = true,
        bool                    include_class_origin       = false,
        bool                    include_missing_properties = false,
        bool                    strict                     = false);

    const string& GetClassname(void) const { return m_Classname; }
    void SetClassname(const string& classname);

    const TCimProperties& GetProperties(void) const { return m_Properties; }
    void SetProperties(const TCimProperties& properties);
    void SetProperties(const vector<CCimProperty>& properties);
    void SetProperties(const TCimNamedValues& properties);

    /// Add or replace a property. Updates the matching keybinding of the
    /// path. With a property list set, properties not in the list are
    /// ignored unless they are keybindings of the path.
    void SetProperty(const CCimProperty& property);
    /// Set the value of a property: existing properties keep their type,
    /// new ones get the type of the value.
    void SetPropertyValue(const string& name, const CCimValue& value);

    /// Value of a property. Throw CCimException::eKey if there is none.
    const CCimValue& operator[](const string& name) const;
    CCimValue Get(const string& name, const CCimValue& def = CCimValue()) const;
    bool Has(const string& name) const { return m_Properties.Has(name); }
    /// Throw CCimException::eKey if there is no such property
    void Erase(const string& name) { m_Properties.Erase(name); }
    size_t size(void) const { return m_Properties.size(); }
    const_iterator begin(void) const { return m_Properties.begin(); }
    const_iterator end(void) const   { return m_Properties.end(); }

    /// Set property values, adding new properties
    void Update(const TCimNamedValues& values);
    void Update(const vector<CCimProperty>& properties);
    /// Set the values of the properties that exist; other names are
    /// ignored. Values are converted to the type of the existing property.
    void UpdateExisting(const TCimNamedValues& values);

    const TCimQualifiers& GetQualifiers(void) const { return m_Qualifiers; }
    void SetQualifiers(const TCimQualifiers& qualifiers);
    void SetQualifiers(const vector<CCimQualifier>& qualifiers);
    void SetQualifiers(const TCimNamedValues& qualifiers);
    void SetQualifier(const CCimQualifier& qualifier);

    bool IsSetPath(void) const { return m_Path.NotEmpty(); }
    /// Throw CCimException::eValue if there is no path
    const CCimInstanceName& GetPath(void) const;
    CCimInstanceName& SetPath(void);
    /// Keybindings named like properties take the property values
    void SetPath(const CCimInstanceName& path);
    void ResetPath(void) { m_Path.Reset(); }

    /// @deprecated
    ///   Filter of accepted property names
    bool IsSetPropertyList(void) const { return m_HasPropertyList; }
    const vector<string>& GetPropertyList(void) const { return m_PropertyList; }
    void SetPropertyList(const vector<string>& names);
    void ResetPropertyList(void);

    bool operator==(const CCimInstance& other) const;
    bool operator!=(const CCimInstance& other) const
        { return !(*this == other); }
    size_t GetHash(void) const;

    /// INSTANCE, wrapped with its path unless 'ignore_path' is set or
    /// there is no path:
    /// VALUE.NAMEDINSTANCE if the path has no namespace,
    /// VALUE.OBJECTWITHLOCALPATH if it has no host,
    /// VALUE.INSTANCEWITHPATH otherwise.
    xml::node ToCimXml(bool ignore_path = false) const;
    string ToCimXmlStr(void) const;
    string ToCimXmlStr(const string& indent) const;

    /// "instance of Class {\n   p = v;\n};\n"
    string ToMof(void) const;

private:
    bool x_IsFiltered(const string& name) const;

    string                  m_Classname;
    TCimProperties          m_Properties;
    TCimQualifiers          m_Qualifiers;
    CRef<CCimInstanceName>  m_Path;
    bool                    m_HasPropertyList;
    vector<string>          m_PropertyList;
};


END_WBEM_SCOPE


/* @} */

#endif  /* WBEM___CIM_INSTANCE__HPP */
