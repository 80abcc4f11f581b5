#ifndef WBEM___WBEM_URI__HPP
#define WBEM___WBEM_URI__HPP

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
 *   WBEM URI (DSP0207) parsing and formatting
 *
 */

/// @file wbem_uri.hpp
/// Untyped WBEM URIs of class and instance paths (DSP0207):
///
///   [scheme:][//authority]/[namespace]:classname[.key=value[,key=value]*]

#include <wbem/cim_value.hpp>
#include <wbem/nocase_dict.hpp>


/** @addtogroup WBEM
 *
 * @{
 */


BEGIN_WBEM_SCOPE


/// Output formats of WBEM URIs
enum EWbemUriFormat {
    /// DSP0207 form, lexical case preserved:
    /// //host/ns:Class.k1="v",k2=1 or /ns:Class.k1="v"
    eWbemUri_Standard,
    /// Standard form with lower-case host, namespace, class name and key
    /// names
    eWbemUri_Canonical,
    /// Form of the CIMObject header (DSP0200): no authority, no leading
    /// slash, ns:Class.k1="v"
    eWbemUri_CimObject,
    /// Standard form without the slash in front of the namespace when
    /// there is no authority, and without ':' when there is no namespace
    eWbemUri_Historical
};


/// Components of a parsed WBEM URI
struct SWbemUriParts
{
    SWbemUriParts(void) : has_keys(false) {}

    CNullable<string>  host;
    CNullable<string>  name_space;
    string             classname;
    /// Instance path: the class name is followed by '.'
    bool               has_keys;
    /// Keybindings in the order of appearance. Values are untyped numbers,
    /// booleans, strings, char16, datetimes and instance paths.
    TCimNamedValues    keybindings;
};


class NCBI_XWBEM_EXPORT NWbemUri
{
public:
    /// Split a WBEM URI into its components.
    ///
    /// Schemes other than http, https, cimxml-wbem and cimxml-wbems are
    /// accepted with a warning, and so are unquoted datetime key values.
    /// Throw CCimException::eValue on malformed input.
    static void Parse(const string& uri, SWbemUriParts& parts);

    /// Path up to and including the class name
    static string FormatPath(const CNullable<string>& host,
                             const CNullable<string>& name_space,
                             const string&            classname,
                             EWbemUriFormat           format);

    /// "k1=v1,k2=v2" with the keys sorted by name, ignoring case
    static string FormatKeybindings(const CNocaseDict<CCimValue>& keys,
                                    EWbemUriFormat format);

    /// Text of one key value; strings and references are quoted
    static string FormatKeyValue(const CCimValue& value,
                                 EWbemUriFormat format);
};


END_WBEM_SCOPE


/* @} */

#endif  /* WBEM___WBEM_URI__HPP */
